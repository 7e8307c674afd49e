#include <gtest/gtest.h>
#include <memory>
#include "../include/alert_coordinator.h"
#include "test_helpers.h"

using namespace DeskMonitor;
using Testing::at;

namespace
{
    MetricSnapshot faceSnapshot()
    {
        MetricSnapshot snapshot;
        snapshot.face_present = true;
        snapshot.fatigue.valid = true;
        snapshot.distance.valid = true;
        snapshot.posture.valid = true;
        snapshot.posture.posture_state = PostureState::NORMAL;
        return snapshot;
    }

    MetricSnapshot microsleepSnapshot()
    {
        MetricSnapshot snapshot = faceSnapshot();
        snapshot.fatigue.microsleep_active = true;
        return snapshot;
    }

    class AlertCoordinatorTest : public ::testing::Test
    {
    protected:
        Config config_ = Testing::quietConfig();
        std::shared_ptr<Testing::RecordingNotifier> recorder_ = std::make_shared<Testing::RecordingNotifier>();
    };
}

TEST_F(AlertCoordinatorTest, CooldownSuppressesRepeats)
{
    AlertCoordinator coordinator(config_);
    coordinator.addNotifier(recorder_);

    AlertEvaluation first = coordinator.evaluate(microsleepSnapshot(), at(0.0));
    ASSERT_EQ(first.dispatched.size(), 1u);
    EXPECT_EQ(first.dispatched[0].severity, Severity::CRITICAL);
    EXPECT_EQ(coordinator.conditionState(ConditionType::FATIGUE_MICROSLEEP), ConditionPhase::COOLDOWN);

    AlertEvaluation repeat = coordinator.evaluate(microsleepSnapshot(), at(10.0));
    EXPECT_TRUE(repeat.dispatched.empty());
    ASSERT_EQ(repeat.active.size(), 1u);
    EXPECT_EQ(coordinator.dispatchCount(ConditionType::FATIGUE_MICROSLEEP), 1);

    AlertEvaluation after = coordinator.evaluate(microsleepSnapshot(), at(301.0));
    EXPECT_EQ(after.dispatched.size(), 1u);
    EXPECT_EQ(coordinator.dispatchCount(ConditionType::FATIGUE_MICROSLEEP), 2);
    EXPECT_EQ(recorder_->received.size(), 2u);
}

TEST_F(AlertCoordinatorTest, CooldownExpiresEvenWithoutCondition)
{
    AlertCoordinator coordinator(config_);
    coordinator.evaluate(microsleepSnapshot(), at(0.0));
    coordinator.evaluate(faceSnapshot(), at(config_.cooldown_time_seconds));
    EXPECT_EQ(coordinator.conditionState(ConditionType::FATIGUE_MICROSLEEP), ConditionPhase::IDLE);
}

TEST_F(AlertCoordinatorTest, ConditionsHaveIndependentCooldowns)
{
    AlertCoordinator coordinator(config_);
    coordinator.addNotifier(recorder_);

    coordinator.evaluate(microsleepSnapshot(), at(0.0));

    MetricSnapshot close = faceSnapshot();
    close.distance.is_too_close = true;
    AlertEvaluation evaluation = coordinator.evaluate(close, at(5.0));

    ASSERT_EQ(evaluation.dispatched.size(), 1u);
    EXPECT_EQ(evaluation.dispatched[0].condition, ConditionType::DISTANCE_TOO_CLOSE);
    EXPECT_EQ(coordinator.conditionState(ConditionType::FATIGUE_MICROSLEEP), ConditionPhase::COOLDOWN);
    EXPECT_EQ(coordinator.conditionState(ConditionType::DISTANCE_TOO_CLOSE), ConditionPhase::COOLDOWN);
    EXPECT_EQ(coordinator.conditionState(ConditionType::POSTURE_HEAD_UP), ConditionPhase::IDLE);
}

TEST_F(AlertCoordinatorTest, DispatchOrderFollowsSeverity)
{
    AlertCoordinator coordinator(config_);
    coordinator.addNotifier(recorder_);

    MetricSnapshot snapshot = faceSnapshot();
    snapshot.fatigue.microsleep_active = true;
    snapshot.distance.is_too_close = true;
    snapshot.posture.posture_state = PostureState::HEAD_UP;
    snapshot.posture.is_sustained = true;

    coordinator.evaluate(snapshot, at(0.0));

    ASSERT_EQ(recorder_->received.size(), 3u);
    EXPECT_EQ(recorder_->received[0].condition, ConditionType::FATIGUE_MICROSLEEP);
    EXPECT_EQ(recorder_->received[1].condition, ConditionType::DISTANCE_TOO_CLOSE);
    EXPECT_EQ(recorder_->received[2].condition, ConditionType::POSTURE_HEAD_UP);
}

TEST_F(AlertCoordinatorTest, SameSeverityKeepsConditionOrder)
{
    AlertCoordinator coordinator(config_);
    MetricSnapshot snapshot = faceSnapshot();
    snapshot.posture.posture_state = PostureState::HEAD_DOWN;
    snapshot.posture.is_sustained = true;
    snapshot.distance.is_too_close = true;
    snapshot.fatigue.blink_rate_low = true;
    snapshot.fatigue.blink_rate_high = false;

    std::vector<ConditionType> crossed = coordinator.crossedConditions(snapshot);
    std::vector<ConditionType> expected = {ConditionType::FATIGUE_LOW_BLINK, ConditionType::DISTANCE_TOO_CLOSE,
                                           ConditionType::POSTURE_HEAD_DOWN};
    EXPECT_EQ(crossed, expected);
}

TEST_F(AlertCoordinatorTest, PerclosNeedsValidWindow)
{
    AlertCoordinator coordinator(config_);
    MetricSnapshot snapshot = faceSnapshot();
    snapshot.fatigue.perclos = 0.5;
    snapshot.fatigue.perclos_valid = false;
    EXPECT_TRUE(coordinator.crossedConditions(snapshot).empty());

    snapshot.fatigue.perclos_valid = true;
    std::vector<ConditionType> crossed = coordinator.crossedConditions(snapshot);
    ASSERT_EQ(crossed.size(), 1u);
    EXPECT_EQ(crossed[0], ConditionType::FATIGUE_HIGH_PERCLOS);

    snapshot.fatigue.perclos = config_.perclos_threshold;
    EXPECT_TRUE(coordinator.crossedConditions(snapshot).empty());
}

TEST_F(AlertCoordinatorTest, UnsustainedPostureDoesNotAlert)
{
    AlertCoordinator coordinator(config_);
    MetricSnapshot snapshot = faceSnapshot();
    snapshot.posture.posture_state = PostureState::HEAD_DOWN;
    snapshot.posture.is_sustained = false;
    EXPECT_TRUE(coordinator.crossedConditions(snapshot).empty());
}

TEST_F(AlertCoordinatorTest, NoFaceRaisesNothing)
{
    AlertCoordinator coordinator(config_);
    coordinator.addNotifier(recorder_);

    MetricSnapshot snapshot = microsleepSnapshot();
    snapshot.face_present = false;
    snapshot.distance.is_too_close = true;

    AlertEvaluation evaluation = coordinator.evaluate(snapshot, at(0.0));
    EXPECT_TRUE(evaluation.active.empty());
    EXPECT_TRUE(recorder_->received.empty());
}

TEST_F(AlertCoordinatorTest, FailingChannelsAreIsolated)
{
    AlertCoordinator coordinator(config_);
    auto failing = std::make_shared<Testing::FailingNotifier>();
    auto throwing = std::make_shared<Testing::ThrowingNotifier>();
    coordinator.addNotifier(failing);
    coordinator.addNotifier(throwing);
    coordinator.addNotifier(recorder_);
    EXPECT_EQ(coordinator.notifierCount(), 3u);

    AlertEvaluation evaluation = coordinator.evaluate(microsleepSnapshot(), at(0.0));

    EXPECT_EQ(evaluation.dispatched.size(), 1u);
    EXPECT_EQ(failing->calls, 1);
    EXPECT_EQ(throwing->calls, 1);
    EXPECT_EQ(recorder_->received.size(), 1u);
    EXPECT_EQ(coordinator.channelFailures(), 2u);
    // Delivery failures still start the cooldown
    EXPECT_EQ(coordinator.conditionState(ConditionType::FATIGUE_MICROSLEEP), ConditionPhase::COOLDOWN);
}

TEST_F(AlertCoordinatorTest, ResetCooldownAllowsImmediateRepeat)
{
    AlertCoordinator coordinator(config_);
    coordinator.addNotifier(recorder_);

    coordinator.evaluate(microsleepSnapshot(), at(0.0));
    coordinator.resetCooldown(ConditionType::FATIGUE_MICROSLEEP);
    EXPECT_EQ(coordinator.conditionState(ConditionType::FATIGUE_MICROSLEEP), ConditionPhase::IDLE);

    coordinator.evaluate(microsleepSnapshot(), at(1.0));
    EXPECT_EQ(recorder_->received.size(), 2u);

    coordinator.resetAll();
    EXPECT_EQ(coordinator.dispatchCount(ConditionType::FATIGUE_MICROSLEEP), 0);
}

TEST(ConditionPhaseTest, Names)
{
    EXPECT_EQ(conditionPhaseToString(ConditionPhase::IDLE), "IDLE");
    EXPECT_EQ(conditionPhaseToString(ConditionPhase::COOLDOWN), "COOLDOWN");
}
