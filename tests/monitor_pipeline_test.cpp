#include <gtest/gtest.h>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <vector>
#include "../include/monitor_pipeline.h"
#include "test_helpers.h"

using namespace DeskMonitor;
using Testing::at;

namespace
{
    // Plays a fixed list of read results, then keeps returning tail
    class ScriptedSource : public FrameSource
    {
    public:
        std::vector<FrameStatus> script;
        FrameStatus tail = FrameStatus::CLOSED;
        int reads = 0;

        FrameStatus read(cv::Mat &frame, Timestamp &timestamp) override
        {
            FrameStatus status = reads < static_cast<int>(script.size()) ? script[reads] : tail;
            timestamp = at(reads * 0.1);
            reads++;
            if (status == FrameStatus::OK)
                frame = cv::Mat::zeros(480, 640, CV_8UC3);
            return status;
        }
    };

    class FakeDetector : public LandmarkDetector
    {
    public:
        DetectionStatus status = DetectionStatus::FACE_FOUND;
        LandmarkSet face = Testing::makeFace(0.30);
        bool throw_error = false;
        int calls = 0;

        DetectionStatus detect(const cv::Mat &, LandmarkSet &landmarks) override
        {
            calls++;
            if (throw_error)
                throw std::runtime_error("model corrupted");
            if (status == DetectionStatus::FACE_FOUND)
                landmarks = face;
            return status;
        }
    };

    class RecordingSink : public SnapshotSink
    {
    public:
        std::vector<MetricSnapshot> snapshots;
        size_t stop_after = 0; // 0 = never
        bool shut_down = false;

        void publish(const MetricSnapshot &snapshot, const cv::Mat &) override
        {
            snapshots.push_back(snapshot);
        }
        void shutdown() override { shut_down = true; }
        bool stopRequested() const override { return stop_after > 0 && snapshots.size() >= stop_after; }
    };

    class ThrowingSink : public SnapshotSink
    {
    public:
        void publish(const MetricSnapshot &, const cv::Mat &) override
        {
            throw std::runtime_error("display lost");
        }
    };

    class MonitorPipelineTest : public ::testing::Test
    {
    protected:
        Config config_ = Testing::quietConfig();
        ScriptedSource *source_ = nullptr;
        FakeDetector *detector_ = nullptr;
        std::shared_ptr<RecordingSink> sink_ = std::make_shared<RecordingSink>();
        const cv::Mat frame_ = cv::Mat::zeros(480, 640, CV_8UC3);

        std::unique_ptr<MonitorPipeline> makePipeline()
        {
            auto source = std::make_unique<ScriptedSource>();
            auto detector = std::make_unique<FakeDetector>();
            source_ = source.get();
            detector_ = detector.get();
            auto pipeline = std::make_unique<MonitorPipeline>(config_, std::move(source), std::move(detector));
            pipeline->addSink(sink_);
            return pipeline;
        }
    };
}

TEST_F(MonitorPipelineTest, ClosedSourceEndsRunWithError)
{
    auto pipeline = makePipeline();
    source_->script = {FrameStatus::OK, FrameStatus::OK};

    EXPECT_NE(pipeline->run(), EXIT_SUCCESS);
    EXPECT_EQ(detector_->calls, 2);
    EXPECT_EQ(pipeline->latestSnapshot()->status, PipelineStatus::STOPPED);
    EXPECT_EQ(pipeline->latestSnapshot()->frame_index, 2u);
    EXPECT_TRUE(sink_->shut_down);
}

TEST_F(MonitorPipelineTest, SinkStopEndsRunCleanly)
{
    auto pipeline = makePipeline();
    source_->tail = FrameStatus::OK;
    sink_->stop_after = 3;

    EXPECT_EQ(pipeline->run(), EXIT_SUCCESS);
    EXPECT_EQ(sink_->snapshots.size(), 3u);
    EXPECT_EQ(pipeline->latestSnapshot()->status, PipelineStatus::STOPPED);
}

TEST_F(MonitorPipelineTest, StopBeforeRunProcessesNothing)
{
    auto pipeline = makePipeline();
    source_->tail = FrameStatus::OK;
    pipeline->stop();

    EXPECT_EQ(pipeline->run(), EXIT_SUCCESS);
    EXPECT_EQ(detector_->calls, 0);
}

TEST_F(MonitorPipelineTest, FacePresentIsMonitoring)
{
    auto pipeline = makePipeline();
    MetricSnapshot snapshot = pipeline->processFrame(frame_, at(0.0));

    EXPECT_EQ(snapshot.status, PipelineStatus::MONITORING);
    EXPECT_TRUE(snapshot.face_present);
    EXPECT_TRUE(snapshot.fatigue.valid);
    EXPECT_TRUE(snapshot.distance.valid);
    EXPECT_DOUBLE_EQ(snapshot.seconds_without_face, 0.0);
    EXPECT_EQ(snapshot.frame_index, 1u);
    ASSERT_EQ(sink_->snapshots.size(), 1u);
    EXPECT_EQ(pipeline->latestSnapshot()->frame_index, 1u);
}

TEST_F(MonitorPipelineTest, NoFaceCountsAbsence)
{
    auto pipeline = makePipeline();
    pipeline->processFrame(frame_, at(0.0));

    detector_->status = DetectionStatus::NO_FACE;
    pipeline->processFrame(frame_, at(1.0));
    MetricSnapshot snapshot = pipeline->processFrame(frame_, at(2.5));

    EXPECT_EQ(snapshot.status, PipelineStatus::NO_FACE);
    EXPECT_FALSE(snapshot.face_present);
    EXPECT_NEAR(snapshot.seconds_without_face, 2.5, 1e-9);
    EXPECT_TRUE(snapshot.active_alerts.empty());
}

TEST_F(MonitorPipelineTest, DetectorFailuresAreReported)
{
    auto pipeline = makePipeline();
    detector_->status = DetectionStatus::FAILED;
    EXPECT_EQ(pipeline->processFrame(frame_, at(0.0)).status, PipelineStatus::DETECTOR_ERROR);

    detector_->throw_error = true;
    MetricSnapshot snapshot;
    EXPECT_NO_THROW(snapshot = pipeline->processFrame(frame_, at(0.1)));
    EXPECT_EQ(snapshot.status, PipelineStatus::DETECTOR_ERROR);
    EXPECT_FALSE(snapshot.face_present);
}

TEST_F(MonitorPipelineTest, MicrosleepAlertsOnce)
{
    auto pipeline = makePipeline();
    auto recorder = std::make_shared<Testing::RecordingNotifier>();
    pipeline->addNotifier(recorder);

    for (int i = 0; i < 10; ++i)
        pipeline->processFrame(frame_, at(i / 10.0));

    detector_->face = Testing::makeFace(0.10);
    bool saw_active = false;
    for (int i = 10; i <= 40; ++i)
    {
        MetricSnapshot snapshot = pipeline->processFrame(frame_, at(i / 10.0));
        if (!snapshot.active_alerts.empty() && snapshot.active_alerts[0] == ConditionType::FATIGUE_MICROSLEEP)
            saw_active = true;
    }

    EXPECT_TRUE(saw_active);
    int microsleep_alerts = 0;
    for (const AlertPayload &payload : recorder->received)
    {
        if (payload.condition == ConditionType::FATIGUE_MICROSLEEP)
            microsleep_alerts++;
    }
    EXPECT_EQ(microsleep_alerts, 1);
    EXPECT_EQ(pipeline->coordinator().dispatchCount(ConditionType::FATIGUE_MICROSLEEP), 1);
}

TEST_F(MonitorPipelineTest, CameraUnavailableAfterMissedReads)
{
    config_.camera_unavailable_status_frames = 3;
    auto pipeline = makePipeline();
    source_->script = {FrameStatus::OK, FrameStatus::UNAVAILABLE, FrameStatus::UNAVAILABLE,
                       FrameStatus::UNAVAILABLE, FrameStatus::UNAVAILABLE};

    pipeline->run();

    // One face frame, then a status snapshot for the third and fourth missed reads
    ASSERT_EQ(sink_->snapshots.size(), 3u);
    EXPECT_EQ(sink_->snapshots[0].status, PipelineStatus::MONITORING);
    EXPECT_EQ(sink_->snapshots[1].status, PipelineStatus::CAMERA_UNAVAILABLE);
    EXPECT_EQ(sink_->snapshots[2].status, PipelineStatus::CAMERA_UNAVAILABLE);
    EXPECT_FALSE(sink_->snapshots[1].face_present);
    EXPECT_EQ(detector_->calls, 1);
}

TEST_F(MonitorPipelineTest, ShortOutageKeepsQuiet)
{
    config_.camera_unavailable_status_frames = 3;
    auto pipeline = makePipeline();
    source_->script = {FrameStatus::UNAVAILABLE, FrameStatus::UNAVAILABLE, FrameStatus::OK,
                       FrameStatus::UNAVAILABLE, FrameStatus::UNAVAILABLE, FrameStatus::OK};

    pipeline->run();

    ASSERT_EQ(sink_->snapshots.size(), 2u);
    EXPECT_EQ(sink_->snapshots[0].status, PipelineStatus::MONITORING);
    EXPECT_EQ(sink_->snapshots[1].status, PipelineStatus::MONITORING);
}

TEST_F(MonitorPipelineTest, FrameSkipProcessesEveryNth)
{
    config_.frame_skip = 3;
    auto pipeline = makePipeline();
    source_->script = std::vector<FrameStatus>(9, FrameStatus::OK);

    pipeline->run();
    EXPECT_EQ(detector_->calls, 3);
}

TEST_F(MonitorPipelineTest, ThrowingSinkDoesNotStopOthers)
{
    auto pipeline = makePipeline();
    pipeline->addSink(std::make_shared<ThrowingSink>());
    auto second = std::make_shared<RecordingSink>();
    pipeline->addSink(second);

    EXPECT_NO_THROW(pipeline->processFrame(frame_, at(0.0)));
    EXPECT_EQ(sink_->snapshots.size(), 1u);
    EXPECT_EQ(second->snapshots.size(), 1u);
}

TEST_F(MonitorPipelineTest, ResetSessionStartsOver)
{
    auto pipeline = makePipeline();
    auto recorder = std::make_shared<Testing::RecordingNotifier>();
    pipeline->addNotifier(recorder);

    detector_->face = Testing::makeFace(0.10);
    for (int i = 0; i <= 30; ++i)
        pipeline->processFrame(frame_, at(i / 10.0));
    ASSERT_EQ(pipeline->coordinator().dispatchCount(ConditionType::FATIGUE_MICROSLEEP), 1);

    pipeline->resetSession();
    EXPECT_EQ(pipeline->latestSnapshot()->frame_index, 0u);
    EXPECT_EQ(pipeline->coordinator().dispatchCount(ConditionType::FATIGUE_MICROSLEEP), 0);

    MetricSnapshot snapshot = pipeline->processFrame(frame_, at(10.0));
    EXPECT_EQ(snapshot.frame_index, 1u);
    EXPECT_EQ(snapshot.fatigue.microsleep_count, 0);
}
