#include "../include/alert_coordinator.h"
#include "../include/logger.h"
#include <algorithm>

namespace DeskMonitor
{
    std::string conditionPhaseToString(ConditionPhase phase)
    {
        switch (phase)
        {
        case ConditionPhase::IDLE:
            return "IDLE";
        case ConditionPhase::FIRING:
            return "FIRING";
        case ConditionPhase::COOLDOWN:
            return "COOLDOWN";
        default:
            return "UNKNOWN";
        }
    }

    AlertCoordinator::AlertCoordinator(const Config &config) : config_(config)
    {
        for (ConditionType condition : ALL_CONDITIONS)
            records_[condition] = ConditionRecord();
    }

    void AlertCoordinator::addNotifier(std::shared_ptr<Notifier> notifier)
    {
        if (notifier)
            notifiers_.push_back(std::move(notifier));
    }

    std::vector<ConditionType> AlertCoordinator::crossedConditions(const MetricSnapshot &snapshot) const
    {
        std::vector<ConditionType> crossed;
        if (!snapshot.face_present)
            return crossed;

        const FatigueSnapshot &fatigue = snapshot.fatigue;
        if (fatigue.valid)
        {
            if (fatigue.blink_rate_low)
                crossed.push_back(ConditionType::FATIGUE_LOW_BLINK);
            if (fatigue.blink_rate_high)
                crossed.push_back(ConditionType::FATIGUE_HIGH_BLINK);
            if (fatigue.microsleep_active)
                crossed.push_back(ConditionType::FATIGUE_MICROSLEEP);
            if (fatigue.perclos_valid && fatigue.perclos > config_.perclos_threshold)
                crossed.push_back(ConditionType::FATIGUE_HIGH_PERCLOS);
        }

        if (snapshot.distance.valid && snapshot.distance.is_too_close)
            crossed.push_back(ConditionType::DISTANCE_TOO_CLOSE);

        const PostureSnapshot &posture = snapshot.posture;
        if (posture.valid && posture.is_sustained)
        {
            if (posture.posture_state == PostureState::HEAD_DOWN)
                crossed.push_back(ConditionType::POSTURE_HEAD_DOWN);
            else if (posture.posture_state == PostureState::HEAD_UP)
                crossed.push_back(ConditionType::POSTURE_HEAD_UP);
        }

        // Enum order within a severity is kept by the stable sort
        std::stable_sort(crossed.begin(), crossed.end(), [](ConditionType a, ConditionType b)
                         { return static_cast<int>(conditionSeverity(a)) > static_cast<int>(conditionSeverity(b)); });
        return crossed;
    }

    void AlertCoordinator::expireCooldowns(Timestamp now)
    {
        for (auto &entry : records_)
        {
            ConditionRecord &record = entry.second;
            if (record.phase == ConditionPhase::COOLDOWN &&
                secondsBetween(record.last_fired, now) >= config_.cooldown_time_seconds)
            {
                record.phase = ConditionPhase::IDLE;
            }
        }
    }

    AlertEvaluation AlertCoordinator::evaluate(const MetricSnapshot &snapshot, Timestamp now)
    {
        expireCooldowns(now);

        AlertEvaluation evaluation;
        evaluation.active = crossedConditions(snapshot);

        for (ConditionType condition : evaluation.active)
        {
            ConditionRecord &record = records_[condition];
            if (record.phase != ConditionPhase::IDLE)
                continue;

            record.phase = ConditionPhase::FIRING;

            AlertPayload payload{condition, conditionSeverity(condition), conditionMessage(condition), now};
            Logger::logAlert(payload, snapshot);
            dispatch(payload);

            record.has_fired = true;
            record.last_fired = now;
            record.dispatch_count++;
            record.phase = ConditionPhase::COOLDOWN;
            evaluation.dispatched.push_back(payload);
        }

        return evaluation;
    }

    void AlertCoordinator::dispatch(const AlertPayload &payload)
    {
        for (const auto &notifier : notifiers_)
        {
            try
            {
                if (!notifier->notify(payload))
                {
                    channel_failures_++;
                    Logger::warn("AlertCoordinator", notifier->name() + " did not deliver " +
                                                         conditionToString(payload.condition));
                }
            }
            catch (const std::exception &e)
            {
                channel_failures_++;
                Logger::error("AlertCoordinator", notifier->name() + " threw while delivering " +
                                                      conditionToString(payload.condition) + ": " + e.what());
            }
        }
    }

    void AlertCoordinator::resetCooldown(ConditionType condition)
    {
        ConditionRecord &record = records_[condition];
        record.phase = ConditionPhase::IDLE;
    }

    void AlertCoordinator::resetAll()
    {
        for (auto &entry : records_)
            entry.second = ConditionRecord();
        channel_failures_ = 0;
    }

    int AlertCoordinator::dispatchCount(ConditionType condition) const
    {
        auto it = records_.find(condition);
        return it == records_.end() ? 0 : it->second.dispatch_count;
    }

    ConditionPhase AlertCoordinator::conditionState(ConditionType condition) const
    {
        auto it = records_.find(condition);
        return it == records_.end() ? ConditionPhase::IDLE : it->second.phase;
    }
}
