#ifndef ALERT_COORDINATOR_H
#define ALERT_COORDINATOR_H

#include <map>
#include <memory>
#include <vector>
#include "alert_types.h"
#include "config.h"
#include "metric_snapshot.h"
#include "notifier.h"
#include "timestamp.h"

namespace DeskMonitor
{
    enum class ConditionPhase
    {
        IDLE,
        FIRING,
        COOLDOWN
    };

    std::string conditionPhaseToString(ConditionPhase phase);

    struct ConditionRecord
    {
        ConditionPhase phase = ConditionPhase::IDLE;
        bool has_fired = false;
        Timestamp last_fired;
        int dispatch_count = 0;
    };

    struct AlertEvaluation
    {
        std::vector<ConditionType> active;     // crossing this frame, descending severity
        std::vector<AlertPayload> dispatched; // sent this frame, same order
    };

    /**
     * @brief Turns analyzer output into alerts.
     *
     * Each condition type runs IDLE -> FIRING -> COOLDOWN -> IDLE on its own
     * record; cooldowns are never shared between condition types.
     */
    class AlertCoordinator
    {
    private:
        Config config_;
        std::map<ConditionType, ConditionRecord> records_;
        std::vector<std::shared_ptr<Notifier>> notifiers_;
        size_t channel_failures_ = 0;

        void expireCooldowns(Timestamp now);
        void dispatch(const AlertPayload &payload);

    public:
        explicit AlertCoordinator(const Config &config);

        void addNotifier(std::shared_ptr<Notifier> notifier);
        size_t notifierCount() const { return notifiers_.size(); }

        AlertEvaluation evaluate(const MetricSnapshot &snapshot, Timestamp now);

        // Conditions the snapshot crosses, ordered by descending severity then enum order
        std::vector<ConditionType> crossedConditions(const MetricSnapshot &snapshot) const;

        void resetCooldown(ConditionType condition);
        void resetAll();

        int dispatchCount(ConditionType condition) const;
        ConditionPhase conditionState(ConditionType condition) const;
        size_t channelFailures() const { return channel_failures_; }
    };
}

#endif // ALERT_COORDINATOR_H
