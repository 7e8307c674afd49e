#ifndef SNAPSHOT_JSON_H
#define SNAPSHOT_JSON_H

#include <nlohmann/json.hpp>
#include "alert_types.h"
#include "metric_snapshot.h"

namespace DeskMonitor
{
    // Found by nlohmann::json through ADL
    void to_json(nlohmann::json &j, const FatigueSnapshot &fatigue);
    void to_json(nlohmann::json &j, const DistanceSnapshot &distance);
    void to_json(nlohmann::json &j, const PostureSnapshot &posture);
    void to_json(nlohmann::json &j, const MetricSnapshot &snapshot);
    void to_json(nlohmann::json &j, const AlertPayload &payload);
}

#endif // SNAPSHOT_JSON_H
