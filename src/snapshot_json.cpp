#include "../include/snapshot_json.h"
#include <chrono>

namespace DeskMonitor
{
    std::string pipelineStatusToString(PipelineStatus status)
    {
        switch (status)
        {
        case PipelineStatus::MONITORING:
            return "MONITORING";
        case PipelineStatus::NO_FACE:
            return "NO_FACE";
        case PipelineStatus::DETECTOR_ERROR:
            return "DETECTOR_ERROR";
        case PipelineStatus::CAMERA_UNAVAILABLE:
            return "CAMERA_UNAVAILABLE";
        case PipelineStatus::STOPPED:
            return "STOPPED";
        default:
            return "UNKNOWN";
        }
    }

    void to_json(nlohmann::json &j, const FatigueSnapshot &fatigue)
    {
        j = nlohmann::json{
            {"ear_left", fatigue.ear_left},
            {"ear_right", fatigue.ear_right},
            {"ear_avg", fatigue.ear_avg},
            {"is_blinking", fatigue.is_blinking},
            {"blink_count_total", fatigue.blink_count_total},
            {"perclos", fatigue.perclos},
            {"perclos_valid", fatigue.perclos_valid},
            {"microsleep_active", fatigue.microsleep_active},
            {"microsleep_count", fatigue.microsleep_count},
            {"closed_duration", fatigue.closed_duration},
            {"blinks_per_minute", fatigue.blinks_per_minute},
            {"blink_rate_valid", fatigue.blink_rate_valid},
            {"blink_rate_low", fatigue.blink_rate_low},
            {"blink_rate_high", fatigue.blink_rate_high},
            {"fatigue_level", fatigue.fatigue_level},
            {"valid", fatigue.valid}};
    }

    void to_json(nlohmann::json &j, const DistanceSnapshot &distance)
    {
        j = nlohmann::json{
            {"raw_bbox_estimate", distance.raw_bbox_estimate},
            {"raw_eye_estimate", distance.raw_eye_estimate},
            {"smoothed_distance", distance.smoothed_distance},
            {"is_too_close", distance.is_too_close},
            {"sustained_seconds", distance.sustained_seconds},
            {"zone", DistanceEstimator::zoneToString(distance.zone)},
            {"valid", distance.valid}};
    }

    void to_json(nlohmann::json &j, const PostureSnapshot &posture)
    {
        j = nlohmann::json{
            {"pitch", posture.pitch},
            {"yaw", posture.yaw},
            {"roll", posture.roll},
            {"posture_state", PostureAnalyzer::postureStateToString(posture.posture_state)},
            {"sustained_seconds", posture.sustained_seconds},
            {"is_sustained", posture.is_sustained},
            {"valid", posture.valid},
            {"consecutive_failures", posture.consecutive_failures}};
    }

    void to_json(nlohmann::json &j, const MetricSnapshot &snapshot)
    {
        nlohmann::json alerts = nlohmann::json::array();
        for (ConditionType condition : snapshot.active_alerts)
            alerts.push_back(conditionToString(condition));

        j = nlohmann::json{
            {"fatigue", snapshot.fatigue},
            {"distance", snapshot.distance},
            {"posture", snapshot.posture},
            {"active_alerts", alerts},
            {"face_present", snapshot.face_present},
            {"status", pipelineStatusToString(snapshot.status)},
            {"seconds_without_face", snapshot.seconds_without_face},
            {"frame_index", snapshot.frame_index},
            {"fps", snapshot.fps}};
    }

    void to_json(nlohmann::json &j, const AlertPayload &payload)
    {
        // Steady clock has no calendar meaning; subscribers get wall time of publication
        auto wall_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                           std::chrono::system_clock::now().time_since_epoch())
                           .count();

        j = nlohmann::json{
            {"condition", conditionToString(payload.condition)},
            {"severity", severityToString(payload.severity)},
            {"message", payload.message},
            {"timestamp_ms", wall_ms}};
    }
}
