#include "../include/alert_types.h"

namespace DeskMonitor
{
    std::string conditionToString(ConditionType condition)
    {
        switch (condition)
        {
        case ConditionType::FATIGUE_LOW_BLINK:
            return "FATIGUE_LOW_BLINK";
        case ConditionType::FATIGUE_HIGH_BLINK:
            return "FATIGUE_HIGH_BLINK";
        case ConditionType::FATIGUE_MICROSLEEP:
            return "FATIGUE_MICROSLEEP";
        case ConditionType::FATIGUE_HIGH_PERCLOS:
            return "FATIGUE_HIGH_PERCLOS";
        case ConditionType::DISTANCE_TOO_CLOSE:
            return "DISTANCE_TOO_CLOSE";
        case ConditionType::POSTURE_HEAD_DOWN:
            return "POSTURE_HEAD_DOWN";
        case ConditionType::POSTURE_HEAD_UP:
            return "POSTURE_HEAD_UP";
        default:
            return "UNKNOWN";
        }
    }

    std::string severityToString(Severity severity)
    {
        switch (severity)
        {
        case Severity::INFO:
            return "INFO";
        case Severity::WARNING:
            return "WARNING";
        case Severity::CRITICAL:
            return "CRITICAL";
        default:
            return "UNKNOWN";
        }
    }

    Severity conditionSeverity(ConditionType condition)
    {
        switch (condition)
        {
        case ConditionType::FATIGUE_MICROSLEEP:
            return Severity::CRITICAL;
        case ConditionType::FATIGUE_LOW_BLINK:
        case ConditionType::FATIGUE_HIGH_PERCLOS:
        case ConditionType::DISTANCE_TOO_CLOSE:
        case ConditionType::POSTURE_HEAD_DOWN:
            return Severity::WARNING;
        case ConditionType::FATIGUE_HIGH_BLINK:
        case ConditionType::POSTURE_HEAD_UP:
        default:
            return Severity::INFO;
        }
    }

    std::string conditionMessage(ConditionType condition)
    {
        switch (condition)
        {
        case ConditionType::FATIGUE_LOW_BLINK:
            return "You are blinking less than usual. Rest your eyes for a moment.";
        case ConditionType::FATIGUE_HIGH_BLINK:
            return "Your blink rate is high. Your eyes may be tired or dry.";
        case ConditionType::FATIGUE_MICROSLEEP:
            return "Severe fatigue detected! Please rest immediately.";
        case ConditionType::FATIGUE_HIGH_PERCLOS:
            return "You look tired. Please take a break.";
        case ConditionType::DISTANCE_TOO_CLOSE:
            return "You are too close to the screen. Please move back.";
        case ConditionType::POSTURE_HEAD_DOWN:
            return "Head down for too long. Please sit up straight.";
        case ConditionType::POSTURE_HEAD_UP:
            return "Head tilted up for too long. Please adjust your screen height.";
        default:
            return "Alert";
        }
    }
}
