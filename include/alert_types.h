#ifndef ALERT_TYPES_H
#define ALERT_TYPES_H

#include <array>
#include <string>
#include "timestamp.h"

namespace DeskMonitor
{
    enum class ConditionType
    {
        FATIGUE_LOW_BLINK,
        FATIGUE_HIGH_BLINK,
        FATIGUE_MICROSLEEP,
        FATIGUE_HIGH_PERCLOS,
        DISTANCE_TOO_CLOSE,
        POSTURE_HEAD_DOWN,
        POSTURE_HEAD_UP
    };

    enum class Severity
    {
        INFO = 1,
        WARNING = 2,
        CRITICAL = 3
    };

    constexpr std::array<ConditionType, 7> ALL_CONDITIONS = {
        ConditionType::FATIGUE_LOW_BLINK,
        ConditionType::FATIGUE_HIGH_BLINK,
        ConditionType::FATIGUE_MICROSLEEP,
        ConditionType::FATIGUE_HIGH_PERCLOS,
        ConditionType::DISTANCE_TOO_CLOSE,
        ConditionType::POSTURE_HEAD_DOWN,
        ConditionType::POSTURE_HEAD_UP};

    struct AlertPayload
    {
        ConditionType condition;
        Severity severity;
        std::string message;
        Timestamp timestamp;
    };

    std::string conditionToString(ConditionType condition);
    std::string severityToString(Severity severity);

    // Fixed severity of each condition type
    Severity conditionSeverity(ConditionType condition);

    // Spoken / displayed text for a condition
    std::string conditionMessage(ConditionType condition);
}

#endif // ALERT_TYPES_H
