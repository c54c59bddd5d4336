#pragma once
/**
 * @file ConfigBranchIds.h
 * @brief Stable config branch identifiers used to group config variables.
 */

#include <stdint.h>

enum class ConfigBranchId : uint16_t {
    Unknown = 0,

    Log = 1,
    AlarmClock = 8,

    AlarmClockC0 = 64,
    AlarmClockC1 = 65,
    AlarmClockC2 = 66,
    AlarmClockC3 = 67
};

/** @brief Module ids carried by `ConfigVariable::moduleId`. */
enum class ConfigModuleId : uint8_t {
    Unknown = 0,
    Log = 1,
    AlarmClock = 8
};

constexpr ConfigBranchId configBranchFromAlarmClockSlot(uint8_t slot)
{
    if (slot > 3U) return ConfigBranchId::Unknown;
    return static_cast<ConfigBranchId>((uint16_t)ConfigBranchId::AlarmClockC0 + slot);
}

inline const char* configBranchModuleName(ConfigBranchId id)
{
    switch (id) {
        case ConfigBranchId::Log: return "log";
        case ConfigBranchId::AlarmClock: return "alarmclock";
        case ConfigBranchId::AlarmClockC0: return "alarmclock/c0";
        case ConfigBranchId::AlarmClockC1: return "alarmclock/c1";
        case ConfigBranchId::AlarmClockC2: return "alarmclock/c2";
        case ConfigBranchId::AlarmClockC3: return "alarmclock/c3";
        case ConfigBranchId::Unknown:
        default:
            return nullptr;
    }
}
