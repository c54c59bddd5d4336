#pragma once
/**
 * @file EventId.h
 * @brief Enumerates event identifiers used by EventBus.
 */
#include <stdint.h>

/** @brief Known event identifiers. */
enum class EventId : uint16_t {
    None = 0,

    // System lifecycle
    SystemStarted = 1,

    // Configuration
    ConfigChanged = 100,

    // Alarm clocks
    AlarmClockTriggered = 430,
    AlarmClockStateChanged = 431,
    AlarmClockRejected = 432,
};
