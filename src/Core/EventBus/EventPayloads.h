#pragma once
/**
 * @file EventPayloads.h
 * @brief Payload types used by EventBus events.
 */
#include <stdint.h>
#include "Core/SystemLimits.h"

// Keep payloads small and trivially copyable.
// EventBus will copy payload bytes into its queue buffer.

/** @brief Payload for ConfigChanged events. */
struct ConfigChangedPayload {
    char nvsKey[Limits::MaxNvsKeyLen + 1];
    uint8_t moduleId;   // ConfigModuleId, 0 when unknown
    uint16_t branchId;  // ConfigBranchId, 0 when unknown
};

/** @brief Payload for AlarmClockTriggered (primary fire or snooze re-fire). */
struct AlarmClockTriggeredPayload {
    uint8_t slot;
    char id[Limits::AlarmClock::IdLen];
    uint32_t firedAt;   // epoch seconds
};

/** @brief Payload for AlarmClockStateChanged. */
struct AlarmClockStateChangedPayload {
    uint8_t slot;
    uint8_t phase;      // AlarmClockPhase
    bool enabled;
    char id[Limits::AlarmClock::IdLen];
    uint32_t nextFireAt; // epoch seconds, 0 when nothing is scheduled
};

/** @brief Payload for AlarmClockRejected. */
struct AlarmClockRejectedPayload {
    uint8_t slot;
    uint16_t code;      // ErrorCode
    char id[Limits::AlarmClock::IdLen];
    char op[12];
};

static_assert(sizeof(ConfigChangedPayload) <= Limits::EventBus::MaxPayload, "ConfigChangedPayload too large");
static_assert(sizeof(AlarmClockTriggeredPayload) <= Limits::EventBus::MaxPayload, "AlarmClockTriggeredPayload too large");
static_assert(sizeof(AlarmClockStateChangedPayload) <= Limits::EventBus::MaxPayload, "AlarmClockStateChangedPayload too large");
static_assert(sizeof(AlarmClockRejectedPayload) <= Limits::EventBus::MaxPayload, "AlarmClockRejectedPayload too large");
