#pragma once
/**
 * @file IAlarmClock.h
 * @brief Alarm clock service interface.
 */

#include <stddef.h>
#include <stdint.h>

#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"

/** @brief Fixed-size identifier buffer used by `listIds`. */
typedef char AlarmClockIdBuf[Limits::AlarmClock::IdLen];

/**
 * Service contract exposed by AlarmClockModule.
 * Every mutating call reports the rejection reason through `err` (may be null).
 */
struct AlarmClockService {
    bool (*add)(void* ctx, const char* name, char* outId, size_t outIdLen, ErrorCode* err);
    bool (*remove)(void* ctx, const char* id, ErrorCode* err);
    bool (*setAlarm)(void* ctx, const char* id, const char* timeSpec, ErrorCode* err);
    bool (*enable)(void* ctx, const char* id, ErrorCode* err);
    bool (*disable)(void* ctx, const char* id, ErrorCode* err);
    bool (*snooze)(void* ctx, const char* id, ErrorCode* err);
    bool (*stop)(void* ctx, const char* id, ErrorCode* err);
    bool (*setSnoozeMinutes)(void* ctx, const char* id, int32_t minutes, ErrorCode* err);
    /** Flat JSON object with the observable attributes of one clock. */
    bool (*buildState)(void* ctx, const char* id, char* out, size_t len);
    uint8_t (*listIds)(void* ctx, AlarmClockIdBuf* out, uint8_t max);
    void* ctx;
};
