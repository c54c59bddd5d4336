#pragma once

#include <stddef.h>
#include <stdint.h>

/**
 * @file SystemLimits.h
 * @brief Shared compile-time limits used across Core and modules.
 */

namespace Limits {

/** @brief JSON capacity for serial console line parsing in `SerialCommandModule::processLine_`. */
constexpr size_t JsonCmdBuf = 512;
/** @brief JSON capacity for one module's config export in `ConfigStore::toJsonModule`. */
constexpr size_t JsonCfgBuf = 384;
/** @brief Maximum number of registered config variables in `ConfigStore` metadata table. */
constexpr size_t MaxConfigVars = 48;
/** @brief Maximum NVS key length (without null terminator) enforced by `ConfigTypes::NVS_KEY`. */
constexpr size_t MaxNvsKeyLen = 15;
/** @brief FreeRTOS log queue length used by `LogHub` (`LogHubModule::init`). */
constexpr uint8_t LogQueueLen = 32;
/** @brief Epoch below which the wall clock is considered unset (2021-01-01 00:00:00 UTC). */
constexpr uint32_t MinValidEpoch = 1609459200UL;

/** @brief Event bus sizing (`EventBus`). */
namespace EventBus {
/** @brief FreeRTOS queue length. */
constexpr uint8_t QueueLen = 16;
/** @brief Largest payload copied into a queue item. */
constexpr size_t MaxPayload = 48;
/** @brief Subscriber table size. */
constexpr uint8_t MaxSubscribers = 8;
/** @brief Events delivered per dispatch pass. */
constexpr uint16_t DispatchBatch = 8;
}  // namespace EventBus

/** @brief Serial console buffers (`SerialCommandModule`). */
namespace Console {
/** @brief Longest accepted input line, including terminator. */
constexpr size_t LineBuf = 384;
/** @brief Command name buffer length. */
constexpr size_t CmdName = 48;
/** @brief Serialized command args buffer length. */
constexpr size_t CmdArgs = 256;
/** @brief Command handler reply buffer length (covers `alarmclock.list`). */
constexpr size_t Reply = 1536;
/** @brief Delay in ms between serial polls when the line is idle. */
constexpr uint32_t PollDelayMs = 20;
}  // namespace Console

/** @brief Alarm clock engine compile-time capacities and defaults. */
namespace AlarmClock {
/** @brief Maximum number of alarm clocks managed by `AlarmClockModule`. */
constexpr uint8_t MaxClocks = 4;
/** @brief Identifier buffer length (slug derived from the display name). */
constexpr size_t IdLen = 24;
/** @brief Display name buffer length. */
constexpr size_t NameLen = 32;
/** @brief Persisted `HH:MM:SS` buffer length. */
constexpr size_t TimeTextLen = 9;
/** @brief POSIX TZ string buffer length (`alarmclock.tz`). */
constexpr size_t TzLen = 64;
/** @brief Snooze duration applied when none is configured. */
constexpr uint16_t DefaultSnoozeMinutes = 9;
/** @brief Smallest accepted snooze duration. */
constexpr uint16_t MinSnoozeMinutes = 1;
/** @brief Largest accepted snooze duration. */
constexpr uint16_t MaxSnoozeMinutes = 180;
/** @brief Default alarm time-of-day for new clocks (07:00:00). */
constexpr uint8_t DefaultHour = 7;
/** @brief Longest relative offset accepted by `parseTimeSpec` ("in N minutes"). */
constexpr uint32_t MaxRelativeSec = 86400UL;
/** @brief Default timer poll period in ms (`AlarmClockModule::loop`). */
constexpr uint32_t DefaultTickMs = 200;
/** @brief Lower clamp for `alarmclock.tick_ms`. */
constexpr uint32_t MinTickMs = 50;
/** @brief Upper clamp for `alarmclock.tick_ms`. */
constexpr uint32_t MaxTickMs = 1000;
/** @brief Bounded wait for registry and per-clock mutexes. */
constexpr uint32_t LockTimeoutMs = 50;
/** @brief Delay in ms while the module is disabled. */
constexpr uint32_t DisabledDelayMs = 500;
/** @brief JSON capacity for alarm clock command args parsing. */
constexpr size_t JsonCmdBuf = 256;
/** @brief Reply buffer used by `AlarmClockModule` for a single clock state. */
constexpr size_t StateJsonBuf = 384;
}  // namespace AlarmClock

}  // namespace Limits
