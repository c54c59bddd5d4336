#pragma once
/**
 * @file AlarmClockRegistry.h
 * @brief Fixed-capacity table of alarm clocks addressed by id or handle.
 */

#include <stddef.h>
#include <stdint.h>

#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include "Modules/AlarmClockModule/AlarmClock.h"

/** @brief Slot index plus generation. A removed clock invalidates its handles. */
struct AlarmClockHandle {
    uint8_t slot = 0xFF;
    uint16_t generation = 0;
};

/**
 * @brief Derive an identifier from a display name.
 *
 * Lowercases ASCII letters, keeps digits, maps every other run of characters
 * to a single '_' and trims leading/trailing '_' ("Bedroom 1" -> "bedroom_1").
 * @return false when nothing usable remains or the id does not fit.
 */
bool makeAlarmClockId(const char* name, char* out, size_t outLen);

/** @brief True for a non-empty `[a-z0-9_]` identifier shorter than `IdLen`. */
bool alarmClockIdValid(const char* id);

/**
 * @brief Owns up to `Limits::AlarmClock::MaxClocks` clocks.
 *
 * Not thread-safe. The owner holds an exclusive lock for register/unregister
 * and at least a shared lock for lookups.
 */
class AlarmClockRegistry {
public:
    static constexpr uint8_t Capacity = Limits::AlarmClock::MaxClocks;

    /** @brief Register in the first free slot. */
    bool registerClock(const AlarmClockConfig& cfg, AlarmClockHandle& out, ErrorCode& err);
    /** @brief Register in a given slot (used when restoring persisted slots). */
    bool registerClockAt(uint8_t slot, const AlarmClockConfig& cfg, AlarmClockHandle& out, ErrorCode& err);
    /** @brief Cancel the clock timer, then free the slot. */
    bool unregisterClock(const AlarmClockHandle& handle, ErrorCode& err);

    bool find(const char* id, AlarmClockHandle& out, ErrorCode& err) const;
    bool isCurrent(const AlarmClockHandle& handle) const;
    AlarmClock* get(const AlarmClockHandle& handle);
    const AlarmClock* get(const AlarmClockHandle& handle) const;

    /** @brief Handle of an occupied slot. */
    bool handleAt(uint8_t slot, AlarmClockHandle& out) const;
    /** @brief Handles of all registered clocks in slot order. */
    uint8_t list(AlarmClockHandle* out, uint8_t max) const;
    uint8_t count() const;

    /** @brief Forwarded to every current and future clock timer. */
    void setSchedulerOnline(bool online);

private:
    struct Slot {
        bool used = false;
        uint16_t generation = 0;
        AlarmClock clock;
    };

    int16_t findSlotById_(const char* id) const;
    int16_t findFreeSlot_() const;

    Slot slots_[Capacity];
    bool schedulerOnline_ = false;
};
