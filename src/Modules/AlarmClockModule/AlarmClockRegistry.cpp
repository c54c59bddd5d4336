/**
 * @file AlarmClockRegistry.cpp
 * @brief Fixed-capacity alarm clock table implementation.
 */

#include "Modules/AlarmClockModule/AlarmClockRegistry.h"

#include <ctype.h>
#include <string.h>

bool makeAlarmClockId(const char* name, char* out, size_t outLen)
{
    if (!name || !out || outLen < 2) return false;

    size_t n = 0;
    bool pendingSep = false;
    for (const char* p = name; *p != '\0'; ++p) {
        const unsigned char c = (unsigned char)*p;
        if (isalnum(c) && c < 0x80) {
            if (pendingSep && n > 0) {
                if (n + 1 >= outLen) return false;
                out[n++] = '_';
            }
            pendingSep = false;
            if (n + 1 >= outLen) return false;
            out[n++] = (char)tolower(c);
        } else {
            pendingSep = true;
        }
    }
    out[n] = '\0';
    return n > 0;
}

bool alarmClockIdValid(const char* id)
{
    if (!id || id[0] == '\0') return false;
    size_t n = 0;
    for (const char* p = id; *p != '\0'; ++p, ++n) {
        if (n + 1 >= Limits::AlarmClock::IdLen) return false;
        const char c = *p;
        const bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
        if (!ok) return false;
    }
    return true;
}

int16_t AlarmClockRegistry::findSlotById_(const char* id) const
{
    if (!id) return -1;
    for (uint8_t i = 0; i < Capacity; ++i) {
        if (!slots_[i].used) continue;
        if (strcmp(slots_[i].clock.id(), id) == 0) return (int16_t)i;
    }
    return -1;
}

int16_t AlarmClockRegistry::findFreeSlot_() const
{
    for (uint8_t i = 0; i < Capacity; ++i) {
        if (!slots_[i].used) return (int16_t)i;
    }
    return -1;
}

bool AlarmClockRegistry::registerClock(const AlarmClockConfig& cfg, AlarmClockHandle& out, ErrorCode& err)
{
    if (!alarmClockIdValid(cfg.id)) {
        err = ErrorCode::InvalidArgument;
        return false;
    }
    if (findSlotById_(cfg.id) >= 0) {
        err = ErrorCode::DuplicateIdentifier;
        return false;
    }
    const int16_t idx = findFreeSlot_();
    if (idx < 0) {
        err = ErrorCode::RegistryFull;
        return false;
    }
    return registerClockAt((uint8_t)idx, cfg, out, err);
}

bool AlarmClockRegistry::registerClockAt(uint8_t slot, const AlarmClockConfig& cfg, AlarmClockHandle& out, ErrorCode& err)
{
    if (slot >= Capacity || !alarmClockIdValid(cfg.id)) {
        err = ErrorCode::InvalidArgument;
        return false;
    }
    if (findSlotById_(cfg.id) >= 0) {
        err = ErrorCode::DuplicateIdentifier;
        return false;
    }
    Slot& s = slots_[slot];
    if (s.used) {
        err = ErrorCode::InvalidState;
        return false;
    }

    s.clock.setSchedulerOnline(schedulerOnline_);
    if (!s.clock.configure(cfg, err)) return false;

    s.used = true;
    s.generation = (uint16_t)(s.generation + 1U);
    out.slot = slot;
    out.generation = s.generation;
    return true;
}

bool AlarmClockRegistry::unregisterClock(const AlarmClockHandle& handle, ErrorCode& err)
{
    if (!isCurrent(handle)) {
        err = ErrorCode::NotFound;
        return false;
    }
    Slot& s = slots_[handle.slot];
    s.clock.beginTeardown();
    s.clock.reset();
    s.used = false;
    // Bump again so handles issued before removal never match a later occupant.
    s.generation = (uint16_t)(s.generation + 1U);
    return true;
}

bool AlarmClockRegistry::find(const char* id, AlarmClockHandle& out, ErrorCode& err) const
{
    const int16_t idx = findSlotById_(id);
    if (idx < 0) {
        err = ErrorCode::NotFound;
        return false;
    }
    out.slot = (uint8_t)idx;
    out.generation = slots_[idx].generation;
    return true;
}

bool AlarmClockRegistry::isCurrent(const AlarmClockHandle& handle) const
{
    if (handle.slot >= Capacity) return false;
    const Slot& s = slots_[handle.slot];
    return s.used && s.generation == handle.generation;
}

AlarmClock* AlarmClockRegistry::get(const AlarmClockHandle& handle)
{
    return isCurrent(handle) ? &slots_[handle.slot].clock : nullptr;
}

const AlarmClock* AlarmClockRegistry::get(const AlarmClockHandle& handle) const
{
    return isCurrent(handle) ? &slots_[handle.slot].clock : nullptr;
}

bool AlarmClockRegistry::handleAt(uint8_t slot, AlarmClockHandle& out) const
{
    if (slot >= Capacity || !slots_[slot].used) return false;
    out.slot = slot;
    out.generation = slots_[slot].generation;
    return true;
}

uint8_t AlarmClockRegistry::list(AlarmClockHandle* out, uint8_t max) const
{
    if (!out || max == 0) return 0;
    uint8_t n = 0;
    for (uint8_t i = 0; i < Capacity && n < max; ++i) {
        if (handleAt(i, out[n])) ++n;
    }
    return n;
}

uint8_t AlarmClockRegistry::count() const
{
    uint8_t n = 0;
    for (uint8_t i = 0; i < Capacity; ++i) {
        if (slots_[i].used) ++n;
    }
    return n;
}

void AlarmClockRegistry::setSchedulerOnline(bool online)
{
    schedulerOnline_ = online;
    for (uint8_t i = 0; i < Capacity; ++i) {
        slots_[i].clock.setSchedulerOnline(online);
    }
}
