/**
 * @file AlarmClockModule.cpp
 * @brief Implementation file.
 */

#include "AlarmClockModule.h"

#include "Core/CommandRegistry.h"
#include "Core/ConfigBranchIds.h"
#include "Core/ErrorCodes.h"
#include <Arduino.h>
#include <ArduinoJson.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

#define LOG_TAG "AlarmClk"
#include "Core/ModuleLog.h"

static bool clockValidNow_(time_t now)
{
    return now >= (time_t)Limits::MinValidEpoch;
}

static uint32_t clampTickMs_(int32_t inMs)
{
    if (inMs < (int32_t)Limits::AlarmClock::MinTickMs) return Limits::AlarmClock::MinTickMs;
    if (inMs > (int32_t)Limits::AlarmClock::MaxTickMs) return Limits::AlarmClock::MaxTickMs;
    return (uint32_t)inMs;
}

static bool persistedEqual_(const AlarmClockPersisted& a, const AlarmClockPersisted& b)
{
    if (a.enabled != b.enabled || a.hasAlarmTime != b.hasAlarmTime) return false;
    if (a.snoozeMinutes != b.snoozeMinutes) return false;
    if (!a.hasAlarmTime) return true;
    return a.alarmTime.hour == b.alarmTime.hour &&
           a.alarmTime.minute == b.alarmTime.minute &&
           a.alarmTime.second == b.alarmTime.second;
}

static void copyId_(char (&dst)[Limits::AlarmClock::IdLen], const char* src)
{
    strncpy(dst, src ? src : "", sizeof(dst) - 1);
    dst[sizeof(dst) - 1] = '\0';
}

static bool parseCmdArgsObject_(const CommandRequest& req, JsonObjectConst& outObj)
{
    static constexpr size_t CMD_DOC_CAPACITY = Limits::AlarmClock::JsonCmdBuf;
    static StaticJsonDocument<CMD_DOC_CAPACITY> doc;

    doc.clear();
    const char* json = req.args ? req.args : req.json;
    if (!json || json[0] == '\0') return false;

    const DeserializationError err = deserializeJson(doc, json);
    if (!err && doc.is<JsonObject>()) {
        if (json == req.json && doc["args"].is<JsonObjectConst>()) {
            outObj = doc["args"].as<JsonObjectConst>();
            return true;
        }
        outObj = doc.as<JsonObjectConst>();
        return true;
    }
    return false;
}

static void writeCmdError_(char* reply, size_t replyLen, ErrorCode code, const char* where, const char* input = nullptr)
{
    const bool ok = input ? writeErrorJsonWithInput(reply, replyLen, code, where, input)
                          : writeErrorJson(reply, replyLen, code, where);
    if (!ok) snprintf(reply, replyLen, "{\"ok\":false}");
}

// ---------------------------------------------------------------------------
// Locks
// ---------------------------------------------------------------------------

bool AlarmClockModule::lockRegistry_()
{
    if (!registryMutex_) return false;
    return xSemaphoreTake(registryMutex_, pdMS_TO_TICKS(Limits::AlarmClock::LockTimeoutMs)) == pdTRUE;
}

void AlarmClockModule::unlockRegistry_()
{
    if (registryMutex_) xSemaphoreGive(registryMutex_);
}

bool AlarmClockModule::lockSlot_(uint8_t slot)
{
    if (slot >= kSlots || !slotMutex_[slot]) return false;
    return xSemaphoreTake(slotMutex_[slot], pdMS_TO_TICKS(Limits::AlarmClock::LockTimeoutMs)) == pdTRUE;
}

void AlarmClockModule::unlockSlot_(uint8_t slot)
{
    if (slot < kSlots && slotMutex_[slot]) xSemaphoreGive(slotMutex_[slot]);
}

AlarmClock* AlarmClockModule::acquireClock_(const char* id, AlarmClockHandle& handle, ErrorCode& err)
{
    if (!id || id[0] == '\0') {
        err = ErrorCode::InvalidArgument;
        return nullptr;
    }
    if (!lockRegistry_()) {
        err = ErrorCode::NotReady;
        return nullptr;
    }
    if (!registry_.find(id, handle, err)) {
        unlockRegistry_();
        return nullptr;
    }
    if (!lockSlot_(handle.slot)) {
        unlockRegistry_();
        err = ErrorCode::NotReady;
        return nullptr;
    }
    // Holding the slot lock pins the clock: removal needs the same lock.
    unlockRegistry_();

    AlarmClock* clock = registry_.get(handle);
    if (!clock) {
        unlockSlot_(handle.slot);
        err = ErrorCode::NotFound;
        return nullptr;
    }
    return clock;
}

void AlarmClockModule::releaseClock_(const AlarmClockHandle& handle)
{
    unlockSlot_(handle.slot);
}

// ---------------------------------------------------------------------------
// Flags shared with listener callbacks
// ---------------------------------------------------------------------------

void AlarmClockModule::markDirty_(uint8_t slot)
{
    if (slot >= kSlots) return;
    portENTER_CRITICAL(&flagsMux_);
    dirty_[slot] = true;
    portEXIT_CRITICAL(&flagsMux_);
}

void AlarmClockModule::markPending_(uint8_t slot)
{
    if (slot >= kSlots) return;
    portENTER_CRITICAL(&flagsMux_);
    pending_[slot] = true;
    portEXIT_CRITICAL(&flagsMux_);
}

void AlarmClockModule::clearPending_(uint8_t slot)
{
    if (slot >= kSlots) return;
    portENTER_CRITICAL(&flagsMux_);
    pending_[slot] = false;
    portEXIT_CRITICAL(&flagsMux_);
}

// ---------------------------------------------------------------------------
// Operations
// ---------------------------------------------------------------------------

bool AlarmClockModule::addClock_(const char* name, char* outId, size_t outIdLen, ErrorCode& err)
{
    if (!name || name[0] == '\0' || strlen(name) >= Limits::AlarmClock::NameLen) {
        err = ErrorCode::InvalidArgument;
        return false;
    }

    AlarmClockConfig ccfg{};
    strncpy(ccfg.name, name, sizeof(ccfg.name) - 1);
    ccfg.defaultSnoozeMinutes = Limits::AlarmClock::DefaultSnoozeMinutes;
    if (!makeAlarmClockId(ccfg.name, ccfg.id, sizeof(ccfg.id))) {
        err = ErrorCode::InvalidArgument;
        return false;
    }

    if (!lockRegistry_()) {
        err = ErrorCode::NotReady;
        return false;
    }

    AlarmClockHandle handle{};
    ErrorCode findErr = ErrorCode::NotFound;
    if (registry_.find(ccfg.id, handle, findErr)) {
        unlockRegistry_();
        err = ErrorCode::DuplicateIdentifier;
        return false;
    }

    int16_t freeSlot = -1;
    for (uint8_t i = 0; i < kSlots; ++i) {
        AlarmClockHandle slotHandle{};
        if (!registry_.handleAt(i, slotHandle)) {
            freeSlot = (int16_t)i;
            break;
        }
    }
    if (freeSlot < 0) {
        unlockRegistry_();
        err = ErrorCode::RegistryFull;
        return false;
    }

    const uint8_t slot = (uint8_t)freeSlot;
    if (!lockSlot_(slot)) {
        unlockRegistry_();
        err = ErrorCode::NotReady;
        return false;
    }

    bool ok = registry_.registerClockAt(slot, ccfg, handle, err);
    if (ok) {
        AlarmClock* clock = registry_.get(handle);
        if (clock) clock->setListener(listenerFor_(slot));
    }
    unlockSlot_(slot);
    unlockRegistry_();

    if (!ok) {
        LOGW("add '%s' rejected: %s", ccfg.name, errorCodeStr(err));
        return false;
    }

    markDirty_(slot);
    clearPending_(slot);
    if (outId && outIdLen > 0) {
        strncpy(outId, ccfg.id, outIdLen - 1);
        outId[outIdLen - 1] = '\0';
    }
    LOGI("clock added id=%s name=%s slot=%u", ccfg.id, ccfg.name, (unsigned)slot);
    return true;
}

bool AlarmClockModule::removeClock_(const char* id, ErrorCode& err)
{
    if (!id || id[0] == '\0') {
        err = ErrorCode::InvalidArgument;
        return false;
    }
    if (!lockRegistry_()) {
        err = ErrorCode::NotReady;
        return false;
    }

    AlarmClockHandle handle{};
    if (!registry_.find(id, handle, err)) {
        unlockRegistry_();
        return false;
    }
    if (!lockSlot_(handle.slot)) {
        unlockRegistry_();
        err = ErrorCode::NotReady;
        return false;
    }

    // Cancel first: a ring can no longer be delivered once teardown started.
    AlarmClock* clock = registry_.get(handle);
    if (clock) clock->beginTeardown();
    const bool ok = registry_.unregisterClock(handle, err);

    unlockSlot_(handle.slot);
    unlockRegistry_();

    if (!ok) return false;

    markDirty_(handle.slot);
    clearPending_(handle.slot);
    LOGI("clock removed id=%s slot=%u", id, (unsigned)handle.slot);
    return true;
}

bool AlarmClockModule::runOp_(const char* id, ClockOp op, const char* timeSpec, int32_t minutes, ErrorCode& err)
{
    AlarmClockHandle handle{};
    AlarmClock* clock = acquireClock_(id, handle, err);
    if (!clock) return false;

    const time_t now = time(nullptr);
    bool ok = false;
    switch (op) {
        case ClockOp::SetAlarm:      ok = clock->setAlarm(timeSpec, now, err); break;
        case ClockOp::Enable:        ok = clock->enable(now, err); break;
        case ClockOp::Disable:       ok = clock->disable(now, err); break;
        case ClockOp::Snooze:        ok = clock->snooze(now, err); break;
        case ClockOp::Stop:          ok = clock->stop(now, err); break;
        case ClockOp::SnoozeMinutes: ok = clock->setSnoozeMinutes(minutes, now, err); break;
    }
    releaseClock_(handle);

    // An explicit command supersedes a restore still waiting for the wall clock.
    if (ok) clearPending_(handle.slot);
    return ok;
}

bool AlarmClockModule::buildState_(const char* id, char* out, size_t len, ErrorCode& err)
{
    if (!out || len == 0) {
        err = ErrorCode::InvalidArgument;
        return false;
    }

    AlarmClockHandle handle{};
    AlarmClock* clock = acquireClock_(id, handle, err);
    if (!clock) return false;

    AlarmClockSnapshot snap{};
    clock->snapshot(time(nullptr), snap);
    releaseClock_(handle);

    if (!buildAlarmClockStateJson(snap, out, len)) {
        err = ErrorCode::CfgTruncated;
        return false;
    }
    return true;
}

bool AlarmClockModule::buildList_(char* out, size_t len, ErrorCode& err)
{
    if (!out || len == 0) {
        err = ErrorCode::InvalidArgument;
        return false;
    }
    err = ErrorCode::CfgTruncated;

    AlarmClockSnapshot snaps[kSlots]{};
    uint8_t n = 0;
    const time_t now = time(nullptr);
    for (uint8_t i = 0; i < kSlots; ++i) {
        if (!lockSlot_(i)) {
            err = ErrorCode::NotReady;
            return false;
        }
        AlarmClockHandle handle{};
        const AlarmClock* clock = registry_.handleAt(i, handle) ? registry_.get(handle) : nullptr;
        if (clock) clock->snapshot(now, snaps[n++]);
        unlockSlot_(i);
    }

    int wrote = snprintf(out, len, "{\"ok\":true,\"count\":%u,\"enabled\":%s,\"clocks\":[",
                         (unsigned)n, enabled_ ? "true" : "false");
    if (wrote <= 0 || (size_t)wrote >= len) return false;
    size_t pos = (size_t)wrote;

    for (uint8_t i = 0; i < n; ++i) {
        if (i > 0) {
            if (len - pos < 2) return false;
            out[pos++] = ',';
            out[pos] = '\0';
        }
        if (!buildAlarmClockStateJson(snaps[i], out + pos, len - pos)) return false;
        pos += strlen(out + pos);
    }

    if ((len - pos) < 3) return false;
    out[pos++] = ']';
    out[pos++] = '}';
    out[pos] = '\0';
    return true;
}

uint8_t AlarmClockModule::listIds_(AlarmClockIdBuf* out, uint8_t max)
{
    if (!out || max == 0) return 0;
    uint8_t n = 0;
    for (uint8_t i = 0; i < kSlots && n < max; ++i) {
        if (!lockSlot_(i)) continue;
        AlarmClockHandle handle{};
        const AlarmClock* clock = registry_.handleAt(i, handle) ? registry_.get(handle) : nullptr;
        if (clock) copyId_(out[n++], clock->id());
        unlockSlot_(i);
    }
    return n;
}

// ---------------------------------------------------------------------------
// Listener trampolines (called under the slot lock, from any task)
// ---------------------------------------------------------------------------

AlarmClockListener AlarmClockModule::listenerFor_(uint8_t slot)
{
    AlarmClockListener l{};
    l.onStateChanged = onStateChanged_;
    l.onTriggered = onTriggered_;
    l.onRejected = onRejected_;
    l.ctx = &slotCtx_[slot];
    return l;
}

void AlarmClockModule::onStateChanged_(void* ctx, const AlarmClockSnapshot& snap)
{
    SlotCtx* sc = static_cast<SlotCtx*>(ctx);
    if (!sc || !sc->self) return;
    AlarmClockModule* self = sc->self;

    self->markDirty_(sc->slot);

    if (self->eventBus_) {
        AlarmClockStateChangedPayload p{};
        p.slot = sc->slot;
        p.phase = (uint8_t)snap.phase;
        p.enabled = snap.enabled;
        copyId_(p.id, snap.id);
        p.nextFireAt = (uint32_t)snap.nextFireAt;
        (void)self->eventBus_->post(self->eventBus_->ctx, EventId::AlarmClockStateChanged, &p, sizeof(p));
    }

    LOGI("%s: %s%s next=%lu snooze=%umin",
         snap.id,
         alarmClockPhaseStr(snap.phase),
         snap.enabled ? "" : " (off)",
         (unsigned long)snap.nextFireAt,
         (unsigned)snap.snoozeMinutes);
}

void AlarmClockModule::onTriggered_(void* ctx, const char* id, time_t firedAt)
{
    SlotCtx* sc = static_cast<SlotCtx*>(ctx);
    if (!sc || !sc->self) return;
    AlarmClockModule* self = sc->self;

    if (self->eventBus_) {
        AlarmClockTriggeredPayload p{};
        p.slot = sc->slot;
        copyId_(p.id, id);
        p.firedAt = (uint32_t)firedAt;
        if (!self->eventBus_->post(self->eventBus_->ctx, EventId::AlarmClockTriggered, &p, sizeof(p))) {
            LOGW("%s: trigger event dropped", id ? id : "?");
        }
    }
    LOGI("%s: ringing at %lu", id ? id : "?", (unsigned long)firedAt);
}

void AlarmClockModule::onRejected_(void* ctx, const char* id, const char* op, ErrorCode code, const char* input)
{
    SlotCtx* sc = static_cast<SlotCtx*>(ctx);
    if (!sc || !sc->self) return;
    AlarmClockModule* self = sc->self;

    if (self->eventBus_) {
        AlarmClockRejectedPayload p{};
        p.slot = sc->slot;
        p.code = (uint16_t)code;
        copyId_(p.id, id);
        strncpy(p.op, op ? op : "", sizeof(p.op) - 1);
        (void)self->eventBus_->post(self->eventBus_->ctx, EventId::AlarmClockRejected, &p, sizeof(p));
    }
    LOGW("%s: %s rejected (%s) input=%s",
         id ? id : "?", op ? op : "?", errorCodeStr(code), input ? input : "-");
}

// ---------------------------------------------------------------------------
// Config
// ---------------------------------------------------------------------------

void AlarmClockModule::applyTz_()
{
    const char* tz = (tz_[0] != '\0') ? tz_ : "UTC0";
    setenv("TZ", tz, 1);
    tzset();
    LOGI("timezone %s", tz);
}

void AlarmClockModule::onTzChanged_(void* ctx, const char& first)
{
    (void)first;
    AlarmClockModule* self = static_cast<AlarmClockModule*>(ctx);
    if (!self) return;
    self->applyTz_();
    self->rearmPending_ = true;
}

void AlarmClockModule::onEventStatic_(const Event& e, void* user)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(user);
    if (!self || e.id != EventId::ConfigChanged) return;
    if (!e.payload || e.len < sizeof(ConfigChangedPayload)) return;
    self->onConfigChanged_(*static_cast<const ConfigChangedPayload*>(e.payload));
}

void AlarmClockModule::onConfigChanged_(const ConfigChangedPayload& p)
{
    if (p.moduleId != (uint8_t)ConfigModuleId::AlarmClock) return;
    for (uint8_t i = 0; i < kSlots; ++i) {
        if (p.branchId == (uint16_t)configBranchFromAlarmClockSlot(i)) {
            markPending_(i);
            return;
        }
    }
}

uint32_t AlarmClockModule::tickMs_() const
{
    return clampTickMs_(tickMsCfg_);
}

bool AlarmClockModule::readSlotConfig_(uint8_t slot, AlarmClockConfig& cfgOut, AlarmClockPersisted& savedOut) const
{
    const char* name = slotName_[slot];
    if (name[0] == '\0') return false;
    if (strnlen(name, sizeof(slotName_[slot])) >= sizeof(cfgOut.name)) return false;

    strncpy(cfgOut.name, name, sizeof(cfgOut.name) - 1);
    if (!makeAlarmClockId(cfgOut.name, cfgOut.id, sizeof(cfgOut.id))) {
        LOGW("slot %u: name '%s' gives no usable id", (unsigned)slot, name);
        return false;
    }
    cfgOut.defaultSnoozeMinutes = Limits::AlarmClock::DefaultSnoozeMinutes;

    savedOut.enabled = slotActive_[slot];
    const int32_t snooze = slotSnooze_[slot];
    if (snooze >= (int32_t)Limits::AlarmClock::MinSnoozeMinutes &&
        snooze <= (int32_t)Limits::AlarmClock::MaxSnoozeMinutes) {
        savedOut.snoozeMinutes = (uint16_t)snooze;
    } else {
        LOGW("slot %u: snooze %ld out of range, default used", (unsigned)slot, (long)snooze);
        savedOut.snoozeMinutes = Limits::AlarmClock::DefaultSnoozeMinutes;
    }

    savedOut.hasAlarmTime = false;
    if (slotTime_[slot][0] != '\0') {
        ErrorCode err = ErrorCode::UnrecognizedFormat;
        AlarmTimeOfDay t{};
        if (parseTimeSpec(slotTime_[slot], 0, t, err)) {
            savedOut.alarmTime = t;
            savedOut.hasAlarmTime = true;
        } else {
            LOGW("slot %u: stored time '%s' ignored (%s)", (unsigned)slot, slotTime_[slot], errorCodeStr(err));
        }
    }
    return true;
}

void AlarmClockModule::writeSlotConfig_(uint8_t slot)
{
    char name[Limits::AlarmClock::NameLen] = {0};
    char timeText[Limits::AlarmClock::TimeTextLen] = {0};
    bool active = false;
    int32_t snooze = (int32_t)Limits::AlarmClock::DefaultSnoozeMinutes;

    if (!lockSlot_(slot)) {
        markDirty_(slot);
        return;
    }
    AlarmClockHandle handle{};
    const AlarmClock* clock = registry_.handleAt(slot, handle) ? registry_.get(handle) : nullptr;
    if (clock) {
        strncpy(name, clock->name(), sizeof(name) - 1);
        const AlarmClockPersisted p = clock->persisted();
        active = p.enabled;
        snooze = (int32_t)p.snoozeMinutes;
        if (p.hasAlarmTime && !formatTimeOfDay(p.alarmTime, timeText, sizeof(timeText))) timeText[0] = '\0';
    }
    unlockSlot_(slot);

    bool ok = cfg_->set(slotNameVar_[slot], name);
    ok = cfg_->set(slotTimeVar_[slot], timeText) && ok;
    ok = cfg_->set(slotActiveVar_[slot], active) && ok;
    ok = cfg_->set(slotSnoozeVar_[slot], snooze) && ok;
    if (!ok) {
        LOGW("slot %u: %s", (unsigned)slot, errorCodeStr(ErrorCode::PersistFailed));
    }
}

// ---------------------------------------------------------------------------
// Task side
// ---------------------------------------------------------------------------

void AlarmClockModule::applySchedulerState_(bool online)
{
    if (!lockRegistry_()) return;
    uint8_t locked = 0;
    for (; locked < kSlots; ++locked) {
        if (!lockSlot_(locked)) break;
    }
    if (locked == kSlots) {
        registry_.setSchedulerOnline(online);
        schedulerOnline_ = online;
        // Offline dropped every deadline.
        if (online) rearmPending_ = true;
    }
    while (locked > 0) unlockSlot_(--locked);
    unlockRegistry_();

    if (schedulerOnline_ == online) {
        LOGI("scheduler %s", online ? "online" : "offline");
    }
}

void AlarmClockModule::tickSlots_(time_t now)
{
    for (uint8_t i = 0; i < kSlots; ++i) {
        if (!lockSlot_(i)) continue;
        AlarmClockHandle handle{};
        AlarmClock* clock = registry_.handleAt(i, handle) ? registry_.get(handle) : nullptr;
        if (clock) (void)clock->tick(now);
        unlockSlot_(i);
    }
}

void AlarmClockModule::flushDirty_()
{
    for (uint8_t i = 0; i < kSlots; ++i) {
        bool dirty = false;
        portENTER_CRITICAL(&flagsMux_);
        dirty = dirty_[i];
        dirty_[i] = false;
        portEXIT_CRITICAL(&flagsMux_);
        if (dirty) writeSlotConfig_(i);
    }
}

void AlarmClockModule::syncPending_(time_t now)
{
    for (uint8_t i = 0; i < kSlots; ++i) {
        bool pending = false;
        portENTER_CRITICAL(&flagsMux_);
        pending = pending_[i];
        portEXIT_CRITICAL(&flagsMux_);
        if (!pending) continue;

        if (syncSlotFromConfig_(i, now)) clearPending_(i);
    }
}

bool AlarmClockModule::syncSlotFromConfig_(uint8_t slot, time_t now)
{
    AlarmClockConfig ccfg{};
    AlarmClockPersisted saved{};
    const bool wanted = readSlotConfig_(slot, ccfg, saved);

    if (!lockRegistry_()) return false;
    if (!lockSlot_(slot)) {
        unlockRegistry_();
        return false;
    }
    const bool settled = syncSlotLocked_(slot, now, wanted, ccfg, saved);
    unlockSlot_(slot);
    unlockRegistry_();
    return settled;
}

bool AlarmClockModule::syncSlotLocked_(uint8_t slot, time_t now, bool wanted,
                                       const AlarmClockConfig& ccfg, const AlarmClockPersisted& saved)
{
    // Unflushed runtime change: runtime state is newer than the config copy.
    bool dirty = false;
    portENTER_CRITICAL(&flagsMux_);
    dirty = dirty_[slot];
    portEXIT_CRITICAL(&flagsMux_);
    if (dirty) return false;

    AlarmClockHandle handle{};
    AlarmClock* clock = registry_.handleAt(slot, handle) ? registry_.get(handle) : nullptr;
    ErrorCode err = ErrorCode::Failed;

    if (clock && (!wanted || strcmp(clock->id(), ccfg.id) != 0 || strcmp(clock->name(), ccfg.name) != 0)) {
        LOGI("slot %u: %s dropped by config", (unsigned)slot, clock->id());
        clock->beginTeardown();
        if (!registry_.unregisterClock(handle, err)) {
            LOGW("slot %u: unregister failed (%s)", (unsigned)slot, errorCodeStr(err));
        }
        clock = nullptr;
    }
    if (!wanted) return true;

    if (!clock) {
        if (!registry_.registerClockAt(slot, ccfg, handle, err)) {
            LOGW("slot %u: cannot load '%s' (%s)", (unsigned)slot, ccfg.id, errorCodeStr(err));
            return true;
        }
        clock = registry_.get(handle);
        if (!clock) return true;
        clock->setListener(listenerFor_(slot));
        LOGI("slot %u: loaded %s", (unsigned)slot, ccfg.id);
    }

    const AlarmClockPersisted current = clock->persisted();
    if (persistedEqual_(current, saved)) return true;

    if (clock->phase() == AlarmClockPhase::Triggered || clock->phase() == AlarmClockPhase::Snoozed) {
        return applyWhileRinging_(clock, current, saved, now);
    }

    // Arming needs the wall clock; retry on a later tick.
    if (saved.enabled && saved.hasAlarmTime && !clockValidNow_(now)) return false;

    if (!clock->restore(saved, now, err)) {
        return !errorCodeRetryable(err);
    }
    return true;
}

bool AlarmClockModule::applyWhileRinging_(AlarmClock* clock, const AlarmClockPersisted& current,
                                          const AlarmClockPersisted& saved, time_t now)
{
    ErrorCode err = ErrorCode::Failed;
    AlarmClockPersisted sameSnooze = saved;
    sameSnooze.snoozeMinutes = current.snoozeMinutes;
    if (persistedEqual_(current, sameSnooze)) {
        // A running snooze keeps its deadline.
        if (!clock->setSnoozeMinutes((int32_t)saved.snoozeMinutes, now, err)) return !errorCodeRetryable(err);
        return true;
    }

    // New wake time or switch turned off: the ringing cycle ends here.
    LOGI("%s: config edit ends ringing cycle", clock->id());
    if (!clock->disable(now, err)) return !errorCodeRetryable(err);
    if (!clock->restore(saved, now, err)) return !errorCodeRetryable(err);
    return true;
}

void AlarmClockModule::rearmSlots_(time_t now)
{
    if (!clockValidNow_(now)) {
        rearmPending_ = true;
        return;
    }
    for (uint8_t i = 0; i < kSlots; ++i) {
        if (!lockSlot_(i)) {
            rearmPending_ = true;
            continue;
        }
        AlarmClockHandle handle{};
        AlarmClock* clock = registry_.handleAt(i, handle) ? registry_.get(handle) : nullptr;
        ErrorCode err = ErrorCode::Failed;
        if (clock && !clock->resume(now, err) && errorCodeRetryable(err)) rearmPending_ = true;
        unlockSlot_(i);
    }
}

void AlarmClockModule::loop()
{
    const bool online = enabled_;
    if (online != schedulerOnline_) applySchedulerState_(online);

    if (!online) {
        flushDirty_();
        vTaskDelay(pdMS_TO_TICKS(Limits::AlarmClock::DisabledDelayMs));
        return;
    }

    const time_t now = time(nullptr);
    if (rearmPending_) {
        rearmPending_ = false;
        rearmSlots_(now);
    }

    flushDirty_();
    syncPending_(now);
    tickSlots_(now);

    vTaskDelay(pdMS_TO_TICKS(tickMs_()));
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

bool AlarmClockModule::replyClockState_(const char* id, const char* where, char* reply, size_t replyLen)
{
    char state[Limits::AlarmClock::StateJsonBuf];
    ErrorCode err = ErrorCode::Failed;
    if (!buildState_(id, state, sizeof(state), err)) {
        writeCmdError_(reply, replyLen, err, where, id);
        return false;
    }
    const int wrote = snprintf(reply, replyLen, "{\"ok\":true,\"clock\":%s}", state);
    if (wrote <= 0 || (size_t)wrote >= replyLen) {
        writeCmdError_(reply, replyLen, ErrorCode::CfgTruncated, where);
        return false;
    }
    return true;
}

bool AlarmClockModule::handleCmdOp_(const CommandRequest& req, ClockOp op, const char* where, char* reply, size_t replyLen)
{
    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, args)) {
        writeCmdError_(reply, replyLen, ErrorCode::MissingArgs, where);
        return false;
    }

    const char* id = args["id"] | (const char*)nullptr;
    if (!id || id[0] == '\0') {
        writeCmdError_(reply, replyLen, ErrorCode::MissingValue, where);
        return false;
    }

    const char* timeSpec = nullptr;
    int32_t minutes = 0;
    char input[Limits::AlarmClock::IdLen + 8] = {0};
    if (op == ClockOp::SetAlarm) {
        timeSpec = args["time"] | (const char*)nullptr;
        if (!timeSpec) {
            writeCmdError_(reply, replyLen, ErrorCode::MissingValue, where, id);
            return false;
        }
    } else if (op == ClockOp::SnoozeMinutes) {
        if (!args["minutes"].is<int32_t>()) {
            writeCmdError_(reply, replyLen, ErrorCode::MissingValue, where, id);
            return false;
        }
        minutes = args["minutes"].as<int32_t>();
        snprintf(input, sizeof(input), "%ld", (long)minutes);
    }

    ErrorCode err = ErrorCode::Failed;
    if (!runOp_(id, op, timeSpec, minutes, err)) {
        const char* echo = timeSpec ? timeSpec : (input[0] ? input : id);
        writeCmdError_(reply, replyLen, err, where, echo);
        return false;
    }
    return replyClockState_(id, where, reply, replyLen);
}

bool AlarmClockModule::cmdSet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(userCtx);
    return self ? self->handleCmdOp_(req, ClockOp::SetAlarm, "alarmclock.set", reply, replyLen) : false;
}

bool AlarmClockModule::cmdSnooze_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(userCtx);
    return self ? self->handleCmdOp_(req, ClockOp::Snooze, "alarmclock.snooze", reply, replyLen) : false;
}

bool AlarmClockModule::cmdStop_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(userCtx);
    return self ? self->handleCmdOp_(req, ClockOp::Stop, "alarmclock.stop", reply, replyLen) : false;
}

bool AlarmClockModule::cmdEnable_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(userCtx);
    return self ? self->handleCmdOp_(req, ClockOp::Enable, "alarmclock.enable", reply, replyLen) : false;
}

bool AlarmClockModule::cmdDisable_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(userCtx);
    return self ? self->handleCmdOp_(req, ClockOp::Disable, "alarmclock.disable", reply, replyLen) : false;
}

bool AlarmClockModule::cmdSnoozeDuration_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(userCtx);
    return self ? self->handleCmdOp_(req, ClockOp::SnoozeMinutes, "alarmclock.snooze_duration", reply, replyLen) : false;
}

bool AlarmClockModule::cmdGet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(userCtx);
    if (!self) return false;

    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, args)) {
        writeCmdError_(reply, replyLen, ErrorCode::MissingArgs, "alarmclock.get");
        return false;
    }
    const char* id = args["id"] | (const char*)nullptr;
    if (!id || id[0] == '\0') {
        writeCmdError_(reply, replyLen, ErrorCode::MissingValue, "alarmclock.get");
        return false;
    }
    return self->replyClockState_(id, "alarmclock.get", reply, replyLen);
}

bool AlarmClockModule::cmdList_(void* userCtx, const CommandRequest&, char* reply, size_t replyLen)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(userCtx);
    if (!self) return false;
    ErrorCode err = ErrorCode::Failed;
    if (!self->buildList_(reply, replyLen, err)) {
        writeCmdError_(reply, replyLen, err, "alarmclock.list");
        return false;
    }
    return true;
}

bool AlarmClockModule::cmdAdd_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(userCtx);
    if (!self) return false;

    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, args)) {
        writeCmdError_(reply, replyLen, ErrorCode::MissingArgs, "alarmclock.add");
        return false;
    }
    const char* name = args["name"] | (const char*)nullptr;
    if (!name) {
        writeCmdError_(reply, replyLen, ErrorCode::MissingValue, "alarmclock.add");
        return false;
    }

    int32_t snooze = 0;
    const bool hasSnooze = !args["snooze"].isNull();
    if (hasSnooze) {
        snooze = args["snooze"] | (int32_t)-1;
        if (snooze < (int32_t)Limits::AlarmClock::MinSnoozeMinutes ||
            snooze > (int32_t)Limits::AlarmClock::MaxSnoozeMinutes) {
            char input[12];
            snprintf(input, sizeof(input), "%ld", (long)snooze);
            writeCmdError_(reply, replyLen, ErrorCode::OutOfRange, "alarmclock.add", input);
            return false;
        }
    }

    char id[Limits::AlarmClock::IdLen] = {0};
    ErrorCode err = ErrorCode::Failed;
    if (!self->addClock_(name, id, sizeof(id), err)) {
        writeCmdError_(reply, replyLen, err, "alarmclock.add", name);
        return false;
    }
    if (hasSnooze && !self->runOp_(id, ClockOp::SnoozeMinutes, nullptr, snooze, err)) {
        LOGW("%s: initial snooze not applied (%s)", id, errorCodeStr(err));
    }
    return self->replyClockState_(id, "alarmclock.add", reply, replyLen);
}

bool AlarmClockModule::cmdRemove_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(userCtx);
    if (!self) return false;

    JsonObjectConst args;
    if (!parseCmdArgsObject_(req, args)) {
        writeCmdError_(reply, replyLen, ErrorCode::MissingArgs, "alarmclock.remove");
        return false;
    }
    const char* id = args["id"] | (const char*)nullptr;
    if (!id || id[0] == '\0') {
        writeCmdError_(reply, replyLen, ErrorCode::MissingValue, "alarmclock.remove");
        return false;
    }

    ErrorCode err = ErrorCode::Failed;
    if (!self->removeClock_(id, err)) {
        writeCmdError_(reply, replyLen, err, "alarmclock.remove", id);
        return false;
    }
    // Only known ids reach this point, they are plain [a-z0-9_].
    snprintf(reply, replyLen, "{\"ok\":true,\"removed\":\"%s\"}", id);
    return true;
}

// ---------------------------------------------------------------------------
// Service trampolines
// ---------------------------------------------------------------------------

bool AlarmClockModule::svcAdd_(void* ctx, const char* name, char* outId, size_t outIdLen, ErrorCode* err)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(ctx);
    ErrorCode local = ErrorCode::Failed;
    const bool ok = self ? self->addClock_(name, outId, outIdLen, local) : false;
    if (err) *err = local;
    return ok;
}

bool AlarmClockModule::svcRemove_(void* ctx, const char* id, ErrorCode* err)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(ctx);
    ErrorCode local = ErrorCode::Failed;
    const bool ok = self ? self->removeClock_(id, local) : false;
    if (err) *err = local;
    return ok;
}

bool AlarmClockModule::svcSetAlarm_(void* ctx, const char* id, const char* timeSpec, ErrorCode* err)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(ctx);
    ErrorCode local = ErrorCode::Failed;
    const bool ok = self ? self->runOp_(id, ClockOp::SetAlarm, timeSpec, 0, local) : false;
    if (err) *err = local;
    return ok;
}

bool AlarmClockModule::svcEnable_(void* ctx, const char* id, ErrorCode* err)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(ctx);
    ErrorCode local = ErrorCode::Failed;
    const bool ok = self ? self->runOp_(id, ClockOp::Enable, nullptr, 0, local) : false;
    if (err) *err = local;
    return ok;
}

bool AlarmClockModule::svcDisable_(void* ctx, const char* id, ErrorCode* err)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(ctx);
    ErrorCode local = ErrorCode::Failed;
    const bool ok = self ? self->runOp_(id, ClockOp::Disable, nullptr, 0, local) : false;
    if (err) *err = local;
    return ok;
}

bool AlarmClockModule::svcSnooze_(void* ctx, const char* id, ErrorCode* err)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(ctx);
    ErrorCode local = ErrorCode::Failed;
    const bool ok = self ? self->runOp_(id, ClockOp::Snooze, nullptr, 0, local) : false;
    if (err) *err = local;
    return ok;
}

bool AlarmClockModule::svcStop_(void* ctx, const char* id, ErrorCode* err)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(ctx);
    ErrorCode local = ErrorCode::Failed;
    const bool ok = self ? self->runOp_(id, ClockOp::Stop, nullptr, 0, local) : false;
    if (err) *err = local;
    return ok;
}

bool AlarmClockModule::svcSetSnoozeMinutes_(void* ctx, const char* id, int32_t minutes, ErrorCode* err)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(ctx);
    ErrorCode local = ErrorCode::Failed;
    const bool ok = self ? self->runOp_(id, ClockOp::SnoozeMinutes, nullptr, minutes, local) : false;
    if (err) *err = local;
    return ok;
}

bool AlarmClockModule::svcBuildState_(void* ctx, const char* id, char* out, size_t len)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(ctx);
    ErrorCode err = ErrorCode::Failed;
    return self ? self->buildState_(id, out, len, err) : false;
}

uint8_t AlarmClockModule::svcListIds_(void* ctx, AlarmClockIdBuf* out, uint8_t max)
{
    AlarmClockModule* self = static_cast<AlarmClockModule*>(ctx);
    return self ? self->listIds_(out, max) : 0;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void AlarmClockModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg_ = &cfg;

    constexpr uint8_t kCfgModuleId = (uint8_t)ConfigModuleId::AlarmClock;
    bool cfgOk = cfg.registerVar(enabledVar_, kCfgModuleId, (uint16_t)ConfigBranchId::AlarmClock);
    cfgOk = cfg.registerVar(tickMsVar_, kCfgModuleId, (uint16_t)ConfigBranchId::AlarmClock) && cfgOk;
    tzVar_.addHandler(onTzChanged_, this);
    cfgOk = cfg.registerVar(tzVar_, kCfgModuleId, (uint16_t)ConfigBranchId::AlarmClock) && cfgOk;
    for (uint8_t i = 0; i < kSlots; ++i) {
        const uint16_t branch = (uint16_t)configBranchFromAlarmClockSlot(i);
        cfgOk = cfg.registerVar(slotNameVar_[i], kCfgModuleId, branch) && cfgOk;
        cfgOk = cfg.registerVar(slotTimeVar_[i], kCfgModuleId, branch) && cfgOk;
        cfgOk = cfg.registerVar(slotActiveVar_[i], kCfgModuleId, branch) && cfgOk;
        cfgOk = cfg.registerVar(slotSnoozeVar_[i], kCfgModuleId, branch) && cfgOk;
    }
    if (!cfgOk) LOGE("config registration incomplete");

    registryMutex_ = xSemaphoreCreateMutex();
    for (uint8_t i = 0; i < kSlots; ++i) {
        slotMutex_[i] = xSemaphoreCreateMutex();
        slotCtx_[i].self = this;
        slotCtx_[i].slot = i;
    }
    if (!registryMutex_) LOGE("registry mutex allocation failed");

    eventBus_ = services.get<EventBusService>("eventbus");
    if (!eventBus_ || !eventBus_->subscribe(eventBus_->ctx, EventId::ConfigChanged, &AlarmClockModule::onEventStatic_, this)) {
        LOGW("ConfigChanged subscription failed, config edits apply after reboot");
    }

    cmdSvc_ = services.get<CommandService>("cmd");
    if (cmdSvc_ && cmdSvc_->registerHandler) {
        bool ok = cmdSvc_->registerHandler(cmdSvc_->ctx, "alarmclock.add", &AlarmClockModule::cmdAdd_, this);
        ok = cmdSvc_->registerHandler(cmdSvc_->ctx, "alarmclock.remove", &AlarmClockModule::cmdRemove_, this) && ok;
        ok = cmdSvc_->registerHandler(cmdSvc_->ctx, "alarmclock.set", &AlarmClockModule::cmdSet_, this) && ok;
        ok = cmdSvc_->registerHandler(cmdSvc_->ctx, "alarmclock.snooze", &AlarmClockModule::cmdSnooze_, this) && ok;
        ok = cmdSvc_->registerHandler(cmdSvc_->ctx, "alarmclock.stop", &AlarmClockModule::cmdStop_, this) && ok;
        ok = cmdSvc_->registerHandler(cmdSvc_->ctx, "alarmclock.enable", &AlarmClockModule::cmdEnable_, this) && ok;
        ok = cmdSvc_->registerHandler(cmdSvc_->ctx, "alarmclock.disable", &AlarmClockModule::cmdDisable_, this) && ok;
        ok = cmdSvc_->registerHandler(cmdSvc_->ctx, "alarmclock.snooze_duration", &AlarmClockModule::cmdSnoozeDuration_, this) && ok;
        ok = cmdSvc_->registerHandler(cmdSvc_->ctx, "alarmclock.get", &AlarmClockModule::cmdGet_, this) && ok;
        ok = cmdSvc_->registerHandler(cmdSvc_->ctx, "alarmclock.list", &AlarmClockModule::cmdList_, this) && ok;
        if (!ok) LOGW("some alarmclock commands were not registered");
    } else {
        LOGW("command service missing");
    }

    if (!services.add("alarmclock", &clockSvc_)) {
        LOGE("AlarmClockService registration failed");
        return;
    }
    LOGI("AlarmClockService registered");
}

void AlarmClockModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    tickMsCfg_ = (int32_t)clampTickMs_(tickMsCfg_);
    applyTz_();

    uint8_t stored = 0;
    for (uint8_t i = 0; i < kSlots; ++i) {
        if (slotName_[i][0] == '\0') continue;
        markPending_(i);
        ++stored;
    }
    LOGI("%u stored clock(s), restore once the task runs", (unsigned)stored);
}
