#pragma once
/**
 * @file AlarmClock.h
 * @brief Per-alarm state machine (idle, armed, triggered, snoozed).
 */

#include <stddef.h>
#include <stdint.h>
#include <time.h>

#include "Core/ErrorCodes.h"
#include "Core/SystemLimits.h"
#include "Modules/AlarmClockModule/AlarmTimer.h"
#include "Modules/AlarmClockModule/FireTime.h"
#include "Modules/AlarmClockModule/TimeSpec.h"

enum class AlarmClockPhase : uint8_t {
    Idle = 0,
    Armed = 1,
    Triggered = 2,
    Snoozed = 3
};

const char* alarmClockPhaseStr(AlarmClockPhase phase);

/** @brief Immutable identity of an alarm clock. */
struct AlarmClockConfig {
    char id[Limits::AlarmClock::IdLen] = {0};
    char name[Limits::AlarmClock::NameLen] = {0};
    uint16_t defaultSnoozeMinutes = Limits::AlarmClock::DefaultSnoozeMinutes;
};

/** @brief Fields that survive a reboot. Everything else is rebuilt from them. */
struct AlarmClockPersisted {
    bool enabled = false;
    bool hasAlarmTime = false;
    AlarmTimeOfDay alarmTime{};
    uint16_t snoozeMinutes = Limits::AlarmClock::DefaultSnoozeMinutes;
};

/** @brief Observable attributes at a given instant. */
struct AlarmClockSnapshot {
    char id[Limits::AlarmClock::IdLen] = {0};
    char name[Limits::AlarmClock::NameLen] = {0};
    AlarmClockPhase phase = AlarmClockPhase::Idle;
    bool enabled = false;
    bool hasAlarmTime = false;
    AlarmTimeOfDay alarmTime{};
    uint16_t snoozeMinutes = 0;
    time_t nextFireAt = 0;
    time_t triggeredAt = 0;
    AlarmDate firedDate{};
    uint32_t countdownSec = 0;
    uint32_t snoozeLeftSec = 0;
    bool isSet = false;
};

/**
 * @brief Observer hooks. Called synchronously by the state machine; callees
 * must not call back into the same `AlarmClock`.
 */
struct AlarmClockListener {
    void (*onStateChanged)(void* ctx, const AlarmClockSnapshot& snap) = nullptr;
    void (*onTriggered)(void* ctx, const char* id, time_t firedAt) = nullptr;
    void (*onRejected)(void* ctx, const char* id, const char* op, ErrorCode code, const char* input) = nullptr;
    void* ctx = nullptr;
};

/** @brief Serialize a snapshot as a flat JSON object. */
bool buildAlarmClockStateJson(const AlarmClockSnapshot& snap, char* out, size_t outLen);

/**
 * @brief One virtual alarm clock.
 *
 * Commands validate first and only commit once every step (parse, fire time
 * computation, timer arming) succeeded, so a failed command leaves the clock
 * untouched. Not thread-safe; the owner serializes every call per instance.
 */
class AlarmClock {
public:
    bool configure(const AlarmClockConfig& cfg, ErrorCode& err);
    /** @brief Forget identity and state, back to an unconfigured instance. */
    void reset();

    void setListener(const AlarmClockListener& listener) { listener_ = listener; }
    /** @brief Going offline drops the pending deadline; call `resume()` once back online. */
    void setSchedulerOnline(bool online);
    /**
     * @brief Re-arm after the scheduler came back or the time zone moved.
     *
     * Armed clocks get the next occurrence from now (fired marker honoured).
     * A pending snooze keeps its deadline; one that passed meanwhile ends the
     * ringing cycle like `stop()`. Idle and triggered clocks are left alone.
     */
    bool resume(time_t now, ErrorCode& err);

    bool setAlarm(const char* timeSpec, time_t now, ErrorCode& err);
    bool enable(time_t now, ErrorCode& err);
    bool disable(time_t now, ErrorCode& err);
    bool snooze(time_t now, ErrorCode& err);
    bool stop(time_t now, ErrorCode& err);
    bool setSnoozeMinutes(int32_t minutes, time_t now, ErrorCode& err);

    /** @brief Rebuild runtime state from persisted fields. Rejected while ringing or snoozed. */
    bool restore(const AlarmClockPersisted& saved, time_t now, ErrorCode& err);

    /** @brief Poll the timer. Returns true when the alarm rang on this call. */
    bool tick(time_t now);

    /** @brief Cancel the timer and reject every later command with `InvalidState`. */
    void beginTeardown();

    bool configured() const { return configured_; }
    bool tearingDown() const { return tearingDown_; }
    const char* id() const { return cfg_.id; }
    const char* name() const { return cfg_.name; }
    AlarmClockPhase phase() const { return phase_; }
    bool enabled() const { return enabled_; }
    time_t nextFireAt() const { return nextFireAt_; }
    bool timerArmed() const { return timer_.armed(); }

    AlarmClockPersisted persisted() const;
    void snapshot(time_t now, AlarmClockSnapshot& out) const;

private:
    static void onTimerFired_(void* ctx, time_t firedAt);
    void handleFire_(time_t firedAt);

    bool guard_(const char* op, const char* input, ErrorCode& err);
    bool fail_(const char* op, ErrorCode code, const char* input, ErrorCode& err);
    bool armAt_(time_t fireAt);
    void notifyStateChanged_(time_t now);

    AlarmClockConfig cfg_{};
    bool configured_ = false;
    bool tearingDown_ = false;
    AlarmClockListener listener_{};
    AlarmTimer timer_;

    AlarmClockPhase phase_ = AlarmClockPhase::Idle;
    bool enabled_ = false;
    bool hasAlarmTime_ = false;
    AlarmTimeOfDay alarmTime_{};
    uint16_t snoozeMinutes_ = Limits::AlarmClock::DefaultSnoozeMinutes;
    time_t nextFireAt_ = 0;
    time_t triggeredAt_ = 0;
    AlarmDate firedDate_{};
};
