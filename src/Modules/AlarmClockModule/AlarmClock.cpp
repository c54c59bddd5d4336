/**
 * @file AlarmClock.cpp
 * @brief Per-alarm state machine implementation.
 */

#include "Modules/AlarmClockModule/AlarmClock.h"

#include <stdio.h>
#include <string.h>

namespace {

bool clockValid_(time_t now)
{
    return now >= (time_t)Limits::MinValidEpoch;
}

bool snoozeMinutesValid_(int32_t minutes)
{
    return minutes >= (int32_t)Limits::AlarmClock::MinSnoozeMinutes &&
           minutes <= (int32_t)Limits::AlarmClock::MaxSnoozeMinutes;
}

bool nameValid_(const char* name)
{
    for (const char* p = name; *p != '\0'; ++p) {
        if (*p == '"' || *p == '\\' || (unsigned char)*p < 0x20) return false;
    }
    return true;
}

uint32_t secondsUntil_(time_t target, time_t now)
{
    if (target <= now) return 0U;
    return (uint32_t)(target - now);
}

}  // namespace

const char* alarmClockPhaseStr(AlarmClockPhase phase)
{
    switch (phase) {
        case AlarmClockPhase::Idle: return "idle";
        case AlarmClockPhase::Armed: return "armed";
        case AlarmClockPhase::Triggered: return "triggered";
        case AlarmClockPhase::Snoozed: return "snoozed";
    }
    return "unknown";
}

bool buildAlarmClockStateJson(const AlarmClockSnapshot& snap, char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;

    char alarmText[Limits::AlarmClock::TimeTextLen] = {0};
    if (snap.hasAlarmTime && !formatTimeOfDay(snap.alarmTime, alarmText, sizeof(alarmText))) return false;
    char firedText[12] = {0};
    if (!formatAlarmDate(snap.firedDate, firedText, sizeof(firedText))) return false;

    const int wrote = snprintf(
        out,
        outLen,
        "{\"id\":\"%s\",\"name\":\"%s\",\"enabled\":%s,\"status\":\"%s\",\"alarm_time\":\"%s\","
        "\"snooze_time\":%u,\"next_fire\":%lld,\"countdown_s\":%lu,\"snooze_left_s\":%lu,"
        "\"is_set\":%s,\"last_fired\":\"%s\"}",
        snap.id,
        snap.name,
        snap.enabled ? "true" : "false",
        alarmClockPhaseStr(snap.phase),
        alarmText,
        (unsigned)snap.snoozeMinutes,
        (long long)snap.nextFireAt,
        (unsigned long)snap.countdownSec,
        (unsigned long)snap.snoozeLeftSec,
        snap.isSet ? "true" : "false",
        firedText);
    return (wrote > 0) && ((size_t)wrote < outLen);
}

bool AlarmClock::configure(const AlarmClockConfig& cfg, ErrorCode& err)
{
    const size_t idLen = strnlen(cfg.id, sizeof(cfg.id));
    const size_t nameLen = strnlen(cfg.name, sizeof(cfg.name));
    if (idLen == 0 || idLen >= sizeof(cfg.id) || nameLen >= sizeof(cfg.name) || !nameValid_(cfg.name)) {
        err = ErrorCode::InvalidArgument;
        return false;
    }
    if (!snoozeMinutesValid_((int32_t)cfg.defaultSnoozeMinutes)) {
        err = ErrorCode::OutOfRange;
        return false;
    }

    const bool online = timer_.online();
    reset();
    timer_.setOnline(online);
    cfg_ = cfg;
    snoozeMinutes_ = cfg.defaultSnoozeMinutes;
    configured_ = true;
    return true;
}

void AlarmClock::reset()
{
    timer_.cancel();
    cfg_ = AlarmClockConfig{};
    configured_ = false;
    tearingDown_ = false;
    listener_ = AlarmClockListener{};
    phase_ = AlarmClockPhase::Idle;
    enabled_ = false;
    hasAlarmTime_ = false;
    alarmTime_ = AlarmTimeOfDay{};
    snoozeMinutes_ = Limits::AlarmClock::DefaultSnoozeMinutes;
    nextFireAt_ = 0;
    triggeredAt_ = 0;
    firedDate_ = AlarmDate{};
}

bool AlarmClock::fail_(const char* op, ErrorCode code, const char* input, ErrorCode& err)
{
    err = code;
    if (listener_.onRejected) listener_.onRejected(listener_.ctx, cfg_.id, op, code, input);
    return false;
}

bool AlarmClock::guard_(const char* op, const char* input, ErrorCode& err)
{
    if (!configured_ || tearingDown_) return fail_(op, ErrorCode::InvalidState, input, err);
    return true;
}

bool AlarmClock::armAt_(time_t fireAt)
{
    return timer_.arm(fireAt, &AlarmClock::onTimerFired_, this);
}

void AlarmClock::notifyStateChanged_(time_t now)
{
    if (!listener_.onStateChanged) return;
    AlarmClockSnapshot snap{};
    snapshot(now, snap);
    listener_.onStateChanged(listener_.ctx, snap);
}

bool AlarmClock::setAlarm(const char* timeSpec, time_t now, ErrorCode& err)
{
    static constexpr const char* kOp = "set_alarm";
    if (!guard_(kOp, timeSpec, err)) return false;

    AlarmTimeOfDay parsed{};
    ErrorCode parseErr = ErrorCode::UnrecognizedFormat;
    if (!parseTimeSpec(timeSpec, now, parsed, parseErr)) return fail_(kOp, parseErr, timeSpec, err);
    if (!clockValid_(now)) return fail_(kOp, ErrorCode::ClockNotSet, timeSpec, err);

    // A new wake time is a new intent: the fired-today marker does not apply.
    time_t fireAt = 0;
    if (!computeNextFire(parsed, now, nullptr, fireAt)) return fail_(kOp, ErrorCode::Failed, timeSpec, err);
    if (!armAt_(fireAt)) return fail_(kOp, ErrorCode::TimerUnavailable, timeSpec, err);

    alarmTime_ = parsed;
    hasAlarmTime_ = true;
    enabled_ = true;
    firedDate_ = AlarmDate{};
    nextFireAt_ = fireAt;
    phase_ = AlarmClockPhase::Armed;
    notifyStateChanged_(now);
    return true;
}

bool AlarmClock::enable(time_t now, ErrorCode& err)
{
    static constexpr const char* kOp = "enable";
    if (!guard_(kOp, nullptr, err)) return false;
    if (!hasAlarmTime_) return fail_(kOp, ErrorCode::InvalidState, nullptr, err);

    // Already inside a ringing cycle: the switch is on, nothing to re-arm.
    if (phase_ == AlarmClockPhase::Triggered || phase_ == AlarmClockPhase::Snoozed) return true;

    if (!clockValid_(now)) return fail_(kOp, ErrorCode::ClockNotSet, nullptr, err);
    time_t fireAt = 0;
    if (!computeNextFire(alarmTime_, now, &firedDate_, fireAt)) return fail_(kOp, ErrorCode::Failed, nullptr, err);
    if (!armAt_(fireAt)) return fail_(kOp, ErrorCode::TimerUnavailable, nullptr, err);

    enabled_ = true;
    nextFireAt_ = fireAt;
    phase_ = AlarmClockPhase::Armed;
    notifyStateChanged_(now);
    return true;
}

bool AlarmClock::disable(time_t now, ErrorCode& err)
{
    if (!guard_("disable", nullptr, err)) return false;

    timer_.cancel();
    const bool changed = enabled_ || phase_ != AlarmClockPhase::Idle || nextFireAt_ != 0;
    enabled_ = false;
    nextFireAt_ = 0;
    phase_ = AlarmClockPhase::Idle;
    if (changed) notifyStateChanged_(now);
    return true;
}

bool AlarmClock::snooze(time_t now, ErrorCode& err)
{
    static constexpr const char* kOp = "snooze";
    if (!guard_(kOp, nullptr, err)) return false;
    if (phase_ != AlarmClockPhase::Triggered) return fail_(kOp, ErrorCode::InvalidState, nullptr, err);
    if (!clockValid_(now)) return fail_(kOp, ErrorCode::ClockNotSet, nullptr, err);

    const time_t fireAt = now + (time_t)snoozeMinutes_ * 60;
    if (!armAt_(fireAt)) return fail_(kOp, ErrorCode::TimerUnavailable, nullptr, err);

    nextFireAt_ = fireAt;
    phase_ = AlarmClockPhase::Snoozed;
    notifyStateChanged_(now);
    return true;
}

bool AlarmClock::stop(time_t now, ErrorCode& err)
{
    static constexpr const char* kOp = "stop";
    if (!guard_(kOp, nullptr, err)) return false;
    if (phase_ != AlarmClockPhase::Triggered && phase_ != AlarmClockPhase::Snoozed) {
        return fail_(kOp, ErrorCode::InvalidState, nullptr, err);
    }

    if (enabled_ && hasAlarmTime_) {
        if (!clockValid_(now)) return fail_(kOp, ErrorCode::ClockNotSet, nullptr, err);
        time_t fireAt = 0;
        if (!computeNextFire(alarmTime_, now, &firedDate_, fireAt)) return fail_(kOp, ErrorCode::Failed, nullptr, err);
        if (!armAt_(fireAt)) return fail_(kOp, ErrorCode::TimerUnavailable, nullptr, err);
        nextFireAt_ = fireAt;
        phase_ = AlarmClockPhase::Armed;
    } else {
        timer_.cancel();
        nextFireAt_ = 0;
        phase_ = AlarmClockPhase::Idle;
    }
    notifyStateChanged_(now);
    return true;
}

bool AlarmClock::setSnoozeMinutes(int32_t minutes, time_t now, ErrorCode& err)
{
    char input[12];
    snprintf(input, sizeof(input), "%ld", (long)minutes);
    if (!guard_("snooze_time", input, err)) return false;
    if (!snoozeMinutesValid_(minutes)) return fail_("snooze_time", ErrorCode::OutOfRange, input, err);

    if (snoozeMinutes_ == (uint16_t)minutes) return true;
    snoozeMinutes_ = (uint16_t)minutes;
    notifyStateChanged_(now);
    return true;
}

bool AlarmClock::restore(const AlarmClockPersisted& saved, time_t now, ErrorCode& err)
{
    static constexpr const char* kOp = "restore";
    if (!guard_(kOp, nullptr, err)) return false;
    if (phase_ == AlarmClockPhase::Triggered || phase_ == AlarmClockPhase::Snoozed) {
        return fail_(kOp, ErrorCode::InvalidState, nullptr, err);
    }
    if (!snoozeMinutesValid_((int32_t)saved.snoozeMinutes)) return fail_(kOp, ErrorCode::OutOfRange, nullptr, err);
    if (saved.hasAlarmTime && !timeOfDayValid(saved.alarmTime)) return fail_(kOp, ErrorCode::OutOfRange, nullptr, err);

    const bool arm = saved.enabled && saved.hasAlarmTime;
    time_t fireAt = 0;
    if (arm) {
        if (!clockValid_(now)) return fail_(kOp, ErrorCode::ClockNotSet, nullptr, err);
        if (!computeNextFire(saved.alarmTime, now, nullptr, fireAt)) return fail_(kOp, ErrorCode::Failed, nullptr, err);
        if (!armAt_(fireAt)) return fail_(kOp, ErrorCode::TimerUnavailable, nullptr, err);
    } else {
        timer_.cancel();
    }

    enabled_ = saved.enabled;
    hasAlarmTime_ = saved.hasAlarmTime;
    alarmTime_ = saved.alarmTime;
    snoozeMinutes_ = saved.snoozeMinutes;
    firedDate_ = AlarmDate{};
    nextFireAt_ = fireAt;
    phase_ = arm ? AlarmClockPhase::Armed : AlarmClockPhase::Idle;
    notifyStateChanged_(now);
    return true;
}

void AlarmClock::setSchedulerOnline(bool online)
{
    // Deadlines do not survive an offline scheduler; resume() computes fresh ones.
    if (!online) timer_.cancel();
    timer_.setOnline(online);
}

bool AlarmClock::resume(time_t now, ErrorCode& err)
{
    static constexpr const char* kOp = "resume";
    if (!guard_(kOp, nullptr, err)) return false;
    if (phase_ == AlarmClockPhase::Idle || phase_ == AlarmClockPhase::Triggered) return true;
    if (!clockValid_(now)) return fail_(kOp, ErrorCode::ClockNotSet, nullptr, err);

    time_t fireAt = nextFireAt_;
    AlarmClockPhase next = phase_;
    if (phase_ == AlarmClockPhase::Armed) {
        if (!computeNextFire(alarmTime_, now, &firedDate_, fireAt)) return fail_(kOp, ErrorCode::Failed, nullptr, err);
    } else if (fireAt <= now) {
        // The snooze re-ring was missed: the cycle ends like a stop.
        if (!enabled_ || !hasAlarmTime_) {
            timer_.cancel();
            nextFireAt_ = 0;
            phase_ = AlarmClockPhase::Idle;
            notifyStateChanged_(now);
            return true;
        }
        if (!computeNextFire(alarmTime_, now, &firedDate_, fireAt)) return fail_(kOp, ErrorCode::Failed, nullptr, err);
        next = AlarmClockPhase::Armed;
    }
    if (!armAt_(fireAt)) return fail_(kOp, ErrorCode::TimerUnavailable, nullptr, err);

    const bool changed = (fireAt != nextFireAt_) || (next != phase_);
    nextFireAt_ = fireAt;
    phase_ = next;
    if (changed) notifyStateChanged_(now);
    return true;
}

bool AlarmClock::tick(time_t now)
{
    if (!configured_ || tearingDown_) return false;
    return timer_.poll(now);
}

void AlarmClock::beginTeardown()
{
    tearingDown_ = true;
    timer_.cancel();
}

void AlarmClock::onTimerFired_(void* ctx, time_t firedAt)
{
    AlarmClock* self = static_cast<AlarmClock*>(ctx);
    if (self) self->handleFire_(firedAt);
}

void AlarmClock::handleFire_(time_t firedAt)
{
    if (phase_ != AlarmClockPhase::Armed && phase_ != AlarmClockPhase::Snoozed) return;

    // The marker keeps the date of the scheduled ring, not of the poll that saw
    // it (a late poll or clock jump may cross midnight). Snooze re-rings do not move it.
    if (phase_ == AlarmClockPhase::Armed) {
        const time_t scheduled = (nextFireAt_ > 0) ? nextFireAt_ : firedAt;
        AlarmDate fired{};
        if (localDateOf(scheduled, fired)) firedDate_ = fired;
    }
    phase_ = AlarmClockPhase::Triggered;
    nextFireAt_ = 0;
    triggeredAt_ = firedAt;

    if (listener_.onTriggered) listener_.onTriggered(listener_.ctx, cfg_.id, firedAt);
    notifyStateChanged_(firedAt);
}

AlarmClockPersisted AlarmClock::persisted() const
{
    AlarmClockPersisted p{};
    p.enabled = enabled_;
    p.hasAlarmTime = hasAlarmTime_;
    p.alarmTime = alarmTime_;
    p.snoozeMinutes = snoozeMinutes_;
    return p;
}

void AlarmClock::snapshot(time_t now, AlarmClockSnapshot& out) const
{
    out = AlarmClockSnapshot{};
    memcpy(out.id, cfg_.id, sizeof(out.id));
    memcpy(out.name, cfg_.name, sizeof(out.name));
    out.phase = phase_;
    out.enabled = enabled_;
    out.hasAlarmTime = hasAlarmTime_;
    out.alarmTime = alarmTime_;
    out.snoozeMinutes = snoozeMinutes_;
    out.nextFireAt = nextFireAt_;
    out.triggeredAt = triggeredAt_;
    out.firedDate = firedDate_;
    out.isSet = enabled_ && nextFireAt_ > now;
    out.countdownSec = enabled_ ? secondsUntil_(nextFireAt_, now) : 0U;
    out.snoozeLeftSec = (phase_ == AlarmClockPhase::Snoozed) ? secondsUntil_(nextFireAt_, now) : 0U;
}
