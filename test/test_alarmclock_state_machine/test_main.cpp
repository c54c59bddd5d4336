#include <unity.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

#include "Modules/AlarmClockModule/AlarmClock.h"

struct Recorder {
    int stateChanges = 0;
    int triggers = 0;
    int rejects = 0;
    AlarmClockPhase lastPhase = AlarmClockPhase::Idle;
    time_t lastFiredAt = 0;
    ErrorCode lastRejectCode = ErrorCode::Failed;
    char lastRejectOp[16] = {0};
};

static void onStateChanged(void* ctx, const AlarmClockSnapshot& snap)
{
    Recorder* r = static_cast<Recorder*>(ctx);
    r->stateChanges++;
    r->lastPhase = snap.phase;
}

static void onTriggered(void* ctx, const char*, time_t firedAt)
{
    Recorder* r = static_cast<Recorder*>(ctx);
    r->triggers++;
    r->lastFiredAt = firedAt;
}

static void onRejected(void* ctx, const char*, const char* op, ErrorCode code, const char*)
{
    Recorder* r = static_cast<Recorder*>(ctx);
    r->rejects++;
    r->lastRejectCode = code;
    strncpy(r->lastRejectOp, op ? op : "", sizeof(r->lastRejectOp) - 1);
}

static time_t localEpoch(int year, int month, int day, int hour, int minute, int second)
{
    struct tm t{};
    t.tm_year = year - 1900;
    t.tm_mon = month - 1;
    t.tm_mday = day;
    t.tm_hour = hour;
    t.tm_min = minute;
    t.tm_sec = second;
    t.tm_isdst = -1;
    return mktime(&t);
}

static Recorder rec;
static AlarmClock clock_;

static void makeClock(bool online = true)
{
    AlarmClockConfig cfg{};
    strncpy(cfg.id, "bedroom", sizeof(cfg.id) - 1);
    strncpy(cfg.name, "Bedroom", sizeof(cfg.name) - 1);
    cfg.defaultSnoozeMinutes = 5;

    ErrorCode err = ErrorCode::Failed;
    clock_.setSchedulerOnline(online);
    TEST_ASSERT_TRUE(clock_.configure(cfg, err));

    AlarmClockListener l{};
    l.onStateChanged = onStateChanged;
    l.onTriggered = onTriggered;
    l.onRejected = onRejected;
    l.ctx = &rec;
    clock_.setListener(l);
}

// 07:00 alarm set at 06:59:59 then rung at 07:00:00.
static void ringAtSeven()
{
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(clock_.setAlarm("07:00", localEpoch(2024, 3, 10, 6, 59, 59), err));
    TEST_ASSERT_TRUE(clock_.tick(localEpoch(2024, 3, 10, 7, 0, 0)));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Triggered, (uint8_t)clock_.phase());
}

void setUp()
{
    setenv("TZ", "UTC0", 1);
    tzset();
    rec = Recorder{};
    clock_.reset();
}

void tearDown() {}

void test_new_clock_is_idle()
{
    makeClock();
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Idle, (uint8_t)clock_.phase());
    TEST_ASSERT_FALSE(clock_.enabled());
    TEST_ASSERT_TRUE(clock_.nextFireAt() == 0);
    TEST_ASSERT_EQUAL_UINT16(5, clock_.persisted().snoozeMinutes);
}

void test_set_alarm_fires_at_wake_time()
{
    makeClock();
    const time_t now = localEpoch(2024, 3, 10, 6, 59, 59);
    ErrorCode err = ErrorCode::Failed;

    TEST_ASSERT_TRUE(clock_.setAlarm("07:00", now, err));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Armed, (uint8_t)clock_.phase());
    TEST_ASSERT_TRUE(clock_.enabled());
    TEST_ASSERT_TRUE(clock_.nextFireAt() == now + 1);

    TEST_ASSERT_FALSE(clock_.tick(now));
    TEST_ASSERT_EQUAL_INT(0, rec.triggers);

    TEST_ASSERT_TRUE(clock_.tick(now + 1));
    TEST_ASSERT_EQUAL_INT(1, rec.triggers);
    TEST_ASSERT_TRUE(rec.lastFiredAt == now + 1);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Triggered, (uint8_t)clock_.phase());
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Triggered, (uint8_t)rec.lastPhase);

    AlarmClockSnapshot snap{};
    clock_.snapshot(now + 1, snap);
    TEST_ASSERT_EQUAL_INT16(2024, snap.firedDate.year);
    TEST_ASSERT_EQUAL_UINT8(3, snap.firedDate.month);
    TEST_ASSERT_EQUAL_UINT8(10, snap.firedDate.day);
    TEST_ASSERT_FALSE(snap.isSet);
}

void test_snooze_rings_again_after_duration()
{
    makeClock();
    ringAtSeven();

    ErrorCode err = ErrorCode::Failed;
    const time_t snoozedAt = localEpoch(2024, 3, 10, 7, 0, 10);
    TEST_ASSERT_TRUE(clock_.snooze(snoozedAt, err));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Snoozed, (uint8_t)clock_.phase());
    TEST_ASSERT_TRUE(clock_.nextFireAt() == localEpoch(2024, 3, 10, 7, 5, 10));

    AlarmClockSnapshot snap{};
    clock_.snapshot(snoozedAt, snap);
    TEST_ASSERT_EQUAL_UINT32(300, snap.snoozeLeftSec);

    TEST_ASSERT_FALSE(clock_.tick(localEpoch(2024, 3, 10, 7, 5, 9)));
    TEST_ASSERT_TRUE(clock_.tick(localEpoch(2024, 3, 10, 7, 5, 10)));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Triggered, (uint8_t)clock_.phase());
    TEST_ASSERT_EQUAL_INT(2, rec.triggers);
}

void test_stop_rearms_for_next_day()
{
    makeClock();
    ringAtSeven();

    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(clock_.stop(localEpoch(2024, 3, 10, 7, 1, 0), err));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Armed, (uint8_t)clock_.phase());
    TEST_ASSERT_TRUE(clock_.enabled());
    TEST_ASSERT_TRUE(clock_.nextFireAt() == localEpoch(2024, 3, 11, 7, 0, 0));
}

void test_stop_from_snoozed_rearms_for_next_day()
{
    makeClock();
    ringAtSeven();

    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(clock_.snooze(localEpoch(2024, 3, 10, 7, 0, 5), err));
    TEST_ASSERT_TRUE(clock_.stop(localEpoch(2024, 3, 10, 7, 2, 0), err));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Armed, (uint8_t)clock_.phase());
    TEST_ASSERT_TRUE(clock_.nextFireAt() == localEpoch(2024, 3, 11, 7, 0, 0));

    // The old snooze deadline is gone.
    TEST_ASSERT_FALSE(clock_.tick(localEpoch(2024, 3, 10, 7, 5, 5)));
}

void test_second_snooze_rejected()
{
    makeClock();
    ringAtSeven();

    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(clock_.snooze(localEpoch(2024, 3, 10, 7, 0, 10), err));
    const time_t deadline = clock_.nextFireAt();

    TEST_ASSERT_FALSE(clock_.snooze(localEpoch(2024, 3, 10, 7, 1, 0), err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidState, (uint16_t)err);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Snoozed, (uint8_t)clock_.phase());
    TEST_ASSERT_TRUE(clock_.nextFireAt() == deadline);
}

void test_late_poll_after_midnight_keeps_ring_date()
{
    makeClock();
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(clock_.setAlarm("23:30", localEpoch(2024, 3, 10, 23, 0, 0), err));

    // Wall clock jumped past midnight before the next poll.
    TEST_ASSERT_TRUE(clock_.tick(localEpoch(2024, 3, 11, 0, 10, 0)));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Triggered, (uint8_t)clock_.phase());

    AlarmClockSnapshot snap{};
    clock_.snapshot(localEpoch(2024, 3, 11, 0, 10, 0), snap);
    TEST_ASSERT_EQUAL_UINT8(10, snap.firedDate.day);

    TEST_ASSERT_TRUE(clock_.stop(localEpoch(2024, 3, 11, 0, 11, 0), err));
    TEST_ASSERT_TRUE(clock_.nextFireAt() == localEpoch(2024, 3, 11, 23, 30, 0));
}

void test_stop_after_snooze_past_midnight()
{
    makeClock();
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(clock_.setAlarm("23:55", localEpoch(2024, 3, 10, 23, 0, 0), err));
    TEST_ASSERT_TRUE(clock_.tick(localEpoch(2024, 3, 10, 23, 55, 0)));

    TEST_ASSERT_TRUE(clock_.snooze(localEpoch(2024, 3, 10, 23, 55, 0), err));
    TEST_ASSERT_TRUE(clock_.tick(localEpoch(2024, 3, 11, 0, 0, 0)));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Triggered, (uint8_t)clock_.phase());

    // The re-ring happened on the 11th but the marker still names the 10th.
    AlarmClockSnapshot snap{};
    clock_.snapshot(localEpoch(2024, 3, 11, 0, 0, 0), snap);
    TEST_ASSERT_EQUAL_UINT8(10, snap.firedDate.day);

    TEST_ASSERT_TRUE(clock_.stop(localEpoch(2024, 3, 11, 0, 1, 0), err));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Armed, (uint8_t)clock_.phase());
    TEST_ASSERT_TRUE(clock_.nextFireAt() == localEpoch(2024, 3, 11, 23, 55, 0));
}

void test_out_of_range_leaves_state_unchanged()
{
    makeClock();
    ErrorCode err = ErrorCode::Failed;
    const time_t now = localEpoch(2024, 3, 10, 6, 59, 59);
    TEST_ASSERT_TRUE(clock_.setAlarm("07:00", now, err));
    const time_t before = clock_.nextFireAt();
    const int changes = rec.stateChanges;

    TEST_ASSERT_FALSE(clock_.setAlarm("25:00", now, err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::OutOfRange, (uint16_t)err);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Armed, (uint8_t)clock_.phase());
    TEST_ASSERT_TRUE(clock_.nextFireAt() == before);
    TEST_ASSERT_EQUAL_INT(changes, rec.stateChanges);
    TEST_ASSERT_EQUAL_INT(1, rec.rejects);
    TEST_ASSERT_EQUAL_STRING("set_alarm", rec.lastRejectOp);

    // Still rings at the original time.
    TEST_ASSERT_TRUE(clock_.tick(before));
}

void test_out_of_range_from_idle()
{
    makeClock();
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_FALSE(clock_.setAlarm("25:00", localEpoch(2024, 3, 10, 6, 0, 0), err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::OutOfRange, (uint16_t)err);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Idle, (uint8_t)clock_.phase());
    TEST_ASSERT_FALSE(clock_.persisted().hasAlarmTime);
}

void test_invalid_transitions_rejected()
{
    makeClock();
    ErrorCode err = ErrorCode::Failed;
    const time_t now = localEpoch(2024, 3, 10, 6, 0, 0);

    TEST_ASSERT_FALSE(clock_.enable(now, err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidState, (uint16_t)err);

    TEST_ASSERT_FALSE(clock_.snooze(now, err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidState, (uint16_t)err);

    TEST_ASSERT_TRUE(clock_.setAlarm("07:00", now, err));
    TEST_ASSERT_FALSE(clock_.snooze(now, err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidState, (uint16_t)err);
    TEST_ASSERT_FALSE(clock_.stop(now, err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidState, (uint16_t)err);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Armed, (uint8_t)clock_.phase());
}

void test_disable_and_enable()
{
    makeClock();
    ErrorCode err = ErrorCode::Failed;
    const time_t now = localEpoch(2024, 3, 10, 6, 0, 0);
    TEST_ASSERT_TRUE(clock_.setAlarm("07:00", now, err));

    TEST_ASSERT_TRUE(clock_.disable(now + 10, err));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Idle, (uint8_t)clock_.phase());
    TEST_ASSERT_FALSE(clock_.enabled());
    TEST_ASSERT_TRUE(clock_.persisted().hasAlarmTime);
    TEST_ASSERT_FALSE(clock_.tick(localEpoch(2024, 3, 10, 7, 0, 0)));

    // Disabling again is a quiet no-op.
    const int changes = rec.stateChanges;
    TEST_ASSERT_TRUE(clock_.disable(now + 20, err));
    TEST_ASSERT_EQUAL_INT(changes, rec.stateChanges);

    TEST_ASSERT_TRUE(clock_.enable(now + 30, err));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Armed, (uint8_t)clock_.phase());
    TEST_ASSERT_TRUE(clock_.nextFireAt() == localEpoch(2024, 3, 10, 7, 0, 0));
}

void test_disable_while_triggered()
{
    makeClock();
    ringAtSeven();

    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(clock_.disable(localEpoch(2024, 3, 10, 7, 0, 20), err));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Idle, (uint8_t)clock_.phase());
    TEST_ASSERT_FALSE(clock_.enabled());
    TEST_ASSERT_TRUE(clock_.nextFireAt() == 0);
    TEST_ASSERT_FALSE(clock_.timerArmed());

    TEST_ASSERT_FALSE(clock_.snooze(localEpoch(2024, 3, 10, 7, 0, 30), err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidState, (uint16_t)err);
    TEST_ASSERT_FALSE(clock_.tick(localEpoch(2024, 3, 11, 7, 0, 0)));
}

void test_enable_after_ring_keeps_fired_today()
{
    makeClock();
    ringAtSeven();

    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(clock_.disable(localEpoch(2024, 3, 10, 7, 0, 30), err));
    TEST_ASSERT_TRUE(clock_.enable(localEpoch(2024, 3, 10, 7, 1, 0), err));
    TEST_ASSERT_TRUE(clock_.nextFireAt() == localEpoch(2024, 3, 11, 7, 0, 0));
}

void test_set_alarm_clears_fired_today()
{
    makeClock();
    ringAtSeven();

    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(clock_.setAlarm("07:30", localEpoch(2024, 3, 10, 7, 1, 0), err));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Armed, (uint8_t)clock_.phase());
    TEST_ASSERT_TRUE(clock_.nextFireAt() == localEpoch(2024, 3, 10, 7, 30, 0));
}

void test_enable_while_triggered_is_noop()
{
    makeClock();
    ringAtSeven();

    ErrorCode err = ErrorCode::Failed;
    const int changes = rec.stateChanges;
    TEST_ASSERT_TRUE(clock_.enable(localEpoch(2024, 3, 10, 7, 0, 5), err));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Triggered, (uint8_t)clock_.phase());
    TEST_ASSERT_EQUAL_INT(changes, rec.stateChanges);
}

void test_clock_not_set()
{
    makeClock();
    ErrorCode err = ErrorCode::Failed;

    TEST_ASSERT_FALSE(clock_.setAlarm("07:00", (time_t)1000, err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::ClockNotSet, (uint16_t)err);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Idle, (uint8_t)clock_.phase());

    TEST_ASSERT_FALSE(clock_.setAlarm("in 5 minutes", (time_t)1000, err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::NotReady, (uint16_t)err);
}

void test_scheduler_offline()
{
    makeClock(false);
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_FALSE(clock_.setAlarm("07:00", localEpoch(2024, 3, 10, 6, 0, 0), err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::TimerUnavailable, (uint16_t)err);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Idle, (uint8_t)clock_.phase());
    TEST_ASSERT_FALSE(clock_.persisted().hasAlarmTime);
}

void test_snooze_minutes_bounds()
{
    makeClock();
    ErrorCode err = ErrorCode::Failed;
    const time_t now = localEpoch(2024, 3, 10, 6, 0, 0);

    TEST_ASSERT_FALSE(clock_.setSnoozeMinutes(0, now, err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::OutOfRange, (uint16_t)err);
    TEST_ASSERT_FALSE(clock_.setSnoozeMinutes(181, now, err));
    TEST_ASSERT_FALSE(clock_.setSnoozeMinutes(-3, now, err));
    TEST_ASSERT_EQUAL_UINT16(5, clock_.persisted().snoozeMinutes);

    TEST_ASSERT_TRUE(clock_.setSnoozeMinutes(1, now, err));
    TEST_ASSERT_TRUE(clock_.setSnoozeMinutes(180, now, err));
    TEST_ASSERT_EQUAL_UINT16(180, clock_.persisted().snoozeMinutes);
}

void test_restore_from_persisted()
{
    makeClock();
    AlarmClockPersisted saved{};
    saved.enabled = true;
    saved.hasAlarmTime = true;
    saved.alarmTime.hour = 6;
    saved.alarmTime.minute = 45;
    saved.snoozeMinutes = 12;

    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_FALSE(clock_.restore(saved, (time_t)1000, err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::ClockNotSet, (uint16_t)err);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Idle, (uint8_t)clock_.phase());

    const time_t now = localEpoch(2024, 3, 10, 6, 0, 0);
    TEST_ASSERT_TRUE(clock_.restore(saved, now, err));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Armed, (uint8_t)clock_.phase());
    TEST_ASSERT_TRUE(clock_.nextFireAt() == localEpoch(2024, 3, 10, 6, 45, 0));
    TEST_ASSERT_EQUAL_UINT16(12, clock_.persisted().snoozeMinutes);

    saved.enabled = false;
    TEST_ASSERT_TRUE(clock_.restore(saved, (time_t)1000, err));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Idle, (uint8_t)clock_.phase());
    TEST_ASSERT_TRUE(clock_.persisted().hasAlarmTime);
}

void test_restore_rejected_while_ringing()
{
    makeClock();
    ringAtSeven();

    AlarmClockPersisted saved = clock_.persisted();
    saved.snoozeMinutes = 15;

    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_FALSE(clock_.restore(saved, localEpoch(2024, 3, 10, 7, 0, 5), err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidState, (uint16_t)err);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Triggered, (uint8_t)clock_.phase());

    TEST_ASSERT_TRUE(clock_.snooze(localEpoch(2024, 3, 10, 7, 0, 10), err));
    TEST_ASSERT_FALSE(clock_.restore(saved, localEpoch(2024, 3, 10, 7, 1, 0), err));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Snoozed, (uint8_t)clock_.phase());
    TEST_ASSERT_EQUAL_UINT16(5, clock_.persisted().snoozeMinutes);

    AlarmClockSnapshot snap{};
    clock_.snapshot(localEpoch(2024, 3, 10, 7, 1, 0), snap);
    TEST_ASSERT_EQUAL_UINT8(10, snap.firedDate.day);
}

void test_scheduler_restart_drops_stale_deadline()
{
    makeClock();
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(clock_.setAlarm("07:00", localEpoch(2024, 3, 10, 6, 0, 0), err));

    clock_.setSchedulerOnline(false);
    TEST_ASSERT_FALSE(clock_.timerArmed());
    clock_.setSchedulerOnline(true);

    const time_t evening = localEpoch(2024, 3, 11, 20, 0, 0);
    TEST_ASSERT_FALSE(clock_.tick(evening));
    TEST_ASSERT_EQUAL_INT(0, rec.triggers);
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Armed, (uint8_t)clock_.phase());

    TEST_ASSERT_TRUE(clock_.resume(evening, err));
    TEST_ASSERT_TRUE(clock_.timerArmed());
    TEST_ASSERT_TRUE(clock_.nextFireAt() == localEpoch(2024, 3, 12, 7, 0, 0));
}

void test_resume_keeps_pending_snooze()
{
    makeClock();
    ringAtSeven();

    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(clock_.snooze(localEpoch(2024, 3, 10, 7, 0, 10), err));
    clock_.setSchedulerOnline(false);
    clock_.setSchedulerOnline(true);

    TEST_ASSERT_TRUE(clock_.resume(localEpoch(2024, 3, 10, 7, 3, 0), err));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Snoozed, (uint8_t)clock_.phase());
    TEST_ASSERT_TRUE(clock_.nextFireAt() == localEpoch(2024, 3, 10, 7, 5, 10));
    TEST_ASSERT_TRUE(clock_.tick(localEpoch(2024, 3, 10, 7, 5, 10)));
}

void test_resume_after_missed_snooze_moves_to_next_day()
{
    makeClock();
    ringAtSeven();

    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(clock_.snooze(localEpoch(2024, 3, 10, 7, 0, 10), err));
    clock_.setSchedulerOnline(false);
    clock_.setSchedulerOnline(true);

    const int triggers = rec.triggers;
    TEST_ASSERT_TRUE(clock_.resume(localEpoch(2024, 3, 10, 9, 0, 0), err));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Armed, (uint8_t)clock_.phase());
    TEST_ASSERT_TRUE(clock_.nextFireAt() == localEpoch(2024, 3, 11, 7, 0, 0));
    TEST_ASSERT_EQUAL_INT(triggers, rec.triggers);
}

void test_resume_while_offline_fails()
{
    makeClock();
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(clock_.setAlarm("07:00", localEpoch(2024, 3, 10, 6, 0, 0), err));
    clock_.setSchedulerOnline(false);

    TEST_ASSERT_FALSE(clock_.resume(localEpoch(2024, 3, 10, 6, 30, 0), err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::TimerUnavailable, (uint16_t)err);
    TEST_ASSERT_FALSE(clock_.timerArmed());
}

void test_teardown_rejects_commands()
{
    makeClock();
    ErrorCode err = ErrorCode::Failed;
    const time_t now = localEpoch(2024, 3, 10, 6, 59, 59);
    TEST_ASSERT_TRUE(clock_.setAlarm("07:00", now, err));

    clock_.beginTeardown();
    TEST_ASSERT_FALSE(clock_.tick(now + 1));
    TEST_ASSERT_EQUAL_INT(0, rec.triggers);
    TEST_ASSERT_FALSE(clock_.setAlarm("08:00", now, err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidState, (uint16_t)err);
}

void test_state_json()
{
    makeClock();
    ErrorCode err = ErrorCode::Failed;
    const time_t now = localEpoch(2024, 3, 10, 6, 59, 0);
    TEST_ASSERT_TRUE(clock_.setAlarm("07:00", now, err));

    AlarmClockSnapshot snap{};
    clock_.snapshot(now, snap);
    TEST_ASSERT_TRUE(snap.isSet);
    TEST_ASSERT_EQUAL_UINT32(60, snap.countdownSec);

    char buf[Limits::AlarmClock::StateJsonBuf];
    TEST_ASSERT_TRUE(buildAlarmClockStateJson(snap, buf, sizeof(buf)));
    TEST_ASSERT_NOT_NULL(strstr(buf, "\"id\":\"bedroom\""));
    TEST_ASSERT_NOT_NULL(strstr(buf, "\"status\":\"armed\""));
    TEST_ASSERT_NOT_NULL(strstr(buf, "\"alarm_time\":\"07:00:00\""));
    TEST_ASSERT_NOT_NULL(strstr(buf, "\"snooze_time\":5"));
    TEST_ASSERT_NOT_NULL(strstr(buf, "\"countdown_s\":60"));

    char tiny[16];
    TEST_ASSERT_FALSE(buildAlarmClockStateJson(snap, tiny, sizeof(tiny)));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_new_clock_is_idle);
    RUN_TEST(test_set_alarm_fires_at_wake_time);
    RUN_TEST(test_snooze_rings_again_after_duration);
    RUN_TEST(test_stop_rearms_for_next_day);
    RUN_TEST(test_stop_from_snoozed_rearms_for_next_day);
    RUN_TEST(test_second_snooze_rejected);
    RUN_TEST(test_late_poll_after_midnight_keeps_ring_date);
    RUN_TEST(test_stop_after_snooze_past_midnight);
    RUN_TEST(test_out_of_range_leaves_state_unchanged);
    RUN_TEST(test_out_of_range_from_idle);
    RUN_TEST(test_invalid_transitions_rejected);
    RUN_TEST(test_disable_and_enable);
    RUN_TEST(test_disable_while_triggered);
    RUN_TEST(test_enable_after_ring_keeps_fired_today);
    RUN_TEST(test_set_alarm_clears_fired_today);
    RUN_TEST(test_enable_while_triggered_is_noop);
    RUN_TEST(test_clock_not_set);
    RUN_TEST(test_scheduler_offline);
    RUN_TEST(test_snooze_minutes_bounds);
    RUN_TEST(test_restore_from_persisted);
    RUN_TEST(test_restore_rejected_while_ringing);
    RUN_TEST(test_scheduler_restart_drops_stale_deadline);
    RUN_TEST(test_resume_keeps_pending_snooze);
    RUN_TEST(test_resume_after_missed_snooze_moves_to_next_day);
    RUN_TEST(test_resume_while_offline_fails);
    RUN_TEST(test_teardown_rejects_commands);
    RUN_TEST(test_state_json);
    return UNITY_END();
}
