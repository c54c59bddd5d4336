#include <unity.h>
#include <stdlib.h>
#include <string.h>
#include <time.h>

#include "Modules/AlarmClockModule/AlarmClockRegistry.h"

static const time_t kMorning = (time_t)1710050400; // 2024-03-10 06:00:00 UTC

static AlarmClockConfig configFor(const char* name)
{
    AlarmClockConfig cfg{};
    strncpy(cfg.name, name, sizeof(cfg.name) - 1);
    TEST_ASSERT_TRUE(makeAlarmClockId(cfg.name, cfg.id, sizeof(cfg.id)));
    return cfg;
}

void setUp()
{
    setenv("TZ", "UTC0", 1);
    tzset();
}

void tearDown() {}

void test_id_from_name()
{
    char id[Limits::AlarmClock::IdLen];
    TEST_ASSERT_TRUE(makeAlarmClockId("Bedroom 1", id, sizeof(id)));
    TEST_ASSERT_EQUAL_STRING("bedroom_1", id);

    TEST_ASSERT_TRUE(makeAlarmClockId("  Kid's Room!! ", id, sizeof(id)));
    TEST_ASSERT_EQUAL_STRING("kid_s_room", id);

    TEST_ASSERT_FALSE(makeAlarmClockId("!!!", id, sizeof(id)));
    TEST_ASSERT_FALSE(makeAlarmClockId("", id, sizeof(id)));

    char small[4];
    TEST_ASSERT_FALSE(makeAlarmClockId("Bedroom", small, sizeof(small)));
}

void test_id_validation()
{
    TEST_ASSERT_TRUE(alarmClockIdValid("bedroom_1"));
    TEST_ASSERT_FALSE(alarmClockIdValid(""));
    TEST_ASSERT_FALSE(alarmClockIdValid("Bedroom"));
    TEST_ASSERT_FALSE(alarmClockIdValid("bed room"));
    TEST_ASSERT_FALSE(alarmClockIdValid(nullptr));
}

void test_register_and_find()
{
    AlarmClockRegistry reg;
    AlarmClockHandle h{};
    ErrorCode err = ErrorCode::Failed;

    TEST_ASSERT_TRUE(reg.registerClock(configFor("Bedroom"), h, err));
    TEST_ASSERT_EQUAL_UINT8(0, h.slot);
    TEST_ASSERT_EQUAL_UINT8(1, reg.count());

    AlarmClockHandle found{};
    TEST_ASSERT_TRUE(reg.find("bedroom", found, err));
    TEST_ASSERT_EQUAL_UINT8(h.slot, found.slot);
    TEST_ASSERT_EQUAL_UINT16(h.generation, found.generation);

    AlarmClock* clock = reg.get(found);
    TEST_ASSERT_NOT_NULL(clock);
    TEST_ASSERT_EQUAL_STRING("Bedroom", clock->name());

    TEST_ASSERT_FALSE(reg.find("kitchen", found, err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::NotFound, (uint16_t)err);
}

void test_duplicate_and_invalid_ids()
{
    AlarmClockRegistry reg;
    AlarmClockHandle h{};
    ErrorCode err = ErrorCode::Failed;

    TEST_ASSERT_TRUE(reg.registerClock(configFor("Bedroom"), h, err));
    TEST_ASSERT_FALSE(reg.registerClock(configFor("BEDROOM"), h, err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::DuplicateIdentifier, (uint16_t)err);

    AlarmClockConfig bad{};
    strncpy(bad.id, "Bad Id", sizeof(bad.id) - 1);
    strncpy(bad.name, "Bad Id", sizeof(bad.name) - 1);
    TEST_ASSERT_FALSE(reg.registerClock(bad, h, err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidArgument, (uint16_t)err);
    TEST_ASSERT_EQUAL_UINT8(1, reg.count());
}

void test_capacity_limit()
{
    AlarmClockRegistry reg;
    AlarmClockHandle h{};
    ErrorCode err = ErrorCode::Failed;
    const char* names[] = {"One", "Two", "Three", "Four"};
    for (const char* n : names) {
        TEST_ASSERT_TRUE(reg.registerClock(configFor(n), h, err));
    }
    TEST_ASSERT_EQUAL_UINT8(AlarmClockRegistry::Capacity, reg.count());

    TEST_ASSERT_FALSE(reg.registerClock(configFor("Five"), h, err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::RegistryFull, (uint16_t)err);

    AlarmClockHandle list[AlarmClockRegistry::Capacity];
    TEST_ASSERT_EQUAL_UINT8(4, reg.list(list, AlarmClockRegistry::Capacity));
    TEST_ASSERT_EQUAL_STRING("three", reg.get(list[2])->id());
}

void test_unregister_invalidates_handles()
{
    AlarmClockRegistry reg;
    AlarmClockHandle h{};
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(reg.registerClock(configFor("Bedroom"), h, err));

    TEST_ASSERT_TRUE(reg.unregisterClock(h, err));
    TEST_ASSERT_EQUAL_UINT8(0, reg.count());
    TEST_ASSERT_FALSE(reg.isCurrent(h));
    TEST_ASSERT_NULL(reg.get(h));

    TEST_ASSERT_FALSE(reg.unregisterClock(h, err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::NotFound, (uint16_t)err);

    // Same slot, new occupant: the old handle still does not resolve.
    AlarmClockHandle h2{};
    TEST_ASSERT_TRUE(reg.registerClock(configFor("Kitchen"), h2, err));
    TEST_ASSERT_EQUAL_UINT8(h.slot, h2.slot);
    TEST_ASSERT_NULL(reg.get(h));
    TEST_ASSERT_NOT_NULL(reg.get(h2));
}

void test_removed_clock_never_fires()
{
    AlarmClockRegistry reg;
    reg.setSchedulerOnline(true);
    AlarmClockHandle h{};
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(reg.registerClock(configFor("Bedroom"), h, err));
    TEST_ASSERT_TRUE(reg.get(h)->setAlarm("07:00", kMorning, err));
    TEST_ASSERT_TRUE(reg.get(h)->timerArmed());

    TEST_ASSERT_TRUE(reg.unregisterClock(h, err));

    AlarmClockHandle h2{};
    TEST_ASSERT_TRUE(reg.registerClock(configFor("Kitchen"), h2, err));
    AlarmClock* reused = reg.get(h2);
    TEST_ASSERT_FALSE(reused->timerArmed());
    TEST_ASSERT_FALSE(reused->tick(kMorning + 3600));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Idle, (uint8_t)reused->phase());
}

void test_register_at_slot()
{
    AlarmClockRegistry reg;
    AlarmClockHandle h{};
    ErrorCode err = ErrorCode::Failed;

    TEST_ASSERT_TRUE(reg.registerClockAt(2, configFor("Bedroom"), h, err));
    TEST_ASSERT_EQUAL_UINT8(2, h.slot);

    TEST_ASSERT_FALSE(reg.registerClockAt(2, configFor("Kitchen"), h, err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidState, (uint16_t)err);

    TEST_ASSERT_FALSE(reg.registerClockAt(AlarmClockRegistry::Capacity, configFor("Kitchen"), h, err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::InvalidArgument, (uint16_t)err);

    AlarmClockHandle slotHandle{};
    TEST_ASSERT_FALSE(reg.handleAt(0, slotHandle));
    TEST_ASSERT_TRUE(reg.handleAt(2, slotHandle));
}

void test_scheduler_state_reaches_clocks()
{
    AlarmClockRegistry reg;
    AlarmClockHandle h{};
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(reg.registerClock(configFor("Bedroom"), h, err));

    TEST_ASSERT_FALSE(reg.get(h)->setAlarm("07:00", kMorning, err));
    TEST_ASSERT_EQUAL_UINT16((uint16_t)ErrorCode::TimerUnavailable, (uint16_t)err);

    reg.setSchedulerOnline(true);
    TEST_ASSERT_TRUE(reg.get(h)->setAlarm("07:00", kMorning, err));

    AlarmClockHandle h2{};
    TEST_ASSERT_TRUE(reg.registerClock(configFor("Kitchen"), h2, err));
    TEST_ASSERT_TRUE(reg.get(h2)->setAlarm("06:30", kMorning, err));
}

void test_scheduler_restart_needs_resume()
{
    AlarmClockRegistry reg;
    reg.setSchedulerOnline(true);
    AlarmClockHandle h{};
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(reg.registerClock(configFor("Bedroom"), h, err));
    TEST_ASSERT_TRUE(reg.get(h)->setAlarm("07:00", kMorning, err));

    reg.setSchedulerOnline(false);
    reg.setSchedulerOnline(true);

    // Next evening: yesterday's deadline must not ring.
    const time_t evening = kMorning + 86400 + 14 * 3600;
    AlarmClock* clock = reg.get(h);
    TEST_ASSERT_FALSE(clock->tick(evening));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Armed, (uint8_t)clock->phase());

    TEST_ASSERT_TRUE(clock->resume(evening, err));
    TEST_ASSERT_TRUE(clock->nextFireAt() == kMorning + 2 * 86400 + 3600);
}

void test_clocks_are_independent()
{
    AlarmClockRegistry reg;
    reg.setSchedulerOnline(true);
    AlarmClockHandle a{};
    AlarmClockHandle b{};
    ErrorCode err = ErrorCode::Failed;
    TEST_ASSERT_TRUE(reg.registerClock(configFor("Bedroom"), a, err));
    TEST_ASSERT_TRUE(reg.registerClock(configFor("Kitchen"), b, err));

    TEST_ASSERT_TRUE(reg.get(a)->setAlarm("07:00", kMorning, err));
    TEST_ASSERT_TRUE(reg.get(b)->setAlarm("08:00", kMorning, err));

    const time_t seven = kMorning + 3600;
    TEST_ASSERT_TRUE(reg.get(a)->tick(seven));
    TEST_ASSERT_FALSE(reg.get(b)->tick(seven));
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Triggered, (uint8_t)reg.get(a)->phase());
    TEST_ASSERT_EQUAL_UINT8((uint8_t)AlarmClockPhase::Armed, (uint8_t)reg.get(b)->phase());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_id_from_name);
    RUN_TEST(test_id_validation);
    RUN_TEST(test_register_and_find);
    RUN_TEST(test_duplicate_and_invalid_ids);
    RUN_TEST(test_capacity_limit);
    RUN_TEST(test_unregister_invalidates_handles);
    RUN_TEST(test_removed_clock_never_fires);
    RUN_TEST(test_register_at_slot);
    RUN_TEST(test_scheduler_state_reaches_clocks);
    RUN_TEST(test_scheduler_restart_needs_resume);
    RUN_TEST(test_clocks_are_independent);
    return UNITY_END();
}
