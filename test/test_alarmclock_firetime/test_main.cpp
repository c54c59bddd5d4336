#include <unity.h>
#include <stdlib.h>
#include <time.h>

#include "Modules/AlarmClockModule/FireTime.h"

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

static AlarmTimeOfDay at(uint8_t h, uint8_t m, uint8_t s = 0)
{
    AlarmTimeOfDay t{};
    t.hour = h;
    t.minute = m;
    t.second = s;
    return t;
}

static AlarmDate date(int y, int m, int d)
{
    AlarmDate out{};
    out.year = (int16_t)y;
    out.month = (uint8_t)m;
    out.day = (uint8_t)d;
    return out;
}

void setUp()
{
    setenv("TZ", "UTC0", 1);
    tzset();
}

void tearDown() {}

void test_later_today()
{
    const time_t now = localEpoch(2024, 3, 10, 6, 59, 59);
    time_t next = 0;
    TEST_ASSERT_TRUE(computeNextFire(at(7, 0), now, nullptr, next));
    TEST_ASSERT_TRUE(next == now + 1);
}

void test_exactly_now_goes_to_tomorrow()
{
    const time_t now = localEpoch(2024, 3, 10, 7, 0, 0);
    time_t next = 0;
    TEST_ASSERT_TRUE(computeNextFire(at(7, 0), now, nullptr, next));
    TEST_ASSERT_TRUE(next == localEpoch(2024, 3, 11, 7, 0, 0));
}

void test_already_passed_goes_to_tomorrow()
{
    const time_t now = localEpoch(2024, 3, 10, 8, 0, 0);
    time_t next = 0;
    TEST_ASSERT_TRUE(computeNextFire(at(7, 0), now, nullptr, next));
    TEST_ASSERT_TRUE(next == localEpoch(2024, 3, 11, 7, 0, 0));
}

void test_fired_today_skips_today()
{
    const time_t now = localEpoch(2024, 3, 10, 6, 0, 0);
    const AlarmDate today = date(2024, 3, 10);
    time_t next = 0;
    TEST_ASSERT_TRUE(computeNextFire(at(7, 0), now, &today, next));
    TEST_ASSERT_TRUE(next == localEpoch(2024, 3, 11, 7, 0, 0));
}

void test_fired_yesterday_keeps_today()
{
    const time_t now = localEpoch(2024, 3, 10, 6, 0, 0);
    const AlarmDate yesterday = date(2024, 3, 9);
    time_t next = 0;
    TEST_ASSERT_TRUE(computeNextFire(at(7, 0), now, &yesterday, next));
    TEST_ASSERT_TRUE(next == localEpoch(2024, 3, 10, 7, 0, 0));

    const AlarmDate unset{};
    TEST_ASSERT_TRUE(computeNextFire(at(7, 0), now, &unset, next));
    TEST_ASSERT_TRUE(next == localEpoch(2024, 3, 10, 7, 0, 0));
}

void test_month_and_leap_day_rollover()
{
    const time_t now = localEpoch(2024, 2, 29, 23, 30, 0);
    time_t next = 0;
    TEST_ASSERT_TRUE(computeNextFire(at(7, 0), now, nullptr, next));
    TEST_ASSERT_TRUE(next == localEpoch(2024, 3, 1, 7, 0, 0));

    const time_t newYearEve = localEpoch(2024, 12, 31, 22, 0, 0);
    TEST_ASSERT_TRUE(computeNextFire(at(6, 30), newYearEve, nullptr, next));
    TEST_ASSERT_TRUE(next == localEpoch(2025, 1, 1, 6, 30, 0));
}

void test_invalid_time_rejected()
{
    const time_t now = localEpoch(2024, 3, 10, 6, 0, 0);
    time_t next = 42;
    TEST_ASSERT_FALSE(computeNextFire(at(24, 0), now, nullptr, next));
    TEST_ASSERT_TRUE(next == 42);
}

void test_timezone_is_applied()
{
    setenv("TZ", "EST5", 1);
    tzset();

    // 11:00 UTC is 06:00 in EST5, so 07:00 local is one hour ahead.
    const time_t now = (time_t)1710068400; // 2024-03-10 11:00:00 UTC
    time_t next = 0;
    TEST_ASSERT_TRUE(computeNextFire(at(7, 0), now, nullptr, next));
    TEST_ASSERT_TRUE(next == now + 3600);
}

static void useCentralEurope()
{
    setenv("TZ", "CET-1CEST,M3.5.0,M10.5.0/3", 1);
    tzset();
}

void test_spring_forward_day_is_23_hours()
{
    useCentralEurope();
    // 2024-03-30 08:00 CET; clocks go forward during the night.
    const time_t now = (time_t)1711782000;
    time_t next = 0;
    TEST_ASSERT_TRUE(computeNextFire(at(7, 0), now, nullptr, next));
    // 2024-03-31 07:00 CEST = 05:00 UTC.
    TEST_ASSERT_TRUE(next == (time_t)1711861200);
    TEST_ASSERT_TRUE(next - now == 23 * 3600);
}

void test_fall_back_day_is_25_hours()
{
    useCentralEurope();
    // 2024-10-26 08:00 CEST; clocks go back during the night.
    const time_t now = (time_t)1729922400;
    time_t next = 0;
    TEST_ASSERT_TRUE(computeNextFire(at(7, 0), now, nullptr, next));
    // 2024-10-27 07:00 CET = 06:00 UTC.
    TEST_ASSERT_TRUE(next == (time_t)1730008800);
    TEST_ASSERT_TRUE(next - now == 25 * 3600);
}

void test_wake_time_inside_spring_gap()
{
    useCentralEurope();
    // 2024-03-31 01:00 CET; 02:30 does not exist on this day.
    const time_t now = (time_t)1711843200;
    time_t next = 0;
    TEST_ASSERT_TRUE(computeNextFire(at(2, 30), now, nullptr, next));
    TEST_ASSERT_TRUE(next > now);
    TEST_ASSERT_TRUE(next <= (time_t)1711848600);

    AlarmDate d{};
    TEST_ASSERT_TRUE(localDateOf(next, d));
    TEST_ASSERT_EQUAL_UINT8(3, d.month);
    TEST_ASSERT_EQUAL_UINT8(31, d.day);
}

void test_wake_time_inside_repeated_hour()
{
    useCentralEurope();
    // 2024-10-27 02:00 CEST; 02:30 happens at 00:30 UTC and again at 01:30 UTC.
    const time_t now = (time_t)1729987200;
    time_t next = 0;
    TEST_ASSERT_TRUE(computeNextFire(at(2, 30), now, nullptr, next));
    TEST_ASSERT_TRUE(next == (time_t)1729989000 || next == (time_t)1729992600);

    // Once rung, the second 02:30 of the same day is skipped.
    AlarmDate fired{};
    TEST_ASSERT_TRUE(localDateOf(next, fired));
    time_t after = 0;
    TEST_ASSERT_TRUE(computeNextFire(at(2, 30), next, &fired, after));
    AlarmDate d{};
    TEST_ASSERT_TRUE(localDateOf(after, d));
    TEST_ASSERT_EQUAL_UINT8(28, d.day);
}

void test_local_date_and_format()
{
    AlarmDate d{};
    TEST_ASSERT_TRUE(localDateOf(localEpoch(2024, 3, 10, 23, 59, 59), d));
    TEST_ASSERT_EQUAL_INT16(2024, d.year);
    TEST_ASSERT_EQUAL_UINT8(3, d.month);
    TEST_ASSERT_EQUAL_UINT8(10, d.day);

    char buf[12];
    TEST_ASSERT_TRUE(formatAlarmDate(d, buf, sizeof(buf)));
    TEST_ASSERT_EQUAL_STRING("2024-03-10", buf);

    const AlarmDate unset{};
    TEST_ASSERT_TRUE(formatAlarmDate(unset, buf, sizeof(buf)));
    TEST_ASSERT_EQUAL_STRING("", buf);
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_later_today);
    RUN_TEST(test_exactly_now_goes_to_tomorrow);
    RUN_TEST(test_already_passed_goes_to_tomorrow);
    RUN_TEST(test_fired_today_skips_today);
    RUN_TEST(test_fired_yesterday_keeps_today);
    RUN_TEST(test_month_and_leap_day_rollover);
    RUN_TEST(test_invalid_time_rejected);
    RUN_TEST(test_timezone_is_applied);
    RUN_TEST(test_spring_forward_day_is_23_hours);
    RUN_TEST(test_fall_back_day_is_25_hours);
    RUN_TEST(test_wake_time_inside_spring_gap);
    RUN_TEST(test_wake_time_inside_repeated_hour);
    RUN_TEST(test_local_date_and_format);
    return UNITY_END();
}
