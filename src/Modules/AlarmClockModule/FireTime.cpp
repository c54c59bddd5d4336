/**
 * @file FireTime.cpp
 * @brief Next fire instant computation implementation.
 */

#include "Modules/AlarmClockModule/FireTime.h"

#include <stdio.h>

static bool localEpochAt_(const struct tm& day, const AlarmTimeOfDay& t, int dayOffset, time_t& out)
{
    struct tm c{};
    c.tm_year = day.tm_year;
    c.tm_mon = day.tm_mon;
    c.tm_mday = day.tm_mday + dayOffset;
    c.tm_hour = t.hour;
    c.tm_min = t.minute;
    c.tm_sec = t.second;
    c.tm_isdst = -1;

    const time_t epoch = mktime(&c);
    if (epoch == (time_t)-1) return false;
    out = epoch;
    return true;
}

bool localDateOf(time_t epoch, AlarmDate& out)
{
    struct tm lt{};
    if (!localtime_r(&epoch, &lt)) return false;
    out.year = (int16_t)(lt.tm_year + 1900);
    out.month = (uint8_t)(lt.tm_mon + 1);
    out.day = (uint8_t)lt.tm_mday;
    return true;
}

bool formatAlarmDate(const AlarmDate& d, char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;
    if (!alarmDateIsSet(d)) {
        out[0] = '\0';
        return true;
    }
    const int wrote = snprintf(out, outLen, "%04d-%02u-%02u",
                               (int)d.year, (unsigned)d.month, (unsigned)d.day);
    return (wrote > 0) && ((size_t)wrote < outLen);
}

bool computeNextFire(const AlarmTimeOfDay& alarmTime,
                     time_t now,
                     const AlarmDate* lastFired,
                     time_t& out)
{
    if (!timeOfDayValid(alarmTime)) return false;

    struct tm today{};
    if (!localtime_r(&now, &today)) return false;

    AlarmDate todayDate{};
    todayDate.year = (int16_t)(today.tm_year + 1900);
    todayDate.month = (uint8_t)(today.tm_mon + 1);
    todayDate.day = (uint8_t)today.tm_mday;
    const bool firedToday = lastFired && alarmDateIsSet(*lastFired) && alarmDateEquals(*lastFired, todayDate);

    // Day 0 is skipped once the alarm already rang today. Day 2 only matters
    // when a DST shift pushes day 1 back to or before `now`.
    for (int offset = firedToday ? 1 : 0; offset <= 2; ++offset) {
        time_t candidate = 0;
        if (!localEpochAt_(today, alarmTime, offset, candidate)) return false;
        if (candidate > now) {
            out = candidate;
            return true;
        }
    }
    return false;
}
