#pragma once
/**
 * @file FireTime.h
 * @brief Next fire instant computation for a daily wake time.
 */

#include <stddef.h>
#include <stdint.h>
#include <time.h>

#include "Modules/AlarmClockModule/TimeSpec.h"

/** @brief Local calendar date. `year == 0` means unset. */
struct AlarmDate {
    int16_t year = 0;
    uint8_t month = 0;
    uint8_t day = 0;
};

inline bool alarmDateIsSet(const AlarmDate& d) { return d.year != 0; }

inline bool alarmDateEquals(const AlarmDate& a, const AlarmDate& b)
{
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

/** @brief Local date of an epoch, using the current TZ. */
bool localDateOf(time_t epoch, AlarmDate& out);

/** @brief Format as `YYYY-MM-DD`, empty string when unset. */
bool formatAlarmDate(const AlarmDate& d, char* out, size_t outLen);

/**
 * @brief Next local instant matching `alarmTime`, strictly after `now`.
 *
 * Today's occurrence is used when it is still ahead and `lastFired` is not
 * today; otherwise the occurrence of the following day. Wall times that do
 * not exist on a given day (DST gap) are normalised forward by `mktime`.
 *
 * @param lastFired optional fired-today marker, nullptr when unset.
 */
bool computeNextFire(const AlarmTimeOfDay& alarmTime,
                     time_t now,
                     const AlarmDate* lastFired,
                     time_t& out);
