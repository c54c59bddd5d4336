#pragma once
/**
 * @file TimeSpec.h
 * @brief Wake time parsing helper ("07:00", "0700", "in 10 minutes").
 */

#include <stddef.h>
#include <stdint.h>
#include <time.h>

#include "Core/ErrorCodes.h"

struct AlarmTimeOfDay {
    uint8_t hour = 0;
    uint8_t minute = 0;
    uint8_t second = 0;
};

/**
 * @brief Parse a user supplied wake time.
 *
 * Absolute forms, tried in order: `HH:MM:SS`, `HH:MM`, `H:MM`, `HHMM`.
 * Relative forms: `in <N> <unit>` and `+<N><unit>` with unit s/min/h
 * (long and plural spellings accepted). Relative input resolves against
 * `referenceNow` in local time.
 *
 * On failure `out` is untouched and `err` is one of `UnrecognizedFormat`,
 * `OutOfRange` or `NotReady` (relative input while the clock is unset).
 */
bool parseTimeSpec(const char* input, time_t referenceNow, AlarmTimeOfDay& out, ErrorCode& err);

/** @brief True when all fields are inside their clock range. */
bool timeOfDayValid(const AlarmTimeOfDay& t);

/** @brief Format as `HH:MM:SS`. */
bool formatTimeOfDay(const AlarmTimeOfDay& t, char* out, size_t outLen);
