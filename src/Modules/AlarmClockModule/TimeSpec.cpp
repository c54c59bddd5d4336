/**
 * @file TimeSpec.cpp
 * @brief Wake time parsing helper implementation.
 */

#include "Modules/AlarmClockModule/TimeSpec.h"
#include "Core/SystemLimits.h"

#include <ctype.h>
#include <stdio.h>
#include <string.h>

namespace {

constexpr size_t kMaxInput = 32;

struct RelativeUnit {
    const char* word;
    uint32_t seconds;
};

const RelativeUnit kUnits[] = {
    {"s", 1U}, {"sec", 1U}, {"secs", 1U}, {"second", 1U}, {"seconds", 1U},
    {"m", 60U}, {"min", 60U}, {"mins", 60U}, {"minute", 60U}, {"minutes", 60U},
    {"h", 3600U}, {"hr", 3600U}, {"hrs", 3600U}, {"hour", 3600U}, {"hours", 3600U},
};

bool trimCopy_(const char* in, char* out, size_t outLen)
{
    while (*in == ' ' || *in == '\t') ++in;
    size_t len = strlen(in);
    while (len > 0 && (in[len - 1] == ' ' || in[len - 1] == '\t' ||
                       in[len - 1] == '\r' || in[len - 1] == '\n')) {
        --len;
    }
    if (len == 0 || len >= outLen) return false;
    memcpy(out, in, len);
    out[len] = '\0';
    return true;
}

// Shape letters: 'D' digit, anything else literal.
bool matchShape_(const char* s, const char* shape)
{
    for (; *shape != '\0'; ++s, ++shape) {
        if (*s == '\0') return false;
        if (*shape == 'D') {
            if (!isdigit((unsigned char)*s)) return false;
        } else if (*s != *shape) {
            return false;
        }
    }
    return *s == '\0';
}

int digits2_(const char* s)
{
    return (s[0] - '0') * 10 + (s[1] - '0');
}

bool finishAbsolute_(int h, int m, int sec, AlarmTimeOfDay& out, ErrorCode& err)
{
    if (h > 23 || m > 59 || sec > 59) {
        err = ErrorCode::OutOfRange;
        return false;
    }
    out.hour = (uint8_t)h;
    out.minute = (uint8_t)m;
    out.second = (uint8_t)sec;
    return true;
}

// 1 = parsed, 0 = not an absolute shape, -1 = shape matched but out of range
int parseAbsolute_(const char* s, AlarmTimeOfDay& out, ErrorCode& err)
{
    if (matchShape_(s, "DD:DD:DD")) {
        return finishAbsolute_(digits2_(s), digits2_(s + 3), digits2_(s + 6), out, err) ? 1 : -1;
    }
    if (matchShape_(s, "DD:DD")) {
        return finishAbsolute_(digits2_(s), digits2_(s + 3), 0, out, err) ? 1 : -1;
    }
    if (matchShape_(s, "D:DD")) {
        return finishAbsolute_(s[0] - '0', digits2_(s + 2), 0, out, err) ? 1 : -1;
    }
    if (matchShape_(s, "DDDD")) {
        return finishAbsolute_(digits2_(s), digits2_(s + 2), 0, out, err) ? 1 : -1;
    }
    return 0;
}

const char* skipSpaces_(const char* p)
{
    while (*p == ' ' || *p == '\t') ++p;
    return p;
}

bool lookupUnit_(const char* word, uint32_t& seconds)
{
    for (const RelativeUnit& u : kUnits) {
        if (strcmp(word, u.word) == 0) {
            seconds = u.seconds;
            return true;
        }
    }
    return false;
}

// 1 = parsed, 0 = not a relative expression, -1 = relative but rejected
int parseRelative_(const char* s, time_t referenceNow, AlarmTimeOfDay& out, ErrorCode& err)
{
    char low[kMaxInput];
    size_t n = 0;
    for (; s[n] != '\0' && n < sizeof(low) - 1; ++n) low[n] = (char)tolower((unsigned char)s[n]);
    low[n] = '\0';

    const char* p = nullptr;
    if (low[0] == '+') {
        p = low + 1;
    } else if (strncmp(low, "in ", 3) == 0) {
        p = skipSpaces_(low + 3);
    } else {
        return 0;
    }

    if (!isdigit((unsigned char)*p)) return 0;
    uint64_t count = 0;
    uint8_t digits = 0;
    while (isdigit((unsigned char)*p)) {
        if (++digits > 9) {
            err = ErrorCode::OutOfRange;
            return -1;
        }
        count = count * 10U + (uint64_t)(*p - '0');
        ++p;
    }
    p = skipSpaces_(p);

    uint32_t unitSec = 0;
    if (!lookupUnit_(p, unitSec)) return 0;

    const uint64_t total = count * unitSec;
    if (count == 0 || total > Limits::AlarmClock::MaxRelativeSec) {
        err = ErrorCode::OutOfRange;
        return -1;
    }
    if (referenceNow < (time_t)Limits::MinValidEpoch) {
        err = ErrorCode::NotReady;
        return -1;
    }

    const time_t target = referenceNow + (time_t)total;
    struct tm lt{};
    if (!localtime_r(&target, &lt)) {
        err = ErrorCode::Failed;
        return -1;
    }
    out.hour = (uint8_t)lt.tm_hour;
    out.minute = (uint8_t)lt.tm_min;
    out.second = (uint8_t)(lt.tm_sec > 59 ? 59 : lt.tm_sec);
    return 1;
}

}  // namespace

bool parseTimeSpec(const char* input, time_t referenceNow, AlarmTimeOfDay& out, ErrorCode& err)
{
    char buf[kMaxInput];
    if (!input || !trimCopy_(input, buf, sizeof(buf))) {
        err = ErrorCode::UnrecognizedFormat;
        return false;
    }

    AlarmTimeOfDay parsed{};
    int rc = parseAbsolute_(buf, parsed, err);
    if (rc == 0) rc = parseRelative_(buf, referenceNow, parsed, err);
    if (rc == 0) {
        err = ErrorCode::UnrecognizedFormat;
        return false;
    }
    if (rc < 0) return false;

    out = parsed;
    return true;
}

bool timeOfDayValid(const AlarmTimeOfDay& t)
{
    return t.hour <= 23 && t.minute <= 59 && t.second <= 59;
}

bool formatTimeOfDay(const AlarmTimeOfDay& t, char* out, size_t outLen)
{
    if (!out || outLen == 0) return false;
    const int wrote = snprintf(out, outLen, "%02u:%02u:%02u",
                               (unsigned)t.hour, (unsigned)t.minute, (unsigned)t.second);
    return (wrote > 0) && ((size_t)wrote < outLen);
}
