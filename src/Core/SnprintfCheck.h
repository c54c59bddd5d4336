#pragma once
/**
 * @file SnprintfCheck.h
 * @brief Checked snprintf helper that logs truncation with source location.
 */

#include "Core/Log.h"
#include <stdarg.h>
#include <stddef.h>
#include <stdio.h>
#include <string.h>

static inline int wakeSnprintfChecked_(const char* tag,
                                       const char* file,
                                       int line,
                                       char* out,
                                       size_t outLen,
                                       const char* fmt,
                                       ...)
{
    va_list ap;
    va_start(ap, fmt);
    const int wrote = vsnprintf(out, outLen, fmt, ap);
    va_end(ap);

    if (wrote < 0 || outLen == 0 || (size_t)wrote >= outLen) {
        // Keep the log line short: basename only.
        const char* base = file ? strrchr(file, '/') : nullptr;
        base = base ? base + 1 : (file ? file : "?");
        Log::warn(tag ? tag : "FmtChk",
                  "snprintf truncated %s:%d len=%u need=%d",
                  base,
                  line,
                  (unsigned)outLen,
                  wrote);
    }
    return wrote;
}

#define WAKE_SNPRINTF_CHECKED(TAG, OUT, LEN, FMT, ...) \
    wakeSnprintfChecked_((TAG), __FILE__, __LINE__, (OUT), (LEN), (FMT), ##__VA_ARGS__)
