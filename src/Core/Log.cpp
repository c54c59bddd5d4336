/**
 * @file Log.cpp
 * @brief Implementation file.
 */
#include "Core/Log.h"
#include <Arduino.h>
#include <cstring>
#include <stdarg.h>
#include <stdio.h>

namespace {
    const LogHubService* g_hub = nullptr;
    volatile uint8_t g_minLevel = (uint8_t)LogLevel::Debug;

    void fillEntry(LogEntry& e, LogLevel lvl, const char* tag, const char* fmt, va_list ap) {
        e.ts_ms = millis();
        e.lvl = lvl;
        strncpy(e.tag, tag ? tag : "-", LOG_TAG_MAX - 1);
        e.tag[LOG_TAG_MAX - 1] = '\0';
        vsnprintf(e.msg, LOG_MSG_MAX, fmt, ap);
    }

    void logVa(LogLevel lvl, const char* tag, const char* fmt, va_list ap) {
        if (!fmt) return;
        if ((uint8_t)lvl < g_minLevel) return;

        LogEntry e{};
        fillEntry(e, lvl, tag, fmt, ap);

        if (g_hub && g_hub->enqueue) {
            (void)g_hub->enqueue(g_hub->ctx, e);  // non-blocking, hub counts drops
            return;
        }

        // Boot path: no queue yet.
        Serial.printf("[boot][%s][%s] %s\n", logLevelStr(e.lvl), e.tag, e.msg);
    }
}

void Log::setHub(const LogHubService* hub) {
    g_hub = hub;
}

const LogHubService* Log::hub() {
    return g_hub;
}

void Log::setMinLevel(LogLevel lvl) {
    g_minLevel = (uint8_t)lvl;
}

LogLevel Log::minLevel() {
    return (LogLevel)g_minLevel;
}

void Log::logf(LogLevel lvl, const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(lvl, tag, fmt, ap);
    va_end(ap);
}

void Log::debug(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Debug, tag, fmt, ap);
    va_end(ap);
}

void Log::info(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Info, tag, fmt, ap);
    va_end(ap);
}

void Log::warn(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Warn, tag, fmt, ap);
    va_end(ap);
}

void Log::error(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Error, tag, fmt, ap);
    va_end(ap);
}
