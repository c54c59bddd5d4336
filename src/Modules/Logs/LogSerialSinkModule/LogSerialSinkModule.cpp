/**
 * @file LogSerialSinkModule.cpp
 * @brief Implementation file.
 */
#include "LogSerialSinkModule.h"
#include "Core/ConfigBranchIds.h"
#include "Core/SystemLimits.h"
#include <Arduino.h>
#include <time.h>

#define LOG_TAG "LogSer"
#include "Core/ModuleLog.h"

static const char* lvlColor(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "\x1b[90m";
        case LogLevel::Info:  return "\x1b[32m";
        case LogLevel::Warn:  return "\x1b[33m";
        case LogLevel::Error: return "\x1b[31m";
    }
    return "";
}

static bool isSystemTimeValid()
{
    // Before the RTC/SNTP sets it, the epoch sits near 1970.
    return time(nullptr) >= (time_t)Limits::MinValidEpoch;
}

static void formatUptime(char* out, size_t outSize, uint32_t ms)
{
    const uint32_t s = ms / 1000;
    const uint32_t m = s / 60;
    const uint32_t h = m / 60;

    snprintf(out, outSize, "+%luh%02lu:%02lu.%03lu",
             (unsigned long)h,
             (unsigned long)(m % 60),
             (unsigned long)(s % 60),
             (unsigned long)(ms % 1000));
}

void LogSerialSinkModule::write_(void* ctx, const LogEntry& e) {
    const LogSerialSinkModule* self = static_cast<const LogSerialSinkModule*>(ctx);

    char ts[32];
    if (isSystemTimeValid()) {
        time_t now = time(nullptr);
        struct tm t;
        localtime_r(&now, &t);
        snprintf(ts, sizeof(ts), "%04d-%02d-%02d %02d:%02d:%02d.%03u",
                 t.tm_year + 1900, t.tm_mon + 1, t.tm_mday,
                 t.tm_hour, t.tm_min, t.tm_sec,
                 (unsigned)(e.ts_ms % 1000));
    } else {
        formatUptime(ts, sizeof(ts), e.ts_ms);
    }

    if (self && self->color) {
        Serial.printf("[%s][%s][%s] %s%s\x1b[0m\n",
                      ts, logLevelStr(e.lvl), e.tag, lvlColor(e.lvl), e.msg);
    } else {
        Serial.printf("[%s][%s][%s] %s\n", ts, logLevelStr(e.lvl), e.tag, e.msg);
    }
}

void LogSerialSinkModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    if (!cfg.registerVar(colorVar, (uint8_t)ConfigModuleId::Log, (uint16_t)ConfigBranchId::Log)) {
        LOGW("log.color not registered");
    }

    auto sinks = services.get<LogSinkRegistryService>("logsinks");
    if (!sinks) {
        LOGE("logsinks service missing");
        return;
    }

    LogSinkService sink{};
    sink.write = write_;
    sink.ctx = this;
    if (!sinks->add(sinks->ctx, sink)) {
        LOGW("serial sink rejected");
    }
}
