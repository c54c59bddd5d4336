/**
 * @file LogHubModule.cpp
 * @brief Implementation file.
 */
#include "LogHubModule.h"
#include "Core/ConfigBranchIds.h"
#include "Core/Log.h"
#include "Core/SystemLimits.h"

#define LOG_TAG "LogHub"
#include "Core/ModuleLog.h"

void LogHubModule::onMinLevelChanged_(void* ctx, const uint8_t& value) {
    (void)ctx;
    const uint8_t lvl = value > (uint8_t)LogLevel::Error ? (uint8_t)LogLevel::Error : value;
    Log::setMinLevel((LogLevel)lvl);
}

void LogHubModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    if (!hub.init(Limits::LogQueueLen)) {
        LOGE("log queue allocation failed");
        return;
    }

    /// expose loghub service
    hubSvc.enqueue = [](void* ctx, const LogEntry& e) -> bool {
        return static_cast<LogHub*>(ctx)->enqueue(e);
    };
    hubSvc.takeDropped = [](void* ctx) -> uint32_t {
        return static_cast<LogHub*>(ctx)->takeDropped();
    };
    hubSvc.ctx = &hub;

    /// expose sink registry service
    sinksSvc.add = [](void* ctx, LogSinkService sink) -> bool {
        return static_cast<LogSinkRegistry*>(ctx)->add(sink);
    };
    sinksSvc.count = [](void* ctx) -> int {
        return static_cast<LogSinkRegistry*>(ctx)->count();
    };
    sinksSvc.get = [](void* ctx, int idx) -> LogSinkService {
        return static_cast<LogSinkRegistry*>(ctx)->get(idx);
    };
    sinksSvc.ctx = &sinks;

    if (!services.add("loghub", &hubSvc) || !services.add("logsinks", &sinksSvc)) {
        LOGE("log services registration failed");
        return;
    }

    minLevelVar.addHandler(onMinLevelChanged_, this);
    if (!cfg.registerVar(minLevelVar, (uint8_t)ConfigModuleId::Log, (uint16_t)ConfigBranchId::Log)) {
        LOGW("log.min_lvl not registered");
    }

    Log::setHub(&hubSvc);
}

void LogHubModule::onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) {
    (void)cfg;
    (void)services;
    onMinLevelChanged_(this, minLevel);
    LOGI("log level %s", logLevelStr(Log::minLevel()));
}
