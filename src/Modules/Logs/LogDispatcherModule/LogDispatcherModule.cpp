/**
 * @file LogDispatcherModule.cpp
 * @brief Implementation file.
 */
#include "LogDispatcherModule.h"
#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <stdio.h>
#include <string.h>

#define LOG_TAG "LogDisp"
#include "Core/ModuleLog.h"

void LogDispatcherModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    (void)cfg;

    _hubSvc = services.get<LogHubService>("loghub");
    _sinkReg = services.get<LogSinkRegistryService>("logsinks");

    /// the LogHub object is carried as the service ctx
    if (!_hubSvc || !_hubSvc->ctx || !_sinkReg) {
        LOGE("log hub or sink registry missing");
        return;
    }
    _hub = static_cast<LogHub*>(_hubSvc->ctx);

    const BaseType_t rc = xTaskCreatePinnedToCore(
        LogDispatcherModule::taskFn,
        "LogDispatch",
        4096,
        this,
        1,
        &_task,
        1
    );
    if (rc != pdPASS) {
        _task = nullptr;
        LOGE("dispatcher task creation failed");
    }
}

void LogDispatcherModule::writeAll_(const LogEntry& e) const {
    const int n = _sinkReg->count(_sinkReg->ctx);
    for (int i = 0; i < n; ++i) {
        LogSinkService sink = _sinkReg->get(_sinkReg->ctx, i);
        if (sink.write) sink.write(sink.ctx, e);
    }
}

void LogDispatcherModule::reportDropped_() {
    const uint32_t lost = _hub->takeDropped();
    if (lost == 0) return;

    // Written straight to sinks: re-queuing would compete with the backlog.
    LogEntry e{};
    e.ts_ms = millis();
    e.lvl = LogLevel::Warn;
    strncpy(e.tag, LOG_TAG, LOG_TAG_MAX - 1);
    snprintf(e.msg, sizeof(e.msg), "%lu log entries dropped (queue full)", (unsigned long)lost);
    writeAll_(e);
}

void LogDispatcherModule::taskFn(void* pv) {
    auto* self = static_cast<LogDispatcherModule*>(pv);
    LogEntry e;

    while (true) {
        if (self->_hub->dequeue(e, pdMS_TO_TICKS(1000))) {
            self->writeAll_(e);
            continue;
        }
        // Queue idle: safe point to report overflow.
        self->reportDropped_();
    }
}
