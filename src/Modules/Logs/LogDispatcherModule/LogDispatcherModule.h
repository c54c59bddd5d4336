#pragma once
/**
 * @file LogDispatcherModule.h
 * @brief Module that dispatches log entries to sinks.
 */
#include "Core/ModulePassive.h"
#include "Core/ServiceRegistry.h"
#include "Core/Services/ILogger.h"
#include "Core/LogHub.h"

/**
 * @brief Passive module that runs its own task to drain the log hub into sinks.
 */
class LogDispatcherModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "log.dispatcher"; }

    /** @brief Depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    /** @brief Start dispatcher task and wire sink registry. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    static void taskFn(void* pv);
    void writeAll_(const LogEntry& e) const;
    void reportDropped_();

    LogHub* _hub = nullptr;
    const LogHubService* _hubSvc = nullptr;
    const LogSinkRegistryService* _sinkReg = nullptr;
    TaskHandle_t _task = nullptr;
};
