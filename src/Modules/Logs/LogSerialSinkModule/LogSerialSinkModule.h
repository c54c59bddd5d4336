#pragma once
/**
 * @file LogSerialSinkModule.h
 * @brief Serial log sink module.
 */
#include "Core/ModulePassive.h"
#include "Core/Services/ILogger.h"
#include "Core/ServiceRegistry.h"
#include "Core/NvsKeys.h"

/**
 * @brief Passive module that writes log entries to Serial.
 * Timestamps use local wall-clock time once it is valid, uptime before.
 */
class LogSerialSinkModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "log.sink.serial"; }

    /** @brief Depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    /** @brief Register the serial log sink. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    static void write_(void* ctx, const LogEntry& e);

    bool color = true;
    ConfigVariable<bool, 0> colorVar{
        NVS_KEY(NvsKeys::Log::Color), "color", "log", ConfigType::Bool,
        &color, ConfigPersistence::Persistent, 0
    };
};
