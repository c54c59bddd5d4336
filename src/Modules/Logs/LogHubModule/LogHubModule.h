#pragma once
/**
 * @file LogHubModule.h
 * @brief Module that hosts the LogHub and sink registry.
 */
#include "Core/ModulePassive.h"
#include "Core/ServiceRegistry.h"
#include "Core/LogHub.h"
#include "Core/LogSinkRegistry.h"
#include "Core/Services/ILogger.h"
#include "Core/NvsKeys.h"

/**
 * @brief Passive module wiring log hub and sink registry services.
 * Owns the `log.min_lvl` config variable.
 */
class LogHubModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "loghub"; }

    /** @brief Initialize log hub and register services. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    LogHub hub;
    LogHubService hubSvc{};

    LogSinkRegistry sinks;
    LogSinkRegistryService sinksSvc{};

    uint8_t minLevel = (uint8_t)LogLevel::Debug;
    ConfigVariable<uint8_t, 1> minLevelVar{
        NVS_KEY(NvsKeys::Log::MinLevel), "min_lvl", "log", ConfigType::UInt8,
        &minLevel, ConfigPersistence::Persistent, 0
    };

    static void onMinLevelChanged_(void* ctx, const uint8_t& value);
};
