#pragma once
/**
 * @file ConfigStoreModule.h
 * @brief Module that exposes ConfigStore service and config commands.
 */
#include "Core/ModulePassive.h"
#include "Core/Services/Services.h"

/**
 * @brief Passive module wiring ConfigStore JSON services.
 * Also registers `config.get` and `config.set` on the command registry.
 */
class ConfigStoreModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "config"; }

    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        if (i == 1) return "cmd";
        return nullptr;
    }

    /** @brief Register config services. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;

private:
    ConfigStore* store = nullptr;
    ConfigStoreService svc{};

    static bool svcApplyJson(void* ctx, const char* json);
    static bool svcToJsonModule(void* ctx, const char* module, char* out, size_t outLen, bool* truncated);
    static uint8_t svcListModules(void* ctx, const char** out, uint8_t max);

    static bool cmdGet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
    static bool cmdSet_(void* userCtx, const CommandRequest& req, char* reply, size_t replyLen);
};
