#pragma once
/**
 * @file ModuleManager.h
 * @brief Dependency ordering and initialization for modules.
 */
#include "Module.h"

/** @brief Maximum number of modules supported at runtime. */
constexpr size_t MAX_MODULES = 12;

/**
 * @brief Owns the boot sequence of every registered module.
 *
 * Boot order: `init()` in dependency order, ConfigStore load, EventBus wiring,
 * `onConfigLoaded()` in the same order, then task start.
 */
class ModuleManager {
public:
    /** @brief Register a module. Rejects nullptr, duplicate ids and a full table. */
    bool add(Module* m);
    bool initAll(ConfigStore& cfg, ServiceRegistry& services);

private:
    enum class Mark : uint8_t { None, Visiting, Done };

    Module* modules[MAX_MODULES]{};
    uint8_t count = 0;

    Module* ordered[MAX_MODULES]{};
    uint8_t orderedCount = 0;

    int8_t indexOf(const char* id) const;
    bool visit(uint8_t idx, Mark* marks);
    bool buildInitOrder();
    void wireCoreServices(ServiceRegistry& services, ConfigStore& config);
};
