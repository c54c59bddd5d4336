/**
 * @file ModuleManager.cpp
 * @brief Implementation file.
 */
#include "ModuleManager.h"
#include "Core/Log.h"
#include "Core/Services/IEventBus.h"
#include <Arduino.h>
#include <cstring>

#define LOG_TAG_CORE "ModManag"

bool ModuleManager::add(Module* m) {
    if (!m || count >= MAX_MODULES) return false;
    if (indexOf(m->moduleId()) >= 0) {
        Log::error(LOG_TAG_CORE, "duplicate module id: %s", m->moduleId());
        return false;
    }
    modules[count++] = m;
    return true;
}

int8_t ModuleManager::indexOf(const char* id) const {
    if (!id) return -1;
    for (uint8_t i = 0; i < count; ++i) {
        if (strcmp(modules[i]->moduleId(), id) == 0) return (int8_t)i;
    }
    return -1;
}

// Depth-first: dependencies land in ordered[] before their dependents.
bool ModuleManager::visit(uint8_t idx, Mark* marks) {
    if (marks[idx] == Mark::Done) return true;
    Module* m = modules[idx];
    if (marks[idx] == Mark::Visiting) {
        // Early boot: the log dispatcher is not running yet.
        Serial.printf("[MOD][ERR] dependency cycle through '%s'\n", m->moduleId());
        Log::error(LOG_TAG_CORE, "dependency cycle through %s", m->moduleId());
        return false;
    }

    marks[idx] = Mark::Visiting;
    for (uint8_t d = 0; d < m->dependencyCount(); ++d) {
        const char* depId = m->dependency(d);
        if (!depId) continue;
        const int8_t dep = indexOf(depId);
        if (dep < 0) {
            Serial.printf("[MOD][ERR] '%s' requires missing module '%s'\n", m->moduleId(), depId);
            Log::error(LOG_TAG_CORE, "missing dependency: module=%s requires=%s", m->moduleId(), depId);
            return false;
        }
        if (!visit((uint8_t)dep, marks)) return false;
    }
    marks[idx] = Mark::Done;
    ordered[orderedCount++] = m;
    return true;
}

bool ModuleManager::buildInitOrder() {
    Mark marks[MAX_MODULES];
    for (uint8_t i = 0; i < MAX_MODULES; ++i) marks[i] = Mark::None;
    orderedCount = 0;

    for (uint8_t i = 0; i < count; ++i) {
        if (!visit(i, marks)) return false;
    }
    return true;
}

bool ModuleManager::initAll(ConfigStore& cfg, ServiceRegistry& services) {
    if (!buildInitOrder()) return false;

    for (uint8_t i = 0; i < orderedCount; ++i) {
        Log::debug(LOG_TAG_CORE, "init %u/%u: %s",
                   (unsigned)(i + 1), (unsigned)orderedCount, ordered[i]->moduleId());
        ordered[i]->init(cfg, services);
    }

    /// Every module registered its variables, stored values can be loaded.
    cfg.loadPersistent();
    wireCoreServices(services, cfg);

    for (uint8_t i = 0; i < orderedCount; ++i) {
        ordered[i]->onConfigLoaded(cfg, services);
    }

    for (uint8_t i = 0; i < orderedCount; ++i) {
        Module* m = ordered[i];
        if (!m->hasTask()) continue;
        if (!m->startTask()) {
            Log::error(LOG_TAG_CORE, "task start failed: %s", m->moduleId());
            return false;
        }
    }
    Log::info(LOG_TAG_CORE, "%u modules up", (unsigned)orderedCount);
    return true;
}

void ModuleManager::wireCoreServices(ServiceRegistry& services, ConfigStore& config) {
    // ConfigChanged is posted from ConfigStore writes.
    const EventBusService* eb = services.get<EventBusService>("eventbus");
    if (!eb) {
        Log::warn(LOG_TAG_CORE, "no eventbus: config changes are not published");
        return;
    }
    config.setEventBus(eb);
}
