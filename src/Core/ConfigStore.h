#pragma once
/**
 * @file ConfigStore.h
 * @brief Persistent configuration store with JSON import/export.
 */

#include <Preferences.h>
#include <cstdint>
#include <cstring>
#include <type_traits>

#include "ConfigTypes.h"
#include "Core/SystemLimits.h"

struct EventBusService;

/** @brief One schema upgrade applied by `runMigrations`. */
struct MigrationStep {
    uint32_t fromVersion;
    uint32_t toVersion;
    bool (*apply)(Preferences& prefs, bool clearOnFail);
};

/**
 * @brief Table of config variables owned by modules.
 *
 * Every effective change runs the variable's handlers, is written to NVS
 * when the variable is persistent, then published as `EventId::ConfigChanged`.
 * Writing an unchanged value is a no-op that reports success.
 */
class ConfigStore {
public:
    void setEventBus(const EventBusService* bus) { _eventBus = bus; }
    void setPreferences(Preferences& prefs) { _prefs = &prefs; }

    template<typename T, size_t H>
    bool registerVar(ConfigVariable<T, H>& var, uint8_t moduleId = 0, uint16_t branchId = 0);

    /** @brief Returns false only when the NVS write failed; the value is applied anyway. */
    template<typename T, size_t H>
    bool set(ConfigVariable<T, H>& var, const T& value);

    /** @brief Char array variant, truncates to the variable size. */
    template<size_t H>
    bool set(ConfigVariable<char, H>& var, const char* str);

    void loadPersistent();

    bool toJsonModule(const char* module, char* out, size_t outLen, bool* truncated = nullptr) const;
    uint8_t listModules(const char** out, uint8_t max) const;
    /**
     * @brief Apply a `{"<module>":{"<name>":value}}` patch.
     * Unknown modules/names are ignored. Returns false on malformed JSON.
     */
    bool applyJson(const char* json);

    bool runMigrations(uint32_t currentVersion, const MigrationStep* steps, size_t count,
                       const char* versionKey = "cfg_ver", bool clearOnFail = true);

private:
    bool addMeta(const ConfigMeta& m);
    bool commitChange(const ConfigMeta& m);
    void notifyChanged(const ConfigMeta& m);
    bool writePersistent(const ConfigMeta& m);
    const ConfigMeta* findByValuePtr(const void* valuePtr) const;
    ConfigMeta* find(const char* module, const char* jsonName);

    template<typename T, size_t H>
    bool changed(ConfigVariable<T, H>& var)
    {
        const ConfigMeta* m = findByValuePtr(var.value);
        if (!m) {
            var.notify();
            return true;
        }
        return commitChange(*m);
    }

    Preferences* _prefs = nullptr;
    const EventBusService* _eventBus = nullptr;
    ConfigMeta _meta[Limits::MaxConfigVars];
    uint16_t _metaCount = 0;
};

template<typename T, size_t H>
bool ConfigStore::registerVar(ConfigVariable<T, H>& var, uint8_t moduleId, uint16_t branchId)
{
    if (!var.value) return false;

    ConfigMeta m{};
    m.module = var.moduleName;
    m.name = var.jsonName;
    m.nvsKey = var.nvsKey;
    m.type = var.type;
    m.persistence = var.persistence;
    m.valuePtr = (void*)var.value;
    m.size = var.size;
    m.moduleId = moduleId;
    m.branchId = branchId;
    m.var = &var;
    m.notify = [](void* v) { static_cast<ConfigVariable<T, H>*>(v)->notify(); };
    if (!addMeta(m)) return false;

    var.moduleId = moduleId;
    var.branchId = branchId;
    return true;
}

template<typename T, size_t H>
bool ConfigStore::set(ConfigVariable<T, H>& var, const T& value)
{
    static_assert(!std::is_same<T, char>::value, "use set(var, const char*) for char arrays");
    if (!var.value) return false;
    if (*(var.value) == value) return true;
    *(var.value) = value;
    return changed(var);
}

template<size_t H>
bool ConfigStore::set(ConfigVariable<char, H>& var, const char* str)
{
    if (!var.value || !str || var.size == 0) return false;

    const size_t len = strnlen(str, var.size - 1);
    if (strncmp(var.value, str, len) == 0 && var.value[len] == '\0') return true;
    memcpy(var.value, str, len);
    var.value[len] = '\0';
    return changed(var);
}
