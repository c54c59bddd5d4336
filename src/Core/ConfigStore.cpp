/**
 * @file ConfigStore.cpp
 * @brief Implementation file.
 */
#include "Core/ConfigStore.h"
#include "Core/Log.h"
#include "Core/EventBus/EventPayloads.h"
#include "Core/Services/IEventBus.h"
#include <ArduinoJson.h>
#include <stdio.h>

#define LOG_TAG_CORE "CfgStore"

bool ConfigStore::addMeta(const ConfigMeta& m)
{
    if (_metaCount >= Limits::MaxConfigVars) {
        Log::error(LOG_TAG_CORE, "config table full, dropped %s.%s",
                   m.module ? m.module : "-", m.name ? m.name : "-");
        return false;
    }
    _meta[_metaCount++] = m;
    return true;
}

bool ConfigStore::commitChange(const ConfigMeta& m)
{
    if (m.notify) m.notify(m.var);
    const bool persisted = writePersistent(m);
    if (!persisted) {
        Log::warn(LOG_TAG_CORE, "persist failed key=%s", m.nvsKey ? m.nvsKey : "-");
    }
    notifyChanged(m);
    return persisted;
}

void ConfigStore::notifyChanged(const ConfigMeta& m)
{
    if (!_eventBus || !m.nvsKey) return;

    ConfigChangedPayload p{};
    strncpy(p.nvsKey, m.nvsKey, sizeof(p.nvsKey) - 1);
    p.moduleId = m.moduleId;
    p.branchId = m.branchId;
    if (!_eventBus->post(_eventBus->ctx, EventId::ConfigChanged, &p, sizeof(p))) {
        Log::warn(LOG_TAG_CORE, "ConfigChanged dropped key=%s", m.nvsKey);
    }
}

bool ConfigStore::writePersistent(const ConfigMeta& m)
{
    if (m.persistence != ConfigPersistence::Persistent) return true;
    if (!_prefs || !m.nvsKey) return false;

    size_t wrote = 0;
    switch (m.type) {
        case ConfigType::Int32:
            wrote = _prefs->putInt(m.nvsKey, *(int32_t*)m.valuePtr);
            break;
        case ConfigType::UInt8:
            wrote = _prefs->putUChar(m.nvsKey, *(uint8_t*)m.valuePtr);
            break;
        case ConfigType::Bool:
            wrote = _prefs->putBool(m.nvsKey, *(bool*)m.valuePtr);
            break;
        case ConfigType::CharArray:
            wrote = _prefs->putString(m.nvsKey, (const char*)m.valuePtr);
            // Preferences reports 0 bytes for an empty string.
            if (((const char*)m.valuePtr)[0] == '\0') return true;
            break;
    }
    return wrote > 0;
}

const ConfigMeta* ConfigStore::findByValuePtr(const void* valuePtr) const
{
    for (uint16_t i = 0; i < _metaCount; ++i) {
        if (_meta[i].valuePtr == valuePtr) return &_meta[i];
    }
    return nullptr;
}

ConfigMeta* ConfigStore::find(const char* module, const char* jsonName)
{
    if (!module || !jsonName) return nullptr;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        if (!m.module || !m.name) continue;
        if (strcmp(m.module, module) == 0 && strcmp(m.name, jsonName) == 0) return &m;
    }
    return nullptr;
}

void ConfigStore::loadPersistent()
{
    if (!_prefs) return;

    Log::debug(LOG_TAG_CORE, "loadPersistent: vars=%u", (unsigned)_metaCount);
    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        if (m.persistence != ConfigPersistence::Persistent) continue;
        if (!m.nvsKey || !_prefs->isKey(m.nvsKey)) continue;

        switch (m.type) {
            case ConfigType::Int32:
                *(int32_t*)m.valuePtr = _prefs->getInt(m.nvsKey, *(int32_t*)m.valuePtr);
                break;
            case ConfigType::UInt8:
                *(uint8_t*)m.valuePtr = _prefs->getUChar(m.nvsKey, *(uint8_t*)m.valuePtr);
                break;
            case ConfigType::Bool:
                *(bool*)m.valuePtr = _prefs->getBool(m.nvsKey, *(bool*)m.valuePtr);
                break;
            case ConfigType::CharArray:
                _prefs->getString(m.nvsKey, (char*)m.valuePtr, m.size);
                break;
        }
    }
}

bool ConfigStore::toJsonModule(const char* module, char* out, size_t outLen, bool* truncated) const
{
    if (truncated) *truncated = false;
    if (!out || outLen == 0) return false;
    out[0] = '\0';
    if (!module || module[0] == '\0') return false;

    StaticJsonDocument<Limits::JsonCfgBuf> doc;
    JsonObject obj = doc.to<JsonObject>();
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || !m.name || strcmp(m.module, module) != 0) continue;
        switch (m.type) {
            case ConfigType::Int32: obj[m.name] = *(const int32_t*)m.valuePtr; break;
            case ConfigType::UInt8: obj[m.name] = *(const uint8_t*)m.valuePtr; break;
            case ConfigType::Bool: obj[m.name] = *(const bool*)m.valuePtr; break;
            // const char* is stored by pointer; the variable outlives the document.
            case ConfigType::CharArray: obj[m.name] = (const char*)m.valuePtr; break;
        }
    }
    if (obj.size() == 0) return false;

    if (doc.overflowed() || measureJson(doc) >= outLen) {
        if (truncated) *truncated = true;
        return false;
    }
    serializeJson(doc, out, outLen);
    return true;
}

uint8_t ConfigStore::listModules(const char** out, uint8_t max) const
{
    if (!out || max == 0) return 0;
    uint8_t count = 0;

    for (uint16_t i = 0; i < _metaCount && count < max; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || m.module[0] == '\0') continue;

        bool exists = false;
        for (uint8_t j = 0; j < count; ++j) {
            if (strcmp(out[j], m.module) == 0) { exists = true; break; }
        }
        if (!exists) out[count++] = m.module;
    }
    return count;
}

// Type mismatches are ignored. Returns true when the stored value changed.
static bool assignFromJson(const ConfigMeta& m, JsonVariantConst v)
{
    switch (m.type) {
        case ConfigType::Int32: {
            if (!v.is<int32_t>()) return false;
            int32_t& dst = *(int32_t*)m.valuePtr;
            if (dst == v.as<int32_t>()) return false;
            dst = v.as<int32_t>();
            return true;
        }
        case ConfigType::UInt8: {
            if (!v.is<uint8_t>()) return false;
            uint8_t& dst = *(uint8_t*)m.valuePtr;
            if (dst == v.as<uint8_t>()) return false;
            dst = v.as<uint8_t>();
            return true;
        }
        case ConfigType::Bool: {
            if (!v.is<bool>()) return false;
            bool& dst = *(bool*)m.valuePtr;
            if (dst == v.as<bool>()) return false;
            dst = v.as<bool>();
            return true;
        }
        case ConfigType::CharArray: {
            const char* src = v.as<const char*>();
            if (!src || m.size == 0) return false;
            char* dst = (char*)m.valuePtr;
            const size_t len = strnlen(src, m.size - 1U);
            if (strncmp(dst, src, len) == 0 && dst[len] == '\0') return false;
            memcpy(dst, src, len);
            dst[len] = '\0';
            return true;
        }
    }
    return false;
}

bool ConfigStore::applyJson(const char* json)
{
    if (!json) return false;

    static StaticJsonDocument<Limits::JsonCmdBuf> doc;
    doc.clear();
    const DeserializationError err = deserializeJson(doc, json);
    if (err || !doc.is<JsonObjectConst>()) {
        Log::warn(LOG_TAG_CORE, "applyJson: bad json (%s)", err.c_str());
        return false;
    }

    bool allOk = true;
    for (JsonPairConst mod : doc.as<JsonObjectConst>()) {
        if (!mod.value().is<JsonObjectConst>()) continue;

        for (JsonPairConst kv : mod.value().as<JsonObjectConst>()) {
            ConfigMeta* m = find(mod.key().c_str(), kv.key().c_str());
            if (!m) {
                Log::debug(LOG_TAG_CORE, "applyJson: unknown %s.%s", mod.key().c_str(), kv.key().c_str());
                continue;
            }

            if (!assignFromJson(*m, kv.value())) continue;
            Log::debug(LOG_TAG_CORE, "applyJson: changed %s.%s", m->module, m->name);
            if (!commitChange(*m)) allOk = false;
        }
    }
    return allOk;
}

bool ConfigStore::runMigrations(uint32_t currentVersion,
                                const MigrationStep* steps,
                                size_t count,
                                const char* versionKey,
                                bool clearOnFail)
{
    if (!_prefs) return false;
    if (!versionKey) versionKey = "cfg_ver";

    uint32_t storedVersion = _prefs->getUInt(versionKey, 0);
    Log::debug(LOG_TAG_CORE, "migrations: stored=%lu current=%lu",
               (unsigned long)storedVersion, (unsigned long)currentVersion);

    if (storedVersion == currentVersion) return true;

    /// Stored schema is newer than this firmware (downgrade): keep data, refuse to touch it.
    if (storedVersion > currentVersion) {
        Log::warn(LOG_TAG_CORE, "migrations: stored schema %lu newer than %lu",
                  (unsigned long)storedVersion, (unsigned long)currentVersion);
        return false;
    }

    while (storedVersion < currentVersion) {
        const MigrationStep* step = nullptr;
        for (size_t i = 0; steps && i < count; ++i) {
            if (steps[i].fromVersion == storedVersion) {
                step = &steps[i];
                break;
            }
        }

        if (!step || !step->apply || !step->apply(*_prefs, clearOnFail)) {
            Log::warn(LOG_TAG_CORE, "migration failed from %lu", (unsigned long)storedVersion);
            if (clearOnFail) {
                _prefs->clear();
                _prefs->putUInt(versionKey, currentVersion);
            }
            return false;
        }

        storedVersion = step->toVersion;
        _prefs->putUInt(versionKey, storedVersion);
        Log::debug(LOG_TAG_CORE, "migration applied: now=%lu", (unsigned long)storedVersion);
    }

    Log::debug(LOG_TAG_CORE, "migrations: completed at %lu", (unsigned long)currentVersion);
    return true;
}
