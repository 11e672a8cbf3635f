#pragma once
/**
 * @file ConfigStore.h
 * @brief Persistent configuration store with JSON import/export.
 */

// Modules register their variables during init(). ModuleManager then calls
// loadPersistent() once, so NVS values override compiled defaults before
// onConfigLoaded(). applyJson() takes {"module":{"name":value}} patches.

#include <Preferences.h>
#include <cstdint>
#include <cstring>

#include "ConfigTypes.h"
#include "Core/ErrorCodes.h"
#include "Core/Log.h"

#ifndef LOG_TAG_CORE
#define LOG_TAG_CORE "CfgStore"
#define LOG_TAG_CORE_LOCAL_DEFINED
#endif

/**
 * @brief Holds config variables, persistence, and JSON import/export.
 */
class ConfigStore {
public:
    ConfigStore() = default;

    /** @brief Inject Preferences for NVS persistence. */
    void setPreferences(Preferences& prefs) { _prefs = &prefs; }

    /** @brief Register a config variable definition. */
    template<typename T, size_t H>
    bool registerVar(ConfigVariable<T, H>& var);

    /** @brief Set a typed config value and persist if needed. */
    template<typename T, size_t H>
    bool set(ConfigVariable<T, H>& var, const T& value);

    /** @brief Set a char array config value and persist if needed. */
    template<size_t H>
    bool set(ConfigVariable<char, H>& var, const char* str);

    /** @brief Load persistent values from NVS into registered variables. */
    void loadPersistent();

    /** @brief Serialize all registered config to nested JSON (secrets masked). */
    bool toJson(char* out, size_t outLen) const;
    /** @brief Serialize a single module's config (flat object). */
    bool toJsonModule(const char* module, char* out, size_t outLen) const;
    /**
     * @brief Apply a JSON patch to registered config variables.
     * @return `ErrorCode::InvalidArg` when the document does not parse.
     */
    ErrorCode applyJson(const char* json, uint8_t* changedCount = nullptr);

    uint16_t count() const { return _metaCount; }

private:
    Preferences* _prefs = nullptr;
    ConfigMeta _meta[Limits::MaxConfigVars];
    uint16_t _metaCount = 0;

    bool writePersistent(const ConfigMeta& m);
    void logPutFailure_(const char* key, size_t written);
};

// -------------------------
// Template implementation
// -------------------------
template<typename T, size_t H>
bool ConfigStore::registerVar(ConfigVariable<T, H>& var)
{
    if (_metaCount >= Limits::MaxConfigVars) {
        Log::error(LOG_TAG_CORE, "config table full (%s.%s)",
                   var.moduleName ? var.moduleName : "-", var.jsonName ? var.jsonName : "-");
        return false;
    }
    if (var.nvsKey && strlen(var.nvsKey) > Limits::MaxNvsKeyLen) {
        Log::warn(LOG_TAG_CORE, "NVS key too long (%s)", var.nvsKey);
        return false;
    }

    ConfigMeta& m = _meta[_metaCount++];
    m.module      = var.moduleName;
    m.name        = var.jsonName;
    m.nvsKey      = var.nvsKey;
    m.type        = var.type;
    m.persistence = var.persistence;
    m.valuePtr    = (void*)var.value;
    m.size        = var.size;
    return true;
}

template<typename T, size_t H>
bool ConfigStore::set(ConfigVariable<T, H>& var, const T& value)
{
    if (!var.value) return false;
    if (*(var.value) == value) return true;
    *(var.value) = value;

    var.notify();

    if (var.persistence == ConfigPersistence::Persistent && var.nvsKey && _prefs) {
        ConfigMeta m{var.moduleName, var.jsonName, var.nvsKey, var.type,
                     var.persistence, (void*)var.value, var.size};
        return writePersistent(m);
    }
    return true;
}

template<size_t H>
bool ConfigStore::set(ConfigVariable<char, H>& var, const char* str)
{
    if (!var.value || !str || var.size == 0) return false;

    size_t len = strlen(str);
    if (len >= var.size) len = var.size - 1;

    if (strncmp(var.value, str, len) == 0 && var.value[len] == '\0') return true;
    memcpy(var.value, str, len);
    var.value[len] = '\0';

    var.notify();

    if (var.persistence == ConfigPersistence::Persistent && var.nvsKey && _prefs) {
        ConfigMeta m{var.moduleName, var.jsonName, var.nvsKey, var.type,
                     var.persistence, (void*)var.value, var.size};
        return writePersistent(m);
    }
    return true;
}

#ifdef LOG_TAG_CORE_LOCAL_DEFINED
#undef LOG_TAG_CORE
#undef LOG_TAG_CORE_LOCAL_DEFINED
#endif
