/**
 * @file ConfigStore.cpp
 * @brief Implementation file.
 */
#include "Core/ConfigStore.h"
#include <ArduinoJson.h>
#include <math.h>

#define LOG_TAG_CORE "CfgStore"

static bool isMaskedKey(const char* key) {
    if (!key) return false;
    return strcmp(key, "pass") == 0 ||
           strcmp(key, "token") == 0 ||
           strcmp(key, "secret") == 0;
}

static void putValue(JsonObject obj, const ConfigMeta& m) {
    if (isMaskedKey(m.name)) {
        obj[m.name] = "***";
        return;
    }
    switch (m.type) {
        case ConfigType::Int32:     obj[m.name] = *(int32_t*)m.valuePtr; break;
        case ConfigType::UInt8:     obj[m.name] = *(uint8_t*)m.valuePtr; break;
        case ConfigType::Bool:      obj[m.name] = *(bool*)m.valuePtr; break;
        case ConfigType::Float:     obj[m.name] = *(float*)m.valuePtr; break;
        case ConfigType::CharArray: obj[m.name] = (const char*)m.valuePtr; break;
    }
}

void ConfigStore::logPutFailure_(const char* key, size_t written)
{
    if (written == 0) Log::warn(LOG_TAG_CORE, "NVS write failed key=%s", key ? key : "-");
}

bool ConfigStore::writePersistent(const ConfigMeta& m)
{
    if (!_prefs) return false;
    if (m.persistence != ConfigPersistence::Persistent) return true;
    if (!m.nvsKey) return false;

    size_t written = 0;
    switch (m.type) {
        case ConfigType::Int32:     written = _prefs->putInt(m.nvsKey, *(int32_t*)m.valuePtr); break;
        case ConfigType::UInt8:     written = _prefs->putUChar(m.nvsKey, *(uint8_t*)m.valuePtr); break;
        case ConfigType::Bool:      written = _prefs->putBool(m.nvsKey, *(bool*)m.valuePtr); break;
        case ConfigType::Float:     written = _prefs->putFloat(m.nvsKey, *(float*)m.valuePtr); break;
        case ConfigType::CharArray:
            written = _prefs->putString(m.nvsKey, (const char*)m.valuePtr);
            // Empty strings store zero bytes.
            if (((const char*)m.valuePtr)[0] == '\0') return true;
            break;
    }
    logPutFailure_(m.nvsKey, written);
    return written > 0;
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
            case ConfigType::Float:
                *(float*)m.valuePtr = _prefs->getFloat(m.nvsKey, *(float*)m.valuePtr);
                break;
            case ConfigType::CharArray:
                _prefs->getString(m.nvsKey, (char*)m.valuePtr, m.size);
                break;
        }
    }
}

bool ConfigStore::toJson(char* out, size_t outLen) const
{
    if (!out || outLen == 0) return false;

    StaticJsonDocument<Limits::JsonStatusBuf> doc;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || !m.name) continue;
        JsonObject mod = doc[m.module];
        if (mod.isNull()) mod = doc.createNestedObject(m.module);
        putValue(mod, m);
    }

    if (doc.overflowed() || measureJson(doc) >= outLen) {
        Log::warn(LOG_TAG_CORE, "toJson: output truncated");
        out[0] = '\0';
        return false;
    }
    serializeJson(doc, out, outLen);
    return true;
}

bool ConfigStore::toJsonModule(const char* module, char* out, size_t outLen) const
{
    if (!module || !out || outLen == 0) return false;

    StaticJsonDocument<Limits::JsonStatusBuf> doc;
    JsonObject obj = doc.to<JsonObject>();
    bool any = false;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || !m.name || strcmp(m.module, module) != 0) continue;
        putValue(obj, m);
        any = true;
    }
    if (!any) return false;

    if (doc.overflowed() || measureJson(doc) >= outLen) {
        out[0] = '\0';
        return false;
    }
    serializeJson(doc, out, outLen);
    return true;
}

ErrorCode ConfigStore::applyJson(const char* json, uint8_t* changedCount)
{
    if (changedCount) *changedCount = 0;
    if (!json) return ErrorCode::InvalidArg;

    StaticJsonDocument<Limits::JsonConfigApplyBuf> doc;
    DeserializationError err = deserializeJson(doc, json);
    if (err || !doc.is<JsonObject>()) {
        Log::warn(LOG_TAG_CORE, "applyJson: parse failed (%s)", err ? err.c_str() : "not an object");
        return ErrorCode::InvalidArg;
    }

    uint8_t changed = 0;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        if (!m.module || !m.name) continue;
        JsonVariant v = doc[m.module][m.name];
        if (v.isNull()) continue;

        bool diff = false;
        switch (m.type) {
        case ConfigType::Int32: {
            if (!v.is<int32_t>()) break;
            int32_t nv = v.as<int32_t>();
            if (*(int32_t*)m.valuePtr != nv) { *(int32_t*)m.valuePtr = nv; diff = true; }
            break;
        }
        case ConfigType::UInt8: {
            if (!v.is<uint8_t>()) break;
            uint8_t nv = v.as<uint8_t>();
            if (*(uint8_t*)m.valuePtr != nv) { *(uint8_t*)m.valuePtr = nv; diff = true; }
            break;
        }
        case ConfigType::Bool: {
            if (!v.is<bool>()) break;
            bool nv = v.as<bool>();
            if (*(bool*)m.valuePtr != nv) { *(bool*)m.valuePtr = nv; diff = true; }
            break;
        }
        case ConfigType::Float: {
            if (!v.is<float>()) break;
            float nv = v.as<float>();
            if (isnan(nv)) break;
            if (*(float*)m.valuePtr != nv) { *(float*)m.valuePtr = nv; diff = true; }
            break;
        }
        case ConfigType::CharArray: {
            const char* s = v.as<const char*>();
            if (!s || m.size == 0) break;
            size_t len = strlen(s);
            if (len >= m.size) len = m.size - 1;
            char* dst = (char*)m.valuePtr;
            if (strncmp(dst, s, len) != 0 || dst[len] != '\0') {
                memcpy(dst, s, len);
                dst[len] = '\0';
                diff = true;
            }
            break;
        }
        }

        if (!diff) continue;
        ++changed;
        Log::info(LOG_TAG_CORE, "applyJson: changed %s.%s", m.module, m.name);
        if (m.persistence == ConfigPersistence::Persistent) writePersistent(m);
    }

    if (changedCount) *changedCount = changed;
    return ErrorCode::None;
}
