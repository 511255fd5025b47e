/**
 * @file ConfigStore.cpp
 * @brief Implementation file.
 */
#include "Core/ConfigStore.h"
#include "Core/ErrorCodes.h"
#include "Core/Log.h"
#include <ArduinoJson.h>
#include <ctype.h>
#include <errno.h>
#include <fstream>
#include <sstream>
#include <stdio.h>
#include <stdlib.h>

#define LOG_TAG_CORE "CfgStore"

static bool strEquals(const char* a, const char* b) {
    if (!a || !b) return false;
    return strcmp(a, b) == 0;
}

static bool isMaskedKey(const char* key) {
    if (!key) return false;
    return strcmp(key, "pass") == 0 ||
           strcmp(key, "token") == 0 ||
           strcmp(key, "secret") == 0;
}

static const char* sourceName(ConfigSource s) {
    switch (s) {
        case ConfigSource::Default:     return "default";
        case ConfigSource::File:        return "file";
        case ConfigSource::Environment: return "env";
    }
    return "?";
}

/// Copy `in` without leading/trailing whitespace.
static std::string trimmed(const char* in) {
    if (!in) return std::string();
    const char* b = in;
    while (*b && isspace((unsigned char)*b)) ++b;
    const char* e = b + strlen(b);
    while (e > b && isspace((unsigned char)e[-1])) --e;
    return std::string(b, (size_t)(e - b));
}

bool ConfigStore::parseBoolText(const char* text) {
    std::string v = trimmed(text);
    for (char& c : v) c = (char)tolower((unsigned char)c);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

const ConfigMeta* ConfigStore::find(const char* module, const char* name) const {
    for (uint16_t i = 0; i < _metaCount; ++i) {
        if (strEquals(_meta[i].module, module) && strEquals(_meta[i].name, name)) return &_meta[i];
    }
    return nullptr;
}

ConfigSource ConfigStore::sourceOf(const char* module, const char* name) const {
    const ConfigMeta* m = find(module, name);
    return m ? m->source : ConfigSource::Default;
}

bool ConfigStore::applyText(ConfigMeta& m, const char* text, ConfigSource source) {
    switch (m.type) {
        case ConfigType::Int32: {
            std::string v = trimmed(text);
            char* end = nullptr;
            errno = 0;
            const long parsed = strtol(v.c_str(), &end, 10);
            if (v.empty() || !end || *end != '\0' || errno == ERANGE ||
                parsed < INT32_MIN || parsed > INT32_MAX) {
                Log::warn(LOG_TAG_CORE, "%s.%s: invalid integer '%s' from %s, keeping %ld",
                          m.module, m.name, v.c_str(), sourceName(source), (long)*(int32_t*)m.valuePtr);
                return false;
            }
            *(int32_t*)m.valuePtr = (int32_t)parsed;
            break;
        }
        case ConfigType::Bool:
            *(bool*)m.valuePtr = parseBoolText(text);
            break;
        case ConfigType::CharArray: {
            if (m.size == 0) return false;
            std::string v = trimmed(text);
            if (v.size() >= m.size) {
                Log::warn(LOG_TAG_CORE, "%s.%s: value from %s truncated to %u bytes",
                          m.module, m.name, sourceName(source), (unsigned)(m.size - 1));
                v.resize(m.size - 1);
            }
            memcpy(m.valuePtr, v.c_str(), v.size() + 1);
            break;
        }
    }
    m.source = source;
    Log::debug(LOG_TAG_CORE, "%s.%s set from %s", m.module, m.name, sourceName(source));
    return true;
}

uint16_t ConfigStore::loadEnvironment() {
    uint16_t applied = 0;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        if (!m.envKey) continue;
        const char* raw = getenv(m.envKey);
        if (!raw) continue;
        /// Empty variables behave as unset (container templates often export "").
        if (trimmed(raw).empty()) continue;
        if (applyText(m, raw, ConfigSource::Environment)) ++applied;
    }
    Log::debug(LOG_TAG_CORE, "loadEnvironment: applied=%u", (unsigned)applied);
    return applied;
}

bool ConfigStore::applyJson(const char* json) {
    if (!json) return false;

    DynamicJsonDocument doc(Limits::JsonConfigApplyBuf);
    const DeserializationError err = deserializeJson(doc, json);
    if (err) {
        Log::error(LOG_TAG_CORE, "applyJson: %s (%s)", errorCodeStr(ErrorCode::BadCfgJson), err.c_str());
        return false;
    }
    if (!doc.is<JsonObject>()) {
        Log::error(LOG_TAG_CORE, "applyJson: %s (root is not an object)", errorCodeStr(ErrorCode::BadCfgJson));
        return false;
    }

    JsonObjectConst root = doc.as<JsonObjectConst>();
    for (uint16_t i = 0; i < _metaCount; ++i) {
        ConfigMeta& m = _meta[i];
        JsonVariantConst v = root[m.module][m.name];
        if (v.isNull()) continue;

        switch (m.type) {
        case ConfigType::Int32:
            if (!v.is<int32_t>()) {
                Log::warn(LOG_TAG_CORE, "applyJson: %s.%s expects an integer", m.module, m.name);
                continue;
            }
            *(int32_t*)m.valuePtr = v.as<int32_t>();
            m.source = ConfigSource::File;
            break;
        case ConfigType::Bool:
            if (v.is<bool>()) {
                *(bool*)m.valuePtr = v.as<bool>();
                m.source = ConfigSource::File;
            } else if (v.is<const char*>()) {
                applyText(m, v.as<const char*>(), ConfigSource::File);
            } else {
                Log::warn(LOG_TAG_CORE, "applyJson: %s.%s expects a boolean", m.module, m.name);
            }
            break;
        case ConfigType::CharArray:
            if (!v.is<const char*>()) {
                Log::warn(LOG_TAG_CORE, "applyJson: %s.%s expects a string", m.module, m.name);
                continue;
            }
            applyText(m, v.as<const char*>(), ConfigSource::File);
            break;
        }
    }
    Log::debug(LOG_TAG_CORE, "applyJson: done");
    return true;
}

bool ConfigStore::loadFile(const char* path) {
    if (!path || path[0] == '\0') return false;

    std::ifstream in(path);
    if (!in) {
        Log::error(LOG_TAG_CORE, "%s: cannot open %s", errorCodeStr(ErrorCode::CfgFileUnreadable), path);
        return false;
    }
    std::stringstream ss;
    ss << in.rdbuf();
    Log::info(LOG_TAG_CORE, "applying config file %s", path);
    return applyJson(ss.str().c_str());
}

bool ConfigStore::loadSources() {
    bool ok = true;
    if (!_sourceFile.empty()) ok = loadFile(_sourceFile.c_str());
    loadEnvironment();
    return ok;
}

bool ConfigStore::toJsonModule(const char* module, char* out, size_t outLen, bool* truncated) const
{
    if (truncated) *truncated = false;
    if (!out || outLen == 0) return false;
    out[0] = '\0';
    if (!module || module[0] == '\0') return false;

    StaticJsonDocument<Limits::JsonConfigModuleBuf> doc;
    JsonObject root = doc.to<JsonObject>();

    bool any = false;
    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || strcmp(m.module, module) != 0) continue;

        switch (m.type) {
            case ConfigType::Int32:
                root[m.name] = *(int32_t*)m.valuePtr;
                break;
            case ConfigType::Bool:
                root[m.name] = *(bool*)m.valuePtr;
                break;
            case ConfigType::CharArray:
                if (isMaskedKey(m.name)) {
                    root[m.name] = ((const char*)m.valuePtr)[0] != '\0' ? "***" : "";
                } else {
                    root[m.name] = (const char*)m.valuePtr;
                }
                break;
        }
        any = true;
    }

    if (doc.overflowed()) {
        if (truncated) *truncated = true;
        Log::warn(LOG_TAG_CORE, "toJsonModule: %s does not fit in %u bytes", module, (unsigned)Limits::JsonConfigModuleBuf);
    }
    if (measureJson(doc) >= outLen) {
        if (truncated) *truncated = true;
    }
    serializeJson(doc, out, outLen);
    return any;
}

uint8_t ConfigStore::listModules(const char** out, uint8_t max) const
{
    if (!out || max == 0) return 0;
    uint8_t count = 0;

    for (uint16_t i = 0; i < _metaCount; ++i) {
        const ConfigMeta& m = _meta[i];
        if (!m.module || m.module[0] == '\0') continue;

        bool exists = false;
        for (uint8_t j = 0; j < count; ++j) {
            if (strcmp(out[j], m.module) == 0) { exists = true; break; }
        }
        if (exists) continue;

        if (count < max) {
            out[count++] = m.module;
        } else {
            break;
        }
    }

    return count;
}
