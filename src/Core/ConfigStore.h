#pragma once
/**
 * @file ConfigStore.h
 * @brief Configuration store fed by defaults, an optional JSON file and the environment.
 */

// Precedence (lowest first): compiled defaults, JSON file, environment.
// Sources are applied once by ModuleManager::initAll() after every module
// registered its variables; values are read-only once threads start.

#include <cstdint>
#include <cstring>
#include <string>

#include "ConfigTypes.h"
#include "Core/Log.h"

#ifndef LOG_TAG_CORE
#define LOG_TAG_CORE "CfgStore"
#define LOG_TAG_CORE_LOCAL_DEFINED
#endif

/**
 * @brief Holds config variables and applies JSON/environment sources.
 */
class ConfigStore {
public:
    ConfigStore() = default;

    /** @brief JSON file applied by loadSources() (empty = none). */
    void setSourceFile(const char* path) { _sourceFile = path ? path : ""; }

    /** @brief Register a config variable definition. */
    template<typename T>
    void registerVar(ConfigVariable<T>& var);

    /** @brief Apply the source file (if any) then the environment. */
    bool loadSources();
    /** @brief Read a JSON file and apply it. */
    bool loadFile(const char* path);
    /** @brief Apply environment variables to registered variables that declare a key. */
    uint16_t loadEnvironment();
    /** @brief Apply `{"module":{"name":value}}` JSON to registered variables. */
    bool applyJson(const char* json);

    /** @brief Serialize a single module's config (flat object, secrets masked). */
    bool toJsonModule(const char* module, char* out, size_t outLen, bool* truncated = nullptr) const;
    /** @brief List unique module names present in config metadata. */
    uint8_t listModules(const char** out, uint8_t max) const;
    /** @brief Where a variable's current value came from (Default when unknown). */
    ConfigSource sourceOf(const char* module, const char* name) const;

    /** @brief Accepts 1/true/yes/on (case-insensitive, surrounding spaces ignored). */
    static bool parseBoolText(const char* text);

private:
    ConfigMeta _meta[Limits::MaxConfigVars];
    uint16_t _metaCount = 0;
    std::string _sourceFile;

    const ConfigMeta* find(const char* module, const char* name) const;
    bool applyText(ConfigMeta& m, const char* text, ConfigSource source);
};

// -------------------------
// Template implementation
// -------------------------
template<typename T>
void ConfigStore::registerVar(ConfigVariable<T>& var)
{
    if (_metaCount >= Limits::MaxConfigVars) {
        Log::error(LOG_TAG_CORE, "config table full, dropping %s.%s",
                   var.moduleName ? var.moduleName : "-", var.jsonName ? var.jsonName : "-");
        return;
    }

    ConfigMeta& m = _meta[_metaCount++];

    m.module   = var.moduleName;
    m.name     = var.jsonName;
    m.envKey   = var.envKey;
    m.type     = var.type;
    m.valuePtr = (void*)var.value;
    m.size     = var.size;
    m.source   = ConfigSource::Default;
}

#ifdef LOG_TAG_CORE_LOCAL_DEFINED
#undef LOG_TAG_CORE
#undef LOG_TAG_CORE_LOCAL_DEFINED
#endif
