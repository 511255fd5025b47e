#pragma once
/**
 * @file ConfigTypes.h
 * @brief Shared configuration types and metadata.
 */
#include <stdint.h>
#include <stddef.h>
#include "Core/SystemLimits.h"

/** @brief Supported config value types. */
enum class ConfigType : uint8_t {
    Int32,
    Bool,
    CharArray
};

/** @brief Where the current value of a variable came from. */
enum class ConfigSource : uint8_t { Default, File, Environment };

/** @brief Declares a config variable bound to module-owned storage. */
template<typename T>
struct ConfigVariable {
    const char* envKey;      ///< environment variable name, nullptr when not env-settable
    const char* jsonName;
    const char* moduleName;
    ConfigType type;
    T* value;
    uint16_t size; // for char[]
};

/** @brief Internal metadata for registered variables. */
struct ConfigMeta {
    const char* module;
    const char* name;
    const char* envKey;
    ConfigType type;
    void* valuePtr;
    uint16_t size;
    ConfigSource source = ConfigSource::Default;
};
