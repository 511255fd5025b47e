#pragma once
/**
 * @file ServiceRegistry.h
 * @brief Typed service registry for cross-module access.
 */
#include "Core/SystemLimits.h"
#include <stdint.h>
#include <cstring>

/** @brief Raw registry entry. */
struct ServiceEntry {
    const char* id;
    const void* ptr;
};

/**
 * @brief Registry of named services (opaque pointers).
 *
 * Filled during ModuleManager::initAll() from the main thread, read-only afterwards.
 */
class ServiceRegistry {
public:
    /** @brief Register a service pointer under a string id (ids are unique). */
    bool add(const char* id, const void* service);
    /** @brief Fetch a raw service pointer by id. */
    const void* getRaw(const char* id) const;

    /** @brief Fetch a typed service pointer by id. */
    template<typename T>
    const T* get(const char* id) const {
        return reinterpret_cast<const T*>(getRaw(id));
    }

    /** @brief Number of registered services. */
    uint8_t size() const { return count; }

private:
    ServiceEntry entries[Limits::MaxServices]{};
    uint8_t count = 0;
};
