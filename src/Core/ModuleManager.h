#pragma once
/**
 * @file ModuleManager.h
 * @brief Dependency ordering, initialization and shutdown for modules.
 */
#include "Module.h"

/**
 * @brief Registers modules, resolves dependencies, and starts/stops threads.
 */
class ModuleManager {
public:
    /** @brief Add a module to the manager. */
    bool add(Module* m);
    /** @brief Initialize all modules in dependency order, then load config sources. */
    bool initAll(ConfigStore& cfg, ServiceRegistry& services);
    /** @brief Start the thread of every active module, in init order. */
    void startAll();
    /** @brief Stop threads in reverse init order, then call shutdown() on every module. */
    void stopAll();

    /** @brief Current module count. */
    uint8_t getCount() const { return count; }
    /** @brief Get a module by index. */
    Module* getModule(uint8_t idx) const {
        if (idx >= count) return nullptr;
        return modules[idx];
    }

private:
    Module* modules[Limits::MaxModules] = {};
    uint8_t count = 0;

    Module* ordered[Limits::MaxModules] = {};
    uint8_t orderedCount = 0;
    bool stopped = false;

    Module* findById(const char* id);
    bool buildInitOrder();
};
