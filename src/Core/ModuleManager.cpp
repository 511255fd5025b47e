/**
 * @file ModuleManager.cpp
 * @brief Implementation file.
 */
#include "ModuleManager.h"
#include "Core/Log.h"
#include <cstring>

#define LOG_TAG_CORE "ModManag"

bool ModuleManager::add(Module* m) {
    if (!m || count >= Limits::MaxModules) {
        Log::error(LOG_TAG_CORE, "add rejected: %s (count=%u)", m ? m->moduleId() : "(null)", (unsigned)count);
        return false;
    }
    modules[count++] = m;
    return true;
}

Module* ModuleManager::findById(const char* id) {
    for (uint8_t i = 0; i < count; ++i)
        if (strcmp(modules[i]->moduleId(), id) == 0) return modules[i];
    return nullptr;
}

bool ModuleManager::buildInitOrder() {
    Log::debug(LOG_TAG_CORE, "buildInitOrder: count=%u", (unsigned)count);
    /// Kahn topo-sort
    bool placed[Limits::MaxModules] = {false};
    orderedCount = 0;

    for (uint8_t pass = 0; pass < count; ++pass) {
        bool progress = false;

        for (uint8_t i = 0; i < count; ++i) {
            Module* m = modules[i];
            if (!m || placed[i]) continue;

            bool depsOk = true;
            const uint8_t depCount = m->dependencyCount();

            for (uint8_t d = 0; d < depCount; ++d) {
                const char* depId = m->dependency(d);
                if (!depId) continue;

                Module* dep = findById(depId);
                if (!dep) {
                    Log::error(LOG_TAG_CORE, "missing dependency: module=%s requires=%s",
                               m->moduleId(), depId);
                    return false;
                }

                bool depPlaced = false;
                for (uint8_t j = 0; j < count; ++j) {
                    if (modules[j] == dep) {
                        depPlaced = placed[j];
                        break;
                    }
                }

                if (!depPlaced) {
                    depsOk = false;
                    break;
                }
            }

            if (depsOk) {
                ordered[orderedCount++] = m;
                placed[i] = true;
                progress = true;
            }
        }

        if (orderedCount == count) break;

        if (!progress) {
            for (uint8_t i = 0; i < count; ++i) {
                if (modules[i] && !placed[i]) {
                    Log::error(LOG_TAG_CORE, "not placed: %s", modules[i]->moduleId());
                }
            }
            Log::error(LOG_TAG_CORE, "cyclic or unresolved deps detected");
            return false;
        }
    }

    Log::debug(LOG_TAG_CORE, "buildInitOrder: success (ordered=%u)", (unsigned)orderedCount);
    return orderedCount == count;
}

bool ModuleManager::initAll(ConfigStore& cfg, ServiceRegistry& services) {
    Log::debug(LOG_TAG_CORE, "initAll: moduleCount=%u", (unsigned)count);

    if (!buildInitOrder()) return false;

    for (uint8_t i = 0; i < orderedCount; ++i) {
        Log::debug(LOG_TAG_CORE, "init: %s", ordered[i]->moduleId());
        ordered[i]->init(cfg, services);
    }

    /// Apply file + environment after all modules registered their variables.
    const bool cfgOk = cfg.loadSources();

    for (uint8_t i = 0; i < orderedCount; ++i) {
        ordered[i]->onConfigLoaded(cfg, services);
    }

    Log::debug(LOG_TAG_CORE, "initAll: done (config %s)", cfgOk ? "ok" : "partial");
    return true;
}

void ModuleManager::startAll() {
    for (uint8_t i = 0; i < orderedCount; ++i) {
        if (!ordered[i]->hasTask()) continue;
        Log::debug(LOG_TAG_CORE, "startTask: %s", ordered[i]->moduleId());
        ordered[i]->startTask();
    }
}

void ModuleManager::stopAll() {
    if (stopped) return;
    stopped = true;

    for (uint8_t i = orderedCount; i > 0; --i) {
        Module* m = ordered[i - 1];
        if (!m->hasTask()) continue;
        Log::debug(LOG_TAG_CORE, "stopTask: %s", m->moduleId());
        m->stopTask();
    }
    for (uint8_t i = orderedCount; i > 0; --i) {
        ordered[i - 1]->shutdown();
    }
}
