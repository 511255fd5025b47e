#pragma once
/**
 * @file StateStoreModule.h
 * @brief Module that exposes StateStore service.
 */
#include "Core/ModulePassive.h"
#include "Core/StateStore/StateStore.h"
#include "Core/Services/Services.h"

/**
 * @brief Passive module owning the bridge caches.
 */
class StateStoreModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "statestore"; }

    /** @brief StateStore depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    /** @brief Register service. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Log cache sizes and release them. */
    void shutdown() override;

private:
    StateStore _store;
    StateStoreService _svc{ &_store };
};
