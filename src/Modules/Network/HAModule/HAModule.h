#pragma once
/**
 * @file HAModule.h
 * @brief Home Assistant auto-discovery publisher.
 */

#include "Core/ModulePassive.h"
#include "Core/EnvKeys.h"
#include "Core/Services/Services.h"
#include <stdint.h>
#include <stddef.h>

/**
 * @brief Passive module exposing the `ha` service.
 *
 * Each discovery object id is published at most once per process; the
 * published set lives in the StateStore.
 */
class HAModule : public ModulePassive {
public:
    const char* moduleId() const override { return "ha"; }

    uint8_t dependencyCount() const override { return 2; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "mqtt";
        if (i == 1) return "statestore";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;

    /** @brief Publish the documents not yet sent for this device. Returns how many were sent. */
    int publishDevice(const DeviceInfo& device, const AttributeMap& attrs);

private:
    struct HAConfig {
        bool enabled = true;
        char discoveryPrefix[Limits::Ha::DiscoveryPrefix] = "homeassistant";
    };

    const MqttService* mqttSvc = nullptr;
    StateStore* store = nullptr;

    HAConfig cfgData{};
    HAService haSvc{};

    ConfigVariable<bool> enabledVar {
        EnvKeys::Ha::Enabled,"enabled","ha",ConfigType::Bool,
        &cfgData.enabled,0
    };
    ConfigVariable<char> prefixVar {
        EnvKeys::Ha::DiscoveryPrefix,"discovery_prefix","ha",ConfigType::CharArray,
        (char*)cfgData.discoveryPrefix,sizeof(cfgData.discoveryPrefix)
    };

    bool publishDiscovery(const char* domain, const std::string& objectId, const std::string& payload);

    static int svcPublishDevice(void* ctx, const DeviceInfo& device, const AttributeMap& attrs);
};
