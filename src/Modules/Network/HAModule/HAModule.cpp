/**
 * @file HAModule.cpp
 * @brief Implementation file.
 */

#include "HAModule.h"
#include "Modules/Network/HAModule/HADiscovery.h"
#include "Core/MqttTopics.h"
#include "Core/SystemLimits.h"
#include <string.h>

#define LOG_TAG "HAModule"
#include "Core/ModuleLog.h"

int HAModule::svcPublishDevice(void* ctx, const DeviceInfo& device, const AttributeMap& attrs)
{
    HAModule* self = static_cast<HAModule*>(ctx);
    return self ? self->publishDevice(device, attrs) : 0;
}

bool HAModule::publishDiscovery(const char* domain, const std::string& objectId, const std::string& payload)
{
    if (!domain || !mqttSvc || !mqttSvc->publish) return false;

    const std::string topic = MqttTopics::discoveryConfigTopic(cfgData.discoveryPrefix, domain, objectId);
    return mqttSvc->publish(mqttSvc->ctx, topic.c_str(), payload.c_str(), 1, true);
}

int HAModule::publishDevice(const DeviceInfo& device, const AttributeMap& attrs)
{
    if (!cfgData.enabled || !store || !mqttSvc) return 0;

    const char* base = mqttSvc->baseTopic ? mqttSvc->baseTopic(mqttSvc->ctx) : "";
    HADiscovery synth(base);

    int sent = 0;
    for (const HAEntity& e : synth.synthesize(device, attrs)) {
        if (store->discoveryPublished(e.objectId)) continue;
        if (!publishDiscovery(e.domain, e.objectId, e.payload)) {
            LOGW("HA discovery publish failed %s/%s", e.domain, e.objectId.c_str());
            continue;
        }
        store->markDiscoveryPublished(e.objectId);
        ++sent;
    }

    if (sent > 0) {
        LOGI("Home Assistant discovery published for %s (%d entities, %u total)",
             device.deviceId.c_str(), sent, (unsigned)store->discoveryCount());
    }
    return sent;
}

void HAModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(enabledVar);
    cfg.registerVar(prefixVar);

    mqttSvc = services.get<MqttService>("mqtt");
    const StateStoreService* ssSvc = services.get<StateStoreService>("statestore");
    store = ssSvc ? ssSvc->store : nullptr;

    haSvc.publishDevice = HAModule::svcPublishDevice;
    haSvc.ctx = this;
    services.add("ha", &haSvc);
}

void HAModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    size_t len = strlen(cfgData.discoveryPrefix);
    while (len > 0 && cfgData.discoveryPrefix[len - 1] == '/') cfgData.discoveryPrefix[--len] = '\0';
    if (cfgData.discoveryPrefix[0] == '\0') {
        snprintf(cfgData.discoveryPrefix, sizeof(cfgData.discoveryPrefix), "%s", "homeassistant");
    }
    LOGI("Home Assistant discovery %s prefix=%s", cfgData.enabled ? "enabled" : "disabled", cfgData.discoveryPrefix);
}
