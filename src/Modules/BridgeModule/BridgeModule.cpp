/**
 * @file BridgeModule.cpp
 * @brief Implementation file.
 */
#include "BridgeModule.h"
#include "Core/Clock.h"
#include "Core/SystemLimits.h"
#include <string>
#include <vector>
#define LOG_TAG "BridgeMd"
#include "Core/ModuleLog.h"

void BridgeModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(pollIntervalVar);

    mqttSvc = services.get<MqttService>("mqtt");
    apiSvc = services.get<DeviceApiService>("devapi");
    haSvc = services.get<HAService>("ha");
    const StateStoreService* ssSvc = services.get<StateStoreService>("statestore");
    store = ssSvc ? ssSvc->store : nullptr;

    if (!mqttSvc || !apiSvc || !store) {
        LOGE("missing services mqtt=%d devapi=%d statestore=%d", mqttSvc ? 1 : 0, apiSvc ? 1 : 0, store ? 1 : 0);
        return;
    }

    publisher = std::make_unique<StatePublisher>(*store, mqttSvc, apiSvc, haSvc);
    router = std::make_unique<TopicRouter>(apiSvc, *publisher);
}

void BridgeModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    if (cfgData.pollIntervalS < Limits::Bridge::MinPollIntervalS) {
        LOGW("poll interval %lds below floor, using %lds",
             (long)cfgData.pollIntervalS, (long)Limits::Bridge::MinPollIntervalS);
        cfgData.pollIntervalS = Limits::Bridge::MinPollIntervalS;
    } else if (cfgData.pollIntervalS > Limits::Bridge::MaxPollIntervalS) {
        LOGW("poll interval %lds above ceiling, using %lds",
             (long)cfgData.pollIntervalS, (long)Limits::Bridge::MaxPollIntervalS);
        cfgData.pollIntervalS = Limits::Bridge::MaxPollIntervalS;
    }
    LOGI("poll interval=%lds", (long)cfgData.pollIntervalS);
}

void BridgeModule::drainInbound(uint32_t firstWaitMs)
{
    if (!mqttSvc || !mqttSvc->takeMessage || !router) return;

    uint32_t waitMs = firstWaitMs;
    while (!stopRequested() && mqttSvc->takeMessage(mqttSvc->ctx, rxMsg, waitMs)) {
        const std::string base = mqttSvc->baseTopic ? mqttSvc->baseTopic(mqttSvc->ctx) : "";
        router->handle(base, rxMsg.topic, rxMsg.payload);
        waitMs = 0;
    }
}

bool BridgeModule::pollCycle()
{
    if (!apiSvc || !publisher || !store) return false;

    if (!polledOnce) LOGI("Validating device API access");

    std::vector<DeviceInfo> devices;
    ApiError err;
    if (!apiSvc->listDevices(apiSvc->ctx, devices, &err)) {
        char label[48];
        writeErrorLabel(label, sizeof(label), err.code, err.httpStatus);
        LOGE("Device poll failed: %s %s", label, err.detail.c_str());
        return false;
    }

    if (!polledOnce) LOGI("Found %u devices", (unsigned)devices.size());
    else LOGD("listed %u devices", (unsigned)devices.size());

    for (const DeviceInfo& d : devices) store->upsertDevice(d);

    for (const DeviceInfo& d : devices) {
        if (stopRequested()) break;
        publisher->publishDeviceState(d.deviceId, false);
        drainInbound(0);
    }
    return true;
}

void BridgeModule::loop()
{
    drainInbound(Limits::Bridge::RxWaitMs);

    if (!mqttSvc || !mqttSvc->isConnected || !mqttSvc->isConnected(mqttSvc->ctx)) return;

    const uint32_t intervalMs = (uint32_t)cfgData.pollIntervalS * 1000U;
    if (polledOnce && (uint32_t)(nowMs() - lastPollMs) < intervalMs) return;

    pollCycle();
    polledOnce = true;
    lastPollMs = nowMs();
}
