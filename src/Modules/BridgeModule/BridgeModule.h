#pragma once
/**
 * @file BridgeModule.h
 * @brief Poll loop and inbound command dispatch.
 */
#include "Core/Module.h"
#include "Core/EnvKeys.h"
#include "Core/Services/Services.h"
#include "Modules/BridgeModule/StatePublisher.h"
#include "Modules/BridgeModule/TopicRouter.h"
#include <memory>

/** @brief Bridge configuration values. */
struct BridgeConfig {
    int32_t pollIntervalS = Limits::Bridge::DefaultPollIntervalS;
};

/**
 * @brief Active module owning every cache access.
 *
 * Each loop drains the MQTT RX queue through the TopicRouter, then runs a poll
 * cycle when the interval elapsed and the broker is connected.
 */
class BridgeModule : public Module {
public:
    const char* moduleId() const override { return "bridge"; }
    const char* taskName() const override { return "bridge"; }

    uint8_t dependencyCount() const override { return 4; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "mqtt";
        if (i == 1) return "devapi";
        if (i == 2) return "statestore";
        if (i == 3) return "ha";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Apply the poll interval floor. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void loop() override;

    /** @brief One listing plus one publish per listed device. Returns false when the listing failed. */
    bool pollCycle();
    int32_t pollIntervalS() const { return cfgData.pollIntervalS; }

private:
    BridgeConfig cfgData;

    const MqttService* mqttSvc = nullptr;
    const DeviceApiService* apiSvc = nullptr;
    const HAService* haSvc = nullptr;
    StateStore* store = nullptr;

    std::unique_ptr<StatePublisher> publisher;
    std::unique_ptr<TopicRouter> router;

    MqttRxMessage rxMsg{};
    bool polledOnce = false;
    uint32_t lastPollMs = 0;

    ConfigVariable<int32_t> pollIntervalVar {
        EnvKeys::Bridge::PollIntervalS,"poll_interval_s","bridge",ConfigType::Int32,
        &cfgData.pollIntervalS,0
    };

    /** @brief Route pending inbound messages; the first one may wait `firstWaitMs`. */
    void drainInbound(uint32_t firstWaitMs);
};
