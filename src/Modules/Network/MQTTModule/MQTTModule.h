#pragma once
/**
 * @file MQTTModule.h
 * @brief MQTT client module.
 */
#include "Core/Module.h"
#include "Core/BoundedQueue.h"
#include "Core/EnvKeys.h"
#include "Core/Services/Services.h"
#include <mqtt/async_client.h>
#include <atomic>
#include <memory>
#include <string>

/** @brief MQTT configuration values. */
struct MQTTConfig {
    char host[Limits::Mqtt::Buffers::Host] = "core-mosquitto";
    int32_t port = Limits::Mqtt::Defaults::Port;
    char user[Limits::Mqtt::Buffers::User] = "";
    char pass[Limits::Mqtt::Buffers::Pass] = "";
    char baseTopic[Limits::Mqtt::Buffers::BaseTopic] = "smartthings";
};

/** @brief MQTT connection state. */
enum class MQTTState : uint8_t { Idle, Connecting, Connected, ErrorWait };

/**
 * @brief Active module that manages the broker connection.
 *
 * The loop thread owns connect, subscribe and reconnect. Inbound messages are
 * copied into a bounded queue that the bridge drains through MqttService::takeMessage.
 */
class MQTTModule : public Module {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "mqtt"; }
    /** @brief Task name. */
    const char* taskName() const override { return "mqtt"; }

    /** @brief MQTT depends on log hub only. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    /** @brief Register config and the `mqtt` service. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Normalize the topic prefix and create the client. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Connection state machine. */
    void loop() override;
    /** @brief Publish bridge offline and disconnect. */
    void shutdown() override;
    uint32_t loopDelayMs() const override { return Limits::Mqtt::Timing::LoopDelayMs; }

    bool publish(const char* topic, const char* payload, int qos = 0, bool retain = false);
    bool isConnected() const { return state.load() == MQTTState::Connected; }
    const char* baseTopic() const { return cfgData.baseTopic; }

    /** @brief Strip leading and trailing `/` in place. */
    static void normalizeBaseTopic(char* topic);

private:
    MQTTConfig cfgData;
    std::atomic<MQTTState> state{MQTTState::Idle};
    uint32_t stateTs = 0;

    std::unique_ptr<mqtt::async_client> client;
    std::atomic<bool> _connectionLost{false};

    char clientId[Limits::Mqtt::Buffers::ClientId] = {0};
    std::string topicStatus;

    BoundedQueue<MqttRxMessage> rxQ;
    std::atomic<uint32_t> rxDropCount_{0};
    std::atomic<uint32_t> oversizeDropCount_{0};

    MqttService mqttSvc{ nullptr, nullptr, nullptr, nullptr, nullptr };

    ConfigVariable<char> hostVar {
        EnvKeys::Mqtt::Host,"host","mqtt",ConfigType::CharArray,
        (char*)cfgData.host,sizeof(cfgData.host)
    };
    ConfigVariable<int32_t> portVar {
        EnvKeys::Mqtt::Port,"port","mqtt",ConfigType::Int32,
        &cfgData.port,0
    };
    ConfigVariable<char> userVar {
        EnvKeys::Mqtt::User,"user","mqtt",ConfigType::CharArray,
        (char*)cfgData.user,sizeof(cfgData.user)
    };
    ConfigVariable<char> passVar {
        EnvKeys::Mqtt::Pass,"pass","mqtt",ConfigType::CharArray,
        (char*)cfgData.pass,sizeof(cfgData.pass)
    };
    ConfigVariable<char> baseTopicVar {
        EnvKeys::Mqtt::BaseTopic,"prefix","mqtt",ConfigType::CharArray,
        (char*)cfgData.baseTopic,sizeof(cfgData.baseTopic)
    };

    void setState(MQTTState s);
    void connectMqtt();
    void onConnect();
    void onDisconnect(const std::string& cause);
    void onMessage(const std::string& topic, const std::string& payload);

    static bool svcPublish(void* ctx, const char* topic, const char* payload, int qos, bool retain);
    static const char* svcBaseTopic(void* ctx);
    static bool svcIsConnected(void* ctx);
    static bool svcTakeMessage(void* ctx, MqttRxMessage& out, uint32_t waitMs);

    // ---- retry backoff ----
    uint8_t _retryCount = 0;
    uint32_t _retryDelayMs = Limits::Mqtt::Backoff::MinMs;
};
