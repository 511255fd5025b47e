/**
 * @file MQTTModule.cpp
 * @brief Implementation file.
 */
#include "MQTTModule.h"
#include "Core/Clock.h"
#include "Core/MqttTopics.h"
#include "Core/SystemLimits.h"
#include <chrono>
#include <cstring>
#include <random>
#include <unistd.h>
#define LOG_TAG "MqttModu"
#include "Core/ModuleLog.h"

static uint32_t clampU32(uint32_t v, uint32_t minV, uint32_t maxV) {
    if (v < minV) return minV;
    if (v > maxV) return maxV;
    return v;
}

static uint32_t jitterMs(uint32_t baseMs, uint8_t pct) {
    if (baseMs == 0 || pct == 0) return baseMs;
    static std::mt19937 rng{std::random_device{}()};
    uint32_t span = (baseMs * pct) / 100U;
    uint32_t r = rng();
    uint32_t delta = r % (2U * span + 1U);
    int32_t signedDelta = (int32_t)delta - (int32_t)span;
    int32_t out = (int32_t)baseMs + signedDelta;
    if (out < 0) out = 0;
    return (uint32_t)out;
}

bool MQTTModule::svcPublish(void* ctx, const char* topic, const char* payload, int qos, bool retain)
{
    MQTTModule* self = static_cast<MQTTModule*>(ctx);
    return self ? self->publish(topic, payload, qos, retain) : false;
}

const char* MQTTModule::svcBaseTopic(void* ctx)
{
    MQTTModule* self = static_cast<MQTTModule*>(ctx);
    return self ? self->baseTopic() : "";
}

bool MQTTModule::svcIsConnected(void* ctx)
{
    MQTTModule* self = static_cast<MQTTModule*>(ctx);
    return self ? self->isConnected() : false;
}

bool MQTTModule::svcTakeMessage(void* ctx, MqttRxMessage& out, uint32_t waitMs)
{
    MQTTModule* self = static_cast<MQTTModule*>(ctx);
    return self ? self->rxQ.receive(out, waitMs) : false;
}

void MQTTModule::normalizeBaseTopic(char* topic)
{
    if (!topic) return;
    size_t len = strlen(topic);
    while (len > 0 && topic[len - 1] == '/') topic[--len] = '\0';
    size_t start = 0;
    while (topic[start] == '/') ++start;
    if (start > 0) memmove(topic, topic + start, len - start + 1);
}

void MQTTModule::setState(MQTTState s) {
    state.store(s);
    stateTs = nowMs();
}

void MQTTModule::connectMqtt() {
    if (!client) return;

    mqtt::connect_options opts;
    opts.set_keep_alive_interval(std::chrono::seconds(Limits::Mqtt::Defaults::KeepAliveS));
    opts.set_clean_session(true);
    opts.set_connect_timeout(std::chrono::milliseconds(Limits::Mqtt::Timing::ConnectTimeoutMs));
    if (cfgData.user[0] != '\0') {
        opts.set_user_name(cfgData.user);
        opts.set_password(cfgData.pass);
    }
    opts.set_will(mqtt::will_options(topicStatus, std::string(MqttTopics::PayloadOffline), 1, true));

    setState(MQTTState::Connecting);
    LOGI("Connecting to %s:%ld", cfgData.host, (long)cfgData.port);

    _connectionLost.store(false);
    try {
        mqtt::token_ptr tok = client->connect(opts);
        if (!tok->wait_for(std::chrono::milliseconds(Limits::Mqtt::Timing::ConnectTimeoutMs))) {
            LOGW("Connect timeout");
            setState(MQTTState::ErrorWait);
            return;
        }
    } catch (const mqtt::exception& e) {
        LOGW("Connect failed: %s", e.what());
        setState(MQTTState::ErrorWait);
        return;
    }

    onConnect();
}

void MQTTModule::onConnect() {
    const std::string base(cfgData.baseTopic);
    const std::string subs[] = {
        base + "/+/" + MqttTopics::SuffixSet,
        base + "/+/" + MqttTopics::SuffixCommand,
        base + "/+/+/+/" + MqttTopics::SuffixSet
    };

    try {
        for (const std::string& t : subs) {
            client->subscribe(t, 1)->wait_for(std::chrono::milliseconds(Limits::Mqtt::Timing::ConnectTimeoutMs));
            LOGI("Subscribed %s", t.c_str());
        }
    } catch (const mqtt::exception& e) {
        LOGW("Subscribe failed: %s", e.what());
        setState(MQTTState::ErrorWait);
        return;
    }

    _retryCount = 0;
    _retryDelayMs = Limits::Mqtt::Backoff::MinMs;
    setState(MQTTState::Connected);

    if (!publish(topicStatus.c_str(), MqttTopics::PayloadOnline, 1, true)) {
        LOGW("bridge status publish failed");
    }
}

void MQTTModule::onDisconnect(const std::string& cause) {
    LOGW("Disconnected%s%s", cause.empty() ? "" : ": ", cause.c_str());
    _connectionLost.store(true);
}

void MQTTModule::onMessage(const std::string& topic, const std::string& payload) {
    const size_t topicCap = sizeof(MqttRxMessage{}.topic);
    const size_t payloadCap = sizeof(MqttRxMessage{}.payload);
    if (topic.size() >= topicCap || payload.size() >= payloadCap) {
        uint32_t n = ++oversizeDropCount_;
        LOGW("rx oversize drop topic=%s len=%u total=%lu",
             topic.c_str(), (unsigned)payload.size(), (unsigned long)n);
        return;
    }

    MqttRxMessage m{};
    memcpy(m.topic, topic.data(), topic.size());
    m.topic[topic.size()] = '\0';
    memcpy(m.payload, payload.data(), payload.size());
    m.payload[payload.size()] = '\0';

    if (!rxQ.send(m)) {
        uint32_t n = ++rxDropCount_;
        LOGW("rx queue full, dropped %s total=%lu", m.topic, (unsigned long)n);
    }
}

bool MQTTModule::publish(const char* topic, const char* payload, int qos, bool retain)
{
    if (!topic || !payload) return false;
    if (!client || state.load() != MQTTState::Connected) {
        LOGD("%s: drop %s", errorCodeStr(ErrorCode::MqttNotConnected), topic);
        return false;
    }
    try {
        client->publish(std::string(topic), payload, strlen(payload), qos, retain);
    } catch (const mqtt::exception& e) {
        LOGW("%s topic=%s qos=%d retain=%d: %s", errorCodeStr(ErrorCode::MqttPublishFailed),
             topic, qos, retain ? 1 : 0, e.what());
        return false;
    }
    LOGD("MQTT TX t=%s r=%d %s", topic, retain ? 1 : 0, payload);
    return true;
}

void MQTTModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(hostVar);
    cfg.registerVar(portVar);
    cfg.registerVar(userVar);
    cfg.registerVar(passVar);
    cfg.registerVar(baseTopicVar);

    rxQ.setCapacity(Limits::Mqtt::Capacity::RxQueueLen);
    rxDropCount_ = 0;
    oversizeDropCount_ = 0;

    mqttSvc.publish = MQTTModule::svcPublish;
    mqttSvc.baseTopic = MQTTModule::svcBaseTopic;
    mqttSvc.isConnected = MQTTModule::svcIsConnected;
    mqttSvc.takeMessage = MQTTModule::svcTakeMessage;
    mqttSvc.ctx = this;
    services.add("mqtt", &mqttSvc);

    snprintf(clientId, sizeof(clientId), "stbridge-%ld", (long)getpid());
}

void MQTTModule::onConfigLoaded(ConfigStore&, ServiceRegistry&) {
    normalizeBaseTopic(cfgData.baseTopic);
    if (cfgData.baseTopic[0] == '\0') {
        LOGW("empty topic prefix, using smartthings");
        snprintf(cfgData.baseTopic, sizeof(cfgData.baseTopic), "%s", "smartthings");
    }
    topicStatus = MqttTopics::bridgeStatusTopic(cfgData.baseTopic);

    char uri[Limits::Mqtt::Buffers::Host + 16];
    snprintf(uri, sizeof(uri), "tcp://%s:%ld", cfgData.host, (long)cfgData.port);

    client = std::make_unique<mqtt::async_client>(std::string(uri), std::string(clientId));
    client->set_connection_lost_handler([this](const std::string& cause) { this->onDisconnect(cause); });
    client->set_message_callback([this](mqtt::const_message_ptr msg) {
        if (msg) this->onMessage(msg->get_topic(), msg->get_payload_str());
    });

    _retryCount = 0;
    _retryDelayMs = Limits::Mqtt::Backoff::MinMs;
    setState(MQTTState::Idle);

    LOGI("Init id=%s uri=%s prefix=%s", clientId, uri, cfgData.baseTopic);
}

void MQTTModule::loop() {
    switch (state.load()) {
    case MQTTState::Idle:
        connectMqtt();
        break;
    case MQTTState::Connecting:
        if (nowMs() - stateTs > Limits::Mqtt::Timing::ConnectTimeoutMs) {
            LOGW("Connect timeout");
            setState(MQTTState::ErrorWait);
        }
        break;
    case MQTTState::Connected:
        if (_connectionLost.load() || !client->is_connected()) {
            setState(MQTTState::ErrorWait);
        }
        break;
    case MQTTState::ErrorWait:
        if (nowMs() - stateTs >= _retryDelayMs) {
            _retryCount++;
            uint32_t next = _retryDelayMs;

            if      (next < Limits::Mqtt::Backoff::Step1Ms)   next = Limits::Mqtt::Backoff::Step1Ms;
            else if (next < Limits::Mqtt::Backoff::Step2Ms)   next = Limits::Mqtt::Backoff::Step2Ms;
            else if (next < Limits::Mqtt::Backoff::Step3Ms)   next = Limits::Mqtt::Backoff::Step3Ms;
            else if (next < Limits::Mqtt::Backoff::Step4Ms)   next = Limits::Mqtt::Backoff::Step4Ms;
            else                                               next = Limits::Mqtt::Backoff::MaxMs;

            next = clampU32(next, Limits::Mqtt::Backoff::MinMs, Limits::Mqtt::Backoff::MaxMs);
            _retryDelayMs = jitterMs(next, Limits::Mqtt::Backoff::JitterPct);
            LOGI("Reconnect attempt %u (next backoff %lums)", (unsigned)_retryCount, (unsigned long)_retryDelayMs);
            connectMqtt();
        }
        break;
    }
}

void MQTTModule::shutdown() {
    rxQ.wakeAll();
    if (!client) return;

    const auto wait = std::chrono::milliseconds(Limits::Mqtt::Timing::ShutdownWaitMs);
    try {
        if (client->is_connected()) {
            mqtt::delivery_token_ptr tok = client->publish(topicStatus, MqttTopics::PayloadOffline,
                                                           strlen(MqttTopics::PayloadOffline), 1, true);
            if (!tok->wait_for(wait)) LOGW("bridge offline publish not acknowledged");
            client->disconnect()->wait_for(wait);
        }
    } catch (const mqtt::exception& e) {
        LOGW("shutdown: %s", e.what());
    }
    setState(MQTTState::Idle);
    LOGI("Stopped (rx drops=%lu oversize=%lu)",
         (unsigned long)rxDropCount_.load(), (unsigned long)oversizeDropCount_.load());
}
