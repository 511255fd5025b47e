#pragma once
/**
 * @file IMqtt.h
 * @brief MQTT service interface.
 */

#include "Core/SystemLimits.h"
#include <stddef.h>
#include <stdint.h>

/** @brief Inbound message copied out of the transport callback. */
struct MqttRxMessage {
    char topic[Limits::Mqtt::Buffers::RxTopic];
    char payload[Limits::Mqtt::Buffers::RxPayload];
};

/** @brief Service wrapper for publishing and inbound consumption via MQTTModule. */
struct MqttService {
    bool (*publish)(void* ctx, const char* topic, const char* payload, int qos, bool retain);
    /** @brief Topic prefix `P` (no leading/trailing `/`). */
    const char* (*baseTopic)(void* ctx);
    bool (*isConnected)(void* ctx);
    /** @brief Pop one inbound message, waiting up to waitMs. */
    bool (*takeMessage)(void* ctx, MqttRxMessage& out, uint32_t waitMs);
    void* ctx;
};
