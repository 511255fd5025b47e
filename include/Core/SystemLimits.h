#pragma once

#include <stddef.h>
#include <stdint.h>

/**
 * @file SystemLimits.h
 * @brief Shared compile-time limits used across Core and modules.
 */

namespace Limits {

/** @brief Maximum number of modules handled by `ModuleManager`. */
constexpr size_t MaxModules = 16;
/** @brief Maximum number of entries in `ServiceRegistry`. */
constexpr uint8_t MaxServices = 16;
/** @brief Maximum number of registered config variables in `ConfigStore` metadata table. */
constexpr size_t MaxConfigVars = 64;
/** @brief JSON capacity for `ConfigStore::applyJson` root document (covers a full config file). */
constexpr size_t JsonConfigApplyBuf = 4096;
/** @brief JSON capacity used by `ConfigStore::toJsonModule`. */
constexpr size_t JsonConfigModuleBuf = 1024;
/** @brief Log queue length used by `LogHub` (`LogHubModule::init`). */
constexpr size_t LogQueueLen = 256;
/** @brief Maximum number of sinks held by `LogSinkRegistry`. */
constexpr int MaxLogSinks = 4;
/** @brief Dispatcher wait in ms on an empty log queue before re-checking the stop flag. */
constexpr uint32_t LogDispatchWaitMs = 200;
/** @brief Default delay in ms between two `Module::loop` calls. */
constexpr uint32_t ModuleLoopDelayMs = 10;

/** @brief Sizing for ArduinoJson documents built from untrusted network payloads. */
namespace Json {
/** @brief Fixed slack added to every dynamic document. */
constexpr size_t DocSlack = 4096;
/** @brief Multiplier applied to input length (slots + copied strings). */
constexpr size_t DocFactor = 4;

/** @brief Capacity for a document parsed from `len` bytes of text. */
constexpr size_t capacityFor(size_t len) { return len * DocFactor + DocSlack; }
}  // namespace Json

/** @brief MQTT-specific limits grouped by concern to keep `SystemLimits` readable. */
namespace Mqtt {

/** @brief MQTT static capacities (queues). */
namespace Capacity {
/** @brief RX queue length for inbound MQTT messages in `MQTTModule`. */
constexpr size_t RxQueueLen = 64;
}  // namespace Capacity

/** @brief MQTT default configuration values. */
namespace Defaults {
/** @brief Default MQTT broker port used by `MQTTConfig::port` in `MQTTModule`. */
constexpr int32_t Port = 1883;
/** @brief Keep-alive interval in seconds announced at connect. */
constexpr int KeepAliveS = 60;
}  // namespace Defaults

/** @brief MQTT string/payload buffer sizes. */
namespace Buffers {
/** @brief MQTT config buffer length for `MQTTConfig::host` in `MQTTModule`. */
constexpr size_t Host = 128;
/** @brief MQTT config buffer length for `MQTTConfig::user` in `MQTTModule`. */
constexpr size_t User = 64;
/** @brief MQTT config buffer length for `MQTTConfig::pass` in `MQTTModule`. */
constexpr size_t Pass = 128;
/** @brief MQTT config buffer length for `MQTTConfig::baseTopic` in `MQTTModule`. */
constexpr size_t BaseTopic = 64;
/** @brief MQTT client identifier buffer length (`stbridge-<pid>`). */
constexpr size_t ClientId = 48;
/** @brief RX topic buffer length inside `MqttRxMessage`. */
constexpr size_t RxTopic = 256;
/** @brief RX payload buffer length inside `MqttRxMessage`. */
constexpr size_t RxPayload = 2048;
}  // namespace Buffers

/** @brief MQTT timing constants (runtime behavior). */
namespace Timing {
/** @brief MQTT connection timeout in ms before forcing reconnect in `MQTTModule::loop`. */
constexpr uint32_t ConnectTimeoutMs = 10000;
/** @brief Main MQTT loop delay in ms (`MQTTModule::loop`). */
constexpr uint32_t LoopDelayMs = 50;
/** @brief Maximum wait in ms for the final bridge status publish and disconnect on shutdown. */
constexpr uint32_t ShutdownWaitMs = 2000;
}  // namespace Timing

/** @brief MQTT reconnect backoff profile. */
namespace Backoff {
/** @brief Minimum MQTT reconnect backoff in ms (`MQTTModule` error-wait state). */
constexpr uint32_t MinMs = 2000;
/** @brief MQTT reconnect backoff step #1 threshold in ms. */
constexpr uint32_t Step1Ms = 5000;
/** @brief MQTT reconnect backoff step #2 threshold in ms. */
constexpr uint32_t Step2Ms = 10000;
/** @brief MQTT reconnect backoff step #3 threshold in ms. */
constexpr uint32_t Step3Ms = 30000;
/** @brief MQTT reconnect backoff step #4 threshold in ms. */
constexpr uint32_t Step4Ms = 60000;
/** @brief Maximum MQTT reconnect backoff in ms. */
constexpr uint32_t MaxMs = 300000;
/** @brief Random jitter percentage applied to MQTT reconnect backoff delay. */
constexpr uint8_t JitterPct = 15;
}  // namespace Backoff

}  // namespace Mqtt

/** @brief Device REST API client limits. */
namespace Api {
namespace Buffers {
/** @brief Bearer token buffer length in `DeviceApiConfig::token`. */
constexpr size_t Token = 512;
/** @brief Base URL buffer length in `DeviceApiConfig::baseUrl`. */
constexpr size_t BaseUrl = 256;
}  // namespace Buffers
/** @brief Default per-call timeout in seconds. */
constexpr int32_t DefaultTimeoutS = 20;
/** @brief Upper bound on followed `_links.next` pages for one device listing. */
constexpr uint8_t MaxPages = 32;
/** @brief Response body bytes kept in `ApiError::detail` for diagnostics. */
constexpr size_t ErrorBodyMax = 512;
}  // namespace Api

/** @brief Poll loop limits (`BridgeModule`). */
namespace Bridge {
/** @brief Default poll interval in seconds. */
constexpr int32_t DefaultPollIntervalS = 30;
/** @brief Floor applied to the configured poll interval. */
constexpr int32_t MinPollIntervalS = 5;
/** @brief Ceiling applied to the configured poll interval (fits 32-bit ms ticks). */
constexpr int32_t MaxPollIntervalS = 86400;
/** @brief Maximum wait in ms on the MQTT RX queue per loop iteration. */
constexpr uint32_t RxWaitMs = 200;
}  // namespace Bridge

/** @brief Home Assistant auto-discovery limits. */
namespace Ha {
/** @brief Discovery prefix buffer length in `HAConfig::discoveryPrefix`. */
constexpr size_t DiscoveryPrefix = 64;
/** @brief Base JSON capacity of one discovery document (before select options). */
constexpr size_t PayloadDocBase = 3072;
}  // namespace Ha

}  // namespace Limits
