#pragma once
/**
 * @file MqttTopics.h
 * @brief Standard MQTT topic suffixes and builders shared across modules.
 */

#include <string>

namespace MqttTopics {

/** @brief Full device state document (`<base>/<device>/state`). */
constexpr char SuffixState[] = "state";
/** @brief Device availability marker (`<base>/<device>/availability`). */
constexpr char SuffixAvailability[] = "availability";
/** @brief Command ingress suffix (`<base>/<device>/set`, `<base>/<device>/<comp>/<cap>/set`). */
constexpr char SuffixSet[] = "set";
/** @brief Alternate whole-device command ingress (`<base>/<device>/command`). */
constexpr char SuffixCommand[] = "command";
/** @brief Bridge status, also used as Last Will (`<base>/bridge/status`). */
constexpr char SuffixBridgeStatus[] = "bridge/status";
/** @brief Discovery config leaf (`<discovery>/<domain>/<object>/config`). */
constexpr char SuffixConfig[] = "config";

constexpr char PayloadOnline[] = "online";
constexpr char PayloadOffline[] = "offline";

inline std::string deviceTopic(const std::string& base, const std::string& deviceId, const char* suffix)
{
    return base + "/" + deviceId + "/" + suffix;
}

inline std::string attributeStateTopic(const std::string& base, const std::string& deviceId,
                                       const std::string& component, const std::string& capability,
                                       const std::string& attribute)
{
    return base + "/" + deviceId + "/" + component + "/" + capability + "/" + attribute + "/" + SuffixState;
}

inline std::string capabilitySetTopic(const std::string& base, const std::string& deviceId,
                                      const std::string& component, const std::string& capability)
{
    return base + "/" + deviceId + "/" + component + "/" + capability + "/" + SuffixSet;
}

inline std::string bridgeStatusTopic(const std::string& base)
{
    return base + "/" + SuffixBridgeStatus;
}

inline std::string discoveryConfigTopic(const std::string& discoveryPrefix, const char* domain,
                                        const std::string& objectId)
{
    return discoveryPrefix + "/" + domain + "/" + objectId + "/" + SuffixConfig;
}

}  // namespace MqttTopics
