#pragma once
/**
 * @file EnvKeys.h
 * @brief Centralized environment variable names used by ConfigStore-registered variables.
 */

namespace EnvKeys {

namespace Api {
constexpr char Token[] = "ST_TOKEN"; // Device API bearer credential, required at startup.
constexpr char BaseUrl[] = "ST_API_BASE"; // Device API root URL, trailing `/` stripped.
constexpr char TimeoutS[] = "ST_HTTP_TIMEOUT"; // Per-call HTTP timeout in seconds.
}  // namespace Api

namespace Mqtt {
constexpr char Host[] = "MQTT_HOST"; // Broker host name.
constexpr char Port[] = "MQTT_PORT"; // Broker TCP port.
constexpr char User[] = "MQTT_USER"; // Broker user name, empty disables credentials.
constexpr char Pass[] = "MQTT_PASSWORD"; // Broker password.
constexpr char BaseTopic[] = "MQTT_TOPIC_PREFIX"; // Topic prefix `P`, surrounding `/` stripped.
}  // namespace Mqtt

namespace Bridge {
constexpr char PollIntervalS[] = "POLL_INTERVAL_SECONDS"; // Poll period, floored at Limits::Bridge::MinPollIntervalS.
}  // namespace Bridge

namespace Ha {
constexpr char Enabled[] = "PUBLISH_DISCOVERY"; // 1/true/yes/on enables discovery publishing.
constexpr char DiscoveryPrefix[] = "HA_DISCOVERY_PREFIX"; // Discovery topic root.
}  // namespace Ha

namespace Log {
constexpr char Level[] = "LOG_LEVEL"; // debug|info|warn|error.
}  // namespace Log

}  // namespace EnvKeys
