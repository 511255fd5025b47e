#pragma once
/**
 * @file TopicRouter.h
 * @brief Classifies inbound command topics and dispatches them.
 */

#include "Core/Services/Services.h"
#include "Modules/BridgeModule/StatePublisher.h"
#include <stdint.h>
#include <string>

/** @brief Inbound topic shapes under prefix `P`. */
enum class TopicKind : uint8_t {
    Ignored,        ///< outside `P/` or too short
    Device,         ///< `P/<dev>/<anything...>`
    CapabilitySet   ///< `P/<dev>/<comp>/<cap>/set`
};

struct RoutedTopic {
    TopicKind kind = TopicKind::Ignored;
    std::string deviceId;
    std::string component;
    std::string capability;
};

/** @brief Split `topic` against prefix `base` (which may itself contain `/`). */
RoutedTopic classifyTopic(const std::string& base, const char* topic);

/**
 * @brief Translates one inbound message, submits it and forces a state refresh.
 *
 * Runs on the bridge thread, so the refresh shares the poll loop caches without locking.
 */
class TopicRouter {
public:
    TopicRouter(const DeviceApiService* api, StatePublisher& publisher) : _api(api), _publisher(publisher) {}

    /**
     * @return true when a command was submitted. Ignored topics and invalid payloads
     * return false without touching the API.
     */
    bool handle(const std::string& base, const char* topic, const char* payload);

private:
    const DeviceApiService* _api;
    StatePublisher& _publisher;
};
