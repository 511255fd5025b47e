#pragma once
/**
 * @file StatePublisher.h
 * @brief Change-detection gated publishing of device state documents.
 */

#include "Core/Services/Services.h"
#include "Core/StateStore/StateStore.h"
#include "Core/Types/Attribute.h"
#include <stdint.h>
#include <string>

/**
 * @brief Publishes `P/<dev>/state`, per-attribute sub-topics and availability.
 *
 * The full document is compared against the cached fingerprint, which is the
 * same canonical encoding without `updated_at`. Caches are only written after a
 * successful publish and never on a fetch failure.
 */
class StatePublisher {
public:
    using EpochFn = int64_t (*)();

    StatePublisher(StateStore& store, const MqttService* mqtt, const DeviceApiService* api,
                   const HAService* ha);

    /** @brief Override the `updated_at` clock (tests). */
    void setClock(EpochFn fn) { _clock = fn; }

    /**
     * @brief Fetch, flatten and publish one device.
     * @return false when the fetch, parse or full-state publish failed.
     */
    bool publishDeviceState(const std::string& deviceId, bool force);

    /**
     * @brief Canonical state document.
     *
     * Keys: `device_id`, `name`, optional `updated_at`, every `comp.cap.attr`, and
     * `cap.attr` aliases for component `main` when not already present.
     */
    static std::string encodeState(const std::string& deviceId, const std::string& name,
                                   const AttributeMap& attrs, bool withTimestamp, int64_t updatedAt);

private:
    StateStore& _store;
    const MqttService* _mqtt;
    const DeviceApiService* _api;
    const HAService* _ha;
    EpochFn _clock;

    bool publish(const std::string& topic, const std::string& payload, int qos);
    void markOffline(const std::string& base, const std::string& deviceId);
    void markOnline(const std::string& base, const std::string& deviceId);
};
