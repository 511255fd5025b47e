#pragma once
/**
 * @file StateStore.h
 * @brief Process-lifetime caches shared by the poll loop and command routing.
 */
#include "Core/Types/DeviceInfo.h"
#include <map>
#include <set>
#include <string>

/**
 * @brief Owns the device cache, last encodings, availability and the discovery-published set.
 *
 * Not synchronized: every accessor must be called from the bridge thread.
 * Entries are never evicted; clear() is the only reset path.
 */
class StateStore {
public:
    /** @brief Insert or replace a device record. */
    void upsertDevice(const DeviceInfo& device);
    /** @brief Cached device record, or nullptr. */
    const DeviceInfo* findDevice(const std::string& deviceId) const;
    size_t deviceCount() const { return devices_.size(); }

    /** @brief True when `encoded` equals the last full state stored for the device. */
    bool fullStateMatches(const std::string& deviceId, const std::string& encoded) const;
    void setFullState(const std::string& deviceId, const std::string& encoded);

    /** @brief True when `encoded` equals the last value stored under `attrKey`. */
    bool attributeMatches(const std::string& attrKey, const std::string& encoded) const;
    void setAttribute(const std::string& attrKey, const std::string& encoded);
    size_t attributeCount() const { return attributes_.size(); }

    /** @brief True when the last availability delivered for the device was `online`. */
    bool isOnline(const std::string& deviceId) const;
    void setOnline(const std::string& deviceId, bool online);

    bool discoveryPublished(const std::string& objectId) const;
    void markDiscoveryPublished(const std::string& objectId);
    size_t discoveryCount() const { return discovery_.size(); }

    /** @brief `device|component|capability|attribute` */
    static std::string attributeKey(const std::string& deviceId, const std::string& component,
                                    const std::string& capability, const std::string& attribute);

    void clear();

private:
    std::map<std::string, DeviceInfo> devices_;
    std::map<std::string, std::string> fullStates_;
    std::map<std::string, std::string> attributes_;
    std::set<std::string> discovery_;
    std::set<std::string> online_;
};
