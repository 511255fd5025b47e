/**
 * @file StateStore.cpp
 * @brief Implementation file.
 */
#include "StateStore.h"

void StateStore::upsertDevice(const DeviceInfo& device)
{
    if (device.deviceId.empty()) return;
    devices_[device.deviceId] = device;
}

const DeviceInfo* StateStore::findDevice(const std::string& deviceId) const
{
    auto it = devices_.find(deviceId);
    return (it == devices_.end()) ? nullptr : &it->second;
}

bool StateStore::fullStateMatches(const std::string& deviceId, const std::string& encoded) const
{
    auto it = fullStates_.find(deviceId);
    return it != fullStates_.end() && it->second == encoded;
}

void StateStore::setFullState(const std::string& deviceId, const std::string& encoded)
{
    fullStates_[deviceId] = encoded;
}

bool StateStore::attributeMatches(const std::string& attrKey, const std::string& encoded) const
{
    auto it = attributes_.find(attrKey);
    return it != attributes_.end() && it->second == encoded;
}

void StateStore::setAttribute(const std::string& attrKey, const std::string& encoded)
{
    attributes_[attrKey] = encoded;
}

bool StateStore::isOnline(const std::string& deviceId) const
{
    return online_.count(deviceId) != 0;
}

void StateStore::setOnline(const std::string& deviceId, bool online)
{
    if (online) online_.insert(deviceId);
    else online_.erase(deviceId);
}

bool StateStore::discoveryPublished(const std::string& objectId) const
{
    return discovery_.count(objectId) != 0;
}

void StateStore::markDiscoveryPublished(const std::string& objectId)
{
    discovery_.insert(objectId);
}

std::string StateStore::attributeKey(const std::string& deviceId, const std::string& component,
                                     const std::string& capability, const std::string& attribute)
{
    std::string key;
    key.reserve(deviceId.size() + component.size() + capability.size() + attribute.size() + 3);
    key += deviceId;
    key += '|';
    key += component;
    key += '|';
    key += capability;
    key += '|';
    key += attribute;
    return key;
}

void StateStore::clear()
{
    devices_.clear();
    fullStates_.clear();
    attributes_.clear();
    discovery_.clear();
    online_.clear();
}
