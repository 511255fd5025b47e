/**
 * @file StatePublisher.cpp
 * @brief Implementation file.
 */

#include "Modules/BridgeModule/StatePublisher.h"
#include "Modules/BridgeModule/AttributeExtractor.h"
#include "Core/Clock.h"
#include "Core/MqttTopics.h"
#include <ArduinoJson.h>
#include <map>
#define LOG_TAG "StatePub"
#include "Core/ModuleLog.h"

StatePublisher::StatePublisher(StateStore& store, const MqttService* mqtt, const DeviceApiService* api,
                               const HAService* ha)
    : _store(store), _mqtt(mqtt), _api(api), _ha(ha), _clock(epochSeconds)
{
}

std::string StatePublisher::encodeState(const std::string& deviceId, const std::string& name,
                                        const AttributeMap& attrs, bool withTimestamp, int64_t updatedAt)
{
    std::map<std::string, std::string> fields;

    {
        StaticJsonDocument<64> tmp;
        std::string enc;
        tmp.set(deviceId.c_str());
        serializeJson(tmp, enc);
        fields["device_id"] = enc;

        enc.clear();
        tmp.set(name.c_str());
        serializeJson(tmp, enc);
        fields["name"] = enc;

        if (withTimestamp) {
            enc.clear();
            tmp.set((long long)updatedAt);
            serializeJson(tmp, enc);
            fields["updated_at"] = enc;
        }
    }

    for (const auto& kv : attrs) fields[kv.first] = kv.second.value.json;

    // `cap.attr` aliases go in after every full key so they never shadow one.
    for (const auto& kv : attrs) {
        const Attribute& a = kv.second;
        if (a.component != "main") continue;
        const std::string legacy = a.capability + "." + a.attribute;
        if (fields.find(legacy) == fields.end()) fields[legacy] = a.value.json;
    }

    size_t cap = JSON_OBJECT_SIZE(fields.size());
    for (const auto& kv : fields) cap += kv.first.size() + kv.second.size() + 2;

    DynamicJsonDocument doc(cap);
    JsonObject root = doc.to<JsonObject>();
    for (const auto& kv : fields) root[kv.first] = serialized(kv.second);

    std::string out;
    serializeJson(doc, out);
    return out;
}

bool StatePublisher::publish(const std::string& topic, const std::string& payload, int qos)
{
    if (!_mqtt || !_mqtt->publish) return false;
    return _mqtt->publish(_mqtt->ctx, topic.c_str(), payload.c_str(), qos, true);
}

void StatePublisher::markOffline(const std::string& base, const std::string& deviceId)
{
    _store.setOnline(deviceId, false);
    const std::string topic = MqttTopics::deviceTopic(base, deviceId, MqttTopics::SuffixAvailability);
    if (!publish(topic, MqttTopics::PayloadOffline, 1)) {
        LOGW("availability offline not published for %s", deviceId.c_str());
    }
}

void StatePublisher::markOnline(const std::string& base, const std::string& deviceId)
{
    const std::string topic = MqttTopics::deviceTopic(base, deviceId, MqttTopics::SuffixAvailability);
    if (!publish(topic, MqttTopics::PayloadOnline, 1)) {
        LOGW("availability online not published for %s", deviceId.c_str());
        return;
    }
    _store.setOnline(deviceId, true);
}

bool StatePublisher::publishDeviceState(const std::string& deviceId, bool force)
{
    if (deviceId.empty() || !_api || !_mqtt) return false;

    const std::string base = _mqtt->baseTopic ? _mqtt->baseTopic(_mqtt->ctx) : "";

    std::string body;
    ApiError apiErr;
    if (!_api->fetchStatus(_api->ctx, deviceId.c_str(), body, &apiErr)) {
        char label[48];
        writeErrorLabel(label, sizeof(label), apiErr.code, apiErr.httpStatus);
        LOGE("Unable to fetch status for %s: %s %s", deviceId.c_str(), label, apiErr.detail.c_str());
        markOffline(base, deviceId);
        return false;
    }

    AttributeMap attrs;
    ErrorCode parseErr = ErrorCode::None;
    if (!extractAttributes(body, attrs, &parseErr)) {
        LOGE("Unable to parse status for %s: %s", deviceId.c_str(), errorCodeStr(parseErr));
        markOffline(base, deviceId);
        return false;
    }

    const DeviceInfo* cached = _store.findDevice(deviceId);
    DeviceInfo device;
    if (cached) device = *cached;
    else device.deviceId = deviceId;
    const std::string& name = device.displayName();

    const std::string fingerprint = encodeState(deviceId, name, attrs, false, 0);
    if (!force && _store.fullStateMatches(deviceId, fingerprint)) {
        if (!_store.isOnline(deviceId)) {
            LOGI("%s back online", deviceId.c_str());
            markOnline(base, deviceId);
        } else {
            LOGD("%s unchanged", deviceId.c_str());
        }
        return true;
    }

    const std::string encoded = encodeState(deviceId, name, attrs, true, _clock ? _clock() : 0);
    if (!publish(MqttTopics::deviceTopic(base, deviceId, MqttTopics::SuffixState), encoded, 0)) {
        LOGW("state publish failed for %s", deviceId.c_str());
        return false;
    }

    uint16_t sent = 0;
    uint16_t failed = 0;
    for (const auto& kv : attrs) {
        const Attribute& a = kv.second;
        const std::string cacheKey = StateStore::attributeKey(deviceId, a.component, a.capability, a.attribute);
        if (!force && _store.attributeMatches(cacheKey, a.value.json)) continue;

        const std::string topic = MqttTopics::attributeStateTopic(base, deviceId, a.component, a.capability, a.attribute);
        if (!publish(topic, a.value.json, 0)) {
            LOGW("attribute publish failed %s", topic.c_str());
            ++failed;
            continue;
        }
        _store.setAttribute(cacheKey, a.value.json);
        ++sent;
    }

    markOnline(base, deviceId);

    // A missed sub-topic keeps the fingerprint stale so the next poll retries it.
    if (failed == 0) _store.setFullState(deviceId, fingerprint);
    LOGD("%s published (%u attributes, %u sub-topics%s)", deviceId.c_str(),
         (unsigned)attrs.size(), (unsigned)sent, force ? ", forced" : "");

    if (_ha && _ha->publishDevice) _ha->publishDevice(_ha->ctx, device, attrs);
    return true;
}
