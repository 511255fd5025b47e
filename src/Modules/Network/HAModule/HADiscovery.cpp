/**
 * @file HADiscovery.cpp
 * @brief Implementation file.
 */

#include "Modules/Network/HAModule/HADiscovery.h"
#include "Core/MqttTopics.h"
#include "Core/SystemLimits.h"
#include <ArduinoJson.h>
#include <ctype.h>
#include <set>
#include <string.h>

static const HAKnownSwitch kKnownSwitches[] = {
    {"switch",    "switch", "on",   "off",    "on",    "off",     "Power"},
    {"audioMute", "mute",   "mute", "unmute", "muted", "unmuted", "Mute"},
};

static const HAKnownNumber kKnownNumbers[] = {
    {"audioVolume", "volume", "Volume", "setVolume", 0, 100, 1},
    {"switchLevel", "level",  "Level",  "setLevel",  0, 100, 1},
};

static const HAKnownSelect kKnownSelects[] = {
    {"mediaInputSource",           "inputSource", "supportedInputSources", "Input Source", "setInputSource"},
    {"samsungvd.mediaInputSource", "inputSource", "supportedInputSources", "Input Source", "setInputSource"},
    {"custom.picturemode",         "pictureMode", "supportedPictureModes", "Picture Mode", "setPictureMode"},
    {"samsungvd.pictureMode",      "pictureMode", "supportedPictureModes", "Picture Mode", "setPictureMode"},
    {"custom.soundmode",           "soundMode",   "supportedSoundModes",   "Sound Mode",   "setSoundMode"},
    {"samsungvd.soundMode",        "soundMode",   "supportedSoundModes",   "Sound Mode",   "setSoundMode"},
    {"ovenMode",                   "ovenMode",    "supportedOvenModes",    "Oven Mode",    "setOvenMode"},
    {"samsungce.ovenMode",         "ovenMode",    "supportedOvenModes",    "Oven Mode",    "setOvenMode"},
};

static const HABinaryVocabulary kBinaryVocabulary[] = {
    {"contact",   "open",     "closed",      "door"},
    {"motion",    "active",   "inactive",    "motion"},
    {"water",     "wet",      "dry",         "moisture"},
    {"presence",  "present",  "not present", "presence"},
    {"occupancy", "occupied", "unoccupied",  "occupancy"},
    {"smoke",     "detected", "clear",       "smoke"},
};

static const char* kKnownComponent = "main";

static std::string lowerAscii(const std::string& in)
{
    std::string out(in);
    for (char& c : out) c = (char)tolower((unsigned char)c);
    return out;
}

static const HABinaryVocabulary* findVocabulary(const std::string& attribute)
{
    const std::string key = lowerAscii(attribute);
    for (const HABinaryVocabulary& v : kBinaryVocabulary) {
        if (key == v.attribute) return &v;
    }
    return nullptr;
}

static const char* sensorDeviceClass(const std::string& capability)
{
    if (capability == "temperatureMeasurement") return "temperature";
    if (capability == "relativeHumidityMeasurement") return "humidity";
    if (capability == "battery") return "battery";
    if (capability == "illuminanceMeasurement") return "illuminance";
    return nullptr;
}

namespace {

/** @brief Per-device values shared by every document of one synthesize() call. */
struct DeviceBlock {
    std::string deviceId;
    std::string label;
    std::string manufacturer;
    std::string model;
    std::string swVersion;
    std::string stateTopic;
    std::string availabilityTopic;
    std::string base;
};

HAEntity finish(const DeviceBlock& dev, const char* domain, const std::string& attrKey, JsonObject root)
{
    JsonObject meta = root.createNestedObject("device");
    JsonArray ids = meta.createNestedArray("identifiers");
    ids.add(std::string("smartthings_") + dev.deviceId);
    meta["name"] = dev.label;
    meta["manufacturer"] = dev.manufacturer;
    meta["model"] = dev.model;
    meta["sw_version"] = dev.swVersion;
    root["availability_topic"] = dev.availabilityTopic;

    HAEntity e;
    e.domain = domain;
    e.objectId = HADiscovery::objectIdFor(dev.deviceId, attrKey);
    serializeJson(root, e.payload);
    return e;
}

size_t docCapacity(const DeviceBlock& dev, size_t extra)
{
    return Limits::Ha::PayloadDocBase + dev.label.size() * 2 + (dev.base.size() + dev.deviceId.size()) * 6
           + dev.manufacturer.size() + dev.model.size() + dev.swVersion.size() + extra;
}

}  // namespace

void HADiscovery::sanitizeId(const char* in, char* out, size_t outLen)
{
    if (!out || outLen == 0) return;
    out[0] = '\0';
    if (!in) return;

    size_t w = 0;
    for (size_t i = 0; in[i] != '\0' && w + 1 < outLen; ++i) {
        const unsigned char c = (unsigned char)in[i];
        // one replacement per code point: UTF-8 continuation bytes are folded into their lead byte
        if ((c & 0xC0) == 0x80) continue;
        if (c < 0x80 && (isalnum(c) || c == '_')) {
            out[w++] = (char)tolower(c);
        } else {
            out[w++] = '_';
        }
    }
    out[w] = '\0';
}

std::string HADiscovery::sanitizeId(const std::string& in)
{
    std::string out(in.size() + 1, '\0');
    sanitizeId(in.c_str(), &out[0], out.size());
    out.resize(strlen(out.c_str()));
    return out;
}

std::string HADiscovery::objectIdFor(const std::string& deviceId, const std::string& attrKey)
{
    return "smartthings_" + deviceId + "_" + sanitizeId(attrKey);
}

std::string HADiscovery::valueTemplate(const std::string& attrKey)
{
    return "{{ value_json['" + attrKey + "'] }}";
}

std::vector<HAEntity> HADiscovery::synthesize(const DeviceInfo& device, const AttributeMap& attrs) const
{
    std::vector<HAEntity> out;

    DeviceBlock dev;
    dev.deviceId = device.deviceId;
    dev.label = device.displayName();
    dev.manufacturer = device.manufacturer.empty() ? "Samsung" : device.manufacturer;
    dev.model = device.model.empty() ? "SmartThings Device" : device.model;
    dev.swVersion = device.firmware;
    dev.stateTopic = MqttTopics::deviceTopic(_base, device.deviceId, MqttTopics::SuffixState);
    dev.availabilityTopic = MqttTopics::deviceTopic(_base, device.deviceId, MqttTopics::SuffixAvailability);
    dev.base = _base;

    std::set<std::string> claimed;

    for (const HAKnownSwitch& k : kKnownSwitches) {
        const std::string key = std::string(kKnownComponent) + "." + k.capability + "." + k.attribute;
        auto it = attrs.find(key);
        if (it == attrs.end() || it->second.value.kind == AttributeKind::Absent) continue;
        claimed.insert(key);

        DynamicJsonDocument doc(docCapacity(dev, key.size() * 4));
        JsonObject root = doc.to<JsonObject>();
        root["name"] = dev.label + " " + k.label;
        root["state_topic"] = dev.stateTopic;
        root["command_topic"] = MqttTopics::capabilitySetTopic(_base, dev.deviceId, kKnownComponent, k.capability);
        root["state_value_template"] = valueTemplate(key);
        root["payload_on"] = k.payloadOn;
        root["payload_off"] = k.payloadOff;
        root["state_on"] = k.stateOn;
        root["state_off"] = k.stateOff;
        root["unique_id"] = objectIdFor(dev.deviceId, key);
        out.push_back(finish(dev, "switch", key, root));
    }

    for (const HAKnownNumber& k : kKnownNumbers) {
        const std::string key = std::string(kKnownComponent) + "." + k.capability + "." + k.attribute;
        auto it = attrs.find(key);
        if (it == attrs.end() || it->second.value.kind != AttributeKind::Number) continue;
        claimed.insert(key);

        DynamicJsonDocument doc(docCapacity(dev, key.size() * 4));
        JsonObject root = doc.to<JsonObject>();
        root["name"] = dev.label + " " + k.label;
        root["state_topic"] = dev.stateTopic;
        root["command_topic"] = MqttTopics::capabilitySetTopic(_base, dev.deviceId, kKnownComponent, k.capability);
        root["value_template"] = valueTemplate(key);
        root["command_template"] = std::string("{\"command\":\"") + k.command + "\",\"arguments\":[{{ value | float }}]}";
        root["min"] = k.minValue;
        root["max"] = k.maxValue;
        root["step"] = k.step;
        root["mode"] = "slider";
        root["unique_id"] = objectIdFor(dev.deviceId, key);
        if (!it->second.unit.empty()) root["unit_of_measurement"] = it->second.unit;
        out.push_back(finish(dev, "number", key, root));
    }

    for (const HAKnownSelect& k : kKnownSelects) {
        const std::string key = std::string(kKnownComponent) + "." + k.capability + "." + k.attribute;
        const std::string supportedKey = std::string(kKnownComponent) + "." + k.capability + "." + k.supportedAttribute;
        auto it = attrs.find(key);
        auto sup = attrs.find(supportedKey);
        if (it == attrs.end() || sup == attrs.end()) continue;
        if (it->second.value.kind != AttributeKind::Text) continue;
        if (sup->second.value.kind != AttributeKind::List) continue;

        std::vector<std::string> options;
        size_t optionBytes = 0;
        for (const std::string& opt : sup->second.value.items) {
            if (opt.empty()) continue;
            options.push_back(opt);
            optionBytes += opt.size() + 1;
        }
        if (options.empty()) continue;
        claimed.insert(key);

        DynamicJsonDocument doc(docCapacity(dev, key.size() * 4 + JSON_ARRAY_SIZE(options.size()) + optionBytes));
        JsonObject root = doc.to<JsonObject>();
        root["name"] = dev.label + " " + k.label;
        root["state_topic"] = dev.stateTopic;
        root["command_topic"] = MqttTopics::capabilitySetTopic(_base, dev.deviceId, kKnownComponent, k.capability);
        root["value_template"] = valueTemplate(key);
        JsonArray opts = root.createNestedArray("options");
        for (const std::string& opt : options) opts.add(opt);
        root["command_template"] = std::string("{\"command\":\"") + k.command + "\",\"arguments\":[\"{{ value }}\"]}";
        root["unique_id"] = objectIdFor(dev.deviceId, key);
        out.push_back(finish(dev, "select", key, root));
    }

    for (const auto& kv : attrs) {
        const std::string& key = kv.first;
        const Attribute& a = kv.second;
        if (claimed.count(key)) continue;
        if (!a.value.isScalar()) continue;

        DynamicJsonDocument doc(docCapacity(dev, key.size() * 6));
        JsonObject root = doc.to<JsonObject>();
        root["name"] = dev.label + " " + a.component + " " + a.capability + " " + a.attribute;
        root["state_topic"] = dev.stateTopic;

        if (a.capability == "switch" && a.attribute == "switch" && a.value.kind == AttributeKind::Text) {
            const std::string v = lowerAscii(a.value.text);
            if (v == "on" || v == "off") {
                root["command_topic"] = MqttTopics::capabilitySetTopic(_base, dev.deviceId, a.component, a.capability);
                root["state_value_template"] = valueTemplate(key);
                root["payload_on"] = "on";
                root["payload_off"] = "off";
                root["state_on"] = "on";
                root["state_off"] = "off";
                root["unique_id"] = objectIdFor(dev.deviceId, key);
                out.push_back(finish(dev, "switch", key, root));
                continue;
            }
        }

        if (a.capability == "lock" && (a.attribute == "lock" || a.attribute == "lockState")) {
            root["command_topic"] = MqttTopics::capabilitySetTopic(_base, dev.deviceId, a.component, a.capability);
            root["value_template"] = valueTemplate(key);
            root["state_locked"] = "locked";
            root["state_unlocked"] = "unlocked";
            root["payload_lock"] = "lock";
            root["payload_unlock"] = "unlock";
            root["unique_id"] = objectIdFor(dev.deviceId, key);
            out.push_back(finish(dev, "lock", key, root));
            continue;
        }

        if (a.value.kind == AttributeKind::Bool) {
            root["value_template"] = valueTemplate(key);
            root["payload_on"] = true;
            root["payload_off"] = false;
            root["unique_id"] = objectIdFor(dev.deviceId, key);
            out.push_back(finish(dev, "binary_sensor", key, root));
            continue;
        }

        const HABinaryVocabulary* vocab = (a.value.kind == AttributeKind::Text) ? findVocabulary(a.attribute) : nullptr;
        if (vocab) {
            root["value_template"] = valueTemplate(key);
            root["payload_on"] = vocab->payloadOn;
            root["payload_off"] = vocab->payloadOff;
            root["device_class"] = vocab->deviceClass;
            root["unique_id"] = objectIdFor(dev.deviceId, key);
            out.push_back(finish(dev, "binary_sensor", key, root));
            continue;
        }

        root["value_template"] = valueTemplate(key);
        root["unique_id"] = objectIdFor(dev.deviceId, key);
        if (a.value.kind == AttributeKind::Number) root["state_class"] = "measurement";
        if (!a.unit.empty()) root["unit_of_measurement"] = a.unit;
        const char* deviceClass = sensorDeviceClass(a.capability);
        if (deviceClass) {
            root["device_class"] = deviceClass;
            if (a.capability == "illuminanceMeasurement" && a.unit.empty()) root["unit_of_measurement"] = "lx";
        }
        out.push_back(finish(dev, "sensor", key, root));
    }

    return out;
}
