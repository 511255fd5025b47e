/**
 * @file AttributeExtractor.cpp
 * @brief Implementation file.
 */

#include "Modules/BridgeModule/AttributeExtractor.h"
#include "Core/SystemLimits.h"
#include <algorithm>
#include <cstring>
#include <vector>

static void appendJsonString(const char* s, std::string& out)
{
    StaticJsonDocument<16> tmp;
    tmp.set(s);
    std::string enc;
    serializeJson(tmp, enc);
    out += enc;
}

static void writeCanonical(JsonVariantConst v, std::string& out)
{
    if (v.is<JsonObjectConst>()) {
        JsonObjectConst obj = v.as<JsonObjectConst>();
        std::vector<const char*> keys;
        for (JsonPairConst kv : obj) keys.push_back(kv.key().c_str());
        std::sort(keys.begin(), keys.end(), [](const char* a, const char* b) { return strcmp(a, b) < 0; });

        out += '{';
        bool first = true;
        for (const char* k : keys) {
            if (!first) out += ',';
            first = false;
            appendJsonString(k, out);
            out += ':';
            writeCanonical(obj[k], out);
        }
        out += '}';
        return;
    }

    if (v.is<JsonArrayConst>()) {
        out += '[';
        bool first = true;
        for (JsonVariantConst item : v.as<JsonArrayConst>()) {
            if (!first) out += ',';
            first = false;
            writeCanonical(item, out);
        }
        out += ']';
        return;
    }

    std::string enc;
    serializeJson(v, enc);
    out += enc;
}

std::string canonicalJson(JsonVariantConst v)
{
    std::string out;
    writeCanonical(v, out);
    return out;
}

AttributeValue toAttributeValue(JsonVariantConst v)
{
    AttributeValue out;
    out.json = canonicalJson(v);

    if (v.isNull()) {
        out.kind = AttributeKind::Absent;
    } else if (v.is<bool>()) {
        out.kind = AttributeKind::Bool;
        out.boolean = v.as<bool>();
    } else if (v.is<long long>()) {
        out.kind = AttributeKind::Number;
        out.integral = true;
        out.number = (double)v.as<long long>();
    } else if (v.is<double>()) {
        out.kind = AttributeKind::Number;
        out.number = v.as<double>();
    } else if (v.is<const char*>()) {
        out.kind = AttributeKind::Text;
        out.text = v.as<const char*>();
    } else if (v.is<JsonArrayConst>()) {
        out.kind = AttributeKind::List;
        for (JsonVariantConst item : v.as<JsonArrayConst>()) {
            if (item.is<const char*>()) out.items.push_back(item.as<const char*>());
        }
    } else if (v.is<JsonObjectConst>()) {
        out.kind = AttributeKind::Map;
    }
    return out;
}

// Numeric units are kept as their JSON text; zero, empty and other types mean "no unit".
static std::string unitText(JsonVariantConst unit)
{
    std::string out;
    if (unit.is<const char*>()) {
        out = unit.as<const char*>();
    } else if ((unit.is<long long>() || unit.is<double>()) && unit.as<double>() != 0.0) {
        serializeJson(unit, out);
    }
    return out;
}

void extractAttributes(JsonVariantConst status, AttributeMap& out)
{
    JsonObjectConst components = status["components"].as<JsonObjectConst>();
    if (components.isNull()) return;

    for (JsonPairConst comp : components) {
        if (!comp.value().is<JsonObjectConst>()) continue;

        for (JsonPairConst cap : comp.value().as<JsonObjectConst>()) {
            if (!cap.value().is<JsonObjectConst>()) continue;

            for (JsonPairConst attr : cap.value().as<JsonObjectConst>()) {
                if (!attr.value().is<JsonObjectConst>()) continue;
                JsonObjectConst payload = attr.value().as<JsonObjectConst>();

                Attribute a;
                a.component = comp.key().c_str();
                a.capability = cap.key().c_str();
                a.attribute = attr.key().c_str();
                a.value = toAttributeValue(payload["value"]);
                a.unit = unitText(payload["unit"]);

                out[a.key()] = a;
            }
        }
    }
}

bool extractAttributes(const std::string& statusJson, AttributeMap& out, ErrorCode* err)
{
    out.clear();

    DynamicJsonDocument doc(Limits::Json::capacityFor(statusJson.size()));
    const DeserializationError jerr = deserializeJson(doc, statusJson);
    if (jerr) {
        if (err) *err = (jerr == DeserializationError::NoMemory) ? ErrorCode::JsonNoMemory : ErrorCode::BadStatusJson;
        return false;
    }

    extractAttributes(doc.as<JsonVariantConst>(), out);
    if (err) *err = ErrorCode::None;
    return true;
}
