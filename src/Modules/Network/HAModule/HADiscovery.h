#pragma once
/**
 * @file HADiscovery.h
 * @brief Maps flattened device attributes to Home Assistant discovery documents.
 */

#include "Core/Types/Attribute.h"
#include "Core/Types/DeviceInfo.h"
#include <stddef.h>
#include <string>
#include <vector>

/** @brief One discovery document ready to publish. */
struct HAEntity {
    const char* domain = "";   ///< switch, number, select, binary_sensor, lock, sensor
    std::string objectId;      ///< also the unique_id
    std::string payload;       ///< JSON document
};

/** @brief Known switch capability (component `main`). */
struct HAKnownSwitch {
    const char* capability;
    const char* attribute;
    const char* payloadOn;
    const char* payloadOff;
    const char* stateOn;
    const char* stateOff;
    const char* label;
};

/** @brief Known number capability (component `main`). */
struct HAKnownNumber {
    const char* capability;
    const char* attribute;
    const char* label;
    const char* command;
    int minValue;
    int maxValue;
    int step;
};

/** @brief Known select capability (component `main`); options come from `supportedAttribute`. */
struct HAKnownSelect {
    const char* capability;
    const char* attribute;
    const char* supportedAttribute;
    const char* label;
    const char* command;
};

/** @brief Text vocabulary turning an attribute into a binary_sensor. */
struct HABinaryVocabulary {
    const char* attribute;     ///< matched against the lower-cased attribute name
    const char* payloadOn;
    const char* payloadOff;
    const char* deviceClass;
};

/**
 * @brief Stateless discovery synthesizer.
 *
 * Known capabilities are evaluated first and claim their attribute keys; every
 * other key goes through the generic rules (binary, vocabulary, switch/lock, sensor).
 */
class HADiscovery {
public:
    /**
     * @param baseTopic MQTT prefix `P` used for state, command and availability topics.
     */
    explicit HADiscovery(const std::string& baseTopic) : _base(baseTopic) {}

    /** @brief Every entity the attribute set maps to, known table first. */
    std::vector<HAEntity> synthesize(const DeviceInfo& device, const AttributeMap& attrs) const;

    /** @brief Lower-case, every char outside `[a-z0-9_]` becomes `_`. */
    static void sanitizeId(const char* in, char* out, size_t outLen);
    static std::string sanitizeId(const std::string& in);
    /** @brief `smartthings_<device>_<sanitized key>` */
    static std::string objectIdFor(const std::string& deviceId, const std::string& attrKey);
    /** @brief `{{ value_json['<key>'] }}` */
    static std::string valueTemplate(const std::string& attrKey);

private:
    std::string _base;
};
