#pragma once
/**
 * @file AttributeExtractor.h
 * @brief Flattens a nested device status document into an AttributeMap.
 */

#include "Core/ErrorCodes.h"
#include "Core/Types/Attribute.h"
#include <ArduinoJson.h>
#include <string>

/**
 * @brief Parse a status body and flatten `components.<comp>.<cap>.<attr>.{value,unit}`.
 *
 * Levels that are not objects are skipped. Returns false only when the body is
 * not valid JSON (err set to BadStatusJson or JsonNoMemory).
 */
bool extractAttributes(const std::string& statusJson, AttributeMap& out, ErrorCode* err = nullptr);

/** @brief Same walk over an already parsed status object. */
void extractAttributes(JsonVariantConst status, AttributeMap& out);

/** @brief Map one JSON value to its tagged form (json = canonical encoding). */
AttributeValue toAttributeValue(JsonVariantConst v);

/** @brief Compact JSON with object keys sorted (byte order), arrays kept in order. */
std::string canonicalJson(JsonVariantConst v);
