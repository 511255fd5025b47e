#pragma once
/**
 * @file CommandTranslator.h
 * @brief Inbound MQTT payload to device command envelope translation.
 */

#include "Core/ErrorCodes.h"
#include <string>

/**
 * @brief Whole-device payload (`P/<dev>/set`, `P/<dev>/command`).
 *
 * Accepts a full `{"commands":[...]}` envelope, a `{capability, command}`
 * shorthand (component defaults to `main`) or the texts on/off, lock/unlock
 * and open/close. On success `envelope` holds the JSON to submit.
 */
bool translateDeviceCommand(const char* payload, std::string& envelope, ErrorCode* err = nullptr);

/**
 * @brief Capability-scoped payload (`P/<dev>/<comp>/<cap>/set`).
 *
 * Never rejects non-empty text: unknown text becomes the command verb.
 */
bool translateCapabilityCommand(const char* payload, const char* component, const char* capability,
                                std::string& envelope, ErrorCode* err = nullptr);

/** @brief True when `text` is exactly one JSON number literal. */
bool isJsonNumberText(const std::string& text);
