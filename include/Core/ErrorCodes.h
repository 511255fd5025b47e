#pragma once
/**
 * @file ErrorCodes.h
 * @brief Shared error codes and log formatting helpers.
 */

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>

enum class ErrorCode : uint16_t {
    None = 0,
    MissingToken,
    ApiTransport,
    ApiHttpStatus,
    BadApiJson,
    BadStatusJson,
    EmptyCmdPayload,
    BadCmdPayload,
    UnknownTopic,
    MqttNotConnected,
    MqttPublishFailed,
    CfgFileUnreadable,
    BadCfgJson,
    JsonNoMemory
};

static inline const char* errorCodeStr(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None: return "None";
    case ErrorCode::MissingToken: return "MissingToken";
    case ErrorCode::ApiTransport: return "ApiTransport";
    case ErrorCode::ApiHttpStatus: return "ApiHttpStatus";
    case ErrorCode::BadApiJson: return "BadApiJson";
    case ErrorCode::BadStatusJson: return "BadStatusJson";
    case ErrorCode::EmptyCmdPayload: return "EmptyCmdPayload";
    case ErrorCode::BadCmdPayload: return "BadCmdPayload";
    case ErrorCode::UnknownTopic: return "UnknownTopic";
    case ErrorCode::MqttNotConnected: return "MqttNotConnected";
    case ErrorCode::MqttPublishFailed: return "MqttPublishFailed";
    case ErrorCode::CfgFileUnreadable: return "CfgFileUnreadable";
    case ErrorCode::BadCfgJson: return "BadCfgJson";
    case ErrorCode::JsonNoMemory: return "JsonNoMemory";
    default: return "Unknown";
    }
}

/** @brief True for failures raised by the network path rather than by payload content. */
static inline bool errorCodeIsTransport(ErrorCode code)
{
    switch (code) {
    case ErrorCode::ApiTransport:
    case ErrorCode::ApiHttpStatus:
    case ErrorCode::MqttNotConnected:
    case ErrorCode::MqttPublishFailed:
        return true;
    default:
        return false;
    }
}

/** @brief Render `<code>[ http=<status>]` into a log-friendly buffer. */
static inline bool writeErrorLabel(char* out, size_t outLen, ErrorCode code, long httpStatus)
{
    if (!out || outLen == 0) return false;
    int wrote = 0;
    if (httpStatus > 0) {
        wrote = snprintf(out, outLen, "%s http=%ld", errorCodeStr(code), httpStatus);
    } else {
        wrote = snprintf(out, outLen, "%s", errorCodeStr(code));
    }
    return (wrote > 0) && ((size_t)wrote < outLen);
}
