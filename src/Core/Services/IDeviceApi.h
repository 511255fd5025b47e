#pragma once
/**
 * @file IDeviceApi.h
 * @brief Device REST API service interface.
 */

#include "Core/ErrorCodes.h"
#include "Core/Types/DeviceInfo.h"
#include <string>
#include <vector>

/** @brief Failure details of one API call. */
struct ApiError {
    ErrorCode code = ErrorCode::None;
    long httpStatus = 0;     ///< 0 when no HTTP response was received
    std::string detail;      ///< transport error text or (truncated) response body
};

/** @brief Service wrapper for the device API client (DeviceApiModule). */
struct DeviceApiService {
    /** @brief `GET devices` (all pages). */
    bool (*listDevices)(void* ctx, std::vector<DeviceInfo>& out, ApiError* err);
    /** @brief `GET devices/{id}/status`, raw body. */
    bool (*fetchStatus)(void* ctx, const char* deviceId, std::string& body, ApiError* err);
    /** @brief `POST devices/{id}/commands` with an envelope document. */
    bool (*sendCommands)(void* ctx, const char* deviceId, const char* envelopeJson, ApiError* err);
    void* ctx;
};
