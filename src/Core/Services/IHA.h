#pragma once
/**
 * @file IHA.h
 * @brief Home Assistant discovery service interface.
 */

#include "Core/Types/Attribute.h"
#include "Core/Types/DeviceInfo.h"

/** @brief Service wrapper for discovery publishing (HAModule). */
struct HAService {
    /** @brief Publish discovery documents not yet published for this device. Returns the count sent. */
    int (*publishDevice)(void* ctx, const DeviceInfo& device, const AttributeMap& attrs);
    void* ctx;
};
