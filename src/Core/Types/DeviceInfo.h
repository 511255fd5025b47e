#pragma once
/**
 * @file DeviceInfo.h
 * @brief Device record returned by the device listing.
 */
#include <string>

struct DeviceInfo {
    std::string deviceId;      ///< opaque primary key
    std::string label;
    std::string name;
    std::string manufacturer;  ///< `manufacturerName`
    std::string model;         ///< `deviceTypeName`
    std::string firmware;      ///< `firmwareVersion`

    /** @brief Label, else name, else id. */
    const std::string& displayName() const {
        if (!label.empty()) return label;
        if (!name.empty()) return name;
        return deviceId;
    }
};
