#pragma once
/**
 * @file DeviceApiModule.h
 * @brief Device REST API client module (libcurl).
 */
#include "Core/ModulePassive.h"
#include "Core/EnvKeys.h"
#include "Core/Services/Services.h"
#include <string>
#include <vector>

/** @brief Device API configuration values. */
struct DeviceApiConfig {
    char token[Limits::Api::Buffers::Token] = "";
    char baseUrl[Limits::Api::Buffers::BaseUrl] = "https://api.smartthings.com/v1";
    int32_t timeoutS = Limits::Api::DefaultTimeoutS;
};

/**
 * @brief Passive module exposing the `devapi` service.
 *
 * Calls are synchronous and run on the caller's thread (the bridge loop).
 * Each call uses its own curl easy handle; there are no retries.
 */
class DeviceApiModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "devapi"; }

    /** @brief Depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Strip the trailing `/` of the base URL and clamp the timeout. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    void shutdown() override;

    /** @brief False when no API token was configured. */
    bool hasToken() const { return cfgData.token[0] != '\0'; }

    bool listDevices(std::vector<DeviceInfo>& out, ApiError* err);
    bool fetchStatus(const char* deviceId, std::string& body, ApiError* err);
    bool sendCommands(const char* deviceId, const char* envelopeJson, ApiError* err);

    /**
     * @brief Parse one `GET devices` page.
     *
     * Appends every item carrying a `deviceId` to `out` and sets `nextHref` to
     * `_links.next.href` (empty on the last page).
     */
    static bool parseDevicePage(const std::string& body, std::vector<DeviceInfo>& out,
                                std::string& nextHref, ApiError* err);

private:
    DeviceApiConfig cfgData;
    bool _curlReady = false;

    DeviceApiService apiSvc{ nullptr, nullptr, nullptr, nullptr };

    ConfigVariable<char> tokenVar {
        EnvKeys::Api::Token,"token","api",ConfigType::CharArray,
        (char*)cfgData.token,sizeof(cfgData.token)
    };
    ConfigVariable<char> baseUrlVar {
        EnvKeys::Api::BaseUrl,"base_url","api",ConfigType::CharArray,
        (char*)cfgData.baseUrl,sizeof(cfgData.baseUrl)
    };
    ConfigVariable<int32_t> timeoutVar {
        EnvKeys::Api::TimeoutS,"timeout_s","api",ConfigType::Int32,
        &cfgData.timeoutS,0
    };

    bool request(const char* method, const std::string& url, const char* body,
                 std::string& out, ApiError* err);

    static bool svcListDevices(void* ctx, std::vector<DeviceInfo>& out, ApiError* err);
    static bool svcFetchStatus(void* ctx, const char* deviceId, std::string& body, ApiError* err);
    static bool svcSendCommands(void* ctx, const char* deviceId, const char* envelopeJson, ApiError* err);
};
