/**
 * @file DeviceApiModule.cpp
 * @brief Implementation file.
 */
#include "DeviceApiModule.h"
#include "Core/SystemLimits.h"
#include <ArduinoJson.h>
#include <curl/curl.h>
#include <cstring>
#include <memory>
#define LOG_TAG "DevApiMd"
#include "Core/ModuleLog.h"

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* h) const { if (h) curl_easy_cleanup(h); }
};
struct CurlSlistDeleter {
    void operator()(curl_slist* l) const { if (l) curl_slist_free_all(l); }
};

size_t appendBody(char* data, size_t size, size_t nmemb, void* userdata)
{
    std::string* out = static_cast<std::string*>(userdata);
    out->append(data, size * nmemb);
    return size * nmemb;
}

void setError(ApiError* err, ErrorCode code, long httpStatus, const std::string& detail)
{
    if (!err) return;
    err->code = code;
    err->httpStatus = httpStatus;
    err->detail = detail;
}

}  // namespace

bool DeviceApiModule::svcListDevices(void* ctx, std::vector<DeviceInfo>& out, ApiError* err)
{
    DeviceApiModule* self = static_cast<DeviceApiModule*>(ctx);
    return self ? self->listDevices(out, err) : false;
}

bool DeviceApiModule::svcFetchStatus(void* ctx, const char* deviceId, std::string& body, ApiError* err)
{
    DeviceApiModule* self = static_cast<DeviceApiModule*>(ctx);
    return self ? self->fetchStatus(deviceId, body, err) : false;
}

bool DeviceApiModule::svcSendCommands(void* ctx, const char* deviceId, const char* envelopeJson, ApiError* err)
{
    DeviceApiModule* self = static_cast<DeviceApiModule*>(ctx);
    return self ? self->sendCommands(deviceId, envelopeJson, err) : false;
}

bool DeviceApiModule::request(const char* method, const std::string& url, const char* body,
                              std::string& out, ApiError* err)
{
    out.clear();
    if (!_curlReady) {
        setError(err, ErrorCode::ApiTransport, 0, "curl not initialized");
        return false;
    }

    std::unique_ptr<CURL, CurlEasyDeleter> h(curl_easy_init());
    if (!h) {
        setError(err, ErrorCode::ApiTransport, 0, "curl_easy_init failed");
        return false;
    }

    char auth[Limits::Api::Buffers::Token + 32];
    snprintf(auth, sizeof(auth), "Authorization: Bearer %s", cfgData.token);

    curl_slist* raw = nullptr;
    raw = curl_slist_append(raw, auth);
    raw = curl_slist_append(raw, "Content-Type: application/json");
    raw = curl_slist_append(raw, "Accept: application/json");
    std::unique_ptr<curl_slist, CurlSlistDeleter> headers(raw);

    char errBuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(h.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(h.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(h.get(), CURLOPT_TIMEOUT, (long)cfgData.timeoutS);
    curl_easy_setopt(h.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h.get(), CURLOPT_ERRORBUFFER, errBuf);
    curl_easy_setopt(h.get(), CURLOPT_WRITEFUNCTION, appendBody);
    curl_easy_setopt(h.get(), CURLOPT_WRITEDATA, &out);
    if (strcmp(method, "POST") == 0) {
        const char* payload = body ? body : "";
        curl_easy_setopt(h.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(h.get(), CURLOPT_POSTFIELDS, payload);
        curl_easy_setopt(h.get(), CURLOPT_POSTFIELDSIZE, (long)strlen(payload));
    }

    LOGD("HTTP %s %s body=%uB", method, url.c_str(), (unsigned)(body ? strlen(body) : 0));

    const CURLcode rc = curl_easy_perform(h.get());
    if (rc != CURLE_OK) {
        const char* why = errBuf[0] ? errBuf : curl_easy_strerror(rc);
        LOGW("HTTP %s %s -> %s", method, url.c_str(), why);
        setError(err, ErrorCode::ApiTransport, 0, why);
        return false;
    }

    long status = 0;
    curl_easy_getinfo(h.get(), CURLINFO_RESPONSE_CODE, &status);
    LOGD("HTTP %s %s -> %ld recv=%uB", method, url.c_str(), status, (unsigned)out.size());

    if (status < 200 || status >= 300) {
        std::string detail = out.substr(0, Limits::Api::ErrorBodyMax);
        setError(err, ErrorCode::ApiHttpStatus, status, detail);
        return false;
    }
    return true;
}

bool DeviceApiModule::parseDevicePage(const std::string& body, std::vector<DeviceInfo>& out,
                                      std::string& nextHref, ApiError* err)
{
    nextHref.clear();

    DynamicJsonDocument doc(Limits::Json::capacityFor(body.size()));
    const DeserializationError jerr = deserializeJson(doc, body);
    if (jerr) {
        setError(err, jerr == DeserializationError::NoMemory ? ErrorCode::JsonNoMemory : ErrorCode::BadApiJson,
                 0, jerr.c_str());
        return false;
    }
    if (!doc.is<JsonObjectConst>()) {
        setError(err, ErrorCode::BadApiJson, 0, "device listing is not an object");
        return false;
    }

    JsonArrayConst items = doc["items"].as<JsonArrayConst>();
    for (JsonVariantConst item : items) {
        const char* id = item["deviceId"] | "";
        if (id[0] == '\0') continue;

        DeviceInfo d;
        d.deviceId = id;
        d.label = item["label"] | "";
        d.name = item["name"] | "";
        d.manufacturer = item["manufacturerName"] | "";
        d.model = item["deviceTypeName"] | "";
        d.firmware = item["firmwareVersion"] | "";
        out.push_back(d);
    }

    const char* next = doc["_links"]["next"]["href"] | "";
    nextHref = next;
    return true;
}

bool DeviceApiModule::listDevices(std::vector<DeviceInfo>& out, ApiError* err)
{
    out.clear();
    std::string url = std::string(cfgData.baseUrl) + "/devices";
    std::string body;

    for (uint8_t page = 0; page < Limits::Api::MaxPages; ++page) {
        if (!request("GET", url, nullptr, body, err)) return false;

        std::string next;
        if (!parseDevicePage(body, out, next, err)) return false;
        if (next.empty()) return true;
        url = next;
    }

    LOGW("device listing truncated after %u pages", (unsigned)Limits::Api::MaxPages);
    return true;
}

bool DeviceApiModule::fetchStatus(const char* deviceId, std::string& body, ApiError* err)
{
    if (!deviceId || deviceId[0] == '\0') return false;
    const std::string url = std::string(cfgData.baseUrl) + "/devices/" + deviceId + "/status";
    return request("GET", url, nullptr, body, err);
}

bool DeviceApiModule::sendCommands(const char* deviceId, const char* envelopeJson, ApiError* err)
{
    if (!deviceId || deviceId[0] == '\0' || !envelopeJson) return false;
    const std::string url = std::string(cfgData.baseUrl) + "/devices/" + deviceId + "/commands";
    std::string reply;
    return request("POST", url, envelopeJson, reply, err);
}

void DeviceApiModule::init(ConfigStore& cfg, ServiceRegistry& services)
{
    cfg.registerVar(tokenVar);
    cfg.registerVar(baseUrlVar);
    cfg.registerVar(timeoutVar);

    const CURLcode rc = curl_global_init(CURL_GLOBAL_DEFAULT);
    _curlReady = (rc == CURLE_OK);
    if (!_curlReady) {
        LOGE("curl_global_init failed: %s", curl_easy_strerror(rc));
    }

    apiSvc.listDevices = DeviceApiModule::svcListDevices;
    apiSvc.fetchStatus = DeviceApiModule::svcFetchStatus;
    apiSvc.sendCommands = DeviceApiModule::svcSendCommands;
    apiSvc.ctx = this;
    services.add("devapi", &apiSvc);
}

void DeviceApiModule::onConfigLoaded(ConfigStore&, ServiceRegistry&)
{
    size_t len = strlen(cfgData.baseUrl);
    while (len > 0 && cfgData.baseUrl[len - 1] == '/') cfgData.baseUrl[--len] = '\0';

    if (cfgData.timeoutS <= 0) {
        LOGW("invalid timeout %ld, using %ld", (long)cfgData.timeoutS, (long)Limits::Api::DefaultTimeoutS);
        cfgData.timeoutS = Limits::Api::DefaultTimeoutS;
    }
    LOGI("api base=%s timeout=%lds token=%s", cfgData.baseUrl, (long)cfgData.timeoutS,
         hasToken() ? "set" : "missing");
}

void DeviceApiModule::shutdown()
{
    if (_curlReady) curl_global_cleanup();
    _curlReady = false;
}
