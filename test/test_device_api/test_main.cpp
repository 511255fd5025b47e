#include <unity.h>

#include <string>
#include <vector>

#include "Core/ConfigStore.h"
#include "Core/ServiceRegistry.h"
#include "Modules/Network/DeviceApiModule/DeviceApiModule.h"

void setUp() {}
void tearDown() {}

void test_parse_page_reads_items_and_next_link()
{
    const std::string body =
        "{\"items\":["
          "{\"deviceId\":\"d1\",\"label\":\"Lamp\",\"name\":\"c2c-switch\",\"manufacturerName\":\"Acme\","
           "\"deviceTypeName\":\"Plug\",\"firmwareVersion\":\"1.2\"},"
          "{\"label\":\"no id\"},"
          "{\"deviceId\":\"d2\",\"name\":\"Sensor\"}"
        "],"
        "\"_links\":{\"next\":{\"href\":\"https://api.example/v1/devices?page=2\"}}}";

    std::vector<DeviceInfo> out;
    std::string next;
    ApiError err;
    TEST_ASSERT_TRUE(DeviceApiModule::parseDevicePage(body, out, next, &err));
    TEST_ASSERT_EQUAL_UINT32(2, (uint32_t)out.size());
    TEST_ASSERT_EQUAL_STRING("d1", out[0].deviceId.c_str());
    TEST_ASSERT_EQUAL_STRING("Acme", out[0].manufacturer.c_str());
    TEST_ASSERT_EQUAL_STRING("Plug", out[0].model.c_str());
    TEST_ASSERT_EQUAL_STRING("1.2", out[0].firmware.c_str());
    TEST_ASSERT_EQUAL_STRING("Lamp", out[0].displayName().c_str());
    TEST_ASSERT_EQUAL_STRING("Sensor", out[1].displayName().c_str());
    TEST_ASSERT_EQUAL_STRING("https://api.example/v1/devices?page=2", next.c_str());
}

void test_parse_page_appends_and_detects_last_page()
{
    std::vector<DeviceInfo> out(1);
    out[0].deviceId = "earlier";
    std::string next = "stale";
    TEST_ASSERT_TRUE(DeviceApiModule::parseDevicePage(
        "{\"items\":[{\"deviceId\":\"d3\"}],\"_links\":{\"next\":null}}", out, next, nullptr));
    TEST_ASSERT_EQUAL_UINT32(2, (uint32_t)out.size());
    TEST_ASSERT_EQUAL_STRING("d3", out[1].displayName().c_str());
    TEST_ASSERT_TRUE(next.empty());

    TEST_ASSERT_TRUE(DeviceApiModule::parseDevicePage("{}", out, next, nullptr));
    TEST_ASSERT_EQUAL_UINT32(2, (uint32_t)out.size());
}

void test_parse_page_rejects_bad_json()
{
    std::vector<DeviceInfo> out;
    std::string next;
    ApiError err;
    TEST_ASSERT_FALSE(DeviceApiModule::parseDevicePage("<html>", out, next, &err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::BadApiJson, (int)err.code);

    TEST_ASSERT_FALSE(DeviceApiModule::parseDevicePage("[]", out, next, &err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::BadApiJson, (int)err.code);
}

void test_module_registers_service_and_reads_token()
{
    ConfigStore cfg;
    ServiceRegistry services;
    DeviceApiModule api;

    api.init(cfg, services);
    api.onConfigLoaded(cfg, services);
    TEST_ASSERT_FALSE(api.hasToken());

    const DeviceApiService* svc = services.get<DeviceApiService>("devapi");
    TEST_ASSERT_NOT_NULL(svc);
    TEST_ASSERT_NOT_NULL(svc->listDevices);
    TEST_ASSERT_NOT_NULL(svc->fetchStatus);
    TEST_ASSERT_NOT_NULL(svc->sendCommands);

    TEST_ASSERT_TRUE(cfg.applyJson("{\"api\":{\"token\":\"abc\"}}"));
    api.onConfigLoaded(cfg, services);
    TEST_ASSERT_TRUE(api.hasToken());
    api.shutdown();
}

void test_unreachable_api_reports_transport_error()
{
    ConfigStore cfg;
    ServiceRegistry services;
    DeviceApiModule api;

    api.init(cfg, services);
    TEST_ASSERT_TRUE(cfg.applyJson("{\"api\":{\"token\":\"abc\",\"base_url\":\"http://127.0.0.1:1/v1/\",\"timeout_s\":2}}"));
    api.onConfigLoaded(cfg, services);

    std::vector<DeviceInfo> devices;
    ApiError err;
    TEST_ASSERT_FALSE(api.listDevices(devices, &err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::ApiTransport, (int)err.code);
    TEST_ASSERT_EQUAL_INT32(0, (int32_t)err.httpStatus);

    std::string body;
    TEST_ASSERT_FALSE(api.fetchStatus("", body, &err));
    api.shutdown();
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_parse_page_reads_items_and_next_link);
    RUN_TEST(test_parse_page_appends_and_detects_last_page);
    RUN_TEST(test_parse_page_rejects_bad_json);
    RUN_TEST(test_module_registers_service_and_reads_token);
    RUN_TEST(test_unreachable_api_reports_transport_error);
    return UNITY_END();
}
