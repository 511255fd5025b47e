#include <unity.h>

#include <deque>
#include <string.h>
#include <string>
#include <vector>

#include "Core/ConfigStore.h"
#include "Core/ServiceRegistry.h"
#include "Modules/BridgeModule/BridgeModule.h"

void setUp() {}
void tearDown() {}

struct Inbound {
    std::string topic;
    std::string payload;
};

static std::vector<std::string> gPublished;
static std::deque<Inbound> gInbound;
static std::vector<std::string> gCommandsFor;
static std::vector<DeviceInfo> gDevices;
static bool gConnected = true;
static bool gListFails = false;
static int gHaCalls = 0;

static bool fakePublish(void*, const char* topic, const char*, int, bool)
{
    gPublished.push_back(topic);
    return true;
}
static const char* fakeBase(void*) { return "st"; }
static bool fakeConnected(void*) { return gConnected; }
static bool fakeTake(void*, MqttRxMessage& out, uint32_t)
{
    if (gInbound.empty()) return false;
    strncpy(out.topic, gInbound.front().topic.c_str(), sizeof(out.topic) - 1);
    out.topic[sizeof(out.topic) - 1] = '\0';
    strncpy(out.payload, gInbound.front().payload.c_str(), sizeof(out.payload) - 1);
    out.payload[sizeof(out.payload) - 1] = '\0';
    gInbound.pop_front();
    return true;
}

static bool fakeList(void*, std::vector<DeviceInfo>& out, ApiError* err)
{
    if (gListFails) {
        if (err) {
            err->code = ErrorCode::ApiHttpStatus;
            err->httpStatus = 401;
        }
        return false;
    }
    out = gDevices;
    return true;
}
static bool fakeFetch(void*, const char*, std::string& body, ApiError*)
{
    body = "{\"components\":{\"main\":{\"switch\":{\"switch\":{\"value\":\"on\"}}}}}";
    return true;
}
static bool fakeSend(void*, const char* deviceId, const char*, ApiError*)
{
    gCommandsFor.push_back(deviceId);
    return true;
}
static int fakeHa(void*, const DeviceInfo&, const AttributeMap&)
{
    gHaCalls++;
    return 0;
}

static void reset()
{
    gPublished.clear();
    gInbound.clear();
    gCommandsFor.clear();
    gDevices.clear();
    gConnected = true;
    gListFails = false;
    gHaCalls = 0;

    DeviceInfo a;
    a.deviceId = "a";
    a.label = "Lamp";
    DeviceInfo b;
    b.deviceId = "b";
    gDevices.push_back(a);
    gDevices.push_back(b);
}

static size_t countTopic(const char* topic)
{
    size_t n = 0;
    for (const std::string& t : gPublished) {
        if (t == topic) ++n;
    }
    return n;
}

struct Fixture {
    MqttService mqttSvc{fakePublish, fakeBase, fakeConnected, fakeTake, nullptr};
    DeviceApiService apiSvc{fakeList, fakeFetch, fakeSend, nullptr};
    HAService haSvc{fakeHa, nullptr};
    StateStore store;
    StateStoreService storeSvc{&store};
    ConfigStore cfg;
    ServiceRegistry services;
    BridgeModule bridge;

    explicit Fixture(const char* json = nullptr) {
        services.add("mqtt", &mqttSvc);
        services.add("devapi", &apiSvc);
        services.add("ha", &haSvc);
        services.add("statestore", &storeSvc);
        bridge.init(cfg, services);
        if (json) cfg.applyJson(json);
        bridge.onConfigLoaded(cfg, services);
    }
};

void test_poll_interval_floor()
{
    reset();
    Fixture low("{\"bridge\":{\"poll_interval_s\":1}}");
    TEST_ASSERT_EQUAL_INT32(5, low.bridge.pollIntervalS());

    Fixture dflt;
    TEST_ASSERT_EQUAL_INT32(30, dflt.bridge.pollIntervalS());
}

void test_poll_interval_ceiling()
{
    reset();
    Fixture high("{\"bridge\":{\"poll_interval_s\":5000000}}");
    TEST_ASSERT_EQUAL_INT32(86400, high.bridge.pollIntervalS());

    Fixture day("{\"bridge\":{\"poll_interval_s\":86400}}");
    TEST_ASSERT_EQUAL_INT32(86400, day.bridge.pollIntervalS());
}

void test_poll_cycle_publishes_every_device()
{
    reset();
    Fixture f;
    TEST_ASSERT_TRUE(f.bridge.pollCycle());
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)countTopic("st/a/state"));
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)countTopic("st/b/state"));
    TEST_ASSERT_EQUAL_UINT32(2, (uint32_t)f.store.deviceCount());
    TEST_ASSERT_EQUAL_STRING("Lamp", f.store.findDevice("a")->displayName().c_str());
    TEST_ASSERT_EQUAL_INT(2, gHaCalls);

    // second cycle with unchanged status publishes nothing
    gPublished.clear();
    TEST_ASSERT_TRUE(f.bridge.pollCycle());
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)gPublished.size());
}

void test_listing_failure_is_not_fatal()
{
    reset();
    gListFails = true;
    Fixture f;
    TEST_ASSERT_FALSE(f.bridge.pollCycle());
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)gPublished.size());

    gListFails = false;
    TEST_ASSERT_TRUE(f.bridge.pollCycle());
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)countTopic("st/a/state"));
}

void test_inbound_commands_are_drained_between_devices()
{
    reset();
    Fixture f;
    gInbound.push_back({"st/b/set", "off"});
    gInbound.push_back({"st/a/main/switch/set", "bogus-but-verbatim"});
    gInbound.push_back({"other/a/set", "on"});

    TEST_ASSERT_TRUE(f.bridge.pollCycle());
    TEST_ASSERT_TRUE(gInbound.empty());
    TEST_ASSERT_EQUAL_UINT32(2, (uint32_t)gCommandsFor.size());
    TEST_ASSERT_EQUAL_STRING("b", gCommandsFor[0].c_str());
    TEST_ASSERT_EQUAL_STRING("a", gCommandsFor[1].c_str());
}

void test_loop_waits_for_broker()
{
    reset();
    gConnected = false;
    Fixture f;
    gInbound.push_back({"st/a/set", "on"});

    f.bridge.loop();
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)gCommandsFor.size());
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)countTopic("st/b/state"));

    gConnected = true;
    f.bridge.loop();
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)countTopic("st/b/state"));

    // interval not elapsed: no second listing
    gPublished.clear();
    f.bridge.loop();
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)gPublished.size());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_poll_interval_floor);
    RUN_TEST(test_poll_interval_ceiling);
    RUN_TEST(test_poll_cycle_publishes_every_device);
    RUN_TEST(test_listing_failure_is_not_fatal);
    RUN_TEST(test_inbound_commands_are_drained_between_devices);
    RUN_TEST(test_loop_waits_for_broker);
    return UNITY_END();
}
