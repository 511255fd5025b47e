#include <unity.h>

#include <string>
#include <vector>

#include "Modules/BridgeModule/StatePublisher.h"

void setUp() {}
void tearDown() {}

struct Published {
    std::string topic;
    std::string payload;
    int qos;
    bool retain;
};

struct FakeBroker {
    std::vector<Published> sent;
    bool failAll = false;
    bool failStateTopic = false;
    std::string failTopic;
};

struct FakeApi {
    std::string status;
    bool fail = false;
    int fetches = 0;
};

struct FakeHa {
    int calls = 0;
    std::string lastDevice;
    std::string lastLabel;
    size_t lastAttrCount = 0;
};

static bool fakePublish(void* ctx, const char* topic, const char* payload, int qos, bool retain)
{
    FakeBroker* b = static_cast<FakeBroker*>(ctx);
    if (b->failAll) return false;
    const std::string t(topic);
    if (!b->failTopic.empty() && t == b->failTopic) return false;
    if (b->failStateTopic && t.size() > 6 && t.compare(t.size() - 6, 6, "/state") == 0 &&
        t.find("/main/") == std::string::npos) {
        return false;
    }
    b->sent.push_back({t, payload, qos, retain});
    return true;
}

static const char* fakeBase(void*) { return "smartthings"; }
static bool fakeConnected(void*) { return true; }
static bool fakeTake(void*, MqttRxMessage&, uint32_t) { return false; }

static bool fakeFetch(void* ctx, const char*, std::string& body, ApiError* err)
{
    FakeApi* api = static_cast<FakeApi*>(ctx);
    api->fetches++;
    if (api->fail) {
        if (err) {
            err->code = ErrorCode::ApiHttpStatus;
            err->httpStatus = 500;
            err->detail = "boom";
        }
        return false;
    }
    body = api->status;
    return true;
}

static int fakeHaPublish(void* ctx, const DeviceInfo& device, const AttributeMap& attrs)
{
    FakeHa* ha = static_cast<FakeHa*>(ctx);
    ha->calls++;
    ha->lastDevice = device.deviceId;
    ha->lastLabel = device.displayName();
    ha->lastAttrCount = attrs.size();
    return 0;
}

static int64_t gNow = 1700000000;
static int64_t fakeClock() { return gNow; }

static const char* kStatusA =
    "{\"components\":{\"main\":{"
      "\"switch\":{\"switch\":{\"value\":\"on\"}},"
      "\"switchLevel\":{\"level\":{\"value\":40}}"
    "}}}";

static const char* kStatusAReordered =
    "{\"components\":{\"main\":{"
      "\"switchLevel\":{\"level\":{\"value\":40}},"
      "\"switch\":{\"switch\":{\"value\":\"on\"}}"
    "}}}";

static const char* kStatusB =
    "{\"components\":{\"main\":{"
      "\"switch\":{\"switch\":{\"value\":\"off\"}},"
      "\"switchLevel\":{\"level\":{\"value\":40}}"
    "}}}";

struct Fixture {
    FakeBroker broker;
    FakeApi api;
    FakeHa ha;
    MqttService mqttSvc{fakePublish, fakeBase, fakeConnected, fakeTake, nullptr};
    DeviceApiService apiSvc{nullptr, fakeFetch, nullptr, nullptr};
    HAService haSvc{fakeHaPublish, nullptr};
    StateStore store;
    StatePublisher publisher;

    Fixture() : publisher(store, &mqttSvc, &apiSvc, &haSvc) {
        mqttSvc.ctx = &broker;
        apiSvc.ctx = &api;
        haSvc.ctx = &ha;
        publisher.setClock(fakeClock);
        DeviceInfo d;
        d.deviceId = "dev1";
        d.label = "Lamp";
        store.upsertDevice(d);
    }

    const Published* find(const std::string& topic) const {
        for (const Published& p : broker.sent) {
            if (p.topic == topic) return &p;
        }
        return nullptr;
    }
};

void test_encode_state_adds_legacy_aliases_and_timestamp()
{
    AttributeMap attrs;
    Attribute a;
    a.component = "main";
    a.capability = "switch";
    a.attribute = "switch";
    a.value.kind = AttributeKind::Text;
    a.value.text = "on";
    a.value.json = "\"on\"";
    attrs[a.key()] = a;

    Attribute b;
    b.component = "sub";
    b.capability = "battery";
    b.attribute = "battery";
    b.value.kind = AttributeKind::Number;
    b.value.json = "80";
    attrs[b.key()] = b;

    const std::string plain = StatePublisher::encodeState("dev1", "Lamp", attrs, false, 0);
    TEST_ASSERT_EQUAL_STRING(
        "{\"device_id\":\"dev1\",\"main.switch.switch\":\"on\",\"name\":\"Lamp\","
        "\"sub.battery.battery\":80,\"switch.switch\":\"on\"}",
        plain.c_str());

    const std::string stamped = StatePublisher::encodeState("dev1", "Lamp", attrs, true, 42);
    TEST_ASSERT_TRUE(stamped.find("\"updated_at\":42") != std::string::npos);
}

void test_first_publish_sends_state_attributes_and_online()
{
    Fixture f;
    f.api.status = kStatusA;
    TEST_ASSERT_TRUE(f.publisher.publishDeviceState("dev1", false));

    const Published* state = f.find("smartthings/dev1/state");
    TEST_ASSERT_NOT_NULL(state);
    TEST_ASSERT_TRUE(state->retain);
    TEST_ASSERT_TRUE(state->payload.find("\"updated_at\":1700000000") != std::string::npos);
    TEST_ASSERT_TRUE(state->payload.find("\"name\":\"Lamp\"") != std::string::npos);

    const Published* sw = f.find("smartthings/dev1/main/switch/switch/state");
    TEST_ASSERT_NOT_NULL(sw);
    TEST_ASSERT_EQUAL_STRING("\"on\"", sw->payload.c_str());
    const Published* level = f.find("smartthings/dev1/main/switchLevel/level/state");
    TEST_ASSERT_NOT_NULL(level);
    TEST_ASSERT_EQUAL_STRING("40", level->payload.c_str());

    const Published* avail = f.find("smartthings/dev1/availability");
    TEST_ASSERT_NOT_NULL(avail);
    TEST_ASSERT_EQUAL_STRING("online", avail->payload.c_str());
    TEST_ASSERT_EQUAL_INT(1, avail->qos);

    TEST_ASSERT_EQUAL_INT(1, f.ha.calls);
    TEST_ASSERT_EQUAL_STRING("Lamp", f.ha.lastLabel.c_str());
    TEST_ASSERT_EQUAL_UINT32(2, (uint32_t)f.ha.lastAttrCount);
}

void test_unchanged_state_publishes_nothing()
{
    Fixture f;
    f.api.status = kStatusA;
    TEST_ASSERT_TRUE(f.publisher.publishDeviceState("dev1", false));
    f.broker.sent.clear();

    gNow += 30;
    TEST_ASSERT_TRUE(f.publisher.publishDeviceState("dev1", false));
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)f.broker.sent.size());
    TEST_ASSERT_EQUAL_INT(1, f.ha.calls);
}

void test_key_order_does_not_change_fingerprint()
{
    Fixture f;
    f.api.status = kStatusA;
    TEST_ASSERT_TRUE(f.publisher.publishDeviceState("dev1", false));
    f.broker.sent.clear();

    f.api.status = kStatusAReordered;
    TEST_ASSERT_TRUE(f.publisher.publishDeviceState("dev1", false));
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)f.broker.sent.size());
}

void test_changed_attribute_publishes_only_that_sub_topic()
{
    Fixture f;
    f.api.status = kStatusA;
    TEST_ASSERT_TRUE(f.publisher.publishDeviceState("dev1", false));
    f.broker.sent.clear();

    f.api.status = kStatusB;
    TEST_ASSERT_TRUE(f.publisher.publishDeviceState("dev1", false));
    TEST_ASSERT_NOT_NULL(f.find("smartthings/dev1/state"));
    TEST_ASSERT_NOT_NULL(f.find("smartthings/dev1/main/switch/switch/state"));
    TEST_ASSERT_NULL(f.find("smartthings/dev1/main/switchLevel/level/state"));
    TEST_ASSERT_NOT_NULL(f.find("smartthings/dev1/availability"));
}

void test_force_republishes_everything()
{
    Fixture f;
    f.api.status = kStatusA;
    TEST_ASSERT_TRUE(f.publisher.publishDeviceState("dev1", false));
    f.broker.sent.clear();

    TEST_ASSERT_TRUE(f.publisher.publishDeviceState("dev1", true));
    TEST_ASSERT_NOT_NULL(f.find("smartthings/dev1/state"));
    TEST_ASSERT_NOT_NULL(f.find("smartthings/dev1/main/switch/switch/state"));
    TEST_ASSERT_NOT_NULL(f.find("smartthings/dev1/main/switchLevel/level/state"));
    TEST_ASSERT_NOT_NULL(f.find("smartthings/dev1/availability"));
}

void test_fetch_failure_marks_offline_and_keeps_caches()
{
    Fixture f;
    f.api.status = kStatusA;
    TEST_ASSERT_TRUE(f.publisher.publishDeviceState("dev1", false));
    f.broker.sent.clear();

    f.api.fail = true;
    TEST_ASSERT_FALSE(f.publisher.publishDeviceState("dev1", false));
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)f.broker.sent.size());
    TEST_ASSERT_EQUAL_STRING("smartthings/dev1/availability", f.broker.sent[0].topic.c_str());
    TEST_ASSERT_EQUAL_STRING("offline", f.broker.sent[0].payload.c_str());
    TEST_ASSERT_TRUE(f.broker.sent[0].retain);
    f.broker.sent.clear();

    // cached fingerprint survived: only availability is restored
    f.api.fail = false;
    TEST_ASSERT_TRUE(f.publisher.publishDeviceState("dev1", false));
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)f.broker.sent.size());
    TEST_ASSERT_EQUAL_STRING("smartthings/dev1/availability", f.broker.sent[0].topic.c_str());
    TEST_ASSERT_EQUAL_STRING("online", f.broker.sent[0].payload.c_str());
    TEST_ASSERT_EQUAL_INT(1, f.broker.sent[0].qos);
    f.broker.sent.clear();

    TEST_ASSERT_TRUE(f.publisher.publishDeviceState("dev1", false));
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)f.broker.sent.size());
}

void test_undelivered_online_is_retried()
{
    Fixture f;
    f.api.status = kStatusA;
    f.broker.failTopic = "smartthings/dev1/availability";
    TEST_ASSERT_TRUE(f.publisher.publishDeviceState("dev1", false));
    TEST_ASSERT_NULL(f.find("smartthings/dev1/availability"));
    TEST_ASSERT_FALSE(f.store.isOnline("dev1"));
    f.broker.sent.clear();

    f.broker.failTopic.clear();
    TEST_ASSERT_TRUE(f.publisher.publishDeviceState("dev1", false));
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)f.broker.sent.size());
    TEST_ASSERT_EQUAL_STRING("online", f.broker.sent[0].payload.c_str());
    TEST_ASSERT_TRUE(f.store.isOnline("dev1"));
}

void test_failed_sub_topic_is_retried_next_poll()
{
    Fixture f;
    f.api.status = kStatusA;
    f.broker.failTopic = "smartthings/dev1/main/switchLevel/level/state";
    TEST_ASSERT_TRUE(f.publisher.publishDeviceState("dev1", false));
    TEST_ASSERT_NOT_NULL(f.find("smartthings/dev1/main/switch/switch/state"));
    TEST_ASSERT_NULL(f.find("smartthings/dev1/main/switchLevel/level/state"));
    f.broker.sent.clear();

    f.broker.failTopic.clear();
    TEST_ASSERT_TRUE(f.publisher.publishDeviceState("dev1", false));
    const Published* level = f.find("smartthings/dev1/main/switchLevel/level/state");
    TEST_ASSERT_NOT_NULL(level);
    TEST_ASSERT_EQUAL_STRING("40", level->payload.c_str());
    TEST_ASSERT_NULL(f.find("smartthings/dev1/main/switch/switch/state"));
    f.broker.sent.clear();

    TEST_ASSERT_TRUE(f.publisher.publishDeviceState("dev1", false));
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)f.broker.sent.size());
}

void test_unparseable_status_marks_offline()
{
    Fixture f;
    f.api.status = "not json";
    TEST_ASSERT_FALSE(f.publisher.publishDeviceState("dev1", false));
    TEST_ASSERT_EQUAL_UINT32(1, (uint32_t)f.broker.sent.size());
    TEST_ASSERT_EQUAL_STRING("offline", f.broker.sent[0].payload.c_str());
    TEST_ASSERT_EQUAL_INT(0, f.ha.calls);
}

void test_failed_state_publish_does_not_update_fingerprint()
{
    Fixture f;
    f.api.status = kStatusA;
    f.broker.failStateTopic = true;
    TEST_ASSERT_FALSE(f.publisher.publishDeviceState("dev1", false));
    TEST_ASSERT_EQUAL_UINT32(0, (uint32_t)f.store.attributeCount());

    f.broker.failStateTopic = false;
    TEST_ASSERT_TRUE(f.publisher.publishDeviceState("dev1", false));
    TEST_ASSERT_NOT_NULL(f.find("smartthings/dev1/state"));
    TEST_ASSERT_EQUAL_UINT32(2, (uint32_t)f.store.attributeCount());
}

void test_unknown_device_uses_id_as_name()
{
    Fixture f;
    f.api.status = kStatusA;
    TEST_ASSERT_TRUE(f.publisher.publishDeviceState("ghost", false));
    const Published* state = f.find("smartthings/ghost/state");
    TEST_ASSERT_NOT_NULL(state);
    TEST_ASSERT_TRUE(state->payload.find("\"name\":\"ghost\"") != std::string::npos);
    TEST_ASSERT_EQUAL_STRING("ghost", f.ha.lastDevice.c_str());
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_encode_state_adds_legacy_aliases_and_timestamp);
    RUN_TEST(test_first_publish_sends_state_attributes_and_online);
    RUN_TEST(test_unchanged_state_publishes_nothing);
    RUN_TEST(test_key_order_does_not_change_fingerprint);
    RUN_TEST(test_changed_attribute_publishes_only_that_sub_topic);
    RUN_TEST(test_force_republishes_everything);
    RUN_TEST(test_fetch_failure_marks_offline_and_keeps_caches);
    RUN_TEST(test_undelivered_online_is_retried);
    RUN_TEST(test_failed_sub_topic_is_retried_next_poll);
    RUN_TEST(test_unparseable_status_marks_offline);
    RUN_TEST(test_failed_state_publish_does_not_update_fingerprint);
    RUN_TEST(test_unknown_device_uses_id_as_name);
    return UNITY_END();
}
