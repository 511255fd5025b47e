#include <unity.h>

#include <string.h>

#include "Core/ConfigStore.h"
#include "Core/MqttTopics.h"
#include "Core/ServiceRegistry.h"
#include "Modules/Network/MQTTModule/MQTTModule.h"

void setUp() {}
void tearDown() {}

void test_topic_builders()
{
    TEST_ASSERT_EQUAL_STRING("smartthings/d1/state",
                             MqttTopics::deviceTopic("smartthings", "d1", MqttTopics::SuffixState).c_str());
    TEST_ASSERT_EQUAL_STRING("smartthings/d1/availability",
                             MqttTopics::deviceTopic("smartthings", "d1", MqttTopics::SuffixAvailability).c_str());
    TEST_ASSERT_EQUAL_STRING("smartthings/d1/main/switch/switch/state",
                             MqttTopics::attributeStateTopic("smartthings", "d1", "main", "switch", "switch").c_str());
    TEST_ASSERT_EQUAL_STRING("smartthings/d1/main/switchLevel/set",
                             MqttTopics::capabilitySetTopic("smartthings", "d1", "main", "switchLevel").c_str());
    TEST_ASSERT_EQUAL_STRING("smartthings/bridge/status", MqttTopics::bridgeStatusTopic("smartthings").c_str());
    TEST_ASSERT_EQUAL_STRING("homeassistant/sensor/smartthings_d1_x/config",
                             MqttTopics::discoveryConfigTopic("homeassistant", "sensor", "smartthings_d1_x").c_str());
}

void test_normalize_base_topic()
{
    char t[32];
    strcpy(t, "/smartthings/");
    MQTTModule::normalizeBaseTopic(t);
    TEST_ASSERT_EQUAL_STRING("smartthings", t);

    strcpy(t, "//home/st//");
    MQTTModule::normalizeBaseTopic(t);
    TEST_ASSERT_EQUAL_STRING("home/st", t);

    strcpy(t, "///");
    MQTTModule::normalizeBaseTopic(t);
    TEST_ASSERT_EQUAL_STRING("", t);

    MQTTModule::normalizeBaseTopic(nullptr);
}

void test_module_service_before_connect()
{
    ConfigStore cfg;
    ServiceRegistry services;
    MQTTModule mqttModule;

    mqttModule.init(cfg, services);
    TEST_ASSERT_TRUE(cfg.applyJson("{\"mqtt\":{\"prefix\":\"/\",\"host\":\"127.0.0.1\"}}"));
    mqttModule.onConfigLoaded(cfg, services);

    const MqttService* svc = services.get<MqttService>("mqtt");
    TEST_ASSERT_NOT_NULL(svc);
    TEST_ASSERT_EQUAL_STRING("smartthings", svc->baseTopic(svc->ctx));
    TEST_ASSERT_FALSE(svc->isConnected(svc->ctx));
    TEST_ASSERT_FALSE(svc->publish(svc->ctx, "smartthings/x/state", "{}", 0, true));

    MqttRxMessage msg;
    TEST_ASSERT_FALSE(svc->takeMessage(svc->ctx, msg, 0));
    mqttModule.shutdown();
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_topic_builders);
    RUN_TEST(test_normalize_base_topic);
    RUN_TEST(test_module_service_before_connect);
    return UNITY_END();
}
