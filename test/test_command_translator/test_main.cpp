#include <unity.h>

#include <string>

#include "Modules/BridgeModule/CommandTranslator.h"

void setUp() {}
void tearDown() {}

void test_device_text_verbs()
{
    std::string env;
    TEST_ASSERT_TRUE(translateDeviceCommand("on", env));
    TEST_ASSERT_EQUAL_STRING(
        "{\"commands\":[{\"component\":\"main\",\"capability\":\"switch\",\"command\":\"on\"}]}", env.c_str());

    TEST_ASSERT_TRUE(translateDeviceCommand("  UNLOCK \n", env));
    TEST_ASSERT_EQUAL_STRING(
        "{\"commands\":[{\"component\":\"main\",\"capability\":\"lock\",\"command\":\"unlock\"}]}", env.c_str());

    TEST_ASSERT_TRUE(translateDeviceCommand("close", env));
    TEST_ASSERT_EQUAL_STRING(
        "{\"commands\":[{\"component\":\"main\",\"capability\":\"doorControl\",\"command\":\"close\"}]}", env.c_str());
}

void test_device_envelope_passthrough()
{
    std::string env;
    TEST_ASSERT_TRUE(translateDeviceCommand(
        "{\"commands\":[{\"component\":\"main\",\"capability\":\"switch\",\"command\":\"off\"}]}", env));
    TEST_ASSERT_EQUAL_STRING(
        "{\"commands\":[{\"component\":\"main\",\"capability\":\"switch\",\"command\":\"off\"}]}", env.c_str());
}

void test_device_shorthand_gets_default_component()
{
    std::string env;
    TEST_ASSERT_TRUE(translateDeviceCommand(
        "{\"capability\":\"switchLevel\",\"command\":\"setLevel\",\"arguments\":[30]}", env));
    TEST_ASSERT_EQUAL_STRING(
        "{\"commands\":[{\"capability\":\"switchLevel\",\"command\":\"setLevel\",\"arguments\":[30],\"component\":\"main\"}]}",
        env.c_str());

    TEST_ASSERT_TRUE(translateDeviceCommand(
        "{\"component\":\"sub\",\"capability\":\"switch\",\"command\":\"on\"}", env));
    TEST_ASSERT_EQUAL_STRING(
        "{\"commands\":[{\"component\":\"sub\",\"capability\":\"switch\",\"command\":\"on\"}]}", env.c_str());
}

void test_device_rejects_empty_and_unknown()
{
    std::string env;
    ErrorCode err = ErrorCode::None;
    TEST_ASSERT_FALSE(translateDeviceCommand("   ", env, &err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::EmptyCmdPayload, (int)err);
    TEST_ASSERT_TRUE(env.empty());

    TEST_ASSERT_FALSE(translateDeviceCommand("dance", env, &err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::BadCmdPayload, (int)err);

    // object without a recognizable shape
    TEST_ASSERT_FALSE(translateDeviceCommand("{\"command\":\"on\"}", env, &err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::BadCmdPayload, (int)err);

    TEST_ASSERT_FALSE(translateDeviceCommand(nullptr, env, &err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::EmptyCmdPayload, (int)err);
}

void test_capability_text_verbs()
{
    std::string env;
    TEST_ASSERT_TRUE(translateCapabilityCommand("ON", "main", "switch", env));
    TEST_ASSERT_EQUAL_STRING(
        "{\"commands\":[{\"component\":\"main\",\"capability\":\"switch\",\"command\":\"on\"}]}", env.c_str());

    TEST_ASSERT_TRUE(translateCapabilityCommand("locked", "main", "lock", env));
    TEST_ASSERT_EQUAL_STRING(
        "{\"commands\":[{\"component\":\"main\",\"capability\":\"lock\",\"command\":\"lock\"}]}", env.c_str());

    TEST_ASSERT_TRUE(translateCapabilityCommand("off", "main", "audioMute", env));
    TEST_ASSERT_EQUAL_STRING(
        "{\"commands\":[{\"component\":\"main\",\"capability\":\"audioMute\",\"command\":\"unmute\"}]}", env.c_str());
}

void test_capability_number_sets_level()
{
    std::string env;
    TEST_ASSERT_TRUE(translateCapabilityCommand("42", "main", "switchLevel", env));
    TEST_ASSERT_EQUAL_STRING(
        "{\"commands\":[{\"component\":\"main\",\"capability\":\"switchLevel\",\"command\":\"setLevel\",\"arguments\":[42]}]}",
        env.c_str());

    TEST_ASSERT_TRUE(translateCapabilityCommand("12.5", "sub", "audioVolume", env));
    TEST_ASSERT_EQUAL_STRING(
        "{\"commands\":[{\"component\":\"sub\",\"capability\":\"audioVolume\",\"command\":\"setLevel\",\"arguments\":[12.5]}]}",
        env.c_str());
}

void test_capability_argument_verbs()
{
    std::string env;
    TEST_ASSERT_TRUE(translateCapabilityCommand("HDMI2", "main", "samsungvd.mediaInputSource", env));
    TEST_ASSERT_EQUAL_STRING(
        "{\"commands\":[{\"component\":\"main\",\"capability\":\"samsungvd.mediaInputSource\","
        "\"command\":\"setInputSource\",\"arguments\":[\"HDMI2\"]}]}",
        env.c_str());

    // a leading '+' is not a JSON number but still parses as an integer argument
    TEST_ASSERT_TRUE(translateCapabilityCommand("+15", "main", "audioVolume", env));
    TEST_ASSERT_EQUAL_STRING(
        "{\"commands\":[{\"component\":\"main\",\"capability\":\"audioVolume\",\"command\":\"setVolume\",\"arguments\":[15]}]}",
        env.c_str());
}

void test_capability_object_payloads()
{
    std::string env;
    TEST_ASSERT_TRUE(translateCapabilityCommand(
        "{\"command\":\"setColor\",\"arguments\":[{\"hue\":10}]}", "main", "colorControl", env));
    TEST_ASSERT_EQUAL_STRING(
        "{\"commands\":[{\"component\":\"main\",\"capability\":\"colorControl\",\"command\":\"setColor\","
        "\"arguments\":[{\"hue\":10}]}]}",
        env.c_str());

    TEST_ASSERT_TRUE(translateCapabilityCommand(
        "{\"commands\":[{\"component\":\"x\",\"capability\":\"y\",\"command\":\"z\"}]}", "main", "switch", env));
    TEST_ASSERT_EQUAL_STRING(
        "{\"commands\":[{\"component\":\"x\",\"capability\":\"y\",\"command\":\"z\"}]}", env.c_str());
}

void test_capability_unknown_text_is_verbatim_command()
{
    std::string env;
    TEST_ASSERT_TRUE(translateCapabilityCommand("foo", "main", "tvChannel", env));
    TEST_ASSERT_EQUAL_STRING(
        "{\"commands\":[{\"component\":\"main\",\"capability\":\"tvChannel\",\"command\":\"foo\"}]}", env.c_str());

    // trailing text makes it non-JSON
    TEST_ASSERT_TRUE(translateCapabilityCommand("42 apples", "main", "tvChannel", env));
    TEST_ASSERT_EQUAL_STRING(
        "{\"commands\":[{\"component\":\"main\",\"capability\":\"tvChannel\",\"command\":\"42 apples\"}]}", env.c_str());

    ErrorCode err = ErrorCode::None;
    TEST_ASSERT_FALSE(translateCapabilityCommand("", "main", "switch", env, &err));
    TEST_ASSERT_EQUAL_INT((int)ErrorCode::EmptyCmdPayload, (int)err);
}

void test_json_number_grammar()
{
    TEST_ASSERT_TRUE(isJsonNumberText("0"));
    TEST_ASSERT_TRUE(isJsonNumberText("-3"));
    TEST_ASSERT_TRUE(isJsonNumberText("1.25e-3"));
    TEST_ASSERT_FALSE(isJsonNumberText("01"));
    TEST_ASSERT_FALSE(isJsonNumberText("1."));
    TEST_ASSERT_FALSE(isJsonNumberText("+1"));
    TEST_ASSERT_FALSE(isJsonNumberText(".5"));
    TEST_ASSERT_FALSE(isJsonNumberText("1e"));
    TEST_ASSERT_FALSE(isJsonNumberText(""));
    TEST_ASSERT_FALSE(isJsonNumberText("NaN"));
}

int main()
{
    UNITY_BEGIN();
    RUN_TEST(test_device_text_verbs);
    RUN_TEST(test_device_envelope_passthrough);
    RUN_TEST(test_device_shorthand_gets_default_component);
    RUN_TEST(test_device_rejects_empty_and_unknown);
    RUN_TEST(test_capability_text_verbs);
    RUN_TEST(test_capability_number_sets_level);
    RUN_TEST(test_capability_argument_verbs);
    RUN_TEST(test_capability_object_payloads);
    RUN_TEST(test_capability_unknown_text_is_verbatim_command);
    RUN_TEST(test_json_number_grammar);
    return UNITY_END();
}
