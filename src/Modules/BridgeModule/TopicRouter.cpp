/**
 * @file TopicRouter.cpp
 * @brief Implementation file.
 */

#include "Modules/BridgeModule/TopicRouter.h"
#include "Modules/BridgeModule/CommandTranslator.h"
#include "Core/MqttTopics.h"
#include <string.h>
#include <vector>
#define LOG_TAG "TopicRtr"
#include "Core/ModuleLog.h"

RoutedTopic classifyTopic(const std::string& base, const char* topic)
{
    RoutedTopic out;
    if (!topic || base.empty()) return out;

    const size_t baseLen = base.size();
    if (strncmp(topic, base.c_str(), baseLen) != 0 || topic[baseLen] != '/') return out;

    std::vector<std::string> parts;
    const char* p = topic + baseLen + 1;
    for (;;) {
        const char* slash = strchr(p, '/');
        if (!slash) {
            parts.emplace_back(p);
            break;
        }
        parts.emplace_back(p, (size_t)(slash - p));
        p = slash + 1;
    }

    if (parts.size() == 4 && parts[3] == MqttTopics::SuffixSet) {
        out.kind = TopicKind::CapabilitySet;
        out.deviceId = parts[0];
        out.component = parts[1];
        out.capability = parts[2];
        return out;
    }
    if (parts.size() >= 2) {
        out.kind = TopicKind::Device;
        out.deviceId = parts[0];
    }
    return out;
}

bool TopicRouter::handle(const std::string& base, const char* topic, const char* payload)
{
    const RoutedTopic route = classifyTopic(base, topic);
    if (route.kind == TopicKind::Ignored || route.deviceId.empty()) {
        LOGD("%s %s", errorCodeStr(ErrorCode::UnknownTopic), topic ? topic : "");
        return false;
    }

    std::string envelope;
    ErrorCode code = ErrorCode::None;
    bool ok = false;
    if (route.kind == TopicKind::CapabilitySet) {
        ok = translateCapabilityCommand(payload, route.component.c_str(), route.capability.c_str(), envelope, &code);
    } else {
        ok = translateDeviceCommand(payload, envelope, &code);
    }
    if (!ok) {
        LOGW("Ignoring empty or invalid command on %s (%s)", topic, errorCodeStr(code));
        return false;
    }

    if (!_api || !_api->sendCommands) return false;

    ApiError apiErr;
    if (!_api->sendCommands(_api->ctx, route.deviceId.c_str(), envelope.c_str(), &apiErr)) {
        char label[48];
        writeErrorLabel(label, sizeof(label), apiErr.code, apiErr.httpStatus);
        LOGE("Command failed for %s: %s %s", route.deviceId.c_str(), label, apiErr.detail.c_str());
        return false;
    }

    LOGI("Command sent to device %s: %s", route.deviceId.c_str(), envelope.c_str());
    _publisher.publishDeviceState(route.deviceId, true);
    return true;
}
