/**
 * @file CommandTranslator.cpp
 * @brief Implementation file.
 */

#include "Modules/BridgeModule/CommandTranslator.h"
#include "Core/SystemLimits.h"
#include <ArduinoJson.h>
#include <ctype.h>
#include <errno.h>
#include <math.h>
#include <stdlib.h>
#include <string.h>

struct DeviceTextVerb {
    const char* text;
    const char* capability;
};

struct CapabilityTextVerb {
    const char* capability;
    const char* text;
    const char* verb;
};

struct CapabilityArgumentVerb {
    const char* capability;
    const char* verb;
};

static const DeviceTextVerb kDeviceTextVerbs[] = {
    {"on",     "switch"},
    {"off",    "switch"},
    {"lock",   "lock"},
    {"unlock", "lock"},
    {"open",   "doorControl"},
    {"close",  "doorControl"},
};

static const CapabilityTextVerb kCapabilityTextVerbs[] = {
    {"switch",      "on",       "on"},
    {"switch",      "off",      "off"},
    {"lock",        "lock",     "lock"},
    {"lock",        "unlock",   "unlock"},
    {"lock",        "locked",   "lock"},
    {"lock",        "unlocked", "unlock"},
    {"doorControl", "open",     "open"},
    {"doorControl", "close",    "close"},
    {"doorControl", "closed",   "close"},
    {"audioMute",   "mute",     "mute"},
    {"audioMute",   "unmute",   "unmute"},
    {"audioMute",   "muted",    "mute"},
    {"audioMute",   "unmuted",  "unmute"},
    {"audioMute",   "on",       "mute"},
    {"audioMute",   "off",      "unmute"},
};

static const CapabilityArgumentVerb kCapabilityArgumentVerbs[] = {
    {"audioVolume",                "setVolume"},
    {"switchLevel",                "setLevel"},
    {"mediaInputSource",           "setInputSource"},
    {"samsungvd.mediaInputSource", "setInputSource"},
    {"custom.picturemode",         "setPictureMode"},
    {"samsungvd.pictureMode",      "setPictureMode"},
    {"custom.soundmode",           "setSoundMode"},
    {"samsungvd.soundMode",        "setSoundMode"},
    {"ovenMode",                   "setOvenMode"},
    {"samsungce.ovenMode",         "setOvenMode"},
};

static const char* kDefaultComponent = "main";

static void setErr(ErrorCode* err, ErrorCode code)
{
    if (err) *err = code;
}

static std::string trimmed(const char* in)
{
    if (!in) return std::string();
    const char* b = in;
    while (*b && isspace((unsigned char)*b)) ++b;
    const char* e = b + strlen(b);
    while (e > b && isspace((unsigned char)e[-1])) --e;
    return std::string(b, (size_t)(e - b));
}

static std::string lowered(const std::string& in)
{
    std::string out(in);
    for (char& c : out) c = (char)tolower((unsigned char)c);
    return out;
}

bool isJsonNumberText(const std::string& text)
{
    size_t i = 0;
    const size_t n = text.size();
    if (i < n && text[i] == '-') ++i;
    if (i >= n) return false;

    if (text[i] == '0') {
        ++i;
    } else if (text[i] >= '1' && text[i] <= '9') {
        while (i < n && isdigit((unsigned char)text[i])) ++i;
    } else {
        return false;
    }

    if (i < n && text[i] == '.') {
        ++i;
        if (i >= n || !isdigit((unsigned char)text[i])) return false;
        while (i < n && isdigit((unsigned char)text[i])) ++i;
    }

    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        ++i;
        if (i < n && (text[i] == '+' || text[i] == '-')) ++i;
        if (i >= n || !isdigit((unsigned char)text[i])) return false;
        while (i < n && isdigit((unsigned char)text[i])) ++i;
    }

    return i == n;
}

/// Object payloads only: ArduinoJson stops after the first value, so trailing text is checked here.
static bool parseObject(const std::string& text, DynamicJsonDocument& doc)
{
    if (text.empty() || text[0] != '{' || text[text.size() - 1] != '}') return false;
    if (deserializeJson(doc, text)) return false;
    return doc.is<JsonObjectConst>();
}

static void addNumber(JsonArray args, const std::string& text, bool integral)
{
    if (integral) {
        errno = 0;
        char* end = nullptr;
        const long long v = strtoll(text.c_str(), &end, 10);
        if (errno == 0 && end && *end == '\0') {
            args.add(v);
            return;
        }
    }
    args.add(strtod(text.c_str(), nullptr));
}

static std::string serializeEnvelope(const DynamicJsonDocument& doc)
{
    std::string out;
    serializeJson(doc, out);
    return out;
}

static JsonObject beginEnvelope(DynamicJsonDocument& doc)
{
    JsonArray commands = doc.to<JsonObject>().createNestedArray("commands");
    return commands.createNestedObject();
}

bool translateDeviceCommand(const char* payload, std::string& envelope, ErrorCode* err)
{
    envelope.clear();
    const std::string text = trimmed(payload);
    if (text.empty()) {
        setErr(err, ErrorCode::EmptyCmdPayload);
        return false;
    }

    const size_t cap = Limits::Json::capacityFor(text.size());
    DynamicJsonDocument in(cap);
    if (parseObject(text, in)) {
        JsonObjectConst raw = in.as<JsonObjectConst>();
        if (raw.containsKey("commands")) {
            envelope = serializeEnvelope(in);
            setErr(err, ErrorCode::None);
            return true;
        }
        if (raw.containsKey("capability") && raw.containsKey("command")) {
            DynamicJsonDocument out(cap);
            JsonObject cmd = beginEnvelope(out);
            cmd.set(raw);
            if (!cmd.containsKey("component")) cmd["component"] = kDefaultComponent;
            envelope = serializeEnvelope(out);
            setErr(err, ErrorCode::None);
            return true;
        }
    }

    const std::string normalized = lowered(text);
    for (const DeviceTextVerb& v : kDeviceTextVerbs) {
        if (normalized != v.text) continue;
        DynamicJsonDocument out(Limits::Json::DocSlack);
        JsonObject cmd = beginEnvelope(out);
        cmd["component"] = kDefaultComponent;
        cmd["capability"] = v.capability;
        cmd["command"] = v.text;
        envelope = serializeEnvelope(out);
        setErr(err, ErrorCode::None);
        return true;
    }

    setErr(err, ErrorCode::BadCmdPayload);
    return false;
}

bool translateCapabilityCommand(const char* payload, const char* component, const char* capability,
                                std::string& envelope, ErrorCode* err)
{
    envelope.clear();
    const std::string text = trimmed(payload);
    if (text.empty() || !component || !capability) {
        setErr(err, ErrorCode::EmptyCmdPayload);
        return false;
    }

    const size_t cap = Limits::Json::capacityFor(text.size());
    DynamicJsonDocument out(cap);
    DynamicJsonDocument in(cap);

    if (parseObject(text, in)) {
        JsonObjectConst raw = in.as<JsonObjectConst>();
        if (raw.containsKey("commands")) {
            envelope = serializeEnvelope(in);
            setErr(err, ErrorCode::None);
            return true;
        }
        if (raw.containsKey("command")) {
            JsonObject cmd = beginEnvelope(out);
            cmd["component"] = component;
            cmd["capability"] = capability;
            cmd["command"] = raw["command"];
            if (raw.containsKey("arguments")) cmd["arguments"] = raw["arguments"];
            envelope = serializeEnvelope(out);
            setErr(err, ErrorCode::None);
            return true;
        }
    }

    JsonObject cmd = beginEnvelope(out);
    cmd["component"] = component;
    cmd["capability"] = capability;

    if (isJsonNumberText(text)) {
        cmd["command"] = "setLevel";
        const bool integral = text.find_first_of(".eE") == std::string::npos;
        addNumber(cmd.createNestedArray("arguments"), text, integral);
        envelope = serializeEnvelope(out);
        setErr(err, ErrorCode::None);
        return true;
    }

    const std::string normalized = lowered(text);
    for (const CapabilityTextVerb& v : kCapabilityTextVerbs) {
        if (strcmp(capability, v.capability) != 0 || normalized != v.text) continue;
        cmd["command"] = v.verb;
        envelope = serializeEnvelope(out);
        setErr(err, ErrorCode::None);
        return true;
    }

    for (const CapabilityArgumentVerb& v : kCapabilityArgumentVerbs) {
        if (strcmp(capability, v.capability) != 0) continue;
        cmd["command"] = v.verb;
        JsonArray args = cmd.createNestedArray("arguments");

        char* end = nullptr;
        errno = 0;
        if (text.find('.') != std::string::npos) {
            const double d = strtod(text.c_str(), &end);
            if (errno == 0 && end && *end == '\0' && isfinite(d)) args.add(d);
            else args.add(text);
        } else {
            const long long i = strtoll(text.c_str(), &end, 10);
            if (errno == 0 && end && *end == '\0') args.add(i);
            else args.add(text);
        }
        envelope = serializeEnvelope(out);
        setErr(err, ErrorCode::None);
        return true;
    }

    cmd["command"] = text;
    envelope = serializeEnvelope(out);
    setErr(err, ErrorCode::None);
    return true;
}
