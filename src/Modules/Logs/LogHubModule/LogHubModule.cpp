/**
 * @file LogHubModule.cpp
 * @brief Implementation file.
 */
#include "LogHubModule.h"
#include "Core/Log.h"
#include "Core/SystemLimits.h"

#define LOG_TAG "LogHubMd"

void LogHubModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    cfg.registerVar(levelVar);

    hub.init(Limits::LogQueueLen);

    /// expose loghub service
    hubSvc.enqueue = [](void* ctx, const LogEntry& e) -> bool {
        return static_cast<LogHub*>(ctx)->enqueue(e);
    };
    hubSvc.ctx = &hub;

    /// expose sink registry service
    sinksSvc.add = [](void* ctx, LogSinkService sink) -> bool {
        return static_cast<LogSinkRegistry*>(ctx)->add(sink);
    };
    sinksSvc.count = [](void* ctx) -> int {
        return static_cast<LogSinkRegistry*>(ctx)->count();
    };
    sinksSvc.get = [](void* ctx, int idx) -> LogSinkService {
        return static_cast<LogSinkRegistry*>(ctx)->get(idx);
    };
    sinksSvc.ctx = &sinks;

    services.add("loghub", &hubSvc);
    services.add("logsinks", &sinksSvc);

    Log::setHub(&hubSvc);
}

void LogHubModule::onConfigLoaded(ConfigStore&, ServiceRegistry&) {
    LogLevel lvl = LogLevel::Info;
    if (!parseLogLevel(level, lvl)) {
        Log::warn(LOG_TAG, "unknown log level '%s', using info", level);
        lvl = LogLevel::Info;
    }
    Log::setMinLevel(lvl);
    Log::info(LOG_TAG, "log level=%s", logLevelName(lvl));
}

void LogHubModule::shutdown() {
    Log::setHub(nullptr);
}
