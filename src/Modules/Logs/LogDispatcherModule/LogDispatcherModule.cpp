/**
 * @file LogDispatcherModule.cpp
 * @brief Implementation file.
 */
#include "LogDispatcherModule.h"
#include "Core/Log.h"
#include "Core/SystemLimits.h"
#include <pthread.h>

void LogDispatcherModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    (void)cfg;

    auto hubSvc = services.get<LogHubService>("loghub");
    _sinkReg = services.get<LogSinkRegistryService>("logsinks");

    /// LogHub* travels as the hub service ctx
    if (!hubSvc || !hubSvc->ctx || !_sinkReg) return;

    _hub = static_cast<LogHub*>(hubSvc->ctx);

    _running.store(true, std::memory_order_release);
    _worker = std::thread(&LogDispatcherModule::run, this);
}

void LogDispatcherModule::dispatch(const LogEntry& e) {
    int n = _sinkReg->count(_sinkReg->ctx);
    for (int i = 0; i < n; ++i) {
        LogSinkService sink = _sinkReg->get(_sinkReg->ctx, i);
        if (sink.write) sink.write(sink.ctx, e);
    }
}

void LogDispatcherModule::run() {
    pthread_setname_np(pthread_self(), "LogDispatch");
    LogEntry e;

    while (_running.load(std::memory_order_acquire)) {
        if (_hub->dequeue(e, Limits::LogDispatchWaitMs)) dispatch(e);
    }
    /// drain what producers queued before shutdown
    while (_hub->dequeue(e, 0)) dispatch(e);
}

void LogDispatcherModule::shutdown() {
    if (!_worker.joinable()) return;
    if (_hub->dropCount() > 0) {
        Log::warn("LogDisp", "log entries dropped: %lu", (unsigned long)_hub->dropCount());
    }
    _running.store(false, std::memory_order_release);
    _hub->wake();
    _worker.join();
}
