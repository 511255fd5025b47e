#pragma once
/**
 * @file LogDispatcherModule.h
 * @brief Module that dispatches log entries to sinks.
 */
#include "Core/ModulePassive.h"
#include "Core/ServiceRegistry.h"
#include "Core/Services/ILogger.h"
#include "Core/LogHub.h"
#include <atomic>
#include <thread>

/**
 * @brief Passive module that runs its own consumer thread on the log hub.
 *
 * The thread starts in init() so that logs produced while other modules
 * initialize are already printed.
 */
class LogDispatcherModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "log.dispatcher"; }

    /** @brief Depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    /** @brief Start dispatcher thread and wire sink registry. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Drain the queue and join the dispatcher thread. */
    void shutdown() override;

private:
    void run();
    void dispatch(const LogEntry& e);

    LogHub* _hub = nullptr;
    const LogSinkRegistryService* _sinkReg = nullptr;
    std::thread _worker;
    std::atomic<bool> _running{false};
};
