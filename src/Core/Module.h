#pragma once
/**
 * @file Module.h
 * @brief Base interface for all runtime modules.
 */
#include "ConfigStore.h"
#include "ServiceRegistry.h"
#include "Core/SystemLimits.h"
#include <atomic>
#include <chrono>
#include <pthread.h>
#include <thread>

/**
 * @brief Base class for active modules backed by a worker thread.
 */
class Module {
public:
    /** @brief Virtual destructor. */
    virtual ~Module() = default;

    /** @brief Unique module identifier (used for dependency wiring). */
    virtual const char* moduleId() const = 0;
    /** @brief Thread name for this module (shown by `top -H`, max 15 chars). */
    virtual const char* taskName() const = 0;

    /** @brief Number of declared dependencies. */
    virtual uint8_t dependencyCount() const { return 0; }
    /** @brief Dependency id at index, or nullptr if none. */
    virtual const char* dependency(uint8_t) const { return nullptr; }

    /** @brief Initialize module and register services/config. */
    virtual void init(ConfigStore& cfg, ServiceRegistry& services) = 0;
    /** @brief Called once all config sources (file, environment) are applied. */
    virtual void onConfigLoaded(ConfigStore&, ServiceRegistry&) {}
    /** @brief Main module loop called from the module thread. */
    virtual void loop() = 0;
    /** @brief Called once in reverse init order after every thread stopped. */
    virtual void shutdown() {}

    /** @brief Delay between two loop() calls. */
    virtual uint32_t loopDelayMs() const { return Limits::ModuleLoopDelayMs; }

    /** @brief Create and start the worker thread for this module. */
    void startTask() {
        if (worker.joinable()) return;
        stopping.store(false, std::memory_order_release);
        running.store(true, std::memory_order_release);
        worker = std::thread(&Module::taskEntry, this);
    }

    /** @brief Ask the worker to leave its loop and join it. */
    void stopTask() {
        stopping.store(true, std::memory_order_release);
        running.store(false, std::memory_order_release);
        if (worker.joinable()) worker.join();
    }

    /** @brief Whether the worker thread is running. */
    bool isRunning() const { return running.load(std::memory_order_acquire); }

    /** @brief Whether this module owns a thread. */
    virtual bool hasTask() const { return true; }

protected:
    /** @brief True once stopTask() was requested; long loops should bail out early. */
    bool stopRequested() const { return stopping.load(std::memory_order_acquire); }

private:
    std::thread worker;
    std::atomic<bool> running{false};
    std::atomic<bool> stopping{false};

    static void taskEntry(Module* self) {
        pthread_setname_np(pthread_self(), self->taskName());
        while (self->running.load(std::memory_order_acquire)) {
            self->loop();
            std::this_thread::sleep_for(std::chrono::milliseconds(self->loopDelayMs()));
        }
    }
};
