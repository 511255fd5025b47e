#pragma once
/**
 * @file LogConsoleSinkModule.h
 * @brief Console (stdout) log sink module.
 */
#include "Core/ModulePassive.h"
#include "Core/Services/ILogger.h"
#include "Core/ServiceRegistry.h"

/**
 * @brief Passive module that writes log entries to stdout.
 */
class LogConsoleSinkModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "log.sink.console"; }

    /** @brief Depends on log hub. */
    uint8_t dependencyCount() const override { return 1; }
    const char* dependency(uint8_t i) const override {
        if (i == 0) return "loghub";
        return nullptr;
    }

    /** @brief Register the console log sink. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Flush stdout. */
    void shutdown() override;

private:
    bool _color = false;
};
