#pragma once
/**
 * @file LogHubModule.h
 * @brief Module that hosts the LogHub and sink registry.
 */
#include "Core/ModulePassive.h"
#include "Core/ServiceRegistry.h"
#include "Core/LogHub.h"
#include "Core/LogSinkRegistry.h"
#include "Core/Services/ILogger.h"
#include "Core/EnvKeys.h"

/**
 * @brief Passive module wiring log hub and sink registry services.
 */
class LogHubModule : public ModulePassive {
public:
    /** @brief Module id. */
    const char* moduleId() const override { return "loghub"; }

    /** @brief Initialize log hub and register services. */
    void init(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Apply `log.level`. */
    void onConfigLoaded(ConfigStore& cfg, ServiceRegistry& services) override;
    /** @brief Detach the hub from Log:: so late producers become no-ops. */
    void shutdown() override;

private:
    LogHub hub;
    LogHubService hubSvc{};

    LogSinkRegistry sinks;
    LogSinkRegistryService sinksSvc{};

    char level[8] = "info";
    ConfigVariable<char> levelVar {
        EnvKeys::Log::Level,"level","log",ConfigType::CharArray,
        (char*)level,sizeof(level)
    };
};
