#pragma once
/**
 * @file LogSinkRegistry.h
 * @brief Registry of log sinks.
 */
#include "Core/Services/ILogger.h"
#include "Core/SystemLimits.h"
#include <mutex>

/**
 * @brief Stores and enumerates registered log sinks.
 */
class LogSinkRegistry {
public:
    /** @brief Add a sink to the registry. */
    bool add(LogSinkService sink);
    /** @brief Number of registered sinks. */
    int count() const;
    /** @brief Get sink by index. */
    LogSinkService get(int idx) const;

private:
    mutable std::mutex mtx;
    LogSinkService sinks[Limits::MaxLogSinks]{};
    int n = 0;
};
