#pragma once
/**
 * @file ILogger.h
 * @brief Logging service interfaces and helpers.
 */
#include <stdint.h>
#include <stddef.h>

/** @brief Log severity levels. */
enum class LogLevel : uint8_t { Debug, Info, Warn, Error };

// ===== LOG TYPES =====
constexpr int LOG_TAG_MAX = 10;
constexpr int LOG_MSG_MAX = 384;

/** @brief Fixed-size log entry. */
struct LogEntry {
    uint32_t ts_ms;      ///< uptime when the entry was produced
    int64_t epoch_ms;    ///< wall clock when the entry was produced
    LogLevel lvl;
    char tag[LOG_TAG_MAX];
    char msg[LOG_MSG_MAX];
};

/** @brief Log sink interface. */
struct LogSinkService {
    void (*write)(void* ctx, const LogEntry& e);
    void* ctx;
};

/** @brief Log hub interface (producer side). */
struct LogHubService {
    bool (*enqueue)(void* ctx, const LogEntry& e);
    void* ctx;
};

/** @brief Registry interface for log sinks. */
struct LogSinkRegistryService {
    bool (*add)(void* ctx, LogSinkService sink);
    int (*count)(void* ctx);
    LogSinkService (*get)(void* ctx, int index);
    void* ctx;
};

/** @brief Parse `debug|info|warn|error` (case-insensitive). Returns false on unknown text. */
bool parseLogLevel(const char* text, LogLevel& out);
/** @brief Lower-case level name. */
const char* logLevelName(LogLevel lvl);
