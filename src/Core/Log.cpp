/**
 * @file Log.cpp
 * @brief Implementation file.
 */
#include "Core/Log.h"
#include "Core/Clock.h"
#include <atomic>
#include <cstring>
#include <ctype.h>
#include <stdarg.h>
#include <stdio.h>

namespace {
    std::atomic<const LogHubService*> g_hub{nullptr};
    std::atomic<uint8_t> g_minLevel{(uint8_t)LogLevel::Info};

    void logVa(LogLevel lvl, const char* tag, const char* fmt, va_list ap) {
        const LogHubService* hub = g_hub.load(std::memory_order_acquire);
        if (!hub || !hub->enqueue || !fmt) return;
        if ((uint8_t)lvl < g_minLevel.load(std::memory_order_relaxed)) return;

        LogEntry e{};
        e.ts_ms = nowMs();
        e.epoch_ms = epochMs();
        e.lvl = lvl;

        strncpy(e.tag, tag ? tag : "-", LOG_TAG_MAX - 1);

        vsnprintf(e.msg, LOG_MSG_MAX, fmt, ap);
        hub->enqueue(hub->ctx, e);  ///< drops when the queue is full
    }
}

bool parseLogLevel(const char* text, LogLevel& out) {
    if (!text) return false;
    char buf[8] = {0};
    size_t i = 0;
    for (; text[i] != '\0' && i + 1 < sizeof(buf); ++i) buf[i] = (char)tolower((unsigned char)text[i]);
    if (text[i] != '\0') return false;

    if (strcmp(buf, "debug") == 0) { out = LogLevel::Debug; return true; }
    if (strcmp(buf, "info") == 0)  { out = LogLevel::Info; return true; }
    if (strcmp(buf, "warn") == 0 || strcmp(buf, "warning") == 0) { out = LogLevel::Warn; return true; }
    if (strcmp(buf, "error") == 0) { out = LogLevel::Error; return true; }
    return false;
}

const char* logLevelName(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "?";
}

void Log::setHub(const LogHubService* hub) {
    g_hub.store(hub, std::memory_order_release);
}

const LogHubService* Log::hub() {
    return g_hub.load(std::memory_order_acquire);
}

void Log::setMinLevel(LogLevel lvl) {
    g_minLevel.store((uint8_t)lvl, std::memory_order_relaxed);
}

LogLevel Log::minLevel() {
    return (LogLevel)g_minLevel.load(std::memory_order_relaxed);
}

void Log::logf(LogLevel lvl, const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(lvl, tag, fmt, ap);
    va_end(ap);
}

void Log::debug(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Debug, tag, fmt, ap);
    va_end(ap);
}

void Log::info(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Info, tag, fmt, ap);
    va_end(ap);
}

void Log::warn(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Warn, tag, fmt, ap);
    va_end(ap);
}

void Log::error(const char* tag, const char* fmt, ...) {
    va_list ap;
    va_start(ap, fmt);
    logVa(LogLevel::Error, tag, fmt, ap);
    va_end(ap);
}
