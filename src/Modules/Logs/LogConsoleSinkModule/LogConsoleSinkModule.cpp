/**
 * @file LogConsoleSinkModule.cpp
 * @brief Implementation file.
 */
#include "LogConsoleSinkModule.h"
#include <stdio.h>
#include <time.h>
#include <unistd.h>

static const char* lvlStr(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "D";
        case LogLevel::Info:  return "I";
        case LogLevel::Warn:  return "W";
        case LogLevel::Error: return "E";
    }
    return "?";
}

static const char* lvlColor(LogLevel lvl) {
    switch (lvl) {
        case LogLevel::Debug: return "\x1b[90m";
        case LogLevel::Info:  return "\x1b[32m";
        case LogLevel::Warn:  return "\x1b[33m";
        case LogLevel::Error: return "\x1b[31m";
    }
    return "";
}

static const char* colorReset() { return "\x1b[0m"; }

static void formatTimestamp(char* out, size_t outSize, int64_t epochMs)
{
    const time_t secs = (time_t)(epochMs / 1000);
    struct tm t;
    localtime_r(&secs, &t);

    snprintf(out, outSize,
             "%04d-%02d-%02d %02d:%02d:%02d.%03u",
             t.tm_year + 1900,
             t.tm_mon + 1,
             t.tm_mday,
             t.tm_hour,
             t.tm_min,
             t.tm_sec,
             (unsigned)(epochMs % 1000));
}

static void consoleSinkWrite(void* ctx, const LogEntry& e) {
    const bool color = ctx && *static_cast<bool*>(ctx);

    char ts[48];
    formatTimestamp(ts, sizeof(ts), e.epoch_ms);

    fprintf(stdout, "[%s][%s][%s] %s%s%s\n",
            ts,
            lvlStr(e.lvl),
            e.tag,
            color ? lvlColor(e.lvl) : "",
            e.msg,
            color ? colorReset() : "");
    if (e.lvl >= LogLevel::Warn) fflush(stdout);
}

void LogConsoleSinkModule::init(ConfigStore& cfg, ServiceRegistry& services) {
    (void)cfg;

    auto sinks = services.get<LogSinkRegistryService>("logsinks");
    if (!sinks) return;

    _color = isatty(fileno(stdout)) != 0;

    LogSinkService sink{};
    sink.write = consoleSinkWrite;
    sink.ctx = &_color;

    sinks->add(sinks->ctx, sink);
}

void LogConsoleSinkModule::shutdown() {
    fflush(stdout);
}
