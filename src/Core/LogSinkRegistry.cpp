/**
 * @file LogSinkRegistry.cpp
 * @brief Implementation file.
 */
#include "Core/LogSinkRegistry.h"

bool LogSinkRegistry::add(LogSinkService sink) {
    if (!sink.write) return false;
    std::lock_guard<std::mutex> lock(mtx);
    if (n >= Limits::MaxLogSinks) return false;
    sinks[n++] = sink;
    return true;
}

int LogSinkRegistry::count() const {
    std::lock_guard<std::mutex> lock(mtx);
    return n;
}

LogSinkService LogSinkRegistry::get(int idx) const {
    std::lock_guard<std::mutex> lock(mtx);
    if (idx < 0 || idx >= n) return LogSinkService{};
    return sinks[idx];
}
