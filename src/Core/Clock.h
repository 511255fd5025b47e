#pragma once
/**
 * @file Clock.h
 * @brief Monotonic and wall-clock time helpers.
 */
#include <chrono>
#include <stdint.h>

/** @brief Milliseconds elapsed since process start (wraps like an uptime counter). */
inline uint32_t nowMs()
{
    static const std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    return (uint32_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
}

/** @brief Wall-clock time in milliseconds since the Unix epoch. */
inline int64_t epochMs()
{
    return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/** @brief Wall-clock time in whole seconds since the Unix epoch. */
inline int64_t epochSeconds()
{
    return epochMs() / 1000;
}
