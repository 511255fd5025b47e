#pragma once
/**
 * @file LogHub.h
 * @brief Central log queue for asynchronous logging.
 */
#include "Core/BoundedQueue.h"
#include "Core/Services/ILogger.h"
#include <atomic>

/**
 * @brief Queue-based log hub for producers and consumers.
 */
class LogHub {
public:
    /** @brief Size the log queue. */
    void init(size_t queueLen = 32);

    /** @brief Enqueue a log entry (non-blocking, counts drops). */
    bool enqueue(const LogEntry& e);
    /** @brief Dequeue a log entry (blocking up to waitMs). */
    bool dequeue(LogEntry& out, uint32_t waitMs);

    /** @brief Entries dropped because the queue was full. */
    uint32_t dropCount() const { return drops.load(std::memory_order_relaxed); }
    /** @brief Wake a consumer blocked in dequeue(). */
    void wake() { q.wakeAll(); }

private:
    BoundedQueue<LogEntry> q;
    std::atomic<uint32_t> drops{0};
};
