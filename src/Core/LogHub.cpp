/**
 * @file LogHub.cpp
 * @brief Implementation file.
 */
#include "Core/LogHub.h"

void LogHub::init(size_t queueLen) {
    q.setCapacity(queueLen);
}

bool LogHub::enqueue(const LogEntry& e) {
    if (q.send(e)) return true;
    drops.fetch_add(1U, std::memory_order_relaxed);
    return false;
}

bool LogHub::dequeue(LogEntry& out, uint32_t waitMs) {
    return q.receive(out, waitMs);
}
