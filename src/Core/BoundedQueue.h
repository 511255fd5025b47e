#pragma once
/**
 * @file BoundedQueue.h
 * @brief Fixed-capacity FIFO shared between producer and consumer threads.
 */
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stddef.h>
#include <stdint.h>

/**
 * @brief Thread-safe queue with queue-like send/receive semantics.
 *
 * `send` never blocks: it fails when the queue is full. `receive` waits up to
 * `waitMs` for an item (0 = poll).
 */
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity = 16) : cap(capacity) {}

    void setCapacity(size_t capacity) {
        std::lock_guard<std::mutex> lock(mtx);
        cap = capacity;
    }

    bool send(const T& item) {
        {
            std::lock_guard<std::mutex> lock(mtx);
            if (items.size() >= cap) return false;
            items.push_back(item);
        }
        cv.notify_one();
        return true;
    }

    bool receive(T& out, uint32_t waitMs) {
        std::unique_lock<std::mutex> lock(mtx);
        if (items.empty() && waitMs > 0) {
            cv.wait_for(lock, std::chrono::milliseconds(waitMs), [this] { return !items.empty(); });
        }
        if (items.empty()) return false;
        out = items.front();
        items.pop_front();
        return true;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return items.size();
    }

    /** @brief Wake every waiting consumer (used on shutdown). */
    void wakeAll() { cv.notify_all(); }

private:
    mutable std::mutex mtx;
    std::condition_variable cv;
    std::deque<T> items;
    size_t cap;
};
