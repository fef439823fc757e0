#ifndef DESKPILOT_THREAD_SAFE_QUEUE_H
#define DESKPILOT_THREAD_SAFE_QUEUE_H

#include <deque>
#include <vector>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <chrono>

namespace deskpilot {

/**
 * @brief Thread-safe FIFO queue with an optional capacity
 *
 * When a capacity is set and the queue is full, push() evicts the oldest
 * element and counts it as dropped. A capacity of zero means unbounded.
 * @tparam T Element type
 */
template<typename T>
class ThreadSafeQueue {
public:
    explicit ThreadSafeQueue(size_t capacity = 0)
        : m_capacity(capacity), m_dropped(0), m_closed(false) {}

    /**
     * @brief Push an item to the queue
     * @return false if the queue is closed
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                return false;
            }
            if (m_capacity > 0 && m_queue.size() >= m_capacity) {
                m_queue.pop_front();
                ++m_dropped;
            }
            m_queue.push_back(std::move(item));
        }
        m_condition.notify_one();
        return true;
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(m_mutex);
        return popLocked();
    }

    /**
     * @brief Pop an item, waiting up to timeoutMs for one to arrive
     * @return Empty on timeout or when the queue is closed and drained
     */
    std::optional<T> popWithTimeout(int timeoutMs) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                             [this] { return !m_queue.empty() || m_closed; });
        return popLocked();
    }

    /**
     * @brief Remove and return everything currently queued
     */
    std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<T> items;
        items.reserve(m_queue.size());
        for (auto& item : m_queue) {
            items.push_back(std::move(item));
        }
        m_queue.clear();
        return items;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.empty();
    }

    size_t droppedCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_dropped;
    }

    /**
     * @brief Refuse further pushes and wake every waiting consumer
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_condition.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_closed;
    }

private:
    std::optional<T> popLocked() {
        if (m_queue.empty()) {
            return std::nullopt;
        }
        T item = std::move(m_queue.front());
        m_queue.pop_front();
        return item;
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_condition;
    std::deque<T> m_queue;
    size_t m_capacity;
    size_t m_dropped;
    bool m_closed;
};

} // namespace deskpilot

#endif // DESKPILOT_THREAD_SAFE_QUEUE_H
