/**
 * @file BoundedChannel.hpp
 * @brief Fixed-capacity multi-producer queue drained by a single consumer.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

namespace vaultbreakdown::application {

/**
 * @class BoundedChannel
 * @brief push() blocks while full; pop() blocks while empty.
 *
 * After close(), push() refuses new items and pop() keeps returning the
 * queued items until the queue is empty, then nullopt.
 */
template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(size_t capacity) : m_capacity(capacity == 0 ? 1 : capacity) {}

    /** @return False if the channel was closed before the item could be queued. */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notFull.wait(lock, [this] { return m_closed || m_queue.size() < m_capacity; });
        if (m_closed) return false;
        m_queue.push(std::move(item));
        m_notEmpty.notify_one();
        return true;
    }

    /** @brief Non-blocking push; false when full or closed. */
    bool tryPush(T item) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed || m_queue.size() >= m_capacity) return false;
        m_queue.push(std::move(item));
        m_notEmpty.notify_one();
        return true;
    }

    /** @return Next item, or nullopt once closed and drained. */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_notEmpty.wait(lock, [this] { return m_closed || !m_queue.empty(); });
        if (m_queue.empty()) return std::nullopt;
        T item = std::move(m_queue.front());
        m_queue.pop();
        m_notFull.notify_one();
        return item;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_notEmpty.notify_all();
        m_notFull.notify_all();
    }

    /**
     * @brief Drops everything still queued and wakes blocked producers.
     * @return Number of items dropped.
     */
    size_t discard() {
        size_t dropped = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            dropped = m_queue.size();
            std::queue<T>().swap(m_queue);
        }
        m_notFull.notify_all();
        return dropped;
    }

private:
    const size_t m_capacity;
    std::queue<T> m_queue;
    bool m_closed = false;
    mutable std::mutex m_mutex;
    std::condition_variable m_notEmpty;
    std::condition_variable m_notFull;
};

} // namespace vaultbreakdown::application
