#pragma once

#include <queue>
#include <mutex>
#include <condition_variable>

namespace sos {
namespace core {

template<typename T>
class ThreadSafeQueue {
public:
    // Returns false once the queue is closed; the value is dropped.
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed)
                return false;
            m_queue.push(std::move(value));
        }
        m_cv.notify_one();
        return true;
    }

    bool try_pop(T& result) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.empty())
            return false;

        result = std::move(m_queue.front());
        m_queue.pop();
        return true;
    }

    // Blocks until a value is available. Returns false only when the queue
    // is closed and fully drained.
    bool wait_and_pop(T& result) {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cv.wait(lock, [this] { return m_closed || !m_queue.empty(); });

        if (m_queue.empty())
            return false;

        result = std::move(m_queue.front());
        m_queue.pop();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_closed = true;
        }
        m_cv.notify_all();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_queue.size();
    }

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::queue<T> m_queue;
    bool m_closed = false;
};

} // namespace core
} // namespace sos
