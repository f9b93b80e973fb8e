#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace netwake::common
{
    // Hands work produced on scan worker threads to a single consumer thread.
    template <typename T>
    class ThreadSafeQueue
    {
    private:
        std::queue<T> m_queue;
        std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_shutdown = false;

    public:
        void Push(T value)
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_shutdown)
                    return;
                m_queue.push(std::move(value));
            }
            m_cv.notify_one();
        }

        // Blocks until an item arrives, the timeout passes, or Shutdown() is called.
        std::optional<T> PopFor(std::chrono::milliseconds timeout)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait_for(lock, timeout, [this]
                          { return !m_queue.empty() || m_shutdown; });

            if (m_queue.empty())
                return std::nullopt;

            T value = std::move(m_queue.front());
            m_queue.pop();
            return value;
        }

        void Shutdown()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_shutdown = true;
            }
            m_cv.notify_all();
        }
    };
}
