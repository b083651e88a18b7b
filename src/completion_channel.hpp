#ifndef MIRRORRANK_SRC_COMPLETION_CHANNEL_HPP
#define MIRRORRANK_SRC_COMPLETION_CHANNEL_HPP

#include <condition_variable>
#include <deque>
#include <mutex>

namespace mirrorrank::details
{
    // Many producers, one consumer. Values are received in the order they were sent.
    template <class T>
    class CompletionChannel
    {
    public:
        void send(T value)
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_values.push_back(std::move(value));
            }
            m_ready.notify_one();
        }

        // Blocks until a value is available.
        T receive()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_ready.wait(lock, [this] { return !m_values.empty(); });
            T value = std::move(m_values.front());
            m_values.pop_front();
            return value;
        }

    private:
        std::mutex m_mutex;
        std::condition_variable m_ready;
        std::deque<T> m_values;
    };
}

#endif
