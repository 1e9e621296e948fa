#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <utility>

namespace mdns_discover
{

// Unbounded multi-producer, single-consumer queue. Pop() blocks until an
// item is available.
template <typename T> class ResultQueue
{
public:
    void Push(T item)
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_queue.push_back(std::move(item));
        }
        m_cond.notify_one();
    }

    T Pop()
    {
        std::unique_lock<std::mutex> lock(m_mutex);
        m_cond.wait(lock, [this] { return !m_queue.empty(); });
        T item = std::move(m_queue.front());
        m_queue.pop_front();
        return item;
    }

private:
    std::deque<T> m_queue;
    std::mutex m_mutex;
    std::condition_variable m_cond;
};

}
