#include "engine/change_channel.hpp"

#include <iterator>
#include <utility>

namespace tidemark {

ChangeChannel::ChangeChannel(std::size_t capacity)
    : m_capacity(capacity == 0 ? 1 : capacity)
{
}

void ChangeChannel::push(ChangeNotification notification)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_queue.size() >= m_capacity) {
            m_queue.pop_front();
            ++m_dropped;
        }
        m_queue.push_back(std::move(notification));
    }
    m_cv.notify_one();
}

std::vector<ChangeNotification> ChangeChannel::drain()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<ChangeNotification> items(std::make_move_iterator(m_queue.begin()),
                                          std::make_move_iterator(m_queue.end()));
    m_queue.clear();
    return items;
}

std::optional<ChangeNotification> ChangeChannel::waitPop(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_cv.wait_for(lock, timeout, [this]() { return !m_queue.empty(); })) {
        return std::nullopt;
    }
    ChangeNotification notification = std::move(m_queue.front());
    m_queue.pop_front();
    return notification;
}

std::size_t ChangeChannel::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_queue.size();
}

std::size_t ChangeChannel::droppedCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dropped;
}

} // namespace tidemark
