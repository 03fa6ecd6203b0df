#include "engine/event_suppressor.hpp"

namespace tidemark {

EventSuppressor::EventSuppressor(std::chrono::milliseconds window)
    : m_window(window)
{
}

void EventSuppressor::suppress(const std::string &relPath)
{
    suppress(relPath, m_window);
}

void EventSuppressor::suppress(const std::string &relPath,
                               std::chrono::milliseconds duration)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_expiry[relPath] = Clock::now() + duration;
}

bool EventSuppressor::isSuppressed(const std::string &relPath)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const auto now = Clock::now();
    for (auto it = m_expiry.begin(); it != m_expiry.end();) {
        if (it->second <= now) {
            it = m_expiry.erase(it);
        } else {
            ++it;
        }
    }
    return m_expiry.count(relPath) > 0;
}

std::size_t EventSuppressor::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_expiry.size();
}

} // namespace tidemark
