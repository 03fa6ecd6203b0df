#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace tidemark {

// Short-lived allow-list of paths the engine itself is about to write.
// Notifications for a suppressed path are dropped until its window expires.
class EventSuppressor {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::milliseconds kDefaultWindow{3000};

    explicit EventSuppressor(std::chrono::milliseconds window = kDefaultWindow);

    void suppress(const std::string &relPath);
    void suppress(const std::string &relPath, std::chrono::milliseconds duration);

    // Expired entries are pruned here.
    bool isSuppressed(const std::string &relPath);

    std::chrono::milliseconds window() const { return m_window; }
    std::size_t size() const;

private:
    std::chrono::milliseconds m_window;
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, Clock::time_point> m_expiry;
};

} // namespace tidemark
