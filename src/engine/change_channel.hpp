#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

#include "common/models.hpp"

namespace tidemark {

/**
 * Bounded queue carrying change notifications from a session's delivery
 * thread to whoever presents them. Producers never block: when the queue is
 * full the oldest notification is dropped and counted. Notifications are
 * hints only; the ledger stays the source of truth.
 */
class ChangeChannel {
public:
    static constexpr std::size_t kDefaultCapacity = 1024;

    explicit ChangeChannel(std::size_t capacity = kDefaultCapacity);

    void push(ChangeNotification notification);

    // Everything queued so far, oldest first.
    std::vector<ChangeNotification> drain();

    // Waits up to timeout for one notification.
    std::optional<ChangeNotification> waitPop(std::chrono::milliseconds timeout);

    std::size_t size() const;
    std::size_t capacity() const { return m_capacity; }
    std::size_t droppedCount() const;

private:
    const std::size_t m_capacity;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<ChangeNotification> m_queue;
    std::size_t m_dropped = 0;
};

} // namespace tidemark
