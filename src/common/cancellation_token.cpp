#include "cancellation_token.h"

namespace deskpilot {

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled = true;
        ++m_generation;
    }
    m_condition.notify_all();
}

void CancellationToken::notify() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_generation;
    }
    m_condition.notify_all();
}

bool CancellationToken::sleepFor(std::chrono::milliseconds duration) {
    if (duration.count() <= 0) {
        return !isCancelled();
    }

    std::unique_lock<std::mutex> lock(m_mutex);
    return !m_condition.wait_for(lock, duration, [this] { return m_cancelled.load(); });
}

bool CancellationToken::waitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds pollInterval) {
    while (!isCancelled()) {
        unsigned long seen = 0;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            seen = m_generation;
        }

        if (predicate()) {
            return true;
        }

        std::unique_lock<std::mutex> lock(m_mutex);
        m_condition.wait_for(lock, pollInterval,
                             [this, seen] { return m_cancelled.load() || m_generation != seen; });
    }
    return false;
}

} // namespace deskpilot
