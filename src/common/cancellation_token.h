#ifndef DESKPILOT_CANCELLATION_TOKEN_H
#define DESKPILOT_CANCELLATION_TOKEN_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>

namespace deskpilot {

/**
 * @brief Cooperative cancellation signal shared between a run and its controller
 *
 * Every wait on the token returns early once cancel() is called. notify()
 * wakes waiters without cancelling so they can re-check their predicate.
 */
class CancellationToken {
public:
    CancellationToken() : m_cancelled(false) {}

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();
    bool isCancelled() const { return m_cancelled.load(); }

    /**
     * @brief Sleep for the duration unless cancelled first
     * @return true if the full duration elapsed, false if cancelled
     */
    bool sleepFor(std::chrono::milliseconds duration);

    /**
     * @brief Block until predicate() holds
     *
     * The predicate is evaluated without the token's lock held, on every
     * notify() and at least once per pollInterval.
     * @return true when the predicate held, false if cancelled
     */
    bool waitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds pollInterval);

    void notify();

private:
    std::atomic<bool> m_cancelled;
    std::mutex m_mutex;
    std::condition_variable m_condition;
    unsigned long m_generation = 0;
};

} // namespace deskpilot

#endif // DESKPILOT_CANCELLATION_TOKEN_H
