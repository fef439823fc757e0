#ifndef DESKPILOT_SHUTDOWN_MANAGER_H
#define DESKPILOT_SHUTDOWN_MANAGER_H

#include <atomic>

namespace deskpilot {

/**
 * @brief Process wide shutdown flag set from signal handlers
 *
 * Only lock-free atomics are touched so the handlers stay async-signal-safe.
 * The CLI polls isShutdownRequested() and stops running scripts itself.
 */
class ShutdownManager {
public:
    static ShutdownManager& getInstance() {
        static ShutdownManager instance;
        return instance;
    }

    /**
     * @brief Record an interrupt
     * @return How many interrupts have been received, this one included
     */
    int onInterrupt() {
        m_shutdown_requested = true;
        return ++m_interrupt_count;
    }

    void requestShutdown() {
        m_shutdown_requested = true;
    }

    bool isShutdownRequested() const {
        return m_shutdown_requested.load();
    }

    void reset() {
        m_shutdown_requested = false;
        m_interrupt_count = 0;
    }

private:
    ShutdownManager() : m_shutdown_requested(false), m_interrupt_count(0) {}

    std::atomic<bool> m_shutdown_requested;
    std::atomic<int> m_interrupt_count;
};

} // namespace deskpilot

#endif // DESKPILOT_SHUTDOWN_MANAGER_H
