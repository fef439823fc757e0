#ifndef DESKPILOT_EVENT_MANAGER_H
#define DESKPILOT_EVENT_MANAGER_H

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "../models/script_models.h"

namespace deskpilot {

enum class EngineEvent {
    LOG_GENERATED,
    STATE_CHANGED
};

/**
 * @class EventManager
 * @brief Fans execution logs and state snapshots out to subscribers
 *
 * Listeners are invoked synchronously on the publishing thread, which for
 * run events is the script's worker thread. A listener that throws is
 * logged and skipped; the exception never reaches the publisher.
 */
class EventManager {
public:
    using ListenerId = std::size_t;
    using LogListener = std::function<void(const ExecutionLog&)>;
    using StateListener = std::function<void(const ScriptExecutionState&)>;

    EventManager();
    ~EventManager();

    // Listener management
    ListenerId subscribeLog(LogListener listener);
    ListenerId subscribeState(StateListener listener);
    bool unsubscribe(ListenerId id);
    void removeAllListeners();
    size_t getListenerCount() const;
    bool hasStateListeners() const;

    // Event raising
    void publishLog(const ExecutionLog& log);
    void publishState(const ScriptExecutionState& state);

    // Event statistics
    struct EventStatistics {
        std::map<EngineEvent, size_t> eventCounts;
        size_t listenerFailures = 0;
        std::chrono::steady_clock::time_point firstEvent;
        std::chrono::steady_clock::time_point lastEvent;
        size_t totalEvents = 0;
    };

    EventStatistics getStatistics() const;
    void resetStatistics();

    static std::string eventTypeToString(EngineEvent type);

private:
    struct ListenerEntry {
        ListenerId id;
        LogListener onLog;
        StateListener onState;
    };

    std::vector<ListenerEntry> m_listeners;
    ListenerId m_nextId;
    mutable std::mutex m_listenerMutex;

    EventStatistics m_statistics;
    mutable std::mutex m_statsMutex;

    std::vector<ListenerEntry> snapshotListeners() const;
    void updateStatistics(EngineEvent type, size_t failures);
};

} // namespace deskpilot

#endif // DESKPILOT_EVENT_MANAGER_H
