#include "event_manager.h"
#include "../common/structured_logger.h"
#include <algorithm>

namespace deskpilot {

EventManager::EventManager()
    : m_nextId(1) {
    m_statistics.firstEvent = std::chrono::steady_clock::now();
    m_statistics.lastEvent = m_statistics.firstEvent;
    SLOG_DEBUG().message("EventManager initialized");
}

EventManager::~EventManager() {
    SLOG_DEBUG().message("EventManager destroyed");
}

EventManager::ListenerId EventManager::subscribeLog(LogListener listener) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    ListenerId id = m_nextId++;
    m_listeners.push_back(ListenerEntry{id, std::move(listener), nullptr});
    return id;
}

EventManager::ListenerId EventManager::subscribeState(StateListener listener) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    ListenerId id = m_nextId++;
    m_listeners.push_back(ListenerEntry{id, nullptr, std::move(listener)});
    return id;
}

bool EventManager::unsubscribe(ListenerId id) {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    auto it = std::find_if(m_listeners.begin(), m_listeners.end(),
                           [id](const ListenerEntry& entry) { return entry.id == id; });
    if (it == m_listeners.end()) {
        return false;
    }
    m_listeners.erase(it);
    return true;
}

void EventManager::removeAllListeners() {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    m_listeners.clear();
    SLOG_DEBUG().message("All event listeners removed");
}

size_t EventManager::getListenerCount() const {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    return m_listeners.size();
}

bool EventManager::hasStateListeners() const {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    return std::any_of(m_listeners.begin(), m_listeners.end(),
                       [](const ListenerEntry& entry) { return static_cast<bool>(entry.onState); });
}

void EventManager::publishLog(const ExecutionLog& log) {
    size_t failures = 0;
    // Copy so callbacks run without the lock and may unsubscribe
    for (const auto& entry : snapshotListeners()) {
        if (!entry.onLog) {
            continue;
        }
        try {
            entry.onLog(log);
        } catch (const std::exception& e) {
            ++failures;
            SLOG_ERROR().message("Exception in log listener")
                .context("listener", entry.id)
                .context("error", e.what());
        } catch (...) {
            ++failures;
            SLOG_ERROR().message("Unknown exception in log listener").context("listener", entry.id);
        }
    }
    updateStatistics(EngineEvent::LOG_GENERATED, failures);
}

void EventManager::publishState(const ScriptExecutionState& state) {
    SLOG_DEBUG().message("Event raised")
        .context("type", eventTypeToString(EngineEvent::STATE_CHANGED))
        .context("script_id", state.scriptId)
        .context("status", toString(state.status));

    size_t failures = 0;
    for (const auto& entry : snapshotListeners()) {
        if (!entry.onState) {
            continue;
        }
        try {
            entry.onState(state);
        } catch (const std::exception& e) {
            ++failures;
            SLOG_ERROR().message("Exception in state listener")
                .context("listener", entry.id)
                .context("error", e.what());
        } catch (...) {
            ++failures;
            SLOG_ERROR().message("Unknown exception in state listener").context("listener", entry.id);
        }
    }
    updateStatistics(EngineEvent::STATE_CHANGED, failures);
}

EventManager::EventStatistics EventManager::getStatistics() const {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_statistics;
}

void EventManager::resetStatistics() {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    m_statistics.eventCounts.clear();
    m_statistics.listenerFailures = 0;
    m_statistics.totalEvents = 0;
    m_statistics.firstEvent = std::chrono::steady_clock::now();
    m_statistics.lastEvent = m_statistics.firstEvent;
}

std::string EventManager::eventTypeToString(EngineEvent type) {
    switch (type) {
        case EngineEvent::LOG_GENERATED: return "LOG_GENERATED";
        case EngineEvent::STATE_CHANGED: return "STATE_CHANGED";
        default: return "UNKNOWN";
    }
}

std::vector<EventManager::ListenerEntry> EventManager::snapshotListeners() const {
    std::lock_guard<std::mutex> lock(m_listenerMutex);
    return m_listeners;
}

void EventManager::updateStatistics(EngineEvent type, size_t failures) {
    std::lock_guard<std::mutex> lock(m_statsMutex);

    auto now = std::chrono::steady_clock::now();
    m_statistics.eventCounts[type]++;
    m_statistics.listenerFailures += failures;
    m_statistics.totalEvents++;

    if (m_statistics.totalEvents == 1) {
        m_statistics.firstEvent = now;
    }
    m_statistics.lastEvent = now;
}

} // namespace deskpilot
