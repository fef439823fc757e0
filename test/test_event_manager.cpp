#include <iostream>
#include "orchestrator/event_manager.h"
#include "common/structured_logger.h"
#include "test_support.h"

using namespace deskpilot;

namespace {

ExecutionLog makeLog(const std::string& message) {
    ExecutionLog log;
    log.id = generateId();
    log.timestamp = std::chrono::system_clock::now();
    log.scriptId = "script";
    log.message = message;
    return log;
}

} // namespace

void testSubscribeAndPublish() {
    std::cout << "[TEST] Subscribe and Publish\n";

    EventManager events;
    std::vector<std::string> received;
    std::vector<ExecutionStatus> statuses;

    auto logId = events.subscribeLog([&received](const ExecutionLog& log) { received.push_back(log.message); });
    CHECK(!events.hasStateListeners());
    auto stateId = events.subscribeState([&statuses](const ScriptExecutionState& state) {
        statuses.push_back(state.status);
    });
    CHECK(events.hasStateListeners());
    CHECK(logId != stateId);
    CHECK_EQ(events.getListenerCount(), 2u);

    events.publishLog(makeLog("first"));
    events.publishLog(makeLog("second"));
    ScriptExecutionState state;
    state.status = ExecutionStatus::PAUSED;
    events.publishState(state);

    CHECK((received == std::vector<std::string>{"first", "second"}));
    CHECK((statuses == std::vector<ExecutionStatus>{ExecutionStatus::PAUSED}));

    auto stats = events.getStatistics();
    CHECK_EQ(stats.totalEvents, 3u);
    CHECK_EQ(stats.eventCounts[EngineEvent::LOG_GENERATED], 2u);
    CHECK_EQ(stats.eventCounts[EngineEvent::STATE_CHANGED], 1u);
    CHECK_EQ(stats.listenerFailures, 0u);

    std::cout << "[OK] Subscribe and publish test passed\n\n";
}

void testUnsubscribe() {
    std::cout << "[TEST] Unsubscribe\n";

    EventManager events;
    int calls = 0;
    auto id = events.subscribeLog([&calls](const ExecutionLog&) { ++calls; });

    events.publishLog(makeLog("one"));
    CHECK(events.unsubscribe(id));
    CHECK(!events.unsubscribe(id));
    events.publishLog(makeLog("two"));
    CHECK_EQ(calls, 1);

    events.subscribeState([](const ScriptExecutionState&) {});
    events.removeAllListeners();
    CHECK_EQ(events.getListenerCount(), 0u);
    CHECK(!events.hasStateListeners());

    std::cout << "[OK] Unsubscribe test passed\n\n";
}

void testListenerMayUnsubscribeItself() {
    std::cout << "[TEST] Listener May Unsubscribe Itself\n";

    EventManager events;
    int calls = 0;
    EventManager::ListenerId self = 0;
    self = events.subscribeLog([&](const ExecutionLog&) {
        ++calls;
        events.unsubscribe(self);
    });

    events.publishLog(makeLog("once"));
    events.publishLog(makeLog("twice"));
    CHECK_EQ(calls, 1);
    CHECK_EQ(events.getListenerCount(), 0u);

    std::cout << "[OK] Listener may unsubscribe itself test passed\n\n";
}

void testFailingListenerIsIsolated() {
    std::cout << "[TEST] Failing Listener Is Isolated\n";

    EventManager events;
    std::vector<std::string> received;
    events.subscribeLog([](const ExecutionLog&) { throw std::runtime_error("boom"); });
    events.subscribeLog([&received](const ExecutionLog& log) { received.push_back(log.message); });

    events.publishLog(makeLog("still delivered"));
    CHECK((received == std::vector<std::string>{"still delivered"}));
    CHECK_EQ(events.getStatistics().listenerFailures, 1u);

    events.resetStatistics();
    CHECK_EQ(events.getStatistics().totalEvents, 0u);
    CHECK_EQ(events.getStatistics().listenerFailures, 0u);

    CHECK_EQ(EventManager::eventTypeToString(EngineEvent::STATE_CHANGED), "STATE_CHANGED");

    std::cout << "[OK] Failing listener is isolated test passed\n\n";
}

int main() {
    std::cout << "=== DeskPilot Event Manager Test Suite ===\n\n";

    StructuredLogger::getInstance().setLogLevel(LogLevel::CRITICAL);

    try {
        testSubscribeAndPublish();
        testUnsubscribe();
        testListenerMayUnsubscribeItself();
        testFailingListenerIsIsolated();
    } catch (const std::exception& e) {
        std::cerr << "[FAILED] Test failed with exception: " << e.what() << "\n";
        return 1;
    }
    return test::finish("Event manager");
}
