#ifndef DESKPILOT_SCRIPT_EXECUTION_ENGINE_H
#define DESKPILOT_SCRIPT_EXECUTION_ENGINE_H

#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "event_manager.h"
#include "../models/script_models.h"
#include "../common/cancellation_token.h"

namespace deskpilot {

class IScriptStorage;
class IAutomationEngine;
class IScreenshotService;
class IImageRecognitionService;
class ConfigManager;

struct EngineOptions {
    int maxTransitionsPerIteration = 1000;
    size_t maxLogEntries = 1000;
    std::chrono::milliseconds pausePollInterval{100};
    int defaultWaitMs = 1000;
    int defaultTimeoutMs = 5000;
    double defaultMatchThreshold = 0.8;

    static EngineOptions fromConfig(const ConfigManager& config);
};

/**
 * @class ScriptExecutionEngine
 * @brief Runs automation scripts, one worker thread per script id
 *
 * Each run walks the script's step list, following jump and else targets,
 * and repeats the walk according to the script's repeat settings. Runs are
 * controlled through start/stop/pause/resume and observed through the event
 * manager. Expected conditions (unknown ids, terminal runs) never throw;
 * only start reports an unknown script.
 *
 * Listeners are called on worker threads and must not call start() for the
 * script whose event they are handling.
 */
class ScriptExecutionEngine {
public:
    ScriptExecutionEngine(std::shared_ptr<IScriptStorage> storage,
                          std::shared_ptr<IAutomationEngine> automation,
                          std::shared_ptr<IScreenshotService> screenshots,
                          std::shared_ptr<IImageRecognitionService> recognition,
                          EngineOptions options = EngineOptions());
    ~ScriptExecutionEngine();

    ScriptExecutionEngine(const ScriptExecutionEngine&) = delete;
    ScriptExecutionEngine& operator=(const ScriptExecutionEngine&) = delete;

    /**
     * @brief Start a run, replacing any previous run of the same script
     *
     * A previous run is stopped and its worker joined first. The Running state
     * and the "started" log are published before this returns.
     * @throws ScriptNotFoundException if storage has no such script
     */
    void start(const std::string& scriptId);

    void stop(const std::string& scriptId);
    void pause(const std::string& scriptId);
    void resume(const std::string& scriptId);

    std::optional<ScriptExecutionState> getExecutionState(const std::string& scriptId) const;
    std::vector<ScriptExecutionState> getAllExecutionStates() const;

    // Process wide target window; wins over a script's own target
    void overrideTargetWindow(std::optional<WindowHandle> handle);
    std::optional<WindowHandle> getTargetWindowOverride() const;

    /**
     * @brief Block until the run's worker has finished
     * @return false on timeout or if the script has no run
     */
    bool waitForCompletion(const std::string& scriptId, std::chrono::milliseconds timeout);

    EventManager& events() { return m_events; }
    const EngineOptions& getOptions() const { return m_options; }

private:
    struct Run {
        mutable std::mutex mutex;  // Guards state and finished
        ScriptExecutionState state;
        bool finished = false;
        std::condition_variable finishedCondition;

        CancellationToken token;
        std::chrono::steady_clock::time_point startedAt;
        std::thread worker;
    };
    using RunPtr = std::shared_ptr<Run>;

    struct StepResult {
        bool success = true;
        std::string nextStepId;
    };

    using StepIndex = std::unordered_map<std::string, size_t>;

    // Run lifecycle, on the worker thread
    void runScript(RunPtr run, AutomationScript script);
    bool runIteration(Run& run, const AutomationScript& script, const StepIndex& index);
    void finishRun(Run& run, const AutomationScript& script, bool iterationFailed);
    void finishCancelled(Run& run);

    StepResult executeStep(Run& run, const ScriptStep& step);
    StepResult executeConditionStep(Run& run, const ScriptStep& step);
    bool evaluateCondition(Run& run, const ScriptStep& step, const ScriptCondition& condition);
    bool evaluateImageCondition(Run& run, const ScriptStep& step, const ScriptCondition& condition);
    void executeAction(Run& run, const ScriptStep& step, const ScriptAction& action);

    void waitWhilePaused(Run& run);
    void sleepOrCancel(Run& run, int milliseconds);
    bool isStopRequested(const Run& run) const;

    // Run bookkeeping
    RunPtr findRun(const std::string& scriptId) const;
    ScriptExecutionState snapshot(const Run& run, bool includeLogs) const;
    void logExecution(Run& run, const std::string& stepId, LogLevel level, const std::string& message);
    void emitStateChanged(const Run& run);

    void applyWindowTargeting(const AutomationScript& script);
    void restoreWindowTargeting();

    static StepIndex buildStepIndex(const AutomationScript& script);

    std::shared_ptr<IScriptStorage> m_storage;
    std::shared_ptr<IAutomationEngine> m_automation;
    std::shared_ptr<IScreenshotService> m_screenshots;
    std::shared_ptr<IImageRecognitionService> m_recognition;
    EngineOptions m_options;

    EventManager m_events;

    // Serializes start and destruction so a restart joins exactly one worker
    std::mutex m_lifecycleMutex;

    mutable std::mutex m_runsMutex;
    std::map<std::string, RunPtr> m_runs;

    mutable std::mutex m_windowMutex;
    std::optional<WindowHandle> m_windowOverride;
};

} // namespace deskpilot

#endif // DESKPILOT_SCRIPT_EXECUTION_ENGINE_H
