#include "script_execution_engine.h"
#include "../storage/script_storage.h"
#include "../ocal/automation_engine.h"
#include "../environmental_perception/screenshot_service.h"
#include "../environmental_perception/image_recognition.h"
#include "../common/config_manager.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace deskpilot {

namespace {
    std::string screenshotFileName() {
        std::time_t raw = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm local{};
#ifdef _WIN32
        localtime_s(&local, &raw);
#else
        localtime_r(&raw, &local);
#endif
        std::ostringstream ss;
        ss << "script_screenshot_" << std::put_time(&local, "%Y%m%d_%H%M%S");
        return ss.str();
    }

    std::string formatConfidence(double confidence) {
        std::ostringstream ss;
        ss << std::fixed << std::setprecision(3) << confidence;
        return ss.str();
    }

    std::string repeatsText(int count) {
        return std::to_string(count) + " repeat(s)";
    }

    std::string typeNameOf(const ScriptAction& action) {
        return action.typeName.empty() ? toString(action.type) : action.typeName;
    }
}

EngineOptions EngineOptions::fromConfig(const ConfigManager& config) {
    EngineOptions options;
    options.maxTransitionsPerIteration = std::max(1, config.getMaxTransitionsPerIteration());
    options.maxLogEntries = static_cast<size_t>(std::max(1, config.getMaxLogEntries()));
    options.pausePollInterval = std::chrono::milliseconds(std::max(1, config.getPausePollIntervalMs()));
    options.defaultMatchThreshold = config.getDefaultMatchThreshold();
    return options;
}

ScriptExecutionEngine::ScriptExecutionEngine(std::shared_ptr<IScriptStorage> storage,
                                             std::shared_ptr<IAutomationEngine> automation,
                                             std::shared_ptr<IScreenshotService> screenshots,
                                             std::shared_ptr<IImageRecognitionService> recognition,
                                             EngineOptions options)
    : m_storage(std::move(storage))
    , m_automation(std::move(automation))
    , m_screenshots(std::move(screenshots))
    , m_recognition(std::move(recognition))
    , m_options(options) {
    if (!m_storage || !m_automation || !m_screenshots || !m_recognition) {
        DESKPILOT_THROW(ErrorType::CONFIGURATION_ERROR, ErrorSeverity::CRITICAL,
                        "ScriptExecutionEngine requires all collaborators", "", "ScriptExecutionEngine");
    }
    SLOG_DEBUG().message("ScriptExecutionEngine initialized")
        .context("max_transitions", m_options.maxTransitionsPerIteration)
        .context("max_log_entries", m_options.maxLogEntries);
}

ScriptExecutionEngine::~ScriptExecutionEngine() {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);

    std::vector<RunPtr> runs;
    {
        std::lock_guard<std::mutex> lock(m_runsMutex);
        for (const auto& entry : m_runs) {
            runs.push_back(entry.second);
        }
    }

    for (const auto& run : runs) {
        run->token.cancel();
    }
    for (const auto& run : runs) {
        if (run->worker.joinable()) {
            run->worker.join();
        }
    }
    SLOG_DEBUG().message("ScriptExecutionEngine destroyed").context("runs", runs.size());
}

void ScriptExecutionEngine::start(const std::string& scriptId) {
    std::lock_guard<std::mutex> lifecycle(m_lifecycleMutex);
    SLOG_INFO().message("Start requested").context("script_id", scriptId);

    RunPtr run;
    try {
        std::optional<AutomationScript> script = m_storage->getScript(scriptId);
        if (!script) {
            throw ScriptNotFoundException(scriptId);
        }

        RunPtr previous = findRun(scriptId);
        if (previous) {
            stop(scriptId);
            if (previous->worker.joinable()) {
                previous->worker.join();
            }
            SLOG_DEBUG().message("Previous run joined").context("script_id", scriptId);
        }

        run = std::make_shared<Run>();
        run->startedAt = std::chrono::steady_clock::now();
        run->state.scriptId = scriptId;
        run->state.currentStepId = script->steps.empty() ? std::string() : script->steps.front().id;
        run->state.startTime = std::chrono::system_clock::now();
        run->state.status = ExecutionStatus::RUNNING;
        run->state.isInfiniteRepeat = script->infiniteRepeat;
        run->state.totalRepeats = script->infiniteRepeat ? std::numeric_limits<int>::max()
                                                         : std::max(1, script->repeatCount);
        {
            std::lock_guard<std::mutex> lock(m_runsMutex);
            m_runs[scriptId] = run;
        }

        emitStateChanged(*run);
        logExecution(*run, "", LogLevel::INFO, "Script '" + script->name + "' started");

        run->worker = std::thread(&ScriptExecutionEngine::runScript, this, run, std::move(*script));
    } catch (const std::exception& e) {
        SLOG_ERROR().message(std::string("Failed to start script: ") + e.what()).context("script_id", scriptId);
        if (run && !run->worker.joinable()) {
            {
                std::lock_guard<std::mutex> lock(run->mutex);
                run->state.status = ExecutionStatus::ERROR_STATE;
                run->finished = true;
            }
            run->finishedCondition.notify_all();
            emitStateChanged(*run);
        }
        throw;
    }
}

void ScriptExecutionEngine::stop(const std::string& scriptId) {
    RunPtr run = findRun(scriptId);
    if (!run) {
        SLOG_WARNING().message("No execution state found for script").context("script_id", scriptId);
        return;
    }

    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(run->mutex);
        if (!isTerminal(run->state.status)) {
            run->state.status = ExecutionStatus::STOPPED;
            changed = true;
        }
    }

    if (changed) {
        emitStateChanged(*run);
        logExecution(*run, "", LogLevel::INFO, "Script execution stopped");
    }
    run->token.cancel();
}

void ScriptExecutionEngine::pause(const std::string& scriptId) {
    RunPtr run = findRun(scriptId);
    if (!run) {
        SLOG_WARNING().message("No execution state found for script").context("script_id", scriptId);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(run->mutex);
        if (run->state.status != ExecutionStatus::RUNNING) {
            return;
        }
        run->state.status = ExecutionStatus::PAUSED;
    }
    emitStateChanged(*run);
    logExecution(*run, "", LogLevel::INFO, "Script execution paused");
}

void ScriptExecutionEngine::resume(const std::string& scriptId) {
    RunPtr run = findRun(scriptId);
    if (!run) {
        SLOG_WARNING().message("No execution state found for script").context("script_id", scriptId);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(run->mutex);
        if (run->state.status != ExecutionStatus::PAUSED) {
            return;
        }
        run->state.status = ExecutionStatus::RUNNING;
    }
    emitStateChanged(*run);
    logExecution(*run, "", LogLevel::INFO, "Script execution resumed");
    run->token.notify();
}

std::optional<ScriptExecutionState> ScriptExecutionEngine::getExecutionState(const std::string& scriptId) const {
    RunPtr run = findRun(scriptId);
    if (!run) {
        return std::nullopt;
    }
    return snapshot(*run, true);
}

std::vector<ScriptExecutionState> ScriptExecutionEngine::getAllExecutionStates() const {
    std::vector<RunPtr> runs;
    {
        std::lock_guard<std::mutex> lock(m_runsMutex);
        for (const auto& entry : m_runs) {
            runs.push_back(entry.second);
        }
    }

    std::vector<ScriptExecutionState> states;
    states.reserve(runs.size());
    for (const auto& run : runs) {
        states.push_back(snapshot(*run, true));
    }
    return states;
}

void ScriptExecutionEngine::overrideTargetWindow(std::optional<WindowHandle> handle) {
    std::lock_guard<std::mutex> lock(m_windowMutex);
    m_windowOverride = handle;
    if (handle) {
        m_automation->setTargetWindow(*handle);
    } else {
        m_automation->clearTargetWindow();
    }
    SLOG_INFO().message(handle ? "Target window override set" : "Target window override cleared");
}

std::optional<WindowHandle> ScriptExecutionEngine::getTargetWindowOverride() const {
    std::lock_guard<std::mutex> lock(m_windowMutex);
    return m_windowOverride;
}

bool ScriptExecutionEngine::waitForCompletion(const std::string& scriptId, std::chrono::milliseconds timeout) {
    RunPtr run = findRun(scriptId);
    if (!run) {
        return false;
    }
    std::unique_lock<std::mutex> lock(run->mutex);
    return run->finishedCondition.wait_for(lock, timeout, [&run] { return run->finished; });
}

void ScriptExecutionEngine::runScript(RunPtr run, AutomationScript script) {
    SLOG_INFO().message("Script run started")
        .context("script_id", script.id)
        .context("repeat_mode", script.infiniteRepeat ? std::string("infinite") : std::to_string(script.repeatCount));

    try {
        applyWindowTargeting(script);

        const bool infinite = script.infiniteRepeat;
        const int repeatCount = std::max(1, script.repeatCount);
        {
            std::lock_guard<std::mutex> lock(run->mutex);
            run->state.currentRepeat = 0;
        }

        logExecution(*run, "", LogLevel::INFO,
                     infinite ? "Starting infinite script execution"
                              : "Starting script execution with " + repeatsText(repeatCount));

        StepIndex index = buildStepIndex(script);
        bool iterationFailed = false;
        int currentRepeat = 0;

        while ((infinite || currentRepeat < repeatCount) && !isStopRequested(*run)) {
            {
                std::lock_guard<std::mutex> lock(run->mutex);
                currentRepeat = ++run->state.currentRepeat;
                run->state.lastRepeatTime = std::chrono::system_clock::now();
            }

            logExecution(*run, "", LogLevel::INFO,
                         infinite ? "Starting repeat #" + std::to_string(currentRepeat)
                                  : "Starting repeat " + std::to_string(currentRepeat) + "/" + std::to_string(repeatCount));

            if (!runIteration(*run, script, index)) {
                logExecution(*run, "", LogLevel::ERROR_LEVEL, "Script iteration failed, stopping execution");
                iterationFailed = true;
                break;
            }

            if (!infinite && currentRepeat >= repeatCount) {
                break;
            }

            if (script.delayBetweenRepeatsMs > 0) {
                logExecution(*run, "", LogLevel::INFO,
                             "Waiting " + std::to_string(script.delayBetweenRepeatsMs) + "ms before next repeat");
                sleepOrCancel(*run, script.delayBetweenRepeatsMs);
            }

            emitStateChanged(*run);
        }

        finishRun(*run, script, iterationFailed);
    } catch (const OperationCancelledException&) {
        finishCancelled(*run);
    } catch (const std::exception& e) {
        if (isStopRequested(*run)) {
            finishCancelled(*run);
        } else {
            {
                std::lock_guard<std::mutex> lock(run->mutex);
                run->state.status = ExecutionStatus::ERROR_STATE;
            }
            logExecution(*run, "", LogLevel::ERROR_LEVEL, std::string("Script execution failed: ") + e.what());
            DESKPILOT_HANDLE_ERROR(ErrorType::RUN_ERROR, ErrorSeverity::HIGH,
                                   std::string("Script execution failed: ") + e.what(), script.id,
                                   "ScriptExecutionEngine::runScript");
        }
    }

    try {
        restoreWindowTargeting();
    } catch (const std::exception& e) {
        SLOG_ERROR().message("Failed to restore window targeting")
            .context("script_id", script.id)
            .context("error", e.what());
    }

    {
        std::lock_guard<std::mutex> lock(run->mutex);
        run->finished = true;
    }
    emitStateChanged(*run);
    run->finishedCondition.notify_all();

    SLOG_INFO().message("Script run finished")
        .context("script_id", script.id)
        .context("status", toString(snapshot(*run, false).status));
}

void ScriptExecutionEngine::finishRun(Run& run, const AutomationScript& script, bool iterationFailed) {
    int repeats = 0;
    {
        std::lock_guard<std::mutex> lock(run.mutex);
        // A stop that landed after the last step still wins
        if (run.state.status == ExecutionStatus::STOPPED || run.token.isCancelled()) {
            repeats = -1;
        } else {
            run.state.status = ExecutionStatus::COMPLETED;
            repeats = run.state.currentRepeat;
        }
    }

    if (repeats < 0) {
        finishCancelled(run);
        return;
    }

    if (script.infiniteRepeat && iterationFailed) {
        logExecution(run, "", LogLevel::INFO, "Script execution stopped after " + std::to_string(repeats) + " repeats");
    } else {
        logExecution(run, "", LogLevel::INFO, "Script execution completed");
    }
}

void ScriptExecutionEngine::finishCancelled(Run& run) {
    int repeats = 0;
    {
        std::lock_guard<std::mutex> lock(run.mutex);
        run.state.status = ExecutionStatus::STOPPED;
        repeats = run.state.currentRepeat;
    }
    logExecution(run, "", LogLevel::INFO, "Script execution cancelled after " + repeatsText(repeats));
}

bool ScriptExecutionEngine::runIteration(Run& run, const AutomationScript& script, const StepIndex& index) {
    try {
        const auto& steps = script.steps;
        size_t cursor = 0;
        int transitions = 0;

        while (cursor < steps.size() && transitions < m_options.maxTransitionsPerIteration) {
            waitWhilePaused(run);
            if (isStopRequested(run)) {
                throw OperationCancelledException();
            }

            const ScriptStep& step = steps[cursor];
            if (!step.enabled) {
                ++cursor;
                continue;
            }

            {
                std::lock_guard<std::mutex> lock(run.mutex);
                run.state.currentStepId = step.id;
            }
            emitStateChanged(run);
            logExecution(run, step.id, LogLevel::INFO, "Executing step: " + step.name);

            try {
                StepResult result = executeStep(run, step);

                if (result.success && !result.nextStepId.empty()) {
                    auto target = index.find(result.nextStepId);
                    if (target != index.end()) {
                        cursor = target->second;
                        logExecution(run, step.id, LogLevel::INFO, "Jumping to step: " + steps[cursor].name);
                    } else {
                        logExecution(run, step.id, LogLevel::WARNING,
                                     "Step ID " + result.nextStepId + " not found, continuing to next step");
                        ++cursor;
                    }
                } else if (result.success) {
                    ++cursor;
                } else if (step.elseStepId && !step.elseStepId->empty()) {
                    auto target = index.find(*step.elseStepId);
                    if (target != index.end()) {
                        cursor = target->second;
                        logExecution(run, step.id, LogLevel::INFO,
                                     "Condition failed, jumping to else step: " + steps[cursor].name);
                    } else {
                        logExecution(run, step.id, LogLevel::WARNING,
                                     "Else step ID " + *step.elseStepId + " not found, continuing to next step");
                        ++cursor;
                    }
                } else {
                    ++cursor;
                }
            } catch (const OperationCancelledException&) {
                throw;
            } catch (const std::exception& e) {
                logExecution(run, step.id, LogLevel::ERROR_LEVEL, std::string("Error executing step: ") + e.what());

                auto target = step.elseStepId ? index.find(*step.elseStepId) : index.end();
                if (target != index.end()) {
                    cursor = target->second;
                    logExecution(run, step.id, LogLevel::INFO,
                                 "Jumping to else step after error: " + steps[cursor].name);
                } else {
                    if (step.elseStepId && !step.elseStepId->empty()) {
                        logExecution(run, step.id, LogLevel::WARNING,
                                     "Else step ID " + *step.elseStepId + " not found, continuing to next step");
                    }
                    ++cursor;
                }
            }

            ++transitions;
        }

        if (cursor < steps.size() && transitions >= m_options.maxTransitionsPerIteration) {
            SLOG_DEBUG().message("Transition limit reached")
                .context("script_id", script.id)
                .context("limit", m_options.maxTransitionsPerIteration);
        }
        return true;
    } catch (const OperationCancelledException&) {
        throw;
    } catch (const std::exception& e) {
        logExecution(run, "", LogLevel::ERROR_LEVEL, std::string("Error in script iteration: ") + e.what());
        DESKPILOT_HANDLE_ERROR(ErrorType::ITERATION_ERROR, ErrorSeverity::MEDIUM,
                               std::string("Error in script iteration: ") + e.what(), script.id,
                               "ScriptExecutionEngine::runIteration");
        return false;
    }
}

ScriptExecutionEngine::StepResult ScriptExecutionEngine::executeStep(Run& run, const ScriptStep& step) {
    StepResult result;
    switch (step.type) {
        case StepType::CONDITION:
            return executeConditionStep(run, step);

        case StepType::ACTION:
            for (const auto& action : step.actions) {
                executeAction(run, step, action);
            }
            return result;

        case StepType::WAIT:
            sleepOrCancel(run, params::getParam<int>(step.parameters, "milliseconds", m_options.defaultWaitMs));
            return result;

        case StepType::JUMP:
            result.nextStepId = params::getParam<std::string>(step.parameters, "targetStepId", std::string());
            return result;

        default:
            logExecution(run, step.id, LogLevel::WARNING,
                         "Unknown step type: " + (step.typeName.empty() ? toString(step.type) : step.typeName));
            return result;
    }
}

ScriptExecutionEngine::StepResult ScriptExecutionEngine::executeConditionStep(Run& run, const ScriptStep& step) {
    // A step without conditions passes
    bool aggregate = true;
    bool first = true;

    for (const auto& condition : step.conditions) {
        bool met = evaluateCondition(run, step, condition);

        // The first condition only seeds the aggregate
        if (first) {
            aggregate = met;
            first = false;
            continue;
        }

        if (condition.op == ConditionOperator::OR) {
            aggregate = aggregate || met;
            if (aggregate) {
                break;
            }
        } else {
            aggregate = aggregate && met;
            if (!aggregate) {
                break;
            }
        }
    }

    if (aggregate) {
        for (const auto& action : step.actions) {
            executeAction(run, step, action);
        }
    }

    StepResult result;
    result.success = aggregate;
    return result;
}

bool ScriptExecutionEngine::evaluateCondition(Run& run, const ScriptStep& step, const ScriptCondition& condition) {
    switch (condition.type) {
        case ConditionType::IMAGE_FOUND:
            return evaluateImageCondition(run, step, condition);

        case ConditionType::IMAGE_NOT_FOUND:
            return !evaluateImageCondition(run, step, condition);

        case ConditionType::TIMEOUT: {
            int timeoutMs = params::getParam<int>(condition.parameters, "timeoutMs", m_options.defaultTimeoutMs);
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - run.startedAt);
            return elapsed.count() >= timeoutMs;
        }

        case ConditionType::ALWAYS:
            return true;

        case ConditionType::NEVER:
            return false;

        default:
            logExecution(run, step.id, LogLevel::WARNING,
                         "Unknown condition type: " +
                             (condition.typeName.empty() ? toString(condition.type) : condition.typeName));
            return false;
    }
}

bool ScriptExecutionEngine::evaluateImageCondition(Run& run, const ScriptStep& step, const ScriptCondition& condition) {
    try {
        std::string templateId = params::getParam<std::string>(condition.parameters, "templateImageId", std::string());
        if (templateId.empty()) {
            logExecution(run, step.id, LogLevel::WARNING, "Template image ID not specified in condition");
            return false;
        }

        std::optional<TemplateImage> image = m_storage->getTemplateImage(templateId);
        if (!image) {
            logExecution(run, step.id, LogLevel::WARNING, "Template image " + templateId + " not found");
            return false;
        }
        if (image->imageData.empty()) {
            logExecution(run, step.id, LogLevel::WARNING, "Template image " + templateId + " has no image data");
            return false;
        }

        double templateThreshold = (image->matchThreshold > 0.0 && image->matchThreshold <= 1.0)
                                       ? image->matchThreshold
                                       : m_options.defaultMatchThreshold;
        double threshold = params::getParam<double>(condition.parameters, "threshold", templateThreshold);

        ImageBytes screen = m_screenshots->captureFullScreen();
        MatchResult match = m_recognition->findImage(screen, image->imageData, threshold);

        logExecution(run, step.id, LogLevel::DEBUG,
                     std::string("Image search result: Found=") + (match.found ? "true" : "false") +
                         ", Confidence=" + formatConfidence(match.confidence));
        return match.found;
    } catch (const std::exception& e) {
        logExecution(run, step.id, LogLevel::ERROR_LEVEL, std::string("Error evaluating image condition: ") + e.what());
        return false;
    }
}

void ScriptExecutionEngine::executeAction(Run& run, const ScriptStep& step, const ScriptAction& action) {
    try {
        switch (action.type) {
            case ActionType::CLICK:
            case ActionType::DOUBLE_CLICK:
            case ActionType::RIGHT_CLICK: {
                int x = params::getParam<int>(action.parameters, "x", 0);
                int y = params::getParam<int>(action.parameters, "y", 0);
                std::string where = "(" + std::to_string(x) + ", " + std::to_string(y) + ")";

                if (action.type == ActionType::CLICK) {
                    m_automation->click(x, y);
                    logExecution(run, step.id, LogLevel::INFO, "Clicked at " + where);
                } else if (action.type == ActionType::DOUBLE_CLICK) {
                    m_automation->doubleClick(x, y);
                    logExecution(run, step.id, LogLevel::INFO, "Double-clicked at " + where);
                } else {
                    m_automation->rightClick(x, y);
                    logExecution(run, step.id, LogLevel::INFO, "Right-clicked at " + where);
                }
                break;
            }

            case ActionType::TYPE: {
                std::string text = params::getParam<std::string>(action.parameters, "text", std::string());
                m_automation->typeText(text);
                logExecution(run, step.id, LogLevel::INFO, "Typed text: " + text);
                break;
            }

            case ActionType::KEY_PRESS: {
                std::string keys = params::getParam<std::string>(action.parameters, "keys", std::string());
                m_automation->sendKeys(keys);
                logExecution(run, step.id, LogLevel::INFO, "Sent keys: " + keys);
                break;
            }

            case ActionType::WAIT: {
                int milliseconds = params::getParam<int>(action.parameters, "milliseconds", m_options.defaultWaitMs);
                if (!m_automation->wait(std::chrono::milliseconds(std::max(0, milliseconds)), run.token)) {
                    throw OperationCancelledException();
                }
                logExecution(run, step.id, LogLevel::INFO, "Waited " + std::to_string(milliseconds) + "ms");
                break;
            }

            case ActionType::SCREENSHOT: {
                std::string fileName = params::getParam<std::string>(action.parameters, "fileName", screenshotFileName());
                ImageBytes screen = m_screenshots->captureFullScreen();
                std::string path = m_screenshots->saveScreenshot(screen, fileName);
                logExecution(run, step.id, LogLevel::INFO, "Screenshot saved: " + path);
                break;
            }

            default:
                logExecution(run, step.id, LogLevel::WARNING, "Unknown action type: " + typeNameOf(action));
                break;
        }

        if (action.delayAfterMs > 0) {
            sleepOrCancel(run, action.delayAfterMs);
        }
    } catch (const OperationCancelledException&) {
        throw;
    } catch (const std::exception& e) {
        logExecution(run, step.id, LogLevel::ERROR_LEVEL,
                     "Error executing action " + typeNameOf(action) + ": " + e.what());
        throw;
    }
}

void ScriptExecutionEngine::waitWhilePaused(Run& run) {
    auto notPaused = [&run] {
        std::lock_guard<std::mutex> lock(run.mutex);
        return run.state.status != ExecutionStatus::PAUSED;
    };

    if (notPaused()) {
        return;
    }
    if (!run.token.waitUntil(notPaused, m_options.pausePollInterval)) {
        throw OperationCancelledException();
    }
}

void ScriptExecutionEngine::sleepOrCancel(Run& run, int milliseconds) {
    if (milliseconds <= 0) {
        return;
    }
    if (!run.token.sleepFor(std::chrono::milliseconds(milliseconds))) {
        throw OperationCancelledException();
    }
}

bool ScriptExecutionEngine::isStopRequested(const Run& run) const {
    if (run.token.isCancelled()) {
        return true;
    }
    std::lock_guard<std::mutex> lock(run.mutex);
    return run.state.status == ExecutionStatus::STOPPED;
}

ScriptExecutionEngine::RunPtr ScriptExecutionEngine::findRun(const std::string& scriptId) const {
    std::lock_guard<std::mutex> lock(m_runsMutex);
    auto it = m_runs.find(scriptId);
    return it != m_runs.end() ? it->second : nullptr;
}

ScriptExecutionState ScriptExecutionEngine::snapshot(const Run& run, bool includeLogs) const {
    std::lock_guard<std::mutex> lock(run.mutex);
    if (includeLogs) {
        return run.state;
    }

    ScriptExecutionState copy;
    copy.scriptId = run.state.scriptId;
    copy.currentStepId = run.state.currentStepId;
    copy.startTime = run.state.startTime;
    copy.status = run.state.status;
    copy.variables = run.state.variables;
    copy.currentRepeat = run.state.currentRepeat;
    copy.totalRepeats = run.state.totalRepeats;
    copy.isInfiniteRepeat = run.state.isInfiniteRepeat;
    copy.lastRepeatTime = run.state.lastRepeatTime;
    return copy;
}

void ScriptExecutionEngine::logExecution(Run& run, const std::string& stepId, LogLevel level,
                                         const std::string& message) {
    ExecutionLog log;
    log.id = generateId();
    log.timestamp = std::chrono::system_clock::now();
    log.stepId = stepId;
    log.level = level;
    log.message = message;

    {
        std::lock_guard<std::mutex> lock(run.mutex);
        log.scriptId = run.state.scriptId;
        run.state.logs.push_back(log);
        while (run.state.logs.size() > m_options.maxLogEntries) {
            run.state.logs.pop_front();
        }
    }

    SLOG_DEBUG().message(message)
        .component("engine")
        .context("script_id", log.scriptId)
        .context("step_id", stepId)
        .context("level", logLevelToString(level));

    m_events.publishLog(log);
}

void ScriptExecutionEngine::emitStateChanged(const Run& run) {
    if (!m_events.hasStateListeners()) {
        return;
    }
    m_events.publishState(snapshot(run, false));
}

void ScriptExecutionEngine::applyWindowTargeting(const AutomationScript& script) {
    std::lock_guard<std::mutex> lock(m_windowMutex);
    if (m_windowOverride) {
        m_automation->setTargetWindow(*m_windowOverride);
    } else if (auto handle = script.targetWindow()) {
        m_automation->setTargetWindow(*handle);
    } else {
        m_automation->clearTargetWindow();
    }
}

void ScriptExecutionEngine::restoreWindowTargeting() {
    std::lock_guard<std::mutex> lock(m_windowMutex);
    if (m_windowOverride) {
        m_automation->setTargetWindow(*m_windowOverride);
    } else {
        m_automation->clearTargetWindow();
    }
}

ScriptExecutionEngine::StepIndex ScriptExecutionEngine::buildStepIndex(const AutomationScript& script) {
    StepIndex index;
    for (size_t i = 0; i < script.steps.size(); ++i) {
        // emplace keeps the first occurrence of a duplicate id
        index.emplace(script.steps[i].id, i);
    }
    return index;
}

} // namespace deskpilot
