#ifndef DESKPILOT_SCRIPT_MODELS_H
#define DESKPILOT_SCRIPT_MODELS_H

#include <chrono>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "parameter_bag.h"
#include "../common/structured_logger.h"

namespace deskpilot {

using Timestamp = std::chrono::system_clock::time_point;
using ImageBytes = std::vector<std::uint8_t>;
using WindowHandle = std::uintptr_t;

enum class StepType {
    CONDITION,
    ACTION,
    WAIT,
    JUMP,
    UNKNOWN
};

enum class ConditionType {
    IMAGE_FOUND,
    IMAGE_NOT_FOUND,
    TIMEOUT,
    ALWAYS,
    NEVER,
    UNKNOWN
};

enum class ActionType {
    CLICK,
    DOUBLE_CLICK,
    RIGHT_CLICK,
    TYPE,
    KEY_PRESS,
    WAIT,
    SCREENSHOT,
    UNKNOWN
};

// How a condition's result folds into the step's running aggregate
enum class ConditionOperator {
    AND,
    OR
};

enum class ExecutionStatus {
    RUNNING,
    PAUSED,
    STOPPED,
    COMPLETED,
    ERROR_STATE  // Avoids the Windows ERROR macro
};

std::string toString(StepType type);
std::string toString(ConditionType type);
std::string toString(ActionType type);
std::string toString(ConditionOperator op);
std::string toString(ExecutionStatus status);

// Case-insensitive; on failure value is left unchanged and false returned
bool fromString(const std::string& text, StepType& value);
bool fromString(const std::string& text, ConditionType& value);
bool fromString(const std::string& text, ActionType& value);
bool fromString(const std::string& text, ConditionOperator& value);
bool fromString(const std::string& text, ExecutionStatus& value);

bool isTerminal(ExecutionStatus status);

struct ScreenPoint {
    int x = 0;
    int y = 0;
};

struct ScreenRegion {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool isEmpty() const { return width <= 0 || height <= 0; }
};

struct ScriptCondition {
    std::string id;
    ConditionType type = ConditionType::UNKNOWN;
    std::string typeName;  // As written in the document, for diagnostics
    ParameterBag parameters;
    ConditionOperator op = ConditionOperator::AND;
};

struct ScriptAction {
    std::string id;
    ActionType type = ActionType::UNKNOWN;
    std::string typeName;
    ParameterBag parameters;
    int delayAfterMs = 0;
};

struct ScriptStep {
    std::string id;
    int order = 0;  // Informational; traversal follows list position and jumps
    StepType type = StepType::UNKNOWN;
    std::string typeName;
    std::string name;
    ParameterBag parameters;
    std::vector<ScriptCondition> conditions;
    std::vector<ScriptAction> actions;
    std::optional<std::string> elseStepId;
    bool enabled = true;
};

struct AutomationScript {
    std::string id;
    std::string name;
    std::string description;
    Timestamp createdAt;
    Timestamp modifiedAt;
    std::vector<ScriptStep> steps;
    bool isActive = false;

    bool infiniteRepeat = false;
    int repeatCount = 1;
    int delayBetweenRepeatsMs = 0;

    bool useWindowTargeting = false;
    std::string targetWindowHandle;  // Decimal or 0x-prefixed hex

    /**
     * @brief The window to target for this script, if enabled and parseable
     */
    std::optional<WindowHandle> targetWindow() const;
};

struct TemplateImage {
    std::string id;
    std::string name;
    std::string filePath;
    ImageBytes imageData;  // Not serialized; loaded from filePath
    Timestamp createdAt;
    ScreenRegion captureRegion;
    double matchThreshold = 0.8;
};

struct MatchResult {
    bool found = false;
    ScreenPoint location;
    double confidence = 0.0;
    ScreenRegion boundingBox;
    std::chrono::milliseconds searchTime{0};
};

struct ExecutionLog {
    std::string id;
    Timestamp timestamp;
    std::string scriptId;
    std::string stepId;  // Empty for script level messages
    LogLevel level = LogLevel::INFO;
    std::string message;
};

/**
 * @brief Observable state of one script run
 *
 * Instances handed out by the engine are snapshots; mutating them has no
 * effect on the run.
 */
struct ScriptExecutionState {
    std::string scriptId;
    std::string currentStepId;
    Timestamp startTime;
    ExecutionStatus status = ExecutionStatus::STOPPED;
    std::deque<ExecutionLog> logs;
    ParameterBag variables;  // Reserved; no shipped condition or action reads it

    int currentRepeat = 0;
    int totalRepeats = 1;
    bool isInfiniteRepeat = false;
    std::optional<Timestamp> lastRepeatTime;
};

std::string generateId();
std::string formatTimestamp(const Timestamp& time);
std::optional<Timestamp> parseTimestamp(const std::string& text);
std::optional<WindowHandle> parseWindowHandle(const std::string& text);

// nlohmann::json conversions, found by ADL
void to_json(nlohmann::json& j, const ScreenPoint& point);
void from_json(const nlohmann::json& j, ScreenPoint& point);
void to_json(nlohmann::json& j, const ScreenRegion& region);
void from_json(const nlohmann::json& j, ScreenRegion& region);
void to_json(nlohmann::json& j, const ScriptCondition& condition);
void from_json(const nlohmann::json& j, ScriptCondition& condition);
void to_json(nlohmann::json& j, const ScriptAction& action);
void from_json(const nlohmann::json& j, ScriptAction& action);
void to_json(nlohmann::json& j, const ScriptStep& step);
void from_json(const nlohmann::json& j, ScriptStep& step);
void to_json(nlohmann::json& j, const AutomationScript& script);
void from_json(const nlohmann::json& j, AutomationScript& script);
void to_json(nlohmann::json& j, const TemplateImage& image);
void from_json(const nlohmann::json& j, TemplateImage& image);
void to_json(nlohmann::json& j, const MatchResult& result);
void to_json(nlohmann::json& j, const ExecutionLog& log);
void to_json(nlohmann::json& j, const ScriptExecutionState& state);

} // namespace deskpilot

#endif // DESKPILOT_SCRIPT_MODELS_H
