#include "script_models.h"
#include "../common/error_handler.h"
#include "../common/json_utils.h"
#include "../common/string_utils.h"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace deskpilot {

using utils::JsonUtils;
using utils::StringUtils;

namespace {
    template<typename Enum, size_t N>
    bool lookup(const std::string& text, const std::pair<const char*, Enum> (&table)[N], Enum& value) {
        std::string key = StringUtils::trim(text);
        for (const auto& entry : table) {
            if (StringUtils::equalsIgnoreCase(key, entry.first)) {
                value = entry.second;
                return true;
            }
        }
        return false;
    }

    const std::pair<const char*, StepType> kStepTypes[] = {
        {"condition", StepType::CONDITION},
        {"action", StepType::ACTION},
        {"wait", StepType::WAIT},
        {"jump", StepType::JUMP},
    };

    const std::pair<const char*, ConditionType> kConditionTypes[] = {
        {"image_found", ConditionType::IMAGE_FOUND},
        {"image_not_found", ConditionType::IMAGE_NOT_FOUND},
        {"timeout", ConditionType::TIMEOUT},
        {"always", ConditionType::ALWAYS},
        {"never", ConditionType::NEVER},
    };

    const std::pair<const char*, ActionType> kActionTypes[] = {
        {"click", ActionType::CLICK},
        {"double_click", ActionType::DOUBLE_CLICK},
        {"right_click", ActionType::RIGHT_CLICK},
        {"type", ActionType::TYPE},
        {"key_press", ActionType::KEY_PRESS},
        {"wait", ActionType::WAIT},
        {"screenshot", ActionType::SCREENSHOT},
    };

    const std::pair<const char*, ExecutionStatus> kStatuses[] = {
        {"Running", ExecutionStatus::RUNNING},
        {"Paused", ExecutionStatus::PAUSED},
        {"Stopped", ExecutionStatus::STOPPED},
        {"Completed", ExecutionStatus::COMPLETED},
        {"Error", ExecutionStatus::ERROR_STATE},
    };

    template<typename Enum, size_t N>
    std::string nameOf(Enum value, const std::pair<const char*, Enum> (&table)[N]) {
        for (const auto& entry : table) {
            if (entry.second == value) {
                return entry.first;
            }
        }
        return "unknown";
    }

    void requireObject(const nlohmann::json& j, const char* what) {
        if (!j.is_object()) {
            DESKPILOT_THROW(ErrorType::VALIDATION_ERROR, ErrorSeverity::MEDIUM,
                            std::string(what) + " must be a JSON object", j.type_name(), "script_models");
        }
    }

    std::string idOrGenerated(const nlohmann::json& j) {
        std::string id = JsonUtils::getStringField(j, "id");
        return id.empty() ? generateId() : id;
    }

    Timestamp timestampField(const nlohmann::json& j, const std::string& field) {
        auto parsed = parseTimestamp(JsonUtils::getStringField(j, field));
        return parsed ? *parsed : std::chrono::system_clock::now();
    }

    nlohmann::json objectField(const nlohmann::json& j, const std::string& field) {
        const nlohmann::json* value = JsonUtils::findField(j, field);
        return (value && value->is_object()) ? *value : nlohmann::json::object();
    }

    template<typename T>
    std::vector<T> listField(const nlohmann::json& j, const std::string& field) {
        std::vector<T> items;
        for (const auto& element : JsonUtils::getArrayField(j, field)) {
            items.push_back(element.get<T>());
        }
        return items;
    }
}

std::string toString(StepType type) {
    return type == StepType::UNKNOWN ? "unknown" : nameOf(type, kStepTypes);
}

std::string toString(ConditionType type) {
    return type == ConditionType::UNKNOWN ? "unknown" : nameOf(type, kConditionTypes);
}

std::string toString(ActionType type) {
    return type == ActionType::UNKNOWN ? "unknown" : nameOf(type, kActionTypes);
}

std::string toString(ConditionOperator op) {
    return op == ConditionOperator::OR ? "OR" : "AND";
}

std::string toString(ExecutionStatus status) {
    return nameOf(status, kStatuses);
}

bool fromString(const std::string& text, StepType& value) {
    return lookup(text, kStepTypes, value);
}

bool fromString(const std::string& text, ConditionType& value) {
    return lookup(text, kConditionTypes, value);
}

bool fromString(const std::string& text, ActionType& value) {
    return lookup(text, kActionTypes, value);
}

bool fromString(const std::string& text, ConditionOperator& value) {
    std::string key = StringUtils::trim(text);
    if (StringUtils::equalsIgnoreCase(key, "OR")) {
        value = ConditionOperator::OR;
        return true;
    }
    if (StringUtils::equalsIgnoreCase(key, "AND")) {
        value = ConditionOperator::AND;
        return true;
    }
    return false;
}

bool fromString(const std::string& text, ExecutionStatus& value) {
    return lookup(text, kStatuses, value);
}

bool isTerminal(ExecutionStatus status) {
    return status == ExecutionStatus::STOPPED ||
           status == ExecutionStatus::COMPLETED ||
           status == ExecutionStatus::ERROR_STATE;
}

std::optional<WindowHandle> AutomationScript::targetWindow() const {
    if (!useWindowTargeting) {
        return std::nullopt;
    }
    return parseWindowHandle(targetWindowHandle);
}

std::string generateId() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<std::uint64_t> dist;

    std::uint64_t high = dist(engine);
    std::uint64_t low = dist(engine);

    std::ostringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << (high >> 32) << '-'
       << std::setw(4) << ((high >> 16) & 0xFFFF) << '-'
       << std::setw(4) << (high & 0xFFFF) << '-'
       << std::setw(4) << (low >> 48) << '-'
       << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

std::string formatTimestamp(const Timestamp& time) {
    std::time_t raw = std::chrono::system_clock::to_time_t(time);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &raw);
#else
    localtime_r(&raw, &local);
#endif
    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

std::optional<Timestamp> parseTimestamp(const std::string& text) {
    if (text.size() < 19) {
        return std::nullopt;
    }

    std::tm parsed{};
    std::istringstream ss(text.substr(0, 19));
    ss >> std::get_time(&parsed, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return std::nullopt;
    }

    parsed.tm_isdst = -1;
    std::time_t raw = std::mktime(&parsed);
    if (raw == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(raw);
}

std::optional<WindowHandle> parseWindowHandle(const std::string& text) {
    std::string trimmed = StringUtils::trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    int base = 10;
    std::string digits = trimmed;
    if (StringUtils::startsWith(trimmed, "0x") || StringUtils::startsWith(trimmed, "0X")) {
        base = 16;
        digits = trimmed.substr(2);
    }
    if (digits.empty() || digits[0] == '-' || digits[0] == '+') {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(digits.c_str(), &end, base);
    if (errno == ERANGE || end != digits.c_str() + digits.size() || value == 0) {
        return std::nullopt;
    }
    return static_cast<WindowHandle>(value);
}

void to_json(nlohmann::json& j, const ScreenPoint& point) {
    j = nlohmann::json{{"x", point.x}, {"y", point.y}};
}

void from_json(const nlohmann::json& j, ScreenPoint& point) {
    point.x = JsonUtils::getIntField(j, "x");
    point.y = JsonUtils::getIntField(j, "y");
}

void to_json(nlohmann::json& j, const ScreenRegion& region) {
    j = nlohmann::json{{"x", region.x}, {"y", region.y},
                       {"width", region.width}, {"height", region.height}};
}

void from_json(const nlohmann::json& j, ScreenRegion& region) {
    region.x = JsonUtils::getIntField(j, "x");
    region.y = JsonUtils::getIntField(j, "y");
    region.width = JsonUtils::getIntField(j, "width");
    region.height = JsonUtils::getIntField(j, "height");
}

void to_json(nlohmann::json& j, const ScriptCondition& condition) {
    j = nlohmann::json{
        {"id", condition.id},
        {"type", condition.typeName.empty() ? toString(condition.type) : condition.typeName},
        {"parameters", params::toJson(condition.parameters)},
        {"operator", toString(condition.op)}
    };
}

void from_json(const nlohmann::json& j, ScriptCondition& condition) {
    requireObject(j, "Condition");
    condition.id = idOrGenerated(j);
    condition.typeName = JsonUtils::getStringField(j, "type");
    condition.type = ConditionType::UNKNOWN;
    fromString(condition.typeName, condition.type);
    condition.parameters = params::fromJson(objectField(j, "parameters"));
    // Anything but OR combines as AND
    condition.op = ConditionOperator::AND;
    fromString(JsonUtils::getStringField(j, "operator", "AND"), condition.op);
}

void to_json(nlohmann::json& j, const ScriptAction& action) {
    j = nlohmann::json{
        {"id", action.id},
        {"type", action.typeName.empty() ? toString(action.type) : action.typeName},
        {"parameters", params::toJson(action.parameters)},
        {"delayAfter", action.delayAfterMs}
    };
}

void from_json(const nlohmann::json& j, ScriptAction& action) {
    requireObject(j, "Action");
    action.id = idOrGenerated(j);
    action.typeName = JsonUtils::getStringField(j, "type");
    action.type = ActionType::UNKNOWN;
    fromString(action.typeName, action.type);
    action.parameters = params::fromJson(objectField(j, "parameters"));
    action.delayAfterMs = JsonUtils::getIntField(j, "delayAfter", 0);
}

void to_json(nlohmann::json& j, const ScriptStep& step) {
    j = nlohmann::json{
        {"id", step.id},
        {"order", step.order},
        {"type", step.typeName.empty() ? toString(step.type) : step.typeName},
        {"name", step.name},
        {"parameters", params::toJson(step.parameters)},
        {"conditions", step.conditions},
        {"actions", step.actions},
        {"elseStepId", step.elseStepId ? nlohmann::json(*step.elseStepId) : nlohmann::json(nullptr)},
        {"isEnabled", step.enabled}
    };
}

void from_json(const nlohmann::json& j, ScriptStep& step) {
    requireObject(j, "Step");
    step.id = idOrGenerated(j);
    step.order = JsonUtils::getIntField(j, "order", 0);
    step.typeName = JsonUtils::getStringField(j, "type");
    step.type = StepType::UNKNOWN;
    fromString(step.typeName, step.type);
    step.name = JsonUtils::getStringField(j, "name");
    step.parameters = params::fromJson(objectField(j, "parameters"));
    step.conditions = listField<ScriptCondition>(j, "conditions");
    step.actions = listField<ScriptAction>(j, "actions");

    std::string elseStepId = JsonUtils::getStringField(j, "elseStepId");
    if (elseStepId.empty()) {
        step.elseStepId.reset();
    } else {
        step.elseStepId = elseStepId;
    }
    step.enabled = JsonUtils::getBoolField(j, "isEnabled", true);
}

void to_json(nlohmann::json& j, const AutomationScript& script) {
    j = nlohmann::json{
        {"id", script.id},
        {"name", script.name},
        {"description", script.description},
        {"createdAt", formatTimestamp(script.createdAt)},
        {"modifiedAt", formatTimestamp(script.modifiedAt)},
        {"steps", script.steps},
        {"isActive", script.isActive},
        {"isInfiniteRepeat", script.infiniteRepeat},
        {"repeatCount", script.repeatCount},
        {"delayBetweenRepeats", script.delayBetweenRepeatsMs},
        {"useWindowTargeting", script.useWindowTargeting},
        {"targetWindowHandle", script.targetWindowHandle}
    };
}

void from_json(const nlohmann::json& j, AutomationScript& script) {
    requireObject(j, "Script");
    script.id = idOrGenerated(j);
    script.name = JsonUtils::getStringField(j, "name");
    script.description = JsonUtils::getStringField(j, "description");
    script.createdAt = timestampField(j, "createdAt");
    script.modifiedAt = timestampField(j, "modifiedAt");
    script.steps = listField<ScriptStep>(j, "steps");
    script.isActive = JsonUtils::getBoolField(j, "isActive", false);
    script.infiniteRepeat = JsonUtils::getBoolField(j, "isInfiniteRepeat", false);
    script.repeatCount = std::max(1, JsonUtils::getIntField(j, "repeatCount", 1));
    script.delayBetweenRepeatsMs = std::max(0, JsonUtils::getIntField(j, "delayBetweenRepeats", 0));
    script.useWindowTargeting = JsonUtils::getBoolField(j, "useWindowTargeting", false);
    script.targetWindowHandle = JsonUtils::getStringField(j, "targetWindowHandle");
}

void to_json(nlohmann::json& j, const TemplateImage& image) {
    j = nlohmann::json{
        {"id", image.id},
        {"name", image.name},
        {"filePath", image.filePath},
        {"createdAt", formatTimestamp(image.createdAt)},
        {"captureRegion", image.captureRegion},
        {"matchThreshold", image.matchThreshold}
    };
}

void from_json(const nlohmann::json& j, TemplateImage& image) {
    requireObject(j, "Template image");
    image.id = idOrGenerated(j);
    image.name = JsonUtils::getStringField(j, "name");
    image.filePath = JsonUtils::getStringField(j, "filePath");
    image.createdAt = timestampField(j, "createdAt");
    image.captureRegion = objectField(j, "captureRegion").get<ScreenRegion>();
    image.matchThreshold = JsonUtils::getDoubleField(j, "matchThreshold", 0.8);
    image.imageData.clear();
}

void to_json(nlohmann::json& j, const MatchResult& result) {
    j = nlohmann::json{
        {"found", result.found},
        {"location", result.location},
        {"confidence", result.confidence},
        {"boundingBox", result.boundingBox},
        {"searchTime", result.searchTime.count()}
    };
}

void to_json(nlohmann::json& j, const ExecutionLog& log) {
    j = nlohmann::json{
        {"id", log.id},
        {"timestamp", formatTimestamp(log.timestamp)},
        {"scriptId", log.scriptId},
        {"stepId", log.stepId},
        {"level", logLevelToString(log.level)},
        {"message", log.message}
    };
}

void to_json(nlohmann::json& j, const ScriptExecutionState& state) {
    j = nlohmann::json{
        {"scriptId", state.scriptId},
        {"currentStepId", state.currentStepId},
        {"startTime", formatTimestamp(state.startTime)},
        {"status", toString(state.status)},
        {"logs", nlohmann::json::array()},
        {"variables", params::toJson(state.variables)},
        {"currentRepeat", state.currentRepeat},
        {"totalRepeats", state.totalRepeats},
        {"isInfiniteRepeat", state.isInfiniteRepeat},
        {"lastRepeatTime", state.lastRepeatTime ? nlohmann::json(formatTimestamp(*state.lastRepeatTime))
                                                : nlohmann::json(nullptr)}
    };
    for (const auto& log : state.logs) {
        j["logs"].push_back(log);
    }
}

} // namespace deskpilot
