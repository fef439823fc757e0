#include "json_utils.h"
#include "structured_logger.h"
#include "string_utils.h"
#include <cmath>

namespace deskpilot {
namespace utils {

const nlohmann::json* JsonUtils::findField(const nlohmann::json& json, const std::string& fieldName) {
    if (!json.is_object() || fieldName.empty()) {
        return nullptr;
    }

    auto exact = json.find(fieldName);
    if (exact != json.end()) {
        return &(*exact);
    }

    for (auto it = json.begin(); it != json.end(); ++it) {
        if (StringUtils::equalsIgnoreCase(it.key(), fieldName)) {
            return &(*it);
        }
    }
    return nullptr;
}

std::string JsonUtils::getStringField(const nlohmann::json& json, const std::string& fieldName, const std::string& defaultValue) {
    const nlohmann::json* field = findField(json, fieldName);
    if (!field || field->is_null()) {
        return defaultValue;
    }

    if (field->is_string()) {
        return field->get<std::string>();
    }
    if (field->is_number_integer()) {
        return std::to_string(field->get<long long>());
    }
    if (field->is_number()) {
        return field->dump();
    }
    if (field->is_boolean()) {
        return field->get<bool>() ? "true" : "false";
    }

    SLOG_WARNING().message("Field is not a string, returning default value").context("field", fieldName);
    return defaultValue;
}

int JsonUtils::getIntField(const nlohmann::json& json, const std::string& fieldName, int defaultValue) {
    const nlohmann::json* field = findField(json, fieldName);
    if (!field || field->is_null()) {
        return defaultValue;
    }

    if (field->is_number_integer()) {
        return field->get<int>();
    }
    if (field->is_number_float()) {
        return static_cast<int>(field->get<double>());
    }
    if (field->is_string()) {
        int parsed = 0;
        if (StringUtils::parseInt(field->get<std::string>(), parsed)) {
            return parsed;
        }
    }

    SLOG_WARNING().message("Field is not an integer, returning default value").context("field", fieldName);
    return defaultValue;
}

bool JsonUtils::getBoolField(const nlohmann::json& json, const std::string& fieldName, bool defaultValue) {
    const nlohmann::json* field = findField(json, fieldName);
    if (!field || field->is_null()) {
        return defaultValue;
    }

    if (field->is_boolean()) {
        return field->get<bool>();
    }
    if (field->is_number()) {
        return field->get<double>() != 0.0;
    }
    if (field->is_string()) {
        bool parsed = false;
        if (StringUtils::parseBool(field->get<std::string>(), parsed)) {
            return parsed;
        }
    }

    SLOG_WARNING().message("Field is not a boolean, returning default value").context("field", fieldName);
    return defaultValue;
}

double JsonUtils::getDoubleField(const nlohmann::json& json, const std::string& fieldName, double defaultValue) {
    const nlohmann::json* field = findField(json, fieldName);
    if (!field || field->is_null()) {
        return defaultValue;
    }

    if (field->is_number()) {
        return field->get<double>();
    }
    if (field->is_string()) {
        double parsed = 0.0;
        if (StringUtils::parseDouble(field->get<std::string>(), parsed)) {
            return parsed;
        }
    }

    SLOG_WARNING().message("Field is not a number, returning default value").context("field", fieldName);
    return defaultValue;
}

nlohmann::json JsonUtils::getArrayField(const nlohmann::json& json, const std::string& fieldName) {
    const nlohmann::json* field = findField(json, fieldName);
    if (field && field->is_array()) {
        return *field;
    }
    return nlohmann::json::array();
}

bool JsonUtils::mergeJsonObjects(const nlohmann::json& base, const nlohmann::json& overlay, nlohmann::json& result) {
    if (!base.is_object() || !overlay.is_object()) {
        SLOG_ERROR().message("Both base and overlay must be JSON objects in mergeJsonObjects");
        return false;
    }

    result = base;
    for (const auto& [key, value] : overlay.items()) {
        if (value.is_object() && result.contains(key) && result[key].is_object()) {
            nlohmann::json nested;
            mergeJsonObjects(result[key], value, nested);
            result[key] = nested;
        } else {
            result[key] = value;
        }
    }
    return true;
}

} // namespace utils
} // namespace deskpilot
