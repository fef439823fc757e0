#ifndef DESKPILOT_JSON_UTILS_H
#define DESKPILOT_JSON_UTILS_H

#include <string>
#include <nlohmann/json.hpp>

namespace deskpilot {
namespace utils {

/**
 * @brief Tolerant field access for JSON documents written by hand or by other tools
 *
 * Field names are matched exactly first, then case-insensitively, so
 * "repeatCount", "RepeatCount" and "repeatcount" all resolve.
 */
class JsonUtils {
public:
    /**
     * @brief Locate a field in an object
     * @return Pointer to the value, or nullptr if json is not an object or has no such field
     */
    static const nlohmann::json* findField(const nlohmann::json& json, const std::string& fieldName);

    /**
     * @brief Get string field with default value
     * @note Numbers and booleans are converted to their text form
     */
    static std::string getStringField(const nlohmann::json& json, const std::string& fieldName, const std::string& defaultValue = "");

    /**
     * @brief Get integer field with default value
     * @note Floats are truncated, numeric strings are parsed
     */
    static int getIntField(const nlohmann::json& json, const std::string& fieldName, int defaultValue = 0);

    static bool getBoolField(const nlohmann::json& json, const std::string& fieldName, bool defaultValue = false);
    static double getDoubleField(const nlohmann::json& json, const std::string& fieldName, double defaultValue = 0.0);

    /**
     * @brief Get array field
     * @return Empty array when the field is missing or not an array
     */
    static nlohmann::json getArrayField(const nlohmann::json& json, const std::string& fieldName);

    /**
     * @brief Recursively merge overlay into base
     * @param result Receives the merged object; nested objects are merged, other values replaced
     * @return false if either input is not an object
     */
    static bool mergeJsonObjects(const nlohmann::json& base, const nlohmann::json& overlay, nlohmann::json& result);
};

} // namespace utils
} // namespace deskpilot

#endif // DESKPILOT_JSON_UTILS_H
