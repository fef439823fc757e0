#ifndef DESKPILOT_STRING_UTILS_H
#define DESKPILOT_STRING_UTILS_H

#include <string>
#include <vector>
#include <cstdint>

namespace deskpilot {
namespace utils {

/**
 * @brief String helpers shared by the model decoders, key parser and CLI
 */
class StringUtils {
public:
    static std::string trim(const std::string& str);

    /**
     * @brief Split on a delimiter, keeping empty parts
     * @note "CTRL++" split on "+" yields {"CTRL", "", ""}
     */
    static std::vector<std::string> split(const std::string& str, const std::string& delimiter);

    static bool startsWith(const std::string& str, const std::string& prefix);
    static bool endsWith(const std::string& str, const std::string& suffix);

    static std::string toLowerCase(const std::string& str);
    static std::string toUpperCase(const std::string& str);
    static bool equalsIgnoreCase(const std::string& a, const std::string& b);

    static std::string join(const std::vector<std::string>& strings, const std::string& delimiter);

    /**
     * @brief Strict numeric parsing: the whole string (after trimming) must be consumed
     * @return false on empty input, trailing garbage or overflow; value is untouched then
     */
    static bool parseInt(const std::string& str, int& value);
    static bool parseInt64(const std::string& str, std::int64_t& value);
    static bool parseDouble(const std::string& str, double& value);

    /**
     * @brief Accepts "true"/"false" in any letter case
     */
    static bool parseBool(const std::string& str, bool& value);

private:
    static bool isWhitespace(char c);
};

} // namespace utils
} // namespace deskpilot

#endif // DESKPILOT_STRING_UTILS_H
