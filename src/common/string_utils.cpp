#include "string_utils.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace deskpilot {
namespace utils {

bool StringUtils::isWhitespace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string StringUtils::trim(const std::string& str) {
    auto begin = std::find_if_not(str.begin(), str.end(), isWhitespace);
    auto end = std::find_if_not(str.rbegin(), str.rend(), isWhitespace).base();
    return (begin < end) ? std::string(begin, end) : std::string();
}

std::vector<std::string> StringUtils::split(const std::string& str, const std::string& delimiter) {
    std::vector<std::string> parts;
    if (delimiter.empty()) {
        parts.push_back(str);
        return parts;
    }

    size_t start = 0;
    size_t pos = 0;
    while ((pos = str.find(delimiter, start)) != std::string::npos) {
        parts.push_back(str.substr(start, pos - start));
        start = pos + delimiter.length();
    }
    parts.push_back(str.substr(start));
    return parts;
}

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string StringUtils::toLowerCase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string StringUtils::toUpperCase(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

bool StringUtils::equalsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::string StringUtils::join(const std::vector<std::string>& strings, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < strings.size(); ++i) {
        if (i > 0) {
            result += delimiter;
        }
        result += strings[i];
    }
    return result;
}

bool StringUtils::parseInt64(const std::string& str, std::int64_t& value) {
    std::string text = trim(str);
    if (text.empty()) {
        return false;
    }

    errno = 0;
    char* end = nullptr;
    long long parsed = std::strtoll(text.c_str(), &end, 10);
    if (errno == ERANGE || end != text.c_str() + text.size()) {
        return false;
    }

    value = static_cast<std::int64_t>(parsed);
    return true;
}

bool StringUtils::parseInt(const std::string& str, int& value) {
    std::int64_t wide = 0;
    if (!parseInt64(str, wide) ||
        wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        return false;
    }

    value = static_cast<int>(wide);
    return true;
}

bool StringUtils::parseDouble(const std::string& str, double& value) {
    std::string text = trim(str);
    if (text.empty()) {
        return false;
    }

    errno = 0;
    char* end = nullptr;
    double parsed = std::strtod(text.c_str(), &end);
    if (errno == ERANGE || end != text.c_str() + text.size() || !std::isfinite(parsed)) {
        return false;
    }

    value = parsed;
    return true;
}

bool StringUtils::parseBool(const std::string& str, bool& value) {
    std::string text = toLowerCase(trim(str));
    if (text == "true") {
        value = true;
        return true;
    }
    if (text == "false") {
        value = false;
        return true;
    }
    return false;
}

} // namespace utils
} // namespace deskpilot
