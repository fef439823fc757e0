#ifndef DESKPILOT_PARAMETER_BAG_H
#define DESKPILOT_PARAMETER_BAG_H

#include <cstdint>
#include <map>
#include <string>
#include <type_traits>
#include <variant>
#include <nlohmann/json.hpp>

namespace deskpilot {

/**
 * @brief Loosely typed parameter value
 *
 * Values set from code use the native alternatives. Values decoded from a
 * script document keep the decoded nlohmann::json element.
 */
using ParameterValue = std::variant<bool, std::int64_t, double, std::string, nlohmann::json>;
using ParameterBag = std::map<std::string, ParameterValue>;

namespace params {
namespace detail {
    // Each returns false, leaving out untouched, when the value cannot be represented
    bool coerce(const ParameterValue& value, std::string& out) noexcept;
    bool coerce(const ParameterValue& value, int& out) noexcept;
    bool coerce(const ParameterValue& value, std::int64_t& out) noexcept;
    bool coerce(const ParameterValue& value, double& out) noexcept;
    bool coerce(const ParameterValue& value, bool& out) noexcept;
}

bool hasParam(const ParameterBag& bag, const std::string& key);

/**
 * @brief Typed read of a parameter with a fallback
 *
 * T is std::string, int, std::int64_t, double, bool, or an enum type with a
 * `bool fromString(const std::string&, T&)` overload found by ADL. Missing keys,
 * nulls and values that do not convert yield defaultValue.
 */
template<typename T>
T getParam(const ParameterBag& bag, const std::string& key, const T& defaultValue) {
    auto it = bag.find(key);
    if (it == bag.end()) {
        return defaultValue;
    }

    T result = defaultValue;
    if constexpr (std::is_enum_v<T>) {
        std::string text;
        if (detail::coerce(it->second, text) && fromString(text, result)) {
            return result;
        }
    } else {
        if (detail::coerce(it->second, result)) {
            return result;
        }
    }
    return defaultValue;
}

nlohmann::json toJson(const ParameterValue& value);
nlohmann::json toJson(const ParameterBag& bag);

/**
 * @brief Decode an object into a bag; each member is kept as a json element
 * @note Anything other than an object yields an empty bag
 */
ParameterBag fromJson(const nlohmann::json& object);

} // namespace params
} // namespace deskpilot

#endif // DESKPILOT_PARAMETER_BAG_H
