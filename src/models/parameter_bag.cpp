#include "parameter_bag.h"
#include "../common/string_utils.h"
#include <cmath>
#include <limits>

namespace deskpilot {
namespace params {

namespace {
    using Scalar = std::variant<std::monostate, bool, std::int64_t, double, std::string>;

    // Reduce a json element to the native alternative it carries
    Scalar unwrap(const nlohmann::json& element) noexcept {
        switch (element.type()) {
            case nlohmann::json::value_t::boolean:
                return element.get_ref<const nlohmann::json::boolean_t&>();
            case nlohmann::json::value_t::number_integer:
                return static_cast<std::int64_t>(element.get_ref<const nlohmann::json::number_integer_t&>());
            case nlohmann::json::value_t::number_unsigned: {
                auto value = element.get_ref<const nlohmann::json::number_unsigned_t&>();
                if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                    return static_cast<double>(value);
                }
                return static_cast<std::int64_t>(value);
            }
            case nlohmann::json::value_t::number_float:
                return element.get_ref<const nlohmann::json::number_float_t&>();
            case nlohmann::json::value_t::string:
                return element.get_ref<const nlohmann::json::string_t&>();
            default:
                return std::monostate{};
        }
    }

    Scalar toScalar(const ParameterValue& value) noexcept {
        if (const auto* element = std::get_if<nlohmann::json>(&value)) {
            return unwrap(*element);
        }
        if (const auto* b = std::get_if<bool>(&value)) return *b;
        if (const auto* i = std::get_if<std::int64_t>(&value)) return *i;
        if (const auto* d = std::get_if<double>(&value)) return *d;
        return std::get<std::string>(value);
    }

    bool doubleToInt64(double value, std::int64_t& out) {
        if (!std::isfinite(value)) {
            return false;
        }
        double rounded = std::nearbyint(value);
        if (rounded < -9223372036854775808.0 || rounded >= 9223372036854775808.0) {
            return false;
        }
        out = static_cast<std::int64_t>(rounded);
        return true;
    }
}

namespace detail {

bool coerce(const ParameterValue& value, std::string& out) noexcept {
    // Structured values have no scalar form; hand back their compact text
    if (const auto* element = std::get_if<nlohmann::json>(&value)) {
        if (element->is_object() || element->is_array()) {
            try {
                out = element->dump();
                return true;
            } catch (const nlohmann::json::exception&) {
                return false;
            }
        }
    }

    Scalar scalar = toScalar(value);
    if (const auto* s = std::get_if<std::string>(&scalar)) {
        out = *s;
        return true;
    }
    if (const auto* b = std::get_if<bool>(&scalar)) {
        out = *b ? "true" : "false";
        return true;
    }
    if (const auto* i = std::get_if<std::int64_t>(&scalar)) {
        out = std::to_string(*i);
        return true;
    }
    if (const auto* d = std::get_if<double>(&scalar)) {
        if (!std::isfinite(*d)) {
            return false;
        }
        out = nlohmann::json(*d).dump();
        return true;
    }
    return false;
}

bool coerce(const ParameterValue& value, std::int64_t& out) noexcept {
    Scalar scalar = toScalar(value);
    if (const auto* i = std::get_if<std::int64_t>(&scalar)) {
        out = *i;
        return true;
    }
    if (const auto* d = std::get_if<double>(&scalar)) {
        return doubleToInt64(*d, out);
    }
    if (const auto* b = std::get_if<bool>(&scalar)) {
        out = *b ? 1 : 0;
        return true;
    }
    if (const auto* s = std::get_if<std::string>(&scalar)) {
        return utils::StringUtils::parseInt64(*s, out);
    }
    return false;
}

bool coerce(const ParameterValue& value, int& out) noexcept {
    std::int64_t wide = 0;
    if (!coerce(value, wide) ||
        wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        return false;
    }
    out = static_cast<int>(wide);
    return true;
}

bool coerce(const ParameterValue& value, double& out) noexcept {
    Scalar scalar = toScalar(value);
    if (const auto* d = std::get_if<double>(&scalar)) {
        out = *d;
        return true;
    }
    if (const auto* i = std::get_if<std::int64_t>(&scalar)) {
        out = static_cast<double>(*i);
        return true;
    }
    if (const auto* b = std::get_if<bool>(&scalar)) {
        out = *b ? 1.0 : 0.0;
        return true;
    }
    if (const auto* s = std::get_if<std::string>(&scalar)) {
        return utils::StringUtils::parseDouble(*s, out);
    }
    return false;
}

bool coerce(const ParameterValue& value, bool& out) noexcept {
    Scalar scalar = toScalar(value);
    if (const auto* b = std::get_if<bool>(&scalar)) {
        out = *b;
        return true;
    }
    if (const auto* i = std::get_if<std::int64_t>(&scalar)) {
        out = *i != 0;
        return true;
    }
    if (const auto* d = std::get_if<double>(&scalar)) {
        out = *d != 0.0;
        return true;
    }
    if (const auto* s = std::get_if<std::string>(&scalar)) {
        return utils::StringUtils::parseBool(*s, out);
    }
    return false;
}

} // namespace detail

bool hasParam(const ParameterBag& bag, const std::string& key) {
    return bag.find(key) != bag.end();
}

nlohmann::json toJson(const ParameterValue& value) {
    return std::visit([](const auto& v) -> nlohmann::json { return nlohmann::json(v); }, value);
}

nlohmann::json toJson(const ParameterBag& bag) {
    nlohmann::json object = nlohmann::json::object();
    for (const auto& [key, value] : bag) {
        object[key] = toJson(value);
    }
    return object;
}

ParameterBag fromJson(const nlohmann::json& object) {
    ParameterBag bag;
    if (!object.is_object()) {
        return bag;
    }
    for (auto it = object.begin(); it != object.end(); ++it) {
        bag.emplace(it.key(), ParameterValue(std::in_place_type<nlohmann::json>, it.value()));
    }
    return bag;
}

} // namespace params
} // namespace deskpilot
