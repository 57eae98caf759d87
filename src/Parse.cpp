/**
 * @file Parse.cpp
 * @brief Implementation of override parsing
 */

#include "expconf/Parse.hpp"
#include "expconf/DotPath.hpp"
#include "expconf/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <stdexcept>

namespace expconf {

namespace {
    std::string to_lower(const std::string& str) {
        std::string result = str;
        std::transform(result.begin(), result.end(), result.begin(),
                      [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    std::string trim(const std::string& str) {
        const auto first = str.find_first_not_of(" \t");
        if (first == std::string::npos) {
            return {};
        }
        const auto last = str.find_last_not_of(" \t");
        return str.substr(first, last - first + 1);
    }

    const std::regex& integer_pattern() {
        static const std::regex re("^-?[0-9]+$");
        return re;
    }

    const std::regex& float_pattern() {
        static const std::regex re("^-?[0-9]+\\.[0-9]+([eE][+-]?[0-9]+)?$");
        return re;
    }
}

Value parse_value(const std::string& str) {
    if (str.empty()) {
        return "";
    }

    // T1, T2
    const std::string lower = to_lower(str);
    if (lower == "true") {
        return true;
    }
    if (lower == "false") {
        return false;
    }
    if (lower == "null") {
        return nullptr;
    }

    // T3: out-of-range integers fall through to a raw string
    if (std::regex_match(str, integer_pattern())) {
        try {
            std::size_t pos = 0;
            const long long val = std::stoll(str, &pos);
            if (pos == str.size()) {
                return static_cast<std::int64_t>(val);
            }
        } catch (const std::out_of_range&) {
        }
    }

    // T4
    if (std::regex_match(str, float_pattern())) {
        try {
            std::size_t pos = 0;
            const double val = std::stod(str, &pos);
            if (pos == str.size()) {
                return val;
            }
        } catch (const std::out_of_range&) {
        }
    }

    // T5
    if ((str.front() == '{' && str.back() == '}') ||
        (str.front() == '[' && str.back() == ']')) {
        Value parsed = Value::parse(str, nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }

    // T6
    if (str.size() >= 2 && str.front() == '"' && str.back() == '"') {
        Value parsed = Value::parse(str, nullptr, false);
        if (parsed.is_string()) {
            return parsed;
        }
    }

    // T7
    return str;
}

std::pair<std::string, Value> parse_override(const std::string& assignment) {
    const auto eq = assignment.find('=');
    if (eq == std::string::npos) {
        throw ConfigError("Invalid override '" + assignment + "': expected KEY=VALUE");
    }

    const std::string key = normalize_dot_path(trim(assignment.substr(0, eq)));
    if (key.empty()) {
        throw ConfigError("Invalid override '" + assignment + "': empty key");
    }
    return {key, parse_value(assignment.substr(eq + 1))};
}

Fragment make_override_fragment(const std::vector<std::string>& assignments,
                                std::size_t position) {
    Value content = Value::object();
    for (const auto& assignment : assignments) {
        auto [key, value] = parse_override(assignment);
        set_by_dot(content, key, value);
    }
    return make_fragment(kOverridesFragmentId, position, std::move(content));
}

} // namespace expconf
