/**
 * @file Value.hpp
 * @brief Value type for configuration data
 *
 * Uses nlohmann::json as the underlying value model to support:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...})
 *
 * Objects are ordered by key, so every traversal of a configuration
 * visits key paths in sorted order.
 */

#ifndef EXPCONF_VALUE_HPP
#define EXPCONF_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace expconf {

/**
 * @brief JSON-like value type for configuration fragments and results
 *
 * Alias for nlohmann::json. See the nlohmann::json documentation for
 * the complete API.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Check whether a value is a leaf of the configuration tree
 *
 * Scalars, null, arrays and empty objects are leaves. Only non-empty
 * objects have children addressable by dot-path.
 */
inline bool is_leaf(const Value& val) {
    return !val.is_object() || val.empty();
}

/**
 * @brief Text inserted in place of a placeholder referring to @p val
 *
 * Strings are inserted verbatim, null as the empty string, everything
 * else as compact JSON (so `true`, `42`, `1.5`, `[1,2]`).
 */
inline std::string to_placeholder_text(const Value& val) {
    if (val.is_string()) return val.get<std::string>();
    if (val.is_null()) return "";
    return val.dump();
}

} // namespace expconf

#endif // EXPCONF_VALUE_HPP
