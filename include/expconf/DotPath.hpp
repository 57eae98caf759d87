/**
 * @file DotPath.hpp
 * @brief Dot-notation key paths over the configuration tree
 *
 * A key path such as "JOBS.SIM.WALLCLOCK" names one node of a nested
 * configuration. Only objects are traversed: arrays are leaves, so
 * their elements have no key path of their own.
 *
 * Behavioral rules:
 * - RULE D1: get_by_dot() raises KeyError if a segment doesn't exist
 * - RULE D2: get_by_dot() raises TypeError when traversing a non-object
 * - RULE D3: find_by_dot() never raises; returns nullptr instead
 * - RULE D4: set_by_dot() creates missing intermediates and replaces
 *            non-object intermediates by objects
 */

#ifndef EXPCONF_DOTPATH_HPP
#define EXPCONF_DOTPATH_HPP

#include "expconf/Value.hpp"
#include "expconf/Errors.hpp"
#include <map>
#include <string>
#include <vector>

namespace expconf {

/**
 * @brief Split a dot-path into segments
 *
 * Empty segments are dropped, so "a..b" and "a.b" are the same path.
 *
 * Examples:
 * - "JOBS.SIM" → ["JOBS", "SIM"]
 * - "" → []
 */
std::vector<std::string> split_dot_path(const std::string& path);

/**
 * @brief Join path segments with dots
 *
 * Examples:
 * - ["a", "b", "c"] → "a.b.c"
 * - [] → ""
 */
std::string join_dot_path(const std::vector<std::string>& segments);

/**
 * @brief Normalize a dot-path (drop empty segments)
 */
std::string normalize_dot_path(const std::string& path);

/**
 * @brief Get value using dot-path (strict)
 *
 * @return Pointer to the value at path (root for an empty path)
 * @throws KeyError if any segment not found
 * @throws TypeError if traversal hits a non-object before the final segment
 */
const Value* get_by_dot(const Value& data, const std::string& path);

/**
 * @brief Look up a value using dot-path (lenient)
 *
 * RULE D3: returns nullptr when the path does not resolve for any
 * reason, including traversal into a scalar.
 */
const Value* find_by_dot(const Value& data, const std::string& path);

/**
 * @brief Set value using dot-path, creating intermediates as needed
 *
 * RULE D4: a non-object found on the way is replaced by an object.
 *
 * Example:
 * ```cpp
 * Value cfg = Value::object();
 * set_by_dot(cfg, "model.version", "first");
 * // Result: {"model": {"version": "first"}}
 * ```
 */
void set_by_dot(Value& data, const std::string& path, const Value& value);

/**
 * @brief Flatten a tree into {"a.b.c": leaf, ...}
 *
 * Leaves are scalars, nulls, arrays and empty objects (see is_leaf()).
 * The result is ordered by key path.
 */
std::map<std::string, Value> flatten_leaves(const Value& data);

/**
 * @brief Every proper ancestor of a path, outermost first
 *
 * Example: "a.b.c" → ["a", "a.b"]
 */
std::vector<std::string> ancestor_paths(const std::string& path);

/**
 * @brief Check whether @p path lies strictly below @p ancestor
 *
 * Example: is_descendant_path("a.b.c", "a.b") == true,
 *          is_descendant_path("a.bc", "a.b") == false
 */
bool is_descendant_path(const std::string& path, const std::string& ancestor);

} // namespace expconf

#endif // EXPCONF_DOTPATH_HPP
