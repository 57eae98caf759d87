/**
 * @file Parse.hpp
 * @brief Command-line override parsing
 *
 * Override values are typed with these rules (first match wins):
 * - T1: Boolean ("true", "false" - case insensitive)
 * - T2: Null ("null" - case insensitive)
 * - T3: Integer (matches ^-?[0-9]+$)
 * - T4: Float (matches ^-?[0-9]+\.[0-9]+([eE][+-]?[0-9]+)?$)
 * - T5: JSON Compound ({...} or [...])
 * - T6: Quoted String ("...")
 * - T7: Raw String (fallback)
 *
 * Overrides form one extra fragment applied after every file, so they
 * win over all of them and take part in both placeholder passes.
 */

#ifndef EXPCONF_PARSE_HPP
#define EXPCONF_PARSE_HPP

#include "expconf/Fragment.hpp"
#include "expconf/Value.hpp"
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace expconf {

/// Identifier of the fragment built from command-line overrides
inline constexpr const char* kOverridesFragmentId = "<overrides>";

/**
 * @brief Parse a string to the Value it denotes
 *
 * Examples:
 * ```cpp
 * parse_value("TRUE")       // → true
 * parse_value("null")       // → null
 * parse_value("-17")        // → -17
 * parse_value("2.5e3")      // → 2500.0
 * parse_value("[1,2]")      // → [1, 2]
 * parse_value("\"42\"")     // → "42"
 * parse_value("%model.version%/run")  // → "%model.version%/run"
 * ```
 */
Value parse_value(const std::string& str);

/**
 * @brief Split "KEY=VALUE" and type the value
 *
 * Only the first '=' separates; the key is normalized as a dot-path.
 *
 * @throws ConfigError if there is no '=' or the key is empty
 */
std::pair<std::string, Value> parse_override(const std::string& assignment);

/**
 * @brief Build the overrides fragment, in command-line order
 *
 * A later assignment to the same key wins.
 */
Fragment make_override_fragment(const std::vector<std::string>& assignments,
                                std::size_t position);

} // namespace expconf

#endif // EXPCONF_PARSE_HPP
