/**
 * @file Placeholder.hpp
 * @brief Placeholder scanning and substitution
 *
 * Two surface forms name a configuration key path:
 * - `%KEY%`  immediate: resolved while the fragment defining it is merged
 * - `%^KEY%` deferred: resolved once every fragment has been merged
 *
 * KEY is made of [A-Za-z0-9_.-]. A doubled `%%` is never a token.
 * Substitution is a single textual pass: substituted text is not
 * scanned again.
 */

#ifndef EXPCONF_PLACEHOLDER_HPP
#define EXPCONF_PLACEHOLDER_HPP

#include "expconf/Errors.hpp"
#include "expconf/Value.hpp"
#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace expconf {

/// Key names exempt from substitution; their tokens stay verbatim
using SafePlaceholderSet = std::set<std::string>;

enum class PlaceholderForm {
    immediate,
    deferred
};

/**
 * @brief One placeholder occurrence inside a text
 */
struct PlaceholderToken {
    std::size_t offset = 0;   ///< Position of the opening '%'
    std::size_t length = 0;   ///< Length of the whole token, markers included
    std::string name;         ///< Bare key name
    PlaceholderForm form = PlaceholderForm::immediate;
};

/**
 * @brief Which forms a substitution pass replaces
 */
enum class SubstitutionScope {
    immediate_only,
    deferred_only,
    both
};

/**
 * @brief Where a pass runs, for error reporting
 */
struct ResolutionContext {
    std::string name;
    UnresolvedPlaceholderError::Context kind = UnresolvedPlaceholderError::Context::fragment;
};

/**
 * @brief Find every placeholder token in @p text, left to right
 *
 * Example: "%a%/%^b.c%" → [{0, 3, "a", immediate}, {4, 6, "b.c", deferred}]
 */
std::vector<PlaceholderToken> find_placeholders(const std::string& text);

/**
 * @brief Replace the tokens of @p scope in @p text
 *
 * Each token is looked up in @p snapshot by dot-path and replaced by
 * to_placeholder_text() of the value found. Tokens whose name is in
 * @p safe, and tokens outside @p scope, are copied verbatim.
 *
 * @param substituted Incremented once per replaced token, if non-null
 * @throws UnresolvedPlaceholderError if a name is absent from @p snapshot
 */
std::string substitute_placeholders(const std::string& text,
                                    const Value& snapshot,
                                    const SafePlaceholderSet& safe,
                                    SubstitutionScope scope,
                                    const ResolutionContext& context,
                                    std::size_t* substituted = nullptr);

/**
 * @brief Substitute inside every string of a value, arrays and objects included
 * @return Number of tokens replaced
 */
std::size_t substitute_in_value(Value& value,
                                const Value& snapshot,
                                const SafePlaceholderSet& safe,
                                SubstitutionScope scope,
                                const ResolutionContext& context);

} // namespace expconf

#endif // EXPCONF_PLACEHOLDER_HPP
