/**
 * @file Fragment.hpp
 * @brief One ordered unit of configuration input
 *
 * A fragment is the content of one configuration file (or in-memory
 * document) together with its identifier and its position in the load
 * order. Fragments are immutable once built.
 */

#ifndef EXPCONF_FRAGMENT_HPP
#define EXPCONF_FRAGMENT_HPP

#include "expconf/Value.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace expconf {

/**
 * @brief 1-based line/column of a key inside its source file
 */
struct SourceLocation {
    int line = 0;
    int column = 0;
};

/**
 * @brief A configuration leaf contributed by a fragment
 */
struct FragmentLeaf {
    std::string path;
    Value value;
    std::optional<SourceLocation> location;
};

/**
 * @brief Ordered, identified configuration input
 */
struct Fragment {
    /// Source identifier, usually the file path
    std::string id;

    /// 0-based index in the load order
    std::size_t position = 0;

    /// Always an object (see make_fragment())
    Value content = Value::object();

    /// Leaf key path → location, when the source format reports it
    std::map<std::string, SourceLocation> locations;

    /**
     * @brief Flatten the content into leaves, ordered by key path
     *
     * Keys containing dots are path segments: {"model.version": x} and
     * {"model": {"version": x}} contribute the same leaf.
     */
    std::vector<FragmentLeaf> leaves() const;

    /**
     * @brief Location recorded for a leaf path, if any
     */
    std::optional<SourceLocation> location_of(const std::string& path) const;
};

/**
 * @brief Build a fragment, validating that the content is a mapping
 *
 * A null document (empty file) is treated as an empty mapping.
 *
 * @throws FragmentFormatError if content is neither null nor an object
 */
Fragment make_fragment(std::string id, std::size_t position, Value content,
                       std::map<std::string, SourceLocation> locations = {});

} // namespace expconf

#endif // EXPCONF_FRAGMENT_HPP
