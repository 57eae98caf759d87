/**
 * @file Fragment.cpp
 * @brief Implementation of fragment construction and flattening
 */

#include "expconf/Fragment.hpp"
#include "expconf/DotPath.hpp"
#include "expconf/Errors.hpp"

namespace expconf {

namespace {
    void collect_leaves(const Value& node, const std::string& prefix,
                        std::map<std::string, Value>& out) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            const std::string path = normalize_dot_path(
                prefix.empty() ? it.key() : prefix + "." + it.key());
            if (path.empty()) {
                continue;
            }
            if (is_leaf(it.value())) {
                out[path] = it.value();
            } else {
                collect_leaves(it.value(), path, out);
            }
        }
    }
}

std::vector<FragmentLeaf> Fragment::leaves() const {
    std::map<std::string, Value> flat;
    if (content.is_object()) {
        collect_leaves(content, "", flat);
    }

    std::vector<FragmentLeaf> result;
    result.reserve(flat.size());
    for (auto& [path, value] : flat) {
        result.push_back(FragmentLeaf{path, std::move(value), location_of(path)});
    }
    return result;
}

std::optional<SourceLocation> Fragment::location_of(const std::string& path) const {
    auto it = locations.find(path);
    if (it == locations.end()) {
        return std::nullopt;
    }
    return it->second;
}

Fragment make_fragment(std::string id, std::size_t position, Value content,
                       std::map<std::string, SourceLocation> locations) {
    if (content.is_null()) {
        content = Value::object();
    }
    if (!content.is_object()) {
        throw FragmentFormatError(id, "expected a mapping at top level, got " +
                                      type_name(content));
    }

    Fragment fragment;
    fragment.id = std::move(id);
    fragment.position = position;
    fragment.content = std::move(content);
    fragment.locations = std::move(locations);
    return fragment;
}

} // namespace expconf
