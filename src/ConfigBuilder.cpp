/**
 * @file ConfigBuilder.cpp
 * @brief Implementation of the merge engine and both placeholder passes
 */

#include "expconf/ConfigBuilder.hpp"
#include "expconf/DotPath.hpp"
#include "expconf/Errors.hpp"
#include "expconf/Log.hpp"

#include <utility>

namespace expconf {

ConfigBuilder::ConfigBuilder(SafePlaceholderSet safe_placeholders)
    : safe_(std::move(safe_placeholders)) {}

void ConfigBuilder::apply(const Fragment& fragment) {
    if (finished_) {
        throw ConfigError("Cannot apply fragment '" + fragment.id +
                          "': configuration builder is closed");
    }
    if (fragment.position != applied_) {
        throw ConfigError("Fragment '" + fragment.id + "' has load position " +
                          std::to_string(fragment.position) + ", expected " +
                          std::to_string(applied_));
    }
    if (!fragment.content.is_object()) {
        throw FragmentFormatError(fragment.id, "expected a mapping at top level, got " +
                                               type_name(fragment.content));
    }

    try {
        std::vector<std::string> written;
        for (const auto& leaf : fragment.leaves()) {
            if (leaf.value.is_object()) {
                // An empty mapping adds nothing to an existing section
                const Value* existing = find_by_dot(data_, leaf.path);
                if (existing != nullptr && existing->is_object() && !existing->empty()) {
                    continue;
                }
            }
            write_leaf(leaf, fragment.id);
            written.push_back(leaf.path);
        }

        if (log_enabled(LogLevel::debug)) {
            log_message(LogLevel::debug, "Fragment '" + fragment.id + "' wrote " +
                                         std::to_string(written.size()) + " keys");
        }
        resolve_immediate(fragment, written);
    } catch (const ConfigError&) {
        // A failed pass leaves a partial merge behind; refuse further use
        finished_ = true;
        throw;
    }

    ++applied_;
}

void ConfigBuilder::write_leaf(const FragmentLeaf& leaf, const std::string& fragment_id) {
    // Scalar over a section drops the section's keys; a key below a
    // former scalar turns that scalar into a section.
    provenance_.erase_descendants(leaf.path);
    for (const auto& ancestor : ancestor_paths(leaf.path)) {
        provenance_.erase(ancestor);
    }

    set_by_dot(data_, leaf.path, leaf.value);

    std::optional<int> line;
    std::optional<int> col;
    if (leaf.location) {
        line = leaf.location->line;
        col = leaf.location->column;
    }
    provenance_.track(leaf.path, fragment_id, ResolutionKind::direct, line, col);
}

void ConfigBuilder::resolve_immediate(const Fragment& fragment,
                                      const std::vector<std::string>& paths) {
    const ResolutionContext context{fragment.id, UnresolvedPlaceholderError::Context::fragment};

    // Every value of the fragment sees the same state: compute all, then write.
    std::vector<std::pair<std::string, Value>> updates;
    for (const auto& path : paths) {
        if (!provenance_.contains(path)) {
            continue; // replaced by a deeper key of the same fragment
        }
        const Value* current = find_by_dot(data_, path);
        if (current == nullptr) {
            continue;
        }
        Value resolved = *current;
        if (substitute_in_value(resolved, data_, safe_, SubstitutionScope::immediate_only,
                                context) > 0) {
            updates.emplace_back(path, std::move(resolved));
        }
    }

    for (auto& [path, value] : updates) {
        set_by_dot(data_, path, value);
        provenance_.set_kind(path, ResolutionKind::immediate);
        if (log_enabled(LogLevel::debug)) {
            log_message(LogLevel::debug, "Resolved '" + path + "' in fragment '" + fragment.id + "'");
        }
    }
}

void ConfigBuilder::resolve_deferred() {
    std::vector<std::pair<std::string, Value>> updates;
    for (const auto& [path, entry] : provenance_) {
        const Value* current = find_by_dot(data_, path);
        if (current == nullptr) {
            throw ProvenanceInconsistencyError(path, "provenance entry without configuration value");
        }
        Value resolved = *current;
        const ResolutionContext context{path, UnresolvedPlaceholderError::Context::configuration};
        if (substitute_in_value(resolved, data_, safe_, SubstitutionScope::deferred_only,
                                context) > 0) {
            updates.emplace_back(path, std::move(resolved));
        }
    }

    for (auto& [path, value] : updates) {
        set_by_dot(data_, path, value);
        provenance_.set_kind(path, ResolutionKind::deferred);
    }
    log_message(LogLevel::debug, "Deferred pass resolved " + std::to_string(updates.size()) + " keys");
}

ResolvedConfig ConfigBuilder::finish() && {
    if (finished_) {
        throw ConfigError("Configuration builder is closed");
    }
    finished_ = true;

    resolve_deferred();

    log_message(LogLevel::info, "Resolved configuration from " + std::to_string(applied_) +
                                " fragments, " + std::to_string(provenance_.size()) +
                                " keys tracked");
    return ResolvedConfig(std::move(data_), std::move(provenance_), std::move(safe_));
}

SafePlaceholderSet collect_safe_placeholders(const std::vector<Fragment>& fragments) {
    SafePlaceholderSet names;
    for (const auto& fragment : fragments) {
        const auto found = safe_placeholders_in(fragment.content);
        names.insert(found.begin(), found.end());
    }
    return names;
}

ResolvedConfig resolve_fragments(const std::vector<Fragment>& fragments,
                                 const SafePlaceholderSet& extra_safe) {
    SafePlaceholderSet safe = collect_safe_placeholders(fragments);
    safe.insert(extra_safe.begin(), extra_safe.end());

    ConfigBuilder builder(std::move(safe));
    for (const auto& fragment : fragments) {
        builder.apply(fragment);
    }
    return std::move(builder).finish();
}

} // namespace expconf
