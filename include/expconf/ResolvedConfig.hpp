/**
 * @file ResolvedConfig.hpp
 * @brief Frozen result of merging and resolving all fragments
 *
 * A ResolvedConfig only exposes const access: once built it can be
 * serialized, queried and rendered against, but never changed.
 */

#ifndef EXPCONF_RESOLVEDCONFIG_HPP
#define EXPCONF_RESOLVEDCONFIG_HPP

#include "expconf/Placeholder.hpp"
#include "expconf/ProvenanceTracker.hpp"
#include "expconf/Value.hpp"
#include <optional>
#include <string>
#include <vector>

namespace expconf {

/// Top-level key holding the provenance section in serialized documents
inline constexpr const char* kProvenanceSection = "PROVENANCE";

/// Configuration key listing safe placeholder names
inline constexpr const char* kSafePlaceholdersKey = "SAFE_PLACEHOLDERS";

class ResolvedConfig {
public:
    /**
     * @brief Freeze data and provenance together
     * @throws ProvenanceInconsistencyError if they disagree
     */
    ResolvedConfig(Value data, ProvenanceTracker provenance,
                   SafePlaceholderSet safe_placeholders = {});

    const Value& data() const noexcept { return data_; }
    const ProvenanceTracker& provenance() const noexcept { return provenance_; }
    const SafePlaceholderSet& safe_placeholders() const noexcept { return safe_; }

    // Dot helpers
    const Value& at(const std::string& path) const;
    bool contains(const std::string& path) const;

    template <typename T>
    T get(const std::string& path, const T& fallback) const {
        const Value* v = find_by_dot_path(path);
        if (v == nullptr) return fallback;
        try {
            return v->get<T>();
        } catch (const nlohmann::json::exception&) {
            return fallback;
        }
    }

    /**
     * @brief Provenance of a key, or nothing if the key is not a tracked leaf
     */
    std::optional<ProvEntry> source_of(const std::string& path) const;

    /**
     * @brief Check that every leaf has exactly one entry and vice versa
     * @throws ProvenanceInconsistencyError naming the first offending key
     */
    void verify_provenance() const;

    /**
     * @throws MissingMandatoryConfig listing every absent key
     */
    void enforce_mandatory(const std::vector<std::string>& keys) const;

    // Serialization: resolved data plus a PROVENANCE section
    Value to_document() const;
    std::string to_json_string(int indent = 2) const;
    std::string to_yaml_string() const;
    std::string to_toml_string() const;

    /**
     * @brief Write the nested provenance alone as a JSON file
     */
    void write_provenance_json(const std::string& file) const;

    /**
     * @brief Rebuild from a document produced by to_document()
     *
     * Documents without a PROVENANCE section are rejected as
     * inconsistent.
     *
     * @throws ProvenanceInconsistencyError, ConfigError
     */
    static ResolvedConfig from_document(const Value& document);

    /**
     * @brief Read a saved YAML or JSON document
     */
    static ResolvedConfig load_document(const std::string& file);

private:
    const Value* find_by_dot_path(const std::string& path) const;

    Value data_;
    ProvenanceTracker provenance_;
    SafePlaceholderSet safe_;
};

/**
 * @brief Names listed under SAFE_PLACEHOLDERS in a tree
 *
 * Accepts a list of names or a single comma/space separated string.
 */
SafePlaceholderSet safe_placeholders_in(const Value& data);

} // namespace expconf

#endif // EXPCONF_RESOLVEDCONFIG_HPP
