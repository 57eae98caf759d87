/**
 * @file ResolvedConfig.cpp
 * @brief Implementation of the frozen configuration and its serializers
 */

#include "expconf/ResolvedConfig.hpp"
#include "expconf/DotPath.hpp"
#include "expconf/Errors.hpp"
#include "expconf/Loader.hpp"

#include <toml++/toml.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <limits>
#include <regex>
#include <sstream>

namespace expconf {

ResolvedConfig::ResolvedConfig(Value data, ProvenanceTracker provenance,
                               SafePlaceholderSet safe_placeholders)
    : data_(std::move(data))
    , provenance_(std::move(provenance))
    , safe_(std::move(safe_placeholders)) {
    if (data_.is_null()) {
        data_ = Value::object();
    }
    verify_provenance();
}

const Value& ResolvedConfig::at(const std::string& path) const {
    return *get_by_dot(data_, path);
}

bool ResolvedConfig::contains(const std::string& path) const {
    return find_by_dot_path(path) != nullptr;
}

const Value* ResolvedConfig::find_by_dot_path(const std::string& path) const {
    return find_by_dot(data_, path);
}

std::optional<ProvEntry> ResolvedConfig::source_of(const std::string& path) const {
    const ProvEntry* entry = provenance_.get(normalize_dot_path(path));
    if (entry == nullptr) {
        return std::nullopt;
    }
    return *entry;
}

void ResolvedConfig::verify_provenance() const {
    const auto leaves = flatten_leaves(data_);

    auto leaf = leaves.begin();
    auto tracked = provenance_.begin();
    while (leaf != leaves.end() || tracked != provenance_.end()) {
        if (tracked == provenance_.end() ||
            (leaf != leaves.end() && leaf->first < tracked->first)) {
            throw ProvenanceInconsistencyError(leaf->first, "key has no provenance entry");
        }
        if (leaf == leaves.end() || tracked->first < leaf->first) {
            throw ProvenanceInconsistencyError(tracked->first,
                                               "provenance entry without configuration value");
        }
        if (tracked->second.file.empty()) {
            throw ProvenanceInconsistencyError(tracked->first, "provenance entry has no source");
        }
        ++leaf;
        ++tracked;
    }
}

void ResolvedConfig::enforce_mandatory(const std::vector<std::string>& keys) const {
    std::vector<std::string> missing;
    for (const auto& k : keys) {
        if (!contains(k)) missing.push_back(k);
    }
    if (!missing.empty()) throw MissingMandatoryConfig(missing);
}

// ============================================================================
// Serialization
// ============================================================================

Value ResolvedConfig::to_document() const {
    if (data_.contains(kProvenanceSection)) {
        throw ConfigError(std::string("Configuration key '") + kProvenanceSection +
                          "' is reserved for the provenance section");
    }
    Value document = data_;
    document[kProvenanceSection] = provenance_.export_to_value();
    return document;
}

std::string ResolvedConfig::to_json_string(int indent) const {
    return to_document().dump(indent);
}

namespace {

// Plain scalars that the loader would not read back as strings
bool needs_quotes(const std::string& s) {
    static const std::regex typed_re(
        "^(~|null|Null|NULL|true|True|TRUE|false|False|FALSE|"
        "[-+]?[0-9]+|[-+]?(\\.[0-9]+|[0-9]+(\\.[0-9]*)?)([eE][-+]?[0-9]+)?)$");
    return s.empty() || std::regex_match(s, typed_re);
}

void emit_yaml(YAML::Emitter& out, const Value& v) {
    if (v.is_null()) {
        out << YAML::Null;
    } else if (v.is_boolean()) {
        out << v.get<bool>();
    } else if (v.is_number_unsigned()) {
        out << v.get<std::uint64_t>();
    } else if (v.is_number_integer()) {
        out << v.get<std::int64_t>();
    } else if (v.is_number_float()) {
        out << v.get<double>();
    } else if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        if (needs_quotes(s)) {
            out << YAML::DoubleQuoted << s;
        } else {
            out << s;
        }
    } else if (v.is_array()) {
        out << YAML::BeginSeq;
        for (const auto& elem : v) {
            emit_yaml(out, elem);
        }
        out << YAML::EndSeq;
    } else if (v.is_object()) {
        out << YAML::BeginMap;
        for (auto it = v.begin(); it != v.end(); ++it) {
            out << YAML::Key << it.key() << YAML::Value;
            emit_yaml(out, it.value());
        }
        out << YAML::EndMap;
    }
}

// ---- JSON -> TOML (value-based construction) -------------------------------

toml::array make_toml_array(const Value& a);
toml::table make_toml_table(const Value& o);

template <typename Inserter>
void insert_scalar(const Value& v, Inserter&& insert) {
    if (v.is_string()) {
        insert(v.get<std::string>());
    } else if (v.is_boolean()) {
        insert(v.get<bool>());
    } else if (v.is_number_unsigned()) {
        const auto u = v.get<std::uint64_t>();
        if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            insert(static_cast<std::int64_t>(u));
        } else {
            // Oversize for TOML int; fall back to double
            insert(static_cast<double>(u));
        }
    } else if (v.is_number_integer()) {
        insert(v.get<std::int64_t>());
    } else if (v.is_number_float()) {
        insert(v.get<double>());
    } else {
        // No TOML null: preserve as empty string
        insert(std::string{});
    }
}

toml::array make_toml_array(const Value& a) {
    toml::array out;
    for (const auto& elem : a) {
        if (elem.is_object()) {
            out.push_back(make_toml_table(elem));
        } else if (elem.is_array()) {
            out.push_back(make_toml_array(elem));
        } else {
            insert_scalar(elem, [&](auto&& x) { out.push_back(x); });
        }
    }
    return out;
}

toml::table make_toml_table(const Value& o) {
    toml::table tbl;
    for (auto it = o.begin(); it != o.end(); ++it) {
        const auto& k = it.key();
        const auto& v = it.value();
        if (v.is_object()) {
            tbl.insert(k, make_toml_table(v));
        } else if (v.is_array()) {
            tbl.insert(k, make_toml_array(v));
        } else {
            insert_scalar(v, [&](auto&& x) { tbl.insert(k, x); });
        }
    }
    return tbl;
}

} // namespace

std::string ResolvedConfig::to_yaml_string() const {
    YAML::Emitter out;
    emit_yaml(out, to_document());
    if (!out.good()) {
        throw ConfigError("YAML emitter error: " + out.GetLastError());
    }
    return std::string(out.c_str()) + "\n";
}

std::string ResolvedConfig::to_toml_string() const {
    std::ostringstream oss;
    oss << make_toml_table(to_document()) << "\n";
    return oss.str();
}

void ResolvedConfig::write_provenance_json(const std::string& file) const {
    std::ofstream ofs(file);
    if (!ofs) throw ConfigError("Failed to open for write: " + file);
    ofs << std::setw(2) << provenance_.export_to_value() << "\n";
}

// ============================================================================
// Reload
// ============================================================================

ResolvedConfig ResolvedConfig::from_document(const Value& document) {
    if (!document.is_object()) {
        throw ConfigError("Resolved configuration document must be a mapping, got " +
                          type_name(document));
    }
    auto section = document.find(kProvenanceSection);
    if (section == document.end()) {
        throw ProvenanceInconsistencyError(kProvenanceSection,
                                           "document has no provenance section");
    }

    ProvenanceTracker tracker;
    tracker.import_from_value(*section);

    Value data = document;
    data.erase(kProvenanceSection);

    SafePlaceholderSet safe = safe_placeholders_in(data);
    return ResolvedConfig(std::move(data), std::move(tracker), std::move(safe));
}

ResolvedConfig ResolvedConfig::load_document(const std::string& file) {
    return from_document(load_document_file(file));
}

SafePlaceholderSet safe_placeholders_in(const Value& data) {
    SafePlaceholderSet names;
    const Value* listed = find_by_dot(data, kSafePlaceholdersKey);
    if (listed == nullptr) {
        return names;
    }

    auto add_names = [&names](const std::string& text) {
        std::string current;
        for (char c : text) {
            if (c == ',' || c == ' ' || c == '\t' || c == '\n') {
                if (!current.empty()) names.insert(current);
                current.clear();
            } else {
                current += c;
            }
        }
        if (!current.empty()) names.insert(current);
    };

    if (listed->is_array()) {
        for (const auto& item : *listed) {
            if (item.is_string()) add_names(item.get<std::string>());
        }
    } else if (listed->is_string()) {
        add_names(listed->get<std::string>());
    }
    return names;
}

} // namespace expconf
