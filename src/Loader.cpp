/**
 * @file Loader.cpp
 * @brief Fragment and document loading implementation
 *
 * RULE F1-F4: File format behavior, see Loader.hpp.
 */

#include "expconf/Loader.hpp"
#include "expconf/DotPath.hpp"
#include "expconf/Errors.hpp"
#include "expconf/Log.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <regex>
#include <sstream>

namespace fs = std::filesystem;

namespace expconf {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string child_path(const std::string& prefix, const std::string& key) {
    return normalize_dot_path(prefix.empty() ? key : prefix + "." + key);
}

// ----------------------------------------------------------------------------
// YAML
// ----------------------------------------------------------------------------

const std::string kYamlStrTag = "tag:yaml.org,2002:str";

/**
 * @brief Type a YAML scalar per the 1.2 core schema
 *
 * Quoted scalars carry the non-specific tag "!" and stay strings.
 */
Value yaml_scalar_to_value(const YAML::Node& node) {
    const std::string& text = node.Scalar();
    const std::string& tag = node.Tag();

    if (tag == "!" || tag == kYamlStrTag) {
        return Value(text);
    }

    if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return Value(nullptr);
    }
    if (text == "true" || text == "True" || text == "TRUE") {
        return Value(true);
    }
    if (text == "false" || text == "False" || text == "FALSE") {
        return Value(false);
    }

    static const std::regex int_re("^[-+]?[0-9]+$");
    static const std::regex float_re(
        "^[-+]?(\\.[0-9]+|[0-9]+(\\.[0-9]*)?)([eE][-+]?[0-9]+)?$");

    if (std::regex_match(text, int_re)) {
        errno = 0;
        char* end = nullptr;
        long long parsed = std::strtoll(text.c_str(), &end, 10);
        if (errno == 0 && end != nullptr && *end == '\0') {
            return Value(static_cast<std::int64_t>(parsed));
        }
        // Out of int64 range: keep the digits rather than lose precision
        return Value(text);
    }

    if (std::regex_match(text, float_re)) {
        errno = 0;
        char* end = nullptr;
        double parsed = std::strtod(text.c_str(), &end);
        if (errno == 0 && end != nullptr && *end == '\0') {
            return Value(parsed);
        }
    }

    return Value(text);
}

SourceLocation location_from_mark(const YAML::Mark& mark) {
    return SourceLocation{mark.line + 1, mark.column + 1};
}

Value yaml_to_value(const YAML::Node& node, const std::string& source,
                    const std::string& prefix,
                    std::map<std::string, SourceLocation>* locations) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return Value(nullptr);

        case YAML::NodeType::Scalar:
            return yaml_scalar_to_value(node);

        case YAML::NodeType::Sequence: {
            Value arr = Value::array();
            for (const auto& item : node) {
                // Array elements have no key path of their own
                arr.push_back(yaml_to_value(item, source, "", nullptr));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            Value obj = Value::object();
            for (const auto& pair : node) {
                if (!pair.first.IsScalar()) {
                    const auto mark = pair.first.Mark();
                    throw ConfigParseError(source, mark.line + 1, mark.column + 1,
                                           "mapping keys must be scalars");
                }
                const std::string key = pair.first.Scalar();
                const std::string path = child_path(prefix, key);
                if (locations != nullptr && !path.empty() && !pair.first.Mark().is_null()) {
                    (*locations)[path] = location_from_mark(pair.first.Mark());
                }
                obj[key] = yaml_to_value(pair.second, source, path, locations);
            }
            return obj;
        }
    }

    return Value(nullptr);
}

// ----------------------------------------------------------------------------
// TOML
// ----------------------------------------------------------------------------

Value toml_to_value(const toml::node& node, const std::string& prefix,
                    std::map<std::string, SourceLocation>* locations) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_to_value(elem, "", nullptr));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                const std::string name(key.str());
                const std::string path = child_path(prefix, name);
                const auto& begin = val.source().begin;
                if (locations != nullptr && !path.empty() && begin.line > 0) {
                    (*locations)[path] = SourceLocation{static_cast<int>(begin.line),
                                                        static_cast<int>(begin.column)};
                }
                obj[name] = toml_to_value(val, path, locations);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

// ============================================================================
// Text parsing
// ============================================================================

Value parse_yaml_text(const std::string& text, const std::string& source,
                      std::map<std::string, SourceLocation>* locations) {
    YAML::Node root;
    try {
        root = YAML::Load(text);
    } catch (const YAML::ParserException& e) {
        throw ConfigParseError(source, e.mark.line + 1, e.mark.column + 1, e.msg);
    }
    return yaml_to_value(root, source, "", locations);
}

Value parse_json_text(const std::string& text, const std::string& source) {
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return Value(nullptr);
    }
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigParseError(source, 0, 0, e.what());
    }
}

Value parse_toml_text(const std::string& text, const std::string& source,
                      std::map<std::string, SourceLocation>* locations) {
    toml::table table;
    try {
        table = toml::parse(text, source);
    } catch (const toml::parse_error& e) {
        throw ConfigParseError(
            source,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
    return toml_to_value(table, "", locations);
}

// ============================================================================
// Fragments
// ============================================================================

Fragment parse_fragment_text(const std::string& id, std::size_t position,
                             const std::string& text, FragmentFormat format) {
    std::map<std::string, SourceLocation> locations;
    Value content;

    try {
        switch (format) {
            case FragmentFormat::yaml:
                content = parse_yaml_text(text, id, &locations);
                break;
            case FragmentFormat::json:
                content = parse_json_text(text, id);
                break;
            case FragmentFormat::toml:
                content = parse_toml_text(text, id, &locations);
                break;
        }
    } catch (const ConfigParseError& e) {
        std::ostringstream details;
        details << e.details();
        if (e.line() > 0) {
            details << " (line " << e.line() << ", column " << e.column() << ")";
        }
        throw FragmentFormatError(id, details.str());
    }

    return make_fragment(id, position, std::move(content), std::move(locations));
}

Fragment load_fragment_file(const std::string& path, std::size_t position) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    auto format = format_for_path(path);
    if (!format) {
        throw ConfigError("Unsupported fragment file type: '" + get_file_extension(path) +
                          "' (expected .yml, .yaml, .json or .toml)");
    }

    Fragment fragment = parse_fragment_text(path, position, read_text_file(path), *format);
    log_message(LogLevel::info, "Loaded fragment #" + std::to_string(position) + " from " + path);
    return fragment;
}

std::vector<Fragment> load_fragment_files(const std::vector<std::string>& paths) {
    std::vector<Fragment> fragments;
    fragments.reserve(paths.size());
    for (std::size_t i = 0; i < paths.size(); ++i) {
        fragments.push_back(load_fragment_file(paths[i], i));
    }
    return fragments;
}

// ============================================================================
// Files and environment
// ============================================================================

Value load_document_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string text = read_text_file(path);
    auto format = format_for_path(path);
    if (format == FragmentFormat::json) {
        return parse_json_text(text, path);
    }
    if (format == FragmentFormat::toml) {
        return parse_toml_text(text, path);
    }
    return parse_yaml_text(text, path);
}

std::string read_text_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::optional<FragmentFormat> format_for_path(const std::string& path) {
    const std::string ext = get_file_extension(path);
    if (ext == ".yml" || ext == ".yaml") return FragmentFormat::yaml;
    if (ext == ".json") return FragmentFormat::json;
    if (ext == ".toml") return FragmentFormat::toml;
    return std::nullopt;
}

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

std::optional<std::string> get_env_var(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace expconf
