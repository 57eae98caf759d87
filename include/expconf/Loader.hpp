/**
 * @file Loader.hpp
 * @brief Fragment and document loading
 *
 * Loads configuration fragments from:
 * - YAML files (using yaml-cpp), with key locations
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++), with key locations
 *
 * RULE F1: Format is chosen by extension (.yml/.yaml, .json, .toml).
 * RULE F2: An empty document is an empty mapping.
 * RULE F3: Syntax errors and non-mapping documents raise
 *          FragmentFormatError naming the fragment.
 * RULE F4: Missing files raise FileNotFoundError.
 */

#ifndef EXPCONF_LOADER_HPP
#define EXPCONF_LOADER_HPP

#include "expconf/Fragment.hpp"
#include "expconf/Value.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace expconf {

enum class FragmentFormat {
    yaml,
    json,
    toml
};

// ============================================================================
// Text parsing
// ============================================================================

/**
 * @brief Parse YAML text into a Value
 *
 * Plain scalars are typed following the YAML 1.2 core schema (null,
 * true/false, integers, floats); quoted scalars stay strings.
 *
 * @param text YAML document
 * @param source Name used in error messages
 * @param locations If non-null, receives the 1-based location of every
 *                  key, indexed by dot-path
 * @throws ConfigParseError on syntax errors or non-scalar keys
 */
Value parse_yaml_text(const std::string& text, const std::string& source,
                      std::map<std::string, SourceLocation>* locations = nullptr);

/**
 * @brief Parse JSON text into a Value
 * @throws ConfigParseError on syntax errors
 */
Value parse_json_text(const std::string& text, const std::string& source);

/**
 * @brief Parse TOML text into a Value
 *
 * Dates and times become strings.
 *
 * @throws ConfigParseError on syntax errors
 */
Value parse_toml_text(const std::string& text, const std::string& source,
                      std::map<std::string, SourceLocation>* locations = nullptr);

// ============================================================================
// Fragments
// ============================================================================

/**
 * @brief Build a fragment from raw text
 *
 * @param id Fragment identifier
 * @param position 0-based load position
 * @param text Raw document
 * @param format Document syntax
 * @throws FragmentFormatError if the text does not parse or is not a mapping
 */
Fragment parse_fragment_text(const std::string& id, std::size_t position,
                             const std::string& text,
                             FragmentFormat format = FragmentFormat::yaml);

/**
 * @brief Load one fragment file, identified by its path
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws FragmentFormatError if its content is malformed
 * @throws ConfigError if the extension is not supported
 */
Fragment load_fragment_file(const std::string& path, std::size_t position);

/**
 * @brief Load fragment files in order; position i is paths[i]
 */
std::vector<Fragment> load_fragment_files(const std::vector<std::string>& paths);

// ============================================================================
// Files and environment
// ============================================================================

/**
 * @brief Load a YAML or JSON document (e.g. a saved resolved configuration)
 *
 * @throws FileNotFoundError, ConfigParseError
 */
Value load_document_file(const std::string& path);

/**
 * @brief Read an entire file
 * @throws FileNotFoundError if it cannot be opened
 */
std::string read_text_file(const std::string& path);

/**
 * @brief Format for a path, by extension (case-insensitive)
 */
std::optional<FragmentFormat> format_for_path(const std::string& path);

/**
 * @brief Get file extension (lowercase), including the dot
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Get environment variable value.
 * @return Value if exists, nullopt otherwise
 */
std::optional<std::string> get_env_var(const std::string& name);

} // namespace expconf

#endif // EXPCONF_LOADER_HPP
