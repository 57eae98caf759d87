/**
 * @file Errors.hpp
 * @brief Exception types for expconf configuration errors
 *
 * Error taxonomy:
 * - ConfigError: Base class
 * - FragmentFormatError: Fragment content is not a mapping
 * - UnresolvedPlaceholderError: Placeholder names an absent key
 * - ProvenanceInconsistencyError: Configuration and provenance disagree
 * - MissingMandatoryConfig: Mandatory keys absent after resolution
 * - FileNotFoundError: Fragment, template or document file not found
 * - ConfigParseError: YAML/JSON/TOML syntax errors
 * - KeyError: Dot-path segment not found
 * - TypeError: Traversal into non-container
 */

#ifndef EXPCONF_ERRORS_HPP
#define EXPCONF_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include <sstream>

namespace expconf {

/**
 * @brief Base class for all expconf exceptions
 */
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A fragment's content is not a valid mapping
 *
 * Aborts the whole load: no partial configuration is returned.
 */
class FragmentFormatError : public ConfigError {
public:
    /**
     * @brief Construct with fragment identifier and error details
     * @param fragment Identifier of the offending fragment (e.g. file path)
     * @param details What was wrong with its content
     */
    FragmentFormatError(std::string fragment, std::string details)
        : ConfigError("Malformed fragment '" + fragment + "': " + details)
        , fragment_(std::move(fragment))
        , details_(std::move(details))
    {}

    const std::string& fragment() const noexcept {
        return fragment_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string fragment_;
    std::string details_;
};

/**
 * @brief A placeholder refers to a key absent from the configuration
 *
 * Raised by the immediate pass (fragment context), the deferred pass
 * (configuration context) and the script renderer (template context).
 */
class UnresolvedPlaceholderError : public ConfigError {
public:
    /// Where the unresolved placeholder was found
    enum class Context {
        fragment,
        configuration,
        template_body
    };

    /**
     * @brief Construct with key, context name and context kind
     * @param key Bare placeholder name (without markers)
     * @param context Fragment identifier, key path or template name
     * @param kind Which pass raised the error
     */
    UnresolvedPlaceholderError(std::string key, std::string context, Context kind)
        : ConfigError(format_message(key, context, kind))
        , key_(std::move(key))
        , context_(std::move(context))
        , kind_(kind)
    {}

    /**
     * @brief Get the bare placeholder name that could not be resolved
     */
    const std::string& key() const noexcept {
        return key_;
    }

    /**
     * @brief Get the fragment, key path or template containing it
     */
    const std::string& context() const noexcept {
        return context_;
    }

    Context context_kind() const noexcept {
        return kind_;
    }

private:
    std::string key_;
    std::string context_;
    Context kind_;

    static std::string format_message(const std::string& key,
                                      const std::string& context,
                                      Context kind) {
        std::ostringstream oss;
        oss << "Unresolved placeholder '" << key << "' in ";
        switch (kind) {
            case Context::fragment: oss << "fragment"; break;
            case Context::configuration: oss << "configuration key"; break;
            case Context::template_body: oss << "template"; break;
        }
        oss << " '" << context << "'";
        return oss.str();
    }
};

/**
 * @brief Configuration and provenance record disagree
 *
 * Internal invariant violation; never expected in normal operation.
 */
class ProvenanceInconsistencyError : public ConfigError {
public:
    ProvenanceInconsistencyError(std::string key, const std::string& details)
        : ConfigError("Provenance inconsistency at '" + key + "': " + details)
        , key_(std::move(key))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

private:
    std::string key_;
};

/**
 * @brief Mandatory configuration keys are missing after resolution
 *
 * Contains the list of all missing mandatory keys.
 */
class MissingMandatoryConfig : public ConfigError {
public:
    /**
     * @brief Construct with list of missing keys
     * @param keys Dot-paths of missing mandatory keys
     */
    explicit MissingMandatoryConfig(std::vector<std::string> keys)
        : ConfigError(format_message(keys))
        , missing_keys_(std::move(keys))
    {}

    /**
     * @brief Get the list of missing keys
     * @return Vector of dot-path strings
     */
    const std::vector<std::string>& missing_keys() const noexcept {
        return missing_keys_;
    }

private:
    std::vector<std::string> missing_keys_;

    static std::string format_message(const std::vector<std::string>& keys) {
        std::ostringstream oss;
        oss << "Missing mandatory configuration keys: [";
        for (size_t i = 0; i < keys.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << "'" << keys[i] << "'";
        }
        oss << "]";
        return oss.str();
    }
};

/**
 * @brief Fragment, template or document file not found
 */
class FileNotFoundError : public ConfigError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : ConfigError("File not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief File parse error (YAML/JSON/TOML syntax)
 *
 * Line and column are 1-based; 0 when the parser does not report them.
 */
class ConfigParseError : public ConfigError {
public:
    ConfigParseError(std::string file, int line, int column, std::string details)
        : ConfigError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line,
                                      int column, const std::string& details) {
        std::ostringstream oss;
        oss << "Parse error in '" << file << "'";
        if (line > 0) {
            oss << " at " << line << ":" << column;
        }
        oss << ": " << details;
        return oss.str();
    }
};

/**
 * @brief Key not found during dot-path traversal
 */
class KeyError : public ConfigError {
public:
    /**
     * @brief Construct with full path and failing segment
     * @param path Full dot-path being accessed (e.g., "JOBS.SIM.WALLCLOCK")
     * @param segment The specific segment that doesn't exist
     */
    KeyError(std::string path, std::string segment)
        : ConfigError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Type mismatch during dot-path traversal
 *
 * Raised when attempting to traverse into a non-object value
 * (e.g., accessing "WALLCLOCK.sub" where WALLCLOCK is a string).
 */
class TypeError : public ConfigError {
public:
    TypeError(std::string path, std::string expected, std::string actual)
        : ConfigError("Cannot traverse into " + actual +
                      " (expected " + expected + ") at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

} // namespace expconf

#endif // EXPCONF_ERRORS_HPP
