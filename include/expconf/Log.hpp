/**
 * @file Log.hpp
 * @brief Leveled diagnostic log for the configuration pipeline
 *
 * Messages go to std::clog as "[expconf] LEVEL: message". The default
 * threshold is warning; EXPCONF_LOG_LEVEL or the CLI flags lower it.
 */

#ifndef EXPCONF_LOG_HPP
#define EXPCONF_LOG_HPP

#include <optional>
#include <string>

namespace expconf {

enum class LogLevel {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3,
    off = 4
};

void set_log_level(LogLevel level) noexcept;
LogLevel log_level() noexcept;

/**
 * @brief Parse "debug", "info", "warning", "error" or "off" (any case)
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Apply EXPCONF_LOG_LEVEL if it is set to a valid level name
 * @return true if the environment changed the level
 */
bool configure_log_from_env();

/**
 * @brief Whether a message at @p level would be written
 *
 * Per-key call sites check this before building the message.
 */
bool log_enabled(LogLevel level) noexcept;

/**
 * @brief Write @p message if @p level passes the threshold
 */
void log_message(LogLevel level, const std::string& message);

} // namespace expconf

#endif // EXPCONF_LOG_HPP
