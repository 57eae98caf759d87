/**
 * @file Log.cpp
 * @brief Implementation of the diagnostic log
 */

#include "expconf/Log.hpp"
#include "expconf/Loader.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace expconf {

namespace {
    std::atomic<int> g_level{static_cast<int>(LogLevel::warning)};
    std::mutex g_sink_mutex;

    const char* level_label(LogLevel level) {
        switch (level) {
            case LogLevel::debug: return "DEBUG";
            case LogLevel::info: return "INFO";
            case LogLevel::warning: return "WARNING";
            case LogLevel::error: return "ERROR";
            case LogLevel::off: break;
        }
        return "";
    }
}

void set_log_level(LogLevel level) noexcept {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() noexcept {
    return static_cast<LogLevel>(g_level.load());
}

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "debug") return LogLevel::debug;
    if (lower == "info") return LogLevel::info;
    if (lower == "warning" || lower == "warn") return LogLevel::warning;
    if (lower == "error") return LogLevel::error;
    if (lower == "off" || lower == "none") return LogLevel::off;
    return std::nullopt;
}

bool configure_log_from_env() {
    auto raw = get_env_var("EXPCONF_LOG_LEVEL");
    if (!raw) {
        return false;
    }
    auto level = parse_log_level(*raw);
    if (!level) {
        log_message(LogLevel::warning, "Ignoring unknown EXPCONF_LOG_LEVEL '" + *raw + "'");
        return false;
    }
    set_log_level(*level);
    return true;
}

bool log_enabled(LogLevel level) noexcept {
    return level != LogLevel::off && static_cast<int>(level) >= g_level.load();
}

void log_message(LogLevel level, const std::string& message) {
    if (!log_enabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    std::clog << "[expconf] " << level_label(level) << ": " << message << '\n';
}

} // namespace expconf
