#pragma once

/**
 * Verbose logging utility for the gesbot CLI.
 *
 * Prints timestamped debug lines for .env loading and Slack API traffic when
 * the -v/--verbose flag is enabled. All output goes to stderr so stdout stays
 * usable in pipelines.
 */

#include <string>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <sstream>
#include <ctime>
#include <nlohmann/json.hpp>

namespace gesbot {

/**
 * Global verbose mode flag.
 */
inline bool g_verbose = false;

inline void set_verbose(bool enabled) {
    g_verbose = enabled;
}

inline bool is_verbose() {
    return g_verbose;
}

/**
 * Current local time as HH:MM:SS.mmm.
 */
inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

namespace detail {
    inline void emit(const char* color, const std::string& tag, const std::string& message) {
        if (!g_verbose) return;
        std::cerr << "\033[90m[" << timestamp() << "] " << color << "[" << tag << "]\033[0m "
                  << message << std::endl;
    }
}

// General progress message.
inline void verbose_log(const std::string& category, const std::string& message) {
    detail::emit("\033[36m", category, message);
}

// Outgoing request data.
inline void verbose_out(const std::string& category, const std::string& message) {
    detail::emit("\033[33m", category + " >>>", message);
}

// Incoming response data.
inline void verbose_in(const std::string& category, const std::string& message) {
    detail::emit("\033[32m", category + " <<<", message);
}

inline void verbose_err(const std::string& category, const std::string& message) {
    detail::emit("\033[31m", category + " ERR", message);
}

/**
 * Truncate long content for display.
 */
inline std::string truncate(const std::string& s, size_t max_len = 200) {
    if (s.length() <= max_len) return s;
    return s.substr(0, max_len) + "... (" + std::to_string(s.length()) + " bytes total)";
}

/**
 * Single-line, truncated rendering of a JSON document.
 * Text that is not JSON is only truncated.
 */
inline std::string format_json_compact(const std::string& json_str, size_t max_len = 500) {
    auto parsed = nlohmann::json::parse(json_str, nullptr, false);
    if (parsed.is_discarded()) {
        return truncate(json_str, max_len);
    }
    return truncate(parsed.dump(), max_len);
}

/**
 * Masks a secret for logging, keeping only its prefix (e.g. "xoxb-").
 */
inline std::string redact(const std::string& secret) {
    size_t keep = secret.find('-');
    if (keep == std::string::npos || keep > 8) {
        keep = 0;
    } else {
        keep += 1;
    }
    return secret.substr(0, keep) + "****";
}

} // namespace gesbot
