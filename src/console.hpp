#pragma once

#include <string>
#include <iostream>

namespace gesbot {

// ========== ANSI Escape Codes ==========

namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
}

/**
 * Status output helper with color support.
 *
 * Writes user-facing status lines (success, errors, hints) to stderr by
 * default so that stdout stays clean in pipelines. Colors are used only when
 * TERM allows them and stderr is a terminal.
 */
class Console {
public:
    // Writes to stderr and detects color support.
    Console();

    // Writes to the given stream with colors explicitly on or off.
    Console(std::ostream& out, bool colors_enabled);

    // ========== Basic Output ==========

    void println(const std::string& text = "") const;

    // ========== Status Messages ==========

    // Prints "❌ <text>" in red.
    void print_error(const std::string& text) const;

    // Prints "💡 <text>" in yellow.
    void print_hint(const std::string& text) const;

    // Prints "✅ <text>" in green.
    void print_success(const std::string& text) const;

private:
    std::ostream* out_;    // Destination stream (not owned).
    bool colors_enabled_;  // True if ANSI colors are emitted.

    void print_line(const char* color, const std::string& text) const;
};

} // namespace gesbot
