#pragma once

#include <string>
#include <iostream>

namespace mkq {

// ========== ANSI Escape Codes ==========

// ANSI escape codes for terminal colors.
namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";
}

/**
 * Status output for the converter with color support.
 *
 * Writes to the given stream (stdout by default; stderr when stdout carries a
 * converted document). Falls back to plain text when TERM is unset or "dumb".
 */
class Console {
public:
    // Creates a Console writing to `out` and detects color support.
    explicit Console(std::ostream& out = std::cout);

    // Prints text followed by a newline.
    void println(const std::string& text = "") const;

    // Prints error message in red.
    void print_error(const std::string& text) const;

    // Prints warning message in yellow.
    void print_warning(const std::string& text) const;

    // Prints success message in green with a checkmark prefix.
    void print_success(const std::string& text) const;

    // Prints informational message in cyan.
    void print_info(const std::string& text) const;

    // Prints text with a specific ANSI color code, without newline.
    void print_colored(const std::string& text, const char* color) const;

private:
    std::ostream& out_;
    bool colors_enabled_;  // True if terminal supports ANSI colors.

    // Prints a full line wrapped in a color when colors are enabled.
    void print_line(const std::string& text, const char* color) const;
};

} // namespace mkq
