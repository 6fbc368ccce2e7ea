#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
// Accent: #3E78B2
// Titles: #80633A
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string rule() {
    std::string line;
    for (int i = 0; i < 44; i++) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

// Title + version + rule (no screen clear; status output is often piped)
inline std::string banner(const std::string& version) {
    return
        "\n" + color::BLUE + color::BOLD
        + "  repomove\n"
        + color::RESET + color::DIM + "  v" + version + "\n"
        + "  Repository transfer state"
        + color::RESET + "\n\n"
        + rule();
}

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

// Key-value row for status panels. width is the key column.
inline std::string kv(const std::string& key, const std::string& value, int width = 10) {
    return color::DIM + fmt::format("    {:<{}}", key, width) + color::RESET + value + "\n";
}

} // namespace theme
