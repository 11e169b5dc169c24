#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string WHITE     = "\033[97m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }
inline std::string yellow(const std::string& s)  { return color::YELLOW + s + color::RESET; }
inline std::string white(const std::string& s)   { return color::WHITE + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

constexpr int RULE_WIDTH = 44;

inline std::string rule() {
    std::string line;
    for (int i = 0; i < RULE_WIDTH; ++i) line += "\xe2\x94\x80";  // U+2500
    return color::DIM + "  " + line + color::RESET + "\n";
}

// Clears the screen first
inline std::string banner() {
    return fmt::format("\033[2J\033[H\n{}{}  dumpfleet\n{}{}  v{}\n  Fleet coredump extraction{}\n\n",
                       color::BLUE, color::BOLD, color::RESET, color::DIM,
                       DUMPFLEET_VERSION, color::RESET)
           + rule();
}

inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

inline std::string divider() {
    return "\n" + rule() + "\n";
}

// ── Status lines ────────────────────────────────────────

// Colored one-character marker, then the message
inline std::string marked(const std::string& marker_color, char marker, const std::string& msg) {
    return marker_color + "    " + marker + " " + color::RESET + msg + "\n";
}

inline std::string ok(const std::string& msg)   { return marked(color::GREEN, '+', msg); }
inline std::string fail(const std::string& msg) { return marked(color::RED, 'x', msg); }
inline std::string info(const std::string& msg) { return marked(color::BLUE, '~', msg); }
inline std::string step(const std::string& msg) { return marked(color::BROWN, '>', msg); }
inline std::string warn(const std::string& msg) { return marked(color::YELLOW, '!', msg); }

// Dimmer than program output
inline std::string log(const std::string& msg) {
    return "\033[38;2;80;80;80m    \xc2\xb7 " + msg + color::RESET + "\n";
}

inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<12}", key) + color::RESET + value + "\n";
}

// Dump state word, colored by outcome
inline std::string state(const std::string& s) {
    if (s == "completed") return green(s);
    if (s == "failed" || s == "timeout") return red(s);
    if (s == "idle") return dim(s);
    return yellow(s);
}

} // namespace theme
