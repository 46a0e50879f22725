#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

// Colours by role rather than hue. Paths, commands and modes use the accent;
// arguments and session values use the label colour; outcomes use the
// pass/fail/warn trio shared with diagnostic severities.
namespace color {
    const std::string ACCENT = "\033[38;2;79;124;172m";   // slate
    const std::string LABEL  = "\033[38;2;200;150;62m";   // amber
    const std::string PASS   = "\033[92m";
    const std::string FAIL   = "\033[91m";
    const std::string WARN   = "\033[93m";
    const std::string MUTED  = "\033[2m";
    const std::string STRONG = "\033[1m";
    const std::string RESET  = "\033[0m";
}

inline std::string paint(const std::string& code, const std::string& s) {
    return code + s + color::RESET;
}

inline std::string accent(const std::string& s) { return paint(color::ACCENT, s); }
inline std::string label(const std::string& s)  { return paint(color::LABEL, s); }
inline std::string passed(const std::string& s) { return paint(color::PASS, s); }
inline std::string failed(const std::string& s) { return paint(color::FAIL, s); }
inline std::string warned(const std::string& s) { return paint(color::WARN, s); }
inline std::string dim(const std::string& s)    { return paint(color::MUTED, s); }

// ── Layout ──────────────────────────────────────────────

inline std::string banner() {
    std::string rule;
    for (int i = 0; i < 44; ++i) rule += "\xe2\x94\x80";
    return "\n"
        + paint(color::ACCENT + color::STRONG, "  toolsight") + "\n"
        + dim(fmt::format("  v{}\n  Build, test and terminal signals from tool output", TOOLSIGHT_VERSION))
        + "\n\n" + dim("  " + rule) + "\n";
}

inline std::string section(const std::string& title) {
    return "\n" + paint(color::LABEL + color::STRONG, "  " + title) + "\n\n";
}

// One row of the usage table: command, its argument, a muted description.
inline std::string usage_row(const std::string& command, const std::string& arg,
                             const std::string& description) {
    return "    " + accent(fmt::format("{:<17}", "toolsight " + command))
         + label(fmt::format("{:<10}", arg)) + dim(description) + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg)   { return "    " + passed("+") + " " + msg + "\n"; }
inline std::string fail(const std::string& msg) { return "    " + failed("x") + " " + msg + "\n"; }
inline std::string info(const std::string& msg) { return "    " + accent("~") + " " + msg + "\n"; }
inline std::string step(const std::string& msg) { return "    " + label(">") + " " + msg + "\n"; }

// Key-value row for report and session panels
inline std::string kv(const std::string& key, const std::string& value, int width = 10) {
    return dim(fmt::format("    {:<{}}", key, width)) + value + "\n";
}

} // namespace theme
