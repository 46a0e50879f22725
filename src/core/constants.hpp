#pragma once

#include <cstddef>

// ── Watcher scan windows ────────────────────────────────────
// Rows counted up from the bottom of the visible grid.
constexpr int INPUT_WAIT_SCAN_ROWS      = 5;     // Interactive prompts sit at the cursor
constexpr int MODE_MODEL_SCAN_ROWS      = 8;     // Status bar + prompt decoration
constexpr int PROMPT_SCAN_ROWS          = 10;    // "> " agent prompt

constexpr int DEFAULT_GRID_ROWS         = 24;    // replay / session viewport height

// ── Polling ─────────────────────────────────────────────────
constexpr int WATCHER_POLL_INTERVAL_MS  = 500;   // Prompt visibility + activity feed

// ── Activity feed ───────────────────────────────────────────
constexpr int ACTIVITY_STATUS_MAX_CHARS = 80;    // Longer lines are output, not status
constexpr size_t ACTIVITY_FEED_LIMIT    = 500;   // Events kept by SessionMonitor

// ── Parsing ─────────────────────────────────────────────────
constexpr size_t MAX_PARSE_LINE         = 4096;  // Longer lines are skipped by every pattern

// ── Config files ────────────────────────────────────────────
constexpr const char* GLOBAL_CONFIG_DIR   = ".toolsight";
constexpr const char* GLOBAL_CONFIG_FILE  = "config.yaml";
constexpr const char* PROJECT_CONFIG_FILE = "toolsight.yaml";
constexpr const char* DEFAULT_LOG_FILE    = "toolsight_debug.log";

constexpr const char* TOOLSIGHT_VERSION   = "0.4.0";

// ── Glyphs ──────────────────────────────────────────────────
// Braille frames used by ora / cli-spinners style progress indicators.
constexpr const char* SPINNER_GLYPHS[] = {
    "⠋", "⠙", "⠹", "⠸", "⠼", "⠴", "⠦", "⠧", "⠇", "⠏",
};

// Check marks and crosses that prefix a finished step.
constexpr const char* RESULT_GLYPHS[] = {
    "✓", "✔", "✗", "✘",
};
