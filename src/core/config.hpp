#pragma once

#include <string>
#include <filesystem>
#include "constants.hpp"
#include "types.hpp"

namespace fs = std::filesystem;

struct LogConfig {
    bool enabled = true;
    std::string path;                   // empty = temp_dir()/toolsight_debug.log
};

struct WatcherConfig {
    int input_wait_rows = INPUT_WAIT_SCAN_ROWS;
    int mode_model_rows = MODE_MODEL_SCAN_ROWS;
    int prompt_rows = PROMPT_SCAN_ROWS;
    int poll_interval_ms = WATCHER_POLL_INTERVAL_MS;
};

struct ActivityConfig {
    int max_status_length = ACTIVITY_STATUS_MAX_CHARS;
};

class Config {
public:
    // Load global config from ~/.toolsight/config.yaml (defaults if absent)
    static Result<Config> load_global();

    // Load a single YAML file on top of the defaults
    static Result<Config> load_file(const fs::path& path);

    // Load global, then overlay ./toolsight.yaml when present
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    const LogConfig& log() const { return log_; }
    const WatcherConfig& watchers() const { return watchers_; }
    const ActivityConfig& activity() const { return activity_; }

    // Point ts_log() at the configured file.
    void apply_logging() const;

public:
    Config() = default;

private:
    LogConfig log_;
    WatcherConfig watchers_;
    ActivityConfig activity_;

    Result<void> overlay_file(const fs::path& path);
};

bool global_config_exists();
bool project_config_exists(const fs::path& dir = fs::current_path());

fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());

// Create default global config
Result<void> create_default_global_config();
