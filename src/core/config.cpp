#include "config.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace fs = std::filesystem;

// Row windows and intervals below 1 would make a watcher scan nothing.
static int positive_or(const YAML::Node& node, int current) {
    int v = node.as<int>(current);
    return v > 0 ? v : current;
}

static void overlay_log(const YAML::Node& node, LogConfig& log) {
    if (!node || !node.IsMap()) return;
    log.enabled = node["enabled"].as<bool>(log.enabled);
    log.path = node["path"].as<std::string>(log.path);
}

static void overlay_watchers(const YAML::Node& node, WatcherConfig& w) {
    if (!node || !node.IsMap()) return;
    w.input_wait_rows = positive_or(node["input_wait_rows"], w.input_wait_rows);
    w.mode_model_rows = positive_or(node["mode_model_rows"], w.mode_model_rows);
    w.prompt_rows = positive_or(node["prompt_rows"], w.prompt_rows);
    w.poll_interval_ms = positive_or(node["poll_interval_ms"], w.poll_interval_ms);
}

static void overlay_activity(const YAML::Node& node, ActivityConfig& a) {
    if (!node || !node.IsMap()) return;
    a.max_status_length = positive_or(node["max_status_length"], a.max_status_length);
}

bool global_config_exists() {
    return fs::exists(get_global_config_path());
}

bool project_config_exists(const fs::path& dir) {
    return fs::exists(get_project_config_path(dir));
}

fs::path get_global_config_dir() {
    return platform::home_dir() / GLOBAL_CONFIG_DIR;
}

fs::path get_global_config_path() {
    return get_global_config_dir() / GLOBAL_CONFIG_FILE;
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / PROJECT_CONFIG_FILE;
}

Result<void> create_default_global_config() {
    fs::path config_path = get_global_config_path();

    // Don't overwrite existing config
    if (fs::exists(config_path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(config_path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err("Failed to create " + config_path.parent_path().string() +
                                 ": " + ec.message());
    }

    const char* default_config = R"(# toolsight configuration

log:
  enabled: true
  # path: "/tmp/toolsight_debug.log"

# Rows scanned from the bottom of the terminal grid
watchers:
  input_wait_rows: 5
  mode_model_rows: 8
  prompt_rows: 10
  poll_interval_ms: 500

activity:
  max_status_length: 80     # longer lines are never agent status
)";

    std::ofstream out(config_path);
    if (!out) {
        return Result<void>::Err("Failed to create config file at " + config_path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}

Result<void> Config::overlay_file(const fs::path& path) {
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root || root.IsNull()) {
            return Result<void>::Ok();
        }
        if (!root.IsMap()) {
            return Result<void>::Err("Expected a mapping at the top of " + path.string());
        }
        overlay_log(root["log"], log_);
        overlay_watchers(root["watchers"], watchers_);
        overlay_activity(root["activity"], activity_);
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(std::string("Failed to parse ") + path.string() + ": " + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    Config config;
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }
    auto r = config.overlay_file(path);
    if (r.is_err()) {
        return Result<Config>::Err(r.error);
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load_global() {
    Config config;
    if (!global_config_exists()) {
        return Result<Config>::Ok(config);
    }
    auto r = config.overlay_file(get_global_config_path());
    if (r.is_err()) {
        return Result<Config>::Err(r.error);
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const fs::path& project_dir) {
    auto global_result = load_global();
    if (!global_result.is_ok()) {
        return global_result;
    }

    Config config = global_result.value;
    if (project_config_exists(project_dir)) {
        auto r = config.overlay_file(get_project_config_path(project_dir));
        if (r.is_err()) {
            return Result<Config>::Err(r.error);
        }
    }
    return Result<Config>::Ok(config);
}

void Config::apply_logging() const {
    set_log_enabled(log_.enabled);
    if (!log_.path.empty()) {
        set_log_path(log_.path);
    }
}
