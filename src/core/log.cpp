#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

std::string& log_path_slot() {
    static std::string path = (platform::temp_dir() / DEFAULT_LOG_FILE).string();
    return path;
}

std::atomic<bool> g_log_enabled{true};

} // namespace

std::string ts_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    return log_path_slot();
}

void set_log_path(const std::string& path) {
    if (path.empty()) return;
    std::lock_guard<std::mutex> lock(log_mutex());
    log_path_slot() = path;
}

void set_log_enabled(bool enabled) {
    g_log_enabled.store(enabled);
}

void ts_log(const std::string& msg) {
    if (!g_log_enabled.load()) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> lock(log_mutex());
    std::ofstream out(log_path_slot(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}
