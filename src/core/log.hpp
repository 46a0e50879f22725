#pragma once

#include <string>
#include <fmt/format.h>

// Debug log: one "[HH:MM:SS.mmm] message" line per call, appended to
// toolsight_debug.log in the temp directory unless configured otherwise.
// Safe to call from any thread.

void ts_log(const std::string& msg);

template <typename... Args>
inline void ts_logf(fmt::format_string<Args...> f, Args&&... args) {
    ts_log(fmt::format(f, std::forward<Args>(args)...));
}

// Redirect or silence the log (applied from Config at startup).
void set_log_path(const std::string& path);
void set_log_enabled(bool enabled);
std::string ts_log_path();
