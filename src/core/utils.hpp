#pragma once

#include <string>
#include <optional>
#include <chrono>

// ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) in local time.
std::string format_iso(std::chrono::system_clock::time_point tp);

// Strict parses for regex captures: the whole string must be consumed.
// Out-of-range or malformed input yields nullopt.
std::optional<int> parse_int(const std::string& s);
std::optional<double> parse_double(const std::string& s);

// Number of UTF-8 code points (continuation bytes are not counted).
size_t utf8_length(const std::string& s);
