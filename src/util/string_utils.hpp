#pragma once

#include <string>
#include <vector>

namespace StringUtils {
// Split on '\n', dropping a trailing '\r' from each line.
std::vector<std::string> split_lines(const std::string& str);

std::string trim(const std::string& str);

// ASCII-only lowercase; multi-byte UTF-8 sequences pass through unchanged,
// so byte offsets stay valid against the original string.
std::string to_lower(const std::string& str);

bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);
bool contains(const std::string& str, const std::string& needle);
}
