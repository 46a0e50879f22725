#pragma once

#include <map>
#include <string>
#include <vector>
#include "diagnostic.hpp"

// Diagnostics that belong to one source file, keyed by line.
//
// A diagnostic with an absolute path matches only if it equals
// `absolute_path`. A relative one matches if it equals `relative_path`
// (the file's path from the project root) or is a trailing "/"-separated
// suffix of it. When several land on one line the last one wins.
std::map<int, Diagnostic> diagnostics_for_file(const std::vector<Diagnostic>& diagnostics,
                                               const std::string& absolute_path,
                                               const std::string& relative_path);
