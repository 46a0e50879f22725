#pragma once

#include <string>
#include <core/types.hpp>

// Read a captured log from `source`, or from stdin when it is "-".
Result<std::string> read_capture(const std::string& source);
