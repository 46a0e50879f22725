#include "capture_input.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

Result<std::string> read_capture(const std::string& source) {
    if (source.empty()) {
        return Result<std::string>::Err("No input given (file path or '-')");
    }

    if (source == "-") {
        std::ostringstream ss;
        ss << std::cin.rdbuf();
        return Result<std::string>::Ok(ss.str());
    }

    std::ifstream in(source, std::ios::binary);
    if (!in) {
        return Result<std::string>::Err("Cannot open " + source);
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return Result<std::string>::Ok(std::move(text));
}
