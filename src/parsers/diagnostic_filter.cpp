#include "diagnostic_filter.hpp"
#include <util/string_utils.hpp>

static bool refers_to(const std::string& reported, const std::string& absolute_path,
                      const std::string& relative_path) {
    if (reported.empty()) return false;
    if (reported.front() == '/') return reported == absolute_path;
    return reported == relative_path ||
           StringUtils::ends_with(relative_path, "/" + reported);
}

std::map<int, Diagnostic> diagnostics_for_file(const std::vector<Diagnostic>& diagnostics,
                                               const std::string& absolute_path,
                                               const std::string& relative_path) {
    std::map<int, Diagnostic> by_line;
    for (const auto& d : diagnostics) {
        if (refers_to(d.file_path, absolute_path, relative_path)) {
            by_line[d.line] = d;
        }
    }
    return by_line;
}
