#include "diagnostic.hpp"
#include <util/string_utils.hpp>
#include <fmt/format.h>

DiagnosticSeverity severity_from_string(const std::string& token) {
    std::string lower = StringUtils::to_lower(StringUtils::trim(token));
    if (lower == "warning") return DiagnosticSeverity::Warning;
    if (lower == "note") return DiagnosticSeverity::Note;
    return DiagnosticSeverity::Error;
}

const char* to_string(DiagnosticSeverity severity) {
    switch (severity) {
        case DiagnosticSeverity::Error:   return "error";
        case DiagnosticSeverity::Warning: return "warning";
        case DiagnosticSeverity::Note:    return "note";
    }
    return "error";
}

std::string format_diagnostic(const Diagnostic& d) {
    if (d.column) {
        return fmt::format("{}:{}:{}: {}: {}", d.file_path, d.line, *d.column,
                           to_string(d.severity), d.message);
    }
    return fmt::format("{}:{}: {}: {}", d.file_path, d.line,
                       to_string(d.severity), d.message);
}
