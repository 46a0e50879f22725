#pragma once

#include <optional>
#include <string>
#include <vector>

enum class DiagnosticSeverity {
    Error,
    Warning,
    Note,
};

// One structured error/warning/note with a resolved file location.
struct Diagnostic {
    std::string file_path;          // as reported (relative or absolute)
    int line = 1;                   // 1-based, always >= 1
    std::optional<int> column;      // 1-based
    DiagnosticSeverity severity = DiagnosticSeverity::Error;
    std::string message;

    bool operator==(const Diagnostic& o) const {
        return file_path == o.file_path && line == o.line && column == o.column &&
               severity == o.severity && message == o.message;
    }
    bool operator!=(const Diagnostic& o) const { return !(*this == o); }
};

// "error" / "warning" / "note" (case-insensitive); anything else is an error.
DiagnosticSeverity severity_from_string(const std::string& token);
const char* to_string(DiagnosticSeverity severity);

// "path:line:col: severity: message" rendering used by the CLI.
std::string format_diagnostic(const Diagnostic& d);
