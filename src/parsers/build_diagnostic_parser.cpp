#include "build_diagnostic_parser.hpp"
#include "pattern.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <util/string_utils.hpp>
#include <optional>

namespace BuildDiagnosticParser {

namespace {

struct PendingHeader {
    DiagnosticSeverity severity;
    std::string message;
};

struct ScanState {
    std::vector<Diagnostic> out;
    std::optional<PendingHeader> pending;
};

// Builds a diagnostic from captured line/column text. Returns false when a
// number does not parse or the line is not positive; the caller then treats
// the line as unmatched.
bool emit(ScanState& st, const std::string& path, const std::string& line_s,
          const std::string& col_s, DiagnosticSeverity severity,
          const std::string& message) {
    auto line = parse_int(line_s);
    if (!line || *line < 1) return false;

    std::optional<int> column;
    if (!col_s.empty()) {
        column = parse_int(col_s);
        if (!column) return false;
    }

    std::string msg = StringUtils::trim(message);
    if (path.empty() || msg.empty()) return false;

    Diagnostic d;
    d.file_path = path;
    d.line = *line;
    d.column = column;
    d.severity = severity;
    d.message = msg;
    st.out.push_back(std::move(d));
    return true;
}

const std::vector<LineRule<ScanState>>& rules() {
    static const std::vector<LineRule<ScanState>> table = {
        // path:line[:col]: severity: message. Only toolchain severity words count;
        // "file:12: got: 3" style test output is not a diagnostic.
        {Pattern(R"(^(.+?):(\d+)(?::(\d+))?:\s*(fatal error|error|warning|note|remark):\s*(.+)$)", true),
         [](const std::smatch& m, ScanState& st) {
             if (!emit(st, m[1], m[2], m[3], severity_from_string(m[4]), m[5])) return false;
             st.pending.reset();
             return true;
         }},

        // path(line[,col]): severity CODE: message
        {Pattern(R"(^(.+?)\((\d+)(?:,(\d+))?\):\s*(error|warning|note|remark)\s+\S+:\s*(.+)$)", true),
         [](const std::smatch& m, ScanState& st) {
             if (!emit(st, m[1], m[2], m[3], severity_from_string(m[4]), m[5])) return false;
             st.pending.reset();
             return true;
         }},

        // rustc header: error[E0308]: mismatched types
        {Pattern(R"(^(error|warning|note)(?:\[\w+\])?:\s*(.+)$)"),
         [](const std::smatch& m, ScanState& st) {
             st.pending = PendingHeader{severity_from_string(m[1]), StringUtils::trim(m[2])};
             return true;
         }},

        // rustc arrow:  --> src/main.rs:10:5
        {Pattern(R"(^\s*-->\s+(.+?):(\d+)(?::(\d+))?\s*$)"),
         [](const std::smatch& m, ScanState& st) {
             if (!st.pending) return false;
             PendingHeader header = *st.pending;
             if (!emit(st, m[1], m[2], m[3], header.severity, header.message)) return false;
             st.pending.reset();
             return true;
         }},
    };
    return table;
}

} // namespace

std::vector<Diagnostic> parse(const std::string& output) {
    ScanState st;

    for (const auto& line : StringUtils::split_lines(output)) {
        if (apply_first_rule(rules(), line, st)) continue;

        // Anything substantive between a rustc header and its arrow orphans the header.
        if (st.pending) {
            std::string trimmed = StringUtils::trim(line);
            if (!trimmed.empty() &&
                !StringUtils::starts_with(trimmed, "-->") &&
                !StringUtils::starts_with(trimmed, "= ")) {
                st.pending.reset();
            }
        }
    }

    ts_logf("BuildDiagnosticParser: {} diagnostics from {} bytes", st.out.size(), output.size());
    return st.out;
}

} // namespace BuildDiagnosticParser
