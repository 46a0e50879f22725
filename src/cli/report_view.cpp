#include "report_view.hpp"
#include "theme.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

namespace ReportView {

namespace {

std::string severity_tag(DiagnosticSeverity severity) {
    switch (severity) {
        case DiagnosticSeverity::Error:   return theme::failed("error");
        case DiagnosticSeverity::Warning: return theme::warned("warning");
        case DiagnosticSeverity::Note:    return theme::accent("note");
    }
    return theme::failed("error");
}

std::string status_line(RunStatus status, const std::string& detail) {
    switch (status) {
        case RunStatus::Passed:  return theme::ok(detail);
        case RunStatus::Failed:  return theme::fail(detail);
        case RunStatus::Running: return theme::info(detail);
        case RunStatus::Idle:    break;
    }
    return theme::step(detail);
}

std::string case_line(const TestCase& c) {
    std::string mark = c.passed ? theme::passed("+") : theme::failed("x");
    std::string line = fmt::format("    {} {}", mark, c.name);
    if (c.duration) {
        line += theme::dim(fmt::format("  ({:.3f}s)", *c.duration));
    }
    line += "\n";
    if (c.failure_message) {
        line += theme::dim("        " + *c.failure_message) + "\n";
    }
    return line;
}

std::string yes_no(bool v) { return v ? "yes" : "no"; }

} // namespace

// ── Runs ────────────────────────────────────────────────────

std::string build_report(const BuildReport& report) {
    std::string out = theme::section("Build");
    if (report.status == RunStatus::Passed) {
        return out + status_line(report.status, "Build succeeded");
    }

    out += status_line(report.status, fmt::format("Build {} ({} diagnostics)",
                                                  to_string(report.status),
                                                  report.diagnostics.size()));
    if (report.diagnostics.empty() && !report.output.empty()) {
        out += theme::dim("    " + report.output) + "\n";
    }
    for (const auto& d : report.diagnostics) {
        std::string where = d.column ? fmt::format("{}:{}:{}", d.file_path, d.line, *d.column)
                                     : fmt::format("{}:{}", d.file_path, d.line);
        out += fmt::format("    {} {} {}\n", severity_tag(d.severity), theme::accent(where), d.message);
    }
    return out;
}

std::string test_report(const TestReport& report) {
    std::string out = theme::section("Tests");
    const auto& r = report.result;

    out += theme::kv("format", to_string(r.format));
    out += theme::kv("passed", std::to_string(r.total_passed));
    out += theme::kv("failed", std::to_string(r.failed_names.size()));
    out += "\n";

    for (const auto& c : r.cases) {
        out += case_line(c);
    }
    if (r.cases.empty()) {
        for (const auto& name : r.failed_names) {
            out += fmt::format("    {} {}\n", theme::failed("x"), name);
        }
    }
    if (!r.cases.empty() || !r.failed_names.empty()) out += "\n";

    if (report.status == RunStatus::Passed) {
        out += status_line(report.status, fmt::format("{} tests passed", report.total_passed));
    } else if (report.failed_names.empty() && r.total_passed == 0 && !report.output.empty() &&
               r.format == TestFormat::None) {
        out += status_line(report.status, "Tests failed: " + report.output.substr(0, 200));
    } else {
        out += status_line(report.status, fmt::format("Tests {} ({} failing)",
                                                      to_string(report.status),
                                                      report.failed_names.size()));
    }
    return out;
}

std::string test_record(const TestRunRecord& record) {
    std::string out = theme::section("Latest test run");
    out += theme::kv("at", format_iso(record.timestamp));
    out += theme::kv("result", record.succeeded ? theme::passed("passed") : theme::failed("failed"));
    out += theme::kv("passed", std::to_string(record.passed_count()));
    out += theme::kv("failed", std::to_string(record.failed_count()));
    out += "\n";
    for (const auto& c : record.cases) {
        out += case_line(c);
    }
    return out;
}

// ── Watchers ────────────────────────────────────────────────

std::string state_panel(const WatcherState& state) {
    std::string out = theme::section("Session");
    out += theme::kv("waiting", yes_no(state.waiting_for_input));
    out += theme::kv("prompt", yes_no(state.prompt_visible));
    out += theme::kv("mode", state.mode ? display_name(*state.mode) : theme::dim("unknown"));
    out += theme::kv("model", state.model ? *state.model : theme::dim("unknown"));
    return out;
}

std::string state_change(const WatcherState& before, const WatcherState& after) {
    std::string out;
    if (before.waiting_for_input != after.waiting_for_input) {
        out += after.waiting_for_input ? theme::info(theme::warned("waiting for input"))
                                       : theme::info("no longer waiting for input");
    }
    if (before.prompt_visible != after.prompt_visible) {
        out += theme::info(after.prompt_visible ? "agent prompt visible" : "agent prompt gone");
    }
    if (after.mode && before.mode != after.mode) {
        out += theme::info("mode " + theme::label(display_name(*after.mode)));
    }
    if (after.model && before.model != after.model) {
        out += theme::info("model " + theme::label(*after.model));
    }
    return out;
}

std::string activity_line(const ActivityEvent& event) {
    return theme::kv(event.kind_name(), event.label(), 7);
}

std::string command_line(const std::string& label,
                         const std::optional<CommandDetector::Command>& command) {
    return theme::kv(label, command ? CommandDetector::to_display(*command)
                                    : theme::dim("none detected"));
}

} // namespace ReportView
