#include "toolsight_cli.hpp"
#include "capture_input.hpp"
#include "report_view.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <runs/command_detector.hpp>
#include <runs/run_report.hpp>
#include <terminal/terminal_text.hpp>
#include <util/string_utils.hpp>
#include <iostream>
#include <sstream>
#include <cstdio>
#include <cstdlib>
#include <readline/readline.h>
#include <readline/history.h>

namespace {

struct CliArgs {
    std::string positional;
    std::optional<int> exit_code;
    std::optional<int> rows;
    std::string error;
};

CliArgs parse_cli_args(const std::vector<std::string>& args) {
    CliArgs out;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "--exit-code" || a == "--rows") {
            if (i + 1 >= args.size()) {
                out.error = "Missing value for " + a;
                return out;
            }
            auto v = parse_int(args[++i]);
            if (!v) {
                out.error = "Not a number: " + args[i];
                return out;
            }
            if (a == "--exit-code") {
                out.exit_code = *v;
            } else if (*v < 1) {
                out.error = "--rows must be at least 1";
                return out;
            } else {
                out.rows = *v;
            }
        } else if (out.positional.empty()) {
            out.positional = a;
        } else {
            out.error = "Unexpected argument: " + a;
            return out;
        }
    }
    return out;
}

} // namespace

ToolsightCLI::ToolsightCLI() {
    register_all_commands();
}

void ToolsightCLI::register_all_commands() {
    register_session_commands(*this);
    register_run_commands(*this);
}

// ── One-shot commands ───────────────────────────────────────

int ToolsightCLI::run_build(const std::vector<std::string>& args) {
    CliArgs a = parse_cli_args(args);
    if (!a.error.empty()) {
        std::cout << theme::fail(a.error);
        std::cout << theme::step("Usage: toolsight build <file|-> [--exit-code N]");
        return 2;
    }

    auto text = read_capture(a.positional);
    if (text.is_err()) {
        std::cout << theme::fail(text.error);
        return 1;
    }

    auto report = BuildReport::from_outcome(
        ProcessOutcome::completed(a.exit_code.value_or(1), text.value));
    std::cout << ReportView::build_report(report) << "\n";
    return report.status == RunStatus::Passed ? 0 : 1;
}

int ToolsightCLI::run_test(const std::vector<std::string>& args) {
    CliArgs a = parse_cli_args(args);
    if (!a.error.empty()) {
        std::cout << theme::fail(a.error);
        std::cout << theme::step("Usage: toolsight test <file|-> [--exit-code N]");
        return 2;
    }

    auto text = read_capture(a.positional);
    if (text.is_err()) {
        std::cout << theme::fail(text.error);
        return 1;
    }

    auto report = TestReport::from_outcome(
        ProcessOutcome::completed(a.exit_code.value_or(1), text.value));
    results.record(make_record(report));
    std::cout << ReportView::test_report(report) << "\n";
    return report.status == RunStatus::Passed ? 0 : 1;
}

int ToolsightCLI::run_detect(const std::vector<std::string>& args) {
    CliArgs a = parse_cli_args(args);
    if (!a.error.empty()) {
        std::cout << theme::fail(a.error);
        return 2;
    }

    std::filesystem::path root = a.positional.empty() ? std::filesystem::current_path()
                                                      : std::filesystem::path(a.positional);
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        std::cout << theme::fail("Not a directory: " + root.string());
        return 1;
    }

    std::cout << theme::section("Detected commands");
    std::cout << ReportView::command_line("build", CommandDetector::build_command(root));
    std::cout << ReportView::command_line("test", CommandDetector::test_command(root));
    std::cout << "\n";
    return 0;
}

int ToolsightCLI::run_replay(const std::vector<std::string>& args) {
    CliArgs a = parse_cli_args(args);
    if (!a.error.empty()) {
        std::cout << theme::fail(a.error);
        std::cout << theme::step("Usage: toolsight replay <file|-> [--rows N]");
        return 2;
    }

    auto text = read_capture(a.positional);
    if (text.is_err()) {
        std::cout << theme::fail(text.error);
        return 1;
    }

    open_session(a.rows.value_or(DEFAULT_GRID_ROWS));
    std::cout << theme::section("Replay");

    size_t line_count = 0;
    for (const auto& line : StringUtils::split_lines(text.value)) {
        RowRange range = grid->append_line(TerminalText::strip_ansi(line));
        monitor->range_changed(range.start, range.end);
        monitor->poll_now();
        flush_notifications();
        line_count++;
    }

    std::cout << ReportView::state_panel(monitor->state());
    std::cout << theme::kv("lines", std::to_string(line_count));
    std::cout << theme::kv("events", std::to_string(monitor->activity_feed().size()));
    std::cout << "\n";

    close_session();
    return 0;
}

// ── Session REPL ────────────────────────────────────────────

int ToolsightCLI::run_session(const std::vector<std::string>& args) {
    CliArgs a = parse_cli_args(args);
    if (!a.error.empty()) {
        std::cout << theme::fail(a.error);
        std::cout << theme::step("Usage: toolsight session [--rows N]");
        return 2;
    }

    open_session(a.rows.value_or(DEFAULT_GRID_ROWS));
    monitor->start();

    std::cout << theme::banner();
    std::cout << theme::dim("  Type 'print <text>' to write a terminal line, 'help' for commands.")
              << "\n\n";

    std::string line;
    while (!quit_requested) {
        flush_notifications();

        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string rest;
        std::getline(iss, rest);
        if (!rest.empty() && rest[0] == ' ') {
            rest = rest.substr(1);
        }

        execute_command(command, rest);
        flush_notifications();
    }

    monitor->stop();
    close_session();
    ts_log("cli: session closed");
    return 0;
}
