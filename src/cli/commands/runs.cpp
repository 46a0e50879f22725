#include "../base_cli.hpp"
#include "../capture_input.hpp"
#include "../report_view.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <runs/command_detector.hpp>
#include <runs/run_report.hpp>
#include <iostream>
#include <sstream>

// "<file> [exit-code]" → captured outcome. Exit code defaults to 1.
static bool load_outcome(const std::string& arg, const std::string& usage,
                         ProcessOutcome& outcome) {
    std::istringstream iss(arg);
    std::string path, code_text;
    iss >> path >> code_text;

    int code = 1;
    if (!code_text.empty()) {
        auto parsed = parse_int(code_text);
        if (!parsed) {
            std::cout << theme::fail("Not an exit code: " + code_text);
            return false;
        }
        code = *parsed;
    }
    if (path.empty()) {
        std::cout << theme::fail("Usage: " + usage);
        return false;
    }

    auto text = read_capture(path);
    if (text.is_err()) {
        std::cout << theme::fail(text.error);
        return false;
    }
    outcome = ProcessOutcome::completed(code, text.value);
    return true;
}

static void do_build(BaseCLI& cli, const std::string& arg) {
    ProcessOutcome outcome;
    if (!load_outcome(arg, "build <file> [exit-code]", outcome)) return;
    std::cout << ReportView::build_report(BuildReport::from_outcome(outcome)) << "\n";
}

static void do_test(BaseCLI& cli, const std::string& arg) {
    ProcessOutcome outcome;
    if (!load_outcome(arg, "test <file> [exit-code]", outcome)) return;

    auto report = TestReport::from_outcome(outcome);
    cli.results.record(make_record(report));
    std::cout << ReportView::test_report(report) << "\n";
}

static void do_results(BaseCLI& cli, const std::string& arg) {
    auto latest = cli.results.latest();
    if (!latest) {
        std::cout << theme::dim("  No test runs recorded.") << "\n";
        return;
    }
    std::cout << ReportView::test_record(*latest) << "\n";
}

static void do_detect(BaseCLI& cli, const std::string& arg) {
    std::filesystem::path root = arg.empty() ? std::filesystem::current_path()
                                             : std::filesystem::path(arg);
    std::cout << theme::section("Detected commands");
    std::cout << ReportView::command_line("build", CommandDetector::build_command(root));
    std::cout << ReportView::command_line("test", CommandDetector::test_command(root));
    std::cout << "\n";
}

void register_run_commands(BaseCLI& cli) {
    cli.add_command("build", do_build, "Parse a captured build log <file> [exit-code]");
    cli.add_command("test", do_test, "Parse a captured test log <file> [exit-code]");
    cli.add_command("results", do_results, "Show the latest recorded test run");
    cli.add_command("detect", do_detect, "Show build/test commands for [dir]");
}
