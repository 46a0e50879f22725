#include "../base_cli.hpp"
#include "../report_view.hpp"
#include "../theme.hpp"
#include <core/utils.hpp>
#include <terminal/terminal_text.hpp>
#include <iostream>
#include <fmt/format.h>

// Push a grid write through the watchers the way a terminal redraw would.
static void notify_redraw(BaseCLI& cli, RowRange range) {
    if (range.empty()) return;
    cli.monitor->range_changed(range.start, range.end);
    cli.monitor->poll_now();
}

static void do_print(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    notify_redraw(cli, cli.grid->append_line(TerminalText::strip_ansi(arg)));
}

static void do_rows(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    std::cout << theme::kv("rows", std::to_string(cli.grid->rows()));
}

static void do_grid(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;

    auto lines = cli.grid->snapshot();
    std::cout << "\n";
    for (size_t row = 0; row < lines.size(); ++row) {
        std::cout << theme::dim(fmt::format("  {:>3} ", row)) << lines[row] << "\n";
    }
    std::cout << "\n";
}

static void do_clear(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    cli.grid->clear();
    int rows = cli.grid->rows();
    notify_redraw(cli, {0, rows - 1});
}

static void do_state(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;
    std::cout << ReportView::state_panel(cli.monitor->state()) << "\n";
}

static void do_feed(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_session()) return;

    size_t limit = 20;
    if (!arg.empty()) {
        auto n = parse_int(arg);
        if (!n || *n < 1) {
            std::cout << theme::fail("Usage: feed [count]");
            return;
        }
        limit = static_cast<size_t>(*n);
    }

    auto feed = cli.monitor->activity_feed();
    if (feed.empty()) {
        std::cout << theme::dim("  No activity yet.") << "\n";
        return;
    }

    size_t start = feed.size() > limit ? feed.size() - limit : 0;
    std::cout << "\n";
    for (size_t i = start; i < feed.size(); ++i) {
        std::cout << ReportView::activity_line(feed[i]);
    }
    std::cout << "\n";
}

static void do_help(BaseCLI& cli, const std::string& arg) {
    cli.print_help();
}

static void do_quit(BaseCLI& cli, const std::string& arg) {
    cli.quit_requested = true;
}

void register_session_commands(BaseCLI& cli) {
    cli.add_command("print", do_print, "Write a line to the simulated terminal");
    cli.add_command("rows", do_rows, "Show the terminal height");
    cli.add_command("grid", do_grid, "Show the terminal contents");
    cli.add_command("clear", do_clear, "Blank the terminal");
    cli.add_command("state", do_state, "Show waiting / prompt / mode / model");
    cli.add_command("feed", do_feed, "Show recent activity events [count]");
    cli.add_command("help", do_help, "Show commands");
    cli.add_command("quit", do_quit, "Leave the session");
    cli.add_command("exit", do_quit, "Leave the session");
}
