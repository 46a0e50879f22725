#include "base_cli.hpp"
#include "report_view.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>
#include <vector>
#include <fmt/format.h>

BaseCLI::BaseCLI() {
    auto config_result = Config::load();
    if (config_result.is_ok()) {
        config = config_result.value;
    } else {
        std::cout << theme::fail(config_result.error);
        std::cout << theme::step("Using default settings.");
    }
    config.apply_logging();
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_session() {
    if (!grid || !monitor) {
        std::cout << theme::fail("No terminal session. Run 'toolsight session' first.");
        return false;
    }
    return true;
}

// ── Session ─────────────────────────────────────────────────

void BaseCLI::open_session(int rows) {
    close_session();

    grid = std::make_shared<TextGrid>(rows);
    monitor = std::make_unique<SessionMonitor>(config, ui);

    // Print only the field that changed
    auto last = std::make_shared<WatcherState>();
    monitor->set_state_callback([last](const WatcherState& s) {
        std::cout << ReportView::state_change(*last, s);
        *last = s;
    });
    monitor->set_activity_callback([](const ActivityEvent& e) {
        std::cout << ReportView::activity_line(e);
    });
    monitor->attach(grid);
    ts_logf("cli: session opened with {} rows", rows);
}

void BaseCLI::close_session() {
    if (monitor) {
        monitor->detach();
        monitor.reset();
    }
    grid.reset();
}

size_t BaseCLI::flush_notifications() {
    return ui.drain();
}

// ── Commands ────────────────────────────────────────────────

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Terminal",  {"print", "rows", "grid", "clear"}},
        {"Signals",   {"state", "feed"}},
        {"Runs",      {"build", "test", "results", "detect"}},
        {"General",   {"help", "quit", "exit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << theme::section(cat_name);
        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it == commands_.end()) continue;
            std::cout << theme::accent(fmt::format("    {:<12}", name))
                      << theme::dim(it->second.second) << "\n";
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline uses \001 and \002 to wrap non-printing chars so it can
    // compute the visible prompt width correctly for cursor positioning.
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    std::string prompt = rl_esc(theme::color::LABEL) + "toolsight" + rl_esc(theme::color::RESET);
    if (monitor) {
        WatcherState s = monitor->state();
        if (s.mode) {
            prompt += ":" + rl_esc(theme::color::ACCENT) + to_string(*s.mode) +
                      rl_esc(theme::color::RESET);
        }
        if (s.waiting_for_input) {
            prompt += rl_esc(theme::color::WARN) + " ?" + rl_esc(theme::color::RESET);
        }
    }
    return prompt + "> ";
}
