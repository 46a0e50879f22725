#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <core/config.hpp>
#include <managers/session_monitor.hpp>
#include <runs/test_results_store.hpp>
#include <terminal/text_grid.hpp>
#include <watchers/ui_queue.hpp>

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    bool require_session();

    // Fresh grid + monitor wired to print every notification.
    void open_session(int rows);
    void close_session();

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Run queued watcher notifications on this thread (the UI context).
    size_t flush_notifications();

    // Public state
    Config config;
    UiQueue ui;
    std::shared_ptr<TextGrid> grid;
    std::unique_ptr<SessionMonitor> monitor;
    TestResultsStore results;
    bool quit_requested = false;

    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
