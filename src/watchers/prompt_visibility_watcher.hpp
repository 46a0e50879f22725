#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <core/constants.hpp>
#include <terminal/terminal_grid.hpp>
#include "delivery_gate.hpp"
#include "poll_timer.hpp"

class UiQueue;

// Polls the bottom rows for the agent's "> " input prompt, which means the
// agent has finished its turn. Notifies when visibility flips.
class PromptVisibilityWatcher {
public:
    using Callback = std::function<void(bool visible)>;

    PromptVisibilityWatcher(UiQueue& ui, Callback on_change,
                            int scan_rows = PROMPT_SCAN_ROWS,
                            std::chrono::milliseconds interval =
                                std::chrono::milliseconds(WATCHER_POLL_INTERVAL_MS));
    ~PromptVisibilityWatcher();

    PromptVisibilityWatcher(const PromptVisibilityWatcher&) = delete;
    PromptVisibilityWatcher& operator=(const PromptVisibilityWatcher&) = delete;

    void attach(std::weak_ptr<TerminalGrid> grid);
    void detach();

    bool start();
    void stop();

    // One poll on the calling thread.
    void poll_once();

    bool prompt_visible() const;

    // Trimmed line is exactly ">" or starts with "> ".
    static bool is_agent_prompt(const std::string& line);

    // True if any of the bottom `scan_rows` rows is an agent prompt.
    static bool scan(const TerminalGrid& grid, int scan_rows);

private:
    UiQueue& ui_;
    Callback on_change_;
    int scan_rows_;
    std::chrono::milliseconds interval_;
    GridHandle grid_;
    DeliveryGate gate_;
    PollTimer timer_;

    mutable std::mutex state_mutex_;
    bool visible_ = false;
};
