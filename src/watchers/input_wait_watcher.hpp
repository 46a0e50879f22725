#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <core/constants.hpp>
#include <terminal/terminal_grid.hpp>
#include "delivery_gate.hpp"

class UiQueue;

// Detects when the agent is blocked on an interactive prompt (y/n
// confirmation, "press enter", an inquirer-style "? " question) with no
// spinner running. Rescans the bottom rows whenever the terminal reports a
// redraw that reaches them; notifies only when the answer flips.
class InputWaitWatcher {
public:
    using Callback = std::function<void(bool waiting)>;

    InputWaitWatcher(UiQueue& ui, Callback on_change, int scan_rows = INPUT_WAIT_SCAN_ROWS);
    ~InputWaitWatcher();

    InputWaitWatcher(const InputWaitWatcher&) = delete;
    InputWaitWatcher& operator=(const InputWaitWatcher&) = delete;

    void attach(std::weak_ptr<TerminalGrid> grid);
    void detach();

    // Terminal notification: rows start_row..end_row were redrawn.
    void range_changed(int start_row, int end_row);

    bool waiting() const;

    static bool is_prompt_line(const std::string& line);

private:
    UiQueue& ui_;
    Callback on_change_;
    int scan_rows_;
    GridHandle grid_;
    DeliveryGate gate_;

    mutable std::mutex state_mutex_;
    bool waiting_ = false;
};
