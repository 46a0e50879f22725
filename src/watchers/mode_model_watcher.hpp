#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <core/constants.hpp>
#include <terminal/terminal_grid.hpp>
#include "agent_mode.hpp"
#include "delivery_gate.hpp"

class UiQueue;

// Tracks the agent's mode and model from its prompt decoration and status
// lines near the bottom of the grid. Mode and model are independent: each is
// reported on its own callback, only when it changes. A scan that finds
// nothing leaves the stored value alone.
class ModeModelWatcher {
public:
    using ModeCallback = std::function<void(AgentMode mode)>;
    using ModelCallback = std::function<void(const std::string& model)>;

    ModeModelWatcher(UiQueue& ui, ModeCallback on_mode, ModelCallback on_model,
                     int scan_rows = MODE_MODEL_SCAN_ROWS);
    ~ModeModelWatcher();

    ModeModelWatcher(const ModeModelWatcher&) = delete;
    ModeModelWatcher& operator=(const ModeModelWatcher&) = delete;

    void attach(std::weak_ptr<TerminalGrid> grid);
    void detach();

    // Terminal notification: rows start_row..end_row were redrawn.
    void range_changed(int start_row, int end_row);

    std::optional<AgentMode> mode() const;
    std::optional<std::string> model() const;

    // "(plan)", "[autopilot]", "mode: ask", "Switched to agent mode", ...
    static std::optional<AgentMode> detect_mode(const std::string& line);

    // "model: gpt-4.1", "Using model: o3", ...
    static std::optional<std::string> detect_model(const std::string& line);

private:
    UiQueue& ui_;
    ModeCallback on_mode_;
    ModelCallback on_model_;
    int scan_rows_;
    GridHandle grid_;
    DeliveryGate gate_;

    mutable std::mutex state_mutex_;
    std::optional<AgentMode> mode_;
    std::optional<std::string> model_;
};
