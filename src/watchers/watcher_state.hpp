#pragma once

#include <optional>
#include <string>
#include "agent_mode.hpp"

// Live session state derived from the terminal grid. Never persisted.
struct WatcherState {
    bool waiting_for_input = false;
    std::optional<AgentMode> mode;
    std::optional<std::string> model;
    bool prompt_visible = false;
};
