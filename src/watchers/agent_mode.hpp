#pragma once

#include <optional>
#include <string>

// Operating mode of the interactive coding agent in the terminal.
enum class AgentMode {
    Interactive,
    Plan,
    Autopilot,
};

// Cycling order: Interactive → Plan → Autopilot → Interactive.
AgentMode next(AgentMode mode);

const char* to_string(AgentMode mode);          // "interactive", "plan", "autopilot"
const char* display_name(AgentMode mode);       // "Interactive", "Plan", "Autopilot"

// Keystrokes that switch the agent into `mode`, e.g. "/agent plan\n".
std::string activate_command(AgentMode mode);

// Case-insensitive; accepts "ask" for Interactive and "agent" for Autopilot.
std::optional<AgentMode> mode_from_string(const std::string& name);
