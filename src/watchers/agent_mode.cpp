#include "agent_mode.hpp"
#include <util/string_utils.hpp>
#include <fmt/format.h>

AgentMode next(AgentMode mode) {
    switch (mode) {
        case AgentMode::Interactive: return AgentMode::Plan;
        case AgentMode::Plan:        return AgentMode::Autopilot;
        case AgentMode::Autopilot:   return AgentMode::Interactive;
    }
    return AgentMode::Interactive;
}

const char* to_string(AgentMode mode) {
    switch (mode) {
        case AgentMode::Interactive: return "interactive";
        case AgentMode::Plan:        return "plan";
        case AgentMode::Autopilot:   return "autopilot";
    }
    return "interactive";
}

const char* display_name(AgentMode mode) {
    switch (mode) {
        case AgentMode::Interactive: return "Interactive";
        case AgentMode::Plan:        return "Plan";
        case AgentMode::Autopilot:   return "Autopilot";
    }
    return "Interactive";
}

std::string activate_command(AgentMode mode) {
    return fmt::format("/agent {}\n", to_string(mode));
}

std::optional<AgentMode> mode_from_string(const std::string& name) {
    std::string lower = StringUtils::to_lower(StringUtils::trim(name));
    if (lower == "interactive" || lower == "ask") return AgentMode::Interactive;
    if (lower == "plan") return AgentMode::Plan;
    if (lower == "autopilot" || lower == "agent") return AgentMode::Autopilot;
    return std::nullopt;
}
