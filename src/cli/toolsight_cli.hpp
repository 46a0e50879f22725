#pragma once

#include "base_cli.hpp"
#include <string>
#include <vector>

// Forward declarations for command registration
void register_session_commands(BaseCLI& cli);
void register_run_commands(BaseCLI& cli);

class ToolsightCLI : public BaseCLI {
public:
    ToolsightCLI();

    // One-shot commands; each returns the process exit code.
    int run_build(const std::vector<std::string>& args);
    int run_test(const std::vector<std::string>& args);
    int run_detect(const std::vector<std::string>& args);
    int run_replay(const std::vector<std::string>& args);

    // Interactive simulated terminal.
    int run_session(const std::vector<std::string>& args);

private:
    void register_all_commands();
};
