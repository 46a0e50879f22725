#include <iostream>
#include <vector>
#include <string>
#include "core/constants.hpp"
#include "cli/toolsight_cli.hpp"
#include "cli/theme.hpp"

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::usage_row("build", "<file|->", "Diagnostics from a build log (--exit-code N)");
    std::cout << theme::usage_row("test", "<file|->", "Results from a test log (--exit-code N)");
    std::cout << theme::usage_row("detect", "[dir]", "Show build/test commands for a project");
    std::cout << theme::usage_row("replay", "<file|->", "Feed a terminal transcript to the watchers (--rows N)");
    std::cout << theme::usage_row("session", "", "Interactive simulated terminal (--rows N)");
    std::cout << "\n";
    std::cout << theme::usage_row("--version", "", "Show version");
    std::cout << theme::usage_row("--help", "", "Show this help");
    std::cout << "\n";
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            print_usage();
            return 0;
        }

        std::string cmd = argv[1];
        std::vector<std::string> args(argv + 2, argv + argc);

        if (cmd == "--version") {
            std::cout << theme::label("toolsight")
                      << theme::dim(std::string(" version ") + TOOLSIGHT_VERSION) << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        }

        ToolsightCLI cli;
        if (cmd == "build") {
            return cli.run_build(args);
        } else if (cmd == "test") {
            return cli.run_test(args);
        } else if (cmd == "detect") {
            return cli.run_detect(args);
        } else if (cmd == "replay") {
            return cli.run_replay(args);
        } else if (cmd == "session") {
            return cli.run_session(args);
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 1;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
