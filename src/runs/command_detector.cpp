#include "command_detector.hpp"

namespace fs = std::filesystem;

namespace CommandDetector {

namespace {

struct MarkerRule {
    std::vector<const char*> markers;   // any one present selects the rule
    Command command;
};

const std::vector<MarkerRule>& build_rules() {
    static const std::vector<MarkerRule> rules = {
        {{"Package.swift"},                         {"swift", "build"}},
        {{"package.json"},                          {"npm", "run", "build"}},
        {{"Cargo.toml"},                            {"cargo", "build"}},
        {{"Makefile", "makefile", "GNUmakefile"},   {"make"}},
    };
    return rules;
}

const std::vector<MarkerRule>& test_rules() {
    static const std::vector<MarkerRule> rules = {
        {{"Package.swift"},                             {"swift", "test"}},
        {{"package.json"},                              {"npm", "test", "--", "--passWithNoTests"}},
        {{"Cargo.toml"},                                {"cargo", "test"}},
        {{"go.mod"},                                    {"go", "test", "./..."}},
        {{"pytest.ini", "pyproject.toml", "setup.py"},  {"python", "-m", "pytest", "--tb=short", "-q"}},
        {{"Makefile", "makefile", "GNUmakefile"},       {"make", "test"}},
    };
    return rules;
}

std::optional<Command> detect(const fs::path& root, const std::vector<MarkerRule>& rules) {
    std::error_code ec;
    for (const auto& rule : rules) {
        for (const char* marker : rule.markers) {
            if (fs::exists(root / marker, ec)) return rule.command;
        }
    }
    return std::nullopt;
}

} // namespace

std::optional<Command> build_command(const fs::path& root) {
    return detect(root, build_rules());
}

std::optional<Command> test_command(const fs::path& root) {
    return detect(root, test_rules());
}

std::string to_display(const Command& command) {
    std::string out;
    for (const auto& arg : command) {
        if (!out.empty()) out += " ";
        out += arg;
    }
    return out;
}

} // namespace CommandDetector
