#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// Picks the build / test command for a project from the marker files in its
// root. Only looks at the filesystem; nothing is executed. Commands are
// argument lists meant to be run through /usr/bin/env.
namespace CommandDetector {

using Command = std::vector<std::string>;

// Package.swift, package.json, Cargo.toml, Makefile (in that order).
std::optional<Command> build_command(const std::filesystem::path& root);

// Package.swift, package.json, Cargo.toml, go.mod, pytest.ini /
// pyproject.toml / setup.py, Makefile (in that order).
std::optional<Command> test_command(const std::filesystem::path& root);

// "cargo test" style rendering for display.
std::string to_display(const Command& command);

} // namespace CommandDetector
