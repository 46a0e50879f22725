#pragma once

#include <optional>
#include <string>
#include <vector>
#include <runs/command_detector.hpp>
#include <runs/run_report.hpp>
#include <runs/test_results_store.hpp>
#include <watchers/activity_event.hpp>
#include <watchers/watcher_state.hpp>

// Terminal rendering of reports and watcher notifications.
namespace ReportView {

std::string build_report(const BuildReport& report);
std::string test_report(const TestReport& report);
std::string test_record(const TestRunRecord& record);

std::string state_panel(const WatcherState& state);

// One line per field that differs between `before` and `after`.
std::string state_change(const WatcherState& before, const WatcherState& after);

std::string activity_line(const ActivityEvent& event);

std::string command_line(const std::string& label,
                         const std::optional<CommandDetector::Command>& command);

} // namespace ReportView
