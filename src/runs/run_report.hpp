#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <parsers/diagnostic.hpp>
#include <parsers/test_result.hpp>

enum class RunStatus {
    Idle,
    Running,
    Passed,
    Failed,
};

const char* to_string(RunStatus status);

// Outcome of a build, ready for display.
struct BuildReport {
    RunStatus status = RunStatus::Idle;
    std::string output;                     // trimmed; launch error text if it never started
    std::vector<Diagnostic> diagnostics;    // only for failed builds

    static BuildReport running();

    // Exit 0 → Passed with no diagnostics. Anything else → Failed, with the
    // output parsed for diagnostics. A launch failure → Failed carrying the
    // error text and no diagnostics.
    static BuildReport from_outcome(const ProcessOutcome& outcome);
};

// Outcome of a test run, ready for display.
struct TestReport {
    RunStatus status = RunStatus::Idle;
    int total_passed = 0;                   // Passed only
    std::vector<std::string> failed_names;  // Failed only
    std::string output;
    TestRunResult result;

    static TestReport running();

    // Exit 0 → Passed(total). Otherwise Failed(failed names, output). A launch
    // failure → Failed with the error text and no names.
    static TestReport from_outcome(const ProcessOutcome& outcome);
};
