#include "run_report.hpp"
#include <core/log.hpp>
#include <parsers/build_diagnostic_parser.hpp>
#include <parsers/test_result_parser.hpp>
#include <util/string_utils.hpp>

const char* to_string(RunStatus status) {
    switch (status) {
        case RunStatus::Idle:    return "idle";
        case RunStatus::Running: return "running";
        case RunStatus::Passed:  return "passed";
        case RunStatus::Failed:  return "failed";
    }
    return "idle";
}

// ── Build ───────────────────────────────────────────────────

BuildReport BuildReport::running() {
    BuildReport r;
    r.status = RunStatus::Running;
    return r;
}

BuildReport BuildReport::from_outcome(const ProcessOutcome& outcome) {
    BuildReport r;
    if (!outcome.launched()) {
        ts_logf("build: failed to launch: {}", outcome.launch_error);
        r.status = RunStatus::Failed;
        r.output = outcome.launch_error;
        return r;
    }

    r.output = StringUtils::trim(outcome.output);
    if (outcome.succeeded()) {
        r.status = RunStatus::Passed;
    } else {
        r.status = RunStatus::Failed;
        r.diagnostics = BuildDiagnosticParser::parse(r.output);
    }
    ts_logf("build: exit {} -> {}", outcome.exit_code, to_string(r.status));
    return r;
}

// ── Test ────────────────────────────────────────────────────

TestReport TestReport::running() {
    TestReport r;
    r.status = RunStatus::Running;
    return r;
}

TestReport TestReport::from_outcome(const ProcessOutcome& outcome) {
    TestReport r;
    if (!outcome.launched()) {
        ts_logf("test: failed to launch: {}", outcome.launch_error);
        r.status = RunStatus::Failed;
        r.output = outcome.launch_error;
        return r;
    }

    r.output = StringUtils::trim(outcome.output);
    r.result = TestResultParser::parse(r.output);
    if (outcome.succeeded()) {
        r.status = RunStatus::Passed;
        r.total_passed = r.result.total_passed;
    } else {
        r.status = RunStatus::Failed;
        r.failed_names = r.result.failed_names;
    }
    ts_logf("test: exit {} -> {}", outcome.exit_code, to_string(r.status));
    return r;
}
