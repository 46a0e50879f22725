#include <gtest/gtest.h>
#include <runs/run_report.hpp>
#include <runs/test_results_store.hpp>

// ── BuildReport ─────────────────────────────────────────────

TEST(BuildReport, SuccessHasNoDiagnostics) {
    auto r = BuildReport::from_outcome(
        ProcessOutcome::completed(0, "a.c:1:1: warning: harmless\nBuild complete!\n"));

    EXPECT_EQ(r.status, RunStatus::Passed);
    EXPECT_TRUE(r.diagnostics.empty());
    EXPECT_EQ(r.output, "a.c:1:1: warning: harmless\nBuild complete!");
}

TEST(BuildReport, FailureParsesDiagnostics) {
    auto r = BuildReport::from_outcome(
        ProcessOutcome::completed(1, "src/x.swift:3:7: error: cannot find 'y' in scope\n"));

    EXPECT_EQ(r.status, RunStatus::Failed);
    ASSERT_EQ(r.diagnostics.size(), 1u);
    EXPECT_EQ(r.diagnostics[0].file_path, "src/x.swift");
    EXPECT_EQ(r.diagnostics[0].line, 3);
}

TEST(BuildReport, LaunchFailureCarriesErrorText) {
    auto r = BuildReport::from_outcome(ProcessOutcome::failed_to_launch("swift: not found"));

    EXPECT_EQ(r.status, RunStatus::Failed);
    EXPECT_EQ(r.output, "swift: not found");
    EXPECT_TRUE(r.diagnostics.empty());
}

TEST(BuildReport, Running) {
    EXPECT_EQ(BuildReport::running().status, RunStatus::Running);
    EXPECT_STREQ(to_string(RunStatus::Running), "running");
}

// ── TestReport ──────────────────────────────────────────────

TEST(TestReport, PassedCarriesTotal) {
    auto r = TestReport::from_outcome(ProcessOutcome::completed(
        0, "--- PASS: TestA (0.01s)\n--- PASS: TestB (0.01s)\nok  pkg 0.02s\n"));

    EXPECT_EQ(r.status, RunStatus::Passed);
    EXPECT_EQ(r.total_passed, 2);
    EXPECT_TRUE(r.failed_names.empty());
}

TEST(TestReport, FailedCarriesNamesAndOutput) {
    std::string output = "--- PASS: TestA (0.01s)\n--- FAIL: TestB (0.02s)\nFAIL\n";
    auto r = TestReport::from_outcome(ProcessOutcome::completed(1, output));

    EXPECT_EQ(r.status, RunStatus::Failed);
    EXPECT_EQ(r.failed_names, (std::vector<std::string>{"TestB"}));
    EXPECT_EQ(r.output, "--- PASS: TestA (0.01s)\n--- FAIL: TestB (0.02s)\nFAIL");
    EXPECT_EQ(r.result.cases.size(), 2u);
}

TEST(TestReport, LaunchFailureHasNoNames) {
    auto r = TestReport::from_outcome(ProcessOutcome::failed_to_launch("cargo: permission denied"));

    EXPECT_EQ(r.status, RunStatus::Failed);
    EXPECT_TRUE(r.failed_names.empty());
    EXPECT_EQ(r.output, "cargo: permission denied");
}

// ── TestResultsStore ────────────────────────────────────────

TEST(TestResultsStore, RecordReplacesWholesale) {
    TestResultsStore store;
    EXPECT_FALSE(store.latest().has_value());

    auto first = TestReport::from_outcome(ProcessOutcome::completed(
        1, "--- PASS: TestA (0.01s)\n--- FAIL: TestB (0.02s)\n"));
    store.record(make_record(first));

    auto latest = store.latest();
    ASSERT_TRUE(latest.has_value());
    EXPECT_FALSE(latest->succeeded);
    EXPECT_EQ(latest->passed_count(), 1);
    EXPECT_EQ(latest->failed_count(), 1);

    auto second = TestReport::from_outcome(ProcessOutcome::completed(0, "--- PASS: TestC (0.01s)\n"));
    store.record(make_record(second));

    latest = store.latest();
    ASSERT_TRUE(latest.has_value());
    EXPECT_TRUE(latest->succeeded);
    ASSERT_EQ(latest->cases.size(), 1u);
    EXPECT_EQ(latest->cases[0].name, "TestC");

    store.clear();
    EXPECT_FALSE(store.latest().has_value());
}
