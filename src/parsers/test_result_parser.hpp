#pragma once

#include <string>
#include "test_result.hpp"

// Test runner output → pass count, failed names and per-case results.
//
// Six format strategies are tried in a fixed order over the whole text; the
// first one that finds a concrete count wins:
//   1. XCTest          "Executed N tests, with F failures" + "Test Case '…' passed (T seconds)"
//   2. swift-testing   "✔ Test x() passed after T seconds" / "✘ Test x() failed …"
//   3. cargo test      "test a::b ... ok|FAILED" + "test result: … N passed; F failed"
//   4. pytest          "=== 2 failed, 3 passed in 0.06s ===" + "FAILED node - message"
//   5. go test         "--- PASS|FAIL: TestX (0.01s)" + indented log lines
//   6. jest / mocha    "Tests: 1 failed, 4 passed" / "5 passing" + "✓"/"✕" case lines
// If none match, any line carrying FAIL, FAILED, ✗ or × followed by text
// contributes a bare failed name.
//
// parse() is pure: same input, same result; it never throws.
namespace TestResultParser {

TestRunResult parse(const std::string& output);

} // namespace TestResultParser
