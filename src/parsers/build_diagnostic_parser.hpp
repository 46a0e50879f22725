#pragma once

#include <string>
#include <vector>
#include "diagnostic.hpp"

// Build output → structured diagnostics.
//
// Recognised forms, tried per line in this order:
//   path:line:col: severity: message        gcc, clang, swiftc, go vet, ...
//   path:line: severity: message            same, no column
//   path(line,col): severity CODE: message  tsc, msvc
//   severity[CODE]: message                 rustc header, held until...
//     --> path:line:col                     ...its location arrow
//
// A rustc header is dropped if any non-blank line other than a `-->` arrow or
// an `= note` continuation shows up before its arrow. Lines that match
// nothing are skipped; parse() never throws.
namespace BuildDiagnosticParser {

std::vector<Diagnostic> parse(const std::string& output);

} // namespace BuildDiagnosticParser
