#pragma once

#include <core/constants.hpp>
#include <functional>
#include <regex>
#include <string>
#include <vector>

struct Pattern {
    std::regex regex;
    std::string raw;

    Pattern(const std::string& pattern, bool icase = false)
        : regex(pattern, icase ? std::regex::ECMAScript | std::regex::icase
                               : std::regex::ECMAScript),
          raw(pattern) {}

    // std::regex recurses per character, so overlong lines never match.
    bool search(const std::string& text, std::smatch& m) const {
        if (text.size() > MAX_PARSE_LINE) return false;
        return std::regex_search(text, m, regex);
    }
};

// One row of a declarative format table: a pattern and what to do with a hit.
// apply() returns false to decline the line (e.g. a malformed number), which
// lets the next rule in the table have a go.
template <typename State>
struct LineRule {
    Pattern pattern;
    std::function<bool(const std::smatch&, State&)> apply;
};

// Evaluate `rules` in order against `line`; the first rule that matches and
// accepts wins. Returns true if some rule consumed the line.
template <typename State>
bool apply_first_rule(const std::vector<LineRule<State>>& rules,
                      const std::string& line, State& state) {
    std::smatch m;
    for (const auto& rule : rules) {
        if (rule.pattern.search(line, m) && rule.apply(m, state)) {
            return true;
        }
    }
    return false;
}
