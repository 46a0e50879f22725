#pragma once

#include <map>
#include <string>
#include <vector>
#include "terminal_grid.hpp"

struct ChangedRow {
    int row;
    std::string text;       // the single read taken during this scan
};

// Compare every row of `grid` against `previous` (row → last seen text) and
// return the rows whose text differs, in ascending order. `previous` is
// updated in place; entries at or beyond the current row count are pruned.
// A row with no entry compares against the empty string. Rows the grid
// cannot produce are skipped and keep their cached text.
std::vector<ChangedRow> scan_changed_rows(const TerminalGrid& grid,
                                          std::map<int, std::string>& previous);

// Owns the per-row cache for one poller.
class BufferScanner {
public:
    std::vector<ChangedRow> scan(const TerminalGrid& grid) {
        return scan_changed_rows(grid, cache_);
    }

    void reset() { cache_.clear(); }
    size_t cached_rows() const { return cache_.size(); }

private:
    std::map<int, std::string> cache_;
};
