#pragma once

#include <mutex>
#include <string>
#include <vector>
#include "terminal_grid.hpp"

// Rows touched by a write, inclusive on both ends.
struct RowRange {
    int start = 0;
    int end = -1;

    bool empty() const { return end < start; }
};

// In-memory TerminalGrid. With a fixed height, appending past the last row
// scrolls the grid up by one like a terminal viewport; with height 0 the
// grid grows without bound.
class TextGrid : public TerminalGrid {
public:
    explicit TextGrid(int height = 0);

    int rows() const override;
    std::optional<std::string> line_at(int row) const override;

    // Replace one row. Rows past the end are created as needed (and the
    // grid scrolls if that exceeds a fixed height).
    RowRange set_line(int row, const std::string& text);

    // Write `text` to the first unused row, scrolling when full.
    RowRange append_line(const std::string& text);

    void clear();
    std::vector<std::string> snapshot() const;

private:
    RowRange scroll_in_locked(const std::string& text);

    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
    int height_;
    int used_ = 0;
};
