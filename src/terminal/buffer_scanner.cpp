#include "buffer_scanner.hpp"

std::vector<ChangedRow> scan_changed_rows(const TerminalGrid& grid,
                                          std::map<int, std::string>& previous) {
    std::vector<ChangedRow> changed;
    const int rows = grid.rows();

    for (int row = 0; row < rows; ++row) {
        auto text = grid.line_at(row);
        if (!text) continue;

        auto it = previous.find(row);
        const bool same = (it == previous.end()) ? text->empty() : (it->second == *text);
        if (same) continue;

        previous[row] = *text;
        changed.push_back({row, std::move(*text)});
    }

    // Viewport shrank: forget rows that no longer exist
    previous.erase(previous.lower_bound(rows > 0 ? rows : 0), previous.end());
    return changed;
}
