#include <gtest/gtest.h>
#include <terminal/buffer_scanner.hpp>
#include <terminal/text_grid.hpp>
#include <map>
#include <vector>

// Grid with a settable row count that counts reads and can fail rows.
class CountingGrid : public TerminalGrid {
public:
    std::vector<std::string> lines;
    std::vector<int> unavailable;
    mutable std::map<int, int> reads;

    int rows() const override { return static_cast<int>(lines.size()); }

    std::optional<std::string> line_at(int row) const override {
        reads[row]++;
        for (int r : unavailable) {
            if (r == row) return std::nullopt;
        }
        if (row < 0 || row >= rows()) return std::nullopt;
        return lines[static_cast<size_t>(row)];
    }
};

TEST(BufferScanner, FirstScanReportsNonEmptyRows) {
    CountingGrid grid;
    grid.lines = {"one", "", "three"};
    std::map<int, std::string> previous;

    auto changed = scan_changed_rows(grid, previous);

    ASSERT_EQ(changed.size(), 2u);
    EXPECT_EQ(changed[0].row, 0);
    EXPECT_EQ(changed[0].text, "one");
    EXPECT_EQ(changed[1].row, 2);
    EXPECT_EQ(changed[1].text, "three");
}

TEST(BufferScanner, UnchangedRowsNotReported) {
    CountingGrid grid;
    grid.lines = {"a", "b"};
    std::map<int, std::string> previous;

    scan_changed_rows(grid, previous);
    EXPECT_TRUE(scan_changed_rows(grid, previous).empty());

    grid.lines[1] = "b2";
    auto changed = scan_changed_rows(grid, previous);
    ASSERT_EQ(changed.size(), 1u);
    EXPECT_EQ(changed[0].row, 1);
    EXPECT_EQ(changed[0].text, "b2");
}

TEST(BufferScanner, ClearedRowIsAChange) {
    CountingGrid grid;
    grid.lines = {"text"};
    std::map<int, std::string> previous;

    scan_changed_rows(grid, previous);
    grid.lines[0] = "";
    auto changed = scan_changed_rows(grid, previous);

    ASSERT_EQ(changed.size(), 1u);
    EXPECT_EQ(changed[0].text, "");
}

TEST(BufferScanner, EachRowReadOnce) {
    CountingGrid grid;
    grid.lines = {"a", "b", "c", "d"};
    std::map<int, std::string> previous;

    scan_changed_rows(grid, previous);

    ASSERT_EQ(grid.reads.size(), 4u);
    for (const auto& [row, count] : grid.reads) {
        EXPECT_EQ(count, 1) << "row " << row;
    }
}

TEST(BufferScanner, ShrinkPrunesCache) {
    CountingGrid grid;
    grid.lines = {"a", "b", "c"};
    std::map<int, std::string> previous;

    scan_changed_rows(grid, previous);
    EXPECT_EQ(previous.size(), 3u);

    grid.lines.resize(1);
    scan_changed_rows(grid, previous);
    EXPECT_EQ(previous.size(), 1u);
    EXPECT_EQ(previous.count(0), 1u);

    // Regrown rows compare against "" again
    grid.lines = {"a", "b", "c"};
    auto changed = scan_changed_rows(grid, previous);
    EXPECT_EQ(changed.size(), 2u);
}

TEST(BufferScanner, UnavailableRowKeepsCachedText) {
    CountingGrid grid;
    grid.lines = {"a", "b"};
    std::map<int, std::string> previous;
    scan_changed_rows(grid, previous);

    grid.unavailable = {1};
    grid.lines[1] = "changed";
    EXPECT_TRUE(scan_changed_rows(grid, previous).empty());
    EXPECT_EQ(previous[1], "b");

    grid.unavailable.clear();
    EXPECT_EQ(scan_changed_rows(grid, previous).size(), 1u);
}

TEST(BufferScanner, ScannerOwnsCache) {
    TextGrid grid;
    grid.append_line("first");
    BufferScanner scanner;

    EXPECT_EQ(scanner.scan(grid).size(), 1u);
    EXPECT_EQ(scanner.cached_rows(), 1u);
    EXPECT_TRUE(scanner.scan(grid).empty());

    scanner.reset();
    EXPECT_EQ(scanner.cached_rows(), 0u);
    EXPECT_EQ(scanner.scan(grid).size(), 1u);
}

// ── TextGrid ────────────────────────────────────────────────

TEST(TextGrid, FixedHeightStartsBlank) {
    TextGrid grid(4);
    EXPECT_EQ(grid.rows(), 4);
    EXPECT_EQ(grid.line_at(3), std::optional<std::string>(""));
    EXPECT_FALSE(grid.line_at(4).has_value());
    EXPECT_FALSE(grid.line_at(-1).has_value());
}

TEST(TextGrid, AppendScrollsWhenFull) {
    TextGrid grid(2);
    auto r0 = grid.append_line("one");
    auto r1 = grid.append_line("two");
    EXPECT_EQ(r0.start, 0);
    EXPECT_EQ(r1.start, 1);

    auto r2 = grid.append_line("three");
    EXPECT_EQ(r2.start, 0);
    EXPECT_EQ(r2.end, 1);
    EXPECT_EQ(grid.snapshot(), (std::vector<std::string>{"two", "three"}));
}

TEST(TextGrid, UnboundedGrows) {
    TextGrid grid;
    EXPECT_EQ(grid.rows(), 0);
    grid.append_line("a");
    grid.append_line("b");
    EXPECT_EQ(grid.rows(), 2);
}

TEST(TextGrid, TrailingBlanksTrimmed) {
    TextGrid grid;
    grid.append_line("> \t ");
    EXPECT_EQ(grid.line_at(0), std::optional<std::string>(">"));
}

TEST(TextGrid, SetLinePastFixedHeightScrolls) {
    TextGrid grid(3);
    grid.set_line(0, "a");
    grid.set_line(1, "b");
    grid.set_line(2, "c");
    auto range = grid.set_line(3, "d");

    EXPECT_EQ(range.start, 0);
    EXPECT_EQ(range.end, 2);
    EXPECT_EQ(grid.snapshot(), (std::vector<std::string>{"b", "c", "d"}));
}

TEST(TextGrid, ClearResets) {
    TextGrid grid(2);
    grid.append_line("x");
    grid.clear();
    EXPECT_EQ(grid.rows(), 2);
    EXPECT_EQ(grid.line_at(0), std::optional<std::string>(""));

    auto r = grid.append_line("y");
    EXPECT_EQ(r.start, 0);
}
