#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Read side of a terminal emulator's character grid.
//
// The grid has a single writer (the emulator) and any number of concurrent
// readers. Row text may change between two reads, so readers take each row
// once per scan and work on that copy.
class TerminalGrid {
public:
    virtual ~TerminalGrid() = default;

    virtual int rows() const = 0;

    // Rendered, printable text of `row` with trailing blanks removed.
    // nullopt when the row is out of range or momentarily unavailable.
    virtual std::optional<std::string> line_at(int row) const = 0;
};

// Thread-safe slot holding a non-owning reference to the attached grid.
// lock() yields nullptr once the grid is gone or detached.
class GridHandle {
public:
    void attach(std::weak_ptr<TerminalGrid> grid) {
        std::lock_guard<std::mutex> lock(mutex_);
        grid_ = std::move(grid);
    }

    void detach() {
        std::lock_guard<std::mutex> lock(mutex_);
        grid_.reset();
    }

    std::shared_ptr<TerminalGrid> lock() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return grid_.lock();
    }

private:
    mutable std::mutex mutex_;
    std::weak_ptr<TerminalGrid> grid_;
};

// First row of the bottom `window` rows of a grid with `rows` rows.
inline int bottom_window_start(int rows, int window) {
    int start = rows - window;
    return start > 0 ? start : 0;
}
