#include "text_grid.hpp"
#include <algorithm>

// Grid rows never carry trailing blanks, same as a rendered terminal line.
static std::string trim_right(const std::string& text) {
    auto end = text.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? std::string() : text.substr(0, end + 1);
}

TextGrid::TextGrid(int height) : height_(std::max(height, 0)) {
    lines_.resize(static_cast<size_t>(height_));
}

int TextGrid::rows() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(lines_.size());
}

std::optional<std::string> TextGrid::line_at(int row) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (row < 0 || row >= static_cast<int>(lines_.size())) return std::nullopt;
    return lines_[static_cast<size_t>(row)];
}

RowRange TextGrid::set_line(int row, const std::string& text) {
    if (row < 0) return {};
    std::lock_guard<std::mutex> lock(mutex_);

    if (height_ > 0 && row >= height_) {
        int shift = row - height_ + 1;
        if (shift >= height_) {
            std::fill(lines_.begin(), lines_.end(), std::string());
        } else {
            lines_.erase(lines_.begin(), lines_.begin() + shift);
            lines_.resize(static_cast<size_t>(height_));
        }
        lines_.back() = trim_right(text);
        used_ = height_;
        return {0, height_ - 1};
    }

    if (row >= static_cast<int>(lines_.size())) {
        lines_.resize(static_cast<size_t>(row) + 1);
    }
    lines_[static_cast<size_t>(row)] = trim_right(text);
    used_ = std::max(used_, row + 1);
    return {row, row};
}

RowRange TextGrid::append_line(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (height_ > 0 && used_ >= height_) {
        return scroll_in_locked(text);
    }

    if (used_ >= static_cast<int>(lines_.size())) {
        lines_.emplace_back();
    }
    int row = used_++;
    lines_[static_cast<size_t>(row)] = trim_right(text);
    return {row, row};
}

RowRange TextGrid::scroll_in_locked(const std::string& text) {
    lines_.erase(lines_.begin());
    lines_.push_back(trim_right(text));
    return {0, height_ - 1};
}

void TextGrid::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.assign(static_cast<size_t>(height_), std::string());
    used_ = 0;
}

std::vector<std::string> TextGrid::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}
