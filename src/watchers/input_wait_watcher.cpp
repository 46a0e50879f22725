#include "input_wait_watcher.hpp"
#include "ui_queue.hpp"
#include <core/log.hpp>
#include <terminal/terminal_text.hpp>
#include <util/string_utils.hpp>

// Lowercase; matched at the end of the line, at its start, or after a space.
static const char* const CONFIRMATION_SUFFIXES[] = {
    "[y/n]", "(y/n)", "(yes/no)", "[yes/no]", "press enter", "press any key",
};

InputWaitWatcher::InputWaitWatcher(UiQueue& ui, Callback on_change, int scan_rows)
    : ui_(ui), on_change_(std::move(on_change)), scan_rows_(scan_rows > 0 ? scan_rows : 1) {}

InputWaitWatcher::~InputWaitWatcher() {
    detach();
}

void InputWaitWatcher::attach(std::weak_ptr<TerminalGrid> grid) {
    detach();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        waiting_ = false;
    }
    grid_.attach(std::move(grid));
    ts_logf("input_wait: attached, scanning bottom {} rows", scan_rows_);
}

void InputWaitWatcher::detach() {
    gate_.invalidate();
    grid_.detach();
}

bool InputWaitWatcher::waiting() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return waiting_;
}

void InputWaitWatcher::range_changed(int /*start_row*/, int end_row) {
    const uint64_t gen = gate_.generation();
    auto grid = grid_.lock();
    if (!grid) return;

    std::lock_guard<std::mutex> lock(state_mutex_);
    const int rows = grid->rows();
    if (rows <= 0) return;

    const int window_start = bottom_window_start(rows, scan_rows_);
    if (end_row < window_start) return;

    bool prompt_found = false;
    bool spinner_found = false;
    for (int row = window_start; row < rows; ++row) {
        auto text = grid->line_at(row);
        if (!text || text->empty()) continue;
        if (!prompt_found && is_prompt_line(*text)) prompt_found = true;
        if (!spinner_found && TerminalText::contains_spinner(*text)) spinner_found = true;
    }

    const bool now_waiting = prompt_found && !spinner_found;
    if (now_waiting == waiting_) return;
    waiting_ = now_waiting;

    ts_logf("input_wait: waiting -> {}", now_waiting);
    gate_.post(ui_, gen, [cb = on_change_, now_waiting] {
        if (cb) cb(now_waiting);
    });
}

bool InputWaitWatcher::is_prompt_line(const std::string& line) {
    std::string stripped = StringUtils::trim(line);
    if (stripped.empty()) return false;

    // inquirer.js / GitHub CLI questions
    if (StringUtils::starts_with(stripped, "? ")) return true;

    std::string lower = StringUtils::to_lower(stripped);
    for (const char* suffix : CONFIRMATION_SUFFIXES) {
        std::string s(suffix);
        if (StringUtils::ends_with(lower, s) ||
            StringUtils::starts_with(lower, s) ||
            StringUtils::contains(lower, " " + s)) {
            return true;
        }
    }
    return false;
}
