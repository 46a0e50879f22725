#include "prompt_visibility_watcher.hpp"
#include "ui_queue.hpp"
#include <core/log.hpp>
#include <util/string_utils.hpp>

PromptVisibilityWatcher::PromptVisibilityWatcher(UiQueue& ui, Callback on_change,
                                                 int scan_rows,
                                                 std::chrono::milliseconds interval)
    : ui_(ui), on_change_(std::move(on_change)),
      scan_rows_(scan_rows > 0 ? scan_rows : 1), interval_(interval) {}

PromptVisibilityWatcher::~PromptVisibilityWatcher() {
    detach();
}

// ── Lifecycle ───────────────────────────────────────────────

void PromptVisibilityWatcher::attach(std::weak_ptr<TerminalGrid> grid) {
    detach();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        visible_ = false;
    }
    grid_.attach(std::move(grid));
}

void PromptVisibilityWatcher::detach() {
    stop();
    grid_.detach();
}

bool PromptVisibilityWatcher::start() {
    if (!timer_.start(interval_, [this] { poll_once(); })) return false;
    ts_logf("prompt_visibility: polling every {}ms", interval_.count());
    return true;
}

void PromptVisibilityWatcher::stop() {
    gate_.invalidate();
    timer_.stop();
}

// ── Polling ─────────────────────────────────────────────────

void PromptVisibilityWatcher::poll_once() {
    const uint64_t gen = gate_.generation();
    auto grid = grid_.lock();
    if (!grid) return;

    std::lock_guard<std::mutex> lock(state_mutex_);
    const bool now_visible = scan(*grid, scan_rows_);
    if (now_visible == visible_) return;
    visible_ = now_visible;

    ts_logf("prompt_visibility: visible -> {}", now_visible);
    gate_.post(ui_, gen, [cb = on_change_, now_visible] {
        if (cb) cb(now_visible);
    });
}

bool PromptVisibilityWatcher::prompt_visible() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return visible_;
}

bool PromptVisibilityWatcher::scan(const TerminalGrid& grid, int scan_rows) {
    const int rows = grid.rows();
    for (int row = bottom_window_start(rows, scan_rows); row < rows; ++row) {
        auto text = grid.line_at(row);
        if (text && is_agent_prompt(*text)) return true;
    }
    return false;
}

bool PromptVisibilityWatcher::is_agent_prompt(const std::string& line) {
    std::string trimmed = StringUtils::trim(line);
    return trimmed == ">" || StringUtils::starts_with(trimmed, "> ");
}
