#include "session_monitor.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>

// ── Construction / Destruction ──────────────────────────────

SessionMonitor::SessionMonitor(const Config& config, UiQueue& ui)
    : input_wait_(ui,
                  [this](bool waiting) {
                      update_state([waiting](WatcherState& s) { s.waiting_for_input = waiting; });
                  },
                  config.watchers().input_wait_rows),
      mode_model_(ui,
                  [this](AgentMode mode) {
                      update_state([mode](WatcherState& s) { s.mode = mode; });
                  },
                  [this](const std::string& model) {
                      update_state([model](WatcherState& s) { s.model = model; });
                  },
                  config.watchers().mode_model_rows),
      prompt_(ui,
              [this](bool visible) {
                  update_state([visible](WatcherState& s) { s.prompt_visible = visible; });
              },
              config.watchers().prompt_rows,
              std::chrono::milliseconds(config.watchers().poll_interval_ms)),
      activity_(ui,
                [this](const std::vector<ActivityEvent>& events) { append_events(events); },
                config.activity().max_status_length,
                std::chrono::milliseconds(config.watchers().poll_interval_ms)) {}

SessionMonitor::~SessionMonitor() {
    detach();
}

// ── Lifecycle ───────────────────────────────────────────────

void SessionMonitor::attach(std::weak_ptr<TerminalGrid> grid) {
    input_wait_.attach(grid);
    mode_model_.attach(grid);
    prompt_.attach(grid);
    activity_.attach(grid);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = WatcherState{};
        feed_.clear();
    }
    ts_log("session_monitor: attached");
}

void SessionMonitor::detach() {
    activity_.detach();
    prompt_.detach();
    mode_model_.detach();
    input_wait_.detach();
    ts_log("session_monitor: detached");
}

bool SessionMonitor::start() {
    bool prompt_started = prompt_.start();
    bool activity_started = activity_.start();
    return prompt_started && activity_started;
}

void SessionMonitor::stop() {
    activity_.stop();
    prompt_.stop();
}

void SessionMonitor::range_changed(int start_row, int end_row) {
    input_wait_.range_changed(start_row, end_row);
    mode_model_.range_changed(start_row, end_row);
}

void SessionMonitor::poll_now() {
    prompt_.poll_once();
    activity_.poll_once();
}

// ── State ───────────────────────────────────────────────────

WatcherState SessionMonitor::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::vector<ActivityEvent> SessionMonitor::activity_feed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<ActivityEvent>(feed_.begin(), feed_.end());
}

void SessionMonitor::clear_feed() {
    std::lock_guard<std::mutex> lock(mutex_);
    feed_.clear();
}

void SessionMonitor::update_state(const std::function<void(WatcherState&)>& change) {
    WatcherState snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        change(state_);
        snapshot = state_;
    }
    if (on_state_) on_state_(snapshot);
}

void SessionMonitor::append_events(const std::vector<ActivityEvent>& events) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& e : events) {
            feed_.push_back(e);
        }
        while (feed_.size() > ACTIVITY_FEED_LIMIT) {
            feed_.pop_front();
        }
    }
    if (on_activity_) {
        for (const auto& e : events) on_activity_(e);
    }
}
