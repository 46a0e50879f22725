#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include <core/config.hpp>
#include <terminal/terminal_grid.hpp>
#include <watchers/activity_event_watcher.hpp>
#include <watchers/input_wait_watcher.hpp>
#include <watchers/mode_model_watcher.hpp>
#include <watchers/prompt_visibility_watcher.hpp>
#include <watchers/watcher_state.hpp>

class UiQueue;

// Runs the four terminal watchers against one grid and folds their
// notifications into a WatcherState plus a bounded activity feed.
//
// All notifications arrive on the UiQueue; state() and activity_feed() may
// be read from any thread.
class SessionMonitor {
public:
    using StateCallback = std::function<void(const WatcherState& state)>;
    using ActivityCallback = std::function<void(const ActivityEvent& event)>;

    SessionMonitor(const Config& config, UiQueue& ui);
    ~SessionMonitor();

    SessionMonitor(const SessionMonitor&) = delete;
    SessionMonitor& operator=(const SessionMonitor&) = delete;

    // Set before attach(). Called on the UI queue after each change.
    void set_state_callback(StateCallback cb) { on_state_ = std::move(cb); }
    void set_activity_callback(ActivityCallback cb) { on_activity_ = std::move(cb); }

    void attach(std::weak_ptr<TerminalGrid> grid);
    void detach();

    // Start / stop the periodic watchers (prompt visibility, activity feed).
    bool start();
    void stop();

    // Terminal redraw notification, forwarded to the range-driven watchers.
    void range_changed(int start_row, int end_row);

    // One poll of the periodic watchers on the calling thread.
    void poll_now();

    WatcherState state() const;
    std::vector<ActivityEvent> activity_feed() const;
    void clear_feed();

private:
    void update_state(const std::function<void(WatcherState&)>& change);
    void append_events(const std::vector<ActivityEvent>& events);

    StateCallback on_state_;
    ActivityCallback on_activity_;

    mutable std::mutex mutex_;
    WatcherState state_;
    std::deque<ActivityEvent> feed_;

    InputWaitWatcher input_wait_;
    ModeModelWatcher mode_model_;
    PromptVisibilityWatcher prompt_;
    ActivityEventWatcher activity_;
};
