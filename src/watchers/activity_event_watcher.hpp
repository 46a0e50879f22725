#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/constants.hpp>
#include <terminal/buffer_scanner.hpp>
#include <terminal/terminal_grid.hpp>
#include "activity_event.hpp"
#include "delivery_gate.hpp"
#include "poll_timer.hpp"

class UiQueue;

// Turns newly drawn terminal rows into activity events: files the agent
// read, commands it ran, and short status lines. Polls the whole grid and
// only looks at rows whose text changed since the previous poll.
class ActivityEventWatcher {
public:
    // Events from one poll, in row order.
    using Callback = std::function<void(const std::vector<ActivityEvent>& events)>;

    ActivityEventWatcher(UiQueue& ui, Callback on_events,
                         int max_status_length = ACTIVITY_STATUS_MAX_CHARS,
                         std::chrono::milliseconds interval =
                             std::chrono::milliseconds(WATCHER_POLL_INTERVAL_MS));
    ~ActivityEventWatcher();

    ActivityEventWatcher(const ActivityEventWatcher&) = delete;
    ActivityEventWatcher& operator=(const ActivityEventWatcher&) = delete;

    // Attaching starts from an empty row cache, so everything already on
    // screen is treated as new on the first poll.
    void attach(std::weak_ptr<TerminalGrid> grid);
    void detach();

    bool start();
    void stop();

    // One poll on the calling thread. Returns the events it produced.
    std::vector<ActivityEvent> poll_once();

    // Classify one line (ANSI already stripped, trimmed). First match wins:
    // file read, then command run, then agent status.
    static std::optional<ActivityEvent> parse_line(const std::string& line,
                                                   int max_status_length = ACTIVITY_STATUS_MAX_CHARS);

private:
    UiQueue& ui_;
    Callback on_events_;
    int max_status_length_;
    std::chrono::milliseconds interval_;
    GridHandle grid_;
    DeliveryGate gate_;
    PollTimer timer_;

    std::mutex scan_mutex_;
    BufferScanner scanner_;
};
