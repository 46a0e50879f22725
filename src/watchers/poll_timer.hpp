#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

// Runs a tick on a background thread at a fixed period until stopped.
class PollTimer {
public:
    PollTimer() = default;
    ~PollTimer();

    PollTimer(const PollTimer&) = delete;
    PollTimer& operator=(const PollTimer&) = delete;

    // Returns false if already running.
    bool start(std::chrono::milliseconds period, std::function<void()> tick);

    // Idempotent and safe from any thread. Wakes the loop and joins it,
    // unless called from the tick itself, in which case the loop exits after
    // the current tick and a later stop() or the destructor joins it.
    void stop();

    bool running() const;

private:
    void loop(std::chrono::milliseconds period, std::function<void()> tick);

    std::mutex lifecycle_mutex_;        // serializes start/stop
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    bool running_ = false;
    std::thread::id loop_id_;
    std::thread thread_;
};
