#include "poll_timer.hpp"

PollTimer::~PollTimer() {
    stop();
}

bool PollTimer::start(std::chrono::milliseconds period, std::function<void()> tick) {
    std::lock_guard<std::mutex> guard(lifecycle_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) return false;
    }

    // A previous loop stopped from inside its own tick may still need joining.
    if (thread_.joinable()) thread_.join();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = false;
        running_ = true;
    }
    thread_ = std::thread(&PollTimer::loop, this, period, std::move(tick));
    return true;
}

void PollTimer::stop() {
    bool from_tick;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
        from_tick = (std::this_thread::get_id() == loop_id_);
    }
    cv_.notify_all();

    if (from_tick) return;

    std::lock_guard<std::mutex> guard(lifecycle_mutex_);
    if (thread_.joinable()) thread_.join();
}

bool PollTimer::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

void PollTimer::loop(std::chrono::milliseconds period, std::function<void()> tick) {
    std::unique_lock<std::mutex> lock(mutex_);
    loop_id_ = std::this_thread::get_id();
    while (!stop_requested_) {
        // First tick fires one period after start.
        if (cv_.wait_for(lock, period, [this] { return stop_requested_; })) break;

        lock.unlock();
        tick();
        lock.lock();
    }
    running_ = false;
    loop_id_ = std::thread::id();
}
