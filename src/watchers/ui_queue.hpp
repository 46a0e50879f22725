#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

// The single execution context that receives watcher notifications.
//
// Watchers post from their own threads; whoever owns the UI either calls
// drain() from its loop or parks a thread in run(). Tasks run in post order.
class UiQueue {
public:
    using Task = std::function<void()>;

    // Enqueue `task`. Ignored after shutdown().
    void post(Task task);

    // Run everything queued so far on the calling thread. Returns the
    // number of tasks run.
    size_t drain();

    // Run tasks as they arrive until shutdown(); remaining tasks are dropped.
    void run();

    void shutdown();
    bool is_shut_down() const;
    size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    bool shutdown_ = false;
};
