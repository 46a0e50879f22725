#include "ui_queue.hpp"

void UiQueue::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutdown_) return;
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

size_t UiQueue::drain() {
    std::deque<Task> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(tasks_);
    }
    for (auto& task : batch) {
        task();
    }
    return batch.size();
}

void UiQueue::run() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return shutdown_ || !tasks_.empty(); });
            if (shutdown_) return;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task();
    }
}

void UiQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        tasks_.clear();
    }
    cv_.notify_all();
}

bool UiQueue::is_shut_down() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shutdown_;
}

size_t UiQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}
