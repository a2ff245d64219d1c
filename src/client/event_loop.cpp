#include "event_loop.hpp"
#include <iostream>

namespace sift {

void EventLoop::post(Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void EventLoop::execute(Task& task) {
    try {
        task();
    } catch (const std::exception& e) {
        std::cerr << "[loop] Task failed: " << e.what() << "\n";
    }
}

bool EventLoop::run_one(std::chrono::milliseconds timeout) {
    Task task;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !tasks_.empty(); })) {
            return false;
        }
        task = std::move(tasks_.front());
        tasks_.pop_front();
    }
    execute(task);
    return true;
}

size_t EventLoop::run_pending() {
    std::deque<Task> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(tasks_);
    }
    size_t ran = 0;
    for (auto& task : batch) {
        execute(task);
        ++ran;
    }
    return ran;
}

void EventLoop::run() {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return !tasks_.empty() || stopped_; });
            if (stopped_) {
                stopped_ = false;
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        execute(task);
    }
}

bool EventLoop::run_until(const std::function<bool()>& pred,
                          std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        run_one(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
    }
    return true;
}

void EventLoop::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_ = true;
    }
    cv_.notify_all();
}

size_t EventLoop::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace sift
