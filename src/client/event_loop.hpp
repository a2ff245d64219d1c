#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace sift {

// Single-threaded task queue. post() may be called from any thread; tasks
// run on whichever thread drives run()/run_one()/run_pending(). All client
// state (message store, consumer, controller) is touched only from tasks.
class EventLoop {
public:
    using Task = std::function<void()>;

    void post(Task task);

    // Wait up to timeout for one task and run it. Returns true if one ran.
    bool run_one(std::chrono::milliseconds timeout);

    // Run the tasks queued so far without waiting. Returns how many ran.
    size_t run_pending();

    // Run until stop() is called.
    void run();

    // Run until pred() holds or timeout elapses. Returns pred().
    bool run_until(const std::function<bool()>& pred,
                   std::chrono::milliseconds timeout);

    void stop();

    size_t pending() const;

private:
    void execute(Task& task);

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    bool stopped_ = false;
};

} // namespace sift
