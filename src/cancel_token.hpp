#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace sift {

// Shared cancellation flag. Copies refer to the same state, so a token can
// be handed to an HTTP transfer and kept by the caller that may cancel it.
// Callbacks registered with on_cancel() run on the cancelling thread.
class CancelToken {
public:
    CancelToken() : state_(std::make_shared<State>()) {}

    void cancel() const {
        std::vector<std::function<void()>> to_call;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->cancelled.exchange(true)) return;
            to_call.swap(state_->callbacks);
        }
        for (const auto& cb : to_call) cb();
    }

    bool cancelled() const {
        return state_->cancelled.load(std::memory_order_relaxed);
    }

    // Runs cb immediately if the token is already cancelled.
    void on_cancel(std::function<void()> cb) const {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->cancelled.load()) {
                state_->callbacks.push_back(std::move(cb));
                return;
            }
        }
        cb();
    }

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::vector<std::function<void()>> callbacks;
    };
    std::shared_ptr<State> state_;
};

} // namespace sift
