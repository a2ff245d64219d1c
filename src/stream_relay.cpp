#include "stream_relay.hpp"
#include "cancel_token.hpp"
#include "util.hpp"
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <thread>

namespace sift {

const char* relay_outcome_name(RelayOutcome outcome) {
    switch (outcome) {
        case RelayOutcome::Completed: return "completed";
        case RelayOutcome::Failed: return "failed";
        case RelayOutcome::Aborted: return "aborted";
    }
    return "failed";
}

StreamRelay::StreamRelay(Provider& provider, FrameSink& sink)
    : provider_(provider), sink_(sink) {}

bool StreamRelay::emit(const StreamFrame& frame, RelayResult& result) {
    if (sink_gone_) return false;
    if (!sink_.connected() || !sink_.write(frame)) {
        sink_gone_ = true;
        return false;
    }
    ++result.frames_written;
    return true;
}

// Cancels the token if the sink disconnects while the provider is silent.
class DisconnectWatch {
public:
    DisconnectWatch(const FrameSink& sink, const CancelToken& token,
                    std::chrono::milliseconds interval)
        : thread_([this, &sink, token, interval] {
              std::unique_lock<std::mutex> lock(mutex_);
              while (!done_) {
                  cv_.wait_for(lock, interval);
                  if (done_) break;
                  if (!sink.connected()) {
                      token.cancel();
                      break;
                  }
              }
          }) {}

    ~DisconnectWatch() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        cv_.notify_all();
        thread_.join();
    }

    DisconnectWatch(const DisconnectWatch&) = delete;
    DisconnectWatch& operator=(const DisconnectWatch&) = delete;

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool done_ = false;
    std::thread thread_; // last: started after the members it uses
};

RelayResult StreamRelay::run(GenerationRequest request, const RelayOptions& options) {
    RelayResult result;
    sink_gone_ = false;

    CancelToken cancel;
    request.cancel = &cancel;

    for (const auto& message : options.status) {
        emit(StreamFrame::status(message), result);
    }

    if (!sink_gone_) {
        // Whitespace-only chunks are held back and sent with the next chunk
        // that has visible text.
        std::string pending_ws;
        DisconnectWatch watch(sink_, cancel, options.watch_interval);
        try {
            provider_.stream(request, [&](const std::string& chunk) -> bool {
                if (cancel.cancelled()) return false;
                if (is_blank(chunk)) {
                    pending_ws += chunk;
                    return true;
                }
                std::string text = pending_ws + chunk;
                pending_ws.clear();
                if (!emit(StreamFrame::delta(text), result)) {
                    cancel.cancel();
                    return false;
                }
                result.text += text;
                return true;
            });
            // Trailing whitespace is still report text.
            if (!pending_ws.empty() && !cancel.cancelled() &&
                emit(StreamFrame::delta(pending_ws), result)) {
                result.text += pending_ws;
            }
        } catch (const std::exception& e) {
            result.outcome = RelayOutcome::Failed;
            result.error = e.what();
        }
    }

    if (sink_gone_ || cancel.cancelled()) {
        // No one is left to read a terminal frame.
        sink_gone_ = true;
        result.outcome = RelayOutcome::Aborted;
        std::cerr << "[relay] Consumer disconnected, provider call aborted after "
                  << result.frames_written << " frames\n";
    } else if (result.outcome == RelayOutcome::Failed) {
        std::cerr << "[relay] Provider " << provider_.provider_name() << " failed: "
                  << truncate_for_log(result.error, 200) << "\n";
        emit(StreamFrame::error("ApplicationError",
                                "Error during analysis: " + result.error), result);
    } else {
        if (!options.analysis_id.empty()) {
            emit(StreamFrame::meta(options.analysis_id), result);
        }
        if (!emit(StreamFrame::complete(), result)) {
            result.outcome = RelayOutcome::Aborted;
        }
    }

    if (options.on_finish) {
        try {
            options.on_finish(result);
        } catch (const std::exception& e) {
            std::cerr << "[relay] Completion hook failed: " << e.what() << "\n";
        }
    }
    return result;
}

} // namespace sift
