#pragma once
#include "stream_reducer.hpp"
#include "transport.hpp"
#include <functional>
#include <memory>
#include <string>

namespace sift {

class MessageStateStore;

// Notifications from a consumer to its owner, on the event loop thread.
struct ConsumerListener {
    std::function<void(const std::string& message)> on_status;
    std::function<void(const std::string& analysis_id)> on_meta;
    // Runs once, when the stream reaches a terminal outcome.
    std::function<void(const ReduceResult& result)> on_finish;
};

// Owns one stream's transport and feeds its frames through the reducer into
// the store. Subscribes once; after close() or a terminal frame every later
// callback from the transport is ignored.
class StreamConsumer {
public:
    StreamConsumer(MessageStateStore& store, std::unique_ptr<StreamTransport> transport,
                   ConsumerListener listener);
    ~StreamConsumer();

    StreamConsumer(const StreamConsumer&) = delete;
    StreamConsumer& operator=(const StreamConsumer&) = delete;

    // Returns false if this consumer has already subscribed.
    bool subscribe();

    // Idempotent. No store mutation happens after this returns.
    void close();

    bool subscribed() const { return subscribed_; }
    bool closed() const { return closed_; }
    bool finished() const { return finished_; }

private:
    void handle_event(const SSEEvent& event);
    void handle_failure(const std::string& error);
    void handle_end();
    void finish(const ReduceResult& result);

    MessageStateStore& store_;
    std::unique_ptr<StreamTransport> transport_;
    ConsumerListener listener_;
    bool subscribed_ = false;
    bool closed_ = false;
    bool finished_ = false;
};

} // namespace sift
