#include "stream_consumer.hpp"
#include <iostream>

namespace sift {

StreamConsumer::StreamConsumer(MessageStateStore& store,
                               std::unique_ptr<StreamTransport> transport,
                               ConsumerListener listener)
    : store_(store), transport_(std::move(transport)), listener_(std::move(listener)) {}

StreamConsumer::~StreamConsumer() {
    close();
}

bool StreamConsumer::subscribe() {
    if (subscribed_ || closed_ || !transport_) {
        std::cerr << "[consumer] Stream already subscribed\n";
        return false;
    }
    subscribed_ = true;
    TransportCallbacks callbacks;
    callbacks.on_event = [this](const SSEEvent& event) { handle_event(event); };
    callbacks.on_failure = [this](const std::string& error) { handle_failure(error); };
    callbacks.on_end = [this]() { handle_end(); };
    transport_->open(std::move(callbacks));
    return true;
}

void StreamConsumer::close() {
    if (closed_) return;
    closed_ = true;
    if (transport_) transport_->close();
}

void StreamConsumer::handle_event(const SSEEvent& event) {
    if (closed_) return;
    ReduceResult result = apply_event(store_, event);
    switch (result.outcome) {
        case FrameOutcome::Status:
            if (listener_.on_status) listener_.on_status(result.text);
            break;
        case FrameOutcome::Meta:
            if (listener_.on_meta) listener_.on_meta(result.text);
            break;
        default:
            break;
    }
    if (result.terminal) finish(result);
}

void StreamConsumer::handle_failure(const std::string& error) {
    if (closed_) return;
    finish(apply_transport_failure(store_, error));
}

void StreamConsumer::handle_end() {
    if (closed_) return;
    finish(apply_transport_failure(store_, "stream ended without a terminal frame"));
}

void StreamConsumer::finish(const ReduceResult& result) {
    close();
    finished_ = true;
    if (listener_.on_finish) listener_.on_finish(result);
}

} // namespace sift
