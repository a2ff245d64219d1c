#pragma once
#include "../sse.hpp"
#include <functional>
#include <string>

namespace sift {

struct TransportCallbacks {
    std::function<void(const SSEEvent&)> on_event;
    std::function<void(const std::string& error)> on_failure;
    std::function<void()> on_end; // body ended without a transport error
};

// Client read end of one event stream. Callbacks are delivered on the event
// loop thread, in arrival order, and never after close() has returned.
class StreamTransport {
public:
    virtual ~StreamTransport() = default;

    // Start receiving. Called at most once.
    virtual void open(TransportCallbacks callbacks) = 0;

    // Stop receiving and release the connection. Idempotent.
    virtual void close() = 0;
};

} // namespace sift
