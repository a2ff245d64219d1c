#pragma once
#include <string>
#include <functional>

namespace sift {

struct SSEEvent {
    std::string event; // event type (e.g. "complete", "error"); empty for plain messages
    std::string data;  // raw data (JSON for every frame this project emits)
};

// Callback receives each parsed SSE event. Return false to stop parsing.
using SSECallback = std::function<bool(const SSEEvent& event)>;

// Incremental parser for a text/event-stream body. Partial lines and
// partially received events are kept across feed() calls.
class SSEParser {
public:
    // Feed raw data chunk, triggers callback for complete events
    void feed(const std::string& chunk, const SSECallback& callback);

    // True if an event has been started but not yet terminated by a blank line
    bool has_pending() const;

    // Reset parser state
    void reset();

private:
    std::string buffer_;
    std::string current_event_;
    std::string current_data_;
    bool has_data_ = false;
};

// Serialize one event: optional "event:" line, one "data:" line per payload
// line, blank-line terminator.
std::string format_sse(const std::string& event, const std::string& data);

} // namespace sift
