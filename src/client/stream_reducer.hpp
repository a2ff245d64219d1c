#pragma once
#include "../frame.hpp"
#include "../sse.hpp"
#include <string>

namespace sift {

class MessageStateStore;

constexpr const char* kTransportErrorText =
    "An error occurred while streaming the response. Please try again.";
constexpr const char* kStopMarker = "\n\nGeneration stopped by user.";

enum class FrameOutcome {
    Status,     // informational, no message change
    Meta,       // analysis id, no message change
    Applied,    // delta or snapshot applied to the active message
    Discarded,  // no active message to target
    Malformed,  // undecodable payload, ignored
    Completed,  // active message finished
    Failed      // active message resolved as an error
};

const char* frame_outcome_name(FrameOutcome outcome);

struct ReduceResult {
    FrameOutcome outcome = FrameOutcome::Discarded;
    bool terminal = false; // the stream is exhausted after this frame
    // Status: message. Meta: analysis id. Failed: the error text shown.
    std::string text;
};

// The whole client-side frame contract. Deltas append, snapshots replace,
// complete and error resolve the active message exactly once.
ReduceResult apply_frame(MessageStateStore& store, const StreamFrame& frame);

// Decode then apply. A malformed payload leaves the store untouched.
ReduceResult apply_event(MessageStateStore& store, const SSEEvent& event);

// Protocol-level failure of the stream (connection error, bad HTTP status,
// EOF before a terminal frame).
ReduceResult apply_transport_failure(MessageStateStore& store, const std::string& detail);

} // namespace sift
