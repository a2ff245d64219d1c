#pragma once
#include "sse.hpp"
#include <string>

namespace sift {

// Closed set of frame kinds carried by an analysis event stream.
enum class FrameKind { Status, Delta, Snapshot, Meta, Complete, Error };

const char* frame_kind_name(FrameKind kind);

inline bool is_terminal(FrameKind kind) {
    return kind == FrameKind::Complete || kind == FrameKind::Error;
}

struct StreamFrame {
    FrameKind kind = FrameKind::Status;
    // Status/Complete: message. Delta: appended text. Snapshot: replacement
    // text. Meta: analysis id. Error: error message.
    std::string text;
    std::string error_type; // Error only

    static StreamFrame status(const std::string& message);
    static StreamFrame delta(const std::string& text);
    static StreamFrame snapshot(const std::string& text);
    static StreamFrame meta(const std::string& analysis_id);
    static StreamFrame complete(const std::string& message = "Stream finished");
    static StreamFrame error(const std::string& type, const std::string& message);
};

// Fallback text when an error frame carries no readable message.
constexpr const char* kBackendErrorFallback = "An error occurred on the backend.";

// Serialize a frame to its text/event-stream representation.
std::string encode_frame(const StreamFrame& frame);

// Decode one SSE event. Throws ParseError for malformed content frames
// (bad JSON, missing fields, unknown event names). Complete and error events
// never throw: an unreadable error payload decodes to the fallback message.
StreamFrame decode_frame(const SSEEvent& event);

} // namespace sift
