#pragma once
#include <cstdint>
#include <string>

namespace sift {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.
// All client events are published on the event loop thread.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* MessageAppended   = "MessageAppended";
    constexpr const char* MessageUpdated    = "MessageUpdated";
    constexpr const char* MessagesReset     = "MessagesReset";
    constexpr const char* SessionStatus     = "SessionStatus";
    constexpr const char* StreamStatus      = "StreamStatus";
    constexpr const char* AnalysisIdChanged = "AnalysisIdChanged";
    constexpr const char* ErrorRaised       = "ErrorRaised";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct MessageAppendedEvent : Event {
    static constexpr const char* TAG = event_tags::MessageAppended;
    uint64_t message_id = 0;

    MessageAppendedEvent() { type_tag = TAG; }
};

// Text, loading or error flag of a message changed.
struct MessageUpdatedEvent : Event {
    static constexpr const char* TAG = event_tags::MessageUpdated;
    uint64_t message_id = 0;
    std::string appended; // set when the change was a pure append

    MessageUpdatedEvent() { type_tag = TAG; }
};

// The list was cleared or truncated; observers should re-read it.
struct MessagesResetEvent : Event {
    static constexpr const char* TAG = event_tags::MessagesReset;
    size_t remaining = 0;

    MessagesResetEvent() { type_tag = TAG; }
};

struct SessionStatusEvent : Event {
    static constexpr const char* TAG = event_tags::SessionStatus;
    std::string session_id;
    std::string status;

    SessionStatusEvent() { type_tag = TAG; }
};

// Informational status frame from the server.
struct StreamStatusEvent : Event {
    static constexpr const char* TAG = event_tags::StreamStatus;
    std::string message;

    StreamStatusEvent() { type_tag = TAG; }
};

struct AnalysisIdChangedEvent : Event {
    static constexpr const char* TAG = event_tags::AnalysisIdChanged;
    std::string analysis_id;

    AnalysisIdChangedEvent() { type_tag = TAG; }
};

// Global error indicator was set (empty message = cleared).
struct ErrorRaisedEvent : Event {
    static constexpr const char* TAG = event_tags::ErrorRaised;
    std::string message;

    ErrorRaisedEvent() { type_tag = TAG; }
};

} // namespace sift
