#include "stream_reducer.hpp"
#include "message_store.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <iostream>

namespace sift {

const char* frame_outcome_name(FrameOutcome outcome) {
    switch (outcome) {
        case FrameOutcome::Status:    return "status";
        case FrameOutcome::Meta:      return "meta";
        case FrameOutcome::Applied:   return "applied";
        case FrameOutcome::Discarded: return "discarded";
        case FrameOutcome::Malformed: return "malformed";
        case FrameOutcome::Completed: return "completed";
        case FrameOutcome::Failed:    return "failed";
    }
    return "unknown";
}

static ReduceResult discard(const StreamFrame& frame) {
    std::cerr << "[consumer] Discarding " << frame_kind_name(frame.kind)
              << " frame: no active message\n";
    return {FrameOutcome::Discarded, is_terminal(frame.kind), {}};
}

ReduceResult apply_frame(MessageStateStore& store, const StreamFrame& frame) {
    switch (frame.kind) {
        case FrameKind::Status:
            return {FrameOutcome::Status, false, frame.text};

        case FrameKind::Meta:
            return {FrameOutcome::Meta, false, frame.text};

        case FrameKind::Delta:
            if (!store.append_to_active(frame.text)) return discard(frame);
            return {FrameOutcome::Applied, false, {}};

        case FrameKind::Snapshot:
            if (!store.replace_active(frame.text)) return discard(frame);
            return {FrameOutcome::Applied, false, {}};

        case FrameKind::Complete:
            if (!store.complete_active()) return discard(frame);
            return {FrameOutcome::Completed, true, {}};

        case FrameKind::Error: {
            std::string text = is_blank(frame.text) ? kBackendErrorFallback : frame.text;
            if (!store.fail_active(text)) return discard(frame);
            std::cerr << "[consumer] Stream error"
                      << (frame.error_type.empty() ? "" : " (" + frame.error_type + ")")
                      << ": " << truncate_for_log(text, 200) << "\n";
            return {FrameOutcome::Failed, true, text};
        }
    }
    return {FrameOutcome::Malformed, false, {}};
}

ReduceResult apply_event(MessageStateStore& store, const SSEEvent& event) {
    StreamFrame frame;
    try {
        frame = decode_frame(event);
    } catch (const ParseError& e) {
        std::cerr << "[consumer] Ignoring malformed frame"
                  << (event.event.empty() ? "" : " '" + event.event + "'")
                  << ": " << e.what() << "\n";
        return {FrameOutcome::Malformed, false, {}};
    }
    return apply_frame(store, frame);
}

ReduceResult apply_transport_failure(MessageStateStore& store, const std::string& detail) {
    std::cerr << "[consumer] Transport failure: " << detail << "\n";
    if (!store.fail_active(kTransportErrorText)) {
        return {FrameOutcome::Discarded, true, {}};
    }
    return {FrameOutcome::Failed, true, kTransportErrorText};
}

} // namespace sift
