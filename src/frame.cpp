#include "frame.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sift {

const char* frame_kind_name(FrameKind kind) {
    switch (kind) {
        case FrameKind::Status: return "status";
        case FrameKind::Delta: return "delta";
        case FrameKind::Snapshot: return "snapshot";
        case FrameKind::Meta: return "analysis_id";
        case FrameKind::Complete: return "complete";
        case FrameKind::Error: return "error";
    }
    return "status";
}

StreamFrame StreamFrame::status(const std::string& message) {
    return StreamFrame{FrameKind::Status, message, ""};
}

StreamFrame StreamFrame::delta(const std::string& text) {
    return StreamFrame{FrameKind::Delta, text, ""};
}

StreamFrame StreamFrame::snapshot(const std::string& text) {
    return StreamFrame{FrameKind::Snapshot, text, ""};
}

StreamFrame StreamFrame::meta(const std::string& analysis_id) {
    return StreamFrame{FrameKind::Meta, analysis_id, ""};
}

StreamFrame StreamFrame::complete(const std::string& message) {
    return StreamFrame{FrameKind::Complete, message, ""};
}

StreamFrame StreamFrame::error(const std::string& type, const std::string& message) {
    return StreamFrame{FrameKind::Error, message, type};
}

std::string encode_frame(const StreamFrame& frame) {
    json payload;
    std::string event;
    switch (frame.kind) {
        case FrameKind::Delta:
            payload["delta"] = frame.text;
            break;
        case FrameKind::Snapshot:
            payload["text_chunk"] = frame.text;
            break;
        case FrameKind::Status:
            event = "status";
            payload["message"] = frame.text;
            break;
        case FrameKind::Meta:
            event = "analysis_id";
            payload["analysis_id"] = frame.text;
            break;
        case FrameKind::Complete:
            event = "complete";
            payload["message"] = frame.text;
            break;
        case FrameKind::Error:
            event = "error";
            payload["type"] = frame.error_type.empty() ? "ApplicationError" : frame.error_type;
            payload["message"] = frame.text;
            break;
    }
    // Invalid UTF-8 from a provider must not abort the stream.
    return format_sse(event, payload.dump(-1, ' ', false, json::error_handler_t::replace));
}

static json parse_object(const SSEEvent& event) {
    json payload;
    try {
        payload = json::parse(event.data);
    } catch (const json::parse_error& e) {
        throw ParseError("Malformed frame data: " + std::string(e.what()));
    }
    if (!payload.is_object()) {
        throw ParseError("Frame data is not a JSON object");
    }
    return payload;
}

static std::string string_field(const json& payload, const char* key) {
    if (payload.contains(key) && payload[key].is_string()) {
        return payload[key].get<std::string>();
    }
    return "";
}

StreamFrame decode_frame(const SSEEvent& event) {
    if (event.event == "complete") {
        StreamFrame frame = StreamFrame::complete("");
        try {
            auto payload = json::parse(event.data);
            if (payload.is_object()) frame.text = string_field(payload, "message");
        } catch (const json::parse_error&) { // NOLINT(bugprone-empty-catch)
            // completion needs no payload
        }
        return frame;
    }

    if (event.event == "error") {
        StreamFrame frame = StreamFrame::error("ApplicationError", kBackendErrorFallback);
        try {
            auto payload = json::parse(event.data);
            if (payload.is_object()) {
                std::string message = string_field(payload, "message");
                if (message.empty()) message = string_field(payload, "error");
                if (!message.empty()) frame.text = message;
                std::string type = string_field(payload, "type");
                if (!type.empty()) frame.error_type = type;
            }
        } catch (const json::parse_error&) { // NOLINT(bugprone-empty-catch)
            // fallback message stands
        }
        return frame;
    }

    if (event.event.empty() || event.event == "message") {
        json payload = parse_object(event);
        if (payload.contains("delta") && payload["delta"].is_string()) {
            return StreamFrame::delta(payload["delta"].get<std::string>());
        }
        if (payload.contains("text_chunk") && payload["text_chunk"].is_string()) {
            return StreamFrame::snapshot(payload["text_chunk"].get<std::string>());
        }
        throw ParseError("Frame has neither delta nor text_chunk");
    }

    if (event.event == "status") {
        json payload = parse_object(event);
        return StreamFrame::status(string_field(payload, "message"));
    }

    if (event.event == "analysis_id") {
        json payload = parse_object(event);
        std::string id = string_field(payload, "analysis_id");
        if (id.empty()) throw ParseError("analysis_id frame without an id");
        return StreamFrame::meta(id);
    }

    throw ParseError("Unknown frame event: " + event.event);
}

} // namespace sift
