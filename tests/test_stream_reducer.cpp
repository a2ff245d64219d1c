#include <catch2/catch_test_macros.hpp>
#include "client/message_store.hpp"
#include "client/stream_reducer.hpp"
#include "frame.hpp"

using namespace sift;

static uint64_t loading_store(MessageStateStore& store) {
    store.append_user("claim");
    return store.append_placeholder();
}

TEST_CASE("Reducer: deltas merge in arrival order", "[stream_reducer]") {
    MessageStateStore store;
    uint64_t id = loading_store(store);
    for (const char* part : {"a", "b", "c"}) {
        auto r = apply_frame(store, StreamFrame::delta(part));
        REQUIRE(r.outcome == FrameOutcome::Applied);
        REQUIRE_FALSE(r.terminal);
    }
    REQUIRE(store.find(id)->text == "abc");
    REQUIRE(store.find(id)->loading);
}

TEST_CASE("Reducer: snapshot overrides earlier deltas", "[stream_reducer]") {
    MessageStateStore store;
    uint64_t id = loading_store(store);
    apply_frame(store, StreamFrame::delta("partial"));
    apply_frame(store, StreamFrame::snapshot("final text"));
    REQUIRE(store.find(id)->text == "final text");
}

TEST_CASE("Reducer: delta after snapshot appends to it", "[stream_reducer]") {
    MessageStateStore store;
    uint64_t id = loading_store(store);
    apply_frame(store, StreamFrame::snapshot("base"));
    apply_frame(store, StreamFrame::delta("+more"));
    REQUIRE(store.find(id)->text == "base+more");
}

TEST_CASE("Reducer: wire events decode through the same rules", "[stream_reducer]") {
    MessageStateStore store;
    uint64_t id = loading_store(store);
    apply_event(store, SSEEvent{"", R"({"delta":"partial"})"});
    apply_event(store, SSEEvent{"", R"({"text_chunk":"final text"})"});
    auto r = apply_event(store, SSEEvent{"complete", R"({"message":"Stream finished"})"});
    REQUIRE(r.outcome == FrameOutcome::Completed);
    REQUIRE(r.terminal);
    REQUIRE(store.find(id)->text == "final text");
    REQUIRE_FALSE(store.find(id)->loading);
}

TEST_CASE("Reducer: status and meta never touch content", "[stream_reducer]") {
    MessageStateStore store;
    uint64_t id = loading_store(store);
    apply_frame(store, StreamFrame::delta("x"));

    auto s = apply_frame(store, StreamFrame::status("Analysis started"));
    REQUIRE(s.outcome == FrameOutcome::Status);
    REQUIRE(s.text == "Analysis started");

    auto m = apply_frame(store, StreamFrame::meta("a-42"));
    REQUIRE(m.outcome == FrameOutcome::Meta);
    REQUIRE(m.text == "a-42");

    REQUIRE(store.find(id)->text == "x");
    REQUIRE(store.find(id)->loading);
}

TEST_CASE("Reducer: malformed payloads leave the store untouched", "[stream_reducer]") {
    MessageStateStore store;
    uint64_t id = loading_store(store);
    apply_frame(store, StreamFrame::delta("kept"));

    const SSEEvent bad[] = {
        {"", "{not json"},
        {"", R"({"neither":"field"})"},
        {"", R"({"delta":42})"},
        {"mystery", R"({"delta":"x"})"},
        {"status", "[]"},
        {"analysis_id", R"({"analysis_id":""})"},
    };
    for (const auto& ev : bad) {
        auto r = apply_event(store, ev);
        REQUIRE(r.outcome == FrameOutcome::Malformed);
        REQUIRE_FALSE(r.terminal);
    }
    REQUIRE(store.find(id)->text == "kept");
    REQUIRE(store.find(id)->loading);
    REQUIRE_FALSE(store.find(id)->is_error);
}

TEST_CASE("Reducer: application error uses the carried message", "[stream_reducer]") {
    MessageStateStore store;
    uint64_t id = loading_store(store);
    apply_frame(store, StreamFrame::delta("partial"));
    auto r = apply_event(store, SSEEvent{"error", R"({"type":"ApplicationError","message":"quota"})"});
    REQUIRE(r.outcome == FrameOutcome::Failed);
    REQUIRE(r.terminal);
    REQUIRE(r.text == "quota");
    REQUIRE(store.find(id)->text == "quota");
    REQUIRE(store.find(id)->is_error);
    REQUIRE_FALSE(store.find(id)->loading);
}

TEST_CASE("Reducer: error payload with an error field", "[stream_reducer]") {
    MessageStateStore store;
    uint64_t id = loading_store(store);
    apply_event(store, SSEEvent{"error", R"({"error":"model overloaded"})"});
    REQUIRE(store.find(id)->text == "model overloaded");
}

TEST_CASE("Reducer: unreadable error payload falls back", "[stream_reducer]") {
    MessageStateStore store;
    uint64_t id = loading_store(store);
    auto r = apply_event(store, SSEEvent{"error", "garbage"});
    REQUIRE(r.outcome == FrameOutcome::Failed);
    REQUIRE(store.find(id)->text == kBackendErrorFallback);
    REQUIRE(store.find(id)->is_error);
}

TEST_CASE("Reducer: terminal frames resolve the message exactly once", "[stream_reducer]") {
    MessageStateStore store;
    uint64_t id = loading_store(store);
    apply_frame(store, StreamFrame::delta("answer"));
    REQUIRE(apply_frame(store, StreamFrame::complete()).outcome == FrameOutcome::Completed);

    auto again = apply_frame(store, StreamFrame::error("ApplicationError", "late"));
    REQUIRE(again.outcome == FrameOutcome::Discarded);
    REQUIRE(again.terminal);
    auto late = apply_frame(store, StreamFrame::delta("late"));
    REQUIRE(late.outcome == FrameOutcome::Discarded);

    REQUIRE(store.find(id)->text == "answer");
    REQUIRE_FALSE(store.find(id)->is_error);
}

TEST_CASE("Reducer: frames without an active message are discarded", "[stream_reducer]") {
    MessageStateStore store;
    uint64_t id = store.append_user("hi");
    REQUIRE(apply_frame(store, StreamFrame::delta("x")).outcome == FrameOutcome::Discarded);
    REQUIRE(apply_frame(store, StreamFrame::snapshot("x")).outcome == FrameOutcome::Discarded);
    REQUIRE(store.find(id)->text == "hi");
}

TEST_CASE("Reducer: transport failure shows the retry message", "[stream_reducer]") {
    MessageStateStore store;
    uint64_t id = loading_store(store);
    apply_frame(store, StreamFrame::delta("partial"));
    auto r = apply_transport_failure(store, "connection reset");
    REQUIRE(r.outcome == FrameOutcome::Failed);
    REQUIRE(r.terminal);
    REQUIRE(store.find(id)->text == kTransportErrorText);
    REQUIRE(store.find(id)->is_error);
    REQUIRE_FALSE(store.is_loading());

    REQUIRE(apply_transport_failure(store, "again").outcome == FrameOutcome::Discarded);
}
