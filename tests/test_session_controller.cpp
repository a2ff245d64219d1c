#include <catch2/catch_test_macros.hpp>
#include "client/event_loop.hpp"
#include "client/message_store.hpp"
#include "client/session_controller.hpp"
#include "errors.hpp"
#include "event_bus.hpp"
#include "fakes.hpp"
#include <random>

using namespace sift;

namespace {

struct ControllerFixture {
    EventLoop loop;
    EventBus bus;
    MessageStateStore store{&bus};
    FakeGatewayClient gateway;
    SessionController controller{store, gateway, loop, &bus};

    static AnalysisQuery query(const std::string& text = "claim X") {
        AnalysisQuery q;
        q.text = text;
        q.model_id = "gpt-4o";
        q.report_type = report_types::FullCheck;
        q.params = {{"temperature", 0.3}};
        return q;
    }

    void finish_stream(const std::string& text) {
        gateway.last()->frame(StreamFrame::delta(text));
        gateway.last()->frame(StreamFrame::complete());
    }

    const ChatMessage& last() const { return store.messages().back(); }
};

// At most one loading message, and only ever the newest AI message.
bool loading_invariant_holds(const MessageStateStore& store) {
    size_t loading = store.loading_count();
    if (loading > 1) return false;
    if (loading == 0) return !store.is_loading();
    for (auto it = store.messages().rbegin(); it != store.messages().rend(); ++it) {
        if (it->sender == Sender::Ai) {
            return it->loading && store.active_id() == it->id;
        }
    }
    return false;
}

} // namespace

// ── start ───────────────────────────────────────────────────────

TEST_CASE("SessionController: empty query is rejected without mutation", "[session_controller]") {
    ControllerFixture f;
    AnalysisQuery empty;
    empty.text = "";
    REQUIRE_THROWS_AS(f.controller.start(empty), ValidationError);
    empty.text = "   \n";
    REQUIRE_THROWS_AS(f.controller.start(empty), ValidationError);
    REQUIRE(f.store.size() == 0);
    REQUIRE(f.gateway.initiated.empty());
    REQUIRE(f.controller.status() == SessionStatus::Idle);
    REQUIRE(f.controller.last_error().empty());
}

TEST_CASE("SessionController: image-only query is accepted", "[session_controller]") {
    ControllerFixture f;
    AnalysisQuery q = ControllerFixture::query("");
    q.image = ImageRef{"image/png", "", "aGVsbG8="};
    REQUIRE(f.controller.start(q));
    REQUIRE(f.gateway.initiated.size() == 1);
}

TEST_CASE("SessionController: start appends origin and placeholder", "[session_controller]") {
    ControllerFixture f;
    f.gateway.auto_reply = false;
    REQUIRE(f.controller.start(ControllerFixture::query()));

    REQUIRE(f.store.size() == 2);
    const ChatMessage& user = f.store.messages()[0];
    REQUIRE(user.sender == Sender::User);
    REQUIRE(user.text == "claim X");
    REQUIRE(user.original_query.has_value());
    REQUIRE(user.original_query->text == "claim X");
    REQUIRE(f.last().loading);
    REQUIRE(f.controller.status() == SessionStatus::Initiating);
    REQUIRE(f.controller.is_loading());
}

TEST_CASE("SessionController: gateway success streams into the placeholder", "[session_controller]") {
    ControllerFixture f;
    f.controller.start(ControllerFixture::query());
    REQUIRE(f.controller.status() == SessionStatus::Streaming);
    REQUIRE(f.gateway.streams.size() == 1);
    REQUIRE(f.gateway.last()->opened);
    REQUIRE(f.controller.analysis_id() == "analysis-1");
    REQUIRE(f.controller.session()->id == "session-1");

    f.finish_stream("Verdict: false");
    REQUIRE(f.last().text == "Verdict: false");
    REQUIRE_FALSE(f.last().loading);
    REQUIRE(f.controller.status() == SessionStatus::Complete);
    REQUIRE_FALSE(f.controller.is_loading());
}

TEST_CASE("SessionController: gateway failure updates the placeholder in place", "[session_controller]") {
    ControllerFixture f;
    std::vector<std::string> errors;
    subscribe<ErrorRaisedEvent>(f.bus, [&](const ErrorRaisedEvent& ev) {
        errors.push_back(ev.message);
    });
    f.gateway.reply = InitiateReply{};
    f.gateway.reply.error = "Provider openai is not configured";

    f.controller.start(ControllerFixture::query());
    REQUIRE(f.store.size() == 2);
    REQUIRE(f.last().is_error);
    REQUIRE_FALSE(f.last().loading);
    REQUIRE(f.last().text == "Provider openai is not configured");
    REQUIRE(f.controller.status() == SessionStatus::Errored);
    REQUIRE(f.controller.last_error() == "Provider openai is not configured");
    REQUIRE(errors == std::vector<std::string>{"Provider openai is not configured"});
    REQUIRE(f.gateway.streams.empty());
}

TEST_CASE("SessionController: start while loading is a no-op", "[session_controller]") {
    ControllerFixture f;
    f.controller.start(ControllerFixture::query());
    REQUIRE_FALSE(f.controller.start(ControllerFixture::query("another")));
    REQUIRE(f.store.size() == 2);
    REQUIRE(f.gateway.initiated.size() == 1);
}

TEST_CASE("SessionController: a new start begins a fresh conversation", "[session_controller]") {
    ControllerFixture f;
    f.controller.start(ControllerFixture::query("first claim"));
    f.finish_stream("first report");
    f.controller.start(ControllerFixture::query("second claim"));
    REQUIRE(f.store.size() == 2);
    REQUIRE(f.store.messages()[0].text == "second claim");
    REQUIRE(f.store.messages()[0].original_query.has_value());
    REQUIRE(f.last().loading);
    REQUIRE(f.controller.original_query()->text == "second claim");

    f.finish_stream("second report");
    REQUIRE(f.controller.follow_up("why?"));
    REQUIRE(f.gateway.chats.size() == 1);
    const auto& history = f.gateway.chats[0].history;
    REQUIRE(history.size() == 2);
    REQUIRE(history[0].content == "second claim");
    REQUIRE(history[1].content == "second report");

    f.finish_stream("because");
    REQUIRE(f.controller.restart());
    REQUIRE(f.store.size() == 2);
    REQUIRE(f.store.messages()[0].text == "second claim");
    REQUIRE(f.last().loading);
}

TEST_CASE("SessionController: application error frame sets the global error", "[session_controller]") {
    ControllerFixture f;
    f.controller.start(ControllerFixture::query());
    f.gateway.last()->frame(StreamFrame::error("ApplicationError", "Error during analysis: quota"));
    REQUIRE(f.last().is_error);
    REQUIRE(f.last().text == "Error during analysis: quota");
    REQUIRE(f.controller.status() == SessionStatus::Errored);
    REQUIRE(f.controller.last_error() == "Error during analysis: quota");
}

TEST_CASE("SessionController: malformed frame does not set the global error", "[session_controller]") {
    ControllerFixture f;
    f.controller.start(ControllerFixture::query());
    f.gateway.last()->event("", "not json");
    REQUIRE(f.controller.last_error().empty());
    REQUIRE(f.last().loading);
    REQUIRE(f.controller.status() == SessionStatus::Streaming);
}

TEST_CASE("SessionController: meta frame updates the analysis id", "[session_controller]") {
    ControllerFixture f;
    f.gateway.reply.locator.analysis_id.clear();
    f.controller.start(ControllerFixture::query());
    REQUIRE(f.controller.analysis_id().empty());
    f.gateway.last()->frame(StreamFrame::meta("a-77"));
    REQUIRE(f.controller.analysis_id() == "a-77");
}

// ── stop ────────────────────────────────────────────────────────

TEST_CASE("SessionController: stop resolves the loading message", "[session_controller]") {
    ControllerFixture f;
    f.controller.start(ControllerFixture::query());
    f.gateway.last()->frame(StreamFrame::delta("partial"));
    f.controller.stop();

    REQUIRE(f.last().text == std::string("partial") + kStopMarker);
    REQUIRE_FALSE(f.last().loading);
    REQUIRE_FALSE(f.last().is_error);
    REQUIRE(f.controller.status() == SessionStatus::Stopped);
    REQUIRE(f.gateway.last()->closed);
    REQUIRE(f.controller.last_error().empty());
}

TEST_CASE("SessionController: stop twice equals stop once", "[session_controller]") {
    ControllerFixture f;
    f.controller.start(ControllerFixture::query());
    f.gateway.last()->frame(StreamFrame::delta("partial"));
    f.controller.stop();
    auto after_one = f.store.messages();
    auto status_one = f.controller.status();
    f.controller.stop();

    REQUIRE(f.store.size() == after_one.size());
    for (size_t i = 0; i < after_one.size(); ++i) {
        REQUIRE(f.store.messages()[i].text == after_one[i].text);
        REQUIRE(f.store.messages()[i].loading == after_one[i].loading);
        REQUIRE(f.store.messages()[i].is_error == after_one[i].is_error);
    }
    REQUIRE(f.controller.status() == status_one);
}

TEST_CASE("SessionController: stop when idle is safe", "[session_controller]") {
    ControllerFixture f;
    f.controller.stop();
    REQUIRE(f.controller.status() == SessionStatus::Idle);
    REQUIRE(f.store.size() == 0);
}

TEST_CASE("SessionController: stop during initiate drops the late reply", "[session_controller]") {
    ControllerFixture f;
    f.gateway.auto_reply = false;
    f.controller.start(ControllerFixture::query());
    f.controller.stop();
    REQUIRE(f.controller.status() == SessionStatus::Stopped);

    InitiateReply ok;
    ok.ok = true;
    ok.locator.stream_url = "/api/sift/stream/late";
    f.gateway.release(ok);
    REQUIRE(f.gateway.streams.empty());
    REQUIRE(f.controller.status() == SessionStatus::Stopped);
    REQUIRE(f.store.loading_count() == 0);
}

TEST_CASE("SessionController: frames queued before stop are dropped", "[session_controller]") {
    ControllerFixture f;
    f.controller.start(ControllerFixture::query());
    auto stream = f.gateway.last();
    stream->frame(StreamFrame::delta("a"));
    f.controller.stop();
    std::string stopped_text = f.last().text;

    stream->frame(StreamFrame::delta("b"), true);
    stream->frame(StreamFrame::complete(), true);
    stream->fail("reset", true);
    REQUIRE(f.last().text == stopped_text);
    REQUIRE(f.controller.status() == SessionStatus::Stopped);
}

// ── follow-up ───────────────────────────────────────────────────

TEST_CASE("SessionController: follow-up sends history, model and analysis id", "[session_controller]") {
    ControllerFixture f;
    f.controller.set_system_override("Be brief.");
    f.controller.start(ControllerFixture::query());
    f.finish_stream("Report body");

    REQUIRE(f.controller.follow_up("Why?"));
    REQUIRE(f.gateway.chats.size() == 1);
    const ChatRequest& req = f.gateway.chats[0];
    REQUIRE(req.message == "Why?");
    REQUIRE(req.model_id == "gpt-4o");
    REQUIRE(req.analysis_id == "analysis-1");
    REQUIRE(req.params["temperature"] == 0.3);
    REQUIRE(req.system_override == "Be brief.");
    REQUIRE(req.history.size() == 2);
    REQUIRE(req.history[0].role == Role::User);
    REQUIRE(req.history[0].content == "claim X");
    REQUIRE(req.history[1].role == Role::Assistant);
    REQUIRE(req.history[1].content == "Report body");

    REQUIRE(f.store.size() == 4);
    REQUIRE(f.last().loading);
    REQUIRE(f.controller.status() == SessionStatus::Streaming);

    f.finish_stream("Because.");
    REQUIRE(f.last().text == "Because.");
    REQUIRE(f.controller.status() == SessionStatus::Complete);
}

TEST_CASE("SessionController: follow-up preconditions", "[session_controller]") {
    ControllerFixture f;
    SECTION("no session") {
        REQUIRE_FALSE(f.controller.follow_up("hello"));
        REQUIRE(f.store.size() == 0);
    }
    SECTION("blank text") {
        f.controller.start(ControllerFixture::query());
        f.finish_stream("done");
        REQUIRE_FALSE(f.controller.follow_up("   "));
        REQUIRE(f.store.size() == 2);
    }
    SECTION("operation in flight") {
        f.controller.start(ControllerFixture::query());
        REQUIRE_FALSE(f.controller.follow_up("too soon"));
        REQUIRE(f.store.size() == 2);
        REQUIRE(f.gateway.chats.empty());
    }
}

TEST_CASE("SessionController: follow-up race never yields two loading messages", "[session_controller]") {
    ControllerFixture f;
    f.controller.start(ControllerFixture::query());
    f.finish_stream("done");

    REQUIRE(f.controller.follow_up("one"));
    REQUIRE_FALSE(f.controller.follow_up("two"));
    REQUIRE(f.store.loading_count() == 1);
    REQUIRE(f.gateway.chats.size() == 1);

    f.controller.stop();
    REQUIRE(f.controller.follow_up("three"));
    REQUIRE(f.store.loading_count() == 1);
    // The first follow-up's transport was closed; its late frames go nowhere
    f.gateway.streams[1]->frame(StreamFrame::delta("stale"), true);
    REQUIRE(f.last().text.empty());
}

TEST_CASE("SessionController: follow-up history excludes errors and stopped placeholders are kept", "[session_controller]") {
    ControllerFixture f;
    f.controller.start(ControllerFixture::query());
    f.gateway.last()->frame(StreamFrame::delta("partial"));
    f.controller.stop();
    f.controller.follow_up("retry please");
    f.gateway.last()->fail("HTTP 500");
    f.controller.follow_up("and now?");

    const ChatRequest& req = f.gateway.chats.back();
    REQUIRE(req.history.size() == 3);
    REQUIRE(req.history[1].content == std::string("partial") + kStopMarker);
    REQUIRE(req.history[2].content == "retry please");
}

TEST_CASE("SessionController: cancelling the follow-up token stops it", "[session_controller]") {
    ControllerFixture f;
    f.controller.start(ControllerFixture::query());
    f.finish_stream("done");

    CancelToken token;
    f.controller.follow_up("more", token);
    f.gateway.last()->frame(StreamFrame::delta("half"));
    token.cancel();
    // Stop is delivered through the loop
    REQUIRE(f.last().loading);
    f.loop.run_pending();
    REQUIRE_FALSE(f.last().loading);
    REQUIRE(f.last().text == std::string("half") + kStopMarker);
    REQUIRE(f.controller.status() == SessionStatus::Stopped);
}

TEST_CASE("SessionController: stale cancel token does not stop a later reply", "[session_controller]") {
    ControllerFixture f;
    f.controller.start(ControllerFixture::query());
    f.finish_stream("done");

    CancelToken old_token;
    f.controller.follow_up("first", old_token);
    f.finish_stream("answer");
    f.controller.follow_up("second");
    old_token.cancel();
    f.loop.run_pending();
    REQUIRE(f.last().loading);
    REQUIRE(f.controller.status() == SessionStatus::Streaming);
}

TEST_CASE("SessionController: failure to open the chat stream is shown", "[session_controller]") {
    ControllerFixture f;
    f.controller.start(ControllerFixture::query());
    f.finish_stream("done");
    f.gateway.throw_on_open = true;
    REQUIRE(f.controller.follow_up("more"));
    REQUIRE(f.last().is_error);
    REQUIRE_FALSE(f.last().loading);
    REQUIRE(f.controller.status() == SessionStatus::Errored);
    REQUIRE_FALSE(f.controller.last_error().empty());
}

// ── restart / reset ─────────────────────────────────────────────

TEST_CASE("SessionController: restart keeps only the origin message", "[session_controller]") {
    ControllerFixture f;
    f.controller.start(ControllerFixture::query("claim X"));
    uint64_t origin = f.store.messages()[0].id;
    f.finish_stream("report");
    f.controller.follow_up("q1");
    f.finish_stream("a1");
    f.controller.follow_up("q2");
    f.finish_stream("a2");
    REQUIRE(f.store.size() == 6);

    REQUIRE(f.controller.restart());
    REQUIRE(f.store.size() == 2);
    const ChatMessage& user = f.store.messages()[0];
    REQUIRE(user.id == origin);
    REQUIRE(user.text == "claim X");
    REQUIRE(user.original_query.has_value());
    REQUIRE(user.original_query->text == "claim X");
    REQUIRE(f.last().sender == Sender::Ai);
    REQUIRE(f.last().loading);
    REQUIRE(f.last().text.empty());
    REQUIRE(f.gateway.initiated.size() == 2);
    REQUIRE(f.gateway.initiated[1].text == "claim X");
    REQUIRE(f.controller.status() == SessionStatus::Streaming);
}

TEST_CASE("SessionController: restart preconditions", "[session_controller]") {
    ControllerFixture f;
    REQUIRE_FALSE(f.controller.restart());

    f.controller.start(ControllerFixture::query());
    REQUIRE_FALSE(f.controller.restart()); // still streaming
    f.controller.stop();
    REQUIRE(f.controller.restart());
    REQUIRE(f.store.size() == 2);
}

TEST_CASE("SessionController: reset clears everything", "[session_controller]") {
    ControllerFixture f;
    f.controller.draft().text = "draft";
    f.controller.draft().report_type = report_types::CommunityNote;
    f.controller.start(ControllerFixture::query());
    auto stream = f.gateway.last();
    stream->frame(StreamFrame::error("ApplicationError", "bad"));
    REQUIRE_FALSE(f.controller.last_error().empty());

    SECTION("keeping inputs") {
        f.controller.reset(false);
        REQUIRE(f.controller.draft().text == "draft");
    }
    SECTION("clearing inputs") {
        f.controller.reset(true);
        REQUIRE(f.controller.draft().text.empty());
        REQUIRE_FALSE(f.controller.draft().image.has_value());
        REQUIRE(f.controller.draft().report_type == report_types::FullCheck);
    }
    REQUIRE(f.store.size() == 0);
    REQUIRE_FALSE(f.controller.session().has_value());
    REQUIRE_FALSE(f.controller.original_query().has_value());
    REQUIRE(f.controller.analysis_id().empty());
    REQUIRE(f.controller.last_error().empty());
    REQUIRE(f.controller.status() == SessionStatus::Idle);
    REQUIRE_FALSE(f.controller.restart());
}

TEST_CASE("SessionController: reset during a stream closes it", "[session_controller]") {
    ControllerFixture f;
    f.controller.start(ControllerFixture::query());
    auto stream = f.gateway.last();
    f.controller.reset(false);
    REQUIRE(stream->closed);
    stream->frame(StreamFrame::delta("ghost"), true);
    REQUIRE(f.store.size() == 0);
}

TEST_CASE("SessionController: status events follow the state machine", "[session_controller]") {
    ControllerFixture f;
    std::vector<std::string> seen;
    subscribe<SessionStatusEvent>(f.bus, [&](const SessionStatusEvent& ev) {
        seen.push_back(ev.status);
    });
    f.controller.start(ControllerFixture::query());
    f.finish_stream("x");
    f.controller.follow_up("y");
    f.controller.stop();
    f.controller.reset(true);
    REQUIRE(seen == std::vector<std::string>{
        "initiating", "streaming", "complete", "streaming", "stopped", "idle"});
}

// ── randomized invariant ────────────────────────────────────────

TEST_CASE("SessionController: random operation sequences keep one loading message", "[session_controller]") {
    for (unsigned seed = 1; seed <= 20; ++seed) {
        ControllerFixture f;
        std::mt19937 rng(seed);
        std::uniform_int_distribution<int> pick(0, 13);

        for (int step = 0; step < 200; ++step) {
            auto stream = f.gateway.streams.empty() ? nullptr : f.gateway.last();
            switch (pick(rng)) {
                case 0:
                    f.gateway.auto_reply = (rng() % 2) == 0;
                    f.controller.start(ControllerFixture::query());
                    break;
                case 1: f.controller.follow_up("more"); break;
                case 2: f.controller.stop(); break;
                case 3: f.controller.restart(); break;
                case 4: f.controller.reset(rng() % 2 == 0); break;
                case 5: if (stream) stream->frame(StreamFrame::delta("d")); break;
                case 6: if (stream) stream->frame(StreamFrame::snapshot("s")); break;
                case 7: if (stream) stream->frame(StreamFrame::complete()); break;
                case 8: if (stream) stream->frame(StreamFrame::error("ApplicationError", "e")); break;
                case 9: if (stream) stream->fail("net"); break;
                case 10: if (stream) stream->end(); break;
                case 11:
                    if (stream) stream->frame(StreamFrame::delta("late"), true);
                    break;
                case 12:
                    if (!f.gateway.held.empty()) {
                        InitiateReply r;
                        r.ok = (rng() % 3) != 0;
                        r.error = "refused";
                        r.locator.stream_url = "/s";
                        f.gateway.release(r);
                    }
                    break;
                case 13:
                    f.gateway.script = {SSEEvent{"", R"({"delta":"x"})"}};
                    if (rng() % 2) f.gateway.script.push_back(SSEEvent{"complete", "{}"});
                    break;
            }
            f.loop.run_pending();
            REQUIRE(loading_invariant_holds(f.store));
            REQUIRE(f.controller.is_loading() == (f.store.loading_count() == 1));
        }
    }
}
