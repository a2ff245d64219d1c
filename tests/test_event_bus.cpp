#include <catch2/catch_test_macros.hpp>
#include "event_bus.hpp"
#include <vector>

using namespace sift;

// ── Basic publish / subscribe ───────────────────────────────────

TEST_CASE("EventBus: subscribe and publish", "[event_bus]") {
    EventBus bus;
    int count = 0;
    bus.subscribe(MessageAppendedEvent::TAG, [&](const Event&) { count++; });

    MessageAppendedEvent ev;
    ev.message_id = 3;
    bus.publish(ev);
    REQUIRE(count == 1);
}

TEST_CASE("EventBus: subscribers called in registration order", "[event_bus]") {
    EventBus bus;
    std::vector<int> order;
    for (int i = 1; i <= 3; ++i) {
        bus.subscribe(SessionStatusEvent::TAG, [&order, i](const Event&) { order.push_back(i); });
    }
    bus.publish(SessionStatusEvent{});
    REQUIRE(order == std::vector<int>{1, 2, 3});
}

TEST_CASE("EventBus: other tags are not delivered", "[event_bus]") {
    EventBus bus;
    int count = 0;
    bus.subscribe(ErrorRaisedEvent::TAG, [&](const Event&) { count++; });
    bus.publish(StreamStatusEvent{});
    bus.publish(MessagesResetEvent{});
    REQUIRE(count == 0);
}

TEST_CASE("EventBus: publish with no subscribers is a no-op", "[event_bus]") {
    EventBus bus;
    REQUIRE_NOTHROW(bus.publish(AnalysisIdChangedEvent{}));
}

// ── Typed helper ─────────────────────────────────────────────────

TEST_CASE("subscribe<E>: handler receives the concrete event", "[event_bus]") {
    EventBus bus;
    std::string seen;
    uint64_t appended_id = 0;
    subscribe<MessageUpdatedEvent>(bus, [&](const MessageUpdatedEvent& e) {
        seen = e.appended;
        appended_id = e.message_id;
    });

    MessageUpdatedEvent ev;
    ev.message_id = 9;
    ev.appended = "more text";
    bus.publish(ev);
    REQUIRE(seen == "more text");
    REQUIRE(appended_id == 9);
}

// ── Unsubscribe ──────────────────────────────────────────────────

TEST_CASE("EventBus: unsubscribe stops delivery", "[event_bus]") {
    EventBus bus;
    int count = 0;
    uint64_t id = bus.subscribe(ErrorRaisedEvent::TAG, [&](const Event&) { count++; });
    REQUIRE(bus.subscriber_count(ErrorRaisedEvent::TAG) == 1);

    REQUIRE(bus.unsubscribe(id));
    REQUIRE_FALSE(bus.unsubscribe(id));
    REQUIRE(bus.subscriber_count(ErrorRaisedEvent::TAG) == 0);

    bus.publish(ErrorRaisedEvent{});
    REQUIRE(count == 0);
}

TEST_CASE("EventBus: handler unsubscribed mid-publish is skipped", "[event_bus]") {
    EventBus bus;
    int second_calls = 0;
    uint64_t second = 0;
    bus.subscribe(MessagesResetEvent::TAG, [&](const Event&) { bus.unsubscribe(second); });
    second = bus.subscribe(MessagesResetEvent::TAG, [&](const Event&) { second_calls++; });

    bus.publish(MessagesResetEvent{});
    REQUIRE(second_calls == 0);
}

TEST_CASE("EventBus: handler may subscribe during publish", "[event_bus]") {
    EventBus bus;
    int late_calls = 0;
    bus.subscribe(StreamStatusEvent::TAG, [&](const Event&) {
        bus.subscribe(StreamStatusEvent::TAG, [&](const Event&) { late_calls++; });
    });
    bus.publish(StreamStatusEvent{});
    REQUIRE(late_calls == 0);
    bus.publish(StreamStatusEvent{});
    REQUIRE(late_calls == 1);
}

TEST_CASE("EventBus: clear removes everything", "[event_bus]") {
    EventBus bus;
    bus.subscribe(MessageAppendedEvent::TAG, [](const Event&) {});
    bus.subscribe(ErrorRaisedEvent::TAG, [](const Event&) {});
    bus.clear();
    REQUIRE(bus.subscriber_count(MessageAppendedEvent::TAG) == 0);
    REQUIRE(bus.subscriber_count(ErrorRaisedEvent::TAG) == 0);
}

// ── ScopedSubscriptions ──────────────────────────────────────────

TEST_CASE("ScopedSubscriptions: unsubscribes on destruction", "[event_bus]") {
    EventBus bus;
    int count = 0;
    {
        ScopedSubscriptions subs(bus);
        subs.add<ErrorRaisedEvent>([&](const ErrorRaisedEvent&) { count++; });
        subs.add<SessionStatusEvent>([&](const SessionStatusEvent&) { count++; });
        bus.publish(ErrorRaisedEvent{});
        REQUIRE(count == 1);
    }
    bus.publish(ErrorRaisedEvent{});
    bus.publish(SessionStatusEvent{});
    REQUIRE(count == 1);
    REQUIRE(bus.subscriber_count(SessionStatusEvent::TAG) == 0);
}

TEST_CASE("ScopedSubscriptions: reset is reusable", "[event_bus]") {
    EventBus bus;
    ScopedSubscriptions subs(bus);
    subs.add<StreamStatusEvent>([](const StreamStatusEvent&) {});
    subs.reset();
    REQUIRE(bus.subscriber_count(StreamStatusEvent::TAG) == 0);
    subs.add<StreamStatusEvent>([](const StreamStatusEvent&) {});
    REQUIRE(bus.subscriber_count(StreamStatusEvent::TAG) == 1);
}
