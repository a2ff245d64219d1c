#include <catch2/catch_test_macros.hpp>
#include "client/console_renderer.hpp"
#include "client/message_store.hpp"
#include "event_bus.hpp"
#include <sstream>

using namespace sift;

namespace {

struct RendererFixture {
    EventBus bus;
    MessageStateStore store{&bus};
    std::ostringstream out;
    std::ostringstream diag;
    ConsoleRenderer renderer{bus, store, out, diag};
};

} // namespace

TEST_CASE("ConsoleRenderer: deltas print incrementally", "[console_renderer]") {
    RendererFixture f;
    f.store.append_user("claim");
    f.store.append_placeholder();
    f.store.append_to_active("Hel");
    f.store.append_to_active("lo");
    REQUIRE(f.out.str() == "Hello");
    REQUIRE(f.renderer.tracked() == 1);

    f.store.complete_active();
    REQUIRE(f.out.str() == "Hello\n\n");
}

TEST_CASE("ConsoleRenderer: finished messages are no longer tracked", "[console_renderer]") {
    RendererFixture f;
    for (int i = 0; i < 5; ++i) {
        f.store.append_user("q");
        f.store.append_placeholder();
        f.store.append_to_active("answer");
        f.store.complete_active();
    }
    REQUIRE(f.renderer.tracked() == 0);

    f.store.append_user("q");
    f.store.append_placeholder();
    f.store.append_to_active("partial");
    f.store.stop_all(" [stopped]");
    REQUIRE(f.renderer.tracked() == 0);

    f.store.append_user("q");
    f.store.append_placeholder();
    f.store.fail_active("boom");
    REQUIRE(f.renderer.tracked() == 0);
}

TEST_CASE("ConsoleRenderer: a snapshot reprints the message", "[console_renderer]") {
    RendererFixture f;
    f.store.append_user("claim");
    f.store.append_placeholder();
    f.store.append_to_active("draft");
    f.store.replace_active("final text");
    REQUIRE(f.out.str() == "draft\n---\nfinal text");
}

TEST_CASE("ConsoleRenderer: failures and status lines", "[console_renderer]") {
    RendererFixture f;
    f.store.append_user("claim");
    f.store.append_placeholder();
    f.store.fail_active("An error occurred on the backend.");
    REQUIRE(f.out.str().find("[failed] An error occurred on the backend.") != std::string::npos);

    StreamStatusEvent status;
    status.message = "Searching sources";
    f.bus.publish(status);
    REQUIRE(f.diag.str() == "[status] Searching sources\n");
}
