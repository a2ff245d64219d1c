#include <catch2/catch_test_macros.hpp>
#include "frame.hpp"
#include "http.hpp"
#include "server/http_server.hpp"
#include <arpa/inet.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <nlohmann/json.hpp>
#include <netinet/in.h>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace sift;
using json = nlohmann::json;

// ── Helpers ──────────────────────────────────────────────────────

TEST_CASE("parse_listen_addr: host and port", "[http_server]") {
    std::string host;
    uint16_t port = 1;
    REQUIRE(parse_listen_addr("127.0.0.1:4567", host, port));
    REQUIRE(host == "127.0.0.1");
    REQUIRE(port == 4567);
    REQUIRE(parse_listen_addr("localhost:0", host, port));
    REQUIRE(port == 0);

    REQUIRE_FALSE(parse_listen_addr("4567", host, port));
    REQUIRE_FALSE(parse_listen_addr(":4567", host, port));
    REQUIRE_FALSE(parse_listen_addr("host:", host, port));
    REQUIRE_FALSE(parse_listen_addr("host:70000", host, port));
    REQUIRE_FALSE(parse_listen_addr("host:12a", host, port));
}

TEST_CASE("format_http_response: status line and length", "[http_server]") {
    std::string wire = format_http_response({404, "application/json", "{}"});
    REQUIRE(wire.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);
    REQUIRE(wire.find("Content-Length: 2\r\n") != std::string::npos);
    REQUIRE(wire.find("Connection: close\r\n") != std::string::npos);
    REQUIRE(wire.substr(wire.size() - 6) == "\r\n\r\n{}");
}

TEST_CASE("event_stream_headers: no caching or buffering", "[http_server]") {
    std::string h = event_stream_headers();
    REQUIRE(h.find("Content-Type: text/event-stream") != std::string::npos);
    REQUIRE(h.find("Cache-Control: no-cache") != std::string::npos);
    REQUIRE(h.substr(h.size() - 4) == "\r\n\r\n");
}

// ── Live server ──────────────────────────────────────────────────

namespace {

struct LiveServer {
    HttpServer server;
    PlatformHttpClient http;

    explicit LiveServer(HttpServer::Handler handler)
        : server("127.0.0.1:0", 4096, std::move(handler)) {
        http_init();
        std::string error;
        if (!server.start(error)) throw std::runtime_error(error);
    }
    ~LiveServer() { server.stop(); }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(server.port()) + path;
    }
};

} // namespace

TEST_CASE("HttpServer: request parsing reaches the handler", "[http_server]") {
    LiveServer live([](const HttpRequest& req, ResponseChannel& ch) {
        json echo = {{"method", req.method},
                     {"path", req.path},
                     {"q", req.query_param("q")},
                     {"header", req.headers.count("x-test") ? req.headers.at("x-test") : ""},
                     {"body", req.body}};
        ch.respond({200, "application/json", echo.dump()});
    });
    REQUIRE(live.server.port() != 0);

    auto resp = live.http.post(live.url("/api/echo?q=a%20b"), R"({"k":1})",
                               {{"Content-Type", "application/json"}, {"X-Test", "yes"}});
    REQUIRE(resp.status_code == 200);
    auto echo = json::parse(resp.body);
    REQUIRE(echo["method"] == "POST");
    REQUIRE(echo["path"] == "/api/echo");
    REQUIRE(echo["q"] == "a b");
    REQUIRE(echo["header"] == "yes");
    REQUIRE(echo["body"] == R"({"k":1})");
}

TEST_CASE("HttpServer: a handler that never responds yields 500", "[http_server]") {
    LiveServer live([](const HttpRequest&, ResponseChannel&) {});
    auto resp = live.http.get(live.url("/"), {});
    REQUIRE(resp.status_code == 500);
}

TEST_CASE("HttpServer: event stream frames reach a streaming client", "[http_server]") {
    LiveServer live([](const HttpRequest&, ResponseChannel& ch) {
        FrameSink& sink = ch.begin_event_stream();
        sink.write(StreamFrame::delta("one "));
        sink.write(StreamFrame::delta("two"));
        sink.write(StreamFrame::complete());
    });

    std::string body;
    auto resp = live.http.stream("GET", live.url("/stream"), "", {{"Accept", "text/event-stream"}},
                                 [&](const char* data, size_t len) {
                                     body.append(data, len);
                                     return true;
                                 });
    REQUIRE(resp.status_code == 200);

    std::vector<StreamFrame> frames;
    SSEParser parser;
    parser.feed(body, [&](const SSEEvent& ev) {
        frames.push_back(decode_frame(ev));
        return true;
    });
    REQUIRE(frames.size() == 3);
    REQUIRE(frames[0].text == "one ");
    REQUIRE(frames[2].kind == FrameKind::Complete);
}

TEST_CASE("HttpServer: stop disconnects a waiting stream", "[http_server]") {
    std::atomic<bool> saw_disconnect{false};
    auto live = std::make_unique<LiveServer>([&](const HttpRequest&, ResponseChannel& ch) {
        FrameSink& sink = ch.begin_event_stream();
        sink.write(StreamFrame::status("waiting"));
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (sink.connected() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        saw_disconnect = !sink.connected();
    });

    PlatformHttpClient http;
    std::atomic<bool> got_first{false};
    std::thread reader([&] {
        http.stream("GET", live->url("/wait"), "", {},
                    [&](const char*, size_t) {
                        got_first = true;
                        return true;
                    }, nullptr, 10);
    });
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!got_first && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    REQUIRE(got_first);

    live.reset();
    reader.join();
    REQUIRE(saw_disconnect);
}

TEST_CASE("HttpServer: teardown with half-read requests in flight", "[http_server]") {
    for (int round = 0; round < 50; ++round) {
        auto live = std::make_unique<LiveServer>([](const HttpRequest&, ResponseChannel& ch) {
            ch.respond({200, "text/plain", "ok"});
        });
        std::vector<int> clients;
        for (int i = 0; i < 8; ++i) {
            int fd = ::socket(AF_INET, SOCK_STREAM, 0);
            REQUIRE(fd >= 0);
            struct sockaddr_in sa{};
            sa.sin_family = AF_INET;
            sa.sin_port = htons(live->server.port());
            ::inet_pton(AF_INET, "127.0.0.1", &sa.sin_addr);
            if (::connect(fd, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) == 0) {
                const char partial[] = "POST /api/sift/chat HTTP/1.1\r\nHost: x\r\n";
                ssize_t n = ::send(fd, partial, sizeof(partial) - 1, 0);
                (void)n;
            }
            clients.push_back(fd);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        live.reset();
        for (int fd : clients) ::close(fd);
    }
    SUCCEED();
}
