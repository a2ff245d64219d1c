#include "http_transport.hpp"
#include "event_loop.hpp"
#include "../util.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

namespace sift {

std::string describe_http_failure(const HttpResponse& response) {
    if (response.status_code == 0) {
        return response.error.empty() ? "no response from server" : response.error;
    }
    try {
        auto j = nlohmann::json::parse(response.body);
        if (j.is_object() && j.contains("error")) {
            const auto& err = j["error"];
            if (err.is_object() && err.contains("message") && err["message"].is_string())
                return err["message"].get<std::string>();
            if (err.is_string()) return err.get<std::string>();
        }
    } catch (const nlohmann::json::parse_error&) { // NOLINT(bugprone-empty-catch)
        // not a JSON error body
    }
    return "HTTP " + std::to_string(response.status_code);
}

HttpStreamTransport::HttpStreamTransport(EventLoop& loop, HttpClient& http,
                                         std::string method, std::string url,
                                         std::string body, std::vector<Header> headers,
                                         long timeout_seconds)
    : loop_(loop), http_(http), method_(std::move(method)), url_(std::move(url)),
      body_(std::move(body)), headers_(std::move(headers)),
      timeout_seconds_(timeout_seconds), shared_(std::make_shared<Shared>()) {}

HttpStreamTransport::~HttpStreamTransport() {
    close();
    if (worker_.joinable()) worker_.join();
}

void HttpStreamTransport::open(TransportCallbacks callbacks) {
    if (worker_.joinable()) return;
    shared_->callbacks = std::move(callbacks);
    worker_ = std::thread([this]() { read_body(); });
}

void HttpStreamTransport::close() {
    shared_->closed = true;
    cancel_.cancel();
}

void HttpStreamTransport::deliver(std::function<void(const TransportCallbacks&)> fn) {
    auto shared = shared_;
    loop_.post([shared, fn = std::move(fn)]() {
        if (shared->closed) return;
        fn(shared->callbacks);
    });
}

void HttpStreamTransport::read_body() {
    SSEParser parser;
    auto on_chunk = [this, &parser](const char* data, size_t len) {
        parser.feed(std::string(data, len), [this](const SSEEvent& event) {
            deliver([event](const TransportCallbacks& cb) {
                if (cb.on_event) cb.on_event(event);
            });
            return true;
        });
        return !cancel_.cancelled();
    };

    HttpResponse resp = http_.stream(method_, url_, body_, headers_, on_chunk,
                                     &cancel_, timeout_seconds_);
    if (resp.cancelled || cancel_.cancelled()) return;

    if (!is_success(resp)) {
        std::string error = describe_http_failure(resp);
        std::cerr << "[http] Stream " << truncate_for_log(url_) << " failed: "
                  << error << "\n";
        deliver([error](const TransportCallbacks& cb) {
            if (cb.on_failure) cb.on_failure(error);
        });
        return;
    }
    if (parser.has_pending()) {
        std::cerr << "[http] Stream ended inside an event\n";
    }
    deliver([](const TransportCallbacks& cb) {
        if (cb.on_end) cb.on_end();
    });
}

} // namespace sift
