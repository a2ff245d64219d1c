#include "gateway_client.hpp"
#include "event_loop.hpp"
#include "http_transport.hpp"
#include "../errors.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace sift {

static const std::vector<Header> kJsonHeaders = {
    {"Content-Type", "application/json"},
    {"Accept", "application/json"}
};

static const std::vector<Header> kStreamHeaders = {
    {"Content-Type", "application/json"},
    {"Accept", "text/event-stream"}
};

HttpGatewayClient::HttpGatewayClient(std::string server_url, HttpClient& http,
                                     EventLoop& loop)
    : server_url_(std::move(server_url)), http_(http), loop_(loop) {
    while (!server_url_.empty() && server_url_.back() == '/') server_url_.pop_back();
}

HttpGatewayClient::~HttpGatewayClient() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto& w : workers_) {
        if (w.thread.joinable()) w.thread.join();
    }
}

std::string HttpGatewayClient::resolve(const std::string& path) const {
    if (path.rfind("http://", 0) == 0 || path.rfind("https://", 0) == 0) return path;
    if (!path.empty() && path[0] == '/') return server_url_ + path;
    return server_url_ + "/" + path;
}

InitiateReply HttpGatewayClient::initiate_blocking(const AnalysisQuery& query) {
    InitiateReply reply;
    AnalysisQuery wire = query;
    if (wire.image && wire.image->data.empty()) {
        // The server only accepts inline image data.
        try {
            wire.image->data = wire.image->base64();
            wire.image->path.clear();
        } catch (const std::exception& e) {
            reply.error = e.what();
            reply.error_type = "ValidationError";
            return reply;
        }
    }

    HttpResponse resp = http_.post(resolve("/api/sift/initiate"),
                                   query_to_json(wire).dump(), kJsonHeaders);
    if (resp.status_code == 0) {
        reply.error = "Cannot reach the analysis server: " +
                      (resp.error.empty() ? std::string("no response") : resp.error);
        reply.error_type = "GatewayError";
        return reply;
    }
    if (!is_success(resp)) {
        reply.error = describe_http_failure(resp);
        reply.error_type = "GatewayError";
        try {
            auto j = json::parse(resp.body);
            if (j.contains("error") && j["error"].is_object() &&
                j["error"].contains("type") && j["error"]["type"].is_string())
                reply.error_type = j["error"]["type"].get<std::string>();
        } catch (const json::parse_error&) { // NOLINT(bugprone-empty-catch)
            // non-JSON error body keeps the generic type
        }
        return reply;
    }

    try {
        auto j = json::parse(resp.body);
        reply.locator.stream_url = j.at("streamUrl").get<std::string>();
        reply.locator.session_id = j.value("sessionId", "");
        reply.locator.analysis_id = j.value("analysisId", "");
        reply.ok = true;
    } catch (const json::exception& e) {
        reply.error = std::string("Unexpected initiate response: ") + e.what();
        reply.error_type = "GatewayError";
    }
    return reply;
}

size_t HttpGatewayClient::reap_workers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto it = workers_.begin();
    while (it != workers_.end()) {
        if (it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
    return workers_.size();
}

void HttpGatewayClient::initiate(const AnalysisQuery& query, InitiateCallback done) {
    reap_workers();
    auto finished = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(workers_mutex_);
    Worker worker;
    worker.done = finished;
    worker.thread = std::thread([this, query, finished, done = std::move(done)]() {
        InitiateReply reply = initiate_blocking(query);
        if (!reply.ok) {
            std::cerr << "[gateway] Initiate failed: " << reply.error << "\n";
        }
        loop_.post([done, reply]() { done(reply); });
        finished->store(true);
    });
    workers_.push_back(std::move(worker));
}

std::unique_ptr<StreamTransport> HttpGatewayClient::open_stream(const StreamLocator& locator) {
    return std::make_unique<HttpStreamTransport>(
        loop_, http_, "GET", resolve(locator.stream_url), "",
        std::vector<Header>{{"Accept", "text/event-stream"}});
}

std::unique_ptr<StreamTransport> HttpGatewayClient::open_chat(const ChatRequest& request) {
    return std::make_unique<HttpStreamTransport>(
        loop_, http_, "POST", resolve("/api/sift/chat"),
        chat_request_to_json(request).dump(), kStreamHeaders);
}

std::vector<ModelInfo> HttpGatewayClient::fetch_models() {
    HttpResponse resp = http_.get(resolve("/api/models/config"), kJsonHeaders);
    if (!is_success(resp)) {
        throw GatewayError("Cannot list models: " + describe_http_failure(resp));
    }
    std::vector<ModelInfo> models;
    try {
        auto j = json::parse(resp.body);
        for (const auto& entry : j.at("models")) {
            models.push_back(model_from_json(entry));
        }
    } catch (const std::exception& e) {
        throw GatewayError(std::string("Unexpected models response: ") + e.what());
    }
    return models;
}

} // namespace sift
