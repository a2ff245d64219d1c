#pragma once
#include "transport.hpp"
#include "../gateway.hpp"
#include "../http.hpp"
#include "../model_catalog.hpp"
#include "../query.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace sift {

class EventLoop;

// Where a freshly initiated analysis can be subscribed.
struct StreamLocator {
    std::string stream_url; // absolute, or relative to the server
    std::string session_id;
    std::string analysis_id; // empty when the server does not persist
};

struct InitiateReply {
    bool ok = false;
    StreamLocator locator;
    std::string error;       // readable message when !ok
    std::string error_type;
};

using InitiateCallback = std::function<void(const InitiateReply&)>;

// Client view of the analysis gateway.
class GatewayClient {
public:
    virtual ~GatewayClient() = default;

    // Request a session. done runs once, on the event loop thread.
    virtual void initiate(const AnalysisQuery& query, InitiateCallback done) = 0;

    // A transport for the one-time stream behind locator. Not yet opened.
    virtual std::unique_ptr<StreamTransport> open_stream(const StreamLocator& locator) = 0;

    // A transport whose body is the chat response stream. Not yet opened.
    virtual std::unique_ptr<StreamTransport> open_chat(const ChatRequest& request) = 0;
};

// GatewayClient over the server's HTTP API.
class HttpGatewayClient : public GatewayClient {
public:
    HttpGatewayClient(std::string server_url, HttpClient& http, EventLoop& loop);
    ~HttpGatewayClient() override;

    HttpGatewayClient(const HttpGatewayClient&) = delete;
    HttpGatewayClient& operator=(const HttpGatewayClient&) = delete;

    void initiate(const AnalysisQuery& query, InitiateCallback done) override;
    std::unique_ptr<StreamTransport> open_stream(const StreamLocator& locator) override;
    std::unique_ptr<StreamTransport> open_chat(const ChatRequest& request) override;

    // Blocking. Throws GatewayError if the server cannot be reached.
    std::vector<ModelInfo> fetch_models();

    // Blocking POST of an initiate body; exposed for tests.
    InitiateReply initiate_blocking(const AnalysisQuery& query);

    std::string resolve(const std::string& path) const;

    // Joins finished initiate workers; returns how many are still running.
    size_t reap_workers();

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::string server_url_;
    HttpClient& http_;
    EventLoop& loop_;
    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

} // namespace sift
