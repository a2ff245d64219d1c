#pragma once
#include "http_server.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace sift {

class AnalysisGateway;
class ModelCatalog;
class ProviderSource;
class Error;

// Path prefix of one-time stream URLs returned by initiate.
constexpr const char* kStreamPathPrefix = "/api/sift/stream/";

// {"error":{"type":...,"message":...}}
nlohmann::json error_json(const std::string& type, const std::string& message);

// HTTP status for an error crossing the API boundary.
int status_for(const Error& error);

// Routes the HTTP API onto the gateway:
//   GET  /api/health
//   GET  /api/models/config
//   POST /api/sift/initiate
//   GET  /api/sift/stream/<handle>
//   POST /api/sift/chat
class ApiRouter {
public:
    ApiRouter(AnalysisGateway& gateway, const ModelCatalog& catalog,
              const ProviderSource& providers);

    void handle(const HttpRequest& request, ResponseChannel& channel);

private:
    void health(ResponseChannel& channel);
    void models(ResponseChannel& channel);
    void initiate(const HttpRequest& request, ResponseChannel& channel);
    void stream(const std::string& handle, ResponseChannel& channel);
    void chat(const HttpRequest& request, ResponseChannel& channel);

    AnalysisGateway& gateway_;
    const ModelCatalog& catalog_;
    const ProviderSource& providers_;
};

} // namespace sift
