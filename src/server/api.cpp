#include "api.hpp"
#include "../errors.hpp"
#include "../gateway.hpp"
#include "../model_catalog.hpp"
#include "../util.hpp"
#include <iostream>

using json = nlohmann::json;

namespace sift {

json error_json(const std::string& type, const std::string& message) {
    return {{"error", {{"type", type}, {"message", message}}}};
}

int status_for(const Error& error) {
    if (dynamic_cast<const ValidationError*>(&error)) return 400;
    if (error.type() == "NotFound") return 404;
    if (dynamic_cast<const GatewayError*>(&error)) return 503;
    return 500;
}

static ServerResponse json_response(int status, const json& body) {
    return {status, "application/json", body.dump()};
}

static void respond_error(ResponseChannel& channel, int status,
                          const std::string& type, const std::string& message) {
    channel.respond(json_response(status, error_json(type, message)));
}

static json parse_body(const HttpRequest& request) {
    try {
        return json::parse(request.body);
    } catch (const json::parse_error&) {
        throw ValidationError("Request body is not valid JSON");
    }
}

ApiRouter::ApiRouter(AnalysisGateway& gateway, const ModelCatalog& catalog,
                     const ProviderSource& providers)
    : gateway_(gateway), catalog_(catalog), providers_(providers) {}

void ApiRouter::handle(const HttpRequest& request, ResponseChannel& channel) {
    const std::string& path = request.path;
    auto expect = [&](const char* method) {
        if (request.method == method) return true;
        respond_error(channel, 405, "MethodNotAllowed",
                      request.method + " not allowed on " + path);
        return false;
    };

    try {
        if (path == "/api/health") {
            if (expect("GET")) health(channel);
        } else if (path == "/api/models/config") {
            if (expect("GET")) models(channel);
        } else if (path == "/api/sift/initiate") {
            if (expect("POST")) initiate(request, channel);
        } else if (path == "/api/sift/chat") {
            if (expect("POST")) chat(request, channel);
        } else if (path.rfind(kStreamPathPrefix, 0) == 0 &&
                   path.size() > std::string(kStreamPathPrefix).size()) {
            if (expect("GET")) stream(path.substr(std::string(kStreamPathPrefix).size()), channel);
        } else {
            respond_error(channel, 404, "NotFound", "No route for " + path);
        }
    } catch (const Error& e) {
        std::cerr << "[server] " << request.method << " " << path << " -> "
                  << e.type() << ": " << e.what() << "\n";
        respond_error(channel, status_for(e), e.type(), e.what());
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[server] " << request.method << " " << path << " -> " << e.what() << "\n";
        respond_error(channel, 400, "ValidationError", e.what());
    }
}

void ApiRouter::health(ResponseChannel& channel) {
    channel.respond(json_response(200, {{"message", "OK"}, {"timestamp", timestamp_now()}}));
}

void ApiRouter::models(ResponseChannel& channel) {
    json list = json::array();
    auto usable = catalog_.available(
        [this](const std::string& provider) { return providers_.available(provider); });
    for (const auto& model : usable) {
        list.push_back(model_to_json(model));
    }
    channel.respond(json_response(200, {{"models", list}}));
}

void ApiRouter::initiate(const HttpRequest& request, ResponseChannel& channel) {
    AnalysisQuery query = query_from_json(parse_body(request));
    InitiateResult result = gateway_.initiate(query);

    json body = {
        {"streamUrl", kStreamPathPrefix + result.handle},
        {"sessionId", result.session_id}
    };
    if (!result.analysis_id.empty()) body["analysisId"] = result.analysis_id;
    channel.respond(json_response(200, body));
}

void ApiRouter::stream(const std::string& handle, ResponseChannel& channel) {
    // Errors before the event stream opens are plain JSON responses.
    PreparedStream prepared = gateway_.claim(handle);
    FrameSink& sink = channel.begin_event_stream();
    gateway_.run(prepared, sink);
}

void ApiRouter::chat(const HttpRequest& request, ResponseChannel& channel) {
    ChatRequest chat_request = chat_request_from_json(parse_body(request));
    PreparedStream prepared = gateway_.prepare_chat(chat_request);
    FrameSink& sink = channel.begin_event_stream();
    gateway_.run(prepared, sink);
}

} // namespace sift
