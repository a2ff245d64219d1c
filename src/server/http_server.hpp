#pragma once
#include "../stream_relay.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace sift {

// A parsed inbound HTTP request.
struct HttpRequest {
    std::string method;   // "GET", "POST", ...
    std::string path;     // e.g. "/api/sift/initiate"
    std::map<std::string, std::string> query_params;  // URL-decoded query parameters
    std::map<std::string, std::string> headers;        // header names lowercased
    std::string body;

    // Return a query parameter value, or "" if absent.
    std::string query_param(const std::string& key) const;
};

struct ServerResponse {
    int         status       = 200;
    std::string content_type = "application/json";
    std::string body;
};

// Write side of one connection. A handler either sends one complete
// response or switches the connection to an event stream.
class ResponseChannel {
public:
    virtual ~ResponseChannel() = default;

    virtual void respond(const ServerResponse& response) = 0;

    // Send event-stream headers and return the frame sink for the rest of the
    // request. Only valid once per request, and not after respond().
    virtual FrameSink& begin_event_stream() = 0;
};

// Frame sink over a connected socket. Each frame is sent in full before
// write() returns; disconnect is detected by a failed send or by polling
// the socket for hang-up.
class SocketFrameSink : public FrameSink {
public:
    explicit SocketFrameSink(int fd);

    bool write(const StreamFrame& frame) override;
    bool connected() const override;

private:
    int fd_;
    mutable std::atomic<bool> closed_{false};
};

// Minimal HTTP/1.1 server. Each accepted connection gets its own thread, so
// long-lived event streams do not block other requests. Every response is
// sent with "Connection: close".
class HttpServer {
public:
    using Handler = std::function<void(const HttpRequest&, ResponseChannel&)>;

    // listen_addr: "host:port", e.g. "127.0.0.1:4567"
    // max_body:    maximum POST body size in bytes; larger bodies get 413
    HttpServer(std::string listen_addr, uint32_t max_body, Handler handler);
    ~HttpServer();

    // Start background accept thread. Returns false and populates error on failure.
    bool start(std::string& error);

    // Stop accepting, disconnect open streams and wait for connection threads.
    void stop();

    // Port actually bound (useful with port 0)
    uint16_t port() const { return bound_port_; }

private:
    void accept_loop();
    void handle_connection(int client_fd) const;
    void connection_thread(int client_fd);

    std::string listen_addr_;
    uint32_t    max_body_;
    Handler     handler_;

    int  server_fd_        = -1;
    int  shutdown_pipe_[2] = {-1, -1};
    uint16_t bound_port_   = 0;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex conn_mutex_;
    std::condition_variable conn_cv_;
    std::set<int> connections_;
};

// Parse "host:port" into host and port.  Returns false if the string is
// malformed or the port is out of range (0 is allowed: pick any free port).
bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port);

// Serialize a complete response with Content-Length and Connection: close.
std::string format_http_response(const ServerResponse& response);

// Status line + headers that open an event stream.
std::string event_stream_headers();

} // namespace sift
