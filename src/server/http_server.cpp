#include "http_server.hpp"
#include "../util.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

// MSG_NOSIGNAL prevents SIGPIPE on Linux; macOS uses SO_NOSIGPIPE per-socket.
#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

namespace sift {

// ── URL helpers ───────────────────────────────────────────────────────────────

static std::string url_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            char hex[3] = {s[i + 1], s[i + 2], '\0'};
            char* end;
            long val = std::strtol(hex, &end, 16);
            if (end == hex + 2) {
                out += static_cast<char>(val);
                i += 2;
                continue;
            }
        } else if (s[i] == '+') {
            out += ' ';
            continue;
        }
        out += s[i];
    }
    return out;
}

static std::map<std::string, std::string> parse_query_string(const std::string& qs) {
    std::map<std::string, std::string> result;
    for (const auto& pair : split(qs, '&')) {
        auto eq = pair.find('=');
        if (eq != std::string::npos) {
            result[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
        } else if (!pair.empty()) {
            result[url_decode(pair)] = "";
        }
    }
    return result;
}

std::string HttpRequest::query_param(const std::string& key) const {
    auto it = query_params.find(key);
    return it != query_params.end() ? it->second : "";
}

// ── Address parsing ───────────────────────────────────────────────────────────

bool parse_listen_addr(const std::string& addr, std::string& host, uint16_t& port) {
    auto pos = addr.rfind(':');
    if (pos == std::string::npos || pos == 0) return false;
    host = addr.substr(0, pos);
    if (host.empty()) return false;
    std::string digits = addr.substr(pos + 1);
    if (digits.empty() || digits.size() > 5) return false;
    for (char c : digits) {
        if (c < '0' || c > '9') return false;
    }
    int p = std::stoi(digits);
    if (p > 65535) return false;
    port = static_cast<uint16_t>(p);
    return true;
}

// ── HTTP helpers ──────────────────────────────────────────────────────────────

static const char* reason_phrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "OK";
    }
}

std::string format_http_response(const ServerResponse& response) {
    return "HTTP/1.1 " + std::to_string(response.status) + " " +
           reason_phrase(response.status) + "\r\n"
           "Content-Type: " + response.content_type + "\r\n"
           "Content-Length: " + std::to_string(response.body.size()) + "\r\n"
           "Connection: close\r\n\r\n" + response.body;
}

std::string event_stream_headers() {
    return "HTTP/1.1 200 OK\r\n"
           "Content-Type: text/event-stream\r\n"
           "Cache-Control: no-cache\r\n"
           "Connection: close\r\n"
           "X-Accel-Buffering: no\r\n\r\n";
}

static bool send_all(int fd, const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        sent += static_cast<size_t>(n);
    }
    return true;
}

static std::string json_error(const std::string& type, const std::string& message) {
    // Fixed messages only; no escaping needed.
    return "{\"error\":{\"type\":\"" + type + "\",\"message\":\"" + message + "\"}}";
}

// ── SocketFrameSink ───────────────────────────────────────────────────────────

SocketFrameSink::SocketFrameSink(int fd) : fd_(fd) {}

bool SocketFrameSink::write(const StreamFrame& frame) {
    if (closed_.load()) return false;
    if (!send_all(fd_, encode_frame(frame))) {
        closed_.store(true);
        return false;
    }
    return true;
}

bool SocketFrameSink::connected() const {
    if (closed_.load()) return false;

    struct pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
#ifdef POLLRDHUP
    pfd.events |= POLLRDHUP;
#endif
    if (::poll(&pfd, 1, 0) <= 0) return true;

    short gone = POLLHUP | POLLERR | POLLNVAL;
#ifdef POLLRDHUP
    gone |= POLLRDHUP;
#endif
    if (pfd.revents & gone) {
        closed_.store(true);
        return false;
    }
    if (pfd.revents & POLLIN) {
        // Clients send nothing after the request; readable means EOF or reset.
        char b;
        ssize_t n = ::recv(fd_, &b, 1, MSG_PEEK | MSG_DONTWAIT);
        if (n == 0 || (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK)) {
            closed_.store(true);
            return false;
        }
    }
    return true;
}

// ── SocketResponseChannel ─────────────────────────────────────────────────────

class SocketResponseChannel : public ResponseChannel {
public:
    explicit SocketResponseChannel(int fd) : fd_(fd), sink_(fd) {}

    void respond(const ServerResponse& response) override {
        if (state_ != State::Fresh) {
            throw std::logic_error("response already started");
        }
        state_ = State::Responded;
        send_all(fd_, format_http_response(response));
    }

    FrameSink& begin_event_stream() override {
        if (state_ != State::Fresh) {
            throw std::logic_error("response already started");
        }
        state_ = State::Streaming;
        send_all(fd_, event_stream_headers());
        return sink_;
    }

    bool started() const { return state_ != State::Fresh; }

private:
    enum class State { Fresh, Responded, Streaming };
    int fd_;
    SocketFrameSink sink_;
    State state_ = State::Fresh;
};

// ── HttpServer ────────────────────────────────────────────────────────────────

HttpServer::HttpServer(std::string listen_addr, uint32_t max_body, Handler handler)
    : listen_addr_(std::move(listen_addr))
    , max_body_(max_body)
    , handler_(std::move(handler))
{}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(std::string& error) {
    std::string host;
    uint16_t port;
    if (!parse_listen_addr(listen_addr_, host, port)) {
        error = "Invalid listen address: " + listen_addr_;
        return false;
    }

    if (::pipe(shutdown_pipe_) != 0) {
        error = "Failed to create shutdown pipe";
        return false;
    }

    auto fail = [&](const std::string& msg) {
        error = msg;
        if (server_fd_ >= 0) { ::close(server_fd_); server_fd_ = -1; }
        ::close(shutdown_pipe_[0]); shutdown_pipe_[0] = -1;
        ::close(shutdown_pipe_[1]); shutdown_pipe_[1] = -1;
        return false;
    };

    server_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd_ < 0) return fail("Failed to create server socket");

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

#ifdef SO_NOSIGPIPE  // macOS
    ::setsockopt(server_fd_, SOL_SOCKET, SO_NOSIGPIPE, &opt, sizeof(opt));
#endif

    struct sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port   = htons(port);
    if (::inet_pton(AF_INET, host.c_str(), &sa.sin_addr) != 1) {
        return fail("Invalid bind address: " + host);
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&sa), sizeof(sa)) != 0) {
        return fail(std::string("bind failed: ") + std::strerror(errno));
    }

    if (::listen(server_fd_, 64) != 0) {
        return fail("listen failed");
    }

    socklen_t len = sizeof(sa);
    if (::getsockname(server_fd_, reinterpret_cast<sockaddr*>(&sa), &len) == 0) {
        bound_port_ = ntohs(sa.sin_port);
    }

    running_.store(true);
    thread_ = std::thread([this]() { accept_loop(); });
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) return;
    char b = 0;
    if (shutdown_pipe_[1] >= 0) {
        ssize_t n = ::write(shutdown_pipe_[1], &b, 1);
        (void)n;
    }
    if (thread_.joinable()) thread_.join();

    // Open streams see a hang-up and their relays abort.
    std::unique_lock<std::mutex> lock(conn_mutex_);
    for (int fd : connections_) ::shutdown(fd, SHUT_RDWR);
    conn_cv_.wait(lock, [this] { return connections_.empty(); });
    lock.unlock();

    if (server_fd_ >= 0)         { ::close(server_fd_);         server_fd_ = -1; }
    if (shutdown_pipe_[0] >= 0)  { ::close(shutdown_pipe_[0]);  shutdown_pipe_[0] = -1; }
    if (shutdown_pipe_[1] >= 0)  { ::close(shutdown_pipe_[1]);  shutdown_pipe_[1] = -1; }
}

void HttpServer::accept_loop() {
    while (running_.load()) {
        struct pollfd fds[2];
        fds[0].fd = server_fd_;         fds[0].events = POLLIN;
        fds[1].fd = shutdown_pipe_[0];  fds[1].events = POLLIN;

        int ret = ::poll(fds, 2, 1000);
        if (ret <= 0) continue;              // timeout or transient error
        if (fds[1].revents & POLLIN) break;  // shutdown signal
        if (!(fds[0].revents & POLLIN)) continue;

        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int cfd = ::accept(server_fd_, reinterpret_cast<sockaddr*>(&peer), &plen);
        if (cfd < 0) continue;

        struct timeval tv{10, 0};  // 10s recv timeout while reading the request
        ::setsockopt(cfd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        {
            std::lock_guard<std::mutex> lock(conn_mutex_);
            connections_.insert(cfd);
        }
        std::thread([this, cfd]() { connection_thread(cfd); }).detach();
    }
}

void HttpServer::connection_thread(int fd) {
    try {
        handle_connection(fd);
    } catch (const std::exception& e) {
        std::cerr << "[server] Connection handler failed: " << e.what() << "\n";
    }
    {
        // Erase before close so a reused descriptor number is never dropped.
        std::lock_guard<std::mutex> lock(conn_mutex_);
        connections_.erase(fd);
        ::close(fd);
        // Notify under the lock: stop() may return and destroy the server
        // as soon as the lock is released.
        conn_cv_.notify_all();
    }
}

void HttpServer::handle_connection(int fd) const {
    // Read until end-of-headers (CRLFCRLF), cap at 16 KB.
    std::string buf;
    buf.reserve(4096);
    char tmp[4096];

    while (buf.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        buf.append(tmp, static_cast<size_t>(n));
        if (buf.size() > 16384) {
            send_all(fd, format_http_response(
                {400, "application/json", json_error("ValidationError", "Headers too large")}));
            return;
        }
    }

    auto hdr_end  = buf.find("\r\n\r\n");
    std::string headers_raw = buf.substr(0, hdr_end);
    std::string leftover    = buf.substr(hdr_end + 4);

    // Parse request line.
    auto rl_end = headers_raw.find("\r\n");
    if (rl_end == std::string::npos) rl_end = headers_raw.size();

    HttpRequest req;
    {
        std::istringstream ss(headers_raw.substr(0, rl_end));
        std::string pq, ver;
        if (!(ss >> req.method >> pq >> ver)) return;
        auto q = pq.find('?');
        if (q != std::string::npos) {
            req.path         = pq.substr(0, q);
            req.query_params = parse_query_string(pq.substr(q + 1));
        } else {
            req.path = pq;
        }
    }

    // Parse headers.
    size_t pos = rl_end + 2;
    while (pos < headers_raw.size()) {
        auto ne = headers_raw.find("\r\n", pos);
        if (ne == std::string::npos) ne = headers_raw.size();
        std::string hline = headers_raw.substr(pos, ne - pos);
        pos = ne + 2;
        auto col = hline.find(':');
        if (col == std::string::npos) continue;
        req.headers[to_lower(trim(hline.substr(0, col)))] = trim(hline.substr(col + 1));
    }

    // Read body.
    size_t content_len = 0;
    auto it = req.headers.find("content-length");
    if (it != req.headers.end()) {
        try {
            content_len = std::stoul(it->second);
        } catch (const std::exception&) {
            send_all(fd, format_http_response(
                {400, "application/json", json_error("ValidationError", "Bad Content-Length")}));
            return;
        }
    }

    if (content_len > max_body_) {
        send_all(fd, format_http_response(
            {413, "application/json", json_error("ValidationError", "Payload too large")}));
        return;
    }

    req.body = std::move(leftover);
    while (req.body.size() < content_len) {
        ssize_t n = ::recv(fd, tmp, sizeof(tmp), 0);
        if (n <= 0) return;
        req.body.append(tmp, static_cast<size_t>(n));
    }
    if (req.body.size() > content_len) req.body.resize(content_len);

    SocketResponseChannel channel(fd);
    handler_(req, channel);
    if (!channel.started()) {
        send_all(fd, format_http_response(
            {500, "application/json", json_error("ServerError", "No response")}));
    }
}

} // namespace sift
