// Linux HTTP/HTTPS client using POSIX sockets + OpenSSL.
// Implements the same HttpClient interface as http.cpp (libcurl).
#ifdef __linux__

#include "http.hpp"

#include <openssl/ssl.h>
#include <openssl/err.h>

#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <cerrno>
#include <string>
#include <stdexcept>

namespace sift {

void http_init() {}
void http_cleanup() {}

// ── URL parsing ────────────────────────────────────────────────

struct ParsedUrl {
    bool tls;
    std::string host;
    std::string port;
    std::string path; // includes leading / and query string
};

static ParsedUrl parse_url(const std::string& url) {
    ParsedUrl result{};
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        throw std::runtime_error("invalid URL: " + url);

    std::string scheme = url.substr(0, scheme_end);
    if (scheme != "http" && scheme != "https")
        throw std::runtime_error("unsupported URL scheme: " + scheme);
    result.tls = (scheme == "https");

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    std::string host_port = (path_start == std::string::npos)
        ? url.substr(host_start)
        : url.substr(host_start, path_start - host_start);

    result.path = (path_start == std::string::npos) ? "/" : url.substr(path_start);

    size_t colon = host_port.find(':');
    if (colon != std::string::npos) {
        result.host = host_port.substr(0, colon);
        result.port = host_port.substr(colon + 1);
    } else {
        result.host = host_port;
        result.port = result.tls ? "443" : "80";
    }
    if (result.host.empty())
        throw std::runtime_error("invalid URL host: " + url);
    return result;
}

// ── RAII connection (TCP + optional TLS) ──────────────────────

struct Connection {
    int      fd  = -1;
    SSL_CTX* ctx = nullptr;
    SSL*     ssl = nullptr;
    const CancelToken* cancel = nullptr;
    bool     cancelled = false;
    bool     timed_out = false;
    long     idle_limit_ms = 0; // 0 = no limit on body reads

    explicit Connection(const CancelToken* token) : cancel(token) {}
    ~Connection() {
        if (ssl) { SSL_shutdown(ssl); SSL_free(ssl); }
        if (ctx) SSL_CTX_free(ctx);
        if (fd >= 0) ::close(fd);
    }
    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    bool connect(const ParsedUrl& url, long timeout_secs, std::string& error) {
        struct addrinfo hints{};
        hints.ai_family   = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;

        struct addrinfo* res = nullptr;
        if (getaddrinfo(url.host.c_str(), url.port.c_str(), &hints, &res) != 0) {
            error = "cannot resolve host " + url.host;
            return false;
        }

        long limit_ms = timeout_secs * 1000;
        bool connected = false;
        for (auto* ai = res; ai && !connected && !cancel_requested(); ai = ai->ai_next) {
            fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
            if (fd < 0) continue;

            // Non-blocking connect, waited on in slices.
            int flags = fcntl(fd, F_GETFL, 0);
            fcntl(fd, F_SETFL, flags | O_NONBLOCK);

            int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
            if (rc == 0) {
                fcntl(fd, F_SETFL, flags);
                connected = true;
            } else if (errno == EINPROGRESS && wait_ready(POLLOUT, limit_ms)) {
                int err = 0;
                socklen_t elen = sizeof(err);
                getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &elen);
                if (err == 0) {
                    fcntl(fd, F_SETFL, flags);
                    connected = true;
                }
            }
            if (!connected) { ::close(fd); fd = -1; }
        }
        freeaddrinfo(res);
        if (cancel_requested()) {
            error = "cancelled";
            return false;
        }
        if (!connected) {
            error = timed_out ? "timed out connecting to " + url.host + ":" + url.port
                              : "cannot connect to " + url.host + ":" + url.port;
            return false;
        }

        if (url.tls && !handshake(url, limit_ms, error)) return false;

        // Short slices for body I/O so the cancel token is polled.
        set_socket_timeout_ms(kSliceMs);
        idle_limit_ms = timeout_secs * 1000;
        return true;
    }

    // Wait for events on fd in slices; false on cancel, timeout or error.
    bool wait_ready(short events, long limit_ms) {
        long waited_ms = 0;
        while (!cancel_requested()) {
            if (limit_ms > 0 && waited_ms >= limit_ms) {
                timed_out = true;
                return false;
            }
            struct pollfd pfd{fd, events, 0};
            int rc = ::poll(&pfd, 1, static_cast<int>(kSliceMs));
            if (rc > 0) return true;
            if (rc < 0 && errno != EINTR) return false;
            waited_ms += kSliceMs;
        }
        return false;
    }

    bool handshake(const ParsedUrl& url, long limit_ms, std::string& error) {
        ctx = SSL_CTX_new(TLS_client_method());
        if (!ctx) { error = "TLS context creation failed"; return false; }
        SSL_CTX_set_verify(ctx, SSL_VERIFY_PEER, nullptr);
        SSL_CTX_set_default_verify_paths(ctx);
        SSL_CTX_set_min_proto_version(ctx, TLS1_2_VERSION);

        ssl = SSL_new(ctx);
        if (!ssl) { error = "TLS session creation failed"; return false; }
        SSL_set_fd(ssl, fd);
        SSL_set_tlsext_host_name(ssl, url.host.c_str()); // SNI

        int flags = fcntl(fd, F_GETFL, 0);
        fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        while (true) {
            int rc = SSL_connect(ssl);
            if (rc == 1) break;
            int err = SSL_get_error(ssl, rc);
            bool ready = false;
            if (err == SSL_ERROR_WANT_READ) ready = wait_ready(POLLIN, limit_ms);
            else if (err == SSL_ERROR_WANT_WRITE) ready = wait_ready(POLLOUT, limit_ms);
            if (!ready) {
                error = cancelled ? "cancelled"
                      : timed_out ? "TLS handshake with " + url.host + " timed out"
                      : "TLS handshake with " + url.host + " failed";
                return false;
            }
        }
        fcntl(fd, F_SETFL, flags);
        return true;
    }

    bool cancel_requested() {
        if (cancel && cancel->cancelled()) cancelled = true;
        return cancelled;
    }

    // Read some bytes; returns >0 on data, 0 on EOF, -1 on error, cancel or
    // idle timeout. Slice expiry loops back so the cancel token is polled.
    ssize_t read_some(char* buf, size_t len) {
        long idle_ms = 0;
        while (true) {
            if (cancel_requested()) return -1;
            if (idle_limit_ms > 0 && idle_ms >= idle_limit_ms) {
                timed_out = true;
                return -1;
            }

            ssize_t n;
            if (ssl) {
                n = SSL_read(ssl, buf, static_cast<int>(len));
                if (n > 0) return n;
                if (n == 0) return 0;
                int err = SSL_get_error(ssl, static_cast<int>(n));
                if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
                    idle_ms += kSliceMs;
                    continue;
                }
                if (err == SSL_ERROR_SYSCALL &&
                    (errno == EAGAIN || errno == EWOULDBLOCK)) {
                    idle_ms += kSliceMs;
                    continue;
                }
                if (err == SSL_ERROR_ZERO_RETURN) return 0;
                return -1;
            } else {
                n = ::recv(fd, buf, len, 0);
                if (n > 0) return n;
                if (n == 0) return 0;
                if (errno == EAGAIN || errno == EWOULDBLOCK) {
                    idle_ms += kSliceMs;
                    continue;
                }
                if (errno == EINTR) continue;
                return -1;
            }
        }
    }

    bool write_all(const char* buf, size_t len) {
        while (len > 0) {
            if (cancel_requested()) return false;
            ssize_t n;
            if (ssl) {
                n = SSL_write(ssl, buf, static_cast<int>(len));
                if (n <= 0) {
                    int err = SSL_get_error(ssl, static_cast<int>(n));
                    if (err == SSL_ERROR_WANT_WRITE || err == SSL_ERROR_WANT_READ)
                        continue;
                    return false;
                }
            } else {
                n = ::send(fd, buf, len, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
                    return false;
                }
            }
            buf += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

private:
    static constexpr long kSliceMs = 200;

    void set_socket_timeout_ms(long ms) {
        struct timeval tv{ms / 1000, static_cast<suseconds_t>((ms % 1000) * 1000)};
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    }

};

// ── Request building ───────────────────────────────────────────

static std::string build_request(const std::string& method,
                                  const ParsedUrl& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers) {
    std::string req;
    req.reserve(512 + body.size());
    req += method + " " + url.path + " HTTP/1.1\r\n";
    req += "Host: " + url.host + "\r\n";

    bool has_content_length = false;
    for (const auto& h : headers) {
        req += h.first + ": " + h.second + "\r\n";
        if (h.first == "Content-Length") has_content_length = true;
    }
    if ((method == "POST" || !body.empty()) && !has_content_length)
        req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "Connection: close\r\n\r\n";
    req += body;
    return req;
}

// ── Response parsing ───────────────────────────────────────────

struct BodyFraming {
    bool   chunked        = false;
    bool   has_length     = false;
    size_t content_length = 0;
};

// Read a CRLF-terminated line, using leftover as a look-ahead buffer.
// Returns false on EOF/error before a full line arrived.
static bool read_line(Connection& conn, std::string& leftover, std::string& line) {
    while (true) {
        size_t pos = leftover.find('\n');
        if (pos != std::string::npos) {
            line = leftover.substr(0, pos);
            leftover.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return true;
        }
        char buf[4096];
        ssize_t n = conn.read_some(buf, sizeof(buf));
        if (n <= 0) return false;
        leftover.append(buf, static_cast<size_t>(n));
    }
}

static long parse_response_headers(Connection& conn, std::string& leftover,
                                    BodyFraming& framing) {
    std::string status_line;
    if (!read_line(conn, leftover, status_line)) return 0;

    // "HTTP/1.1 200 OK": extract the three-digit code
    size_t sp1 = status_line.find(' ');
    if (sp1 == std::string::npos) return 0;
    long status = 0;
    try { status = std::stol(status_line.substr(sp1 + 1, 3)); }
    catch (const std::exception&) { return 0; }

    std::string line;
    while (read_line(conn, leftover, line)) {
        if (line.empty()) break; // blank line → end of headers

        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;

        std::string name  = line.substr(0, colon);
        std::string value = line.substr(colon + 1);
        while (!value.empty() && (value[0] == ' ' || value[0] == '\t'))
            value.erase(0, 1);

        for (auto& c : name)  c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
        for (auto& c : value) c = static_cast<char>(tolower(static_cast<unsigned char>(c)));

        if (name == "transfer-encoding") {
            framing.chunked = (value.find("chunked") != std::string::npos);
        } else if (name == "content-length") {
            try {
                framing.content_length = std::stoul(value);
                framing.has_length = true;
            } catch (const std::exception&) { // NOLINT(bugprone-empty-catch)
            }
        }
    }
    return status;
}

static bool read_exactly(Connection& conn, std::string& leftover,
                          size_t n, std::string& out) {
    while (n > 0) {
        if (!leftover.empty()) {
            size_t take = std::min(n, leftover.size());
            out.append(leftover, 0, take);
            leftover.erase(0, take);
            n -= take;
            continue;
        }
        char buf[4096];
        ssize_t got = conn.read_some(buf, std::min(n, sizeof(buf)));
        if (got <= 0) return false;
        out.append(buf, static_cast<size_t>(got));
        n -= static_cast<size_t>(got);
    }
    return true;
}

// Deliver the body to sink in arrival-sized pieces, dechunking if needed.
// Returns false if the sink asked to stop.
static bool pump_body(Connection& conn, std::string& leftover,
                       const BodyFraming& framing,
                       const RawChunkCallback& sink) {
    if (framing.chunked) {
        std::string size_line;
        while (read_line(conn, leftover, size_line)) {
            if (size_line.empty()) continue;
            size_t chunk_size = std::strtoul(size_line.c_str(), nullptr, 16);
            if (chunk_size == 0) break;

            size_t remaining = chunk_size;
            while (remaining > 0) {
                if (!leftover.empty()) {
                    size_t take = std::min(remaining, leftover.size());
                    if (!sink(leftover.data(), take)) return false;
                    leftover.erase(0, take);
                    remaining -= take;
                    continue;
                }
                char buf[4096];
                ssize_t n = conn.read_some(buf, std::min(remaining, sizeof(buf)));
                if (n <= 0) return true;
                if (!sink(buf, static_cast<size_t>(n))) return false;
                remaining -= static_cast<size_t>(n);
            }
            std::string crlf;
            if (!read_exactly(conn, leftover, 2, crlf)) return true;
        }
        return true;
    }

    size_t remaining = framing.content_length;
    while (!framing.has_length || remaining > 0) {
        if (!leftover.empty()) {
            size_t take = framing.has_length
                ? std::min(remaining, leftover.size())
                : leftover.size();
            if (!sink(leftover.data(), take)) return false;
            leftover.erase(0, take);
            if (framing.has_length) remaining -= take;
            continue;
        }
        size_t want = framing.has_length
            ? std::min(remaining, static_cast<size_t>(4096))
            : 4096;
        char buf[4096];
        ssize_t n = conn.read_some(buf, want);
        if (n <= 0) break;
        if (!sink(buf, static_cast<size_t>(n))) return false;
        if (framing.has_length) remaining -= static_cast<size_t>(n);
    }
    return true;
}

// ── Core request executor ──────────────────────────────────────

static HttpResponse do_request(const std::string& method,
                                const std::string& url_str,
                                const std::string& body,
                                const std::vector<Header>& headers,
                                const RawChunkCallback* callback,
                                const CancelToken* cancel,
                                long timeout_secs) {
    HttpResponse resp;
    ParsedUrl url;
    try {
        url = parse_url(url_str);
    } catch (const std::exception& e) {
        resp.error = e.what();
        return resp;
    }

    Connection conn(cancel);
    if (!conn.connect(url, timeout_secs, resp.error)) {
        resp.cancelled = conn.cancelled;
        return resp;
    }

    std::string request = build_request(method, url, body, headers);
    if (!conn.write_all(request.c_str(), request.size())) {
        resp.cancelled = conn.cancelled;
        resp.error = resp.cancelled ? "cancelled" : "failed to send request";
        return resp;
    }

    std::string leftover;
    BodyFraming framing;
    long status = parse_response_headers(conn, leftover, framing);
    if (status == 0) {
        resp.cancelled = conn.cancelled;
        resp.error = resp.cancelled ? "cancelled"
                   : conn.timed_out ? "timed out waiting for response"
                   : "no valid HTTP response";
        return resp;
    }
    resp.status_code = status;

    RawChunkCallback collect = [&resp](const char* data, size_t len) {
        resp.body.append(data, len);
        return true;
    };
    bool streaming = callback && status >= 200 && status < 300;
    bool completed = pump_body(conn, leftover, framing, streaming ? *callback : collect);

    if (conn.timed_out) {
        resp.error = "timed out waiting for data";
        return resp;
    }
    if (!completed || conn.cancelled) resp.cancelled = true;
    return resp;
}

// ── Public API ─────────────────────────────────────────────────

HttpResponse SocketHttpClient::post(const std::string& url,
                                     const std::string& body,
                                     const std::vector<Header>& headers,
                                     long timeout_seconds) {
    return do_request("POST", url, body, headers, nullptr, nullptr, timeout_seconds);
}

HttpResponse SocketHttpClient::get(const std::string& url,
                                    const std::vector<Header>& headers,
                                    long timeout_seconds) {
    return do_request("GET", url, "", headers, nullptr, nullptr, timeout_seconds);
}

HttpResponse SocketHttpClient::stream(const std::string& method,
                                       const std::string& url,
                                       const std::string& body,
                                       const std::vector<Header>& headers,
                                       RawChunkCallback callback,
                                       const CancelToken* cancel,
                                       long timeout_seconds) {
    return do_request(method, url, body, headers, &callback, cancel, timeout_seconds);
}

} // namespace sift

#endif // __linux__
