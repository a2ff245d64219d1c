#pragma once
#include "cancel_token.hpp"
#include <string>
#include <vector>
#include <functional>
#include <utility>

namespace sift {

// Initialize HTTP subsystem (call once at startup).
// No-op on Linux (OpenSSL 1.1+ auto-initialises); initialises libcurl elsewhere.
void http_init();

// Cleanup HTTP subsystem (call once at shutdown).
void http_cleanup();

using Header = std::pair<std::string, std::string>;

struct HttpResponse {
    long status_code = 0;   // 0 = no response (connect/read failure or cancelled)
    std::string body;       // full body, or the error body of a failed stream
    std::string error;      // transport-level failure description
    bool cancelled = false; // stopped by the CancelToken or the chunk callback
};

// Raw-chunk streaming callback: receives raw body bytes as they arrive.
// Return false to abort the transfer.
using RawChunkCallback = std::function<bool(const char* data, size_t len)>;

// Abstract HTTP client interface (injectable for testing)
class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse post(const std::string& url,
                              const std::string& body,
                              const std::vector<Header>& headers,
                              long timeout_seconds = 120) = 0;

    virtual HttpResponse get(const std::string& url,
                             const std::vector<Header>& headers,
                             long timeout_seconds = 30) = 0;

    // Streams a 2xx response body to callback. Non-2xx bodies are collected
    // into HttpResponse::body instead. The transfer stops shortly after
    // cancel is triggered; timeout_seconds bounds each wait for data.
    virtual HttpResponse stream(const std::string& method,
                                const std::string& url,
                                const std::string& body,
                                const std::vector<Header>& headers,
                                RawChunkCallback callback,
                                const CancelToken* cancel = nullptr,
                                long timeout_seconds = 300) = 0;
};

// Platform-specific concrete implementations.
// Only one is compiled per build target (CMakeLists.txt gates the source file).
#ifdef __linux__

// Linux: POSIX sockets + OpenSSL (no libcurl dependency)
class SocketHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;

    HttpResponse stream(const std::string& method,
                        const std::string& url,
                        const std::string& body,
                        const std::vector<Header>& headers,
                        RawChunkCallback callback,
                        const CancelToken* cancel = nullptr,
                        long timeout_seconds = 300) override;
};
using PlatformHttpClient = SocketHttpClient;

#else

// Other platforms: libcurl
class CurlHttpClient : public HttpClient {
public:
    HttpResponse post(const std::string& url,
                      const std::string& body,
                      const std::vector<Header>& headers,
                      long timeout_seconds = 120) override;

    HttpResponse get(const std::string& url,
                     const std::vector<Header>& headers,
                     long timeout_seconds = 30) override;

    HttpResponse stream(const std::string& method,
                        const std::string& url,
                        const std::string& body,
                        const std::vector<Header>& headers,
                        RawChunkCallback callback,
                        const CancelToken* cancel = nullptr,
                        long timeout_seconds = 300) override;
};
using PlatformHttpClient = CurlHttpClient;

#endif

inline bool is_success(const HttpResponse& r) {
    return r.status_code >= 200 && r.status_code < 300;
}

} // namespace sift
