// libcurl HTTP client, used on platforms other than Linux.
#ifndef __linux__

#include "http.hpp"

#include <curl/curl.h>
#include <string>

namespace sift {

void http_init() {
    curl_global_init(CURL_GLOBAL_ALL);
}

void http_cleanup() {
    curl_global_cleanup();
}

// Called by curl ~once per second; return non-zero to abort the transfer.
static int cancel_progress_cb(void* clientp,
                              curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                              curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* token = static_cast<const CancelToken*>(clientp);
    return (token && token->cancelled()) ? 1 : 0;
}

struct TransferContext {
    CURL* curl = nullptr;
    const RawChunkCallback* callback = nullptr;
    std::string* error_body = nullptr;
    bool aborted = false;
};

// Streams 2xx bodies to the callback; anything else is collected as the
// error body so callers can report it.
static size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    size_t total = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userdata);
    if (ctx->aborted) return 0;

    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    if (!ctx->callback || status < 200 || status >= 300) {
        ctx->error_body->append(ptr, total);
        return total;
    }
    if (!(*ctx->callback)(ptr, total)) {
        ctx->aborted = true;
        return 0;
    }
    return total;
}

static curl_slist* build_headers(const std::vector<Header>& headers) {
    curl_slist* list = nullptr;
    for (const auto& h : headers) {
        std::string entry = h.first + ": " + h.second;
        list = curl_slist_append(list, entry.c_str());
    }
    return list;
}

// ── RAII curl handle with common setup ────────────────────────

struct CurlRequest {
    CURL* curl = curl_easy_init();
    curl_slist* hlist = nullptr;

    CurlRequest() = default;
    ~CurlRequest() {
        curl_slist_free_all(hlist);
        if (curl) curl_easy_cleanup(curl);
    }
    CurlRequest(const CurlRequest&) = delete;
    CurlRequest& operator=(const CurlRequest&) = delete;

    explicit operator bool() const { return curl != nullptr; }
};

static HttpResponse perform(const std::string& method,
                            const std::string& url,
                            const std::string& body,
                            const std::vector<Header>& headers,
                            const RawChunkCallback* callback,
                            const CancelToken* cancel,
                            long timeout) {
    HttpResponse response;
    CurlRequest req;
    if (!req) {
        response.error = "curl_easy_init failed";
        return response;
    }

    req.hlist = build_headers(headers);
    curl_easy_setopt(req.curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(req.curl, CURLOPT_HTTPHEADER, req.hlist);
    curl_easy_setopt(req.curl, CURLOPT_TIMEOUT, timeout);
    if (cancel) {
        curl_easy_setopt(req.curl, CURLOPT_NOPROGRESS, 0L);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFOFUNCTION, cancel_progress_cb);
        curl_easy_setopt(req.curl, CURLOPT_XFERINFODATA,
                         const_cast<CancelToken*>(cancel));
    }

    if (method == "POST") {
        curl_easy_setopt(req.curl, CURLOPT_POST, 1L);
        curl_easy_setopt(req.curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(req.curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else {
        curl_easy_setopt(req.curl, CURLOPT_HTTPGET, 1L);
    }

    TransferContext ctx;
    ctx.curl = req.curl;
    ctx.callback = callback;
    ctx.error_body = &response.body;
    curl_easy_setopt(req.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(req.curl, CURLOPT_WRITEDATA, &ctx);

    CURLcode res = curl_easy_perform(req.curl);
    curl_easy_getinfo(req.curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    if (res == CURLE_ABORTED_BY_CALLBACK || ctx.aborted ||
        (cancel && cancel->cancelled())) {
        response.cancelled = true;
        response.error = "cancelled";
    } else if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
        if (response.status_code == 0) response.body.clear();
    }
    return response;
}

// ── Public API ────────────────────────────────────────────────

HttpResponse CurlHttpClient::post(const std::string& url,
                                  const std::string& body,
                                  const std::vector<Header>& headers,
                                  long timeout_seconds) {
    return perform("POST", url, body, headers, nullptr, nullptr, timeout_seconds);
}

HttpResponse CurlHttpClient::get(const std::string& url,
                                 const std::vector<Header>& headers,
                                 long timeout_seconds) {
    return perform("GET", url, "", headers, nullptr, nullptr, timeout_seconds);
}

HttpResponse CurlHttpClient::stream(const std::string& method,
                                    const std::string& url,
                                    const std::string& body,
                                    const std::vector<Header>& headers,
                                    RawChunkCallback callback,
                                    const CancelToken* cancel,
                                    long timeout_seconds) {
    return perform(method, url, body, headers, &callback, cancel, timeout_seconds);
}

} // namespace sift

#endif // !__linux__
