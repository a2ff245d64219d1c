#pragma once
#include "transport.hpp"
#include "../cancel_token.hpp"
#include "../http.hpp"
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace sift {

class EventLoop;

// Reads a text/event-stream body on a worker thread and posts each parsed
// event to the loop. close() cancels the transfer; the destructor joins.
class HttpStreamTransport : public StreamTransport {
public:
    HttpStreamTransport(EventLoop& loop, HttpClient& http,
                        std::string method, std::string url,
                        std::string body, std::vector<Header> headers,
                        long timeout_seconds = 300);
    ~HttpStreamTransport() override;

    HttpStreamTransport(const HttpStreamTransport&) = delete;
    HttpStreamTransport& operator=(const HttpStreamTransport&) = delete;

    void open(TransportCallbacks callbacks) override;
    void close() override;

private:
    // Shared with tasks already queued on the loop, which may run after
    // this object is gone.
    struct Shared {
        std::atomic<bool> closed{false};
        TransportCallbacks callbacks;
    };

    void read_body();
    void deliver(std::function<void(const TransportCallbacks&)> fn);

    EventLoop& loop_;
    HttpClient& http_;
    std::string method_;
    std::string url_;
    std::string body_;
    std::vector<Header> headers_;
    long timeout_seconds_;
    CancelToken cancel_;
    std::shared_ptr<Shared> shared_;
    std::thread worker_;
};

// Readable message for a failed (non-2xx) HTTP response: the message of a
// {"error":{...}} body when there is one, else the status code.
std::string describe_http_failure(const HttpResponse& response);

} // namespace sift
