#pragma once
#include "frame.hpp"
#include "provider.hpp"
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace sift {

// Server-side write end of one stream response.
class FrameSink {
public:
    virtual ~FrameSink() = default;

    // Write and flush one frame. Returns false once the consumer is gone.
    virtual bool write(const StreamFrame& frame) = 0;

    // False once the consumer has disconnected. Must be callable from any thread.
    virtual bool connected() const = 0;
};

enum class RelayOutcome { Completed, Failed, Aborted };

const char* relay_outcome_name(RelayOutcome outcome);

struct RelayResult {
    RelayOutcome outcome = RelayOutcome::Completed;
    std::string text;   // everything forwarded as delta frames
    std::string error;  // Failed only
    size_t frames_written = 0;
};

struct RelayOptions {
    std::vector<std::string> status;   // status frames sent before generation
    std::string analysis_id;           // emitted as a meta frame when non-empty
    // Runs after the stream with the final result; exceptions are logged.
    std::function<void(const RelayResult&)> on_finish;
    // How often a silent provider call is checked for consumer disconnect.
    std::chrono::milliseconds watch_interval{200};
};

// Runs one provider call and emits status*, delta*, meta?, then exactly one
// terminal frame (complete or error) to the sink. When the consumer
// disconnects the provider call is aborted and nothing further is written.
class StreamRelay {
public:
    StreamRelay(Provider& provider, FrameSink& sink);

    RelayResult run(GenerationRequest request, const RelayOptions& options = {});

private:
    bool emit(const StreamFrame& frame, RelayResult& result);

    Provider& provider_;
    FrameSink& sink_;
    bool sink_gone_ = false;
};

} // namespace sift
