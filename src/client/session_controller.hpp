#pragma once
#include "gateway_client.hpp"
#include "message_store.hpp"
#include "stream_consumer.hpp"
#include "../cancel_token.hpp"
#include "../query.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace sift {

class EventBus;
class EventLoop;

enum class SessionStatus { Idle, Initiating, Streaming, Complete, Stopped, Errored };

const char* session_status_name(SessionStatus status);

inline bool is_terminal(SessionStatus status) {
    return status == SessionStatus::Complete || status == SessionStatus::Stopped ||
           status == SessionStatus::Errored;
}

struct AnalysisSession {
    std::string id;           // server session id, empty while initiating
    AnalysisQuery query;
    std::string created_at;
    SessionStatus status = SessionStatus::Initiating;
};

// Input being composed for the next analysis.
struct InputDraft {
    std::string text;
    std::optional<ImageRef> image;
    std::string report_type = report_types::FullCheck;
};

// Drives one conversation: start, follow-up, stop, restart and reset.
// Lives on the event loop thread; owns at most one StreamConsumer at a time.
class SessionController {
public:
    SessionController(MessageStateStore& store, GatewayClient& gateway,
                      EventLoop& loop, EventBus* bus = nullptr);
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Throws ValidationError (nothing mutated) if the query has neither text
    // nor an image. Returns false while another operation is in flight.
    bool start(const AnalysisQuery& query);

    // Returns false (no-op) without a session, while loading or for blank
    // text. Cancelling the token resolves the reply like stop().
    bool follow_up(const std::string& text, const CancelToken& cancel = CancelToken());

    // Idempotent; safe when idle.
    void stop();

    // Re-run the stored original query from its user message. Returns false
    // if there is no stored query or an operation is in flight.
    bool restart();

    void reset(bool clear_inputs);

    bool is_loading() const { return store_.is_loading(); }
    SessionStatus status() const;
    const std::optional<AnalysisSession>& session() const { return session_; }
    const std::optional<AnalysisQuery>& original_query() const { return original_query_; }
    const std::string& analysis_id() const { return analysis_id_; }
    const std::string& last_error() const { return last_error_; }

    InputDraft& draft() { return draft_; }
    const InputDraft& draft() const { return draft_; }

    // Replaces the chat directive for follow-ups (empty = server default).
    void set_system_override(std::string directive) { system_override_ = std::move(directive); }

private:
    void begin_analysis(const AnalysisQuery& query);
    void on_initiated(uint64_t generation, const InitiateReply& reply);
    bool attach(std::unique_ptr<StreamTransport> transport);
    void on_stream_finished(const ReduceResult& result);
    void close_consumer();
    void set_status(SessionStatus status);
    void set_error(const std::string& message);
    void set_analysis_id(const std::string& id);

    MessageStateStore& store_;
    GatewayClient& gateway_;
    EventLoop& loop_;
    EventBus* bus_;

    std::optional<AnalysisSession> session_;
    std::optional<AnalysisQuery> original_query_;
    uint64_t origin_message_id_ = 0;
    std::string analysis_id_;
    std::string last_error_;
    std::string system_override_;
    InputDraft draft_;

    // Finished consumers are kept until the next operation, since they may
    // still be on the call stack when they report completion.
    std::unique_ptr<StreamConsumer> consumer_;
    std::unique_ptr<StreamConsumer> retired_;
    uint64_t generation_ = 0; // bumped whenever pending replies become stale
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace sift
