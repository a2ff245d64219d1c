#include "session_controller.hpp"
#include "event_loop.hpp"
#include "../errors.hpp"
#include "../event_bus.hpp"
#include "../util.hpp"
#include <iostream>

namespace sift {

const char* session_status_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::Idle:       return "idle";
        case SessionStatus::Initiating: return "initiating";
        case SessionStatus::Streaming:  return "streaming";
        case SessionStatus::Complete:   return "complete";
        case SessionStatus::Stopped:    return "stopped";
        case SessionStatus::Errored:    return "errored";
    }
    return "unknown";
}

SessionController::SessionController(MessageStateStore& store, GatewayClient& gateway,
                                     EventLoop& loop, EventBus* bus)
    : store_(store), gateway_(gateway), loop_(loop), bus_(bus) {}

SessionController::~SessionController() {
    if (consumer_) consumer_->close();
}

SessionStatus SessionController::status() const {
    return session_ ? session_->status : SessionStatus::Idle;
}

bool SessionController::start(const AnalysisQuery& query) {
    if (!query.has_content()) {
        throw ValidationError("Enter some text or attach an image to analyze.");
    }
    if (is_loading()) {
        std::cerr << "[controller] Ignoring start: an operation is in flight\n";
        return false;
    }
    close_consumer();
    // Each analysis starts its own conversation.
    if (store_.size() > 0) store_.clear();
    origin_message_id_ = store_.append_user(query.text, query);
    original_query_ = query;
    begin_analysis(query);
    return true;
}

void SessionController::begin_analysis(const AnalysisQuery& query) {
    ++generation_;
    set_error("");
    set_analysis_id("");
    store_.append_placeholder(query.model_id);

    AnalysisSession session;
    session.query = query;
    session.created_at = timestamp_now();
    session.status = SessionStatus::Initiating;
    session_ = std::move(session);
    set_status(SessionStatus::Initiating);

    uint64_t generation = generation_;
    std::weak_ptr<bool> alive = alive_;
    gateway_.initiate(query, [this, alive, generation](const InitiateReply& reply) {
        if (alive.expired()) return;
        on_initiated(generation, reply);
    });
}

void SessionController::on_initiated(uint64_t generation, const InitiateReply& reply) {
    if (generation != generation_ || status() != SessionStatus::Initiating) {
        std::cerr << "[controller] Dropping stale initiate reply\n";
        return;
    }
    if (!reply.ok) {
        std::string message = reply.error.empty() ? "Failed to start the analysis." : reply.error;
        store_.fail_active(message);
        set_status(SessionStatus::Errored);
        set_error(message);
        return;
    }

    session_->id = reply.locator.session_id;
    if (!reply.locator.analysis_id.empty()) set_analysis_id(reply.locator.analysis_id);

    std::unique_ptr<StreamTransport> transport;
    try {
        transport = gateway_.open_stream(reply.locator);
    } catch (const std::exception& e) {
        store_.fail_active(e.what());
        set_status(SessionStatus::Errored);
        set_error(e.what());
        return;
    }
    set_status(SessionStatus::Streaming);
    attach(std::move(transport));
}

bool SessionController::follow_up(const std::string& text, const CancelToken& cancel) {
    if (!session_ || is_loading() || is_blank(text)) return false;
    close_consumer();
    ++generation_;
    set_error("");

    ChatRequest request;
    request.message = text;
    request.history = store_.history();
    request.model_id = session_->query.model_id;
    request.params = session_->query.params;
    request.analysis_id = analysis_id_;
    request.system_override = system_override_;

    store_.append_user(text);
    store_.append_placeholder(request.model_id);

    std::unique_ptr<StreamTransport> transport;
    try {
        transport = gateway_.open_chat(request);
    } catch (const std::exception& e) {
        store_.fail_active(e.what());
        set_status(SessionStatus::Errored);
        set_error(e.what());
        return true;
    }
    set_status(SessionStatus::Streaming);

    // The token may be cancelled from any thread; stop() must run on the loop.
    EventLoop* loop = &loop_;
    uint64_t generation = generation_;
    std::weak_ptr<bool> alive = alive_;
    cancel.on_cancel([this, loop, alive, generation]() {
        loop->post([this, alive, generation]() {
            if (alive.expired() || generation != generation_) return;
            stop();
        });
    });

    attach(std::move(transport));
    return true;
}

bool SessionController::attach(std::unique_ptr<StreamTransport> transport) {
    ConsumerListener listener;
    listener.on_status = [this](const std::string& message) {
        if (!bus_) return;
        StreamStatusEvent ev;
        ev.message = message;
        bus_->publish(ev);
    };
    listener.on_meta = [this](const std::string& id) { set_analysis_id(id); };
    listener.on_finish = [this](const ReduceResult& result) { on_stream_finished(result); };

    consumer_ = std::make_unique<StreamConsumer>(store_, std::move(transport),
                                                 std::move(listener));
    return consumer_->subscribe();
}

void SessionController::on_stream_finished(const ReduceResult& result) {
    switch (result.outcome) {
        case FrameOutcome::Completed:
            set_status(SessionStatus::Complete);
            break;
        case FrameOutcome::Failed:
            set_status(SessionStatus::Errored);
            set_error(result.text);
            break;
        default:
            if (status() == SessionStatus::Streaming) set_status(SessionStatus::Complete);
            break;
    }
}

void SessionController::stop() {
    ++generation_;
    close_consumer();
    size_t stopped = store_.stop_all(kStopMarker);
    SessionStatus current = status();
    if (current == SessionStatus::Initiating || current == SessionStatus::Streaming) {
        set_status(SessionStatus::Stopped);
    }
    if (stopped > 0) std::cerr << "[controller] Generation stopped\n";
}

bool SessionController::restart() {
    if (!original_query_ || is_loading()) return false;
    close_consumer();
    AnalysisQuery query = *original_query_;
    if (!store_.truncate_after(origin_message_id_)) {
        std::cerr << "[controller] Origin message missing, re-adding it\n";
        store_.clear();
        origin_message_id_ = store_.append_user(query.text, query);
    }
    begin_analysis(query);
    return true;
}

void SessionController::reset(bool clear_inputs) {
    ++generation_;
    close_consumer();
    store_.clear();
    session_.reset();
    original_query_.reset();
    origin_message_id_ = 0;
    set_analysis_id("");
    set_error("");
    if (clear_inputs) draft_ = InputDraft{};
    set_status(SessionStatus::Idle);
}

void SessionController::close_consumer() {
    if (!consumer_) return;
    consumer_->close();
    retired_ = std::move(consumer_);
}

void SessionController::set_status(SessionStatus status) {
    if (session_) session_->status = status;
    if (!bus_) return;
    SessionStatusEvent ev;
    ev.session_id = session_ ? session_->id : "";
    ev.status = session_status_name(status);
    bus_->publish(ev);
}

void SessionController::set_error(const std::string& message) {
    if (message == last_error_) return;
    last_error_ = message;
    if (!message.empty()) std::cerr << "[controller] " << message << "\n";
    if (!bus_) return;
    ErrorRaisedEvent ev;
    ev.message = message;
    bus_->publish(ev);
}

void SessionController::set_analysis_id(const std::string& id) {
    if (id == analysis_id_) return;
    analysis_id_ = id;
    if (!bus_ || id.empty()) return;
    AnalysisIdChangedEvent ev;
    ev.analysis_id = id;
    bus_->publish(ev);
}

} // namespace sift
