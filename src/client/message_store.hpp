#pragma once
#include "../provider.hpp"
#include "../query.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sift {

class EventBus;

enum class Sender { User, Ai };

const char* sender_name(Sender sender);

struct ChatMessage {
    uint64_t id = 0;
    Sender sender = Sender::User;
    std::string text;
    std::string timestamp;
    bool loading = false;
    bool is_error = false;
    std::optional<AnalysisQuery> original_query; // first user message of a session
    std::string model_id;
};

// Ordered conversation. At most one message is loading, and it is always the
// most recently appended AI message; every streaming mutation goes through
// the active id rather than a scan. Not thread-safe: event loop only.
class MessageStateStore {
public:
    explicit MessageStateStore(EventBus* bus = nullptr) : bus_(bus) {}

    uint64_t append_user(const std::string& text,
                         std::optional<AnalysisQuery> original_query = std::nullopt);

    // Append a loading AI message and make it active. Throws std::logic_error
    // if a message is already loading.
    uint64_t append_placeholder(const std::string& model_id = "");

    std::optional<uint64_t> active_id() const { return active_; }
    bool is_loading() const { return active_.has_value(); }

    // Mutations of the active message. Each returns false (and changes
    // nothing) when there is no active message.
    bool append_to_active(const std::string& text);
    bool replace_active(const std::string& text);
    bool complete_active();
    bool fail_active(const std::string& error_text);

    // Resolve every loading message as stopped: loading cleared, marker
    // appended, not an error. Returns how many were resolved.
    size_t stop_all(const std::string& marker);

    // Drop every message after id. Returns false if id is not in the list.
    bool truncate_after(uint64_t id);

    void clear();

    const ChatMessage* find(uint64_t id) const;
    const std::vector<ChatMessage>& messages() const { return messages_; }
    size_t size() const { return messages_.size(); }
    size_t loading_count() const;

    // Role/content pairs of every finished, non-error message, oldest first.
    std::vector<PromptMessage> history() const;

private:
    ChatMessage* active_message();
    void publish_appended(uint64_t id);
    void publish_updated(uint64_t id, const std::string& appended = "");
    void publish_reset();

    EventBus* bus_;
    std::vector<ChatMessage> messages_;
    std::optional<uint64_t> active_;
    uint64_t next_id_ = 1;
};

} // namespace sift
