#include "message_store.hpp"
#include "../event_bus.hpp"
#include "../prompt.hpp"
#include "../util.hpp"
#include <algorithm>
#include <stdexcept>

namespace sift {

const char* sender_name(Sender sender) {
    return sender == Sender::User ? "user" : "ai";
}

uint64_t MessageStateStore::append_user(const std::string& text,
                                        std::optional<AnalysisQuery> original_query) {
    ChatMessage msg;
    msg.id = next_id_++;
    msg.sender = Sender::User;
    msg.text = text;
    msg.timestamp = timestamp_now();
    msg.original_query = std::move(original_query);
    messages_.push_back(std::move(msg));
    publish_appended(messages_.back().id);
    return messages_.back().id;
}

uint64_t MessageStateStore::append_placeholder(const std::string& model_id) {
    if (active_) {
        throw std::logic_error("a message is already loading");
    }
    ChatMessage msg;
    msg.id = next_id_++;
    msg.sender = Sender::Ai;
    msg.timestamp = timestamp_now();
    msg.loading = true;
    msg.model_id = model_id;
    messages_.push_back(std::move(msg));
    active_ = messages_.back().id;
    publish_appended(*active_);
    return *active_;
}

ChatMessage* MessageStateStore::active_message() {
    if (!active_) return nullptr;
    // The active message is the newest AI message, so search from the back.
    for (auto it = messages_.rbegin(); it != messages_.rend(); ++it) {
        if (it->id == *active_) return &*it;
    }
    return nullptr;
}

bool MessageStateStore::append_to_active(const std::string& text) {
    ChatMessage* msg = active_message();
    if (!msg) return false;
    msg->text += text;
    publish_updated(msg->id, text);
    return true;
}

bool MessageStateStore::replace_active(const std::string& text) {
    ChatMessage* msg = active_message();
    if (!msg) return false;
    msg->text = text;
    publish_updated(msg->id);
    return true;
}

bool MessageStateStore::complete_active() {
    ChatMessage* msg = active_message();
    if (!msg) return false;
    msg->loading = false;
    active_.reset();
    publish_updated(msg->id);
    return true;
}

bool MessageStateStore::fail_active(const std::string& error_text) {
    ChatMessage* msg = active_message();
    if (!msg) return false;
    msg->loading = false;
    msg->is_error = true;
    msg->text = error_text;
    active_.reset();
    publish_updated(msg->id);
    return true;
}

size_t MessageStateStore::stop_all(const std::string& marker) {
    size_t stopped = 0;
    std::vector<uint64_t> changed;
    for (auto& msg : messages_) {
        if (!msg.loading) continue;
        msg.loading = false;
        msg.text += marker;
        changed.push_back(msg.id);
        ++stopped;
    }
    active_.reset();
    for (uint64_t id : changed) publish_updated(id, marker);
    return stopped;
}

bool MessageStateStore::truncate_after(uint64_t id) {
    auto it = std::find_if(messages_.begin(), messages_.end(),
                           [id](const ChatMessage& m) { return m.id == id; });
    if (it == messages_.end()) return false;
    messages_.erase(it + 1, messages_.end());
    if (active_ && !find(*active_)) active_.reset();
    publish_reset();
    return true;
}

void MessageStateStore::clear() {
    messages_.clear();
    active_.reset();
    publish_reset();
}

const ChatMessage* MessageStateStore::find(uint64_t id) const {
    for (const auto& msg : messages_) {
        if (msg.id == id) return &msg;
    }
    return nullptr;
}

size_t MessageStateStore::loading_count() const {
    return static_cast<size_t>(std::count_if(
        messages_.begin(), messages_.end(),
        [](const ChatMessage& m) { return m.loading; }));
}

std::vector<PromptMessage> MessageStateStore::history() const {
    std::vector<PromptMessage> out;
    for (const auto& msg : messages_) {
        if (msg.loading || msg.is_error) continue;
        if (msg.sender == Sender::User) {
            // An image-only query has no text of its own.
            out.push_back({Role::User, is_blank(msg.text) ? kImageOnlyInput : msg.text});
        } else {
            if (msg.text.empty()) continue;
            out.push_back({Role::Assistant, msg.text});
        }
    }
    return out;
}

void MessageStateStore::publish_appended(uint64_t id) {
    if (!bus_) return;
    MessageAppendedEvent ev;
    ev.message_id = id;
    bus_->publish(ev);
}

void MessageStateStore::publish_updated(uint64_t id, const std::string& appended) {
    if (!bus_) return;
    MessageUpdatedEvent ev;
    ev.message_id = id;
    ev.appended = appended;
    bus_->publish(ev);
}

void MessageStateStore::publish_reset() {
    if (!bus_) return;
    MessagesResetEvent ev;
    ev.remaining = messages_.size();
    bus_->publish(ev);
}

} // namespace sift
