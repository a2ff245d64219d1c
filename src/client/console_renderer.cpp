#include "console_renderer.hpp"
#include "../event.hpp"

namespace sift {

ConsoleRenderer::ConsoleRenderer(EventBus& bus, const MessageStateStore& store,
                                 std::ostream& out, std::ostream& diag)
    : subs_(bus), store_(store), out_(out), diag_(diag) {
    subs_.add<MessageUpdatedEvent>([this](const MessageUpdatedEvent& ev) {
        on_updated(ev.message_id);
    });
    subs_.add<MessagesResetEvent>([this](const MessagesResetEvent& ev) {
        printed_.clear();
        if (ev.remaining == 0) out_ << "\n(conversation cleared)\n";
    });
    subs_.add<StreamStatusEvent>([this](const StreamStatusEvent& ev) {
        diag_ << "[status] " << ev.message << "\n";
    });
    subs_.add<ErrorRaisedEvent>([this](const ErrorRaisedEvent& ev) {
        if (!ev.message.empty()) diag_ << "[error] " << ev.message << "\n";
    });
}

void ConsoleRenderer::on_updated(uint64_t id) {
    const ChatMessage* msg = store_.find(id);
    if (!msg || msg->sender != Sender::Ai) return;
    std::string& shown = printed_[id];
    if (msg->is_error) {
        out_ << "\n[failed] " << msg->text << "\n";
    } else if (msg->text.compare(0, shown.size(), shown) == 0) {
        out_ << msg->text.substr(shown.size());
    } else {
        // Replaced wholesale by a snapshot
        out_ << "\n---\n" << msg->text;
    }
    if (msg->loading) {
        shown = msg->text;
    } else {
        printed_.erase(id);
        out_ << "\n\n";
    }
    out_ << std::flush;
}

} // namespace sift
