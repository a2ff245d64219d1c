#pragma once
#include "../event_bus.hpp"
#include "message_store.hpp"
#include <cstdint>
#include <ostream>
#include <string>
#include <unordered_map>

namespace sift {

// Prints the conversation as the store changes. AI text is written
// incrementally while a message loads; a snapshot that rewrites earlier text
// is printed in full after a separator.
class ConsoleRenderer {
public:
    ConsoleRenderer(EventBus& bus, const MessageStateStore& store,
                    std::ostream& out, std::ostream& diag);

    ConsoleRenderer(const ConsoleRenderer&) = delete;
    ConsoleRenderer& operator=(const ConsoleRenderer&) = delete;

    // Messages whose printed text is still tracked.
    size_t tracked() const { return printed_.size(); }

private:
    void on_updated(uint64_t id);

    ScopedSubscriptions subs_;
    const MessageStateStore& store_;
    std::ostream& out_;
    std::ostream& diag_;
    std::unordered_map<uint64_t, std::string> printed_; // loading messages only
};

} // namespace sift
