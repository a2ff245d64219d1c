#include "sse.hpp"

namespace sift {

// Strip the field name and the single optional space after the colon.
static std::string field_value(const std::string& line, size_t name_len) {
    size_t start = name_len + 1;
    if (start < line.size() && line[start] == ' ') ++start;
    return start < line.size() ? line.substr(start) : std::string();
}

void SSEParser::feed(const std::string& chunk, const SSECallback& callback) {
    buffer_ += chunk;

    size_t pos = 0;
    while (pos < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) {
            // Incomplete line - keep remainder in buffer
            buffer_ = buffer_.substr(pos);
            return;
        }

        std::string line = buffer_.substr(pos, newline - pos);
        // Remove trailing \r if present
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        pos = newline + 1;

        if (line.empty()) {
            // Empty line = dispatch event
            if (has_data_ || !current_event_.empty()) {
                SSEEvent event{current_event_, current_data_};
                current_event_.clear();
                current_data_.clear();
                has_data_ = false;
                if (!callback(event)) {
                    buffer_ = buffer_.substr(pos);
                    return;
                }
            }
        } else if (line[0] == ':') {
            // Comment / keep-alive
        } else if (line.rfind("event:", 0) == 0) {
            current_event_ = field_value(line, 5);
        } else if (line.rfind("data:", 0) == 0) {
            if (has_data_) {
                current_data_ += '\n';
            }
            current_data_ += field_value(line, 4);
            has_data_ = true;
        }
        // Ignore other fields (id:, retry:)
    }

    // All data processed
    buffer_.clear();
}

bool SSEParser::has_pending() const {
    return has_data_ || !current_event_.empty() || !buffer_.empty();
}

void SSEParser::reset() {
    buffer_.clear();
    current_event_.clear();
    current_data_.clear();
    has_data_ = false;
}

std::string format_sse(const std::string& event, const std::string& data) {
    std::string out;
    out.reserve(event.size() + data.size() + 24);
    if (!event.empty()) {
        out += "event: ";
        out += event;
        out += '\n';
    }
    size_t start = 0;
    while (true) {
        size_t nl = data.find('\n', start);
        out += "data: ";
        if (nl == std::string::npos) {
            out.append(data, start, std::string::npos);
            out += '\n';
            break;
        }
        out.append(data, start, nl - start);
        out += '\n';
        start = nl + 1;
    }
    out += '\n';
    return out;
}

} // namespace sift
