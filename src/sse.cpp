#include "sse.hpp"
#include <nlohmann/json.hpp>

namespace relaygate {

bool SseParser::feed(const std::string& chunk, const SseCallback& callback) {
    buffer_ += chunk;

    size_t pos = 0;
    while (pos < buffer_.size()) {
        size_t newline = buffer_.find('\n', pos);
        if (newline == std::string::npos) break;  // incomplete line stays buffered

        std::string line = buffer_.substr(pos, newline - pos);
        // Remove trailing \r if present
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        pos = newline + 1;

        if (line.empty()) {
            // Empty line = dispatch event
            if (has_data_) {
                SseEvent event{current_event_, current_data_};
                current_event_.clear();
                current_data_.clear();
                has_data_ = false;
                if (!callback(event)) {
                    buffer_.erase(0, pos);
                    return false;
                }
            }
            current_event_.clear();
        } else if (line.rfind("event:", 0) == 0) {
            current_event_ = line.substr(line.size() > 6 && line[6] == ' ' ? 7 : 6);
        } else if (line.rfind("data:", 0) == 0) {
            if (has_data_) {
                current_data_ += '\n';
            }
            // Handle both "data: payload" (with space) and "data:payload" (without)
            current_data_ += line.substr(line.size() > 5 && line[5] == ' ' ? 6 : 5);
            has_data_ = true;
        }
        // Ignore other lines (comments starting with :, id:, retry:)
    }

    buffer_.erase(0, pos);
    return true;
}

void SseParser::reset() {
    buffer_.clear();
    current_event_.clear();
    current_data_.clear();
    has_data_ = false;
}

std::string sse_event_content(const SseEvent& event) {
    auto j = nlohmann::json::parse(event.data, nullptr, false);
    if (j.is_object()) {
        auto it = j.find("content");
        if (it != j.end() && it->is_string()) return it->get<std::string>();
    }
    return event.data;
}

} // namespace relaygate
