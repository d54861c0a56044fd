#pragma once
#include <string>
#include <functional>

namespace relaygate {

struct SseEvent {
    std::string event; // event type ("progress", "response"); empty if unnamed
    std::string data;  // raw data payload, multi-line data joined with '\n'
};

// Callback receives each parsed SSE event. Return false to stop parsing.
using SseCallback = std::function<bool(const SseEvent& event)>;

// Incremental parser for a text/event-stream body
class SseParser {
public:
    // Feed raw data chunk, triggers callback for complete events.
    // Returns false if the callback asked to stop.
    bool feed(const std::string& chunk, const SseCallback& callback);

    // Reset parser state
    void reset();

private:
    std::string buffer_;
    std::string current_event_;
    std::string current_data_;
    bool has_data_ = false;
};

// The "content" field of a relay event's JSON data, or the raw data if it
// is not a JSON object with a string content.
std::string sse_event_content(const SseEvent& event);

} // namespace relaygate
