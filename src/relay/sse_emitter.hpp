#pragma once
#include "relay/delivery_channel.hpp"
#include <chrono>
#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace relaygate {

class ResponseWriter;

namespace sse_events {
    constexpr const char* Progress = "progress";
    constexpr const char* Response = "response";
} // namespace sse_events

// Content of synthetic terminal events
namespace relay_notices {
    constexpr const char* Timeout       = "Upstream response timed out.";
    constexpr const char* PublishFailed = "I could not process this message. Please retry.";
    constexpr const char* ShuttingDown  = "Relay is shutting down.";
} // namespace relay_notices

// "event: <event>\ndata: <json>\n\n". Invalid UTF-8 in the payload is
// replaced rather than thrown.
std::string format_sse_event(const std::string& event, const nlohmann::json& payload);

enum class EmitterState {
    Awaiting,
    EmittingProgress,
    Terminated,
};

enum class StreamOutcome {
    Completed,       // a non-progress message was emitted
    TimedOut,        // no delivery within the window; timeout notice emitted
    Cancelled,       // channel closed by shutdown; shutdown notice emitted
    PublishFailed,   // bus rejected the inbound message; failure notice emitted
    InternalError,   // loop raised; failure notice emitted
    TransportError,  // write failed or the peer hung up; caller is gone
};

const char* stream_outcome_name(StreamOutcome outcome);

// Drives one request's delivery loop: waits on the delivery channel and
// writes each message to the open stream as a progress or response event,
// stopping at the first terminal condition. The timeout restarts after
// every dequeued message. While waiting, the writer is checked for a hung-up
// peer every peer_check_interval, ending the loop with TransportError.
class SseEmitter {
public:
    static constexpr std::chrono::milliseconds kPeerCheckInterval{1000};

    SseEmitter(ResponseWriter& writer, std::chrono::milliseconds timeout,
               std::chrono::milliseconds peer_check_interval = kPeerCheckInterval);

    // Run the loop until Terminated. Never reads the channel afterwards.
    StreamOutcome run(DeliveryChannel& channel);

    // Emit a single terminal response event (used when the loop never
    // starts, e.g. publish failure). Returns false on write failure.
    bool emit_terminal(const std::string& content);

    EmitterState state() const { return state_; }
    size_t events_emitted() const { return events_emitted_; }

private:
    bool write_event(const char* event, const std::string& content);
    bool wait_next(DeliveryChannel& channel, OutboundMessage& msg, PopStatus& status);

    ResponseWriter& writer_;
    std::chrono::milliseconds timeout_;
    std::chrono::milliseconds peer_check_;
    EmitterState state_ = EmitterState::Awaiting;
    size_t events_emitted_ = 0;
};

} // namespace relaygate
