#include "relay/sse_emitter.hpp"
#include "relay/delivery_channel.hpp"
#include "relay/outbound_dispatcher.hpp"
#include "channels/http_server.hpp"

#include <algorithm>

namespace relaygate {

std::string format_sse_event(const std::string& event, const nlohmann::json& payload) {
    return "event: " + event + "\n" +
           "data: " + payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) +
           "\n\n";
}

const char* stream_outcome_name(StreamOutcome outcome) {
    switch (outcome) {
        case StreamOutcome::Completed:      return "completed";
        case StreamOutcome::TimedOut:       return "timed_out";
        case StreamOutcome::Cancelled:      return "cancelled";
        case StreamOutcome::PublishFailed:  return "publish_failed";
        case StreamOutcome::InternalError:  return "internal_error";
        case StreamOutcome::TransportError: return "transport_error";
    }
    return "unknown";
}

SseEmitter::SseEmitter(ResponseWriter& writer, std::chrono::milliseconds timeout,
                       std::chrono::milliseconds peer_check_interval)
    : writer_(writer)
    , timeout_(timeout)
    , peer_check_(peer_check_interval > std::chrono::milliseconds(0)
                      ? peer_check_interval : kPeerCheckInterval)
{}

bool SseEmitter::write_event(const char* event, const std::string& content) {
    nlohmann::json payload = {{"content", content}};
    if (!writer_.write_chunk(format_sse_event(event, payload))) {
        state_ = EmitterState::Terminated;
        return false;
    }
    ++events_emitted_;
    return true;
}

bool SseEmitter::emit_terminal(const std::string& content) {
    if (state_ == EmitterState::Terminated) return false;
    bool ok = write_event(sse_events::Response, content);
    state_ = EmitterState::Terminated;
    return ok;
}

// Pop within the full timeout in peer_check_ slices. Returns false if the
// peer hung up first.
bool SseEmitter::wait_next(DeliveryChannel& channel, OutboundMessage& msg,
                           PopStatus& status) {
    using namespace std::chrono;
    const auto deadline = steady_clock::now() + timeout_;
    for (;;) {
        auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now());
        if (remaining <= milliseconds(0)) {
            status = PopStatus::Timeout;
            return true;
        }
        status = channel.pop(msg, std::min(remaining, peer_check_));
        if (status != PopStatus::Timeout) return true;
        if (writer_.peer_closed()) return false;
    }
}

StreamOutcome SseEmitter::run(DeliveryChannel& channel) {
    while (state_ != EmitterState::Terminated) {
        state_ = EmitterState::Awaiting;

        OutboundMessage msg;
        PopStatus status = PopStatus::Timeout;
        if (!wait_next(channel, msg, status)) {
            state_ = EmitterState::Terminated;
            return StreamOutcome::TransportError;
        }
        switch (status) {
            case PopStatus::Timeout:
                return emit_terminal(relay_notices::Timeout)
                    ? StreamOutcome::TimedOut : StreamOutcome::TransportError;
            case PopStatus::Closed:
                return emit_terminal(relay_notices::ShuttingDown)
                    ? StreamOutcome::Cancelled : StreamOutcome::TransportError;
            case PopStatus::Message:
                break;
        }

        if (!is_progress_message(msg.metadata)) {
            return emit_terminal(msg.content)
                ? StreamOutcome::Completed : StreamOutcome::TransportError;
        }

        state_ = EmitterState::EmittingProgress;
        if (!write_event(sse_events::Progress, msg.content)) {
            return StreamOutcome::TransportError;
        }
    }
    return StreamOutcome::TransportError;
}

} // namespace relaygate
