#pragma once
#include "channel.hpp"
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace relaygate {

class CorrelationRegistry;

// Metadata namespaces that may carry a correlation ID
namespace relay_keys {
    constexpr const char* Progress   = "progress";
    constexpr const char* HttpRelay  = "http_relay";
    constexpr const char* RequestId  = "request_id";
    constexpr const char* IsProgress = "is_progress";
} // namespace relay_keys

// Correlation ID carried by outbound metadata. Checks progress.request_id
// first, then http_relay.request_id; only non-empty strings count. When
// both are present the progress namespace wins, even if they disagree.
std::optional<std::string> resolve_request_id(const nlohmann::json& metadata);

// True if metadata marks the message as non-terminal (progress.is_progress).
// Truthy values are true, non-zero numbers and any non-empty string, array
// or object (so the string "false" counts); null and absence are false.
bool is_progress_message(const nlohmann::json& metadata);

enum class DeliveryResult {
    Delivered,
    NoCorrelationId,   // not addressed to any relay request
    NoPendingRequest,  // request already finished, timed out or cancelled
};

// Routes outbound messages to the delivery channel of the matching pending
// request. Never blocks beyond a registry lookup and an unbounded enqueue.
class OutboundDispatcher {
public:
    explicit OutboundDispatcher(CorrelationRegistry& registry);

    DeliveryResult deliver(const OutboundMessage& msg);

private:
    CorrelationRegistry& registry_;
};

} // namespace relaygate
