#pragma once
#include "relay/sse_emitter.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace relaygate {

class CorrelationRegistry;
class DeliveryChannel;
class ResponseWriter;
struct ServerRequest;

// Malformed or incomplete inbound request; reported as 400 before any
// stream is opened.
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

// A validated relay request, metadata already carrying the correlation ID.
struct RelayRequest {
    std::string request_id;
    std::string sender_id;
    std::string chat_id;
    std::string content;
    nlohmann::json metadata = nlohmann::json::object();
};

// Parse and validate a POST body. Accepts senderId/sender_id and
// chatId/chat_id (camelCase wins); strings and numbers are taken as text.
// Throws ValidationError with the caller-facing message.
RelayRequest parse_relay_request(const std::string& body);

// Copy of metadata (or {} if not an object) with http_relay.request_id set.
// Other caller keys, including siblings inside http_relay, are kept.
nlohmann::json merge_relay_metadata(const nlohmann::json& metadata,
                                    const std::string& request_id);

struct HandleResult {
    int status = 200;
    std::string request_id;                // empty if never minted
    std::optional<StreamOutcome> outcome;  // set once a stream was opened
};

// Serves one POST: validate, mint an ID, register it, open the event
// stream, publish the inbound message, then run the delivery loop. The
// registry entry is released on every exit path.
class InboundRequestHandler {
public:
    // Publishes the inbound message on the bus; may throw.
    using Publisher = std::function<void(const RelayRequest&)>;
    using IdGenerator = std::function<std::string()>;

    InboundRequestHandler(CorrelationRegistry& registry,
                          Publisher publisher,
                          std::chrono::milliseconds timeout,
                          IdGenerator id_generator = nullptr);

    HandleResult handle(const ServerRequest& req, ResponseWriter& writer);

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    StreamOutcome stream(const RelayRequest& relay_req,
                         DeliveryChannel& channel,
                         ResponseWriter& writer);

    CorrelationRegistry& registry_;
    Publisher publisher_;
    std::chrono::milliseconds timeout_;
    IdGenerator id_generator_;
};

} // namespace relaygate
