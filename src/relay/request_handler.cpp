#include "relay/request_handler.hpp"
#include "relay/correlation_registry.hpp"
#include "relay/outbound_dispatcher.hpp"
#include "channels/http_server.hpp"
#include "util.hpp"

#include <iostream>

namespace relaygate {

static const char* kMissingFields = "Missing sender_id/chat_id/content";

// Scalar JSON value as text; nullopt for null, objects and arrays.
static std::optional<std::string> scalar_text(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number() || v.is_boolean()) return v.dump();
    return std::nullopt;
}

// First non-empty scalar among the given keys, in order.
static std::optional<std::string> identity_field(const nlohmann::json& body,
                                                 const char* camel,
                                                 const char* snake) {
    for (const char* key : {camel, snake}) {
        auto it = body.find(key);
        if (it == body.end()) continue;
        auto text = scalar_text(*it);
        if (text && !text->empty()) return text;
    }
    return std::nullopt;
}

RelayRequest parse_relay_request(const std::string& body) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        std::cerr << "[http_relay] Invalid JSON in /message payload: " << e.what() << "\n";
        throw ValidationError("Invalid JSON body");
    }
    if (!j.is_object()) throw ValidationError("Payload must be an object");

    auto sender_id = identity_field(j, "senderId", "sender_id");
    auto chat_id = identity_field(j, "chatId", "chat_id");
    std::optional<std::string> content;
    auto c = j.find("content");
    if (c != j.end()) content = scalar_text(*c);

    if (!sender_id || !chat_id || !content) throw ValidationError(kMissingFields);

    RelayRequest req;
    req.sender_id = std::move(*sender_id);
    req.chat_id = std::move(*chat_id);
    req.content = std::move(*content);
    auto m = j.find("metadata");
    if (m != j.end() && m->is_object()) req.metadata = *m;
    return req;
}

nlohmann::json merge_relay_metadata(const nlohmann::json& metadata,
                                    const std::string& request_id) {
    nlohmann::json merged = metadata.is_object() ? metadata : nlohmann::json::object();
    auto& relay = merged[relay_keys::HttpRelay];
    if (!relay.is_object()) relay = nlohmann::json::object();
    relay[relay_keys::RequestId] = request_id;
    return merged;
}

static void send_error(ResponseWriter& writer, int status, const std::string& message) {
    if (!writer.send({status, "application/json", nlohmann::json{{"error", message}}.dump()})) {
        log_debug("http_relay", "Client went away before error response " + std::to_string(status));
    }
}

InboundRequestHandler::InboundRequestHandler(CorrelationRegistry& registry,
                                             Publisher publisher,
                                             std::chrono::milliseconds timeout,
                                             IdGenerator id_generator)
    : registry_(registry)
    , publisher_(std::move(publisher))
    , timeout_(timeout)
    , id_generator_(id_generator ? std::move(id_generator) : IdGenerator(generate_id))
{}

HandleResult InboundRequestHandler::handle(const ServerRequest& req, ResponseWriter& writer) {
    HandleResult result;

    RelayRequest relay_req;
    try {
        relay_req = parse_relay_request(req.body);
    } catch (const ValidationError& e) {
        result.status = 400;
        send_error(writer, result.status, e.what());
        return result;
    }

    relay_req.request_id = id_generator_();
    relay_req.metadata = merge_relay_metadata(relay_req.metadata, relay_req.request_id);
    result.request_id = relay_req.request_id;

    std::shared_ptr<DeliveryChannel> channel;
    try {
        channel = registry_.register_request(relay_req.request_id);
    } catch (const RegistryClosed&) {
        result.status = 503;
        send_error(writer, result.status, "Relay is shutting down");
        return result;
    } catch (const DuplicateIdentifier& e) {
        std::cerr << "[http_relay] " << e.what() << "\n";
        result.status = 500;
        send_error(writer, result.status, "Internal error");
        return result;
    }

    RegistrationGuard guard(registry_, relay_req.request_id);
    result.outcome = stream(relay_req, *channel, writer);
    if (*result.outcome != StreamOutcome::TransportError && !writer.end_stream()) {
        result.outcome = StreamOutcome::TransportError;
    }
    log_debug("http_relay", "request_id=" + relay_req.request_id + " finished: " +
              stream_outcome_name(*result.outcome));
    return result;
}

StreamOutcome InboundRequestHandler::stream(const RelayRequest& relay_req,
                                            DeliveryChannel& channel,
                                            ResponseWriter& writer) {
    const ResponseHeaders headers = {
        {"Content-Type", "text/event-stream"},
        {"Cache-Control", "no-cache"},
        {"Connection", "keep-alive"},
        {"X-Accel-Buffering", "no"},
    };
    if (!writer.begin_stream(200, headers)) return StreamOutcome::TransportError;

    // From here on exactly one terminal event is owed to the caller.
    SseEmitter emitter(writer, timeout_);

    try {
        publisher_(relay_req);
    } catch (const std::exception& e) {
        std::cerr << "[http_relay] Failed to enqueue inbound message for HTTP relay request "
                  << relay_req.request_id << ": " << e.what() << "\n";
        return emitter.emit_terminal(relay_notices::PublishFailed)
            ? StreamOutcome::PublishFailed : StreamOutcome::TransportError;
    }

    try {
        return emitter.run(channel);
    } catch (const std::exception& e) {
        std::cerr << "[http_relay] Delivery loop failed for request "
                  << relay_req.request_id << ": " << e.what() << "\n";
        if (emitter.state() != EmitterState::Terminated &&
            emitter.emit_terminal(relay_notices::PublishFailed)) {
            return StreamOutcome::InternalError;
        }
        return StreamOutcome::TransportError;
    }
}

} // namespace relaygate
