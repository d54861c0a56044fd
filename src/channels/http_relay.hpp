#pragma once
#include "channel.hpp"
#include "event_bus.hpp"
#include "channels/http_server.hpp"
#include "relay/correlation_registry.hpp"
#include "relay/outbound_dispatcher.hpp"
#include "relay/request_handler.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace relaygate {

struct HttpRelayConfig {
    // Longer timeouts are clamped to this (one year) so the wait deadline
    // stays representable.
    static constexpr double kMaxTimeoutSeconds = 365.0 * 24 * 3600;

    bool enabled = true;
    std::string host = "127.0.0.1";
    uint16_t port = 18790;
    std::string path = "/message";
    double timeout_seconds = 900;     // silence allowed between deliveries
    uint32_t max_body = 1048576;

    // Parse a channels.http_relay section; unknown or mistyped keys keep
    // their defaults. Accepts camelCase aliases.
    static HttpRelayConfig from_json(const nlohmann::json& j);

    std::string listen_addr() const { return host + ":" + std::to_string(port); }

    // timeout_seconds as a duration, clamped to (0, kMaxTimeoutSeconds].
    std::chrono::milliseconds timeout() const;
};

// HTTP relay channel: one POST endpoint that publishes the inbound message
// on the bus and streams the backend's outbound messages for it back as
// Server-Sent Events. Owns the correlation registry, the listener and the
// running flag for its whole lifetime.
class HttpRelayChannel : public Channel {
public:
    HttpRelayChannel(const HttpRelayConfig& config, EventBus& bus);
    ~HttpRelayChannel() override;

    std::string channel_name() const override { return "http_relay"; }

    // Bind and start accepting. Idempotent; throws std::runtime_error if the
    // listener cannot be bound (the channel is then left stopped).
    void start() override;

    // Stop accepting, discard queued messages, release every in-flight
    // stream with a shutdown notice, then close the listener and join the
    // connection workers. Idempotent; safe if start() never completed.
    void stop() override;

    bool is_running() const override { return running_.load(); }

    // Outbound dispatcher entry point: route to the waiting request, or drop.
    void send(const OutboundMessage& msg) override;

    // Route every OutboundMessageEvent on the bus to send(). Released on
    // destruction.
    void subscribe_events();

    // Block while running, checking once per second, until stop() or until
    // *shutdown becomes true. Does not stop the channel itself.
    void run(const std::atomic<bool>* shutdown = nullptr);

    // Serve one HTTP request; exposed so tests can drive it without sockets.
    void handle_http(const ServerRequest& req, ResponseWriter& writer);

    // Bound port once started (useful with port 0).
    uint16_t port() const;

    const HttpRelayConfig& config() const { return config_; }
    CorrelationRegistry& registry() { return registry_; }
    const CorrelationRegistry& registry() const { return registry_; }

private:
    HttpRelayConfig config_;
    CorrelationRegistry registry_;
    OutboundDispatcher dispatcher_;
    InboundRequestHandler handler_;
    std::unique_ptr<HttpServer> server_;
    ScopedSubscription outbound_sub_;

    mutable std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
};

} // namespace relaygate
