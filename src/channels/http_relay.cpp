#include "channels/http_relay.hpp"
#include "event.hpp"
#include "util.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace relaygate {

// ── HttpRelayConfig ─────────────────────────────────────────────

static const nlohmann::json* find_key(const nlohmann::json& j,
                                      const char* snake, const char* camel) {
    auto it = j.find(snake);
    if (it != j.end()) return &*it;
    if (camel) {
        it = j.find(camel);
        if (it != j.end()) return &*it;
    }
    return nullptr;
}

HttpRelayConfig HttpRelayConfig::from_json(const nlohmann::json& j) {
    HttpRelayConfig cfg;
    if (!j.is_object()) return cfg;

    if (auto* v = find_key(j, "enabled", nullptr); v && v->is_boolean())
        cfg.enabled = v->get<bool>();
    if (auto* v = find_key(j, "host", nullptr); v && v->is_string())
        cfg.host = v->get<std::string>();
    if (auto* v = find_key(j, "port", nullptr); v && v->is_number_integer() &&
        v->get<int64_t>() >= 0 && v->get<int64_t>() <= 65535)
        cfg.port = static_cast<uint16_t>(v->get<int64_t>());
    if (auto* v = find_key(j, "path", nullptr); v && v->is_string() &&
        !v->get<std::string>().empty() && v->get<std::string>()[0] == '/')
        cfg.path = v->get<std::string>();
    if (auto* v = find_key(j, "timeout_seconds", "timeoutSeconds"); v && v->is_number() &&
        v->get<double>() > 0)
        cfg.timeout_seconds = std::min(v->get<double>(), kMaxTimeoutSeconds);
    if (auto* v = find_key(j, "max_body", "maxBody"); v && v->is_number_integer() &&
        v->get<int64_t>() > 0 && v->get<int64_t>() <= UINT32_MAX)
        cfg.max_body = static_cast<uint32_t>(v->get<int64_t>());
    return cfg;
}

std::chrono::milliseconds HttpRelayConfig::timeout() const {
    double secs = std::min(timeout_seconds, kMaxTimeoutSeconds);
    if (!(secs > 0)) secs = HttpRelayConfig{}.timeout_seconds;
    return std::chrono::milliseconds(
        std::max<int64_t>(1, static_cast<int64_t>(std::llround(secs * 1000.0))));
}

// ── HttpRelayChannel ────────────────────────────────────────────

HttpRelayChannel::HttpRelayChannel(const HttpRelayConfig& config, EventBus& bus)
    : Channel(bus)
    , config_(config)
    , dispatcher_(registry_)
    , handler_(registry_,
               [this](const RelayRequest& req) {
                   handle_message(req.sender_id, req.chat_id, req.content,
                                  {}, req.metadata);
               },
               config.timeout())
{}

HttpRelayChannel::~HttpRelayChannel() {
    stop();
}

void HttpRelayChannel::subscribe_events() {
    if (outbound_sub_.active()) return;
    outbound_sub_ = ScopedSubscription(bus_, relaygate::subscribe<OutboundMessageEvent>(bus_,
        [this](const OutboundMessageEvent& ev) {
            send(ev.message);
        }));
}

void HttpRelayChannel::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_.load()) return;

    registry_.reopen();
    auto server = std::make_unique<HttpServer>(
        config_.listen_addr(), config_.max_body,
        [this](const ServerRequest& req, ResponseWriter& writer) {
            handle_http(req, writer);
        });

    std::string error;
    if (!server->start(error)) {
        registry_.close_all();
        throw std::runtime_error("HTTP relay failed to start: " + error);
    }
    server_ = std::move(server);
    running_.store(true);

    std::cerr << "[http_relay] HTTP relay channel started on "
              << config_.host << ":" << server_->port() << config_.path << "\n";
}

void HttpRelayChannel::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    bool was_running = running_.exchange(false);

    // Wakes every waiting delivery loop, which emits its shutdown notice
    // and returns before the server joins its worker.
    size_t released = registry_.close_all();

    if (server_) {
        server_->stop();
        server_.reset();
    }

    if (was_running) {
        std::cerr << "[http_relay] Stopped; released " << released
                  << " pending request(s)\n";
    }
}

void HttpRelayChannel::run(const std::atomic<bool>* shutdown) {
    while (running_.load()) {
        if (shutdown && shutdown->load()) break;
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
}

uint16_t HttpRelayChannel::port() const {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    return server_ ? server_->port() : config_.port;
}

void HttpRelayChannel::send(const OutboundMessage& msg) {
    // Undeliverable messages are not errors: they belong to another channel
    // or to a request that already ended.
    dispatcher_.deliver(msg);
}

void HttpRelayChannel::handle_http(const ServerRequest& req, ResponseWriter& writer) {
    if (req.path != config_.path) {
        if (!writer.send({404, "application/json", R"({"error":"Not found"})"}))
            log_debug("http_relay", "Client went away before 404");
        return;
    }
    if (req.method != "POST") {
        if (!writer.send({405, "application/json", R"({"error":"Method not allowed"})"}))
            log_debug("http_relay", "Client went away before 405");
        return;
    }
    handler_.handle(req, writer);
}

} // namespace relaygate
