#include "echo_backend.hpp"
#include "event.hpp"

#include <iostream>

namespace relaygate {

EchoConfig EchoConfig::from_json(const nlohmann::json& j) {
    EchoConfig cfg;
    if (!j.is_object()) return cfg;
    if (j.contains("enabled") && j["enabled"].is_boolean())
        cfg.enabled = j["enabled"].get<bool>();
    if (j.contains("progress_text") && j["progress_text"].is_string())
        cfg.progress_text = j["progress_text"].get<std::string>();
    if (j.contains("reply_prefix") && j["reply_prefix"].is_string())
        cfg.reply_prefix = j["reply_prefix"].get<std::string>();
    if (j.contains("async") && j["async"].is_boolean())
        cfg.async = j["async"].get<bool>();
    if (j.contains("delay_ms") && j["delay_ms"].is_number_integer() &&
        j["delay_ms"].get<int64_t>() >= 0)
        cfg.delay = std::chrono::milliseconds(j["delay_ms"].get<int64_t>());
    return cfg;
}

EchoBackend::EchoBackend(EventBus& bus, EchoConfig config)
    : bus_(bus), config_(std::move(config))
{}

EchoBackend::~EchoBackend() {
    shutdown();
}

void EchoBackend::subscribe_events() {
    if (inbound_sub_.active()) return;
    inbound_sub_ = ScopedSubscription(bus_, relaygate::subscribe<InboundMessageEvent>(bus_,
        [this](const InboundMessageEvent& ev) {
            if (!config_.async) {
                reply(ev.message);
                return;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            if (shutting_down_) return;
            reap_finished();
            auto done = std::make_shared<std::atomic<bool>>(false);
            InboundMessage msg = ev.message;
            workers_.push_back(Worker{
                std::thread([this, done, msg = std::move(msg)]() {
                    reply(msg);
                    done->store(true);
                }),
                done});
        }));
}

void EchoBackend::reap_finished() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

void EchoBackend::shutdown() {
    inbound_sub_.reset();
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
        workers.swap(workers_);
    }
    cv_.notify_all();
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
}

// Returns false if shutdown interrupted the wait.
bool EchoBackend::wait_delay() {
    if (config_.delay.count() <= 0) return true;
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, config_.delay, [this] { return shutting_down_; });
}

void EchoBackend::reply(const InboundMessage& msg) {
    // Tag replies with the progress namespace, as a streaming agent would.
    nlohmann::json tag = nlohmann::json::object();
    auto relay = msg.metadata.find("http_relay");
    if (relay != msg.metadata.end() && relay->is_object() && relay->contains("request_id")) {
        tag["request_id"] = (*relay)["request_id"];
    }

    try {
        if (!config_.progress_text.empty()) {
            if (!wait_delay()) return;
            OutboundMessageEvent progress;
            progress.message.channel = msg.channel;
            progress.message.chat_id = msg.chat_id;
            progress.message.content = config_.progress_text;
            progress.message.metadata = msg.metadata;
            progress.message.metadata["progress"] = tag;
            progress.message.metadata["progress"]["is_progress"] = true;
            bus_.publish(progress);
        }

        if (!wait_delay()) return;
        OutboundMessageEvent final_reply;
        final_reply.message.channel = msg.channel;
        final_reply.message.chat_id = msg.chat_id;
        final_reply.message.content = config_.reply_prefix + msg.content;
        final_reply.message.metadata = msg.metadata;
        final_reply.message.metadata["progress"] = tag;
        final_reply.message.metadata["progress"]["is_progress"] = false;
        bus_.publish(final_reply);
        replies_sent_.fetch_add(1);
    } catch (const std::exception& e) {
        std::cerr << "[echo] Failed to publish reply for " << msg.session_key()
                  << ": " << e.what() << "\n";
    }
}

} // namespace relaygate
