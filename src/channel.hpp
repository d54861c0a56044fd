#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace relaygate {

class EventBus;

// Message travelling from a channel towards the agent backend.
struct InboundMessage {
    std::string channel;
    std::string sender_id;
    std::string chat_id;
    std::string content;
    std::vector<std::string> media;
    nlohmann::json metadata = nlohmann::json::object();
    uint64_t timestamp = 0;

    // "channel:chat_id", the key a backend keeps conversation state under
    std::string session_key() const { return channel + ":" + chat_id; }
};

// Message travelling from the agent backend back to a channel.
struct OutboundMessage {
    std::string channel;
    std::string chat_id;
    std::string content;
    nlohmann::json metadata = nlohmann::json::object();
};

// Abstract base class for messaging channels
class Channel {
public:
    explicit Channel(EventBus& bus) : bus_(bus) {}
    virtual ~Channel() = default;

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    virtual std::string channel_name() const = 0;

    // Bring the channel up. Idempotent; throws std::runtime_error on failure.
    virtual void start() = 0;

    // Tear the channel down. Idempotent; safe if start() never ran.
    virtual void stop() = 0;

    virtual bool is_running() const = 0;

    // Deliver a message produced by the backend through this channel
    virtual void send(const OutboundMessage& msg) = 0;

protected:
    // Publish an inbound message on the bus, stamping channel and timestamp.
    // Exceptions thrown by bus subscribers propagate to the caller.
    void handle_message(const std::string& sender_id,
                        const std::string& chat_id,
                        const std::string& content,
                        std::vector<std::string> media,
                        nlohmann::json metadata);

    EventBus& bus_;
};

} // namespace relaygate
