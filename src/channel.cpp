#include "channel.hpp"
#include "event.hpp"
#include "event_bus.hpp"
#include "util.hpp"

namespace relaygate {

void Channel::handle_message(const std::string& sender_id,
                             const std::string& chat_id,
                             const std::string& content,
                             std::vector<std::string> media,
                             nlohmann::json metadata) {
    InboundMessageEvent ev;
    ev.message.channel = channel_name();
    ev.message.sender_id = sender_id;
    ev.message.chat_id = chat_id;
    ev.message.content = content;
    ev.message.media = std::move(media);
    ev.message.metadata = metadata.is_object() ? std::move(metadata)
                                               : nlohmann::json::object();
    ev.message.timestamp = epoch_seconds();
    bus_.publish(ev);
}

} // namespace relaygate
