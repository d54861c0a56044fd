#include "relay/outbound_dispatcher.hpp"
#include "relay/correlation_registry.hpp"
#include "util.hpp"

namespace relaygate {

static std::optional<std::string> request_id_in(const nlohmann::json& metadata,
                                                const char* ns) {
    auto it = metadata.find(ns);
    if (it == metadata.end() || !it->is_object()) return std::nullopt;
    auto id = it->find(relay_keys::RequestId);
    if (id == it->end() || !id->is_string()) return std::nullopt;
    const auto& value = id->get_ref<const std::string&>();
    if (value.empty()) return std::nullopt;
    return value;
}

std::optional<std::string> resolve_request_id(const nlohmann::json& metadata) {
    if (!metadata.is_object()) return std::nullopt;
    if (auto id = request_id_in(metadata, relay_keys::Progress)) return id;
    return request_id_in(metadata, relay_keys::HttpRelay);
}

bool is_progress_message(const nlohmann::json& metadata) {
    if (!metadata.is_object()) return false;
    auto progress = metadata.find(relay_keys::Progress);
    if (progress == metadata.end() || !progress->is_object()) return false;
    auto flag = progress->find(relay_keys::IsProgress);
    if (flag == progress->end()) return false;

    if (flag->is_boolean()) return flag->get<bool>();
    if (flag->is_number_integer()) return flag->get<int64_t>() != 0;
    if (flag->is_number_unsigned()) return flag->get<uint64_t>() != 0;
    if (flag->is_number_float()) return flag->get<double>() != 0.0;
    if (flag->is_string() || flag->is_array() || flag->is_object()) return !flag->empty();
    return false;
}

OutboundDispatcher::OutboundDispatcher(CorrelationRegistry& registry)
    : registry_(registry)
{}

DeliveryResult OutboundDispatcher::deliver(const OutboundMessage& msg) {
    auto request_id = resolve_request_id(msg.metadata);
    if (!request_id) return DeliveryResult::NoCorrelationId;

    auto channel = registry_.lookup(*request_id);
    if (!channel) {
        log_debug("http_relay", "No pending HTTP relay request for request_id=" + *request_id);
        return DeliveryResult::NoPendingRequest;
    }

    // A channel closed between lookup and push belongs to a request that
    // already ended; the message is dropped with it.
    if (!channel->push(msg)) {
        log_debug("http_relay", "Dropped message for closed request_id=" + *request_id);
        return DeliveryResult::NoPendingRequest;
    }
    return DeliveryResult::Delivered;
}

} // namespace relaygate
