#pragma once
#include "channel.hpp"

namespace relaygate {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* InboundMessage  = "InboundMessage";
    constexpr const char* OutboundMessage = "OutboundMessage";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

// A channel received a message for the agent backend
struct InboundMessageEvent : Event {
    static constexpr const char* TAG = event_tags::InboundMessage;
    InboundMessage message;

    InboundMessageEvent() { type_tag = TAG; }
};

// The agent backend produced a message; every channel may see it
struct OutboundMessageEvent : Event {
    static constexpr const char* TAG = event_tags::OutboundMessage;
    OutboundMessage message;

    OutboundMessageEvent() { type_tag = TAG; }
};

} // namespace relaygate
