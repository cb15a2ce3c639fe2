#pragma once

/*
===============================================================================
 wiregate::core::transport::websocket::Event
===============================================================================

Event type emitted by a WebSocket transport implementation and delivered to
the owning protocol session through a bounded channel.

This replaces cross-thread callbacks (on_message / on_error / on_close) with
a deterministic, poll-driven event channel.

-------------------------------------------------------------------------------
 Threading Model
-------------------------------------------------------------------------------

WebSocket:
    - Runs an internal I/O thread
    - Pushes Event objects with non-blocking try_send()

Session:
    - Runs a single-threaded poll loop
    - Drains events via try_recv()
    - Drives its state machine transitions

No session state is mutated from the transport thread.

-------------------------------------------------------------------------------
 Reliability Contract
-------------------------------------------------------------------------------

• Events MUST NOT be dropped silently.
• If the channel is full the transport closes its side of the channel; the
  session observes the closure and fails with Error::Backpressure.
• At most one terminal event (Close or Error) is emitted per open().
===============================================================================
*/

#include <string>
#include <cstdint>
#include <utility>
#include <string_view>

#include "wiregate/core/transport/error.hpp"
#include "lcr/sync/bounded_channel.hpp"

namespace wiregate::core::transport::websocket {

// -----------------------------------------------------------------------------
// EventType
// -----------------------------------------------------------------------------

enum class EventType : std::uint8_t {
    Open    = 0,    // Opening handshake completed
    Message = 1,    // Complete text message (payload)
    Close   = 2,    // Close frame received or stream ended
    Error   = 3,    // Transport-level failure (error + payload as description)
};

[[nodiscard]]
inline constexpr std::string_view to_string(EventType t) noexcept {
    switch (t) {
        case EventType::Open:    return "Open";
        case EventType::Message: return "Message";
        case EventType::Close:   return "Close";
        case EventType::Error:   return "Error";
        default:                 return "Unknown";
    }
}

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------

struct Event {

    EventType type{EventType::Close};
    transport::Error error{transport::Error::None};    // valid only if type == EventType::Error
    std::string payload;                                // message text, or error description

    static Event make_open() {
        Event ev;
        ev.type = EventType::Open;
        return ev;
    }

    static Event make_message(std::string text) {
        Event ev;
        ev.type = EventType::Message;
        ev.payload = std::move(text);
        return ev;
    }

    static Event make_close() {
        Event ev;
        ev.type = EventType::Close;
        return ev;
    }

    static Event make_error(transport::Error e, std::string description) {
        Event ev;
        ev.type    = EventType::Error;
        ev.error   = e;
        ev.payload = std::move(description);
        return ev;
    }
};

// Channel carrying transport events to the session
using EventChannel  = lcr::sync::bounded_channel<Event>;
using EventSender   = EventChannel::Sender;
using EventReceiver = EventChannel::Receiver;

} // namespace wiregate::core::transport::websocket
