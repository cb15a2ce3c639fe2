/*
===============================================================================
WebSocketConcept (Push-to-Channel)
===============================================================================

Defines the minimal transport contract required by a protocol Session.

The WebSocket implementation:

  • Performs the opening handshake asynchronously after open()
  • Owns its I/O thread (if any)
  • Reports Open / Message / Close / Error through the EventSender handed to
    open(), using non-blocking pushes only
  • Accepts outbound text frames through send() from the session thread
  • Is fully lifecycle-managed by the Session

No callbacks.
No dynamic dispatch.

-------------------------------------------------------------------------------
Lifecycle
-------------------------------------------------------------------------------

  open(url, events)
      Validates and starts the connection attempt. A non-None return value
      means nothing was started and no event will ever be emitted.

  send(text)
      Queues one text frame. Returns false if the socket is not open.

  close()
      Idempotent. Performs a graceful close when open, cancels a pending
      attempt otherwise, and releases the event channel. After close()
      returns no further event is pushed.

  abort()
      Like close(), but the socket is torn down without a close handshake.
      A later close() is a no-op.
===============================================================================
*/
#pragma once

#include <string_view>
#include <concepts>
#include <utility>

#include "wiregate/core/transport/error.hpp"
#include "wiregate/core/transport/parse_url.hpp"
#include "wiregate/core/transport/websocket/events.hpp"


namespace wiregate::core::transport {

template<class WS>
concept WebSocketConcept =
    requires(
        WS ws,
        const ParsedUrl& url,
        websocket::EventSender events,
        const std::string_view msg
    )
{
    // ---------------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------------

    { ws.open(url, std::move(events)) } -> std::same_as<Error>;
    { ws.close() } noexcept -> std::same_as<void>;
    { ws.abort() } noexcept -> std::same_as<void>;

    // ---------------------------------------------------------------------
    // Sending
    // ---------------------------------------------------------------------

    { ws.send(msg) } -> std::same_as<bool>;
};

} // namespace wiregate::core::transport
