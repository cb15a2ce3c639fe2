#pragma once

/*
===============================================================================
 transport::beast::WebSocket
===============================================================================

Boost.Beast implementation of transport::WebSocketConcept.

  • ws:// over plain TCP, wss:// over TLS (Boost.Asio SSL / OpenSSL) with SNI
    and peer verification against the system trust store
  • One internal I/O thread per open() runs the whole asynchronous chain:
        resolve → connect → [TLS handshake] → WebSocket upgrade → read loop
  • Outbound frames are posted onto the I/O thread and written in order
  • Events (Open / Message / Close / Error) are pushed into the EventSender
    handed to open(); the transport never blocks on the session

The Boost headers stay behind a pimpl so consumers of this header only need
the standard library.
===============================================================================
*/

#include <memory>
#include <string_view>

#include "wiregate/core/transport/error.hpp"
#include "wiregate/core/transport/parse_url.hpp"
#include "wiregate/core/transport/websocket/events.hpp"
#include "wiregate/core/transport/websocket_concept.hpp"


namespace wiregate::core::transport::beast {

class WebSocket {
public:
    WebSocket();
    ~WebSocket();

    WebSocket(const WebSocket&) = delete;
    WebSocket& operator=(const WebSocket&) = delete;

    // Starts the asynchronous connection attempt
    [[nodiscard]]
    Error open(const ParsedUrl& url, websocket::EventSender events);

    // Queues one text frame; false when the socket is not open
    [[nodiscard]]
    bool send(std::string_view msg);

    // Graceful close (or cancellation of a pending attempt); joins the I/O thread
    void close() noexcept;

    // Drops the connection without sending a close frame; joins the I/O thread
    void abort() noexcept;

    [[nodiscard]]
    bool is_open() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;

    void stop_(bool graceful) noexcept;
};

// Assert that the Beast transport conforms to transport::WebSocketConcept
static_assert(WebSocketConcept<WebSocket>);

} // namespace wiregate::core::transport::beast
