#pragma once

#include <string_view>

namespace wiregate::core {
namespace transport {

/*
===============================================================================
 transport::Error
===============================================================================

Classification of what went wrong below the gateway protocol. The Boost.Asio /
Beast / OpenSSL error code is folded into one of these, and its message text
travels next to it in websocket::Event::description.

Returned synchronously by open() / send() and carried by Error events:

  open()            InvalidUrl, InvalidState
  connect phase     ConnectionFailed (resolve / TCP), HandshakeFailed (TLS / upgrade)
  established       TransportFailure (read / write failure)
  session side      Backpressure (inbound queue full, reader gave up)

A graceful close is not an error; it is reported as a Close event.
===============================================================================
*/

enum class Error {
    None = 0,
    InvalidUrl,
    InvalidState,     // open() on an open socket, send() on a closed one
    ConnectionFailed,
    HandshakeFailed,
    TransportFailure,
    Backpressure,
};

inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:              return "None";
    case Error::InvalidUrl:        return "InvalidUrl";
    case Error::InvalidState:      return "InvalidState";
    case Error::ConnectionFailed:  return "ConnectionFailed";
    case Error::HandshakeFailed:   return "HandshakeFailed";
    case Error::TransportFailure:  return "TransportFailure";
    case Error::Backpressure:      return "Backpressure";
    }
    return "Unknown";
}

} // namespace transport
} // namespace wiregate::core
