#pragma once

#include <cstdint>


namespace wiregate::core::protocol::ctrl {

// Numeric request identifier carried in the "id" field of every outbound
// command and echoed back in the matching reply.
using req_id_t = std::uint64_t;

// Never sent; marks "no id"
inline constexpr req_id_t INVALID_REQ_ID = 0;

// Reserved for the implicit connect request of every session
inline constexpr req_id_t CONNECT_REQ_ID = 1;

// First id handed out to subscribe / unsubscribe requests
inline constexpr req_id_t PROTOCOL_BASE_REQ_ID = 2;

} // namespace wiregate::core::protocol::ctrl
