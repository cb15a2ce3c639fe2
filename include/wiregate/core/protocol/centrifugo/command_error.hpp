#pragma once

#include <cstdint>
#include <string_view>


namespace wiregate::core::protocol::centrifugo {

// ===============================================================
// Synchronous result of a command API call
// ===============================================================
enum class CommandError : std::uint8_t {
    None = 0,
    NotConnected,   // no live session (never connected, disconnected, or terminated)
    InvalidUrl      // connect() URL is not ws:// or wss://
};

[[nodiscard]]
inline constexpr std::string_view to_string(CommandError e) noexcept {
    switch (e) {
        case CommandError::None:         return "None";
        case CommandError::NotConnected: return "NotConnected";
        case CommandError::InvalidUrl:   return "InvalidUrl";
        default:                         return "Unknown";
    }
}

} // namespace wiregate::core::protocol::centrifugo
