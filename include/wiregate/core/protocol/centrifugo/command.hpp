#pragma once

#include <string>
#include <cstdint>
#include <ostream>
#include <utility>
#include <string_view>

#include "lcr/sync/bounded_channel.hpp"


namespace wiregate::core::protocol::centrifugo {

// ===============================================================
// Commands accepted by a running session
// ===============================================================
enum class CommandType : std::uint8_t {
    Connect,        // ignored by a live session (a new connect replaces the session)
    Subscribe,
    Unsubscribe,
    Disconnect
};

[[nodiscard]]
inline constexpr std::string_view to_string(CommandType t) noexcept {
    switch (t) {
        case CommandType::Connect:     return "Connect";
        case CommandType::Subscribe:   return "Subscribe";
        case CommandType::Unsubscribe: return "Unsubscribe";
        case CommandType::Disconnect:  return "Disconnect";
        default:                       return "Unknown";
    }
}

struct Command {
    CommandType type{CommandType::Disconnect};
    std::string handle;     // Subscribe, Unsubscribe
    std::string name;       // Subscribe: logical name
    std::string url;        // Connect
    std::string token;      // Connect

    static Command connect(std::string url, std::string token) {
        return Command{CommandType::Connect, {}, {}, std::move(url), std::move(token)};
    }

    static Command subscribe(std::string handle, std::string logical) {
        return Command{CommandType::Subscribe, std::move(handle), std::move(logical), {}, {}};
    }

    static Command unsubscribe(std::string handle) {
        return Command{CommandType::Unsubscribe, std::move(handle), {}, {}, {}};
    }

    static Command disconnect() {
        return Command{CommandType::Disconnect, {}, {}, {}, {}};
    }
};

inline std::ostream& operator<<(std::ostream& os, const Command& c) {
    os << "[Command] " << to_string(c.type);
    switch (c.type) {
        case CommandType::Subscribe:
            os << " {handle=" << c.handle << ", name=" << c.name << "}";
            break;
        case CommandType::Unsubscribe:
            os << " {handle=" << c.handle << "}";
            break;
        case CommandType::Connect:
            os << " {url=" << c.url << "}";
            break;
        default:
            break;
    }
    return os;
}

// Command channel (callers → session)
using CommandChannel  = lcr::sync::bounded_channel<Command>;
using CommandSender   = CommandChannel::Sender;
using CommandReceiver = CommandChannel::Receiver;

} // namespace wiregate::core::protocol::centrifugo
