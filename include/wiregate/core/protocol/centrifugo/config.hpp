#pragma once

#include <string>
#include <cstddef>

#include "wiregate/core/protocol/centrifugo/channel/naming.hpp"


namespace wiregate::core::protocol::centrifugo {

// Client-wide settings; every new session copies them.
struct client_config {
    std::string channel_prefix{channel::DEFAULT_PREFIX};   // channel = "<prefix>:<logical name>"
    std::size_t command_capacity{32};                      // callers → session queue depth
    std::size_t inbound_capacity{1024};                    // transport → session queue depth
};

} // namespace wiregate::core::protocol::centrifugo
