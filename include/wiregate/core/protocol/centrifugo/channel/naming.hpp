#pragma once

#include <string>
#include <string_view>


namespace wiregate::core::protocol::centrifugo::channel {

inline constexpr std::string_view DEFAULT_PREFIX = "logs";

// Server channel name of a logical name: "<prefix>:<name>"
[[nodiscard]]
inline std::string make_channel_name(std::string_view prefix, std::string_view logical) {
    std::string out;
    out.reserve(prefix.size() + 1 + logical.size());
    out.append(prefix);
    out += ':';
    out.append(logical);
    return out;
}

} // namespace wiregate::core::protocol::centrifugo::channel
