#pragma once

#include <string>
#include <ostream>

#include "lcr/optional.hpp"


namespace wiregate::core::protocol::centrifugo::schema {

// Server-initiated message for a channel. `data` holds the raw JSON text of
// "pub.data" when the push is a publication.
struct Push {
    std::string channel;
    lcr::optional<std::string> data{};

    [[nodiscard]]
    inline bool is_publication() const noexcept {
        return data.has();
    }

    inline void reset() {
        channel.clear();
        data.reset();
    }
};

inline std::ostream& operator<<(std::ostream& os, const Push& p) {
    os << "[Push] {channel=\"" << p.channel << "\"";
    if (p.data.has()) {
        os << ", data=" << p.data.value();
    }
    return os << "}";
}

} // namespace wiregate::core::protocol::centrifugo::schema
