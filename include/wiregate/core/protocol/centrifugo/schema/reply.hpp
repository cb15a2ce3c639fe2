#pragma once

#include <string>
#include <cstdint>
#include <ostream>

#include "wiregate/core/protocol/control/req_id.hpp"
#include "lcr/optional.hpp"


namespace wiregate::core::protocol::centrifugo::schema {

// Error object of a reply: {"code":<u32>,"message":"<text>"}
struct ReplyError {
    std::uint32_t code{0};
    std::string message;

    bool operator==(const ReplyError&) const = default;
};

// Reply to a command. Any combination of the three fields may be absent.
struct Reply {
    lcr::optional<ctrl::req_id_t> id{};
    bool has_result{false};               // "result" present (content is not interpreted)
    lcr::optional<ReplyError> error{};

    [[nodiscard]]
    inline bool is_error() const noexcept {
        return error.has();
    }

    inline void reset() {
        id.reset();
        has_result = false;
        error.reset();
    }
};

inline std::ostream& operator<<(std::ostream& os, const Reply& r) {
    os << "[Reply] {id=" << lcr::to_string(r.id) << ", result=" << (r.has_result ? "yes" : "no");
    if (r.error.has()) {
        os << ", error={code=" << r.error.value().code << ", message=\"" << r.error.value().message << "\"}";
    }
    return os << "}";
}

} // namespace wiregate::core::protocol::centrifugo::schema
