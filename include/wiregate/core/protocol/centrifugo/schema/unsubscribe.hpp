#pragma once

#include <string>
#include <cstddef>

#include "wiregate/core/protocol/control/req_id.hpp"
#include "lcr/json.hpp"


namespace wiregate::core::protocol::centrifugo::schema {

// {"id":N,"method":"unsubscribe","params":{"channel":"<prefix>:<name>"}}
// Sent fire-and-forget: the ack carries no information the session needs.
struct Unsubscribe {
    using unsubscribe_tag = void;

    ctrl::req_id_t id{ctrl::INVALID_REQ_ID};
    std::string channel;

    [[nodiscard]]
    inline std::size_t max_json_size() const noexcept {
        return sizeof("{\"id\":,\"method\":\"unsubscribe\",\"params\":{\"channel\":\"\"}}") - 1
             + 20 + 6 * channel.size();
    }

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        out.reserve(max_json_size());
        out += "{\"id\":";
        lcr::json::append(out, id);
        out += ",\"method\":\"unsubscribe\",\"params\":{\"channel\":";
        lcr::json::append_string(out, channel);
        out += "}}";
        return out;
    }
};

} // namespace wiregate::core::protocol::centrifugo::schema
