#pragma once

#include <string>
#include <cstddef>

#include "wiregate/core/protocol/control/req_id.hpp"
#include "lcr/json.hpp"


namespace wiregate::core::protocol::centrifugo::schema {

// {"id":1,"method":"connect","params":{"token":"<token>"}}
struct Connect {
    using control_tag = void;

    ctrl::req_id_t id{ctrl::CONNECT_REQ_ID};
    std::string token;

    // Worst-case size (every token byte escaped as \u00XX)
    [[nodiscard]]
    inline std::size_t max_json_size() const noexcept {
        return sizeof("{\"id\":,\"method\":\"connect\",\"params\":{\"token\":\"\"}}") - 1
             + 20 + 6 * token.size();
    }

    [[nodiscard]]
    inline std::string to_json() const {
        std::string out;
        out.reserve(max_json_size());
        out += "{\"id\":";
        lcr::json::append(out, id);
        out += ",\"method\":\"connect\",\"params\":{\"token\":";
        lcr::json::append_string(out, token);
        out += "}}";
        return out;
    }
};

} // namespace wiregate::core::protocol::centrifugo::schema
