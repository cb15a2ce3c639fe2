#pragma once

#include <string_view>

#include "wiregate/core/protocol/centrifugo/schema/push.hpp"
#include "wiregate/core/protocol/centrifugo/parser/helpers.hpp"
#include "wiregate/core/protocol/centrifugo/parser/result.hpp"
#include "lcr/log/logger.hpp"

#include <simdjson.h>


namespace wiregate::core::protocol::centrifugo::parser::push {

// Parses {"channel":string, "pub"?:{"data"?:any}}
[[nodiscard]]
inline Result parse(const simdjson::dom::element& root, schema::Push& out) {
    out.reset();

    std::string_view channel;
    if (helper::parse_string_required(root, "channel", channel) != Result::Ok) {
        WG_WARN("[CODEC] Field 'channel' missing or invalid in push -> ignore message.");
        return Result::InvalidSchema;
    }
    out.channel.assign(channel);

    simdjson::dom::element pub;
    bool present = false;
    if (helper::parse_object_optional(root, "pub", pub, present) != Result::Ok) {
        WG_WARN("[CODEC] Field 'pub' is not an object in push on '" << channel << "' -> ignore message.");
        return Result::InvalidSchema;
    }
    if (present) {
        // data is passed through as raw JSON text
        if (helper::parse_raw_optional(pub, "data", out.data) != Result::Ok) {
            return Result::InvalidSchema;
        }
    }

    return Result::Parsed;
}

} // namespace wiregate::core::protocol::centrifugo::parser::push
