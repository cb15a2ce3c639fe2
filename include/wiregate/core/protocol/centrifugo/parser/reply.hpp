#pragma once

#include <string_view>

#include "wiregate/core/protocol/centrifugo/schema/reply.hpp"
#include "wiregate/core/protocol/centrifugo/parser/helpers.hpp"
#include "wiregate/core/protocol/centrifugo/parser/result.hpp"
#include "lcr/log/logger.hpp"

#include <simdjson.h>


namespace wiregate::core::protocol::centrifugo::parser::reply {

// Parses {"id"?:u64, "result"?:any, "error"?:{"code":u32,"message":string}}
[[nodiscard]]
inline Result parse(const simdjson::dom::element& root, schema::Reply& out) {
    out.reset();

    if (helper::require_object(root) != Result::Ok) {
        WG_WARN("[CODEC] Reply is not a JSON object -> ignore message.");
        return Result::InvalidSchema;
    }

    // id (optional)
    if (helper::parse_uint64_optional(root, "id", out.id) != Result::Ok) {
        WG_WARN("[CODEC] Field 'id' has invalid type in reply -> ignore message.");
        return Result::InvalidSchema;
    }

    // result (optional, content not interpreted; null reads as absent)
    out.has_result = helper::has_value(root, "result");

    // error (optional)
    simdjson::dom::element error;
    bool present = false;
    if (helper::parse_object_optional(root, "error", error, present) != Result::Ok) {
        WG_WARN("[CODEC] Field 'error' is not an object in reply -> ignore message.");
        return Result::InvalidSchema;
    }
    if (present) {
        schema::ReplyError err;
        if (helper::parse_uint32_required(error, "code", err.code) != Result::Ok) {
            WG_WARN("[CODEC] Field 'error.code' missing or invalid in reply -> ignore message.");
            return Result::InvalidSchema;
        }
        std::string_view message;
        if (helper::parse_string_required(error, "message", message) != Result::Ok) {
            WG_WARN("[CODEC] Field 'error.message' missing or invalid in reply -> ignore message.");
            return Result::InvalidSchema;
        }
        err.message.assign(message);
        out.error = std::move(err);
    }

    return Result::Parsed;
}

} // namespace wiregate::core::protocol::centrifugo::parser::reply
