#pragma once

#include <string>
#include <cstddef>
#include <concepts>
#include <string_view>

#include <simdjson.h>

#include "wiregate/core/protocol/centrifugo/schema/reply.hpp"
#include "wiregate/core/protocol/centrifugo/schema/push.hpp"
#include "wiregate/core/protocol/centrifugo/parser/helpers.hpp"
#include "wiregate/core/protocol/centrifugo/parser/result.hpp"
#include "wiregate/core/protocol/centrifugo/parser/reply.hpp"
#include "wiregate/core/protocol/centrifugo/parser/push.hpp"
#include "lcr/log/logger.hpp"


namespace wiregate::core::protocol::centrifugo::parser {

/*
================================================================================
Gateway Parsing Architecture
================================================================================

1) Router (frame dispatch)
   • Splits a text frame into its newline-separated JSON objects
   • Classifies each object by shape and selects the message parser:
        "id" present                  → Reply
        "push" object present         → Push (envelope unwrapped)
        "channel" present             → Push
        "result" or "error" present   → Reply without id
        empty object {}               → server ping
        anything else                 → Ignored
   • Hands every successfully parsed message to the Sink, in frame order

2) Message parsers (reply.hpp, push.hpp)
   • Validate required vs optional fields, log failures
   • Populate schema::Reply / schema::Push

3) Helpers (helpers.hpp)
   • Structural JSON primitives, no logging

A malformed object never aborts the rest of the frame and is never fatal;
it is logged and dropped.
================================================================================
*/

// Receiver of decoded messages (the protocol session, or a test recorder)
template <class S>
concept SinkConcept =
    requires(S& sink, const schema::Reply& reply, const schema::Push& push) {
        sink.on_reply(reply);
        sink.on_push(push);
        sink.on_ping();
    };


class Router {
    constexpr static std::size_t PARSER_BUFFER_INITIAL_SIZE_ = 16 * 1024; // 16 KB

public:
    Router() {
        if (parser_.allocate(PARSER_BUFFER_INITIAL_SIZE_)) {
            WG_WARN("[CODEC] Unable to preallocate parser buffer");
        }
    }

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    // -------------------------------------------------------------------------
    // Frame entry point: decodes every newline-separated object in order.
    // Returns the number of messages delivered to the sink.
    // -------------------------------------------------------------------------
    template <SinkConcept Sink>
    std::size_t parse_frame(std::string_view frame, Sink& sink) {
        std::size_t delivered = 0;
        while (!frame.empty()) {
            const std::size_t nl = frame.find('\n');
            std::string_view line = frame.substr(0, nl);
            frame = (nl == std::string_view::npos) ? std::string_view{} : frame.substr(nl + 1);
            if (is_blank_(line)) {
                continue;
            }
            if (parse_and_route(line, sink) == Result::Delivered) {
                ++delivered;
            }
        }
        return delivered;
    }

    // -------------------------------------------------------------------------
    // Single JSON object entry point
    // -------------------------------------------------------------------------
    template <SinkConcept Sink>
    [[nodiscard]]
    Result parse_and_route(std::string_view raw_msg, Sink& sink) {
        simdjson::dom::element root;
        auto error = parser_.parse(raw_msg).get(root);
        if (error) {
            WG_DEBUG("[CODEC] JSON parse error: " << error << " in message: " << raw_msg);
            return Result::InvalidJson;
        }
        if (helper::require_object(root) != Result::Ok) {
            WG_DEBUG("[CODEC] Non-object message -> ignore: " << raw_msg);
            return Result::Ignored;
        }

        // REPLY (correlated)
        if (helper::has_value(root, "id")) {
            return route_reply_(root, sink, raw_msg);
        }
        // PUSH (enveloped)
        simdjson::dom::element envelope;
        bool enveloped = false;
        if (helper::parse_object_optional(root, "push", envelope, enveloped) != Result::Ok) {
            WG_DEBUG("[CODEC] Field 'push' is not an object -> ignore: " << raw_msg);
            return Result::InvalidSchema;
        }
        if (enveloped) {
            return route_push_(envelope, sink, raw_msg);
        }
        // PUSH (flat)
        if (helper::has_value(root, "channel")) {
            return route_push_(root, sink, raw_msg);
        }
        // REPLY (uncorrelated)
        if (helper::has_value(root, "result") || helper::has_value(root, "error")) {
            return route_reply_(root, sink, raw_msg);
        }
        // PING
        simdjson::dom::object obj;
        if (!root.get(obj) && obj.size() == 0) {
            sink.on_ping();
            return Result::Delivered;
        }
        WG_TRACE("[CODEC] Unrecognized message shape -> ignore: " << raw_msg);
        return Result::Ignored;
    }

private:
    // Underlying simdjson parser (buffers reused across messages)
    simdjson::dom::parser parser_;

    // Reused decode targets
    schema::Reply reply_;
    schema::Push push_;

private:
    template <SinkConcept Sink>
    Result route_reply_(const simdjson::dom::element& root, Sink& sink, std::string_view raw_msg) {
        const Result r = reply::parse(root, reply_);
        if (r != Result::Parsed) {
            WG_DEBUG("[CODEC] Dropped reply (" << to_string(r) << "): " << raw_msg);
            return r;
        }
        sink.on_reply(reply_);
        return Result::Delivered;
    }

    template <SinkConcept Sink>
    Result route_push_(const simdjson::dom::element& root, Sink& sink, std::string_view raw_msg) {
        const Result r = push::parse(root, push_);
        if (r != Result::Parsed) {
            WG_DEBUG("[CODEC] Dropped push (" << to_string(r) << "): " << raw_msg);
            return r;
        }
        sink.on_push(push_);
        return Result::Delivered;
    }

    static bool is_blank_(std::string_view s) noexcept {
        for (char c : s) {
            if (c != ' ' && c != '\t' && c != '\r') {
                return false;
            }
        }
        return true;
    }
};

} // namespace wiregate::core::protocol::centrifugo::parser
