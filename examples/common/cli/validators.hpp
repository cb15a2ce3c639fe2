#pragma once

#include <string>
#include <string_view>

#include <CLI/CLI.hpp>

#include "wiregate/core/transport/parse_url.hpp"


namespace wiregate::examples::cli {

// -------------------------------------------------------------
// WebSocket URL validator
// -------------------------------------------------------------
inline auto ws_url_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        wiregate::core::transport::ParsedUrl parsed;
        if (wiregate::core::transport::parse_url(value, parsed) == wiregate::core::transport::Error::None) {
            return {};
        }
        return "URL must be ws://host[:port][/path] or wss://host[:port][/path]";
    },
    "WebSocket URL validator"
);


// -------------------------------------------------------------
// Logical channel name validator
// -------------------------------------------------------------
inline auto channel_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value.empty()) {
            return "Channel name must not be empty";
        }
        for (char c : value) {
            if (c == ' ' || c == '\t' || c == '\n') {
                return "Channel name must not contain whitespace";
            }
        }
        return {};
    },
    "Channel name validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::IsMember({"trace", "debug", "info", "warn", "error", "fatal"});

} // namespace wiregate::examples::cli
