#pragma once

#include <string>
#include <string_view>
#include <cstdlib>
#include <cstddef>

#include "wiregate/core/transport/error.hpp"


namespace wiregate::core::transport {

    // Contains parsed URL components
    struct ParsedUrl {
        bool secure{false};   // true = wss, false = ws
        std::string host;
        std::string port;
        std::string target;   // path + query, always starts with '/'
    };


    // ---------------------------------------------------------------------
    // Minimal URL parser for ws:// and wss:// gateway endpoints.
    // Accepts the forms gateways are deployed with and rejects malformed
    // input without attempting full RFC 3986 compliance. IPv6 literals are
    // accepted in brackets.
    //
    // Example inputs:
    //   wss://gateway.example.com/connection/websocket
    //   ws://127.0.0.1:8000/connection/websocket?format=json
    //   ws://[::1]:8000/ws
    // ---------------------------------------------------------------------
    [[nodiscard]]
    inline Error parse_url(std::string_view url, ParsedUrl& out) noexcept {
        out = ParsedUrl{};
        // 1) Extract scheme
        constexpr std::string_view ws  = "ws://";
        constexpr std::string_view wss = "wss://";
        std::size_t pos = 0;
        if (url.substr(0, ws.size()) == ws) {
            out.secure = false;
            pos = ws.size();
        }
        else if (url.substr(0, wss.size()) == wss) {
            out.secure = true;
            pos = wss.size();
        }
        else {
            return Error::InvalidUrl;
        }
        // 2) Extract authority (host[:port]), ends at '/', '?' or end of input
        const std::size_t end = url.find_first_of("/?", pos);
        const std::string_view authority = (end == std::string_view::npos) ? url.substr(pos) : url.substr(pos, end - pos);
        if (authority.empty() || authority.find('@') != std::string_view::npos) {
            return Error::InvalidUrl;
        }
        // 3) Split host and port
        std::string_view host;
        std::string_view port;
        if (authority.front() == '[') {
            const std::size_t close = authority.find(']');
            if (close == std::string_view::npos) {
                return Error::InvalidUrl;
            }
            host = authority.substr(1, close - 1);
            const std::string_view rest = authority.substr(close + 1);
            if (!rest.empty()) {
                if (rest.front() != ':') {
                    return Error::InvalidUrl;
                }
                port = rest.substr(1);
                if (port.empty()) {
                    return Error::InvalidUrl;
                }
            }
        }
        else {
            const std::size_t colon = authority.find(':');
            if (colon != std::string_view::npos) {
                host = authority.substr(0, colon);
                port = authority.substr(colon + 1);
                if (port.empty()) {
                    return Error::InvalidUrl;
                }
            }
            else {
                host = authority;
            }
        }
        out.host.assign(host);
        out.port = port.empty() ? (out.secure ? "443" : "80") : std::string(port);
        // 4) Target (default "/" if missing)
        if (end == std::string_view::npos) {
            out.target = "/";
        }
        else if (url[end] == '?') {
            out.target = "/";
            out.target.append(url.substr(end));
        }
        else {
            out.target.assign(url.substr(end));
        }

        // Invariants check --------------------------------

        // Validate host
        if (out.host.empty()) {
            return Error::InvalidUrl;
        }
        for (char c : out.host) {
            if (c == ' ' || c == '/' || c == '\\') {
                return Error::InvalidUrl;
            }
        }
        // Validate port - must be numeric and in range
        if (out.port.size() > 5) {
            return Error::InvalidUrl;
        }
        for (char c : out.port) {
            if (c < '0' || c > '9') {
                return Error::InvalidUrl;
            }
        }
        const unsigned long p = std::strtoul(out.port.c_str(), nullptr, 10);
        if (p == 0 || p > 65535) {
            return Error::InvalidUrl;
        }
        // Validate target
        if (out.target.empty() || out.target[0] != '/') {
            return Error::InvalidUrl;
        }
        // ---------------------------------------------------

        return Error::None;
    }

} // namespace wiregate::core::transport
