#pragma once

#include <string>
#include <vector>
#include <ostream>
#include <cstdlib>
#include <iostream>
#include <string_view>

#include <CLI/CLI.hpp>

#include "common/cli/validators.hpp"
#include "common/logger.hpp"

namespace wiregate::examples::cli::tail {

struct Params {
    std::string url                   = "ws://localhost:8000/connection/websocket";
    std::string token                 = "";
    std::vector<std::string> channels = {};
    std::string prefix                = "logs";
    std::string log_level             = "info";
    bool no_color                     = false;

    inline void dump(const std::string& header, std::ostream& os) const {
        os << header << ":\n  URL       : " << url << "\n" << "  Channels  : ";
        for (const auto& c : channels) {
            os << prefix << ":" << c << " ";
        }
        os << "\n  Token     : " << (token.empty() ? "(none)" : "(set)")
           << "\n  Log Level : " << log_level << "\n";
    }
};

[[nodiscard]]
inline Params configure(int argc, char** argv, std::string_view description) {
    CLI::App app{std::string(description)};
    Params params{};

    app.add_option("--url", params.url, "Gateway WebSocket endpoint")->check(ws_url_validator)->default_val(params.url);
    app.add_option("--token", params.token, "Connection token (opaque)")->envname("WIREGATE_TOKEN");
    app.add_option("-c,--channel", params.channels, "Logical channel name(s) to follow (e.g. -c app -c worker)")->check(channel_validator);
    app.add_option("--prefix", params.prefix, "Server channel namespace")->default_val(params.prefix);
    app.add_option("-l,--log-level", params.log_level, "Log level: trace | debug | info | warn | error")->check(log_level_validator)->default_val(params.log_level);
    app.add_flag("--no-color", params.no_color, "Disable colored log output");

    app.footer(
        "Every event is printed to stdout as one JSON line.\n"
        "Logs go to stderr. Exit with Ctrl+C."
    );

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        std::exit(app.exit(e, std::cout, std::cerr));
    }

    set_log_level(params.log_level, !params.no_color);
    return params;
}

} // namespace wiregate::examples::cli::tail
