#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "wiregate/core/protocol/centrifugo/config.hpp"
#include "wiregate/core/protocol/centrifugo/status.hpp"
#include "wiregate/core/protocol/centrifugo/event.hpp"
#include "wiregate/core/protocol/centrifugo/command_error.hpp"


namespace wiregate {

using client_config    = core::protocol::centrifugo::client_config;
using ConnectionStatus = core::protocol::centrifugo::ConnectionStatus;
using StatusKind       = core::protocol::centrifugo::StatusKind;
using Event            = core::protocol::centrifugo::Event;
using EventType        = core::protocol::centrifugo::EventType;
using EventSink        = core::protocol::centrifugo::EventSink;
using CommandError     = core::protocol::centrifugo::CommandError;

using core::protocol::centrifugo::to_json;
using core::protocol::centrifugo::to_string;

/*
===============================================================================
wiregate::Client (public API)
===============================================================================

Client for a JSON-over-WebSocket pub/sub gateway, backed by the Boost.Beast
transport. One background session thread per connection; every method is
thread-safe and the EventSink is invoked on the session thread.

    wiregate::Client client([](const wiregate::Event& ev) {
        std::cout << wiregate::to_json(ev) << std::endl;
    });
    (void)client.connect("wss://gateway.example.com/connection/websocket", token);
    (void)client.subscribe("app", "app");   // channel "logs:app"

Core internals (transport, parser, session) are not exposed by this header.
===============================================================================
*/
class Client {
public:
    explicit Client(EventSink sink, client_config cfg = {});
    ~Client();

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    [[nodiscard]] CommandError connect(std::string url, std::string token);
    [[nodiscard]] CommandError subscribe(std::string handle, std::string logical_name);
    [[nodiscard]] CommandError unsubscribe(std::string handle);
    void disconnect();

    [[nodiscard]] ConnectionStatus status() const;
    [[nodiscard]] std::vector<std::pair<std::string, std::string>> subscriptions() const;

    // Blocks until the current session has ended
    void wait();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace wiregate
