#include "wiregate/client.hpp"

// ---- Core includes (PRIVATE) ----
#include "wiregate/core/transport/beast/websocket.hpp"
#include "wiregate/core/protocol/centrifugo/client.hpp"


namespace wiregate {

namespace centrifugo = wiregate::core::protocol::centrifugo;

using WS = wiregate::core::transport::beast::WebSocket;

// -----------------------------
// Impl
// -----------------------------

struct Client::Impl {
    centrifugo::Client<WS> core;

    Impl(EventSink sink, client_config cfg)
        : core(std::move(sink), std::move(cfg))
    {
    }
};

// -----------------------------
// Client
// -----------------------------

Client::Client(EventSink sink, client_config cfg)
    : impl_(std::make_unique<Impl>(std::move(sink), std::move(cfg)))
{
}

Client::~Client() = default;

CommandError Client::connect(std::string url, std::string token) {
    return impl_->core.connect(std::move(url), std::move(token));
}

CommandError Client::subscribe(std::string handle, std::string logical_name) {
    return impl_->core.subscribe(std::move(handle), std::move(logical_name));
}

CommandError Client::unsubscribe(std::string handle) {
    return impl_->core.unsubscribe(std::move(handle));
}

void Client::disconnect() {
    impl_->core.disconnect();
}

ConnectionStatus Client::status() const {
    return impl_->core.status();
}

std::vector<std::pair<std::string, std::string>> Client::subscriptions() const {
    return impl_->core.subscriptions();
}

void Client::wait() {
    impl_->core.wait();
}

} // namespace wiregate
