/*
===============================================================================
Gateway protocol Client (session owner)
===============================================================================

Owns at most one live Session and the thread running it, and exposes the
thread-safe command API used by application code:

    connect(url, token)     spawn a new session (replacing the previous one)
    subscribe(handle, name) enqueue a subscribe command
    unsubscribe(handle)     enqueue an unsubscribe command
    disconnect()            enqueue a disconnect command
    status()                last-known ConnectionStatus
    subscriptions()         (handle, logical name) pairs of the live session

Replacement contract:
  A new connect() closes the previous command channel and joins the previous
  session thread before the new session is created. All events of the old
  session are therefore delivered before any event of the new one.

Threading:
  - All public methods may be called concurrently from any thread
  - The EventSink is invoked on the session thread and may call subscribe(),
    unsubscribe(), disconnect(), status() and subscriptions(); while a
    session is being replaced or destroyed those report NotConnected
  - The EventSink must not call connect(), wait() or the destructor (self-join)
  - Exceptions escaping the EventSink are logged and the event is dropped;
    the session keeps running
  - No join happens while lifecycle_mutex_ is held
===============================================================================
*/
#pragma once

#include <mutex>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <utility>

#include "wiregate/core/transport/parse_url.hpp"
#include "wiregate/core/transport/websocket_concept.hpp"
#include "wiregate/core/protocol/centrifugo/config.hpp"
#include "wiregate/core/protocol/centrifugo/status.hpp"
#include "wiregate/core/protocol/centrifugo/event.hpp"
#include "wiregate/core/protocol/centrifugo/command.hpp"
#include "wiregate/core/protocol/centrifugo/command_error.hpp"
#include "wiregate/core/protocol/centrifugo/session.hpp"
#include "lcr/sync/notifier.hpp"
#include "lcr/log/logger.hpp"


namespace wiregate::core::protocol::centrifugo {

template<transport::WebSocketConcept WS>
class Client {
public:
    using SessionType = Session<WS>;

    explicit Client(EventSink sink, client_config cfg = {})
        : cfg_(std::move(cfg))
        , sink_(std::move(sink))
        , status_(std::make_shared<StatusCell>())
        , subscriptions_(std::make_shared<SubscriptionSnapshot>())
    {
    }

    ~Client() {
        std::lock_guard<std::mutex> connect_lock(connect_mutex_);
        stop_session_();
    }

    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    // Spawns a new session; the previous one (if any) is terminated first
    [[nodiscard]]
    CommandError connect(std::string url, std::string token) {
        transport::ParsedUrl parsed;
        if (transport::parse_url(url, parsed) != transport::Error::None) {
            WG_WARN("[CLIENT] Rejecting invalid URL '" << url << "'");
            return CommandError::InvalidUrl;
        }

        std::lock_guard<std::mutex> connect_lock(connect_mutex_);
        stop_session_();
        subscriptions_->clear();

        auto wake = std::make_shared<lcr::sync::notifier>();
        auto [commands_tx, commands_rx] = CommandChannel::make(cfg_.command_capacity, wake);

        // Constructed here so the status reads Connecting before connect() returns
        auto session = std::make_unique<SessionType>(
            std::move(url), std::move(token), cfg_, std::move(commands_rx),
            SessionContext{wake, status_, subscriptions_, sink_});

        std::promise<void> finished;
        std::shared_future<void> done = finished.get_future().share();

        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        commands_ = std::move(commands_tx);
        done_ = std::move(done);
        thread_ = std::thread([s = std::move(session), p = std::move(finished)]() mutable {
            s->run();
            s.reset();
            p.set_value();
        });
        WG_DEBUG("[CLIENT] Session thread started");
        return CommandError::None;
    }

    [[nodiscard]]
    CommandError subscribe(std::string handle, std::string logical_name) {
        return send_(Command::subscribe(std::move(handle), std::move(logical_name)));
    }

    [[nodiscard]]
    CommandError unsubscribe(std::string handle) {
        return send_(Command::unsubscribe(std::move(handle)));
    }

    // Always succeeds; without a live session this is a no-op
    void disconnect() {
        CommandSender tx;
        {
            std::lock_guard<std::mutex> lock(lifecycle_mutex_);
            tx = std::move(commands_);
        }
        if (!tx.valid()) {
            return;
        }
        if (!tx.send(Command::disconnect())) {
            WG_DEBUG("[CLIENT] Disconnect: session already terminated");
        }
    }

    // -------------------------------------------------------------------------
    // Shared state
    // -------------------------------------------------------------------------

    [[nodiscard]]
    ConnectionStatus status() const {
        return status_->load();
    }

    [[nodiscard]]
    SubscriptionSnapshot::value_type subscriptions() const {
        return subscriptions_->load();
    }

    [[nodiscard]]
    const client_config& config() const noexcept {
        return cfg_;
    }

    // Blocks until the current session has finished and released its socket
    void wait() {
        std::shared_future<void> done;
        {
            std::lock_guard<std::mutex> lock(lifecycle_mutex_);
            done = done_;
        }
        if (done.valid()) {
            done.wait();
        }
    }

private:
    client_config cfg_;
    EventSink sink_;
    std::shared_ptr<StatusCell> status_;
    std::shared_ptr<SubscriptionSnapshot> subscriptions_;

    // Serializes connect() and the destructor; held across the join
    std::mutex connect_mutex_;

    // Guards commands_, thread_ and done_; never held across a join
    mutable std::mutex lifecycle_mutex_;
    CommandSender commands_;
    std::thread thread_;
    std::shared_future<void> done_;

private:
    [[nodiscard]]
    CommandError send_(Command cmd) {
        CommandSender tx;
        {
            std::lock_guard<std::mutex> lock(lifecycle_mutex_);
            tx = commands_;
        }
        if (!tx.valid()) {
            return CommandError::NotConnected;
        }
        // Blocks while the queue is full; fails once the session is gone
        if (!tx.send(std::move(cmd))) {
            return CommandError::NotConnected;
        }
        return CommandError::None;
    }

    // Close the command channel and join the session thread.
    // Caller holds connect_mutex_.
    void stop_session_() {
        CommandSender tx;
        std::thread t;
        {
            std::lock_guard<std::mutex> lock(lifecycle_mutex_);
            tx = std::move(commands_);
            t = std::move(thread_);
        }
        if (tx.valid()) {
            tx.close();
            tx.reset();
        }
        if (t.joinable()) {
            t.join();
            WG_DEBUG("[CLIENT] Previous session joined");
        }
    }
};

} // namespace wiregate::core::protocol::centrifugo
