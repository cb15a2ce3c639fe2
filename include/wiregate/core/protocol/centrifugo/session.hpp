/*
===============================================================================
Gateway protocol Session
===============================================================================

One Session owns one WebSocket connection for its whole life:

    Connecting ──(connect reply ok)──► Connected ──(close / disconnect)──► Disconnected
        │                                  │
        └──(transport / handshake error)───┴──(transport error)──────────► Error

Disconnected and Error are terminal: once reached, no frame is read, no
command is processed, no event is emitted and the status cell is not
written again.

Architecture:
  - transport::*          → WebSocket transport (Boost.Beast, mockable)
  - parser::Router        → frame decoding into schema::Reply / schema::Push
  - PendingRequests       → request id allocation and reply correlation
  - Registry              → handle <-> channel mapping for push routing
  - StatusCell            → status shared with caller threads (sole writer)
  - EventSink             → typed notifications, invoked on the session thread

Threading model:
  - Everything runs on the thread calling poll() / run()
  - Two inbound sources share one notifier:
        • transport events (Open / Message / Close / Error)
        • caller commands (Subscribe / Unsubscribe / Disconnect / Connect)
  - Each poll() pass takes at most one item from each source and alternates
    which source goes first, so neither can starve the other

Commands arriving before the socket is open are held in arrival order and
replayed right after the connect request is sent. Disconnect and closure of
the command channel act immediately in every state.
===============================================================================
*/

#pragma once

#include <deque>
#include <memory>
#include <string>
#include <utility>
#include <exception>
#include <string_view>

#include "wiregate/core/transport/error.hpp"
#include "wiregate/core/transport/parse_url.hpp"
#include "wiregate/core/transport/websocket_concept.hpp"
#include "wiregate/core/transport/websocket/events.hpp"
#include "wiregate/core/protocol/control/req_id.hpp"
#include "wiregate/core/protocol/centrifugo/config.hpp"
#include "wiregate/core/protocol/centrifugo/status.hpp"
#include "wiregate/core/protocol/centrifugo/event.hpp"
#include "wiregate/core/protocol/centrifugo/command.hpp"
#include "wiregate/core/protocol/centrifugo/request/concepts.hpp"
#include "wiregate/core/protocol/centrifugo/schema/connect.hpp"
#include "wiregate/core/protocol/centrifugo/schema/subscribe.hpp"
#include "wiregate/core/protocol/centrifugo/schema/unsubscribe.hpp"
#include "wiregate/core/protocol/centrifugo/schema/reply.hpp"
#include "wiregate/core/protocol/centrifugo/schema/push.hpp"
#include "wiregate/core/protocol/centrifugo/parser/router.hpp"
#include "wiregate/core/protocol/centrifugo/channel/naming.hpp"
#include "wiregate/core/protocol/centrifugo/channel/pending_requests.hpp"
#include "wiregate/core/protocol/centrifugo/channel/registry.hpp"
#include "lcr/sync/notifier.hpp"
#include "lcr/log/logger.hpp"


namespace wiregate::core {
namespace protocol {
namespace centrifugo {

// Shared handles a session writes to
struct SessionContext {
    std::shared_ptr<lcr::sync::notifier> wake;
    std::shared_ptr<StatusCell> status;
    std::shared_ptr<SubscriptionSnapshot> subscriptions;
    EventSink sink;
};


template<transport::WebSocketConcept WS>
class Session {

    using TransportEvent = transport::websocket::Event;
    using TransportEventType = transport::websocket::EventType;

public:
    Session(std::string url, std::string token, client_config cfg, CommandReceiver commands, SessionContext ctx)
        : url_(std::move(url))
        , token_(std::move(token))
        , cfg_(std::move(cfg))
        , commands_(std::move(commands))
        , ctx_(std::move(ctx))
    {
        if (!ctx_.wake) {
            ctx_.wake = std::make_shared<lcr::sync::notifier>();
        }
        if (!ctx_.status) {
            ctx_.status = std::make_shared<StatusCell>();
        }
        if (!ctx_.subscriptions) {
            ctx_.subscriptions = std::make_shared<SubscriptionSnapshot>();
        }
        ctx_.status->store(ConnectionStatus::connecting());
    }

    ~Session() {
        ws_.close();
    }

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    // -------------------------------------------------------------------------
    // Start the opening handshake.
    // Returns false if the session terminated immediately (connection failed).
    // -------------------------------------------------------------------------
    inline bool start() {
        if (started_) {
            return !terminated_;
        }
        started_ = true;

        transport::ParsedUrl parsed;
        if (transport::parse_url(url_, parsed) != transport::Error::None) {
            WG_ERROR("[SESSION] Invalid URL '" << url_ << "'");
            connection_failed_("invalid URL '" + url_ + "'");
            return false;
        }

        auto [events_tx, events_rx] = transport::websocket::EventChannel::make(cfg_.inbound_capacity, ctx_.wake);
        inbound_ = std::move(events_rx);

        const transport::Error err = ws_.open(parsed, std::move(events_tx));
        if (err != transport::Error::None) {
            WG_ERROR("[SESSION] Transport refused to open: " << transport::to_string(err));
            connection_failed_(std::string(transport::to_string(err)));
            return false;
        }
        WG_INFO("[SESSION] Connecting to " << url_);
        return true;
    }

    // -------------------------------------------------------------------------
    // One deterministic pass over both sources.
    // Returns true if anything was processed.
    // -------------------------------------------------------------------------
    inline bool poll() {
        if (terminated_) {
            return false;
        }
        if (!started_) {
            (void)start();
            return true;
        }
        bool progressed = false;
        if (commands_first_) {
            progressed = poll_command_();
            if (!terminated_) {
                progressed = poll_transport_() || progressed;
            }
        }
        else {
            progressed = poll_transport_();
            if (!terminated_) {
                progressed = poll_command_() || progressed;
            }
        }
        commands_first_ = !commands_first_;
        return progressed;
    }

    // -------------------------------------------------------------------------
    // Blocking event loop; returns once the session reached a terminal state
    // -------------------------------------------------------------------------
    inline void run() {
        if (start()) {
            while (!terminated_) {
                const auto ticket = ctx_.wake->ticket();
                if (!poll()) {
                    ctx_.wake->wait(ticket);
                }
            }
        }
        ws_.close();
        WG_DEBUG("[SESSION] Event loop finished");
    }

    // -------------------------------------------------------------------------
    // Introspection
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline StatusKind state() const noexcept {
        return state_;
    }

    [[nodiscard]]
    inline bool is_terminated() const noexcept {
        return terminated_;
    }

    [[nodiscard]]
    inline bool is_socket_open() const noexcept {
        return socket_open_;
    }

    [[nodiscard]]
    inline const channel::Registry& registry() const noexcept {
        return registry_;
    }

    [[nodiscard]]
    inline const channel::PendingRequests& pending_requests() const noexcept {
        return pending_;
    }

    [[nodiscard]]
    inline std::size_t deferred_commands() const noexcept {
        return deferred_.size();
    }

    [[nodiscard]]
    inline const std::shared_ptr<lcr::sync::notifier>& notifier() const noexcept {
        return ctx_.wake;
    }

#ifdef WG_UNIT_TEST
    // Accessor to the underlying WebSocket for testing purposes
    WS& ws() {
        return ws_;
    }
#endif // WG_UNIT_TEST

private:
    // Adapts the private message handlers to parser::SinkConcept
    struct RouterSink {
        Session& self;
        void on_reply(const schema::Reply& r) { self.on_reply_(r); }
        void on_push(const schema::Push& p)   { self.on_push_(p); }
        void on_ping()                        { self.on_ping_(); }
    };

    std::string url_;
    std::string token_;
    client_config cfg_;

    // Transport
    WS ws_;
    transport::websocket::EventReceiver inbound_;

    // Callers → session
    CommandReceiver commands_;
    std::deque<Command> deferred_;

    // Protocol state (session thread only)
    parser::Router router_;
    channel::PendingRequests pending_;
    channel::Registry registry_;

    SessionContext ctx_;

    StatusKind state_{StatusKind::Connecting};
    bool started_{false};
    bool socket_open_{false};
    bool terminated_{false};
    bool commands_first_{false};

private:
    // =========================================================================
    // Sources
    // =========================================================================

    inline bool poll_transport_() {
        TransportEvent ev;
        switch (inbound_.try_recv(ev)) {
            case lcr::sync::recv_status::Empty:
                return false;
            case lcr::sync::recv_status::Disconnected:
                // The transport only closes its side early when the queue overflowed
                WG_ERROR("[SESSION] Transport event queue overflow");
                fail_("inbound event queue overflow (" + std::string(transport::to_string(transport::Error::Backpressure)) + ")");
                return true;
            case lcr::sync::recv_status::Item:
                handle_transport_event_(ev);
                return true;
        }
        return false;
    }

    inline bool poll_command_() {
        Command cmd;
        switch (commands_.try_recv(cmd)) {
            case lcr::sync::recv_status::Empty:
                return false;
            case lcr::sync::recv_status::Disconnected:
                WG_INFO("[SESSION] Command channel closed - shutting down");
                shutdown_("Connection closed");
                return true;
            case lcr::sync::recv_status::Item:
                handle_command_(std::move(cmd));
                return true;
        }
        return false;
    }

    // =========================================================================
    // Transport events
    // =========================================================================

    inline void handle_transport_event_(const TransportEvent& ev) {
        switch (ev.type) {
            case TransportEventType::Open:
                on_socket_open_();
                break;
            case TransportEventType::Message:
                if (!socket_open_) {
                    WG_WARN("[SESSION] Message before socket open -> ignore");
                    break;
                }
                WG_TRACE("[SESSION] <- " << ev.payload);
                {
                    RouterSink sink{*this};
                    (void)router_.parse_frame(ev.payload, sink);
                }
                break;
            case TransportEventType::Close:
                if (!socket_open_) {
                    connection_failed_("connection closed during handshake");
                    break;
                }
                WG_INFO("[SESSION] Connection closed by server");
                ws_.close();
                terminate_(ConnectionStatus::disconnected(), Event::disconnected("Connection closed"));
                break;
            case TransportEventType::Error:
                if (!socket_open_) {
                    connection_failed_(ev.payload);
                    break;
                }
                WG_ERROR("[SESSION] Transport error (" << transport::to_string(ev.error) << "): " << ev.payload);
                fail_(ev.payload);
                break;
        }
    }

    inline void on_socket_open_() {
        if (socket_open_) {
            return;
        }
        socket_open_ = true;
        WG_INFO("[SESSION] Socket open - sending connect request");

        schema::Connect req{ctrl::CONNECT_REQ_ID, token_};
        if (!send_(req)) {
            fail_("Failed to send connect request");
            return;
        }

        // Replay commands queued during the opening handshake
        if (!deferred_.empty()) {
            WG_DEBUG("[SESSION] Replaying " << deferred_.size() << " deferred command(s)");
        }
        while (!deferred_.empty() && !terminated_) {
            Command cmd = std::move(deferred_.front());
            deferred_.pop_front();
            handle_command_(std::move(cmd));
        }
    }

    // =========================================================================
    // Decoded messages
    // =========================================================================

    inline void on_reply_(const schema::Reply& reply) {
        if (terminated_) {
            return;
        }
        if (!reply.id.has()) {
            WG_DEBUG("[SESSION] Reply without id -> ignore: " << reply);
            return;
        }
        const ctrl::req_id_t id = reply.id.value();
        if (id == ctrl::CONNECT_REQ_ID) {
            on_connect_reply_(reply);
            return;
        }

        auto req = pending_.take(id);
        if (!req) {
            WG_DEBUG("[SESSION] Reply for unknown or stale id " << id << " -> ignore");
            return;
        }

        if (req->kind == channel::RequestKind::Unsubscribe) {
            if (reply.is_error()) {
                WG_WARN("[SESSION] Unsubscribe from '" << req->channel << "' rejected: " << reply.error.value().message);
            }
            return;
        }

        if (reply.is_error()) {
            WG_WARN("[SESSION] Subscribe '" << req->handle << "' -> '" << req->channel << "' rejected: " << reply.error.value().message);
            emit_(Event::subscription_error(req->handle, reply.error.value().message));
            return;
        }

        if (auto displaced = registry_.add(req->handle, req->channel, req->logical)) {
            ctx_.subscriptions->erase(*displaced);
        }
        ctx_.subscriptions->insert(req->handle, req->logical);
        WG_INFO("[SESSION] Subscribed '" << req->handle << "' -> '" << req->channel << "'");
        emit_(Event::subscribed(req->handle));
    }

    inline void on_connect_reply_(const schema::Reply& reply) {
        if (state_ != StatusKind::Connecting) {
            WG_DEBUG("[SESSION] Duplicate connect reply -> ignore");
            return;
        }
        if (reply.is_error()) {
            const std::string& message = reply.error.value().message;
            WG_ERROR("[SESSION] Connect rejected (code " << reply.error.value().code << "): " << message);
            // No close handshake on a rejected connect; the socket is just dropped
            ws_.abort();
            terminate_(ConnectionStatus::error(message), Event::error(message));
            return;
        }
        state_ = StatusKind::Connected;
        ctx_.status->store(ConnectionStatus::connected());
        WG_INFO("[SESSION] Connected");
        emit_(Event::connected());
    }

    inline void on_push_(const schema::Push& push) {
        if (terminated_) {
            return;
        }
        if (!push.is_publication()) {
            WG_TRACE("[SESSION] Push without publication on '" << push.channel << "' -> ignore");
            return;
        }
        const std::string* handle = registry_.resolve(push.channel);
        if (handle == nullptr) {
            WG_DEBUG("[SESSION] Publication on unsubscribed channel '" << push.channel << "' -> drop");
            return;
        }
        emit_(Event::publication(*handle, push.data.value()));
    }

    inline void on_ping_() {
        if (terminated_ || !socket_open_) {
            return;
        }
        WG_TRACE("[SESSION] Server ping -> pong");
        if (!ws_.send("{}")) {
            WG_WARN("[SESSION] Failed to answer server ping");
        }
    }

    // =========================================================================
    // Commands
    // =========================================================================

    inline void handle_command_(Command cmd) {
        WG_DEBUG("[SESSION] " << cmd);
        switch (cmd.type) {
            case CommandType::Connect:
                WG_DEBUG("[SESSION] Connect command on a live session -> ignore");
                break;
            case CommandType::Disconnect:
                WG_INFO("[SESSION] Disconnect requested");
                shutdown_("User disconnected");
                break;
            case CommandType::Subscribe:
            case CommandType::Unsubscribe:
                if (!socket_open_) {
                    deferred_.push_back(std::move(cmd));
                    break;
                }
                if (cmd.type == CommandType::Subscribe) {
                    subscribe_(cmd);
                }
                else {
                    unsubscribe_(cmd);
                }
                break;
        }
    }

    inline void subscribe_(const Command& cmd) {
        std::string channel_name = channel::make_channel_name(cfg_.channel_prefix, cmd.name);
        schema::Subscribe req{pending_.next_id(), channel_name};
        (void)pending_.add(req.id, channel::PendingRequest{channel::RequestKind::Subscribe, cmd.handle, std::move(channel_name), cmd.name});
        if (!send_(req)) {
            pending_.remove(req.id);
            emit_(Event::subscription_error(cmd.handle, "Failed to send subscribe request"));
        }
    }

    inline void unsubscribe_(const Command& cmd) {
        const channel::Registry::Entry* entry = registry_.find(cmd.handle);
        if (entry == nullptr) {
            WG_DEBUG("[SESSION] Unsubscribe of unknown handle '" << cmd.handle << "' -> ignore");
            return;
        }
        schema::Unsubscribe req{pending_.next_id(), entry->channel};
        (void)pending_.add(req.id, channel::PendingRequest{channel::RequestKind::Unsubscribe, cmd.handle, entry->channel, entry->logical});
        if (!send_(req)) {
            pending_.remove(req.id);
            WG_WARN("[SESSION] Failed to send unsubscribe for '" << req.channel << "'");
        }
        // Local removal does not wait for the ack
        (void)registry_.remove(cmd.handle);
        ctx_.subscriptions->erase(cmd.handle);
        WG_INFO("[SESSION] Unsubscribed '" << cmd.handle << "' from '" << req.channel << "'");
    }

    // =========================================================================
    // Helpers
    // =========================================================================

    template<request::Request R>
    [[nodiscard]]
    inline bool send_(const R& req) {
        const std::string json = req.to_json();
        WG_DEBUG("[SESSION] -> " << json);
        return ws_.send(json);
    }

    inline void emit_(const Event& ev) {
        WG_TRACE("[SESSION] " << ev);
        if (!ctx_.sink) {
            return;
        }
        try {
            ctx_.sink(ev);
        }
        catch (const std::exception& e) {
            WG_ERROR("[SESSION] Event sink threw: " << e.what());
        }
        catch (...) {
            WG_ERROR("[SESSION] Event sink threw a non-standard exception; event " << to_string(ev.type) << " dropped");
        }
    }

    // Failure while the opening handshake is in progress
    inline void connection_failed_(const std::string& message) {
        WG_ERROR("[SESSION] Connection failed: " << message);
        ws_.close();
        terminate_(ConnectionStatus::error(message), Event::error("Connection failed: " + message));
    }

    // Fatal failure on an open socket
    inline void fail_(const std::string& message) {
        ws_.close();
        terminate_(ConnectionStatus::error(message), Event::error(message));
    }

    // Graceful local close
    inline void shutdown_(const std::string& reason) {
        ws_.close();
        terminate_(ConnectionStatus::disconnected(), Event::disconnected(reason));
    }

    inline void terminate_(ConnectionStatus status, const Event& ev) {
        if (terminated_) {
            return;
        }
        state_ = status.kind;
        ctx_.status->store(std::move(status));
        emit_(ev);
        terminated_ = true;

        // Everything in flight dies with the session
        pending_.clear();
        registry_.clear();
        deferred_.clear();
        ctx_.subscriptions->clear();
        commands_.close();
        inbound_.close();
    }
};

} // namespace centrifugo
} // namespace protocol
} // namespace wiregate::core
