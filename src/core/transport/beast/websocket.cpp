#include "wiregate/core/transport/beast/websocket.hpp"

#include <deque>
#include <string>
#include <thread>
#include <atomic>
#include <chrono>
#include <utility>
#include <optional>
#include <system_error>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "wiregate/version.hpp"
#include "lcr/log/logger.hpp"


namespace wiregate::core::transport::beast {

namespace bb   = boost::beast;
namespace bws  = boost::beast::websocket;
namespace http = boost::beast::http;
namespace net  = boost::asio;
namespace ssl  = boost::asio::ssl;
using tcp      = boost::asio::ip::tcp;

namespace {

constexpr auto CONNECT_TIMEOUT = std::chrono::seconds(30);

} // namespace

// ============================================================================
// Impl
// ============================================================================
//
// Everything below except open(), send(), close() and is_open() runs on the
// I/O thread. Those four are called from the owning session thread and only
// touch the io_context through post(), or the thread handle.
//
struct WebSocket::Impl {
    net::io_context ioc;
    ssl::context ssl_ctx{ssl::context::tls_client};
    tcp::resolver resolver{ioc};

    std::optional<bws::stream<bb::tcp_stream>> plain;
    std::optional<bws::stream<bb::ssl_stream<bb::tcp_stream>>> secure;

    bb::flat_buffer buffer;
    std::deque<std::string> write_queue;

    ParsedUrl url;
    websocket::EventSender events;
    std::thread io_thread;

    // I/O thread state
    bool opened   = false;
    bool closing  = false;
    bool finished = false;   // terminal event already delivered (or suppressed)

    // Shared with the session thread
    std::atomic<bool> open_flag{false};

    // -------------------------------------------------------------------------
    // Stream access
    // -------------------------------------------------------------------------
    template <class F>
    void with_stream(F&& f) {
        if (secure) {
            f(*secure);
        }
        else {
            f(*plain);
        }
    }

    // -------------------------------------------------------------------------
    // Event delivery
    // -------------------------------------------------------------------------
    void push_(websocket::Event ev) {
        if (finished) {
            return;
        }
        switch (events.try_send(std::move(ev))) {
            case lcr::sync::send_status::Sent:
                return;
            case lcr::sync::send_status::Full:
                WG_ERROR("[WS] Event channel full - closing transport (backpressure).");
                events.close();
                finished = true;
                open_flag.store(false, std::memory_order_release);
                abort_();
                return;
            case lcr::sync::send_status::Closed:
                WG_DEBUG("[WS] Event channel closed by session - dropping transport events.");
                finished = true;
                open_flag.store(false, std::memory_order_release);
                abort_();
                return;
        }
    }

    // is_open() already reads false when the terminal event is observed
    void finish_(websocket::Event ev) {
        open_flag.store(false, std::memory_order_release);
        push_(std::move(ev));
        finished = true;
    }

    void fail_(Error err, const bb::error_code& ec) {
        if (finished || closing) {
            return;
        }
        WG_WARN("[WS] " << to_string(err) << ": " << ec.message());
        finish_(websocket::Event::make_error(err, ec.message()));
        abort_();
    }

    // Tear down the socket without a close handshake
    void abort_() {
        bb::error_code ignored;
        resolver.cancel();
        with_stream([&](auto& ws) {
            bb::get_lowest_layer(ws).socket().close(ignored);
        });
    }

    // -------------------------------------------------------------------------
    // Connection chain
    // -------------------------------------------------------------------------
    void on_resolve_(const bb::error_code& ec, tcp::resolver::results_type results) {
        if (ec) {
            fail_(Error::ConnectionFailed, ec);
            return;
        }
        WG_DEBUG("[WS] Resolved " << url.host << ":" << url.port);
        with_stream([&](auto& ws) {
            bb::get_lowest_layer(ws).expires_after(CONNECT_TIMEOUT);
            bb::get_lowest_layer(ws).async_connect(results,
                [this](const bb::error_code& ec, const tcp::endpoint& ep) { on_connect_(ec, ep); });
        });
    }

    void on_connect_(const bb::error_code& ec, const tcp::endpoint& ep) {
        if (ec) {
            fail_(Error::ConnectionFailed, ec);
            return;
        }
        WG_DEBUG("[WS] TCP connected to " << ep);
        if (!secure) {
            start_ws_handshake_();
            return;
        }
        // SNI: many gateways sit behind virtual-hosted TLS terminators
        if (!SSL_set_tlsext_host_name(secure->next_layer().native_handle(), url.host.c_str())) {
            const bb::error_code sni_ec{static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()};
            fail_(Error::HandshakeFailed, sni_ec);
            return;
        }
        secure->next_layer().set_verify_callback(ssl::host_name_verification(url.host));
        secure->next_layer().async_handshake(ssl::stream_base::client,
            [this](const bb::error_code& ec) {
                if (ec) {
                    fail_(Error::HandshakeFailed, ec);
                    return;
                }
                start_ws_handshake_();
            });
    }

    void start_ws_handshake_() {
        with_stream([this](auto& ws) {
            // The WebSocket stream applies its own timeouts from here on
            bb::get_lowest_layer(ws).expires_never();
            ws.set_option(bws::stream_base::timeout::suggested(bb::role_type::client));
            ws.set_option(bws::stream_base::decorator([](bws::request_type& req) {
                req.set(http::field::user_agent, wiregate::user_agent);
            }));
            std::string host_header = url.host;
            if (url.host.find(':') != std::string::npos) {
                host_header = "[" + url.host + "]";
            }
            host_header += ":" + url.port;
            ws.async_handshake(host_header, url.target,
                [this](const bb::error_code& ec) { on_handshake_(ec); });
        });
    }

    void on_handshake_(const bb::error_code& ec) {
        if (ec) {
            fail_(Error::HandshakeFailed, ec);
            return;
        }
        WG_INFO("[WS] Connected to " << (url.secure ? "wss://" : "ws://") << url.host << ":" << url.port << url.target);
        with_stream([](auto& ws) { ws.text(true); });
        opened = true;
        open_flag.store(true, std::memory_order_release);
        push_(websocket::Event::make_open());
        if (finished) {
            return;
        }
        // Writes posted before the handshake completed
        if (!write_queue.empty()) {
            do_write_();
        }
        do_read_();
    }

    // -------------------------------------------------------------------------
    // Read loop
    // -------------------------------------------------------------------------
    void do_read_() {
        with_stream([this](auto& ws) {
            ws.async_read(buffer, [this](const bb::error_code& ec, std::size_t n) { on_read_(ec, n); });
        });
    }

    void on_read_(const bb::error_code& ec, std::size_t bytes) {
        if (ec == bws::error::closed || ec == net::error::eof) {
            if (!closing) {
                WG_INFO("[WS] Connection closed by remote endpoint");
                finish_(websocket::Event::make_close());
            }
            return;
        }
        if (ec) {
            if (ec == net::error::operation_aborted && (closing || finished)) {
                return;
            }
            fail_(Error::TransportFailure, ec);
            return;
        }
        bool text = true;
        with_stream([&](auto& ws) { text = ws.got_text(); });
        if (text) {
            push_(websocket::Event::make_message(bb::buffers_to_string(buffer.data())));
        }
        else {
            WG_DEBUG("[WS] Ignoring binary frame (" << bytes << " bytes)");
        }
        buffer.consume(buffer.size());
        if (!finished) {
            do_read_();
        }
    }

    // -------------------------------------------------------------------------
    // Write queue
    // -------------------------------------------------------------------------
    void enqueue_write_(std::string msg) {
        if (finished || closing) {
            return;
        }
        write_queue.push_back(std::move(msg));
        if (opened && write_queue.size() == 1) {
            do_write_();
        }
    }

    void do_write_() {
        with_stream([this](auto& ws) {
            ws.async_write(net::buffer(write_queue.front()),
                [this](const bb::error_code& ec, std::size_t) { on_write_(ec); });
        });
    }

    void on_write_(const bb::error_code& ec) {
        if (ec) {
            if (ec == net::error::operation_aborted && (closing || finished)) {
                return;
            }
            fail_(Error::TransportFailure, ec);
            return;
        }
        write_queue.pop_front();
        if (!write_queue.empty() && !finished && !closing) {
            do_write_();
        }
    }

    // -------------------------------------------------------------------------
    // Shutdown
    // -------------------------------------------------------------------------
    void do_close_(bool handshake) {
        if (closing) {
            return;
        }
        const bool graceful = handshake && opened && !finished;
        closing  = true;
        finished = true;
        open_flag.store(false, std::memory_order_release);
        if (!graceful) {
            abort_();
            return;
        }
        WG_DEBUG("[WS] Sending close frame");
        with_stream([this](auto& ws) {
            ws.async_close(bws::close_code::normal, [this](const bb::error_code& ec) {
                if (ec && ec != net::error::operation_aborted) {
                    WG_DEBUG("[WS] Close handshake did not complete: " << ec.message());
                }
                abort_();
            });
        });
    }
};


// ============================================================================
// WebSocket
// ============================================================================

WebSocket::WebSocket()
    : impl_(std::make_unique<Impl>())
{
}

WebSocket::~WebSocket() {
    close();
}

Error WebSocket::open(const ParsedUrl& url, websocket::EventSender events) {
    if (impl_->io_thread.joinable()) {
        WG_WARN("[WS] open() called while a connection is active");
        return Error::InvalidState;
    }
    if (url.host.empty() || url.target.empty()) {
        return Error::InvalidUrl;
    }

    auto& im = *impl_;
    // Handlers posted after the previous I/O thread ran out of work
    im.ioc.restart();
    im.ioc.poll();
    im.ioc.restart();
    im.url = url;
    im.events = std::move(events);
    im.buffer.clear();
    im.write_queue.clear();
    im.opened = false;
    im.closing = false;
    im.finished = false;
    im.plain.reset();
    im.secure.reset();

    if (url.secure) {
        bb::error_code ec;
        im.ssl_ctx.set_default_verify_paths(ec);
        if (ec) {
            WG_WARN("[WS] Unable to load system trust store: " << ec.message());
        }
        im.ssl_ctx.set_verify_mode(ssl::verify_peer);
        im.secure.emplace(im.ioc, im.ssl_ctx);
    }
    else {
        im.plain.emplace(im.ioc);
    }

    WG_DEBUG("[WS] Resolving " << url.host << ":" << url.port);
    im.resolver.async_resolve(url.host, url.port,
        [&im](const bb::error_code& ec, tcp::resolver::results_type results) {
            im.on_resolve_(ec, std::move(results));
        });

    try {
        im.io_thread = std::thread([&im] {
            im.ioc.run();
            WG_TRACE("[WS] I/O thread finished");
        });
    }
    catch (const std::system_error& e) {
        WG_ERROR("[WS] Unable to start I/O thread: " << e.what());
        im.events.reset();
        return Error::TransportFailure;
    }
    return Error::None;
}

bool WebSocket::send(std::string_view msg) {
    if (!impl_->open_flag.load(std::memory_order_acquire)) {
        WG_WARN("[WS] send() while socket is not open");
        return false;
    }
    auto& im = *impl_;
    net::post(im.ioc, [&im, text = std::string(msg)]() mutable {
        im.enqueue_write_(std::move(text));
    });
    return true;
}

void WebSocket::close() noexcept {
    stop_(true);
}

void WebSocket::abort() noexcept {
    stop_(false);
}

void WebSocket::stop_(bool graceful) noexcept {
    auto& im = *impl_;
    if (!im.io_thread.joinable()) {
        im.events.reset();
        return;
    }
    if (!graceful) {
        WG_DEBUG("[WS] Aborting connection");
    }
    try {
        net::post(im.ioc, [&im, graceful] { im.do_close_(graceful); });
        im.io_thread.join();
    }
    catch (const std::exception& e) {
        WG_ERROR("[WS] close() failed: " << e.what());
        im.ioc.stop();
        if (im.io_thread.joinable()) {
            im.io_thread.detach();
        }
    }
    im.open_flag.store(false, std::memory_order_release);
    im.events.reset();
}

bool WebSocket::is_open() const noexcept {
    return impl_->open_flag.load(std::memory_order_acquire);
}

} // namespace wiregate::core::transport::beast
