/*
===============================================================================
 protocol::centrifugo::Client - Threaded Tests
===============================================================================

Scope:
------
Validate the caller-facing command API over a real session thread, with the
MockWebSocket standing in for the network.

Covered:
1. Commands without a session
2. Invalid URL rejected synchronously
3. Full lifecycle: connect, subscribe, publication, disconnect
4. A new connect terminates the previous session before the new one starts
5. Commands after the server closed the session
6. Event sink calling back into the client while a session is replaced or
   destroyed

===============================================================================
*/

#include <mutex>
#include <chrono>
#include <string>
#include <thread>
#include <vector>
#include <iostream>
#include <functional>

#include "wiregate/core/protocol/centrifugo/client.hpp"
#include "common/mock_websocket.hpp"
#include "common/json_helpers.hpp"
#include "common/test_check.hpp"

using namespace wiregate::core;
using namespace wiregate::core::protocol::centrifugo;

using WebSocketUnderTest = transport::test::MockWebSocket;
using ClientUnderTest = Client<WebSocketUnderTest>;

inline constexpr const char* TEST_URL = "ws://localhost:8000/connection/websocket";


// Thread-safe event recorder (events arrive on the session thread)
struct Recorder {
    mutable std::mutex mutex;
    std::vector<Event> events;

    EventSink sink() {
        return [this](const Event& ev) {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(ev);
        };
    }

    std::vector<Event> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }

    bool contains(const Event& ev) const {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& e : events) {
            if (e == ev) {
                return true;
            }
        }
        return false;
    }
};

static bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return pred();
}

static bool was_sent(const std::string& frame) {
    for (const auto& s : WebSocketUnderTest::sent()) {
        if (s == frame) {
            return true;
        }
    }
    return false;
}

// Drive the handshake of the session currently opening the mock
static void complete_handshake(ClientUnderTest& client, int expected_open_count) {
    TEST_CHECK(wait_until([&] { return WebSocketUnderTest::open_count() == expected_open_count && WebSocketUnderTest::is_attached(); }));
    TEST_CHECK(WebSocketUnderTest::emit_open());
    TEST_CHECK(WebSocketUnderTest::emit_message(json::reply::connect_ok()));
    TEST_CHECK(wait_until([&] { return client.status() == ConnectionStatus::connected(); }));
}


// ----------------------------------------------------------------------------
// 1. No session
// ----------------------------------------------------------------------------

void test_commands_without_session() {
    std::cout << "[TEST] 1. Commands without a session\n";
    WebSocketUnderTest::reset();

    Recorder rec;
    ClientUnderTest client(rec.sink());

    TEST_CHECK_EQ(client.status(), ConnectionStatus::disconnected());
    TEST_CHECK(client.subscribe("c1", "app") == CommandError::NotConnected);
    TEST_CHECK(client.unsubscribe("c1") == CommandError::NotConnected);
    client.disconnect();
    client.wait();

    TEST_CHECK(client.subscriptions().empty());
    TEST_CHECK(rec.snapshot().empty());
    TEST_CHECK(WebSocketUnderTest::open_count() == 0);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// 2. Invalid URL
// ----------------------------------------------------------------------------

void test_invalid_url() {
    std::cout << "[TEST] 2. Invalid URL rejected synchronously\n";
    WebSocketUnderTest::reset();

    Recorder rec;
    ClientUnderTest client(rec.sink());

    TEST_CHECK(client.connect("tcp://localhost:8000", "t") == CommandError::InvalidUrl);
    TEST_CHECK_EQ(client.status(), ConnectionStatus::disconnected());
    TEST_CHECK(client.subscribe("c1", "app") == CommandError::NotConnected);
    TEST_CHECK(rec.snapshot().empty());
    TEST_CHECK(WebSocketUnderTest::open_count() == 0);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// 3. Full lifecycle
// ----------------------------------------------------------------------------

void test_full_lifecycle() {
    std::cout << "[TEST] 3. Connect, subscribe, publication, disconnect\n";
    WebSocketUnderTest::reset();

    Recorder rec;
    ClientUnderTest client(rec.sink());

    TEST_CHECK(client.connect(TEST_URL, "secret") == CommandError::None);
    TEST_CHECK(client.status().kind != StatusKind::Disconnected);

    // Queued before the socket is open; replayed after the connect request
    TEST_CHECK(client.subscribe("c1", "app") == CommandError::None);

    complete_handshake(client, 1);

    const std::string sub = R"({"id":2,"method":"subscribe","params":{"channel":"logs:app"}})";
    TEST_CHECK(wait_until([&] { return was_sent(sub); }));
    TEST_CHECK_EQ(WebSocketUnderTest::sent()[0], R"({"id":1,"method":"connect","params":{"token":"secret"}})");

    TEST_CHECK(WebSocketUnderTest::emit_message(json::reply::ok(2)));
    TEST_CHECK(wait_until([&] { return !client.subscriptions().empty(); }));
    TEST_CHECK(client.subscriptions() == (SubscriptionSnapshot::value_type{{"c1", "app"}}));

    TEST_CHECK(WebSocketUnderTest::emit_message(json::push::publication("logs:app", R"({"msg":"hello"})")));
    TEST_CHECK(wait_until([&] { return rec.contains(Event::publication("c1", R"({"msg":"hello"})")); }));

    client.disconnect();
    client.wait();

    TEST_CHECK_EQ(client.status(), ConnectionStatus::disconnected());
    TEST_CHECK(client.subscriptions().empty());
    TEST_CHECK(!WebSocketUnderTest::is_attached());

    const auto events = rec.snapshot();
    TEST_CHECK(events.size() == 4);
    TEST_CHECK_EQ(events[0], Event::connected());
    TEST_CHECK_EQ(events[1], Event::subscribed("c1"));
    TEST_CHECK_EQ(events[3], Event::disconnected("User disconnected"));

    TEST_CHECK(client.subscribe("c2", "db") == CommandError::NotConnected);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// 4. Session replacement
// ----------------------------------------------------------------------------

void test_reconnect_replaces_session() {
    std::cout << "[TEST] 4. New connect replaces the previous session\n";
    WebSocketUnderTest::reset();

    Recorder rec;
    ClientUnderTest client(rec.sink());

    TEST_CHECK(client.connect(TEST_URL, "first") == CommandError::None);
    complete_handshake(client, 1);
    TEST_CHECK(client.subscribe("c1", "app") == CommandError::None);
    TEST_CHECK(wait_until([&] { return was_sent(R"({"id":2,"method":"subscribe","params":{"channel":"logs:app"}})"); }));
    TEST_CHECK(WebSocketUnderTest::emit_message(json::reply::ok(2)));
    TEST_CHECK(wait_until([&] { return client.subscriptions().size() == 1; }));

    // Returns once the previous session has fully ended
    TEST_CHECK(client.connect(TEST_URL, "second") == CommandError::None);
    {
        const auto events = rec.snapshot();
        TEST_CHECK(events.size() == 3);
        TEST_CHECK_EQ(events[2], Event::disconnected("Connection closed"));
    }
    TEST_CHECK(client.subscriptions().empty());
    TEST_CHECK(client.status().kind == StatusKind::Connecting);

    complete_handshake(client, 2);
    TEST_CHECK(was_sent(R"({"id":1,"method":"connect","params":{"token":"second"}})"));

    const auto events = rec.snapshot();
    TEST_CHECK(events.size() == 4);
    TEST_CHECK_EQ(events[3], Event::connected());

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// 5. Server-side close
// ----------------------------------------------------------------------------

void test_commands_after_server_close() {
    std::cout << "[TEST] 5. Commands after the server closed the session\n";
    WebSocketUnderTest::reset();

    Recorder rec;
    ClientUnderTest client(rec.sink());

    TEST_CHECK(client.connect(TEST_URL, "t") == CommandError::None);
    complete_handshake(client, 1);

    TEST_CHECK(WebSocketUnderTest::emit_close());
    TEST_CHECK(wait_until([&] { return client.status() == ConnectionStatus::disconnected(); }));
    client.wait();

    TEST_CHECK(client.subscribe("c1", "app") == CommandError::NotConnected);
    TEST_CHECK(rec.contains(Event::disconnected("Connection closed")));

    // A fresh connect starts over
    TEST_CHECK(client.connect(TEST_URL, "t") == CommandError::None);
    complete_handshake(client, 2);
    client.disconnect();
    client.wait();
    TEST_CHECK_EQ(client.status(), ConnectionStatus::disconnected());

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// 6. Re-entrant sink
// ----------------------------------------------------------------------------

void test_sink_reenters_client() {
    std::cout << "[TEST] 6. Event sink calls back into the client\n";
    WebSocketUnderTest::reset();

    std::mutex mutex;
    std::vector<CommandError> resubscribe_results;
    ClientUnderTest* self = nullptr;

    {
        // Re-subscribe from the terminal event, the way a reconnecting caller would
        ClientUnderTest client([&](const Event& ev) {
            if (ev.type != EventType::Disconnected) {
                return;
            }
            const CommandError err = self->subscribe("c1", "app");
            self->disconnect();
            (void)self->status();
            std::lock_guard<std::mutex> lock(mutex);
            resubscribe_results.push_back(err);
        });
        self = &client;

        TEST_CHECK(client.connect(TEST_URL, "first") == CommandError::None);
        complete_handshake(client, 1);

        // The old session's Disconnected runs the sink while connect() joins it
        TEST_CHECK(client.connect(TEST_URL, "second") == CommandError::None);
        {
            std::lock_guard<std::mutex> lock(mutex);
            TEST_CHECK(resubscribe_results.size() == 1);
            TEST_CHECK(resubscribe_results[0] == CommandError::NotConnected);
        }
        complete_handshake(client, 2);
        TEST_CHECK(client.subscribe("c2", "db") == CommandError::None);
    }

    // Same path through the destructor
    std::lock_guard<std::mutex> lock(mutex);
    TEST_CHECK(resubscribe_results.size() == 2);
    TEST_CHECK(resubscribe_results[1] == CommandError::NotConnected);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------

#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Debug);

    test_commands_without_session();
    test_invalid_url();
    test_full_lifecycle();
    test_reconnect_replaces_session();
    test_commands_after_server_close();
    test_sink_reenters_client();

    std::cout << "\n[CLIENT TESTS PASSED]\n";
    return 0;
}
