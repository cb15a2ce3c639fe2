/*
===============================================================================
 protocol::centrifugo::Session - Group E Ordering & Fairness Tests
===============================================================================

Scope:
------
Validate how commands issued during the opening handshake are handled, and
that neither inbound source can starve the other.

Covered:
E1 Subscribe before the socket opens is replayed after the connect request
E2 Commands keep their arrival order across the replay
E3 Disconnect during the handshake acts immediately
E4 A pending command is served while the transport is flooded
E5 Connect command on a live session is ignored
E6 Blocking run() loop ends on disconnect

===============================================================================
*/

#include <iostream>
#include <string>
#include <thread>

#include "common/harness/session.hpp"


// ----------------------------------------------------------------------------
// E1 Deferred subscribe
// ----------------------------------------------------------------------------

void test_subscribe_before_open_is_deferred() {
    std::cout << "[TEST] E1 Subscribe before open is deferred\n";

    test::SessionHarness h;
    h.start();

    (void)h.subscribe("c1", "app");
    TEST_CHECK(h.session.deferred_commands() == 1);
    TEST_CHECK(WebSocketUnderTest::sent_count() == 0);
    TEST_CHECK(h.session.pending_requests().empty());

    h.open();

    const auto sent = WebSocketUnderTest::sent();
    TEST_CHECK(sent.size() == 2);
    TEST_CHECK_EQ(sent[0], R"({"id":1,"method":"connect","params":{"token":"secret-token"}})");
    TEST_CHECK_EQ(sent[1], R"({"id":2,"method":"subscribe","params":{"channel":"logs:app"}})");
    TEST_CHECK(h.session.deferred_commands() == 0);

    // Replies can arrive in any order relative to the connect reply
    h.reply_ok(2);
    h.reply_ok(ctrl::CONNECT_REQ_ID);
    TEST_CHECK(h.events.size() == 2);
    TEST_CHECK_EQ(h.events[0], Event::subscribed("c1"));
    TEST_CHECK_EQ(h.events[1], Event::connected());

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// E2 Arrival order kept
// ----------------------------------------------------------------------------

void test_deferred_order_kept() {
    std::cout << "[TEST] E2 Deferred commands keep arrival order\n";

    test::SessionHarness h;
    h.start();

    TEST_CHECK(h.commands.send(Command::subscribe("c1", "app")));
    TEST_CHECK(h.commands.send(Command::subscribe("c2", "db")));
    TEST_CHECK(h.commands.send(Command::unsubscribe("c1")));
    h.drain();
    TEST_CHECK(h.session.deferred_commands() == 3);

    h.open();

    // The unsubscribe finds no registered handle yet and sends nothing
    const auto sent = WebSocketUnderTest::sent();
    TEST_CHECK(sent.size() == 3);
    TEST_CHECK_EQ(sent[1], R"({"id":2,"method":"subscribe","params":{"channel":"logs:app"}})");
    TEST_CHECK_EQ(sent[2], R"({"id":3,"method":"subscribe","params":{"channel":"logs:db"}})");

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// E3 Disconnect during the handshake
// ----------------------------------------------------------------------------

void test_disconnect_during_handshake() {
    std::cout << "[TEST] E3 Disconnect during handshake\n";

    test::SessionHarness h;
    h.start();
    (void)h.subscribe("c1", "app");
    h.disconnect();

    TEST_CHECK(h.session.is_terminated());
    TEST_CHECK(h.session.deferred_commands() == 0);
    TEST_CHECK_EQ(h.status->load(), ConnectionStatus::disconnected());
    TEST_CHECK(h.events.size() == 1);
    TEST_CHECK_EQ(h.last(), Event::disconnected("User disconnected"));
    TEST_CHECK(WebSocketUnderTest::close_count() == 1);
    TEST_CHECK(WebSocketUnderTest::sent_count() == 0);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// E4 Fairness under a flooded transport
// ----------------------------------------------------------------------------

void test_command_served_under_flood() {
    std::cout << "[TEST] E4 Command served while transport is flooded\n";

    test::SessionHarness h;
    h.connect();
    h.subscribe_confirmed("c1", "app");

    for (int i = 0; i < 50; ++i) {
        TEST_CHECK(WebSocketUnderTest::emit_message(json::push::publication("logs:app", std::to_string(i))));
    }
    TEST_CHECK(h.commands.send(Command::disconnect()));

    // One pass takes one item from each source
    (void)h.session.poll();

    TEST_CHECK(h.session.is_terminated());
    TEST_CHECK(h.count(EventType::Publication) <= 1);
    TEST_CHECK_EQ(h.last(), Event::disconnected("User disconnected"));

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// E5 Connect command ignored
// ----------------------------------------------------------------------------

void test_connect_command_ignored() {
    std::cout << "[TEST] E5 Connect command on a live session ignored\n";

    test::SessionHarness h;
    h.connect();
    const auto sent_before = WebSocketUnderTest::sent_count();

    TEST_CHECK(h.commands.send(Command::connect("ws://other:9000/ws", "t")));
    h.drain();

    TEST_CHECK(WebSocketUnderTest::open_count() == 1);
    TEST_CHECK(WebSocketUnderTest::sent_count() == sent_before);
    TEST_CHECK(h.session.state() == StatusKind::Connected);
    TEST_CHECK(h.events.size() == 1);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// E6 Blocking run() loop
// ----------------------------------------------------------------------------

void test_run_loop_ends_on_disconnect() {
    std::cout << "[TEST] E6 run() ends on disconnect\n";

    test::SessionHarness h;
    std::thread worker([&] { h.session.run(); });

    // Wait for the transport to be opened by the session thread
    while (!WebSocketUnderTest::is_attached()) {
        std::this_thread::yield();
    }
    TEST_CHECK(WebSocketUnderTest::emit_open());
    TEST_CHECK(WebSocketUnderTest::emit_message(json::reply::connect_ok()));
    while (h.status->load().kind != StatusKind::Connected) {
        std::this_thread::yield();
    }

    TEST_CHECK(h.commands.send(Command::disconnect()));
    worker.join();

    TEST_CHECK_EQ(h.status->load(), ConnectionStatus::disconnected());
    TEST_CHECK(!WebSocketUnderTest::is_attached());

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------

#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_subscribe_before_open_is_deferred();
    test_deferred_order_kept();
    test_disconnect_during_handshake();
    test_command_served_under_flood();
    test_connect_command_ignored();
    test_run_loop_ends_on_disconnect();

    std::cout << "\n[GROUP E - SESSION ORDERING TESTS PASSED]\n";
    return 0;
}
