/*
===============================================================================
 lcr::sync::bounded_channel - Unit Tests
===============================================================================

Covered:
- FIFO delivery and capacity limit
- Disconnected only after the queue is drained
- Last sender gone / sender close / receiver close
- Blocking send() released by the consumer and by receiver closure
- Notifier rung on push and on closure

===============================================================================
*/

#include <atomic>
#include <chrono>
#include <thread>
#include <string>
#include <memory>
#include <iostream>

#include "lcr/sync/bounded_channel.hpp"
#include "lcr/sync/notifier.hpp"
#include "common/test_check.hpp"

using namespace lcr::sync;
using Channel = bounded_channel<int>;


void test_fifo_and_capacity() {
    std::cout << "[TEST] FIFO and capacity\n";

    auto [tx, rx] = Channel::make(3);
    TEST_CHECK(tx.try_send(1) == send_status::Sent);
    TEST_CHECK(tx.try_send(2) == send_status::Sent);
    TEST_CHECK(tx.try_send(3) == send_status::Sent);
    TEST_CHECK(tx.try_send(4) == send_status::Full);
    TEST_CHECK(rx.size() == 3);

    int v = 0;
    TEST_CHECK(rx.try_recv(v) == recv_status::Item && v == 1);
    TEST_CHECK(rx.try_recv(v) == recv_status::Item && v == 2);
    TEST_CHECK(tx.try_send(5) == send_status::Sent);
    TEST_CHECK(rx.try_recv(v) == recv_status::Item && v == 3);
    TEST_CHECK(rx.try_recv(v) == recv_status::Item && v == 5);
    TEST_CHECK(rx.try_recv(v) == recv_status::Empty);

    std::cout << "[TEST] OK\n";
}


void test_drain_before_disconnect() {
    std::cout << "[TEST] Items queued before closure are delivered\n";

    auto [tx, rx] = Channel::make(4);
    TEST_CHECK(tx.try_send(7) == send_status::Sent);
    auto copy = tx;
    tx.reset();

    int v = 0;
    TEST_CHECK(rx.try_recv(v) == recv_status::Item && v == 7);
    TEST_CHECK(rx.try_recv(v) == recv_status::Empty);

    TEST_CHECK(copy.try_send(8) == send_status::Sent);
    copy.reset();
    TEST_CHECK(rx.try_recv(v) == recv_status::Item && v == 8);
    TEST_CHECK(rx.try_recv(v) == recv_status::Disconnected);

    std::cout << "[TEST] OK\n";
}


void test_sender_close() {
    std::cout << "[TEST] Sender close\n";

    auto [tx, rx] = Channel::make(4);
    auto other = tx;
    TEST_CHECK(tx.try_send(1) == send_status::Sent);
    other.close();

    TEST_CHECK(tx.try_send(2) == send_status::Closed);
    TEST_CHECK(!tx.send(3));

    int v = 0;
    TEST_CHECK(rx.try_recv(v) == recv_status::Item && v == 1);
    TEST_CHECK(rx.try_recv(v) == recv_status::Disconnected);

    std::cout << "[TEST] OK\n";
}


void test_receiver_close() {
    std::cout << "[TEST] Receiver close\n";

    auto [tx, rx] = Channel::make(4);
    TEST_CHECK(tx.try_send(1) == send_status::Sent);
    rx.close();

    TEST_CHECK(tx.try_send(2) == send_status::Closed);
    TEST_CHECK(!tx.send(2));
    int v = 0;
    TEST_CHECK(rx.try_recv(v) == recv_status::Disconnected);

    // Destroying the receiver has the same effect
    auto [tx2, rx2] = Channel::make(1);
    {
        auto dropped = std::move(rx2);
    }
    TEST_CHECK(tx2.try_send(1) == send_status::Closed);

    Channel::Sender empty;
    TEST_CHECK(!empty.valid());
    TEST_CHECK(empty.try_send(1) == send_status::Closed);

    std::cout << "[TEST] OK\n";
}


void test_blocking_send() {
    std::cout << "[TEST] Blocking send released by consumer and by closure\n";

    auto [tx, rx] = Channel::make(1);
    TEST_CHECK(tx.try_send(1) == send_status::Sent);

    std::atomic<bool> done{false};
    bool result = false;
    std::thread producer([&, s = tx]() mutable {
        result = s.send(2);
        done = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    TEST_CHECK(!done.load());

    int v = 0;
    TEST_CHECK(rx.try_recv(v) == recv_status::Item && v == 1);
    producer.join();
    TEST_CHECK(result);
    TEST_CHECK(rx.try_recv(v) == recv_status::Item && v == 2);

    // Queue full again, receiver closes while the producer waits
    TEST_CHECK(tx.try_send(3) == send_status::Sent);
    done = false;
    std::thread blocked([&, s = tx]() mutable {
        result = s.send(4);
        done = true;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    rx.close();
    blocked.join();
    TEST_CHECK(done.load());
    TEST_CHECK(!result);

    std::cout << "[TEST] OK\n";
}


void test_notifier_rung() {
    std::cout << "[TEST] Notifier rung on push and closure\n";

    auto wake = std::make_shared<notifier>();
    auto [tx, rx] = Channel::make(4, wake);

    auto ticket = wake->ticket();
    TEST_CHECK(!wake->wait_for(ticket, std::chrono::milliseconds(1)));

    TEST_CHECK(tx.try_send(1) == send_status::Sent);
    TEST_CHECK(wake->wait_for(ticket, std::chrono::milliseconds(1)));

    ticket = wake->ticket();
    tx.reset();
    TEST_CHECK(wake->wait_for(ticket, std::chrono::milliseconds(1)));

    // Wakeups from another thread
    auto [tx2, rx2] = Channel::make(4, wake);
    ticket = wake->ticket();
    std::thread producer([s = tx2]() mutable {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        (void)s.try_send(42);
    });
    wake->wait(ticket);
    producer.join();
    int v = 0;
    TEST_CHECK(rx2.try_recv(v) == recv_status::Item && v == 42);

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------

int main() {
    test_fifo_and_capacity();
    test_drain_before_disconnect();
    test_sender_close();
    test_receiver_close();
    test_blocking_send();
    test_notifier_rung();

    std::cout << "\n[BOUNDED CHANNEL TESTS PASSED]\n";
    return 0;
}
