/*
===============================================================================
 protocol::centrifugo::schema - Outbound Request Tests
===============================================================================

Covered:
- Exact wire form of connect / subscribe / unsubscribe
- JSON escaping of tokens and channel names
- Serialized size never exceeds the reserved worst case
- Compile-time intent tagging

===============================================================================
*/

#include <iostream>
#include <string>

#include "wiregate/core/protocol/centrifugo/request/concepts.hpp"
#include "wiregate/core/protocol/centrifugo/schema/connect.hpp"
#include "wiregate/core/protocol/centrifugo/schema/subscribe.hpp"
#include "wiregate/core/protocol/centrifugo/schema/unsubscribe.hpp"
#include "wiregate/core/protocol/centrifugo/channel/naming.hpp"
#include "common/test_check.hpp"

using namespace wiregate::core::protocol;
using namespace wiregate::core::protocol::centrifugo;

static_assert(request::Control<schema::Connect>);
static_assert(request::Subscription<schema::Subscribe>);
static_assert(request::Unsubscription<schema::Unsubscribe>);
static_assert(request::Request<schema::Connect>);
static_assert(request::Request<schema::Subscribe>);
static_assert(request::Request<schema::Unsubscribe>);
static_assert(!request::Subscription<schema::Unsubscribe>);


void test_connect_request() {
    std::cout << "[TEST] Connect request\n";

    schema::Connect req{ctrl::CONNECT_REQ_ID, "abc.def.ghi"};
    TEST_CHECK_EQ(req.to_json(), R"({"id":1,"method":"connect","params":{"token":"abc.def.ghi"}})");

    schema::Connect empty{};
    TEST_CHECK(empty.id == ctrl::CONNECT_REQ_ID);
    TEST_CHECK_EQ(empty.to_json(), R"({"id":1,"method":"connect","params":{"token":""}})");

    std::cout << "[TEST] OK\n";
}


void test_subscribe_request() {
    std::cout << "[TEST] Subscribe request\n";

    schema::Subscribe req{2, channel::make_channel_name(channel::DEFAULT_PREFIX, "app")};
    TEST_CHECK_EQ(req.channel, "logs:app");
    TEST_CHECK_EQ(req.to_json(), R"({"id":2,"method":"subscribe","params":{"channel":"logs:app"}})");

    schema::Subscribe big{18446744073709551615ULL, "x"};
    TEST_CHECK_EQ(big.to_json(), R"({"id":18446744073709551615,"method":"subscribe","params":{"channel":"x"}})");
    TEST_CHECK(big.to_json().size() <= big.max_json_size());

    std::cout << "[TEST] OK\n";
}


void test_unsubscribe_request() {
    std::cout << "[TEST] Unsubscribe request\n";

    schema::Unsubscribe req{3, "logs:app"};
    TEST_CHECK_EQ(req.to_json(), R"({"id":3,"method":"unsubscribe","params":{"channel":"logs:app"}})");

    std::cout << "[TEST] OK\n";
}


void test_escaping() {
    std::cout << "[TEST] Escaping\n";

    schema::Connect req{ctrl::CONNECT_REQ_ID, "a\"b\\c\n\x01"};
    TEST_CHECK_EQ(req.to_json(), R"({"id":1,"method":"connect","params":{"token":"a\"b\\c\n\u0001"}})");
    TEST_CHECK(req.to_json().size() <= req.max_json_size());

    schema::Subscribe sub{2, channel::make_channel_name("logs", "caf\xC3\xA9 \"q\"")};
    TEST_CHECK_EQ(sub.to_json(), "{\"id\":2,\"method\":\"subscribe\",\"params\":{\"channel\":\"logs:caf\xC3\xA9 \\\"q\\\"\"}}");
    TEST_CHECK(sub.to_json().size() <= sub.max_json_size());

    std::cout << "[TEST] OK\n";
}


void test_channel_naming() {
    std::cout << "[TEST] Channel naming\n";

    TEST_CHECK_EQ(channel::make_channel_name("logs", "app"), "logs:app");
    TEST_CHECK_EQ(channel::make_channel_name("audit", "db.replica"), "audit:db.replica");
    TEST_CHECK_EQ(channel::make_channel_name("logs", ""), "logs:");

    std::cout << "[TEST] OK\n";
}


// ----------------------------------------------------------------------------
// Runner
// ----------------------------------------------------------------------------

int main() {
    test_connect_request();
    test_subscribe_request();
    test_unsubscribe_request();
    test_escaping();
    test_channel_naming();

    std::cout << "\n[REQUEST SCHEMA TESTS PASSED]\n";
    return 0;
}
