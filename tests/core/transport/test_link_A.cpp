/*
===============================================================================
 transport::Link - Group A Unit Tests
===============================================================================

Scope:
------
Lifecycle of a Link against a transport that always connects.

A1. open() connects, emits Connected and starts epoch 1
A2. open() with an invalid URL fails without creating a transport
A3. open() while connected is rejected with InvalidState
A4. close() emits Disconnected once and is idempotent
A5. Destroying the Link closes the transport
A6. URL components reach the transport unchanged
===============================================================================
*/

#include <iostream>

#include "common/harness/link.hpp"

using namespace roomsync::core::transport::test;


void test_open_connects() {
    std::cout << "[TEST] Group A1: open() connects and emits Connected\n";
    LinkHarness h;

    TEST_CHECK(h.link->open("wss://relay.test/ws") == Error::None);
    h.drain_signals();

    TEST_CHECK(h.link->state() == State::Connected);
    TEST_CHECK(h.link->epoch() == 1);
    TEST_CHECK(h.connect_signals == 1);
    TEST_CHECK(h.disconnect_signals == 0);
    TEST_CHECK(h.link->has_ws());
    TEST_CHECK(h.link->ws().is_connected());

    std::cout << "[TEST] OK\n";
}

void test_open_invalid_url() {
    std::cout << "[TEST] Group A2: invalid URL creates no transport\n";
    LinkHarness h;

    TEST_CHECK(h.link->open("http://relay.test/ws") == Error::InvalidUrl);
    h.drain_signals();

    TEST_CHECK(h.link->state() == State::Disconnected);
    TEST_CHECK(WebSocketUnderTest::constructed() == 0);
    TEST_CHECK(h.signals.empty());

    std::cout << "[TEST] OK\n";
}

void test_open_twice() {
    std::cout << "[TEST] Group A3: open() while connected is rejected\n";
    LinkHarness h;

    TEST_CHECK(h.link->open("wss://relay.test/ws") == Error::None);
    TEST_CHECK(h.link->open("wss://relay.test/ws") == Error::InvalidState);
    TEST_CHECK(h.link->state() == State::Connected);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);

    std::cout << "[TEST] OK\n";
}

void test_close_idempotent() {
    std::cout << "[TEST] Group A4: close() emits Disconnected once\n";
    LinkHarness h;

    TEST_CHECK(h.link->open("wss://relay.test/ws") == Error::None);
    h.drain_signals();
    h.reset_counters();

    h.link->close();
    h.link->close();
    h.drain_signals();

    TEST_CHECK(h.link->state() == State::Disconnected);
    TEST_CHECK(h.link->disconnect_reason() == DisconnectReason::LocalClose);
    TEST_CHECK(h.disconnect_signals == 1);
    TEST_CHECK(!h.link->has_ws());

    // A local close never schedules a retry
    h.step(std::chrono::seconds(60));
    TEST_CHECK(h.link->state() == State::Disconnected);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);

    std::cout << "[TEST] OK\n";
}

void test_destructor_closes() {
    std::cout << "[TEST] Group A5: destructor closes transport\n";
    LinkHarness h;

    TEST_CHECK(h.link->open("wss://relay.test/ws") == Error::None);
    const int closes_before = WebSocketUnderTest::close_calls();
    h.destroy_link();
    TEST_CHECK(WebSocketUnderTest::close_calls() == closes_before + 1);

    std::cout << "[TEST] OK\n";
}

void test_url_components() {
    std::cout << "[TEST] Group A6: URL components reach the transport\n";
    LinkHarness h;

    TEST_CHECK(h.link->open("ws://localhost:9001/collab") == Error::None);
    TEST_CHECK(WebSocketUnderTest::last_host() == "localhost");
    TEST_CHECK(WebSocketUnderTest::last_port() == "9001");
    TEST_CHECK(WebSocketUnderTest::last_path() == "/collab");
    TEST_CHECK(!WebSocketUnderTest::last_secure());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_open_connects();
    test_open_invalid_url();
    test_open_twice();
    test_close_idempotent();
    test_destructor_closes();
    test_url_components();

    std::cout << "\n[GROUP A - LINK LIFECYCLE TESTS PASSED]\n";
    return 0;
}
