/*
===============================================================================
 transport::Link - Group B Unit Tests
===============================================================================

Scope:
------
Reconnection with bounded exponential backoff.

B1. A failed initial connect schedules attempt 1 after the base delay
B2. Attempts are spaced 1s, 2s, 4s, 8s, 16s; the 5th failure ends the cycle
    with exactly one ConnectionLost
B3. open() is accepted again after ConnectionLost
B4. A remote close reconnects after the base delay and bumps the epoch
B5. cancel_reconnect() stops a pending cycle
B6. A transport error before close is kept as the cause
===============================================================================
*/

#include <chrono>
#include <iostream>

#include "common/harness/link.hpp"

using namespace std::chrono_literals;
using namespace roomsync::core::transport::test;


void test_initial_failure_schedules_retry() {
    std::cout << "[TEST] Group B1: initial failure schedules retry\n";
    LinkHarness h;
    WebSocketUnderTest::script_connect(Error::ConnectionFailed);

    TEST_CHECK(h.link->open("wss://relay.test/ws") == Error::ConnectionFailed);
    h.drain_signals();
    TEST_CHECK(h.link->state() == State::Reconnecting);
    TEST_CHECK(h.link->attempts() == 1);
    TEST_CHECK(h.retry_schedule_signals == 1);
    TEST_CHECK(h.link->next_retry() - ClockUnderTest::now() == 1000ms);

    h.step(999ms);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);
    h.step(1ms);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 2);
    TEST_CHECK(h.link->state() == State::Connected);
    TEST_CHECK(h.connect_signals == 1);
    TEST_CHECK(h.link->attempts() == 0);

    std::cout << "[TEST] OK\n";
}

void test_backoff_exhaustion() {
    std::cout << "[TEST] Group B2: 1/2/4/8/16s backoff then ConnectionLost once\n";
    LinkHarness h;
    WebSocketUnderTest::script_connect(Error::ConnectionFailed, 6);

    TEST_CHECK(h.link->open("wss://relay.test/ws") == Error::ConnectionFailed);
    h.drain_signals();

    const std::chrono::milliseconds expected[] = {1000ms, 2000ms, 4000ms, 8000ms, 16000ms};
    for (int i = 0; i < 5; ++i) {
        TEST_CHECK(h.link->state() == State::Reconnecting);
        TEST_CHECK(h.link->attempts() == static_cast<std::uint32_t>(i + 1));
        TEST_CHECK(h.link->next_retry() - ClockUnderTest::now() == expected[i]);
        h.step(expected[i] - 1ms);
        TEST_CHECK(WebSocketUnderTest::connect_calls() == i + 1);
        h.step(1ms);
        TEST_CHECK(WebSocketUnderTest::connect_calls() == i + 2);
    }

    TEST_CHECK(h.link->state() == State::ConnectionLost);
    TEST_CHECK(h.link->disconnect_reason() == DisconnectReason::RetriesExhausted);
    TEST_CHECK(h.link->attempts() == 5);
    TEST_CHECK(h.retry_schedule_signals == 5);
    TEST_CHECK(h.connection_lost_signals == 1);

    // Terminal: no further attempts, no repeated signal
    h.step(10min);
    h.step(10min);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 6);
    TEST_CHECK(h.connection_lost_signals == 1);

    std::cout << "[TEST] OK\n";
}

void test_reopen_after_loss() {
    std::cout << "[TEST] Group B3: open() accepted after ConnectionLost\n";
    LinkHarness h(RetryPolicy{.max_attempts = 1, .base_delay = 100ms});
    WebSocketUnderTest::script_connect(Error::Timeout, 2);

    TEST_CHECK(h.link->open("wss://relay.test/ws") == Error::Timeout);
    h.step(100ms);
    TEST_CHECK(h.link->state() == State::ConnectionLost);
    TEST_CHECK(h.connection_lost_signals == 1);

    TEST_CHECK(h.link->open("wss://relay.test/ws") == Error::None);
    h.drain_signals();
    TEST_CHECK(h.link->state() == State::Connected);
    TEST_CHECK(h.link->disconnect_reason() == DisconnectReason::None);
    TEST_CHECK(h.connect_signals == 1);

    std::cout << "[TEST] OK\n";
}

void test_remote_close_reconnects() {
    std::cout << "[TEST] Group B4: remote close reconnects and bumps epoch\n";
    LinkHarness h;

    TEST_CHECK(h.link->open("wss://relay.test/ws") == Error::None);
    h.drain_signals();
    TEST_CHECK(h.link->epoch() == 1);

    h.link->ws().emit_close();
    h.step(0ms);
    TEST_CHECK(h.disconnect_signals == 1);
    TEST_CHECK(h.link->state() == State::Reconnecting);
    TEST_CHECK(h.link->last_error() == Error::RemoteClosed);

    h.step(1000ms);
    TEST_CHECK(h.link->state() == State::Connected);
    TEST_CHECK(h.link->epoch() == 2);
    TEST_CHECK(h.connect_signals == 2);

    std::cout << "[TEST] OK\n";
}

void test_cancel_reconnect() {
    std::cout << "[TEST] Group B5: cancel_reconnect() stops the cycle\n";
    LinkHarness h;
    WebSocketUnderTest::script_connect(Error::HandshakeFailed);

    TEST_CHECK(h.link->open("wss://relay.test/ws") == Error::HandshakeFailed);
    TEST_CHECK(h.link->state() == State::Reconnecting);

    h.link->cancel_reconnect();
    TEST_CHECK(h.link->state() == State::Disconnected);
    TEST_CHECK(h.link->attempts() == 0);

    h.step(1min);
    TEST_CHECK(WebSocketUnderTest::connect_calls() == 1);

    // No effect on an established connection
    TEST_CHECK(h.link->open("wss://relay.test/ws") == Error::None);
    h.link->cancel_reconnect();
    TEST_CHECK(h.link->state() == State::Connected);

    std::cout << "[TEST] OK\n";
}

void test_error_then_close() {
    std::cout << "[TEST] Group B6: transport error is kept as cause\n";
    LinkHarness h;

    TEST_CHECK(h.link->open("wss://relay.test/ws") == Error::None);
    h.link->ws().emit_close(Error::TransportFailure);
    h.step(0ms);
    TEST_CHECK(h.link->last_error() == Error::TransportFailure);
    TEST_CHECK(h.link->state() == State::Reconnecting);
    TEST_CHECK(h.retry_schedule_signals == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
#include "lcr/log/logger.hpp"

int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_initial_failure_schedules_retry();
    test_backoff_exhaustion();
    test_reopen_after_loss();
    test_remote_close_reconnects();
    test_cancel_reconnect();
    test_error_then_close();

    std::cout << "\n[GROUP B - LINK RECONNECTION TESTS PASSED]\n";
    return 0;
}
