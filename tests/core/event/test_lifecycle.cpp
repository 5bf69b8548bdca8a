/*
===============================================================================
 lifecycle - Unit Tests
===============================================================================

Covered Requirements:
---------------------
L1. emit_before
    - Foreign exceptions are wrapped (Application) with the cause preserved
    - The error reaches the caller marked as emitted
    - An already-emitted error is rethrown without a second `error` event

L2. emit_error
    - Stopping propagation suppresses the throw
    - Listeners see the marked failure and can flag throw-immediately
    - The caller's error object is never mutated

L3. emit_complete
    - Sets the effective URL to the request URL
    - A RequestError raised by a listener is reported with the same stats
    - A foreign exception raised by a listener is wrapped and reported
    - InternalError passes through without an `error` event
    - Requires a response

L4. intercept
    - On `before`: attaches the response and emits `complete`
    - On `error`: clears throw-immediately
    - A failing substitute cannot be intercepted again from the nested
      `error` event (InternalError); the guard is released afterwards
    - Rejected on other events

===============================================================================
*/

#include <iostream>
#include <stdexcept>
#include <string>

#include "spindle/core/event/event.hpp"
#include "spindle/core/lifecycle.hpp"

#include "common/test_check.hpp"
#include "lcr/log/logger.hpp"

using namespace spindle::core;

namespace {

Transaction make_txn(std::string url = "http://example.test/a") {
    return Transaction{message::Request{"GET", std::move(url)}};
}

} // namespace


// -----------------------------------------------------------------------------
// Group L1: emit_before
// -----------------------------------------------------------------------------
void test_before_wraps_foreign_exception() {
    std::cout << "[TEST] Group L1: before wraps foreign exceptions\n";

    Transaction txn = make_txn();
    int errors = 0;
    bool saw_marked = false;

    txn.request().emitter().on(event::names::BEFORE, [](event::Event&, event::Emitter&) {
        throw std::runtime_error("listener exploded");
    });
    txn.request().emitter().on(event::names::ERROR, [&](event::Event& ev, event::Emitter&) {
        ++errors;
        const auto* err = ev.get_if<event::Error>();
        TEST_CHECK(err != nullptr);
        TEST_CHECK(ev.kind() == event::Kind::Error);
        saw_marked = err->error.emitted();
    });

    bool thrown = false;
    try {
        lifecycle::emit_before(txn);
    } catch (const RequestError& e) {
        thrown = true;
        TEST_CHECK(e.kind() == ErrorKind::Application);
        TEST_CHECK(e.emitted());
        TEST_CHECK(std::string(e.what()) == "listener exploded");
        TEST_CHECK(e.cause() != nullptr);
        TEST_CHECK_THROWS(std::rethrow_exception(e.cause()), std::runtime_error);
    }

    TEST_CHECK(thrown);
    TEST_CHECK(errors == 1);
    TEST_CHECK(saw_marked);

    std::cout << "[TEST] OK\n";
}

void test_before_rethrows_emitted_error() {
    std::cout << "[TEST] Group L1: already-emitted error is not reported twice\n";

    Transaction outer = make_txn("http://example.test/outer");
    Transaction inner = make_txn("http://example.test/inner");
    int outer_errors = 0;
    int inner_errors = 0;

    // The inner exchange fails and reports through its own `error` event;
    // the marked error then escapes through the outer `before` listener.
    inner.request().emitter().on(event::names::ERROR, [&](event::Event&, event::Emitter&) { ++inner_errors; });
    outer.request().emitter().on(event::names::ERROR, [&](event::Event&, event::Emitter&) { ++outer_errors; });
    outer.request().emitter().on(event::names::BEFORE, [&](event::Event&, event::Emitter&) {
        lifecycle::emit_error(inner, RequestError{ErrorKind::Transport, "inner failed"});
    });

    TEST_CHECK_THROWS(lifecycle::emit_before(outer), RequestError);
    TEST_CHECK(inner_errors == 1);
    TEST_CHECK(outer_errors == 0);

    std::cout << "[TEST] OK\n";
}

void test_before_reports_unmarked_request_error() {
    std::cout << "[TEST] Group L1: unmarked RequestError from before is reported once\n";

    Transaction txn = make_txn();
    int errors = 0;

    txn.request().emitter().on(event::names::BEFORE, [](event::Event&, event::Emitter&) {
        throw RequestError(ErrorKind::Application, "signing failed");
    });
    txn.request().emitter().on(event::names::ERROR, [&](event::Event&, event::Emitter&) { ++errors; });

    TEST_CHECK_THROWS(lifecycle::emit_before(txn), RequestError);
    TEST_CHECK(errors == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group L2: emit_error
// -----------------------------------------------------------------------------
void test_error_stop_propagation_suppresses_throw() {
    std::cout << "[TEST] Group L2: stop propagation suppresses throw\n";

    Transaction txn = make_txn();
    txn.request().emitter().on(event::names::ERROR, [](event::Event& ev, event::Emitter&) {
        ev.stop_propagation();
    });

    const RequestError original{ErrorKind::Transport, "down", nullptr, 7};
    lifecycle::emit_error(txn, original);

    // Caller's object untouched
    TEST_CHECK(!original.emitted());

    std::cout << "[TEST] OK\n";
}

void test_error_listener_flags_throw_immediately() {
    std::cout << "[TEST] Group L2: listener flags throw-immediately\n";

    Transaction txn = make_txn();
    TransferStats stats;
    stats.http_status = 503;

    txn.request().emitter().on(event::names::ERROR, [](event::Event& ev, event::Emitter&) {
        auto* err = ev.get_if<event::Error>();
        TEST_CHECK(err->stats.http_status == 503);
        TEST_CHECK(err->error.transport_code() == 7);
        err->error.set_throw_immediately(true);
    });

    bool thrown = false;
    try {
        lifecycle::emit_error(txn, RequestError{ErrorKind::Transport, "down", nullptr, 7}, stats);
    } catch (const RequestError& e) {
        thrown = true;
        TEST_CHECK(e.throws_immediately());
        TEST_CHECK(e.emitted());
        TEST_CHECK(e.kind() == ErrorKind::Transport);
    }
    TEST_CHECK(thrown);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group L3: emit_complete
// -----------------------------------------------------------------------------
void test_complete_sets_effective_url() {
    std::cout << "[TEST] Group L3: complete sets effective URL\n";

    Transaction txn = make_txn("http://example.test/final");
    txn.set_response(message::Response{"1.1", 200, "OK"});
    int completes = 0;
    txn.request().emitter().on(event::names::COMPLETE, [&](event::Event& ev, event::Emitter&) {
        ++completes;
        TEST_CHECK(ev.transaction().response()->effective_url() == "http://example.test/final");
    });

    lifecycle::emit_complete(txn);

    TEST_CHECK(completes == 1);
    TEST_CHECK(txn.response()->effective_url() == "http://example.test/final");

    std::cout << "[TEST] OK\n";
}

void test_complete_listener_failure_goes_to_error() {
    std::cout << "[TEST] Group L3: complete listener failure reported as error\n";

    Transaction txn = make_txn();
    txn.set_response(message::Response{"1.1", 500, "Internal Server Error"});
    TransferStats stats;
    stats.total_time = 1.5;
    double seen_time = 0.0;

    txn.request().emitter().on(event::names::COMPLETE, [](event::Event&, event::Emitter&) {
        throw RequestError(ErrorKind::Application, "bad status");
    });
    txn.request().emitter().on(event::names::ERROR, [&](event::Event& ev, event::Emitter&) {
        seen_time = ev.get_if<event::Error>()->stats.total_time;
    });

    TEST_CHECK_THROWS(lifecycle::emit_complete(txn, stats), RequestError);
    TEST_CHECK(seen_time == 1.5);

    std::cout << "[TEST] OK\n";
}

void test_complete_listener_foreign_exception_goes_to_error() {
    std::cout << "[TEST] Group L3: complete listener foreign exception reported as error\n";

    Transaction txn = make_txn();
    txn.set_response(message::Response{"1.1", 200, "OK"});
    int errors = 0;

    txn.request().emitter().on(event::names::COMPLETE, [](event::Event&, event::Emitter&) {
        throw std::runtime_error("bad payload");
    });
    txn.request().emitter().on(event::names::ERROR, [&](event::Event& ev, event::Emitter&) {
        ++errors;
        const RequestError& error = ev.get_if<event::Error>()->error;
        TEST_CHECK(error.kind() == ErrorKind::Application);
        TEST_CHECK(std::string(error.what()) == "bad payload");
        TEST_CHECK(static_cast<bool>(error.cause()));
    });

    bool thrown = false;
    try {
        lifecycle::emit_complete(txn);
    } catch (const RequestError& e) {
        thrown = true;
        TEST_CHECK(e.emitted());
    }
    TEST_CHECK(thrown);
    TEST_CHECK(errors == 1);

    std::cout << "[TEST] OK\n";
}

void test_complete_listener_internal_error_passes_through() {
    std::cout << "[TEST] Group L3: complete listener InternalError passes through\n";

    Transaction txn = make_txn();
    txn.set_response(message::Response{"1.1", 200, "OK"});
    int errors = 0;

    txn.request().emitter().on(event::names::COMPLETE, [](event::Event&, event::Emitter&) {
        throw InternalError("broken bookkeeping");
    });
    txn.request().emitter().on(event::names::ERROR, [&](event::Event&, event::Emitter&) { ++errors; });

    TEST_CHECK_THROWS(lifecycle::emit_complete(txn), InternalError);
    TEST_CHECK(errors == 0);

    std::cout << "[TEST] OK\n";
}

void test_complete_requires_response() {
    std::cout << "[TEST] Group L3: complete requires a response\n";

    Transaction txn = make_txn();
    TEST_CHECK_THROWS(lifecycle::emit_complete(txn), InternalError);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group L4: intercept
// -----------------------------------------------------------------------------
void test_intercept_in_before_emits_complete() {
    std::cout << "[TEST] Group L4: intercept in before emits complete\n";

    Transaction txn = make_txn();
    int completes = 0;
    int later_before = 0;

    txn.request().emitter().on(event::names::BEFORE, [](event::Event& ev, event::Emitter&) {
        ev.intercept(message::Response{"1.1", 204, "No Content"});
    }, 10);
    txn.request().emitter().on(event::names::BEFORE, [&](event::Event&, event::Emitter&) { ++later_before; });
    txn.request().emitter().on(event::names::COMPLETE, [&](event::Event&, event::Emitter&) { ++completes; });

    lifecycle::emit_before(txn);

    TEST_CHECK(txn.has_response());
    TEST_CHECK(txn.response()->status() == 204);
    TEST_CHECK(completes == 1);
    TEST_CHECK(later_before == 0);

    std::cout << "[TEST] OK\n";
}

void test_intercept_in_error_clears_throw_immediately() {
    std::cout << "[TEST] Group L4: intercept in error\n";

    Transaction txn = make_txn();
    int completes = 0;

    txn.request().emitter().on(event::names::ERROR, [](event::Event& ev, event::Emitter&) {
        ev.get_if<event::Error>()->error.set_throw_immediately(true);
        ev.intercept(message::Response{"1.1", 200, "OK (cached)"});
        TEST_CHECK(!ev.get_if<event::Error>()->error.throws_immediately());
    });
    txn.request().emitter().on(event::names::COMPLETE, [&](event::Event&, event::Emitter&) { ++completes; });

    lifecycle::emit_error(txn, RequestError{ErrorKind::Transport, "down", nullptr, 7});

    TEST_CHECK(txn.response()->reason() == "OK (cached)");
    TEST_CHECK(completes == 1);

    std::cout << "[TEST] OK\n";
}

void test_intercept_reentry_from_error_is_rejected() {
    std::cout << "[TEST] Group L4: nested intercept from error is rejected\n";

    Transaction txn = make_txn();
    int errors = 0;
    int completes = 0;

    txn.request().emitter().on(event::names::ERROR, [&](event::Event& ev, event::Emitter&) {
        ++errors;
        ev.intercept(message::Response{"1.1", 200, "OK (substitute)"});
    });
    const auto failing = txn.request().emitter().on(event::names::COMPLETE, [&](event::Event&, event::Emitter&) {
        ++completes;
        throw RequestError(ErrorKind::Application, "substitute rejected");
    });

    TEST_CHECK_THROWS(lifecycle::emit_error(txn, RequestError{ErrorKind::Transport, "down", nullptr, 7}),
                      InternalError);
    TEST_CHECK(errors == 2);
    TEST_CHECK(completes == 1);

    // Guard released: a later error can be intercepted normally
    TEST_CHECK(txn.request().emitter().remove_listener(event::names::COMPLETE, failing));
    lifecycle::emit_error(txn, RequestError{ErrorKind::Transport, "down again", nullptr, 7});
    TEST_CHECK(errors == 3);
    TEST_CHECK(txn.response()->reason() == "OK (substitute)");

    std::cout << "[TEST] OK\n";
}

void test_intercept_rejected_on_headers() {
    std::cout << "[TEST] Group L4: intercept rejected on headers\n";

    Transaction txn = make_txn();
    event::Event ev{txn, event::Headers{}};
    TEST_CHECK_THROWS(ev.intercept(message::Response{}), InternalError);
    TEST_CHECK(!txn.has_response());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_before_wraps_foreign_exception();
    test_before_rethrows_emitted_error();
    test_before_reports_unmarked_request_error();
    test_error_stop_propagation_suppresses_throw();
    test_error_listener_flags_throw_immediately();
    test_complete_sets_effective_url();
    test_complete_listener_failure_goes_to_error();
    test_complete_listener_foreign_exception_goes_to_error();
    test_complete_listener_internal_error_passes_through();
    test_complete_requires_response();
    test_intercept_in_before_emits_complete();
    test_intercept_in_error_clears_throw_immediately();
    test_intercept_reentry_from_error_is_rejected();
    test_intercept_rejected_on_headers();

    std::cout << "\n[LIFECYCLE TESTS PASSED]\n";
    return 0;
}
