/*
===============================================================================
 event::Emitter - Unit Tests
===============================================================================

Covered Requirements:
---------------------
E1. Ordering
    - Higher priority runs first
    - Equal priorities run in registration order
    - first() / last() resolve against registered listeners (1 / -1 when empty)

E2. One-shot listeners
    - Invoked once, removed before invocation even if they throw
    - A one-shot removed by an earlier listener of the same emission is skipped

E3. Registry queries and removal
    - listeners(name) in dispatch order, listeners() for every name
    - remove_listener() of an unknown id is a no-op

E4. Propagation and mutation during emission
    - stop_propagation() halts dispatch
    - listeners added during an emission run from the next emission on

E5. Subscribers
    - attach() registers every subscription, detach() removes exactly those

===============================================================================
*/

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "spindle/core/event/emitter.hpp"
#include "spindle/core/event/event.hpp"
#include "spindle/core/transaction.hpp"

#include "common/test_check.hpp"
#include "lcr/log/logger.hpp"

using namespace spindle::core;
using namespace spindle::core::event;

namespace {

Transaction make_txn() {
    return Transaction{message::Request{"GET", "http://example.test/"}};
}

Listener record(std::vector<std::string>& out, std::string tag) {
    return [&out, tag](Event&, Emitter&) { out.push_back(tag); };
}

} // namespace


// -----------------------------------------------------------------------------
// Group E1: ordering
// -----------------------------------------------------------------------------
void test_priority_ordering() {
    std::cout << "[TEST] Group E1: priority ordering\n";

    Transaction txn = make_txn();
    Emitter emitter;
    std::vector<std::string> calls;

    emitter.on("x", record(calls, "low"), -5);
    emitter.on("x", record(calls, "high"), 50);
    emitter.on("x", record(calls, "mid-1"));
    emitter.on("x", record(calls, "mid-2"));

    Event ev{txn, Before{}};
    emitter.emit("x", ev);

    TEST_CHECK((calls == std::vector<std::string>{"high", "mid-1", "mid-2", "low"}));

    std::cout << "[TEST] OK\n";
}

void test_first_and_last() {
    std::cout << "[TEST] Group E1: first() and last()\n";

    Transaction txn = make_txn();
    Emitter emitter;
    std::vector<std::string> calls;

    // Empty list: first -> 1, last -> -1
    emitter.on("empty-first", record(calls, "a"), Priority::first());
    emitter.on("empty-first", record(calls, "b"), 0);
    emitter.on("empty-last", record(calls, "c"), Priority::last());
    emitter.on("empty-last", record(calls, "d"), 0);

    Event ev1{txn, Before{}};
    emitter.emit("empty-first", ev1);
    emitter.emit("empty-last", ev1);
    TEST_CHECK((calls == std::vector<std::string>{"a", "b", "d", "c"}));

    calls.clear();
    emitter.on("y", record(calls, "p10"), 10);
    emitter.on("y", record(calls, "p-3"), -3);
    emitter.on("y", record(calls, "first"), Priority::first()); // 11
    emitter.on("y", record(calls, "last"), Priority::last());   // -4
    emitter.on("y", record(calls, "p11"), 11);                  // ties with first, registered later

    Event ev2{txn, Before{}};
    emitter.emit("y", ev2);
    TEST_CHECK((calls == std::vector<std::string>{"first", "p11", "p10", "p-3", "last"}));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group E2: one-shot listeners
// -----------------------------------------------------------------------------
void test_once() {
    std::cout << "[TEST] Group E2: once\n";

    Transaction txn = make_txn();
    Emitter emitter;
    int calls = 0;

    emitter.once("x", [&](Event&, Emitter&) { ++calls; });

    Event ev{txn, Before{}};
    emitter.emit("x", ev);
    emitter.emit("x", ev);

    TEST_CHECK(calls == 1);
    TEST_CHECK(emitter.listeners("x").empty());
    TEST_CHECK(!emitter.has_listeners("x"));

    std::cout << "[TEST] OK\n";
}

void test_once_removed_even_if_it_throws() {
    std::cout << "[TEST] Group E2: once removed even if it throws\n";

    Transaction txn = make_txn();
    Emitter emitter;

    emitter.once("x", [](Event&, Emitter&) { throw std::runtime_error("boom"); });

    Event ev{txn, Before{}};
    TEST_CHECK_THROWS(emitter.emit("x", ev), std::runtime_error);
    TEST_CHECK(emitter.listeners("x").empty());

    // Second emission is silent
    emitter.emit("x", ev);

    std::cout << "[TEST] OK\n";
}

void test_once_removed_by_earlier_listener_is_skipped() {
    std::cout << "[TEST] Group E2: once removed mid-emission is skipped\n";

    Transaction txn = make_txn();
    Emitter emitter;
    int once_calls = 0;

    ListenerId once_id = 0;
    emitter.on("x", [&](Event&, Emitter& em) { em.remove_listener("x", once_id); }, 10);
    once_id = emitter.once("x", [&](Event&, Emitter&) { ++once_calls; }, 0);

    Event ev{txn, Before{}};
    emitter.emit("x", ev);

    TEST_CHECK(once_calls == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group E3: registry queries and removal
// -----------------------------------------------------------------------------
void test_listener_queries() {
    std::cout << "[TEST] Group E3: listener queries\n";

    Emitter emitter;
    const auto a = emitter.on("a", [](Event&, Emitter&) {}, 1);
    const auto b = emitter.on("a", [](Event&, Emitter&) {}, 5);
    const auto c = emitter.on("b", [](Event&, Emitter&) {});

    TEST_CHECK((emitter.listeners("a") == std::vector<ListenerId>{b, a}));
    TEST_CHECK(emitter.listeners("missing").empty());

    const auto all = emitter.listeners();
    TEST_CHECK(all.size() == 2);
    TEST_CHECK((all.at("a") == std::vector<ListenerId>{b, a}));
    TEST_CHECK((all.at("b") == std::vector<ListenerId>{c}));

    // Unknown id / name: no-op
    TEST_CHECK(!emitter.remove_listener("a", c));
    TEST_CHECK(!emitter.remove_listener("missing", a));
    TEST_CHECK(emitter.listeners("a").size() == 2);

    TEST_CHECK(emitter.remove_listener("a", b));
    TEST_CHECK((emitter.listeners("a") == std::vector<ListenerId>{a}));

    TEST_CHECK(emitter.remove_listener("b", c));
    TEST_CHECK(emitter.listeners().size() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group E4: propagation and mutation during emission
// -----------------------------------------------------------------------------
void test_stop_propagation() {
    std::cout << "[TEST] Group E4: stop propagation\n";

    Transaction txn = make_txn();
    Emitter emitter;
    std::vector<std::string> calls;

    emitter.on("x", [&](Event& ev, Emitter&) { calls.push_back("stopper"); ev.stop_propagation(); }, 10);
    emitter.on("x", record(calls, "never"));

    Event ev{txn, Before{}};
    Event& returned = emitter.emit("x", ev);

    TEST_CHECK(&returned == &ev);
    TEST_CHECK(ev.is_propagation_stopped());
    TEST_CHECK((calls == std::vector<std::string>{"stopper"}));

    std::cout << "[TEST] OK\n";
}

void test_registration_during_emission() {
    std::cout << "[TEST] Group E4: registration during emission\n";

    Transaction txn = make_txn();
    Emitter emitter;
    std::vector<std::string> calls;
    bool added = false;

    emitter.on("x", [&](Event&, Emitter& em) {
        calls.push_back("adder");
        if (!added) {
            added = true;
            em.on("x", record(calls, "late"), -1);
        }
    });

    Event ev1{txn, Before{}};
    emitter.emit("x", ev1);
    TEST_CHECK((calls == std::vector<std::string>{"adder"}));

    calls.clear();
    Event ev2{txn, Before{}};
    emitter.emit("x", ev2);
    TEST_CHECK((calls == std::vector<std::string>{"adder", "late"}));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group E5: subscribers
// -----------------------------------------------------------------------------
struct CountingSubscriber {
    int before = 0;
    int complete = 0;

    std::vector<Subscription> events() {
        return {
            Subscription{"before", [this](Event&, Emitter&) { ++before; }, priority::early},
            Subscription{"complete", [this](Event&, Emitter&) { ++complete; }, priority::late},
        };
    }
};

static_assert(SubscriberConcept<CountingSubscriber>);

void test_attach_detach() {
    std::cout << "[TEST] Group E5: attach / detach\n";

    Transaction txn = make_txn();
    Emitter emitter;
    CountingSubscriber sub;

    const auto own = emitter.on("before", [](Event&, Emitter&) {});
    emitter.attach(sub);

    TEST_CHECK(emitter.listeners("before").size() == 2);
    TEST_CHECK(emitter.listeners("before").back() == own); // early runs first

    Event ev{txn, Before{}};
    emitter.emit("before", ev);
    emitter.emit("complete", ev);
    TEST_CHECK(sub.before == 1);
    TEST_CHECK(sub.complete == 1);

    emitter.detach(sub);
    TEST_CHECK((emitter.listeners("before") == std::vector<ListenerId>{own}));
    TEST_CHECK(emitter.listeners("complete").empty());

    // Detaching twice is harmless
    emitter.detach(sub);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_priority_ordering();
    test_first_and_last();
    test_once();
    test_once_removed_even_if_it_throws();
    test_once_removed_by_earlier_listener_is_skipped();
    test_listener_queries();
    test_stop_propagation();
    test_registration_during_emission();
    test_attach_detach();

    std::cout << "\n[EMITTER TESTS PASSED]\n";
    return 0;
}
