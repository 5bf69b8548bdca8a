/*
===============================================================================
 transport::engine::Config - Unit Tests
===============================================================================

Covered Requirements:
---------------------
G1. Select timeout resolution: explicit > SPINDLE_SELECT_TIMEOUT > 1 second
G2. Invalid values (negative, NaN, infinite, unparsable) raise ConfigError,
    also when constructing an engine
G3. Handle factory override replaces the backend factory

===============================================================================
*/

#include <cmath>
#include <cstdlib>
#include <iostream>
#include <limits>

#include "common/engine_harness.hpp"
#include "lcr/log/logger.hpp"

using namespace std::chrono_literals;
using engine::resolve_select_timeout;


// -----------------------------------------------------------------------------
// Group G1: resolution order
// -----------------------------------------------------------------------------
void test_resolution_order() {
    std::cout << "[TEST] Group G1: resolution order\n";

    ::unsetenv(engine::SELECT_TIMEOUT_ENV);
    TEST_CHECK(resolve_select_timeout(std::nullopt) == 1000ms);
    TEST_CHECK(resolve_select_timeout(0.25) == 250ms);
    TEST_CHECK(resolve_select_timeout(0.0) == 0ms);

    ::setenv(engine::SELECT_TIMEOUT_ENV, "2.5", 1);
    TEST_CHECK(resolve_select_timeout(std::nullopt) == 2500ms);
    TEST_CHECK(resolve_select_timeout(0.1) == 100ms); // explicit wins

    // Empty variable counts as unset
    ::setenv(engine::SELECT_TIMEOUT_ENV, "", 1);
    TEST_CHECK(resolve_select_timeout(std::nullopt) == 1000ms);

    ::unsetenv(engine::SELECT_TIMEOUT_ENV);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group G2: invalid values
// -----------------------------------------------------------------------------
void test_invalid_values() {
    std::cout << "[TEST] Group G2: invalid values\n";

    TEST_CHECK_THROWS((void)resolve_select_timeout(-1.0), ConfigError);
    TEST_CHECK_THROWS((void)resolve_select_timeout(std::numeric_limits<double>::quiet_NaN()), ConfigError);
    TEST_CHECK_THROWS((void)resolve_select_timeout(std::numeric_limits<double>::infinity()), ConfigError);

    ::setenv(engine::SELECT_TIMEOUT_ENV, "soon", 1);
    TEST_CHECK_THROWS((void)resolve_select_timeout(std::nullopt), ConfigError);
    ::setenv(engine::SELECT_TIMEOUT_ENV, "1.5s", 1);
    TEST_CHECK_THROWS((void)resolve_select_timeout(std::nullopt), ConfigError);
    ::setenv(engine::SELECT_TIMEOUT_ENV, "-3", 1);
    TEST_CHECK_THROWS((void)resolve_select_timeout(std::nullopt), ConfigError);

    // Raised at engine construction
    TEST_CHECK_THROWS(EngineUnderTest{}, ConfigError);
    ::unsetenv(engine::SELECT_TIMEOUT_ENV);

    EngineUnderTest::config_type cfg;
    cfg.select_timeout = -0.5;
    TEST_CHECK_THROWS(EngineUnderTest{cfg}, ConfigError);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Group G3: handle factory override
// -----------------------------------------------------------------------------
void test_handle_factory_override() {
    std::cout << "[TEST] Group G3: handle factory override\n";
    reset_mocks();

    int custom_calls = 0;
    EngineUnderTest::config_type cfg = test_config();
    cfg.handle_factory = [&](Transaction& txn, message::Factory& messages, std::unique_ptr<MockHandle> existing) {
        ++custom_calls;
        txn.request().headers().set("X-Factory", "custom");
        return MockHandleFactory{}(txn, messages, std::move(existing));
    };

    EngineUnderTest engine{cfg};
    Transaction txn = make_txn("mock://ok/1");
    (void)engine.send(txn);

    TEST_CHECK(custom_calls == 1);
    TEST_CHECK(txn.request().headers().get("x-factory") == std::optional<std::string>{"custom"});
    TEST_CHECK(engine.select_timeout() == 0ms);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// Test runner
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Trace);

    test_resolution_order();
    test_invalid_values();
    test_handle_factory_override();

    std::cout << "\n[ENGINE CONFIG TESTS PASSED]\n";
    return 0;
}
