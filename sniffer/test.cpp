/**
 * @file test.cpp
 * @brief Test suite for the sniffer facade, statement interception, configuration and test adapters
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstdint>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../testing/test_main.hpp"
#include "sniffer.hxx"
#include "../testing/statement_assertions.hpp"

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

namespace {

// Loads orders and their items, either one query per order or one batched query.
class OrderRepository {
   public:
    explicit OrderRepository(bool batched) : batched_(batched) {}

    auto load_orders_with_items(int order_count) -> std::vector<int> {
        auto ids = sniffer::intercept("SELECT id FROM orders", [order_count] {
            std::vector<int> found;
            for (int id = 0; id < order_count; ++id) {
                found.push_back(id);
            }
            return found;
        });
        if (batched_) {
            sniffer::intercept("SELECT * FROM items WHERE order_id IN (...)", [] {});
        } else {
            for (const int id : ids) {
                sniffer::intercept("SELECT * FROM items WHERE order_id = " + std::to_string(id), [] {});
            }
        }
        return ids;
    }

   private:
    bool batched_;
};

void run_statements(int count) {
    for (int i = 0; i < count; ++i) {
        sniffer::record_statement("SELECT " + std::to_string(i));
    }
}

void run_on_other_thread(int count) {
    std::thread worker([count] { run_statements(count); });
    worker.join();
}

}  // namespace

BEFORE_EACH() {
    sniffer::reset_counters();
    sniffer::configure({.log_failures = false});
}

// ═════════════════════════════════════════════════════════════════════════════
// Factories
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Facade – factories")

TEST_CASE("spy baselines on the current counters") {
    run_statements(4);
    auto spy = sniffer::spy();
    expect(spy.baseline().global).to_equal(4U);
    expect(spy.expectation_count()).to_equal(0U);
}

TEST_CASE("spy_with_baseline uses the given counters") {
    run_statements(4);
    auto spy = sniffer::spy_with_baseline(1, 1);
    expect(spy.executed_statements()).to_equal(3);
}

TEST_CASE("each factory returns a spy carrying one expectation") {
    expect(sniffer::expect_never().expectation_count()).to_equal(1U);
    expect(sniffer::expect_at_most_once(sniffer::ThreadScope::Any).expectation_count()).to_equal(1U);
    expect(sniffer::expect_at_most(2).expectation_count()).to_equal(1U);
    expect(sniffer::expect_exactly(2, sniffer::ThreadScope::Others).expectation_count()).to_equal(1U);
    expect(sniffer::expect_at_least(1).expectation_count()).to_equal(1U);
    expect(sniffer::expect_between(1, 4, sniffer::ThreadScope::Current).expectation_count()).to_equal(1U);
}

TEST_CASE("expect_never spy closes cleanly without statements") {
    auto spy = sniffer::expect_never();
    expect_no_throw(spy.close());
}

TEST_CASE("expect_at_most_once spy fails on close after two statements") {
    auto spy = sniffer::expect_at_most_once();
    run_statements(2);
    const auto err = catch_thrown(sniffer::VerificationError, spy.close());
    expect(err.actual_count()).to_equal(2);
    expect(err.max_count()).to_equal(1);
    expect(spy.is_closed()).to_be_true();
}

TEST_CASE("expect_at_most spy counts the given scope") {
    auto spy = sniffer::expect_at_most(3, sniffer::ThreadScope::Any);
    run_on_other_thread(3);
    expect_no_throw(spy.close());
}

TEST_CASE("factory result can call work and keep checking afterwards") {
    auto rows = sniffer::expect_at_most_once().call([] {
        sniffer::record_statement("SELECT 1");
        return 7;
    });
    expect(rows.value()).to_equal(7);
    expect(rows->executed_statements()).to_equal(1);
    expect_no_throw(rows.verify());
    sniffer::record_statement("SELECT 2");
    expect_throws(sniffer::VerificationError, rows.verify());
    expect_throws(sniffer::VerificationError, rows->close());
    expect(rows->is_closed()).to_be_true();
}

TEST_CASE("chained factory expectations survive call") {
    auto ids = sniffer::expect_at_least(1).expect_never(sniffer::ThreadScope::Others).call([] {
        return OrderRepository(true).load_orders_with_items(3);
    });
    expect(ids.value().size()).to_equal(3U);
    expect(ids->expectation_count()).to_equal(2U);
    expect(ids->observed_statements().size()).to_equal(2U);
    expect_no_throw(ids->close());
}

TEST_CASE("expect_exactly spy passes on the exact count") {
    auto spy = sniffer::expect_exactly(2);
    run_statements(2);
    run_on_other_thread(5);
    expect_no_throw(spy.close());
}

TEST_CASE("expect_at_least spy on other threads ignores the own thread") {
    auto spy = sniffer::expect_at_least(1, sniffer::ThreadScope::Others);
    run_statements(1);
    const auto err = catch_thrown(sniffer::VerificationError, spy.close());
    expect(err.actual_count()).to_equal(0);
    expect(err.scope()).to_equal(sniffer::ThreadScope::Others);
}

TEST_CASE("expect_between spy accepts a count inside the range") {
    auto spy = sniffer::expect_between(1, 2);
    run_statements(1);
    expect_no_throw(spy.close());
}

TEST_CASE("factories reject invalid ranges") {
    expect_throws(std::invalid_argument, (void)sniffer::expect_between(2, 1));
    expect_throws(std::invalid_argument, (void)sniffer::expect_at_least(-1, sniffer::ThreadScope::Any));
}

// ═════════════════════════════════════════════════════════════════════════════
// Counters
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Facade – counters")

TEST_CASE("record_statement counts globally and for the thread") {
    run_statements(2);
    run_on_other_thread(3);
    expect(sniffer::executed_statements()).to_equal(5U);
    expect(sniffer::thread_executed_statements()).to_equal(2U);
}

TEST_CASE("reset_counters zeroes the global and the thread counter") {
    run_statements(2);
    sniffer::reset_counters();
    expect(sniffer::executed_statements()).to_equal(0U);
    expect(sniffer::thread_executed_statements()).to_equal(0U);
}

// ═════════════════════════════════════════════════════════════════════════════
// Interception
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Facade – intercept")

TEST_CASE("intercept returns the work's result and records once") {
    const auto rows = sniffer::intercept("SELECT count(*) FROM users", [] { return 17; });
    expect(rows).to_equal(17);
    expect(sniffer::executed_statements()).to_equal(1U);
}

TEST_CASE("intercept passes references through") {
    int cached = 5;
    auto& ref = sniffer::intercept("SELECT cached", [&cached]() -> int& { return cached; });
    ref = 9;
    expect(cached).to_equal(9);
}

TEST_CASE("intercept accepts void work") {
    bool ran = false;
    sniffer::intercept("UPDATE users SET active = 1", [&ran] { ran = true; });
    expect(ran).to_be_true();
    expect(sniffer::thread_executed_statements()).to_equal(1U);
}

TEST_CASE("intercept records after the work completes") {
    std::uint64_t during = 99;
    sniffer::intercept("SELECT 1", [&during] { during = sniffer::thread_executed_statements(); });
    expect(during).to_equal(0U);
    expect(sniffer::thread_executed_statements()).to_equal(1U);
}

TEST_CASE("intercept records a failing statement and rethrows it unchanged") {
    const auto err = catch_thrown(std::runtime_error, sniffer::intercept("INSERT INTO users", []() -> int {
        throw std::runtime_error("duplicate key");
    }));
    expect(std::string(err.what())).to_equal(std::string("duplicate key"));
    expect(sniffer::executed_statements()).to_equal(1U);
}

TEST_CASE("intercepted text reaches open spies") {
    auto spy = sniffer::spy();
    sniffer::intercept("SELECT * FROM invoices", [] {});
    const auto observed = spy.observed_statements();
    expect(observed.size()).to_equal(1U);
    expect(observed[0]).to_equal(std::string("SELECT * FROM invoices"));
}

TEST_CASE("per-order queries are caught as N+1") {
    OrderRepository repository(false);
    auto spy = sniffer::expect_at_most(2);
    const auto ids = repository.load_orders_with_items(5);
    expect(ids.size()).to_equal(5U);
    const auto err = catch_thrown(sniffer::VerificationError, spy.close());
    expect(err.actual_count()).to_equal(6);
    expect(std::string(err.what())).to_contain("SELECT * FROM items WHERE order_id = 4");
}

TEST_CASE("batched queries stay within the budget") {
    OrderRepository repository(true);
    auto spy = sniffer::expect_at_most(2);
    (void)repository.load_orders_with_items(50);
    expect_no_throw(spy.close());
}

// ═════════════════════════════════════════════════════════════════════════════
// Configuration
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Facade – configuration")

TEST_CASE("default configuration") {
    sniffer::configure({});
    const auto cfg = sniffer::current_config();
    expect(cfg.default_scope).to_equal(sniffer::ThreadScope::Current);
    expect(cfg.max_reported_statements).to_equal(0U);
    expect(cfg.log_failures).to_be_true();
    expect(cfg.log_statements).to_be_false();
    expect(cfg.log_level == sniffer::Logger::level::WARNING).to_be_true();
}

TEST_CASE("configure round-trips every field") {
    sniffer::configure({
        .default_scope = sniffer::ThreadScope::Others,
        .max_reported_statements = 25,
        .log_failures = false,
        .log_statements = true,
        .log_level = sniffer::Logger::level::ERROR,
    });
    const auto cfg = sniffer::current_config();
    expect(cfg.default_scope).to_equal(sniffer::ThreadScope::Others);
    expect(cfg.max_reported_statements).to_equal(25U);
    expect(cfg.log_failures).to_be_false();
    expect(cfg.log_statements).to_be_true();
    expect(cfg.log_level == sniffer::Logger::level::ERROR).to_be_true();
    expect(sniffer::Logger::get_instance().enabled(sniffer::Logger::level::WARNING)).to_be_false();
}

TEST_CASE("configured default scope applies to new expectations") {
    sniffer::configure({.default_scope = sniffer::ThreadScope::Others, .log_failures = false});
    auto spy = sniffer::expect_never();
    run_statements(3);
    expect_no_throw(spy.close());
}

// ═════════════════════════════════════════════════════════════════════════════
// Test adapters
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Test adapters")

TEST_CASE("expect_statements passes when expectations hold") {
    auto spy = sniffer::expect_exactly(1);
    run_statements(1);
    expect_no_throw(expect_statements(spy));
}

TEST_CASE("expect_statements reports a mismatch as an assertion failure") {
    auto spy = sniffer::expect_never();
    run_statements(1);
    const auto line = __LINE__ + 1;
    const auto err = catch_thrown(testing::assertion_error, expect_statements(spy));
    expect(err.line).to_equal(line);
    expect(err.message).to_contain("statement count mismatch");
    expect(err.message).to_contain("SELECT 0");
    expect(spy.is_closed()).to_be_false();
}

TEST_CASE("close_statements closes and reports a mismatch") {
    auto spy = sniffer::expect_at_least(2);
    run_statements(1);
    const auto err = catch_thrown(testing::assertion_error, close_statements(spy));
    expect(err.message).to_contain("Expected at least 2 statement(s)");
    expect(spy.is_closed()).to_be_true();
}

TEST_CASE("with_statements runs the body under a fresh spy") {
    run_statements(3);
    expect_no_throw(with_statements(1, 1, sniffer::ThreadScope::Current, run_statements(1)));
}

TEST_CASE("with_statements reports a body outside the range") {
    const auto err = catch_thrown(testing::assertion_error, with_statements(0, 0, sniffer::ThreadScope::Any, run_on_other_thread(2)));
    expect(err.message).to_contain("from any thread, but 2 were executed");
}
