/**
 * @file test.cpp
 * @brief Test suite for Spy: counting per scope, expectations, aggregation, close and the functional wrappers
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "../testing/test_main.hpp"
#include "spy.hxx"

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

namespace {

using sniffer::Spy;
using sniffer::ThreadScope;

void run_statements(int count, const std::string& prefix = "SELECT") {
    for (int i = 0; i < count; ++i) {
        sniffer::ExecutionCounters::instance().record(prefix + " " + std::to_string(i));
    }
}

void run_on_other_thread(int count) {
    std::thread worker([count] { run_statements(count, "SELECT FROM worker"); });
    worker.join();
}

// A caller-defined exception type able to carry verification failures.
class DaoError : public std::runtime_error, public sniffer::SuppressedFailures {
   public:
    using std::runtime_error::runtime_error;
};

auto registry_size() -> std::size_t { return sniffer::ObserverRegistry::instance().size(); }

}  // namespace

BEFORE_EACH() {
    sniffer::ExecutionCounters::instance().reset();
    sniffer::configure({.log_failures = false});
}

// ═════════════════════════════════════════════════════════════════════════════
// Counting
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Spy – counting")

TEST_CASE("fresh spy counts nothing") {
    run_statements(3);
    Spy spy;
    expect(spy.executed_statements(ThreadScope::Any)).to_equal(0);
    expect(spy.executed_statements(ThreadScope::Current)).to_equal(0);
    expect(spy.executed_statements(ThreadScope::Others)).to_equal(0);
}

TEST_CASE("statements on the spy's thread count for current and any") {
    Spy spy;
    run_statements(5);
    expect(spy.executed_statements(ThreadScope::Current)).to_equal(5);
    expect(spy.executed_statements(ThreadScope::Any)).to_equal(5);
    expect(spy.executed_statements(ThreadScope::Others)).to_equal(0);
}

TEST_CASE("statements split between the spy's thread and another thread") {
    Spy spy;
    run_statements(3);
    run_on_other_thread(4);
    expect(spy.executed_statements(ThreadScope::Any)).to_equal(7);
    expect(spy.executed_statements(ThreadScope::Current)).to_equal(3);
    expect(spy.executed_statements(ThreadScope::Others)).to_equal(4);
}

TEST_CASE("statements run before the baseline are not counted as other threads' work") {
    run_statements(5);
    Spy spy;
    run_on_other_thread(2);
    run_statements(1);
    expect(spy.executed_statements(ThreadScope::Others)).to_equal(2);
    expect(spy.executed_statements(ThreadScope::Current)).to_equal(1);
    expect(spy.executed_statements(ThreadScope::Any)).to_equal(3);
}

TEST_CASE("no-scope count uses the current thread by default") {
    Spy spy;
    run_statements(1);
    run_on_other_thread(2);
    expect(spy.executed_statements()).to_equal(1);
}

TEST_CASE("default scope follows the configuration") {
    sniffer::configure({.default_scope = ThreadScope::Any, .log_failures = false});
    Spy spy;
    run_statements(1);
    run_on_other_thread(2);
    expect(spy.executed_statements()).to_equal(3);
    expect_no_throw(spy.verify_exactly(3));
}

TEST_CASE("counts are evaluated for the calling thread") {
    Spy spy;
    std::int64_t current_seen = -1;
    std::int64_t others_seen = -1;
    std::thread worker([&] {
        run_statements(3, "SELECT FROM worker");
        current_seen = spy.executed_statements(ThreadScope::Current);
        others_seen = spy.executed_statements(ThreadScope::Others);
    });
    worker.join();
    expect(current_seen).to_equal(3);
    expect(others_seen).to_equal(0);
    expect(spy.executed_statements(ThreadScope::Others)).to_equal(3);
}

TEST_CASE("current scope read on another thread is relative to that thread's counter") {
    run_statements(5);
    Spy spy;
    std::int64_t current_seen = 0;
    std::thread worker([&] { current_seen = spy.executed_statements(ThreadScope::Current); });
    worker.join();
    expect(current_seen).to_equal(-5);
}

TEST_CASE("log keeps statement text in execution order") {
    Spy spy;
    sniffer::ExecutionCounters::instance().record("SELECT * FROM orders");
    sniffer::ExecutionCounters::instance().record("SELECT * FROM items WHERE order_id = 7");
    const auto observed = spy.observed_statements();
    expect(observed.size()).to_equal(2U);
    expect(observed[0]).to_equal(std::string("SELECT * FROM orders"));
    expect(observed[1]).to_equal(std::string("SELECT * FROM items WHERE order_id = 7"));
}

TEST_CASE("log includes statements from other threads") {
    Spy spy;
    run_on_other_thread(2);
    expect(spy.observed_statements().size()).to_equal(2U);
}

TEST_CASE("explicit baseline counts from the supplied values") {
    run_statements(3);
    auto spy = Spy::with_baseline(0, 0);
    expect(spy.executed_statements(ThreadScope::Current)).to_equal(3);
    expect(spy.executed_statements(ThreadScope::Any)).to_equal(3);
    expect(spy.baseline().global).to_equal(0U);
    expect(spy.observed_statements().empty()).to_be_true();
}

TEST_CASE("baseline is a snapshot of both counters") {
    run_statements(2);
    run_on_other_thread(3);
    const auto spy = Spy::create();
    expect(spy.baseline().global).to_equal(5U);
    expect(spy.baseline().context).to_equal(2U);
}

TEST_CASE("concurrent statements from many threads are all counted") {
    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 500;
    Spy spy;
    std::vector<std::thread> workers;
    workers.reserve(THREADS);
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([] { run_statements(PER_THREAD, "UPDATE stock"); });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    expect(spy.executed_statements(ThreadScope::Any)).to_equal(THREADS * PER_THREAD);
    expect(spy.executed_statements(ThreadScope::Others)).to_equal(THREADS * PER_THREAD);
    expect(spy.executed_statements(ThreadScope::Current)).to_equal(0);
    expect(spy.observed_statements().size()).to_equal(static_cast<std::size_t>(THREADS * PER_THREAD));
}

TEST_CASE("spies on different threads verify their own thread independently") {
    constexpr int THREADS = 6;
    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    workers.reserve(THREADS);
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&failures, t] {
            try {
                Spy spy;
                run_statements(100 + t, "SELECT FROM tenant");
                spy.verify_exactly(100 + t, ThreadScope::Current);
                spy.verify_at_least(100 + t, ThreadScope::Any);
                spy.close();
            } catch (const std::exception&) {
                ++failures;
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    expect(failures.load()).to_equal(0);
}

// ═════════════════════════════════════════════════════════════════════════════
// Reset
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Spy – reset")

TEST_CASE("reset zeroes the deltas and clears the log") {
    Spy spy;
    run_statements(3);
    run_on_other_thread(2);
    spy.reset();
    expect(spy.executed_statements(ThreadScope::Any)).to_equal(0);
    expect(spy.executed_statements(ThreadScope::Current)).to_equal(0);
    expect(spy.observed_statements().empty()).to_be_true();
    run_statements(1);
    expect(spy.executed_statements(ThreadScope::Current)).to_equal(1);
}

TEST_CASE("reset does not affect another spy") {
    Spy first;
    Spy second;
    run_statements(2);
    first.reset();
    run_statements(1);
    expect(first.executed_statements(ThreadScope::Any)).to_equal(1);
    expect(second.executed_statements(ThreadScope::Any)).to_equal(3);
    expect(second.observed_statements().size()).to_equal(3U);
}

TEST_CASE("reset keeps expectations") {
    Spy spy;
    spy.expect_exactly(1);
    run_statements(3);
    spy.reset();
    run_statements(1);
    expect(spy.expectation_count()).to_equal(1U);
    expect_no_throw(spy.verify());
}

TEST_CASE("reset returns the same spy") {
    Spy spy;
    auto& same = spy.reset();
    expect(&same == &spy).to_be_true();
}

// ═════════════════════════════════════════════════════════════════════════════
// Expectations
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Spy – expectations")

TEST_CASE("expect_never passes with no statements") {
    Spy spy;
    spy.expect_never();
    expect_no_throw(spy.verify());
}

TEST_CASE("expect_never fails with one statement") {
    Spy spy;
    spy.expect_never();
    run_statements(1);
    const auto err = catch_thrown(sniffer::VerificationError, spy.verify());
    expect(err.actual_count()).to_equal(1);
    expect(err.min_count()).to_equal(0);
    expect(err.max_count()).to_equal(0);
    expect(err.scope()).to_equal(ThreadScope::Current);
    expect(err.cause() == nullptr).to_be_true();
}

TEST_CASE("expect_between accepts counts inside the range") {
    Spy spy;
    spy.expect_between(1, 3);
    run_statements(2);
    expect_no_throw(spy.verify());
}

TEST_CASE("expect_between rejects counts above the range") {
    Spy spy;
    spy.expect_between(1, 3);
    run_statements(4);
    const auto err = catch_thrown(sniffer::VerificationError, spy.verify());
    expect(err.actual_count()).to_equal(4);
    expect(err.min_count()).to_equal(1);
    expect(err.max_count()).to_equal(3);
}

TEST_CASE("expect_between rejects counts below the range") {
    Spy spy;
    spy.expect_between(2, 3);
    run_statements(1);
    expect_throws(sniffer::VerificationError, spy.verify());
}

TEST_CASE("shape shortcuts map to their ranges") {
    Spy spy;
    run_statements(10);
    spy.expect_at_most_once().expect_at_most(4).expect_exactly(7).expect_at_least(20);
    const auto err = catch_thrown(sniffer::VerificationError, spy.verify());
    expect(err.chain_length()).to_equal(4U);

    const auto* at_most_once = &err;
    const auto* at_most = at_most_once->cause();
    const auto* exactly = at_most->cause();
    const auto* at_least = exactly->cause();

    expect(at_most_once->max_count()).to_equal(1);
    expect(at_most->min_count()).to_equal(0);
    expect(at_most->max_count()).to_equal(4);
    expect(exactly->min_count()).to_equal(7);
    expect(exactly->max_count()).to_equal(7);
    expect(at_least->min_count()).to_equal(20);
    expect(at_least->max_count()).to_equal(Spy::UNBOUNDED);
}

TEST_CASE("other-threads expectation ignores the spy's own thread") {
    Spy spy;
    spy.expect_never(ThreadScope::Others);
    run_statements(5);
    expect_no_throw(spy.verify());
    run_on_other_thread(1);
    const auto err = catch_thrown(sniffer::VerificationError, spy.verify());
    expect(err.scope()).to_equal(ThreadScope::Others);
    expect(err.actual_count()).to_equal(1);
}

TEST_CASE("current-thread expectation ignores other threads") {
    Spy spy;
    spy.expect_never(ThreadScope::Current);
    run_on_other_thread(3);
    expect_no_throw(spy.verify());
}

TEST_CASE("any-thread expectation counts every thread") {
    Spy spy;
    spy.expect_exactly(3, ThreadScope::Any);
    run_statements(1);
    run_on_other_thread(2);
    expect_no_throw(spy.verify());
}

TEST_CASE("invalid ranges are rejected when added") {
    Spy spy;
    expect_throws(std::invalid_argument, spy.expect_between(3, 1));
    expect_throws(std::invalid_argument, spy.expect_at_most(-1));
    expect_throws(std::invalid_argument, spy.expect_exactly(-2, ThreadScope::Any));
    expect_throws(std::invalid_argument, spy.verify_between(5, 4));
    expect(spy.expectation_count()).to_equal(0U);
}

TEST_CASE("expectations accumulate until verified") {
    Spy spy;
    spy.expect_never(ThreadScope::Others).expect_at_most_once().expect_at_least(0, ThreadScope::Any);
    expect(spy.expectation_count()).to_equal(3U);
}

TEST_CASE("verify_ checks immediately and returns the same spy") {
    Spy spy;
    run_statements(2);
    auto& same = spy.verify_exactly(2);
    expect(&same == &spy).to_be_true();
    expect(spy.expectation_count()).to_equal(0U);
    expect_throws(sniffer::VerificationError, spy.verify_never());
    expect_throws(sniffer::VerificationError, spy.verify_at_most_once());
    expect_no_throw(spy.verify_at_most(2).verify_at_least(1).verify_between(2, 5));
}

TEST_CASE("verify_ with scope checks that scope") {
    Spy spy;
    run_on_other_thread(2);
    expect_no_throw(spy.verify_never(ThreadScope::Current));
    const auto err = catch_thrown(sniffer::VerificationError, spy.verify_at_most_once(ThreadScope::Others));
    expect(err.actual_count()).to_equal(2);
    expect(err.scope()).to_equal(ThreadScope::Others);
}

TEST_CASE("verify passes with no expectations") {
    Spy spy;
    run_statements(100);
    expect_no_throw(spy.verify());
    expect(spy.verification_error().has_value()).to_be_false();
}

TEST_CASE("verify can be repeated") {
    Spy spy;
    spy.expect_at_most_once();
    run_statements(1);
    expect_no_throw(spy.verify());
    run_statements(1);
    expect_throws(sniffer::VerificationError, spy.verify());
}

// ═════════════════════════════════════════════════════════════════════════════
// Failure reports
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Spy – failure reports")

TEST_CASE("every violated expectation is reported in insertion order") {
    Spy spy;
    spy.expect_never().expect_exactly(1).expect_at_least(5).expect_between(2, 3);
    run_statements(1);
    const auto err = catch_thrown(sniffer::VerificationError, spy.verify());
    expect(err.chain_length()).to_equal(3U);
    expect(err.max_count()).to_equal(0);
    expect(err.cause()->min_count()).to_equal(5);
    expect(err.cause()->cause()->min_count()).to_equal(2);
    expect(err.cause()->cause()->max_count()).to_equal(3);
    expect(err.cause()->cause()->cause() == nullptr).to_be_true();
}

TEST_CASE("message names bounds, scope, count and statements") {
    Spy spy;
    sniffer::ExecutionCounters::instance().record("SELECT * FROM orders");
    sniffer::ExecutionCounters::instance().record("SELECT * FROM items WHERE order_id = 1");
    const auto err = catch_thrown(sniffer::VerificationError, spy.verify_at_most_once());
    const std::string message = err.what();
    expect(message).to_contain("Expected at most 1 statement(s) from current thread, but 2 were executed");
    expect(message).to_contain("SELECT * FROM orders");
    expect(message).to_contain("SELECT * FROM items WHERE order_id = 1");
}

TEST_CASE("message describes each range shape") {
    expect(sniffer::VerificationError::describe_bounds(2, 2)).to_equal(std::string("exactly 2"));
    expect(sniffer::VerificationError::describe_bounds(0, 3)).to_equal(std::string("at most 3"));
    expect(sniffer::VerificationError::describe_bounds(4, Spy::UNBOUNDED)).to_equal(std::string("at least 4"));
    expect(sniffer::VerificationError::describe_bounds(1, 3)).to_equal(std::string("between 1 and 3"));
}

TEST_CASE("message says when no statement was observed") {
    Spy spy;
    const auto err = catch_thrown(sniffer::VerificationError, spy.verify_at_least(1, ThreadScope::Any));
    const std::string message = err.what();
    expect(message).to_contain("from any thread, but 0 were executed");
    expect(message).to_contain("No statements were observed by this spy");
}

TEST_CASE("message includes the chained failures") {
    Spy spy;
    spy.expect_never().expect_at_least(5);
    run_statements(1);
    const auto err = catch_thrown(sniffer::VerificationError, spy.verify());
    expect(std::string(err.what())).to_contain("Caused by: Expected at least 5 statement(s)");
}

TEST_CASE("message lists at most the configured number of statements") {
    sniffer::configure({.max_reported_statements = 2, .log_failures = false});
    Spy spy;
    run_statements(4, "SELECT FROM line");
    const auto err = catch_thrown(sniffer::VerificationError, spy.verify_never());
    const std::string message = err.what();
    expect(message).to_contain("SELECT FROM line 1");
    expect(message).not_to_contain("SELECT FROM line 2");
    expect(message).to_contain("... and 2 more");
    expect(err.executed_statements().size()).to_equal(4U);
}

TEST_CASE("failure carries the log at the time of the failure") {
    Spy spy;
    run_statements(2);
    const auto err = catch_thrown(sniffer::VerificationError, spy.verify_never());
    run_statements(5);
    expect(err.executed_statements().size()).to_equal(2U);
    expect(err.executed_statements()[0]).to_equal(std::string("SELECT 0"));
}

TEST_CASE("verification_error reports without throwing") {
    Spy spy;
    spy.expect_exactly(2);
    run_statements(2);
    expect(spy.verification_error().has_value()).to_be_false();
    run_statements(1);
    const auto failure = spy.verification_error();
    expect(failure.has_value()).to_be_true();
    expect(failure->actual_count()).to_equal(3);
}

// ═════════════════════════════════════════════════════════════════════════════
// Invariants
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Spy – counting invariants")

TEST_CASE("resetting the counters under an open spy is reported") {
    run_statements(3);
    Spy spy;
    spy.expect_never();
    sniffer::ExecutionCounters::instance().reset();
    expect_throws(sniffer::InvariantViolation, (void)spy.executed_statements(ThreadScope::Any));
    expect_throws(sniffer::InvariantViolation, spy.verify());
}

TEST_CASE("baseline ahead of the global counter is reported") {
    auto spy = Spy::with_baseline(100, 0);
    const auto err = catch_thrown(sniffer::InvariantViolation, (void)spy.executed_statements(ThreadScope::Any));
    expect(std::string(err.what())).to_contain("went backwards");
}

TEST_CASE("thread baseline ahead of the thread counter is reported") {
    run_statements(3);
    auto spy = Spy::with_baseline(0, 10);
    expect_throws(sniffer::InvariantViolation, (void)spy.executed_statements(ThreadScope::Current));
}

TEST_CASE("invariant violation is not a verification failure") {
    run_statements(1);
    Spy spy;
    sniffer::ExecutionCounters::instance().reset_global();
    expect_throws(sniffer::InvariantViolation, spy.verify_never());
}

// ═════════════════════════════════════════════════════════════════════════════
// Close
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Spy – close")

TEST_CASE("close verifies the expectations") {
    Spy spy;
    spy.expect_exactly(1);
    run_statements(1);
    expect_no_throw(spy.close());
    expect(spy.is_closed()).to_be_true();
}

TEST_CASE("close closes the spy even when verification fails") {
    const auto before = registry_size();
    Spy spy;
    spy.expect_never();
    run_statements(1);
    expect_throws(sniffer::VerificationError, spy.close());
    expect(spy.is_closed()).to_be_true();
    expect(registry_size()).to_equal(before);
}

TEST_CASE("close unregisters the spy") {
    const auto before = registry_size();
    Spy spy;
    expect(registry_size()).to_equal(before + 1);
    spy.close();
    expect(registry_size()).to_equal(before);
}

TEST_CASE("every operation on a closed spy fails") {
    Spy spy;
    spy.close();
    const std::vector<std::function<void()>> operations = {
        [&] { spy.reset(); },
        [&] { (void)spy.executed_statements(); },
        [&] { (void)spy.executed_statements(ThreadScope::Any); },
        [&] { (void)spy.observed_statements(); },
        [&] { (void)spy.baseline(); },
        [&] { (void)spy.expectation_count(); },
        [&] { spy.expect_never(); },
        [&] { spy.expect_at_most_once(ThreadScope::Others); },
        [&] { spy.expect_at_most(2); },
        [&] { spy.expect_exactly(1); },
        [&] { spy.expect_at_least(1); },
        [&] { spy.expect_between(1, 2, ThreadScope::Any); },
        [&] { spy.verify_never(); },
        [&] { spy.verify_at_most_once(); },
        [&] { spy.verify_at_most(2); },
        [&] { spy.verify_exactly(0); },
        [&] { spy.verify_at_least(0); },
        [&] { spy.verify_between(0, 1); },
        [&] { spy.verify(); },
        [&] { (void)spy.verification_error(); },
        [&] { spy.close(); },
        [&] { spy.execute([] {}); },
        [&] { spy.run([] {}); },
        [&] { (void)spy.call([] { return 1; }); },
    };
    for (const auto& operation : operations) {
        expect_throws(sniffer::SpyClosedError, operation());
    }
}

TEST_CASE("closed error points at the close call") {
    Spy spy;
    const auto close_line = __LINE__ + 1;
    spy.close();
    const auto err = catch_thrown(sniffer::SpyClosedError, spy.verify());
    expect(err.closed_at().line()).to_equal(static_cast<std::uint_least32_t>(close_line));
    expect(std::string(err.what())).to_contain("Spy is closed");
    expect(std::string(err.what())).to_contain("test.cpp:" + std::to_string(close_line));
}

TEST_CASE("run on a closed spy does not start the work") {
    Spy spy;
    spy.close();
    bool ran = false;
    expect_throws(sniffer::SpyClosedError, spy.run([&] { ran = true; }));
    expect(ran).to_be_false();
}

TEST_CASE("statements after close no longer reach the spy") {
    Spy spy;
    Spy witness;
    spy.close();
    run_statements(2);
    expect(witness.observed_statements().size()).to_equal(2U);
    expect_throws(sniffer::SpyClosedError, (void)spy.observed_statements());
}

TEST_CASE("dropping a spy without closing unregisters it") {
    const auto before = registry_size();
    {
        Spy spy;
        spy.expect_never();
        run_statements(1);
    }
    expect(registry_size()).to_equal(before);
    Spy survivor;
    run_statements(1);
    expect(survivor.executed_statements()).to_equal(1);
}

TEST_CASE("creating and dropping many spies keeps the registry bounded") {
    const auto before = registry_size();
    for (int i = 0; i < 1000; ++i) {
        Spy spy;
        run_statements(1);
    }
    expect(registry_size()).to_equal(before);
}

// ═════════════════════════════════════════════════════════════════════════════
// Ownership
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Spy – ownership")

TEST_CASE("moved spy keeps its baseline and registration") {
    const auto before = registry_size();
    Spy original;
    run_statements(1);
    Spy moved = std::move(original);
    run_statements(1);
    expect(registry_size()).to_equal(before + 1);
    expect(moved.executed_statements()).to_equal(2);
    expect(moved.observed_statements().size()).to_equal(2U);
}

TEST_CASE("moved-from spy refuses to work") {
    Spy original;
    Spy moved = std::move(original);
    expect_throws(std::logic_error, (void)original.executed_statements());  // NOLINT(bugprone-use-after-move)
    expect(original.is_closed()).to_be_false();                             // NOLINT(bugprone-use-after-move)
    expect_no_throw(moved.verify());
}

TEST_CASE("move assignment releases the replaced spy") {
    const auto before = registry_size();
    Spy first;
    Spy second;
    expect(registry_size()).to_equal(before + 2);
    second = std::move(first);
    expect(registry_size()).to_equal(before + 1);
}

TEST_CASE("spy created by factory works like a constructed one") {
    auto spy = Spy::create();
    spy.expect_exactly(2, ThreadScope::Any);
    run_statements(2);
    expect_no_throw(spy.close());
}

// ═════════════════════════════════════════════════════════════════════════════
// Functional wrappers
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Spy – functional wrappers")

TEST_CASE("run verifies after the work") {
    Spy spy;
    spy.expect_never();
    expect_throws(sniffer::VerificationError, spy.run([] { run_statements(1); }));
}

TEST_CASE("run returns the same spy when expectations hold") {
    Spy spy;
    auto& same = spy.expect_exactly(2).run([] { run_statements(2); });
    expect(&same == &spy).to_be_true();
}

TEST_CASE("execute runs a type-erased executable") {
    Spy spy;
    int calls = 0;
    const Spy::Executable work = [&calls] {
        ++calls;
        run_statements(1);
    };
    spy.expect_at_most_once().execute(work);
    expect(calls).to_equal(1);
    expect_throws(sniffer::VerificationError, spy.execute(work));
    expect(calls).to_equal(2);
}

TEST_CASE("call returns the value together with a handle on the same spy") {
    Spy spy;
    auto result = spy.expect_exactly(2).call([] {
        run_statements(2);
        return 42;
    });
    expect(result.value()).to_equal(42);
    expect(result->executed_statements()).to_equal(2);
    result->expect_never(ThreadScope::Others);
    expect(spy.expectation_count()).to_equal(2U);
    result->close();
    expect(spy.is_closed()).to_be_true();
}

TEST_CASE("value called on a temporary spy stays usable") {
    auto result = Spy::create().expect_at_most_once().call([] {
        run_statements(1);
        return 7;
    });
    expect(result.value()).to_equal(7);
    expect(result->executed_statements()).to_equal(1);
    expect_no_throw(result.verify());
    run_statements(1, "UPDATE");
    expect(result->observed_statements().size()).to_equal(2U);
    expect_throws(sniffer::VerificationError, result.verify());
}

TEST_CASE("value outlives the spy that produced it") {
    auto make = [] {
        Spy spy;
        spy.expect_exactly(1);
        return spy.call([] {
            run_statements(1);
            return std::string("rows");
        });
    };
    auto result = make();
    run_statements(1, "DELETE");
    expect(result->executed_statements()).to_equal(2);
    expect(result->observed_statements().back()).to_equal(std::string("DELETE 0"));
    expect_throws(sniffer::VerificationError, result.verify());
}

TEST_CASE("moved value keeps its spy") {
    Spy spy;
    auto first = spy.call([] { return 1; });
    Spy* const handle = first.operator->();
    auto second = std::move(first);
    expect(second.operator->() == handle).to_be_true();
    run_statements(2);
    expect(second->executed_statements()).to_equal(2);
}

TEST_CASE("last handle on a spy unregisters it") {
    const auto before = registry_size();
    {
        auto result = Spy::create().call([] { return 0; });
        expect(registry_size()).to_equal(before + 1);
    }
    expect(registry_size()).to_equal(before);
}

TEST_CASE("value keeps the original baseline for later checks") {
    Spy spy;
    auto result = spy.call([] {
        run_statements(2);
        return std::string("rows");
    });
    run_statements(1);
    expect_no_throw(result->verify_exactly(3));
    const std::string rows = std::move(result).value();
    expect(rows).to_equal(std::string("rows"));
}

TEST_CASE("verify on the value checks the spy's expectations") {
    Spy spy;
    auto result = spy.call([] { return 3; });
    result->expect_at_most_once();
    expect_no_throw(result.verify());
    run_statements(2);
    expect_throws(sniffer::VerificationError, result.verify());
}

TEST_CASE("call accepts move-only results") {
    Spy spy;
    auto result = spy.call([] { return std::make_unique<int>(7); });
    expect(*result.value()).to_equal(7);
}

TEST_CASE("call verifies after the work") {
    Spy spy;
    spy.expect_never();
    expect_throws(sniffer::VerificationError, (void)spy.call([] {
        run_statements(1);
        return 0;
    }));
}

TEST_CASE("failing work keeps its exception and carries the verification failure") {
    Spy spy;
    spy.expect_never();
    const auto err = catch_thrown(DaoError, (void)spy.call([]() -> int {
        run_statements(1);
        throw DaoError("connection lost");
    }));
    expect(std::string(err.what())).to_equal(std::string("connection lost"));
    expect(err.suppressed().size()).to_equal(1U);
    const auto failure = catch_thrown(sniffer::VerificationError, std::rethrow_exception(err.suppressed().front()));
    expect(failure.actual_count()).to_equal(1);
    expect(failure.max_count()).to_equal(0);
}

TEST_CASE("failing work carries nothing when expectations hold") {
    Spy spy;
    spy.expect_at_most_once();
    const auto err = catch_thrown(DaoError, spy.run([] {
        run_statements(1);
        throw DaoError("constraint violation");
    }));
    expect(err.suppressed().empty()).to_be_true();
}

TEST_CASE("failing work with a plain exception is rethrown unchanged") {
    Spy spy;
    spy.expect_never();
    const auto err = catch_thrown(std::runtime_error, spy.run([] {
        run_statements(3);
        throw std::runtime_error("timeout");
    }));
    expect(std::string(err.what())).to_equal(std::string("timeout"));
    expect(spy.is_closed()).to_be_false();
}

TEST_CASE("inner verification failure receives the outer one") {
    Spy outer;
    outer.expect_never();
    const auto err = catch_thrown(sniffer::VerificationError, outer.run([] {
        Spy inner;
        run_statements(2);
        inner.verify_at_most_once();
    }));
    expect(err.actual_count()).to_equal(2);
    expect(err.max_count()).to_equal(1);
    expect(err.suppressed().size()).to_equal(1U);
}

TEST_CASE("failing work leaves the spy usable") {
    Spy spy;
    spy.expect_never();
    expect_throws(DaoError, spy.run([] {
        run_statements(1);
        throw DaoError("retry");
    }));
    spy.reset();
    expect_no_throw(spy.verify());
}
