/**
 * @file test.cpp
 * @brief Test suite for ExecutionCounters: global and per-thread statement counts
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "../testing/test_main.hpp"
#include "../spy/spy.hxx"
#include "execution_counters.hxx"

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

namespace {

auto counters() -> sniffer::ExecutionCounters& { return sniffer::ExecutionCounters::instance(); }

class CollectingObserver : public sniffer::StatementObserver {
   public:
    void statement_executed(std::string_view statement) override {
        std::lock_guard lock(mutex_);
        seen_.emplace_back(statement);
    }

    auto seen() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return seen_;
    }

   private:
    mutable std::mutex mutex_;
    std::vector<std::string> seen_;
};

class FailingObserver : public sniffer::StatementObserver {
   public:
    void statement_executed(std::string_view /*statement*/) override { throw std::runtime_error("observer storage full"); }
};

class FailingWithCodeObserver : public sniffer::StatementObserver {
   public:
    void statement_executed(std::string_view /*statement*/) override { throw 42; }
};

}  // namespace

BEFORE_EACH() {
    counters().reset();
    sniffer::configure({.log_level = sniffer::Logger::level::ERROR});
}

// ═════════════════════════════════════════════════════════════════════════════
// Counting
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("ExecutionCounters – counting")

TEST_CASE("counters start at zero after reset") {
    expect(counters().snapshot_global()).to_equal(0U);
    expect(counters().snapshot_context()).to_equal(0U);
}

TEST_CASE("record increments both counters by one") {
    counters().record("SELECT 1");
    expect(counters().snapshot_global()).to_equal(1U);
    expect(counters().snapshot_context()).to_equal(1U);
    counters().record("SELECT 2");
    expect(counters().snapshot_global()).to_equal(2U);
    expect(counters().snapshot_context()).to_equal(2U);
}

TEST_CASE("snapshot returns both counters") {
    counters().record("SELECT 1");
    counters().record("SELECT 2");
    const auto snap = counters().snapshot();
    expect(snap.global).to_equal(2U);
    expect(snap.context).to_equal(2U);
}

TEST_CASE("another thread's statements reach only the global counter") {
    counters().record("SELECT main");
    std::uint64_t worker_context = 0;
    std::thread worker([&worker_context] {
        counters().record("SELECT worker 1");
        counters().record("SELECT worker 2");
        worker_context = counters().snapshot_context();
    });
    worker.join();
    expect(counters().snapshot_global()).to_equal(3U);
    expect(counters().snapshot_context()).to_equal(1U);
    expect(worker_context).to_equal(2U);
}

TEST_CASE("a new thread starts with a zero context counter") {
    counters().record("SELECT main");
    std::uint64_t initial_context = 99;
    std::thread worker([&initial_context] { initial_context = counters().snapshot_context(); });
    worker.join();
    expect(initial_context).to_equal(0U);
}

TEST_CASE("concurrent records lose no increments") {
    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 10000;
    std::vector<std::thread> workers;
    std::vector<std::uint64_t> per_thread(THREADS, 0);
    workers.reserve(THREADS);
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&per_thread, t] {
            for (int i = 0; i < PER_THREAD; ++i) {
                counters().record("INSERT INTO events");
            }
            per_thread[static_cast<std::size_t>(t)] = counters().snapshot_context();
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    expect(counters().snapshot_global()).to_equal(static_cast<std::uint64_t>(THREADS) * PER_THREAD);
    expect(counters().snapshot_context()).to_equal(0U);
    for (const auto count : per_thread) {
        expect(count).to_equal(static_cast<std::uint64_t>(PER_THREAD));
    }
}

// ═════════════════════════════════════════════════════════════════════════════
// Reset
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("ExecutionCounters – reset")

TEST_CASE("reset_global leaves the context counter alone") {
    counters().record("SELECT 1");
    counters().reset_global();
    expect(counters().snapshot_global()).to_equal(0U);
    expect(counters().snapshot_context()).to_equal(1U);
}

TEST_CASE("reset_context leaves the global counter alone") {
    counters().record("SELECT 1");
    counters().reset_context();
    expect(counters().snapshot_global()).to_equal(1U);
    expect(counters().snapshot_context()).to_equal(0U);
}

TEST_CASE("reset_context only affects the calling thread") {
    std::uint64_t worker_context = 0;
    std::thread worker([&worker_context] {
        counters().record("SELECT worker");
        counters().record("SELECT worker");
        std::thread([] { counters().reset_context(); }).join();
        worker_context = counters().snapshot_context();
    });
    worker.join();
    expect(worker_context).to_equal(2U);
}

TEST_CASE("counting resumes after reset") {
    counters().record("SELECT 1");
    counters().reset();
    counters().record("SELECT 2");
    expect(counters().snapshot_global()).to_equal(1U);
    expect(counters().snapshot_context()).to_equal(1U);
}

// ═════════════════════════════════════════════════════════════════════════════
// Observers
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("ExecutionCounters – observers")

TEST_CASE("record broadcasts the statement text") {
    auto observer = std::make_shared<CollectingObserver>();
    auto& registry = sniffer::ObserverRegistry::instance();
    const auto handle = registry.register_observer(observer);
    counters().record("SELECT * FROM customers");
    registry.unregister_observer(handle);
    counters().record("SELECT * FROM suppliers");

    const auto seen = observer->seen();
    expect(seen.size()).to_equal(1U);
    expect(seen[0]).to_equal(std::string("SELECT * FROM customers"));
}

TEST_CASE("statements from other threads are broadcast too") {
    auto observer = std::make_shared<CollectingObserver>();
    auto& registry = sniffer::ObserverRegistry::instance();
    const auto handle = registry.register_observer(observer);
    std::thread worker([] { counters().record("DELETE FROM sessions"); });
    worker.join();
    registry.unregister_observer(handle);
    expect(observer->seen().size()).to_equal(1U);
}

TEST_CASE("a throwing observer does not make record fail") {
    auto observer = std::make_shared<FailingObserver>();
    auto& registry = sniffer::ObserverRegistry::instance();
    const auto handle = registry.register_observer(observer);
    sniffer::Spy spy;
    auto collector = std::make_shared<CollectingObserver>();
    const auto collector_handle = registry.register_observer(collector);
    expect_no_throw(counters().record("UPDATE accounts"));
    registry.unregister_observer(handle);
    registry.unregister_observer(collector_handle);
    expect(counters().snapshot_global()).to_equal(1U);
    expect(counters().snapshot_context()).to_equal(1U);
    expect(spy.observed_statements().size()).to_equal(1U);
    expect(spy.observed_statements().front()).to_equal(std::string("UPDATE accounts"));
    expect(collector->seen().size()).to_equal(1U);
}

TEST_CASE("an observer throwing a non-standard exception does not make record fail") {
    auto observer = std::make_shared<FailingWithCodeObserver>();
    auto& registry = sniffer::ObserverRegistry::instance();
    const auto handle = registry.register_observer(observer);
    sniffer::Spy spy;
    expect_no_throw(counters().record("DELETE FROM carts"));
    expect_no_throw(counters().record("DELETE FROM sessions"));
    registry.unregister_observer(handle);
    expect(counters().snapshot_global()).to_equal(2U);
    expect(spy.observed_statements().size()).to_equal(2U);
}

TEST_CASE("recording with statement logging enabled still counts") {
    sniffer::configure({.log_statements = true, .log_level = sniffer::Logger::level::ERROR});
    counters().record("SELECT now()");
    expect(counters().snapshot_global()).to_equal(1U);
}
