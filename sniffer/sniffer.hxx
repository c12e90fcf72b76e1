#pragma once

/**
 * @file sniffer.hxx
 * @brief One-include entry point: spy factories, counters and statement interception
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "../config/config.hxx"
#include "../execution_counters/execution_counters.hxx"
#include "../scope_guard/scope_guard.hxx"
#include "../spy/spy.hxx"

namespace sniffer {

// ─────────────────────────────────────────────────────────────────────────────
// Spy factories
// ─────────────────────────────────────────────────────────────────────────────

/** A new Spy baselined on the current counters. */
[[nodiscard]] inline auto spy() -> Spy { return Spy::create(); }

[[nodiscard]] inline auto spy_with_baseline(std::uint64_t initial_global, std::uint64_t initial_context) -> Spy {
    return Spy::with_baseline(initial_global, initial_context);
}

// Each returns a fresh Spy already carrying the expectation, typically closed
// at the end of the test:  auto s = sniffer::expect_at_most_once(); ... s.close();

[[nodiscard]] inline auto expect_never() -> Spy { return std::move(spy().expect_never()); }
[[nodiscard]] inline auto expect_never(ThreadScope scope) -> Spy { return std::move(spy().expect_never(scope)); }

[[nodiscard]] inline auto expect_at_most_once() -> Spy { return std::move(spy().expect_at_most_once()); }
[[nodiscard]] inline auto expect_at_most_once(ThreadScope scope) -> Spy { return std::move(spy().expect_at_most_once(scope)); }

[[nodiscard]] inline auto expect_at_most(std::int64_t allowed) -> Spy { return std::move(spy().expect_at_most(allowed)); }
[[nodiscard]] inline auto expect_at_most(std::int64_t allowed, ThreadScope scope) -> Spy { return std::move(spy().expect_at_most(allowed, scope)); }

[[nodiscard]] inline auto expect_exactly(std::int64_t count) -> Spy { return std::move(spy().expect_exactly(count)); }
[[nodiscard]] inline auto expect_exactly(std::int64_t count, ThreadScope scope) -> Spy { return std::move(spy().expect_exactly(count, scope)); }

[[nodiscard]] inline auto expect_at_least(std::int64_t required) -> Spy { return std::move(spy().expect_at_least(required)); }
[[nodiscard]] inline auto expect_at_least(std::int64_t required, ThreadScope scope) -> Spy {
    return std::move(spy().expect_at_least(required, scope));
}

[[nodiscard]] inline auto expect_between(std::int64_t min_count, std::int64_t max_count) -> Spy {
    return std::move(spy().expect_between(min_count, max_count));
}
[[nodiscard]] inline auto expect_between(std::int64_t min_count, std::int64_t max_count, ThreadScope scope) -> Spy {
    return std::move(spy().expect_between(min_count, max_count, scope));
}

// ─────────────────────────────────────────────────────────────────────────────
// Counters
// ─────────────────────────────────────────────────────────────────────────────

/** Statements executed by all threads since start-up or the last reset_counters(). */
[[nodiscard]] inline auto executed_statements() noexcept -> std::uint64_t { return ExecutionCounters::instance().snapshot_global(); }

/** Statements executed by the calling thread. */
[[nodiscard]] inline auto thread_executed_statements() noexcept -> std::uint64_t { return ExecutionCounters::instance().snapshot_context(); }

/**
 * Zeroes the global counter and the calling thread's counter.
 * Only for test setup while no other thread executes statements, and with no
 * open Spy: their baselines would be ahead of the counters.
 */
inline void reset_counters() noexcept { ExecutionCounters::instance().reset(); }

// ─────────────────────────────────────────────────────────────────────────────
// Interception
// ─────────────────────────────────────────────────────────────────────────────

/** Reports one executed statement. Call from the thread that executed it. */
inline void record_statement(std::string_view statement) noexcept { ExecutionCounters::instance().record(statement); }

/**
 * Executes @p work as the statement @p statement: the statement is recorded
 * once when @p work returns or throws, and whatever @p work returns or throws
 * is passed through untouched.
 *
 *   auto rows = sniffer::intercept(sql, [&] { return driver.query(sql); });
 */
template <typename F>
auto intercept(std::string statement, F&& work) -> decltype(auto) {
    auto recorder = on_scope_exit([statement = std::move(statement)]() noexcept { record_statement(statement); });
    return std::forward<F>(work)();
}

}  // namespace sniffer
