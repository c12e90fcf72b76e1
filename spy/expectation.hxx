#pragma once

/**
 * @file expectation.hxx
 * @brief Statement-count range expectations and scope delta resolution
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../execution_counters/execution_counters.hxx"
#include "errors.hxx"
#include "thread_scope.hxx"

namespace sniffer {

namespace detail {

/**
 * Statements executed in @p scope between @p baseline and @p now.
 *
 *   Any     : global - initial_global
 *   Current : context - initial_context
 *   Others  : global - context - initial_global + initial_context
 *
 * Adding initial_context back in Others keeps statements the evaluating
 * thread ran before the baseline from being counted as other threads' work.
 *
 * The global counter never goes backwards, and on the thread that took the
 * baseline the context delta can neither be negative nor exceed the global
 * delta. Anything else means the counters were reset under a live baseline
 * or a count was lost, and is reported as InvariantViolation.
 */
inline auto resolve_delta(ThreadScope scope, const CounterSnapshot& baseline, const CounterSnapshot& now, bool on_origin_thread) -> std::int64_t {
    const auto global_delta = static_cast<std::int64_t>(now.global) - static_cast<std::int64_t>(baseline.global);
    const auto context_delta = static_cast<std::int64_t>(now.context) - static_cast<std::int64_t>(baseline.context);

    if (global_delta < 0) {
        throw InvariantViolation("global statement counter went backwards: baseline " + std::to_string(baseline.global) + ", now " +
                                 std::to_string(now.global));
    }
    if (on_origin_thread && (context_delta < 0 || context_delta > global_delta)) {
        throw InvariantViolation("thread statement delta " + std::to_string(context_delta) + " is outside [0, " + std::to_string(global_delta) +
                                 "] on the baseline thread");
    }

    switch (scope) {
        case ThreadScope::Any:
            return global_delta;
        case ThreadScope::Current:
            return context_delta;
        case ThreadScope::Others:
            return global_delta - context_delta;
    }
    throw std::invalid_argument("unknown ThreadScope value " + std::to_string(static_cast<int>(scope)));
}

}  // namespace detail

/**
 * Immutable [min_count, max_count] range of statements expected in a scope.
 */
class Expectation {
   public:
    static constexpr std::int64_t UNBOUNDED = VerificationError::UNBOUNDED;

    /** @throws std::invalid_argument if min_count < 0 or max_count < min_count. */
    Expectation(std::int64_t min_count, std::int64_t max_count, ThreadScope scope) : min_count_(min_count), max_count_(max_count), scope_(scope) {
        if (min_count < 0) {
            throw std::invalid_argument("expected statement count must be >= 0, got " + std::to_string(min_count));
        }
        if (max_count < min_count) {
            throw std::invalid_argument("maximum statement count " + std::to_string(max_count) + " is below minimum " + std::to_string(min_count));
        }
    }

    [[nodiscard]] auto min_count() const noexcept -> std::int64_t { return min_count_; }
    [[nodiscard]] auto max_count() const noexcept -> std::int64_t { return max_count_; }
    [[nodiscard]] auto scope() const noexcept -> ThreadScope { return scope_; }

    [[nodiscard]] auto accepts(std::int64_t actual) const noexcept -> bool { return actual >= min_count_ && actual <= max_count_; }

    /**
     * Returns the failure for @p actual, or nothing when it is in range.
     * @p statements is copied into the failure as the diagnostic log.
     */
    [[nodiscard]] auto check(std::int64_t actual, const std::vector<std::string>& statements, std::size_t max_listed = 0) const
        -> std::optional<VerificationError> {
        if (accepts(actual)) {
            return std::nullopt;
        }
        return VerificationError(scope_, min_count_, max_count_, actual, statements, max_listed);
    }

   private:
    std::int64_t min_count_;
    std::int64_t max_count_;
    ThreadScope scope_;
};

}  // namespace sniffer
