#pragma once

/**
 * @file spy.hxx
 * @brief Spy: a statement-count baseline with fluent expectations and verification
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include "../config/config.hxx"
#include "../execution_counters/execution_counters.hxx"
#include "../logger/logger.hxx"
#include "../observer_registry/observer_registry.hxx"
#include "../scope_guard/scope_guard.hxx"
#include "errors.hxx"
#include "expectation.hxx"
#include "spy_with_value.hxx"
#include "thread_scope.hxx"

namespace sniffer {

namespace detail {

// Everything a Spy owns. Shared with the registry only through a weak_ptr.
struct SpyState final : StatementObserver {
    void statement_executed(std::string_view statement) override {
        std::lock_guard lock(mutex);
        log.emplace_back(statement);
    }

    mutable std::mutex mutex;  // guards every field below except handle
    CounterSnapshot baseline;
    std::thread::id origin;
    std::vector<std::string> log;
    std::vector<Expectation> expectations;
    bool closed = false;
    std::source_location closed_at;

    ObserverHandle handle;  // written once, before registration completes
};

}  // namespace detail

/**
 * Spy: counts statements executed since a baseline and checks the counts
 * against expected ranges.
 *
 * A Spy snapshots the global and the calling thread's statement counters at
 * construction (or takes explicit baselines), registers with the
 * ObserverRegistry to collect the text of every statement executed while it
 * is open, and evaluates expectations against the counter deltas:
 *
 *   sniffer::Spy spy;
 *   dao.load_orders_with_items();
 *   spy.verify_at_most(2);                        // immediate
 *
 *   sniffer::Spy spy2;
 *   spy2.expect_never(sniffer::ThreadScope::Others).expect_exactly(1);
 *   service.refresh();
 *   spy2.close();                                 // verify() + unregister
 *
 * Overloads without a ThreadScope use Config::default_scope (initially
 * ThreadScope::Current). Every operation throws SpyClosedError once close()
 * has been called.
 *
 * Thread safety
 * ─────────────
 * A Spy is meant to be driven by one thread. Its log is appended to by any
 * thread that records a statement; a per-spy mutex serializes those appends
 * with the fluent API. Counts for ThreadScope::Current and ::Others are
 * evaluated for the thread making the call.
 *
 * Destroying a Spy that was never closed unregisters it without verifying,
 * unless a SpyWithValue returned by call() still shares its state.
 */
class Spy {
   public:
    using Executable = std::function<void()>;

    static constexpr std::int64_t UNBOUNDED = Expectation::UNBOUNDED;

    /** Baseline = current counters. */
    Spy() : Spy(ExecutionCounters::instance().snapshot()) {}

    /** Baseline supplied by the caller, e.g. taken earlier from ExecutionCounters. */
    Spy(std::uint64_t initial_global, std::uint64_t initial_context) : Spy(CounterSnapshot{.global = initial_global, .context = initial_context}) {}

    [[nodiscard]] static auto create() -> Spy { return {}; }

    [[nodiscard]] static auto with_baseline(std::uint64_t initial_global, std::uint64_t initial_context) -> Spy {
        return {initial_global, initial_context};
    }

    ~Spy() { release(); }

    Spy(const Spy&) = delete;
    auto operator=(const Spy&) -> Spy& = delete;
    Spy(Spy&& other) noexcept = default;
    auto operator=(Spy&& other) noexcept -> Spy& {
        if (this != &other) {
            release();
            state_ = std::move(other.state_);
        }
        return *this;
    }

    // ── Baseline ──────────────────────────────────────────────────────────

    /**
     * Takes a new baseline from the current counters and clears the log.
     * The calling thread becomes the baseline thread.
     */
    auto reset() -> Spy& {
        auto lock = lock_open();
        state_->baseline = ExecutionCounters::instance().snapshot();
        state_->origin = std::this_thread::get_id();
        state_->log.clear();
        return *this;
    }

    [[nodiscard]] auto baseline() const -> CounterSnapshot {
        auto lock = lock_open();
        return state_->baseline;
    }

    // ── Counts ────────────────────────────────────────────────────────────

    [[nodiscard]] auto executed_statements() const -> std::int64_t { return executed_statements(default_scope()); }

    /** Statements executed in @p scope since the baseline, as seen from the calling thread. */
    [[nodiscard]] auto executed_statements(ThreadScope scope) const -> std::int64_t {
        auto lock = lock_open();
        return delta_locked(scope, ExecutionCounters::instance().snapshot());
    }

    /** Text of every statement recorded since the baseline, in execution order. */
    [[nodiscard]] auto observed_statements() const -> std::vector<std::string> {
        auto lock = lock_open();
        return state_->log;
    }

    [[nodiscard]] auto expectation_count() const -> std::size_t {
        auto lock = lock_open();
        return state_->expectations.size();
    }

    [[nodiscard]] auto is_closed() const -> bool {
        if (!state_) {
            return false;
        }
        std::lock_guard lock(state_->mutex);
        return state_->closed;
    }

    // ── never: (0, 0) ─────────────────────────────────────────────────────

    auto expect_never() -> Spy& { return expect_never(default_scope()); }
    auto expect_never(ThreadScope scope) -> Spy& { return expect_between(0, 0, scope); }
    auto verify_never() -> Spy& { return verify_never(default_scope()); }
    auto verify_never(ThreadScope scope) -> Spy& { return verify_between(0, 0, scope); }

    // ── at most once: (0, 1) ──────────────────────────────────────────────

    auto expect_at_most_once() -> Spy& { return expect_at_most_once(default_scope()); }
    auto expect_at_most_once(ThreadScope scope) -> Spy& { return expect_between(0, 1, scope); }
    auto verify_at_most_once() -> Spy& { return verify_at_most_once(default_scope()); }
    auto verify_at_most_once(ThreadScope scope) -> Spy& { return verify_between(0, 1, scope); }

    // ── at most: (0, n) ───────────────────────────────────────────────────

    auto expect_at_most(std::int64_t allowed) -> Spy& { return expect_at_most(allowed, default_scope()); }
    auto expect_at_most(std::int64_t allowed, ThreadScope scope) -> Spy& { return expect_between(0, allowed, scope); }
    auto verify_at_most(std::int64_t allowed) -> Spy& { return verify_at_most(allowed, default_scope()); }
    auto verify_at_most(std::int64_t allowed, ThreadScope scope) -> Spy& { return verify_between(0, allowed, scope); }

    // ── exactly: (n, n) ───────────────────────────────────────────────────

    auto expect_exactly(std::int64_t count) -> Spy& { return expect_exactly(count, default_scope()); }
    auto expect_exactly(std::int64_t count, ThreadScope scope) -> Spy& { return expect_between(count, count, scope); }
    auto verify_exactly(std::int64_t count) -> Spy& { return verify_exactly(count, default_scope()); }
    auto verify_exactly(std::int64_t count, ThreadScope scope) -> Spy& { return verify_between(count, count, scope); }

    // ── at least: (n, unbounded) ──────────────────────────────────────────

    auto expect_at_least(std::int64_t required) -> Spy& { return expect_at_least(required, default_scope()); }
    auto expect_at_least(std::int64_t required, ThreadScope scope) -> Spy& { return expect_between(required, UNBOUNDED, scope); }
    auto verify_at_least(std::int64_t required) -> Spy& { return verify_at_least(required, default_scope()); }
    auto verify_at_least(std::int64_t required, ThreadScope scope) -> Spy& { return verify_between(required, UNBOUNDED, scope); }

    // ── between: (min, max) ───────────────────────────────────────────────

    auto expect_between(std::int64_t min_count, std::int64_t max_count) -> Spy& { return expect_between(min_count, max_count, default_scope()); }

    /**
     * Adds an expectation, checked by verify() or close(), that between
     * @p min_count and @p max_count statements are executed in @p scope
     * between the baseline and the check.
     * @throws std::invalid_argument for a negative or inverted range.
     */
    auto expect_between(std::int64_t min_count, std::int64_t max_count, ThreadScope scope) -> Spy& {
        auto lock = lock_open();
        state_->expectations.emplace_back(min_count, max_count, scope);
        return *this;
    }

    auto verify_between(std::int64_t min_count, std::int64_t max_count) -> Spy& { return verify_between(min_count, max_count, default_scope()); }

    /**
     * Checks right away that between @p min_count and @p max_count statements
     * were executed in @p scope since the baseline.
     * @throws VerificationError if the count is out of range.
     */
    auto verify_between(std::int64_t min_count, std::int64_t max_count, ThreadScope scope) -> Spy& {
        std::optional<VerificationError> failure;
        {
            auto lock = lock_open();
            const Expectation expectation(min_count, max_count, scope);
            failure = expectation.check(delta_locked(scope, ExecutionCounters::instance().snapshot()), state_->log, max_listed());
        }
        if (failure) {
            raise(std::move(*failure));
        }
        return *this;
    }

    // ── Verification ──────────────────────────────────────────────────────

    /**
     * Checks every expectation added with expect_*.
     * @throws VerificationError for the first violated expectation, with the
     *         remaining violations chained behind it through cause().
     */
    void verify() {
        if (auto failure = verification_error()) {
            raise(std::move(*failure));
        }
    }

    /** Non-throwing verify(): the chained failure, or nothing if all expectations hold. */
    [[nodiscard]] auto verification_error() const -> std::optional<VerificationError> {
        auto lock = lock_open();
        return collect_failures_locked();
    }

    /**
     * Verifies, then unregisters and marks the spy closed even if verification
     * throws. The call site is kept for the SpyClosedError of later calls.
     * @throws SpyClosedError if already closed.
     */
    void close(std::source_location where = std::source_location::current()) {
        check_open();
        auto cleanup = on_scope_exit([this, where]() noexcept { deactivate(where); });
        verify();
    }

    // ── Functional wrappers ───────────────────────────────────────────────

    /** Runs @p executable, then verify(). See run(). */
    auto execute(const Executable& executable) -> Spy& { return run(executable); }

    /**
     * Runs @p work, then verify().
     *
     * If @p work throws, the expectations are still checked. A failure is
     * attached to the thrown exception with add_suppressed() when it derives
     * from SuppressedFailures, and logged otherwise; the original exception is
     * rethrown either way.
     */
    template <typename F>
    auto run(F&& work) -> Spy& {
        check_open();
        invoke_verified(std::forward<F>(work));
        verify();
        return *this;
    }

    /**
     * Like run(), and returns the work's result together with a handle on this
     * spy's state. Safe on a temporary: `sniffer::expect_never().call(work)`.
     */
    template <typename F>
    auto call(F&& work) -> SpyWithValue<std::remove_cvref_t<std::invoke_result_t<F>>> {
        using V = std::remove_cvref_t<std::invoke_result_t<F>>;
        static_assert(!std::is_void_v<V>, "call() needs a callable returning a value, use run() for void work");
        check_open();
        V value = invoke_verified(std::forward<F>(work));
        verify();
        return SpyWithValue<V>(std::move(value), std::unique_ptr<Spy>(new Spy(state_)));
    }

   private:
    explicit Spy(CounterSnapshot baseline) : state_(std::make_shared<detail::SpyState>()) {
        state_->baseline = baseline;
        state_->origin = std::this_thread::get_id();
        state_->handle = registry().register_observer(state_);
    }

    // Second handle on existing state, for SpyWithValue.
    explicit Spy(std::shared_ptr<detail::SpyState> state) noexcept : state_(std::move(state)) {}

    static auto registry() -> ObserverRegistry& { return ObserverRegistry::instance(); }
    static auto default_scope() noexcept -> ThreadScope { return Settings::instance().default_scope(); }
    static auto max_listed() noexcept -> std::size_t { return Settings::instance().max_reported_statements(); }

    auto lock_open() const -> std::unique_lock<std::mutex> {
        if (!state_) {
            throw std::logic_error("Spy used after being moved from");
        }
        std::unique_lock lock(state_->mutex);
        if (state_->closed) {
            throw SpyClosedError(state_->closed_at);
        }
        return lock;
    }

    void check_open() const { [[maybe_unused]] auto lock = lock_open(); }

    // state_->mutex must be held.
    auto delta_locked(ThreadScope scope, const CounterSnapshot& now) const -> std::int64_t {
        return detail::resolve_delta(scope, state_->baseline, now, std::this_thread::get_id() == state_->origin);
    }

    // state_->mutex must be held. Counters are read once for the whole pass.
    auto collect_failures_locked() const -> std::optional<VerificationError> {
        const CounterSnapshot now = ExecutionCounters::instance().snapshot();
        std::vector<VerificationError> failures;
        for (const auto& expectation : state_->expectations) {
            if (auto failure = expectation.check(delta_locked(expectation.scope(), now), state_->log, max_listed())) {
                failures.push_back(std::move(*failure));
            }
        }
        if (failures.empty()) {
            return std::nullopt;
        }
        for (std::size_t i = failures.size() - 1; i > 0; --i) {
            failures[i - 1].chain(std::move(failures[i]));
        }
        return std::move(failures.front());
    }

    [[noreturn]] static void raise(VerificationError failure) {
        if (Settings::instance().log_failures()) {
            SNIFFER_LOG_WARN << failure.what();
        }
        throw std::move(failure);
    }

    struct PendingFailure {
        std::exception_ptr error;
        std::string message;
    };

    // Verification outcome while the work's exception is in flight. Never throws
    // a VerificationError or InvariantViolation: both are returned instead.
    auto pending_failure() const -> std::optional<PendingFailure> {
        std::lock_guard lock(state_->mutex);
        if (state_->closed) {
            return std::nullopt;
        }
        try {
            if (auto failure = collect_failures_locked()) {
                std::string message = failure->what();
                return PendingFailure{std::make_exception_ptr(std::move(*failure)), std::move(message)};
            }
        } catch (const InvariantViolation& e) {
            return PendingFailure{std::current_exception(), e.what()};
        }
        return std::nullopt;
    }

    static void log_unattached(const PendingFailure& failure, std::string_view primary) {
        SNIFFER_LOG_WARN << "statement verification failed while the work threw (" << primary
                         << "); the exception cannot carry it, so it is logged here:\n"
                         << failure.message;
    }

    template <typename F>
    auto invoke_verified(F&& work) -> std::invoke_result_t<F> {
        try {
            return std::invoke(std::forward<F>(work));
        } catch (SuppressedFailures& thrown) {
            if (auto failure = pending_failure()) {
                thrown.add_suppressed(failure->error);
            }
            throw;
        } catch (const std::exception& thrown) {
            if (auto failure = pending_failure()) {
                log_unattached(*failure, thrown.what());
            }
            throw;
        } catch (...) {
            if (auto failure = pending_failure()) {
                log_unattached(*failure, "non-standard exception");
            }
            throw;
        }
    }

    void deactivate(std::source_location where) noexcept {
        registry().unregister_observer(state_->handle);
        std::lock_guard lock(state_->mutex);
        state_->closed = true;
        state_->closed_at = where;
    }

    // Only the last handle unregisters. A broadcast holding the state at that
    // moment can make the count read high; the entry then expires and is pruned.
    void release() noexcept {
        if (state_ && state_.use_count() == 1 && !is_closed()) {
            registry().unregister_observer(state_->handle);
        }
        state_.reset();
    }

    std::shared_ptr<detail::SpyState> state_;
};

template <typename V>
auto SpyWithValue<V>::verify() -> SpyWithValue& {
    spy_->verify();
    return *this;
}

}  // namespace sniffer
