#pragma once

/**
 * @file execution_counters.hxx
 * @brief Global and per-thread counters of executed statements
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
#include <string_view>

#include "../config/config.hxx"
#include "../logger/logger.hxx"
#include "../observer_registry/observer_registry.hxx"

namespace sniffer {

/** Both counters as seen by one thread at one moment. */
struct CounterSnapshot {
    std::uint64_t global = 0;
    std::uint64_t context = 0;
};

/**
 * ExecutionCounters: the entry point of the statement interception layer.
 *
 * Thread safety
 * ─────────────
 * record()            : lock-free increments, then one registry broadcast.
 * snapshot_*()        : lock-free loads.
 * reset_*()           : NOT safe while other threads record. Intended for
 *                       single-threaded test setup only.
 *
 * The global counter is a relaxed atomic: increments are never lost, and a
 * thread always observes its own increments. The per-thread counter lives in
 * thread_local storage and is only ever touched by its owning thread.
 */
class ExecutionCounters {
   public:
    static auto instance() -> ExecutionCounters& {
        static ExecutionCounters inst;
        return inst;
    }

    ExecutionCounters(const ExecutionCounters&) = delete;
    auto operator=(const ExecutionCounters&) -> ExecutionCounters& = delete;

    /**
     * Counts one executed statement on the calling thread and notifies every
     * registered observer. Never throws.
     */
    void record(std::string_view statement) noexcept {
        const std::uint64_t number = global_.fetch_add(1, std::memory_order_relaxed) + 1;
        ++context_counter();

        auto& logger = Logger::get_instance();
        if (Settings::instance().log_statements()) {
            logger.log(Logger::level::DEBUG, "statement #", number, ": ", statement);
        }

        // The statement stays counted either way; only observer logs can miss it.
        try {
            registry_.broadcast(statement);
        } catch (const std::exception& e) {
            logger.log(Logger::level::WARNING, "failed to notify statement observers: ", e.what());
        } catch (...) {
            logger.log(Logger::level::WARNING, "failed to notify statement observers: non-standard exception");
        }
    }

    [[nodiscard]] auto snapshot_global() const noexcept -> std::uint64_t { return global_.load(std::memory_order_relaxed); }

    [[nodiscard]] auto snapshot_context() const noexcept -> std::uint64_t { return context_counter(); }

    /** Two separate reads: the global value is not frozen while the context value is read. */
    [[nodiscard]] auto snapshot() const noexcept -> CounterSnapshot { return {.global = snapshot_global(), .context = snapshot_context()}; }

    /** Not safe for concurrent use. */
    void reset_global() noexcept { global_.store(0, std::memory_order_relaxed); }

    /** Resets the calling thread's counter only. */
    void reset_context() noexcept { context_counter() = 0; }

    /** Administrative reset of the global and the calling thread's counter. Not safe for concurrent use. */
    void reset() noexcept {
        reset_global();
        reset_context();
    }

   private:
    ExecutionCounters() : registry_(ObserverRegistry::instance()) {}
    ~ExecutionCounters() = default;

    static auto context_counter() noexcept -> std::uint64_t& {
        thread_local std::uint64_t count = 0;
        return count;
    }

    std::atomic<std::uint64_t> global_{0};
    ObserverRegistry& registry_;
};

}  // namespace sniffer
