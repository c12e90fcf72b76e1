#pragma once

/**
 * @file config.hxx
 * @brief Process-wide settings for statement counting and failure reporting
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <atomic>
#include <cstddef>

#include "../logger/logger.hxx"
#include "../spy/thread_scope.hxx"

namespace sniffer {

/**
 * Plain settings value. Build one with designated initializers and pass it to
 * configure():
 *
 *   sniffer::configure({.max_reported_statements = 20, .log_statements = true});
 */
struct Config {
    // Scope used by the expect_* / verify_* overloads that take no ThreadScope.
    ThreadScope default_scope = ThreadScope::Current;
    // Upper bound on statements listed in a failure message. 0 lists all.
    std::size_t max_reported_statements = 0;
    // Log every failing verify() at WARNING before throwing.
    bool log_failures = true;
    // Log every recorded statement at DEBUG (also requires log_level DEBUG).
    bool log_statements = false;
    Logger::level log_level = Logger::level::WARNING;
};

/**
 * Holds the active Config in atomics so that the statement-recording path
 * reads it without locking. Fields are independent: a reader racing with
 * configure() may observe a mix of old and new values.
 */
class Settings {
   public:
    static auto instance() -> Settings& {
        static Settings inst;
        return inst;
    }

    Settings(const Settings&) = delete;
    auto operator=(const Settings&) -> Settings& = delete;

    void apply(const Config& cfg) noexcept {
        default_scope_.store(cfg.default_scope, std::memory_order_relaxed);
        max_reported_statements_.store(cfg.max_reported_statements, std::memory_order_relaxed);
        log_failures_.store(cfg.log_failures, std::memory_order_relaxed);
        log_statements_.store(cfg.log_statements, std::memory_order_relaxed);
        Logger::get_instance().set_min_level(cfg.log_level);
    }

    [[nodiscard]] auto snapshot() const noexcept -> Config {
        return {
            .default_scope = default_scope(),
            .max_reported_statements = max_reported_statements(),
            .log_failures = log_failures(),
            .log_statements = log_statements(),
            .log_level = Logger::get_instance().min_level(),
        };
    }

    [[nodiscard]] auto default_scope() const noexcept -> ThreadScope { return default_scope_.load(std::memory_order_relaxed); }
    [[nodiscard]] auto max_reported_statements() const noexcept -> std::size_t { return max_reported_statements_.load(std::memory_order_relaxed); }
    [[nodiscard]] auto log_failures() const noexcept -> bool { return log_failures_.load(std::memory_order_relaxed); }
    [[nodiscard]] auto log_statements() const noexcept -> bool { return log_statements_.load(std::memory_order_relaxed); }

   private:
    Settings() = default;
    ~Settings() = default;

    std::atomic<ThreadScope> default_scope_{ThreadScope::Current};
    std::atomic<std::size_t> max_reported_statements_{0};
    std::atomic<bool> log_failures_{true};
    std::atomic<bool> log_statements_{false};
};

inline void configure(const Config& cfg) noexcept { Settings::instance().apply(cfg); }

inline auto current_config() noexcept -> Config { return Settings::instance().snapshot(); }

}  // namespace sniffer
