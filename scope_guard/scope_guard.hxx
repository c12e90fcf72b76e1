#pragma once

/**
 * @file scope_guard.hxx
 * @brief Runs a cleanup action when a scope is left, normally or by exception
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <type_traits>
#include <utility>

namespace sniffer {

/**
 * The cleanup action must not throw: it may run during stack unwinding, and
 * the guard's destructor is noexcept.
 */
template <typename F>
class ScopeGuard {
    static_assert(std::is_nothrow_invocable_v<F&>, "ScopeGuard cleanup must be noexcept");

   public:
    explicit ScopeGuard(F func) : func_(std::move(func)) {}

    ~ScopeGuard() noexcept {
        if (active_) {
            func_();
        }
    }

    ScopeGuard(const ScopeGuard&) = delete;
    auto operator=(const ScopeGuard&) -> ScopeGuard& = delete;
    auto operator=(ScopeGuard&&) -> ScopeGuard& = delete;
    ScopeGuard(ScopeGuard&& other) noexcept : func_(std::move(other.func_)), active_(other.active_) { other.active_ = false; }

   private:
    F func_;
    bool active_ = true;
};

template <typename F>
auto on_scope_exit(F&& func) {
    return ScopeGuard<std::decay_t<F>>(std::forward<F>(func));
}

}  // namespace sniffer
