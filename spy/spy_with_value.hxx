#pragma once

/**
 * @file spy_with_value.hxx
 * @brief Result of Spy::call(): the computed value plus the spy that measured it
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <memory>
#include <utility>

namespace sniffer {

class Spy;

/**
 * Holds the value returned by the work passed to Spy::call() together with a
 * handle on that same Spy, so further expectations keep using the original
 * baseline, log and expectations:
 *
 *   auto users = sniffer::expect_at_most(2).call([&] { return dao.load_users(); });
 *   users->expect_never(sniffer::ThreadScope::Others).verify();
 *   use(users.value());
 *
 * The handle shares the spy's state, so the result stays valid after the Spy
 * that produced it is moved from or destroyed.
 */
template <typename V>
class SpyWithValue {
   public:
    SpyWithValue(V value, std::unique_ptr<Spy> spy) : value_(std::move(value)), spy_(std::move(spy)) {}

    [[nodiscard]] auto value() & -> V& { return value_; }
    [[nodiscard]] auto value() const& -> const V& { return value_; }
    [[nodiscard]] auto value() && -> V { return std::move(value_); }

    [[nodiscard]] auto spy() const noexcept -> Spy& { return *spy_; }
    auto operator->() const noexcept -> Spy* { return spy_.get(); }

    /** Spy::verify() on the shared spy. Defined in spy.hxx. */
    auto verify() -> SpyWithValue&;

   private:
    V value_;
    std::unique_ptr<Spy> spy_;  // heap-held so moving the result keeps spy() stable
};

}  // namespace sniffer
