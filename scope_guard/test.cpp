/**
 * @file test.cpp
 * @brief Test suite for ScopeGuard
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <stdexcept>
#include <utility>

#include "../testing/test_main.hpp"
#include "scope_guard.hxx"

TEST_SUITE("ScopeGuard")

TEST_CASE("cleanup runs when the scope ends normally") {
    int runs = 0;
    {
        auto guard = sniffer::on_scope_exit([&runs]() noexcept { ++runs; });
        expect(runs).to_equal(0);
    }
    expect(runs).to_equal(1);
}

TEST_CASE("cleanup runs when the scope is left by an exception") {
    int runs = 0;
    expect_throws(std::runtime_error, {
        auto guard = sniffer::on_scope_exit([&runs]() noexcept { ++runs; });
        throw std::runtime_error("unwind");
    });
    expect(runs).to_equal(1);
}

TEST_CASE("moved guard runs the cleanup once") {
    int runs = 0;
    {
        auto first = sniffer::on_scope_exit([&runs]() noexcept { ++runs; });
        auto second = std::move(first);
    }
    expect(runs).to_equal(1);
}

TEST_CASE("guards run in reverse order of creation") {
    int order = 0;
    int first_ran_at = 0;
    int second_ran_at = 0;
    {
        auto first = sniffer::on_scope_exit([&]() noexcept { first_ran_at = ++order; });
        auto second = sniffer::on_scope_exit([&]() noexcept { second_ran_at = ++order; });
    }
    expect(second_ran_at).to_equal(1);
    expect(first_ran_at).to_equal(2);
}
