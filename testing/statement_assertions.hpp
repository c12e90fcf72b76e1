#pragma once

/**
 * @file statement_assertions.hpp
 * @brief Reports a Spy's statement-count failures as test framework assertion failures.
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <cstdint>
#include <string>
#include <utility>

#include "../spy/spy.hxx"
#include "test_framework.hpp"

namespace testing {

// Verifies every expectation of spy; a violation becomes an assertion_error at
// the caller's line carrying the full statement report.
inline void check_statements(sniffer::Spy& spy, const char* file, int line) {
    if (auto failure = spy.verification_error()) {
        throw assertion_error(std::string("statement count mismatch: ") + failure->what(), file, line);
    }
}

// Closes spy; a violation becomes an assertion_error, and the spy is closed either way.
inline void close_statements(sniffer::Spy& spy, const char* file, int line) {
    try {
        spy.close();
    } catch (const sniffer::VerificationError& e) {
        throw assertion_error(std::string("statement count mismatch: ") + e.what(), file, line);
    }
}

// Declarative form: the test body runs under a fresh spy that must see
// [min_count, max_count] statements in scope.
template <typename Body>
void with_statements(std::int64_t min_count, std::int64_t max_count, sniffer::ThreadScope scope, Body&& body, const char* file, int line) {
    sniffer::Spy spy;
    spy.expect_between(min_count, max_count, scope);
    std::forward<Body>(body)();
    close_statements(spy, file, line);
}

}  // namespace testing

#define expect_statements(spy) ::testing::check_statements((spy), __FILE__, __LINE__)

#define close_statements(spy) ::testing::close_statements((spy), __FILE__, __LINE__)

#define with_statements(min_count, max_count, scope, ...) \
    ::testing::with_statements((min_count), (max_count), (scope), [&] { __VA_ARGS__; }, __FILE__, __LINE__)
