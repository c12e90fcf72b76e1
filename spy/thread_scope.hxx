#pragma once

/**
 * @file thread_scope.hxx
 * @brief Selects which threads' statements a count or expectation considers
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <ostream>
#include <string_view>

namespace sniffer {

enum class ThreadScope {
    Any,      // every thread (global counter)
    Current,  // the thread evaluating the count
    Others    // every thread except the evaluating one
};

constexpr auto to_string(ThreadScope scope) noexcept -> std::string_view {
    switch (scope) {
        case ThreadScope::Any:
            return "any thread";
        case ThreadScope::Current:
            return "current thread";
        case ThreadScope::Others:
            return "other threads";
    }
    return "unknown scope";
}

inline auto operator<<(std::ostream& os, ThreadScope scope) -> std::ostream& { return os << to_string(scope); }

}  // namespace sniffer
