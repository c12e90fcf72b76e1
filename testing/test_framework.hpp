#pragma once

/**
 * @file test_framework.hpp
 * @brief Self-registering test cases, fluent assertions and a colored runner for the sniffer tests.
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <exception>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#ifndef _WIN32
#include <unistd.h>
#endif

// ─────────────────────────────────────────────────────────────────────────────
// ANSI colors
// ─────────────────────────────────────────────────────────────────────────────
namespace testing::color {

inline auto enabled() -> bool {
#ifdef _WIN32
    return false;
#else
    static bool val = (isatty(fileno(stdout)) != 0);
    return val;
#endif
}

inline auto wrap(std::string_view code, std::string_view str) -> std::string {
    return enabled() ? std::string(code) + std::string(str) + "\033[0m" : std::string(str);
}
inline auto green(std::string_view str) -> std::string { return wrap("\033[32m", str); }
inline auto red(std::string_view str) -> std::string { return wrap("\033[31m", str); }
inline auto yellow(std::string_view str) -> std::string { return wrap("\033[33m", str); }
inline auto bold(std::string_view str) -> std::string { return wrap("\033[1m", str); }
inline auto dim(std::string_view str) -> std::string { return wrap("\033[2m", str); }

}  // namespace testing::color

namespace testing {

// ─────────────────────────────────────────────────────────────────────────────
// assertion_error: a failed check, with the location of the check
// ─────────────────────────────────────────────────────────────────────────────

struct assertion_error : std::exception {
    std::string message;
    std::string file;
    int line{};

    assertion_error(std::string msg, std::string file_path, int line_num) : message(std::move(msg)), file(std::move(file_path)), line(line_num) {}

    [[nodiscard]] auto what() const noexcept -> const char* override { return message.c_str(); }
};

// ─────────────────────────────────────────────────────────────────────────────
// expectation<T>
// ─────────────────────────────────────────────────────────────────────────────

template <typename T>
class expectation {
   public:
    expectation(const T& value, const char* file, int line) : value_(value), file_(file), line_(line) {}

    template <typename U>
    auto to_equal(const U& expected) -> expectation& {
        if (!(value_ == expected)) {
            std::ostringstream oss;
            oss << "expected: " << to_str(expected) << "\n"
                << "           got:      " << to_str(value_);
            fail(oss.str());
        }
        return *this;
    }

    template <typename U>
    auto not_to_equal(const U& unexpected) -> expectation& {
        if (value_ == unexpected) {
            fail("expected value to differ from: " + to_str(unexpected));
        }
        return *this;
    }

    auto to_be_true() -> expectation& {
        if (!static_cast<bool>(value_)) {
            fail("expected: true\n           got:      false");
        }
        return *this;
    }

    auto to_be_false() -> expectation& {
        if (static_cast<bool>(value_)) {
            fail("expected: false\n           got:      true");
        }
        return *this;
    }

    template <typename U>
    auto to_be_greater_or_equal(const U& threshold) -> expectation& {
        if (!(value_ >= threshold)) {
            fail(to_str(value_) + " is not >= " + to_str(threshold));
        }
        return *this;
    }

    template <typename U>
    auto to_be_less_or_equal(const U& threshold) -> expectation& {
        if (!(value_ <= threshold)) {
            fail(to_str(value_) + " is not <= " + to_str(threshold));
        }
        return *this;
    }

    // Inclusive on both ends.
    template <typename U>
    auto to_be_between(const U& low, const U& high) -> expectation& {
        if (!(value_ >= low && value_ <= high)) {
            fail(to_str(value_) + " is not in [" + to_str(low) + ", " + to_str(high) + "]");
        }
        return *this;
    }

    auto to_contain(std::string_view substr) -> expectation&
        requires std::is_convertible_v<T, std::string_view>
    {
        std::string_view str(value_);
        if (str.find(substr) == std::string_view::npos) {
            fail("\"" + to_str(value_) + "\" does not contain \"" + std::string(substr) + "\"");
        }
        return *this;
    }

    auto not_to_contain(std::string_view substr) -> expectation&
        requires std::is_convertible_v<T, std::string_view>
    {
        std::string_view str(value_);
        if (str.find(substr) != std::string_view::npos) {
            fail("\"" + to_str(value_) + "\" unexpectedly contains \"" + std::string(substr) + "\"");
        }
        return *this;
    }

   private:
    const T& value_;
    const char* file_;
    int line_;

    [[noreturn]] void fail(const std::string& msg) const { throw assertion_error(msg, file_, line_); }

    template <typename U>
    static auto to_str(const U& val) -> std::string {
        std::ostringstream oss;
        oss << val;
        return oss.str();
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Exception helpers
// ─────────────────────────────────────────────────────────────────────────────

template <typename ExceptionType>
auto unexpected_exception(const char* detail, const char* file, int line) -> assertion_error {
    return {std::string("expected exception '") + typeid(ExceptionType).name() + "' but " + detail, file, line};
}

template <typename ExceptionType, typename Callable>
void check_throws(Callable&& func, const char* file, int line) {
    try {
        std::forward<Callable>(func)();
    } catch (const ExceptionType&) {
        return;
    } catch (...) {
        throw unexpected_exception<ExceptionType>("a different exception was thrown", file, line);
    }
    throw unexpected_exception<ExceptionType>("no exception was thrown", file, line);
}

// Like check_throws, and hands the caught exception back for inspection.
template <typename ExceptionType, typename Callable>
auto capture_thrown(Callable&& func, const char* file, int line) -> ExceptionType {
    try {
        std::forward<Callable>(func)();
    } catch (const ExceptionType& e) {
        return e;
    } catch (const std::exception& e) {
        throw unexpected_exception<ExceptionType>((std::string("got: ") + e.what()).c_str(), file, line);
    } catch (...) {
        throw unexpected_exception<ExceptionType>("a non-standard exception was thrown", file, line);
    }
    throw unexpected_exception<ExceptionType>("no exception was thrown", file, line);
}

template <typename Callable>
void check_no_throw(Callable&& func, const char* file, int line) {
    try {
        std::forward<Callable>(func)();
    } catch (const std::exception& e) {
        throw assertion_error(std::string("expected no exception but got: ") + e.what(), file, line);
    } catch (...) {
        throw assertion_error("expected no exception but an unknown exception was thrown", file, line);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// test_registry
// ─────────────────────────────────────────────────────────────────────────────

struct test_case {
    std::string suite;
    std::string name;
    std::function<void()> fn;
};

class test_registry {
   public:
    static auto instance() -> test_registry& {
        static test_registry reg;
        return reg;
    }

    auto register_test(test_case tcase) -> void { tests_.push_back(std::move(tcase)); }

    // Fixture code run before every test of the translation unit's binary.
    auto register_before_each(std::function<void()> hook) -> void { before_each_.push_back(std::move(hook)); }

    // Runs every test whose suite or name contains filter (all when empty).
    auto run_all(std::string_view filter = {}) -> int {
        print_header();

        int passed = 0;
        int failed = 0;
        std::string current_suite;

        for (const auto& tcase : tests_) {
            if (!filter.empty() && tcase.suite.find(filter) == std::string::npos && tcase.name.find(filter) == std::string::npos) {
                continue;
            }
            if (tcase.suite != current_suite) {
                current_suite = tcase.suite;
                std::cout << "\n  " << color::bold(color::yellow("SUITE: " + current_suite)) << "\n";
            }

            if (run_one(tcase)) {
                ++passed;
            } else {
                ++failed;
            }
        }

        print_footer(passed, failed);
        return (failed > 0) ? 1 : 0;
    }

   private:
    std::vector<test_case> tests_;
    std::vector<std::function<void()>> before_each_;

    auto run_one(const test_case& tcase) -> bool {
        try {
            for (const auto& hook : before_each_) {
                hook();
            }
            tcase.fn();
            std::cout << "    " << color::green("v") << "  " << tcase.name << "\n";
            return true;
        } catch (const assertion_error& e) {
            report_failure(tcase, e.message);
            std::cout << color::dim("         at: " + short_path(e.file) + ":" + std::to_string(e.line)) << "\n";
        } catch (const std::exception& e) {
            report_failure(tcase, std::string("unexpected exception: ") + e.what());
        } catch (...) {
            report_failure(tcase, "unknown exception thrown");
        }
        return false;
    }

    static void report_failure(const test_case& tcase, const std::string& message) {
        std::cout << "    " << color::red("x") << "  " << tcase.name << "\n";
        std::istringstream lines(message);
        for (std::string line; std::getline(lines, line);) {
            std::cout << color::dim("         " + line) << "\n";
        }
    }

    static void print_header() {
        std::cout << color::bold("\n+-------------------------------------+\n");
        std::cout << color::bold("|  sniffer test runner                 |\n");
        std::cout << color::bold("+-------------------------------------+\n");
    }

    static void print_footer(int passed, int failed) {
        constexpr int SEPARATOR_WIDTH = 42;
        std::cout << "\n" << std::string(SEPARATOR_WIDTH, '-') << "\n";
        std::cout << "  Results:  " << color::green(std::to_string(passed) + " passed") << "  |  "
                  << (failed > 0 ? color::red(std::to_string(failed) + " failed") : color::dim("0 failed")) << "  |  "
                  << std::to_string(passed + failed) << " total\n";
        std::cout << std::string(SEPARATOR_WIDTH, '-') << "\n\n";
    }

    static auto short_path(const std::string& path) -> std::string {
        auto pos = path.find_last_of("/\\");
        return (pos == std::string::npos) ? path : path.substr(pos + 1);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Registrars: fire at static-init time
// ─────────────────────────────────────────────────────────────────────────────
struct auto_registrar {
    auto_registrar(const char* suite, const char* name, void (*func)()) {
        test_registry::instance().register_test({.suite = suite, .name = name, .fn = func});
    }
};

struct before_each_registrar {
    explicit before_each_registrar(void (*func)()) { test_registry::instance().register_before_each(func); }
};

}  // namespace testing

#define _TS_CAT2(a, b) a##b
#define _TS_CAT(a, b) _TS_CAT2(a, b)

// ─────────────────────────────────────────────────────────────────────────────
// TEST_SUITE: sets the suite name for all TEST_CASEs that follow in the file.
// The name lives in a per-line static so the shared pointer stays valid.
// ─────────────────────────────────────────────────────────────────────────────

namespace {
inline const char* _ts_current_suite_ = "<unset>";
}

#define TEST_SUITE(name)                                         \
    static const char* _TS_CAT(_ts_suite_str_, __LINE__) = name; \
    static int _TS_CAT(_ts_suite_set_, __LINE__) = (_ts_current_suite_ = _TS_CAT(_ts_suite_str_, __LINE__), 0);

// Each TEST_CASE must start on its own line: __LINE__ makes the symbols unique.
#define TEST_CASE(test_name)                                                                                                 \
    static void _TS_CAT(_ts_fn_, __LINE__)();                                                                                \
    static ::testing::auto_registrar _TS_CAT(_ts_reg_, __LINE__)(_ts_current_suite_, test_name, _TS_CAT(_ts_fn_, __LINE__)); \
    static void _TS_CAT(_ts_fn_, __LINE__)()

// Runs before every test case of the binary, in registration order.
#define BEFORE_EACH()                                                                                \
    static void _TS_CAT(_ts_before_, __LINE__)();                                                    \
    static ::testing::before_each_registrar _TS_CAT(_ts_before_reg_, __LINE__)(_TS_CAT(_ts_before_, __LINE__)); \
    static void _TS_CAT(_ts_before_, __LINE__)()

// ─────────────────────────────────────────────────────────────────────────────
// Assertion macros
// ─────────────────────────────────────────────────────────────────────────────

#define expect(val) ::testing::expectation((val), __FILE__, __LINE__)

#define expect_throws(ExType, ...) ::testing::check_throws<ExType>([&] { __VA_ARGS__; }, __FILE__, __LINE__)

#define expect_no_throw(...) ::testing::check_no_throw([&] { __VA_ARGS__; }, __FILE__, __LINE__)

#define catch_thrown(ExType, ...) ::testing::capture_thrown<ExType>([&] { __VA_ARGS__; }, __FILE__, __LINE__)
