#pragma once

/**
 * @file errors.hxx
 * @brief Failures raised by statement expectations and by closed spies
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <limits>
#include <memory>
#include <source_location>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "thread_scope.hxx"

namespace sniffer {

/**
 * Mixin for exceptions that can carry secondary failures.
 *
 * When a Spy runs a unit of work that throws, and the Spy's own expectations
 * fail as well, the verification failure is attached to the thrown exception
 * through this interface. Derive your own exception types from it to receive
 * those failures; other exceptions get them logged instead.
 */
class SuppressedFailures {
   public:
    virtual ~SuppressedFailures() = default;

    void add_suppressed(std::exception_ptr failure) {
        if (failure) {
            suppressed_.push_back(std::move(failure));
        }
    }

    [[nodiscard]] auto suppressed() const noexcept -> const std::vector<std::exception_ptr>& { return suppressed_; }

   private:
    std::vector<std::exception_ptr> suppressed_;
};

/**
 * A statement count outside an expectation's [min, max].
 *
 * One verification pass reports every violated expectation: the first one is
 * thrown, and each further one is reachable through cause(). what() describes
 * the whole chain.
 */
class VerificationError : public std::exception, public SuppressedFailures {
   public:
    static constexpr std::int64_t UNBOUNDED = std::numeric_limits<std::int64_t>::max();

    VerificationError(ThreadScope scope, std::int64_t min_count, std::int64_t max_count, std::int64_t actual_count, std::vector<std::string> statements,
                      std::size_t max_listed = 0)
        : scope_(scope),
          min_count_(min_count),
          max_count_(max_count),
          actual_count_(actual_count),
          statements_(std::move(statements)),
          max_listed_(max_listed) {
        rebuild_message();
    }

    [[nodiscard]] auto what() const noexcept -> const char* override { return message_.c_str(); }

    [[nodiscard]] auto scope() const noexcept -> ThreadScope { return scope_; }
    [[nodiscard]] auto min_count() const noexcept -> std::int64_t { return min_count_; }
    [[nodiscard]] auto max_count() const noexcept -> std::int64_t { return max_count_; }
    [[nodiscard]] auto actual_count() const noexcept -> std::int64_t { return actual_count_; }
    /** Statements observed by the spy at the time of the failure, in execution order. */
    [[nodiscard]] auto executed_statements() const noexcept -> const std::vector<std::string>& { return statements_; }

    /** Next violated expectation of the same pass, or nullptr. */
    [[nodiscard]] auto cause() const noexcept -> const VerificationError* { return cause_.get(); }

    [[nodiscard]] auto chain_length() const noexcept -> std::size_t {
        std::size_t length = 1;
        for (const auto* err = cause(); err != nullptr; err = err->cause()) {
            ++length;
        }
        return length;
    }

    /** Appends @p next at the end of the cause chain. */
    void chain(VerificationError next) {
        if (cause_) {
            auto tail = std::make_shared<VerificationError>(*cause_);
            tail->chain(std::move(next));
            cause_ = std::move(tail);
        } else {
            cause_ = std::make_shared<const VerificationError>(std::move(next));
        }
        rebuild_message();
    }

    /** "between 1 and 3", "exactly 2", "at most 1", "at least 4". */
    [[nodiscard]] static auto describe_bounds(std::int64_t min_count, std::int64_t max_count) -> std::string {
        if (min_count == max_count) {
            return "exactly " + std::to_string(min_count);
        }
        if (max_count == UNBOUNDED) {
            return "at least " + std::to_string(min_count);
        }
        if (min_count == 0) {
            return "at most " + std::to_string(max_count);
        }
        return "between " + std::to_string(min_count) + " and " + std::to_string(max_count);
    }

   private:
    void rebuild_message() {
        std::ostringstream oss;
        oss << "Expected " << describe_bounds(min_count_, max_count_) << " statement(s) from " << to_string(scope_) << ", but " << actual_count_
            << " were executed";
        if (statements_.empty()) {
            oss << "\nNo statements were observed by this spy";
        } else {
            oss << "\nStatements observed by this spy:";
            const std::size_t listed = (max_listed_ == 0) ? statements_.size() : std::min(max_listed_, statements_.size());
            for (std::size_t i = 0; i < listed; ++i) {
                oss << "\n  " << statements_[i];
            }
            if (listed < statements_.size()) {
                oss << "\n  ... and " << (statements_.size() - listed) << " more";
            }
        }
        if (cause_) {
            oss << "\nCaused by: " << cause_->what();
        }
        message_ = oss.str();
    }

    ThreadScope scope_;
    std::int64_t min_count_;
    std::int64_t max_count_;
    std::int64_t actual_count_;
    std::vector<std::string> statements_;
    std::size_t max_listed_;
    std::shared_ptr<const VerificationError> cause_;
    std::string message_;
};

/** Any Spy operation after close(). Carries where the spy was closed. */
class SpyClosedError : public std::logic_error {
   public:
    explicit SpyClosedError(std::source_location closed_at)
        : std::logic_error(std::string("Spy is closed (closed at ") + closed_at.file_name() + ":" + std::to_string(closed_at.line()) + " in " +
                           closed_at.function_name() + ")"),
          closed_at_(closed_at) {}

    [[nodiscard]] auto closed_at() const noexcept -> const std::source_location& { return closed_at_; }

   private:
    std::source_location closed_at_;
};

/** A counting defect, e.g. a negative delta. Never an expected test outcome. */
class InvariantViolation : public std::logic_error {
   public:
    using std::logic_error::logic_error;
};

}  // namespace sniffer
