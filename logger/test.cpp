/**
 * @file test.cpp
 * @brief Test suite for Logger and the library's diagnostic output
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "../testing/test_main.hpp"
#include "../spy/spy.hxx"
#include "logger.hxx"

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

namespace {

auto log_path() -> std::string {
    static const std::string path = (std::filesystem::temp_directory_path() / "sniffer_logger_test.log").string();
    return path;
}

auto log_contents() -> std::string {
    sniffer::Logger::get_instance().flush();
    std::ifstream file(log_path());
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

class RejectingObserver : public sniffer::StatementObserver {
   public:
    void statement_executed(std::string_view statement) override { throw std::runtime_error("rejected " + std::string(statement)); }
};

}  // namespace

BEFORE_EACH() {
    sniffer::ExecutionCounters::instance().reset();
    sniffer::configure({.log_level = sniffer::Logger::level::DEBUG});
}

// The logger is a process-wide singleton: the first test redirects it to a
// file before anything else in this binary emits a message.
TEST_SUITE("Logger – setup")

TEST_CASE("initialize redirects output to a file") {
    std::filesystem::remove(log_path());
    sniffer::Logger::get_instance().initialize(log_path(), false, false, sniffer::Logger::level::DEBUG);
    SNIFFER_LOG_INFO << "logger ready, answer=" << 42;
    expect(log_contents()).to_contain("[  INFO ] [sniffer] logger ready, answer=42");
}

TEST_CASE("second initialize is rejected") {
    expect_throws(std::runtime_error, sniffer::Logger::get_instance().initialize());
}

TEST_CASE("messages below the minimum level are dropped") {
    sniffer::configure({.log_level = sniffer::Logger::level::ERROR});
    SNIFFER_LOG_WARN << "hidden warning";
    sniffer::Logger::get_instance().error("visible error");
    const auto contents = log_contents();
    expect(contents).not_to_contain("hidden warning");
    expect(contents).to_contain("[ ERROR ] [sniffer] visible error");
}

TEST_CASE("log streams every part into one line") {
    sniffer::Logger::get_instance().log(sniffer::Logger::level::INFO, "pool ", 3, " of ", 8U, ": ", std::string_view("ready"));
    expect(log_contents()).to_contain("[  INFO ] [sniffer] pool 3 of 8: ready");
}

TEST_CASE("log below the minimum level writes nothing") {
    sniffer::configure({.log_level = sniffer::Logger::level::WARNING});
    sniffer::Logger::get_instance().log(sniffer::Logger::level::INFO, "suppressed ", 7);
    expect(log_contents()).not_to_contain("suppressed 7");
}

TEST_CASE("minimum level is adjustable at runtime") {
    auto& logger = sniffer::Logger::get_instance();
    logger.set_min_level(sniffer::Logger::level::INFO);
    expect(logger.enabled(sniffer::Logger::level::DEBUG)).to_be_false();
    expect(logger.enabled(sniffer::Logger::level::INFO)).to_be_true();
    expect(logger.min_level() == sniffer::Logger::level::INFO).to_be_true();
}

// ═════════════════════════════════════════════════════════════════════════════
// Library diagnostics
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("Logger – library diagnostics")

TEST_CASE("failed verification is logged before it is thrown") {
    sniffer::configure({.log_failures = true, .log_level = sniffer::Logger::level::DEBUG});
    sniffer::Spy spy;
    sniffer::ExecutionCounters::instance().record("SELECT * FROM audit_log");
    expect_throws(sniffer::VerificationError, spy.verify_never());
    const auto contents = log_contents();
    expect(contents).to_contain("[WARNING] [sniffer] Expected exactly 0 statement(s) from current thread, but 1 were executed");
    expect(contents).to_contain("SELECT * FROM audit_log");
}

TEST_CASE("failure logging can be switched off") {
    sniffer::configure({.log_failures = false, .log_level = sniffer::Logger::level::DEBUG});
    sniffer::Spy spy;
    sniffer::ExecutionCounters::instance().record("SELECT quiet_failure");
    expect_throws(sniffer::VerificationError, spy.verify_never());
    expect(log_contents()).not_to_contain("SELECT quiet_failure");
}

TEST_CASE("recorded statements are logged when enabled") {
    sniffer::configure({.log_statements = true, .log_level = sniffer::Logger::level::DEBUG});
    sniffer::ExecutionCounters::instance().record("SELECT 42 FROM dual");
    expect(log_contents()).to_contain("[ DEBUG ] [sniffer] statement #1: SELECT 42 FROM dual");
}

TEST_CASE("recorded statements are not logged by default") {
    sniffer::ExecutionCounters::instance().record("SELECT unlogged");
    expect(log_contents()).not_to_contain("SELECT unlogged");
}

TEST_CASE("failure that the thrown exception cannot carry is logged") {
    sniffer::configure({.log_failures = false, .log_level = sniffer::Logger::level::DEBUG});
    sniffer::Spy spy;
    spy.expect_never();
    expect_throws(std::runtime_error, spy.run([] {
        sniffer::ExecutionCounters::instance().record("SELECT lost_update");
        throw std::runtime_error("deadlock detected");
    }));
    const auto contents = log_contents();
    expect(contents).to_contain("statement verification failed while the work threw (deadlock detected)");
    expect(contents).to_contain("SELECT lost_update");
}

TEST_CASE("failing observer is logged and the statement still reaches the spy") {
    auto observer = std::make_shared<RejectingObserver>();
    auto& registry = sniffer::ObserverRegistry::instance();
    const auto handle = registry.register_observer(observer);
    sniffer::Spy spy;
    sniffer::ExecutionCounters::instance().record("INSERT INTO ledger");
    registry.unregister_observer(handle);
    expect(log_contents()).to_contain("failed: rejected INSERT INTO ledger");
    expect(spy.observed_statements().size()).to_equal(1U);
}
