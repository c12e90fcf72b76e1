/**
 * @file test.cpp
 * @brief Test suite for ObserverRegistry: weak membership, broadcast and pruning
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "../testing/test_main.hpp"
#include "observer_registry.hxx"

// ─────────────────────────────────────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────────────────────────────────────

namespace {

class CollectingObserver : public sniffer::StatementObserver {
   public:
    void statement_executed(std::string_view statement) override {
        std::lock_guard lock(mutex_);
        seen_.emplace_back(statement);
    }

    auto seen() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return seen_;
    }

    auto count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return seen_.size();
    }

   private:
    mutable std::mutex mutex_;
    std::vector<std::string> seen_;
};

class FailingObserver : public sniffer::StatementObserver {
   public:
    void statement_executed(std::string_view /*statement*/) override { throw std::runtime_error("audit sink offline"); }
};

// Throws something that is not a std::exception.
class FailingWithCodeObserver : public sniffer::StatementObserver {
   public:
    void statement_executed(std::string_view /*statement*/) override { throw 503; }
};

}  // namespace

// ═════════════════════════════════════════════════════════════════════════════
// Registration
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("ObserverRegistry – registration")

TEST_CASE("new registry is empty") {
    sniffer::ObserverRegistry registry;
    expect(registry.size()).to_equal(0U);
}

TEST_CASE("register returns distinct valid handles") {
    sniffer::ObserverRegistry registry;
    auto first = std::make_shared<CollectingObserver>();
    auto second = std::make_shared<CollectingObserver>();
    const auto h1 = registry.register_observer(first);
    const auto h2 = registry.register_observer(second);
    expect(h1.valid()).to_be_true();
    expect(h2.valid()).to_be_true();
    expect(h1.id).not_to_equal(h2.id);
    expect(registry.size()).to_equal(2U);
    expect(registry.contains(h1)).to_be_true();
    expect(registry.contains(h2)).to_be_true();
}

TEST_CASE("default handle is invalid") {
    const sniffer::ObserverHandle handle;
    expect(handle.valid()).to_be_false();
}

TEST_CASE("handles are not reused after unregistering") {
    sniffer::ObserverRegistry registry;
    auto observer = std::make_shared<CollectingObserver>();
    const auto h1 = registry.register_observer(observer);
    registry.unregister_observer(h1);
    const auto h2 = registry.register_observer(observer);
    expect(h2.id).not_to_equal(h1.id);
    expect(registry.contains(h1)).to_be_false();
}

TEST_CASE("registration does not keep the observer alive") {
    sniffer::ObserverRegistry registry;
    auto observer = std::make_shared<CollectingObserver>();
    const std::weak_ptr<CollectingObserver> watch = observer;
    const auto handle = registry.register_observer(observer);
    observer.reset();
    expect(watch.expired()).to_be_true();
    expect(registry.contains(handle)).to_be_false();
}

TEST_CASE("unregister is idempotent") {
    sniffer::ObserverRegistry registry;
    auto observer = std::make_shared<CollectingObserver>();
    const auto handle = registry.register_observer(observer);
    registry.unregister_observer(handle);
    expect_no_throw(registry.unregister_observer(handle));
    expect_no_throw(registry.unregister_observer(sniffer::ObserverHandle{}));
    expect_no_throw(registry.unregister_observer(sniffer::ObserverHandle{.id = 12345}));
    expect(registry.size()).to_equal(0U);
}

TEST_CASE("unregister removes only the given observer") {
    sniffer::ObserverRegistry registry;
    auto first = std::make_shared<CollectingObserver>();
    auto second = std::make_shared<CollectingObserver>();
    const auto h1 = registry.register_observer(first);
    const auto h2 = registry.register_observer(second);
    registry.unregister_observer(h1);
    expect(registry.contains(h1)).to_be_false();
    expect(registry.contains(h2)).to_be_true();
}

// ═════════════════════════════════════════════════════════════════════════════
// Broadcast
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("ObserverRegistry – broadcast")

TEST_CASE("broadcast reaches every live observer in order") {
    sniffer::ObserverRegistry registry;
    auto first = std::make_shared<CollectingObserver>();
    auto second = std::make_shared<CollectingObserver>();
    registry.register_observer(first);
    registry.register_observer(second);
    registry.broadcast("SELECT a");
    registry.broadcast("SELECT b");
    for (const auto& observer : {first, second}) {
        const auto seen = observer->seen();
        expect(seen.size()).to_equal(2U);
        expect(seen[0]).to_equal(std::string("SELECT a"));
        expect(seen[1]).to_equal(std::string("SELECT b"));
    }
}

TEST_CASE("unregistered observer receives nothing more") {
    sniffer::ObserverRegistry registry;
    auto observer = std::make_shared<CollectingObserver>();
    const auto handle = registry.register_observer(observer);
    registry.broadcast("SELECT before");
    registry.unregister_observer(handle);
    registry.broadcast("SELECT after");
    expect(observer->count()).to_equal(1U);
}

TEST_CASE("observer registered later misses earlier statements") {
    sniffer::ObserverRegistry registry;
    registry.broadcast("SELECT early");
    auto observer = std::make_shared<CollectingObserver>();
    registry.register_observer(observer);
    registry.broadcast("SELECT late");
    const auto seen = observer->seen();
    expect(seen.size()).to_equal(1U);
    expect(seen[0]).to_equal(std::string("SELECT late"));
}

TEST_CASE("a throwing observer does not stop later observers") {
    sniffer::ObserverRegistry registry;
    auto failing = std::make_shared<FailingObserver>();
    auto after = std::make_shared<CollectingObserver>();
    registry.register_observer(failing);
    registry.register_observer(after);
    expect_no_throw(registry.broadcast("SELECT 1"));
    expect_no_throw(registry.broadcast("SELECT 2"));
    expect(after->count()).to_equal(2U);
    expect(registry.size()).to_equal(2U);
}

TEST_CASE("an observer throwing a non-standard exception is skipped") {
    sniffer::ObserverRegistry registry;
    auto before = std::make_shared<CollectingObserver>();
    auto failing = std::make_shared<FailingWithCodeObserver>();
    auto after = std::make_shared<CollectingObserver>();
    registry.register_observer(before);
    registry.register_observer(failing);
    registry.register_observer(after);
    expect_no_throw(registry.broadcast("UPDATE stock"));
    expect(before->count()).to_equal(1U);
    expect(after->count()).to_equal(1U);
    expect(after->seen().front()).to_equal(std::string("UPDATE stock"));
}

TEST_CASE("broadcast with no observers is harmless") {
    sniffer::ObserverRegistry registry;
    expect_no_throw(registry.broadcast("SELECT 1"));
}

// ═════════════════════════════════════════════════════════════════════════════
// Pruning
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("ObserverRegistry – pruning")

TEST_CASE("released observer is skipped and dropped by the next broadcast") {
    sniffer::ObserverRegistry registry;
    auto kept = std::make_shared<CollectingObserver>();
    auto released = std::make_shared<CollectingObserver>();
    registry.register_observer(kept);
    registry.register_observer(released);
    released.reset();
    expect(registry.size()).to_equal(2U);
    registry.broadcast("SELECT 1");
    expect(registry.size()).to_equal(1U);
    expect(kept->count()).to_equal(1U);
}

TEST_CASE("registration drops released observers") {
    sniffer::ObserverRegistry registry;
    auto released = std::make_shared<CollectingObserver>();
    registry.register_observer(released);
    released.reset();
    auto fresh = std::make_shared<CollectingObserver>();
    registry.register_observer(fresh);
    expect(registry.size()).to_equal(1U);
}

TEST_CASE("create and release cycles keep the registry bounded") {
    sniffer::ObserverRegistry registry;
    for (int i = 0; i < 10000; ++i) {
        auto observer = std::make_shared<CollectingObserver>();
        registry.register_observer(observer);
    }
    expect(registry.size()).to_be_less_or_equal(1U);
    registry.broadcast("SELECT 1");
    expect(registry.size()).to_equal(0U);
}

// ═════════════════════════════════════════════════════════════════════════════
// Concurrency
// ═════════════════════════════════════════════════════════════════════════════

TEST_SUITE("ObserverRegistry – concurrency")

TEST_CASE("concurrent broadcasts reach a stable observer exactly once each") {
    constexpr int THREADS = 4;
    constexpr int PER_THREAD = 1000;
    sniffer::ObserverRegistry registry;
    auto stable = std::make_shared<CollectingObserver>();
    registry.register_observer(stable);

    std::atomic<bool> done{false};
    std::thread churn([&registry, &done] {
        while (!done.load()) {
            auto transient = std::make_shared<CollectingObserver>();
            const auto handle = registry.register_observer(transient);
            registry.unregister_observer(handle);
        }
    });

    std::vector<std::thread> broadcasters;
    broadcasters.reserve(THREADS);
    for (int t = 0; t < THREADS; ++t) {
        broadcasters.emplace_back([&registry] {
            for (int i = 0; i < PER_THREAD; ++i) {
                registry.broadcast("SELECT shared");
            }
        });
    }
    for (auto& thread : broadcasters) {
        thread.join();
    }
    done.store(true);
    churn.join();

    expect(stable->count()).to_equal(static_cast<std::size_t>(THREADS * PER_THREAD));
    expect(registry.size()).to_equal(1U);
}

TEST_CASE("process-wide registry is a single instance") {
    expect(&sniffer::ObserverRegistry::instance() == &sniffer::ObserverRegistry::instance()).to_be_true();
}
