#pragma once

/**
 * @file observer_registry.hxx
 * @brief Process-wide set of weakly held statement observers
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
#include <memory>
#include <mutex>
#include <string_view>
#include <vector>

#include "../logger/logger.hxx"

namespace sniffer {

/**
 * Receives the text of every statement recorded while registered.
 * Called from whichever thread executed the statement, with the registry
 * mutex held: implementations must be quick and must not call back into the
 * registry.
 */
class StatementObserver {
   public:
    virtual ~StatementObserver() = default;
    virtual void statement_executed(std::string_view statement) = 0;
};

/** Identifies one registration. Ids are never reused; 0 is never issued. */
struct ObserverHandle {
    std::uint64_t id = 0;

    [[nodiscard]] auto valid() const noexcept -> bool { return id != 0; }
};

/**
 * ObserverRegistry: broadcasts recorded statements to observers.
 *
 * Membership is non-owning: the registry keeps a std::weak_ptr per observer,
 * so registration never extends an observer's lifetime. An observer whose
 * owner released it without unregistering is skipped, and its entry is
 * dropped by the next broadcast() or register_observer().
 *
 * Thread safety
 * ─────────────
 * One mutex guards membership and is held for the whole broadcast, so every
 * observer sees statements in the order record() calls were serialized here
 * and no notification is lost or duplicated by a concurrent (un)registration.
 */
class ObserverRegistry {
   public:
    static auto instance() -> ObserverRegistry& {
        static ObserverRegistry inst;
        return inst;
    }

    ObserverRegistry() = default;
    ~ObserverRegistry() = default;
    ObserverRegistry(const ObserverRegistry&) = delete;
    ObserverRegistry(ObserverRegistry&&) = delete;
    auto operator=(const ObserverRegistry&) -> ObserverRegistry& = delete;
    auto operator=(ObserverRegistry&&) -> ObserverRegistry& = delete;

    auto register_observer(std::weak_ptr<StatementObserver> observer) -> ObserverHandle {
        std::lock_guard lock(mutex_);
        prune_expired();
        ObserverHandle handle{++last_id_};
        entries_.push_back({handle.id, std::move(observer)});
        return handle;
    }

    /** Idempotent: unknown, already removed or expired handles are ignored. */
    void unregister_observer(ObserverHandle handle) noexcept {
        if (!handle.valid()) {
            return;
        }
        std::lock_guard lock(mutex_);
        std::erase_if(entries_, [&](const Entry& entry) { return entry.id == handle.id; });
    }

    /**
     * Delivers @p statement to every live observer. An observer that throws is
     * logged and skipped; the observers after it are still notified.
     */
    void broadcast(std::string_view statement) {
        std::lock_guard lock(mutex_);
        bool saw_expired = false;
        for (const auto& entry : entries_) {
            if (auto observer = entry.target.lock()) {
                notify(*observer, entry.id, statement);
            } else {
                saw_expired = true;
            }
        }
        if (saw_expired) {
            prune_expired();
        }
    }

    /** Entries currently held, including expired ones not yet pruned. */
    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

    [[nodiscard]] auto contains(ObserverHandle handle) const -> bool {
        std::lock_guard lock(mutex_);
        return std::ranges::any_of(entries_, [&](const Entry& entry) { return entry.id == handle.id && !entry.target.expired(); });
    }

   private:
    struct Entry {
        std::uint64_t id;
        std::weak_ptr<StatementObserver> target;
    };

    static void notify(StatementObserver& observer, std::uint64_t id, std::string_view statement) noexcept {
        try {
            observer.statement_executed(statement);
        } catch (const std::exception& e) {
            Logger::get_instance().log(Logger::level::WARNING, "statement observer #", id, " failed: ", e.what());
        } catch (...) {
            Logger::get_instance().log(Logger::level::WARNING, "statement observer #", id, " failed: non-standard exception");
        }
    }

    // mutex_ must be held.
    void prune_expired() noexcept {
        const auto dropped = std::erase_if(entries_, [](const Entry& entry) { return entry.target.expired(); });
        if (dropped > 0) {
            Logger::get_instance().log(Logger::level::DEBUG, "observer registry dropped ", dropped, " released observer(s)");
        }
    }

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    std::uint64_t last_id_ = 0;
};

}  // namespace sniffer
