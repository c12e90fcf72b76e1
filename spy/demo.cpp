/**
 * @file demo.cpp
 * @brief Catches an N+1 query pattern in a fake order repository with sniffer.
 *
 * The repository reports every statement it runs through sniffer::intercept(),
 * the way a driver wrapper would. The demo then:
 *  - shows a Spy rejecting the per-order query loop and accepting the batched query,
 *  - separates statements of a background thread from those of the caller,
 *  - reports several violated expectations in one failure,
 *  - attaches a verification failure to an exception thrown by the work.
 *
 * Run:
 *   ./spy_demo
 */

#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../sniffer/sniffer.hxx"

namespace {

struct Order {
    int id;
    std::vector<std::string> items;
};

class RepositoryError : public std::runtime_error, public sniffer::SuppressedFailures {
   public:
    using std::runtime_error::runtime_error;
};

class OrderRepository {
   public:
    auto load_orders(int count) -> std::vector<Order> {
        return sniffer::intercept("SELECT id FROM orders LIMIT " + std::to_string(count), [count] {
            std::vector<Order> orders;
            for (int id = 1; id <= count; ++id) {
                orders.push_back({.id = id, .items = {}});
            }
            return orders;
        });
    }

    // One query per order.
    void load_items_lazily(std::vector<Order>& orders) {
        for (auto& order : orders) {
            order.items = sniffer::intercept("SELECT name FROM items WHERE order_id = " + std::to_string(order.id),
                                             [] { return std::vector<std::string>{"widget", "gadget"}; });
        }
    }

    // One query for every order.
    void load_items_batched(std::vector<Order>& orders) {
        sniffer::intercept("SELECT order_id, name FROM items WHERE order_id IN (...)", [&orders] {
            for (auto& order : orders) {
                order.items = {"widget", "gadget"};
            }
        });
    }

    void archive(int order_id) {
        sniffer::intercept("UPDATE orders SET archived = 1 WHERE id = " + std::to_string(order_id), [] {});
        sniffer::intercept("DELETE FROM carts WHERE order_id = " + std::to_string(order_id), [] {});
        throw RepositoryError("archive failed: order " + std::to_string(order_id) + " is locked");
    }
};

void section(const std::string& title) { std::cout << "\n=== " << title << " ===\n"; }

void lazy_loading(OrderRepository& repository) {
    section("lazy loading (N+1)");
    auto spy = sniffer::expect_at_most(2);
    auto orders = repository.load_orders(4);
    repository.load_items_lazily(orders);
    try {
        spy.close();
    } catch (const sniffer::VerificationError& e) {
        std::cout << e.what() << "\n";
    }
}

void batched_loading(OrderRepository& repository) {
    section("batched loading");
    auto spy = sniffer::expect_at_most(2);
    auto orders = repository.load_orders(40);
    repository.load_items_batched(orders);
    spy.close();
    std::cout << "loaded " << orders.size() << " orders with 2 statements\n";
}

void background_thread(OrderRepository& repository) {
    section("caller vs background thread");
    sniffer::Spy spy;
    std::thread refresher([&repository] { (void)repository.load_orders(10); });
    refresher.join();
    (void)repository.load_orders(1);
    std::cout << "current thread: " << spy.executed_statements(sniffer::ThreadScope::Current) << "\n"
              << "other threads:  " << spy.executed_statements(sniffer::ThreadScope::Others) << "\n"
              << "any thread:     " << spy.executed_statements(sniffer::ThreadScope::Any) << "\n";
    spy.verify_exactly(1, sniffer::ThreadScope::Current).verify_exactly(1, sniffer::ThreadScope::Others);
}

void several_violations(OrderRepository& repository) {
    section("several violated expectations");
    sniffer::Spy spy;
    spy.expect_never(sniffer::ThreadScope::Others).expect_exactly(1).expect_at_least(3, sniffer::ThreadScope::Any);
    auto orders = repository.load_orders(2);
    repository.load_items_batched(orders);
    if (auto failure = spy.verification_error()) {
        std::cout << failure->chain_length() << " violation(s):\n" << failure->what() << "\n";
    }
}

void failing_work(OrderRepository& repository) {
    section("failing work");
    sniffer::Spy spy;
    try {
        spy.expect_at_most_once().run([&repository] { repository.archive(7); });
    } catch (const RepositoryError& e) {
        std::cout << "work failed: " << e.what() << "\n";
        for (const auto& suppressed : e.suppressed()) {
            try {
                std::rethrow_exception(suppressed);
            } catch (const sniffer::VerificationError& failure) {
                std::cout << "also: " << failure.what() << "\n";
            } catch (const std::exception& other) {
                std::cout << "also: " << other.what() << "\n";
            }
        }
    }
}

}  // namespace

auto main() -> int {
    sniffer::configure({.max_reported_statements = 3, .log_failures = false});
    OrderRepository repository;

    lazy_loading(repository);
    batched_loading(repository);
    background_thread(repository);
    several_violations(repository);
    failing_work(repository);
    return 0;
}
