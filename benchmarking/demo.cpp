/**
 * @file demo.cpp
 * @brief Benchmarks a small in-process request dispatcher with benchmark.hxx.
 *
 * Simulates an order service with:
 *  - A synchronous lookup handler.
 *  - An asynchronous handler returning std::future.
 *  - A command handler with no response.
 *  - A long run cancelled from another thread through a std::stop_source.
 *
 * Run:
 *   ./benchmark_demo             # results table on stdout
 *   ./benchmark_demo verbose     # plus DEBUG lines from the runner
 */

#include <chrono>
#include <cstring>
#include <future>
#include <iostream>
#include <map>
#include <numeric>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "../logger/logger.hxx"
#include "benchmark.hxx"

// ── Fake domain ──────────────────────────────────────────────────────────────

struct get_order {
    int id = 0;
};

struct place_order {
    int customer = 0;
    std::vector<int> items;
};

struct order {
    int id = 0;
    double total = 0.0;
};

class order_service {
   public:
    order_service() {
        for (int i = 0; i < 1000; ++i) {
            orders_[i] = order{i, i * 1.25};
        }
    }

    auto send(const get_order& req, std::stop_token /*token*/) -> order { return orders_.at(req.id % 1000); }

    void send(const place_order& req, std::stop_token /*token*/) {
        const double total = std::accumulate(req.items.begin(), req.items.end(), 0.0);
        const int id = next_id_++;
        orders_[id] = order{id, total};
    }

   private:
    std::map<int, order> orders_;
    int next_id_ = 1000;
};

/// Same lookups, answered from a worker thread.
class async_order_service {
   public:
    auto send(const get_order& req, std::stop_token /*token*/) -> std::future<order> {
        return std::async(std::launch::async, [id = req.id] {
            std::this_thread::sleep_for(std::chrono::microseconds(200));
            return order{id, 0.0};
        });
    }
};

// ─────────────────────────────────────────────────────────────────────────────

auto main(int argc, char** argv) -> int {
    reqprof::log_init();
    const bool verbose = argc > 1 && std::strcmp(argv[1], "verbose") == 0;
    reqprof::logger::get_instance().set_min_level(verbose ? reqprof::log_level::DEBUG : reqprof::log_level::INFO);

    reqprof::benchmark_runner runner;
    std::vector<reqprof::benchmark_result> results;

    order_service service;
    results.push_back(runner.run_dispatch(service, get_order{42}, {.iterations = 10'000, .request_type = "GetOrder", .handler_type = "order_service"}));
    results.push_back(runner.run_dispatch(service, place_order{7, {3, 5, 8}}, {.iterations = 2'000, .request_type = "PlaceOrder"}));

    async_order_service async_service;
    results.push_back(runner.run_dispatch(async_service, get_order{1}, {.iterations = 200, .request_type = "GetOrder (async)"}));

    // Plain callable, labeled by hand
    results.push_back(runner.run([] { return std::string(256, 'x'); }, {.iterations = 50'000, .request_type = "alloc 256 B"}));

    // Cancel a long run from a watchdog thread
    std::stop_source stop;
    std::jthread watchdog([&stop] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        stop.request_stop();
    });
    try {
        (void)runner.run([] { std::this_thread::sleep_for(std::chrono::milliseconds(1)); }, 10'000, stop.get_token());
    } catch (const reqprof::cancelled_error& e) {
        REQPROF_LOG_INFO << "watchdog stopped the long run: " << e.what();
    }

    reqprof::print_results(std::cout, results);
    return 0;
}
