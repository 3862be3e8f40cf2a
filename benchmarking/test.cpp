#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <sstream>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "../testing/test_main.hpp"
#include "benchmark.hxx"

using namespace std::chrono_literals;
using reqprof::benchmark_options;
using reqprof::benchmark_result;
using reqprof::benchmark_runner;
using reqprof::cancelled_error;

namespace {

// Probe returning scripted readings: the forced one first, then the unforced one.
class scripted_probe final : public reqprof::memory_probe {
   public:
    scripted_probe(std::int64_t before, std::int64_t after) : before_(before), after_(after) {}

    auto current_allocated_bytes(bool force_collection) -> std::int64_t override {
        calls.push_back(force_collection);
        return force_collection ? before_ : after_;
    }

    std::vector<bool> calls;

   private:
    std::int64_t before_;
    std::int64_t after_;
};

struct ping {
    int id = 0;
};

struct pong {
    int id = 0;
};

struct echo_dispatcher {
    int sent = 0;
    auto send(const ping& req, std::stop_token /*token*/) -> pong {
        ++sent;
        return pong{req.id};
    }
};

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Iteration and sampling
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("benchmark_runner – iterations")

TEST_CASE("operation is invoked exactly N times") {
    scripted_probe probe(0, 0);
    benchmark_runner runner(probe);
    int calls = 0;
    auto res = runner.run([&] { ++calls; }, 37);
    expect(calls).to_equal(37);
    expect(res.iterations).to_equal(37);
}

TEST_CASE("default iteration count is 100") {
    scripted_probe probe(0, 0);
    benchmark_runner runner(probe);
    int calls = 0;
    auto res = runner.run([&] { ++calls; });
    expect(calls).to_equal(100);
    expect(res.iterations).to_equal(benchmark_options::DEFAULT_ITERATIONS);
}

TEST_CASE("zero iterations is rejected before anything runs") {
    scripted_probe probe(0, 0);
    benchmark_runner runner(probe);
    int calls = 0;
    expect_throws(std::invalid_argument, (void)runner.run([&] { ++calls; }, 0));
    expect(calls).to_equal(0);
    expect(probe.calls.empty()).to_be_true();
}

TEST_CASE("invocations never overlap") {
    scripted_probe probe(0, 0);
    benchmark_runner runner(probe);
    std::atomic<int> in_flight{0};
    std::atomic<int> max_seen{0};
    (void)runner.run(
        [&] {
            return std::async(std::launch::async, [&] {
                const int now = ++in_flight;
                if (now > max_seen.load()) max_seen.store(now);
                std::this_thread::sleep_for(100us);
                --in_flight;
            });
        },
        20);
    expect(max_seen.load()).to_equal(1);
}

TEST_CASE("sleeping 1ms gives a mean of at least 1ms and consistent totals") {
    scripted_probe probe(0, 0);
    benchmark_runner runner(probe);
    auto res = runner.run([] { std::this_thread::sleep_for(1ms); }, 10);
    expect(res.iterations).to_equal(10);
    expect(res.mean_time >= 1ms).to_be_true();
    expect(res.min_time >= 1ms).to_be_true();
    expect(res.min_time <= res.max_time).to_be_true();
    expect(res.total_time >= 10ms).to_be_true();
    expect(res.standard_deviation.count() >= 0.0).to_be_true();
}

TEST_CASE("a fixed 1ms operation gives tight statistics over 100 iterations") {
    scripted_probe probe(0, 0);
    benchmark_runner runner(probe);
    // Spin on the same clock the runner uses so every sample is just over 1ms.
    auto spin_1ms = [] {
        const auto until = benchmark_runner::clock::now() + 1ms;
        while (benchmark_runner::clock::now() < until) {
        }
    };
    auto res = runner.run(spin_1ms, 100);
    expect(res.iterations).to_equal(100);
    expect(res.min_time >= 1ms).to_be_true();
    expect(res.median_time < 1500us).to_be_true();
    expect(res.mean_time.count()).to_approx_equal(static_cast<double>(res.total_time.count()) / 100.0, 1.0);
    expect(res.standard_deviation < 2ms).to_be_true();
}

TEST_CASE("value-returning operations are supported") {
    scripted_probe probe(0, 0);
    benchmark_runner runner(probe);
    int calls = 0;
    auto res = runner.run([&] { return std::string(16, static_cast<char>('a' + (calls++ % 26))); }, 5);
    expect(calls).to_equal(5);
    expect(res.iterations).to_equal(5);
}

TEST_CASE("future-returning operations are awaited inside the timed region") {
    scripted_probe probe(0, 0);
    benchmark_runner runner(probe);
    auto res = runner.run([] { return std::async(std::launch::async, [] { std::this_thread::sleep_for(2ms); return 1; }); }, 3);
    expect(res.min_time >= 2ms).to_be_true();
}

TEST_CASE("timestamp is taken at the start of the run") {
    scripted_probe probe(0, 0);
    benchmark_runner runner(probe);
    const auto before = std::chrono::system_clock::now();
    auto res = runner.run([] { std::this_thread::sleep_for(1ms); }, 3);
    const auto after = std::chrono::system_clock::now();
    expect(res.timestamp >= before).to_be_true();
    expect(res.timestamp <= after).to_be_true();
}

// ─────────────────────────────────────────────────────────────────────────────
// Memory snapshots
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("benchmark_runner – memory")

TEST_CASE("forced snapshot before the loop, unforced after") {
    scripted_probe probe(1000, 1500);
    benchmark_runner runner(probe);
    auto res = runner.run([] {}, 4);
    expect(probe.calls.size()).to_equal(2);
    expect(static_cast<bool>(probe.calls[0])).to_be_true();
    expect(static_cast<bool>(probe.calls[1])).to_be_false();
    expect(res.total_allocated_bytes).to_equal(500);
}

TEST_CASE("a negative delta is clamped to zero") {
    scripted_probe probe(5000, 1000);
    benchmark_runner runner(probe);
    auto res = runner.run([] {}, 2);
    expect(res.total_allocated_bytes).to_equal(0);
}

// ─────────────────────────────────────────────────────────────────────────────
// Cancellation and failures
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("benchmark_runner – cancellation")

TEST_CASE("a stop requested up front runs nothing") {
    scripted_probe probe(0, 0);
    benchmark_runner runner(probe);
    std::stop_source source;
    source.request_stop();
    int calls = 0;
    expect_throws(cancelled_error, (void)runner.run([&] { ++calls; }, 10, source.get_token()));
    expect(calls).to_equal(0);
}

TEST_CASE("a stop requested mid-run aborts before the next iteration") {
    scripted_probe probe(0, 0);
    benchmark_runner runner(probe);
    std::stop_source source;
    int calls = 0;
    auto op = [&] {
        if (++calls == 3) {
            source.request_stop();
        }
    };
    expect_throws_with(cancelled_error, "after 3 of 10", (void)runner.run(op, 10, source.get_token()));
    expect(calls).to_equal(3);
    expect(probe.calls.size()).to_equal(1);
}

TEST_CASE("exceptions from the operation propagate unchanged") {
    scripted_probe probe(0, 0);
    benchmark_runner runner(probe);
    int calls = 0;
    auto op = [&] {
        if (++calls == 2) {
            throw std::domain_error("handler blew up");
        }
    };
    expect_throws_with(std::domain_error, "handler blew up", (void)runner.run(op, 5));
    expect(calls).to_equal(2);
}

TEST_CASE("exceptions stored in a returned future propagate") {
    scripted_probe probe(0, 0);
    benchmark_runner runner(probe);
    auto op = [] {
        std::promise<int> promise;
        promise.set_exception(std::make_exception_ptr(std::overflow_error("async failure")));
        return promise.get_future();
    };
    expect_throws_with(std::overflow_error, "async failure", (void)runner.run(op, 3));
}

// ─────────────────────────────────────────────────────────────────────────────
// Dispatch and labels
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("benchmark_runner – dispatch")

TEST_CASE("run_dispatch sends the request N times") {
    scripted_probe probe(0, 0);
    benchmark_runner runner(probe);
    echo_dispatcher dispatcher;
    auto res = runner.run_dispatch(dispatcher, ping{7}, benchmark_options{.iterations = 12});
    expect(dispatcher.sent).to_equal(12);
    expect(res.iterations).to_equal(12);
}

TEST_CASE("run_dispatch fills empty labels with type names") {
    scripted_probe probe(0, 0);
    benchmark_runner runner(probe);
    echo_dispatcher dispatcher;
    auto res = runner.run_dispatch(dispatcher, ping{}, benchmark_options{.iterations = 1});
    expect(res.request_type).to_contain("ping");
    expect(res.handler_type).to_contain("echo_dispatcher");
}

TEST_CASE("explicit labels are kept") {
    scripted_probe probe(0, 0);
    benchmark_runner runner(probe);
    echo_dispatcher dispatcher;
    auto res = runner.run_dispatch(dispatcher, ping{}, benchmark_options{.iterations = 1, .request_type = "GetUser", .handler_type = "UserHandler"});
    expect(res.request_type).to_equal("GetUser");
    expect(res.handler_type).to_equal("UserHandler");
}

// ─────────────────────────────────────────────────────────────────────────────
// Formatting
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("benchmark – formatting")

TEST_CASE("format_time picks a readable unit") {
    using reqprof::fp_nanoseconds;
    expect(reqprof::format_time(fp_nanoseconds(12.0))).to_equal("12.00 ns");
    expect(reqprof::format_time(fp_nanoseconds(1500.0))).to_equal("1.50 µs");
    expect(reqprof::format_time(fp_nanoseconds(2'500'000.0))).to_equal("2.50 ms");
}

TEST_CASE("print_results lists every result label") {
    benchmark_result first{.request_type = "GetUser", .handler_type = "UserHandler", .iterations = 3};
    benchmark_result second{.request_type = "ListOrders", .iterations = 5};
    std::ostringstream out;
    reqprof::print_results(out, {first, second});
    const std::string text = out.str();
    expect(text).to_contain("GetUser → UserHandler");
    expect(text).to_contain("ListOrders");
    expect(text).to_contain("2 benchmarks completed");
}
