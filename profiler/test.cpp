#include <chrono>
#include <cstdint>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../testing/test_main.hpp"
#include "profiler.hxx"

using namespace std::chrono_literals;
using reqprof::invalid_state_error;
using reqprof::metrics_collector;
using reqprof::performance_profiler;
using reqprof::performance_thresholds;
using reqprof::profiler_not_started_error;

namespace {

// Each reading advances by a fixed step, so every measured call sees exactly one step.
class stepping_probe final : public reqprof::memory_probe {
   public:
    stepping_probe(std::int64_t byte_step, std::int64_t alloc_step) : byte_step_(byte_step), alloc_step_(alloc_step) {}

    auto current_allocated_bytes(bool /*force_collection*/) -> std::int64_t override { return bytes_ += byte_step_; }
    auto allocation_count() -> std::int64_t override { return allocs_ += alloc_step_; }

   private:
    std::int64_t byte_step_;
    std::int64_t alloc_step_;
    std::int64_t bytes_ = 0;
    std::int64_t allocs_ = 0;
};

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// metrics_collector
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("metrics_collector")

TEST_CASE("void callable yields metrics only") {
    stepping_probe probe(256, 3);
    metrics_collector collector(probe);
    bool ran = false;
    reqprof::operation_metrics metrics = collector.collect("touch", [&] { ran = true; });
    expect(ran).to_be_true();
    expect(metrics.name).to_equal("touch");
    expect(metrics.memory_used).to_equal(256);
    expect(metrics.allocations).to_equal(3);
    expect(metrics.end_time >= metrics.start_time).to_be_true();
}

TEST_CASE("value callable yields the value and metrics") {
    stepping_probe probe(0, 0);
    metrics_collector collector(probe);
    auto [value, metrics] = collector.collect("answer", [] { return 42; });
    expect(value).to_equal(42);
    expect(metrics.name).to_equal("answer");
}

TEST_CASE("duration covers the call") {
    stepping_probe probe(0, 0);
    metrics_collector collector(probe);
    auto metrics = collector.collect("nap", [] { std::this_thread::sleep_for(3ms); });
    expect(metrics.duration >= 3ms).to_be_true();
}

TEST_CASE("future results are awaited") {
    stepping_probe probe(0, 0);
    metrics_collector collector(probe);
    auto [value, metrics] = collector.collect("async", [] {
        return std::async(std::launch::async, [] {
            std::this_thread::sleep_for(2ms);
            return std::string("done");
        });
    });
    expect(value).to_equal("done");
    expect(metrics.duration >= 2ms).to_be_true();
}

TEST_CASE("shrinking memory is clamped to zero") {
    stepping_probe probe(-512, -1);
    metrics_collector collector(probe);
    auto metrics = collector.collect("free", [] {});
    expect(metrics.memory_used).to_equal(0);
    expect(metrics.allocations).to_equal(0);
}

TEST_CASE("empty name is rejected and the callable does not run") {
    metrics_collector collector;
    bool ran = false;
    expect_throws(std::invalid_argument, (void)collector.collect("", [&] { ran = true; }));
    expect(ran).to_be_false();
}

TEST_CASE("rates are per millisecond of duration") {
    reqprof::operation_metrics metrics{.name = "rate", .duration = 4ms, .memory_used = 1000, .allocations = 8};
    expect(metrics.memory_per_ms()).to_approx_equal(250.0);
    expect(metrics.allocations_per_ms()).to_approx_equal(2.0);
    reqprof::operation_metrics instant{.name = "instant"};
    expect(instant.memory_per_ms()).to_approx_equal(0.0);
}

// ─────────────────────────────────────────────────────────────────────────────
// performance_profiler – sessions
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("performance_profiler – sessions")

TEST_CASE("start_session creates a running, active session") {
    performance_profiler profiler;
    auto session = profiler.start_session("load");
    expect(session->is_running()).to_be_true();
    expect(profiler.active_session() == session).to_be_true();
    expect(profiler.get_session("load") == session).to_be_true();
}

TEST_CASE("duplicate and empty names are rejected") {
    performance_profiler profiler;
    (void)profiler.start_session("dup");
    expect_throws_with(invalid_state_error, "already exists", (void)profiler.start_session("dup"));
    expect_throws(std::invalid_argument, (void)profiler.start_session(""));
}

TEST_CASE("the newest session becomes active") {
    performance_profiler profiler;
    (void)profiler.start_session("first");
    auto second = profiler.start_session("second");
    expect(profiler.active_session() == second).to_be_true();
    expect(profiler.sessions().size()).to_equal(2);
}

TEST_CASE("stop_session stops it and clears the active slot") {
    performance_profiler profiler;
    auto session = profiler.start_session("s");
    profiler.stop_session("s");
    expect(session->is_running()).to_be_false();
    expect(profiler.active_session() == nullptr).to_be_true();
    expect_throws_with(invalid_state_error, "not running", profiler.stop_session("s"));
    expect_throws_with(invalid_state_error, "does not exist", profiler.stop_session("missing"));
}

TEST_CASE("stop_active_session requires an active session") {
    performance_profiler profiler;
    expect_throws(invalid_state_error, profiler.stop_active_session());
    auto session = profiler.start_session("a");
    profiler.stop_active_session();
    expect(session->is_running()).to_be_false();
}

TEST_CASE("get_session returns null for unknown names") {
    performance_profiler profiler;
    expect(profiler.get_session("nope") == nullptr).to_be_true();
}

TEST_CASE("remove_session and clear") {
    performance_profiler profiler;
    (void)profiler.start_session("a");
    (void)profiler.start_session("b");
    expect(profiler.remove_session("b")).to_be_true();
    expect(profiler.remove_session("b")).to_be_false();
    expect(profiler.active_session() == nullptr).to_be_true();
    profiler.clear();
    expect(profiler.sessions().empty()).to_be_true();
}

// ─────────────────────────────────────────────────────────────────────────────
// performance_profiler – profile()
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("performance_profiler – profile")

TEST_CASE("profile without an active session fails before running") {
    performance_profiler profiler;
    bool ran = false;
    expect_throws(profiler_not_started_error, profiler.profile("op", [&] { ran = true; }));
    expect(ran).to_be_false();
}

TEST_CASE("profile records into the active session and returns the value") {
    stepping_probe probe(100, 2);
    performance_profiler profiler(probe);
    auto session = profiler.start_session("record");
    const int value = profiler.profile("compute", [] { return 7; });
    profiler.profile("noop", [] {});
    expect(value).to_equal(7);
    expect(session->operation_count()).to_equal(2);
    expect(session->operations()[0].name).to_equal("compute");
    expect(session->total_memory_used()).to_equal(200);
    expect(session->total_allocations()).to_equal(4);
}

TEST_CASE("a throwing callable records nothing and the exception propagates") {
    performance_profiler profiler;
    auto session = profiler.start_session("throws");
    expect_throws_with(std::runtime_error, "boom", profiler.profile("bad", [] { throw std::runtime_error("boom"); }));
    expect(session->operation_count()).to_equal(0);
}

TEST_CASE("concurrent profile calls all land in the session") {
    performance_profiler profiler;
    auto session = profiler.start_session("parallel");
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&profiler] {
            for (int i = 0; i < 100; ++i) {
                profiler.profile("tick", [] {});
            }
        });
    }
    for (auto& w : workers) w.join();
    expect(session->operation_count()).to_equal(400);
}

// ─────────────────────────────────────────────────────────────────────────────
// performance_profiler – reports
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("performance_profiler – reports")

TEST_CASE("generate_report for a named session") {
    stepping_probe probe(4096, 1);
    performance_profiler profiler(probe);
    (void)profiler.start_session("reported");
    profiler.profile("heavy", [] {});
    profiler.stop_active_session();
    auto report = profiler.generate_report("reported", performance_thresholds{.max_operation_memory = 1024});
    expect(report.warnings().size()).to_equal(1);
    expect(report.to_console()).to_contain("Performance Profile Report: reported");
    expect_throws(invalid_state_error, (void)profiler.generate_report("absent"));
}

TEST_CASE("generate_active_report requires an active session") {
    performance_profiler profiler;
    expect_throws(invalid_state_error, (void)profiler.generate_active_report());
    (void)profiler.start_session("live");
    expect(profiler.generate_active_report().session()->name()).to_equal("live");
}
