#include <atomic>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <thread>
#include <vector>

#include "../testing/test_main.hpp"
#include "profile_session.hxx"

using namespace std::chrono_literals;
using reqprof::invalid_state_error;
using reqprof::operation_metrics;
using reqprof::profile_session;
using reqprof::session_state;

namespace {

auto op(const std::string& name, std::chrono::nanoseconds duration, std::int64_t memory = 0, std::int64_t allocations = 0) -> operation_metrics {
    return operation_metrics{.name = name, .duration = duration, .memory_used = memory, .allocations = allocations};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("profile_session – construction")

TEST_CASE("new session is not started and empty") {
    profile_session s("fresh");
    expect(s.name()).to_equal("fresh");
    expect(s.state()).to_equal(session_state::not_started);
    expect(s.is_running()).to_be_false();
    expect(s.start_time().has_value()).to_be_false();
    expect(s.end_time().has_value()).to_be_false();
    expect(s.duration()).to_equal(0ns);
    expect(s.operations().empty()).to_be_true();
    expect(s.total_memory_used()).to_equal(0);
    expect(s.total_allocations()).to_equal(0);
    expect(s.average_operation_duration()).to_equal(0ns);
}

TEST_CASE("empty session name is rejected and the message names the parameter") {
    expect_throws_with(std::invalid_argument, "session_name", profile_session s(""));
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("profile_session – lifecycle")

TEST_CASE("start moves to running and records a start time") {
    profile_session s("start");
    s.start();
    expect(s.is_running()).to_be_true();
    expect(s.start_time().has_value()).to_be_true();
    expect(s.end_time().has_value()).to_be_false();
}

TEST_CASE("stop moves to stopped and records an end time after the start time") {
    profile_session s("stop");
    s.start();
    std::this_thread::sleep_for(2ms);
    s.stop();
    expect(s.state()).to_equal(session_state::stopped);
    expect(s.end_time().has_value()).to_be_true();
    expect(*s.end_time() >= *s.start_time()).to_be_true();
}

TEST_CASE("second start fails with already running and changes nothing") {
    profile_session s("double-start");
    s.start();
    const auto first_start = s.start_time();
    std::this_thread::sleep_for(1ms);
    expect_throws_with(invalid_state_error, "already running", s.start());
    expect(s.is_running()).to_be_true();
    expect(s.start_time() == first_start).to_be_true();
}

TEST_CASE("stop without start fails with not running and leaves end time unset") {
    profile_session s("stop-first");
    expect_throws_with(invalid_state_error, "not running", s.stop());
    expect(s.state()).to_equal(session_state::not_started);
    expect(s.end_time().has_value()).to_be_false();
}

TEST_CASE("second stop fails and keeps the first end time") {
    profile_session s("double-stop");
    s.start();
    s.stop();
    const auto first_end = s.end_time();
    expect_throws(invalid_state_error, s.stop());
    expect(s.end_time() == first_end).to_be_true();
}

TEST_CASE("restart after stop opens a new window and keeps operations") {
    profile_session s("restart");
    s.start();
    s.add_operation(op("a", 1ms));
    s.stop();
    s.start();
    expect(s.is_running()).to_be_true();
    expect(s.end_time().has_value()).to_be_false();
    expect(s.operation_count()).to_equal(1);
}

// ─────────────────────────────────────────────────────────────────────────────
// Duration
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("profile_session – duration")

TEST_CASE("duration grows while running") {
    profile_session s("live");
    s.start();
    auto d1 = s.duration();
    std::this_thread::sleep_for(5ms);
    auto d2 = s.duration();
    expect(d2 > d1).to_be_true();
}

TEST_CASE("duration is frozen after stop") {
    profile_session s("frozen");
    s.start();
    std::this_thread::sleep_for(10ms);
    s.stop();
    auto d1 = s.duration();
    std::this_thread::sleep_for(5ms);
    auto d2 = s.duration();
    expect(d1).to_equal(d2);
    expect(d1 >= 10ms).to_be_true();
}

// ─────────────────────────────────────────────────────────────────────────────
// Recording
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("profile_session – recording")

TEST_CASE("running sums and average follow the added operations") {
    profile_session s("sums");
    s.add_operation(op("m1", 10ms, 100, 5));
    s.add_operation(op("m2", 20ms, 200, 10));
    expect(s.total_memory_used()).to_equal(300);
    expect(s.total_allocations()).to_equal(15);
    expect(s.average_operation_duration()).to_equal(15ms);
}

TEST_CASE("operations keep insertion order") {
    profile_session s("order");
    s.add_operation(op("first", 1ms));
    s.add_operation(op("second", 2ms));
    s.add_operation(op("third", 3ms));
    expect(s.operations()[0].name).to_equal("first");
    expect(s.operations()[1].name).to_equal("second");
    expect(s.operations().back().name).to_equal("third");
}

TEST_CASE("add_operation works in every state") {
    profile_session s("any-state");
    s.add_operation(op("before", 1ms));
    s.start();
    s.add_operation(op("during", 1ms));
    s.stop();
    s.add_operation(op("after", 1ms));
    expect(s.operation_count()).to_equal(3);
}

TEST_CASE("invalid records are rejected without touching the session") {
    profile_session s("invalid");
    s.add_operation(op("ok", 1ms, 10, 1));
    expect_throws_with(std::invalid_argument, "metrics.name", s.add_operation(op("", 1ms)));
    expect_throws(std::invalid_argument, s.add_operation(op("neg-duration", -1ms)));
    expect_throws(std::invalid_argument, s.add_operation(op("neg-memory", 1ms, -1)));
    expect_throws(std::invalid_argument, s.add_operation(op("neg-allocs", 1ms, 0, -1)));
    expect(s.operation_count()).to_equal(1);
    expect(s.total_memory_used()).to_equal(10);
    expect(s.total_allocations()).to_equal(1);
}

TEST_CASE("zero memory is accepted") {
    profile_session s("zero");
    expect_no_throw(s.add_operation(op("free", 1ms, 0, 0)));
}

TEST_CASE("clear empties operations and sums but keeps state and start time") {
    profile_session s("clear");
    s.start();
    const auto started = s.start_time();
    s.add_operation(op("a", 1ms, 64, 2));
    s.add_operation(op("b", 3ms, 32, 1));
    s.clear();
    expect(s.operations().empty()).to_be_true();
    expect(s.total_memory_used()).to_equal(0);
    expect(s.total_allocations()).to_equal(0);
    expect(s.average_operation_duration()).to_equal(0ns);
    expect(s.is_running()).to_be_true();
    expect(s.start_time() == started).to_be_true();
}

// ─────────────────────────────────────────────────────────────────────────────
// operations() view
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("profile_session – operations view")

TEST_CASE("operations() returns the same view object on every call") {
    profile_session s("identity");
    const auto* first = &s.operations();
    s.add_operation(op("a", 1ms));
    expect(&s.operations() == first).to_be_true();
}

TEST_CASE("a cached view reflects later appends") {
    profile_session s("live-view");
    const auto& view = s.operations();
    expect(view.size()).to_equal(0);
    s.add_operation(op("a", 1ms));
    s.add_operation(op("b", 1ms));
    expect(view.size()).to_equal(2);
    expect(view.at(1).name).to_equal("b");
}

TEST_CASE("at() past the end throws out_of_range") {
    profile_session s("bounds");
    expect_throws(std::out_of_range, (void)s.operations().at(0));
    expect_throws(std::out_of_range, (void)s.operations().back());
}

TEST_CASE("snapshot is a detached copy") {
    profile_session s("snapshot");
    s.add_operation(op("a", 1ms));
    auto copy = s.operations().snapshot();
    s.add_operation(op("b", 1ms));
    expect(copy.size()).to_equal(1);
    expect(s.operations().size()).to_equal(2);
}

// ─────────────────────────────────────────────────────────────────────────────
// Scenario from the recording walkthrough
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("profile_session – scenario")

TEST_CASE("S1: two operations, start and stop") {
    profile_session s("S1");
    s.start();
    s.add_operation(op("first", 100ms, 1024, 10));
    s.add_operation(op("second", 200ms, 2048, 20));
    s.stop();

    expect(s.operations().size()).to_equal(2);
    expect(s.total_memory_used()).to_equal(3072);
    expect(s.total_allocations()).to_equal(30);
    expect(s.average_operation_duration()).to_equal(150ms);
    auto d1 = s.duration();
    expect(d1 > 0ns).to_be_true();
    std::this_thread::sleep_for(2ms);
    expect(s.duration()).to_equal(d1);
}

TEST_CASE("summary captures operations, sums, average and duration together") {
    profile_session s("S1-summary");
    s.start();
    s.add_operation(op("first", 100ms, 1024, 10));
    s.add_operation(op("second", 200ms, 2048, 20));
    s.stop();

    const auto summary = s.summary();
    expect(summary.operations.size()).to_equal(2);
    expect(summary.operations[1].name).to_equal("second");
    expect(summary.total_memory_used).to_equal(3072);
    expect(summary.total_allocations).to_equal(30);
    expect(summary.average_operation_duration).to_equal(150ms);
    expect(summary.duration).to_equal(s.duration());
    expect(summary.state).to_equal(session_state::stopped);
}

TEST_CASE("summary of a fresh session is empty") {
    profile_session s("empty-summary");
    const auto summary = s.summary();
    expect(summary.operations.empty()).to_be_true();
    expect(summary.total_memory_used).to_equal(0);
    expect(summary.average_operation_duration).to_equal(0ns);
    expect(summary.duration).to_equal(0ns);
    expect(summary.state).to_equal(session_state::not_started);
}

// ─────────────────────────────────────────────────────────────────────────────
// Concurrency
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("profile_session – concurrency")

TEST_CASE("concurrent add_operation from many threads loses nothing") {
    profile_session s("parallel-add");
    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 500;
    std::vector<std::thread> workers;
    for (int t = 0; t < THREADS; ++t) {
        workers.emplace_back([&s] {
            for (int i = 0; i < PER_THREAD; ++i) {
                s.add_operation(op("op", 1us, 2, 1));
            }
        });
    }
    for (auto& w : workers) w.join();
    expect(s.operation_count()).to_equal(THREADS * PER_THREAD);
    expect(s.total_memory_used()).to_equal(2 * THREADS * PER_THREAD);
    expect(s.total_allocations()).to_equal(THREADS * PER_THREAD);
}

TEST_CASE("start/stop racing add_operation keeps counts and sums consistent") {
    profile_session s("race");
    std::atomic<bool> done{false};
    std::atomic<int> added{0};
    std::atomic<int> unexpected{0};
    std::atomic<int> torn{0};

    std::thread toggler([&] {
        while (!done.load()) {
            try {
                s.start();
            } catch (const invalid_state_error&) {
            }
            try {
                s.stop();
            } catch (const invalid_state_error&) {
            }
        }
    });

    std::thread adder([&] {
        for (int i = 0; i < 2000; ++i) {
            try {
                s.add_operation(op("racing", 1us, 3, 1));
                ++added;
            } catch (...) {
                ++unexpected;
            }
        }
        done.store(true);
    });

    std::thread reader([&] {
        while (!done.load()) {
            const auto summary = s.summary();
            const auto count = static_cast<std::int64_t>(summary.operations.size());
            if (summary.total_memory_used != 3 * count || summary.total_allocations != count) {
                ++torn;
            }
        }
    });

    adder.join();
    toggler.join();
    reader.join();

    expect(unexpected.load()).to_equal(0);
    expect(torn.load()).to_equal(0);
    expect(s.operation_count()).to_equal(static_cast<std::size_t>(added.load()));
    expect(s.total_memory_used()).to_equal(3LL * added.load());
    expect(s.total_allocations()).to_equal(static_cast<std::int64_t>(added.load()));
}
