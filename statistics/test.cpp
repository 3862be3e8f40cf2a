#include <chrono>
#include <cmath>
#include <stdexcept>
#include <vector>

#include "../testing/test_main.hpp"
#include "statistics.hxx"

using namespace std::chrono_literals;
using reqprof::nanoseconds;

namespace {

// Reference population standard deviation, computed independently of reduce().
auto population_stddev(const std::vector<double>& xs) -> double {
    double mean = 0;
    for (double x : xs) mean += x;
    mean /= static_cast<double>(xs.size());
    double acc = 0;
    for (double x : xs) acc += (x - mean) * (x - mean);
    return std::sqrt(acc / static_cast<double>(xs.size()));
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Basic reductions
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("reduce – basics")

TEST_CASE("empty sample set is rejected") {
    std::vector<nanoseconds> none;
    expect_throws(std::invalid_argument, (void)reqprof::reduce(none));
}

TEST_CASE("single sample: min, max, mean and total are the sample, stddev is zero") {
    std::vector<nanoseconds> one{1500ns};
    auto s = reqprof::reduce(one);
    expect(s.count).to_equal(1);
    expect(s.total).to_equal(1500ns);
    expect(s.min).to_equal(1500ns);
    expect(s.max).to_equal(1500ns);
    expect(s.mean.count()).to_approx_equal(1500.0);
    expect(s.median.count()).to_approx_equal(1500.0);
    expect(s.stddev.count()).to_approx_equal(0.0);
}

TEST_CASE("total, min and max over unordered samples") {
    std::vector<nanoseconds> xs{30ns, 10ns, 50ns, 20ns, 40ns};
    auto s = reqprof::reduce(xs);
    expect(s.total).to_equal(150ns);
    expect(s.min).to_equal(10ns);
    expect(s.max).to_equal(50ns);
}

TEST_CASE("mean equals total divided by count") {
    std::vector<nanoseconds> xs{1ms, 2ms, 4ms};
    auto s = reqprof::reduce(xs);
    expect(s.mean.count()).to_approx_equal(static_cast<double>(s.total.count()) / 3.0, 1e-6);
}

TEST_CASE("stddev uses population variance (divide by N)") {
    // {2,4,4,4,5,5,7,9}: population stddev is exactly 2, sample stddev would be ~2.138
    std::vector<nanoseconds> xs{2ns, 4ns, 4ns, 4ns, 5ns, 5ns, 7ns, 9ns};
    auto s = reqprof::reduce(xs);
    expect(s.stddev.count()).to_approx_equal(2.0, 1e-9);
}

TEST_CASE("stddev matches an independent population formula") {
    std::vector<nanoseconds> xs{1200ns, 980ns, 1010ns, 1500ns, 870ns, 1333ns, 999ns};
    std::vector<double> raw;
    for (auto x : xs) raw.push_back(static_cast<double>(x.count()));
    auto s = reqprof::reduce(xs);
    expect(s.stddev.count()).to_approx_equal(population_stddev(raw), 1e-9);
}

TEST_CASE("median of an odd count is the middle element") {
    std::vector<nanoseconds> xs{9ns, 1ns, 5ns};
    expect(reqprof::reduce(xs).median.count()).to_approx_equal(5.0);
}

TEST_CASE("median of an even count averages the two middle elements") {
    std::vector<nanoseconds> xs{4ns, 1ns, 3ns, 2ns};
    expect(reqprof::reduce(xs).median.count()).to_approx_equal(2.5);
}

TEST_CASE("reduce leaves the caller's ordering untouched") {
    std::vector<nanoseconds> xs{3ns, 1ns, 2ns};
    (void)reqprof::reduce(xs);
    expect(xs[0]).to_equal(3ns);
    expect(xs[1]).to_equal(1ns);
    expect(xs[2]).to_equal(2ns);
}

// ─────────────────────────────────────────────────────────────────────────────
// Precision
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("reduce – precision")

TEST_CASE("sub-microsecond mean is not truncated") {
    std::vector<nanoseconds> xs{1ns, 2ns};
    expect(reqprof::reduce(xs).mean.count()).to_approx_equal(1.5);
}

TEST_CASE("identical samples give zero stddev and mean equal to every sample") {
    std::vector<nanoseconds> xs(100, 1ms);
    auto s = reqprof::reduce(xs);
    expect(s.stddev.count()).to_approx_equal(0.0);
    expect(s.mean.count()).to_approx_equal(1e6);
    expect(s.total).to_equal(100ms);
}

TEST_CASE("min <= mean <= max holds for skewed samples") {
    std::vector<nanoseconds> xs{1ns, 1ns, 1ns, 1ns, 1s};
    auto s = reqprof::reduce(xs);
    expect(s.min <= s.mean).to_be_true();
    expect(s.mean <= s.max).to_be_true();
}
