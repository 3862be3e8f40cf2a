/**
 * @file demo.cpp
 * @brief Profiles a simulated import job with profiler.hxx and prints the report in every format.
 *
 * Run:
 *   ./profiler_demo           # console report
 *   ./profiler_demo json      # JSON report
 *   ./profiler_demo csv       # CSV report
 */

#include <algorithm>
#include <chrono>
#include <iostream>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

#include "../logger/logger.hxx"
#include "profiler.hxx"

REQPROF_INSTALL_ALLOCATION_COUNTER()

// ── Fake workload ────────────────────────────────────────────────────────────

static auto load_rows(std::size_t count) -> std::vector<std::string> {
    std::vector<std::string> rows;
    rows.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        rows.push_back("row-" + std::to_string(i) + ",customer-" + std::to_string(i % 97) + "," + std::to_string(i * 3));
    }
    return rows;
}

static auto checksum(const std::vector<std::string>& rows) -> std::size_t {
    return std::accumulate(rows.begin(), rows.end(), std::size_t{0}, [](std::size_t acc, const std::string& row) { return acc + row.size(); });
}

// ─────────────────────────────────────────────────────────────────────────────

auto main(int argc, char** argv) -> int {
    reqprof::log_init();

    reqprof::counting_memory_probe probe;
    reqprof::performance_profiler profiler(probe);

    (void)profiler.start_session("nightly-import");

    auto rows = profiler.profile("load", [] { return load_rows(20'000); });
    profiler.profile("sort", [&rows] { std::sort(rows.begin(), rows.end()); });
    const auto sum = profiler.profile("checksum", [&rows] { return checksum(rows); });
    profiler.profile("flush", [] { std::this_thread::sleep_for(std::chrono::milliseconds(15)); });

    REQPROF_LOG_INFO << "imported " << rows.size() << " rows, checksum " << sum;
    profiler.stop_active_session();

    const reqprof::performance_thresholds limits{
        .max_duration = std::chrono::seconds(5),
        .max_operation_duration = std::chrono::milliseconds(10),
        .max_operation_memory = 512 * 1024,
    };
    const auto report = profiler.generate_report("nightly-import", limits);

    const std::string format = argc > 1 ? argv[1] : "console";
    if (format == "json") {
        std::cout << report.to_json();
    } else if (format == "csv") {
        std::cout << report.to_csv();
    } else {
        std::cout << report.to_console();
    }

    for (const auto& warning : report.warnings()) {
        REQPROF_LOG_WARN << warning;
    }
    return 0;
}
