#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../testing/test_main.hpp"
#include "profile_report.hxx"

using namespace std::chrono_literals;
using reqprof::operation_metrics;
using reqprof::performance_thresholds;
using reqprof::profile_report;
using reqprof::profile_session;

namespace {

auto make_session(const std::string& name) -> std::shared_ptr<profile_session> {
    auto session = std::make_shared<profile_session>(name);
    session->start();
    session->add_operation(operation_metrics{.name = "parse", .duration = 100ms, .memory_used = 1024, .allocations = 10});
    session->add_operation(operation_metrics{.name = "render", .duration = 200ms, .memory_used = 2048, .allocations = 20});
    session->stop();
    return session;
}

auto count_of(const std::string& text, const std::string& needle) -> std::size_t {
    std::size_t count = 0;
    for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

// Splits the summary row (third line) of a csv report into its fields.
auto csv_summary_fields(const std::string& csv) -> std::vector<std::string> {
    std::istringstream lines(csv);
    std::string line;
    for (int i = 0; i < 3; ++i) {
        std::getline(lines, line);
    }
    std::vector<std::string> fields;
    std::istringstream row(line);
    for (std::string field; std::getline(row, field, ',');) {
        fields.push_back(field);
    }
    return fields;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Formatting helpers
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("report_detail")

TEST_CASE("format_bytes keeps bytes exact and scales larger values") {
    using reqprof::report_detail::format_bytes;
    expect(format_bytes(0)).to_equal("0 B");
    expect(format_bytes(512)).to_equal("512 B");
    expect(format_bytes(1536)).to_equal("1.50 KB");
    expect(format_bytes(3LL * 1024 * 1024)).to_equal("3.00 MB");
}

TEST_CASE("format_ms prints two decimals") {
    expect(reqprof::report_detail::format_ms(1500us)).to_equal("1.50 ms");
}

TEST_CASE("escape_json escapes quotes, backslashes and control characters") {
    using reqprof::report_detail::escape_json;
    expect(escape_json("a\"b")).to_equal("a\\\"b");
    expect(escape_json("c:\\tmp")).to_equal("c:\\\\tmp");
    expect(escape_json("line\nbreak")).to_equal("line\\nbreak");
    expect(escape_json(std::string("\x01", 1))).to_equal("\\u0001");
}

TEST_CASE("escape_csv quotes only when needed") {
    using reqprof::report_detail::escape_csv;
    expect(escape_csv("plain")).to_equal("plain");
    expect(escape_csv("a,b")).to_equal("\"a,b\"");
    expect(escape_csv("say \"hi\"")).to_equal("\"say \"\"hi\"\"\"");
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction and thresholds
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("profile_report – thresholds")

TEST_CASE("a null session is rejected") {
    expect_throws(std::invalid_argument, profile_report report(nullptr));
}

TEST_CASE("no thresholds means no warnings") {
    profile_report report(make_session("quiet"));
    expect(report.warnings().empty()).to_be_true();
}

TEST_CASE("limits that are not exceeded produce no warnings") {
    performance_thresholds limits{
        .max_duration = 1h,
        .max_memory = 3072,
        .max_allocations = 30,
        .max_operation_duration = 200ms,
        .max_operation_memory = 2048,
    };
    profile_report report(make_session("at-limit"), limits);
    expect(report.warnings().empty()).to_be_true();
}

TEST_CASE("session totals above their limits are reported") {
    performance_thresholds limits{.max_memory = 3000, .max_allocations = 29};
    profile_report report(make_session("totals"), limits);
    expect(report.warnings().size()).to_equal(2);
    expect(report.warnings()[0]).to_contain("Total memory usage 3.00 KB exceeds threshold");
    expect(report.warnings()[1]).to_contain("Total allocations 30 exceeds threshold 29");
}

TEST_CASE("session duration above its limit is reported") {
    performance_thresholds limits{.max_duration = 0ns};
    profile_report report(make_session("slow"), limits);
    expect(report.warnings().size()).to_equal(1);
    expect(report.warnings()[0]).to_contain("Session duration");
}

TEST_CASE("each operation is checked on its own") {
    performance_thresholds limits{.max_operation_duration = 150ms, .max_operation_memory = 1500};
    profile_report report(make_session("per-op"), limits);
    expect(report.warnings().size()).to_equal(2);
    expect(report.warnings()[0]).to_contain("Operation 'render' duration 200.00 ms exceeds threshold 150.00 ms");
    expect(report.warnings()[1]).to_contain("Operation 'render' memory usage 2.00 KB");
}

// ─────────────────────────────────────────────────────────────────────────────
// Renderings
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("profile_report – renderings")

TEST_CASE("console report lists the summary and every operation") {
    profile_report report(make_session("console"));
    const std::string text = report.to_console();
    expect(text).to_contain("Performance Profile Report: console");
    expect(text).to_contain("Total Memory Used: 3.00 KB");
    expect(text).to_contain("Total Allocations: 30");
    expect(text).to_contain("Operations Count: 2");
    expect(text).to_contain("Average Operation Duration: 150.00 ms");
    expect(text).to_contain("  - parse: 100.00 ms, 1.00 KB, 10 allocations");
    expect(text.find("Warnings:") == std::string::npos).to_be_true();
}

TEST_CASE("console report shows warnings when present") {
    profile_report report(make_session("warned"), performance_thresholds{.max_allocations = 1});
    expect(report.to_console()).to_contain("Warnings:\n  ! Total allocations 30 exceeds threshold 1");
}

TEST_CASE("json report carries totals, operations and warnings") {
    profile_report report(make_session("json \"quoted\""), performance_thresholds{.max_memory = 1});
    const std::string json = report.to_json();
    expect(json).to_contain("\"SessionName\": \"json \\\"quoted\\\"\"");
    expect(json).to_contain("\"TotalMemoryUsed\": 3072");
    expect(json).to_contain("\"TotalAllocations\": 30");
    expect(json).to_contain("\"AverageOperationDurationMs\": 150.000");
    expect(json).to_contain("{\"Name\": \"parse\", \"DurationMs\": 100.000, \"MemoryUsed\": 1024, \"Allocations\": 10}");
    expect(count_of(json, "\"Name\"")).to_equal(2);
    expect(json).to_contain("\"Warnings\": [\"Total memory usage");
}

TEST_CASE("json report of an empty session has empty arrays") {
    auto session = std::make_shared<profile_session>("empty");
    profile_report report(session);
    const std::string json = report.to_json();
    expect(json).to_contain("\"Operations\": [],");
    expect(json).to_contain("\"Warnings\": []");
}

TEST_CASE("csv report has a summary row and one row per operation") {
    profile_report report(make_session("csv,name"));
    const std::string csv = report.to_csv();
    expect(csv).to_contain("Session Summary\nSessionName,DurationMs,TotalMemoryUsed,TotalAllocations,OperationsCount\n\"csv,name\",");
    expect(csv).to_contain(",3072,30,2\n");
    expect(csv).to_contain("Name,DurationMs,MemoryUsed,Allocations\nparse,100.000,1024,10\nrender,200.000,2048,20\n");
    expect(csv.find("Warnings") == std::string::npos).to_be_true();
}

TEST_CASE("renderings of a running session include operations added later") {
    auto session = std::make_shared<profile_session>("live");
    session->start();
    profile_report report(session);
    session->add_operation(operation_metrics{.name = "late", .duration = 1ms});
    expect(report.to_console()).to_contain("late");
}

TEST_CASE("csv summary row stays self-consistent while operations are appended") {
    auto session = std::make_shared<profile_session>("appending");
    session->start();
    std::atomic<bool> done{false};

    std::thread appender([&] {
        for (int i = 0; i < 2000; ++i) {
            session->add_operation(operation_metrics{.name = "step", .duration = 1us, .memory_used = 3, .allocations = 1});
            std::this_thread::yield();
        }
        done.store(true);
    });

    int malformed = 0;
    int mismatched = 0;
    while (!done.load()) {
        const auto fields = csv_summary_fields(profile_report(session).to_csv());
        if (fields.size() != 5) {
            ++malformed;
            continue;
        }
        const auto memory = std::stoll(fields[2]);
        const auto allocations = std::stoll(fields[3]);
        const auto count = std::stoll(fields[4]);
        if (memory != 3 * count || allocations != count) {
            ++mismatched;
        }
    }
    appender.join();

    expect(malformed).to_equal(0);
    expect(mismatched).to_equal(0);
    const auto fields = csv_summary_fields(profile_report(session).to_csv());
    expect(fields.size()).to_equal(5);
    expect(fields[4]).to_equal("2000");
    expect(fields[2]).to_equal("6000");
}
