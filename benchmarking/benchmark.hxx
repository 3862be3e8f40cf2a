#pragma once

/**
 * @file benchmark.hxx
 * @brief Benchmark runner for request-handling operations, with statistical output and colored reporting.
 * @version 2.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <typeinfo>
#include <utility>
#include <vector>

#ifndef _WIN32
#include <unistd.h>
#endif

#if defined(__GNUG__)
#include <cxxabi.h>
#endif

#include "../awaitable/awaitable.hxx"
#include "../errors/errors.hxx"
#include "../logger/logger.hxx"
#include "../memory_probe/memory_probe.hxx"
#include "../statistics/statistics.hxx"

// ─────────────────────────────────────────────────────────────────────────────
// ANSI colors  (mirrors testing::color)
// ─────────────────────────────────────────────────────────────────────────────
namespace reqprof::color {

inline auto enabled() -> bool {
#ifdef _WIN32
    return false;
#else
    static bool val = (isatty(fileno(stdout)) != 0);
    return val;
#endif
}

inline auto green(std::string_view s) -> std::string { return enabled() ? "\033[32m" + std::string(s) + "\033[0m" : std::string(s); }
inline auto yellow(std::string_view s) -> std::string { return enabled() ? "\033[33m" + std::string(s) + "\033[0m" : std::string(s); }
inline auto cyan(std::string_view s) -> std::string { return enabled() ? "\033[36m" + std::string(s) + "\033[0m" : std::string(s); }
inline auto bold(std::string_view s) -> std::string { return enabled() ? "\033[1m" + std::string(s) + "\033[0m" : std::string(s); }
inline auto dim(std::string_view s) -> std::string { return enabled() ? "\033[2m" + std::string(s) + "\033[0m" : std::string(s); }

}  // namespace reqprof::color

namespace reqprof {

// ─────────────────────────────────────────────────────────────────────────────
// benchmark_result — plain data, computed after a run
// ─────────────────────────────────────────────────────────────────────────────

struct benchmark_result {
    std::string request_type;
    std::string handler_type;
    std::size_t iterations{};
    nanoseconds total_time{};
    nanoseconds min_time{};
    nanoseconds max_time{};
    fp_nanoseconds mean_time{};
    fp_nanoseconds median_time{};
    fp_nanoseconds standard_deviation{};
    std::int64_t total_allocated_bytes{};  // clamped to >= 0
    std::chrono::system_clock::time_point timestamp;
};

struct benchmark_options {
    static constexpr std::size_t DEFAULT_ITERATIONS = 100;

    std::size_t iterations = DEFAULT_ITERATIONS;
    std::string request_type;
    std::string handler_type;
};

// ─────────────────────────────────────────────────────────────────────────────
// do_not_optimize — keeps the compiler from discarding a value-returning
// operation under test.  Same pattern as Google Benchmark / nanobench.
// ─────────────────────────────────────────────────────────────────────────────

#if defined(__GNUC__) || defined(__clang__)
template <typename T>
inline void do_not_optimize(T const& val) {
    asm volatile("" : : "r,m"(val) : "memory");
}
#else
// MSVC / unknown: volatile store is the best we can do portably
template <typename T>
inline void do_not_optimize(T const& val) {
    const volatile T* ptr = &val;
    (void)ptr;
}
#endif

// ─────────────────────────────────────────────────────────────────────────────
// Labels and formatting
// ─────────────────────────────────────────────────────────────────────────────

/// Human-readable name of T ("orders::get_order" rather than the mangled form where possible).
template <typename T>
auto type_label() -> std::string {
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(abi::__cxa_demangle(typeid(T).name(), nullptr, nullptr, &status), std::free);
    if (status == 0 && demangled != nullptr) {
        return demangled.get();
    }
#endif
    return typeid(T).name();
}

// Chooses the most human-readable unit: ns / µs / ms / s.
inline auto format_time(fp_nanoseconds time) -> std::string {
    const double ns = time.count();
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (ns < 1'000.0) {
        oss << ns << " ns";
    } else if (ns < 1'000'000.0) {
        oss << ns / 1e3 << " µs";
    } else if (ns < 1'000'000'000.0) {
        oss << ns / 1e6 << " ms";
    } else {
        oss << ns / 1e9 << "  s";
    }
    return oss.str();
}

inline auto label_of(const benchmark_result& res) -> std::string {
    if (res.handler_type.empty()) {
        return res.request_type;
    }
    return res.request_type + " → " + res.handler_type;
}

// Layout:  v  label    mean  median  stddev  [min … max]  N iters  alloc
inline void print_result(std::ostream& out, const benchmark_result& res, int label_width = 48) {
    out << "    " << color::green("v") << "  " << std::left << std::setw(label_width) << label_of(res) << color::cyan(format_time(res.mean_time))
        << color::dim("  med " + format_time(res.median_time)) << color::dim("  σ " + format_time(res.standard_deviation))
        << color::dim("  [" + format_time(res.min_time) + " … " + format_time(res.max_time) + "]")
        << color::dim("  ×" + std::to_string(res.iterations)) << color::dim("  +" + std::to_string(res.total_allocated_bytes) + " B") << "\n";
}

inline void print_results(std::ostream& out, const std::vector<benchmark_result>& results) {
    constexpr int SEPARATOR_WIDTH = 42;
    std::size_t label_width = 8;
    for (const auto& res : results) {
        label_width = std::max(label_width, label_of(res).size() + 2);
    }
    out << color::bold("\n+-------------------------------------+\n");
    out << color::bold("|  reqprof benchmark results           |\n");
    out << color::bold("+-------------------------------------+\n\n");
    for (const auto& res : results) {
        print_result(out, res, static_cast<int>(label_width));
    }
    out << "\n" << std::string(SEPARATOR_WIDTH, '-') << "\n";
    out << "  " << color::green(std::to_string(results.size()) + " benchmarks completed") << "\n";
    out << std::string(SEPARATOR_WIDTH, '-') << "\n\n";
}

// ─────────────────────────────────────────────────────────────────────────────
// benchmark_runner — N sequential invocations, one sample each
//
//   benchmark_runner runner;
//   auto res = runner.run([&] { return dispatcher.send(req, {}); }, 500);
//
// Iterations never overlap: each operation is awaited before the next one
// starts. The stop_token is checked before every iteration; a requested stop
// aborts the run with cancelled_error and discards the samples gathered so far.
// ─────────────────────────────────────────────────────────────────────────────

class benchmark_runner {
   public:
    using clock = std::chrono::steady_clock;

    explicit benchmark_runner(memory_probe& probe = default_memory_probe()) : probe_(&probe) {}

    template <awaitable F>
    auto run(F&& operation, std::size_t iterations = benchmark_options::DEFAULT_ITERATIONS, std::stop_token token = {}) -> benchmark_result {
        return run(std::forward<F>(operation), benchmark_options{.iterations = iterations}, std::move(token));
    }

    /**
     * @throws std::invalid_argument if options.iterations is 0.
     * @throws cancelled_error if @p token is stopped before the last iteration starts.
     * Exceptions thrown by @p operation propagate unchanged.
     */
    template <awaitable F>
    auto run(F&& operation, const benchmark_options& options, std::stop_token token = {}) -> benchmark_result {
        if (options.iterations == 0) {
            throw std::invalid_argument("iterations must be > 0.");
        }

        std::vector<nanoseconds> samples;
        samples.reserve(options.iterations);

        const auto timestamp = std::chrono::system_clock::now();
        const std::int64_t bytes_before = probe_->current_allocated_bytes(true);

        for (std::size_t i = 0; i < options.iterations; ++i) {
            if (token.stop_requested()) {
                REQPROF_LOG_WARN << "benchmark '" << options.request_type << "' cancelled after " << i << " of " << options.iterations << " iterations";
                throw cancelled_error("Benchmark cancelled after " + std::to_string(i) + " of " + std::to_string(options.iterations) + " iterations.");
            }
            const auto begin = clock::now();
            if constexpr (std::is_void_v<awaited_result_t<F>>) {
                await_call(operation);
            } else {
                do_not_optimize(await_call(operation));
            }
            const auto end = clock::now();
            samples.push_back(std::chrono::duration_cast<nanoseconds>(end - begin));
        }

        const std::int64_t bytes_after = probe_->current_allocated_bytes(false);
        const auto stats = reduce(samples);

        benchmark_result res{
            .request_type = options.request_type,
            .handler_type = options.handler_type,
            .iterations = stats.count,
            .total_time = stats.total,
            .min_time = stats.min,
            .max_time = stats.max,
            .mean_time = stats.mean,
            .median_time = stats.median,
            .standard_deviation = stats.stddev,
            .total_allocated_bytes = std::max<std::int64_t>(0, bytes_after - bytes_before),
            .timestamp = timestamp,
        };
        REQPROF_LOG_DEBUG << "benchmark '" << label_of(res) << "' finished: " << res.iterations << " iterations, mean " << format_time(res.mean_time);
        return res;
    }

    /**
     * Benchmarks dispatcher.send(request, token). Empty labels in @p options are
     * filled with the request and dispatcher type names.
     */
    template <typename Dispatcher, typename Request>
        requires dispatcher_for<Dispatcher, Request>
    auto run_dispatch(Dispatcher& dispatcher, const Request& request, benchmark_options options = {}, std::stop_token token = {}) -> benchmark_result {
        if (options.request_type.empty()) {
            options.request_type = type_label<Request>();
        }
        if (options.handler_type.empty()) {
            options.handler_type = type_label<Dispatcher>();
        }
        return run([&dispatcher, &request, token] { return dispatcher.send(request, token); }, options, token);
    }

   private:
    memory_probe* probe_;
};

}  // namespace reqprof
