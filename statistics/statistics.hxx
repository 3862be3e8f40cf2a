#pragma once

/**
 * @file statistics.hxx
 * @brief Summary statistics over a sequence of duration samples.
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <algorithm>
#include <chrono>
#include <cmath>
#include <span>
#include <stdexcept>
#include <vector>

namespace reqprof {

/// Integer nanoseconds: the resolution every sample is stored at.
using nanoseconds = std::chrono::nanoseconds;

/// Floating nanoseconds, for derived values (mean, stddev) that must not be truncated.
using fp_nanoseconds = std::chrono::duration<double, std::nano>;

struct sample_summary {
    std::size_t count{};
    nanoseconds total{};
    nanoseconds min{};
    nanoseconds max{};
    fp_nanoseconds mean{};
    fp_nanoseconds median{};
    fp_nanoseconds stddev{};  // population standard deviation (divides by N)
};

// ─────────────────────────────────────────────────────────────────────────────
// reduce — two passes over the samples: sums/extremes first, then squared
// deviations from the mean. The median works on a sorted copy so the
// caller's ordering is left untouched.
// ─────────────────────────────────────────────────────────────────────────────

/**
 * @throws std::invalid_argument if @p samples is empty.
 */
inline auto reduce(std::span<const nanoseconds> samples) -> sample_summary {
    if (samples.empty()) {
        throw std::invalid_argument("reduce() requires at least one sample.");
    }

    const std::size_t n = samples.size();
    nanoseconds total{0};
    nanoseconds lo = samples.front();
    nanoseconds hi = samples.front();
    for (const auto sample : samples) {
        total += sample;
        lo = std::min(lo, sample);
        hi = std::max(hi, sample);
    }

    const double mean = static_cast<double>(total.count()) / static_cast<double>(n);

    const double variance = [&] {
        double acc = 0;
        for (const auto sample : samples) {
            const double dev = static_cast<double>(sample.count()) - mean;
            acc += dev * dev;
        }
        return acc / static_cast<double>(n);
    }();

    std::vector<nanoseconds> sorted(samples.begin(), samples.end());
    std::sort(sorted.begin(), sorted.end());
    const double median = (n % 2 == 0) ? (static_cast<double>(sorted[n / 2 - 1].count()) + static_cast<double>(sorted[n / 2].count())) / 2.0
                                       : static_cast<double>(sorted[n / 2].count());

    return sample_summary{
        .count = n,
        .total = total,
        .min = lo,
        .max = hi,
        .mean = fp_nanoseconds{mean},
        .median = fp_nanoseconds{median},
        .stddev = fp_nanoseconds{std::sqrt(variance)},
    };
}

}  // namespace reqprof
