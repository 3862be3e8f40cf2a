#pragma once

/**
 * @file profile_report.hxx
 * @brief Threshold checks and console / JSON / CSV renderings of a profile session.
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <iomanip>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "../profile_session/profile_session.hxx"

namespace reqprof {

/// Every limit is optional; an unset limit is never checked. A value strictly above a limit produces a warning.
struct performance_thresholds {
    std::optional<nanoseconds> max_duration;            // session duration
    std::optional<std::int64_t> max_memory;             // session total memory
    std::optional<std::int64_t> max_allocations;        // session total allocations
    std::optional<nanoseconds> max_operation_duration;  // per operation
    std::optional<std::int64_t> max_operation_memory;   // per operation
};

namespace report_detail {

inline auto to_ms(nanoseconds dur) -> double { return std::chrono::duration<double, std::milli>(dur).count(); }

inline auto format_ms(nanoseconds dur) -> std::string {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << to_ms(dur) << " ms";
    return oss.str();
}

// B / KB / MB / GB, two decimals above bytes.
inline auto format_bytes(std::int64_t bytes) -> std::string {
    constexpr double KIB = 1024.0;
    static constexpr const char* UNITS[] = {"B", "KB", "MB", "GB", "TB"};
    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while ((value >= KIB || value <= -KIB) && unit + 1 < std::size(UNITS)) {
        value /= KIB;
        ++unit;
    }
    std::ostringstream oss;
    if (unit == 0) {
        oss << bytes << " B";
    } else {
        oss << std::fixed << std::setprecision(2) << value << " " << UNITS[unit];
    }
    return oss.str();
}

inline auto escape_json(std::string_view str) -> std::string {
    std::string out;
    out.reserve(str.size() + 2);
    for (char chr : str) {
        switch (chr) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(chr) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(chr)));
                    out += buf;
                } else {
                    out += chr;
                }
        }
    }
    return out;
}

// RFC 4180: quote when the field holds a comma, quote or line break; double embedded quotes.
inline auto escape_csv(std::string_view str) -> std::string {
    if (str.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string(str);
    }
    std::string out = "\"";
    for (char chr : str) {
        if (chr == '"') {
            out += '"';
        }
        out += chr;
    }
    out += '"';
    return out;
}

}  // namespace report_detail

// ─────────────────────────────────────────────────────────────────────────────
// profile_report
// ─────────────────────────────────────────────────────────────────────────────

/**
 * Report over one session. Warnings are evaluated once, at construction;
 * each rendering takes its own session summary, so a report on a running
 * session shows its current operations and every figure in one rendering
 * comes from the same moment.
 */
class profile_report {
   public:
    /** @throws std::invalid_argument if @p session is null. */
    explicit profile_report(std::shared_ptr<profile_session> session, performance_thresholds thresholds = {})
        : session_(std::move(session)), thresholds_(thresholds) {
        if (!session_) {
            throw std::invalid_argument("session must not be null.");
        }
        evaluate();
    }

    [[nodiscard]] auto session() const -> const std::shared_ptr<profile_session>& { return session_; }
    [[nodiscard]] auto thresholds() const -> const performance_thresholds& { return thresholds_; }
    [[nodiscard]] auto warnings() const -> const std::vector<std::string>& { return warnings_; }

    [[nodiscard]] auto to_console() const -> std::string {
        using report_detail::format_bytes;
        using report_detail::format_ms;

        const session_summary sum = session_->summary();
        std::ostringstream out;
        out << "Performance Profile Report: " << session_->name() << "\n";
        out << std::string(SEPARATOR_WIDTH, '=') << "\n";
        out << "Session Duration: " << format_ms(sum.duration) << "\n";
        out << "Total Memory Used: " << format_bytes(sum.total_memory_used) << "\n";
        out << "Total Allocations: " << sum.total_allocations << "\n";
        out << "Operations Count: " << sum.operations.size() << "\n";
        out << "Average Operation Duration: " << format_ms(sum.average_operation_duration) << "\n";

        if (!sum.operations.empty()) {
            out << "\nOperations:\n";
            for (const auto& op : sum.operations) {
                out << "  - " << op.name << ": " << format_ms(op.duration) << ", " << format_bytes(op.memory_used) << ", " << op.allocations
                    << " allocations\n";
            }
        }

        if (!warnings_.empty()) {
            out << "\nWarnings:\n";
            for (const auto& warning : warnings_) {
                out << "  ! " << warning << "\n";
            }
        }
        return out.str();
    }

    [[nodiscard]] auto to_json() const -> std::string {
        using report_detail::escape_json;
        using report_detail::to_ms;

        const session_summary sum = session_->summary();
        const auto& ops = sum.operations;
        std::ostringstream out;
        out << std::fixed << std::setprecision(3);
        out << "{\n";
        out << "  \"SessionName\": \"" << escape_json(session_->name()) << "\",\n";
        out << "  \"DurationMs\": " << to_ms(sum.duration) << ",\n";
        out << "  \"TotalMemoryUsed\": " << sum.total_memory_used << ",\n";
        out << "  \"TotalAllocations\": " << sum.total_allocations << ",\n";
        out << "  \"AverageOperationDurationMs\": " << to_ms(sum.average_operation_duration) << ",\n";
        out << "  \"Operations\": [";
        for (std::size_t i = 0; i < ops.size(); ++i) {
            const auto& op = ops[i];
            out << (i == 0 ? "\n" : ",\n");
            out << "    {\"Name\": \"" << escape_json(op.name) << "\", \"DurationMs\": " << to_ms(op.duration) << ", \"MemoryUsed\": " << op.memory_used
                << ", \"Allocations\": " << op.allocations << "}";
        }
        out << (ops.empty() ? "],\n" : "\n  ],\n");
        out << "  \"Warnings\": [";
        for (std::size_t i = 0; i < warnings_.size(); ++i) {
            out << (i == 0 ? "" : ", ") << "\"" << escape_json(warnings_[i]) << "\"";
        }
        out << "]\n}\n";
        return out.str();
    }

    [[nodiscard]] auto to_csv() const -> std::string {
        using report_detail::escape_csv;
        using report_detail::to_ms;

        const session_summary sum = session_->summary();
        std::ostringstream out;
        out << std::fixed << std::setprecision(3);
        out << "Session Summary\n";
        out << "SessionName,DurationMs,TotalMemoryUsed,TotalAllocations,OperationsCount\n";
        out << escape_csv(session_->name()) << "," << to_ms(sum.duration) << "," << sum.total_memory_used << "," << sum.total_allocations << ","
            << sum.operations.size() << "\n";
        out << "\nOperations\n";
        out << "Name,DurationMs,MemoryUsed,Allocations\n";
        for (const auto& op : sum.operations) {
            out << escape_csv(op.name) << "," << to_ms(op.duration) << "," << op.memory_used << "," << op.allocations << "\n";
        }
        if (!warnings_.empty()) {
            out << "\nWarnings\n";
            for (const auto& warning : warnings_) {
                out << escape_csv(warning) << "\n";
            }
        }
        return out.str();
    }

   private:
    static constexpr int SEPARATOR_WIDTH = 50;

    void evaluate() {
        using report_detail::format_bytes;
        using report_detail::format_ms;

        const session_summary sum = session_->summary();
        if (thresholds_.max_duration && sum.duration > *thresholds_.max_duration) {
            warnings_.push_back("Session duration " + format_ms(sum.duration) + " exceeds threshold " + format_ms(*thresholds_.max_duration));
        }
        if (thresholds_.max_memory && sum.total_memory_used > *thresholds_.max_memory) {
            warnings_.push_back("Total memory usage " + format_bytes(sum.total_memory_used) + " exceeds threshold " +
                                format_bytes(*thresholds_.max_memory));
        }
        if (thresholds_.max_allocations && sum.total_allocations > *thresholds_.max_allocations) {
            warnings_.push_back("Total allocations " + std::to_string(sum.total_allocations) + " exceeds threshold " +
                                std::to_string(*thresholds_.max_allocations));
        }

        for (const auto& op : sum.operations) {
            if (thresholds_.max_operation_duration && op.duration > *thresholds_.max_operation_duration) {
                warnings_.push_back("Operation '" + op.name + "' duration " + format_ms(op.duration) + " exceeds threshold " +
                                    format_ms(*thresholds_.max_operation_duration));
            }
            if (thresholds_.max_operation_memory && op.memory_used > *thresholds_.max_operation_memory) {
                warnings_.push_back("Operation '" + op.name + "' memory usage " + format_bytes(op.memory_used) + " exceeds threshold " +
                                    format_bytes(*thresholds_.max_operation_memory));
            }
        }
    }

    std::shared_ptr<profile_session> session_;
    performance_thresholds thresholds_;
    std::vector<std::string> warnings_;
};

}  // namespace reqprof
