#pragma once

/**
 * @file profile_session.hxx
 * @brief Thread-safe profiling session accumulating per-operation metrics over a start/stop window.
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "../errors/errors.hxx"
#include "../logger/logger.hxx"
#include "../statistics/statistics.hxx"

namespace reqprof {

using wall_clock = std::chrono::system_clock;

// ─────────────────────────────────────────────────────────────────────────────
// operation_metrics — one measured unit of work
// ─────────────────────────────────────────────────────────────────────────────

struct operation_metrics {
    std::string name;
    nanoseconds duration{};
    std::int64_t memory_used{};
    std::int64_t allocations{};
    wall_clock::time_point start_time{};
    wall_clock::time_point end_time{};

    /// Bytes per millisecond of duration; 0 for a zero-length operation.
    [[nodiscard]] auto memory_per_ms() const -> double {
        const double ms = std::chrono::duration<double, std::milli>(duration).count();
        return ms > 0.0 ? static_cast<double>(memory_used) / ms : 0.0;
    }

    /// Allocations per millisecond of duration; 0 for a zero-length operation.
    [[nodiscard]] auto allocations_per_ms() const -> double {
        const double ms = std::chrono::duration<double, std::milli>(duration).count();
        return ms > 0.0 ? static_cast<double>(allocations) / ms : 0.0;
    }
};

enum class session_state { not_started, running, stopped };

inline auto to_string(session_state state) -> std::string {
    switch (state) {
        case session_state::not_started:
            return "not started";
        case session_state::running:
            return "running";
        case session_state::stopped:
            return "stopped";
    }
    return "unknown";
}

/// One consistent reading of a session; see profile_session::summary().
struct session_summary {
    std::vector<operation_metrics> operations;
    std::int64_t total_memory_used{};
    std::int64_t total_allocations{};
    nanoseconds average_operation_duration{};
    nanoseconds duration{};
    session_state state = session_state::not_started;
};

// ─────────────────────────────────────────────────────────────────────────────
// profile_session
// ─────────────────────────────────────────────────────────────────────────────

/**
 * A named recording window.
 *
 *   not_started ──start()──▶ running ──stop()──▶ stopped ──start()──▶ running …
 *
 * add_operation() and clear() are valid in every state. Every public method
 * takes the same mutex, so the operation list and the two running sums are
 * always observed together: a reader never sees a length that disagrees with
 * the totals.
 *
 * A session is neither copyable nor movable: operations() hands out a view
 * bound to this object.
 */
class profile_session {
   public:
    using clock = std::chrono::steady_clock;

    // ── operations_view ───────────────────────────────────────────────────

    /**
     * Live, read-only window onto the session's operation list.
     *
     * The same view object is returned by every call to operations(), and it
     * reflects appends made after it was obtained. Each access locks the
     * session and copies the element out. Use snapshot() to iterate a
     * consistent copy.
     */
    class operations_view {
       public:
        operations_view(const operations_view&) = delete;
        auto operator=(const operations_view&) -> operations_view& = delete;

        [[nodiscard]] auto size() const -> std::size_t {
            std::lock_guard lock(owner_->mutex_);
            return owner_->operations_.size();
        }

        [[nodiscard]] auto empty() const -> bool { return size() == 0; }

        /** @throws std::out_of_range if @p index >= size(). */
        [[nodiscard]] auto at(std::size_t index) const -> operation_metrics {
            std::lock_guard lock(owner_->mutex_);
            if (index >= owner_->operations_.size()) {
                throw std::out_of_range("Operation index " + std::to_string(index) + " out of range (size " +
                                        std::to_string(owner_->operations_.size()) + ").");
            }
            return owner_->operations_[index];
        }

        [[nodiscard]] auto operator[](std::size_t index) const -> operation_metrics { return at(index); }

        /** @throws std::out_of_range if the view is empty. */
        [[nodiscard]] auto back() const -> operation_metrics {
            std::lock_guard lock(owner_->mutex_);
            if (owner_->operations_.empty()) {
                throw std::out_of_range("No operations recorded.");
            }
            return owner_->operations_.back();
        }

        [[nodiscard]] auto snapshot() const -> std::vector<operation_metrics> {
            std::lock_guard lock(owner_->mutex_);
            return owner_->operations_;
        }

       private:
        friend class profile_session;
        explicit operations_view(const profile_session& owner) : owner_(&owner) {}
        const profile_session* owner_;
    };

    /** @throws std::invalid_argument if @p session_name is empty. */
    explicit profile_session(std::string session_name) : name_(std::move(session_name)), view_(*this) {
        if (name_.empty()) {
            throw std::invalid_argument("session_name must not be empty.");
        }
    }

    profile_session(const profile_session&) = delete;
    profile_session(profile_session&&) = delete;
    auto operator=(const profile_session&) -> profile_session& = delete;
    auto operator=(profile_session&&) -> profile_session& = delete;
    ~profile_session() = default;

    // ── Lifecycle ─────────────────────────────────────────────────────────

    /**
     * Opens the recording window. Restarting a stopped session opens a new
     * window and forgets the previous end time; recorded operations are kept.
     * @throws invalid_state_error if the session is already running.
     */
    void start() {
        {
            std::lock_guard lock(mutex_);
            if (state_ == session_state::running) {
                throw invalid_state_error("Profile session '" + name_ + "' is already running.");
            }
            state_ = session_state::running;
            start_time_ = wall_clock::now();
            end_time_.reset();
            start_tp_ = clock::now();
            end_tp_ = {};
        }
        REQPROF_LOG_DEBUG << "profile session '" << name_ << "' started";
    }

    /**
     * Closes the recording window; duration() is frozen from here on.
     * @throws invalid_state_error if the session is not running.
     */
    void stop() {
        nanoseconds elapsed{};
        {
            std::lock_guard lock(mutex_);
            if (state_ != session_state::running) {
                throw invalid_state_error("Profile session '" + name_ + "' is not running (" + to_string(state_) + ").");
            }
            end_tp_ = clock::now();
            end_time_ = wall_clock::now();
            state_ = session_state::stopped;
            elapsed = std::chrono::duration_cast<nanoseconds>(end_tp_ - start_tp_);
        }
        REQPROF_LOG_DEBUG << "profile session '" << name_ << "' stopped after " << std::chrono::duration<double, std::milli>(elapsed).count() << " ms";
    }

    // ── Recording ─────────────────────────────────────────────────────────

    /**
     * Appends a copy of @p metrics and adds its memory and allocations to the running sums.
     * @throws std::invalid_argument if the name is empty or any measured quantity is negative.
     */
    void add_operation(operation_metrics metrics) {
        if (metrics.name.empty()) {
            throw std::invalid_argument("metrics.name must not be empty.");
        }
        if (metrics.duration < nanoseconds::zero()) {
            throw std::invalid_argument("metrics.duration must not be negative.");
        }
        if (metrics.memory_used < 0 || metrics.allocations < 0) {
            throw std::invalid_argument("metrics.memory_used and metrics.allocations must not be negative.");
        }
        std::lock_guard lock(mutex_);
        total_memory_used_ += metrics.memory_used;
        total_allocations_ += metrics.allocations;
        operations_.push_back(std::move(metrics));
    }

    /// Drops every recorded operation and zeroes the sums. State and timestamps are untouched.
    void clear() {
        std::lock_guard lock(mutex_);
        operations_.clear();
        total_memory_used_ = 0;
        total_allocations_ = 0;
    }

    // ── Accessors ─────────────────────────────────────────────────────────

    [[nodiscard]] auto name() const -> const std::string& { return name_; }

    [[nodiscard]] auto state() const -> session_state {
        std::lock_guard lock(mutex_);
        return state_;
    }

    [[nodiscard]] auto is_running() const -> bool { return state() == session_state::running; }

    /// Empty until the first start().
    [[nodiscard]] auto start_time() const -> std::optional<wall_clock::time_point> {
        std::lock_guard lock(mutex_);
        return start_time_;
    }

    /// Empty until stop(); cleared again by a restart.
    [[nodiscard]] auto end_time() const -> std::optional<wall_clock::time_point> {
        std::lock_guard lock(mutex_);
        return end_time_;
    }

    /// Live while running, frozen once stopped, zero before the first start().
    [[nodiscard]] auto duration() const -> nanoseconds {
        std::lock_guard lock(mutex_);
        return duration_locked();
    }

    [[nodiscard]] auto operations() const -> const operations_view& { return view_; }

    [[nodiscard]] auto operation_count() const -> std::size_t {
        std::lock_guard lock(mutex_);
        return operations_.size();
    }

    [[nodiscard]] auto total_memory_used() const -> std::int64_t {
        std::lock_guard lock(mutex_);
        return total_memory_used_;
    }

    [[nodiscard]] auto total_allocations() const -> std::int64_t {
        std::lock_guard lock(mutex_);
        return total_allocations_;
    }

    /// Recomputed from the recorded operations on every call; zero when there are none.
    [[nodiscard]] auto average_operation_duration() const -> nanoseconds {
        std::lock_guard lock(mutex_);
        return average_locked();
    }

    /**
     * Operations, sums, average and duration read under one lock, so the
     * operation count always agrees with the totals. Use this instead of
     * several accessor calls when the values are combined.
     */
    [[nodiscard]] auto summary() const -> session_summary {
        std::lock_guard lock(mutex_);
        return session_summary{
            .operations = operations_,
            .total_memory_used = total_memory_used_,
            .total_allocations = total_allocations_,
            .average_operation_duration = average_locked(),
            .duration = duration_locked(),
            .state = state_,
        };
    }

   private:
    // Both helpers expect mutex_ to be held.
    [[nodiscard]] auto duration_locked() const -> nanoseconds {
        switch (state_) {
            case session_state::running:
                return std::chrono::duration_cast<nanoseconds>(clock::now() - start_tp_);
            case session_state::stopped:
                return std::chrono::duration_cast<nanoseconds>(end_tp_ - start_tp_);
            case session_state::not_started:
                break;
        }
        return nanoseconds::zero();
    }

    [[nodiscard]] auto average_locked() const -> nanoseconds {
        if (operations_.empty()) {
            return nanoseconds::zero();
        }
        nanoseconds total{0};
        for (const auto& op : operations_) {
            total += op.duration;
        }
        return total / static_cast<nanoseconds::rep>(operations_.size());
    }

    const std::string name_;
    const operations_view view_;

    mutable std::mutex mutex_;  // guards everything below
    session_state state_ = session_state::not_started;
    std::optional<wall_clock::time_point> start_time_;
    std::optional<wall_clock::time_point> end_time_;
    clock::time_point start_tp_;
    clock::time_point end_tp_;
    std::vector<operation_metrics> operations_;
    std::int64_t total_memory_used_ = 0;
    std::int64_t total_allocations_ = 0;
};

}  // namespace reqprof
