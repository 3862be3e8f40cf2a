#pragma once

/**
 * @file profiler.hxx
 * @brief Metrics collection for single calls and a registry of named profile sessions.
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

#include "../awaitable/awaitable.hxx"
#include "../errors/errors.hxx"
#include "../logger/logger.hxx"
#include "../memory_probe/memory_probe.hxx"
#include "../profile_report/profile_report.hxx"
#include "../profile_session/profile_session.hxx"

namespace reqprof {

// ─────────────────────────────────────────────────────────────────────────────
// metrics_collector — measures one call
// ─────────────────────────────────────────────────────────────────────────────

/**
 * Times one invocation of a callable and samples the memory probe around it.
 *
 *   auto metrics = collector.collect("flush", [&] { cache.flush(); });
 *   auto [rows, metrics] = collector.collect("query", [&] { return db.query(sql); });
 *
 * Future-returning callables are awaited; the measured duration covers the
 * wait. If the callable throws, the exception propagates and nothing is
 * measured.
 */
class metrics_collector {
   public:
    using clock = std::chrono::steady_clock;

    explicit metrics_collector(memory_probe& probe = default_memory_probe()) : probe_(&probe) {}

    /**
     * @return operation_metrics for callables yielding nothing,
     *         std::pair<value, operation_metrics> otherwise.
     * @throws std::invalid_argument if @p name is empty.
     */
    template <awaitable F>
    auto collect(const std::string& name, F&& func) {
        if (name.empty()) {
            throw std::invalid_argument("Operation name must not be empty.");
        }

        const std::int64_t bytes_before = probe_->current_allocated_bytes(false);
        const std::int64_t allocs_before = probe_->allocation_count();
        const auto start_time = wall_clock::now();
        const auto begin = clock::now();

        if constexpr (std::is_void_v<awaited_result_t<F>>) {
            await_call(func);
            return finish(name, begin, start_time, bytes_before, allocs_before);
        } else {
            auto value = await_call(func);
            auto metrics = finish(name, begin, start_time, bytes_before, allocs_before);
            return std::pair<awaited_result_t<F>, operation_metrics>(std::move(value), std::move(metrics));
        }
    }

   private:
    auto finish(const std::string& name, clock::time_point begin, wall_clock::time_point start_time, std::int64_t bytes_before,
                std::int64_t allocs_before) -> operation_metrics {
        const auto end = clock::now();
        return operation_metrics{
            .name = name,
            .duration = std::chrono::duration_cast<nanoseconds>(end - begin),
            .memory_used = std::max<std::int64_t>(0, probe_->current_allocated_bytes(false) - bytes_before),
            .allocations = std::max<std::int64_t>(0, probe_->allocation_count() - allocs_before),
            .start_time = start_time,
            .end_time = wall_clock::now(),
        };
    }

    memory_probe* probe_;
};

// ─────────────────────────────────────────────────────────────────────────────
// performance_profiler — named sessions plus one active session
// ─────────────────────────────────────────────────────────────────────────────

/**
 * Owns a set of named sessions and routes profile() calls to the active one.
 *
 * Thread safety
 * ─────────────
 * The session map and the active pointer are guarded by one mutex. The
 * mutex is never held while a profiled callable runs; profile() pins the
 * active session first and records into it afterwards, even if the session
 * was stopped or removed in the meantime.
 */
class performance_profiler {
   public:
    using session_ptr = std::shared_ptr<profile_session>;
    using session_map = std::map<std::string, session_ptr>;

    explicit performance_profiler(memory_probe& probe = default_memory_probe()) : collector_(probe) {}

    performance_profiler(const performance_profiler&) = delete;
    auto operator=(const performance_profiler&) -> performance_profiler& = delete;

    /**
     * Creates and starts a session, which becomes the active one.
     * @throws std::invalid_argument if @p name is empty.
     * @throws invalid_state_error if a session with this name already exists.
     */
    auto start_session(const std::string& name) -> session_ptr {
        if (name.empty()) {
            throw std::invalid_argument("session_name must not be empty.");
        }
        std::lock_guard lock(mutex_);
        if (sessions_.contains(name)) {
            throw invalid_state_error("Profile session '" + name + "' already exists.");
        }
        auto session = std::make_shared<profile_session>(name);
        session->start();
        sessions_.emplace(name, session);
        active_ = session;
        return session;
    }

    /** @throws invalid_state_error if no session is named @p name, or it is not running. */
    void stop_session(const std::string& name) {
        std::lock_guard lock(mutex_);
        auto iter = sessions_.find(name);
        if (iter == sessions_.end()) {
            throw invalid_state_error("Profile session '" + name + "' does not exist.");
        }
        iter->second->stop();
        if (active_ == iter->second) {
            active_.reset();
        }
    }

    /** @throws invalid_state_error if there is no active session. */
    void stop_active_session() {
        std::lock_guard lock(mutex_);
        if (!active_) {
            throw invalid_state_error("No active profile session.");
        }
        active_->stop();
        active_.reset();
    }

    [[nodiscard]] auto active_session() const -> session_ptr {
        std::lock_guard lock(mutex_);
        return active_;
    }

    /// Copy of the name → session map; later start_session() calls do not show up in it.
    [[nodiscard]] auto sessions() const -> session_map {
        std::lock_guard lock(mutex_);
        return sessions_;
    }

    /// nullptr if no session is named @p name.
    [[nodiscard]] auto get_session(const std::string& name) const -> session_ptr {
        std::lock_guard lock(mutex_);
        auto iter = sessions_.find(name);
        return iter == sessions_.end() ? nullptr : iter->second;
    }

    auto remove_session(const std::string& name) -> bool {
        std::lock_guard lock(mutex_);
        auto iter = sessions_.find(name);
        if (iter == sessions_.end()) {
            return false;
        }
        if (active_ == iter->second) {
            active_.reset();
        }
        sessions_.erase(iter);
        REQPROF_LOG_DEBUG << "profile session '" << name << "' removed";
        return true;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        sessions_.clear();
        active_.reset();
    }

    /**
     * Runs @p func, records its metrics into the active session and returns
     * whatever @p func yields.
     * @throws profiler_not_started_error if there is no active session.
     */
    template <awaitable F>
    auto profile(const std::string& name, F&& func) -> awaited_result_t<F> {
        session_ptr session = active_session();
        if (!session) {
            throw profiler_not_started_error("No active profile session; call start_session() before profile().");
        }
        if constexpr (std::is_void_v<awaited_result_t<F>>) {
            session->add_operation(collector_.collect(name, func));
        } else {
            auto [value, metrics] = collector_.collect(name, func);
            session->add_operation(std::move(metrics));
            return std::move(value);
        }
    }

    /** @throws invalid_state_error if no session is named @p name. */
    [[nodiscard]] auto generate_report(const std::string& name, performance_thresholds thresholds = {}) const -> profile_report {
        session_ptr session = get_session(name);
        if (!session) {
            throw invalid_state_error("Profile session '" + name + "' does not exist.");
        }
        return profile_report(std::move(session), thresholds);
    }

    /** @throws invalid_state_error if there is no active session. */
    [[nodiscard]] auto generate_active_report(performance_thresholds thresholds = {}) const -> profile_report {
        session_ptr session = active_session();
        if (!session) {
            throw invalid_state_error("No active profile session.");
        }
        return profile_report(std::move(session), thresholds);
    }

   private:
    mutable std::mutex mutex_;
    session_map sessions_;
    session_ptr active_;
    metrics_collector collector_;
};

}  // namespace reqprof
