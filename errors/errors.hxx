#pragma once

/**
 * @file errors.hxx
 * @brief Exception types shared by the profiling and benchmarking headers.
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <stdexcept>
#include <string>

// Argument errors are reported with std::invalid_argument throughout.

namespace reqprof {

/// An operation was called in a state that does not allow it (e.g. start() on a running session).
class invalid_state_error : public std::logic_error {
   public:
    explicit invalid_state_error(const std::string& what) : std::logic_error(what) {}
};

/// profile() was called while the profiler has no active session.
class profiler_not_started_error : public invalid_state_error {
   public:
    explicit profiler_not_started_error(const std::string& what) : invalid_state_error(what) {}
};

/// A benchmark run was stopped through its stop_token before it completed.
class cancelled_error : public std::runtime_error {
   public:
    explicit cancelled_error(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace reqprof
