#pragma once

/**
 * @file trace_capture.hxx
 * @brief Wraps one dispatch call with start / exception / completion calls on a tracer.
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <concepts>
#include <exception>
#include <optional>
#include <stop_token>
#include <type_traits>
#include <utility>

#include "../awaitable/awaitable.hxx"
#include "../logger/logger.hxx"

namespace reqprof {

/**
 * The external span recorder. start_trace() returns an opaque handle (a
 * pointer, an optional, a shared_ptr …); an empty handle just means tracing
 * is off. The handle is handed back to the caller and never inspected here.
 */
template <typename T, typename Request>
concept tracer_for = requires(T& tracer, const Request& request, std::exception_ptr error, bool success) {
    { tracer.start_trace(request) } -> std::movable;
    tracer.record_exception(error);
    tracer.complete_trace(success);
};

template <typename T, typename Request>
    requires tracer_for<T, Request>
using trace_handle_t = std::remove_cvref_t<decltype(std::declval<T&>().start_trace(std::declval<const Request&>()))>;

/// Response of a traced dispatch, paired with the handle start_trace() produced.
template <typename Response, typename Handle>
struct traced_response {
    Response response;
    Handle trace;
};

/// Command-style dispatch: nothing but the handle.
template <typename Handle>
struct traced_response<void, Handle> {
    Handle trace;
};

/**
 * Dispatches @p request with tracing around it:
 *
 *   start_trace(request) → send(request, token) → complete_trace(true)
 *                                       └─throws─→ record_exception(e) → complete_trace(false) → rethrow e
 *
 * The original exception object is rethrown, never wrapped. Future-returning
 * dispatchers are awaited before the trace is completed.
 */
template <typename Dispatcher, typename Tracer, typename Request>
    requires dispatcher_for<Dispatcher, Request> && tracer_for<Tracer, Request>
auto trace_capture(Dispatcher& dispatcher, Tracer& tracer, const Request& request, std::stop_token token = {}) {
    using handle_t = trace_handle_t<Tracer, Request>;

    handle_t handle = tracer.start_trace(request);
    auto call = [&dispatcher, &request, &token] { return dispatcher.send(request, token); };
    using response_t = awaited_result_t<decltype(call)>;

    auto fail = [&tracer] {
        REQPROF_LOG_WARN << "traced dispatch failed; recording exception";
        tracer.record_exception(std::current_exception());
        tracer.complete_trace(false);
    };

    if constexpr (std::is_void_v<response_t>) {
        try {
            await_call(call);
        } catch (...) {
            fail();
            throw;
        }
        tracer.complete_trace(true);
        return traced_response<void, handle_t>{std::move(handle)};
    } else {
        std::optional<response_t> response;
        try {
            response.emplace(await_call(call));
        } catch (...) {
            fail();
            throw;
        }
        tracer.complete_trace(true);
        return traced_response<response_t, handle_t>{std::move(*response), std::move(handle)};
    }
}

}  // namespace reqprof
