#pragma once

/**
 * @file awaitable.hxx
 * @brief Uniform "invoke and await" over plain callables and future-returning callables.
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <concepts>
#include <functional>
#include <future>
#include <stop_token>
#include <type_traits>

// ─────────────────────────────────────────────────────────────────────────────
// awaitable — a zero-argument callable whose completion can be waited on.
//
//   int                 fn()   → yields int
//   void                fn()   → yields nothing
//   std::future<int>    fn()   → waits, yields int
//   std::future<void>   fn()   → waits, yields nothing
//
// Every measuring component (benchmark runner, metrics collector, trace
// capture) goes through await_call() so there is only one timing loop per
// component, regardless of the operation's shape.
// ─────────────────────────────────────────────────────────────────────────────
namespace reqprof {

namespace awaitable_detail {

template <typename R>
struct awaited {
    using type = R;
    static constexpr bool is_future = false;
};

template <typename T>
struct awaited<std::future<T>> {
    using type = T;
    static constexpr bool is_future = true;
};

}  // namespace awaitable_detail

template <typename F>
concept awaitable = std::invocable<F&>;

/// Raw return type of calling F with no arguments.
template <awaitable F>
using call_result_t = std::remove_cvref_t<std::invoke_result_t<F&>>;

/// The value produced once the call has completed (the future's payload for future-returning callables).
template <awaitable F>
using awaited_result_t = typename awaitable_detail::awaited<call_result_t<F>>::type;

/**
 * Calls @p func and blocks until its result is available.
 * Exceptions thrown by the call, or stored in the returned future, propagate unchanged.
 */
template <awaitable F>
auto await_call(F& func) -> awaited_result_t<F> {
    if constexpr (awaitable_detail::awaited<call_result_t<F>>::is_future) {
        return std::invoke(func).get();
    } else {
        return std::invoke(func);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// dispatcher_for — the external request executor. Any type exposing
//   send(const Request&, std::stop_token)
// qualifies; the result may be a response, void, or a future of either.
// ─────────────────────────────────────────────────────────────────────────────

template <typename D, typename Request>
concept dispatcher_for = requires(D& dispatcher, const Request& request, std::stop_token token) { dispatcher.send(request, token); };

}  // namespace reqprof
