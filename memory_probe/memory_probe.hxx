#pragma once

/**
 * @file memory_probe.hxx
 * @brief Memory snapshot providers used by the benchmark runner and the metrics collector.
 * @version 1.0.0
 *
 * @author Matteo Zanella <matteozanella2@gmail.com>
 * Copyright 2026 Matteo Zanella
 *
 * SPDX-License-Identifier: MIT
 */

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <new>

#if defined(__GLIBC__)
#include <malloc.h>
#endif

namespace reqprof {

// ─────────────────────────────────────────────────────────────────────────────
// memory_probe — the capability the measuring components depend on
// ─────────────────────────────────────────────────────────────────────────────

class memory_probe {
   public:
    memory_probe() = default;
    virtual ~memory_probe() = default;
    memory_probe(const memory_probe&) = delete;
    auto operator=(const memory_probe&) -> memory_probe& = delete;

    /**
     * Bytes currently held by the process allocator.
     * @param force_collection  Return cached free memory to the system first, so the
     *                          reading is a stable baseline rather than a steady-state value.
     */
    virtual auto current_allocated_bytes(bool force_collection) -> std::int64_t = 0;

    /// Monotonic count of allocation calls, or 0 when the probe cannot observe them.
    virtual auto allocation_count() -> std::int64_t { return 0; }
};

// ─────────────────────────────────────────────────────────────────────────────
// process_memory_probe — glibc heap statistics (in-use bytes from mallinfo2).
// malloc_trim() is the closest thing to a forced collection: it hands unused
// arena memory back before the reading. Elsewhere the probe reports 0.
// ─────────────────────────────────────────────────────────────────────────────

class process_memory_probe final : public memory_probe {
   public:
    auto current_allocated_bytes(bool force_collection) -> std::int64_t override {
#if defined(__GLIBC__) && (__GLIBC__ > 2 || (__GLIBC__ == 2 && __GLIBC_MINOR__ >= 33))
        if (force_collection) {
            malloc_trim(0);
        }
        const struct mallinfo2 info = mallinfo2();
        return static_cast<std::int64_t>(info.uordblks + info.hblkhd);
#else
        (void)force_collection;
        return 0;
#endif
    }
};

/// Process-wide default probe.
inline auto default_memory_probe() -> memory_probe& {
    static process_memory_probe probe;
    return probe;
}

// ─────────────────────────────────────────────────────────────────────────────
// Allocation counters — fed by the global operator new/delete replacements
// that REQPROF_INSTALL_ALLOCATION_COUNTER() defines. Without that macro the
// counters simply stay at zero.
// ─────────────────────────────────────────────────────────────────────────────

namespace memory_detail {

inline std::atomic<std::int64_t> allocation_calls{0};
inline std::atomic<std::int64_t> live_bytes{0};

inline auto usable_size(void* ptr) noexcept -> std::int64_t {
#if defined(__GLIBC__)
    return static_cast<std::int64_t>(malloc_usable_size(ptr));
#else
    (void)ptr;
    return 0;
#endif
}

inline auto counted_alloc(std::size_t size) -> void* {
    void* ptr = std::malloc(size == 0 ? 1 : size);
    if (ptr == nullptr) {
        throw std::bad_alloc();
    }
    allocation_calls.fetch_add(1, std::memory_order_relaxed);
    live_bytes.fetch_add(usable_size(ptr), std::memory_order_relaxed);
    return ptr;
}

inline void counted_free(void* ptr) noexcept {
    if (ptr == nullptr) {
        return;
    }
    live_bytes.fetch_sub(usable_size(ptr), std::memory_order_relaxed);
    std::free(ptr);
}

}  // namespace memory_detail

/**
 * Reads the counters maintained by REQPROF_INSTALL_ALLOCATION_COUNTER().
 * current_allocated_bytes() is the live byte balance; there is nothing to
 * collect, so force_collection is ignored.
 */
class counting_memory_probe final : public memory_probe {
   public:
    auto current_allocated_bytes(bool /*force_collection*/) -> std::int64_t override {
        return memory_detail::live_bytes.load(std::memory_order_relaxed);
    }

    auto allocation_count() -> std::int64_t override { return memory_detail::allocation_calls.load(std::memory_order_relaxed); }
};

}  // namespace reqprof

// ─────────────────────────────────────────────────────────────────────────────
// REQPROF_INSTALL_ALLOCATION_COUNTER — expand once, at namespace scope, in
// exactly one translation unit of the program. Aligned new/delete keep the
// default implementation and are not counted.
// ─────────────────────────────────────────────────────────────────────────────
#define REQPROF_INSTALL_ALLOCATION_COUNTER()                                                               \
    void* operator new(std::size_t size) { return ::reqprof::memory_detail::counted_alloc(size); }         \
    void* operator new[](std::size_t size) { return ::reqprof::memory_detail::counted_alloc(size); }       \
    void operator delete(void* ptr) noexcept { ::reqprof::memory_detail::counted_free(ptr); }              \
    void operator delete[](void* ptr) noexcept { ::reqprof::memory_detail::counted_free(ptr); }            \
    void operator delete(void* ptr, std::size_t) noexcept { ::reqprof::memory_detail::counted_free(ptr); } \
    void operator delete[](void* ptr, std::size_t) noexcept { ::reqprof::memory_detail::counted_free(ptr); }
