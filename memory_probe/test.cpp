#include <cstdint>
#include <memory>
#include <vector>

#include "../testing/test_main.hpp"
#include "memory_probe.hxx"

REQPROF_INSTALL_ALLOCATION_COUNTER()

using reqprof::counting_memory_probe;
using reqprof::memory_probe;
using reqprof::process_memory_probe;

namespace {

// Keeps a heap block reachable so the optimizer cannot elide the allocation.
std::vector<std::unique_ptr<char[]>> g_retained;

}  // namespace

TEST_SUITE("counting_memory_probe")

TEST_CASE("every new is counted") {
    counting_memory_probe probe;
    const auto before = probe.allocation_count();
    g_retained.push_back(std::make_unique<char[]>(64));
    g_retained.push_back(std::make_unique<char[]>(64));
    const auto after = probe.allocation_count();
    // push_back may also grow the vector's buffer
    expect(after - before >= 2).to_be_true();
    g_retained.clear();
}

TEST_CASE("live bytes rise with a retained block and fall when it is released") {
    counting_memory_probe probe;
    g_retained.reserve(4);
    const auto base = probe.current_allocated_bytes(true);
    g_retained.push_back(std::make_unique<char[]>(4096));
    const auto held = probe.current_allocated_bytes(false);
    expect(held - base >= 4096).to_be_true();
    g_retained.clear();
    const auto released = probe.current_allocated_bytes(false);
    expect(released <= base).to_be_true();
}

TEST_CASE("allocation count is monotonic across frees") {
    counting_memory_probe probe;
    const auto before = probe.allocation_count();
    {
        auto tmp = std::make_unique<int>(7);
    }
    expect(probe.allocation_count() >= before + 1).to_be_true();
}

TEST_SUITE("process_memory_probe")

TEST_CASE("readings are never negative") {
    process_memory_probe probe;
    expect(probe.current_allocated_bytes(true) >= 0).to_be_true();
    expect(probe.current_allocated_bytes(false) >= 0).to_be_true();
}

TEST_CASE("the base probe reports no allocation count") {
    process_memory_probe probe;
    expect(probe.allocation_count()).to_equal(0);
}

TEST_CASE("default probe is one shared instance") {
    memory_probe& first = reqprof::default_memory_probe();
    memory_probe& second = reqprof::default_memory_probe();
    expect(&first == &second).to_be_true();
}

#if defined(__GLIBC__)
TEST_CASE("a large retained block shows up in the heap reading") {
    process_memory_probe probe;
    const auto before = probe.current_allocated_bytes(true);
    auto block = std::make_unique<char[]>(8 * 1024 * 1024);
    block[0] = 1;
    const auto after = probe.current_allocated_bytes(false);
    expect(after - before >= 8 * 1024 * 1024).to_be_true();
}
#endif
