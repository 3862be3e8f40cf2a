#pragma once

// Include this header in exactly ONE .cpp file per test executable.
// It defines main() and hands control to the test registry.
//
//   ./test_profile_session              run everything
//   ./test_profile_session lifecycle    run tests whose suite or name contains "lifecycle"
//
// Library logging is raised to WARNING so lifecycle DEBUG lines do not
// interleave with the runner's output.

#include <string_view>

#include "../logger/logger.hxx"
#include "test_framework.hpp"

auto main(int argc, char** argv) -> int {
    ::reqprof::logger::get_instance().set_min_level(::reqprof::log_level::WARNING);
    const std::string_view filter = argc > 1 ? std::string_view(argv[1]) : std::string_view{};
    return ::testing::test_registry::instance().run_all(filter);
}
