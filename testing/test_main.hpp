#pragma once

// Include this header in exactly ONE .cpp file per test binary. It defines
// main() and hands control to the test registry.
//
//   ./spy_test              runs every test
//   ./spy_test "close"      runs tests whose suite or name contains "close"

#include <string_view>

#include "test_framework.hpp"

auto main(int argc, char** argv) -> int {
    const std::string_view filter = (argc > 1) ? std::string_view(argv[1]) : std::string_view{};
    return ::testing::test_registry::instance().run_all(filter);
}
