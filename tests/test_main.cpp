/**
 * @file test_main.cpp
 * @brief Test entry point - Initialize test environment and global fixtures
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "core/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace GeoHex {
namespace Test {

// =============================================================================
// Global Test Environment
// =============================================================================

/**
 * @brief Global test environment for the GeoHex suite
 *
 * Keeps library logging at warn so expected failures do not flood the output.
 */
class GeoHexTestEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        std::cout << "=== GeoHex Test Suite Starting ===" << std::endl;
        Logger::SetLevel(spdlog::level::warn);
    }

    void TearDown() override {
        Logger::Shutdown();
        std::cout << "=== GeoHex Test Suite Complete ===" << std::endl;
    }
};

// =============================================================================
// Test Event Listener for Enhanced Output
// =============================================================================

/**
 * @brief Prints failed test names at the end of each test
 */
class GeoHexTestListener : public ::testing::EmptyTestEventListener {
public:
    void OnTestEnd(const ::testing::TestInfo& test_info) override {
        if (test_info.result()->Failed()) {
            std::cout << "[  FAILED  ] " << test_info.test_suite_name() << "."
                      << test_info.name() << std::endl;
        }
    }
};

} // namespace Test
} // namespace GeoHex

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleMock(&argc, argv);

    ::testing::AddGlobalTestEnvironment(new GeoHex::Test::GeoHexTestEnvironment());

    if (std::getenv("GEOHEX_TEST_VERBOSE")) {
        ::testing::UnitTest::GetInstance()->listeners().Append(new GeoHex::Test::GeoHexTestListener());
    }

    return RUN_ALL_TESTS();
}
