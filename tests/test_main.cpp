/**
 * @file test_main.cpp
 * @brief Test entry point - Initialize test environment and global fixtures
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "core/Logger.hpp"
#include "config/Config.hpp"

#include <iostream>

namespace Lodestone {
namespace Test {

// =============================================================================
// Global Test Environment
// =============================================================================

/**
 * @brief Global test environment for the Lodestone suite
 *
 * Routes engine logging to the console at warning level so expected
 * rejections do not flood the output.
 */
class LodestoneTestEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        std::cout << "=== Lodestone Test Suite Starting ===" << std::endl;
        Logger::Initialize();
        Logger::SetLevel(spdlog::level::warn);
    }

    void TearDown() override {
        Config::Instance().Clear();
        Logger::Shutdown();
        std::cout << "=== Lodestone Test Suite Complete ===" << std::endl;
    }
};

// =============================================================================
// Test Event Listener for Enhanced Output
// =============================================================================

class LodestoneTestListener : public ::testing::EmptyTestEventListener {
public:
    void OnTestEnd(const ::testing::TestInfo& test_info) override {
        if (test_info.result()->Failed()) {
            std::cout << "[  FAILED  ] " << test_info.test_suite_name() << "."
                      << test_info.name() << std::endl;
        }
    }

    void OnTestSuiteEnd(const ::testing::TestSuite& test_suite) override {
        std::cout << "Suite " << test_suite.name() << ": "
                  << test_suite.successful_test_count() << " passed, "
                  << test_suite.failed_test_count() << " failed" << std::endl;
    }
};

} // namespace Test
} // namespace Lodestone

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);

    ::testing::AddGlobalTestEnvironment(new Lodestone::Test::LodestoneTestEnvironment());

    ::testing::TestEventListeners& listeners =
        ::testing::UnitTest::GetInstance()->listeners();
    listeners.Append(new Lodestone::Test::LodestoneTestListener());

    return RUN_ALL_TESTS();
}
