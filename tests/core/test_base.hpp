//===== test_base.hpp =====
#pragma once

#ifndef TESTING
#define TESTING
#endif

#include <gtest/gtest.h>
#include "trade_sim/core/logger.hpp"

namespace trade_sim {
namespace testing {

/**
 * @brief Fixture with a quiet, freshly initialized console logger
 */
class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        Logger::register_component("");
        LoggerConfig config;
        config.min_level = LogLevel::ERR;
        config.destination = LogDestination::CONSOLE;
        Logger::instance().initialize(config);
    }

    void TearDown() override {
        Logger::reset_for_tests();
        Logger::register_component("");
    }
};

}  // namespace testing
}  // namespace trade_sim
