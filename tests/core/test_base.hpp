//===== test_base.hpp =====
#pragma once

#ifndef TESTING
#define TESTING
#endif

#include <gtest/gtest.h>
#include "paper_ngin/core/logger.hpp"
#include "paper_ngin/core/state_manager.hpp"

namespace paper_ngin {
namespace testing {

class TestBase : public ::testing::Test {
protected:
    void SetUp() override {
        StateManager::reset_instance();

        LoggerConfig config;
        config.min_level = LogLevel::WARNING;
        config.destination = LogDestination::CONSOLE;
        Logger::instance().initialize(config);
    }

    void TearDown() override {
        StateManager::instance().reset_instance();
    }
};

}  // namespace testing
}  // namespace paper_ngin
