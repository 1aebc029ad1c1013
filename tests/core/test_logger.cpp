#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>
#include "paper_ngin/core/logger.hpp"

using namespace paper_ngin;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();

        original_cout = std::cout.rdbuf();
        std::cout.rdbuf(cout_buffer.rdbuf());

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        std::cout.rdbuf(original_cout);
        Logger::reset_for_tests();

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
    }

    std::vector<std::filesystem::path> get_log_files() {
        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(test_log_dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                files.push_back(entry.path());
            }
        }
        return files;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    LoggerConfig file_config() {
        LoggerConfig config;
        config.min_level = LogLevel::DEBUG;
        config.destination = LogDestination::FILE;
        config.log_directory = test_log_dir;
        config.filename_prefix = "test";
        return config;
    }

    const std::string test_log_dir = "test_logs_paper_ngin";
    std::stringstream cout_buffer;
    std::streambuf* original_cout{nullptr};
};

TEST_F(LoggerTest, ConsoleOutputRespectsLevel) {
    LoggerConfig config;
    config.min_level = LogLevel::INFO;
    config.destination = LogDestination::CONSOLE;
    Logger::instance().initialize(config);

    DEBUG("hidden debug line");
    INFO("Entered RELIANCE x" << 25);

    std::string output = cout_buffer.str();
    EXPECT_EQ(output.find("hidden debug line"), std::string::npos);
    EXPECT_NE(output.find("[INFO]"), std::string::npos);
    EXPECT_NE(output.find("Entered RELIANCE x25"), std::string::npos);
}

TEST_F(LoggerTest, ComponentTagIsIncluded) {
    LoggerConfig config;
    config.destination = LogDestination::CONSOLE;
    Logger::instance().initialize(config);

    Logger::register_component("PortfolioOrchestrator");
    INFO("tagged");
    Logger::register_component("");

    EXPECT_NE(cout_buffer.str().find("[PortfolioOrchestrator] tagged"), std::string::npos);
}

TEST_F(LoggerTest, WritesToFile) {
    Logger::instance().initialize(file_config());
    INFO("file message");

    auto files = get_log_files();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_NE(read_file(files.front()).find("file message"), std::string::npos);
    EXPECT_NE(files.front().filename().string().find("test_"), std::string::npos);
}

TEST_F(LoggerTest, RotatesBySize) {
    auto config = file_config();
    config.max_file_size = 512;
    config.max_files = 3;
    Logger::instance().initialize(config);

    for (int i = 0; i < 100; ++i) {
        INFO("rotation filler line number " << i);
    }

    auto files = get_log_files();
    EXPECT_GT(files.size(), 1u);
    EXPECT_LE(files.size(), 3u);
}

TEST_F(LoggerTest, ConfigRoundTripAndValidation) {
    LoggerConfig config;
    config.min_level = LogLevel::WARNING;
    config.destination = LogDestination::BOTH;
    config.max_files = 4;

    LoggerConfig copy;
    copy.from_json(config.to_json());
    EXPECT_EQ(copy.min_level, LogLevel::WARNING);
    EXPECT_EQ(copy.destination, LogDestination::BOTH);
    EXPECT_EQ(copy.max_files, 4u);
    EXPECT_TRUE(copy.validate().is_ok());

    copy.max_files = 0;
    EXPECT_TRUE(copy.validate().is_error());
}

TEST_F(LoggerTest, UnknownLevelOrDestinationIsConfigError) {
    LoggerConfig config;
    EXPECT_THROW(config.from_json({{"min_level", "LOUD"}}), TradeError);
    EXPECT_THROW(config.from_json({{"destination", "SYSLOG"}}), TradeError);
    EXPECT_EQ(config.min_level, LogLevel::INFO);
    EXPECT_EQ(config.destination, LogDestination::CONSOLE);
}

TEST_F(LoggerTest, LevelStrings) {
    EXPECT_EQ(level_to_string(LogLevel::ERR), "ERROR");
    EXPECT_EQ(level_from_string("FATAL"), LogLevel::FATAL);
    EXPECT_FALSE(level_from_string("LOUD").has_value());
}
