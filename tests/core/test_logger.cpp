#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>
#include "trade_sim/core/logger.hpp"

using namespace trade_sim;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        Logger::register_component("");

        original_cout = std::cout.rdbuf();
        std::cout.rdbuf(cout_buffer.rdbuf());

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        std::cout.rdbuf(original_cout);
        Logger::reset_for_tests();
        Logger::register_component("");

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
    }

    std::vector<std::filesystem::path> get_log_files(const std::string& dir) {
        std::vector<std::filesystem::path> files;
        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            if (entry.is_regular_file() && entry.path().extension() == ".log") {
                files.push_back(entry.path());
            }
        }
        std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
            return std::filesystem::last_write_time(a) < std::filesystem::last_write_time(b);
        });
        return files;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        if (!file.is_open())
            return "";
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    LoggerConfig plain_file_config() {
        LoggerConfig config;
        config.destination = LogDestination::FILE;
        config.log_directory = test_log_dir;
        config.include_timestamp = false;
        config.include_level = false;
        return config;
    }

    std::streambuf* original_cout;
    std::stringstream cout_buffer;
    const std::string test_log_dir = "test_logs";
};

TEST_F(LoggerTest, InitializationCreatesLogDirectory) {
    LoggerConfig config;
    config.destination = LogDestination::FILE;
    config.log_directory = test_log_dir + "/subdir";
    ASSERT_NO_THROW(Logger::instance().initialize(config));
    EXPECT_TRUE(std::filesystem::exists(config.log_directory));
}

TEST_F(LoggerTest, LogsToConsoleWhenConfigured) {
    LoggerConfig config;
    config.destination = LogDestination::CONSOLE;
    config.include_timestamp = false;
    config.include_level = false;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::INFO, "Console message");

    EXPECT_EQ(cout_buffer.str(), "Console message\n");
}

TEST_F(LoggerTest, LogsToBothDestinations) {
    LoggerConfig config = plain_file_config();
    config.destination = LogDestination::BOTH;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::INFO, "Both message");

    EXPECT_EQ(cout_buffer.str(), "Both message\n");
    auto files = get_log_files(test_log_dir);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(read_file(files[0]), "Both message\n");
}

TEST_F(LoggerTest, LogLevelFiltering) {
    LoggerConfig config = plain_file_config();
    config.min_level = LogLevel::WARNING;
    Logger::instance().initialize(config);

    DEBUG("Debug");
    INFO("Info");
    WARN("Warning");
    ERROR("Error");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_EQ(content.find("Debug"), std::string::npos);
    EXPECT_EQ(content.find("Info"), std::string::npos);
    EXPECT_NE(content.find("Warning\nError\n"), std::string::npos);
}

TEST_F(LoggerTest, MessageFormattingIncludesLevelAndComponent) {
    LoggerConfig config = plain_file_config();
    config.include_timestamp = true;
    config.include_level = true;
    Logger::instance().initialize(config);
    Logger::register_component("BacktestEngine");

    INFO("Formatted " << 42);

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_NE(content.find("[INFO] [BacktestEngine] Formatted 42"), std::string::npos);
}

TEST_F(LoggerTest, ComponentTagIsPerThread) {
    Logger::instance().initialize(plain_file_config());
    Logger::register_component("Main");

    std::thread worker([] {
        Logger::register_component("Worker");
        Logger::instance().log(LogLevel::INFO, "from worker");
    });
    worker.join();
    Logger::instance().log(LogLevel::INFO, "from main");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_NE(content.find("[Worker] from worker"), std::string::npos);
    EXPECT_NE(content.find("[Main] from main"), std::string::npos);
    EXPECT_EQ(Logger::current_component(), "Main");
}

TEST_F(LoggerTest, FileRotation) {
    LoggerConfig config = plain_file_config();
    config.max_file_size = 10;
    config.max_files = 2;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::INFO, "12345678");
    Logger::instance().log(LogLevel::INFO, "12345678");

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2u);
}

TEST_F(LoggerTest, MaxFilesEnforced) {
    LoggerConfig config = plain_file_config();
    config.max_file_size = 1;
    config.max_files = 2;
    Logger::instance().initialize(config);

    for (int i = 0; i < 3; ++i) {
        Logger::instance().log(LogLevel::INFO, std::to_string(i));
    }

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2u);
}

TEST_F(LoggerTest, LogBeforeInitializationSilent) {
    Logger::instance().log(LogLevel::INFO, "Test");

    EXPECT_TRUE(cout_buffer.str().empty());
    EXPECT_TRUE(get_log_files(test_log_dir).empty());
}

TEST_F(LoggerTest, ConfigFromJson) {
    LoggerConfig config;
    config.from_json({{"min_level", "DEBUG"}, {"destination", "BOTH"}, {"max_files", 3}});

    EXPECT_EQ(config.min_level, LogLevel::DEBUG);
    EXPECT_EQ(config.destination, LogDestination::BOTH);
    EXPECT_EQ(config.max_files, 3u);
    EXPECT_EQ(config.filename_prefix, "trade_sim");
    EXPECT_EQ(level_from_string("ERROR"), LogLevel::ERR);
    EXPECT_EQ(level_from_string("nonsense"), LogLevel::INFO);
}

TEST_F(LoggerTest, ConfigValidation) {
    LoggerConfig config;
    EXPECT_TRUE(config.collect_violations().empty());

    config.max_files = 0;
    config.destination = LogDestination::FILE;
    config.log_directory.clear();
    auto checked = config.check("LoggerConfig");
    ASSERT_TRUE(checked.is_error());
    auto* validation = dynamic_cast<const ValidationError*>(checked.error());
    ASSERT_NE(validation, nullptr);
    EXPECT_EQ(validation->violations().size(), 2u);
}
