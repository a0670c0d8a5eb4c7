#include <gtest/gtest.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>
#include "finpipe/core/logger.hpp"

using namespace finpipe;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::reset_for_tests();
        Logger::register_component("");

        original_cout = std::cout.rdbuf();
        original_cerr = std::cerr.rdbuf();
        std::cout.rdbuf(cout_buffer.rdbuf());
        std::cerr.rdbuf(cerr_buffer.rdbuf());

        std::error_code ec;
        std::filesystem::remove_all(test_log_dir, ec);
        std::filesystem::create_directories(test_log_dir);
    }

    void TearDown() override {
        std::cout.rdbuf(original_cout);
        std::cerr.rdbuf(original_cerr);
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
        std::sort(files.begin(), files.end());
        return files;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream file(path);
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }

    LoggerConfig plain_config(LogDestination destination) {
        LoggerConfig config;
        config.destination = destination;
        config.log_directory = test_log_dir;
        config.include_timestamp = false;
        config.include_level = false;
        return config;
    }

    std::streambuf* original_cout;
    std::streambuf* original_cerr;
    std::stringstream cout_buffer;
    std::stringstream cerr_buffer;
    const std::string test_log_dir = "finpipe_test_logs";
};

TEST_F(LoggerTest, InitializationCreatesLogDirectory) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.log_directory = test_log_dir + "/subdir";
    ASSERT_NO_THROW(Logger::instance().initialize(config));
    EXPECT_TRUE(std::filesystem::exists(config.log_directory));
}

TEST_F(LoggerTest, InfoGoesToStdoutWarningsToStderr) {
    Logger::instance().initialize(plain_config(LogDestination::CONSOLE));

    Logger::instance().log(LogLevel::INFO, "Fetched 3/3 symbols");
    Logger::instance().log(LogLevel::WARNING, "yahoo_eod quota exhausted");

    EXPECT_EQ(cout_buffer.str(), "Fetched 3/3 symbols\n");
    EXPECT_EQ(cerr_buffer.str(), "yahoo_eod quota exhausted\n");
}

TEST_F(LoggerTest, LogsToBothDestinations) {
    Logger::instance().initialize(plain_config(LogDestination::BOTH));

    Logger::instance().log(LogLevel::INFO, "Both message");

    EXPECT_EQ(cout_buffer.str(), "Both message\n");
    auto files = get_log_files(test_log_dir);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(read_file(files[0]), "Both message\n");
}

TEST_F(LoggerTest, LogLevelFiltering) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.min_level = LogLevel::WARNING;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::DEBUG, "Debug");
    Logger::instance().log(LogLevel::INFO, "Info");
    Logger::instance().log(LogLevel::WARNING, "Warning");
    Logger::instance().log(LogLevel::ERR, "Error");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_EQ(content, "Warning\nError\n");
}

TEST_F(LoggerTest, ComponentTagAndLevelInPrefix) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.include_level = true;
    Logger::instance().initialize(config);

    {
        ScopedLogComponent component("RateLimiter");
        INFO("denied " << 2 << " permits");
    }
    INFO("untagged");

    auto content = read_file(get_log_files(test_log_dir)[0]);
    EXPECT_NE(content.find("[INFO] [RateLimiter] denied 2 permits"), std::string::npos);
    EXPECT_NE(content.find("[INFO] untagged"), std::string::npos);
}

TEST_F(LoggerTest, FileRotation) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.max_file_size = 10;
    config.max_files = 3;
    Logger::instance().initialize(config);

    Logger::instance().log(LogLevel::INFO, "12345678");
    Logger::instance().log(LogLevel::INFO, "12345678");

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2u);
}

TEST_F(LoggerTest, MaxFilesEnforced) {
    LoggerConfig config = plain_config(LogDestination::FILE);
    config.max_file_size = 1;
    config.max_files = 2;
    Logger::instance().initialize(config);

    for (int i = 0; i < 3; ++i) {
        Logger::instance().log(LogLevel::INFO, std::to_string(i));
    }

    EXPECT_EQ(get_log_files(test_log_dir).size(), 2u);
}

TEST_F(LoggerTest, LogBeforeInitializationWritesNothingToStdout) {
    Logger::instance().log(LogLevel::INFO, "Test");

    EXPECT_TRUE(cout_buffer.str().empty());
    EXPECT_TRUE(get_log_files(test_log_dir).empty());
}

TEST_F(LoggerTest, ConfigJsonRoundTripAndUnknownLevelIgnored) {
    LoggerConfig config;
    config.min_level = LogLevel::DEBUG;
    config.destination = LogDestination::BOTH;
    config.filename_prefix = "refresh";

    LoggerConfig loaded;
    loaded.from_json(config.to_json());
    EXPECT_EQ(loaded.min_level, LogLevel::DEBUG);
    EXPECT_EQ(loaded.destination, LogDestination::BOTH);
    EXPECT_EQ(loaded.filename_prefix, "refresh");

    loaded.from_json(nlohmann::json{{"min_level", "VERBOSE"}});
    EXPECT_EQ(loaded.min_level, LogLevel::DEBUG);
    EXPECT_EQ(level_from_string("WARN"), LogLevel::WARNING);
}
