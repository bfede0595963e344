#include "paper/util/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "paper/client.hpp"

namespace paper::util::test {

class ConfigTest : public ::testing::Test {
   protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "paper_config_test";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir_);
    }

    std::filesystem::path test_dir_;
};

TEST_F(ConfigTest, DefaultValues) {
    Config config;
    EXPECT_EQ(config.address, "paper://127.0.0.1:3145");
    EXPECT_EQ(config.timeout_ms, 0);
    EXPECT_EQ(config.connect_timeout_ms, 0);
    EXPECT_EQ(config.reconnect_attempts, 0);
    EXPECT_EQ(config.log_level, LogLevel::Warn);
    EXPECT_FALSE(config.config_path.has_value());
}

TEST_F(ConfigTest, LoadFile) {
    auto path = test_dir_ / "client.conf";
    {
        std::ofstream f(path);
        f << "address = \"paper://cache.local:4000\"\n";
        f << "timeout_ms = 1500\n";
        f << "connect_timeout_ms = 300\n";
        f << "reconnect_attempts = 2\n";
        f << "log_level = debug\n";
    }

    auto config = Config::load_file(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->address, "paper://cache.local:4000");
    EXPECT_EQ(config->timeout_ms, 1500);
    EXPECT_EQ(config->connect_timeout_ms, 300);
    EXPECT_EQ(config->reconnect_attempts, 2);
    EXPECT_EQ(config->log_level, LogLevel::Debug);
}

TEST_F(ConfigTest, LoadFileWithComments) {
    auto path = test_dir_ / "client.conf";
    {
        std::ofstream f(path);
        f << "# This is a comment\n";
        f << "timeout_ms = 50\n";
        f << "\n";
        f << "# unknown keys are skipped with a warning\n";
        f << "colour = blue\n";
    }

    auto config = Config::load_file(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->timeout_ms, 50);
}

TEST_F(ConfigTest, LoadFileBadValue) {
    auto path = test_dir_ / "client.conf";
    {
        std::ofstream f(path);
        f << "timeout_ms = soon\n";
    }
    EXPECT_THROW(Config::load_file(path), std::invalid_argument);
}

TEST_F(ConfigTest, LoadFileNotFound) {
    auto config = Config::load_file("/nonexistent/path/client.conf");
    EXPECT_FALSE(config.has_value());
}

TEST_F(ConfigTest, ParseArgs) {
    const char* argv[] = {"program", "-a", "paper://10.0.0.1:3145", "-t", "250",
                          "--connect-timeout", "100", "--reconnect", "1", "-l", "error",
                          "-c", "/etc/paper.conf"};
    int argc = 13;

    auto config = Config::parse_args(argc, const_cast<char**>(argv));
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->address, "paper://10.0.0.1:3145");
    EXPECT_EQ(config->timeout_ms, 250);
    EXPECT_EQ(config->connect_timeout_ms, 100);
    EXPECT_EQ(config->reconnect_attempts, 1);
    EXPECT_EQ(config->log_level, LogLevel::Error);
    ASSERT_TRUE(config->config_path.has_value());
    EXPECT_EQ(*config->config_path, "/etc/paper.conf");
}

TEST_F(ConfigTest, ParseArgsHelp) {
    const char* argv[] = {"program", "--help"};
    int argc = 2;

    auto config = Config::parse_args(argc, const_cast<char**>(argv));
    EXPECT_FALSE(config.has_value());
}

TEST_F(ConfigTest, ParseArgsRejectsUnknownAndIncomplete) {
    const char* unknown[] = {"program", "--port", "3145"};
    EXPECT_THROW(Config::parse_args(3, const_cast<char**>(unknown)), std::invalid_argument);

    const char* incomplete[] = {"program", "-t"};
    EXPECT_THROW(Config::parse_args(2, const_cast<char**>(incomplete)), std::invalid_argument);

    const char* negative[] = {"program", "-t", "-5"};
    EXPECT_THROW(Config::parse_args(3, const_cast<char**>(negative)), std::invalid_argument);
}

TEST_F(ConfigTest, MergeConfigs) {
    Config defaults;
    Config file_config = defaults;
    Config cli_config = defaults;

    file_config.timeout_ms = 1000;
    file_config.address = "paper://file:1";

    cli_config.timeout_ms = 20;  // CLI overrides file

    auto result = Config::merge(file_config, cli_config, defaults);

    EXPECT_EQ(result.timeout_ms, 20);                // CLI wins
    EXPECT_EQ(result.address, "paper://file:1");     // File wins (CLI was default)
    EXPECT_EQ(result.log_level, LogLevel::Warn);     // nobody set it
}

TEST_F(ConfigTest, ClientOptions) {
    Config config;
    config.timeout_ms = 750;
    config.connect_timeout_ms = 40;
    config.reconnect_attempts = 3;

    paper::ClientOptions options = config.client_options();
    EXPECT_EQ(options.timeout.count(), 750);
    EXPECT_EQ(options.connect_timeout.count(), 40);
    EXPECT_EQ(options.reconnect_attempts, 3);
}

}  // namespace paper::util::test
