#include "paper/util/logger.hpp"

#include <gtest/gtest.h>

#include <sstream>

namespace paper::util::test {

class LoggerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        Logger::instance().set_stream(&out_);
    }

    void TearDown() override {
        // reset to default
        Logger::instance().set_stream(nullptr);
        Logger::instance().set_level(LogLevel::Warn);
    }

    std::ostringstream out_;
};

TEST_F(LoggerTest, DefaultLevelIsWarn) {
    EXPECT_EQ(Logger::instance().level(), LogLevel::Warn);
}

TEST_F(LoggerTest, SetLevel) {
    Logger::instance().set_level(LogLevel::Debug);
    EXPECT_EQ(Logger::instance().level(), LogLevel::Debug);

    Logger::instance().set_level(LogLevel::Error);
    EXPECT_EQ(Logger::instance().level(), LogLevel::Error);
}

TEST_F(LoggerTest, LevelFiltering) {
    Logger::instance().set_level(LogLevel::Warn);

    Logger::instance().debug("filtered debug");
    Logger::instance().info("filtered info");
    Logger::instance().warn("visible warn");
    Logger::instance().error("visible error");

    std::string text = out_.str();
    EXPECT_EQ(text.find("filtered"), std::string::npos);
    EXPECT_NE(text.find("[WARN ] paper: visible warn"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] paper: visible error"), std::string::npos);
}

TEST_F(LoggerTest, NoneSilencesEverything) {
    Logger::instance().set_level(LogLevel::None);
    Logger::instance().error("nothing");
    EXPECT_TRUE(out_.str().empty());
}

TEST_F(LoggerTest, MacrosSkipDisabledMessages) {
    Logger::instance().set_level(LogLevel::Info);

    int built = 0;
    auto message = [&built] {
        ++built;
        return std::string("expensive");
    };

    PAPER_LOG_DEBUG(message());
    EXPECT_EQ(built, 0);

    PAPER_LOG_INFO(message());
    EXPECT_EQ(built, 1);
    EXPECT_NE(out_.str().find("expensive"), std::string::npos);
}

TEST(LogLevelTest, ParseAndPrint) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("none"), LogLevel::None);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
    EXPECT_EQ(to_string(LogLevel::Warn), "warn");
}

}  // namespace paper::util::test
