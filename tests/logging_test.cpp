#include "sqlxfer/error.h"
#include "sqlxfer/logging.h"

#include <cstdio>
#include <fstream>
#include <sstream>

#include <gtest/gtest.h>

using namespace sqlxfer;

namespace {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "sqlxfer_logger_test.log";
        saved_ = Logger::instance().level();
        Logger::instance().set_console_level(LogLevel::Off);
    }

    void TearDown() override {
        auto& log = Logger::instance();
        log.close_log_file();
        log.set_level(saved_);
        log.set_console_level(LogLevel::Trace);
        std::remove(path_.c_str());
    }

    std::string read_log() const {
        std::ifstream in(path_);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::string path_;
    LogLevel    saved_ = LogLevel::Info;
};

}  // namespace

TEST_F(LoggerTest, FileReceivesMessagesAtOrAboveLevel) {
    auto& log = Logger::instance();
    log.set_level(LogLevel::Info);
    log.set_log_file(path_);

    LOG_DEBUG("hidden %d", 1);
    LOG_INFO("Source rows: %d", 42);
    LOG_WARN("careful %s", "now");
    log.close_log_file();

    std::string text = read_log();
    EXPECT_EQ(text.find("hidden"), std::string::npos);
    EXPECT_NE(text.find("] [INFO ] Source rows: 42\n"), std::string::npos);
    EXPECT_NE(text.find("] [WARN ] careful now\n"), std::string::npos);
}

TEST_F(LoggerTest, VerboseEnablesDebug) {
    auto& log = Logger::instance();
    log.set_level(LogLevel::Info);
    log.set_verbose(true);
    EXPECT_EQ(log.level(), LogLevel::Debug);

    log.set_log_file(path_);
    LOG_DEBUG("Batch %d", 3);
    log.close_log_file();
    EXPECT_NE(read_log().find("[DEBUG] Batch 3"), std::string::npos);
}

TEST_F(LoggerTest, OffSilencesEverything) {
    auto& log = Logger::instance();
    log.set_level(LogLevel::Off);
    log.set_log_file(path_);
    LOG_ERROR("boom");
    log.close_log_file();
    EXPECT_TRUE(read_log().empty());
}

TEST(LogLevelTest, Parse) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
    EXPECT_THROW(parse_log_level("loud"), ConfigError);
    EXPECT_THROW(parse_log_level("\xC9rror"), ConfigError);
}
