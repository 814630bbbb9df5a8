#include <gtest/gtest.h>
#include "utils/logger.h"
#include "utils/config.h"
#include "utils/utils.h"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace paycore::utils;

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / generateId("paycore_log_");
        std::filesystem::create_directories(testDir);
        Logger::enableConsole(false);
        Logger::setLevel(LogLevel::INFO);
        Logger::setAllowSensitiveLogging(false);
        Logger::clear();
    }

    void TearDown() override {
        Logger::onLog(nullptr);
        Logger::shutdown();
        Logger::setMaxFileSize(10 * 1024 * 1024);
        Logger::setMaxFiles(5);
        std::filesystem::remove_all(testDir);
    }

    static std::string readFile(const std::filesystem::path& p) {
        std::ifstream in(p);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    std::filesystem::path testDir;
};

TEST_F(LoggerTest, FiltersBelowLevel) {
    Logger::setLevel(LogLevel::WARN);
    LOG_INFO("transfer", "dropped");
    LOG_DEBUG("transfer", "dropped");
    LOG_WARN("transfer", "kept");
    auto entries = Logger::recent(10);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "kept");
    EXPECT_EQ(entries[0].category, "transfer");
}

TEST_F(LoggerTest, RedactsSensitiveValues) {
    EXPECT_EQ(Logger::redact("token=abc123 amount=5.00"), "token=[REDACTED] amount=5.00");
    EXPECT_EQ(Logger::redact("card: 4111111111111111"), "card: [REDACTED]");
    EXPECT_EQ(Logger::redact("no secrets here"), "no secrets here");

    LOG_INFO("payments", "signature=deadbeef");
    auto entries = Logger::recent(1);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "signature=[REDACTED]");
}

TEST_F(LoggerTest, SensitiveLoggingCanBeAllowed) {
    Logger::setAllowSensitiveLogging(true);
    LOG_INFO("payments", "token=abc123");
    EXPECT_EQ(Logger::recent(1).at(0).message, "token=abc123");
    EXPECT_EQ(Logger::redactIdentifier("alice@example.com"), "alice@example.com");
}

TEST_F(LoggerTest, RedactsIdentifiers) {
    EXPECT_EQ(Logger::redactIdentifier("alice@example.com"), "alic....com");
    EXPECT_EQ(Logger::redactIdentifier("bob"), "[REDACTED]");
}

TEST_F(LoggerTest, CallbackAndErrorCount) {
    std::vector<LogLevel> seen;
    Logger::onLog([&](const LogEntry& e) { seen.push_back(e.level); });
    LOG_INFO("engine", "one");
    LOG_ERROR("engine", "two");
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[1], LogLevel::ERROR);
    EXPECT_EQ(Logger::errorCount(), 1u);
}

TEST_F(LoggerTest, ConfigureWritesToFileInDirectory) {
    LogConfig cfg;
    cfg.level = "debug";
    cfg.file = "engine.log";
    cfg.console = false;
    Logger::configure(cfg, testDir.string());
    EXPECT_EQ(Logger::getLevel(), LogLevel::DEBUG);

    LOG_DEBUG("storage", "opened");
    Logger::shutdown();
    std::string content = readFile(testDir / "engine.log");
    EXPECT_NE(content.find("[storage] opened"), std::string::npos);
}

TEST_F(LoggerTest, RotatesWhenFileExceedsLimit) {
    Logger::init((testDir / "rot.log").string());
    Logger::setMaxFileSize(200);
    Logger::setMaxFiles(2);
    for (int i = 0; i < 20; ++i) LOG_INFO("ledger", "entry number " + std::to_string(i));
    Logger::shutdown();
    EXPECT_TRUE(std::filesystem::exists(testDir / "rot.log.1"));
    EXPECT_FALSE(std::filesystem::exists(testDir / "rot.log.3"));
}

TEST(LogLevelTest, ParsesNames) {
    EXPECT_EQ(parseLogLevel("WARNING"), LogLevel::WARN);
    EXPECT_EQ(parseLogLevel(" error "), LogLevel::ERROR);
    EXPECT_EQ(parseLogLevel("bogus", LogLevel::DEBUG), LogLevel::DEBUG);
}
