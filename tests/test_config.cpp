#include <gtest/gtest.h>
#include "utils/config.h"
#include "utils/utils.h"
#include <filesystem>
#include <fstream>

using namespace paycore::utils;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir = std::filesystem::temp_directory_path() / generateId("paycore_config_");
        std::filesystem::create_directories(testDir);
        Config::instance().reset();
    }

    void TearDown() override {
        Config::instance().reset();
        std::filesystem::remove_all(testDir);
    }

    std::filesystem::path testDir;
};

TEST_F(ConfigTest, DefaultsMatchEngineDefaults) {
    EngineConfig cfg = Config::instance().getEngineConfig();
    EXPECT_EQ(cfg.currency, "USD");
    EXPECT_EQ(cfg.minorDigits, 2u);
    EXPECT_EQ(cfg.lockTimeoutMs, 5000u);
    EXPECT_TRUE(cfg.requireVerification);
    EXPECT_FALSE(cfg.verifyRecipient);
    EXPECT_EQ(cfg.maxHistoryPage, 500u);
    EXPECT_EQ(Config::instance().getStorageConfig().dbFile, "ledger.db");
}

TEST_F(ConfigTest, LoadsKeyValueFile) {
    auto path = testDir / "paycore.conf";
    {
        std::ofstream out(path);
        out << "# comment\n";
        out << "ledger.currency = EUR\n";
        out << "ledger.minor_digits=3\n";
        out << "ledger.require_verification = no\n";
        out << "log.level = debug\n";
        out << "not a setting\n";
    }

    ASSERT_TRUE(Config::instance().load(path.string()));
    EngineConfig cfg = Config::instance().getEngineConfig();
    EXPECT_EQ(cfg.currency, "EUR");
    EXPECT_EQ(cfg.minorDigits, 3u);
    EXPECT_FALSE(cfg.requireVerification);
    EXPECT_EQ(Config::instance().getLogConfig().level, "debug");
    EXPECT_EQ(Config::instance().getConfigPath(), path.string());
}

TEST_F(ConfigTest, MissingFileIsReported) {
    EXPECT_FALSE(Config::instance().load((testDir / "absent.conf").string()));
}

TEST_F(ConfigTest, ClampsOutOfRangeValues) {
    auto& config = Config::instance();
    config.set("ledger.minor_digits", 12);
    config.set("ledger.lock_timeout_ms", -4);
    config.set("ledger.max_history_page", 0);

    EngineConfig cfg = config.getEngineConfig();
    EXPECT_EQ(cfg.minorDigits, 6u);
    EXPECT_EQ(cfg.lockTimeoutMs, 1u);
    EXPECT_EQ(cfg.maxHistoryPage, 1u);
}

TEST_F(ConfigTest, SaveAndReloadEngineConfig) {
    EngineConfig cfg;
    cfg.currency = "GBP";
    cfg.lockTimeoutMs = 250;
    cfg.verifyRecipient = true;
    Config::instance().setEngineConfig(cfg);

    auto path = testDir / "saved.conf";
    ASSERT_TRUE(Config::instance().save(path.string()));

    Config::instance().reset();
    EXPECT_EQ(Config::instance().getEngineConfig().currency, "USD");

    ASSERT_TRUE(Config::instance().load(path.string()));
    EngineConfig loaded = Config::instance().getEngineConfig();
    EXPECT_EQ(loaded.currency, "GBP");
    EXPECT_EQ(loaded.lockTimeoutMs, 250u);
    EXPECT_TRUE(loaded.verifyRecipient);
}

TEST_F(ConfigTest, ChangeCallbackSeesKeys) {
    std::vector<std::string> changed;
    Config::instance().onChange([&](const std::string& key) { changed.push_back(key); });
    Config::instance().set("ledger.currency", "CHF");
    Config::instance().remove("ledger.currency");
    Config::instance().onChange(nullptr);

    ASSERT_EQ(changed.size(), 2u);
    EXPECT_EQ(changed[0], "ledger.currency");
    EXPECT_FALSE(Config::instance().has("ledger.currency"));
}

TEST_F(ConfigTest, ListsSplitOnCommas) {
    Config::instance().set("log.sinks", "file, console ,,syslog");
    auto items = Config::instance().getList("log.sinks");
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[1], "console");
    EXPECT_EQ(Config::instance().keys("ledger.").size(), 7u);
}
