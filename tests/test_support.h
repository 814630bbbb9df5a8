#pragma once

#include <gtest/gtest.h>
#include "core/transfer.h"
#include "core/accounts.h"
#include "core/wallet.h"
#include "database/database.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <filesystem>
#include <memory>
#include <string>

namespace paycore {
namespace tests {

// Fresh ledger database per test with a running engine on top.
class EngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        utils::Logger::enableConsole(false);
        testDir = std::filesystem::temp_directory_path() / utils::generateId("paycore_test_");
        std::filesystem::create_directories(testDir);
        config.lockTimeoutMs = 5000;
        configure(config);
        ASSERT_TRUE(storage.open((testDir / "ledger.db").string(), config.lockTimeoutMs)) << storage.lastError();
        engine = std::make_unique<core::TransferEngine>(storage, config);
    }

    void TearDown() override {
        engine.reset();
        storage.close();
        std::error_code ec;
        std::filesystem::remove_all(testDir, ec);
    }

    virtual void configure(utils::EngineConfig&) {}

    std::string openAccount(const std::string& identifier,
                            core::Verification v = core::Verification::APPROVED) {
        auto created = engine->accounts().createAccount(identifier, v);
        EXPECT_TRUE(created.ok()) << created.error().message;
        return created.ok() ? created.value().id : std::string();
    }

    void fund(const std::string& accountId, const std::string& amount) {
        core::CreditRequest req;
        req.accountId = accountId;
        req.amount = amount;
        req.externalReference = utils::generateId("dep_");
        auto out = engine->credit(req);
        ASSERT_TRUE(out.ok()) << out.message;
    }

    core::Amount balanceOf(const std::string& accountId) {
        auto b = engine->getBalance(accountId);
        EXPECT_TRUE(b.ok());
        return b.ok() ? b.value() : -1;
    }

    core::TransferOutcome send(const std::string& from, const std::string& to,
                               const std::string& amount, const std::string& key) {
        core::TransferRequest req;
        req.initiatorId = from;
        req.recipient = to;
        req.amount = amount;
        req.idempotencyKey = key;
        return engine->transfer(req);
    }

    std::filesystem::path testDir;
    database::Storage storage;
    utils::EngineConfig config;
    std::unique_ptr<core::TransferEngine> engine;
};

}
}
