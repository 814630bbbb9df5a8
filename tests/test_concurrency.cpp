#include "test_support.h"
#include "core/ledger.h"
#include <thread>
#include <atomic>
#include <vector>
#include <set>
#include <mutex>

using namespace paycore;
using namespace paycore::core;
using paycore::tests::EngineTest;

class ConcurrencyTest : public EngineTest {
protected:
    void configure(utils::EngineConfig& cfg) override {
        cfg.lockTimeoutMs = 20000;
    }
};

TEST_F(ConcurrencyTest, TotalIsConservedUnderContention) {
    const int accountsCount = 4;
    std::vector<std::string> ids;
    for (int i = 0; i < accountsCount; i++) {
        ids.push_back(openAccount("user" + std::to_string(i) + "@example.com"));
        fund(ids.back(), "100");
    }

    std::atomic<int> conflicts{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 25; i++) {
                const std::string& from = ids[(t + i) % accountsCount];
                const std::string& to = ids[(t + i + 1 + t % 2) % accountsCount];
                auto out = send(from, to, "3.33", "t" + std::to_string(t) + "-" + std::to_string(i));
                if (out.code == ErrorCode::CONCURRENCY_CONFLICT) conflicts++;
            }
        });
    }
    for (auto& th : threads) th.join();

    Amount total = 0;
    for (const auto& id : ids) {
        Amount b = balanceOf(id);
        EXPECT_GE(b, 0);
        total += b;
    }
    EXPECT_EQ(total, 40000);
    EXPECT_EQ(engine->wallets().totalBalance(), 40000);
    EXPECT_EQ(conflicts.load(), 0);

    AuditReport report = engine->ledger().verify();
    EXPECT_TRUE(report.balanced);
    for (const auto& p : report.problems) ADD_FAILURE() << p;
}

TEST_F(ConcurrencyTest, NoOverdraftFromParallelSpends) {
    std::string payer = openAccount("payer@example.com");
    fund(payer, "10");
    std::vector<std::string> payees;
    for (int i = 0; i < 6; i++) payees.push_back(openAccount("payee" + std::to_string(i) + "@example.com"));

    std::atomic<int> succeeded{0};
    std::atomic<int> declined{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 6; i++) {
        threads.emplace_back([&, i] {
            auto out = send(payer, payees[i], "4", "spend-" + std::to_string(i));
            if (out.ok()) succeeded++;
            else if (out.code == ErrorCode::INSUFFICIENT_FUNDS) declined++;
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(succeeded.load(), 2);
    EXPECT_EQ(declined.load(), 4);
    EXPECT_EQ(balanceOf(payer), 200);
}

TEST_F(ConcurrencyTest, SameKeyAppliesOnce) {
    std::string a = openAccount("same-a@example.com");
    std::string b = openAccount("same-b@example.com");
    fund(a, "100");

    std::mutex mtx;
    std::set<std::string> txIds;
    std::atomic<int> fresh{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; i++) {
        threads.emplace_back([&] {
            auto out = send(a, b, "10", "shared-key");
            ASSERT_EQ(out.code, ErrorCode::OK);
            if (!out.alreadyProcessed) fresh++;
            std::lock_guard<std::mutex> lock(mtx);
            txIds.insert(out.transaction.id);
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(fresh.load(), 1);
    EXPECT_EQ(txIds.size(), 1u);
    EXPECT_EQ(balanceOf(a), 9000);
    EXPECT_EQ(balanceOf(b), 1000);
}

TEST_F(ConcurrencyTest, OpposingTransfersDoNotDeadlock) {
    std::string a = openAccount("left@example.com");
    std::string b = openAccount("right@example.com");
    fund(a, "500");
    fund(b, "500");

    std::atomic<int> completed{0};
    std::thread ab([&] {
        for (int i = 0; i < 40; i++) {
            if (send(a, b, "1", "ab-" + std::to_string(i)).ok()) completed++;
        }
    });
    std::thread ba([&] {
        for (int i = 0; i < 40; i++) {
            if (send(b, a, "2", "ba-" + std::to_string(i)).ok()) completed++;
        }
    });
    ab.join();
    ba.join();

    EXPECT_EQ(completed.load(), 80);
    EXPECT_EQ(balanceOf(a), 50000 - 4000 + 8000);
    EXPECT_EQ(balanceOf(b), 50000 + 4000 - 8000);
}

TEST_F(ConcurrencyTest, ShortTimeoutReportsConflict) {
    std::string a = openAccount("slow-a@example.com");
    std::string b = openAccount("slow-b@example.com");
    fund(a, "5");

    Wallet w;
    ASSERT_TRUE(engine->wallets().findByAccount(a, w));

    utils::EngineConfig quick = config;
    quick.lockTimeoutMs = 50;
    core::TransferEngine impatient(storage, quick);

    database::UnitOfWork holder(storage);
    ASSERT_TRUE(holder.begin({w.id}, std::chrono::milliseconds(500)).ok());

    TransferOutcome out;
    std::thread t([&] {
        TransferRequest req;
        req.initiatorId = a;
        req.recipient = b;
        req.amount = "1";
        req.idempotencyKey = "blocked";
        out = impatient.transfer(req);
    });
    t.join();
    holder.rollback();

    EXPECT_EQ(out.code, ErrorCode::CONCURRENCY_CONFLICT);
    EXPECT_EQ(out.certainty, Certainty::NOT_APPLIED);

    auto retry = send(a, b, "1", "blocked");
    EXPECT_TRUE(retry.ok());
    EXPECT_FALSE(retry.alreadyProcessed);
}

TEST_F(ConcurrencyTest, BusyTimeoutFollowsLockTimeout) {
    for (database::Database* db : {&storage.writer(), &storage.reader()}) {
        auto stmt = db->prepare("PRAGMA busy_timeout;");
        ASSERT_TRUE(stmt.step());
        EXPECT_EQ(stmt.getInt64(0), 20000);
    }
}
