#include "test_support.h"
#include "core/idempotency.h"
#include "core/transactions.h"

using namespace paycore;
using namespace paycore::core;
using paycore::tests::EngineTest;

class IdempotencyTest : public EngineTest {
protected:
    IdempotencyRecord makeRecord(const std::string& key, const std::string& initiator) {
        IdempotencyRecord r;
        r.key = key;
        r.initiatorId = initiator;
        r.transactionId = "txn_" + key;
        r.outcome = ErrorCode::OK;
        r.fingerprint = IdempotencyIndex::fingerprint("acc_other", 100);
        return r;
    }

    void store(IdempotencyIndex& index, const IdempotencyRecord& r) {
        database::UnitOfWork uow(storage);
        ASSERT_TRUE(uow.begin({}, std::chrono::milliseconds(500)).ok());
        index.insert(uow, r);
        ASSERT_TRUE(uow.commit().ok());
    }
};

TEST_F(IdempotencyTest, FingerprintCombinesCounterpartyAndAmount) {
    EXPECT_EQ(IdempotencyIndex::fingerprint("acc_1", 250), "acc_1:250");
    EXPECT_NE(IdempotencyIndex::fingerprint("acc_1", 250), IdempotencyIndex::fingerprint("acc_1", 251));
}

TEST_F(IdempotencyTest, KeysAreScopedToInitiator) {
    IdempotencyIndex index(storage, 16);
    store(index, makeRecord("k1", "acc_a"));

    IdempotencyRecord out;
    EXPECT_TRUE(index.lookup("k1", "acc_a", out));
    EXPECT_EQ(out.transactionId, "txn_k1");
    EXPECT_EQ(out.outcome, ErrorCode::OK);
    EXPECT_FALSE(index.lookup("k1", "acc_b", out));
}

TEST_F(IdempotencyTest, CommittedLookupsAreCached) {
    IdempotencyIndex index(storage, 16);
    store(index, makeRecord("k1", "acc_a"));

    IdempotencyRecord out;
    ASSERT_TRUE(index.lookup("k1", "acc_a", out));
    EXPECT_EQ(index.cacheSize(), 1u);
    EXPECT_EQ(index.cacheHits(), 0u);
    ASSERT_TRUE(index.lookup("k1", "acc_a", out));
    EXPECT_EQ(index.cacheHits(), 1u);

    index.clearCache();
    EXPECT_EQ(index.cacheSize(), 0u);
    EXPECT_TRUE(index.lookup("k1", "acc_a", out));
}

TEST_F(IdempotencyTest, CacheEvictsLeastRecentlyUsed) {
    IdempotencyIndex index(storage, 2);
    index.remember(makeRecord("k1", "acc_a"));
    index.remember(makeRecord("k2", "acc_a"));
    index.remember(makeRecord("k3", "acc_a"));
    EXPECT_EQ(index.cacheSize(), 2u);

    // k1 was evicted and never written to storage.
    IdempotencyRecord out;
    EXPECT_FALSE(index.lookup("k1", "acc_a", out));
    EXPECT_TRUE(index.lookup("k3", "acc_a", out));
}

TEST_F(IdempotencyTest, RecordsAreImmutable) {
    IdempotencyIndex index(storage, 0);
    store(index, makeRecord("k1", "acc_a"));

    database::UnitOfWork uow(storage);
    ASSERT_TRUE(uow.begin({}, std::chrono::milliseconds(500)).ok());
    EXPECT_THROW(index.insert(uow, makeRecord("k1", "acc_a")), database::DatabaseError);
    EXPECT_THROW(uow.db().exec("UPDATE idempotency_records SET outcome = 'INSUFFICIENT_FUNDS';"),
                 database::DatabaseError);
}

TEST_F(IdempotencyTest, UncommittedRecordIsInvisible) {
    IdempotencyIndex index(storage, 16);
    {
        database::UnitOfWork uow(storage);
        ASSERT_TRUE(uow.begin({}, std::chrono::milliseconds(500)).ok());
        index.insert(uow, makeRecord("k9", "acc_a"));
        IdempotencyRecord inside;
        EXPECT_TRUE(index.lookup(uow, "k9", "acc_a", inside));
    }
    IdempotencyRecord out;
    EXPECT_FALSE(index.lookup("k9", "acc_a", out));
}

TEST_F(IdempotencyTest, EngineReplaysFromCacheAndStorage) {
    std::string a = openAccount("jo@example.com");
    std::string b = openAccount("kim@example.com");
    fund(a, "50");

    auto first = send(a, b, "5", "order-77");
    ASSERT_TRUE(first.ok());

    uint64_t hitsBefore = engine->idempotency().cacheHits();
    auto cached = send(a, b, "5", "order-77");
    EXPECT_TRUE(cached.alreadyProcessed);
    EXPECT_GT(engine->idempotency().cacheHits(), hitsBefore);

    engine->idempotency().clearCache();
    auto stored = send(a, b, "5", "order-77");
    EXPECT_TRUE(stored.alreadyProcessed);
    EXPECT_EQ(stored.transaction.id, first.transaction.id);
    EXPECT_EQ(balanceOf(a), 4500);
}

TEST_F(IdempotencyTest, ReusedKeyWithNewParametersReturnsOriginal) {
    std::string a = openAccount("lee@example.com");
    std::string b = openAccount("max@example.com");
    fund(a, "50");

    auto first = send(a, b, "5", "dup-key");
    ASSERT_TRUE(first.ok());
    auto second = send(a, b, "7", "dup-key");
    EXPECT_EQ(second.code, ErrorCode::OK);
    EXPECT_TRUE(second.alreadyProcessed);
    EXPECT_EQ(second.transaction.id, first.transaction.id);
    EXPECT_EQ(second.transaction.amount, 500);
    EXPECT_EQ(balanceOf(b), 500);
}
