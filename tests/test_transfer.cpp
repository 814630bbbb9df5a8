#include "test_support.h"
#include "core/transactions.h"
#include "core/ledger.h"
#include "core/idempotency.h"
#include <atomic>

using namespace paycore;
using namespace paycore::core;
using paycore::tests::EngineTest;

class TransferTest : public EngineTest {
protected:
    void SetUp() override {
        EngineTest::SetUp();
        alice = openAccount("alice@example.com");
        bob = openAccount("bob@example.com");
        fund(alice, "100.00");
    }

    std::string alice;
    std::string bob;
};

TEST_F(TransferTest, SuccessfulTransferMovesMoney) {
    auto out = send(alice, bob, "25.50", "k1");
    ASSERT_EQ(out.code, ErrorCode::OK);
    EXPECT_EQ(out.certainty, Certainty::APPLIED);
    EXPECT_FALSE(out.alreadyProcessed);

    const Transaction& tx = out.transaction;
    EXPECT_EQ(tx.status, TxStatus::COMPLETED);
    EXPECT_EQ(tx.amount, 2550);
    EXPECT_EQ(tx.sourceBalanceBefore, 10000);
    EXPECT_EQ(tx.sourceBalanceAfter, 7450);
    EXPECT_EQ(tx.destinationBalanceBefore, 0);
    EXPECT_EQ(tx.destinationBalanceAfter, 2550);

    EXPECT_EQ(balanceOf(alice), 7450);
    EXPECT_EQ(balanceOf(bob), 2550);

    auto entries = engine->getLedgerEntries(tx.id);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].leg, EntryLeg::DEBIT);
    EXPECT_EQ(entries[0].accountId, alice);
    EXPECT_EQ(entries[1].leg, EntryLeg::CREDIT);
    EXPECT_EQ(entries[1].accountId, bob);
}

TEST_F(TransferTest, RetryWithSameKeyReplays) {
    auto first = send(alice, bob, "25.50", "k1");
    ASSERT_TRUE(first.ok());

    auto retry = send(alice, bob, "25.50", "k1");
    EXPECT_EQ(retry.code, ErrorCode::OK);
    EXPECT_TRUE(retry.alreadyProcessed);
    EXPECT_EQ(retry.certainty, Certainty::APPLIED);
    EXPECT_EQ(retry.transaction.id, first.transaction.id);

    EXPECT_EQ(balanceOf(alice), 7450);
    EXPECT_EQ(balanceOf(bob), 2550);
    EXPECT_EQ(engine->ledger().entryCount(), 4u);
}

TEST_F(TransferTest, InsufficientFundsIsRecordedAndReplayed) {
    auto out = send(alice, bob, "100.01", "k2");
    EXPECT_EQ(out.code, ErrorCode::INSUFFICIENT_FUNDS);
    EXPECT_EQ(out.certainty, Certainty::NOT_APPLIED);
    EXPECT_EQ(out.transaction.status, TxStatus::FAILED);
    EXPECT_TRUE(engine->getLedgerEntries(out.transaction.id).empty());

    fund(alice, "50");
    auto retry = send(alice, bob, "100.01", "k2");
    EXPECT_EQ(retry.code, ErrorCode::INSUFFICIENT_FUNDS);
    EXPECT_TRUE(retry.alreadyProcessed);
    EXPECT_EQ(retry.transaction.id, out.transaction.id);
    EXPECT_EQ(balanceOf(alice), 15000);
    EXPECT_EQ(balanceOf(bob), 0);

    auto stored = engine->getTransaction(out.transaction.id);
    ASSERT_TRUE(stored.ok());
    EXPECT_EQ(stored.value().failureCode, "INSUFFICIENT_FUNDS");
}

TEST_F(TransferTest, SelfTransferRejected) {
    auto out = send(alice, alice, "1", "k3");
    EXPECT_EQ(out.code, ErrorCode::SELF_TRANSFER_NOT_ALLOWED);
    EXPECT_TRUE(out.transaction.id.empty());

    auto byIdentifier = send(alice, "ALICE@example.com", "1", "k3");
    EXPECT_EQ(byIdentifier.code, ErrorCode::SELF_TRANSFER_NOT_ALLOWED);
    EXPECT_EQ(balanceOf(alice), 10000);
}

TEST_F(TransferTest, WholeBalanceCanBeSent) {
    ASSERT_TRUE(send(alice, bob, "100", "all").ok());
    EXPECT_EQ(balanceOf(alice), 0);
    EXPECT_EQ(send(alice, bob, "0.01", "more").code, ErrorCode::INSUFFICIENT_FUNDS);
}

TEST_F(TransferTest, RecipientByIdentifier) {
    auto out = send(alice, "Bob@Example.com", "1", "by-name");
    ASSERT_TRUE(out.ok());
    EXPECT_EQ(out.transaction.destinationAccountId, bob);
}

TEST_F(TransferTest, ValidationOrder) {
    EXPECT_EQ(send(alice, bob, "1", "").code, ErrorCode::MISSING_IDEMPOTENCY_KEY);
    EXPECT_EQ(send(alice, bob, "1", "   ").code, ErrorCode::MISSING_IDEMPOTENCY_KEY);
    EXPECT_EQ(send(alice, bob, "1", std::string(129, 'k')).code, ErrorCode::MISSING_IDEMPOTENCY_KEY);
    EXPECT_EQ(send(alice, bob, "-1", "").code, ErrorCode::MISSING_IDEMPOTENCY_KEY);

    EXPECT_EQ(send(alice, bob, "-1", "v1").code, ErrorCode::INVALID_AMOUNT);
    EXPECT_EQ(send(alice, bob, "0", "v1").code, ErrorCode::INVALID_AMOUNT);
    EXPECT_EQ(send(alice, bob, "1.001", "v1").code, ErrorCode::INVALID_AMOUNT);
    EXPECT_EQ(send(alice, "nobody", "-1", "v1").code, ErrorCode::INVALID_AMOUNT);

    EXPECT_EQ(send(alice, "nobody", "1", "v1").code, ErrorCode::RECIPIENT_NOT_FOUND);
    EXPECT_EQ(send("acc_missing", bob, "1", "v1").code, ErrorCode::VERIFICATION_REQUIRED);

    EXPECT_EQ(engine->transactions().count(TxStatus::FAILED), 0u);
    EXPECT_EQ(balanceOf(alice), 10000);
}

TEST_F(TransferTest, UnverifiedSenderRejected) {
    std::string carol = openAccount("carol@example.com", Verification::PENDING);
    fund(carol, "10");
    EXPECT_EQ(send(carol, bob, "1", "c1").code, ErrorCode::VERIFICATION_REQUIRED);

    ASSERT_TRUE(engine->accounts().setVerification(carol, Verification::APPROVED).ok());
    EXPECT_TRUE(send(carol, bob, "1", "c1").ok());
}

TEST_F(TransferTest, VerificationLookupOverridesDirectory) {
    engine->setVerificationLookup([](const std::string&) { return Verification::REJECTED; });
    EXPECT_EQ(send(alice, bob, "1", "x1").code, ErrorCode::VERIFICATION_REQUIRED);
    engine->setVerificationLookup(nullptr);
    EXPECT_TRUE(send(alice, bob, "1", "x1").ok());
}

TEST_F(TransferTest, DeactivatedRecipientNotFound) {
    ASSERT_TRUE(engine->accounts().deactivate(bob).ok());
    EXPECT_EQ(send(alice, bob, "1", "d1").code, ErrorCode::RECIPIENT_NOT_FOUND);
}

TEST_F(TransferTest, ClosedRecipientWalletNotFound) {
    Wallet w;
    ASSERT_TRUE(engine->wallets().findByAccount(bob, w));
    {
        database::UnitOfWork uow(storage);
        ASSERT_TRUE(uow.begin({w.id}, std::chrono::milliseconds(500)).ok());
        ASSERT_TRUE(engine->wallets().close(uow, w.id).ok());
        ASSERT_TRUE(uow.commit().ok());
    }
    EXPECT_EQ(send(alice, bob, "1", "closed").code, ErrorCode::RECIPIENT_NOT_FOUND);
    EXPECT_EQ(balanceOf(alice), 10000);
}

TEST_F(TransferTest, ReplayAfterRecipientDeactivated) {
    auto first = send(alice, bob, "50.00", "k1");
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(engine->accounts().deactivate(bob).ok());

    auto retry = send(alice, bob, "50.00", "k1");
    EXPECT_EQ(retry.code, ErrorCode::OK);
    EXPECT_EQ(retry.certainty, Certainty::APPLIED);
    EXPECT_TRUE(retry.alreadyProcessed);
    EXPECT_EQ(retry.transaction.id, first.transaction.id);

    EXPECT_EQ(send(alice, bob, "50.00", "k1-new").code, ErrorCode::RECIPIENT_NOT_FOUND);
    EXPECT_EQ(balanceOf(alice), 5000);
}

TEST_F(TransferTest, ReplayAfterVerificationRevoked) {
    auto first = send(alice, bob, "10", "v-rev");
    ASSERT_TRUE(first.ok());
    ASSERT_TRUE(engine->accounts().setVerification(alice, Verification::REJECTED).ok());

    auto retry = send(alice, bob, "10", "v-rev");
    EXPECT_EQ(retry.code, ErrorCode::OK);
    EXPECT_TRUE(retry.alreadyProcessed);
    EXPECT_EQ(retry.transaction.id, first.transaction.id);

    engine->setVerificationLookup([](const std::string&) { return Verification::PENDING; });
    auto viaLookup = send(alice, bob, "10", "v-rev");
    EXPECT_EQ(viaLookup.code, ErrorCode::OK);
    EXPECT_TRUE(viaLookup.alreadyProcessed);

    EXPECT_EQ(send(alice, bob, "10", "v-new").code, ErrorCode::VERIFICATION_REQUIRED);
    EXPECT_EQ(balanceOf(bob), 1000);
}

TEST_F(TransferTest, DepositPrefixIsReservedForCredits) {
    EXPECT_EQ(send(alice, bob, "1", "deposit:pi_1").code, ErrorCode::MISSING_IDEMPOTENCY_KEY);
    EXPECT_EQ(TransferEngine::depositKey("pi_1"), "deposit:pi_1");
    EXPECT_TRUE(TransferEngine::isReservedKey("deposit:pi_1"));
    EXPECT_FALSE(TransferEngine::isReservedKey("pi_1"));
    EXPECT_EQ(balanceOf(alice), 10000);
}

TEST_F(TransferTest, TransferKeyDoesNotShadowDepositReference) {
    auto sent = send(alice, bob, "1", "ref-9");
    ASSERT_TRUE(sent.ok());

    CreditRequest req;
    req.accountId = alice;
    req.amount = "20";
    req.externalReference = "ref-9";
    auto credited = engine->credit(req);
    ASSERT_TRUE(credited.ok());
    EXPECT_FALSE(credited.alreadyProcessed);
    EXPECT_NE(credited.transaction.id, sent.transaction.id);
    EXPECT_EQ(credited.transaction.kind, TxKind::DEPOSIT);
    EXPECT_EQ(credited.transaction.externalReference, "ref-9");
    EXPECT_EQ(balanceOf(alice), 11900);
}

TEST_F(TransferTest, KeyBoundToOtherKindIsRejected) {
    auto sent = send(alice, bob, "1", "legacy");
    ASSERT_TRUE(sent.ok());
    {
        database::UnitOfWork uow(storage);
        ASSERT_TRUE(uow.begin({}, std::chrono::milliseconds(500)).ok());
        IdempotencyRecord record;
        record.key = TransferEngine::depositKey("legacy");
        record.initiatorId = alice;
        record.transactionId = sent.transaction.id;
        record.fingerprint = IdempotencyIndex::fingerprint(alice, 500);
        record.firstSeenAt = utils::nowMillis();
        engine->idempotency().insert(uow, record);
        ASSERT_TRUE(uow.commit().ok());
    }

    CreditRequest req;
    req.accountId = alice;
    req.amount = "5";
    req.externalReference = "legacy";
    auto out = engine->credit(req);
    EXPECT_EQ(out.code, ErrorCode::ALREADY_EXISTS);
    EXPECT_EQ(out.certainty, Certainty::NOT_APPLIED);
    EXPECT_FALSE(out.alreadyProcessed);
    EXPECT_EQ(balanceOf(alice), 9900);
}

TEST_F(TransferTest, DepositReferenceIsIdempotent) {
    CreditRequest req;
    req.accountId = bob;
    req.amount = "5";
    req.externalReference = "ext-1";
    auto first = engine->credit(req);
    ASSERT_TRUE(first.ok());
    auto again = engine->credit(req);
    EXPECT_TRUE(again.ok());
    EXPECT_TRUE(again.alreadyProcessed);
    EXPECT_EQ(again.transaction.id, first.transaction.id);
    EXPECT_EQ(balanceOf(bob), 500);

    req.externalReference = "";
    EXPECT_EQ(engine->credit(req).code, ErrorCode::MISSING_IDEMPOTENCY_KEY);
    req.externalReference = "ext-2";
    req.accountId = "acc_missing";
    EXPECT_EQ(engine->credit(req).code, ErrorCode::RECIPIENT_NOT_FOUND);
}

TEST_F(TransferTest, DepositCannotExceedMaximum) {
    fund(bob, "9999999999999.99");
    CreditRequest req;
    req.accountId = bob;
    req.amount = "0.01";
    req.externalReference = "overflow";
    EXPECT_EQ(engine->credit(req).code, ErrorCode::INVALID_AMOUNT);

    auto out = send(alice, bob, "1", "overflow-transfer");
    EXPECT_EQ(out.code, ErrorCode::INVALID_AMOUNT);
    EXPECT_EQ(balanceOf(alice), 10000);
    EXPECT_TRUE(engine->ledger().verify().balanced);
}

TEST_F(TransferTest, HistoryPagesNewestFirst) {
    for (int i = 0; i < 5; i++) {
        ASSERT_TRUE(send(alice, bob, "1", "h" + std::to_string(i)).ok());
    }

    auto page1 = engine->getHistory(alice, "", 4);
    ASSERT_TRUE(page1.ok());
    ASSERT_EQ(page1.value().items.size(), 4u);
    EXPECT_EQ(page1.value().items[0].idempotencyKey, "h4");
    ASSERT_FALSE(page1.value().nextCursor.empty());

    auto page2 = engine->getHistory(alice, page1.value().nextCursor, 4);
    ASSERT_TRUE(page2.ok());
    ASSERT_EQ(page2.value().items.size(), 2u);
    EXPECT_EQ(page2.value().items[0].idempotencyKey, "h0");
    EXPECT_EQ(page2.value().items[1].kind, TxKind::DEPOSIT);
    EXPECT_TRUE(page2.value().nextCursor.empty());

    auto bobPage = engine->getHistory(bob);
    ASSERT_TRUE(bobPage.ok());
    EXPECT_EQ(bobPage.value().items.size(), 5u);

    EXPECT_EQ(engine->getHistory(alice, "", 0).error().code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(engine->getHistory(alice, "abc", 10).error().code, ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(engine->getHistory("acc_missing").error().code, ErrorCode::NOT_FOUND);
}

TEST_F(TransferTest, LookupsReportMissing) {
    EXPECT_EQ(engine->getTransaction("txn_nope").error().code, ErrorCode::NOT_FOUND);
    EXPECT_EQ(engine->getBalance("acc_nope").error().code, ErrorCode::NOT_FOUND);
    EXPECT_TRUE(engine->getLedgerEntries("txn_nope").empty());
}

TEST_F(TransferTest, SubscribersHearAfterCommit) {
    std::atomic<int> completed{0};
    std::atomic<int> failed{0};
    engine->onCommitted([&](const Notification& n) {
        if (n.type == NotificationType::TRANSFER_COMPLETED) completed++;
        if (n.type == NotificationType::TRANSFER_FAILED) failed++;
    });

    ASSERT_TRUE(send(alice, bob, "1", "n1").ok());
    send(alice, bob, "1", "n1");
    send(alice, bob, "1000", "n2");
    ASSERT_TRUE(engine->notifications().waitIdle(std::chrono::seconds(2)));

    EXPECT_EQ(completed.load(), 1);
    EXPECT_EQ(failed.load(), 1);
}
