#pragma once

#include "core/types.h"
#include "core/notifications.h"
#include "database/database.h"
#include "utils/config.h"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <cstdint>

namespace paycore {
namespace core {

class AccountDirectory;
class WalletStore;
class Ledger;
class TransactionStore;
class IdempotencyIndex;

struct TransferRequest {
    std::string initiatorId;
    // Account id or account identifier of the recipient.
    std::string recipient;
    std::string amount;
    std::string description;
    std::string idempotencyKey;
};

struct CreditRequest {
    std::string accountId;
    std::string amount;
    // Recorded under depositKey(externalReference), scoped to accountId.
    std::string externalReference;
    std::string description;
};

using VerificationLookup = std::function<Verification(const std::string& accountId)>;

// Moves money between wallets. Every accepted request runs in one unit of
// work: wallet locks in ascending id order, balance check, both balance
// writes, two ledger legs, the transaction row and the idempotency record
// commit together or not at all. Subscribers hear about it after commit.
class TransferEngine {
public:
    TransferEngine(database::Storage& storage, const utils::EngineConfig& config);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    TransferOutcome transfer(const TransferRequest& request);
    TransferOutcome credit(const CreditRequest& request);

    Result<Amount> getBalance(const std::string& accountId) const;
    Result<HistoryPage> getHistory(const std::string& accountId, const std::string& cursor = "",
                                   size_t limit = 50) const;
    Result<Transaction> getTransaction(const std::string& transactionId) const;
    std::vector<LedgerEntry> getLedgerEntries(const std::string& transactionId) const;

    std::string onCommitted(NotificationHandler handler);
    // Replaces the default lookup, which reads the account directory.
    void setVerificationLookup(VerificationLookup lookup);

    AccountDirectory& accounts();
    WalletStore& wallets();
    Ledger& ledger();
    TransactionStore& transactions();
    IdempotencyIndex& idempotency();
    NotificationDispatcher& notifications();
    const utils::EngineConfig& config() const;

    static bool isValidIdempotencyKey(const std::string& key);
    // Key a credit is recorded under. Transfer keys may not use this prefix,
    // so a deposit can never collide with a transfer from the same account.
    static std::string depositKey(const std::string& externalReference);
    static bool isReservedKey(const std::string& key);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
