#pragma once

#include "core/types.h"
#include "database/database.h"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace paycore {
namespace core {

// One side of a posting. walletId is empty for the external book side of a deposit.
struct LedgerLeg {
    std::string walletId;
    std::string accountId;
    EntryLeg leg;
    Amount amount;
    Amount balanceAfter;
};

struct AuditReport {
    bool balanced = true;
    size_t transactionsChecked = 0;
    size_t walletsChecked = 0;
    std::vector<std::string> problems;
};

// Append-only double-entry journal.
class Ledger {
public:
    explicit Ledger(database::Storage& storage);
    ~Ledger();

    // Exactly one debit and one credit with equal positive amounts.
    Result<void> record(database::UnitOfWork& uow, const std::string& transactionId,
                        const std::vector<LedgerLeg>& legs);

    std::vector<LedgerEntry> entriesFor(const std::string& transactionId) const;
    std::vector<LedgerEntry> entriesForAccount(const std::string& accountId, size_t limit = 100) const;
    size_t entryCount() const;

    // Every completed transaction has a balanced pair, nothing else has entries,
    // and every wallet balance equals its credits minus its debits.
    AuditReport verify() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
