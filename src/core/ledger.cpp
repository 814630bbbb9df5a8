#include "core/ledger.h"
#include "utils/utils.h"
#include "utils/logger.h"

namespace paycore {
namespace core {

static const char* ENTRY_COLUMNS =
    "id, transaction_id, wallet_id, account_id, leg, amount, balance_after, created_at";

static LedgerEntry readEntry(const database::Statement& stmt) {
    LedgerEntry e;
    e.id = stmt.getInt64(0);
    e.transactionId = stmt.getString(1);
    e.walletId = stmt.getString(2);
    e.accountId = stmt.getString(3);
    fromString(stmt.getString(4), e.leg);
    e.amount = stmt.getInt64(5);
    e.balanceAfter = stmt.getInt64(6);
    e.createdAt = static_cast<uint64_t>(stmt.getInt64(7));
    return e;
}

struct Ledger::Impl {
    database::Storage& storage;
    explicit Impl(database::Storage& s) : storage(s) {}
};

Ledger::Ledger(database::Storage& storage) : impl_(std::make_unique<Impl>(storage)) {}

Ledger::~Ledger() = default;

Result<void> Ledger::record(database::UnitOfWork& uow, const std::string& transactionId,
                            const std::vector<LedgerLeg>& legs) {
    if (legs.size() != 2) {
        return Result<void>(makeError(ErrorCode::INTERNAL_ERROR, "posting needs exactly two legs", transactionId));
    }
    const LedgerLeg* debit = nullptr;
    const LedgerLeg* credit = nullptr;
    for (const auto& leg : legs) {
        if (leg.leg == EntryLeg::DEBIT) debit = &leg;
        else credit = &leg;
    }
    if (!debit || !credit) {
        return Result<void>(makeError(ErrorCode::INTERNAL_ERROR, "posting needs one debit and one credit", transactionId));
    }
    if (debit->amount <= 0 || debit->amount != credit->amount) {
        return Result<void>(makeError(ErrorCode::INTERNAL_ERROR, "unbalanced posting", transactionId));
    }

    int64_t now = static_cast<int64_t>(utils::nowMillis());
    auto stmt = uow.db().prepare(
        "INSERT INTO ledger_entries (transaction_id, wallet_id, account_id, leg, amount, balance_after, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?);");
    for (const LedgerLeg* leg : {debit, credit}) {
        stmt.reset();
        stmt.bind(1, transactionId).bind(2, leg->walletId).bind(3, leg->accountId)
            .bind(4, toString(leg->leg)).bind(5, leg->amount).bind(6, leg->balanceAfter).bind(7, now);
        stmt.execute();
    }
    return Result<void>();
}

std::vector<LedgerEntry> Ledger::entriesFor(const std::string& transactionId) const {
    std::vector<LedgerEntry> result;
    auto stmt = impl_->storage.reader().prepare(
        std::string("SELECT ") + ENTRY_COLUMNS + " FROM ledger_entries WHERE transaction_id = ? ORDER BY id;");
    stmt.bind(1, transactionId);
    while (stmt.step()) result.push_back(readEntry(stmt));
    return result;
}

std::vector<LedgerEntry> Ledger::entriesForAccount(const std::string& accountId, size_t limit) const {
    std::vector<LedgerEntry> result;
    auto stmt = impl_->storage.reader().prepare(
        std::string("SELECT ") + ENTRY_COLUMNS +
        " FROM ledger_entries WHERE account_id = ? ORDER BY id DESC LIMIT ?;");
    stmt.bind(1, accountId).bind(2, static_cast<int64_t>(limit));
    while (stmt.step()) result.push_back(readEntry(stmt));
    return result;
}

size_t Ledger::entryCount() const {
    auto stmt = impl_->storage.reader().prepare("SELECT COUNT(*) FROM ledger_entries;");
    if (!stmt.step()) return 0;
    return static_cast<size_t>(stmt.getInt64(0));
}

AuditReport Ledger::verify() const {
    AuditReport report;
    database::Database& db = impl_->storage.reader();
    database::ReadTransaction snapshot(db);

    {
        auto stmt = db.prepare(
            "SELECT t.id, t.amount, "
            "  COALESCE(SUM(CASE WHEN e.leg = 'DEBIT' THEN 1 ELSE 0 END), 0), "
            "  COALESCE(SUM(CASE WHEN e.leg = 'CREDIT' THEN 1 ELSE 0 END), 0), "
            "  COALESCE(SUM(CASE WHEN e.leg = 'DEBIT' THEN e.amount ELSE 0 END), 0), "
            "  COALESCE(SUM(CASE WHEN e.leg = 'CREDIT' THEN e.amount ELSE 0 END), 0) "
            "FROM transactions t LEFT JOIN ledger_entries e ON e.transaction_id = t.id "
            "WHERE t.status = 'COMPLETED' GROUP BY t.id;");
        while (stmt.step()) {
            report.transactionsChecked++;
            std::string id = stmt.getString(0);
            Amount amount = stmt.getInt64(1);
            if (stmt.getInt64(2) != 1 || stmt.getInt64(3) != 1) {
                report.problems.push_back(id + ": expected one debit and one credit leg");
            } else if (stmt.getInt64(4) != amount || stmt.getInt64(5) != amount) {
                report.problems.push_back(id + ": leg amounts do not match the transaction");
            }
        }
    }

    {
        auto stmt = db.prepare(
            "SELECT DISTINCT e.transaction_id FROM ledger_entries e "
            "LEFT JOIN transactions t ON t.id = e.transaction_id "
            "WHERE t.id IS NULL OR t.status <> 'COMPLETED';");
        while (stmt.step()) {
            report.problems.push_back(stmt.getString(0) + ": entries for a transaction that is not completed");
        }
    }

    {
        auto stmt = db.prepare(
            "SELECT w.id, w.balance, "
            "  COALESCE(SUM(CASE WHEN e.leg = 'CREDIT' THEN e.amount ELSE -e.amount END), 0) "
            "FROM wallets w LEFT JOIN ledger_entries e ON e.wallet_id = w.id "
            "GROUP BY w.id;");
        while (stmt.step()) {
            report.walletsChecked++;
            Amount balance = stmt.getInt64(1);
            Amount net = stmt.getInt64(2);
            if (balance != net) {
                report.problems.push_back(stmt.getString(0) + ": balance " + std::to_string(balance) +
                                          " differs from ledger net " + std::to_string(net));
            }
        }
    }

    report.balanced = report.problems.empty();
    if (!report.balanced) {
        LOG_ERROR("ledger", "Audit found " + std::to_string(report.problems.size()) + " problem(s)");
    }
    return report;
}

}
}
