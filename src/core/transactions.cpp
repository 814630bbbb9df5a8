#include "core/transactions.h"
#include "utils/utils.h"
#include <cctype>
#include <limits>

namespace paycore {
namespace core {

static const char* TX_COLUMNS =
    "seq, id, idempotency_key, initiator_id, kind, source_account_id, destination_account_id, "
    "external_reference, amount, currency, description, status, failure_code, failure_reason, "
    "source_balance_before, source_balance_after, destination_balance_before, "
    "destination_balance_after, created_at, completed_at";

static Transaction readTransaction(const database::Statement& stmt) {
    Transaction tx;
    tx.seq = stmt.getInt64(0);
    tx.id = stmt.getString(1);
    tx.idempotencyKey = stmt.getString(2);
    tx.initiatorId = stmt.getString(3);
    fromString(stmt.getString(4), tx.kind);
    tx.sourceAccountId = stmt.getString(5);
    tx.destinationAccountId = stmt.getString(6);
    tx.externalReference = stmt.getString(7);
    tx.amount = stmt.getInt64(8);
    tx.currency = stmt.getString(9);
    tx.description = stmt.getString(10);
    fromString(stmt.getString(11), tx.status);
    tx.failureCode = stmt.getString(12);
    tx.failureReason = stmt.getString(13);
    tx.sourceBalanceBefore = stmt.getInt64(14);
    tx.sourceBalanceAfter = stmt.getInt64(15);
    tx.destinationBalanceBefore = stmt.getInt64(16);
    tx.destinationBalanceAfter = stmt.getInt64(17);
    tx.createdAt = static_cast<uint64_t>(stmt.getInt64(18));
    tx.completedAt = static_cast<uint64_t>(stmt.getInt64(19));
    return tx;
}

static bool selectTransaction(database::Database& db, const std::string& id, Transaction& out) {
    auto stmt = db.prepare(std::string("SELECT ") + TX_COLUMNS + " FROM transactions WHERE id = ?;");
    stmt.bind(1, id);
    if (!stmt.step()) return false;
    out = readTransaction(stmt);
    return true;
}

static bool parseCursor(const std::string& cursor, int64_t& seq) {
    if (cursor.empty()) {
        seq = std::numeric_limits<int64_t>::max();
        return true;
    }
    if (cursor.size() > 18) return false;
    int64_t value = 0;
    for (unsigned char c : cursor) {
        if (!std::isdigit(c)) return false;
        value = value * 10 + (c - '0');
    }
    if (value <= 0) return false;
    seq = value;
    return true;
}

struct TransactionStore::Impl {
    database::Storage& storage;
    explicit Impl(database::Storage& s) : storage(s) {}
};

TransactionStore::TransactionStore(database::Storage& storage)
    : impl_(std::make_unique<Impl>(storage)) {}

TransactionStore::~TransactionStore() = default;

void TransactionStore::insert(database::UnitOfWork& uow, Transaction& tx) {
    tx.status = TxStatus::PENDING;
    if (tx.createdAt == 0) tx.createdAt = utils::nowMillis();

    auto stmt = uow.db().prepare(
        "INSERT INTO transactions (id, idempotency_key, initiator_id, kind, source_account_id, "
        "destination_account_id, external_reference, amount, currency, description, status, "
        "source_balance_before, source_balance_after, destination_balance_before, "
        "destination_balance_after, created_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 'PENDING', ?, ?, ?, ?, ?);");
    stmt.bind(1, tx.id).bind(2, tx.idempotencyKey).bind(3, tx.initiatorId)
        .bind(4, toString(tx.kind)).bind(5, tx.sourceAccountId).bind(6, tx.destinationAccountId)
        .bind(7, tx.externalReference).bind(8, tx.amount).bind(9, tx.currency)
        .bind(10, tx.description).bind(11, tx.sourceBalanceBefore).bind(12, tx.sourceBalanceAfter)
        .bind(13, tx.destinationBalanceBefore).bind(14, tx.destinationBalanceAfter)
        .bind(15, static_cast<int64_t>(tx.createdAt));
    stmt.execute();
    tx.seq = uow.db().lastInsertRowId();
}

Result<void> TransactionStore::markCompleted(database::UnitOfWork& uow, Transaction& tx) {
    uint64_t now = utils::nowMillis();
    auto stmt = uow.db().prepare(
        "UPDATE transactions SET status = 'COMPLETED', source_balance_before = ?, "
        "source_balance_after = ?, destination_balance_before = ?, destination_balance_after = ?, "
        "completed_at = ? WHERE id = ? AND status = 'PENDING';");
    stmt.bind(1, tx.sourceBalanceBefore).bind(2, tx.sourceBalanceAfter)
        .bind(3, tx.destinationBalanceBefore).bind(4, tx.destinationBalanceAfter)
        .bind(5, static_cast<int64_t>(now)).bind(6, tx.id);
    stmt.execute();
    if (uow.db().changes() != 1) {
        return Result<void>(makeError(ErrorCode::INVALID_STATE, "transaction is not pending", tx.id));
    }
    tx.status = TxStatus::COMPLETED;
    tx.completedAt = now;
    return Result<void>();
}

Result<void> TransactionStore::markFailed(database::UnitOfWork& uow, Transaction& tx,
                                          ErrorCode code, const std::string& reason) {
    uint64_t now = utils::nowMillis();
    auto stmt = uow.db().prepare(
        "UPDATE transactions SET status = 'FAILED', failure_code = ?, failure_reason = ?, "
        "source_balance_before = ?, source_balance_after = ?, destination_balance_before = ?, "
        "destination_balance_after = ?, completed_at = ? WHERE id = ? AND status = 'PENDING';");
    stmt.bind(1, errorCodeName(code)).bind(2, reason)
        .bind(3, tx.sourceBalanceBefore).bind(4, tx.sourceBalanceAfter)
        .bind(5, tx.destinationBalanceBefore).bind(6, tx.destinationBalanceAfter)
        .bind(7, static_cast<int64_t>(now)).bind(8, tx.id);
    stmt.execute();
    if (uow.db().changes() != 1) {
        return Result<void>(makeError(ErrorCode::INVALID_STATE, "transaction is not pending", tx.id));
    }
    tx.status = TxStatus::FAILED;
    tx.failureCode = errorCodeName(code);
    tx.failureReason = reason;
    tx.completedAt = now;
    return Result<void>();
}

bool TransactionStore::find(database::UnitOfWork& uow, const std::string& id, Transaction& out) const {
    return selectTransaction(uow.db(), id, out);
}

bool TransactionStore::find(const std::string& id, Transaction& out) const {
    return selectTransaction(impl_->storage.reader(), id, out);
}

Result<HistoryPage> TransactionStore::history(const std::string& accountId, const std::string& cursor,
                                              size_t limit) const {
    int64_t before = 0;
    if (!parseCursor(cursor, before)) {
        return Result<HistoryPage>(makeError(ErrorCode::INVALID_ARGUMENT, "invalid history cursor", cursor));
    }
    if (limit == 0) {
        return Result<HistoryPage>(makeError(ErrorCode::INVALID_ARGUMENT, "page size must be positive"));
    }

    HistoryPage page;
    auto stmt = impl_->storage.reader().prepare(
        std::string("SELECT ") + TX_COLUMNS + " FROM transactions "
        "WHERE (source_account_id = ?1 OR destination_account_id = ?1) AND seq < ?2 "
        "ORDER BY seq DESC LIMIT ?3;");
    stmt.bind(1, accountId).bind(2, before).bind(3, static_cast<int64_t>(limit + 1));
    while (stmt.step()) page.items.push_back(readTransaction(stmt));

    if (page.items.size() > limit) {
        page.items.resize(limit);
        page.nextCursor = std::to_string(page.items.back().seq);
    }
    return Result<HistoryPage>(page);
}

size_t TransactionStore::count(TxStatus status) const {
    auto stmt = impl_->storage.reader().prepare("SELECT COUNT(*) FROM transactions WHERE status = ?;");
    stmt.bind(1, toString(status));
    if (!stmt.step()) return 0;
    return static_cast<size_t>(stmt.getInt64(0));
}

}
}
