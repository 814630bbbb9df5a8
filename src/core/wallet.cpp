#include "core/wallet.h"
#include "utils/utils.h"
#include "utils/logger.h"
#include <stdexcept>

namespace paycore {
namespace core {

static const char* WALLET_COLUMNS =
    "id, account_id, balance, currency, version, closed, created_at, updated_at";

static Wallet readWallet(const database::Statement& stmt) {
    Wallet w;
    w.id = stmt.getString(0);
    w.accountId = stmt.getString(1);
    w.balance = stmt.getInt64(2);
    w.currency = stmt.getString(3);
    w.version = stmt.getInt64(4);
    w.closed = stmt.getInt64(5) != 0;
    w.createdAt = static_cast<uint64_t>(stmt.getInt64(6));
    w.updatedAt = static_cast<uint64_t>(stmt.getInt64(7));
    return w;
}

static bool selectWallet(database::Database& db, const std::string& column,
                         const std::string& value, Wallet& out) {
    auto stmt = db.prepare(std::string("SELECT ") + WALLET_COLUMNS +
                           " FROM wallets WHERE " + column + " = ?;");
    stmt.bind(1, value);
    if (!stmt.step()) return false;
    out = readWallet(stmt);
    return true;
}

struct WalletStore::Impl {
    database::Storage& storage;
    explicit Impl(database::Storage& s) : storage(s) {}
};

WalletStore::WalletStore(database::Storage& storage)
    : impl_(std::make_unique<Impl>(storage)) {}

WalletStore::~WalletStore() = default;

Wallet WalletStore::create(database::UnitOfWork& uow, const std::string& accountId,
                           const std::string& currency) {
    Wallet w;
    w.id = utils::generateId("wal_");
    w.accountId = accountId;
    w.currency = currency;
    w.createdAt = utils::nowMillis();
    w.updatedAt = w.createdAt;

    auto stmt = uow.db().prepare(
        "INSERT INTO wallets (id, account_id, balance, currency, version, closed, created_at, updated_at) "
        "VALUES (?, ?, 0, ?, 0, 0, ?, ?);");
    stmt.bind(1, w.id).bind(2, w.accountId).bind(3, w.currency)
        .bind(4, static_cast<int64_t>(w.createdAt)).bind(5, static_cast<int64_t>(w.updatedAt));
    stmt.execute();
    return w;
}

Wallet WalletStore::getForUpdate(database::UnitOfWork& uow, const std::string& walletId) {
    if (!uow.holdsLock(walletId)) {
        throw std::logic_error("getForUpdate without holding the lock on " + walletId);
    }
    Wallet w;
    if (!selectWallet(uow.db(), "id", walletId, w)) {
        throw std::logic_error("getForUpdate on missing wallet " + walletId);
    }
    return w;
}

Result<void> WalletStore::save(database::UnitOfWork& uow, Wallet& wallet) {
    if (!uow.holdsLock(wallet.id)) {
        throw std::logic_error("save without holding the lock on " + wallet.id);
    }
    if (wallet.balance < 0 || wallet.balance > MAX_AMOUNT) {
        return Result<void>(makeError(ErrorCode::INVALID_AMOUNT, "balance out of range", wallet.id));
    }

    uint64_t now = utils::nowMillis();
    auto stmt = uow.db().prepare(
        "UPDATE wallets SET balance = ?, version = version + 1, updated_at = ? "
        "WHERE id = ? AND version = ?;");
    stmt.bind(1, wallet.balance).bind(2, static_cast<int64_t>(now))
        .bind(3, wallet.id).bind(4, wallet.version);
    stmt.execute();

    if (uow.db().changes() != 1) {
        LOG_WARN("wallet", "Version conflict saving " + wallet.id);
        return Result<void>(makeError(ErrorCode::CONCURRENCY_CONFLICT,
                                      "wallet changed since it was read", wallet.id));
    }

    wallet.version++;
    wallet.updatedAt = now;
    return Result<void>();
}

Result<void> WalletStore::close(database::UnitOfWork& uow, const std::string& walletId) {
    Wallet w = getForUpdate(uow, walletId);
    if (w.closed) return Result<void>();

    auto stmt = uow.db().prepare(
        "UPDATE wallets SET closed = 1, version = version + 1, updated_at = ? "
        "WHERE id = ? AND version = ?;");
    stmt.bind(1, static_cast<int64_t>(utils::nowMillis())).bind(2, w.id).bind(3, w.version);
    stmt.execute();
    if (uow.db().changes() != 1) {
        return Result<void>(makeError(ErrorCode::CONCURRENCY_CONFLICT,
                                      "wallet changed since it was read", walletId));
    }
    LOG_INFO("wallet", "Closed wallet " + walletId);
    return Result<void>();
}

bool WalletStore::findById(const std::string& walletId, Wallet& out) const {
    return selectWallet(impl_->storage.reader(), "id", walletId, out);
}

bool WalletStore::findByAccount(const std::string& accountId, Wallet& out) const {
    return selectWallet(impl_->storage.reader(), "account_id", accountId, out);
}

std::vector<Wallet> WalletStore::all() const {
    std::vector<Wallet> result;
    auto stmt = impl_->storage.reader().prepare(
        std::string("SELECT ") + WALLET_COLUMNS + " FROM wallets ORDER BY id;");
    while (stmt.step()) result.push_back(readWallet(stmt));
    return result;
}

Amount WalletStore::totalBalance() const {
    auto stmt = impl_->storage.reader().prepare("SELECT COALESCE(SUM(balance), 0) FROM wallets;");
    if (!stmt.step()) return 0;
    return stmt.getInt64(0);
}

}
}
