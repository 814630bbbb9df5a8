#include "core/accounts.h"
#include "core/wallet.h"
#include "utils/utils.h"
#include "utils/logger.h"
#include <cctype>
#include <chrono>
#include <functional>

namespace paycore {
namespace core {

static const size_t MAX_IDENTIFIER_LENGTH = 254;

static const char* ACCOUNT_COLUMNS = "id, identifier, verification, active, created_at";

static Account readAccount(const database::Statement& stmt) {
    Account a;
    a.id = stmt.getString(0);
    a.identifier = stmt.getString(1);
    if (!fromString(stmt.getString(2), a.verification)) a.verification = Verification::PENDING;
    a.active = stmt.getInt64(3) != 0;
    a.createdAt = static_cast<uint64_t>(stmt.getInt64(4));
    return a;
}

static std::string normalizeIdentifier(const std::string& identifier) {
    return utils::Formatter::toLower(utils::Formatter::trim(identifier));
}

struct AccountDirectory::Impl {
    database::Storage& storage;
    WalletStore& wallets;
    std::string currency;
    std::chrono::milliseconds lockTimeout;

    Impl(database::Storage& s, WalletStore& w, const std::string& c, uint32_t timeoutMs)
        : storage(s), wallets(w), currency(c), lockTimeout(timeoutMs) {}

    bool selectBy(database::Database& db, const std::string& column,
                  const std::string& value, Account& out) const {
        auto stmt = db.prepare(std::string("SELECT ") + ACCOUNT_COLUMNS +
                               " FROM accounts WHERE " + column + " = ?;");
        stmt.bind(1, value);
        if (!stmt.step()) return false;
        out = readAccount(stmt);
        return true;
    }

    Result<void> updateAccount(const std::string& accountId, const std::string& sql,
                               const std::function<void(database::Statement&)>& binder) {
        database::UnitOfWork uow(storage);
        auto begun = uow.begin({}, lockTimeout);
        if (!begun.ok()) return begun;
        try {
            auto stmt = uow.db().prepare(sql);
            binder(stmt);
            stmt.execute();
            if (uow.db().changes() != 1) {
                return Result<void>(makeError(ErrorCode::NOT_FOUND, "account not found", accountId));
            }
        } catch (const database::DatabaseError& e) {
            ErrorHandler::instance().handle(makeError(ErrorCode::DATABASE_ERROR, e.what(), accountId));
            return Result<void>(makeError(ErrorCode::DATABASE_ERROR, e.what(), accountId));
        }
        return uow.commit();
    }
};

AccountDirectory::AccountDirectory(database::Storage& storage, WalletStore& wallets,
                                   const std::string& currency, uint32_t lockTimeoutMs)
    : impl_(std::make_unique<Impl>(storage, wallets, currency, lockTimeoutMs)) {}

AccountDirectory::~AccountDirectory() = default;

bool AccountDirectory::isValidIdentifier(const std::string& identifier) {
    if (identifier.empty() || identifier.size() > MAX_IDENTIFIER_LENGTH) return false;
    for (unsigned char c : identifier) {
        if (!std::isgraph(c)) return false;
    }
    return true;
}

Result<Account> AccountDirectory::createAccount(const std::string& identifier,
                                                Verification verification) {
    std::string normalized = normalizeIdentifier(identifier);
    if (!isValidIdentifier(normalized)) {
        return Result<Account>(makeError(ErrorCode::INVALID_ARGUMENT, "invalid account identifier"));
    }

    database::UnitOfWork uow(impl_->storage);
    auto begun = uow.begin({}, impl_->lockTimeout);
    if (!begun.ok()) return Result<Account>(begun.error());

    Account account;
    try {
        Account existing;
        if (impl_->selectBy(uow.db(), "identifier", normalized, existing)) {
            return Result<Account>(makeError(ErrorCode::ALREADY_EXISTS,
                                             "identifier already registered", existing.id));
        }

        account.id = utils::generateId("acc_");
        account.identifier = normalized;
        account.verification = verification;
        account.active = true;
        account.createdAt = utils::nowMillis();

        auto stmt = uow.db().prepare(
            "INSERT INTO accounts (id, identifier, verification, active, created_at) "
            "VALUES (?, ?, ?, 1, ?);");
        stmt.bind(1, account.id).bind(2, account.identifier)
            .bind(3, toString(account.verification)).bind(4, static_cast<int64_t>(account.createdAt));
        stmt.execute();

        impl_->wallets.create(uow, account.id, impl_->currency);
    } catch (const database::DatabaseError& e) {
        ErrorHandler::instance().handle(makeError(ErrorCode::DATABASE_ERROR, e.what(), "createAccount"));
        LOG_ERROR("accounts", std::string("Provisioning failed: ") + e.what());
        return Result<Account>(makeError(ErrorCode::DATABASE_ERROR, e.what()));
    }

    auto committed = uow.commit();
    if (!committed.ok()) return Result<Account>(committed.error());

    LOG_INFO("accounts", "Provisioned account " + account.id + " for " +
             utils::Logger::redactIdentifier(account.identifier));
    return Result<Account>(account);
}

bool AccountDirectory::findById(const std::string& accountId, Account& out) const {
    return impl_->selectBy(impl_->storage.reader(), "id", accountId, out);
}

bool AccountDirectory::findByIdentifier(const std::string& identifier, Account& out) const {
    return impl_->selectBy(impl_->storage.reader(), "identifier", normalizeIdentifier(identifier), out);
}

bool AccountDirectory::resolve(const std::string& idOrIdentifier, Account& out) const {
    if (idOrIdentifier.empty()) return false;
    if (findById(idOrIdentifier, out)) return true;
    return findByIdentifier(idOrIdentifier, out);
}

Result<void> AccountDirectory::setVerification(const std::string& accountId, Verification verification) {
    auto result = impl_->updateAccount(accountId,
        "UPDATE accounts SET verification = ? WHERE id = ?;",
        [&](database::Statement& stmt) {
            stmt.bind(1, toString(verification)).bind(2, accountId);
        });
    if (result.ok()) {
        LOG_INFO("accounts", "Account " + accountId + " verification set to " + toString(verification));
    }
    return result;
}

Result<void> AccountDirectory::deactivate(const std::string& accountId) {
    return impl_->updateAccount(accountId,
        "UPDATE accounts SET active = 0 WHERE id = ?;",
        [&](database::Statement& stmt) { stmt.bind(1, accountId); });
}

std::vector<Account> AccountDirectory::list(size_t limit) const {
    std::vector<Account> result;
    auto stmt = impl_->storage.reader().prepare(
        std::string("SELECT ") + ACCOUNT_COLUMNS + " FROM accounts ORDER BY created_at, id LIMIT ?;");
    stmt.bind(1, static_cast<int64_t>(limit));
    while (stmt.step()) result.push_back(readAccount(stmt));
    return result;
}

size_t AccountDirectory::count() const {
    auto stmt = impl_->storage.reader().prepare("SELECT COUNT(*) FROM accounts;");
    if (!stmt.step()) return 0;
    return static_cast<size_t>(stmt.getInt64(0));
}

}
}
