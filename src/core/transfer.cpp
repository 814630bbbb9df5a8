#include "core/transfer.h"
#include "core/accounts.h"
#include "core/wallet.h"
#include "core/ledger.h"
#include "core/transactions.h"
#include "core/idempotency.h"
#include "utils/utils.h"
#include "utils/logger.h"
#include <mutex>
#include <chrono>
#include <cctype>

namespace paycore {
namespace core {

static const size_t MAX_IDEMPOTENCY_KEY_LENGTH = 128;
static const std::string DEPOSIT_KEY_PREFIX = "deposit:";

static TransferOutcome rejected(ErrorCode code, const std::string& message) {
    TransferOutcome out;
    out.code = code;
    out.certainty = Certainty::NOT_APPLIED;
    out.message = message;
    return out;
}

static TransferOutcome fromError(const Error& error) {
    return rejected(error.code, error.message);
}

struct TransferEngine::Impl {
    database::Storage& storage;
    utils::EngineConfig config;
    std::chrono::milliseconds lockTimeout;

    WalletStore wallets;
    AccountDirectory accounts;
    Ledger ledger;
    TransactionStore txs;
    IdempotencyIndex idempotency;
    NotificationDispatcher notifier;

    mutable std::mutex lookupMtx;
    VerificationLookup verificationLookup;

    Impl(database::Storage& s, const utils::EngineConfig& cfg)
        : storage(s), config(cfg), lockTimeout(cfg.lockTimeoutMs),
          wallets(s), accounts(s, wallets, cfg.currency, cfg.lockTimeoutMs),
          ledger(s), txs(s), idempotency(s, cfg.idempotencyCacheSize) {}

    Verification verificationOf(const std::string& accountId) const {
        VerificationLookup lookup;
        {
            std::lock_guard<std::mutex> lock(lookupMtx);
            lookup = verificationLookup;
        }
        if (lookup) return lookup(accountId);
        Account account;
        if (!accounts.findById(accountId, account)) return Verification::REJECTED;
        return account.verification;
    }

    std::string fmt(Amount amount) const {
        return formatAmount(amount, config.minorDigits);
    }

    TransferOutcome replay(const IdempotencyRecord& record, const std::string& fingerprint,
                           TxKind kind, database::UnitOfWork* uow) {
        if (record.fingerprint != fingerprint) {
            LOG_WARN("idempotency", "Key reused with different parameters by " + record.initiatorId +
                     "; returning original result of " + record.transactionId);
        }

        TransferOutcome out;
        bool found = uow ? txs.find(*uow, record.transactionId, out.transaction)
                         : txs.find(record.transactionId, out.transaction);
        if (!found) {
            ErrorHandler::instance().handle(makeError(ErrorCode::INTERNAL_ERROR,
                "idempotency record points at a missing transaction", record.transactionId));
            out.code = ErrorCode::INTERNAL_ERROR;
            out.certainty = Certainty::UNKNOWN;
            out.message = "recorded transaction missing";
            return out;
        }

        if (out.transaction.kind != kind) {
            LOG_ERROR("idempotency", "Key " + record.key + " of " + record.initiatorId + " belongs to " +
                      toString(out.transaction.kind) + " " + record.transactionId);
            TransferOutcome clash = rejected(ErrorCode::ALREADY_EXISTS,
                std::string("idempotency key already used by a ") + toString(out.transaction.kind));
            clash.transaction = out.transaction;
            return clash;
        }

        out.code = record.outcome;
        out.alreadyProcessed = true;
        out.certainty = record.outcome == ErrorCode::OK ? Certainty::APPLIED : Certainty::NOT_APPLIED;
        out.message = "already processed";
        LOG_INFO("engine", "Replay of " + record.transactionId + " (" + errorCodeName(record.outcome) + ")");
        return out;
    }

    // Fingerprint of a request that has not been validated yet.
    std::string requestFingerprint(const std::string& recipient, Amount amount) const {
        Account resolved;
        return IdempotencyIndex::fingerprint(accounts.resolve(recipient, resolved) ? resolved.id : recipient, amount);
    }

    TransferOutcome storageFailure(const database::DatabaseError& e, const std::string& context) {
        if (e.busy()) {
            LOG_WARN("engine", "Conflict during " + context + ": " + e.what());
            return rejected(ErrorCode::CONCURRENCY_CONFLICT, "database busy, retry");
        }
        ErrorHandler::instance().handle(makeError(ErrorCode::DATABASE_ERROR, e.what(), context));
        LOG_ERROR("engine", "Storage failure during " + context + ": " + e.what());
        return rejected(ErrorCode::DATABASE_ERROR, "storage failure");
    }

    TransferOutcome commitFailure(const Error& error, const Transaction& tx) {
        ErrorHandler::instance().handle(error);
        TransferOutcome out;
        out.code = ErrorCode::DATABASE_ERROR;
        out.certainty = Certainty::UNKNOWN;
        out.transaction = tx;
        out.message = "commit failed; retry with the same idempotency key";
        return out;
    }

    void afterCommit(const IdempotencyRecord& record, NotificationType type, const Transaction& tx) {
        idempotency.remember(record);
        notifier.publish(notifier.create(type, tx));
    }
};

TransferEngine::TransferEngine(database::Storage& storage, const utils::EngineConfig& config)
    : impl_(std::make_unique<Impl>(storage, config)) {
    impl_->notifier.start();
}

TransferEngine::~TransferEngine() {
    impl_->notifier.stop();
}

bool TransferEngine::isValidIdempotencyKey(const std::string& key) {
    if (key.empty() || key.size() > MAX_IDEMPOTENCY_KEY_LENGTH) return false;
    bool visible = false;
    for (unsigned char c : key) {
        if (!std::isprint(c)) return false;
        if (c != ' ') visible = true;
    }
    return visible;
}

std::string TransferEngine::depositKey(const std::string& externalReference) {
    return DEPOSIT_KEY_PREFIX + externalReference;
}

bool TransferEngine::isReservedKey(const std::string& key) {
    return key.compare(0, DEPOSIT_KEY_PREFIX.size(), DEPOSIT_KEY_PREFIX) == 0;
}

TransferOutcome TransferEngine::transfer(const TransferRequest& request) {
    auto& d = *impl_;

    if (!isValidIdempotencyKey(request.idempotencyKey)) {
        return rejected(ErrorCode::MISSING_IDEMPOTENCY_KEY, "idempotency key must be 1-128 printable characters");
    }
    if (isReservedKey(request.idempotencyKey)) {
        return rejected(ErrorCode::MISSING_IDEMPOTENCY_KEY, "idempotency key prefix " + DEPOSIT_KEY_PREFIX + " is reserved");
    }

    Amount amount = 0;
    if (!parseAmount(request.amount, d.config.minorDigits, amount)) {
        return rejected(ErrorCode::INVALID_AMOUNT, "amount must be a positive decimal with at most " +
                        std::to_string(d.config.minorDigits) + " fractional digits");
    }

    try {
        IdempotencyRecord existing;
        if (d.idempotency.lookup(request.idempotencyKey, request.initiatorId, existing)) {
            return d.replay(existing, d.requestFingerprint(request.recipient, amount), TxKind::TRANSFER, nullptr);
        }

        Account recipient;
        if (!d.accounts.resolve(request.recipient, recipient) || !recipient.active) {
            return rejected(ErrorCode::RECIPIENT_NOT_FOUND, "recipient not found");
        }
        if (recipient.id == request.initiatorId) {
            return rejected(ErrorCode::SELF_TRANSFER_NOT_ALLOWED, "cannot transfer to yourself");
        }
        Wallet toWallet;
        if (!d.wallets.findByAccount(recipient.id, toWallet) || toWallet.closed) {
            return rejected(ErrorCode::RECIPIENT_NOT_FOUND, "recipient has no open wallet");
        }

        Account initiator;
        Wallet fromWallet;
        if (!d.accounts.findById(request.initiatorId, initiator) || !initiator.active ||
            !d.wallets.findByAccount(initiator.id, fromWallet) || fromWallet.closed) {
            return rejected(ErrorCode::VERIFICATION_REQUIRED, "sender has no open wallet");
        }
        if (d.config.requireVerification && d.verificationOf(initiator.id) != Verification::APPROVED) {
            return rejected(ErrorCode::VERIFICATION_REQUIRED, "sender is not verified");
        }
        if (d.config.verifyRecipient && d.verificationOf(recipient.id) != Verification::APPROVED) {
            return rejected(ErrorCode::VERIFICATION_REQUIRED, "recipient is not verified");
        }

        std::string fingerprint = IdempotencyIndex::fingerprint(recipient.id, amount);

        database::UnitOfWork uow(d.storage);
        auto begun = uow.begin({fromWallet.id, toWallet.id}, d.lockTimeout);
        if (!begun.ok()) {
            LOG_WARN("engine", "Lock timeout for " + fromWallet.id + " -> " + toWallet.id);
            return fromError(begun.error());
        }

        if (d.idempotency.lookup(uow, request.idempotencyKey, initiator.id, existing)) {
            TransferOutcome out = d.replay(existing, fingerprint, TxKind::TRANSFER, &uow);
            uow.rollback();
            return out;
        }

        Wallet from = d.wallets.getForUpdate(uow, fromWallet.id);
        Wallet to = d.wallets.getForUpdate(uow, toWallet.id);
        if (from.closed) {
            return rejected(ErrorCode::VERIFICATION_REQUIRED, "sender wallet closed");
        }
        if (to.closed) {
            return rejected(ErrorCode::RECIPIENT_NOT_FOUND, "recipient wallet closed");
        }

        Transaction tx;
        tx.id = utils::generateId("txn_");
        tx.idempotencyKey = request.idempotencyKey;
        tx.initiatorId = initiator.id;
        tx.kind = TxKind::TRANSFER;
        tx.sourceAccountId = initiator.id;
        tx.destinationAccountId = recipient.id;
        tx.amount = amount;
        tx.currency = d.config.currency;
        tx.description = request.description;
        tx.sourceBalanceBefore = from.balance;
        tx.sourceBalanceAfter = from.balance;
        tx.destinationBalanceBefore = to.balance;
        tx.destinationBalanceAfter = to.balance;
        d.txs.insert(uow, tx);

        IdempotencyRecord record;
        record.key = request.idempotencyKey;
        record.initiatorId = initiator.id;
        record.transactionId = tx.id;
        record.fingerprint = fingerprint;
        record.firstSeenAt = tx.createdAt;

        if (from.balance < amount) {
            std::string reason = "insufficient funds: available " + d.fmt(from.balance) +
                                 ", required " + d.fmt(amount);
            auto failed = d.txs.markFailed(uow, tx, ErrorCode::INSUFFICIENT_FUNDS, reason);
            if (!failed.ok()) return fromError(failed.error());

            record.outcome = ErrorCode::INSUFFICIENT_FUNDS;
            d.idempotency.insert(uow, record);

            auto committed = uow.commit();
            if (!committed.ok()) return d.commitFailure(committed.error(), tx);

            LOG_INFO("engine", "Transfer " + tx.id + " failed: insufficient funds in " + from.id);
            d.afterCommit(record, NotificationType::TRANSFER_FAILED, tx);

            TransferOutcome out;
            out.code = ErrorCode::INSUFFICIENT_FUNDS;
            out.certainty = Certainty::NOT_APPLIED;
            out.transaction = tx;
            out.message = reason;
            return out;
        }

        if (!safeSub(from.balance, amount, from.balance) ||
            !safeAdd(to.balance, amount, to.balance)) {
            uow.rollback();
            return rejected(ErrorCode::INVALID_AMOUNT, "recipient balance would exceed the maximum");
        }

        auto saved = d.wallets.save(uow, from);
        if (saved.ok()) saved = d.wallets.save(uow, to);
        if (!saved.ok()) {
            uow.rollback();
            return fromError(saved.error());
        }

        auto posted = d.ledger.record(uow, tx.id, {
            LedgerLeg{from.id, from.accountId, EntryLeg::DEBIT, amount, from.balance},
            LedgerLeg{to.id, to.accountId, EntryLeg::CREDIT, amount, to.balance}
        });
        if (!posted.ok()) {
            uow.rollback();
            ErrorHandler::instance().handle(posted.error());
            return fromError(posted.error());
        }

        tx.sourceBalanceAfter = from.balance;
        tx.destinationBalanceAfter = to.balance;
        auto completed = d.txs.markCompleted(uow, tx);
        if (!completed.ok()) {
            uow.rollback();
            return fromError(completed.error());
        }

        record.outcome = ErrorCode::OK;
        d.idempotency.insert(uow, record);

        auto committed = uow.commit();
        if (!committed.ok()) return d.commitFailure(committed.error(), tx);

        LOG_INFO("engine", "Transfer completed: " + tx.id + " | " + tx.sourceAccountId + " -> " +
                 tx.destinationAccountId + " | " + d.fmt(amount) + " " + tx.currency);
        d.afterCommit(record, NotificationType::TRANSFER_COMPLETED, tx);

        TransferOutcome out;
        out.code = ErrorCode::OK;
        out.certainty = Certainty::APPLIED;
        out.transaction = tx;
        out.message = "completed";
        return out;
    } catch (const database::DatabaseError& e) {
        return d.storageFailure(e, "transfer " + request.idempotencyKey);
    }
}

TransferOutcome TransferEngine::credit(const CreditRequest& request) {
    auto& d = *impl_;

    if (!isValidIdempotencyKey(request.externalReference)) {
        return rejected(ErrorCode::MISSING_IDEMPOTENCY_KEY, "external reference must be 1-128 printable characters");
    }

    Amount amount = 0;
    if (!parseAmount(request.amount, d.config.minorDigits, amount)) {
        return rejected(ErrorCode::INVALID_AMOUNT, "amount must be a positive decimal with at most " +
                        std::to_string(d.config.minorDigits) + " fractional digits");
    }

    const std::string key = depositKey(request.externalReference);
    const std::string fingerprint = IdempotencyIndex::fingerprint(request.accountId, amount);
    try {
        IdempotencyRecord existing;
        if (d.idempotency.lookup(key, request.accountId, existing)) {
            return d.replay(existing, fingerprint, TxKind::DEPOSIT, nullptr);
        }

        Account account;
        Wallet wallet;
        if (!d.accounts.findById(request.accountId, account) || !account.active ||
            !d.wallets.findByAccount(account.id, wallet) || wallet.closed) {
            return rejected(ErrorCode::RECIPIENT_NOT_FOUND, "account has no open wallet");
        }

        database::UnitOfWork uow(d.storage);
        auto begun = uow.begin({wallet.id}, d.lockTimeout);
        if (!begun.ok()) {
            LOG_WARN("engine", "Lock timeout crediting " + wallet.id);
            return fromError(begun.error());
        }

        if (d.idempotency.lookup(uow, key, account.id, existing)) {
            TransferOutcome out = d.replay(existing, fingerprint, TxKind::DEPOSIT, &uow);
            uow.rollback();
            return out;
        }

        Wallet target = d.wallets.getForUpdate(uow, wallet.id);
        if (target.closed) {
            return rejected(ErrorCode::RECIPIENT_NOT_FOUND, "wallet closed");
        }

        Transaction tx;
        tx.id = utils::generateId("txn_");
        tx.idempotencyKey = key;
        tx.initiatorId = account.id;
        tx.kind = TxKind::DEPOSIT;
        tx.destinationAccountId = account.id;
        tx.externalReference = request.externalReference;
        tx.amount = amount;
        tx.currency = d.config.currency;
        tx.description = request.description;
        tx.destinationBalanceBefore = target.balance;
        tx.destinationBalanceAfter = target.balance;

        if (!safeAdd(target.balance, amount, target.balance)) {
            return rejected(ErrorCode::INVALID_AMOUNT, "balance would exceed the maximum");
        }

        d.txs.insert(uow, tx);

        auto saved = d.wallets.save(uow, target);
        if (!saved.ok()) {
            uow.rollback();
            return fromError(saved.error());
        }

        auto posted = d.ledger.record(uow, tx.id, {
            LedgerLeg{"", "", EntryLeg::DEBIT, amount, 0},
            LedgerLeg{target.id, account.id, EntryLeg::CREDIT, amount, target.balance}
        });
        if (!posted.ok()) {
            uow.rollback();
            ErrorHandler::instance().handle(posted.error());
            return fromError(posted.error());
        }

        tx.destinationBalanceAfter = target.balance;
        auto completed = d.txs.markCompleted(uow, tx);
        if (!completed.ok()) {
            uow.rollback();
            return fromError(completed.error());
        }

        IdempotencyRecord record;
        record.key = key;
        record.initiatorId = account.id;
        record.transactionId = tx.id;
        record.outcome = ErrorCode::OK;
        record.fingerprint = fingerprint;
        record.firstSeenAt = tx.createdAt;
        d.idempotency.insert(uow, record);

        auto committed = uow.commit();
        if (!committed.ok()) return d.commitFailure(committed.error(), tx);

        LOG_INFO("engine", "Deposit completed: " + tx.id + " | " + account.id + " | " +
                 d.fmt(amount) + " " + tx.currency);
        d.afterCommit(record, NotificationType::DEPOSIT_COMPLETED, tx);

        TransferOutcome out;
        out.code = ErrorCode::OK;
        out.certainty = Certainty::APPLIED;
        out.transaction = tx;
        out.message = "completed";
        return out;
    } catch (const database::DatabaseError& e) {
        return d.storageFailure(e, "credit " + request.externalReference);
    }
}

Result<Amount> TransferEngine::getBalance(const std::string& accountId) const {
    try {
        Wallet wallet;
        if (!impl_->wallets.findByAccount(accountId, wallet)) {
            return Result<Amount>(makeError(ErrorCode::NOT_FOUND, "no wallet for account", accountId));
        }
        return Result<Amount>(wallet.balance);
    } catch (const database::DatabaseError& e) {
        ErrorHandler::instance().handle(makeError(ErrorCode::DATABASE_ERROR, e.what(), "getBalance"));
        return Result<Amount>(makeError(ErrorCode::DATABASE_ERROR, e.what()));
    }
}

Result<HistoryPage> TransferEngine::getHistory(const std::string& accountId, const std::string& cursor,
                                               size_t limit) const {
    if (limit == 0) {
        return Result<HistoryPage>(makeError(ErrorCode::INVALID_ARGUMENT, "page size must be positive"));
    }
    if (limit > impl_->config.maxHistoryPage) limit = impl_->config.maxHistoryPage;

    try {
        Account account;
        if (!impl_->accounts.findById(accountId, account)) {
            return Result<HistoryPage>(makeError(ErrorCode::NOT_FOUND, "account not found", accountId));
        }
        return impl_->txs.history(accountId, cursor, limit);
    } catch (const database::DatabaseError& e) {
        ErrorHandler::instance().handle(makeError(ErrorCode::DATABASE_ERROR, e.what(), "getHistory"));
        return Result<HistoryPage>(makeError(ErrorCode::DATABASE_ERROR, e.what()));
    }
}

Result<Transaction> TransferEngine::getTransaction(const std::string& transactionId) const {
    try {
        Transaction tx;
        if (!impl_->txs.find(transactionId, tx)) {
            return Result<Transaction>(makeError(ErrorCode::NOT_FOUND, "transaction not found", transactionId));
        }
        return Result<Transaction>(tx);
    } catch (const database::DatabaseError& e) {
        ErrorHandler::instance().handle(makeError(ErrorCode::DATABASE_ERROR, e.what(), "getTransaction"));
        return Result<Transaction>(makeError(ErrorCode::DATABASE_ERROR, e.what()));
    }
}

std::vector<LedgerEntry> TransferEngine::getLedgerEntries(const std::string& transactionId) const {
    return impl_->ledger.entriesFor(transactionId);
}

std::string TransferEngine::onCommitted(NotificationHandler handler) {
    return impl_->notifier.subscribe(std::move(handler));
}

void TransferEngine::setVerificationLookup(VerificationLookup lookup) {
    std::lock_guard<std::mutex> lock(impl_->lookupMtx);
    impl_->verificationLookup = std::move(lookup);
}

AccountDirectory& TransferEngine::accounts() { return impl_->accounts; }
WalletStore& TransferEngine::wallets() { return impl_->wallets; }
Ledger& TransferEngine::ledger() { return impl_->ledger; }
TransactionStore& TransferEngine::transactions() { return impl_->txs; }
IdempotencyIndex& TransferEngine::idempotency() { return impl_->idempotency; }
NotificationDispatcher& TransferEngine::notifications() { return impl_->notifier; }
const utils::EngineConfig& TransferEngine::config() const { return impl_->config; }

}
}
