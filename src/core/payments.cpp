#include "core/payments.h"
#include "core/transfer.h"
#include "core/accounts.h"
#include "utils/utils.h"
#include "utils/logger.h"
#include <mutex>
#include <chrono>

namespace paycore {
namespace core {

static const char* INTENT_COLUMNS =
    "id, account_id, amount, currency, description, status, transaction_id, error_message, "
    "created_at, updated_at";

static PaymentIntent readIntent(const database::Statement& stmt) {
    PaymentIntent p;
    p.id = stmt.getString(0);
    p.accountId = stmt.getString(1);
    p.amount = stmt.getInt64(2);
    p.currency = stmt.getString(3);
    p.description = stmt.getString(4);
    fromString(stmt.getString(5), p.status);
    p.transactionId = stmt.getString(6);
    p.errorMessage = stmt.getString(7);
    p.createdAt = static_cast<uint64_t>(stmt.getInt64(8));
    p.updatedAt = static_cast<uint64_t>(stmt.getInt64(9));
    return p;
}

static PaymentEvent readEvent(const database::Statement& stmt) {
    PaymentEvent e;
    e.eventId = stmt.getString(0);
    e.intentId = stmt.getString(1);
    fromString(stmt.getString(2), e.type);
    fromString(stmt.getString(3), e.status);
    e.attempts = static_cast<int>(stmt.getInt64(4));
    e.outcome = errorCodeFromName(stmt.getString(5));
    e.errorMessage = stmt.getString(6);
    e.receivedAt = static_cast<uint64_t>(stmt.getInt64(7));
    e.processedAt = static_cast<uint64_t>(stmt.getInt64(8));
    return e;
}

static IntentStatus targetStatus(PaymentEventType type) {
    switch (type) {
        case PaymentEventType::SUCCEEDED: return IntentStatus::SUCCEEDED;
        case PaymentEventType::FAILED: return IntentStatus::FAILED;
        case PaymentEventType::EXPIRED: return IntentStatus::EXPIRED;
    }
    return IntentStatus::FAILED;
}

struct PaymentReconciler::Impl {
    database::Storage& storage;
    TransferEngine& engine;
    std::chrono::milliseconds lockTimeout;
    std::mutex mtx;

    Impl(database::Storage& s, TransferEngine& e)
        : storage(s), engine(e), lockTimeout(e.config().lockTimeoutMs) {}

    bool selectIntent(database::Database& db, const std::string& id, PaymentIntent& out) const {
        auto stmt = db.prepare(std::string("SELECT ") + INTENT_COLUMNS + " FROM payment_intents WHERE id = ?;");
        stmt.bind(1, id);
        if (!stmt.step()) return false;
        out = readIntent(stmt);
        return true;
    }

    bool selectEvent(database::Database& db, const std::string& eventId, PaymentEvent& out) const {
        auto stmt = db.prepare(
            "SELECT event_id, intent_id, type, status, attempts, outcome, error_message, received_at, processed_at "
            "FROM payment_events WHERE event_id = ?;");
        stmt.bind(1, eventId);
        if (!stmt.step()) return false;
        out = readEvent(stmt);
        return true;
    }

    void upsertEvent(database::UnitOfWork& uow, const PaymentEvent& ev) {
        auto stmt = uow.db().prepare(
            "INSERT INTO payment_events (event_id, intent_id, type, status, attempts, outcome, "
            "error_message, received_at, processed_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?) "
            "ON CONFLICT(event_id) DO UPDATE SET status = excluded.status, attempts = excluded.attempts, "
            "outcome = excluded.outcome, error_message = excluded.error_message, "
            "processed_at = excluded.processed_at;");
        stmt.bind(1, ev.eventId).bind(2, ev.intentId).bind(3, toString(ev.type))
            .bind(4, toString(ev.status)).bind(5, ev.attempts).bind(6, errorCodeName(ev.outcome))
            .bind(7, ev.errorMessage).bind(8, static_cast<int64_t>(ev.receivedAt))
            .bind(9, static_cast<int64_t>(ev.processedAt));
        stmt.execute();
    }

    void updateIntent(database::UnitOfWork& uow, const PaymentIntent& intent) {
        auto stmt = uow.db().prepare(
            "UPDATE payment_intents SET status = ?, transaction_id = ?, error_message = ?, updated_at = ? "
            "WHERE id = ?;");
        stmt.bind(1, toString(intent.status)).bind(2, intent.transactionId).bind(3, intent.errorMessage)
            .bind(4, static_cast<int64_t>(intent.updatedAt)).bind(5, intent.id);
        stmt.execute();
    }

    // Writes the event row, and the intent when given, in one unit of work.
    Result<void> persist(const PaymentEvent& ev, const PaymentIntent* intent) {
        database::UnitOfWork uow(storage);
        auto begun = uow.begin({}, lockTimeout);
        if (!begun.ok()) return begun;
        if (intent) updateIntent(uow, *intent);
        upsertEvent(uow, ev);
        return uow.commit();
    }

    Result<PaymentIntent> rejectEvent(PaymentEvent& ev, ErrorCode code, const std::string& message) {
        ev.status = EventStatus::FAILED;
        ev.outcome = code;
        ev.errorMessage = message;
        ev.processedAt = utils::nowMillis();
        auto saved = persist(ev, nullptr);
        if (!saved.ok()) return Result<PaymentIntent>(saved.error());
        LOG_WARN("payments", "Event " + ev.eventId + " for " + ev.intentId + " rejected: " + message);
        return Result<PaymentIntent>(makeError(code, message, ev.intentId));
    }

    Result<PaymentIntent> storageFailure(const database::DatabaseError& e, const std::string& context) {
        ErrorCode code = e.busy() ? ErrorCode::CONCURRENCY_CONFLICT : ErrorCode::DATABASE_ERROR;
        if (code == ErrorCode::DATABASE_ERROR) {
            ErrorHandler::instance().handle(makeError(code, e.what(), context));
            LOG_ERROR("payments", "Storage failure during " + context + ": " + e.what());
        }
        return Result<PaymentIntent>(makeError(code, e.what(), context));
    }
};

PaymentReconciler::PaymentReconciler(database::Storage& storage, TransferEngine& engine)
    : impl_(std::make_unique<Impl>(storage, engine)) {}

PaymentReconciler::~PaymentReconciler() = default;

Result<PaymentIntent> PaymentReconciler::createIntent(const std::string& accountId, const std::string& amount,
                                                      const std::string& description) {
    const auto& cfg = impl_->engine.config();
    PaymentIntent intent;
    if (!parseAmount(amount, cfg.minorDigits, intent.amount)) {
        return Result<PaymentIntent>(makeError(ErrorCode::INVALID_AMOUNT, "invalid intent amount", amount));
    }

    try {
        Account account;
        if (!impl_->engine.accounts().findById(accountId, account) || !account.active) {
            return Result<PaymentIntent>(makeError(ErrorCode::NOT_FOUND, "account not found", accountId));
        }

        intent.id = utils::generateId("pi_");
        intent.accountId = account.id;
        intent.currency = cfg.currency;
        intent.description = description;
        intent.status = IntentStatus::CREATED;
        intent.createdAt = utils::nowMillis();
        intent.updatedAt = intent.createdAt;

        database::UnitOfWork uow(impl_->storage);
        auto begun = uow.begin({}, impl_->lockTimeout);
        if (!begun.ok()) return Result<PaymentIntent>(begun.error());

        auto stmt = uow.db().prepare(
            "INSERT INTO payment_intents (id, account_id, amount, currency, description, status, "
            "created_at, updated_at) VALUES (?, ?, ?, ?, ?, 'CREATED', ?, ?);");
        stmt.bind(1, intent.id).bind(2, intent.accountId).bind(3, intent.amount)
            .bind(4, intent.currency).bind(5, intent.description)
            .bind(6, static_cast<int64_t>(intent.createdAt)).bind(7, static_cast<int64_t>(intent.updatedAt));
        stmt.execute();

        auto committed = uow.commit();
        if (!committed.ok()) return Result<PaymentIntent>(committed.error());
    } catch (const database::DatabaseError& e) {
        return impl_->storageFailure(e, "createIntent");
    }

    LOG_INFO("payments", "Created intent " + intent.id + " for " + intent.accountId + " (" +
             formatAmount(intent.amount, cfg.minorDigits) + " " + intent.currency + ")");
    return Result<PaymentIntent>(intent);
}

Result<PaymentIntent> PaymentReconciler::markPending(const std::string& intentId) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    try {
        PaymentIntent intent;
        if (!impl_->selectIntent(impl_->storage.reader(), intentId, intent)) {
            return Result<PaymentIntent>(makeError(ErrorCode::NOT_FOUND, "intent not found", intentId));
        }
        if (intent.status == IntentStatus::PENDING) return Result<PaymentIntent>(intent);
        if (intent.status != IntentStatus::CREATED) {
            return Result<PaymentIntent>(makeError(ErrorCode::INVALID_STATE,
                std::string("intent is ") + toString(intent.status), intentId));
        }

        database::UnitOfWork uow(impl_->storage);
        auto begun = uow.begin({}, impl_->lockTimeout);
        if (!begun.ok()) return Result<PaymentIntent>(begun.error());

        intent.status = IntentStatus::PENDING;
        intent.updatedAt = utils::nowMillis();
        impl_->updateIntent(uow, intent);

        auto committed = uow.commit();
        if (!committed.ok()) return Result<PaymentIntent>(committed.error());
        return Result<PaymentIntent>(intent);
    } catch (const database::DatabaseError& e) {
        return impl_->storageFailure(e, "markPending " + intentId);
    }
}

Result<PaymentIntent> PaymentReconciler::applyEvent(const std::string& eventId, const std::string& intentId,
                                                    PaymentEventType type, const std::string& errorMessage) {
    if (eventId.empty() || intentId.empty()) {
        return Result<PaymentIntent>(makeError(ErrorCode::INVALID_ARGUMENT, "event id and intent id are required"));
    }

    std::lock_guard<std::mutex> lock(impl_->mtx);
    try {
        database::Database& reader = impl_->storage.reader();
        uint64_t now = utils::nowMillis();

        PaymentEvent prior;
        bool seen = impl_->selectEvent(reader, eventId, prior);
        if (seen && prior.status == EventStatus::PROCESSED) {
            if (prior.intentId != intentId || prior.type != type) {
                LOG_WARN("payments", "Event " + eventId + " redelivered with different contents");
            }
            PaymentIntent intent;
            if (!impl_->selectIntent(reader, prior.intentId, intent)) {
                return Result<PaymentIntent>(makeError(ErrorCode::NOT_FOUND, "intent not found", prior.intentId));
            }
            LOG_DEBUG("payments", "Event " + eventId + " already processed");
            return Result<PaymentIntent>(intent);
        }

        PaymentEvent ev;
        ev.eventId = eventId;
        ev.intentId = intentId;
        ev.type = type;
        ev.attempts = seen ? prior.attempts + 1 : 1;
        ev.receivedAt = seen ? prior.receivedAt : now;

        PaymentIntent intent;
        if (!impl_->selectIntent(reader, intentId, intent)) {
            return impl_->rejectEvent(ev, ErrorCode::NOT_FOUND, "unknown payment intent");
        }

        IntentStatus target = targetStatus(type);
        if (isTerminal(intent.status) && intent.status != target) {
            return impl_->rejectEvent(ev, ErrorCode::INVALID_STATE,
                std::string("intent already ") + toString(intent.status));
        }

        if (type == PaymentEventType::SUCCEEDED) {
            CreditRequest credit;
            credit.accountId = intent.accountId;
            credit.amount = formatAmount(intent.amount, impl_->engine.config().minorDigits);
            credit.externalReference = intent.id;
            credit.description = intent.description.empty() ? "Top-up " + intent.id : intent.description;

            TransferOutcome outcome = impl_->engine.credit(credit);
            if (!outcome.ok()) {
                return impl_->rejectEvent(ev, outcome.code, "credit failed: " + outcome.message);
            }
            intent.transactionId = outcome.transaction.id;
            intent.errorMessage.clear();
        } else if (intent.status != target) {
            intent.errorMessage = errorMessage.empty() ? std::string("payment ") + toString(type) : errorMessage;
        }

        intent.status = target;
        intent.updatedAt = now;

        ev.status = EventStatus::PROCESSED;
        ev.outcome = ErrorCode::OK;
        ev.processedAt = now;

        auto saved = impl_->persist(ev, &intent);
        if (!saved.ok()) return Result<PaymentIntent>(saved.error());

        LOG_INFO("payments", "Intent " + intent.id + " -> " + toString(intent.status) + " via " + eventId);
        return Result<PaymentIntent>(intent);
    } catch (const database::DatabaseError& e) {
        return impl_->storageFailure(e, "applyEvent " + eventId);
    }
}

Result<size_t> PaymentReconciler::expireStale(uint64_t olderThanMs) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    try {
        uint64_t now = utils::nowMillis();
        int64_t cutoff = static_cast<int64_t>(now > olderThanMs ? now - olderThanMs : 0);

        database::UnitOfWork uow(impl_->storage);
        auto begun = uow.begin({}, impl_->lockTimeout);
        if (!begun.ok()) return Result<size_t>(begun.error());

        // An intent whose credit already committed is left for the next
        // SUCCEEDED delivery to settle.
        auto stmt = uow.db().prepare(
            "UPDATE payment_intents SET status = 'EXPIRED', error_message = 'expired before confirmation', "
            "updated_at = ? WHERE status IN ('CREATED', 'PENDING') AND created_at < ? "
            "AND NOT EXISTS (SELECT 1 FROM idempotency_records r "
            "WHERE r.idempotency_key = ? || payment_intents.id AND r.initiator_id = payment_intents.account_id);");
        stmt.bind(1, static_cast<int64_t>(now)).bind(2, cutoff).bind(3, TransferEngine::depositKey(""));
        stmt.execute();
        size_t expired = static_cast<size_t>(uow.db().changes());

        auto committed = uow.commit();
        if (!committed.ok()) return Result<size_t>(committed.error());

        if (expired > 0) {
            LOG_INFO("payments", "Expired " + std::to_string(expired) + " stale intent(s)");
        }
        return Result<size_t>(expired);
    } catch (const database::DatabaseError& e) {
        ErrorHandler::instance().handle(makeError(ErrorCode::DATABASE_ERROR, e.what(), "expireStale"));
        return Result<size_t>(makeError(ErrorCode::DATABASE_ERROR, e.what()));
    }
}

bool PaymentReconciler::getIntent(const std::string& intentId, PaymentIntent& out) const {
    return impl_->selectIntent(impl_->storage.reader(), intentId, out);
}

bool PaymentReconciler::getEvent(const std::string& eventId, PaymentEvent& out) const {
    return impl_->selectEvent(impl_->storage.reader(), eventId, out);
}

std::vector<PaymentIntent> PaymentReconciler::intentsFor(const std::string& accountId, size_t limit) const {
    std::vector<PaymentIntent> result;
    auto stmt = impl_->storage.reader().prepare(
        std::string("SELECT ") + INTENT_COLUMNS +
        " FROM payment_intents WHERE account_id = ? ORDER BY created_at DESC, id LIMIT ?;");
    stmt.bind(1, accountId).bind(2, static_cast<int64_t>(limit));
    while (stmt.step()) result.push_back(readIntent(stmt));
    return result;
}

}
}
