#include "database/database.h"
#include "utils/logger.h"
#include <filesystem>

namespace paycore {
namespace database {

static const char* SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS meta (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS accounts (
    id TEXT PRIMARY KEY,
    identifier TEXT NOT NULL UNIQUE COLLATE NOCASE,
    verification TEXT NOT NULL DEFAULT 'PENDING'
        CHECK (verification IN ('PENDING', 'APPROVED', 'REJECTED')),
    active INTEGER NOT NULL DEFAULT 1,
    created_at INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS wallets (
    id TEXT PRIMARY KEY,
    account_id TEXT NOT NULL UNIQUE REFERENCES accounts(id),
    balance INTEGER NOT NULL DEFAULT 0 CHECK (balance >= 0),
    currency TEXT NOT NULL,
    version INTEGER NOT NULL DEFAULT 0,
    closed INTEGER NOT NULL DEFAULT 0,
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS transactions (
    seq INTEGER PRIMARY KEY AUTOINCREMENT,
    id TEXT NOT NULL UNIQUE,
    idempotency_key TEXT NOT NULL,
    initiator_id TEXT NOT NULL,
    kind TEXT NOT NULL CHECK (kind IN ('TRANSFER', 'DEPOSIT')),
    source_account_id TEXT NOT NULL DEFAULT '',
    destination_account_id TEXT NOT NULL,
    external_reference TEXT NOT NULL DEFAULT '',
    amount INTEGER NOT NULL CHECK (amount > 0),
    currency TEXT NOT NULL,
    description TEXT NOT NULL DEFAULT '',
    status TEXT NOT NULL CHECK (status IN ('PENDING', 'COMPLETED', 'FAILED')),
    failure_code TEXT NOT NULL DEFAULT '',
    failure_reason TEXT NOT NULL DEFAULT '',
    source_balance_before INTEGER NOT NULL DEFAULT 0,
    source_balance_after INTEGER NOT NULL DEFAULT 0,
    destination_balance_before INTEGER NOT NULL DEFAULT 0,
    destination_balance_after INTEGER NOT NULL DEFAULT 0,
    created_at INTEGER NOT NULL,
    completed_at INTEGER NOT NULL DEFAULT 0,
    UNIQUE (initiator_id, idempotency_key)
);

CREATE INDEX IF NOT EXISTS idx_transactions_source ON transactions(source_account_id, seq);
CREATE INDEX IF NOT EXISTS idx_transactions_destination ON transactions(destination_account_id, seq);

CREATE TRIGGER IF NOT EXISTS transactions_terminal_immutable
BEFORE UPDATE ON transactions WHEN OLD.status <> 'PENDING'
BEGIN
    SELECT RAISE(ABORT, 'terminal transactions are immutable');
END;

CREATE TABLE IF NOT EXISTS ledger_entries (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    transaction_id TEXT NOT NULL REFERENCES transactions(id),
    wallet_id TEXT NOT NULL DEFAULT '',
    account_id TEXT NOT NULL DEFAULT '',
    leg TEXT NOT NULL CHECK (leg IN ('DEBIT', 'CREDIT')),
    amount INTEGER NOT NULL CHECK (amount > 0),
    balance_after INTEGER NOT NULL,
    created_at INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_ledger_transaction ON ledger_entries(transaction_id);
CREATE INDEX IF NOT EXISTS idx_ledger_account ON ledger_entries(account_id, id);

CREATE TRIGGER IF NOT EXISTS ledger_entries_no_update
BEFORE UPDATE ON ledger_entries
BEGIN
    SELECT RAISE(ABORT, 'ledger entries are append-only');
END;

CREATE TRIGGER IF NOT EXISTS ledger_entries_no_delete
BEFORE DELETE ON ledger_entries
BEGIN
    SELECT RAISE(ABORT, 'ledger entries are append-only');
END;

CREATE TABLE IF NOT EXISTS idempotency_records (
    idempotency_key TEXT NOT NULL,
    initiator_id TEXT NOT NULL,
    transaction_id TEXT NOT NULL,
    outcome TEXT NOT NULL,
    fingerprint TEXT NOT NULL,
    first_seen_at INTEGER NOT NULL,
    PRIMARY KEY (idempotency_key, initiator_id)
);

CREATE TRIGGER IF NOT EXISTS idempotency_records_no_update
BEFORE UPDATE ON idempotency_records
BEGIN
    SELECT RAISE(ABORT, 'idempotency records are immutable');
END;

CREATE TABLE IF NOT EXISTS payment_intents (
    id TEXT PRIMARY KEY,
    account_id TEXT NOT NULL REFERENCES accounts(id),
    amount INTEGER NOT NULL CHECK (amount > 0),
    currency TEXT NOT NULL,
    description TEXT NOT NULL DEFAULT '',
    status TEXT NOT NULL
        CHECK (status IN ('CREATED', 'PENDING', 'SUCCEEDED', 'FAILED', 'EXPIRED')),
    transaction_id TEXT NOT NULL DEFAULT '',
    error_message TEXT NOT NULL DEFAULT '',
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_payment_intents_status ON payment_intents(status, created_at);

CREATE TABLE IF NOT EXISTS payment_events (
    event_id TEXT PRIMARY KEY,
    intent_id TEXT NOT NULL,
    type TEXT NOT NULL CHECK (type IN ('SUCCEEDED', 'FAILED', 'EXPIRED')),
    status TEXT NOT NULL CHECK (status IN ('PROCESSED', 'FAILED')),
    attempts INTEGER NOT NULL DEFAULT 1,
    outcome TEXT NOT NULL DEFAULT 'OK',
    error_message TEXT NOT NULL DEFAULT '',
    received_at INTEGER NOT NULL,
    processed_at INTEGER NOT NULL DEFAULT 0
);
)SQL";

bool RowLockTable::acquire(const std::vector<std::string>& sortedIds,
                           std::chrono::steady_clock::time_point deadline) {
    std::vector<std::timed_mutex*> taken;
    taken.reserve(sortedIds.size());
    for (const auto& id : sortedIds) {
        std::timed_mutex& m = lockFor(id);
        if (!m.try_lock_until(deadline)) {
            for (auto it = taken.rbegin(); it != taken.rend(); ++it) (*it)->unlock();
            return false;
        }
        taken.push_back(&m);
    }
    return true;
}

void RowLockTable::release(const std::vector<std::string>& ids) {
    for (auto it = ids.rbegin(); it != ids.rend(); ++it) {
        lockFor(*it).unlock();
    }
}

size_t RowLockTable::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return locks_.size();
}

std::timed_mutex& RowLockTable::lockFor(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto& slot = locks_[id];
    if (!slot) slot = std::make_unique<std::timed_mutex>();
    return *slot;
}

struct Storage::Impl {
    Database writer;
    Database reader;
    RowLockTable rowLocks;
    std::timed_mutex writerMutex;
    std::string path;
    std::string lastError;
    bool open = false;
};

Storage::Storage() : impl_(std::make_unique<Impl>()) {}

Storage::~Storage() { close(); }

bool Storage::open(const std::string& path, uint32_t busyTimeoutMs) {
    if (impl_->open) return false;

    std::filesystem::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    if (!impl_->writer.open(path, busyTimeoutMs)) {
        impl_->lastError = impl_->writer.lastError();
        LOG_ERROR("storage", "Failed to open " + path + ": " + impl_->lastError);
        return false;
    }

    try {
        impl_->writer.exec("PRAGMA journal_mode=WAL;");
        impl_->writer.exec("PRAGMA synchronous=FULL;");
        impl_->writer.exec("PRAGMA foreign_keys=ON;");

        impl_->writer.exec("BEGIN IMMEDIATE;");
        try {
            impl_->writer.exec(SCHEMA_SQL);
            auto stmt = impl_->writer.prepare(
                "INSERT OR IGNORE INTO meta (key, value) VALUES ('schema_version', ?);");
            stmt.bind(1, std::to_string(SCHEMA_VERSION));
            stmt.execute();
        } catch (const DatabaseError&) {
            impl_->writer.exec("ROLLBACK;");
            throw;
        }
        impl_->writer.exec("COMMIT;");
    } catch (const DatabaseError& e) {
        impl_->lastError = e.what();
        LOG_ERROR("storage", "Schema setup failed: " + impl_->lastError);
        impl_->writer.close();
        return false;
    }

    if (!impl_->reader.open(path, busyTimeoutMs)) {
        impl_->lastError = impl_->reader.lastError();
        LOG_ERROR("storage", "Failed to open read connection: " + impl_->lastError);
        impl_->writer.close();
        return false;
    }

    try {
        impl_->reader.exec("PRAGMA query_only=ON;");
    } catch (const DatabaseError& e) {
        impl_->lastError = e.what();
        impl_->reader.close();
        impl_->writer.close();
        return false;
    }

    impl_->path = path;
    impl_->open = true;

    int version = schemaVersion();
    if (version != SCHEMA_VERSION) {
        impl_->lastError = "unsupported schema version " + std::to_string(version);
        LOG_ERROR("storage", impl_->lastError);
        close();
        return false;
    }

    LOG_DEBUG("storage", "Opened ledger database " + path);
    return true;
}

void Storage::close() {
    impl_->reader.close();
    impl_->writer.close();
    impl_->open = false;
}

bool Storage::isOpen() const {
    return impl_->open;
}

Database& Storage::writer() { return impl_->writer; }
Database& Storage::reader() { return impl_->reader; }
RowLockTable& Storage::rowLocks() { return impl_->rowLocks; }
std::timed_mutex& Storage::writerMutex() { return impl_->writerMutex; }

int Storage::schemaVersion() {
    try {
        auto stmt = impl_->reader.prepare("SELECT value FROM meta WHERE key = 'schema_version';");
        if (!stmt.step()) return 0;
        return std::stoi(stmt.getString(0));
    } catch (const DatabaseError& e) {
        impl_->lastError = e.what();
        return 0;
    } catch (const std::invalid_argument&) {
        return 0;
    } catch (const std::out_of_range&) {
        return 0;
    }
}

std::string Storage::getPath() const {
    return impl_->path;
}

std::string Storage::lastError() const {
    return impl_->lastError;
}

}
}
