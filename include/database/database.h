#pragma once

#include "infrastructure/error_handling.h"

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <map>
#include <chrono>
#include <stdexcept>
#include <cstdint>

struct sqlite3;
struct sqlite3_stmt;

namespace paycore {
namespace database {

// Raised by Database and Statement when SQLite reports a failure.
class DatabaseError : public std::runtime_error {
public:
    DatabaseError(int code, const std::string& message);

    int code() const { return code_; }
    bool busy() const;
    bool constraint() const;

private:
    int code_;
};

class Statement;

// One SQLite connection. Statements hold the connection mutex while they live,
// so a connection may be shared between threads.
class Database {
public:
    Database();
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    bool open(const std::string& path, uint32_t busyTimeoutMs);
    void close();
    bool isOpen() const;

    void exec(const std::string& sql);
    Statement prepare(const std::string& sql);

    int changes() const;
    int64_t lastInsertRowId() const;
    std::string lastError() const;
    std::string getPath() const;

    bool backup(const std::string& destPath);

private:
    friend class Statement;
    friend class ReadTransaction;
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

class Statement {
public:
    Statement(Database& db, const std::string& sql);
    ~Statement();

    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&&) = delete;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    // Parameters are 1-based, columns 0-based.
    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, const char* value);
    Statement& bind(int index, int64_t value);
    Statement& bind(int index, int value);
    Statement& bindNull(int index);

    // true while a row is available, false once done.
    bool step();
    void execute();
    void reset();

    int64_t getInt64(int column) const;
    std::string getString(int column) const;
    bool isNull(int column) const;

private:
    Database* db_;
    sqlite3_stmt* stmt_;
    std::unique_lock<std::recursive_mutex> lock_;
};

// Pins a connection and keeps one read snapshot across several statements.
class ReadTransaction {
public:
    explicit ReadTransaction(Database& db);
    ~ReadTransaction();

    ReadTransaction(const ReadTransaction&) = delete;
    ReadTransaction& operator=(const ReadTransaction&) = delete;

private:
    Database& db_;
    std::unique_lock<std::recursive_mutex> lock_;
};

// In-process row locks keyed by wallet id. Callers acquire in ascending id
// order; acquire() either takes every lock or none of them.
class RowLockTable {
public:
    bool acquire(const std::vector<std::string>& sortedIds,
                 std::chrono::steady_clock::time_point deadline);
    void release(const std::vector<std::string>& ids);
    size_t size() const;

private:
    std::timed_mutex& lockFor(const std::string& id);

    mutable std::mutex mtx_;
    std::map<std::string, std::unique_ptr<std::timed_mutex>> locks_;
};

// The ledger database: a writer connection used only inside a UnitOfWork, a
// reader connection that observes committed state, the row lock table and
// the writer mutex that serialises write transactions in this process.
class Storage {
public:
    static constexpr int SCHEMA_VERSION = 1;

    Storage();
    ~Storage();

    Storage(const Storage&) = delete;
    Storage& operator=(const Storage&) = delete;

    bool open(const std::string& path, uint32_t busyTimeoutMs = 5000);
    void close();
    bool isOpen() const;

    Database& writer();
    Database& reader();
    RowLockTable& rowLocks();
    std::timed_mutex& writerMutex();

    int schemaVersion();
    std::string getPath() const;
    std::string lastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Scoped write transaction. begin() takes the row locks of the given wallets
// in ascending order, then the writer, then BEGIN IMMEDIATE. Destruction
// without commit() rolls back. Locks are released on commit or rollback.
class UnitOfWork {
public:
    explicit UnitOfWork(Storage& storage);
    ~UnitOfWork();

    UnitOfWork(const UnitOfWork&) = delete;
    UnitOfWork& operator=(const UnitOfWork&) = delete;

    Result<void> begin(std::vector<std::string> walletIds, std::chrono::milliseconds timeout);
    Result<void> commit();
    void rollback();

    bool isActive() const { return active_; }
    bool isCommitted() const { return committed_; }
    bool holdsLock(const std::string& walletId) const;
    const std::vector<std::string>& lockedWallets() const { return locked_; }

    // Writer connection; throws std::logic_error outside an active unit.
    Database& db();

private:
    void releaseAll();

    Storage& storage_;
    std::vector<std::string> locked_;
    bool writerHeld_ = false;
    bool active_ = false;
    bool committed_ = false;
};

}
}
