#include "database/database.h"
#include "utils/logger.h"
#include <sqlite3.h>
#include <utility>

namespace paycore {
namespace database {

DatabaseError::DatabaseError(int code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

bool DatabaseError::busy() const {
    int primary = code_ & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

bool DatabaseError::constraint() const {
    return (code_ & 0xff) == SQLITE_CONSTRAINT;
}

struct Database::Impl {
    sqlite3* db = nullptr;
    std::string path;
    mutable std::recursive_mutex mtx;
    bool isOpen = false;
    std::string openError;

    [[noreturn]] void fail(const std::string& what) const {
        int code = db ? sqlite3_extended_errcode(db) : SQLITE_MISUSE;
        std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : "database not open");
        throw DatabaseError(code, msg);
    }
};

Database::Database() : impl_(std::make_unique<Impl>()) {}

Database::~Database() { close(); }

bool Database::open(const std::string& path, uint32_t busyTimeoutMs) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    if (impl_->isOpen) return false;

    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(path.c_str(), &impl_->db, flags, nullptr);
    if (rc != SQLITE_OK) {
        impl_->openError = impl_->db ? sqlite3_errmsg(impl_->db) : sqlite3_errstr(rc);
        sqlite3_close(impl_->db);
        impl_->db = nullptr;
        return false;
    }

    sqlite3_extended_result_codes(impl_->db, 1);
    sqlite3_busy_timeout(impl_->db, static_cast<int>(busyTimeoutMs));

    impl_->path = path;
    impl_->isOpen = true;
    return true;
}

void Database::close() {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    if (impl_->db) {
        sqlite3_close_v2(impl_->db);
        impl_->db = nullptr;
    }
    impl_->isOpen = false;
}

bool Database::isOpen() const {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    return impl_->isOpen;
}

void Database::exec(const std::string& sql) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    if (!impl_->db) impl_->fail("exec");

    char* errMsg = nullptr;
    int rc = sqlite3_exec(impl_->db, sql.c_str(), nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        std::string msg = errMsg ? errMsg : sqlite3_errstr(rc);
        sqlite3_free(errMsg);
        throw DatabaseError(sqlite3_extended_errcode(impl_->db), "exec: " + msg);
    }
}

Statement Database::prepare(const std::string& sql) {
    return Statement(*this, sql);
}

int Database::changes() const {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    return impl_->db ? sqlite3_changes(impl_->db) : 0;
}

int64_t Database::lastInsertRowId() const {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    return impl_->db ? sqlite3_last_insert_rowid(impl_->db) : 0;
}

std::string Database::lastError() const {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    if (!impl_->db) return impl_->openError;
    return sqlite3_errmsg(impl_->db);
}

std::string Database::getPath() const {
    return impl_->path;
}

bool Database::backup(const std::string& destPath) {
    std::lock_guard<std::recursive_mutex> lock(impl_->mtx);
    if (!impl_->db) return false;

    sqlite3* destDb = nullptr;
    if (sqlite3_open(destPath.c_str(), &destDb) != SQLITE_OK) {
        sqlite3_close(destDb);
        return false;
    }

    sqlite3_backup* bkp = sqlite3_backup_init(destDb, "main", impl_->db, "main");
    if (!bkp) {
        sqlite3_close(destDb);
        return false;
    }

    int stepRc = sqlite3_backup_step(bkp, -1);
    sqlite3_backup_finish(bkp);

    int rc = sqlite3_errcode(destDb);
    sqlite3_close(destDb);

    return stepRc == SQLITE_DONE && rc == SQLITE_OK;
}

ReadTransaction::ReadTransaction(Database& db)
    : db_(db), lock_(db.impl_->mtx) {
    db_.exec("BEGIN DEFERRED;");
}

ReadTransaction::~ReadTransaction() {
    try {
        db_.exec("COMMIT;");
    } catch (const DatabaseError& e) {
        LOG_WARN("storage", std::string("Ending read snapshot: ") + e.what());
    }
}

Statement::Statement(Database& db, const std::string& sql)
    : db_(&db), stmt_(nullptr), lock_(db.impl_->mtx) {
    if (!db_->impl_->db) db_->impl_->fail("prepare");
    if (sqlite3_prepare_v2(db_->impl_->db, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
        db_->impl_->fail("prepare");
    }
}

Statement::~Statement() {
    if (stmt_) sqlite3_finalize(stmt_);
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_), lock_(std::move(other.lock_)) {
    other.stmt_ = nullptr;
}

Statement& Statement::bind(int index, const std::string& value) {
    if (sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()),
                          SQLITE_TRANSIENT) != SQLITE_OK) {
        db_->impl_->fail("bind");
    }
    return *this;
}

Statement& Statement::bind(int index, const char* value) {
    return bind(index, std::string(value ? value : ""));
}

Statement& Statement::bind(int index, int64_t value) {
    if (sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value)) != SQLITE_OK) {
        db_->impl_->fail("bind");
    }
    return *this;
}

Statement& Statement::bind(int index, int value) {
    return bind(index, static_cast<int64_t>(value));
}

Statement& Statement::bindNull(int index) {
    if (sqlite3_bind_null(stmt_, index) != SQLITE_OK) {
        db_->impl_->fail("bind");
    }
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    db_->impl_->fail("step");
}

void Statement::execute() {
    while (step()) {}
}

void Statement::reset() {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
}

int64_t Statement::getInt64(int column) const {
    return static_cast<int64_t>(sqlite3_column_int64(stmt_, column));
}

std::string Statement::getString(int column) const {
    const unsigned char* text = sqlite3_column_text(stmt_, column);
    if (!text) return "";
    int len = sqlite3_column_bytes(stmt_, column);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(len));
}

bool Statement::isNull(int column) const {
    return sqlite3_column_type(stmt_, column) == SQLITE_NULL;
}

}
}
