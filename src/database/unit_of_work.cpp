#include "database/database.h"
#include "utils/logger.h"
#include <algorithm>

namespace paycore {
namespace database {

UnitOfWork::UnitOfWork(Storage& storage) : storage_(storage) {}

UnitOfWork::~UnitOfWork() {
    if (active_ && !committed_) rollback();
    releaseAll();
}

Result<void> UnitOfWork::begin(std::vector<std::string> walletIds, std::chrono::milliseconds timeout) {
    if (active_ || committed_) {
        return Result<void>(makeError(ErrorCode::INVALID_STATE, "unit of work already used"));
    }
    if (!storage_.isOpen()) {
        return Result<void>(makeError(ErrorCode::DATABASE_ERROR, "storage not open"));
    }

    std::sort(walletIds.begin(), walletIds.end());
    walletIds.erase(std::unique(walletIds.begin(), walletIds.end()), walletIds.end());
    walletIds.erase(std::remove(walletIds.begin(), walletIds.end(), std::string()), walletIds.end());

    auto deadline = std::chrono::steady_clock::now() + timeout;

    if (!storage_.rowLocks().acquire(walletIds, deadline)) {
        return Result<void>(makeError(ErrorCode::CONCURRENCY_CONFLICT,
                                      "timed out waiting for wallet locks"));
    }
    locked_ = walletIds;

    if (!storage_.writerMutex().try_lock_until(deadline)) {
        releaseAll();
        return Result<void>(makeError(ErrorCode::CONCURRENCY_CONFLICT,
                                      "timed out waiting for the ledger writer"));
    }
    writerHeld_ = true;

    try {
        storage_.writer().exec("BEGIN IMMEDIATE;");
    } catch (const DatabaseError& e) {
        releaseAll();
        ErrorCode code = e.busy() ? ErrorCode::CONCURRENCY_CONFLICT : ErrorCode::DATABASE_ERROR;
        return Result<void>(makeError(code, e.what(), "begin"));
    }

    active_ = true;
    return Result<void>();
}

Result<void> UnitOfWork::commit() {
    if (!active_) {
        return Result<void>(makeError(ErrorCode::INVALID_STATE, "no active unit of work"));
    }

    try {
        storage_.writer().exec("COMMIT;");
    } catch (const DatabaseError& e) {
        LOG_ERROR("storage", std::string("Commit failed: ") + e.what());
        rollback();
        return Result<void>(makeError(ErrorCode::DATABASE_ERROR, e.what(), "commit"));
    }

    committed_ = true;
    active_ = false;
    releaseAll();
    return Result<void>();
}

void UnitOfWork::rollback() {
    if (active_) {
        try {
            storage_.writer().exec("ROLLBACK;");
        } catch (const DatabaseError& e) {
            // SQLite may already have rolled back on its own after an I/O or busy error.
            LOG_WARN("storage", std::string("Rollback reported: ") + e.what());
        }
        active_ = false;
    }
    releaseAll();
}

bool UnitOfWork::holdsLock(const std::string& walletId) const {
    return active_ && std::binary_search(locked_.begin(), locked_.end(), walletId);
}

Database& UnitOfWork::db() {
    if (!active_) throw std::logic_error("unit of work is not active");
    return storage_.writer();
}

void UnitOfWork::releaseAll() {
    if (writerHeld_) {
        storage_.writerMutex().unlock();
        writerHeld_ = false;
    }
    if (!locked_.empty()) {
        storage_.rowLocks().release(locked_);
        locked_.clear();
    }
}

}
}
