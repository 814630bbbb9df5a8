#pragma once

#include "core/types.h"
#include "database/database.h"
#include <string>
#include <memory>
#include <cstdint>

namespace paycore {
namespace core {

// Transaction rows. Status only moves PENDING -> COMPLETED or PENDING -> FAILED.
class TransactionStore {
public:
    explicit TransactionStore(database::Storage& storage);
    ~TransactionStore();

    // Inserts tx as PENDING and fills in tx.seq.
    void insert(database::UnitOfWork& uow, Transaction& tx);
    Result<void> markCompleted(database::UnitOfWork& uow, Transaction& tx);
    Result<void> markFailed(database::UnitOfWork& uow, Transaction& tx,
                            ErrorCode code, const std::string& reason);

    bool find(database::UnitOfWork& uow, const std::string& id, Transaction& out) const;
    bool find(const std::string& id, Transaction& out) const;

    // Newest first. cursor is the nextCursor of a previous page, or empty.
    Result<HistoryPage> history(const std::string& accountId, const std::string& cursor,
                                size_t limit) const;

    size_t count(TxStatus status) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
