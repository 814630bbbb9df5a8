#pragma once

#include "core/types.h"
#include "database/database.h"
#include <string>
#include <memory>
#include <cstdint>

namespace paycore {
namespace core {

// Durable (key, initiator) -> outcome records, written in the same unit of
// work as the effects they describe. The in-memory cache only ever holds
// committed records and is never required for correctness.
class IdempotencyIndex {
public:
    IdempotencyIndex(database::Storage& storage, size_t cacheCapacity);
    ~IdempotencyIndex();

    // Cache, then committed state.
    bool lookup(const std::string& key, const std::string& initiatorId, IdempotencyRecord& out);
    // Authoritative read inside the unit of work.
    bool lookup(database::UnitOfWork& uow, const std::string& key, const std::string& initiatorId,
                IdempotencyRecord& out) const;

    void insert(database::UnitOfWork& uow, const IdempotencyRecord& record);

    // Call only after the unit of work that inserted record has committed.
    void remember(const IdempotencyRecord& record);

    size_t cacheSize() const;
    uint64_t cacheHits() const;
    void clearCache();

    static std::string fingerprint(const std::string& counterpartyId, Amount amount);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
