#include "core/idempotency.h"
#include "utils/utils.h"
#include <list>
#include <unordered_map>
#include <mutex>
#include <atomic>

namespace paycore {
namespace core {

static IdempotencyRecord readRecord(const database::Statement& stmt) {
    IdempotencyRecord r;
    r.key = stmt.getString(0);
    r.initiatorId = stmt.getString(1);
    r.transactionId = stmt.getString(2);
    r.outcome = errorCodeFromName(stmt.getString(3));
    r.fingerprint = stmt.getString(4);
    r.firstSeenAt = static_cast<uint64_t>(stmt.getInt64(5));
    return r;
}

static bool selectRecord(database::Database& db, const std::string& key,
                         const std::string& initiatorId, IdempotencyRecord& out) {
    auto stmt = db.prepare(
        "SELECT idempotency_key, initiator_id, transaction_id, outcome, fingerprint, first_seen_at "
        "FROM idempotency_records WHERE idempotency_key = ? AND initiator_id = ?;");
    stmt.bind(1, key).bind(2, initiatorId);
    if (!stmt.step()) return false;
    out = readRecord(stmt);
    return true;
}

static std::string cacheKey(const std::string& key, const std::string& initiatorId) {
    return initiatorId + '\x1f' + key;
}

struct IdempotencyIndex::Impl {
    database::Storage& storage;
    size_t capacity;
    mutable std::mutex mtx;
    std::list<std::pair<std::string, IdempotencyRecord>> lru;
    std::unordered_map<std::string, std::list<std::pair<std::string, IdempotencyRecord>>::iterator> index;
    std::atomic<uint64_t> hits{0};

    Impl(database::Storage& s, size_t cap) : storage(s), capacity(cap) {}

    bool cached(const std::string& k, IdempotencyRecord& out) {
        std::lock_guard<std::mutex> lock(mtx);
        auto it = index.find(k);
        if (it == index.end()) return false;
        lru.splice(lru.begin(), lru, it->second);
        out = it->second->second;
        hits++;
        return true;
    }

    void put(const std::string& k, const IdempotencyRecord& record) {
        if (capacity == 0) return;
        std::lock_guard<std::mutex> lock(mtx);
        auto it = index.find(k);
        if (it != index.end()) {
            lru.splice(lru.begin(), lru, it->second);
            return;
        }
        lru.emplace_front(k, record);
        index[k] = lru.begin();
        while (lru.size() > capacity) {
            index.erase(lru.back().first);
            lru.pop_back();
        }
    }
};

IdempotencyIndex::IdempotencyIndex(database::Storage& storage, size_t cacheCapacity)
    : impl_(std::make_unique<Impl>(storage, cacheCapacity)) {}

IdempotencyIndex::~IdempotencyIndex() = default;

bool IdempotencyIndex::lookup(const std::string& key, const std::string& initiatorId,
                              IdempotencyRecord& out) {
    std::string k = cacheKey(key, initiatorId);
    if (impl_->cached(k, out)) return true;
    if (!selectRecord(impl_->storage.reader(), key, initiatorId, out)) return false;
    impl_->put(k, out);
    return true;
}

bool IdempotencyIndex::lookup(database::UnitOfWork& uow, const std::string& key,
                              const std::string& initiatorId, IdempotencyRecord& out) const {
    return selectRecord(uow.db(), key, initiatorId, out);
}

void IdempotencyIndex::insert(database::UnitOfWork& uow, const IdempotencyRecord& record) {
    auto stmt = uow.db().prepare(
        "INSERT INTO idempotency_records "
        "(idempotency_key, initiator_id, transaction_id, outcome, fingerprint, first_seen_at) "
        "VALUES (?, ?, ?, ?, ?, ?);");
    uint64_t seen = record.firstSeenAt ? record.firstSeenAt : utils::nowMillis();
    stmt.bind(1, record.key).bind(2, record.initiatorId).bind(3, record.transactionId)
        .bind(4, errorCodeName(record.outcome)).bind(5, record.fingerprint)
        .bind(6, static_cast<int64_t>(seen));
    stmt.execute();
}

void IdempotencyIndex::remember(const IdempotencyRecord& record) {
    impl_->put(cacheKey(record.key, record.initiatorId), record);
}

size_t IdempotencyIndex::cacheSize() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->lru.size();
}

uint64_t IdempotencyIndex::cacheHits() const {
    return impl_->hits;
}

void IdempotencyIndex::clearCache() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->lru.clear();
    impl_->index.clear();
}

std::string IdempotencyIndex::fingerprint(const std::string& counterpartyId, Amount amount) {
    return counterpartyId + ":" + std::to_string(amount);
}

}
}
