#pragma once

#include "core/types.h"
#include "database/database.h"
#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace paycore {
namespace core {

class TransferEngine;

// Tracks top-up intents and turns confirmed payment events into credits.
// Event signatures are checked upstream; every event handed in is trusted.
class PaymentReconciler {
public:
    PaymentReconciler(database::Storage& storage, TransferEngine& engine);
    ~PaymentReconciler();

    Result<PaymentIntent> createIntent(const std::string& accountId, const std::string& amount,
                                       const std::string& description = "");
    Result<PaymentIntent> markPending(const std::string& intentId);

    // SUCCEEDED credits the intent's account once, keyed by the intent id.
    // FAILED and EXPIRED never touch the ledger. Redelivering a processed
    // eventId returns the recorded result.
    Result<PaymentIntent> applyEvent(const std::string& eventId, const std::string& intentId,
                                     PaymentEventType type, const std::string& errorMessage = "");

    // Expires CREATED and PENDING intents created more than olderThanMs ago.
    Result<size_t> expireStale(uint64_t olderThanMs);

    bool getIntent(const std::string& intentId, PaymentIntent& out) const;
    bool getEvent(const std::string& eventId, PaymentEvent& out) const;
    std::vector<PaymentIntent> intentsFor(const std::string& accountId, size_t limit = 50) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
