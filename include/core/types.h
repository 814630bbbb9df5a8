#pragma once

#include "core/money.h"
#include "infrastructure/error_handling.h"
#include <string>
#include <vector>
#include <cstdint>

namespace paycore {
namespace core {

enum class Verification : uint8_t {
    PENDING = 0,
    APPROVED = 1,
    REJECTED = 2
};

enum class TxKind : uint8_t {
    TRANSFER = 0,
    DEPOSIT = 1
};

enum class TxStatus : uint8_t {
    PENDING = 0,
    COMPLETED = 1,
    FAILED = 2
};

enum class EntryLeg : uint8_t {
    DEBIT = 0,
    CREDIT = 1
};

enum class IntentStatus : uint8_t {
    CREATED = 0,
    PENDING = 1,
    SUCCEEDED = 2,
    FAILED = 3,
    EXPIRED = 4
};

enum class PaymentEventType : uint8_t {
    SUCCEEDED = 0,
    FAILED = 1,
    EXPIRED = 2
};

enum class EventStatus : uint8_t {
    PROCESSED = 0,
    FAILED = 1
};

// Whether money moved for a given outcome.
enum class Certainty : uint8_t {
    NOT_APPLIED = 0,
    UNKNOWN = 1,
    APPLIED = 2
};

struct Account {
    std::string id;
    std::string identifier;
    Verification verification = Verification::PENDING;
    bool active = true;
    uint64_t createdAt = 0;
};

struct Wallet {
    std::string id;
    std::string accountId;
    Amount balance = 0;
    std::string currency;
    int64_t version = 0;
    bool closed = false;
    uint64_t createdAt = 0;
    uint64_t updatedAt = 0;
};

struct Transaction {
    std::string id;
    int64_t seq = 0;
    std::string idempotencyKey;
    std::string initiatorId;
    TxKind kind = TxKind::TRANSFER;
    std::string sourceAccountId;
    std::string destinationAccountId;
    std::string externalReference;
    Amount amount = 0;
    std::string currency;
    std::string description;
    TxStatus status = TxStatus::PENDING;
    std::string failureCode;
    std::string failureReason;
    Amount sourceBalanceBefore = 0;
    Amount sourceBalanceAfter = 0;
    Amount destinationBalanceBefore = 0;
    Amount destinationBalanceAfter = 0;
    uint64_t createdAt = 0;
    uint64_t completedAt = 0;
};

struct LedgerEntry {
    int64_t id = 0;
    std::string transactionId;
    std::string walletId;
    std::string accountId;
    EntryLeg leg = EntryLeg::DEBIT;
    Amount amount = 0;
    Amount balanceAfter = 0;
    uint64_t createdAt = 0;
};

struct IdempotencyRecord {
    std::string key;
    std::string initiatorId;
    std::string transactionId;
    ErrorCode outcome = ErrorCode::OK;
    std::string fingerprint;
    uint64_t firstSeenAt = 0;
};

struct PaymentIntent {
    std::string id;
    std::string accountId;
    Amount amount = 0;
    std::string currency;
    std::string description;
    IntentStatus status = IntentStatus::CREATED;
    std::string transactionId;
    std::string errorMessage;
    uint64_t createdAt = 0;
    uint64_t updatedAt = 0;
};

struct PaymentEvent {
    std::string eventId;
    std::string intentId;
    PaymentEventType type = PaymentEventType::SUCCEEDED;
    EventStatus status = EventStatus::PROCESSED;
    int attempts = 0;
    ErrorCode outcome = ErrorCode::OK;
    std::string errorMessage;
    uint64_t receivedAt = 0;
    uint64_t processedAt = 0;
};

struct TransferOutcome {
    ErrorCode code = ErrorCode::UNKNOWN;
    Certainty certainty = Certainty::NOT_APPLIED;
    bool alreadyProcessed = false;
    Transaction transaction;
    std::string message;

    bool ok() const { return code == ErrorCode::OK; }
};

struct HistoryPage {
    std::vector<Transaction> items;
    // Empty when there is nothing older.
    std::string nextCursor;
};

const char* toString(Verification v);
const char* toString(TxKind k);
const char* toString(TxStatus s);
const char* toString(EntryLeg l);
const char* toString(IntentStatus s);
const char* toString(PaymentEventType t);
const char* toString(EventStatus s);
const char* toString(Certainty c);

bool fromString(const std::string& s, Verification& out);
bool fromString(const std::string& s, TxKind& out);
bool fromString(const std::string& s, TxStatus& out);
bool fromString(const std::string& s, EntryLeg& out);
bool fromString(const std::string& s, IntentStatus& out);
bool fromString(const std::string& s, PaymentEventType& out);
bool fromString(const std::string& s, EventStatus& out);

bool isTerminal(IntentStatus s);

}
}
