#include "core/types.h"

namespace paycore {
namespace core {

const char* toString(Verification v) {
    switch (v) {
        case Verification::PENDING: return "PENDING";
        case Verification::APPROVED: return "APPROVED";
        case Verification::REJECTED: return "REJECTED";
    }
    return "PENDING";
}

const char* toString(TxKind k) {
    switch (k) {
        case TxKind::TRANSFER: return "TRANSFER";
        case TxKind::DEPOSIT: return "DEPOSIT";
    }
    return "TRANSFER";
}

const char* toString(TxStatus s) {
    switch (s) {
        case TxStatus::PENDING: return "PENDING";
        case TxStatus::COMPLETED: return "COMPLETED";
        case TxStatus::FAILED: return "FAILED";
    }
    return "PENDING";
}

const char* toString(EntryLeg l) {
    return l == EntryLeg::DEBIT ? "DEBIT" : "CREDIT";
}

const char* toString(IntentStatus s) {
    switch (s) {
        case IntentStatus::CREATED: return "CREATED";
        case IntentStatus::PENDING: return "PENDING";
        case IntentStatus::SUCCEEDED: return "SUCCEEDED";
        case IntentStatus::FAILED: return "FAILED";
        case IntentStatus::EXPIRED: return "EXPIRED";
    }
    return "CREATED";
}

const char* toString(PaymentEventType t) {
    switch (t) {
        case PaymentEventType::SUCCEEDED: return "SUCCEEDED";
        case PaymentEventType::FAILED: return "FAILED";
        case PaymentEventType::EXPIRED: return "EXPIRED";
    }
    return "SUCCEEDED";
}

const char* toString(EventStatus s) {
    return s == EventStatus::PROCESSED ? "PROCESSED" : "FAILED";
}

const char* toString(Certainty c) {
    switch (c) {
        case Certainty::NOT_APPLIED: return "NOT_APPLIED";
        case Certainty::UNKNOWN: return "UNKNOWN";
        case Certainty::APPLIED: return "APPLIED";
    }
    return "UNKNOWN";
}

bool fromString(const std::string& s, Verification& out) {
    if (s == "PENDING") { out = Verification::PENDING; return true; }
    if (s == "APPROVED") { out = Verification::APPROVED; return true; }
    if (s == "REJECTED") { out = Verification::REJECTED; return true; }
    return false;
}

bool fromString(const std::string& s, TxKind& out) {
    if (s == "TRANSFER") { out = TxKind::TRANSFER; return true; }
    if (s == "DEPOSIT") { out = TxKind::DEPOSIT; return true; }
    return false;
}

bool fromString(const std::string& s, TxStatus& out) {
    if (s == "PENDING") { out = TxStatus::PENDING; return true; }
    if (s == "COMPLETED") { out = TxStatus::COMPLETED; return true; }
    if (s == "FAILED") { out = TxStatus::FAILED; return true; }
    return false;
}

bool fromString(const std::string& s, EntryLeg& out) {
    if (s == "DEBIT") { out = EntryLeg::DEBIT; return true; }
    if (s == "CREDIT") { out = EntryLeg::CREDIT; return true; }
    return false;
}

bool fromString(const std::string& s, IntentStatus& out) {
    if (s == "CREATED") { out = IntentStatus::CREATED; return true; }
    if (s == "PENDING") { out = IntentStatus::PENDING; return true; }
    if (s == "SUCCEEDED") { out = IntentStatus::SUCCEEDED; return true; }
    if (s == "FAILED") { out = IntentStatus::FAILED; return true; }
    if (s == "EXPIRED") { out = IntentStatus::EXPIRED; return true; }
    return false;
}

bool fromString(const std::string& s, PaymentEventType& out) {
    if (s == "SUCCEEDED") { out = PaymentEventType::SUCCEEDED; return true; }
    if (s == "FAILED") { out = PaymentEventType::FAILED; return true; }
    if (s == "EXPIRED") { out = PaymentEventType::EXPIRED; return true; }
    return false;
}

bool fromString(const std::string& s, EventStatus& out) {
    if (s == "PROCESSED") { out = EventStatus::PROCESSED; return true; }
    if (s == "FAILED") { out = EventStatus::FAILED; return true; }
    return false;
}

bool isTerminal(IntentStatus s) {
    return s == IntentStatus::SUCCEEDED || s == IntentStatus::FAILED || s == IntentStatus::EXPIRED;
}

}
}
