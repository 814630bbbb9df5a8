#include "error_handling.h"
#include "utils/utils.h"
#include <mutex>
#include <deque>
#include <map>

namespace paycore {

namespace {

struct CodeName {
    ErrorCode code;
    const char* name;
};

const CodeName CODE_NAMES[] = {
    {ErrorCode::OK, "OK"},
    {ErrorCode::INVALID_AMOUNT, "INVALID_AMOUNT"},
    {ErrorCode::SELF_TRANSFER_NOT_ALLOWED, "SELF_TRANSFER_NOT_ALLOWED"},
    {ErrorCode::RECIPIENT_NOT_FOUND, "RECIPIENT_NOT_FOUND"},
    {ErrorCode::VERIFICATION_REQUIRED, "VERIFICATION_REQUIRED"},
    {ErrorCode::MISSING_IDEMPOTENCY_KEY, "MISSING_IDEMPOTENCY_KEY"},
    {ErrorCode::INSUFFICIENT_FUNDS, "INSUFFICIENT_FUNDS"},
    {ErrorCode::CONCURRENCY_CONFLICT, "CONCURRENCY_CONFLICT"},
    {ErrorCode::DATABASE_ERROR, "DATABASE_ERROR"},
    {ErrorCode::NOT_FOUND, "NOT_FOUND"},
    {ErrorCode::ALREADY_EXISTS, "ALREADY_EXISTS"},
    {ErrorCode::INVALID_STATE, "INVALID_STATE"},
    {ErrorCode::INVALID_ARGUMENT, "INVALID_ARGUMENT"},
    {ErrorCode::INTERNAL_ERROR, "INTERNAL_ERROR"},
};

}

const char* errorCodeName(ErrorCode code) {
    for (const auto& entry : CODE_NAMES) {
        if (entry.code == code) return entry.name;
    }
    return "UNKNOWN";
}

ErrorCode errorCodeFromName(const std::string& name) {
    for (const auto& entry : CODE_NAMES) {
        if (name == entry.name) return entry.code;
    }
    return ErrorCode::UNKNOWN;
}

ErrorClass classifyError(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return ErrorClass::NONE;
        case ErrorCode::INVALID_AMOUNT:
        case ErrorCode::SELF_TRANSFER_NOT_ALLOWED:
        case ErrorCode::RECIPIENT_NOT_FOUND:
        case ErrorCode::VERIFICATION_REQUIRED:
        case ErrorCode::MISSING_IDEMPOTENCY_KEY:
        case ErrorCode::NOT_FOUND:
        case ErrorCode::ALREADY_EXISTS:
        case ErrorCode::INVALID_ARGUMENT:
            return ErrorClass::VALIDATION;
        case ErrorCode::INSUFFICIENT_FUNDS:
        case ErrorCode::INVALID_STATE:
            return ErrorClass::BUSINESS;
        case ErrorCode::CONCURRENCY_CONFLICT:
        case ErrorCode::DATABASE_ERROR:
            return ErrorClass::TRANSIENT;
        default:
            return ErrorClass::INTERNAL;
    }
}

bool isRetryable(ErrorCode code) {
    return classifyError(code) == ErrorClass::TRANSIENT;
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err(code, message);
    err.context = context;
    err.timestamp = utils::nowMillis();
    return err;
}

struct ErrorHandler::Impl {
    static constexpr size_t MAX_RECENT = 100;

    mutable std::mutex mtx;
    std::deque<Error> recent;
    std::map<ErrorCode, uint64_t> counts;
    uint64_t total = 0;
};

ErrorHandler::ErrorHandler() : impl_(std::make_unique<Impl>()) {}

ErrorHandler& ErrorHandler::instance() {
    static ErrorHandler inst;
    return inst;
}

void ErrorHandler::handle(const Error& error) {
    Error err = error;
    if (err.timestamp == 0) err.timestamp = utils::nowMillis();

    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->recent.push_back(std::move(err));
    if (impl_->recent.size() > Impl::MAX_RECENT) impl_->recent.pop_front();
    impl_->counts[error.code]++;
    impl_->total++;
}

std::vector<Error> ErrorHandler::recent(size_t count) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<Error> out;
    for (auto it = impl_->recent.rbegin(); it != impl_->recent.rend() && out.size() < count; ++it) {
        out.push_back(*it);
    }
    return out;
}

uint64_t ErrorHandler::count() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->total;
}

uint64_t ErrorHandler::count(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->counts.find(code);
    return it != impl_->counts.end() ? it->second : 0;
}

void ErrorHandler::clear() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->recent.clear();
    impl_->counts.clear();
    impl_->total = 0;
}

}
