#pragma once

#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace paycore {

enum class ErrorCode {
    OK = 0,
    INVALID_AMOUNT,
    SELF_TRANSFER_NOT_ALLOWED,
    RECIPIENT_NOT_FOUND,
    VERIFICATION_REQUIRED,
    MISSING_IDEMPOTENCY_KEY,
    INSUFFICIENT_FUNDS,
    CONCURRENCY_CONFLICT,
    DATABASE_ERROR,
    NOT_FOUND,
    ALREADY_EXISTS,
    INVALID_STATE,
    INVALID_ARGUMENT,
    INTERNAL_ERROR,
    UNKNOWN
};

// How a caller should read a failed or replayed outcome.
enum class ErrorClass {
    NONE,
    VALIDATION,
    BUSINESS,
    TRANSIENT,
    INTERNAL
};

struct Error {
    ErrorCode code = ErrorCode::OK;
    std::string message;
    std::string context;
    uint64_t timestamp = 0;

    Error() = default;
    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}
};

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), hasValue_(true) {}
    Result(Error error) : value_(), error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

private:
    T value_;
    Error error_;
    bool hasValue_;
};

template<>
class Result<void> {
public:
    Result() : hasValue_(true) {}
    Result(Error error) : error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    const Error& error() const { return error_; }

private:
    Error error_;
    bool hasValue_;
};

// Process-wide record of storage and internal failures. Business outcomes such
// as insufficient funds are not reported here.
class ErrorHandler {
public:
    static ErrorHandler& instance();

    void handle(const Error& error);

    // Most recent first.
    std::vector<Error> recent(size_t count = 10) const;
    uint64_t count() const;
    uint64_t count(ErrorCode code) const;
    void clear();

private:
    ErrorHandler();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Stable upper-case names used in storage and on the command line.
const char* errorCodeName(ErrorCode code);
ErrorCode errorCodeFromName(const std::string& name);

ErrorClass classifyError(ErrorCode code);
// True when the same request may be resubmitted with the same idempotency key.
bool isRetryable(ErrorCode code);

Error makeError(ErrorCode code, const std::string& message, const std::string& context = "");

}
