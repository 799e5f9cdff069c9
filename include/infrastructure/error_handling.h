#pragma once

#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <cstdint>

namespace stakerep {

enum class ErrorCode {
    OK = 0,
    INVALID_INPUT,
    INVALID_VALUE,
    INVALID_DIMENSION,
    INVALID_AMOUNT,
    INVALID_CONFIG,
    NO_META_DIMENSION,
    UNAUTHORIZED,
    INSUFFICIENT_STAKE,
    NOT_FOUND,
    RATING_NOT_FOUND,
    DISPUTE_NOT_FOUND,
    ALREADY_EXISTS,
    ALREADY_RESOLVED,
    SELF_RATING_FORBIDDEN,
    STORAGE_CONFLICT,
    DATABASE_ERROR,
    SERIALIZATION_ERROR,
    INTERNAL_ERROR,
    UNKNOWN
};

// Coarse classes surfaced to callers. Only StorageConflict is retryable.
enum class ErrorCategory {
    None,
    InvalidInput,
    Unauthorized,
    InsufficientStake,
    NotFound,
    AlreadyResolved,
    SelfRatingForbidden,
    StorageConflict,
    Internal
};

enum class ErrorSeverity {
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

struct Error {
    ErrorCode code;
    ErrorSeverity severity;
    std::string message;
    std::string context;
    std::string file;
    int line;
    uint64_t timestamp;

    Error() : code(ErrorCode::OK), severity(ErrorSeverity::INFO), line(0), timestamp(0) {}
    Error(ErrorCode c, const std::string& msg) : code(c), severity(ErrorSeverity::ERROR), message(msg), line(0), timestamp(0) {}
};

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(), hasValue_(true) {}
    Result(Error error) : value_(), error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

    T valueOr(const T& defaultValue) const { return hasValue_ ? value_ : defaultValue; }

private:
    T value_;
    Error error_;
    bool hasValue_;
};

template<>
class Result<void> {
public:
    Result() : error_(), hasValue_(true) {}
    Result(Error error) : error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }
    const Error& error() const { return error_; }
    ErrorCode code() const { return error_.code; }

private:
    Error error_;
    bool hasValue_;
};

// Process-wide sink for errors returned by engine entry points.
class ErrorHandler {
public:
    static ErrorHandler& instance();

    void setHandler(std::function<void(const Error&)> handler);
    void handle(const Error& error);
    void handle(ErrorCode code, const std::string& message);

    std::vector<Error> getRecentErrors(size_t count = 10) const;
    void clearErrors();

    uint64_t getErrorCount() const;
    uint64_t getErrorCount(ErrorCode code) const;
    Error getLastError() const;

private:
    ErrorHandler();
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

const char* errorToString(ErrorCode code);
const char* severityToString(ErrorSeverity severity);
const char* categoryToString(ErrorCategory category);
ErrorCategory errorCategory(ErrorCode code);
bool isRetryable(ErrorCode code);

Error makeError(ErrorCode code, const std::string& message);
Error makeError(ErrorCode code, const std::string& message, const std::string& context);

#define STAKEREP_ERROR(code, msg) stakerep::Error{code, msg}
#define STAKEREP_CHECK(expr, code, msg) if (!(expr)) return stakerep::makeError(code, msg)
#define STAKEREP_TRY(var, expr) \
    auto var = (expr); \
    if (var.failed()) return var.error()

}
