#include "infrastructure/error_handling.h"
#include <mutex>
#include <deque>
#include <unordered_map>
#include <ctime>

namespace stakerep {

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::INVALID_INPUT: return "Invalid input";
        case ErrorCode::INVALID_VALUE: return "Invalid value";
        case ErrorCode::INVALID_DIMENSION: return "Invalid dimension";
        case ErrorCode::INVALID_AMOUNT: return "Invalid amount";
        case ErrorCode::INVALID_CONFIG: return "Invalid config";
        case ErrorCode::NO_META_DIMENSION: return "No meta dimension";
        case ErrorCode::UNAUTHORIZED: return "Unauthorized";
        case ErrorCode::INSUFFICIENT_STAKE: return "Insufficient stake";
        case ErrorCode::NOT_FOUND: return "Not found";
        case ErrorCode::RATING_NOT_FOUND: return "Rating not found";
        case ErrorCode::DISPUTE_NOT_FOUND: return "Dispute not found";
        case ErrorCode::ALREADY_EXISTS: return "Already exists";
        case ErrorCode::ALREADY_RESOLVED: return "Already resolved";
        case ErrorCode::SELF_RATING_FORBIDDEN: return "Self rating forbidden";
        case ErrorCode::STORAGE_CONFLICT: return "Storage conflict";
        case ErrorCode::DATABASE_ERROR: return "Database error";
        case ErrorCode::SERIALIZATION_ERROR: return "Serialization error";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

const char* severityToString(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::INFO: return "INFO";
        case ErrorSeverity::WARNING: return "WARNING";
        case ErrorSeverity::ERROR: return "ERROR";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

const char* categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::InvalidInput: return "InvalidInput";
        case ErrorCategory::Unauthorized: return "Unauthorized";
        case ErrorCategory::InsufficientStake: return "InsufficientStake";
        case ErrorCategory::NotFound: return "NotFound";
        case ErrorCategory::AlreadyResolved: return "AlreadyResolved";
        case ErrorCategory::SelfRatingForbidden: return "SelfRatingForbidden";
        case ErrorCategory::StorageConflict: return "StorageConflict";
        default: return "Internal";
    }
}

ErrorCategory errorCategory(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return ErrorCategory::None;
        case ErrorCode::INVALID_INPUT:
        case ErrorCode::INVALID_VALUE:
        case ErrorCode::INVALID_DIMENSION:
        case ErrorCode::INVALID_AMOUNT:
        case ErrorCode::INVALID_CONFIG:
        case ErrorCode::NO_META_DIMENSION:
        case ErrorCode::ALREADY_EXISTS:
            return ErrorCategory::InvalidInput;
        case ErrorCode::UNAUTHORIZED:
            return ErrorCategory::Unauthorized;
        case ErrorCode::INSUFFICIENT_STAKE:
            return ErrorCategory::InsufficientStake;
        case ErrorCode::NOT_FOUND:
        case ErrorCode::RATING_NOT_FOUND:
        case ErrorCode::DISPUTE_NOT_FOUND:
            return ErrorCategory::NotFound;
        case ErrorCode::ALREADY_RESOLVED:
            return ErrorCategory::AlreadyResolved;
        case ErrorCode::SELF_RATING_FORBIDDEN:
            return ErrorCategory::SelfRatingForbidden;
        case ErrorCode::STORAGE_CONFLICT:
            return ErrorCategory::StorageConflict;
        default:
            return ErrorCategory::Internal;
    }
}

bool isRetryable(ErrorCode code) {
    return code == ErrorCode::STORAGE_CONFLICT;
}

Error makeError(ErrorCode code, const std::string& message) {
    Error err;
    err.code = code;
    err.severity = ErrorSeverity::ERROR;
    err.message = message;
    err.timestamp = static_cast<uint64_t>(std::time(nullptr));
    return err;
}

Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    Error err = makeError(code, message);
    err.context = context;
    return err;
}

struct ErrorHandler::Impl {
    std::function<void(const Error&)> handler;
    std::deque<Error> recentErrors;
    std::unordered_map<int, uint64_t> errorCounts;
    uint64_t totalErrors = 0;
    mutable std::mutex mtx;
    static constexpr size_t MAX_RECENT_ERRORS = 100;
};

ErrorHandler::ErrorHandler() : impl_(std::make_unique<Impl>()) {}

ErrorHandler& ErrorHandler::instance() {
    static ErrorHandler inst;
    return inst;
}

void ErrorHandler::setHandler(std::function<void(const Error&)> handler) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->handler = handler;
}

void ErrorHandler::handle(const Error& error) {
    std::function<void(const Error&)> handler;
    Error err = error;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        if (err.timestamp == 0) {
            err.timestamp = static_cast<uint64_t>(std::time(nullptr));
        }
        impl_->recentErrors.push_back(err);
        if (impl_->recentErrors.size() > Impl::MAX_RECENT_ERRORS) {
            impl_->recentErrors.pop_front();
        }
        impl_->totalErrors++;
        impl_->errorCounts[static_cast<int>(error.code)]++;
        handler = impl_->handler;
    }

    if (handler) {
        handler(err);
    }
}

void ErrorHandler::handle(ErrorCode code, const std::string& message) {
    handle(makeError(code, message));
}

std::vector<Error> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<Error> result;
    size_t start = impl_->recentErrors.size() > count ?
                   impl_->recentErrors.size() - count : 0;
    for (size_t i = impl_->recentErrors.size(); i > start; i--) {
        result.push_back(impl_->recentErrors[i - 1]);
    }
    return result;
}

void ErrorHandler::clearErrors() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->recentErrors.clear();
    impl_->errorCounts.clear();
    impl_->totalErrors = 0;
}

uint64_t ErrorHandler::getErrorCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->totalErrors;
}

uint64_t ErrorHandler::getErrorCount(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->errorCounts.find(static_cast<int>(code));
    return it != impl_->errorCounts.end() ? it->second : 0;
}

Error ErrorHandler::getLastError() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (impl_->recentErrors.empty()) {
        return Error{};
    }
    return impl_->recentErrors.back();
}

}
