#pragma once

#include <string>
#include <functional>
#include <vector>
#include <memory>
#include <cstdint>

namespace coursedao {

enum class ErrorCode {
    OK = 0,
    // authorization
    NOT_OWNER,
    NOT_BOARD,
    NOT_TEACHER,
    NOT_STUDENT,
    NOT_IN_ELECTORATE,
    NOT_COURSE_TEACHER,
    NOT_AUTHORIZED,
    // validation
    INVALID_CANDIDATE,
    INVALID_ROLE,
    INVALID_ACCOUNT,
    INVALID_DURATION,
    EMPTY_TITLE,
    EMPTY_TEACHER_LIST,
    LENGTH_MISMATCH,
    DUPLICATE_TEACHER,
    SHARES_MUST_SUM_TO_10000,
    UNREGISTERED_TEACHER,
    INVALID_RATING_VALUE,
    TEACHER_NOT_IN_COURSE,
    ZERO_AMOUNT,
    ZERO_PRICE_COURSE,
    UNKNOWN_TOKEN,
    INVALID_ARGUMENT,
    // state conflicts
    ALREADY_IN_ROLE,
    ALREADY_HAS_ROLE,
    DUPLICATE_ACTIVE_PROPOSAL,
    NO_SUCH_PROPOSAL,
    DUPLICATE_VOTE,
    ALREADY_EXECUTED,
    NO_SUCH_COURSE,
    ALREADY_ACTIVE,
    NO_APPLICATION,
    ALREADY_ENROLLED,
    NOT_PENDING_OR_NOT_ACCEPTED,
    STUDENT_NOT_ENROLLED,
    ALREADY_COMPLETED,
    NO_WEIGHT,
    // temporal
    VOTING_CLOSED,
    VOTING_STILL_OPEN,
    // resources
    INSUFFICIENT_TREASURY,
    PAYMENT_FAILED,
    TRANSFER_FAILED,
    // infrastructure
    DATABASE_ERROR,
    SERIALIZATION_ERROR,
    INTERNAL_ERROR,
    UNKNOWN
};

enum class ErrorCategory {
    NONE,
    AUTHORIZATION,
    VALIDATION,
    STATE_CONFLICT,
    TEMPORAL,
    RESOURCE,
    INFRASTRUCTURE
};

ErrorCategory categoryOf(ErrorCode code);

struct Error {
    ErrorCode code;
    ErrorCategory category;
    std::string message;
    std::string context;
    std::string file;
    int line;
    uint64_t timestamp;

    Error() : code(ErrorCode::OK), category(ErrorCategory::NONE), line(0), timestamp(0) {}
    Error(ErrorCode c, const std::string& msg) : code(c), category(categoryOf(c)), message(msg), line(0), timestamp(0) {}
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
    ErrorCode code() const { return hasValue_ ? ErrorCode::OK : error_.code; }

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
    ErrorCode code() const { return hasValue_ ? ErrorCode::OK : error_.code; }

private:
    Error error_;
    bool hasValue_;
};

// Collects rejected operations for reporting. Owned by whoever surfaces
// errors to a user; the core never reads it back.
class ErrorHandler {
public:
    static ErrorHandler& instance();
    ErrorHandler();
    ~ErrorHandler();

    // Called after the error is recorded.
    void setHandler(std::function<void(const Error&)> handler);
    void handle(const Error& error);
    void handle(ErrorCode code, const std::string& message);

    // Newest first.
    std::vector<Error> getRecentErrors(size_t count = 10) const;
    void clearErrors();

    uint64_t getErrorCount() const;
    uint64_t getErrorCount(ErrorCode code) const;
    Error getLastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

const char* errorToString(ErrorCode code);
const char* errorName(ErrorCode code);
const char* categoryToString(ErrorCategory category);
void throwIfError(ErrorCode code);
void throwIfError(const Error& error);

Error makeError(ErrorCode code, const std::string& message);
Error makeError(ErrorCode code, const std::string& message, const std::string& context);

#define COURSEDAO_ERROR(code, msg) coursedao::makeError(code, msg)
#define COURSEDAO_CHECK(expr, code, msg) if (!(expr)) return coursedao::makeError(code, msg)

}
