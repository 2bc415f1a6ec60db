#include "infrastructure/error_handling.h"
#include <stdexcept>
#include <mutex>
#include <deque>
#include <unordered_map>
#include <ctime>

namespace coursedao {

ErrorCategory categoryOf(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:
            return ErrorCategory::NONE;
        case ErrorCode::NOT_OWNER:
        case ErrorCode::NOT_BOARD:
        case ErrorCode::NOT_TEACHER:
        case ErrorCode::NOT_STUDENT:
        case ErrorCode::NOT_IN_ELECTORATE:
        case ErrorCode::NOT_COURSE_TEACHER:
        case ErrorCode::NOT_AUTHORIZED:
            return ErrorCategory::AUTHORIZATION;
        case ErrorCode::INVALID_CANDIDATE:
        case ErrorCode::INVALID_ROLE:
        case ErrorCode::INVALID_ACCOUNT:
        case ErrorCode::INVALID_DURATION:
        case ErrorCode::EMPTY_TITLE:
        case ErrorCode::EMPTY_TEACHER_LIST:
        case ErrorCode::LENGTH_MISMATCH:
        case ErrorCode::DUPLICATE_TEACHER:
        case ErrorCode::SHARES_MUST_SUM_TO_10000:
        case ErrorCode::UNREGISTERED_TEACHER:
        case ErrorCode::INVALID_RATING_VALUE:
        case ErrorCode::TEACHER_NOT_IN_COURSE:
        case ErrorCode::ZERO_AMOUNT:
        case ErrorCode::ZERO_PRICE_COURSE:
        case ErrorCode::UNKNOWN_TOKEN:
        case ErrorCode::INVALID_ARGUMENT:
            return ErrorCategory::VALIDATION;
        case ErrorCode::ALREADY_IN_ROLE:
        case ErrorCode::ALREADY_HAS_ROLE:
        case ErrorCode::DUPLICATE_ACTIVE_PROPOSAL:
        case ErrorCode::NO_SUCH_PROPOSAL:
        case ErrorCode::DUPLICATE_VOTE:
        case ErrorCode::ALREADY_EXECUTED:
        case ErrorCode::NO_SUCH_COURSE:
        case ErrorCode::ALREADY_ACTIVE:
        case ErrorCode::NO_APPLICATION:
        case ErrorCode::ALREADY_ENROLLED:
        case ErrorCode::NOT_PENDING_OR_NOT_ACCEPTED:
        case ErrorCode::STUDENT_NOT_ENROLLED:
        case ErrorCode::ALREADY_COMPLETED:
        case ErrorCode::NO_WEIGHT:
            return ErrorCategory::STATE_CONFLICT;
        case ErrorCode::VOTING_CLOSED:
        case ErrorCode::VOTING_STILL_OPEN:
            return ErrorCategory::TEMPORAL;
        case ErrorCode::INSUFFICIENT_TREASURY:
        case ErrorCode::PAYMENT_FAILED:
        case ErrorCode::TRANSFER_FAILED:
            return ErrorCategory::RESOURCE;
        default:
            return ErrorCategory::INFRASTRUCTURE;
    }
}

const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::NOT_OWNER: return "Caller is not the organization owner";
        case ErrorCode::NOT_BOARD: return "Caller is not a board member";
        case ErrorCode::NOT_TEACHER: return "Caller is not a teacher";
        case ErrorCode::NOT_STUDENT: return "Caller is not a student";
        case ErrorCode::NOT_IN_ELECTORATE: return "Caller may not vote on this proposal";
        case ErrorCode::NOT_COURSE_TEACHER: return "Caller does not teach this course";
        case ErrorCode::NOT_AUTHORIZED: return "Not authorized";
        case ErrorCode::INVALID_CANDIDATE: return "Invalid candidate";
        case ErrorCode::INVALID_ROLE: return "Invalid role";
        case ErrorCode::INVALID_ACCOUNT: return "Invalid account";
        case ErrorCode::INVALID_DURATION: return "Invalid duration";
        case ErrorCode::EMPTY_TITLE: return "Empty course title";
        case ErrorCode::EMPTY_TEACHER_LIST: return "Empty teacher list";
        case ErrorCode::LENGTH_MISMATCH: return "Teacher and share lists differ in length";
        case ErrorCode::DUPLICATE_TEACHER: return "Teacher listed twice";
        case ErrorCode::SHARES_MUST_SUM_TO_10000: return "Shares must sum to 10000";
        case ErrorCode::UNREGISTERED_TEACHER: return "Unregistered teacher";
        case ErrorCode::INVALID_RATING_VALUE: return "Rating must be between 1 and 5";
        case ErrorCode::TEACHER_NOT_IN_COURSE: return "Teacher not in course";
        case ErrorCode::ZERO_AMOUNT: return "Zero amount";
        case ErrorCode::ZERO_PRICE_COURSE: return "Zero price course";
        case ErrorCode::UNKNOWN_TOKEN: return "Unknown token";
        case ErrorCode::INVALID_ARGUMENT: return "Invalid argument";
        case ErrorCode::ALREADY_IN_ROLE: return "Account already holds a role";
        case ErrorCode::ALREADY_HAS_ROLE: return "Candidate already holds the role";
        case ErrorCode::DUPLICATE_ACTIVE_PROPOSAL: return "Candidate already has an active proposal";
        case ErrorCode::NO_SUCH_PROPOSAL: return "No such proposal";
        case ErrorCode::DUPLICATE_VOTE: return "Already voted";
        case ErrorCode::ALREADY_EXECUTED: return "Proposal already executed";
        case ErrorCode::NO_SUCH_COURSE: return "No such course";
        case ErrorCode::ALREADY_ACTIVE: return "Application already active";
        case ErrorCode::NO_APPLICATION: return "No application";
        case ErrorCode::ALREADY_ENROLLED: return "Already enrolled";
        case ErrorCode::NOT_PENDING_OR_NOT_ACCEPTED: return "Enrollment not pending or not accepted";
        case ErrorCode::STUDENT_NOT_ENROLLED: return "Student not enrolled";
        case ErrorCode::ALREADY_COMPLETED: return "Course already completed for student";
        case ErrorCode::NO_WEIGHT: return "No rating weight";
        case ErrorCode::VOTING_CLOSED: return "Voting closed";
        case ErrorCode::VOTING_STILL_OPEN: return "Voting still open";
        case ErrorCode::INSUFFICIENT_TREASURY: return "Insufficient treasury balance";
        case ErrorCode::PAYMENT_FAILED: return "Payment failed";
        case ErrorCode::TRANSFER_FAILED: return "Transfer failed";
        case ErrorCode::DATABASE_ERROR: return "Database error";
        case ErrorCode::SERIALIZATION_ERROR: return "Serialization error";
        case ErrorCode::INTERNAL_ERROR: return "Internal error";
        default: return "Unknown error";
    }
}

const char* errorName(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "Ok";
        case ErrorCode::NOT_OWNER: return "NotOwner";
        case ErrorCode::NOT_BOARD: return "NotBoard";
        case ErrorCode::NOT_TEACHER: return "NotTeacher";
        case ErrorCode::NOT_STUDENT: return "NotStudent";
        case ErrorCode::NOT_IN_ELECTORATE: return "NotInElectorate";
        case ErrorCode::NOT_COURSE_TEACHER: return "NotCourseTeacher";
        case ErrorCode::NOT_AUTHORIZED: return "NotAuthorized";
        case ErrorCode::INVALID_CANDIDATE: return "InvalidCandidate";
        case ErrorCode::INVALID_ROLE: return "InvalidRole";
        case ErrorCode::INVALID_ACCOUNT: return "InvalidAccount";
        case ErrorCode::INVALID_DURATION: return "InvalidDuration";
        case ErrorCode::EMPTY_TITLE: return "EmptyTitle";
        case ErrorCode::EMPTY_TEACHER_LIST: return "EmptyTeacherList";
        case ErrorCode::LENGTH_MISMATCH: return "LengthMismatch";
        case ErrorCode::DUPLICATE_TEACHER: return "DuplicateTeacher";
        case ErrorCode::SHARES_MUST_SUM_TO_10000: return "SharesMustSumTo10000";
        case ErrorCode::UNREGISTERED_TEACHER: return "UnregisteredTeacher";
        case ErrorCode::INVALID_RATING_VALUE: return "InvalidRatingValue";
        case ErrorCode::TEACHER_NOT_IN_COURSE: return "TeacherNotInCourse";
        case ErrorCode::ZERO_AMOUNT: return "ZeroAmount";
        case ErrorCode::ZERO_PRICE_COURSE: return "ZeroPriceCourse";
        case ErrorCode::UNKNOWN_TOKEN: return "UnknownToken";
        case ErrorCode::INVALID_ARGUMENT: return "InvalidArgument";
        case ErrorCode::ALREADY_IN_ROLE: return "AlreadyInRole";
        case ErrorCode::ALREADY_HAS_ROLE: return "AlreadyHasRole";
        case ErrorCode::DUPLICATE_ACTIVE_PROPOSAL: return "DuplicateActiveProposal";
        case ErrorCode::NO_SUCH_PROPOSAL: return "NoSuchProposal";
        case ErrorCode::DUPLICATE_VOTE: return "DuplicateVote";
        case ErrorCode::ALREADY_EXECUTED: return "AlreadyExecuted";
        case ErrorCode::NO_SUCH_COURSE: return "NoSuchCourse";
        case ErrorCode::ALREADY_ACTIVE: return "AlreadyActive";
        case ErrorCode::NO_APPLICATION: return "NoApplication";
        case ErrorCode::ALREADY_ENROLLED: return "AlreadyEnrolled";
        case ErrorCode::NOT_PENDING_OR_NOT_ACCEPTED: return "NotPendingOrNotAccepted";
        case ErrorCode::STUDENT_NOT_ENROLLED: return "StudentNotEnrolled";
        case ErrorCode::ALREADY_COMPLETED: return "AlreadyCompleted";
        case ErrorCode::NO_WEIGHT: return "NoWeight";
        case ErrorCode::VOTING_CLOSED: return "VotingClosed";
        case ErrorCode::VOTING_STILL_OPEN: return "VotingStillOpen";
        case ErrorCode::INSUFFICIENT_TREASURY: return "InsufficientTreasury";
        case ErrorCode::PAYMENT_FAILED: return "PaymentFailed";
        case ErrorCode::TRANSFER_FAILED: return "TransferFailed";
        case ErrorCode::DATABASE_ERROR: return "DatabaseError";
        case ErrorCode::SERIALIZATION_ERROR: return "SerializationError";
        case ErrorCode::INTERNAL_ERROR: return "InternalError";
        default: return "Unknown";
    }
}

const char* categoryToString(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::AUTHORIZATION: return "AUTHORIZATION";
        case ErrorCategory::VALIDATION: return "VALIDATION";
        case ErrorCategory::STATE_CONFLICT: return "STATE_CONFLICT";
        case ErrorCategory::TEMPORAL: return "TEMPORAL";
        case ErrorCategory::RESOURCE: return "RESOURCE";
        case ErrorCategory::INFRASTRUCTURE: return "INFRASTRUCTURE";
        default: return "UNKNOWN";
    }
}

void throwIfError(ErrorCode code) {
    if (code != ErrorCode::OK) {
        throw std::runtime_error(errorToString(code));
    }
}

void throwIfError(const Error& error) {
    if (error.code != ErrorCode::OK) {
        std::string msg = error.message;
        if (!error.context.empty()) {
            msg += " [" + error.context + "]";
        }
        throw std::runtime_error(msg);
    }
}

Error makeError(ErrorCode code, const std::string& message) {
    Error err(code, message);
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
    std::deque<Error> recent;
    std::unordered_map<int, uint64_t> counts;
    uint64_t total = 0;
    mutable std::mutex mtx;
    static constexpr size_t MAX_RECENT = 100;
};

ErrorHandler::ErrorHandler() : impl_(std::make_unique<Impl>()) {}
ErrorHandler::~ErrorHandler() = default;

ErrorHandler& ErrorHandler::instance() {
    static ErrorHandler inst;
    return inst;
}

void ErrorHandler::setHandler(std::function<void(const Error&)> handler) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->handler = std::move(handler);
}

void ErrorHandler::handle(const Error& error) {
    std::function<void(const Error&)> handler;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->recent.push_back(error);
        if (impl_->recent.size() > Impl::MAX_RECENT) impl_->recent.pop_front();
        impl_->total++;
        impl_->counts[static_cast<int>(error.code)]++;
        handler = impl_->handler;
    }
    if (handler) handler(error);
}

void ErrorHandler::handle(ErrorCode code, const std::string& message) {
    handle(makeError(code, message));
}

std::vector<Error> ErrorHandler::getRecentErrors(size_t count) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    std::vector<Error> result;
    for (auto it = impl_->recent.rbegin(); it != impl_->recent.rend() && result.size() < count; ++it) {
        result.push_back(*it);
    }
    return result;
}

void ErrorHandler::clearErrors() {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->recent.clear();
    impl_->counts.clear();
    impl_->total = 0;
}

uint64_t ErrorHandler::getErrorCount() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->total;
}

uint64_t ErrorHandler::getErrorCount(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    auto it = impl_->counts.find(static_cast<int>(code));
    return it != impl_->counts.end() ? it->second : 0;
}

Error ErrorHandler::getLastError() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->recent.empty() ? Error() : impl_->recent.back();
}

}
