#pragma once

#include "core/context.h"
#include "core/courses.h"
#include "core/treasury.h"
#include "infrastructure/error_handling.h"
#include <map>
#include <set>
#include <vector>
#include <optional>

namespace coursedao {
namespace core {

enum class EnrollmentStage : uint8_t {
    NONE = 0,
    APPLIED = 1,
    ACCEPTED = 2,
    REJECTED = 3,
    ENROLLED = 4,
    COMPLETED = 5
};

const char* enrollmentStageToString(EnrollmentStage stage);

struct EnrollmentRequest {
    uint64_t courseId = 0;
    Account student;
    bool exists = false;
    uint32_t votesFor = 0;
    uint32_t votesAgainst = 0;
    std::set<Account> teacherVoted;
    bool decided = false;
    bool acceptedByTeachers = false;
    bool enrolled = false;
    bool completed = false;
    uint32_t attempts = 0;
    uint64_t appliedAt = 0;

    EnrollmentStage stage() const;
    bool canReapply() const { return decided && !acceptedByTeachers && !enrolled; }
};

struct CompletionResult {
    std::vector<Payout> payouts;
    Amount distributed = 0;
    Amount residue = 0;
};

class EnrollmentWorkflow {
public:
    EnrollmentWorkflow(EngineContext ctx, const CourseCatalog& catalog, Treasury& treasury);

    Result<void> apply(const Account& student, uint64_t courseId);
    Result<void> teacherVote(const Account& teacher, uint64_t courseId, const Account& student, bool accept);
    Result<void> confirm(const Account& student, uint64_t courseId);
    Result<CompletionResult> complete(const Account& caller, uint64_t courseId, const Account& student);

    bool isEnrolled(uint64_t courseId, const Account& student) const;
    std::optional<EnrollmentRequest> get(uint64_t courseId, const Account& student) const;
    std::vector<EnrollmentRequest> list(uint64_t courseId) const;
    std::vector<EnrollmentRequest> all() const;

    Result<void> restore(const std::vector<EnrollmentRequest>& requests);

private:
    using Key = std::pair<uint64_t, Account>;

    EngineContext ctx_;
    const CourseCatalog& catalog_;
    Treasury& treasury_;
    std::map<Key, EnrollmentRequest> requests_;

    EnrollmentRequest* findRequest(uint64_t courseId, const Account& student);
};

}
}
