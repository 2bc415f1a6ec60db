#pragma once

#include "core/types.h"
#include "core/clock.h"
#include "core/notifications.h"
#include "core/proposals.h"
#include "core/courses.h"
#include "core/enrollment.h"
#include "core/ratings.h"
#include "core/token_ledger.h"
#include "infrastructure/error_handling.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace coursedao {
namespace utils { struct OrganizationSettings; }

namespace core {

struct OrganizationConfig {
    Account treasuryAccount = "dao:treasury";
    uint64_t proposalDuration = DEFAULT_PROPOSAL_DURATION;
    uint64_t defaultRatingWeight = DEFAULT_RATING_WEIGHT;

    static OrganizationConfig fromSettings(const utils::OrganizationSettings& settings);
};

// Complete entity state, as persisted by StateStore.
struct OrganizationState {
    Account owner;
    Account treasuryAccount;
    std::vector<std::pair<Account, Role>> roles;
    ProposalBook proposals;
    CourseBook courses;
    std::vector<EnrollmentRequest> enrollments;
    std::vector<RatingEntry> ratings;
};

// Top-level governance engine. Every mutating call names its caller first,
// runs under one lock and either applies fully or returns an error with no
// state change. Notification handlers run inside that lock and must not call
// back into the organization.
class Organization {
public:
    // Throws std::runtime_error on an invalid owner, board seed or config.
    Organization(const Account& owner, const std::vector<Account>& board,
                 TokenLedger& paymentToken, const Clock& clock,
                 const OrganizationConfig& config = OrganizationConfig());
    ~Organization();

    Organization(const Organization&) = delete;
    Organization& operator=(const Organization&) = delete;

    NotificationBus& notifications();
    void attachToken(TokenLedger& token);

    // Governance
    Result<uint64_t> createAdmissionProposal(const Account& caller, const Account& candidate, Role role);
    Result<void> castVote(const Account& caller, uint64_t proposalId, bool support);
    Result<bool> executeProposal(const Account& caller, uint64_t proposalId);

    // Courses
    Result<uint64_t> createCourse(const Account& caller, const std::string& title, Amount price,
                                  const std::vector<Account>& teachers,
                                  const std::vector<uint32_t>& shares);
    Result<void> removeCourse(const Account& caller, uint64_t courseId);

    // Enrollment
    Result<void> applyToCourse(const Account& caller, uint64_t courseId);
    Result<void> teacherVoteOnEnrollment(const Account& caller, uint64_t courseId,
                                         const Account& student, bool support);
    Result<void> confirmEnrollment(const Account& caller, uint64_t courseId);
    Result<CompletionResult> completeCourseAndDistribute(const Account& caller, uint64_t courseId,
                                                         const Account& student);

    // Ratings
    Result<void> giveRating(const Account& caller, uint64_t courseId, const Account& teacher, uint8_t value);
    Result<BonusResult> distributeBonusByRating(const Account& caller, uint64_t courseId, Amount amount);

    // Treasury and administration
    Result<void> boardPayout(const Account& caller, const Account& to, Amount amount);
    Result<void> setProposalDuration(const Account& caller, uint64_t seconds);
    Result<void> rescueFunds(const Account& caller, const std::string& token, const Account& to, Amount amount);

    // Views
    Role roleOf(const Account& account) const;
    std::vector<Account> members(Role role) const;
    std::vector<Account> boards() const { return members(Role::BOARD); }
    std::vector<Account> teachers() const { return members(Role::TEACHER); }
    std::vector<Account> students() const { return members(Role::STUDENT); }

    std::optional<Proposal> getProposal(uint64_t id) const;
    std::vector<Proposal> listProposals() const;
    std::optional<uint64_t> activeProposalOf(const Account& candidate) const;

    std::optional<Course> getCourse(uint64_t id) const;
    std::vector<Course> listCourses(bool includeRemoved = false) const;

    std::optional<EnrollmentRequest> getEnrollment(uint64_t courseId, const Account& student) const;
    std::vector<EnrollmentRequest> listEnrollments(uint64_t courseId) const;

    uint8_t ratingOf(uint64_t courseId, const Account& student, const Account& teacher) const;
    TeacherRatingStats teacherStats(const Account& teacher) const;
    // Bonus weight; the configured default for teachers nobody has rated.
    uint64_t teacherWeight(const Account& teacher) const;

    uint64_t proposalDuration() const;
    const Account& owner() const;
    const Account& treasuryAccount() const;
    std::string paymentToken() const;
    Amount treasuryBalance() const;
    uint64_t now() const;

    OrganizationState snapshot() const;
    Result<void> restore(const OrganizationState& state);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}
}
