#include "core/organization.h"
#include "core/roles.h"
#include "core/treasury.h"
#include "utils/config.h"
#include "utils/logger.h"
#include <mutex>

namespace coursedao {
namespace core {

OrganizationConfig OrganizationConfig::fromSettings(const utils::OrganizationSettings& settings) {
    OrganizationConfig cfg;
    cfg.treasuryAccount = settings.treasuryAccount;
    cfg.proposalDuration = settings.proposalDuration;
    cfg.defaultRatingWeight = settings.defaultRatingWeight;
    return cfg;
}

struct Organization::Impl {
    const Clock& clock;
    Account owner;
    NotificationBus bus;
    RoleRegistry roles;
    Treasury treasury;
    ProposalEngine proposals;
    CourseCatalog catalog;
    EnrollmentWorkflow enrollment;
    RatingLedger ratings;
    mutable std::mutex mtx;

    Impl(const Account& ownerAccount, TokenLedger& paymentToken, const Clock& clk,
         const OrganizationConfig& config)
        : clock(clk),
          owner(ownerAccount),
          treasury(paymentToken, config.treasuryAccount),
          proposals(context(), config.proposalDuration),
          catalog(context()),
          enrollment(context(), catalog, treasury),
          ratings(context(), catalog, enrollment, treasury, config.defaultRatingWeight) {}

    EngineContext context() { return EngineContext{roles, clock, bus, owner}; }

    template<typename T>
    Result<T> track(const char* op, const Account& caller, Result<T> result) const {
        if (result.failed()) {
            LOG_CAT(DEBUG, "organization", std::string(op) + " rejected for " +
                    utils::Logger::redactAddress(caller) + ": " + errorName(result.code()) +
                    " (" + result.error().message + ")");
        }
        return result;
    }

    OrganizationState capture() const {
        OrganizationState state;
        state.owner = owner;
        state.treasuryAccount = treasury.account();
        state.roles = roles.entries();
        state.proposals = proposals.exportState();
        state.courses = catalog.exportState();
        state.enrollments = enrollment.all();
        state.ratings = ratings.entries();
        return state;
    }

    Result<void> apply(const OrganizationState& state) {
        auto r = roles.restore(state.roles);
        if (r.failed()) return r;
        r = catalog.restore(state.courses);
        if (r.failed()) return r;
        r = proposals.restore(state.proposals);
        if (r.failed()) return r;
        r = enrollment.restore(state.enrollments);
        if (r.failed()) return r;
        return ratings.restore(state.ratings);
    }
};

Organization::Organization(const Account& owner, const std::vector<Account>& board,
                           TokenLedger& paymentToken, const Clock& clock,
                           const OrganizationConfig& config) {
    if (isZeroAccount(owner)) {
        throwIfError(makeError(ErrorCode::INVALID_ACCOUNT, "organization owner is the zero account"));
    }
    if (isZeroAccount(config.treasuryAccount)) {
        throwIfError(makeError(ErrorCode::INVALID_ACCOUNT, "treasury account is the zero account"));
    }
    if (config.proposalDuration == 0) {
        throwIfError(makeError(ErrorCode::INVALID_DURATION, "proposal duration must be positive"));
    }

    impl_ = std::make_unique<Impl>(owner, paymentToken, clock, config);
    auto seeded = impl_->roles.seed(board);
    if (seeded.failed()) throwIfError(seeded.error());

    LOG_CAT(INFO, "organization", "organization of " + utils::Logger::redactAddress(owner) + " started with " +
            std::to_string(board.size()) + " board member(s), treasury " + config.treasuryAccount +
            " in " + paymentToken.symbol());
}

Organization::~Organization() = default;

NotificationBus& Organization::notifications() {
    return impl_->bus;
}

void Organization::attachToken(TokenLedger& token) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->treasury.attachToken(token);
}

Result<uint64_t> Organization::createAdmissionProposal(const Account& caller, const Account& candidate, Role role) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->track("createAdmissionProposal", caller, impl_->proposals.create(caller, candidate, role));
}

Result<void> Organization::castVote(const Account& caller, uint64_t proposalId, bool support) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->track("castVote", caller, impl_->proposals.vote(caller, proposalId, support));
}

Result<bool> Organization::executeProposal(const Account& caller, uint64_t proposalId) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->track("executeProposal", caller, impl_->proposals.execute(caller, proposalId));
}

Result<uint64_t> Organization::createCourse(const Account& caller, const std::string& title, Amount price,
                                            const std::vector<Account>& teachers,
                                            const std::vector<uint32_t>& shares) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->track("createCourse", caller, impl_->catalog.create(caller, title, price, teachers, shares));
}

Result<void> Organization::removeCourse(const Account& caller, uint64_t courseId) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->track("removeCourse", caller, impl_->catalog.remove(caller, courseId));
}

Result<void> Organization::applyToCourse(const Account& caller, uint64_t courseId) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->track("applyToCourse", caller, impl_->enrollment.apply(caller, courseId));
}

Result<void> Organization::teacherVoteOnEnrollment(const Account& caller, uint64_t courseId,
                                                   const Account& student, bool support) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->track("teacherVoteOnEnrollment", caller,
                        impl_->enrollment.teacherVote(caller, courseId, student, support));
}

Result<void> Organization::confirmEnrollment(const Account& caller, uint64_t courseId) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->track("confirmEnrollment", caller, impl_->enrollment.confirm(caller, courseId));
}

Result<CompletionResult> Organization::completeCourseAndDistribute(const Account& caller, uint64_t courseId,
                                                                   const Account& student) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->track("completeCourseAndDistribute", caller,
                        impl_->enrollment.complete(caller, courseId, student));
}

Result<void> Organization::giveRating(const Account& caller, uint64_t courseId, const Account& teacher,
                                      uint8_t value) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->track("giveRating", caller, impl_->ratings.rate(caller, courseId, teacher, value));
}

Result<BonusResult> Organization::distributeBonusByRating(const Account& caller, uint64_t courseId, Amount amount) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->track("distributeBonusByRating", caller,
                        impl_->ratings.distributeBonus(caller, courseId, amount));
}

Result<void> Organization::boardPayout(const Account& caller, const Account& to, Amount amount) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    Result<void> result;
    if (!impl_->roles.hasRole(caller, Role::BOARD)) {
        result = makeError(ErrorCode::NOT_BOARD, "only board members pay out of the treasury");
    } else if (isZeroAccount(to)) {
        result = makeError(ErrorCode::INVALID_ACCOUNT, "payout recipient is the zero account");
    } else if (amount == 0) {
        result = makeError(ErrorCode::ZERO_AMOUNT, "payout amount is zero");
    } else {
        result = impl_->treasury.pay(to, amount);
    }
    if (result.ok()) {
        impl_->bus.publish(NotificationType::TREASURY_PAYOUT, impl_->clock.now(), {
            {"to", to},
            {"amount", std::to_string(amount)},
            {"by", caller}
        });
    }
    return impl_->track("boardPayout", caller, result);
}

Result<void> Organization::setProposalDuration(const Account& caller, uint64_t seconds) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    Result<void> result;
    if (caller != impl_->owner) {
        result = makeError(ErrorCode::NOT_OWNER, "only the owner changes the proposal duration");
    } else {
        result = impl_->proposals.setDuration(seconds);
    }
    if (result.ok()) {
        LOG_CAT(INFO, "organization", "proposal duration set to " + std::to_string(seconds) + "s");
        impl_->bus.publish(NotificationType::PROPOSAL_DURATION_CHANGED, impl_->clock.now(), {
            {"seconds", std::to_string(seconds)}
        });
    }
    return impl_->track("setProposalDuration", caller, result);
}

Result<void> Organization::rescueFunds(const Account& caller, const std::string& token, const Account& to,
                                       Amount amount) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    Result<void> result;
    if (caller != impl_->owner) {
        result = makeError(ErrorCode::NOT_OWNER, "only the owner rescues funds");
    } else if (!impl_->treasury.hasToken(token)) {
        result = makeError(ErrorCode::UNKNOWN_TOKEN, "no ledger attached for " + token);
    } else if (isZeroAccount(to)) {
        result = makeError(ErrorCode::INVALID_ACCOUNT, "rescue recipient is the zero account");
    } else if (amount == 0) {
        result = makeError(ErrorCode::ZERO_AMOUNT, "rescue amount is zero");
    } else {
        result = impl_->treasury.payToken(token, to, amount);
    }
    if (result.ok()) {
        LOG_CAT(WARN, "organization", "rescued " + std::to_string(amount) + " " + token + " to " +
                utils::Logger::redactAddress(to));
        impl_->bus.publish(NotificationType::FUNDS_RESCUED, impl_->clock.now(), {
            {"token", token},
            {"to", to},
            {"amount", std::to_string(amount)}
        });
    }
    return impl_->track("rescueFunds", caller, result);
}

Role Organization::roleOf(const Account& account) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->roles.roleOf(account);
}

std::vector<Account> Organization::members(Role role) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->roles.members(role);
}

std::optional<Proposal> Organization::getProposal(uint64_t id) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->proposals.get(id);
}

std::vector<Proposal> Organization::listProposals() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->proposals.list();
}

std::optional<uint64_t> Organization::activeProposalOf(const Account& candidate) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->proposals.activeProposalOf(candidate);
}

std::optional<Course> Organization::getCourse(uint64_t id) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->catalog.get(id);
}

std::vector<Course> Organization::listCourses(bool includeRemoved) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->catalog.list(includeRemoved);
}

std::optional<EnrollmentRequest> Organization::getEnrollment(uint64_t courseId, const Account& student) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->enrollment.get(courseId, student);
}

std::vector<EnrollmentRequest> Organization::listEnrollments(uint64_t courseId) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->enrollment.list(courseId);
}

uint8_t Organization::ratingOf(uint64_t courseId, const Account& student, const Account& teacher) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->ratings.ratingOf(courseId, student, teacher);
}

TeacherRatingStats Organization::teacherStats(const Account& teacher) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->ratings.statsOf(teacher);
}

uint64_t Organization::teacherWeight(const Account& teacher) const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->ratings.weightOf(teacher);
}

uint64_t Organization::proposalDuration() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->proposals.duration();
}

const Account& Organization::owner() const {
    return impl_->owner;
}

const Account& Organization::treasuryAccount() const {
    return impl_->treasury.account();
}

std::string Organization::paymentToken() const {
    return impl_->treasury.paymentSymbol();
}

Amount Organization::treasuryBalance() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->treasury.balance();
}

uint64_t Organization::now() const {
    return impl_->clock.now();
}

OrganizationState Organization::snapshot() const {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->capture();
}

Result<void> Organization::restore(const OrganizationState& state) {
    std::lock_guard<std::mutex> lock(impl_->mtx);
    if (state.owner != impl_->owner || state.treasuryAccount != impl_->treasury.account()) {
        return makeError(ErrorCode::SERIALIZATION_ERROR, "stored state belongs to another organization",
                         state.owner);
    }

    OrganizationState previous = impl_->capture();
    auto result = impl_->apply(state);
    if (result.failed()) {
        // Roll back to the state held before the attempt.
        auto rollback = impl_->apply(previous);
        if (rollback.failed()) {
            LOG_CAT(ERROR, "organization", "rollback after failed restore failed: " + rollback.error().message);
        }
        return result;
    }

    LOG_CAT(INFO, "organization", "restored " + std::to_string(state.roles.size()) + " members, " +
            std::to_string(state.proposals.proposals.size()) + " proposals, " +
            std::to_string(state.courses.courses.size()) + " courses");
    return result;
}

}
}
