#include "core/proposals.h"
#include "utils/logger.h"
#include <limits>

namespace coursedao {
namespace core {

const char* proposalStateToString(ProposalState state) {
    switch (state) {
        case ProposalState::VOTING: return "VOTING";
        case ProposalState::CLOSED: return "CLOSED";
        case ProposalState::GRANTED: return "GRANTED";
        case ProposalState::REJECTED: return "REJECTED";
        default: return "UNKNOWN";
    }
}

ProposalState Proposal::stateAt(uint64_t now) const {
    if (executed) return granted ? ProposalState::GRANTED : ProposalState::REJECTED;
    return now <= end ? ProposalState::VOTING : ProposalState::CLOSED;
}

Role electorateFor(Role candidateRole) {
    switch (candidateRole) {
        case Role::BOARD: return Role::STUDENT;
        case Role::TEACHER: return Role::BOARD;
        case Role::STUDENT: return Role::TEACHER;
        default: return Role::NONE;
    }
}

ProposalEngine::ProposalEngine(EngineContext ctx, uint64_t duration)
    : ctx_(ctx), duration_(duration) {}

Result<uint64_t> ProposalEngine::create(const Account& proposer, const Account& candidate, Role role) {
    if (isZeroAccount(candidate)) {
        return makeError(ErrorCode::INVALID_CANDIDATE, "candidate is the zero account");
    }
    if (!isMemberRole(role)) {
        return makeError(ErrorCode::INVALID_ROLE, std::string("cannot propose role ") + roleToString(role));
    }

    uint64_t now = ctx_.clock.now();
    auto active = activeByCandidate_.find(candidate);
    if (active != activeByCandidate_.end()) {
        const Proposal& prior = proposals_.at(active->second);
        if (prior.isActive(now)) {
            return makeError(ErrorCode::DUPLICATE_ACTIVE_PROPOSAL,
                             "proposal " + std::to_string(prior.id) + " is still open for candidate");
        }
    }
    if (ctx_.roles.roleOf(candidate) == role) {
        return makeError(ErrorCode::ALREADY_HAS_ROLE,
                         std::string("candidate already is ") + roleToString(role));
    }

    Proposal p;
    p.id = nextId_++;
    p.candidate = candidate;
    p.roleToAdd = role;
    p.proposer = proposer;
    p.start = now;
    p.end = now > std::numeric_limits<uint64_t>::max() - duration_
          ? std::numeric_limits<uint64_t>::max() : now + duration_;

    proposals_[p.id] = p;
    activeByCandidate_[candidate] = p.id;

    LOG_CAT(INFO, "proposals", "proposal " + std::to_string(p.id) + " admits " +
            utils::Logger::redactAddress(candidate) + " as " + roleToString(role) +
            ", voting until " + std::to_string(p.end));

    ctx_.bus.publish(NotificationType::PROPOSAL_CREATED, now, {
        {"id", std::to_string(p.id)},
        {"candidate", candidate},
        {"role", roleToString(role)},
        {"proposer", proposer},
        {"start", std::to_string(p.start)},
        {"end", std::to_string(p.end)}
    });
    return p.id;
}

Result<void> ProposalEngine::vote(const Account& voter, uint64_t id, bool support) {
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return makeError(ErrorCode::NO_SUCH_PROPOSAL, "proposal " + std::to_string(id) + " does not exist");
    }
    Proposal& p = it->second;

    uint64_t now = ctx_.clock.now();
    if (!p.isVotingOpen(now)) {
        return makeError(ErrorCode::VOTING_CLOSED, "voting window is [" + std::to_string(p.start) +
                         ", " + std::to_string(p.end) + "]");
    }

    Role electorate = electorateFor(p.roleToAdd);
    if (!ctx_.roles.hasRole(voter, electorate)) {
        return makeError(ErrorCode::NOT_IN_ELECTORATE,
                         std::string("only ") + roleToString(electorate) + " members vote on " +
                         roleToString(p.roleToAdd) + " admissions");
    }
    if (p.voted.count(voter)) {
        return makeError(ErrorCode::DUPLICATE_VOTE, "already voted on proposal " + std::to_string(id));
    }

    p.voted.insert(voter);
    if (support) {
        p.votesFor++;
    } else {
        p.votesAgainst++;
    }

    LOG_CAT(DEBUG, "proposals", "proposal " + std::to_string(id) + " now " +
            std::to_string(p.votesFor) + " for / " + std::to_string(p.votesAgainst) + " against");

    ctx_.bus.publish(NotificationType::PROPOSAL_VOTED, now, {
        {"id", std::to_string(id)},
        {"voter", voter},
        {"support", support ? "true" : "false"},
        {"votesFor", std::to_string(p.votesFor)},
        {"votesAgainst", std::to_string(p.votesAgainst)}
    });
    return {};
}

Result<bool> ProposalEngine::execute(const Account& caller, uint64_t id) {
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return makeError(ErrorCode::NO_SUCH_PROPOSAL, "proposal " + std::to_string(id) + " does not exist");
    }
    Proposal& p = it->second;

    uint64_t now = ctx_.clock.now();
    if (now <= p.end) {
        return makeError(ErrorCode::VOTING_STILL_OPEN, "voting ends at " + std::to_string(p.end));
    }
    if (p.executed) {
        return makeError(ErrorCode::ALREADY_EXECUTED, "proposal " + std::to_string(id) + " was already executed");
    }

    // Strict majority of votes cast; no votes or a tie rejects.
    bool passed = p.votesFor > p.votesAgainst && (p.votesFor + p.votesAgainst) > 0;
    if (passed) {
        auto granted = ctx_.roles.grant(p.candidate, p.roleToAdd);
        if (granted.failed()) return granted.error();
    }

    p.executed = true;
    p.granted = passed;
    auto active = activeByCandidate_.find(p.candidate);
    if (active != activeByCandidate_.end() && active->second == id) {
        activeByCandidate_.erase(active);
    }

    LOG_CAT(INFO, "proposals", "proposal " + std::to_string(id) + (passed ? " granted" : " rejected") +
            " (" + std::to_string(p.votesFor) + "/" + std::to_string(p.votesAgainst) + ")");

    ctx_.bus.publish(NotificationType::PROPOSAL_EXECUTED, now, {
        {"id", std::to_string(id)},
        {"candidate", p.candidate},
        {"role", roleToString(p.roleToAdd)},
        {"granted", passed ? "true" : "false"},
        {"executor", caller}
    });
    if (passed) {
        ctx_.bus.publish(NotificationType::ROLE_GRANTED, now, {
            {"account", p.candidate},
            {"role", roleToString(p.roleToAdd)},
            {"proposal", std::to_string(id)}
        });
    }
    return passed;
}

Result<void> ProposalEngine::setDuration(uint64_t seconds) {
    if (seconds == 0) {
        return makeError(ErrorCode::INVALID_DURATION, "proposal duration must be positive");
    }
    duration_ = seconds;
    return {};
}

std::optional<Proposal> ProposalEngine::get(uint64_t id) const {
    auto it = proposals_.find(id);
    if (it == proposals_.end()) return std::nullopt;
    return it->second;
}

std::vector<Proposal> ProposalEngine::list() const {
    std::vector<Proposal> out;
    out.reserve(proposals_.size());
    for (const auto& [id, p] : proposals_) out.push_back(p);
    return out;
}

std::optional<uint64_t> ProposalEngine::activeProposalOf(const Account& candidate) const {
    auto it = activeByCandidate_.find(candidate);
    if (it == activeByCandidate_.end()) return std::nullopt;
    if (!proposals_.at(it->second).isActive(ctx_.clock.now())) return std::nullopt;
    return it->second;
}

ProposalBook ProposalEngine::exportState() const {
    ProposalBook book;
    book.proposals = list();
    book.nextId = nextId_;
    book.duration = duration_;
    return book;
}

Result<void> ProposalEngine::restore(const ProposalBook& book) {
    if (book.duration == 0) {
        return makeError(ErrorCode::SERIALIZATION_ERROR, "stored proposal duration is zero");
    }
    std::map<uint64_t, Proposal> proposals;
    std::map<Account, uint64_t> active;
    for (const auto& p : book.proposals) {
        if (p.id == 0 || p.id >= book.nextId || proposals.count(p.id)) {
            return makeError(ErrorCode::SERIALIZATION_ERROR, "bad proposal id " + std::to_string(p.id));
        }
        proposals[p.id] = p;
    }
    // The newest unexecuted proposal per candidate carries the marker.
    for (const auto& [id, p] : proposals) {
        if (!p.executed) active[p.candidate] = id;
    }
    proposals_ = std::move(proposals);
    activeByCandidate_ = std::move(active);
    nextId_ = book.nextId;
    duration_ = book.duration;
    return {};
}

}
}
