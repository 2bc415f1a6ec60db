#pragma once

#include "core/context.h"
#include "infrastructure/error_handling.h"
#include <map>
#include <set>
#include <vector>
#include <optional>

namespace coursedao {
namespace core {

enum class ProposalState : uint8_t {
    VOTING = 0,
    CLOSED = 1,
    GRANTED = 2,
    REJECTED = 3
};

const char* proposalStateToString(ProposalState state);

struct Proposal {
    uint64_t id = 0;
    Account candidate;
    Role roleToAdd = Role::NONE;
    Account proposer;
    uint32_t votesFor = 0;
    uint32_t votesAgainst = 0;
    std::set<Account> voted;
    uint64_t start = 0;
    uint64_t end = 0;
    bool executed = false;
    bool granted = false;

    bool isVotingOpen(uint64_t now) const { return now >= start && now <= end; }
    bool isActive(uint64_t now) const { return !executed && now <= end; }
    ProposalState stateAt(uint64_t now) const;
};

// The role whose members vote on admissions into `candidateRole`.
// Students admit Board, Teachers admit Students, Board admits Teachers.
Role electorateFor(Role candidateRole);

struct ProposalBook {
    std::vector<Proposal> proposals;
    uint64_t nextId = 1;
    uint64_t duration = DEFAULT_PROPOSAL_DURATION;
};

class ProposalEngine {
public:
    explicit ProposalEngine(EngineContext ctx, uint64_t duration = DEFAULT_PROPOSAL_DURATION);

    Result<uint64_t> create(const Account& proposer, const Account& candidate, Role role);
    Result<void> vote(const Account& voter, uint64_t id, bool support);
    // Returns whether the role was granted.
    Result<bool> execute(const Account& caller, uint64_t id);

    uint64_t duration() const { return duration_; }
    Result<void> setDuration(uint64_t seconds);

    std::optional<Proposal> get(uint64_t id) const;
    std::vector<Proposal> list() const;
    std::optional<uint64_t> activeProposalOf(const Account& candidate) const;
    size_t size() const { return proposals_.size(); }

    ProposalBook exportState() const;
    Result<void> restore(const ProposalBook& book);

private:
    EngineContext ctx_;
    std::map<uint64_t, Proposal> proposals_;
    std::map<Account, uint64_t> activeByCandidate_;
    uint64_t nextId_ = 1;
    uint64_t duration_;
};

}
}
