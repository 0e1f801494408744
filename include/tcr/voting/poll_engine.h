// TCR - Commit-Reveal Poll Engine
// Copyright (c) 2024 TCR Developers
// MIT License
//
// Runs stake-weighted commit-reveal polls.
//
// Timeline of a poll (all bounds absolute, compared with util::GetTime()):
//   [start, commitEndDate)          commit stage
//   [commitEndDate, revealEndDate)  reveal stage
//   revealEndDate onwards           ended; outcome immutable
//
// A voter commits H(choice, salt) and locks tokens from their voting
// rights; revealing (choice, salt) adds the tokens to votesFor (choice 1)
// or votesAgainst (any other choice) and releases the lock. Unrevealed
// commitments never count toward either side.
//
// Each voter's unrevealed commitments form a list ordered by token count.
// Committing takes the id of the poll to insert after (0 = head) so the
// position can be checked instead of searched.

#ifndef TCR_VOTING_POLL_ENGINE_H
#define TCR_VOTING_POLL_ENGINE_H

#include "tcr/core/status.h"
#include "tcr/core/types.h"

#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace tcr {

namespace crypto { class Hasher; }
namespace events { class EventLog; }

namespace voting {

class VotingRights;

/// Quorum that makes "passed" mean a strict majority for
constexpr uint64_t DEFAULT_VOTE_QUORUM = 50;

/// Choice that counts toward votesFor
constexpr VoteChoice VOTE_FOR = 1;

/// Conventional choice that counts toward votesAgainst
constexpr VoteChoice VOTE_AGAINST = 0;

/// One voter's participation in a poll
struct VoteRecord {
    Hash256 commitHash;
    Amount numTokens{0};
    bool revealed{false};
    VoteChoice choice{0};
};

struct Poll {
    PollId id{0};
    uint64_t voteQuorum{DEFAULT_VOTE_QUORUM};
    Timestamp commitEndDate{0};
    Timestamp revealEndDate{0};
    Amount votesFor{0};
    Amount votesAgainst{0};
    std::map<Address, VoteRecord> votes;
};

class PollEngine {
public:
    PollEngine(std::shared_ptr<VotingRights> rights,
               std::shared_ptr<crypto::Hasher> hasher,
               std::shared_ptr<events::EventLog> eventLog = nullptr);

    // ========================================================================
    // Poll lifecycle
    // ========================================================================

    /**
     * Start a poll; ids start at 1 and strictly increase.
     * Overflow if a stage would end past the last representable timestamp.
     */
    Status StartPoll(const Address& creator, uint64_t voteQuorum,
                     uint64_t commitDuration, uint64_t revealDuration, PollId* pollId);

    /**
     * Commit a hidden vote.
     *
     * @param prevPollId Poll after which this commitment sorts in the
     *        voter's list (see GetInsertPointForNumTokens), 0 for the head
     */
    Status CommitVote(const Address& voter, PollId pollId, const Hash256& secretHash,
                      Amount numTokens, PollId prevPollId);

    /// Hint for CommitVote that keeps the voter's list ordered
    PollId GetInsertPointForNumTokens(const Address& voter, Amount numTokens,
                                      PollId pollId) const;

    /// Reveal a committed vote
    Status RevealVote(const Address& voter, PollId pollId, VoteChoice choice, Salt salt);

    /// Release the lock of a commitment that was never revealed
    Status RescueTokens(const Address& voter, PollId pollId);

    // ========================================================================
    // Outcome
    // ========================================================================

    /// 100 * votesFor > voteQuorum * (votesFor + votesAgainst); ended polls only
    Status IsPassed(PollId pollId, bool* passed) const;

    /// Voter's weight if they revealed the winning choice with this salt
    Status GetNumPassingTokens(const Address& voter, PollId pollId, Salt salt,
                               Amount* tokens) const;

    /// votesFor if passed, votesAgainst otherwise
    Status GetTotalNumberOfTokensForWinningOption(PollId pollId, Amount* tokens) const;

    // ========================================================================
    // Queries
    // ========================================================================

    bool PollExists(PollId pollId) const;
    bool CommitPeriodActive(PollId pollId) const;
    bool RevealPeriodActive(PollId pollId) const;
    bool PollEnded(PollId pollId) const;

    bool DidCommit(const Address& voter, PollId pollId) const;
    bool DidReveal(const Address& voter, PollId pollId) const;

    /// Null hash if the voter never committed
    Hash256 GetCommitHash(const Address& voter, PollId pollId) const;

    Amount GetNumTokens(const Address& voter, PollId pollId) const;

    std::optional<Poll> GetPoll(PollId pollId) const;

    /// Voter's unrevealed commitments, ascending by token count
    std::vector<PollId> GetCommitments(const Address& voter) const;

    const crypto::Hasher& GetHasher() const { return *hasher_; }

private:
    const VoteRecord* FindVote(const Address& voter, PollId pollId) const;

    /// Remove pollId from the voter's ordered list
    void RemoveCommitment(const Address& voter, PollId pollId);

    std::shared_ptr<VotingRights> rights_;
    std::shared_ptr<crypto::Hasher> hasher_;
    std::shared_ptr<events::EventLog> eventLog_;

    std::map<PollId, Poll> polls_;
    std::map<Address, std::vector<PollId>> commitments_;
    PollId nextPollId_{1};
};

} // namespace voting
} // namespace tcr

#endif // TCR_VOTING_POLL_ENGINE_H
