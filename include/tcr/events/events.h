// TCR - Protocol Events
// Copyright (c) 2024 TCR Developers
// MIT License
//
// Every observable state change of the token, poll engine, registry,
// parameterizer and bank is recorded as an event. Events carry the ids
// needed to correlate them (listing hash, challenge id, poll id,
// proposal id, account) and are stamped with the protocol clock.

#ifndef TCR_EVENTS_EVENTS_H
#define TCR_EVENTS_EVENTS_H

#include "tcr/core/types.h"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tcr {
namespace events {

// ============================================================================
// Token
// ============================================================================

struct Transfer {
    Address from;
    Address to;
    Amount amount{0};
};

struct Approval {
    Address owner;
    Address spender;
    Amount amount{0};
};

// ============================================================================
// Poll Engine
// ============================================================================

struct PollCreated {
    PollId pollId{0};
    uint64_t voteQuorum{0};
    Timestamp commitEndDate{0};
    Timestamp revealEndDate{0};
    Address creator;
};

struct VoteCommitted {
    PollId pollId{0};
    Amount numTokens{0};
    Address voter;
};

struct VoteRevealed {
    PollId pollId{0};
    Amount numTokens{0};
    Amount votesFor{0};
    Amount votesAgainst{0};
    VoteChoice choice{0};
    Address voter;
};

struct VotingRightsGranted {
    Amount numTokens{0};
    Address voter;
};

struct VotingRightsWithdrawn {
    Amount numTokens{0};
    Address voter;
};

struct TokensRescued {
    PollId pollId{0};
    Address voter;
};

// ============================================================================
// Registry
// ============================================================================

struct Application {
    ListingHash listing;
    Amount deposit{0};
    Timestamp appEndDate{0};
    std::string data;
    Address applicant;
};

struct ChallengeCreated {
    ListingHash listing;
    ChallengeId challengeId{0};
    std::string data;
    Timestamp commitEndDate{0};
    Timestamp revealEndDate{0};
    Address challenger;
};

struct DepositMade {
    ListingHash listing;
    Amount added{0};
    Amount newTotal{0};
    Address owner;
};

struct WithdrawalMade {
    ListingHash listing;
    Amount withdrew{0};
    Amount newTotal{0};
    Address owner;
};

struct ApplicationWhitelisted {
    ListingHash listing;
};

struct ApplicationRemoved {
    ListingHash listing;
};

struct ListingRemoved {
    ListingHash listing;
};

struct ListingWithdrawn {
    ListingHash listing;
    Address owner;
};

struct TouchAndRemoved {
    ListingHash listing;
};

struct ChallengeFailed {
    ListingHash listing;
    ChallengeId challengeId{0};
    Amount rewardPool{0};
    Amount totalTokens{0};
};

struct ChallengeSucceeded {
    ListingHash listing;
    ChallengeId challengeId{0};
    Amount rewardPool{0};
    Amount totalTokens{0};
};

struct RewardClaimed {
    ChallengeId challengeId{0};
    Amount reward{0};
    Address voter;
};

// ============================================================================
// Parameterizer
// ============================================================================

struct ReparameterizationProposal {
    std::string name;
    uint64_t value{0};
    Hash256 propId;
    Amount deposit{0};
    Timestamp appEndDate{0};
    Address proposer;
};

struct NewChallenge {
    Hash256 propId;
    ChallengeId challengeId{0};
    Timestamp commitEndDate{0};
    Timestamp revealEndDate{0};
    Address challenger;
};

struct ProposalAccepted {
    Hash256 propId;
    std::string name;
    uint64_t value{0};
};

struct ProposalExpired {
    Hash256 propId;
};

struct ParamChallengeSucceeded {
    Hash256 propId;
    ChallengeId challengeId{0};
    Amount rewardPool{0};
    Amount totalTokens{0};
};

struct ParamChallengeFailed {
    Hash256 propId;
    ChallengeId challengeId{0};
    Amount rewardPool{0};
    Amount totalTokens{0};
};

struct ParamRewardClaimed {
    ChallengeId challengeId{0};
    Amount reward{0};
    Address voter;
};

// ============================================================================
// Bank
// ============================================================================

struct EpochSnapshot {
    EpochNumber epoch{0};
    Amount totalTokens{0};
};

struct VoterTokensRecorded {
    EpochNumber epoch{0};
    Address voter;
    Amount tokens{0};
};

// ============================================================================
// Event Log
// ============================================================================

using Event = std::variant<
    Transfer, Approval,
    PollCreated, VoteCommitted, VoteRevealed,
    VotingRightsGranted, VotingRightsWithdrawn, TokensRescued,
    Application, ChallengeCreated, DepositMade, WithdrawalMade,
    ApplicationWhitelisted, ApplicationRemoved, ListingRemoved,
    ListingWithdrawn, TouchAndRemoved, ChallengeFailed, ChallengeSucceeded,
    RewardClaimed,
    ReparameterizationProposal, NewChallenge, ProposalAccepted, ProposalExpired,
    ParamChallengeSucceeded, ParamChallengeFailed, ParamRewardClaimed,
    EpochSnapshot, VoterTokensRecorded>;

/// Event as recorded: payload plus emission time
struct EventRecord {
    uint64_t sequence{0};
    Timestamp timestamp{0};
    Event event;
};

/// Short event name ("Application", "RewardClaimed", ...)
std::string EventName(const Event& event);

/// Single-line rendering with every field
std::string ToString(const Event& event);

/**
 * Append-only, ordered record of emitted events.
 *
 * Subscribers are invoked synchronously on every Emit, in subscription order.
 */
class EventLog {
public:
    using Callback = std::function<void(const EventRecord&)>;
    using SubscriptionId = uint64_t;

    /// Stamp with the protocol clock, record and notify subscribers
    void Emit(Event event);

    SubscriptionId Subscribe(Callback callback);
    void Unsubscribe(SubscriptionId id);

    const std::vector<EventRecord>& Records() const { return records_; }
    size_t Size() const { return records_.size(); }
    void Clear() { records_.clear(); }

    /// All payloads of type T, in emission order
    template<typename T>
    std::vector<T> Find() const {
        std::vector<T> out;
        for (const auto& record : records_) {
            if (const T* ev = std::get_if<T>(&record.event)) {
                out.push_back(*ev);
            }
        }
        return out;
    }

    template<typename T>
    size_t Count() const {
        size_t n = 0;
        for (const auto& record : records_) {
            if (std::holds_alternative<T>(record.event)) ++n;
        }
        return n;
    }

    /// Most recent payload of type T
    template<typename T>
    std::optional<T> Last() const {
        for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
            if (const T* ev = std::get_if<T>(&it->event)) {
                return *ev;
            }
        }
        return std::nullopt;
    }

private:
    std::vector<EventRecord> records_;
    std::map<SubscriptionId, Callback> subscribers_;
    SubscriptionId nextSubscription_{1};
    uint64_t nextSequence_{1};
};

} // namespace events
} // namespace tcr

#endif // TCR_EVENTS_EVENTS_H
