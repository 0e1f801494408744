// TCR - Protocol Events Implementation
// Copyright (c) 2024 TCR Developers
// MIT License

#include "tcr/events/events.h"
#include "tcr/util/time.h"

#include <sstream>

namespace tcr {
namespace events {

namespace {

/// Renders an event as "Name{field=value ...}"
struct Renderer {
    std::ostringstream& os;

    void operator()(const Transfer& e) const {
        os << "Transfer{from=" << e.from.ToHex() << " to=" << e.to.ToHex()
           << " amount=" << e.amount << "}";
    }
    void operator()(const Approval& e) const {
        os << "Approval{owner=" << e.owner.ToHex() << " spender=" << e.spender.ToHex()
           << " amount=" << e.amount << "}";
    }
    void operator()(const PollCreated& e) const {
        os << "PollCreated{poll=" << e.pollId << " quorum=" << e.voteQuorum
           << " commitEnd=" << e.commitEndDate << " revealEnd=" << e.revealEndDate << "}";
    }
    void operator()(const VoteCommitted& e) const {
        os << "VoteCommitted{poll=" << e.pollId << " tokens=" << e.numTokens
           << " voter=" << e.voter.ToHex() << "}";
    }
    void operator()(const VoteRevealed& e) const {
        os << "VoteRevealed{poll=" << e.pollId << " tokens=" << e.numTokens
           << " choice=" << e.choice << " for=" << e.votesFor
           << " against=" << e.votesAgainst << " voter=" << e.voter.ToHex() << "}";
    }
    void operator()(const VotingRightsGranted& e) const {
        os << "VotingRightsGranted{tokens=" << e.numTokens << " voter=" << e.voter.ToHex() << "}";
    }
    void operator()(const VotingRightsWithdrawn& e) const {
        os << "VotingRightsWithdrawn{tokens=" << e.numTokens << " voter=" << e.voter.ToHex() << "}";
    }
    void operator()(const TokensRescued& e) const {
        os << "TokensRescued{poll=" << e.pollId << " voter=" << e.voter.ToHex() << "}";
    }
    void operator()(const Application& e) const {
        os << "Application{listing=" << e.listing.ToHex() << " deposit=" << e.deposit
           << " appEnd=" << e.appEndDate << " applicant=" << e.applicant.ToHex() << "}";
    }
    void operator()(const ChallengeCreated& e) const {
        os << "ChallengeCreated{listing=" << e.listing.ToHex() << " challenge=" << e.challengeId
           << " commitEnd=" << e.commitEndDate << " revealEnd=" << e.revealEndDate
           << " challenger=" << e.challenger.ToHex() << "}";
    }
    void operator()(const DepositMade& e) const {
        os << "DepositMade{listing=" << e.listing.ToHex() << " added=" << e.added
           << " total=" << e.newTotal << "}";
    }
    void operator()(const WithdrawalMade& e) const {
        os << "WithdrawalMade{listing=" << e.listing.ToHex() << " withdrew=" << e.withdrew
           << " total=" << e.newTotal << "}";
    }
    void operator()(const ApplicationWhitelisted& e) const {
        os << "ApplicationWhitelisted{listing=" << e.listing.ToHex() << "}";
    }
    void operator()(const ApplicationRemoved& e) const {
        os << "ApplicationRemoved{listing=" << e.listing.ToHex() << "}";
    }
    void operator()(const ListingRemoved& e) const {
        os << "ListingRemoved{listing=" << e.listing.ToHex() << "}";
    }
    void operator()(const ListingWithdrawn& e) const {
        os << "ListingWithdrawn{listing=" << e.listing.ToHex() << " owner=" << e.owner.ToHex() << "}";
    }
    void operator()(const TouchAndRemoved& e) const {
        os << "TouchAndRemoved{listing=" << e.listing.ToHex() << "}";
    }
    void operator()(const ChallengeFailed& e) const {
        os << "ChallengeFailed{listing=" << e.listing.ToHex() << " challenge=" << e.challengeId
           << " pool=" << e.rewardPool << " totalTokens=" << e.totalTokens << "}";
    }
    void operator()(const ChallengeSucceeded& e) const {
        os << "ChallengeSucceeded{listing=" << e.listing.ToHex() << " challenge=" << e.challengeId
           << " pool=" << e.rewardPool << " totalTokens=" << e.totalTokens << "}";
    }
    void operator()(const RewardClaimed& e) const {
        os << "RewardClaimed{challenge=" << e.challengeId << " reward=" << e.reward
           << " voter=" << e.voter.ToHex() << "}";
    }
    void operator()(const ReparameterizationProposal& e) const {
        os << "ReparameterizationProposal{name=" << e.name << " value=" << e.value
           << " prop=" << e.propId.ToHex() << " deposit=" << e.deposit
           << " appEnd=" << e.appEndDate << "}";
    }
    void operator()(const NewChallenge& e) const {
        os << "NewChallenge{prop=" << e.propId.ToHex() << " challenge=" << e.challengeId
           << " commitEnd=" << e.commitEndDate << " revealEnd=" << e.revealEndDate << "}";
    }
    void operator()(const ProposalAccepted& e) const {
        os << "ProposalAccepted{prop=" << e.propId.ToHex() << " name=" << e.name
           << " value=" << e.value << "}";
    }
    void operator()(const ProposalExpired& e) const {
        os << "ProposalExpired{prop=" << e.propId.ToHex() << "}";
    }
    void operator()(const ParamChallengeSucceeded& e) const {
        os << "ParamChallengeSucceeded{prop=" << e.propId.ToHex() << " challenge=" << e.challengeId
           << " pool=" << e.rewardPool << " totalTokens=" << e.totalTokens << "}";
    }
    void operator()(const ParamChallengeFailed& e) const {
        os << "ParamChallengeFailed{prop=" << e.propId.ToHex() << " challenge=" << e.challengeId
           << " pool=" << e.rewardPool << " totalTokens=" << e.totalTokens << "}";
    }
    void operator()(const ParamRewardClaimed& e) const {
        os << "ParamRewardClaimed{challenge=" << e.challengeId << " reward=" << e.reward
           << " voter=" << e.voter.ToHex() << "}";
    }
    void operator()(const EpochSnapshot& e) const {
        os << "EpochSnapshot{epoch=" << e.epoch << " totalTokens=" << e.totalTokens << "}";
    }
    void operator()(const VoterTokensRecorded& e) const {
        os << "VoterTokensRecorded{epoch=" << e.epoch << " voter=" << e.voter.ToHex()
           << " tokens=" << e.tokens << "}";
    }
};

} // anonymous namespace

std::string ToString(const Event& event) {
    std::ostringstream os;
    std::visit(Renderer{os}, event);
    return os.str();
}

std::string EventName(const Event& event) {
    std::string text = ToString(event);
    return text.substr(0, text.find('{'));
}

// ============================================================================
// EventLog
// ============================================================================

void EventLog::Emit(Event event) {
    EventRecord record;
    record.sequence = nextSequence_++;
    record.timestamp = util::GetTime();
    record.event = std::move(event);
    records_.push_back(record);

    // Callbacks may emit or unsubscribe while we iterate
    auto subscribers = subscribers_;
    for (const auto& [id, callback] : subscribers) {
        callback(record);
    }
}

EventLog::SubscriptionId EventLog::Subscribe(Callback callback) {
    SubscriptionId id = nextSubscription_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
}

void EventLog::Unsubscribe(SubscriptionId id) {
    subscribers_.erase(id);
}

} // namespace events
} // namespace tcr
