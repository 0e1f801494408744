// TCR - Token-Curated Registry
// Copyright (c) 2024 TCR Developers
// MIT License
//
// Listing lifecycle, deposit escrow, challenge settlement and voter rewards.
//
// Listing states:
//   Unlisted -> Applied -> {Whitelisted, Unlisted}
//   Applied | Whitelisted -> Challenged -> {Whitelisted, Unlisted}
//
// A challenge escrows minDeposit from the challenger and locks minDeposit
// of the listing's unstaked deposit, so 2 * minDeposit is at stake. The
// winner of the vote receives 2 * stake - rewardPool; winning voters share
// rewardPool = (100 - dispensationPct)% of the stake in proportion to their
// revealed tokens.
//
// Every mutating call either applies fully or returns a non-OK status and
// changes nothing. Parameter values are read from the ParameterSource at
// call time.

#ifndef TCR_REGISTRY_REGISTRY_H
#define TCR_REGISTRY_REGISTRY_H

#include "tcr/core/status.h"
#include "tcr/core/types.h"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace tcr {

namespace bank { class Bank; }
namespace events { class EventLog; }
namespace token { class TokenLedger; }
namespace voting { class PollEngine; }

namespace registry {

class ParameterSource;

enum class ListingState {
    Unlisted,
    Applied,
    Whitelisted,
    Challenged
};

const char* ListingStateToString(ListingState state);

struct Listing {
    ListingHash id;
    Address owner;
    Amount unstakedDeposit{0};
    Timestamp applicationExpiry{0};
    bool whitelisted{false};
    ChallengeId challengeId{0};   // 0 = never challenged
    std::string data;
};

struct Challenge {
    ChallengeId id{0};            // Same as the poll id
    ListingHash listing;
    Address challenger;
    Amount rewardPool{0};         // Shared by winning voters
    Amount stake{0};              // Put up by each side
    bool resolved{false};
    Amount totalTokens{0};        // Winning tokens, recorded at resolution
    EpochNumber epochNumber{0};
    std::set<Address> tokenClaims;
};

class Registry {
public:
    /**
     * @param address Account the registry escrows deposits in; applicants
     *        and challengers must approve it
     */
    Registry(std::shared_ptr<token::TokenLedger> token,
             std::shared_ptr<voting::PollEngine> voting,
             std::shared_ptr<ParameterSource> params,
             std::shared_ptr<bank::Bank> bank,
             const Address& address,
             std::string name,
             std::shared_ptr<events::EventLog> eventLog = nullptr);

    // ========================================================================
    // Listing lifecycle
    // ========================================================================

    /// Apply with at least minDeposit; matures after applyStageLen
    Status Apply(const Address& sender, const ListingHash& listingHash,
                 Amount amount, const std::string& data);

    /// Owner tops up the unstaked deposit
    Status Deposit(const Address& sender, const ListingHash& listingHash, Amount amount);

    /// Owner withdraws unstaked deposit down to minDeposit
    Status Withdraw(const Address& sender, const ListingHash& listingHash, Amount amount);

    /// Owner removes a whitelisted, unchallenged listing
    Status Exit(const Address& sender, const ListingHash& listingHash);

    // ========================================================================
    // Challenges
    // ========================================================================

    /**
     * Challenge an applied or whitelisted listing.
     *
     * A listing whose unstaked deposit fell below minDeposit is removed
     * instead and *challengeId is set to 0.
     */
    Status Challenge(const Address& sender, const ListingHash& listingHash,
                     const std::string& data, ChallengeId* challengeId);

    /**
     * Advance a listing: whitelist a matured application or resolve an
     * ended challenge. Settled listings are a no-op; anything else is
     * InvalidPhase.
     */
    Status UpdateStatus(const Address& sender, const ListingHash& listingHash);

    /// Resolve the listing's ended challenge; AlreadyResolved on repeat
    Status ResolveChallenge(const Address& sender, const ListingHash& listingHash);

    /// Pay the sender's share of a resolved challenge's reward pool
    Status ClaimReward(const Address& sender, ChallengeId challengeId, Salt salt);

    /// Reward ClaimReward would pay, without paying it
    Status VoterReward(const Address& voter, ChallengeId challengeId, Salt salt,
                       Amount* reward) const;

    /// Amount the winner of an ended, unresolved challenge receives
    Status DetermineReward(ChallengeId challengeId, Amount* reward) const;

    // ========================================================================
    // Queries
    // ========================================================================

    bool IsWhitelisted(const ListingHash& listingHash) const;
    bool AppWasMade(const ListingHash& listingHash) const;

    /// Listing has an unresolved challenge
    bool ChallengeExists(const ListingHash& listingHash) const;

    bool ChallengeCanBeResolved(const ListingHash& listingHash) const;
    bool CanBeWhitelisted(const ListingHash& listingHash) const;

    /// Voter already claimed from the challenge
    bool TokenClaims(ChallengeId challengeId, const Address& voter) const;

    ListingState GetListingState(const ListingHash& listingHash) const;
    std::optional<Listing> GetListing(const ListingHash& listingHash) const;
    std::optional<registry::Challenge> GetChallenge(ChallengeId challengeId) const;

    const Address& GetAddress() const { return address_; }
    const std::string& GetName() const { return name_; }

private:
    using Payments = std::vector<std::pair<Address, Amount>>;

    Status Escrow(const Address& from, Amount amount);
    Status PayOut(const Payments& payments);

    /// Voter's tokens and reward for a resolved challenge
    Status ComputeVoterReward(const Address& voter, const registry::Challenge& challenge,
                              Salt salt, Amount* voterTokens, Amount* reward) const;

    Status Resolve(Listing& listing);
    void Whitelist(Listing& listing);
    Status RemoveListing(const ListingHash& listingHash);

    std::shared_ptr<token::TokenLedger> token_;
    std::shared_ptr<voting::PollEngine> voting_;
    std::shared_ptr<ParameterSource> params_;
    std::shared_ptr<bank::Bank> bank_;
    Address address_;
    std::string name_;
    std::shared_ptr<events::EventLog> eventLog_;

    std::map<ListingHash, Listing> listings_;
    std::map<ChallengeId, registry::Challenge> challenges_;

    /// Latest challenge per listing hash, kept when that challenge removes the listing
    std::map<ListingHash, ChallengeId> lastChallenge_;
};

} // namespace registry
} // namespace tcr

#endif // TCR_REGISTRY_REGISTRY_H
