// TCR - Parameterizer
// Copyright (c) 2024 TCR Developers
// MIT License
//
// Holds the governed parameters and changes them through challengeable
// proposals.
//
// A proposal escrows pMinDeposit. Unchallenged, it can be applied once its
// application stage ends. Challenged, a poll with pVoteQuorum decides it:
// passed applies the value and pays the proposer, failed pays the
// challenger. A proposal nobody processes before processBy expires and its
// deposit is refunded.

#ifndef TCR_GOVERNANCE_PARAMETERIZER_H
#define TCR_GOVERNANCE_PARAMETERIZER_H

#include "tcr/core/status.h"
#include "tcr/core/types.h"
#include "tcr/registry/params.h"

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

namespace governance {

/// Grace period after the reveal stage in which a proposal can still be processed
constexpr int64_t PROCESS_BY_WINDOW = 604800;

struct ParamProposal {
    Hash256 id;
    std::string name;
    uint64_t value{0};
    Address owner;
    Amount deposit{0};
    Timestamp appExpiry{0};
    Timestamp processBy{0};
    ChallengeId challengeId{0};   // 0 = unchallenged
};

struct ParamChallenge {
    ChallengeId id{0};
    Hash256 propId;
    Address challenger;
    Amount rewardPool{0};
    Amount stake{0};
    bool resolved{false};
    Amount winningTokens{0};
    std::set<Address> tokenClaims;
};

class Parameterizer : public registry::ParameterSource {
public:
    /**
     * @param address Account proposal and challenge deposits are escrowed in
     */
    Parameterizer(std::shared_ptr<token::TokenLedger> token,
                  std::shared_ptr<voting::PollEngine> voting,
                  std::shared_ptr<bank::Bank> bank,
                  const registry::ParamDefaults& defaults,
                  const Address& address,
                  std::shared_ptr<events::EventLog> eventLog = nullptr);

    // ========================================================================
    // Proposals
    // ========================================================================

    /// Propose name := value, escrowing pMinDeposit from the sender
    Status ProposeReparameterization(const Address& sender, const std::string& name,
                                     uint64_t value, Hash256* propId);

    /// Challenge a proposal still in its application stage
    Status ChallengeReparameterization(const Address& sender, const Hash256& propId,
                                       ChallengeId* challengeId);

    /// Apply, resolve or expire a proposal; InvalidPhase if none applies yet
    Status ProcessProposal(const Address& sender, const Hash256& propId);

    // ========================================================================
    // Voter rewards
    // ========================================================================

    Status ClaimReward(const Address& sender, ChallengeId challengeId, Salt salt);

    Status VoterReward(const Address& voter, ChallengeId challengeId, Salt salt,
                       Amount* reward) const;

    /// Amount the winner of an ended, unresolved challenge receives
    Status ChallengeWinnerReward(ChallengeId challengeId, Amount* reward) const;

    // ========================================================================
    // Queries
    // ========================================================================

    uint64_t Get(const std::string& name) const override;

    bool CanBeSet(const Hash256& propId) const;
    bool PropExists(const Hash256& propId) const;
    bool ChallengeCanBeResolved(const Hash256& propId) const;
    bool TokenClaims(ChallengeId challengeId, const Address& voter) const;

    std::optional<ParamProposal> GetProposal(const Hash256& propId) const;
    std::optional<ParamChallenge> GetChallenge(ChallengeId challengeId) const;

    const Address& GetAddress() const { return address_; }

private:
    using Payments = std::vector<std::pair<Address, Amount>>;

    Status PayOut(const Payments& payments);
    Status ResolveChallenge(const ParamProposal& proposal);
    void Set(const std::string& name, uint64_t value);

    Status ComputeVoterReward(const Address& voter, const ParamChallenge& challenge,
                              Salt salt, Amount* voterTokens, Amount* reward) const;

    std::shared_ptr<token::TokenLedger> token_;
    std::shared_ptr<voting::PollEngine> voting_;
    std::shared_ptr<bank::Bank> bank_;
    Address address_;
    std::shared_ptr<events::EventLog> eventLog_;

    std::map<std::string, uint64_t> params_;
    std::map<Hash256, ParamProposal> proposals_;
    std::map<ChallengeId, ParamChallenge> challenges_;
};

} // namespace governance
} // namespace tcr

#endif // TCR_GOVERNANCE_PARAMETERIZER_H
