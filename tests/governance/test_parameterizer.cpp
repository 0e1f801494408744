// TCR - Parameterizer Tests
// Copyright (c) 2024 TCR Developers
// MIT License

#include <gtest/gtest.h>

#include "tcr/bank/bank.h"
#include "tcr/crypto/hasher.h"
#include "tcr/events/events.h"
#include "tcr/governance/parameterizer.h"
#include "tcr/node/context.h"
#include "tcr/token/token.h"
#include "tcr/util/time.h"
#include "tcr/voting/poll_engine.h"
#include "tcr/voting/voting_rights.h"

#include <cstdint>
#include <memory>

namespace tcr {
namespace governance {
namespace test {

namespace ParamName = registry::ParamName;

// ============================================================================
// Test Collaborators
// ============================================================================

/// Forwards to a real ledger; outgoing transfers can be switched off
class RefusingLedger : public token::TokenLedger {
public:
    explicit RefusingLedger(std::shared_ptr<token::TokenLedger> inner)
        : inner_(std::move(inner)) {}

    bool Transfer(const Address& from, const Address& to, Amount amount) override {
        return !refuseTransfers && inner_->Transfer(from, to, amount);
    }
    bool TransferFrom(const Address& spender, const Address& from,
                      const Address& to, Amount amount) override {
        return inner_->TransferFrom(spender, from, to, amount);
    }
    bool Approve(const Address& owner, const Address& spender, Amount amount) override {
        return inner_->Approve(owner, spender, amount);
    }
    Amount BalanceOf(const Address& account) const override { return inner_->BalanceOf(account); }
    Amount Allowance(const Address& owner, const Address& spender) const override {
        return inner_->Allowance(owner, spender);
    }
    Amount TotalSupply() const override { return inner_->TotalSupply(); }

    bool refuseTransfers{false};

private:
    std::shared_ptr<token::TokenLedger> inner_;
};

// ============================================================================
// Test Fixture
// ============================================================================

class ParameterizerTest : public ::testing::Test {
protected:
    static constexpr Amount START = 1000000000000000ULL;
    static constexpr Timestamp T0 = 1700000000;

    void SetUp() override {
        util::SetMockTime(T0);
        util::EnableMockTime();

        ASSERT_TRUE(node::InitializeContext(ctx_, options_).ok());
        for (const Address& user : {proposer_, challenger_, alice_, bob_}) {
            ASSERT_TRUE(ctx_.token->Transfer(ctx_.deployer, user, START));
            ctx_.token->Approve(user, ctx_.votingAddress, START);
            ctx_.token->Approve(user, ctx_.parameterizerAddress, START);
        }
    }

    void TearDown() override {
        util::DisableMockTime();
    }

    Parameterizer& Params() { return *ctx_.parameterizer; }
    Amount PMinDeposit() const { return options_.params.pMinDeposit; }
    Amount Balance(const Address& account) const { return ctx_.token->BalanceOf(account); }

    Hash256 Propose(const std::string& name, uint64_t value) {
        Hash256 propId;
        EXPECT_TRUE(Params().ProposeReparameterization(proposer_, name, value, &propId).ok());
        return propId;
    }

    ChallengeId ChallengeProposal(const Hash256& propId) {
        ChallengeId id = 0;
        EXPECT_TRUE(Params().ChallengeReparameterization(challenger_, propId, &id).ok());
        return id;
    }

    /// Single voter decides the poll and the poll runs to its end
    void Decide(const Address& voter, ChallengeId id, VoteChoice choice, Salt salt,
                Amount tokens) {
        ASSERT_TRUE(ctx_.votingRights->RequestVotingRights(voter, tokens).ok());
        ASSERT_TRUE(ctx_.voting->CommitVote(voter, id,
                                            crypto::ComputeVoteHash(*ctx_.hasher, choice, salt),
                                            tokens,
                                            ctx_.voting->GetInsertPointForNumTokens(voter, tokens,
                                                                                     id)).ok());
        util::AdvanceMockTime(static_cast<int64_t>(options_.params.pCommitStageLength));
        ASSERT_TRUE(ctx_.voting->RevealVote(voter, id, choice, salt).ok());
        util::AdvanceMockTime(static_cast<int64_t>(options_.params.pRevealStageLength));
    }

    node::TcrInitOptions options_;
    node::TcrContext ctx_;

    Address proposer_ = MakeAddress("proposer");
    Address challenger_ = MakeAddress("challenger");
    Address alice_ = MakeAddress("alice");
    Address bob_ = MakeAddress("bob");
    Address stranger_ = MakeAddress("stranger");
};

// ============================================================================
// Values
// ============================================================================

TEST_F(ParameterizerTest, StartsWithDefaults) {
    for (const auto& [name, value] : options_.params.ToMap()) {
        EXPECT_EQ(Params().Get(name), value) << name;
    }
    EXPECT_EQ(Params().Get("noSuchParam"), 0u);
}

// ============================================================================
// Proposals
// ============================================================================

TEST_F(ParameterizerTest, ProposeEscrowsDeposit) {
    Hash256 propId = Propose(ParamName::VOTE_QUORUM, 51);

    EXPECT_EQ(propId, crypto::ComputeProposalId(*ctx_.hasher, ParamName::VOTE_QUORUM, 51));
    EXPECT_TRUE(Params().PropExists(propId));
    EXPECT_EQ(Balance(proposer_), START - PMinDeposit());
    EXPECT_EQ(Balance(ctx_.parameterizerAddress), PMinDeposit());

    auto proposal = Params().GetProposal(propId);
    ASSERT_TRUE(proposal.has_value());
    EXPECT_EQ(proposal->owner, proposer_);
    EXPECT_EQ(proposal->deposit, PMinDeposit());
    EXPECT_EQ(proposal->appExpiry, T0 + 1200);
    EXPECT_EQ(proposal->processBy, T0 + 1200 + 600 + 600 + PROCESS_BY_WINDOW);

    auto event = ctx_.eventLog->Last<events::ReparameterizationProposal>();
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->name, ParamName::VOTE_QUORUM);
    EXPECT_EQ(event->value, 51u);
}

TEST_F(ParameterizerTest, ProposeRejections) {
    Hash256 propId;
    EXPECT_EQ(Params().ProposeReparameterization(proposer_, "bogus", 1, &propId).code(),
              Status::INVALID_ARGUMENT);
    EXPECT_EQ(Params().ProposeReparameterization(proposer_, ParamName::VOTE_QUORUM, 50,
                                                 &propId).code(),
              Status::INVALID_ARGUMENT);
    EXPECT_EQ(Params().ProposeReparameterization(proposer_, ParamName::DISPENSATION_PCT, 101,
                                                 &propId).code(),
              Status::INVALID_ARGUMENT);
    EXPECT_EQ(Params().ProposeReparameterization(proposer_, ParamName::COMMIT_STAGE_LEN, 0,
                                                 &propId).code(),
              Status::INVALID_ARGUMENT);
    EXPECT_EQ(Params().ProposeReparameterization(proposer_, ParamName::APPLY_STAGE_LEN,
                                                 static_cast<uint64_t>(INT64_MAX),
                                                 &propId).code(),
              Status::INVALID_ARGUMENT);
    EXPECT_EQ(Params().ProposeReparameterization(proposer_, ParamName::P_COMMIT_STAGE_LEN,
                                                 UINT64_MAX, &propId).code(),
              Status::INVALID_ARGUMENT);
    EXPECT_EQ(Params().ProposeReparameterization(proposer_, ParamName::REVEAL_STAGE_LEN,
                                                 registry::MAX_STAGE_LENGTH + 1,
                                                 &propId).code(),
              Status::INVALID_ARGUMENT);
    EXPECT_EQ(Params().ProposeReparameterization(stranger_, ParamName::VOTE_QUORUM, 60,
                                                 &propId).code(),
              Status::INSUFFICIENT_FUNDS);
    EXPECT_EQ(Balance(ctx_.parameterizerAddress), 0u);

    Propose(ParamName::VOTE_QUORUM, 60);
    EXPECT_EQ(Params().ProposeReparameterization(bob_, ParamName::VOTE_QUORUM, 60,
                                                 &propId).code(),
              Status::INVALID_PHASE);
}

TEST_F(ParameterizerTest, UnchallengedProposalIsApplied) {
    Hash256 propId = Propose(ParamName::COMMIT_STAGE_LEN, 900);
    EXPECT_FALSE(Params().CanBeSet(propId));
    EXPECT_EQ(Params().ProcessProposal(bob_, propId).code(), Status::INVALID_PHASE);

    util::AdvanceMockTime(static_cast<int64_t>(options_.params.pApplyStageLength));
    EXPECT_TRUE(Params().CanBeSet(propId));
    ASSERT_TRUE(Params().ProcessProposal(bob_, propId).ok());

    EXPECT_EQ(Params().Get(ParamName::COMMIT_STAGE_LEN), 900u);
    EXPECT_EQ(Balance(proposer_), START);
    EXPECT_FALSE(Params().PropExists(propId));
    EXPECT_EQ(ctx_.eventLog->Count<events::ProposalAccepted>(), 1u);
    EXPECT_EQ(Params().ProcessProposal(bob_, propId).code(), Status::NO_SUCH_PROPOSAL);
}

TEST_F(ParameterizerTest, UnprocessedProposalExpires) {
    Hash256 propId = Propose(ParamName::REVEAL_STAGE_LEN, 1000);
    auto proposal = Params().GetProposal(propId);
    ASSERT_TRUE(proposal.has_value());

    util::SetMockTime(proposal->processBy);
    EXPECT_FALSE(Params().CanBeSet(propId));
    ASSERT_TRUE(Params().ProcessProposal(bob_, propId).ok());

    EXPECT_EQ(Params().Get(ParamName::REVEAL_STAGE_LEN), options_.params.revealStageLength);
    EXPECT_EQ(Balance(proposer_), START);
    EXPECT_EQ(ctx_.eventLog->Count<events::ProposalExpired>(), 1u);
    EXPECT_FALSE(Params().PropExists(propId));
}

// ============================================================================
// Challenges
// ============================================================================

TEST_F(ParameterizerTest, ChallengeEscrowsMatchingDeposit) {
    Hash256 propId = Propose(ParamName::P_VOTE_QUORUM, 70);
    ChallengeId id = ChallengeProposal(propId);

    EXPECT_NE(id, 0u);
    EXPECT_EQ(Params().GetProposal(propId)->challengeId, id);
    EXPECT_EQ(Balance(challenger_), START - PMinDeposit());
    EXPECT_EQ(Balance(ctx_.parameterizerAddress), 2 * PMinDeposit());

    auto poll = ctx_.voting->GetPoll(id);
    ASSERT_TRUE(poll.has_value());
    EXPECT_EQ(poll->voteQuorum, options_.params.pVoteQuorum);
    EXPECT_EQ(poll->commitEndDate, T0 + 600);

    auto challenge = Params().GetChallenge(id);
    ASSERT_TRUE(challenge.has_value());
    EXPECT_EQ(challenge->rewardPool, PMinDeposit() / 2);
    EXPECT_EQ(challenge->stake, PMinDeposit());
    EXPECT_EQ(ctx_.eventLog->Count<events::NewChallenge>(), 1u);
}

TEST_F(ParameterizerTest, ChallengeRejections) {
    ChallengeId id = 0;
    EXPECT_EQ(Params().ChallengeReparameterization(challenger_, Hash256(), &id).code(),
              Status::NO_SUCH_PROPOSAL);

    Hash256 late = Propose(ParamName::APPLY_STAGE_LEN, 300);
    Hash256 contested = Propose(ParamName::APPLY_STAGE_LEN, 400);
    EXPECT_EQ(Params().ChallengeReparameterization(stranger_, contested, &id).code(),
              Status::INSUFFICIENT_FUNDS);

    ChallengeProposal(contested);
    EXPECT_EQ(Params().ChallengeReparameterization(bob_, contested, &id).code(),
              Status::INVALID_PHASE);

    util::AdvanceMockTime(static_cast<int64_t>(options_.params.pApplyStageLength));
    EXPECT_EQ(Params().ChallengeReparameterization(challenger_, late, &id).code(),
              Status::INVALID_PHASE);
}

TEST_F(ParameterizerTest, ChallengedProposalWaitsForPoll) {
    Hash256 propId = Propose(ParamName::DISPENSATION_PCT, 60);
    ChallengeProposal(propId);

    util::AdvanceMockTime(static_cast<int64_t>(options_.params.pApplyStageLength));
    EXPECT_FALSE(Params().CanBeSet(propId));
    EXPECT_FALSE(Params().ChallengeCanBeResolved(propId));
    EXPECT_EQ(Params().ProcessProposal(bob_, propId).code(), Status::INVALID_PHASE);
}

TEST_F(ParameterizerTest, FailedChallengeAppliesValueAndPaysProposer) {
    Hash256 propId = Propose(ParamName::DISPENSATION_PCT, 60);
    ChallengeId id = ChallengeProposal(propId);
    Decide(alice_, id, voting::VOTE_FOR, 420, 500);

    Amount reward = 0;
    ASSERT_TRUE(Params().ChallengeWinnerReward(id, &reward).ok());
    EXPECT_EQ(reward, 2 * PMinDeposit() - PMinDeposit() / 2);

    EXPECT_TRUE(Params().ChallengeCanBeResolved(propId));
    ASSERT_TRUE(Params().ProcessProposal(bob_, propId).ok());
    EXPECT_EQ(Params().Get(ParamName::DISPENSATION_PCT), 60u);
    EXPECT_EQ(Balance(proposer_), START - PMinDeposit() + reward);
    EXPECT_EQ(Balance(challenger_), START - PMinDeposit());
    EXPECT_EQ(ctx_.eventLog->Count<events::ParamChallengeFailed>(), 1u);
    EXPECT_FALSE(Params().PropExists(propId));

    auto challenge = Params().GetChallenge(id);
    EXPECT_TRUE(challenge->resolved);
    EXPECT_EQ(challenge->winningTokens, 500u);
    EXPECT_EQ(Params().ChallengeWinnerReward(id, &reward).code(), Status::ALREADY_RESOLVED);
}

TEST_F(ParameterizerTest, SuccessfulChallengeKeepsValueAndPaysChallenger) {
    Hash256 propId = Propose(ParamName::MIN_DEPOSIT, 1000);
    ChallengeId id = ChallengeProposal(propId);
    Decide(alice_, id, voting::VOTE_AGAINST, 420, 500);

    ASSERT_TRUE(Params().ProcessProposal(bob_, propId).ok());
    EXPECT_EQ(Params().Get(ParamName::MIN_DEPOSIT), options_.params.minDeposit);
    EXPECT_EQ(Balance(challenger_), START - PMinDeposit() + 2 * PMinDeposit() - PMinDeposit() / 2);
    EXPECT_EQ(Balance(proposer_), START - PMinDeposit());
    EXPECT_EQ(ctx_.eventLog->Count<events::ParamChallengeSucceeded>(), 1u);
    EXPECT_EQ(Balance(ctx_.parameterizerAddress), PMinDeposit() / 2);
}

TEST_F(ParameterizerTest, PassedChallengeProcessedTooLateDoesNotApply) {
    Hash256 propId = Propose(ParamName::VOTE_QUORUM, 66);
    ChallengeId id = ChallengeProposal(propId);
    Decide(alice_, id, voting::VOTE_FOR, 1, 500);

    util::SetMockTime(Params().GetProposal(propId)->processBy);
    ASSERT_TRUE(Params().ProcessProposal(bob_, propId).ok());
    EXPECT_EQ(Params().Get(ParamName::VOTE_QUORUM), options_.params.voteQuorum);
    EXPECT_EQ(Balance(proposer_), START - PMinDeposit() + 2 * PMinDeposit() - PMinDeposit() / 2);
}

// ============================================================================
// Voter rewards
// ============================================================================

TEST_F(ParameterizerTest, ClaimRewardPaysWinningVoterOnce) {
    Hash256 propId = Propose(ParamName::MIN_DEPOSIT, 1000);
    ChallengeId id = ChallengeProposal(propId);
    Decide(alice_, id, voting::VOTE_AGAINST, 420, 500);

    EXPECT_EQ(Params().ClaimReward(alice_, id, 420).code(), Status::NO_SUCH_CHALLENGE);
    ASSERT_TRUE(Params().ProcessProposal(bob_, propId).ok());

    Amount preview = 0;
    ASSERT_TRUE(Params().VoterReward(alice_, id, 420, &preview).ok());
    EXPECT_EQ(preview, PMinDeposit() / 2);

    Amount before = Balance(alice_);
    EXPECT_EQ(Params().ClaimReward(alice_, id, 421).code(), Status::SALT_MISMATCH);
    ASSERT_TRUE(Params().ClaimReward(alice_, id, 420).ok());
    EXPECT_EQ(Balance(alice_), before + preview);
    EXPECT_TRUE(Params().TokenClaims(id, alice_));
    EXPECT_EQ(Params().ClaimReward(alice_, id, 420).code(), Status::ALREADY_CLAIMED);

    EXPECT_EQ(ctx_.bank->GetEpochVoterTokens(id, alice_), 500u);
    EXPECT_EQ(ctx_.bank->GetEpochTotalTokens(id), 500u);
    EXPECT_EQ(Balance(ctx_.parameterizerAddress), 0u);
    EXPECT_EQ(ctx_.eventLog->Count<events::ParamRewardClaimed>(), 1u);
}

TEST_F(ParameterizerTest, ClaimOnUnknownChallengeFails) {
    EXPECT_EQ(Params().ClaimReward(alice_, 666, 420).code(), Status::NO_SUCH_CHALLENGE);
    Amount preview = 0;
    EXPECT_EQ(Params().VoterReward(alice_, 666, 420, &preview).code(),
              Status::NO_SUCH_CHALLENGE);
    EXPECT_FALSE(Params().TokenClaims(666, alice_));
}

TEST_F(ParameterizerTest, LongestStageLengthsKeepDeadlinesValid) {
    Hash256 propId = Propose(ParamName::P_APPLY_STAGE_LEN, registry::MAX_STAGE_LENGTH);
    util::AdvanceMockTime(static_cast<int64_t>(options_.params.pApplyStageLength));
    ASSERT_TRUE(Params().ProcessProposal(bob_, propId).ok());
    propId = Propose(ParamName::P_COMMIT_STAGE_LEN, registry::MAX_STAGE_LENGTH);
    util::AdvanceMockTime(static_cast<int64_t>(registry::MAX_STAGE_LENGTH));
    ASSERT_TRUE(Params().ProcessProposal(bob_, propId).ok());

    Timestamp now = util::GetTime();
    const Timestamp longest = static_cast<Timestamp>(registry::MAX_STAGE_LENGTH);
    propId = Propose(ParamName::VOTE_QUORUM, 60);
    auto proposal = Params().GetProposal(propId);
    ASSERT_TRUE(proposal.has_value());
    EXPECT_EQ(proposal->appExpiry, now + longest);
    EXPECT_EQ(proposal->processBy, now + longest + longest + 600 + PROCESS_BY_WINDOW);

    ChallengeId id = ChallengeProposal(propId);
    auto poll = ctx_.voting->GetPoll(id);
    ASSERT_TRUE(poll.has_value());
    EXPECT_EQ(poll->commitEndDate, now + longest);
}

TEST_F(ParameterizerTest, ChallengeRefusesDispensationAboveHundred) {
    registry::ParamDefaults defaults = options_.params;
    defaults.pDispensationPct = 150;
    Address address = MakeAddress("parameterizer2");
    Parameterizer params(ctx_.token, ctx_.voting, ctx_.bank, defaults, address, ctx_.eventLog);
    ctx_.token->Approve(proposer_, address, START);
    ctx_.token->Approve(challenger_, address, START);

    Hash256 propId;
    ASSERT_TRUE(params.ProposeReparameterization(proposer_, ParamName::VOTE_QUORUM, 60,
                                                 &propId).ok());
    size_t polls = ctx_.eventLog->Count<events::PollCreated>();
    ChallengeId id = 0;
    EXPECT_EQ(params.ChallengeReparameterization(challenger_, propId, &id).code(),
              Status::INVALID_ARGUMENT);
    EXPECT_EQ(id, 0u);
    EXPECT_EQ(Balance(challenger_), START);
    EXPECT_EQ(ctx_.eventLog->Count<events::PollCreated>(), polls);
    EXPECT_FALSE(params.ChallengeCanBeResolved(propId));
}

TEST_F(ParameterizerTest, RefusedRewardTransferCanBeRetried) {
    auto ledger = std::make_shared<RefusingLedger>(ctx_.token);
    Address address = MakeAddress("parameterizer2");
    ctx_.bank->AuthorizeWriter(address);
    Parameterizer params(ledger, ctx_.voting, ctx_.bank, options_.params, address,
                         ctx_.eventLog);
    ctx_.token->Approve(proposer_, address, START);
    ctx_.token->Approve(challenger_, address, START);

    Hash256 propId;
    ASSERT_TRUE(params.ProposeReparameterization(proposer_, ParamName::MIN_DEPOSIT, 1000,
                                                 &propId).ok());
    ChallengeId id = 0;
    ASSERT_TRUE(params.ChallengeReparameterization(challenger_, propId, &id).ok());
    Decide(alice_, id, voting::VOTE_AGAINST, 420, 500);
    ASSERT_TRUE(params.ProcessProposal(bob_, propId).ok());

    Amount reward = 0;
    ASSERT_TRUE(params.VoterReward(alice_, id, 420, &reward).ok());
    Amount before = Balance(alice_);
    ledger->refuseTransfers = true;
    EXPECT_EQ(params.ClaimReward(alice_, id, 420).code(), Status::INSUFFICIENT_FUNDS);
    EXPECT_FALSE(params.TokenClaims(id, alice_));
    EXPECT_FALSE(ctx_.bank->HasSnapshot(id));
    EXPECT_FALSE(ctx_.bank->HasVoterTokens(id, alice_));
    EXPECT_EQ(Balance(alice_), before);

    ledger->refuseTransfers = false;
    ASSERT_TRUE(params.ClaimReward(alice_, id, 420).ok());
    EXPECT_EQ(Balance(alice_), before + reward);
    EXPECT_EQ(ctx_.bank->GetEpochVoterTokens(id, alice_), 500u);
    EXPECT_EQ(params.ClaimReward(alice_, id, 420).code(), Status::ALREADY_CLAIMED);
}

} // namespace test
} // namespace governance
} // namespace tcr
