// TCR - Poll Engine Tests
// Copyright (c) 2024 TCR Developers
// MIT License

#include <gtest/gtest.h>

#include "tcr/crypto/hasher.h"
#include "tcr/events/events.h"
#include "tcr/token/token.h"
#include "tcr/util/time.h"
#include "tcr/voting/poll_engine.h"
#include "tcr/voting/voting_rights.h"

#include <cstdint>
#include <memory>

namespace tcr {
namespace voting {
namespace test {

// ============================================================================
// Test Fixture
// ============================================================================

class PollEngineTest : public ::testing::Test {
protected:
    static constexpr int64_t COMMIT = 600;
    static constexpr int64_t REVEAL = 600;

    void SetUp() override {
        util::SetMockTime(1700000000);
        util::EnableMockTime();

        log_ = std::make_shared<events::EventLog>();
        token_ = std::make_shared<token::StandardToken>("TestCoin", "TEST", 18, 1000000,
                                                        deployer_, log_);
        rights_ = std::make_shared<VotingRights>(token_, escrow_, log_);
        hasher_ = crypto::DefaultHasher();
        engine_ = std::make_unique<PollEngine>(rights_, hasher_, log_);

        for (const Address& voter : {alice_, bob_}) {
            token_->Transfer(deployer_, voter, 10000);
            token_->Approve(voter, escrow_, 10000);
        }
    }

    void TearDown() override {
        util::DisableMockTime();
    }

    PollId Start(uint64_t quorum = DEFAULT_VOTE_QUORUM) {
        PollId id = 0;
        EXPECT_TRUE(engine_->StartPoll(deployer_, quorum, COMMIT, REVEAL, &id).ok());
        return id;
    }

    Hash256 Secret(VoteChoice choice, Salt salt) {
        return crypto::ComputeVoteHash(*hasher_, choice, salt);
    }

    Status Commit(const Address& voter, PollId id, VoteChoice choice, Salt salt, Amount tokens) {
        PollId prev = engine_->GetInsertPointForNumTokens(voter, tokens, id);
        return engine_->CommitVote(voter, id, Secret(choice, salt), tokens, prev);
    }

    Address deployer_ = MakeAddress("deployer");
    Address alice_ = MakeAddress("alice");
    Address bob_ = MakeAddress("bob");
    Address escrow_ = MakeAddress("voting");
    std::shared_ptr<events::EventLog> log_;
    std::shared_ptr<token::StandardToken> token_;
    std::shared_ptr<VotingRights> rights_;
    std::shared_ptr<crypto::Hasher> hasher_;
    std::unique_ptr<PollEngine> engine_;
};

// ============================================================================
// Poll lifecycle
// ============================================================================

TEST_F(PollEngineTest, StartPollAssignsIncreasingIds) {
    PollId first = Start();
    PollId second = Start();
    EXPECT_EQ(first, 1u);
    EXPECT_EQ(second, 2u);
    EXPECT_EQ(log_->Count<events::PollCreated>(), 2u);

    auto poll = engine_->GetPoll(first);
    ASSERT_TRUE(poll.has_value());
    EXPECT_EQ(poll->commitEndDate, 1700000000 + COMMIT);
    EXPECT_EQ(poll->revealEndDate, 1700000000 + COMMIT + REVEAL);
}

TEST_F(PollEngineTest, StartPollRejectsBadArguments) {
    PollId id = 0;
    EXPECT_EQ(engine_->StartPoll(deployer_, 101, COMMIT, REVEAL, &id).code(),
              Status::INVALID_ARGUMENT);
    EXPECT_EQ(engine_->StartPoll(deployer_, 50, UINT64_MAX, REVEAL, &id).code(),
              Status::ARITHMETIC_OVERFLOW);
    EXPECT_EQ(engine_->StartPoll(deployer_, 50, COMMIT,
                                 static_cast<uint64_t>(INT64_MAX) - 100, &id).code(),
              Status::ARITHMETIC_OVERFLOW);
    EXPECT_EQ(log_->Count<events::PollCreated>(), 0u);
    EXPECT_FALSE(engine_->PollExists(1));
}

TEST_F(PollEngineTest, StageBoundaries) {
    PollId id = Start();
    EXPECT_TRUE(engine_->CommitPeriodActive(id));
    EXPECT_FALSE(engine_->RevealPeriodActive(id));

    util::AdvanceMockTime(COMMIT - 1);
    EXPECT_TRUE(engine_->CommitPeriodActive(id));

    util::AdvanceMockTime(1);
    EXPECT_FALSE(engine_->CommitPeriodActive(id));
    EXPECT_TRUE(engine_->RevealPeriodActive(id));
    EXPECT_FALSE(engine_->PollEnded(id));

    util::AdvanceMockTime(REVEAL);
    EXPECT_FALSE(engine_->RevealPeriodActive(id));
    EXPECT_TRUE(engine_->PollEnded(id));
}

// ============================================================================
// Commit and reveal
// ============================================================================

TEST_F(PollEngineTest, CommitRevealCountsTokens) {
    ASSERT_TRUE(rights_->RequestVotingRights(alice_, 500).ok());
    ASSERT_TRUE(rights_->RequestVotingRights(bob_, 300).ok());
    PollId id = Start();

    ASSERT_TRUE(Commit(alice_, id, VOTE_FOR, 420, 500).ok());
    ASSERT_TRUE(Commit(bob_, id, VOTE_AGAINST, 7, 300).ok());
    EXPECT_TRUE(engine_->DidCommit(alice_, id));
    EXPECT_EQ(engine_->GetNumTokens(alice_, id), 500u);
    EXPECT_EQ(engine_->GetCommitHash(alice_, id), Secret(VOTE_FOR, 420));
    EXPECT_EQ(rights_->GetLockedTokens(alice_), 500u);

    util::AdvanceMockTime(COMMIT);
    ASSERT_TRUE(engine_->RevealVote(alice_, id, VOTE_FOR, 420).ok());
    ASSERT_TRUE(engine_->RevealVote(bob_, id, VOTE_AGAINST, 7).ok());
    EXPECT_TRUE(engine_->DidReveal(alice_, id));
    EXPECT_EQ(rights_->GetLockedTokens(alice_), 0u);

    auto poll = engine_->GetPoll(id);
    ASSERT_TRUE(poll.has_value());
    EXPECT_EQ(poll->votesFor, 500u);
    EXPECT_EQ(poll->votesAgainst, 300u);

    util::AdvanceMockTime(REVEAL);
    bool passed = false;
    ASSERT_TRUE(engine_->IsPassed(id, &passed).ok());
    EXPECT_TRUE(passed);

    Amount total = 0;
    ASSERT_TRUE(engine_->GetTotalNumberOfTokensForWinningOption(id, &total).ok());
    EXPECT_EQ(total, 500u);
}

TEST_F(PollEngineTest, AnyChoiceOtherThanOneCountsAgainst) {
    ASSERT_TRUE(rights_->RequestVotingRights(alice_, 100).ok());
    PollId id = Start();
    ASSERT_TRUE(Commit(alice_, id, 7, 1, 100).ok());

    util::AdvanceMockTime(COMMIT);
    ASSERT_TRUE(engine_->RevealVote(alice_, id, 7, 1).ok());
    EXPECT_EQ(engine_->GetPoll(id)->votesAgainst, 100u);
    EXPECT_EQ(engine_->GetPoll(id)->votesFor, 0u);
}

TEST_F(PollEngineTest, CommitOutsideCommitStageFails) {
    ASSERT_TRUE(rights_->RequestVotingRights(alice_, 100).ok());
    PollId id = Start();
    util::AdvanceMockTime(COMMIT);
    EXPECT_EQ(Commit(alice_, id, VOTE_FOR, 1, 100).code(), Status::INVALID_PHASE);
    EXPECT_EQ(Commit(alice_, 99, VOTE_FOR, 1, 100).code(), Status::NO_SUCH_POLL);
}

TEST_F(PollEngineTest, CommitRejectsEmptyCommitment) {
    ASSERT_TRUE(rights_->RequestVotingRights(alice_, 100).ok());
    PollId id = Start();
    EXPECT_EQ(engine_->CommitVote(alice_, id, Secret(1, 1), 0, 0).code(),
              Status::INVALID_ARGUMENT);
    EXPECT_EQ(engine_->CommitVote(alice_, id, Hash256(), 10, 0).code(),
              Status::INVALID_ARGUMENT);
}

TEST_F(PollEngineTest, CommitBeyondRightsFails) {
    ASSERT_TRUE(rights_->RequestVotingRights(alice_, 100).ok());
    PollId first = Start();
    PollId second = Start();
    ASSERT_TRUE(Commit(alice_, first, VOTE_FOR, 1, 80).ok());
    EXPECT_EQ(Commit(alice_, second, VOTE_FOR, 1, 21).code(), Status::INSUFFICIENT_RIGHTS);
    EXPECT_TRUE(Commit(alice_, second, VOTE_FOR, 1, 20).ok());
}

TEST_F(PollEngineTest, RecommitReplacesEarlierCommitment) {
    ASSERT_TRUE(rights_->RequestVotingRights(alice_, 100).ok());
    PollId id = Start();
    ASSERT_TRUE(Commit(alice_, id, VOTE_FOR, 1, 60).ok());
    ASSERT_TRUE(Commit(alice_, id, VOTE_AGAINST, 2, 100).ok());

    EXPECT_EQ(rights_->GetLockedTokens(alice_), 100u);
    EXPECT_EQ(engine_->GetNumTokens(alice_, id), 100u);
    EXPECT_EQ(engine_->GetCommitments(alice_).size(), 1u);

    util::AdvanceMockTime(COMMIT);
    EXPECT_EQ(engine_->RevealVote(alice_, id, VOTE_FOR, 1).code(), Status::SALT_MISMATCH);
    EXPECT_TRUE(engine_->RevealVote(alice_, id, VOTE_AGAINST, 2).ok());
}

TEST_F(PollEngineTest, RevealChecks) {
    ASSERT_TRUE(rights_->RequestVotingRights(alice_, 100).ok());
    PollId id = Start();
    ASSERT_TRUE(Commit(alice_, id, VOTE_FOR, 420, 100).ok());

    EXPECT_EQ(engine_->RevealVote(alice_, id, VOTE_FOR, 420).code(), Status::INVALID_PHASE);

    util::AdvanceMockTime(COMMIT);
    EXPECT_EQ(engine_->RevealVote(alice_, id, VOTE_FOR, 421).code(), Status::SALT_MISMATCH);
    EXPECT_EQ(engine_->RevealVote(alice_, id, VOTE_AGAINST, 420).code(), Status::SALT_MISMATCH);
    EXPECT_EQ(engine_->RevealVote(bob_, id, VOTE_FOR, 420).code(), Status::SALT_MISMATCH);

    ASSERT_TRUE(engine_->RevealVote(alice_, id, VOTE_FOR, 420).ok());
    EXPECT_EQ(engine_->RevealVote(alice_, id, VOTE_FOR, 420).code(), Status::SALT_MISMATCH);
    EXPECT_EQ(engine_->GetPoll(id)->votesFor, 100u);

    util::AdvanceMockTime(REVEAL);
    EXPECT_EQ(engine_->RevealVote(alice_, id, VOTE_FOR, 420).code(), Status::INVALID_PHASE);
}

// ============================================================================
// Ordered commitment list
// ============================================================================

TEST_F(PollEngineTest, CommitmentsStayOrderedByTokens) {
    ASSERT_TRUE(rights_->RequestVotingRights(alice_, 1000).ok());
    PollId p1 = Start();
    PollId p2 = Start();
    PollId p3 = Start();

    ASSERT_TRUE(engine_->CommitVote(alice_, p1, Secret(1, 1), 10, 0).ok());
    ASSERT_TRUE(engine_->CommitVote(alice_, p2, Secret(1, 1), 30, p1).ok());
    EXPECT_EQ(engine_->GetInsertPointForNumTokens(alice_, 20, p3), p1);
    ASSERT_TRUE(engine_->CommitVote(alice_, p3, Secret(1, 1), 20, p1).ok());

    EXPECT_EQ(engine_->GetCommitments(alice_), (std::vector<PollId>{p1, p3, p2}));
    EXPECT_EQ(rights_->GetLockedTokens(alice_), 60u);
}

TEST_F(PollEngineTest, BadInsertHintIsRejected) {
    ASSERT_TRUE(rights_->RequestVotingRights(alice_, 1000).ok());
    PollId p1 = Start();
    PollId p2 = Start();
    PollId p3 = Start();
    ASSERT_TRUE(engine_->CommitVote(alice_, p1, Secret(1, 1), 10, 0).ok());
    ASSERT_TRUE(engine_->CommitVote(alice_, p2, Secret(1, 1), 30, p1).ok());

    // After p2 (30 > 20), at the head (20 > 10), and a poll not in the list
    EXPECT_EQ(engine_->CommitVote(alice_, p3, Secret(1, 1), 20, p2).code(), Status::INVALID_HINT);
    EXPECT_EQ(engine_->CommitVote(alice_, p3, Secret(1, 1), 20, 0).code(), Status::INVALID_HINT);
    EXPECT_EQ(engine_->CommitVote(alice_, p3, Secret(1, 1), 20, 42).code(), Status::INVALID_HINT);
    EXPECT_EQ(rights_->GetLockedTokens(alice_), 40u);
}

TEST_F(PollEngineTest, RecommitMayUseItsOwnPositionAsHint) {
    ASSERT_TRUE(rights_->RequestVotingRights(alice_, 1000).ok());
    PollId p1 = Start();
    PollId p2 = Start();
    ASSERT_TRUE(engine_->CommitVote(alice_, p1, Secret(1, 1), 10, 0).ok());
    ASSERT_TRUE(engine_->CommitVote(alice_, p2, Secret(1, 1), 30, p1).ok());

    // p1 grows past p2; the hint is computed without p1 itself
    PollId prev = engine_->GetInsertPointForNumTokens(alice_, 50, p1);
    EXPECT_EQ(prev, p2);
    ASSERT_TRUE(engine_->CommitVote(alice_, p1, Secret(1, 1), 50, prev).ok());
    EXPECT_EQ(engine_->GetCommitments(alice_), (std::vector<PollId>{p2, p1}));
    EXPECT_EQ(rights_->GetLockedTokens(alice_), 80u);
}

// ============================================================================
// Outcome
// ============================================================================

TEST_F(PollEngineTest, OutcomeOnlyAfterPollEnds) {
    PollId id = Start();
    bool passed = true;
    EXPECT_EQ(engine_->IsPassed(id, &passed).code(), Status::INVALID_PHASE);
    EXPECT_EQ(engine_->IsPassed(99, &passed).code(), Status::NO_SUCH_POLL);

    util::AdvanceMockTime(COMMIT + REVEAL);
    ASSERT_TRUE(engine_->IsPassed(id, &passed).ok());
    EXPECT_FALSE(passed);

    Amount total = 1;
    ASSERT_TRUE(engine_->GetTotalNumberOfTokensForWinningOption(id, &total).ok());
    EXPECT_EQ(total, 0u);
}

TEST_F(PollEngineTest, TieDoesNotPass) {
    ASSERT_TRUE(rights_->RequestVotingRights(alice_, 100).ok());
    ASSERT_TRUE(rights_->RequestVotingRights(bob_, 100).ok());
    PollId id = Start();
    ASSERT_TRUE(Commit(alice_, id, VOTE_FOR, 1, 100).ok());
    ASSERT_TRUE(Commit(bob_, id, VOTE_AGAINST, 2, 100).ok());
    util::AdvanceMockTime(COMMIT);
    ASSERT_TRUE(engine_->RevealVote(alice_, id, VOTE_FOR, 1).ok());
    ASSERT_TRUE(engine_->RevealVote(bob_, id, VOTE_AGAINST, 2).ok());
    util::AdvanceMockTime(REVEAL);

    bool passed = true;
    ASSERT_TRUE(engine_->IsPassed(id, &passed).ok());
    EXPECT_FALSE(passed);
}

TEST_F(PollEngineTest, QuorumRaisesTheBar) {
    ASSERT_TRUE(rights_->RequestVotingRights(alice_, 60).ok());
    ASSERT_TRUE(rights_->RequestVotingRights(bob_, 40).ok());
    PollId id = Start(70);
    ASSERT_TRUE(Commit(alice_, id, VOTE_FOR, 1, 60).ok());
    ASSERT_TRUE(Commit(bob_, id, VOTE_AGAINST, 2, 40).ok());
    util::AdvanceMockTime(COMMIT);
    ASSERT_TRUE(engine_->RevealVote(alice_, id, VOTE_FOR, 1).ok());
    ASSERT_TRUE(engine_->RevealVote(bob_, id, VOTE_AGAINST, 2).ok());
    util::AdvanceMockTime(REVEAL);

    bool passed = true;
    ASSERT_TRUE(engine_->IsPassed(id, &passed).ok());
    EXPECT_FALSE(passed);

    Amount tokens = 0;
    ASSERT_TRUE(engine_->GetNumPassingTokens(bob_, id, 2, &tokens).ok());
    EXPECT_EQ(tokens, 40u);
    EXPECT_EQ(engine_->GetNumPassingTokens(alice_, id, 1, &tokens).code(),
              Status::SALT_MISMATCH);
}

TEST_F(PollEngineTest, NumPassingTokensNeedsReveal) {
    ASSERT_TRUE(rights_->RequestVotingRights(alice_, 100).ok());
    ASSERT_TRUE(rights_->RequestVotingRights(bob_, 100).ok());
    PollId id = Start();
    ASSERT_TRUE(Commit(alice_, id, VOTE_FOR, 1, 100).ok());
    ASSERT_TRUE(Commit(bob_, id, VOTE_FOR, 2, 100).ok());
    util::AdvanceMockTime(COMMIT);
    ASSERT_TRUE(engine_->RevealVote(alice_, id, VOTE_FOR, 1).ok());
    util::AdvanceMockTime(REVEAL);

    Amount tokens = 0;
    ASSERT_TRUE(engine_->GetNumPassingTokens(alice_, id, 1, &tokens).ok());
    EXPECT_EQ(tokens, 100u);
    EXPECT_EQ(engine_->GetNumPassingTokens(alice_, id, 2, &tokens).code(), Status::SALT_MISMATCH);
    EXPECT_EQ(engine_->GetNumPassingTokens(bob_, id, 2, &tokens).code(), Status::DID_NOT_REVEAL);
}

// ============================================================================
// Rescue
// ============================================================================

TEST_F(PollEngineTest, RescueReleasesUnrevealedLock) {
    ASSERT_TRUE(rights_->RequestVotingRights(alice_, 100).ok());
    PollId id = Start();
    ASSERT_TRUE(Commit(alice_, id, VOTE_FOR, 1, 70).ok());

    EXPECT_EQ(engine_->RescueTokens(alice_, id).code(), Status::INVALID_PHASE);

    util::AdvanceMockTime(COMMIT + REVEAL);
    ASSERT_TRUE(engine_->RescueTokens(alice_, id).ok());
    EXPECT_EQ(rights_->GetLockedTokens(alice_), 0u);
    EXPECT_TRUE(engine_->GetCommitments(alice_).empty());
    EXPECT_EQ(log_->Count<events::TokensRescued>(), 1u);

    EXPECT_EQ(engine_->RescueTokens(alice_, id).code(), Status::SALT_MISMATCH);
    EXPECT_TRUE(rights_->WithdrawVotingRights(alice_, 100).ok());
}

TEST_F(PollEngineTest, RevealedVoteCannotBeRescued) {
    ASSERT_TRUE(rights_->RequestVotingRights(alice_, 100).ok());
    PollId id = Start();
    ASSERT_TRUE(Commit(alice_, id, VOTE_FOR, 1, 70).ok());
    util::AdvanceMockTime(COMMIT);
    ASSERT_TRUE(engine_->RevealVote(alice_, id, VOTE_FOR, 1).ok());
    util::AdvanceMockTime(REVEAL);
    EXPECT_EQ(engine_->RescueTokens(alice_, id).code(), Status::SALT_MISMATCH);
    EXPECT_EQ(engine_->RescueTokens(alice_, 99).code(), Status::NO_SUCH_POLL);
}

TEST_F(PollEngineTest, LockEqualsUnrevealedCommitments) {
    ASSERT_TRUE(rights_->RequestVotingRights(alice_, 1000).ok());
    PollId p1 = Start();
    PollId p2 = Start();
    ASSERT_TRUE(Commit(alice_, p1, VOTE_FOR, 1, 100).ok());
    ASSERT_TRUE(Commit(alice_, p2, VOTE_FOR, 1, 250).ok());

    auto unrevealedSum = [&]() {
        Amount sum = 0;
        for (PollId id : engine_->GetCommitments(alice_)) {
            sum += engine_->GetNumTokens(alice_, id);
        }
        return sum;
    };
    EXPECT_EQ(rights_->GetLockedTokens(alice_), unrevealedSum());

    util::AdvanceMockTime(COMMIT);
    ASSERT_TRUE(engine_->RevealVote(alice_, p1, VOTE_FOR, 1).ok());
    EXPECT_EQ(rights_->GetLockedTokens(alice_), unrevealedSum());
    EXPECT_EQ(rights_->GetLockedTokens(alice_), 250u);

    util::AdvanceMockTime(REVEAL);
    ASSERT_TRUE(engine_->RescueTokens(alice_, p2).ok());
    EXPECT_EQ(rights_->GetLockedTokens(alice_), unrevealedSum());
    EXPECT_EQ(rights_->GetLockedTokens(alice_), 0u);
}

} // namespace test
} // namespace voting
} // namespace tcr
