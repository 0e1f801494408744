// TCR - Commit-Reveal Poll Engine Implementation
// Copyright (c) 2024 TCR Developers
// MIT License

#include "tcr/voting/poll_engine.h"
#include "tcr/core/fixedpoint.h"
#include "tcr/crypto/hasher.h"
#include "tcr/events/events.h"
#include "tcr/util/logging.h"
#include "tcr/util/time.h"
#include "tcr/voting/voting_rights.h"

#include <algorithm>

namespace tcr {
namespace voting {

namespace {

Status Reject(const char* op, PollId pollId, const Address& voter, Status status) {
    LOG_DEBUG(util::LogCategory::VOTING) << op << " on poll " << pollId << " by "
                                         << voter.ToHex() << " rejected: "
                                         << status.ToString();
    return status;
}

} // anonymous namespace

PollEngine::PollEngine(std::shared_ptr<VotingRights> rights,
                       std::shared_ptr<crypto::Hasher> hasher,
                       std::shared_ptr<events::EventLog> eventLog)
    : rights_(std::move(rights))
    , hasher_(std::move(hasher))
    , eventLog_(std::move(eventLog)) {}

// ============================================================================
// Poll lifecycle
// ============================================================================

Status PollEngine::StartPoll(const Address& creator, uint64_t voteQuorum,
                             uint64_t commitDuration, uint64_t revealDuration,
                             PollId* pollId) {
    if (voteQuorum > fixedpoint::PERCENT) {
        return Status::InvalidArgument("vote quorum above 100");
    }
    Timestamp commitEnd = 0;
    Timestamp revealEnd = 0;
    Status s = fixedpoint::CheckedDeadline(util::GetTime(), commitDuration, &commitEnd);
    if (s.ok()) {
        s = fixedpoint::CheckedDeadline(commitEnd, revealDuration, &revealEnd);
    }
    if (!s.ok()) {
        LOG_WARN(util::LogCategory::VOTING) << "Poll refused: " << s.ToString();
        return s;
    }

    Poll poll;
    poll.id = nextPollId_++;
    poll.voteQuorum = voteQuorum;
    poll.commitEndDate = commitEnd;
    poll.revealEndDate = revealEnd;

    LOG_INFO(util::LogCategory::VOTING)
        << "Poll " << poll.id << " started (commit "
        << util::FormatDuration(static_cast<int64_t>(commitDuration)) << ", reveal "
        << util::FormatDuration(static_cast<int64_t>(revealDuration)) << "), ends "
        << util::FormatISO8601(poll.revealEndDate);
    if (eventLog_) {
        eventLog_->Emit(events::PollCreated{poll.id, voteQuorum, poll.commitEndDate,
                                            poll.revealEndDate, creator});
    }

    *pollId = poll.id;
    polls_.emplace(poll.id, std::move(poll));
    return Status::Ok();
}

Status PollEngine::CommitVote(const Address& voter, PollId pollId, const Hash256& secretHash,
                              Amount numTokens, PollId prevPollId) {
    auto pollIt = polls_.find(pollId);
    if (pollIt == polls_.end()) {
        return Reject("CommitVote", pollId, voter, Status::NoSuchPoll());
    }
    if (!CommitPeriodActive(pollId)) {
        return Reject("CommitVote", pollId, voter,
                      Status::InvalidPhase("commit stage is over"));
    }
    if (numTokens == 0 || secretHash.IsNull()) {
        return Reject("CommitVote", pollId, voter,
                      Status::InvalidArgument("empty commitment"));
    }

    // A repeated commit replaces the earlier one, so its lock counts as free
    const VoteRecord* previous = FindVote(voter, pollId);
    Amount replaced = previous ? previous->numTokens : 0;
    if (numTokens > rights_->GetAvailableTokens(voter) + replaced) {
        return Reject("CommitVote", pollId, voter,
                      Status::InsufficientRights("commit exceeds unlocked voting rights"));
    }

    // Validate the insert position against the list without this poll
    std::vector<PollId> list = GetCommitments(voter);
    list.erase(std::remove(list.begin(), list.end(), pollId), list.end());

    size_t insertAt = 0;
    if (prevPollId != 0) {
        auto prevIt = std::find(list.begin(), list.end(), prevPollId);
        if (prevIt == list.end()) {
            return Reject("CommitVote", pollId, voter,
                          Status::InvalidHint("previous poll not in commitment list"));
        }
        insertAt = static_cast<size_t>(prevIt - list.begin()) + 1;
    }
    bool prevValid = prevPollId == 0 || GetNumTokens(voter, prevPollId) <= numTokens;
    bool nextValid = insertAt == list.size() || numTokens <= GetNumTokens(voter, list[insertAt]);
    if (!prevValid || !nextValid) {
        return Reject("CommitVote", pollId, voter,
                      Status::InvalidHint("insert position breaks token ordering"));
    }

    Status locked = rights_->Lock(voter, numTokens, replaced);
    if (!locked.ok()) {
        return Reject("CommitVote", pollId, voter, locked);
    }

    list.insert(list.begin() + static_cast<std::ptrdiff_t>(insertAt), pollId);
    commitments_[voter] = std::move(list);

    VoteRecord& record = pollIt->second.votes[voter];
    record.commitHash = secretHash;
    record.numTokens = numTokens;
    record.revealed = false;

    LOG_INFO(util::LogCategory::VOTING) << voter.ToHex() << " committed " << numTokens
                                        << " tokens to poll " << pollId;
    if (eventLog_) {
        eventLog_->Emit(events::VoteCommitted{pollId, numTokens, voter});
    }
    return Status::Ok();
}

PollId PollEngine::GetInsertPointForNumTokens(const Address& voter, Amount numTokens,
                                              PollId pollId) const {
    PollId insertPoint = 0;
    for (PollId id : GetCommitments(voter)) {
        if (id == pollId) {
            continue;
        }
        if (GetNumTokens(voter, id) > numTokens) {
            break;
        }
        insertPoint = id;
    }
    return insertPoint;
}

Status PollEngine::RevealVote(const Address& voter, PollId pollId, VoteChoice choice, Salt salt) {
    auto pollIt = polls_.find(pollId);
    if (pollIt == polls_.end()) {
        return Reject("RevealVote", pollId, voter, Status::NoSuchPoll());
    }
    if (!RevealPeriodActive(pollId)) {
        return Reject("RevealVote", pollId, voter,
                      Status::InvalidPhase("outside reveal stage"));
    }

    Poll& poll = pollIt->second;
    auto voteIt = poll.votes.find(voter);
    if (voteIt == poll.votes.end()) {
        return Reject("RevealVote", pollId, voter, Status::SaltMismatch("no commitment"));
    }
    VoteRecord& record = voteIt->second;
    if (record.revealed) {
        return Reject("RevealVote", pollId, voter, Status::SaltMismatch("already revealed"));
    }
    if (crypto::ComputeVoteHash(*hasher_, choice, salt) != record.commitHash) {
        return Reject("RevealVote", pollId, voter,
                      Status::SaltMismatch("choice and salt do not match commitment"));
    }

    Amount& side = (choice == VOTE_FOR) ? poll.votesFor : poll.votesAgainst;
    Amount newTotal = 0;
    Status added = fixedpoint::CheckedAdd(side, record.numTokens, &newTotal);
    if (!added.ok()) {
        return Reject("RevealVote", pollId, voter, added);
    }
    side = newTotal;

    record.revealed = true;
    record.choice = choice;
    RemoveCommitment(voter, pollId);
    rights_->Unlock(voter, record.numTokens);

    LOG_INFO(util::LogCategory::VOTING) << voter.ToHex() << " revealed " << record.numTokens
                                        << " tokens " << (choice == VOTE_FOR ? "for" : "against")
                                        << " in poll " << pollId;
    if (eventLog_) {
        eventLog_->Emit(events::VoteRevealed{pollId, record.numTokens, poll.votesFor,
                                             poll.votesAgainst, choice, voter});
    }
    return Status::Ok();
}

Status PollEngine::RescueTokens(const Address& voter, PollId pollId) {
    if (!PollExists(pollId)) {
        return Reject("RescueTokens", pollId, voter, Status::NoSuchPoll());
    }
    if (!PollEnded(pollId)) {
        return Reject("RescueTokens", pollId, voter,
                      Status::InvalidPhase("poll has not ended"));
    }

    std::vector<PollId> list = GetCommitments(voter);
    if (std::find(list.begin(), list.end(), pollId) == list.end()) {
        return Reject("RescueTokens", pollId, voter,
                      Status::SaltMismatch("no unrevealed commitment"));
    }

    Amount tokens = GetNumTokens(voter, pollId);
    RemoveCommitment(voter, pollId);
    rights_->Unlock(voter, tokens);

    LOG_INFO(util::LogCategory::VOTING) << voter.ToHex() << " rescued " << tokens
                                        << " tokens from poll " << pollId;
    if (eventLog_) {
        eventLog_->Emit(events::TokensRescued{pollId, voter});
    }
    return Status::Ok();
}

// ============================================================================
// Outcome
// ============================================================================

Status PollEngine::IsPassed(PollId pollId, bool* passed) const {
    auto it = polls_.find(pollId);
    if (it == polls_.end()) {
        return Status::NoSuchPoll();
    }
    if (!PollEnded(pollId)) {
        return Status::InvalidPhase("poll has not ended");
    }

    const Poll& poll = it->second;
    __uint128_t forWeight = static_cast<__uint128_t>(poll.votesFor) * fixedpoint::PERCENT;
    __uint128_t threshold = static_cast<__uint128_t>(poll.voteQuorum) *
                            (static_cast<__uint128_t>(poll.votesFor) + poll.votesAgainst);
    *passed = forWeight > threshold;
    return Status::Ok();
}

Status PollEngine::GetNumPassingTokens(const Address& voter, PollId pollId, Salt salt,
                                       Amount* tokens) const {
    bool passed = false;
    Status s = IsPassed(pollId, &passed);
    if (!s.ok()) {
        return s;
    }

    const VoteRecord* record = FindVote(voter, pollId);
    if (!record || !record->revealed) {
        return Status::DidNotReveal();
    }

    VoteChoice winningChoice = passed ? VOTE_FOR : VOTE_AGAINST;
    if (crypto::ComputeVoteHash(*hasher_, winningChoice, salt) != record->commitHash) {
        return Status::SaltMismatch("not a winning vote with this salt");
    }

    *tokens = record->numTokens;
    return Status::Ok();
}

Status PollEngine::GetTotalNumberOfTokensForWinningOption(PollId pollId, Amount* tokens) const {
    bool passed = false;
    Status s = IsPassed(pollId, &passed);
    if (!s.ok()) {
        return s;
    }

    const Poll& poll = polls_.at(pollId);
    *tokens = passed ? poll.votesFor : poll.votesAgainst;
    return Status::Ok();
}

// ============================================================================
// Queries
// ============================================================================

bool PollEngine::PollExists(PollId pollId) const {
    return polls_.count(pollId) > 0;
}

bool PollEngine::CommitPeriodActive(PollId pollId) const {
    auto it = polls_.find(pollId);
    return it != polls_.end() && util::GetTime() < it->second.commitEndDate;
}

bool PollEngine::RevealPeriodActive(PollId pollId) const {
    auto it = polls_.find(pollId);
    if (it == polls_.end()) {
        return false;
    }
    Timestamp now = util::GetTime();
    return now >= it->second.commitEndDate && now < it->second.revealEndDate;
}

bool PollEngine::PollEnded(PollId pollId) const {
    auto it = polls_.find(pollId);
    return it != polls_.end() && util::GetTime() >= it->second.revealEndDate;
}

bool PollEngine::DidCommit(const Address& voter, PollId pollId) const {
    return FindVote(voter, pollId) != nullptr;
}

bool PollEngine::DidReveal(const Address& voter, PollId pollId) const {
    const VoteRecord* record = FindVote(voter, pollId);
    return record && record->revealed;
}

Hash256 PollEngine::GetCommitHash(const Address& voter, PollId pollId) const {
    const VoteRecord* record = FindVote(voter, pollId);
    return record ? record->commitHash : Hash256();
}

Amount PollEngine::GetNumTokens(const Address& voter, PollId pollId) const {
    const VoteRecord* record = FindVote(voter, pollId);
    return record ? record->numTokens : 0;
}

std::optional<Poll> PollEngine::GetPoll(PollId pollId) const {
    auto it = polls_.find(pollId);
    if (it == polls_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<PollId> PollEngine::GetCommitments(const Address& voter) const {
    auto it = commitments_.find(voter);
    if (it == commitments_.end()) {
        return {};
    }
    return it->second;
}

const VoteRecord* PollEngine::FindVote(const Address& voter, PollId pollId) const {
    auto pollIt = polls_.find(pollId);
    if (pollIt == polls_.end()) {
        return nullptr;
    }
    auto voteIt = pollIt->second.votes.find(voter);
    return voteIt != pollIt->second.votes.end() ? &voteIt->second : nullptr;
}

void PollEngine::RemoveCommitment(const Address& voter, PollId pollId) {
    auto it = commitments_.find(voter);
    if (it == commitments_.end()) {
        return;
    }
    auto& list = it->second;
    list.erase(std::remove(list.begin(), list.end(), pollId), list.end());
}

} // namespace voting
} // namespace tcr
