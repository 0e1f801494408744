// TCR - Token-Curated Registry Implementation
// Copyright (c) 2024 TCR Developers
// MIT License

#include "tcr/registry/registry.h"
#include "tcr/bank/bank.h"
#include "tcr/core/fixedpoint.h"
#include "tcr/events/events.h"
#include "tcr/registry/params.h"
#include "tcr/token/token.h"
#include "tcr/util/logging.h"
#include "tcr/util/time.h"
#include "tcr/voting/poll_engine.h"

namespace tcr {
namespace registry {

namespace {

Status Reject(const char* op, const ListingHash& listingHash, const Address& sender,
              Status status) {
    LOG_DEBUG(util::LogCategory::REGISTRY) << op << " on listing " << listingHash.ToHex()
                                           << " by " << sender.ToHex() << " rejected: "
                                           << status.ToString();
    return status;
}

Status Reject(const char* op, ChallengeId challengeId, const Address& sender, Status status) {
    LOG_DEBUG(util::LogCategory::REGISTRY) << op << " on challenge " << challengeId
                                           << " by " << sender.ToHex() << " rejected: "
                                           << status.ToString();
    return status;
}

} // anonymous namespace

const char* ListingStateToString(ListingState state) {
    switch (state) {
        case ListingState::Unlisted:    return "unlisted";
        case ListingState::Applied:     return "applied";
        case ListingState::Whitelisted: return "whitelisted";
        case ListingState::Challenged:  return "challenged";
    }
    return "unknown";
}

Registry::Registry(std::shared_ptr<token::TokenLedger> token,
                   std::shared_ptr<voting::PollEngine> voting,
                   std::shared_ptr<ParameterSource> params,
                   std::shared_ptr<bank::Bank> bank,
                   const Address& address,
                   std::string name,
                   std::shared_ptr<events::EventLog> eventLog)
    : token_(std::move(token))
    , voting_(std::move(voting))
    , params_(std::move(params))
    , bank_(std::move(bank))
    , address_(address)
    , name_(std::move(name))
    , eventLog_(std::move(eventLog)) {}

// ============================================================================
// Token movement
// ============================================================================

Status Registry::Escrow(const Address& from, Amount amount) {
    if (!token_->TransferFrom(address_, from, address_, amount)) {
        return Status::InsufficientFunds("transfer into registry refused");
    }
    return Status::Ok();
}

Status Registry::PayOut(const Payments& payments) {
    Amount total = 0;
    for (const auto& [to, amount] : payments) {
        Status s = fixedpoint::CheckedAdd(total, amount, &total);
        if (!s.ok()) {
            return s;
        }
    }
    if (token_->BalanceOf(address_) < total) {
        LOG_ERROR(util::LogCategory::REGISTRY) << name_ << " escrow holds "
                                               << token_->BalanceOf(address_)
                                               << ", cannot pay out " << total;
        return Status::InsufficientFunds("registry escrow cannot cover payout");
    }

    for (const auto& [to, amount] : payments) {
        if (amount == 0) {
            continue;
        }
        if (!token_->Transfer(address_, to, amount)) {
            LOG_ERROR(util::LogCategory::REGISTRY) << "Payout of " << amount << " to "
                                                   << to.ToHex() << " refused";
            return Status::InsufficientFunds("payout refused");
        }
    }
    return Status::Ok();
}

// ============================================================================
// Listing lifecycle
// ============================================================================

Status Registry::Apply(const Address& sender, const ListingHash& listingHash,
                       Amount amount, const std::string& data) {
    if (listingHash.IsNull()) {
        return Reject("Apply", listingHash, sender, Status::InvalidArgument("null listing hash"));
    }
    if (IsWhitelisted(listingHash)) {
        return Reject("Apply", listingHash, sender, Status::InvalidPhase("already whitelisted"));
    }
    if (AppWasMade(listingHash)) {
        return Reject("Apply", listingHash, sender,
                      Status::InvalidPhase("application already pending"));
    }

    Amount minDeposit = params_->Get(ParamName::MIN_DEPOSIT);
    if (amount < minDeposit) {
        return Reject("Apply", listingHash, sender,
                      Status::InsufficientDeposit("deposit below minDeposit"));
    }

    Timestamp expiry = 0;
    Status s = fixedpoint::CheckedDeadline(util::GetTime(),
                                           params_->Get(ParamName::APPLY_STAGE_LEN), &expiry);
    if (!s.ok()) {
        return Reject("Apply", listingHash, sender, s);
    }
    s = Escrow(sender, amount);
    if (!s.ok()) {
        return Reject("Apply", listingHash, sender, s);
    }

    Listing listing;
    listing.id = listingHash;
    listing.owner = sender;
    listing.unstakedDeposit = amount;
    listing.applicationExpiry = expiry;
    listing.data = data;
    listings_[listingHash] = listing;

    LOG_INFO(util::LogCategory::REGISTRY) << "Application " << listingHash.ToHex() << " by "
                                          << sender.ToHex() << " with deposit " << amount
                                          << ", matures "
                                          << util::FormatISO8601(listing.applicationExpiry);
    if (eventLog_) {
        eventLog_->Emit(events::Application{listingHash, amount, listing.applicationExpiry,
                                            data, sender});
    }
    return Status::Ok();
}

Status Registry::Deposit(const Address& sender, const ListingHash& listingHash, Amount amount) {
    auto it = listings_.find(listingHash);
    if (it == listings_.end()) {
        return Reject("Deposit", listingHash, sender, Status::NoSuchListing());
    }
    Listing& listing = it->second;
    if (listing.owner != sender) {
        return Reject("Deposit", listingHash, sender, Status::NotOwner());
    }
    if (amount == 0) {
        return Reject("Deposit", listingHash, sender, Status::InvalidArgument("zero deposit"));
    }

    Amount newTotal = 0;
    Status s = fixedpoint::CheckedAdd(listing.unstakedDeposit, amount, &newTotal);
    if (!s.ok()) {
        return Reject("Deposit", listingHash, sender, s);
    }
    s = Escrow(sender, amount);
    if (!s.ok()) {
        return Reject("Deposit", listingHash, sender, s);
    }
    listing.unstakedDeposit = newTotal;

    LOG_INFO(util::LogCategory::REGISTRY) << "Deposit of " << amount << " on "
                                          << listingHash.ToHex() << ", unstaked " << newTotal;
    if (eventLog_) {
        eventLog_->Emit(events::DepositMade{listingHash, amount, newTotal, sender});
    }
    return Status::Ok();
}

Status Registry::Withdraw(const Address& sender, const ListingHash& listingHash, Amount amount) {
    auto it = listings_.find(listingHash);
    if (it == listings_.end()) {
        return Reject("Withdraw", listingHash, sender, Status::NoSuchListing());
    }
    Listing& listing = it->second;
    if (listing.owner != sender) {
        return Reject("Withdraw", listingHash, sender, Status::NotOwner());
    }

    Amount minDeposit = params_->Get(ParamName::MIN_DEPOSIT);
    if (amount > listing.unstakedDeposit || listing.unstakedDeposit - amount < minDeposit) {
        return Reject("Withdraw", listingHash, sender,
                      Status::InsufficientDeposit("withdrawal leaves less than minDeposit"));
    }

    Status s = PayOut({{sender, amount}});
    if (!s.ok()) {
        return Reject("Withdraw", listingHash, sender, s);
    }
    listing.unstakedDeposit -= amount;

    LOG_INFO(util::LogCategory::REGISTRY) << "Withdrawal of " << amount << " from "
                                          << listingHash.ToHex() << ", unstaked "
                                          << listing.unstakedDeposit;
    if (eventLog_) {
        eventLog_->Emit(events::WithdrawalMade{listingHash, amount, listing.unstakedDeposit,
                                               sender});
    }
    return Status::Ok();
}

Status Registry::Exit(const Address& sender, const ListingHash& listingHash) {
    auto it = listings_.find(listingHash);
    if (it == listings_.end()) {
        return Reject("Exit", listingHash, sender, Status::NoSuchListing());
    }
    if (it->second.owner != sender) {
        return Reject("Exit", listingHash, sender, Status::NotOwner());
    }
    if (!it->second.whitelisted) {
        return Reject("Exit", listingHash, sender, Status::InvalidPhase("not whitelisted"));
    }
    if (ChallengeExists(listingHash)) {
        return Reject("Exit", listingHash, sender, Status::InvalidPhase("challenge in progress"));
    }

    Status s = RemoveListing(listingHash);
    if (!s.ok()) {
        return Reject("Exit", listingHash, sender, s);
    }

    LOG_INFO(util::LogCategory::REGISTRY) << "Listing " << listingHash.ToHex()
                                          << " withdrawn by its owner";
    if (eventLog_) {
        eventLog_->Emit(events::ListingWithdrawn{listingHash, sender});
    }
    return Status::Ok();
}

void Registry::Whitelist(Listing& listing) {
    if (listing.whitelisted) {
        return;
    }
    listing.whitelisted = true;

    LOG_INFO(util::LogCategory::REGISTRY) << "Listing " << listing.id.ToHex() << " whitelisted";
    if (eventLog_) {
        eventLog_->Emit(events::ApplicationWhitelisted{listing.id});
    }
}

Status Registry::RemoveListing(const ListingHash& listingHash) {
    auto it = listings_.find(listingHash);
    if (it == listings_.end()) {
        return Status::NoSuchListing();
    }
    const Listing& listing = it->second;

    Status s = PayOut({{listing.owner, listing.unstakedDeposit}});
    if (!s.ok()) {
        return s;
    }

    bool wasWhitelisted = listing.whitelisted;
    listings_.erase(it);
    lastChallenge_.erase(listingHash);

    LOG_INFO(util::LogCategory::REGISTRY) << (wasWhitelisted ? "Listing " : "Application ")
                                          << listingHash.ToHex() << " removed";
    if (eventLog_) {
        if (wasWhitelisted) {
            eventLog_->Emit(events::ListingRemoved{listingHash});
        } else {
            eventLog_->Emit(events::ApplicationRemoved{listingHash});
        }
    }
    return Status::Ok();
}

// ============================================================================
// Challenges
// ============================================================================

Status Registry::Challenge(const Address& sender, const ListingHash& listingHash,
                           const std::string& data, ChallengeId* challengeId) {
    auto it = listings_.find(listingHash);
    if (it == listings_.end()) {
        return Reject("Challenge", listingHash, sender, Status::NoSuchListing());
    }
    if (ChallengeExists(listingHash)) {
        return Reject("Challenge", listingHash, sender,
                      Status::InvalidPhase("listing already challenged"));
    }

    Amount minDeposit = params_->Get(ParamName::MIN_DEPOSIT);

    // Deposit eroded by a minDeposit increase: remove instead of challenging
    if (it->second.unstakedDeposit < minDeposit) {
        Status s = RemoveListing(listingHash);
        if (!s.ok()) {
            return Reject("Challenge", listingHash, sender, s);
        }
        LOG_INFO(util::LogCategory::REGISTRY) << "Listing " << listingHash.ToHex()
                                              << " touched and removed";
        if (eventLog_) {
            eventLog_->Emit(events::TouchAndRemoved{listingHash});
        }
        *challengeId = 0;
        return Status::Ok();
    }

    uint64_t dispensationPct = params_->Get(ParamName::DISPENSATION_PCT);
    if (dispensationPct > fixedpoint::PERCENT) {
        return Reject("Challenge", listingHash, sender,
                      Status::InvalidArgument("dispensationPct above 100"));
    }
    Amount rewardPool = 0;
    Status s = fixedpoint::MultiplyByPercentage(minDeposit, fixedpoint::PERCENT - dispensationPct,
                                                &rewardPool);
    if (!s.ok()) {
        return Reject("Challenge", listingHash, sender, s);
    }

    if (token_->BalanceOf(sender) < minDeposit ||
        token_->Allowance(sender, address_) < minDeposit) {
        return Reject("Challenge", listingHash, sender,
                      Status::InsufficientFunds("challenger cannot cover minDeposit"));
    }

    PollId pollId = 0;
    s = voting_->StartPoll(address_, params_->Get(ParamName::VOTE_QUORUM),
                           params_->Get(ParamName::COMMIT_STAGE_LEN),
                           params_->Get(ParamName::REVEAL_STAGE_LEN),
                           &pollId);
    if (!s.ok()) {
        return Reject("Challenge", listingHash, sender, s);
    }

    s = Escrow(sender, minDeposit);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::REGISTRY) << "Challenger stake for poll " << pollId
                                               << " refused after precheck";
        return s;
    }

    registry::Challenge challenge;
    challenge.id = pollId;
    challenge.listing = listingHash;
    challenge.challenger = sender;
    challenge.rewardPool = rewardPool;
    challenge.stake = minDeposit;
    challenge.epochNumber = pollId;
    challenges_[pollId] = challenge;

    Listing& listing = it->second;
    listing.challengeId = pollId;
    listing.unstakedDeposit -= minDeposit;
    lastChallenge_[listingHash] = pollId;

    auto poll = voting_->GetPoll(pollId);
    Timestamp commitEnd = poll ? poll->commitEndDate : 0;
    Timestamp revealEnd = poll ? poll->revealEndDate : 0;

    LOG_INFO(util::LogCategory::REGISTRY) << "Challenge " << pollId << " against "
                                          << listingHash.ToHex() << " by " << sender.ToHex()
                                          << ", stake " << minDeposit << ", reward pool "
                                          << rewardPool;
    if (eventLog_) {
        eventLog_->Emit(events::ChallengeCreated{listingHash, pollId, data, commitEnd,
                                                 revealEnd, sender});
    }

    *challengeId = pollId;
    return Status::Ok();
}

Status Registry::UpdateStatus(const Address& sender, const ListingHash& listingHash) {
    auto it = listings_.find(listingHash);
    if (it == listings_.end()) {
        // A listing removed by its challenge stays settled
        auto last = lastChallenge_.find(listingHash);
        if (last != lastChallenge_.end() && challenges_.at(last->second).resolved) {
            return Status::Ok();
        }
        return Reject("UpdateStatus", listingHash, sender, Status::NoSuchListing());
    }

    if (CanBeWhitelisted(listingHash)) {
        Whitelist(it->second);
        return Status::Ok();
    }
    if (ChallengeCanBeResolved(listingHash)) {
        Status s = Resolve(it->second);
        if (!s.ok()) {
            return Reject("UpdateStatus", listingHash, sender, s);
        }
        return Status::Ok();
    }
    if (it->second.whitelisted && !ChallengeExists(listingHash)) {
        return Status::Ok();
    }
    return Reject("UpdateStatus", listingHash, sender, Status::InvalidPhase("called too early"));
}

Status Registry::ResolveChallenge(const Address& sender, const ListingHash& listingHash) {
    auto it = listings_.find(listingHash);
    ChallengeId id = 0;
    if (it != listings_.end()) {
        id = it->second.challengeId;
    } else {
        auto last = lastChallenge_.find(listingHash);
        if (last != lastChallenge_.end()) {
            id = last->second;
        }
    }

    auto challengeIt = challenges_.find(id);
    if (challengeIt == challenges_.end()) {
        return Reject("ResolveChallenge", listingHash, sender, Status::NoSuchChallenge());
    }
    if (challengeIt->second.resolved) {
        return Reject("ResolveChallenge", listingHash, sender, Status::AlreadyResolved());
    }
    if (!voting_->PollEnded(id)) {
        return Reject("ResolveChallenge", listingHash, sender,
                      Status::InvalidPhase("poll has not ended"));
    }
    if (it == listings_.end()) {
        return Reject("ResolveChallenge", listingHash, sender, Status::NoSuchListing());
    }

    Status s = Resolve(it->second);
    if (!s.ok()) {
        return Reject("ResolveChallenge", listingHash, sender, s);
    }
    return Status::Ok();
}

Status Registry::Resolve(Listing& listing) {
    ChallengeId id = listing.challengeId;
    registry::Challenge& challenge = challenges_.at(id);

    Amount reward = 0;
    Status s = DetermineReward(id, &reward);
    if (!s.ok()) {
        return s;
    }
    bool passed = false;
    s = voting_->IsPassed(id, &passed);
    if (!s.ok()) {
        return s;
    }
    Amount winningTokens = 0;
    s = voting_->GetTotalNumberOfTokensForWinningOption(id, &winningTokens);
    if (!s.ok()) {
        return s;
    }

    ListingHash listingHash = listing.id;
    if (passed) {
        Amount newDeposit = 0;
        s = fixedpoint::CheckedAdd(listing.unstakedDeposit, reward, &newDeposit);
        if (!s.ok()) {
            return s;
        }
        challenge.resolved = true;
        challenge.totalTokens = winningTokens;
        Whitelist(listing);
        listing.unstakedDeposit = newDeposit;

        LOG_INFO(util::LogCategory::REGISTRY) << "Challenge " << id << " failed, "
                                              << listingHash.ToHex() << " keeps its place and "
                                              << reward << " tokens";
        if (eventLog_) {
            eventLog_->Emit(events::ChallengeFailed{listingHash, id, challenge.rewardPool,
                                                    winningTokens});
        }
        return Status::Ok();
    }

    // The challenger's reward and the owner's remaining deposit leave together
    s = PayOut({{listing.owner, listing.unstakedDeposit}, {challenge.challenger, reward}});
    if (!s.ok()) {
        return s;
    }
    challenge.resolved = true;
    challenge.totalTokens = winningTokens;

    bool wasWhitelisted = listing.whitelisted;
    listings_.erase(listingHash);

    LOG_INFO(util::LogCategory::REGISTRY) << "Challenge " << id << " succeeded, "
                                          << listingHash.ToHex() << " removed, challenger paid "
                                          << reward;
    if (eventLog_) {
        if (wasWhitelisted) {
            eventLog_->Emit(events::ListingRemoved{listingHash});
        } else {
            eventLog_->Emit(events::ApplicationRemoved{listingHash});
        }
        eventLog_->Emit(events::ChallengeSucceeded{listingHash, id, challenge.rewardPool,
                                                   winningTokens});
    }
    return Status::Ok();
}

Status Registry::DetermineReward(ChallengeId challengeId, Amount* reward) const {
    auto it = challenges_.find(challengeId);
    if (it == challenges_.end()) {
        return Status::NoSuchChallenge();
    }
    const registry::Challenge& challenge = it->second;
    if (challenge.resolved) {
        return Status::AlreadyResolved();
    }

    Amount winningTokens = 0;
    Status s = voting_->GetTotalNumberOfTokensForWinningOption(challengeId, &winningTokens);
    if (!s.ok()) {
        return s;
    }

    Amount pot = 0;
    s = fixedpoint::CheckedAdd(challenge.stake, challenge.stake, &pot);
    if (!s.ok()) {
        return s;
    }
    // Nobody to share the pool with: the winner takes the whole pot
    *reward = winningTokens == 0 ? pot : pot - challenge.rewardPool;
    return Status::Ok();
}

// ============================================================================
// Voter rewards
// ============================================================================

Status Registry::ComputeVoterReward(const Address& voter, const registry::Challenge& challenge,
                                    Salt salt, Amount* voterTokens, Amount* reward) const {
    Amount tokens = 0;
    Status s = voting_->GetNumPassingTokens(voter, challenge.id, salt, &tokens);
    if (!s.ok()) {
        return s;
    }

    Amount total = challenge.totalTokens;
    if (bank_ && bank_->HasSnapshot(challenge.epochNumber)) {
        total = bank_->GetEpochTotalTokens(challenge.epochNumber);
    }

    Amount share = 0;
    s = fixedpoint::ProportionalShare(challenge.rewardPool, tokens, total, &share);
    if (!s.ok()) {
        return s;
    }
    *voterTokens = tokens;
    *reward = share;
    return Status::Ok();
}

Status Registry::VoterReward(const Address& voter, ChallengeId challengeId, Salt salt,
                             Amount* reward) const {
    auto it = challenges_.find(challengeId);
    if (it == challenges_.end() || !it->second.resolved) {
        return Status::NoSuchChallenge();
    }
    Amount voterTokens = 0;
    return ComputeVoterReward(voter, it->second, salt, &voterTokens, reward);
}

Status Registry::ClaimReward(const Address& sender, ChallengeId challengeId, Salt salt) {
    auto it = challenges_.find(challengeId);
    if (it == challenges_.end() || !it->second.resolved) {
        return Reject("ClaimReward", challengeId, sender,
                      Status::NoSuchChallenge("no resolved challenge"));
    }
    registry::Challenge& challenge = it->second;
    if (challenge.tokenClaims.count(sender) > 0) {
        return Reject("ClaimReward", challengeId, sender, Status::AlreadyClaimed());
    }

    Amount voterTokens = 0;
    Amount reward = 0;
    Status s = ComputeVoterReward(sender, challenge, salt, &voterTokens, &reward);
    if (!s.ok()) {
        return Reject("ClaimReward", challengeId, sender, s);
    }

    if (bank_) {
        if (!bank_->IsAuthorizedWriter(address_)) {
            return Reject("ClaimReward", challengeId, sender,
                          Status::NotOwner("registry may not record epochs"));
        }
        if (bank_->HasVoterTokens(challenge.epochNumber, sender)) {
            return Reject("ClaimReward", challengeId, sender, Status::AlreadyClaimed());
        }
    }
    if (token_->BalanceOf(address_) < reward) {
        LOG_ERROR(util::LogCategory::REGISTRY) << "Escrow cannot cover reward of " << reward
                                               << " for challenge " << challengeId;
        return Status::InsufficientFunds("registry escrow cannot cover reward");
    }

    s = PayOut({{sender, reward}});
    if (!s.ok()) {
        return Reject("ClaimReward", challengeId, sender, s);
    }
    challenge.tokenClaims.insert(sender);

    // Writer and duplicate checks above leave the bank nothing to refuse
    if (bank_) {
        s = bank_->SnapshotEpoch(address_, challenge.epochNumber, challenge.totalTokens);
        if (s.ok()) {
            s = bank_->AddVoterTokens(address_, challenge.epochNumber, sender, voterTokens);
        }
        if (!s.ok()) {
            LOG_ERROR(util::LogCategory::REGISTRY) << "Bank refused epoch "
                                                   << challenge.epochNumber << " after payout: "
                                                   << s.ToString();
            return s;
        }
    }

    LOG_INFO(util::LogCategory::REGISTRY) << sender.ToHex() << " claimed " << reward
                                          << " from challenge " << challengeId;
    if (eventLog_) {
        eventLog_->Emit(events::RewardClaimed{challengeId, reward, sender});
    }
    return Status::Ok();
}

// ============================================================================
// Queries
// ============================================================================

bool Registry::IsWhitelisted(const ListingHash& listingHash) const {
    auto it = listings_.find(listingHash);
    return it != listings_.end() && it->second.whitelisted;
}

bool Registry::AppWasMade(const ListingHash& listingHash) const {
    auto it = listings_.find(listingHash);
    return it != listings_.end() && it->second.applicationExpiry > 0;
}

bool Registry::ChallengeExists(const ListingHash& listingHash) const {
    auto it = listings_.find(listingHash);
    if (it == listings_.end() || it->second.challengeId == 0) {
        return false;
    }
    auto challengeIt = challenges_.find(it->second.challengeId);
    return challengeIt != challenges_.end() && !challengeIt->second.resolved;
}

bool Registry::ChallengeCanBeResolved(const ListingHash& listingHash) const {
    if (!ChallengeExists(listingHash)) {
        return false;
    }
    return voting_->PollEnded(listings_.at(listingHash).challengeId);
}

bool Registry::CanBeWhitelisted(const ListingHash& listingHash) const {
    auto it = listings_.find(listingHash);
    if (it == listings_.end() || it->second.whitelisted) {
        return false;
    }
    return AppWasMade(listingHash) &&
           it->second.applicationExpiry <= util::GetTime() &&
           !ChallengeExists(listingHash);
}

bool Registry::TokenClaims(ChallengeId challengeId, const Address& voter) const {
    auto it = challenges_.find(challengeId);
    return it != challenges_.end() && it->second.tokenClaims.count(voter) > 0;
}

ListingState Registry::GetListingState(const ListingHash& listingHash) const {
    auto it = listings_.find(listingHash);
    if (it == listings_.end()) {
        return ListingState::Unlisted;
    }
    if (ChallengeExists(listingHash)) {
        return ListingState::Challenged;
    }
    return it->second.whitelisted ? ListingState::Whitelisted : ListingState::Applied;
}

std::optional<Listing> Registry::GetListing(const ListingHash& listingHash) const {
    auto it = listings_.find(listingHash);
    if (it == listings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<registry::Challenge> Registry::GetChallenge(ChallengeId challengeId) const {
    auto it = challenges_.find(challengeId);
    if (it == challenges_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace registry
} // namespace tcr
