// TCR - Parameterizer Implementation
// Copyright (c) 2024 TCR Developers
// MIT License

#include "tcr/governance/parameterizer.h"
#include "tcr/bank/bank.h"
#include "tcr/core/fixedpoint.h"
#include "tcr/crypto/hasher.h"
#include "tcr/events/events.h"
#include "tcr/token/token.h"
#include "tcr/util/logging.h"
#include "tcr/util/time.h"
#include "tcr/voting/poll_engine.h"

namespace tcr {
namespace governance {

namespace ParamName = registry::ParamName;

namespace {

Status Reject(const char* op, const Hash256& propId, const Address& sender, Status status) {
    LOG_DEBUG(util::LogCategory::PARAMS) << op << " on proposal " << propId.ToHex().substr(0, 16)
                                         << " by " << sender.ToHex() << " rejected: "
                                         << status.ToString();
    return status;
}

Status Reject(const char* op, ChallengeId challengeId, const Address& sender, Status status) {
    LOG_DEBUG(util::LogCategory::PARAMS) << op << " on challenge " << challengeId << " by "
                                         << sender.ToHex() << " rejected: "
                                         << status.ToString();
    return status;
}

} // anonymous namespace

Parameterizer::Parameterizer(std::shared_ptr<token::TokenLedger> token,
                             std::shared_ptr<voting::PollEngine> voting,
                             std::shared_ptr<bank::Bank> bank,
                             const registry::ParamDefaults& defaults,
                             const Address& address,
                             std::shared_ptr<events::EventLog> eventLog)
    : token_(std::move(token))
    , voting_(std::move(voting))
    , bank_(std::move(bank))
    , address_(address)
    , eventLog_(std::move(eventLog))
    , params_(defaults.ToMap()) {}

uint64_t Parameterizer::Get(const std::string& name) const {
    auto it = params_.find(name);
    return it != params_.end() ? it->second : 0;
}

void Parameterizer::Set(const std::string& name, uint64_t value) {
    LOG_INFO(util::LogCategory::PARAMS) << name << " changed from " << Get(name) << " to "
                                        << value;
    params_[name] = value;
}

Status Parameterizer::PayOut(const Payments& payments) {
    Amount total = 0;
    for (const auto& payment : payments) {
        Status s = fixedpoint::CheckedAdd(total, payment.second, &total);
        if (!s.ok()) {
            return s;
        }
    }
    if (token_->BalanceOf(address_) < total) {
        LOG_ERROR(util::LogCategory::PARAMS) << "Parameterizer escrow holds "
                                             << token_->BalanceOf(address_)
                                             << ", cannot pay out " << total;
        return Status::InsufficientFunds("parameterizer escrow cannot cover payout");
    }
    for (const auto& [to, amount] : payments) {
        if (amount > 0 && !token_->Transfer(address_, to, amount)) {
            LOG_ERROR(util::LogCategory::PARAMS) << "Payout of " << amount << " to "
                                                 << to.ToHex() << " refused";
            return Status::InsufficientFunds("payout refused");
        }
    }
    return Status::Ok();
}

// ============================================================================
// Proposals
// ============================================================================

Status Parameterizer::ProposeReparameterization(const Address& sender, const std::string& name,
                                                uint64_t value, Hash256* propId) {
    Hash256 id = crypto::ComputeProposalId(voting_->GetHasher(), name, value);

    Status s = registry::ValidateParameter(name, value);
    if (!s.ok()) {
        return Reject("Propose", id, sender, s);
    }
    if (Get(name) == value) {
        return Reject("Propose", id, sender,
                      Status::InvalidArgument(name + " already has this value"));
    }
    if (PropExists(id)) {
        return Reject("Propose", id, sender, Status::InvalidPhase("proposal already exists"));
    }

    Timestamp appExpiry = 0;
    Timestamp commitEnd = 0;
    Timestamp revealEnd = 0;
    Timestamp processBy = 0;
    s = fixedpoint::CheckedDeadline(util::GetTime(), Get(ParamName::P_APPLY_STAGE_LEN),
                                    &appExpiry);
    if (s.ok()) {
        s = fixedpoint::CheckedDeadline(appExpiry, Get(ParamName::P_COMMIT_STAGE_LEN),
                                        &commitEnd);
    }
    if (s.ok()) {
        s = fixedpoint::CheckedDeadline(commitEnd, Get(ParamName::P_REVEAL_STAGE_LEN),
                                        &revealEnd);
    }
    if (s.ok()) {
        s = fixedpoint::CheckedDeadline(revealEnd, PROCESS_BY_WINDOW, &processBy);
    }
    if (!s.ok()) {
        return Reject("Propose", id, sender, s);
    }

    Amount deposit = Get(ParamName::P_MIN_DEPOSIT);
    if (!token_->TransferFrom(address_, sender, address_, deposit)) {
        return Reject("Propose", id, sender,
                      Status::InsufficientFunds("proposer cannot cover pMinDeposit"));
    }

    ParamProposal proposal;
    proposal.id = id;
    proposal.name = name;
    proposal.value = value;
    proposal.owner = sender;
    proposal.deposit = deposit;
    proposal.appExpiry = appExpiry;
    proposal.processBy = processBy;
    proposals_[id] = proposal;

    LOG_INFO(util::LogCategory::PARAMS) << "Proposal " << name << "=" << value << " by "
                                        << sender.ToHex() << ", challengeable until "
                                        << util::FormatISO8601(proposal.appExpiry);
    if (eventLog_) {
        eventLog_->Emit(events::ReparameterizationProposal{name, value, id, deposit,
                                                           proposal.appExpiry, sender});
    }

    *propId = id;
    return Status::Ok();
}

Status Parameterizer::ChallengeReparameterization(const Address& sender, const Hash256& propId,
                                                  ChallengeId* challengeId) {
    auto it = proposals_.find(propId);
    if (it == proposals_.end()) {
        return Reject("Challenge", propId, sender, Status::NoSuchProposal());
    }
    ParamProposal& proposal = it->second;
    if (proposal.challengeId != 0) {
        return Reject("Challenge", propId, sender,
                      Status::InvalidPhase("proposal already challenged"));
    }
    if (util::GetTime() >= proposal.appExpiry) {
        return Reject("Challenge", propId, sender,
                      Status::InvalidPhase("application stage is over"));
    }

    uint64_t dispensationPct = Get(ParamName::P_DISPENSATION_PCT);
    if (dispensationPct > fixedpoint::PERCENT) {
        return Reject("Challenge", propId, sender,
                      Status::InvalidArgument("pDispensationPct above 100"));
    }
    Amount rewardPool = 0;
    Status s = fixedpoint::MultiplyByPercentage(proposal.deposit,
                                                fixedpoint::PERCENT - dispensationPct,
                                                &rewardPool);
    if (!s.ok()) {
        return Reject("Challenge", propId, sender, s);
    }

    if (token_->BalanceOf(sender) < proposal.deposit ||
        token_->Allowance(sender, address_) < proposal.deposit) {
        return Reject("Challenge", propId, sender,
                      Status::InsufficientFunds("challenger cannot match the deposit"));
    }

    PollId pollId = 0;
    s = voting_->StartPoll(address_, Get(ParamName::P_VOTE_QUORUM),
                           Get(ParamName::P_COMMIT_STAGE_LEN),
                           Get(ParamName::P_REVEAL_STAGE_LEN),
                           &pollId);
    if (!s.ok()) {
        return Reject("Challenge", propId, sender, s);
    }
    if (!token_->TransferFrom(address_, sender, address_, proposal.deposit)) {
        LOG_ERROR(util::LogCategory::PARAMS) << "Challenger stake for poll " << pollId
                                             << " refused after precheck";
        return Status::InsufficientFunds("challenger stake refused");
    }

    ParamChallenge challenge;
    challenge.id = pollId;
    challenge.propId = propId;
    challenge.challenger = sender;
    challenge.rewardPool = rewardPool;
    challenge.stake = proposal.deposit;
    challenges_[pollId] = challenge;
    proposal.challengeId = pollId;

    auto poll = voting_->GetPoll(pollId);
    LOG_INFO(util::LogCategory::PARAMS) << "Proposal " << proposal.name << "=" << proposal.value
                                        << " challenged by " << sender.ToHex() << " (poll "
                                        << pollId << ")";
    if (eventLog_) {
        eventLog_->Emit(events::NewChallenge{propId, pollId,
                                             poll ? poll->commitEndDate : 0,
                                             poll ? poll->revealEndDate : 0, sender});
    }

    *challengeId = pollId;
    return Status::Ok();
}

Status Parameterizer::ProcessProposal(const Address& sender, const Hash256& propId) {
    auto it = proposals_.find(propId);
    if (it == proposals_.end()) {
        return Reject("ProcessProposal", propId, sender, Status::NoSuchProposal());
    }
    const ParamProposal proposal = it->second;

    if (CanBeSet(propId)) {
        Status s = PayOut({{proposal.owner, proposal.deposit}});
        if (!s.ok()) {
            return Reject("ProcessProposal", propId, sender, s);
        }
        Set(proposal.name, proposal.value);
        proposals_.erase(propId);
        if (eventLog_) {
            eventLog_->Emit(events::ProposalAccepted{propId, proposal.name, proposal.value});
        }
        return Status::Ok();
    }

    if (ChallengeCanBeResolved(propId)) {
        Status s = ResolveChallenge(proposal);
        if (!s.ok()) {
            return Reject("ProcessProposal", propId, sender, s);
        }
        proposals_.erase(propId);
        return Status::Ok();
    }

    if (proposal.challengeId == 0 && util::GetTime() >= proposal.processBy) {
        Status s = PayOut({{proposal.owner, proposal.deposit}});
        if (!s.ok()) {
            return Reject("ProcessProposal", propId, sender, s);
        }
        proposals_.erase(propId);

        LOG_INFO(util::LogCategory::PARAMS) << "Proposal " << proposal.name << "="
                                            << proposal.value << " expired";
        if (eventLog_) {
            eventLog_->Emit(events::ProposalExpired{propId});
        }
        return Status::Ok();
    }

    return Reject("ProcessProposal", propId, sender, Status::InvalidPhase("called too early"));
}

Status Parameterizer::ResolveChallenge(const ParamProposal& proposal) {
    ParamChallenge& challenge = challenges_.at(proposal.challengeId);

    Amount reward = 0;
    Status s = ChallengeWinnerReward(challenge.id, &reward);
    if (!s.ok()) {
        return s;
    }
    bool passed = false;
    s = voting_->IsPassed(challenge.id, &passed);
    if (!s.ok()) {
        return s;
    }
    Amount winningTokens = 0;
    s = voting_->GetTotalNumberOfTokensForWinningOption(challenge.id, &winningTokens);
    if (!s.ok()) {
        return s;
    }

    s = PayOut({{passed ? proposal.owner : challenge.challenger, reward}});
    if (!s.ok()) {
        return s;
    }
    challenge.resolved = true;
    challenge.winningTokens = winningTokens;

    if (passed) {
        // Too late to apply, the proposer still wins the challenge
        if (util::GetTime() < proposal.processBy) {
            Set(proposal.name, proposal.value);
        }
        LOG_INFO(util::LogCategory::PARAMS) << "Challenge " << challenge.id << " failed, "
                                            << "proposer paid " << reward;
        if (eventLog_) {
            eventLog_->Emit(events::ParamChallengeFailed{proposal.id, challenge.id,
                                                         challenge.rewardPool, winningTokens});
        }
    } else {
        LOG_INFO(util::LogCategory::PARAMS) << "Challenge " << challenge.id << " succeeded, "
                                            << "challenger paid " << reward;
        if (eventLog_) {
            eventLog_->Emit(events::ParamChallengeSucceeded{proposal.id, challenge.id,
                                                            challenge.rewardPool, winningTokens});
        }
    }
    return Status::Ok();
}

Status Parameterizer::ChallengeWinnerReward(ChallengeId challengeId, Amount* reward) const {
    auto it = challenges_.find(challengeId);
    if (it == challenges_.end()) {
        return Status::NoSuchChallenge();
    }
    const ParamChallenge& challenge = it->second;
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
    *reward = winningTokens == 0 ? pot : pot - challenge.rewardPool;
    return Status::Ok();
}

// ============================================================================
// Voter rewards
// ============================================================================

Status Parameterizer::ComputeVoterReward(const Address& voter, const ParamChallenge& challenge,
                                         Salt salt, Amount* voterTokens, Amount* reward) const {
    Amount tokens = 0;
    Status s = voting_->GetNumPassingTokens(voter, challenge.id, salt, &tokens);
    if (!s.ok()) {
        return s;
    }

    Amount total = challenge.winningTokens;
    if (bank_ && bank_->HasSnapshot(challenge.id)) {
        total = bank_->GetEpochTotalTokens(challenge.id);
    }
    s = fixedpoint::ProportionalShare(challenge.rewardPool, tokens, total, reward);
    if (!s.ok()) {
        return s;
    }
    *voterTokens = tokens;
    return Status::Ok();
}

Status Parameterizer::VoterReward(const Address& voter, ChallengeId challengeId, Salt salt,
                                  Amount* reward) const {
    auto it = challenges_.find(challengeId);
    if (it == challenges_.end() || !it->second.resolved) {
        return Status::NoSuchChallenge();
    }
    Amount voterTokens = 0;
    return ComputeVoterReward(voter, it->second, salt, &voterTokens, reward);
}

Status Parameterizer::ClaimReward(const Address& sender, ChallengeId challengeId, Salt salt) {
    auto it = challenges_.find(challengeId);
    if (it == challenges_.end() || !it->second.resolved) {
        return Reject("ClaimReward", challengeId, sender,
                      Status::NoSuchChallenge("no resolved challenge"));
    }
    ParamChallenge& challenge = it->second;
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
                          Status::NotOwner("parameterizer may not record epochs"));
        }
        if (bank_->HasVoterTokens(challenge.id, sender)) {
            return Reject("ClaimReward", challengeId, sender, Status::AlreadyClaimed());
        }
    }
    if (token_->BalanceOf(address_) < reward) {
        LOG_ERROR(util::LogCategory::PARAMS) << "Escrow cannot cover reward of " << reward
                                             << " for challenge " << challengeId;
        return Status::InsufficientFunds("parameterizer escrow cannot cover reward");
    }

    s = PayOut({{sender, reward}});
    if (!s.ok()) {
        return Reject("ClaimReward", challengeId, sender, s);
    }
    challenge.tokenClaims.insert(sender);

    // Writer and duplicate checks above leave the bank nothing to refuse
    if (bank_) {
        s = bank_->SnapshotEpoch(address_, challenge.id, challenge.winningTokens);
        if (s.ok()) {
            s = bank_->AddVoterTokens(address_, challenge.id, sender, voterTokens);
        }
        if (!s.ok()) {
            LOG_ERROR(util::LogCategory::PARAMS) << "Bank refused epoch " << challenge.id
                                                 << " after payout: " << s.ToString();
            return s;
        }
    }

    LOG_INFO(util::LogCategory::PARAMS) << sender.ToHex() << " claimed " << reward
                                        << " from parameter challenge " << challengeId;
    if (eventLog_) {
        eventLog_->Emit(events::ParamRewardClaimed{challengeId, reward, sender});
    }
    return Status::Ok();
}

// ============================================================================
// Queries
// ============================================================================

bool Parameterizer::CanBeSet(const Hash256& propId) const {
    auto it = proposals_.find(propId);
    if (it == proposals_.end()) {
        return false;
    }
    Timestamp now = util::GetTime();
    return it->second.challengeId == 0 &&
           now >= it->second.appExpiry &&
           now < it->second.processBy;
}

bool Parameterizer::PropExists(const Hash256& propId) const {
    return proposals_.count(propId) > 0;
}

bool Parameterizer::ChallengeCanBeResolved(const Hash256& propId) const {
    auto it = proposals_.find(propId);
    if (it == proposals_.end() || it->second.challengeId == 0) {
        return false;
    }
    auto challengeIt = challenges_.find(it->second.challengeId);
    return challengeIt != challenges_.end() && !challengeIt->second.resolved &&
           voting_->PollEnded(it->second.challengeId);
}

bool Parameterizer::TokenClaims(ChallengeId challengeId, const Address& voter) const {
    auto it = challenges_.find(challengeId);
    return it != challenges_.end() && it->second.tokenClaims.count(voter) > 0;
}

std::optional<ParamProposal> Parameterizer::GetProposal(const Hash256& propId) const {
    auto it = proposals_.find(propId);
    if (it == proposals_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ParamChallenge> Parameterizer::GetChallenge(ChallengeId challengeId) const {
    auto it = challenges_.find(challengeId);
    if (it == challenges_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace governance
} // namespace tcr
