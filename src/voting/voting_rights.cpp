// TCR - Voting Rights Ledger Implementation
// Copyright (c) 2024 TCR Developers
// MIT License

#include "tcr/voting/voting_rights.h"
#include "tcr/events/events.h"
#include "tcr/token/token.h"
#include "tcr/util/logging.h"

#include <algorithm>
#include <string>

namespace tcr {
namespace voting {

namespace {

Status Reject(const char* op, const Address& voter, Status status) {
    LOG_DEBUG(util::LogCategory::VOTING) << op << " by " << voter.ToHex()
                                         << " rejected: " << status.ToString();
    return status;
}

} // anonymous namespace

VotingRights::VotingRights(std::shared_ptr<token::TokenLedger> token,
                           const Address& escrowAddress,
                           std::shared_ptr<events::EventLog> eventLog)
    : token_(std::move(token))
    , escrow_(escrowAddress)
    , eventLog_(std::move(eventLog)) {}

Status VotingRights::RequestVotingRights(const Address& voter, Amount amount) {
    if (amount == 0) {
        return Reject("RequestVotingRights", voter,
                      Status::InvalidArgument("zero voting rights"));
    }
    if (!token_->TransferFrom(escrow_, voter, escrow_, amount)) {
        return Reject("RequestVotingRights", voter,
                      Status::InsufficientFunds("token transfer refused"));
    }

    accounts_[voter].deposited += amount;

    LOG_INFO(util::LogCategory::VOTING) << voter.ToHex() << " escrowed " << amount
                                        << " voting rights";
    if (eventLog_) {
        eventLog_->Emit(events::VotingRightsGranted{amount, voter});
    }
    return Status::Ok();
}

Status VotingRights::WithdrawVotingRights(const Address& voter, Amount amount) {
    Amount available = GetAvailableTokens(voter);
    if (amount > available) {
        return Reject("WithdrawVotingRights", voter,
                      Status::InsufficientUnlocked("requested " + std::to_string(amount) +
                                                   ", unlocked " + std::to_string(available)));
    }
    if (amount == 0) {
        return Reject("WithdrawVotingRights", voter,
                      Status::InvalidArgument("zero withdrawal"));
    }
    if (!token_->Transfer(escrow_, voter, amount)) {
        LOG_ERROR(util::LogCategory::VOTING) << "Escrow could not return " << amount
                                             << " to " << voter.ToHex();
        return Status::InsufficientFunds("escrow transfer refused");
    }

    accounts_[voter].deposited -= amount;

    LOG_INFO(util::LogCategory::VOTING) << voter.ToHex() << " withdrew " << amount
                                        << " voting rights";
    if (eventLog_) {
        eventLog_->Emit(events::VotingRightsWithdrawn{amount, voter});
    }
    return Status::Ok();
}

Amount VotingRights::GetBalance(const Address& voter) const {
    auto it = accounts_.find(voter);
    return it != accounts_.end() ? it->second.deposited : 0;
}

Amount VotingRights::GetLockedTokens(const Address& voter) const {
    auto it = accounts_.find(voter);
    return it != accounts_.end() ? it->second.locked : 0;
}

Amount VotingRights::GetAvailableTokens(const Address& voter) const {
    auto it = accounts_.find(voter);
    if (it == accounts_.end()) {
        return 0;
    }
    return it->second.deposited - it->second.locked;
}

Status VotingRights::Lock(const Address& voter, Amount amount, Amount replacing) {
    Account& account = accounts_[voter];
    Amount released = std::min(replacing, account.locked);
    if (amount > account.deposited - account.locked + released) {
        return Status::InsufficientRights("commit exceeds unlocked voting rights");
    }
    account.locked = account.locked - released + amount;
    return Status::Ok();
}

void VotingRights::Unlock(const Address& voter, Amount amount) {
    auto it = accounts_.find(voter);
    if (it == accounts_.end()) {
        return;
    }
    it->second.locked -= std::min(amount, it->second.locked);
}

} // namespace voting
} // namespace tcr
