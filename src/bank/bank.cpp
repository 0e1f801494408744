// TCR - Epoch Ledger Implementation
// Copyright (c) 2024 TCR Developers
// MIT License

#include "tcr/bank/bank.h"
#include "tcr/events/events.h"
#include "tcr/util/logging.h"

namespace tcr {
namespace bank {

Bank::Bank(std::shared_ptr<events::EventLog> eventLog)
    : eventLog_(std::move(eventLog)) {}

void Bank::AuthorizeWriter(const Address& writer) {
    writers_.insert(writer);
}

bool Bank::IsAuthorizedWriter(const Address& writer) const {
    return writers_.count(writer) > 0;
}

Status Bank::SnapshotEpoch(const Address& caller, EpochNumber epoch, Amount totalTokens) {
    if (!IsAuthorizedWriter(caller)) {
        LOG_DEBUG(util::LogCategory::BANK) << "Snapshot of epoch " << epoch
                                           << " refused for " << caller.ToHex();
        return Status::NotOwner("not an authorized bank writer");
    }

    Epoch& record = epochs_[epoch];
    record.number = epoch;
    if (record.snapshotTaken) {
        return Status::Ok();
    }
    record.snapshotTaken = true;
    record.totalTokens = totalTokens;

    LOG_INFO(util::LogCategory::BANK) << "Epoch " << epoch << " snapshot: "
                                      << totalTokens << " winning tokens";
    if (eventLog_) {
        eventLog_->Emit(events::EpochSnapshot{epoch, totalTokens});
    }
    return Status::Ok();
}

Status Bank::AddVoterTokens(const Address& caller, EpochNumber epoch,
                            const Address& voter, Amount tokens) {
    if (!IsAuthorizedWriter(caller)) {
        LOG_DEBUG(util::LogCategory::BANK) << "Voter tokens for epoch " << epoch
                                           << " refused for " << caller.ToHex();
        return Status::NotOwner("not an authorized bank writer");
    }
    if (HasVoterTokens(epoch, voter)) {
        return Status::AlreadyClaimed("voter already recorded in epoch");
    }

    Epoch& record = epochs_[epoch];
    record.number = epoch;
    record.voterTokens[voter] = tokens;

    LOG_DEBUG(util::LogCategory::BANK) << "Epoch " << epoch << ": " << voter.ToHex()
                                       << " contributed " << tokens;
    if (eventLog_) {
        eventLog_->Emit(events::VoterTokensRecorded{epoch, voter, tokens});
    }
    return Status::Ok();
}

bool Bank::HasSnapshot(EpochNumber epoch) const {
    auto it = epochs_.find(epoch);
    return it != epochs_.end() && it->second.snapshotTaken;
}

Amount Bank::GetEpochTotalTokens(EpochNumber epoch) const {
    auto it = epochs_.find(epoch);
    return it != epochs_.end() ? it->second.totalTokens : 0;
}

Amount Bank::GetEpochVoterTokens(EpochNumber epoch, const Address& voter) const {
    auto it = epochs_.find(epoch);
    if (it == epochs_.end()) {
        return 0;
    }
    auto voterIt = it->second.voterTokens.find(voter);
    return voterIt != it->second.voterTokens.end() ? voterIt->second : 0;
}

bool Bank::HasVoterTokens(EpochNumber epoch, const Address& voter) const {
    auto it = epochs_.find(epoch);
    return it != epochs_.end() && it->second.voterTokens.count(voter) > 0;
}

std::optional<Epoch> Bank::GetEpoch(EpochNumber epoch) const {
    auto it = epochs_.find(epoch);
    if (it == epochs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace bank
} // namespace tcr
