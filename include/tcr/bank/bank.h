// TCR - Epoch Ledger ("Bank")
// Copyright (c) 2024 TCR Developers
// MIT License
//
// Per resolved challenge (epoch), the total winning token weight as of the
// first reward claim and the weight each claiming voter contributed.
// Only authorized writers (the registry and the parameterizer) may record.
// Entries are write-once.

#ifndef TCR_BANK_BANK_H
#define TCR_BANK_BANK_H

#include "tcr/core/status.h"
#include "tcr/core/types.h"

#include <map>
#include <memory>
#include <optional>
#include <set>

namespace tcr {

namespace events { class EventLog; }

namespace bank {

struct Epoch {
    EpochNumber number{0};
    bool snapshotTaken{false};
    Amount totalTokens{0};
    std::map<Address, Amount> voterTokens;
};

class Bank {
public:
    explicit Bank(std::shared_ptr<events::EventLog> eventLog = nullptr);

    /// Allow `writer` to record epochs
    void AuthorizeWriter(const Address& writer);
    bool IsAuthorizedWriter(const Address& writer) const;

    /**
     * Record the total winning tokens of an epoch.
     * The first snapshot wins; later calls leave it unchanged.
     */
    Status SnapshotEpoch(const Address& caller, EpochNumber epoch, Amount totalTokens);

    /// Record a voter's weight in an epoch; AlreadyClaimed if already recorded
    Status AddVoterTokens(const Address& caller, EpochNumber epoch,
                          const Address& voter, Amount tokens);

    bool HasSnapshot(EpochNumber epoch) const;
    Amount GetEpochTotalTokens(EpochNumber epoch) const;
    Amount GetEpochVoterTokens(EpochNumber epoch, const Address& voter) const;
    bool HasVoterTokens(EpochNumber epoch, const Address& voter) const;

    std::optional<Epoch> GetEpoch(EpochNumber epoch) const;

private:
    std::shared_ptr<events::EventLog> eventLog_;
    std::set<Address> writers_;
    std::map<EpochNumber, Epoch> epochs_;
};

} // namespace bank
} // namespace tcr

#endif // TCR_BANK_BANK_H
