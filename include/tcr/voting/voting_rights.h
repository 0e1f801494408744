// TCR - Voting Rights Ledger
// Copyright (c) 2024 TCR Developers
// MIT License
//
// Tokens a voter has escrowed with the voting address. Escrowed tokens are
// either locked into unrevealed poll commitments or available to commit
// again or withdraw.

#ifndef TCR_VOTING_VOTING_RIGHTS_H
#define TCR_VOTING_VOTING_RIGHTS_H

#include "tcr/core/status.h"
#include "tcr/core/types.h"

#include <map>
#include <memory>

namespace tcr {

namespace events { class EventLog; }
namespace token { class TokenLedger; }

namespace voting {

class VotingRights {
public:
    /**
     * @param token Ledger the rights are escrowed in
     * @param escrowAddress Account that holds escrowed tokens; voters must
     *        approve it before requesting rights
     */
    VotingRights(std::shared_ptr<token::TokenLedger> token, const Address& escrowAddress,
                 std::shared_ptr<events::EventLog> eventLog = nullptr);

    /// Escrow `amount` of the voter's tokens as voting rights
    Status RequestVotingRights(const Address& voter, Amount amount);

    /// Return `amount` of unlocked voting rights to the voter
    Status WithdrawVotingRights(const Address& voter, Amount amount);

    /// Total escrowed by the voter
    Amount GetBalance(const Address& voter) const;

    /// Sum of the voter's unrevealed commitments
    Amount GetLockedTokens(const Address& voter) const;

    /// Balance minus locked
    Amount GetAvailableTokens(const Address& voter) const;

    const Address& EscrowAddress() const { return escrow_; }

    // ========================================================================
    // Poll engine hooks
    // ========================================================================

    /**
     * Lock tokens for a commitment, releasing `replacing` tokens of the
     * commitment it supersedes. InsufficientRights leaves the lock unchanged.
     */
    Status Lock(const Address& voter, Amount amount, Amount replacing = 0);

    /// Release tokens of a revealed or rescued commitment
    void Unlock(const Address& voter, Amount amount);

private:
    struct Account {
        Amount deposited{0};
        Amount locked{0};
    };

    std::shared_ptr<token::TokenLedger> token_;
    Address escrow_;
    std::shared_ptr<events::EventLog> eventLog_;

    std::map<Address, Account> accounts_;
};

} // namespace voting
} // namespace tcr

#endif // TCR_VOTING_VOTING_RIGHTS_H
