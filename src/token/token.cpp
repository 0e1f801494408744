// TCR - Token Ledger Implementation
// Copyright (c) 2024 TCR Developers
// MIT License

#include "tcr/token/token.h"
#include "tcr/events/events.h"
#include "tcr/util/logging.h"

namespace tcr {
namespace token {

StandardToken::StandardToken(std::string name, std::string symbol, uint8_t decimals,
                             Amount initialSupply, const Address& initialHolder,
                             std::shared_ptr<events::EventLog> eventLog)
    : name_(std::move(name))
    , symbol_(std::move(symbol))
    , decimals_(decimals)
    , totalSupply_(initialSupply)
    , eventLog_(std::move(eventLog)) {
    balances_[initialHolder] = initialSupply;
    LOG_INFO(util::LogCategory::TOKEN) << "Minted " << initialSupply << " " << symbol_
                                       << " to " << initialHolder.ToHex();
}

void StandardToken::Move(const Address& from, const Address& to, Amount amount) {
    balances_[from] -= amount;
    balances_[to] += amount;
    if (eventLog_) {
        eventLog_->Emit(events::Transfer{from, to, amount});
    }
}

bool StandardToken::Transfer(const Address& from, const Address& to, Amount amount) {
    if (BalanceOf(from) < amount) {
        LOG_DEBUG(util::LogCategory::TOKEN) << "Transfer of " << amount << " from "
                                            << from.ToHex() << " refused: balance "
                                            << BalanceOf(from);
        return false;
    }
    Move(from, to, amount);
    return true;
}

bool StandardToken::TransferFrom(const Address& spender, const Address& from,
                                 const Address& to, Amount amount) {
    Amount allowed = Allowance(from, spender);
    if (BalanceOf(from) < amount || allowed < amount) {
        LOG_DEBUG(util::LogCategory::TOKEN) << "TransferFrom of " << amount << " by "
                                            << spender.ToHex() << " refused: balance "
                                            << BalanceOf(from) << ", allowance " << allowed;
        return false;
    }
    allowances_[{from, spender}] = allowed - amount;
    Move(from, to, amount);
    return true;
}

bool StandardToken::Approve(const Address& owner, const Address& spender, Amount amount) {
    allowances_[{owner, spender}] = amount;
    if (eventLog_) {
        eventLog_->Emit(events::Approval{owner, spender, amount});
    }
    return true;
}

Amount StandardToken::BalanceOf(const Address& account) const {
    auto it = balances_.find(account);
    return it != balances_.end() ? it->second : 0;
}

Amount StandardToken::Allowance(const Address& owner, const Address& spender) const {
    auto it = allowances_.find({owner, spender});
    return it != allowances_.end() ? it->second : 0;
}

} // namespace token
} // namespace tcr
