// TCR - Token Ledger
// Copyright (c) 2024 TCR Developers
// MIT License
//
// Balance bookkeeping the protocol escrows deposits and voting rights in.
// The protocol only depends on TokenLedger; StandardToken is the in-memory
// EIP20-style implementation used by deployments and tests.

#ifndef TCR_TOKEN_TOKEN_H
#define TCR_TOKEN_TOKEN_H

#include "tcr/core/types.h"

#include <map>
#include <memory>
#include <string>
#include <utility>

namespace tcr {

namespace events { class EventLog; }

namespace token {

/**
 * Token ledger interface.
 *
 * Every transfer either moves the full amount or returns false and changes
 * nothing. Balances never go negative.
 */
class TokenLedger {
public:
    virtual ~TokenLedger() = default;

    /// Move amount from `from` to `to`
    virtual bool Transfer(const Address& from, const Address& to, Amount amount) = 0;

    /// Move amount from `from` to `to`, spending spender's allowance
    virtual bool TransferFrom(const Address& spender, const Address& from,
                              const Address& to, Amount amount) = 0;

    /// Set spender's allowance over owner's balance
    virtual bool Approve(const Address& owner, const Address& spender, Amount amount) = 0;

    virtual Amount BalanceOf(const Address& account) const = 0;
    virtual Amount Allowance(const Address& owner, const Address& spender) const = 0;
    virtual Amount TotalSupply() const = 0;
};

/// In-memory EIP20 token
class StandardToken : public TokenLedger {
public:
    /// Mints initialSupply to initialHolder
    StandardToken(std::string name, std::string symbol, uint8_t decimals,
                  Amount initialSupply, const Address& initialHolder,
                  std::shared_ptr<events::EventLog> eventLog = nullptr);

    bool Transfer(const Address& from, const Address& to, Amount amount) override;
    bool TransferFrom(const Address& spender, const Address& from,
                      const Address& to, Amount amount) override;
    bool Approve(const Address& owner, const Address& spender, Amount amount) override;

    Amount BalanceOf(const Address& account) const override;
    Amount Allowance(const Address& owner, const Address& spender) const override;
    Amount TotalSupply() const override { return totalSupply_; }

    const std::string& Name() const { return name_; }
    const std::string& Symbol() const { return symbol_; }
    uint8_t Decimals() const { return decimals_; }

private:
    void Move(const Address& from, const Address& to, Amount amount);

    std::string name_;
    std::string symbol_;
    uint8_t decimals_;
    Amount totalSupply_;

    std::map<Address, Amount> balances_;
    std::map<std::pair<Address, Address>, Amount> allowances_;

    std::shared_ptr<events::EventLog> eventLog_;
};

} // namespace token
} // namespace tcr

#endif // TCR_TOKEN_TOKEN_H
