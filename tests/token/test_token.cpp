// TCR - Token Ledger Tests
// Copyright (c) 2024 TCR Developers
// MIT License

#include <gtest/gtest.h>

#include "tcr/events/events.h"
#include "tcr/token/token.h"

#include <memory>

namespace tcr {
namespace token {
namespace test {

class TokenTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_ = std::make_shared<events::EventLog>();
        token_ = std::make_unique<StandardToken>("TestCoin", "TEST", 18, 1000, owner_, log_);
    }

    Address owner_ = MakeAddress("owner");
    Address alice_ = MakeAddress("alice");
    Address spender_ = MakeAddress("spender");
    std::shared_ptr<events::EventLog> log_;
    std::unique_ptr<StandardToken> token_;
};

TEST_F(TokenTest, InitialSupplyMintedToHolder) {
    EXPECT_EQ(token_->TotalSupply(), 1000u);
    EXPECT_EQ(token_->BalanceOf(owner_), 1000u);
    EXPECT_EQ(token_->BalanceOf(alice_), 0u);
    EXPECT_EQ(token_->Name(), "TestCoin");
    EXPECT_EQ(token_->Symbol(), "TEST");
    EXPECT_EQ(token_->Decimals(), 18);
}

TEST_F(TokenTest, Transfer) {
    EXPECT_TRUE(token_->Transfer(owner_, alice_, 300));
    EXPECT_EQ(token_->BalanceOf(owner_), 700u);
    EXPECT_EQ(token_->BalanceOf(alice_), 300u);

    auto transfer = log_->Last<events::Transfer>();
    ASSERT_TRUE(transfer.has_value());
    EXPECT_EQ(transfer->from, owner_);
    EXPECT_EQ(transfer->to, alice_);
    EXPECT_EQ(transfer->amount, 300u);
}

TEST_F(TokenTest, TransferRefusedOnInsufficientBalance) {
    EXPECT_FALSE(token_->Transfer(alice_, owner_, 1));
    EXPECT_FALSE(token_->Transfer(owner_, alice_, 1001));
    EXPECT_EQ(token_->BalanceOf(owner_), 1000u);
    EXPECT_EQ(log_->Count<events::Transfer>(), 0u);
}

TEST_F(TokenTest, TransferFromSpendsAllowance) {
    EXPECT_TRUE(token_->Approve(owner_, spender_, 400));
    EXPECT_EQ(token_->Allowance(owner_, spender_), 400u);

    EXPECT_TRUE(token_->TransferFrom(spender_, owner_, alice_, 150));
    EXPECT_EQ(token_->Allowance(owner_, spender_), 250u);
    EXPECT_EQ(token_->BalanceOf(alice_), 150u);

    EXPECT_FALSE(token_->TransferFrom(spender_, owner_, alice_, 251));
    EXPECT_EQ(token_->Allowance(owner_, spender_), 250u);
    EXPECT_EQ(token_->BalanceOf(alice_), 150u);
}

TEST_F(TokenTest, TransferFromRefusedOnInsufficientBalance) {
    token_->Approve(alice_, spender_, 100);
    EXPECT_FALSE(token_->TransferFrom(spender_, alice_, owner_, 1));
    EXPECT_EQ(token_->Allowance(alice_, spender_), 100u);
}

TEST_F(TokenTest, ApproveOverwrites) {
    token_->Approve(owner_, spender_, 400);
    token_->Approve(owner_, spender_, 10);
    EXPECT_EQ(token_->Allowance(owner_, spender_), 10u);
    EXPECT_EQ(log_->Count<events::Approval>(), 2u);
}

TEST_F(TokenTest, SupplyIsConserved) {
    token_->Transfer(owner_, alice_, 10);
    token_->Approve(alice_, spender_, 5);
    token_->TransferFrom(spender_, alice_, spender_, 5);
    EXPECT_EQ(token_->BalanceOf(owner_) + token_->BalanceOf(alice_) +
              token_->BalanceOf(spender_), token_->TotalSupply());
}

} // namespace test
} // namespace token
} // namespace tcr
