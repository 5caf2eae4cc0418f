// STAKELEDGER - Payout Book Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include <stakeledger/transfer/payout_book.h>

#include <limits>

using namespace stakeledger;
using namespace stakeledger::transfer;

class PayoutBookTest : public ::testing::Test {
protected:
    Identity alice_ = Identity::FromHex("a100000000000000000000000000000000000001");
    Identity bob_ = Identity::FromHex("b000000000000000000000000000000000000001");
    PayoutBook book_;
};

TEST_F(PayoutBookTest, SendCreditsRecipient) {
    EXPECT_TRUE(book_.Send(alice_, 40).success);
    EXPECT_TRUE(book_.Send(alice_, 10).success);
    EXPECT_TRUE(book_.Send(bob_, 5).success);

    EXPECT_EQ(book_.GetBalance(alice_), 50u);
    EXPECT_EQ(book_.GetBalance(bob_), 5u);
    EXPECT_EQ(book_.GetTotalPaid(), 55u);
}

TEST_F(PayoutBookTest, RefusedRecipientFails) {
    book_.Refuse(alice_);
    EXPECT_TRUE(book_.IsRefused(alice_));

    auto result = book_.Send(alice_, 10);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.reason, "recipient refuses transfers");
    EXPECT_EQ(book_.GetBalance(alice_), 0u);

    book_.Accept(alice_);
    EXPECT_TRUE(book_.Send(alice_, 10).success);
}

TEST_F(PayoutBookTest, OverflowFails) {
    ASSERT_TRUE(book_.Send(alice_, std::numeric_limits<Amount>::max()).success);
    EXPECT_FALSE(book_.Send(alice_, 1).success);
    EXPECT_EQ(book_.GetBalance(alice_), std::numeric_limits<Amount>::max());
}

TEST_F(PayoutBookTest, SetBalancesReplacesEverything) {
    ASSERT_TRUE(book_.Send(alice_, 7).success);
    book_.SetBalances({{bob_, 3}});
    EXPECT_EQ(book_.GetBalance(alice_), 0u);
    EXPECT_EQ(book_.GetBalances().size(), 1u);
    EXPECT_EQ(book_.GetBalance(bob_), 3u);
}
