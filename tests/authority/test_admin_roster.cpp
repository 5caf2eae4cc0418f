// STAKELEDGER - Admin Roster Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include <stakeledger/authority/admin_roster.h>

using namespace stakeledger;
using namespace stakeledger::authority;
using ledger::CallContext;
using ledger::LedgerError;

// ============================================================================
// Test Fixture
// ============================================================================

class AdminRosterTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = Identity::FromHex("ad00000000000000000000000000000000000001");
        other_ = Identity::FromHex("b000000000000000000000000000000000000001");
        ASSERT_TRUE(roster_.Seed({root_}));
    }

    AdminRoster roster_;
    Identity root_;
    Identity other_;
};

TEST_F(AdminRosterTest, SeedOnlyOnce) {
    EXPECT_TRUE(roster_.HasAdminCapability(root_));
    EXPECT_FALSE(roster_.Seed({other_}));
    EXPECT_FALSE(roster_.HasAdminCapability(other_));
    EXPECT_EQ(roster_.Size(), 1u);
}

TEST_F(AdminRosterTest, SeedSkipsNullIdentity) {
    AdminRoster fresh;
    EXPECT_TRUE(fresh.Seed({Identity(), other_}));
    EXPECT_EQ(fresh.Size(), 1u);
    EXPECT_FALSE(fresh.HasAdminCapability(Identity()));
}

TEST_F(AdminRosterTest, GrantAndRevoke) {
    ASSERT_TRUE(roster_.Grant(CallContext(root_, 1), other_).ok());
    EXPECT_TRUE(roster_.HasAdminCapability(other_));

    ASSERT_TRUE(roster_.Revoke(CallContext(other_, 2), root_).ok());
    EXPECT_FALSE(roster_.HasAdminCapability(root_));
    EXPECT_EQ(roster_.GetAdmins(), std::set<Identity>{other_});
}

TEST_F(AdminRosterTest, NonAdminCannotChangeRoster) {
    EXPECT_EQ(roster_.Grant(CallContext(other_, 1), other_).error(),
              LedgerError::NotAuthorized);
    EXPECT_EQ(roster_.Revoke(CallContext(other_, 1), root_).error(),
              LedgerError::NotAuthorized);
    EXPECT_EQ(roster_.Renounce(CallContext(other_, 1)).error(),
              LedgerError::NotAuthorized);
    EXPECT_TRUE(roster_.HasAdminCapability(root_));
}

TEST_F(AdminRosterTest, Renounce) {
    ASSERT_TRUE(roster_.Renounce(CallContext(root_, 1)).ok());
    EXPECT_TRUE(roster_.Empty());
    EXPECT_FALSE(roster_.HasAdminCapability(root_));
}

TEST_F(AdminRosterTest, ConstructFromSet) {
    AdminRoster roster(std::set<Identity>{root_, other_});
    EXPECT_EQ(roster.Size(), 2u);
    EXPECT_TRUE(roster.HasAdminCapability(other_));
}
