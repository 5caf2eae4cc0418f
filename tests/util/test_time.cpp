// STAKELEDGER - Time Utility Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <gtest/gtest.h>

#include "stakeledger/util/time.h"

namespace stakeledger {
namespace util {
namespace test {

class MockTimeTest : public ::testing::Test {
protected:
    void TearDown() override {
        DisableMockTime();
        SetMockTime(0);
    }
};

TEST_F(MockTimeTest, RealTimeIsRecent) {
    DisableMockTime();
    // 2023-11-14, well before any build of this code
    EXPECT_GT(GetTime(), 1700000000u);
}

TEST_F(MockTimeTest, MockTimeOverridesClock) {
    EnableMockTime();
    SetMockTime(1000);
    EXPECT_TRUE(IsMockTimeEnabled());
    EXPECT_EQ(GetTime(), 1000u);

    AdvanceMockTime(SECONDS_PER_DAY);
    EXPECT_EQ(GetTime(), 1000u + 86400u);
    EXPECT_EQ(GetMockTime(), 87400u);
}

TEST_F(MockTimeTest, DisablingRestoresClock) {
    EnableMockTime();
    SetMockTime(5);
    DisableMockTime();
    EXPECT_FALSE(IsMockTimeEnabled());
    EXPECT_NE(GetTime(), 5u);
}

TEST(TimeFormatTest, Duration) {
    EXPECT_EQ(FormatDuration(0), "0s");
    EXPECT_EQ(FormatDuration(59), "59s");
    EXPECT_EQ(FormatDuration(3600), "1h");
    EXPECT_EQ(FormatDuration(86400), "1d");
    EXPECT_EQ(FormatDuration(90061), "1d 1h 1m 1s");
}

TEST(TimeFormatTest, ISO8601) {
    EXPECT_EQ(FormatISO8601(FromUnixTime(0)), "1970-01-01T00:00:00Z");
    EXPECT_EQ(FormatISO8601(FromUnixTime(1700000000)), "2023-11-14T22:13:20Z");
    EXPECT_EQ(ToUnixTime(FromUnixTime(1234567)), 1234567u);
}

} // namespace test
} // namespace util
} // namespace stakeledger
