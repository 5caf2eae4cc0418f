// STAKELEDGER - Serialization Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "stakeledger/core/serialize.h"

#include <string>
#include <vector>

namespace stakeledger {
namespace test {

// ============================================================================
// Integer Encoding
// ============================================================================

TEST(SerializeTest, Uint64IsLittleEndian) {
    DataStream ss;
    ss << uint64_t{0x0102030405060708ULL};
    EXPECT_EQ(ss.ToHex(), "0807060504030201");
}

TEST(SerializeTest, Uint32IsLittleEndian) {
    DataStream ss;
    ss << uint32_t{2};
    EXPECT_EQ(ss.ToHex(), "02000000");
}

TEST(SerializeTest, ReadBackInOrder) {
    DataStream ss;
    ss << uint64_t{42} << uint32_t{7} << true;

    uint64_t a = 0;
    uint32_t b = 0;
    bool c = false;
    ss >> a >> b >> c;
    EXPECT_EQ(a, 42u);
    EXPECT_EQ(b, 7u);
    EXPECT_TRUE(c);
    EXPECT_TRUE(ss.empty());
}

TEST(SerializeTest, ReadPastEndThrows) {
    DataStream ss;
    ss << uint32_t{1};
    uint64_t value = 0;
    EXPECT_THROW(ss >> value, std::ios_base::failure);
}

// ============================================================================
// Compact Size
// ============================================================================

TEST(CompactSizeTest, Boundaries) {
    struct Case { uint64_t value; std::string hex; };
    std::vector<Case> cases = {
        {0, "00"},
        {252, "fc"},
        {253, "fefd000000"},
        {0x10000, "fe00000100"},
    };
    for (const auto& c : cases) {
        DataStream ss;
        WriteCompactSize(ss, c.value);
        EXPECT_EQ(ss.ToHex(), c.hex) << c.value;
        EXPECT_EQ(ReadCompactSize(ss), c.value);
    }
}

TEST(CompactSizeTest, RejectsNonCanonical) {
    DataStream ss;
    ser_writedata8(ss, 0xFE);
    ser_writedata32(ss, 10);
    EXPECT_THROW(ReadCompactSize(ss), std::ios_base::failure);
}

TEST(CompactSizeTest, RejectsOversize) {
    DataStream ss;
    ser_writedata8(ss, 0xFE);
    ser_writedata32(ss, static_cast<uint32_t>(MAX_SIZE + 1));
    EXPECT_THROW(ReadCompactSize(ss), std::ios_base::failure);
}

// ============================================================================
// Strings, Hashes and Vectors
// ============================================================================

TEST(SerializeTest, StringIsLengthPrefixed) {
    DataStream ss;
    ss << std::string("abc");
    EXPECT_EQ(ss.ToHex(), "03616263");

    std::string out;
    ss >> out;
    EXPECT_EQ(out, "abc");
}

TEST(SerializeTest, HashIsRawBytes) {
    Hash160 h = Hash160::FromHex("0102030405060708090a0b0c0d0e0f1011121314");
    DataStream ss;
    ss << h;
    EXPECT_EQ(ss.size(), 20u);
    EXPECT_EQ(ss.ToHex(), h.ToHex());

    Hash160 back;
    ss >> back;
    EXPECT_EQ(back, h);
}

TEST(SerializeTest, VectorOfIntegers) {
    std::vector<uint64_t> values{1, 2, 3};
    DataStream ss;
    ss << values;
    EXPECT_EQ(ss.size(), 1u + 3 * 8);

    std::vector<uint64_t> out;
    ss >> out;
    EXPECT_EQ(out, values);
}

TEST(SerializeTest, StrExposesUnreadBytes) {
    DataStream ss;
    ss << uint32_t{0x61626364};
    EXPECT_EQ(ss.str(), "dcba");

    DataStream copy(ss.str());
    uint32_t v = 0;
    copy >> v;
    EXPECT_EQ(v, 0x61626364u);
}

} // namespace test
} // namespace stakeledger
