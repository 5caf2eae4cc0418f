// STAKELEDGER - SHA256 Tests
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include <gtest/gtest.h>
#include "stakeledger/crypto/sha256.h"

#include <string>
#include <vector>

namespace stakeledger {
namespace test {

// ============================================================================
// Known Vectors (FIPS 180-2)
// ============================================================================

TEST(SHA256Test, OutputSizeIs32Bytes) {
    EXPECT_EQ(SHA256::OUTPUT_SIZE, 32u);
}

TEST(SHA256Test, EmptyInput) {
    EXPECT_EQ(SHA256Hash(std::string()).ToHex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    EXPECT_EQ(SHA256Hash(std::string("abc")).ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockMessage) {
    EXPECT_EQ(SHA256Hash(std::string(
                  "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")).ToHex(),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

// ============================================================================
// Incremental Interface
// ============================================================================

TEST(SHA256Test, IncrementalMatchesOneShot) {
    std::string msg = "The quick brown fox jumps over the lazy dog";
    SHA256 hasher;
    hasher.Write(reinterpret_cast<const Byte*>(msg.data()), 10)
          .Write(reinterpret_cast<const Byte*>(msg.data()) + 10, msg.size() - 10);
    EXPECT_EQ(hasher.Finalize(), SHA256Hash(msg));
}

TEST(SHA256Test, ResetStartsOver) {
    SHA256 hasher;
    hasher.Write(reinterpret_cast<const Byte*>("junk"), 4);
    hasher.Reset();
    hasher.Write(reinterpret_cast<const Byte*>("abc"), 3);
    EXPECT_EQ(hasher.Finalize(), SHA256Hash(std::string("abc")));
}

TEST(SHA256Test, VectorOverload) {
    std::vector<Byte> data{'a', 'b', 'c'};
    EXPECT_EQ(SHA256Hash(data), SHA256Hash(std::string("abc")));
}

} // namespace test
} // namespace stakeledger
