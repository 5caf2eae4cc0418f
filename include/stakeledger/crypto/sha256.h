// STAKELEDGER - SHA256 Hash Function
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// SHA-256 backed by OpenSSL's EVP digest interface.

#ifndef STAKELEDGER_CRYPTO_SHA256_H
#define STAKELEDGER_CRYPTO_SHA256_H

#include "stakeledger/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace stakeledger {

/// Incremental SHA-256 hasher
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);

    /// Finalize the hash; the hasher must be Reset() before reuse
    Hash256 Finalize();

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Impl;
    Impl* impl_;
};

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

inline Hash256 SHA256Hash(const std::string& data) {
    return SHA256Hash(reinterpret_cast<const Byte*>(data.data()), data.size());
}

} // namespace stakeledger

#endif // STAKELEDGER_CRYPTO_SHA256_H
