// STAKELEDGER - Core Types Header
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// This file defines fundamental types used throughout STAKELEDGER.

#ifndef STAKELEDGER_CORE_TYPES_H
#define STAKELEDGER_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>

namespace stakeledger {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in indivisible value units. Balances are never negative.
using Amount = uint64_t;

/// Ledger time (Unix epoch seconds). Zero is reserved as "never".
using Timestamp = uint64_t;

/// Length of a time span in seconds
using Duration = uint64_t;

/// Largest representable amount
constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

// ============================================================================
// Checked Arithmetic
// ============================================================================

/**
 * Thrown when a balance would leave the range of Amount.
 *
 * This is a defect, not a ledger error: callers are never expected to
 * recover from it and it is raised before any state is touched.
 */
class AmountOverflow : public std::overflow_error {
public:
    explicit AmountOverflow(const std::string& what)
        : std::overflow_error(what) {}
};

/// Add two amounts, throwing AmountOverflow instead of wrapping
inline Amount CheckedAdd(Amount a, Amount b) {
    if (a > MAX_AMOUNT - b) {
        throw AmountOverflow("amount overflow: " + std::to_string(a) +
                             " + " + std::to_string(b));
    }
    return a + b;
}

/// True if a + b fits in an Amount
inline bool CanAdd(Amount a, Amount b) noexcept {
    return a <= MAX_AMOUNT - b;
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-width opaque byte value (identities, digests)
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero-padded)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    /// Check if all bytes are zero
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept { data_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    /// Lexicographic order over the stored bytes
    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Convert to lowercase hex, first byte first
    std::string ToHex() const;

    /// Parse from exactly SIZE*2 hex characters (throws std::invalid_argument)
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) : BaseHash<256>(base) {}

    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 160-bit hash (20 bytes)
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& base) : BaseHash<160>(base) {}

    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

/// A caller or participant of the ledger
class Identity : public Hash160 {
public:
    using Hash160::Hash160;
    Identity() = default;
    explicit Identity(const Hash160& h) : Hash160(h) {}

    static Identity FromHex(const std::string& hex) {
        return Identity(Hash160::FromHex(hex));
    }

    /// Shortened form for log lines
    std::string ToShortString() const { return ToHex().substr(0, 12); }
};

} // namespace stakeledger

#endif // STAKELEDGER_CORE_TYPES_H
