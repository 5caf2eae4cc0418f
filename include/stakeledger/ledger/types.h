// STAKELEDGER - Ledger Types
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Value types shared by the ledger, its collaborators and the store:
// call context, error kinds and results, participant records, the
// aggregate ledger state and the notifications the ledger emits.

#ifndef STAKELEDGER_LEDGER_TYPES_H
#define STAKELEDGER_LEDGER_TYPES_H

#include "stakeledger/core/serialize.h"
#include "stakeledger/core/types.h"

#include <cstdint>
#include <map>
#include <string>

namespace stakeledger {
namespace ledger {

// ============================================================================
// Call Context
// ============================================================================

/// Who is calling and at what ledger time
struct CallContext {
    Identity caller;
    Timestamp timestamp{0};

    CallContext() = default;
    CallContext(const Identity& who, Timestamp when) : caller(who), timestamp(when) {}
};

// ============================================================================
// Errors
// ============================================================================

enum class LedgerError {
    None,

    // Authorization
    NotAuthorized,

    // State preconditions
    AlreadyRegistered,
    NotRegistered,
    InsufficientDeposit,
    InsufficientStake,
    InsufficientFunds,
    ZeroAmount,
    CooldownNotElapsed,

    // External failure
    TransferFailed,

    /// A state-mutating call arrived while an unregister was releasing funds
    ReentrantCall
};

/// Convert error kind to string
const char* LedgerErrorToString(LedgerError error);

/**
 * Outcome of a ledger operation.
 *
 * A failed result guarantees that no ledger state was changed.
 */
class LedgerResult {
public:
    LedgerResult() = default;

    static LedgerResult Ok() { return LedgerResult(); }

    static LedgerResult Error(LedgerError error, const std::string& detail = "") {
        LedgerResult r;
        r.error_ = error;
        r.detail_ = detail;
        return r;
    }

    bool ok() const { return error_ == LedgerError::None; }
    explicit operator bool() const { return ok(); }

    LedgerError error() const { return error_; }
    const std::string& detail() const { return detail_; }

    std::string ToString() const;

private:
    LedgerError error_{LedgerError::None};
    std::string detail_;
};

// ============================================================================
// Participant Record
// ============================================================================

/**
 * Per-identity stake record.
 *
 * registeredAt == 0 means "not registered", and an unregistered record
 * always has stakedAmount == 0.
 */
struct ParticipantRecord {
    Timestamp registeredAt{0};
    Amount stakedAmount{0};

    bool IsRegistered() const { return registeredAt != 0; }

    bool operator==(const ParticipantRecord& other) const {
        return registeredAt == other.registeredAt &&
               stakedAmount == other.stakedAmount;
    }
    bool operator!=(const ParticipantRecord& other) const { return !(*this == other); }
};

template<typename Stream>
void Serialize(Stream& s, const ParticipantRecord& record) {
    ser_writedata64(s, record.registeredAt);
    ser_writedata64(s, record.stakedAmount);
}

template<typename Stream>
void Unserialize(Stream& s, ParticipantRecord& record) {
    record.registeredAt = ser_readdata64(s);
    record.stakedAmount = ser_readdata64(s);
}

// ============================================================================
// Ledger State
// ============================================================================

/// Everything the ledger owns, as persisted and restored
struct LedgerState {
    Amount depositFloor{0};
    Duration cooldownPeriod{0};
    Amount confiscatedTotal{0};

    /// Total value held by the ledger
    Amount custodyBalance{0};

    /// Registered participants only
    std::map<Identity, ParticipantRecord> records;

    /// Sum of all staked amounts (throws AmountOverflow)
    Amount TotalStaked() const;

    /// custodyBalance == TotalStaked() + confiscatedTotal
    bool IsConserved() const;

    bool operator==(const LedgerState& other) const;
    bool operator!=(const LedgerState& other) const { return !(*this == other); }
};

/**
 * SHA-256 over the canonical encoding of a ledger state.
 *
 * Parameters, pool, custody and the records in identity order are
 * encoded little-endian after a domain tag. Equal states have equal
 * digests.
 */
Hash256 ComputeStateDigest(const LedgerState& state);

// ============================================================================
// Notifications
// ============================================================================

enum class LedgerEventType {
    ConfigurationUpdated,
    Registered,
    Unregistered,
    Staked,
    Unstaked,
    Slashed,
    Withdrawn
};

const char* LedgerEventTypeToString(LedgerEventType type);

struct LedgerEvent {
    LedgerEventType type{LedgerEventType::Registered};

    /// Participant (or the admin for Withdrawn); null for ConfigurationUpdated
    Identity identity;
    Amount amount{0};

    /// Set for ConfigurationUpdated only
    Amount depositFloor{0};
    Duration cooldownPeriod{0};

    std::string ToString() const;
};

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_TYPES_H
