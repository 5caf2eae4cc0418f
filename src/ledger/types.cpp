// STAKELEDGER - Ledger Types Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/ledger/types.h"
#include "stakeledger/crypto/sha256.h"

#include <sstream>

namespace stakeledger {
namespace ledger {

namespace {

/// Domain tag prefixed to the digest input
constexpr const char* STATE_DIGEST_TAG = "stakeledger/state/v2";

} // namespace

const char* LedgerErrorToString(LedgerError error) {
    switch (error) {
        case LedgerError::None:                return "None";
        case LedgerError::NotAuthorized:       return "NotAuthorized";
        case LedgerError::AlreadyRegistered:   return "AlreadyRegistered";
        case LedgerError::NotRegistered:       return "NotRegistered";
        case LedgerError::InsufficientDeposit: return "InsufficientDeposit";
        case LedgerError::InsufficientStake:   return "InsufficientStake";
        case LedgerError::InsufficientFunds:   return "InsufficientFunds";
        case LedgerError::ZeroAmount:          return "ZeroAmount";
        case LedgerError::CooldownNotElapsed:  return "CooldownNotElapsed";
        case LedgerError::TransferFailed:      return "TransferFailed";
        case LedgerError::ReentrantCall:       return "ReentrantCall";
        default:                               return "Unknown";
    }
}

std::string LedgerResult::ToString() const {
    if (ok()) return "OK";
    std::string result = LedgerErrorToString(error_);
    if (!detail_.empty()) {
        result += ": " + detail_;
    }
    return result;
}

// ============================================================================
// LedgerState
// ============================================================================

Amount LedgerState::TotalStaked() const {
    Amount total = 0;
    for (const auto& [identity, record] : records) {
        total = CheckedAdd(total, record.stakedAmount);
    }
    return total;
}

bool LedgerState::IsConserved() const {
    Amount staked = 0;
    for (const auto& [identity, record] : records) {
        if (!CanAdd(staked, record.stakedAmount)) return false;
        staked += record.stakedAmount;
    }
    return CanAdd(staked, confiscatedTotal) &&
           custodyBalance == staked + confiscatedTotal;
}

bool LedgerState::operator==(const LedgerState& other) const {
    return depositFloor == other.depositFloor &&
           cooldownPeriod == other.cooldownPeriod &&
           confiscatedTotal == other.confiscatedTotal &&
           custodyBalance == other.custodyBalance &&
           records == other.records;
}

Hash256 ComputeStateDigest(const LedgerState& state) {
    DataStream ss;
    ss << std::string(STATE_DIGEST_TAG);
    ss << state.depositFloor << state.cooldownPeriod
       << state.confiscatedTotal << state.custodyBalance;
    WriteCompactSize(ss, state.records.size());
    for (const auto& [identity, record] : state.records) {
        Serialize(ss, identity);
        Serialize(ss, record);
    }
    return SHA256Hash(ss.data(), ss.size());
}

// ============================================================================
// Events
// ============================================================================

const char* LedgerEventTypeToString(LedgerEventType type) {
    switch (type) {
        case LedgerEventType::ConfigurationUpdated: return "ConfigurationUpdated";
        case LedgerEventType::Registered:           return "Registered";
        case LedgerEventType::Unregistered:         return "Unregistered";
        case LedgerEventType::Staked:               return "Staked";
        case LedgerEventType::Unstaked:             return "Unstaked";
        case LedgerEventType::Slashed:              return "Slashed";
        case LedgerEventType::Withdrawn:            return "Withdrawn";
        default:                                    return "Unknown";
    }
}

std::string LedgerEvent::ToString() const {
    std::ostringstream ss;
    ss << LedgerEventTypeToString(type) << "(";
    if (type == LedgerEventType::ConfigurationUpdated) {
        ss << depositFloor << ", " << cooldownPeriod;
    } else {
        ss << identity.ToHex() << ", " << amount;
    }
    ss << ")";
    return ss.str();
}

} // namespace ledger
} // namespace stakeledger
