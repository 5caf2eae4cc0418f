// STAKELEDGER - Ledger Collaborators
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// The two services the ledger consumes but does not implement.

#ifndef STAKELEDGER_LEDGER_INTERFACES_H
#define STAKELEDGER_LEDGER_INTERFACES_H

#include "stakeledger/core/types.h"

#include <string>

namespace stakeledger {
namespace ledger {

/// Answers whether an identity holds the administrative capability
class IAuthorityCheck {
public:
    virtual ~IAuthorityCheck() = default;

    virtual bool HasAdminCapability(const Identity& identity) const = 0;
};

/// Result of an outbound value transfer
struct TransferResult {
    bool success{false};
    std::string reason;

    static TransferResult Ok() { return {true, ""}; }
    static TransferResult Failed(const std::string& why) { return {false, why}; }
};

/**
 * Moves value out of the ledger to an external identity.
 *
 * A failed send must not be assumed to have undone anything; the ledger
 * reverses its own mutation. Implementations may call back into the
 * ledger before returning.
 */
class IValueTransfer {
public:
    virtual ~IValueTransfer() = default;

    virtual TransferResult Send(const Identity& recipient, Amount amount) = 0;
};

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_INTERFACES_H
