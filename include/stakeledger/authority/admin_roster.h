// STAKELEDGER - Admin Roster
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// The set of identities holding the administrative capability.

#ifndef STAKELEDGER_AUTHORITY_ADMIN_ROSTER_H
#define STAKELEDGER_AUTHORITY_ADMIN_ROSTER_H

#include "stakeledger/core/types.h"
#include "stakeledger/ledger/interfaces.h"
#include "stakeledger/ledger/types.h"

#include <mutex>
#include <set>
#include <vector>

namespace stakeledger {
namespace authority {

/**
 * Persisted admin set answering the ledger's authority checks.
 *
 * The roster is seeded once at setup; afterwards only admins may grant or
 * revoke the capability.
 */
class AdminRoster : public ledger::IAuthorityCheck {
public:
    AdminRoster() = default;
    explicit AdminRoster(const std::set<Identity>& admins);

    bool HasAdminCapability(const Identity& identity) const override;

    /// Add an initial admin; false once the roster has been seeded
    bool Seed(const std::vector<Identity>& admins);

    ledger::LedgerResult Grant(const ledger::CallContext& ctx, const Identity& identity);
    ledger::LedgerResult Revoke(const ledger::CallContext& ctx, const Identity& identity);

    /// Drop the caller's own capability
    ledger::LedgerResult Renounce(const ledger::CallContext& ctx);

    std::set<Identity> GetAdmins() const;
    size_t Size() const;
    bool Empty() const;

private:
    mutable std::mutex mutex_;
    std::set<Identity> admins_;
};

} // namespace authority
} // namespace stakeledger

#endif // STAKELEDGER_AUTHORITY_ADMIN_ROSTER_H
