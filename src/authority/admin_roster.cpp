// STAKELEDGER - Admin Roster Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/authority/admin_roster.h"
#include "stakeledger/util/logging.h"

namespace stakeledger {
namespace authority {

using ledger::LedgerError;
using ledger::LedgerResult;

AdminRoster::AdminRoster(const std::set<Identity>& admins) : admins_(admins) {}

bool AdminRoster::HasAdminCapability(const Identity& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admins_.count(identity) != 0;
}

bool AdminRoster::Seed(const std::vector<Identity>& admins) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!admins_.empty()) {
        LOG_WARN(util::LogCategory::AUTH) << "Admin roster already seeded, ignoring "
                                          << admins.size() << " identities";
        return false;
    }
    for (const auto& admin : admins) {
        if (admin.IsNull()) continue;
        admins_.insert(admin);
        LOG_INFO(util::LogCategory::AUTH) << "Seeded admin " << admin.ToShortString();
    }
    return true;
}

LedgerResult AdminRoster::Grant(const ledger::CallContext& ctx, const Identity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (admins_.count(ctx.caller) == 0) {
        LOG_DEBUG(util::LogCategory::AUTH) << "Grant by " << ctx.caller.ToShortString()
                                           << " rejected";
        return LedgerResult::Error(LedgerError::NotAuthorized);
    }
    if (admins_.insert(identity).second) {
        LOG_INFO(util::LogCategory::AUTH) << ctx.caller.ToShortString() << " granted admin to "
                                          << identity.ToShortString();
    }
    return LedgerResult::Ok();
}

LedgerResult AdminRoster::Revoke(const ledger::CallContext& ctx, const Identity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (admins_.count(ctx.caller) == 0) {
        LOG_DEBUG(util::LogCategory::AUTH) << "Revoke by " << ctx.caller.ToShortString()
                                           << " rejected";
        return LedgerResult::Error(LedgerError::NotAuthorized);
    }
    if (admins_.erase(identity) != 0) {
        LOG_INFO(util::LogCategory::AUTH) << ctx.caller.ToShortString() << " revoked admin from "
                                          << identity.ToShortString();
    }
    return LedgerResult::Ok();
}

LedgerResult AdminRoster::Renounce(const ledger::CallContext& ctx) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (admins_.erase(ctx.caller) == 0) {
        return LedgerResult::Error(LedgerError::NotAuthorized);
    }
    LOG_INFO(util::LogCategory::AUTH) << ctx.caller.ToShortString() << " renounced admin";
    return LedgerResult::Ok();
}

std::set<Identity> AdminRoster::GetAdmins() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admins_;
}

size_t AdminRoster::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admins_.size();
}

bool AdminRoster::Empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admins_.empty();
}

} // namespace authority
} // namespace stakeledger
