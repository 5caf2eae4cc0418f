// STAKELEDGER - Stake Ledger
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Implements the staking ledger:
// - Registration with a deposit floor
// - Adding and withdrawing stake after a cooldown
// - Admin slashing into a confiscated pool and sweeping it out
// - Rollback when an outbound transfer fails
// - Notifications for every successful operation

#ifndef STAKELEDGER_LEDGER_LEDGER_H
#define STAKELEDGER_LEDGER_LEDGER_H

#include "stakeledger/core/types.h"
#include "stakeledger/ledger/interfaces.h"
#include "stakeledger/ledger/types.h"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace stakeledger {
namespace ledger {

/**
 * The staking ledger.
 *
 * Every operation either applies all of its effects and fires exactly one
 * event, or returns an error with the state untouched. Ledger state is
 * always changed before value leaves through IValueTransfer, and a failed
 * transfer is undone by reversing that change.
 *
 * While Unregister is releasing funds, every other state-mutating call
 * (including one made from inside the transfer) fails with ReentrantCall.
 */
class StakeLedger {
public:
    using EventCallback = std::function<void(const LedgerEvent&)>;
    using SubscriptionId = uint64_t;

    StakeLedger(const IAuthorityCheck& authority, IValueTransfer& transfer);
    StakeLedger(const IAuthorityCheck& authority, IValueTransfer& transfer,
                Amount depositFloor, Duration cooldownPeriod);
    ~StakeLedger();

    StakeLedger(const StakeLedger&) = delete;
    StakeLedger& operator=(const StakeLedger&) = delete;

    // === Administration ===

    /// Replace deposit floor and cooldown (admin only)
    LedgerResult SetConfiguration(const CallContext& ctx, Amount depositFloor,
                                  Duration cooldownPeriod);

    /// Confiscate stake from target into the pool (admin only)
    LedgerResult Slash(const CallContext& ctx, const Identity& target, Amount amount);

    /// Pay confiscated funds out to the calling admin
    LedgerResult Sweep(const CallContext& ctx, Amount amount);

    // === Participants ===

    /// Register the caller; the attached deposit becomes its stake
    LedgerResult Register(const CallContext& ctx, Amount deposit);

    /// Remove the caller's record and return its whole stake
    LedgerResult Unregister(const CallContext& ctx);

    /// Add attached value to the caller's stake
    LedgerResult Stake(const CallContext& ctx, Amount amount);

    /// Withdraw part of the caller's stake
    LedgerResult Unstake(const CallContext& ctx, Amount amount);

    // === Queries ===

    /// Record for identity; absent identities read as the all-zero record
    ParticipantRecord GetRecord(const Identity& identity) const;

    bool IsRegistered(const Identity& identity) const;

    /// Earliest time at which identity may withdraw, if registered
    std::optional<Timestamp> CooldownEndsAt(const Identity& identity) const;

    Amount GetDepositFloor() const;
    Duration GetCooldownPeriod() const;
    Amount GetConfiscatedTotal() const;
    Amount GetCustodyBalance() const;
    Amount GetTotalStaked() const;
    size_t ParticipantCount() const;

    /// Visit registered participants in identity order
    void ForEachParticipant(
        const std::function<void(const Identity&, const ParticipantRecord&)>& visitor) const;

    /// True if held value equals total stake plus the confiscated pool
    bool CheckConservation() const;

    // === Persistence ===

    LedgerState Snapshot() const;

    /// Replace the whole state at once (used when loading from storage).
    /// Throws std::invalid_argument if a record lacks a registration time or
    /// custody does not equal staked plus confiscated.
    void Restore(const LedgerState& state);

    // === Notifications ===

    SubscriptionId Subscribe(EventCallback callback);
    void Unsubscribe(SubscriptionId id);

private:
    bool IsAdmin(const Identity& identity) const;
    bool CooldownElapsed(const ParticipantRecord& record, Timestamp now) const;

    /// Error result for a rejected call, logged at debug level
    LedgerResult Reject(const char* op, const CallContext& ctx, LedgerError error,
                        const std::string& detail = "") const;

    void Emit(const LedgerEvent& event);

    /// Sum that must not overflow; logs and throws AmountOverflow otherwise
    static Amount AddOrThrow(Amount a, Amount b, const char* what);

    const IAuthorityCheck& authority_;
    IValueTransfer& transfer_;

    mutable std::recursive_mutex mutex_;
    LedgerState state_;

    /// Set while Unregister releases funds
    bool unregisterInFlight_{false};

    std::map<SubscriptionId, EventCallback> subscribers_;
    SubscriptionId nextSubscriptionId_{1};
};

/// Collects a ledger's events for as long as it lives, so callers can
/// report them once the resulting state has been committed elsewhere.
class EventRecorder {
public:
    explicit EventRecorder(StakeLedger& ledger);
    ~EventRecorder();

    EventRecorder(const EventRecorder&) = delete;
    EventRecorder& operator=(const EventRecorder&) = delete;

    const std::vector<LedgerEvent>& Events() const { return events_; }
    void Clear() { events_.clear(); }

private:
    StakeLedger& ledger_;
    StakeLedger::SubscriptionId id_;
    std::vector<LedgerEvent> events_;
};

} // namespace ledger
} // namespace stakeledger

#endif // STAKELEDGER_LEDGER_LEDGER_H
