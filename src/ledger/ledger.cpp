// STAKELEDGER - Stake Ledger Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/ledger/ledger.h"
#include "stakeledger/util/logging.h"
#include "stakeledger/util/time.h"

#include <limits>
#include <stdexcept>
#include <vector>

namespace stakeledger {
namespace ledger {

namespace {

/// Clears the in-flight flag on every exit path
class FlagGuard {
public:
    explicit FlagGuard(bool& flag) : flag_(flag) { flag_ = true; }
    ~FlagGuard() { flag_ = false; }

    FlagGuard(const FlagGuard&) = delete;
    FlagGuard& operator=(const FlagGuard&) = delete;

private:
    bool& flag_;
};

void RequireTimestamp(const CallContext& ctx, const char* op) {
    if (ctx.timestamp == 0) {
        throw std::invalid_argument(std::string(op) + ": call timestamp must be non-zero");
    }
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

StakeLedger::StakeLedger(const IAuthorityCheck& authority, IValueTransfer& transfer)
    : authority_(authority), transfer_(transfer) {}

StakeLedger::StakeLedger(const IAuthorityCheck& authority, IValueTransfer& transfer,
                         Amount depositFloor, Duration cooldownPeriod)
    : authority_(authority), transfer_(transfer) {
    state_.depositFloor = depositFloor;
    state_.cooldownPeriod = cooldownPeriod;
}

StakeLedger::~StakeLedger() = default;

// ============================================================================
// Helpers
// ============================================================================

bool StakeLedger::IsAdmin(const Identity& identity) const {
    return authority_.HasAdminCapability(identity);
}

bool StakeLedger::CooldownElapsed(const ParticipantRecord& record, Timestamp now) const {
    // Inclusive boundary, written to avoid overflowing registeredAt + cooldown
    return now >= record.registeredAt &&
           now - record.registeredAt >= state_.cooldownPeriod;
}

LedgerResult StakeLedger::Reject(const char* op, const CallContext& ctx,
                                 LedgerError error, const std::string& detail) const {
    LOG_DEBUG(util::LogCategory::LEDGER) << op << " by " << ctx.caller.ToShortString()
                                         << " rejected: " << LedgerErrorToString(error)
                                         << (detail.empty() ? "" : " (" + detail + ")");
    return LedgerResult::Error(error, detail);
}

Amount StakeLedger::AddOrThrow(Amount a, Amount b, const char* what) {
    if (!CanAdd(a, b)) {
        LOG_FATAL(util::LogCategory::LEDGER) << what << " overflow: " << a << " + " << b;
    }
    return CheckedAdd(a, b);
}

void StakeLedger::Emit(const LedgerEvent& event) {
    std::vector<EventCallback> callbacks;
    callbacks.reserve(subscribers_.size());
    for (const auto& [id, callback] : subscribers_) {
        callbacks.push_back(callback);
    }
    for (const auto& callback : callbacks) {
        callback(event);
    }
}

// ============================================================================
// Administration
// ============================================================================

LedgerResult StakeLedger::SetConfiguration(const CallContext& ctx, Amount depositFloor,
                                           Duration cooldownPeriod) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const char* op = "setConfiguration";

    if (unregisterInFlight_) {
        return Reject(op, ctx, LedgerError::ReentrantCall);
    }
    if (!IsAdmin(ctx.caller)) {
        return Reject(op, ctx, LedgerError::NotAuthorized);
    }

    state_.depositFloor = depositFloor;
    state_.cooldownPeriod = cooldownPeriod;

    LOG_INFO(util::LogCategory::LEDGER) << "Configuration updated: deposit floor "
                                        << depositFloor << ", cooldown "
                                        << util::FormatDuration(cooldownPeriod);

    LedgerEvent event;
    event.type = LedgerEventType::ConfigurationUpdated;
    event.depositFloor = depositFloor;
    event.cooldownPeriod = cooldownPeriod;
    Emit(event);
    return LedgerResult::Ok();
}

LedgerResult StakeLedger::Slash(const CallContext& ctx, const Identity& target, Amount amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const char* op = "slash";

    if (unregisterInFlight_) {
        return Reject(op, ctx, LedgerError::ReentrantCall);
    }
    if (!IsAdmin(ctx.caller)) {
        return Reject(op, ctx, LedgerError::NotAuthorized);
    }

    auto it = state_.records.find(target);
    Amount staked = it == state_.records.end() ? 0 : it->second.stakedAmount;
    if (amount > staked) {
        return Reject(op, ctx, LedgerError::InsufficientStake,
                      target.ToShortString() + " holds " + std::to_string(staked));
    }

    Amount newPool = AddOrThrow(state_.confiscatedTotal, amount, "confiscated total");

    if (it != state_.records.end()) {
        it->second.stakedAmount -= amount;
    }
    state_.confiscatedTotal = newPool;

    LOG_INFO(util::LogCategory::LEDGER) << "Slashed " << amount << " from "
                                        << target.ToShortString() << ", pool now "
                                        << state_.confiscatedTotal;

    LedgerEvent event;
    event.type = LedgerEventType::Slashed;
    event.identity = target;
    event.amount = amount;
    Emit(event);
    return LedgerResult::Ok();
}

LedgerResult StakeLedger::Sweep(const CallContext& ctx, Amount amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const char* op = "sweep";

    if (unregisterInFlight_) {
        return Reject(op, ctx, LedgerError::ReentrantCall);
    }
    if (!IsAdmin(ctx.caller)) {
        return Reject(op, ctx, LedgerError::NotAuthorized);
    }
    if (amount > state_.confiscatedTotal) {
        return Reject(op, ctx, LedgerError::InsufficientFunds,
                      "pool holds " + std::to_string(state_.confiscatedTotal));
    }

    state_.confiscatedTotal -= amount;
    state_.custodyBalance -= amount;

    if (amount > 0) {
        TransferResult sent = transfer_.Send(ctx.caller, amount);
        if (!sent.success) {
            state_.confiscatedTotal = AddOrThrow(state_.confiscatedTotal, amount,
                                                 "confiscated total");
            state_.custodyBalance = AddOrThrow(state_.custodyBalance, amount, "custody");
            LOG_WARN(util::LogCategory::LEDGER) << "Sweep of " << amount << " to "
                                                << ctx.caller.ToShortString()
                                                << " failed, rolled back: " << sent.reason;
            return LedgerResult::Error(LedgerError::TransferFailed, sent.reason);
        }
    }

    LOG_INFO(util::LogCategory::LEDGER) << "Swept " << amount << " to "
                                        << ctx.caller.ToShortString();

    LedgerEvent event;
    event.type = LedgerEventType::Withdrawn;
    event.identity = ctx.caller;
    event.amount = amount;
    Emit(event);
    return LedgerResult::Ok();
}

// ============================================================================
// Participants
// ============================================================================

LedgerResult StakeLedger::Register(const CallContext& ctx, Amount deposit) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const char* op = "register";

    if (unregisterInFlight_) {
        return Reject(op, ctx, LedgerError::ReentrantCall);
    }
    if (state_.records.count(ctx.caller) != 0) {
        return Reject(op, ctx, LedgerError::AlreadyRegistered);
    }
    if (deposit < state_.depositFloor) {
        return Reject(op, ctx, LedgerError::InsufficientDeposit,
                      std::to_string(deposit) + " < " + std::to_string(state_.depositFloor));
    }
    RequireTimestamp(ctx, op);

    Amount newCustody = AddOrThrow(state_.custodyBalance, deposit, "custody");

    ParticipantRecord record;
    record.registeredAt = ctx.timestamp;
    record.stakedAmount = deposit;
    state_.records.emplace(ctx.caller, record);
    state_.custodyBalance = newCustody;

    LOG_INFO(util::LogCategory::LEDGER) << "Registered " << ctx.caller.ToShortString()
                                        << " with " << deposit;

    LedgerEvent event;
    event.type = LedgerEventType::Registered;
    event.identity = ctx.caller;
    event.amount = deposit;
    Emit(event);
    return LedgerResult::Ok();
}

LedgerResult StakeLedger::Unregister(const CallContext& ctx) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const char* op = "unregister";

    if (unregisterInFlight_) {
        return Reject(op, ctx, LedgerError::ReentrantCall);
    }
    auto it = state_.records.find(ctx.caller);
    if (it == state_.records.end()) {
        return Reject(op, ctx, LedgerError::NotRegistered);
    }
    if (!CooldownElapsed(it->second, ctx.timestamp)) {
        return Reject(op, ctx, LedgerError::CooldownNotElapsed,
                      "ends at " + std::to_string(*CooldownEndsAt(ctx.caller)));
    }

    ParticipantRecord removed = it->second;
    {
        // Held only while funds are released; subscribers run after it drops
        FlagGuard guard(unregisterInFlight_);

        state_.records.erase(it);
        state_.custodyBalance -= removed.stakedAmount;

        if (removed.stakedAmount > 0) {
            TransferResult sent = transfer_.Send(ctx.caller, removed.stakedAmount);
            if (!sent.success) {
                // Nothing else could have touched the ledger while the flag was set
                state_.records.emplace(ctx.caller, removed);
                state_.custodyBalance += removed.stakedAmount;
                LOG_WARN(util::LogCategory::LEDGER) << "Unregister of "
                                                    << ctx.caller.ToShortString()
                                                    << " failed, record restored: "
                                                    << sent.reason;
                return LedgerResult::Error(LedgerError::TransferFailed, sent.reason);
            }
        }
    }

    LOG_INFO(util::LogCategory::LEDGER) << "Unregistered " << ctx.caller.ToShortString()
                                        << ", returned " << removed.stakedAmount;

    LedgerEvent event;
    event.type = LedgerEventType::Unregistered;
    event.identity = ctx.caller;
    event.amount = removed.stakedAmount;
    Emit(event);
    return LedgerResult::Ok();
}

LedgerResult StakeLedger::Stake(const CallContext& ctx, Amount amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const char* op = "stake";

    if (unregisterInFlight_) {
        return Reject(op, ctx, LedgerError::ReentrantCall);
    }
    if (amount == 0) {
        return Reject(op, ctx, LedgerError::ZeroAmount);
    }
    auto it = state_.records.find(ctx.caller);
    if (it == state_.records.end()) {
        return Reject(op, ctx, LedgerError::NotRegistered);
    }

    // Custody bounds every stake, so checking it covers the record too
    Amount newCustody = AddOrThrow(state_.custodyBalance, amount, "custody");
    Amount newStake = AddOrThrow(it->second.stakedAmount, amount, "stake");

    it->second.stakedAmount = newStake;
    state_.custodyBalance = newCustody;

    LOG_INFO(util::LogCategory::LEDGER) << "Staked " << amount << " for "
                                        << ctx.caller.ToShortString() << ", total " << newStake;

    LedgerEvent event;
    event.type = LedgerEventType::Staked;
    event.identity = ctx.caller;
    event.amount = amount;
    Emit(event);
    return LedgerResult::Ok();
}

LedgerResult StakeLedger::Unstake(const CallContext& ctx, Amount amount) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const char* op = "unstake";

    if (unregisterInFlight_) {
        return Reject(op, ctx, LedgerError::ReentrantCall);
    }
    auto it = state_.records.find(ctx.caller);
    if (it == state_.records.end()) {
        return Reject(op, ctx, LedgerError::NotRegistered);
    }
    if (amount > it->second.stakedAmount) {
        return Reject(op, ctx, LedgerError::InsufficientStake,
                      std::to_string(amount) + " > " + std::to_string(it->second.stakedAmount));
    }
    if (!CooldownElapsed(it->second, ctx.timestamp)) {
        return Reject(op, ctx, LedgerError::CooldownNotElapsed,
                      "ends at " + std::to_string(*CooldownEndsAt(ctx.caller)));
    }

    const Timestamp registeredAt = it->second.registeredAt;
    it->second.stakedAmount -= amount;
    state_.custodyBalance -= amount;

    if (amount > 0) {
        TransferResult sent = transfer_.Send(ctx.caller, amount);
        if (!sent.success) {
            // The transfer may have re-entered and unregistered the caller. The
            // record then comes back with its old registeredAt and no Registered
            // event, so observers see Unregistered followed by a live record.
            // Only Unregister holds the reentrancy guard, so this cannot be refused.
            ParticipantRecord& record = state_.records[ctx.caller];
            if (!record.IsRegistered()) {
                record.registeredAt = registeredAt;
            }
            record.stakedAmount = AddOrThrow(record.stakedAmount, amount, "stake");
            state_.custodyBalance = AddOrThrow(state_.custodyBalance, amount, "custody");
            LOG_WARN(util::LogCategory::LEDGER) << "Unstake of " << amount << " for "
                                                << ctx.caller.ToShortString()
                                                << " failed, rolled back: " << sent.reason;
            return LedgerResult::Error(LedgerError::TransferFailed, sent.reason);
        }
    }

    LOG_INFO(util::LogCategory::LEDGER) << "Unstaked " << amount << " for "
                                        << ctx.caller.ToShortString();

    LedgerEvent event;
    event.type = LedgerEventType::Unstaked;
    event.identity = ctx.caller;
    event.amount = amount;
    Emit(event);
    return LedgerResult::Ok();
}

// ============================================================================
// Queries
// ============================================================================

ParticipantRecord StakeLedger::GetRecord(const Identity& identity) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = state_.records.find(identity);
    if (it == state_.records.end()) {
        return ParticipantRecord{};
    }
    return it->second;
}

bool StakeLedger::IsRegistered(const Identity& identity) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.records.count(identity) != 0;
}

std::optional<Timestamp> StakeLedger::CooldownEndsAt(const Identity& identity) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = state_.records.find(identity);
    if (it == state_.records.end()) {
        return std::nullopt;
    }
    Timestamp start = it->second.registeredAt;
    if (!CanAdd(start, state_.cooldownPeriod)) {
        return std::numeric_limits<Timestamp>::max();
    }
    return start + state_.cooldownPeriod;
}

Amount StakeLedger::GetDepositFloor() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.depositFloor;
}

Duration StakeLedger::GetCooldownPeriod() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.cooldownPeriod;
}

Amount StakeLedger::GetConfiscatedTotal() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.confiscatedTotal;
}

Amount StakeLedger::GetCustodyBalance() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.custodyBalance;
}

Amount StakeLedger::GetTotalStaked() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.TotalStaked();
}

size_t StakeLedger::ParticipantCount() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.records.size();
}

void StakeLedger::ForEachParticipant(
    const std::function<void(const Identity&, const ParticipantRecord&)>& visitor) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (const auto& [identity, record] : state_.records) {
        visitor(identity, record);
    }
}

bool StakeLedger::CheckConservation() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_.IsConserved();
}

// ============================================================================
// Persistence
// ============================================================================

LedgerState StakeLedger::Snapshot() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return state_;
}

void StakeLedger::Restore(const LedgerState& state) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (unregisterInFlight_) {
        throw std::logic_error("StakeLedger::Restore during unregister");
    }
    for (const auto& [identity, record] : state.records) {
        if (!record.IsRegistered()) {
            throw std::invalid_argument("StakeLedger::Restore: record for " +
                                        identity.ToShortString() + " has no registration time");
        }
    }
    if (!state.IsConserved()) {
        throw std::invalid_argument(
            "StakeLedger::Restore: custody does not match stakes plus pool");
    }
    state_ = state;
    LOG_DEBUG(util::LogCategory::LEDGER) << "Restored " << state_.records.size()
                                         << " participants, custody "
                                         << state_.custodyBalance;
}

// ============================================================================
// Notifications
// ============================================================================

StakeLedger::SubscriptionId StakeLedger::Subscribe(EventCallback callback) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    SubscriptionId id = nextSubscriptionId_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
}

void StakeLedger::Unsubscribe(SubscriptionId id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    subscribers_.erase(id);
}

// ============================================================================
// EventRecorder
// ============================================================================

EventRecorder::EventRecorder(StakeLedger& ledger)
    : ledger_(ledger),
      id_(ledger.Subscribe([this](const LedgerEvent& event) { events_.push_back(event); })) {}

EventRecorder::~EventRecorder() {
    ledger_.Unsubscribe(id_);
}

} // namespace ledger
} // namespace stakeledger
