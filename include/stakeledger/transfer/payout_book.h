// STAKELEDGER - Payout Book
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License
//
// Value transfer backend for the standalone tool: outbound transfers are
// credited to per-recipient payout balances instead of leaving the process.

#ifndef STAKELEDGER_TRANSFER_PAYOUT_BOOK_H
#define STAKELEDGER_TRANSFER_PAYOUT_BOOK_H

#include "stakeledger/core/types.h"
#include "stakeledger/ledger/interfaces.h"

#include <map>
#include <mutex>
#include <set>

namespace stakeledger {
namespace transfer {

class PayoutBook : public ledger::IValueTransfer {
public:
    PayoutBook() = default;

    /// Credit recipient, or fail if the recipient refuses transfers
    ledger::TransferResult Send(const Identity& recipient, Amount amount) override;

    /// Make future sends to identity fail
    void Refuse(const Identity& identity);
    void Accept(const Identity& identity);
    bool IsRefused(const Identity& identity) const;

    Amount GetBalance(const Identity& identity) const;

    /// Sum of all payouts
    Amount GetTotalPaid() const;

    std::map<Identity, Amount> GetBalances() const;

    /// Replace all balances (used when loading from storage)
    void SetBalances(const std::map<Identity, Amount>& balances);

private:
    mutable std::mutex mutex_;
    std::map<Identity, Amount> balances_;
    std::set<Identity> refused_;
};

} // namespace transfer
} // namespace stakeledger

#endif // STAKELEDGER_TRANSFER_PAYOUT_BOOK_H
