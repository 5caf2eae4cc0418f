// STAKELEDGER - Payout Book Implementation
// Copyright (c) 2024 STAKELEDGER Developers
// MIT License

#include "stakeledger/transfer/payout_book.h"
#include "stakeledger/util/logging.h"

namespace stakeledger {
namespace transfer {

ledger::TransferResult PayoutBook::Send(const Identity& recipient, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (refused_.count(recipient) != 0) {
        LOG_WARN(util::LogCategory::TRANSFER) << "Recipient " << recipient.ToShortString()
                                              << " refused " << amount;
        return ledger::TransferResult::Failed("recipient refuses transfers");
    }

    Amount& balance = balances_[recipient];
    if (!CanAdd(balance, amount)) {
        return ledger::TransferResult::Failed("payout balance would overflow");
    }
    balance += amount;

    LOG_DEBUG(util::LogCategory::TRANSFER) << "Paid " << amount << " to "
                                           << recipient.ToShortString()
                                           << ", balance " << balance;
    return ledger::TransferResult::Ok();
}

void PayoutBook::Refuse(const Identity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    refused_.insert(identity);
}

void PayoutBook::Accept(const Identity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    refused_.erase(identity);
}

bool PayoutBook::IsRefused(const Identity& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return refused_.count(identity) != 0;
}

Amount PayoutBook::GetBalance(const Identity& identity) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(identity);
    return it == balances_.end() ? 0 : it->second;
}

Amount PayoutBook::GetTotalPaid() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount total = 0;
    for (const auto& [identity, balance] : balances_) {
        total = CheckedAdd(total, balance);
    }
    return total;
}

std::map<Identity, Amount> PayoutBook::GetBalances() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return balances_;
}

void PayoutBook::SetBalances(const std::map<Identity, Amount>& balances) {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_ = balances;
}

} // namespace transfer
} // namespace stakeledger
