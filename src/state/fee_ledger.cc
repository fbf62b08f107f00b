#include "fee_ledger.hh"
#include "core/logging.hh"
#include <stdexcept>

namespace spv {

std::string_view payout_result_string(PayoutResult result) {
    switch (result) {
        case PayoutResult::SUCCESS: return "success";
        case PayoutResult::RECIPIENT_REJECTED: return "recipient_rejected";
        case PayoutResult::INSUFFICIENT_FUNDS: return "insufficient_funds";
    }
    return "unknown";
}

// ============================================================================
// BalanceBook Implementation
// ============================================================================

BalanceBook::BalanceBook(amount_t escrow) : escrow_(escrow) {}

PayoutResult BalanceBook::collect(amount_t amount, const Address& payer) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = balances_.find(payer);
    amount_t available = it == balances_.end() ? 0 : it->second;
    if (available < amount) {
        SPV_LOG_DEBUG(log::fees) << "Collection failed: " << payer.to_hex() << " holds "
                                 << available << " < " << amount;
        return PayoutResult::INSUFFICIENT_FUNDS;
    }

    if (amount > 0) {
        it->second -= amount;
        escrow_ += amount;
    }
    SPV_LOG_TRACE(log::fees) << "Collected " << amount << " from " << payer.to_hex();
    return PayoutResult::SUCCESS;
}

void BalanceBook::refund(amount_t amount, const Address& payer) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (escrow_ < amount) {
        throw std::logic_error("refund exceeds escrow");
    }
    escrow_ -= amount;
    balances_[payer] += amount;
    SPV_LOG_TRACE(log::fees) << "Refunded " << amount << " to " << payer.to_hex();
}

PayoutResult BalanceBook::pay(amount_t amount, const Address& recipient) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (refused_.count(recipient) != 0) {
        SPV_LOG_DEBUG(log::fees) << "Payout refused by recipient " << recipient.to_hex();
        return PayoutResult::RECIPIENT_REJECTED;
    }

    if (escrow_ < amount) {
        SPV_LOG_DEBUG(log::fees) << "Payout failed: escrow " << escrow_ << " < " << amount;
        return PayoutResult::INSUFFICIENT_FUNDS;
    }

    escrow_ -= amount;
    balances_[recipient] += amount;
    ++payouts_;

    SPV_LOG_TRACE(log::fees) << "Paid " << amount << " to " << recipient.to_hex();
    return PayoutResult::SUCCESS;
}

void BalanceBook::credit(const Address& account, amount_t amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_[account] += amount;
}

void BalanceBook::refuse(const Address& recipient) {
    std::lock_guard<std::mutex> lock(mutex_);
    refused_.insert(recipient);
}

void BalanceBook::accept(const Address& recipient) {
    std::lock_guard<std::mutex> lock(mutex_);
    refused_.erase(recipient);
}

amount_t BalanceBook::escrow() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return escrow_;
}

amount_t BalanceBook::balance_of(const Address& addr) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(addr);
    return it == balances_.end() ? 0 : it->second;
}

std::size_t BalanceBook::payout_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return payouts_;
}

// ============================================================================
// FeeLedger Implementation
// ============================================================================

FeeLedger::FeeLedger(amount_t relay_fee, amount_t verify_fee)
    : relay_fee_(relay_fee)
    , verify_fee_(verify_fee) {}

bool FeeLedger::record_recipient(const hash_t& fingerprint, const Address& recipient) {
    return recipients_.emplace(fingerprint, recipient).second;
}

std::optional<Address> FeeLedger::recipient(const hash_t& fingerprint) const {
    auto it = recipients_.find(fingerprint);
    if (it == recipients_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void FeeLedger::burn(amount_t amount) {
    burned_total_ += amount;
}

void FeeLedger::retain(amount_t amount) {
    retained_total_ += amount;
}

void FeeLedger::record_payout(amount_t amount) {
    paid_out_total_ += amount;
}

FeeLedger::Checkpoint FeeLedger::checkpoint() const {
    return Checkpoint{burned_total_, retained_total_, paid_out_total_};
}

void FeeLedger::rollback(const Checkpoint& cp) {
    burned_total_ = cp.burned;
    retained_total_ = cp.retained;
    paid_out_total_ = cp.paid_out;
}

void FeeLedger::restore_totals(amount_t burned, amount_t retained, amount_t paid_out) {
    burned_total_ = burned;
    retained_total_ = retained;
    paid_out_total_ = paid_out;
}

}  // namespace spv
