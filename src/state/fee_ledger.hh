#pragma once

#include "core/types.hh"
#include <optional>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <mutex>

namespace spv {

// ============================================================================
// Payment Rail
// ============================================================================

enum class PayoutResult : std::uint8_t {
    SUCCESS = 0,
    RECIPIENT_REJECTED = 1,   // recipient cannot receive funds
    INSUFFICIENT_FUNDS = 2,   // rail cannot cover the amount
};

[[nodiscard]] std::string_view payout_result_string(PayoutResult result);

// Value-transfer capability supplied by the host ledger. Fees are collected
// from the payer into escrow, and payouts leave from escrow. A failed
// collect() or pay() must leave the rail unchanged.
//
// The light client calls the rail while holding its own lock. A rail may
// call the client's read-only queries from inside these methods, but must
// not submit headers, verify claims or restore state.
class PaymentRail {
public:
    virtual ~PaymentRail() = default;

    [[nodiscard]] virtual PayoutResult collect(amount_t amount, const Address& payer) = 0;

    // Reverses a collect() made earlier in the same call; cannot fail
    virtual void refund(amount_t amount, const Address& payer) = 0;

    [[nodiscard]] virtual PayoutResult pay(amount_t amount, const Address& recipient) = 0;
};

// In-memory rail: per-account balances plus one escrow pool.
class BalanceBook : public PaymentRail {
public:
    explicit BalanceBook(amount_t escrow = 0);

    [[nodiscard]] PayoutResult collect(amount_t amount, const Address& payer) override;
    void refund(amount_t amount, const Address& payer) override;
    [[nodiscard]] PayoutResult pay(amount_t amount, const Address& recipient) override;

    void credit(const Address& account, amount_t amount);

    // Recipient will be refused by every later pay()
    void refuse(const Address& recipient);
    void accept(const Address& recipient);

    [[nodiscard]] amount_t escrow() const;
    [[nodiscard]] amount_t balance_of(const Address& addr) const;
    [[nodiscard]] std::size_t payout_count() const;

private:
    amount_t escrow_;
    std::unordered_map<Address, amount_t> balances_;
    std::unordered_set<Address> refused_;
    std::size_t payouts_ = 0;
    mutable std::mutex mutex_;
};

// ============================================================================
// Fee Ledger
// ============================================================================

// Fee configuration, per-header fee recipients and fee totals. Relay fees are
// collected and retired (never paid out); verify fees are collected, then go
// to the header's recipient when a claim is proven and stay in escrow
// otherwise.
class FeeLedger {
public:
    FeeLedger() = default;
    FeeLedger(amount_t relay_fee, amount_t verify_fee);

    [[nodiscard]] amount_t relay_fee() const { return relay_fee_; }
    [[nodiscard]] amount_t verify_fee() const { return verify_fee_; }

    [[nodiscard]] bool covers_relay_fee(amount_t paid) const { return paid >= relay_fee_; }
    [[nodiscard]] bool covers_verify_fee(amount_t paid) const { return paid >= verify_fee_; }

    // Set once per header; false if a recipient is already on record
    [[nodiscard]] bool record_recipient(const hash_t& fingerprint, const Address& recipient);
    [[nodiscard]] std::optional<Address> recipient(const hash_t& fingerprint) const;
    [[nodiscard]] const std::unordered_map<hash_t, Address>& recipients() const { return recipients_; }

    void burn(amount_t amount);
    void retain(amount_t amount);
    void record_payout(amount_t amount);

    [[nodiscard]] amount_t burned_total() const { return burned_total_; }
    [[nodiscard]] amount_t retained_total() const { return retained_total_; }
    [[nodiscard]] amount_t paid_out_total() const { return paid_out_total_; }

    // Totals only; recipients are written at admission, never during
    // verification, so they need no undo.
    struct Checkpoint {
        amount_t burned;
        amount_t retained;
        amount_t paid_out;
    };
    [[nodiscard]] Checkpoint checkpoint() const;
    void rollback(const Checkpoint& cp);

    // Used when restoring persisted state
    void restore_totals(amount_t burned, amount_t retained, amount_t paid_out);

    bool operator==(const FeeLedger&) const = default;

private:
    amount_t relay_fee_ = 0;
    amount_t verify_fee_ = 0;
    std::unordered_map<hash_t, Address> recipients_;
    amount_t burned_total_ = 0;
    amount_t retained_total_ = 0;
    amount_t paid_out_total_ = 0;
};

}  // namespace spv
