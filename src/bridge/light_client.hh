#pragma once

#include "core/types.hh"
#include "chain/header.hh"
#include "bridge/chain_state.hh"
#include "bridge/proof_oracle.hh"
#include "bridge/proof_verifier.hh"
#include "state/fee_ledger.hh"
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace spv {

// ============================================================================
// Configuration
// ============================================================================

// Fixed at initialization.
struct LightClientConfig {
    hash_t difficulty_threshold{};
    amount_t relay_fee = 0;
    amount_t verify_fee = 0;
    StateRootSource state_root_source = StateRootSource::STORAGE_ROOT;

    // Empty string when valid, otherwise the first problem found
    [[nodiscard]] std::string validate() const;

    // Parses a 64-digit hex threshold (0x prefix optional)
    [[nodiscard]] static std::optional<hash_t> difficulty_from_hex(std::string_view hex);
};

// ============================================================================
// Results
// ============================================================================

struct SubmitReceipt {
    SubmitResult result = SubmitResult::ACCEPTED;
    hash_t fingerprint{};
    height_t height = 0;
    bool new_tip = false;
    bool reorganized = false;
    std::vector<Event> events;

    [[nodiscard]] bool accepted() const { return result == SubmitResult::ACCEPTED; }
};

// ============================================================================
// Light Client
// ============================================================================

// SPV light client for a foreign proof-of-work chain. Calls are serialized;
// each one either completes or leaves the state exactly as it found it.
//
// submit_header and the verify calls invoke the PaymentRail with the client
// lock held. The lock is recursive, so a rail may call the const queries
// below from inside collect(), refund() or pay(). Calling submit_header,
// a verify call or restore from inside the rail is not supported.
class LightClient {
public:
    // Initializes around a trusted checkpoint header. `deployer` receives the
    // verify fees for claims against the checkpoint.
    // Throws std::invalid_argument on an invalid config or all-zero header.
    LightClient(const Header& genesis,
                const LightClientConfig& config,
                const Address& deployer,
                PaymentRail& rail,
                const MerkleProofOracle& oracle);

    LightClient(const LightClient&) = delete;
    LightClient& operator=(const LightClient&) = delete;

    // Collects `paid_fee` from `submitter` through the rail once the header
    // passes every check
    SubmitReceipt submit_header(const Header& header,
                                const Address& submitter,
                                amount_t paid_fee);

    // `paid_fee` is collected from `payer` before gating. It is refunded on
    // PAYOUT_FAILED and never collected on INSUFFICIENT_FEE.

    VerifyOutcome verify_transaction_inclusion(const hash_t& tx_id,
                                               const hash_t& header_fingerprint,
                                               height_t min_depth,
                                               const MerkleProof& proof,
                                               const Address& payer,
                                               amount_t paid_fee);

    VerifyOutcome verify_state_inclusion(const StateClaim& claim,
                                         const hash_t& header_fingerprint,
                                         height_t min_depth,
                                         const MerkleProof& proof,
                                         const Address& payer,
                                         amount_t paid_fee);

    [[nodiscard]] bool is_header_known(const hash_t& fingerprint) const;
    [[nodiscard]] bool is_canonical(const hash_t& fingerprint) const;
    [[nodiscard]] static hash_t fingerprint_of(const Header& header);

    [[nodiscard]] height_t best_height() const;
    [[nodiscard]] height_t genesis_height() const;
    [[nodiscard]] std::optional<hash_t> canonical_at(height_t height) const;
    [[nodiscard]] std::optional<Header> header(const hash_t& fingerprint) const;
    [[nodiscard]] std::optional<Address> fee_recipient(const hash_t& fingerprint) const;
    [[nodiscard]] std::size_t header_count() const;

    [[nodiscard]] amount_t burned_total() const;
    [[nodiscard]] amount_t retained_total() const;
    [[nodiscard]] amount_t paid_out_total() const;

    [[nodiscard]] const LightClientConfig& config() const { return config_; }

    // Events emitted since construction or the last successful restore
    [[nodiscard]] std::vector<Event> events() const;

    [[nodiscard]] std::vector<std::uint8_t> snapshot() const;

    // Replaces the whole chain state and clears the event log. The snapshot
    // must carry the same threshold and fees as this client's config; false
    // leaves state and events untouched.
    [[nodiscard]] bool restore(std::span<const std::uint8_t> data);

private:
    LightClientConfig config_;
    ChainState state_;
    PaymentRail& rail_;
    ProofVerifier verifier_;
    std::vector<Event> events_;
    mutable std::recursive_mutex mutex_;

    VerifyOutcome record(VerifyOutcome outcome);
};

}  // namespace spv
