#pragma once

#include "core/types.hh"
#include "bridge/chain_state.hh"
#include "bridge/proof_oracle.hh"
#include "state/fee_ledger.hh"
#include <string_view>
#include <vector>

namespace spv {

// ============================================================================
// Verification Result
// ============================================================================

enum class VerifyResult : std::uint8_t {
    PROVEN = 0x00,
    // Routine "not proven" outcomes; the verify fee is retained
    UNKNOWN_HEADER = 0x01,
    NOT_CANONICAL = 0x02,
    INSUFFICIENT_DEPTH = 0x03,
    PROOF_REJECTED = 0x04,
    // Aborts; no state change
    INSUFFICIENT_FEE = 0x10,
    PAYOUT_FAILED = 0x11,
    FEE_UNCOLLECTED = 0x12,
};

[[nodiscard]] std::string_view verify_result_string(VerifyResult result);

struct VerifyOutcome {
    VerifyResult result = VerifyResult::UNKNOWN_HEADER;
    hash_t claim_fingerprint{};
    hash_t reference_root{};     // root handed to the oracle, zero if not reached
    amount_t fee_paid_out = 0;
    std::vector<Event> events;

    [[nodiscard]] bool proven() const { return result == VerifyResult::PROVEN; }
    [[nodiscard]] bool aborted() const {
        return result == VerifyResult::INSUFFICIENT_FEE ||
               result == VerifyResult::PAYOUT_FAILED ||
               result == VerifyResult::FEE_UNCOLLECTED;
    }
};

// Which header root a state claim is checked against. Transaction claims
// always use the transactions root.
enum class StateRootSource : std::uint8_t {
    STORAGE_ROOT = 0,
    TRANSACTIONS_ROOT = 1,    // legacy behaviour
};

enum class ClaimKind : std::uint8_t {
    TRANSACTION = 0,
    STATE = 1,
};

// ============================================================================
// Proof Verifier
// ============================================================================

// Collects the verify fee from the payer, gates an inclusion claim on
// canonicality, confirmation depth and the Merkle-proof oracle, then pays
// the collected fee to the header's fee recipient. An aborted call leaves
// both the state and the rail as they were.
class ProofVerifier {
public:
    ProofVerifier(const MerkleProofOracle& oracle,
                  PaymentRail& rail,
                  StateRootSource state_root_source = StateRootSource::STORAGE_ROOT);

    [[nodiscard]] VerifyOutcome verify_transaction(
        ChainState& state,
        const hash_t& tx_id,
        const hash_t& header_fingerprint,
        height_t min_depth,
        const MerkleProof& proof,
        const Address& payer,
        amount_t paid_fee);

    [[nodiscard]] VerifyOutcome verify_state(
        ChainState& state,
        const StateClaim& claim,
        const hash_t& header_fingerprint,
        height_t min_depth,
        const MerkleProof& proof,
        const Address& payer,
        amount_t paid_fee);

    [[nodiscard]] StateRootSource state_root_source() const { return state_root_source_; }

private:
    const MerkleProofOracle& oracle_;
    PaymentRail& rail_;
    StateRootSource state_root_source_;

    VerifyOutcome verify(
        ChainState& state,
        ClaimKind kind,
        const hash_t& claim_fingerprint,
        const hash_t& header_fingerprint,
        height_t min_depth,
        const MerkleProof& proof,
        const Address& payer,
        amount_t paid_fee);

    [[nodiscard]] hash_t reference_root(ClaimKind kind, const Header& header) const;
};

}  // namespace spv
