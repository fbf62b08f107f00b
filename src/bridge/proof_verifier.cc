#include "bridge/proof_verifier.hh"
#include "core/logging.hh"
#include <stdexcept>

namespace spv {

std::string_view verify_result_string(VerifyResult result) {
    switch (result) {
        case VerifyResult::PROVEN: return "proven";
        case VerifyResult::UNKNOWN_HEADER: return "unknown_header";
        case VerifyResult::NOT_CANONICAL: return "not_canonical";
        case VerifyResult::INSUFFICIENT_DEPTH: return "insufficient_depth";
        case VerifyResult::PROOF_REJECTED: return "proof_rejected";
        case VerifyResult::INSUFFICIENT_FEE: return "insufficient_fee";
        case VerifyResult::PAYOUT_FAILED: return "payout_failed";
        case VerifyResult::FEE_UNCOLLECTED: return "fee_uncollected";
    }
    return "unknown";
}

ProofVerifier::ProofVerifier(const MerkleProofOracle& oracle,
                             PaymentRail& rail,
                             StateRootSource state_root_source)
    : oracle_(oracle)
    , rail_(rail)
    , state_root_source_(state_root_source) {}

VerifyOutcome ProofVerifier::verify_transaction(
    ChainState& state,
    const hash_t& tx_id,
    const hash_t& header_fingerprint,
    height_t min_depth,
    const MerkleProof& proof,
    const Address& payer,
    amount_t paid_fee) {

    return verify(state, ClaimKind::TRANSACTION, tx_id, header_fingerprint,
                  min_depth, proof, payer, paid_fee);
}

VerifyOutcome ProofVerifier::verify_state(
    ChainState& state,
    const StateClaim& claim,
    const hash_t& header_fingerprint,
    height_t min_depth,
    const MerkleProof& proof,
    const Address& payer,
    amount_t paid_fee) {

    return verify(state, ClaimKind::STATE, claim.fingerprint(), header_fingerprint,
                  min_depth, proof, payer, paid_fee);
}

hash_t ProofVerifier::reference_root(ClaimKind kind, const Header& header) const {
    if (kind == ClaimKind::STATE && state_root_source_ == StateRootSource::STORAGE_ROOT) {
        return header.storage_root;
    }
    return header.tx_root;
}

VerifyOutcome ProofVerifier::verify(
    ChainState& state,
    ClaimKind kind,
    const hash_t& claim_fingerprint,
    const hash_t& header_fingerprint,
    height_t min_depth,
    const MerkleProof& proof,
    const Address& payer,
    amount_t paid_fee) {

    VerifyOutcome outcome;
    outcome.claim_fingerprint = claim_fingerprint;

    if (!state.fees.covers_verify_fee(paid_fee)) {
        outcome.result = VerifyResult::INSUFFICIENT_FEE;
        SPV_LOG_DEBUG(log::verify) << "Verify fee " << paid_fee << " below "
                                   << state.fees.verify_fee();
        return outcome;
    }

    if (rail_.collect(paid_fee, payer) != PayoutResult::SUCCESS) {
        outcome.result = VerifyResult::FEE_UNCOLLECTED;
        SPV_LOG_DEBUG(log::verify) << "Verify fee " << paid_fee << " not collected from "
                                   << payer.to_hex();
        return outcome;
    }

    auto checkpoint = state.fees.checkpoint();

    auto header = state.headers.get(header_fingerprint);
    if (!header) {
        outcome.result = VerifyResult::UNKNOWN_HEADER;
    } else if (!state.canon.is_canonical(state.headers, header_fingerprint)) {
        outcome.result = VerifyResult::NOT_CANONICAL;
    } else if (state.best_height() - header->height < min_depth) {
        outcome.result = VerifyResult::INSUFFICIENT_DEPTH;
    } else {
        outcome.reference_root = reference_root(kind, *header);
        outcome.result = oracle_.verify(claim_fingerprint, proof, outcome.reference_root)
            ? VerifyResult::PROVEN
            : VerifyResult::PROOF_REJECTED;
    }

    if (!outcome.proven()) {
        // The fee stays in escrow even when nothing is proven
        state.fees.retain(paid_fee);
        SPV_LOG_DEBUG(log::verify) << "Claim " << short_hex(claim_fingerprint) << " against "
                                   << short_hex(header_fingerprint) << " not proven: "
                                   << verify_result_string(outcome.result);
        return outcome;
    }

    auto recipient = state.fees.recipient(header_fingerprint);
    if (!recipient) {
        // Every admitted header gets a recipient at admission
        rail_.refund(paid_fee, payer);
        throw std::logic_error("canonical header without fee recipient");
    }

    state.fees.record_payout(paid_fee);

    PayoutResult payout = rail_.pay(paid_fee, *recipient);
    if (payout != PayoutResult::SUCCESS) {
        state.fees.rollback(checkpoint);
        rail_.refund(paid_fee, payer);
        SPV_LOG_WARN(log::verify) << "Payout of " << paid_fee << " to " << recipient->to_hex()
                                  << " failed (" << payout_result_string(payout)
                                  << "), verification aborted";
        VerifyOutcome aborted;
        aborted.result = VerifyResult::PAYOUT_FAILED;
        aborted.claim_fingerprint = claim_fingerprint;
        return aborted;
    }

    outcome.fee_paid_out = paid_fee;
    outcome.events.emplace_back(InclusionVerified{
        claim_fingerprint, header_fingerprint, *recipient, paid_fee});

    SPV_LOG_DEBUG(log::verify) << "Claim " << short_hex(claim_fingerprint) << " proven in "
                               << short_hex(header_fingerprint) << " at height " << header->height
                               << ", paid " << paid_fee << " to " << recipient->to_hex();
    return outcome;
}

}  // namespace spv
