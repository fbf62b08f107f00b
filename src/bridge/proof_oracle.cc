#include "bridge/proof_oracle.hh"
#include "crypto/hash.hh"
#include "core/logging.hh"

namespace spv {

bool MerkleBranchOracle::verify(const hash_t& claim,
                                const MerkleProof& proof,
                                const hash_t& root) const {
    bool ok = verify_merkle_branch(claim, proof.branch, proof.leaf_index, root);
    SPV_LOG_TRACE(log::verify) << "Merkle branch of length " << proof.branch.size()
                               << " for " << short_hex(claim)
                               << (ok ? " verified" : " rejected");
    return ok;
}

bool FixedVerdictOracle::verify(const hash_t& claim,
                                const MerkleProof& /*proof*/,
                                const hash_t& root) const {
    last_claim_ = claim;
    last_root_ = root;
    ++calls_;
    return verdict_;
}

}  // namespace spv
