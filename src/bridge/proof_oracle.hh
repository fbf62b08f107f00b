#pragma once

#include "core/types.hh"
#include <cstdint>
#include <optional>
#include <vector>

namespace spv {

// ============================================================================
// Merkle Proof
// ============================================================================

// Opaque to the light client; only the oracle interprets it.
struct MerkleProof {
    std::vector<hash_t> branch;     // sibling hashes, leaf level first
    std::uint64_t leaf_index = 0;
};

// ============================================================================
// Merkle Proof Oracle
// ============================================================================

class MerkleProofOracle {
public:
    virtual ~MerkleProofOracle() = default;

    // Is `claim` included under `root` according to `proof`?
    [[nodiscard]] virtual bool verify(const hash_t& claim,
                                      const MerkleProof& proof,
                                      const hash_t& root) const = 0;
};

// Binary SHA3 Merkle branch check (crypto/hash.hh layout)
class MerkleBranchOracle : public MerkleProofOracle {
public:
    [[nodiscard]] bool verify(const hash_t& claim,
                              const MerkleProof& proof,
                              const hash_t& root) const override;
};

// Returns a fixed verdict regardless of the proof. Stands in for a real
// proof system and remembers the last root it was asked about.
class FixedVerdictOracle : public MerkleProofOracle {
public:
    explicit FixedVerdictOracle(bool verdict) : verdict_(verdict) {}

    [[nodiscard]] bool verify(const hash_t& claim,
                              const MerkleProof& proof,
                              const hash_t& root) const override;

    void set_verdict(bool verdict) { verdict_ = verdict; }

    [[nodiscard]] std::optional<hash_t> last_root() const { return last_root_; }
    [[nodiscard]] std::optional<hash_t> last_claim() const { return last_claim_; }
    [[nodiscard]] std::size_t call_count() const { return calls_; }

private:
    bool verdict_;
    mutable std::optional<hash_t> last_root_;
    mutable std::optional<hash_t> last_claim_;
    mutable std::size_t calls_ = 0;
};

}  // namespace spv
