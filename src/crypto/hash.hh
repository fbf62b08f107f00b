#pragma once

#include "core/types.hh"
#include <initializer_list>
#include <span>
#include <vector>

struct evp_md_ctx_st;

namespace spv {

// ============================================================================
// SHA3-256
// ============================================================================

// Streaming digest over an OpenSSL EVP context
class SHA3Hasher {
public:
    SHA3Hasher();
    ~SHA3Hasher();

    SHA3Hasher(const SHA3Hasher&) = delete;
    SHA3Hasher& operator=(const SHA3Hasher&) = delete;

    void update(std::span<const std::uint8_t> data);
    [[nodiscard]] hash_t finalize();

    void reset();

private:
    evp_md_ctx_st* ctx_ = nullptr;
};

[[nodiscard]] hash_t sha3_256(std::span<const std::uint8_t> data);

// Digest of the parts laid end to end
[[nodiscard]] hash_t sha3_256_concat(std::initializer_list<std::span<const std::uint8_t>> parts);

// ============================================================================
// Merkle Branches
// ============================================================================
//
// Binary SHA3 tree over 32-byte leaves. A node without a right sibling is
// paired with itself. A branch lists sibling hashes from the leaf level up.

[[nodiscard]] hash_t merkle_node(const hash_t& left, const hash_t& right);

// Zero hash for no leaves
[[nodiscard]] hash_t merkle_root(std::span<const hash_t> leaves);

// Empty when index is out of range
[[nodiscard]] std::vector<hash_t> merkle_branch(std::span<const hash_t> leaves, std::size_t index);

[[nodiscard]] bool verify_merkle_branch(const hash_t& leaf,
                                        std::span<const hash_t> branch,
                                        std::uint64_t index,
                                        const hash_t& root);

}  // namespace spv
