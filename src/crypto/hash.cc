#include "hash.hh"
#include "core/logging.hh"
#include <openssl/evp.h>
#include <stdexcept>

namespace spv {

namespace {

[[noreturn]] void digest_failure(const char* step) {
    log::crypto.error() << "SHA3-256 " << step << " failed";
    throw std::runtime_error(std::string("SHA3-256 ") + step + " failed");
}

// One level up; the last node is doubled when the level is odd
std::vector<hash_t> next_level(const std::vector<hash_t>& level) {
    std::vector<hash_t> parents;
    parents.reserve((level.size() + 1) / 2);
    for (std::size_t i = 0; i < level.size(); i += 2) {
        parents.push_back(merkle_node(level[i], i + 1 < level.size() ? level[i + 1] : level[i]));
    }
    return parents;
}

}  // namespace

// ============================================================================
// SHA3Hasher
// ============================================================================

SHA3Hasher::SHA3Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        digest_failure("context allocation");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha3_256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        digest_failure("init");
    }
}

SHA3Hasher::~SHA3Hasher() {
    EVP_MD_CTX_free(ctx_);
}

void SHA3Hasher::update(std::span<const std::uint8_t> data) {
    if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
        digest_failure("update");
    }
}

hash_t SHA3Hasher::finalize() {
    hash_t digest{};
    unsigned int len = HASH_SIZE;
    if (EVP_DigestFinal_ex(ctx_, digest.data(), &len) != 1) {
        digest_failure("final");
    }
    return digest;
}

void SHA3Hasher::reset() {
    if (EVP_DigestInit_ex(ctx_, EVP_sha3_256(), nullptr) != 1) {
        digest_failure("reset");
    }
}

hash_t sha3_256(std::span<const std::uint8_t> data) {
    hash_t digest{};
    unsigned int len = HASH_SIZE;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha3_256(), nullptr) != 1) {
        digest_failure("digest");
    }
    return digest;
}

hash_t sha3_256_concat(std::initializer_list<std::span<const std::uint8_t>> parts) {
    SHA3Hasher hasher;
    for (auto part : parts) {
        hasher.update(part);
    }
    return hasher.finalize();
}

// ============================================================================
// Merkle Branches
// ============================================================================

hash_t merkle_node(const hash_t& left, const hash_t& right) {
    return sha3_256_concat({left, right});
}

hash_t merkle_root(std::span<const hash_t> leaves) {
    if (leaves.empty()) {
        return hash_t{};
    }
    std::vector<hash_t> level(leaves.begin(), leaves.end());
    while (level.size() > 1) {
        level = next_level(level);
    }
    return level.front();
}

std::vector<hash_t> merkle_branch(std::span<const hash_t> leaves, std::size_t index) {
    std::vector<hash_t> branch;
    if (index >= leaves.size()) {
        return branch;
    }

    std::vector<hash_t> level(leaves.begin(), leaves.end());
    while (level.size() > 1) {
        std::size_t sibling = index ^ 1;
        branch.push_back(sibling < level.size() ? level[sibling] : level[index]);
        level = next_level(level);
        index /= 2;
    }
    return branch;
}

bool verify_merkle_branch(const hash_t& leaf,
                          std::span<const hash_t> branch,
                          std::uint64_t index,
                          const hash_t& root) {
    hash_t node = leaf;
    for (const hash_t& sibling : branch) {
        node = (index & 1) ? merkle_node(sibling, node) : merkle_node(node, sibling);
        index >>= 1;
    }
    // Bits left in the index mean the branch stops below the root
    return index == 0 && node == root;
}

}  // namespace spv
