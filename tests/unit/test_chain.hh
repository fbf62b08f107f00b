#pragma once

#include "chain/header.hh"
#include "chain/pow.hh"
#include <stdexcept>

namespace spv {
namespace test {

// Sixteen expected attempts per header; fast enough to grind in every test
inline hash_t easy_threshold() {
    return threshold_from_leading_zeros(4);
}

inline Address address(std::uint8_t tag) {
    Address addr;
    addr.bytes.fill(tag);
    return addr;
}

inline Header checkpoint(height_t height = 100) {
    Header genesis;
    genesis.height = height;
    genesis.parent_fingerprint = u256_from_u64(0xC0FFEE);
    genesis.storage_root = u256_from_u64(0x5707);
    genesis.tx_root = u256_from_u64(0x7C07);
    return genesis;
}

// Child of `parent` at parent.height + 1 with a ground nonce. `branch`
// distinguishes siblings so forks get distinct fingerprints.
inline Header child_of(const Header& parent,
                       std::uint8_t branch = 0,
                       const hash_t& threshold = easy_threshold()) {
    Header header;
    header.height = parent.height + 1;
    header.parent_fingerprint = fingerprint_of(parent);
    header.storage_root = u256_from_u64(0x5000 + header.height);
    header.tx_root = u256_from_u64(0x7000 + header.height);
    header.storage_root[0] = branch;
    header.tx_root[0] = branch;

    auto ground = grind_nonce(header, threshold);
    if (!ground) {
        throw std::runtime_error("nonce search exhausted");
    }
    return ground->header;
}

// Same as child_of but with a nonce whose fingerprint misses the threshold
inline Header weak_child_of(const Header& parent,
                            std::uint8_t branch = 0,
                            const hash_t& threshold = easy_threshold()) {
    Header header;
    header.height = parent.height + 1;
    header.parent_fingerprint = fingerprint_of(parent);
    header.storage_root[0] = branch;
    header.tx_root[0] = branch;

    for (std::uint64_t nonce = 1; nonce < 1024; ++nonce) {
        header.pow_nonce = u256_from_u64(nonce);
        if (!meets_threshold(fingerprint_of(header), threshold)) {
            return header;
        }
    }
    throw std::runtime_error("every nonce met the threshold");
}

}  // namespace test
}  // namespace spv
