#include "chain/pow.hh"
#include "core/logging.hh"
#include <algorithm>

namespace spv {

bool meets_threshold(const hash_t& fingerprint, const hash_t& threshold) {
    // Big-endian storage makes lexicographic order numeric order
    return std::lexicographical_compare(
        fingerprint.begin(), fingerprint.end(),
        threshold.begin(), threshold.end());
}

hash_t threshold_from_leading_zeros(std::size_t leading_zero_bits) {
    hash_t threshold;
    threshold.fill(0xFF);

    std::size_t bits = std::min(leading_zero_bits, HASH_SIZE * 8);
    std::size_t full_bytes = bits / 8;
    std::fill_n(threshold.begin(), full_bytes, 0x00);

    if (full_bytes < HASH_SIZE && bits % 8 != 0) {
        threshold[full_bytes] = static_cast<std::uint8_t>(0xFF >> (bits % 8));
    }

    return threshold;
}

namespace {

// 256-bit big-endian increment, wrapping at 2^256
void increment(hash_t& value) {
    for (std::size_t i = HASH_SIZE; i-- > 0;) {
        if (++value[i] != 0) {
            return;
        }
    }
}

}  // namespace

std::optional<GrindResult> grind_nonce(
    const Header& header,
    const hash_t& threshold,
    std::uint64_t max_attempts) {

    Header candidate = header;

    for (std::uint64_t attempt = 1; attempt <= max_attempts; ++attempt) {
        hash_t fp = fingerprint_of(candidate);
        if (meets_threshold(fp, threshold)) {
            SPV_LOG_TRACE(log::chain) << "Ground nonce for height " << candidate.height
                                      << " after " << attempt << " attempts";
            return GrindResult{candidate, fp, attempt};
        }
        increment(candidate.pow_nonce);
    }

    SPV_LOG_DEBUG(log::chain) << "Nonce search exhausted " << max_attempts
                              << " attempts at height " << header.height;
    return std::nullopt;
}

}  // namespace spv
