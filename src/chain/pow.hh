#pragma once

#include "core/types.hh"
#include "chain/header.hh"
#include <optional>

namespace spv {

// ============================================================================
// Proof-of-Work Gate
// ============================================================================

// Constant-target check: the fingerprint, read as a 256-bit big-endian
// integer, must be strictly below the threshold. There is no retargeting.
[[nodiscard]] bool meets_threshold(const hash_t& fingerprint, const hash_t& threshold);

// Threshold with the top `leading_zero_bits` bits clear and every other bit
// set; an expected 2^leading_zero_bits attempts per valid header.
[[nodiscard]] hash_t threshold_from_leading_zeros(std::size_t leading_zero_bits);

// ============================================================================
// Nonce Grinding
// ============================================================================

struct GrindResult {
    Header header;            // header with the winning nonce filled in
    hash_t fingerprint;
    std::uint64_t attempts;
};

// Relayer-side search: starting from header.pow_nonce, increments the nonce
// until the fingerprint clears the threshold. nullopt if max_attempts runs out.
[[nodiscard]] std::optional<GrindResult> grind_nonce(
    const Header& header,
    const hash_t& threshold,
    std::uint64_t max_attempts = DEFAULT_GRIND_ATTEMPTS);

}  // namespace spv
