#pragma once

#include "core/types.hh"
#include <array>
#include <optional>
#include <span>

namespace spv {

// ============================================================================
// Source-Chain Header
// ============================================================================

// Immutable once admitted. Identity is fingerprint_of(*this); two headers
// with identical fields are the same header.
struct Header {
    height_t height = 0;
    hash_t parent_fingerprint{};
    hash_t storage_root{};
    hash_t tx_root{};
    hash_t pow_nonce{};

    // True when every field is zero. Such a header is never admitted.
    [[nodiscard]] bool is_null() const;

    // Five 32-byte big-endian words: height, parent, storage root,
    // transactions root, nonce
    [[nodiscard]] std::array<std::uint8_t, HEADER_ENCODED_SIZE> encode() const;
    [[nodiscard]] static std::optional<Header> decode(std::span<const std::uint8_t> data);

    bool operator==(const Header&) const = default;
};

// SHA3-256 of the canonical encoding
[[nodiscard]] hash_t fingerprint_of(const Header& header);

// ============================================================================
// Claims
// ============================================================================

// A claim that `key` holds `value` in the source chain's storage
struct StateClaim {
    hash_t key{};
    hash_t value{};

    // SHA3-256(key || value); the leaf looked up under the header root
    [[nodiscard]] hash_t fingerprint() const;
};

}  // namespace spv
