#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <compare>

namespace spv {

// ============================================================================
// Sizes
// ============================================================================

// SHA3-256 output size, also the width of every 256-bit header word
inline constexpr std::size_t HASH_SIZE = 32;

// Account identifiers on the destination ledger
inline constexpr std::size_t ADDRESS_SIZE = HASH_SIZE;

// Canonical header encoding: five 32-byte big-endian words
inline constexpr std::size_t HEADER_FIELD_COUNT = 5;
inline constexpr std::size_t HEADER_ENCODED_SIZE = HEADER_FIELD_COUNT * HASH_SIZE;

// ============================================================================
// Relay Constants
// ============================================================================

// Default nonce search budget for grind_nonce()
inline constexpr std::uint64_t DEFAULT_GRIND_ATTEMPTS = 1'000'000;

// Snapshot format
inline constexpr std::uint32_t SNAPSHOT_MAGIC = 0x53505652;   // "SPVR"
inline constexpr std::uint16_t SNAPSHOT_VERSION = 1;

// ============================================================================
// Core Type Aliases
// ============================================================================

// 256-bit unsigned value stored big-endian (byte 0 is most significant), so
// lexicographic array comparison is numeric comparison.
using hash_t = std::array<std::uint8_t, HASH_SIZE>;
using height_t = std::uint64_t;
using amount_t = std::uint64_t;

[[nodiscard]] inline bool is_zero(const hash_t& h) {
    for (auto b : h) {
        if (b != 0) return false;
    }
    return true;
}

// Widen a 64-bit value into a 256-bit big-endian word
[[nodiscard]] hash_t u256_from_u64(std::uint64_t value);

// Narrow a 256-bit word; nullopt if any of the upper 24 bytes is set
[[nodiscard]] std::optional<std::uint64_t> u256_to_u64(const hash_t& value);

// ============================================================================
// Address (destination-ledger account)
// ============================================================================

struct Address {
    std::array<std::uint8_t, ADDRESS_SIZE> bytes{};

    [[nodiscard]] std::string to_hex() const;
    [[nodiscard]] static std::optional<Address> from_hex(std::string_view hex);

    [[nodiscard]] bool is_zero() const {
        for (auto b : bytes) {
            if (b != 0) return false;
        }
        return true;
    }

    auto operator<=>(const Address&) const = default;
};

// ============================================================================
// Serialization Helpers
// ============================================================================

// Little-endian encoding, used by the snapshot codec
inline void encode_u16(std::uint8_t* dst, std::uint16_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
}

inline void encode_u32(std::uint8_t* dst, std::uint32_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
    dst[2] = static_cast<std::uint8_t>(val >> 16);
    dst[3] = static_cast<std::uint8_t>(val >> 24);
}

inline void encode_u64(std::uint8_t* dst, std::uint64_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
    dst[2] = static_cast<std::uint8_t>(val >> 16);
    dst[3] = static_cast<std::uint8_t>(val >> 24);
    dst[4] = static_cast<std::uint8_t>(val >> 32);
    dst[5] = static_cast<std::uint8_t>(val >> 40);
    dst[6] = static_cast<std::uint8_t>(val >> 48);
    dst[7] = static_cast<std::uint8_t>(val >> 56);
}

[[nodiscard]] inline std::uint16_t decode_u16(const std::uint8_t* src) {
    return static_cast<std::uint16_t>(src[0]) |
           (static_cast<std::uint16_t>(src[1]) << 8);
}

[[nodiscard]] inline std::uint32_t decode_u32(const std::uint8_t* src) {
    return static_cast<std::uint32_t>(src[0]) |
           (static_cast<std::uint32_t>(src[1]) << 8) |
           (static_cast<std::uint32_t>(src[2]) << 16) |
           (static_cast<std::uint32_t>(src[3]) << 24);
}

[[nodiscard]] inline std::uint64_t decode_u64(const std::uint8_t* src) {
    return static_cast<std::uint64_t>(src[0]) |
           (static_cast<std::uint64_t>(src[1]) << 8) |
           (static_cast<std::uint64_t>(src[2]) << 16) |
           (static_cast<std::uint64_t>(src[3]) << 24) |
           (static_cast<std::uint64_t>(src[4]) << 32) |
           (static_cast<std::uint64_t>(src[5]) << 40) |
           (static_cast<std::uint64_t>(src[6]) << 48) |
           (static_cast<std::uint64_t>(src[7]) << 56);
}

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

[[nodiscard]] std::string bytes_to_hex(std::span<const std::uint8_t> bytes);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex);

// Exactly 64 hex digits (optional 0x prefix)
[[nodiscard]] std::optional<hash_t> hash_from_hex(std::string_view hex);
[[nodiscard]] std::string hash_to_hex(const hash_t& h);

// First 8 bytes as hex, for log lines
[[nodiscard]] std::string short_hex(const hash_t& h);

}  // namespace spv

// ============================================================================
// Hash specialization for hash_t (enables use in unordered_map/unordered_set)
// ============================================================================

namespace std {

template<>
struct hash<spv::hash_t> {
    std::size_t operator()(const spv::hash_t& h) const noexcept {
        // Use first 8 bytes as hash (already cryptographic quality)
        std::size_t result = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t) && i < h.size(); ++i) {
            result |= static_cast<std::size_t>(h[i]) << (i * 8);
        }
        return result;
    }
};

template<>
struct hash<spv::Address> {
    std::size_t operator()(const spv::Address& addr) const noexcept {
        return std::hash<spv::hash_t>{}(addr.bytes);
    }
};

}  // namespace std
