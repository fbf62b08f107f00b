#include "header.hh"
#include "crypto/hash.hh"
#include <algorithm>

namespace spv {

// ============================================================================
// Header Implementation
// ============================================================================

bool Header::is_null() const {
    return height == 0 &&
           is_zero(parent_fingerprint) &&
           is_zero(storage_root) &&
           is_zero(tx_root) &&
           is_zero(pow_nonce);
}

std::array<std::uint8_t, HEADER_ENCODED_SIZE> Header::encode() const {
    std::array<std::uint8_t, HEADER_ENCODED_SIZE> out{};
    std::uint8_t* ptr = out.data();

    hash_t height_word = u256_from_u64(height);
    ptr = std::copy(height_word.begin(), height_word.end(), ptr);
    ptr = std::copy(parent_fingerprint.begin(), parent_fingerprint.end(), ptr);
    ptr = std::copy(storage_root.begin(), storage_root.end(), ptr);
    ptr = std::copy(tx_root.begin(), tx_root.end(), ptr);
    std::copy(pow_nonce.begin(), pow_nonce.end(), ptr);

    return out;
}

std::optional<Header> Header::decode(std::span<const std::uint8_t> data) {
    if (data.size() < HEADER_ENCODED_SIZE) {
        return std::nullopt;
    }

    const std::uint8_t* ptr = data.data();

    hash_t height_word;
    std::copy(ptr, ptr + HASH_SIZE, height_word.begin());
    ptr += HASH_SIZE;

    // Heights beyond 64 bits are not representable here
    auto height = u256_to_u64(height_word);
    if (!height) {
        return std::nullopt;
    }

    Header header;
    header.height = *height;

    std::copy(ptr, ptr + HASH_SIZE, header.parent_fingerprint.begin());
    ptr += HASH_SIZE;
    std::copy(ptr, ptr + HASH_SIZE, header.storage_root.begin());
    ptr += HASH_SIZE;
    std::copy(ptr, ptr + HASH_SIZE, header.tx_root.begin());
    ptr += HASH_SIZE;
    std::copy(ptr, ptr + HASH_SIZE, header.pow_nonce.begin());

    return header;
}

hash_t fingerprint_of(const Header& header) {
    auto encoded = header.encode();
    return sha3_256(encoded);
}

// ============================================================================
// StateClaim Implementation
// ============================================================================

hash_t StateClaim::fingerprint() const {
    return sha3_256_concat({key, value});
}

}  // namespace spv
