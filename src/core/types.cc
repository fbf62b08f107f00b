#include "types.hh"
#include <algorithm>

namespace spv {

// ============================================================================
// 256-bit Words
// ============================================================================

hash_t u256_from_u64(std::uint64_t value) {
    hash_t result{};
    for (std::size_t i = 0; i < sizeof(std::uint64_t); ++i) {
        result[HASH_SIZE - 1 - i] = static_cast<std::uint8_t>(value >> (i * 8));
    }
    return result;
}

std::optional<std::uint64_t> u256_to_u64(const hash_t& value) {
    for (std::size_t i = 0; i < HASH_SIZE - sizeof(std::uint64_t); ++i) {
        if (value[i] != 0) {
            return std::nullopt;
        }
    }
    std::uint64_t result = 0;
    for (std::size_t i = HASH_SIZE - sizeof(std::uint64_t); i < HASH_SIZE; ++i) {
        result = (result << 8) | value[i];
    }
    return result;
}

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

std::string bytes_to_hex(std::span<const std::uint8_t> bytes) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        result.push_back(hex_chars[byte >> 4]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

namespace {

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex) {
    // Skip optional 0x prefix
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }

    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    std::vector<std::uint8_t> result;
    result.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int high = hex_digit(hex[i]);
        int low = hex_digit(hex[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        result.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }

    return result;
}

std::optional<hash_t> hash_from_hex(std::string_view hex) {
    auto bytes_opt = hex_to_bytes(hex);
    if (!bytes_opt || bytes_opt->size() != HASH_SIZE) {
        return std::nullopt;
    }
    hash_t result;
    std::copy(bytes_opt->begin(), bytes_opt->end(), result.begin());
    return result;
}

std::string hash_to_hex(const hash_t& h) {
    return "0x" + bytes_to_hex(h);
}

std::string short_hex(const hash_t& h) {
    return bytes_to_hex(std::span<const std::uint8_t>(h.data(), 8));
}

// ============================================================================
// Address Implementation
// ============================================================================

std::string Address::to_hex() const {
    return "0x" + bytes_to_hex(bytes);
}

std::optional<Address> Address::from_hex(std::string_view hex) {
    auto bytes_opt = hex_to_bytes(hex);
    if (!bytes_opt || bytes_opt->size() != ADDRESS_SIZE) {
        return std::nullopt;
    }
    Address addr;
    std::copy(bytes_opt->begin(), bytes_opt->end(), addr.bytes.begin());
    return addr;
}

}  // namespace spv
