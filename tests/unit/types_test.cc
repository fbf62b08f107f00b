#include <gtest/gtest.h>
#include "core/types.hh"

using namespace spv;

// ============================================================================
// Hex Encoding Tests
// ============================================================================

TEST(TypesTest, BytesToHex) {
    std::vector<std::uint8_t> bytes = {0x00, 0x01, 0x0a, 0xff};
    EXPECT_EQ(bytes_to_hex(bytes), "00010aff");
}

TEST(TypesTest, HexToBytes) {
    auto result = hex_to_bytes("0x00010aFF");
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->size(), 4u);
    EXPECT_EQ((*result)[2], 0x0a);
    EXPECT_EQ((*result)[3], 0xff);
}

TEST(TypesTest, HexToBytesInvalid) {
    EXPECT_FALSE(hex_to_bytes("0xgg").has_value());
    EXPECT_FALSE(hex_to_bytes("123").has_value());  // Odd length
}

TEST(TypesTest, HashFromHexRequiresFullWidth) {
    EXPECT_FALSE(hash_from_hex("0x1234").has_value());

    std::string hex = "0x00000000ffffffff" + std::string(48, 'f');
    auto h = hash_from_hex(hex);
    ASSERT_TRUE(h.has_value());
    EXPECT_EQ((*h)[0], 0x00);
    EXPECT_EQ((*h)[4], 0xff);
    EXPECT_EQ(hash_to_hex(*h), hex);
}

TEST(TypesTest, ShortHexIsFirstEightBytes) {
    hash_t h{};
    h[0] = 0xde;
    h[7] = 0xad;
    h[8] = 0xff;
    EXPECT_EQ(short_hex(h), "de000000000000ad");
}

// ============================================================================
// 256-bit Word Tests
// ============================================================================

TEST(TypesTest, U256FromU64IsBigEndian) {
    hash_t word = u256_from_u64(0x0102);
    EXPECT_EQ(word[31], 0x02);
    EXPECT_EQ(word[30], 0x01);
    EXPECT_EQ(word[0], 0x00);
}

TEST(TypesTest, U256ToU64) {
    EXPECT_EQ(u256_to_u64(u256_from_u64(0x123456789ABCDEF0ULL)).value_or(0), 0x123456789ABCDEF0ULL);

    hash_t too_wide = u256_from_u64(1);
    too_wide[23] = 1;
    EXPECT_FALSE(u256_to_u64(too_wide).has_value());
}

TEST(TypesTest, WordOrderingIsNumeric) {
    EXPECT_LT(u256_from_u64(255), u256_from_u64(256));
    EXPECT_LT(u256_from_u64(0xFFFFFFFFFFFFFFFFULL), hash_t{0x01});
}

TEST(TypesTest, IsZero) {
    EXPECT_TRUE(is_zero(hash_t{}));
    EXPECT_FALSE(is_zero(u256_from_u64(1)));
}

// ============================================================================
// Encoding Tests
// ============================================================================

TEST(TypesTest, EncodeDecodeU16) {
    std::array<std::uint8_t, 2> buf;
    encode_u16(buf.data(), 0x1234);
    EXPECT_EQ(buf[0], 0x34);
    EXPECT_EQ(decode_u16(buf.data()), 0x1234);
}

TEST(TypesTest, EncodeDecodeU64) {
    std::array<std::uint8_t, 8> buf;
    encode_u64(buf.data(), 0x123456789ABCDEF0ULL);
    EXPECT_EQ(decode_u64(buf.data()), 0x123456789ABCDEF0ULL);
}

// ============================================================================
// Address Tests
// ============================================================================

TEST(AddressTest, IsZero) {
    Address addr{};
    EXPECT_TRUE(addr.is_zero());

    addr.bytes[0] = 1;
    EXPECT_FALSE(addr.is_zero());
}

TEST(AddressTest, ToHex) {
    Address addr{};
    addr.bytes[0] = 0xAB;
    addr.bytes[31] = 0xCD;

    std::string hex = addr.to_hex();
    EXPECT_TRUE(hex.starts_with("0xab"));
    EXPECT_TRUE(hex.ends_with("cd"));
    EXPECT_EQ(hex.size(), 66u);
}

TEST(AddressTest, FromHex) {
    auto addr = Address::from_hex("0xab00000000000000000000000000000000000000000000000000000000000000");
    ASSERT_TRUE(addr.has_value());
    EXPECT_EQ(addr->bytes[0], 0xAB);

    EXPECT_FALSE(Address::from_hex("0x1234").has_value());
}
