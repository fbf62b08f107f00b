#include <gtest/gtest.h>
#include "chain/header.hh"
#include "crypto/hash.hh"
#include "test_chain.hh"

namespace spv {
namespace {

TEST(HeaderTest, DefaultIsNull) {
    Header header;
    EXPECT_TRUE(header.is_null());

    header.pow_nonce[31] = 1;
    EXPECT_FALSE(header.is_null());
}

TEST(HeaderTest, EncodingLayout) {
    Header header = test::checkpoint(0x0102);
    header.pow_nonce = u256_from_u64(7);

    auto encoded = header.encode();
    ASSERT_EQ(encoded.size(), HEADER_ENCODED_SIZE);

    // Height occupies the first word, big-endian
    EXPECT_EQ(encoded[30], 0x01);
    EXPECT_EQ(encoded[31], 0x02);
    EXPECT_TRUE(std::equal(header.parent_fingerprint.begin(), header.parent_fingerprint.end(),
                           encoded.begin() + 32));
    EXPECT_TRUE(std::equal(header.storage_root.begin(), header.storage_root.end(),
                           encoded.begin() + 64));
    EXPECT_TRUE(std::equal(header.tx_root.begin(), header.tx_root.end(),
                           encoded.begin() + 96));
    EXPECT_EQ(encoded[159], 7);
}

TEST(HeaderTest, DecodeRestoresFields) {
    Header header = test::checkpoint();
    header.pow_nonce = u256_from_u64(99);

    auto encoded = header.encode();
    auto decoded = Header::decode(encoded);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, header);
}

TEST(HeaderTest, DecodeRejectsShortInput) {
    auto encoded = test::checkpoint().encode();
    EXPECT_FALSE(Header::decode(std::span<const std::uint8_t>(encoded.data(), 159)).has_value());
}

TEST(HeaderTest, DecodeRejectsOversizedHeight) {
    auto encoded = test::checkpoint().encode();
    encoded[0] = 1;
    EXPECT_FALSE(Header::decode(encoded).has_value());
}

TEST(HeaderTest, FingerprintIsHashOfEncoding) {
    Header header = test::checkpoint();
    auto encoded = header.encode();
    EXPECT_EQ(fingerprint_of(header), sha3_256(encoded));
}

TEST(HeaderTest, FingerprintCoversEveryField) {
    Header base = test::checkpoint();
    hash_t fp = fingerprint_of(base);

    Header h = base;
    h.height += 1;
    EXPECT_NE(fingerprint_of(h), fp);

    h = base;
    h.parent_fingerprint[5] ^= 1;
    EXPECT_NE(fingerprint_of(h), fp);

    h = base;
    h.storage_root[5] ^= 1;
    EXPECT_NE(fingerprint_of(h), fp);

    h = base;
    h.tx_root[5] ^= 1;
    EXPECT_NE(fingerprint_of(h), fp);

    h = base;
    h.pow_nonce[5] ^= 1;
    EXPECT_NE(fingerprint_of(h), fp);
}

TEST(HeaderTest, EqualFieldsEqualFingerprint) {
    EXPECT_EQ(fingerprint_of(test::checkpoint()), fingerprint_of(test::checkpoint()));
}

TEST(StateClaimTest, FingerprintIsKeyThenValue) {
    StateClaim claim{u256_from_u64(1), u256_from_u64(2)};
    EXPECT_EQ(claim.fingerprint(), sha3_256_concat({claim.key, claim.value}));

    StateClaim swapped{claim.value, claim.key};
    EXPECT_NE(swapped.fingerprint(), claim.fingerprint());
}

}  // namespace
}  // namespace spv
