#include <gtest/gtest.h>
#include "utilities/digest.hpp"
#include "utilities/hash_stream.hpp"
#include <stdexcept>

using namespace ledgerproof;

TEST(HashStream, KnownVector) {
    HashStream hs;
    hs.ingest(std::string("abc"));
    auto result = hs.finalize_hashed();
    EXPECT_EQ(result.hex, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(toHex(result.digest), result.hex);
}

TEST(HashStream, IncrementalMatchesOneShot) {
    HashStream hs;
    hs.ingest(std::string("ab"));
    hs.ingest(std::string("c"));
    std::vector<uint8_t> abc{'a', 'b', 'c'};
    EXPECT_EQ(hs.finalize_hashed().digest, HashStream::sha256(abc));
}

TEST(HashStream, IntegersAreBigEndian) {
    HashStream hs;
    hs.ingestU8(0x01);
    hs.ingestU32(0x02030405);
    hs.ingestU64(0x060708090a0b0c0dULL);
    std::vector<uint8_t> expected{0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07,
                                  0x08, 0x09, 0x0a, 0x0b, 0x0c, 0x0d};
    EXPECT_EQ(hs.finalize_raw(), expected);
}

TEST(HashStream, FinalizeTwiceThrows) {
    HashStream hs;
    hs.ingest(std::string("x"));
    hs.finalize_hashed();
    EXPECT_THROW(hs.finalize_hashed(), std::logic_error);
}

TEST(HashStream, CombineIsConcatenation) {
    Digest left = HashStream::sha256(std::vector<uint8_t>{'l'});
    Digest right = HashStream::sha256(std::vector<uint8_t>{'r'});
    std::vector<uint8_t> joined(left.begin(), left.end());
    joined.insert(joined.end(), right.begin(), right.end());
    EXPECT_EQ(HashStream::combine(left.data(), right.data()), HashStream::sha256(joined));
    EXPECT_NE(HashStream::combine(left.data(), right.data()),
              HashStream::combine(right.data(), left.data()));
}

TEST(DigestHex, RoundTripAndRejects) {
    auto bytes = fromHex("0xDEadBEef");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(toHex(*bytes), "deadbeef");
    EXPECT_FALSE(fromHex("abc").has_value());
    EXPECT_FALSE(fromHex("zz").has_value());
    EXPECT_FALSE(digestFromHex("deadbeef").has_value());
    EXPECT_TRUE(digestFromHex(std::string(64, 'a')).has_value());
}

TEST(DigestHex, ConstantTimeEquals) {
    Digest a{}, b{};
    EXPECT_TRUE(constantTimeEquals(a, b));
    b[31] = 1;
    EXPECT_FALSE(constantTimeEquals(a, b));
    EXPECT_FALSE(constantTimeEquals(a.data(), 32, a.data(), 31));
}
