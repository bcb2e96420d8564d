#include <gtest/gtest.h>
#include <openssl/sha.h>

#include "crypto.hpp"
#include "test_support.hpp"

using TestSupport::TempDir;

namespace {
std::string sha256_of(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return Crypto::to_hex(hash, SHA256_DIGEST_LENGTH);
}
}  // namespace

TEST(CryptoTest, KnownVector) {
    TempDir dir;
    TestSupport::write_file(dir / "abc.txt", "abc");
    auto digest = Crypto::compute_file_hash(dir / "abc.txt");
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(*digest, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(CryptoTest, EmptyFileHasEmptyInputDigest) {
    TempDir dir;
    TestSupport::write_file(dir / "empty", "");
    auto digest = Crypto::compute_file_hash(dir / "empty");
    ASSERT_TRUE(digest.has_value());
    EXPECT_EQ(*digest, Crypto::EmptyDigest);
}

TEST(CryptoTest, MissingFileIsUnavailable) {
    TempDir dir;
    EXPECT_FALSE(Crypto::compute_file_hash(dir / "nope").has_value());
}

TEST(CryptoTest, StreamingMatchesOneShotAcrossChunkBoundaries) {
    TempDir dir;
    const std::string data = TestSupport::random_bytes(3 * Limits::ChunkSize + 17);
    TestSupport::write_file(dir / "blob", data);
    const std::string expected = sha256_of(data);
    EXPECT_EQ(Crypto::compute_file_hash(dir / "blob"), expected);
    EXPECT_EQ(Crypto::compute_file_hash(dir / "blob", 7), expected);
}

TEST(CryptoTest, SingleByteChangeChangesDigest) {
    TempDir dir;
    std::string data = TestSupport::random_bytes(1000);
    TestSupport::write_file(dir / "a", data);
    data[500] = static_cast<char>(data[500] ^ 0x01);
    TestSupport::write_file(dir / "b", data);
    EXPECT_NE(Crypto::compute_file_hash(dir / "a"), Crypto::compute_file_hash(dir / "b"));
}

TEST(CryptoTest, NormalizeDigest) {
    const std::string upper = "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD";
    EXPECT_EQ(Crypto::normalize_digest(upper), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_FALSE(Crypto::normalize_digest("abc").has_value());
    EXPECT_FALSE(Crypto::normalize_digest(std::string(64, 'g')).has_value());
}
