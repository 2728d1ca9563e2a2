#include <gtest/gtest.h>

#include "icepack/tree_hash.hpp"
#include "icepack/hex_utils.hpp"
#include "test_support.hpp"

#include <openssl/sha.h>
#include <algorithm>

using namespace icepack;

namespace {

const std::string TEST_HASH = "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08";

std::string raw_sha256(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return std::string(reinterpret_cast<const char*>(hash), SHA256_DIGEST_LENGTH);
}

} // namespace

TEST(TreeHashTest, EmptyInputHasNoHash) {
    EXPECT_FALSE(compute_tree_hash("").has_value());

    TreeHasher hasher;
    EXPECT_FALSE(hasher.finish().has_value());
}

TEST(TreeHashTest, SingleChunkIsPlainSha256) {
    EXPECT_EQ(compute_tree_hash("test"), TEST_HASH);
}

TEST(TreeHashTest, ExactlyOneMebibyteIsOneLeaf) {
    std::string data = test::random_bytes(TREE_HASH_CHUNK_SIZE);
    EXPECT_EQ(compute_tree_hash(data), to_hex(raw_sha256(data)));
}

TEST(TreeHashTest, CombinesPairsAndPromotesOddNode) {
    const size_t mib = static_cast<size_t>(TREE_HASH_CHUNK_SIZE);
    std::string data = test::random_bytes(3 * mib + 10);

    std::string a = raw_sha256(data.substr(0, mib));
    std::string b = raw_sha256(data.substr(mib, mib));
    std::string c = raw_sha256(data.substr(2 * mib, mib));
    std::string d = raw_sha256(data.substr(3 * mib));

    std::string ab = raw_sha256(a + b);
    std::string cd = raw_sha256(c + d);
    EXPECT_EQ(compute_tree_hash(data), to_hex(raw_sha256(ab + cd)));

    // Three leaves: the third is promoted and joined at the top
    std::string three = data.substr(0, 2 * mib + 5);
    std::string c5 = raw_sha256(three.substr(2 * mib));
    EXPECT_EQ(compute_tree_hash(three), to_hex(raw_sha256(ab + c5)));
}

TEST(TreeHashTest, IndependentOfUpdateSplitting) {
    std::string data = test::random_bytes(2 * TREE_HASH_CHUNK_SIZE + 12345, 7);

    TreeHasher hasher;
    size_t pos = 0;
    size_t step = 1;
    while (pos < data.size()) {
        size_t n = std::min(step, data.size() - pos);
        hasher.update(data.data() + pos, n);
        pos += n;
        step = step * 3 + 1;
    }
    EXPECT_EQ(hasher.bytes_hashed(), static_cast<int64_t>(data.size()));
    EXPECT_EQ(hasher.finish(), compute_tree_hash(data));
}

TEST(TreeHashTest, HasherIsReusableAfterFinish) {
    TreeHasher hasher;
    hasher.update("abc", 3);
    ASSERT_TRUE(hasher.finish().has_value());

    hasher.update("test", 4);
    EXPECT_EQ(hasher.finish(), TEST_HASH);
}
