/**
 * @file test_hashing.cpp
 * @brief Unit tests for BLAKE3 hashing pipeline
 */

#include <gtest/gtest.h>
#include <hashing/blake3_pipeline.hpp>
#include <stdexcept>
#include <string>
#include <unordered_set>

using namespace Russell;

TEST(HashingTest, Determinism) {
    std::string data = "Russell Recursive Refining Engine";
    auto hash1 = BLAKE3Pipeline::hash(data);
    auto hash2 = BLAKE3Pipeline::hash(data);

    EXPECT_EQ(hash1, hash2);
}

TEST(HashingTest, CollisionResistance) {
    auto hash1 = BLAKE3Pipeline::hash("test1");
    auto hash2 = BLAKE3Pipeline::hash("test2");

    EXPECT_NE(hash1, hash2);
}

TEST(HashingTest, HexConversion) {
    std::string data = "hex_test";
    auto hash = BLAKE3Pipeline::hash(data);
    std::string hex = BLAKE3Pipeline::to_hex(hash);
    auto hash_rt = BLAKE3Pipeline::from_hex(hex);

    EXPECT_EQ(hash, hash_rt);
    EXPECT_EQ(hex.length(), 32u); // 16 bytes * 2
    EXPECT_EQ(BLAKE3Pipeline::hash_hex(data), hex);
}

TEST(HashingTest, FromHexRejectsMalformedInput) {
    EXPECT_THROW(BLAKE3Pipeline::from_hex("abc"), std::invalid_argument);
    EXPECT_THROW(BLAKE3Pipeline::from_hex(std::string(32, 'z')), std::invalid_argument);
}

TEST(HashingTest, IncrementalFieldsAreLengthPrefixed) {
    BLAKE3Pipeline::Incremental a;
    a.field("ab").field("c");
    BLAKE3Pipeline::Incremental b;
    b.field("a").field("bc");

    EXPECT_NE(a.finalize(), b.finalize());
}

TEST(HashingTest, IncrementalIsDeterministic) {
    auto digest = [] {
        BLAKE3Pipeline::Incremental h;
        h.field("statement").field(0.95).field(static_cast<int64_t>(6));
        return h.finalize_hex();
    };
    EXPECT_EQ(digest(), digest());
}

TEST(HashingTest, HashHasherKeysUnorderedSet) {
    std::unordered_set<BLAKE3Pipeline::Hash, HashHasher> seen;
    seen.insert(BLAKE3Pipeline::hash("new insight"));
    seen.insert(BLAKE3Pipeline::hash("new insight"));
    seen.insert(BLAKE3Pipeline::hash("other insight"));

    EXPECT_EQ(seen.size(), 2u);
}
