#include <gtest/gtest.h>
#include <kvcache/storage/KeyDigest.hpp>
#include <string>

/**
 * @brief Тесты для keyDigest (MD5 в hex)
 */

TEST(KeyDigestTest, KnownVectors) {
    EXPECT_EQ(keyDigest("hello"), "5d41402abc4b2a76b9719d911017c592");
    EXPECT_EQ(keyDigest("The quick brown fox jumps over the lazy dog"),
              "9e107d9d372bb6826bd81d3542a419d6");
}

TEST(KeyDigestTest, FixedLengthLowercaseHex) {
    std::string digest = keyDigest("user:42/profile?lang=ru");

    ASSERT_EQ(digest.size(), 32u);
    for (char c : digest) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
    }
}

TEST(KeyDigestTest, Deterministic) {
    EXPECT_EQ(keyDigest("same"), keyDigest("same"));
}

TEST(KeyDigestTest, DifferentKeysDifferentDigests) {
    EXPECT_NE(keyDigest("a"), keyDigest("b"));
    EXPECT_NE(keyDigest("key"), keyDigest("key "));
}

TEST(KeyDigestTest, BinaryKey) {
    std::string key("a\0b", 3);
    EXPECT_NE(keyDigest(key), keyDigest("a"));
    EXPECT_EQ(keyDigest(key).size(), 32u);
}
