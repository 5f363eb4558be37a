/**
 * @file hash_test.cpp
 * @brief Unit tests for SHA-256 hashing functionality
 *
 * Tests HashUtils class for SHA-256 hash computation,
 * hex conversion and constant-time comparison.
 *
 * (c) 2026 Stork Project
 * Licensed under MIT License
 */

#include "stork/HashUtils.h"
#include <gtest/gtest.h>
#include <cctype>
#include <cstring>
#include <string>
#include <vector>

using namespace Stork;

namespace {

// SHA-256("Hello, World!")
const char* kHelloWorldHex = "dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f";

// SHA-256("")
const char* kEmptyHex = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

const uint8_t* bytesOf(const std::string& s) {
    return reinterpret_cast<const uint8_t*>(s.data());
}

}  // namespace

//=============================================================================
// Test Fixtures
//=============================================================================

class HashUtilsTest : public ::testing::Test {};

//=============================================================================
// Buffer Hashing
//=============================================================================

TEST_F(HashUtilsTest, BufferHashMatchesKnownVectors) {
    const std::string text = "Hello, World!";
    EXPECT_EQ(HashUtils::toHex(HashUtils::computeBufferHash(bytesOf(text), text.size())), kHelloWorldHex);
    EXPECT_EQ(HashUtils::toHex(HashUtils::computeBufferHash(nullptr, 0)), kEmptyHex);
}

//=============================================================================
// Incremental Hashing
//=============================================================================

TEST_F(HashUtilsTest, IncrementalEqualsOneShot) {
    const std::string text = "Hello, World!";
    HashUtils::IncrementalHash hash;
    ASSERT_TRUE(hash.update(bytesOf(text), 5));
    ASSERT_TRUE(hash.update(bytesOf(text) + 5, text.size() - 5));

    Sha256Digest digest{};
    ASSERT_TRUE(hash.finalize(digest));
    EXPECT_EQ(HashUtils::toHex(digest), kHelloWorldHex);

    // Finalized context refuses more data until reset
    EXPECT_FALSE(hash.update(bytesOf(text), 1));
    ASSERT_TRUE(hash.reset());
    ASSERT_TRUE(hash.finalize(digest));
    EXPECT_EQ(HashUtils::toHex(digest), kEmptyHex);
}

//=============================================================================
// Hex Conversion and Comparison
//=============================================================================

TEST_F(HashUtilsTest, HexRoundTripAcceptsEitherCase) {
    Sha256Digest digest{};
    std::string upper = kHelloWorldHex;
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    ASSERT_TRUE(HashUtils::fromHex(upper, digest));
    EXPECT_EQ(HashUtils::toHex(digest), kHelloWorldHex);
}

TEST_F(HashUtilsTest, HexRejectsMalformedInput) {
    std::vector<uint8_t> out;
    EXPECT_FALSE(HashUtils::fromHex("abc", out));
    EXPECT_FALSE(HashUtils::fromHex("zz", out));

    Sha256Digest digest{};
    EXPECT_FALSE(HashUtils::fromHex("abcd", digest));
}

TEST_F(HashUtilsTest, ConstantTimeEquals) {
    const uint8_t a[4] = { 1, 2, 3, 4 };
    const uint8_t b[4] = { 1, 2, 3, 4 };
    const uint8_t c[4] = { 1, 2, 3, 5 };
    EXPECT_TRUE(HashUtils::constantTimeEquals(a, b, sizeof(a)));
    EXPECT_FALSE(HashUtils::constantTimeEquals(a, c, sizeof(a)));
}
