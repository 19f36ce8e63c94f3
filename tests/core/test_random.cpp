// ETHWALLET - Random Number Generation Tests
// Copyright (c) 2024 ETHWALLET Developers
// MIT License

#include <gtest/gtest.h>
#include "ethwallet/core/random.h"
#include "ethwallet/core/types.h"
#include <algorithm>
#include <cctype>
#include <set>
#include <vector>

using namespace ethwallet;

// ============================================================================
// GetRandBytes Tests
// ============================================================================

TEST(RandomTest, GetRandBytesNonZero) {
    std::vector<uint8_t> bytes(32);
    GetRandBytes(bytes.data(), bytes.size());

    bool allZero = std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
    EXPECT_FALSE(allZero);
}

TEST(RandomTest, GetRandBytesDifferent) {
    EXPECT_NE(GetRandBytes(32), GetRandBytes(32));
}

TEST(RandomTest, GetRandBytesZeroLength) {
    uint8_t dummy = 0;
    EXPECT_NO_THROW(GetRandBytes(&dummy, 0));
    EXPECT_TRUE(GetRandBytes(0).empty());
}

TEST(RandomTest, GetRandIntInRange) {
    for (int i = 0; i < 1000; ++i) {
        EXPECT_LT(GetRandInt(10), 10u);
    }
    EXPECT_EQ(GetRandInt(0), 0u);
    EXPECT_EQ(GetRandInt(1), 0u);
}

// ============================================================================
// Identifier Tests
// ============================================================================

TEST(RandomTest, NonceIsAlphanumeric) {
    std::string nonce = GenerateNonce();
    EXPECT_EQ(nonce.size(), DEFAULT_NONCE_LENGTH);
    for (char c : nonce) {
        EXPECT_TRUE(std::isalnum(static_cast<unsigned char>(c))) << c;
    }
}

TEST(RandomTest, NoncesAreUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        seen.insert(GenerateNonce());
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(RandomTest, UUIDv4Format) {
    std::string uuid = GenerateUUIDv4();
    ASSERT_EQ(uuid.size(), 36u);
    EXPECT_EQ(uuid[8], '-');
    EXPECT_EQ(uuid[13], '-');
    EXPECT_EQ(uuid[18], '-');
    EXPECT_EQ(uuid[23], '-');
    EXPECT_EQ(uuid[14], '4');
    EXPECT_NE(std::string("89ab").find(uuid[19]), std::string::npos);
}
