// STARKMOAT - Random Number Generation Tests
// Copyright (c) 2024 STARKMOAT Developers
// MIT License

#include <gtest/gtest.h>
#include <starkmoat/core/hex.h>
#include <starkmoat/core/random.h>

#include <algorithm>
#include <cerrno>
#include <set>
#include <vector>

using namespace starkmoat;

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
    std::vector<uint8_t> bytes1(32);
    std::vector<uint8_t> bytes2(32);
    
    GetRandBytes(bytes1.data(), bytes1.size());
    GetRandBytes(bytes2.data(), bytes2.size());
    
    EXPECT_NE(bytes1, bytes2);
}

TEST(RandomTest, GetRandBytesZeroLength) {
    uint8_t dummy = 0;
    EXPECT_NO_THROW(GetRandBytes(&dummy, 0));
}

TEST(RandomTest, GetRandBytesLargeBuffer) {
    // Larger than a single getrandom() guarantee of 256 bytes
    std::vector<uint8_t> bytes(4096);
    EXPECT_NO_THROW(GetRandBytes(bytes.data(), bytes.size()));
    
    std::set<uint8_t> distinct(bytes.begin(), bytes.end());
    EXPECT_GT(distinct.size(), 200u);
}

TEST(RandomTest, EntropyReadRetriesAfterInterrupt) {
    int calls = 0;
    auto reader = [&calls](uint8_t* out, size_t n) -> ssize_t {
        ++calls;
        if (calls == 1) {
            errno = EINTR;
            return -1;
        }
        // Short reads of at most 3 bytes
        size_t chunk = std::min<size_t>(n, 3);
        std::fill(out, out + chunk, static_cast<uint8_t>(0xa0 + calls));
        return static_cast<ssize_t>(chunk);
    };
    
    std::vector<uint8_t> bytes(8, 0);
    ASSERT_TRUE(detail::FillFromReader(bytes.data(), bytes.size(), reader));
    EXPECT_EQ(calls, 4);
    std::vector<uint8_t> expected = {0xa2, 0xa2, 0xa2, 0xa3, 0xa3, 0xa3, 0xa4, 0xa4};
    EXPECT_EQ(bytes, expected);
}

TEST(RandomTest, EntropyReadFailsOnOtherErrors) {
    int calls = 0;
    auto reader = [&calls](uint8_t*, size_t) -> ssize_t {
        ++calls;
        errno = EIO;
        return -1;
    };
    
    uint8_t buf[4];
    EXPECT_FALSE(detail::FillFromReader(buf, sizeof(buf), reader));
    EXPECT_EQ(calls, 1);
}

// ============================================================================
// Random Source Tests
// ============================================================================

TEST(RandomSourceTest, OSSourceFills) {
    std::vector<uint8_t> bytes(64, 0);
    GetOSRandomSource().Fill(bytes.data(), bytes.size());
    
    bool allZero = std::all_of(bytes.begin(), bytes.end(), [](uint8_t b) { return b == 0; });
    EXPECT_FALSE(allZero);
}

TEST(RandomSourceTest, OSSourceIsSingleton) {
    EXPECT_EQ(&GetOSRandomSource(), &GetOSRandomSource());
}

TEST(RandomSourceTest, SeededSourceFirstBlock) {
    // SHA256(00..2a || 00..00)
    SeededRandomSource rng(42);
    std::vector<uint8_t> bytes(32);
    rng.Fill(bytes.data(), bytes.size());
    
    EXPECT_EQ(BytesToHex(bytes),
              "bf5e93c443151c95541e8a3161ea3c06a1fc12195ef52dbc49fb653f073cc0a4");
}

TEST(RandomSourceTest, SeededSourceIsReproducible) {
    SeededRandomSource a(7);
    SeededRandomSource b(7);
    std::vector<uint8_t> bytesA(100);
    std::vector<uint8_t> bytesB(100);
    
    a.Fill(bytesA.data(), bytesA.size());
    b.Fill(bytesB.data(), bytesB.size());
    
    EXPECT_EQ(bytesA, bytesB);
}

TEST(RandomSourceTest, SeededSourceChunkingDoesNotMatter) {
    SeededRandomSource whole(9);
    SeededRandomSource pieces(9);
    std::vector<uint8_t> expected(70);
    std::vector<uint8_t> actual(70);
    
    whole.Fill(expected.data(), expected.size());
    pieces.Fill(actual.data(), 5);
    pieces.Fill(actual.data() + 5, 30);
    pieces.Fill(actual.data() + 35, 35);
    
    EXPECT_EQ(expected, actual);
}

TEST(RandomSourceTest, SeededSourcesDifferBySeed) {
    SeededRandomSource a(1);
    SeededRandomSource b(2);
    std::vector<uint8_t> bytesA(32);
    std::vector<uint8_t> bytesB(32);
    
    a.Fill(bytesA.data(), bytesA.size());
    b.Fill(bytesB.data(), bytesB.size());
    
    EXPECT_NE(bytesA, bytesB);
}
