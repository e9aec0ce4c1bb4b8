#include <random>
#include <string_view>
#include <vector>

#include <cstdint>
#include <gtest/gtest.h>
#include <wary.hpp>

using namespace wary;
using namespace wary::detail;

// Haystacks are drawn from a small alphabet so needles actually occur,
// at lengths around the 16-byte vector width.
class FastScanTest : public ::testing::Test {
protected:
    std::vector<uint8_t> random_bytes(std::size_t len) {
        std::uniform_int_distribution<int> dist('a', 'e');
        std::vector<uint8_t> out(len);
        for (auto& b : out) {
            b = static_cast<uint8_t>(dist(rng_));
        }
        return out;
    }

    std::mt19937 rng_{0x5eed};
};

// ==============================================================================
// Agreement with the scalar reference
// ==============================================================================

TEST_F(FastScanTest, FindByteMatchesScalar) {
    for (std::size_t len = 0; len < 80; ++len) {
        for (int round = 0; round < 8; ++round) {
            auto hay = random_bytes(len);
            for (uint8_t needle : {uint8_t{'a'}, uint8_t{'e'}, uint8_t{'z'}}) {
                EXPECT_EQ(find_byte(hay, needle), scalar::find_byte(hay, needle))
                    << "len=" << len << " needle=" << needle;
            }
        }
    }
}

TEST_F(FastScanTest, CountByteMatchesScalar) {
    for (std::size_t len = 0; len < 80; ++len) {
        auto hay = random_bytes(len);
        EXPECT_EQ(count_byte(hay, 'c'), scalar::count_byte(hay, 'c')) << "len=" << len;
    }
}

TEST_F(FastScanTest, CountByteOnLongRun) {
    // Exercises the NEON lane-counter flush
    std::vector<uint8_t> hay(16 * 300 + 7, '\n');
    EXPECT_EQ(count_byte(hay, '\n'), hay.size());
}

TEST_F(FastScanTest, FindSubstringMatchesScalar) {
    for (std::size_t len = 0; len < 64; ++len) {
        for (int round = 0; round < 8; ++round) {
            auto hay = random_bytes(len);
            auto needle = random_bytes(1 + round % 3);
            EXPECT_EQ(find_substring(hay, needle), scalar::find_substring(hay, needle))
                << "len=" << len;
        }
    }
}

TEST_F(FastScanTest, BackendFollowsConfiguration) {
    if (!WARY_ENABLE_SIMD) {
        EXPECT_FALSE(config::simd);
    }
    std::vector<uint8_t> hay(33, 'a');
    hay[32] = 'b';
    EXPECT_EQ(find_byte(hay, 'b'), 32u);
}

TEST_F(FastScanTest, FindByteBeyondFirstBlock) {
    std::vector<uint8_t> hay(40, 'x');
    hay[33] = 'y';
    EXPECT_EQ(find_byte(hay, 'y'), 33u);
    hay[17] = 'y';
    EXPECT_EQ(find_byte(hay, 'y'), 17u);
}

// ==============================================================================
// Edge cases
// ==============================================================================

TEST_F(FastScanTest, EmptyNeedleMatchesAtZero) {
    std::vector<uint8_t> hay{'a', 'b'};
    EXPECT_EQ(find_substring(hay, std::span<const uint8_t>{}), 0u);
    EXPECT_EQ(find_substring(std::span<const uint8_t>{}, std::span<const uint8_t>{}), 0u);
}

TEST_F(FastScanTest, NeedleLongerThanHaystack) {
    std::vector<uint8_t> hay{'a', 'b'};
    std::vector<uint8_t> needle{'a', 'b', 'c'};
    EXPECT_FALSE(find_substring(hay, needle).has_value());
}

TEST_F(FastScanTest, NeedleAtVeryEnd) {
    std::string_view text = "0123456789abcdef0123456789XYZ";
    std::span<const uint8_t> hay(reinterpret_cast<const uint8_t*>(text.data()), text.size());
    std::vector<uint8_t> needle{'X', 'Y', 'Z'};
    EXPECT_EQ(find_substring(hay, needle), text.size() - 3);
}

// ==============================================================================
// Byte sets and predicates
// ==============================================================================

TEST_F(FastScanTest, ByteSetMembership) {
    constexpr auto digits = ByteSet::range('0', '9');
    constexpr auto sep = ByteSet::of(",;");
    static_assert(digits.contains('5'));
    static_assert(!digits.contains('a'));

    auto both = digits | sep;
    EXPECT_TRUE(both.contains(';'));
    EXPECT_TRUE(both.contains('0'));
    EXPECT_FALSE(both.contains(' '));
    EXPECT_TRUE((~digits).contains('a'));
    EXPECT_FALSE((~digits).contains('3'));
}

TEST_F(FastScanTest, FindInSetAndPredicates) {
    std::vector<uint8_t> hay{'a', 'b', '7', 'c'};
    EXPECT_EQ(find_in_set(hay, ByteSet::range('0', '9')), 2u);
    EXPECT_EQ(find_if(hay, [](uint8_t b) { return b == 'c'; }), 3u);
    EXPECT_EQ(find_if_not(hay, [](uint8_t b) { return b >= 'a'; }), 2u);
    EXPECT_FALSE(find_if_not(hay, [](uint8_t) { return true; }).has_value());
}
