#include "regbits/bits.hpp"

#include <limits>
#include <utility>

#include <cstdint>
#include <gtest/gtest.h>

using namespace regbits;

// -----------------------------------------------------------------------------
// Single bits
// -----------------------------------------------------------------------------

TEST(BitsTest, GetBitReadsOneBit) {
    EXPECT_TRUE(get_bit(uint8_t{0b0000'0100}, 2));
    EXPECT_FALSE(get_bit(uint8_t{0b0000'0100}, 3));
    EXPECT_TRUE(get_bit(uint64_t{1} << 63, 63));
    EXPECT_FALSE(get_bit(uint64_t{1} << 63, 62));
}

TEST(BitsTest, SetBitForcesOneBit) {
    EXPECT_EQ(set_bit(uint8_t{0b0000'0000}, 5, true), 0b0010'0000);
    EXPECT_EQ(set_bit(uint8_t{0b1111'1111}, 0, false), 0b1111'1110);
    EXPECT_EQ(set_bit(uint8_t{0b0010'0000}, 5, true), 0b0010'0000);
    EXPECT_EQ(set_bit(uint32_t{0}, 31, true), 0x8000'0000u);
}

TEST(BitsTest, SingleBitMatchesOneWideRange) {
    for (unsigned raw = 0; raw < 256; ++raw) {
        const auto v = static_cast<uint8_t>(raw);
        for (std::size_t n = 0; n < 8; ++n) {
            ASSERT_EQ(get_bit(v, n), get_bits(v, n, n + 1) == 1);
            ASSERT_EQ(set_bit(v, n, true), set_bits(v, n, n + 1, uint8_t{1}));
            ASSERT_EQ(set_bit(v, n, false), set_bits(v, n, n + 1, uint8_t{0}));
        }
    }
}

// -----------------------------------------------------------------------------
// Ranges
// -----------------------------------------------------------------------------

TEST(BitsTest, GetBitsExtractsRightAligned) {
    EXPECT_EQ(get_bits(uint8_t{0b1100'1110}, 3, 7), 0b1001);
    EXPECT_EQ(get_bits(uint8_t{0b1010'0101}, 6, 8), 0b10);
    EXPECT_EQ(get_bits(uint32_t{0xfa84'9e1b}, 16, 20), 0x4u);
}

TEST(BitsTest, GetBitsEmptyRangeIsZero) {
    EXPECT_EQ(get_bits(uint8_t{0xff}, 3, 3), 0);
    EXPECT_EQ(get_bits(uint8_t{0xff}, 8, 8), 0);
}

TEST(BitsTest, SetBitsReplacesOnlyTheRange) {
    EXPECT_EQ(set_bits(uint8_t{0b0000'0000}, 6, 8, uint8_t{0b11}), 0b1100'0000);
    EXPECT_EQ(set_bits(uint8_t{0b1111'1111}, 1, 5, uint8_t{0b0000}), 0b1110'0001);
    EXPECT_EQ(set_bits(uint8_t{0b1010'0110}, 2, 6, uint8_t{0b1110}), 0b1011'1010);
}

TEST(BitsTest, SetBitsDropsValueBitsAboveTheWidth) {
    EXPECT_EQ(set_bits(uint8_t{0}, 0, 4, uint8_t{0xff}), 0x0f);
    EXPECT_EQ(set_bits(uint8_t{0}, 2, 4, uint8_t{0b111}), 0b0000'1100);
}

TEST(BitsTest, FullWidthRangeIsWholeValue) {
    // A full-width mask needs a shift by the word width, which must saturate
    EXPECT_EQ(get_bits(uint8_t{0xa5}, 0, 8), 0xa5);
    EXPECT_EQ(get_bits(uint16_t{0xbeef}, 0, 16), 0xbeef);
    EXPECT_EQ(get_bits(uint32_t{0xdead'beef}, 0, 32), 0xdead'beefu);
    EXPECT_EQ(get_bits(uint64_t{0x0123'4567'89ab'cdef}, 0, 64), 0x0123'4567'89ab'cdefull);

    EXPECT_EQ(set_bits(uint8_t{0x12}, 0, 8, uint8_t{0xa5}), 0xa5);
    EXPECT_EQ(set_bits(uint16_t{0}, 0, 16, uint16_t{0xbeef}), 0xbeef);
    EXPECT_EQ(set_bits(uint64_t{0}, 0, 64, ~uint64_t{0}), ~uint64_t{0});
}

TEST(BitsTest, BoundsAboveTheWidthSaturate) {
    EXPECT_EQ(get_bits(uint8_t{0xf0}, 4, 12), 0x0f);
    EXPECT_EQ(get_bits(uint8_t{0xf0}, 8, 16), 0);
    EXPECT_EQ(set_bits(uint8_t{0x0f}, 4, 12, uint8_t{0xff}), 0xff);
}

TEST(BitsTest, NonInterference) {
    const uint32_t packed = 0x1234'5678;
    const uint32_t updated = set_bits(packed, 8, 20, uint32_t{0xabc});
    EXPECT_EQ(get_bits(updated, 8, 20), 0xabcu);
    EXPECT_EQ(get_bits(updated, 0, 8), get_bits(packed, 0, 8));
    EXPECT_EQ(get_bits(updated, 20, 32), get_bits(packed, 20, 32));
}

TEST(BitsTest, RangeMask) {
    EXPECT_EQ(range_mask<uint8_t>(2, 5), 0b0001'1100);
    EXPECT_EQ(range_mask<uint8_t>(0, 8), 0xff);
    EXPECT_EQ(range_mask<uint32_t>(0, 0), 0u);
}

// -----------------------------------------------------------------------------
// Shifts
// -----------------------------------------------------------------------------

TEST(BitsTest, OverflowingShiftsWrapTheAmount) {
    EXPECT_EQ(overflowing_shl(uint8_t{0b1}, 3), std::make_pair(uint8_t{0b1000}, false));
    EXPECT_EQ(overflowing_shl(uint8_t{0b1}, 9), std::make_pair(uint8_t{0b10}, true));
    EXPECT_EQ(overflowing_shr(uint8_t{0x80}, 7), std::make_pair(uint8_t{1}, false));
    EXPECT_EQ(overflowing_shr(uint8_t{0x80}, 8), std::make_pair(uint8_t{0x80}, true));
}

TEST(BitsTest, SaturatingShiftsGoToZero) {
    EXPECT_EQ(saturating_shl(uint8_t{0xff}, 7), 0x80);
    EXPECT_EQ(saturating_shl(uint8_t{0xff}, 8), 0);
    EXPECT_EQ(saturating_shl(uint8_t{0xff}, 200), 0);
    EXPECT_EQ(saturating_shr(uint32_t{0xffff'ffff}, 31), 1u);
    EXPECT_EQ(saturating_shr(uint32_t{0xffff'ffff}, 32), 0u);
    EXPECT_EQ(saturating_shl(uint64_t{1}, 64), 0u);
}

// -----------------------------------------------------------------------------
// Width conversions
// -----------------------------------------------------------------------------

TEST(BitsTest, TruncateIntoKeepsLowBits) {
    EXPECT_EQ(truncate_into<uint8_t>(uint32_t{0x1234'5678}), 0x78);
    EXPECT_EQ(truncate_into<uint16_t>(uint64_t{0xdead'beef'cafe'f00d}), 0xf00d);
    EXPECT_EQ(truncate_into<uint32_t>(uint32_t{0xffff'ffff}), 0xffff'ffffu);
}

TEST(BitsTest, ZeroExtendFillsWithZeros) {
    EXPECT_EQ(zero_extend<uint32_t>(uint8_t{0xff}), 0xffu);
    EXPECT_EQ(zero_extend<uint64_t>(uint16_t{0x8000}), 0x8000u);
}

TEST(BitsTest, PrimitivesAreConstexpr) {
    static_assert(get_bits(uint8_t{0b1100'1110}, 3, 7) == 0b1001);
    static_assert(set_bits(uint8_t{0}, 6, 8, uint8_t{0b11}) == 0b1100'0000);
    static_assert(get_bit(uint16_t{0x8000}, 15));
    static_assert(saturating_shl(uint8_t{1}, 8) == 0);
    static_assert(range_mask<uint16_t>(0, 16) == std::numeric_limits<uint16_t>::max());
}

#if REGBITS_HAS_INT128
TEST(BitsTest, Works128Bit) {
    const uint128_t high = uint128_t{1} << 100;
    EXPECT_TRUE(get_bit(high, 100));
    EXPECT_TRUE(get_bits(high, 96, 104) == uint128_t{0x10});
    EXPECT_TRUE(get_bits(~uint128_t{0}, 0, 128) == ~uint128_t{0});
    EXPECT_TRUE(saturating_shl(uint128_t{1}, 128) == uint128_t{0});
}
#endif
