#pragma once

#include "regbits/config.hpp"
#include "regbits/types.hpp"

#include <utility>

#include <cstddef>

namespace regbits {

// ============================================================================
// Shift helpers
//
// A raw shift by an amount >= the word width is undefined behavior in C++.
// Every mask in this header goes through the saturating variants instead, so
// a field that covers the whole word (width == word_bits) gets an all-ones
// mask rather than garbage.
// ============================================================================

// All bits set, without relying on integer promotion of ~T{0}
template <UnsignedWord T>
[[nodiscard]] constexpr T all_ones() noexcept {
    return static_cast<T>(~T{0});
}

/**
 * Shift left by `n mod word_bits<T>`.
 *
 * Returns the shifted value and whether the shift amount wrapped. Mostly
 * useful as the building block of saturating_shl().
 */
template <UnsignedWord T>
[[nodiscard]] constexpr std::pair<T, bool> overflowing_shl(T value, std::size_t n) noexcept {
    constexpr std::size_t bits = word_bits<T>;
    return {static_cast<T>(value << (n % bits)), n >= bits};
}

/**
 * Shift right by `n mod word_bits<T>`.
 *
 * Returns the shifted value and whether the shift amount wrapped.
 */
template <UnsignedWord T>
[[nodiscard]] constexpr std::pair<T, bool> overflowing_shr(T value, std::size_t n) noexcept {
    constexpr std::size_t bits = word_bits<T>;
    return {static_cast<T>(value >> (n % bits)), n >= bits};
}

// Shift left by n bits; zero when n >= word_bits<T>
template <UnsignedWord T>
[[nodiscard]] constexpr T saturating_shl(T value, std::size_t n) noexcept {
    const auto [shifted, wrapped] = overflowing_shl(value, n);
    return wrapped ? T{0} : shifted;
}

// Shift right by n bits; zero when n >= word_bits<T>
template <UnsignedWord T>
[[nodiscard]] constexpr T saturating_shr(T value, std::size_t n) noexcept {
    const auto [shifted, wrapped] = overflowing_shr(value, n);
    return wrapped ? T{0} : shifted;
}

// ============================================================================
// Single-bit access
// ============================================================================

/**
 * Test one bit of a value. Bit 0 is the least significant bit.
 *
 *   get_bit(uint8_t{0b0000'0100}, 2) == true
 *   get_bit(uint8_t{0b0000'0100}, 3) == false
 *
 * Precondition: bit < word_bits<T> (checked by REGBITS_ASSERT).
 */
template <UnsignedWord T>
[[nodiscard]] constexpr bool get_bit(T value, std::size_t bit) noexcept {
    REGBITS_ASSERT(bit < word_bits<T>);
    const T position_mask = static_cast<T>(T{1} << bit);
    return (value & position_mask) != T{0};
}

/**
 * Copy of `value` with one bit forced to `bit_value`.
 *
 *   set_bit(uint8_t{0b0000'0000}, 5, true)  == 0b0010'0000
 *   set_bit(uint8_t{0b1111'1111}, 0, false) == 0b1111'1110
 */
template <UnsignedWord T>
[[nodiscard]] constexpr T set_bit(T value, std::size_t bit, bool bit_value) noexcept {
    REGBITS_ASSERT(bit < word_bits<T>);
    const T position_mask = static_cast<T>(T{1} << bit);
    const T value_mask = static_cast<T>(T{bit_value} << bit);
    return static_cast<T>((value & static_cast<T>(~position_mask)) | value_mask);
}

// ============================================================================
// Bit-range access
// ============================================================================

/**
 * Extract bits [lsb, msb) of a value, right-aligned in a result of the same
 * type. The range excludes msb.
 *
 *   get_bits(uint8_t{0b1100'1110}, 3, 7) == 0b1001
 *   get_bits(uint8_t{0b1010'0101}, 6, 8) == 0b10
 *
 * A range reaching (or passing) the top of the word keeps every remaining
 * bit: get_bits(v, 0, word_bits<T>) == v.
 *
 * Precondition: lsb <= msb (checked by REGBITS_ASSERT).
 */
template <UnsignedWord T>
[[nodiscard]] constexpr T get_bits(T packed, std::size_t lsb, std::size_t msb) noexcept {
    REGBITS_ASSERT(lsb <= msb);
    const std::size_t field_width = msb - lsb;
    // e.g. 0b0000'0111 for a 3-bit field
    const T field_width_mask = static_cast<T>(~saturating_shl(all_ones<T>(), field_width));
    return static_cast<T>(saturating_shr(packed, lsb) & field_width_mask);
}

/**
 * Copy of `packed` with bits [lsb, msb) replaced by the low bits of
 * `field_value`. Bits of `field_value` above the range width are dropped and
 * bits outside the range are preserved.
 *
 *   set_bits(uint8_t{0b0000'0000}, 6, 8, uint8_t{0b11})   == 0b1100'0000
 *   set_bits(uint8_t{0b1111'1111}, 1, 5, uint8_t{0b0000}) == 0b1110'0001
 *   set_bits(uint8_t{0b1010'0110}, 2, 6, uint8_t{0b1110}) == 0b1011'1010
 *
 * Precondition: lsb <= msb (checked by REGBITS_ASSERT).
 */
template <UnsignedWord T>
[[nodiscard]] constexpr T set_bits(T packed, std::size_t lsb, std::size_t msb,
                                   T field_value) noexcept {
    REGBITS_ASSERT(lsb <= msb);
    // e.g. 0b1110'0000 for msb = 5
    const T msb_mask = saturating_shl(all_ones<T>(), msb);
    // e.g. 0b0000'0011 for lsb = 2
    const T lsb_mask = static_cast<T>(~saturating_shl(all_ones<T>(), lsb));
    // e.g. 0b1110'0011 for msb = 5, lsb = 2
    const T position_mask = static_cast<T>(msb_mask | lsb_mask);
    const T value_mask =
        static_cast<T>(saturating_shl(field_value, lsb) & static_cast<T>(~position_mask));
    return static_cast<T>((packed & position_mask) | value_mask);
}

// Mask with bits [lsb, msb) set
template <UnsignedWord T>
[[nodiscard]] constexpr T range_mask(std::size_t lsb, std::size_t msb) noexcept {
    return set_bits(T{0}, lsb, msb, all_ones<T>());
}

// ============================================================================
// Width conversions
// ============================================================================

/**
 * Narrow a word by dropping its high-order bits (value mod 2^word_bits<Dest>).
 * Only narrowing (or same-width) conversions are allowed; widening goes
 * through zero_extend().
 */
template <UnsignedWord Dest, UnsignedWord Source>
[[nodiscard]] constexpr Dest truncate_into(Source value) noexcept {
    static_assert(word_bits<Dest> <= word_bits<Source>,
                  "truncate_into cannot widen; use zero_extend");
    return static_cast<Dest>(value);
}

// Widen a word, filling the new high-order bits with zeros
template <UnsignedWord Dest, UnsignedWord Source>
[[nodiscard]] constexpr Dest zero_extend(Source value) noexcept {
    static_assert(word_bits<Dest> >= word_bits<Source>,
                  "zero_extend cannot narrow; use truncate_into");
    return static_cast<Dest>(value);
}

} // namespace regbits
