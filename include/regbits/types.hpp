#pragma once

#include "regbits/config.hpp"

#include <concepts>
#include <type_traits>

#include <climits>
#include <cstddef>
#include <cstdint>

namespace regbits {

#if REGBITS_HAS_INT128
__extension__ typedef unsigned __int128 uint128_t;
#endif

namespace detail {

template <typename T>
struct is_unsigned_word : std::false_type {};

template <>
struct is_unsigned_word<unsigned char> : std::true_type {};
template <>
struct is_unsigned_word<unsigned short> : std::true_type {};
template <>
struct is_unsigned_word<unsigned int> : std::true_type {};
template <>
struct is_unsigned_word<unsigned long> : std::true_type {};
template <>
struct is_unsigned_word<unsigned long long> : std::true_type {};
#if REGBITS_HAS_INT128
template <>
struct is_unsigned_word<uint128_t> : std::true_type {};
#endif

} // namespace detail

/**
 * Fixed-width unsigned integer usable as the underlying value of a bitfield
 * or as the storage type of a field: uint8_t through uint64_t, the pointer
 * width types, and uint128_t where the compiler provides it.
 */
template <typename T>
concept UnsignedWord = detail::is_unsigned_word<std::remove_cv_t<T>>::value;

// Number of bits in a word type
template <UnsignedWord T>
inline constexpr std::size_t word_bits = sizeof(T) * CHAR_BIT;

// Smallest standard word type holding Width bits. Default storage for a field.
template <std::size_t Width>
struct smallest_word {
    static_assert(Width > 0, "a field must be at least one bit wide");
#if REGBITS_HAS_INT128
    static_assert(Width <= 128, "no word type is wider than 128 bits");
#else
    static_assert(Width <= 64, "no word type is wider than 64 bits");
#endif

    using type = std::conditional_t<
        Width <= 8, uint8_t,
        std::conditional_t<Width <= 16, uint16_t,
                           std::conditional_t<Width <= 32, uint32_t,
#if REGBITS_HAS_INT128
                                              std::conditional_t<Width <= 64, uint64_t, uint128_t>
#else
                                              uint64_t
#endif
                                              >>>;
};

template <std::size_t Width>
using smallest_word_t = typename smallest_word<Width>::type;

} // namespace regbits
