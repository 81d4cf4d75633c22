#pragma once

#include "regbits/types.hpp"

#include <string>

#include <cstddef>

namespace regbits::detail {

// Room for "0x", every nibble of T and a terminating NUL
template <UnsignedWord T>
inline constexpr std::size_t hex_buffer_size = word_bits<T> / 4 + 3;

// Writes "0x"-prefixed lowercase hex, without leading zeros, so that it ends
// just before `end`. Returns the first character written.
template <UnsignedWord T>
char* write_hex(T value, char* end) noexcept {
    static constexpr char digits[] = "0123456789abcdef";
    char* pos = end;
    do {
        *--pos = digits[static_cast<unsigned>(value & T{0xF})];
        value = static_cast<T>(value >> 4);
    } while (value != T{0});
    *--pos = 'x';
    *--pos = '0';
    return pos;
}

// Works for uint128_t, which neither printf nor iostreams can format.
template <UnsignedWord T>
std::string to_hex(T value) {
    char buffer[hex_buffer_size<T>];
    char* end = buffer + sizeof(buffer) - 1;
    char* begin = write_hex(value, end);
    return std::string(begin, end);
}

// Decimal rendering, same reason as to_hex()
template <UnsignedWord T>
std::string to_decimal(T value) {
    char buffer[word_bits<T> / 3 + 2];
    std::size_t pos = sizeof(buffer);
    do {
        buffer[--pos] = static_cast<char>('0' + static_cast<unsigned>(value % T{10}));
        value = static_cast<T>(value / T{10});
    } while (value != T{0});
    return std::string(buffer + pos, sizeof(buffer) - pos);
}

} // namespace regbits::detail
