#pragma once
// Core bindings: bit primitives on 64-bit words

#include <nanobind/nanobind.h>
#include <nanobind/stl/pair.h>

#include <regbits/bits.hpp>

#include "py_types.hpp"

#include <cstddef>
#include <cstdint>

namespace nb = nanobind;
using namespace nb::literals;

namespace regbits_python {

inline void bind_core(nb::module_& m) {
    m.attr("WORD_BITS") = 64;

    m.def(
        "get_bit",
        [](uint64_t value, std::size_t bit) {
            check_bit(bit);
            return regbits::get_bit(value, bit);
        },
        "value"_a, "bit"_a, "Test one bit (bit 0 is the least significant)");

    m.def(
        "set_bit",
        [](uint64_t value, std::size_t bit, bool bit_value) {
            check_bit(bit);
            return regbits::set_bit(value, bit, bit_value);
        },
        "value"_a, "bit"_a, "bit_value"_a, "Copy of value with one bit forced");

    m.def(
        "get_bits",
        [](uint64_t packed, std::size_t lsb, std::size_t msb) {
            check_range(lsb, msb);
            return regbits::get_bits(packed, lsb, msb);
        },
        "packed"_a, "lsb"_a, "msb"_a, "Bits [lsb, msb) of packed, right-aligned");

    m.def(
        "set_bits",
        [](uint64_t packed, std::size_t lsb, std::size_t msb, uint64_t field_value) {
            check_range(lsb, msb);
            return regbits::set_bits(packed, lsb, msb, field_value);
        },
        "packed"_a, "lsb"_a, "msb"_a, "field_value"_a,
        "Copy of packed with bits [lsb, msb) replaced by the low bits of field_value");

    m.def(
        "range_mask",
        [](std::size_t lsb, std::size_t msb) {
            check_range(lsb, msb);
            return regbits::range_mask<uint64_t>(lsb, msb);
        },
        "lsb"_a, "msb"_a, "Mask with bits [lsb, msb) set");

    m.def("saturating_shl", &regbits::saturating_shl<uint64_t>, "value"_a, "n"_a,
          "Shift left; 0 when n >= 64");
    m.def("saturating_shr", &regbits::saturating_shr<uint64_t>, "value"_a, "n"_a,
          "Shift right; 0 when n >= 64");
    m.def("overflowing_shl", &regbits::overflowing_shl<uint64_t>, "value"_a, "n"_a,
          "Shift left by n mod 64; returns (value, wrapped)");
    m.def("overflowing_shr", &regbits::overflowing_shr<uint64_t>, "value"_a, "n"_a,
          "Shift right by n mod 64; returns (value, wrapped)");
}

} // namespace regbits_python
