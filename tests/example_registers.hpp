#pragma once

// Register types shared by the test suites

#include <regbits/typed.hpp>

#include <string_view>

#include <cstdint>

namespace regbits_test {

using regbits::Bit;
using regbits::Bits;
using regbits::BitsInclusive;
using regbits::Field;

// Six flags in the low bits; bits 6 and 7 are reserved
struct SubFields : regbits::Register<SubFields, uint8_t,
                                     Field<"zero", Bit<0>>,
                                     Field<"one", Bit<1>>,
                                     Field<"two", Bit<2>>,
                                     Field<"three", Bit<3>>,
                                     Field<"four", Bit<4>>,
                                     Field<"five", Bit<5>>> {
    using Register::Register;
    static constexpr std::string_view type_name = "SubFields";
};

// Overlapping ranges (b and c share bits 16 and 17), a nested bitfield in e,
// reserved bits 4, 5 and 20..24
struct Example : regbits::Register<Example, uint32_t,
                                   Field<"a", Bits<0, 4>, uint8_t>,
                                   Field<"b", BitsInclusive<6, 17>, uint16_t>,
                                   Field<"c", Bits<16, 20>, uint8_t>,
                                   Field<"d", Bit<25>>,
                                   Field<"e", Bits<26, 32>, uint8_t, SubFields>> {
    using Register::Register;
    static constexpr std::string_view type_name = "Example";
};

// b overlaps the low bit of c
struct Small : regbits::Register<Small, uint8_t,
                                 Field<"a", Bits<0, 4>>,
                                 Field<"b", Bit<4>>,
                                 Field<"c", Bits<4, 8>>> {
    using Register::Register;
    static constexpr std::string_view type_name = "Small";
};

// Fields shared by SomeFields and OtherFields
using CommonFields = regbits::AccessorSet<uint32_t,
                                          Field<"a", Bits<0, 6>, uint8_t>,
                                          Field<"b", Bit<14>>,
                                          Field<"c", Bits<18, 32>, uint16_t>>;

struct SomeFields : regbits::Register<SomeFields, uint32_t, CommonFields,
                                      Field<"x", Bit<7>>,
                                      Field<"y", Bit<16>>> {
    using Register::Register;
    static constexpr std::string_view type_name = "SomeFields";
};

struct OtherFields : regbits::Register<OtherFields, uint32_t, CommonFields,
                                       Field<"z", Bit<10>>,
                                       Field<"q", Bit<12>>> {
    using Register::Register;
    static constexpr std::string_view type_name = "OtherFields";
};

} // namespace regbits_test
