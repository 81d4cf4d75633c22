#include <iomanip>
#include <iostream>
#include <memory>
#include <string_view>

#include <cstdint>
#include <regbits.hpp>

using regbits::Bit;
using regbits::Bits;
using regbits::BitsInclusive;
using regbits::Field;

// Six single-bit flags packed into the top of Example
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

// b and c overlap on bits 16 and 17; bits 4, 5 and 20..24 are reserved
struct Example : regbits::Register<Example, uint32_t,
                                   Field<"a", Bits<0, 4>, uint8_t>,
                                   Field<"b", BitsInclusive<6, 17>, uint16_t>,
                                   Field<"c", Bits<16, 20>, uint8_t>,
                                   Field<"d", Bit<25>>,
                                   Field<"e", Bits<26, 32>, uint8_t, SubFields>> {
    using Register::Register;
    static constexpr std::string_view type_name = "Example";
};

void printHex(std::string_view label, uint64_t value) {
    std::cout << "  " << label << ": 0x" << std::hex << value << std::dec << "\n";
}

int main() {
    std::cout << "REGBITS Register Examples\n";
    std::cout << "=========================\n\n";

    // Example 1: Decoding a raw word
    std::cout << "1. Decoding\n";
    std::cout << "-----------\n";

    const Example x(0xfa84'9e1b);
    printHex("a", x.get<"a">());
    printHex("b", x.get<"b">());
    printHex("c", x.get<"c">());
    std::cout << "  d: " << std::boolalpha << x.get<"d">() << "\n";
    std::cout << "  e: " << x.get<"e">() << "\n\n";

    // Example 2: Building a value with setters
    std::cout << "2. Setters\n";
    std::cout << "----------\n";

    Example z;
    z.set<"a">(0xb);
    z.set<"b">(0x278);
    z.set<"c">(0x4);
    z.set<"d">(true);
    z.set<"e">(SubFields(0x3e));
    printHex("value", z.value());
    // Reserved bits differ, so the two values are not equal
    std::cout << "  equal to the decoded value: " << (z == x) << "\n\n";

    // Example 3: Chained with-builders leave the source untouched
    std::cout << "3. With-builders\n";
    std::cout << "----------------\n";

    const Example w = x.with<"a">(0x6)
                          .with<"b">(0x9f3)
                          .with<"c">(0xd)
                          .with<"d">(false)
                          .with<"e">(SubFields(0x2b));
    printHex("new value", w.value());
    printHex("source", x.value());
    std::cout << "\n";

    // Example 4: Schema introspection
    std::cout << "4. Schema\n";
    std::cout << "---------\n";

    printHex("covered bits", Example::covered_mask());
    printHex("reserved bits", Example::reserved_mask());
    for (const auto& field : Example::descriptors()) {
        std::cout << "  " << std::setw(2) << field.name << " [" << field.lsb << ", " << field.msb
                  << ") " << regbits::dynamic::field_kind_string(field.kind) << "\n";
    }
    std::cout << "\n";

    // Example 5: The same register through its runtime layout
    std::cout << "5. Runtime layout\n";
    std::cout << "-----------------\n";

    auto layout =
        std::make_shared<const regbits::dynamic::Layout>(regbits::dynamic::Layout::of<Example>());
    regbits::dynamic::RegisterValue reg(layout, x.value());
    std::cout << "  " << reg << "\n";

    if (auto missing = reg.get("f"); !missing) {
        std::cout << "  get(\"f\"): " << missing.error().describe() << "\n";
    }

    return 0;
}
