// An interface type with no conversion to and from its storage type is
// rejected until regbits::field_conversion is specialized for it.
//
// This translation unit is expected to FAIL compilation.

#include <regbits/typed.hpp>

#include <cstdint>

namespace {
struct Celsius {
    int degrees;
};

struct Bad : regbits::Register<Bad, uint16_t,
                               regbits::Field<"temp", regbits::Bits<0, 8>, uint8_t, Celsius>> {
    using Register::Register;
};
} // namespace

int main() {
    return Bad(0).get<"temp">().degrees;
}
