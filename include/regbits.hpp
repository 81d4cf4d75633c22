#pragma once

// regbits: named, typed views over the bits of an unsigned word
//
//   #include <regbits.hpp>
//
//   struct Status : regbits::Register<Status, uint8_t,
//                                     regbits::Field<"mode", regbits::Bits<0, 4>>,
//                                     regbits::Field<"ready", regbits::Bit<4>>> {
//       using Register::Register;
//   };

#include "regbits/bits.hpp"
#include "regbits/config.hpp"
#include "regbits/debug.hpp"
#include "regbits/dynamic.hpp"
#include "regbits/expected.hpp"
#include "regbits/typed.hpp"
#include "regbits/types.hpp"
