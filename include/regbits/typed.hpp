#pragma once

// Compile-time register schemas: Field, Register, AccessorSet

#include "regbits/field.hpp"
#include "regbits/typed/accessor_set.hpp"
#include "regbits/typed/bitfield.hpp"
#include "regbits/typed/register.hpp"
