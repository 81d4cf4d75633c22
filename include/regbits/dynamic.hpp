#pragma once

// Runtime register schemas: Layout, RegisterValue and their error type

#include "regbits/dynamic/field_descriptor.hpp"
#include "regbits/dynamic/layout.hpp"
#include "regbits/dynamic/register_value.hpp"
#include "regbits/dynamic/schema_error.hpp"
