#pragma once

// REGBITS compile-time configuration
//
// Every macro may be defined before the first regbits include (or from the
// build system) to override the default.

#include <cassert>

// Contract check for the bit primitives (inverted ranges, bit index past the
// word width). Release builds compile it away together with assert().
#ifndef REGBITS_ASSERT
#define REGBITS_ASSERT(x) assert(x)
#endif

// Print a WARNING to stderr when a setter wraps a value that does not fit the
// field width. Defaults to on for debug builds only.
#ifndef REGBITS_TRUNCATION_WARNINGS
#ifdef NDEBUG
#define REGBITS_TRUNCATION_WARNINGS 0
#else
#define REGBITS_TRUNCATION_WARNINGS 1
#endif
#endif

#if defined(__SIZEOF_INT128__)
#define REGBITS_HAS_INT128 1
#else
#define REGBITS_HAS_INT128 0
#endif
