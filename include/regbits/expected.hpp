#pragma once

// REGBITS Expected Type
//
// Exposes tl::expected in the regbits namespace for the runtime schema layer.
// Typed schemas never need it: they are rejected at compile time.
//
// Usage:
//   regbits::expected<T, E> result = some_operation();
//   if (result.has_value()) {
//       use(*result);
//   } else {
//       handle(result.error());
//   }

#include <tl/expected.hpp>

namespace regbits {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace regbits
