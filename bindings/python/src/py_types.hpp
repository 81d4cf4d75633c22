#pragma once
// Shared helpers for the REGBITS Python bindings

#include <nanobind/nanobind.h>

#include <regbits/dynamic.hpp>

#include <type_traits>
#include <utility>

#include <cstddef>

namespace nb = nanobind;

namespace regbits_python {

// Exception type pointer (set during module init)
extern PyObject* schema_error_type;

// Value of a schema result, or regbits.SchemaError
template <typename T>
T unwrap(regbits::dynamic::SchemaResult<T>&& result) {
    if (!result.has_value()) {
        PyErr_SetString(schema_error_type, result.error().describe().c_str());
        throw nb::python_error();
    }
    if constexpr (!std::is_void_v<T>) {
        return std::move(*result);
    }
}

// The C++ primitives assert on these; Python gets a ValueError instead
inline void check_range(std::size_t lsb, std::size_t msb) {
    if (msb < lsb) {
        throw nb::value_error("msb must not be below lsb");
    }
}

inline void check_bit(std::size_t bit) {
    if (bit >= 64) {
        throw nb::value_error("bit index must be below 64");
    }
}

} // namespace regbits_python
