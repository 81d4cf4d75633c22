#pragma once
// Error bindings: SchemaErrorCode, SchemaError

#include <nanobind/nanobind.h>

#include <regbits/dynamic/schema_error.hpp>

#include "py_types.hpp"

#include <stdexcept>
#include <string>

namespace nb = nanobind;

namespace regbits_python {

inline void bind_errors(nb::module_& m) {
    using regbits::dynamic::SchemaErrorCode;

    nb::enum_<SchemaErrorCode>(m, "SchemaErrorCode", "Reasons a runtime schema is rejected")
        .value("unsupported_width", SchemaErrorCode::unsupported_width,
               "Word width is not 8, 16, 32 or 64")
        .value("empty_name", SchemaErrorCode::empty_name, "Field name is empty")
        .value("duplicate_name", SchemaErrorCode::duplicate_name, "Two fields share a name")
        .value("empty_range", SchemaErrorCode::empty_range, "Range contains no bits")
        .value("inverted_range", SchemaErrorCode::inverted_range, "msb is below lsb")
        .value("out_of_bounds", SchemaErrorCode::out_of_bounds,
               "Range extends beyond the word width")
        .value("flag_width", SchemaErrorCode::flag_width, "Flag field is not one bit wide")
        .value("unknown_field", SchemaErrorCode::unknown_field, "No field with that name")
        .def("__str__", [](SchemaErrorCode c) {
            return std::string(regbits::dynamic::schema_error_string(c));
        });

    // SchemaError - invalid schemas and unknown field names
    auto schema_error = nb::exception<std::runtime_error>(m, "SchemaError", PyExc_ValueError);
    schema_error_type = schema_error.ptr();
}

} // namespace regbits_python
