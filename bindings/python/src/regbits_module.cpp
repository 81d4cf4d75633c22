// REGBITS Python Bindings
// Main module entry point - includes component bindings

#include <nanobind/nanobind.h>

// Binding components
#include "core_bindings.hpp"
#include "error_bindings.hpp"
#include "layout_bindings.hpp"

namespace nb = nanobind;

// Define the exception type pointer (declared extern in py_types.hpp)
namespace regbits_python {
PyObject* schema_error_type = nullptr;
} // namespace regbits_python

NB_MODULE(regbits, m) {
    m.doc() = "REGBITS - named, typed views over the bits of an unsigned word";

    // Bind components in dependency order:
    // 1. Bit primitives - no dependencies
    regbits_python::bind_core(m);

    // 2. Error types (sets schema_error_type)
    regbits_python::bind_errors(m);

    // 3. Runtime schemas - need schema_error_type
    regbits_python::bind_layout(m);
}
