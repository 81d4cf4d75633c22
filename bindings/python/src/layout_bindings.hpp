#pragma once
// Runtime schema bindings: FieldKind, FieldSpec, FieldDescriptor, Layout, RegisterValue

#include <nanobind/nanobind.h>
#include <nanobind/stl/shared_ptr.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/vector.h>

#include <regbits/dynamic.hpp>

#include "py_types.hpp"

#include <memory>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace nb = nanobind;
using namespace nb::literals;

namespace regbits_python {

inline void bind_layout(nb::module_& m) {
    using regbits::dynamic::FieldDescriptor;
    using regbits::dynamic::FieldKind;
    using regbits::dynamic::FieldSpec;
    using regbits::dynamic::Layout;
    using regbits::dynamic::RegisterValue;

    nb::enum_<FieldKind>(m, "FieldKind", "How a field reads")
        .value("flag", FieldKind::flag, "Single bit read as bool")
        .value("unsigned_int", FieldKind::unsigned_int, "Bit range read as an unsigned integer")
        .def("__str__",
             [](FieldKind k) { return std::string(regbits::dynamic::field_kind_string(k)); });

    // =========================================================================
    // FieldSpec - unvalidated schema entry
    // =========================================================================

    nb::class_<FieldSpec>(m, "FieldSpec", "Unvalidated field specification")
        .def_static("bit", &FieldSpec::bit, "name"_a, "n"_a, "Single bit read as bool")
        .def_static("range", &FieldSpec::range, "name"_a, "lsb"_a, "msb"_a,
                    "Bits [lsb, msb), msb excluded")
        .def_static("inclusive", &FieldSpec::inclusive, "name"_a, "lsb"_a, "msb"_a,
                    "Bits [lsb, msb], msb included")
        .def_ro("name", &FieldSpec::name)
        .def_ro("lsb", &FieldSpec::lsb)
        .def_ro("msb", &FieldSpec::msb)
        .def_ro("msb_inclusive", &FieldSpec::msb_inclusive)
        .def_ro("kind", &FieldSpec::kind);

    // =========================================================================
    // FieldDescriptor - validated field
    // =========================================================================

    nb::class_<FieldDescriptor>(m, "FieldDescriptor", "Validated field: name and [lsb, msb)")
        .def_ro("name", &FieldDescriptor::name)
        .def_ro("lsb", &FieldDescriptor::lsb)
        .def_ro("msb", &FieldDescriptor::msb, "Exclusive upper bound")
        .def_ro("kind", &FieldDescriptor::kind)
        .def_prop_ro("width", &FieldDescriptor::width)
        .def("overlaps", &FieldDescriptor::overlaps, "other"_a)
        .def("__eq__", [](const FieldDescriptor& a, const FieldDescriptor& b) { return a == b; })
        .def("__repr__", [](const FieldDescriptor& f) {
            std::ostringstream oss;
            oss << "FieldDescriptor(name='" << f.name << "', lsb=" << f.lsb << ", msb=" << f.msb
                << ", kind=" << regbits::dynamic::field_kind_string(f.kind) << ")";
            return oss.str();
        });

    // =========================================================================
    // Layout - validated runtime schema
    // =========================================================================

    nb::class_<Layout>(m, "Layout", "Validated register schema over a word of width_bits")
        .def_static(
            "create",
            [](std::size_t width_bits, const std::vector<FieldSpec>& specs, std::string type_name) {
                return unwrap(Layout::create(width_bits, std::span<const FieldSpec>(specs),
                                             std::move(type_name)));
            },
            "width_bits"_a, "specs"_a, "type_name"_a = "bitfield",
            "Validate a schema; raises SchemaError on the first problem")
        .def_prop_ro("width_bits", &Layout::width_bits)
        .def_prop_ro("type_name", &Layout::type_name)
        .def_prop_ro("fields", &Layout::fields)
        .def_prop_ro("word_mask", &Layout::word_mask)
        .def_prop_ro("covered_mask", &Layout::covered_mask)
        .def_prop_ro("reserved_mask", &Layout::reserved_mask)
        .def(
            "find",
            [](const Layout& l, std::string_view name) -> nb::object {
                const FieldDescriptor* field = l.find(name);
                return field ? nb::cast(*field) : nb::none();
            },
            "name"_a, "Field named name, or None")
        .def(
            "get",
            [](const Layout& l, uint64_t raw, std::string_view name) {
                return unwrap(l.get(raw, name));
            },
            "raw"_a, "name"_a)
        .def(
            "with_",
            [](const Layout& l, uint64_t raw, std::string_view name, uint64_t value) {
                return unwrap(l.with(raw, name, value));
            },
            "raw"_a, "name"_a, "value"_a, "Copy of raw with one field replaced")
        .def(
            "format", [](const Layout& l, uint64_t raw) { return l.format(raw); }, "raw"_a)
        .def("__eq__", [](const Layout& a, const Layout& b) { return a == b; })
        .def("__len__", [](const Layout& l) { return l.fields().size(); });

    // =========================================================================
    // RegisterValue - raw word bound to a layout
    // =========================================================================

    nb::class_<RegisterValue>(m, "RegisterValue", "Raw word bound to a Layout")
        .def(
            "__init__",
            [](RegisterValue* self, std::shared_ptr<Layout> layout, uint64_t raw) {
                new (self) RegisterValue(std::move(layout), raw);
            },
            "layout"_a, "raw"_a = 0)
        .def_prop_ro("value", &RegisterValue::value)
        .def_prop_ro("layout", &RegisterValue::layout, nb::rv_policy::reference_internal)
        .def(
            "get",
            [](const RegisterValue& r, std::string_view name) { return unwrap(r.get(name)); },
            "name"_a)
        .def(
            "set",
            [](RegisterValue& r, std::string_view name, uint64_t value) {
                unwrap(r.set(name, value));
            },
            "name"_a, "value"_a)
        .def(
            "with_",
            [](const RegisterValue& r, std::string_view name, uint64_t value) {
                return unwrap(r.with(name, value));
            },
            "name"_a, "value"_a, "Copy with one field replaced")
        .def("__getitem__",
             [](const RegisterValue& r, std::string_view name) { return unwrap(r.get(name)); })
        .def("__setitem__", [](RegisterValue& r, std::string_view name,
                               uint64_t value) { unwrap(r.set(name, value)); })
        .def("__int__", &RegisterValue::value)
        .def("__eq__", [](const RegisterValue& a, const RegisterValue& b) { return a == b; })
        .def("__str__", &RegisterValue::to_string)
        .def("__repr__", &RegisterValue::to_string);
}

} // namespace regbits_python
