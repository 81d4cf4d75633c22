#pragma once

#include "regbits/bits.hpp"
#include "regbits/debug.hpp"
#include "regbits/detail/diagnostics.hpp"
#include "regbits/dynamic/field_descriptor.hpp"
#include "regbits/dynamic/schema_error.hpp"
#include "regbits/types.hpp"

#include <functional>
#include <initializer_list>
#include <map>
#include <ostream>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace regbits::dynamic {

/**
 * @brief Unvalidated field specification for a runtime schema
 *
 *   FieldSpec::bit("ready", 25)          // bit 25, read as a flag
 *   FieldSpec::range("mode", 0, 4)       // bits [0, 4)
 *   FieldSpec::inclusive("count", 6, 17) // bits [6, 17]
 */
struct FieldSpec {
    std::string name;
    std::size_t lsb{0};
    std::size_t msb{0};
    bool msb_inclusive{false};
    FieldKind kind{FieldKind::unsigned_int};

    [[nodiscard]] static FieldSpec bit(std::string name, std::size_t n) {
        return FieldSpec{std::move(name), n, n, true, FieldKind::flag};
    }

    [[nodiscard]] static FieldSpec range(std::string name, std::size_t lsb, std::size_t msb) {
        return FieldSpec{std::move(name), lsb, msb, false, FieldKind::unsigned_int};
    }

    [[nodiscard]] static FieldSpec inclusive(std::string name, std::size_t lsb, std::size_t msb) {
        return FieldSpec{std::move(name), lsb, msb, true, FieldKind::unsigned_int};
    }
};

/**
 * @brief Validated schema of a register known only at run time
 *
 * The counterpart of a typed Register for schemas read from configuration
 * or built by a scripting front end. Words are held in a uint64_t; bits
 * above width_bits() are ignored on input and zero on output.
 *
 * A layout is validated once by create() and then shared by every value
 * using it (see RegisterValue).
 */
class Layout {
public:
    /**
     * @brief Validate a schema
     *
     * @param width_bits Word width: 8, 16, 32 or 64
     * @param specs Fields in declaration order
     * @param type_name Name used by format()
     * @return The layout, or the first problem found
     */
    [[nodiscard]] static SchemaResult<Layout> create(std::size_t width_bits,
                                                     std::span<const FieldSpec> specs,
                                                     std::string type_name = "bitfield") {
        if (width_bits != 8 && width_bits != 16 && width_bits != 32 && width_bits != 64) {
            return make_schema_error(SchemaErrorCode::unsupported_width);
        }

        Layout layout(width_bits, std::move(type_name));
        layout.fields_.reserve(specs.size());

        for (std::size_t i = 0; i < specs.size(); ++i) {
            const FieldSpec& spec = specs[i];
            if (spec.name.empty()) {
                return make_schema_error(SchemaErrorCode::empty_name, i);
            }
            if (spec.msb < spec.lsb) {
                return make_schema_error(SchemaErrorCode::inverted_range, i, spec.name);
            }
            // Inclusive bounds are checked before the +1 so SIZE_MAX cannot wrap
            if (spec.msb_inclusive ? spec.msb >= width_bits : spec.msb > width_bits) {
                return make_schema_error(SchemaErrorCode::out_of_bounds, i, spec.name);
            }
            const std::size_t msb = spec.msb_inclusive ? spec.msb + 1 : spec.msb;
            if (msb == spec.lsb) {
                return make_schema_error(SchemaErrorCode::empty_range, i, spec.name);
            }
            if (spec.kind == FieldKind::flag && msb - spec.lsb != 1) {
                return make_schema_error(SchemaErrorCode::flag_width, i, spec.name);
            }
            if (!layout.index_.emplace(spec.name, i).second) {
                return make_schema_error(SchemaErrorCode::duplicate_name, i, spec.name);
            }
            layout.fields_.push_back(FieldDescriptor{spec.name, spec.lsb, msb, spec.kind});
        }
        return layout;
    }

    [[nodiscard]] static SchemaResult<Layout> create(std::size_t width_bits,
                                                     std::initializer_list<FieldSpec> specs,
                                                     std::string type_name = "bitfield") {
        return create(width_bits, std::span<const FieldSpec>(specs.begin(), specs.size()),
                      std::move(type_name));
    }

    /**
     * @brief Layout of a typed register
     *
     * The typed schema was already checked at compile time, so this cannot
     * fail. Registers wider than 64 bits have no runtime layout.
     */
    template <typename R>
    [[nodiscard]] static Layout of() {
        using T = typename R::underlying_type;
        static_assert(word_bits<T> <= 64, "runtime layouts hold at most 64-bit words");

        std::string type_name = "bitfield";
        if constexpr (requires { R::type_name; }) {
            type_name = std::string{R::type_name};
        }

        Layout layout(word_bits<T>, std::move(type_name));
        layout.fields_ = R::descriptors();
        for (std::size_t i = 0; i < layout.fields_.size(); ++i) {
            layout.index_.emplace(layout.fields_[i].name, i);
        }
        return layout;
    }

    [[nodiscard]] std::size_t width_bits() const noexcept { return width_bits_; }
    [[nodiscard]] const std::string& type_name() const noexcept { return type_name_; }
    [[nodiscard]] const std::vector<FieldDescriptor>& fields() const noexcept { return fields_; }

    // nullptr when no field has that name
    [[nodiscard]] const FieldDescriptor* find(std::string_view name) const {
        const auto it = index_.find(name);
        return it == index_.end() ? nullptr : &fields_[it->second];
    }

    // All bits of the word
    [[nodiscard]] uint64_t word_mask() const noexcept {
        return range_mask<uint64_t>(0, width_bits_);
    }

    [[nodiscard]] uint64_t covered_mask() const noexcept {
        uint64_t mask = 0;
        for (const auto& field : fields_) {
            mask |= range_mask<uint64_t>(field.lsb, field.msb);
        }
        return mask;
    }

    [[nodiscard]] uint64_t reserved_mask() const noexcept {
        return word_mask() & ~covered_mask();
    }

    /**
     * @brief Read a field from a raw word
     *
     * Flags read as 0 or 1.
     */
    [[nodiscard]] SchemaResult<uint64_t> get(uint64_t raw, std::string_view name) const {
        const FieldDescriptor* field = find(name);
        if (field == nullptr) {
            return make_schema_error(SchemaErrorCode::unknown_field, SchemaError::npos,
                                     std::string{name});
        }
        return extract(raw, *field);
    }

    /**
     * @brief Copy of a raw word with one field replaced
     *
     * Values wider than the field are wrapped modulo 2^width (with a
     * truncation warning when enabled).
     */
    [[nodiscard]] SchemaResult<uint64_t> with(uint64_t raw, std::string_view name,
                                              uint64_t value) const {
        const FieldDescriptor* field = find(name);
        if (field == nullptr) {
            return make_schema_error(SchemaErrorCode::unknown_field, SchemaError::npos,
                                     std::string{name});
        }
        return insert(raw, *field, value);
    }

    [[nodiscard]] uint64_t extract(uint64_t raw, const FieldDescriptor& field) const noexcept {
        return get_bits(raw & word_mask(), field.lsb, field.msb);
    }

    [[nodiscard]] uint64_t insert(uint64_t raw, const FieldDescriptor& field,
                                  uint64_t value) const noexcept {
        if (detail::exceeds_width(value, field.width())) {
            detail::warn_truncation(field.name, value, field.width());
        }
        return set_bits(raw & word_mask(), field.lsb, field.msb, value);
    }

    // Append one entry per field, in declaration order
    void format_fields(DebugStruct& out, uint64_t raw) const {
        for (const auto& field : fields_) {
            const uint64_t value = extract(raw, field);
            if (field.kind == FieldKind::flag) {
                out.field(field.name, value != 0);
            } else {
                out.field(field.name, value);
            }
        }
    }

    // Same dump as a typed register: "Name { <value>: 0x.., field: value, ... }"
    void format(std::ostream& os, uint64_t raw) const {
        DebugStruct out(os, type_name_);
        out.field("<value>", hex_value<uint64_t>{raw & word_mask()});
        format_fields(out, raw);
        out.finish();
    }

    [[nodiscard]] std::string format(uint64_t raw) const {
        std::ostringstream oss;
        format(oss, raw);
        return oss.str();
    }

    bool operator==(const Layout& other) const {
        return width_bits_ == other.width_bits_ && fields_ == other.fields_;
    }

private:
    Layout(std::size_t width_bits, std::string type_name)
        : width_bits_(width_bits),
          type_name_(std::move(type_name)) {}

    std::size_t width_bits_;
    std::string type_name_;
    std::vector<FieldDescriptor> fields_;
    std::map<std::string, std::size_t, std::less<>> index_;
};

} // namespace regbits::dynamic
