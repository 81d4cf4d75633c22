#pragma once

#include "regbits/bits.hpp"
#include "regbits/debug.hpp"
#include "regbits/detail/field_list.hpp"
#include "regbits/detail/fixed_string.hpp"
#include "regbits/dynamic/field_descriptor.hpp"
#include "regbits/field.hpp"
#include "regbits/typed/bitfield.hpp"
#include "regbits/types.hpp"

#include <concepts>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

#include <cstddef>

namespace regbits {

/**
 * CRTP base for a bitfield wrapper over an underlying word T.
 *
 * Entries are Field<> specifications and AccessorSet<> bundles, in
 * declaration order. Ranges may overlap and need not cover the word; bits no
 * field covers are reserved, but still take part in equality and debug
 * output.
 *
 *   struct Status : regbits::Register<Status, uint8_t,
 *                                     regbits::Field<"a", regbits::Bits<0, 4>>,
 *                                     regbits::Field<"b", regbits::Bit<4>>,
 *                                     regbits::Field<"c", regbits::Bits<4, 8>>> {
 *       using Register::Register;
 *       static constexpr std::string_view type_name = "Status";
 *   };
 *
 *   Status s{0b1011'0110};
 *   s.get<"a">();            // 0b0110
 *   s.with<"a">(0).value();  // 0b1011'0000
 *
 * The derived type must inherit the constructors (using Register::Register)
 * and add no data members: the wrapper is exactly one T.
 *
 * Derived may declare `static constexpr std::string_view type_name` for the
 * debug output, and may replace that output entirely by defining
 * `void format_debug(std::ostream&) const` (format_fields() helps there).
 *
 * @tparam Derived The concrete bitfield type (CRTP)
 * @tparam T The underlying word type
 * @tparam Entries Field<> and AccessorSet<> types
 */
template <typename Derived, UnsignedWord T, typename... Entries>
class Register {
public:
    using underlying_type = T;
    using fields = detail::flatten_fields_t<Entries...>;

    static constexpr std::size_t field_count = fields::size;

    static_assert(detail::all_are_fields(fields{}),
                  "Register entries must be Field or AccessorSet types");
    static_assert(detail::all_fields_fit<T>(fields{}),
                  "field does not fit the underlying word (range or storage type too wide)");
    static_assert(detail::all_unique_names_v<fields>, "duplicate field name in register");

    template <fixed_string Name>
    using field_type = typename detail::lookup_field<Name, fields>::type;

    template <fixed_string Name>
    using value_type_of = typename field_type<Name>::value_type;

    // Zero value
    constexpr Register() noexcept = default;

    constexpr explicit Register(T raw) noexcept : value_(raw) {}

    [[nodiscard]] static constexpr Derived from_value(T raw) noexcept { return Derived(raw); }

    [[nodiscard]] constexpr T value() const noexcept { return value_; }

    constexpr explicit operator T() const noexcept { return value_; }

    // ========================================================================
    // Field access by name
    // ========================================================================

    template <fixed_string Name>
    [[nodiscard]] constexpr value_type_of<Name> get() const {
        return detail::get_field<field_type<Name>>(self());
    }

    template <fixed_string Name>
    constexpr void set(const value_type_of<Name>& value) {
        detail::set_field<field_type<Name>>(self(), value);
    }

    template <fixed_string Name>
    [[nodiscard]] constexpr Derived with(const value_type_of<Name>& value) const {
        return detail::with_field<field_type<Name>>(self(), value);
    }

    // ========================================================================
    // Field access by tag
    // ========================================================================

    template <typename F>
        requires detail::contains_field_v<F, fields>
    [[nodiscard]] constexpr typename F::value_type get(field_tag<F>) const {
        return detail::get_field<F>(self());
    }

    template <typename F>
        requires detail::contains_field_v<F, fields>
    constexpr void set(field_tag<F>, const typename F::value_type& value) {
        detail::set_field<F>(self(), value);
    }

    template <typename F>
        requires detail::contains_field_v<F, fields>
    [[nodiscard]] constexpr Derived with(field_tag<F>, const typename F::value_type& value) const {
        return detail::with_field<F>(self(), value);
    }

    // ========================================================================
    // Schema introspection
    // ========================================================================

    // Bits covered by at least one field
    [[nodiscard]] static constexpr T covered_mask() noexcept {
        return []<typename... Fs>(detail::field_list<Fs...>) {
            return static_cast<T>((range_mask<T>(Fs::lsb, Fs::msb) | ... | T{0}));
        }(fields{});
    }

    // Bits no field covers
    [[nodiscard]] static constexpr T reserved_mask() noexcept {
        return static_cast<T>(~covered_mask());
    }

    [[nodiscard]] static std::vector<dynamic::FieldDescriptor> descriptors() {
        return []<typename... Fs>(detail::field_list<Fs...>) {
            return std::vector<dynamic::FieldDescriptor>{dynamic::FieldDescriptor{
                std::string{Fs::name.view()}, Fs::lsb, Fs::msb,
                Fs::is_flag ? dynamic::FieldKind::flag : dynamic::FieldKind::unsigned_int}...};
        }(fields{});
    }

    // ========================================================================
    // Debug output
    // ========================================================================

    // Append one entry per field, in declaration order
    void format_fields(DebugStruct& out) const {
        [&]<typename... Fs>(detail::field_list<Fs...>) {
            (out.field(Fs::name.view(), detail::get_field<Fs>(self())), ...);
        }(fields{});
    }

    [[nodiscard]] std::string to_string() const {
        std::ostringstream oss;
        oss << self();
        return oss.str();
    }

    friend std::ostream& operator<<(std::ostream& os, const Derived& reg) {
        if constexpr (requires { reg.format_debug(os); }) {
            reg.format_debug(os);
        } else {
            DebugStruct out(os, debug_name());
            out.field("<value>", hex_value<T>{reg.value()});
            reg.format_fields(out);
            out.finish();
        }
        return os;
    }

    // Equality of the full underlying word, reserved bits included
    friend constexpr bool operator==(const Derived& a, const Derived& b) noexcept {
        return a.value() == b.value();
    }

private:
    [[nodiscard]] constexpr const Derived& self() const noexcept {
        static_assert(sizeof(Derived) == sizeof(T),
                      "a bitfield must hold exactly its underlying value; add no data members");
        static_assert(std::constructible_from<Derived, T>,
                      "bitfield types must inherit the constructors: using Register::Register;");
        return static_cast<const Derived&>(*this);
    }

    [[nodiscard]] constexpr Derived& self() noexcept { return static_cast<Derived&>(*this); }

    [[nodiscard]] static constexpr std::string_view debug_name() noexcept {
        if constexpr (requires { Derived::type_name; }) {
            return std::string_view{Derived::type_name};
        } else {
            return "bitfield";
        }
    }

    T value_{};
};

} // namespace regbits
