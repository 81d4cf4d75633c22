#pragma once

#include "regbits/detail/field_list.hpp"
#include "regbits/detail/fixed_string.hpp"
#include "regbits/field.hpp"
#include "regbits/typed/bitfield.hpp"
#include "regbits/types.hpp"

namespace regbits {

/**
 * AccessorSet<T, Fields...>: field accessors defined once and shared by
 * several bitfield types over the same underlying word T.
 *
 * Registers whose state changes the meaning of some bits typically share a
 * common subset of fields. Declare that subset once:
 *
 *   using CommonFields = regbits::AccessorSet<uint32_t,
 *       regbits::Field<"a", regbits::Bits<0, 6>>,
 *       regbits::Field<"b", regbits::Bit<14>>>;
 *
 * and list it among the entries of each register that has it:
 *
 *   struct SomeFields : regbits::Register<SomeFields, uint32_t, CommonFields,
 *                                         regbits::Field<"x", regbits::Bit<7>>> {
 *       using Register::Register;
 *   };
 *
 * SomeFields then exposes get<"a">(), set<"a">(), with<"a">() alongside its
 * own fields. The static accessors below also work on any type satisfying
 * Bitfield<W, T>, listed or not.
 */
template <UnsignedWord T, typename... Fields>
struct AccessorSet {
    using underlying_type = T;
    using fields = detail::field_list<Fields...>;

    static_assert((IsField<Fields> && ...), "AccessorSet entries must be Field types");
    static_assert((Fields::template fits_in<T>() && ...),
                  "accessor set field does not fit the underlying word");
    static_assert(detail::all_unique_names_v<fields>, "duplicate field name in accessor set");

    template <fixed_string Name>
    using field_type = typename detail::lookup_field<Name, fields>::type;

    template <fixed_string Name>
    using value_type_of = typename field_type<Name>::value_type;

    // Implemented by W when W lists this set among its entries
    template <typename W>
    static constexpr bool is_attached_to = [] {
        if constexpr (requires { typename W::fields; }) {
            return (detail::contains_field_v<Fields, typename W::fields> && ...);
        } else {
            return false;
        }
    }();

    template <fixed_string Name, Bitfield<T> W>
    [[nodiscard]] static constexpr value_type_of<Name> get(const W& w) {
        return detail::get_field<field_type<Name>>(w);
    }

    template <fixed_string Name, Bitfield<T> W>
    static constexpr void set(W& w, const value_type_of<Name>& value) {
        detail::set_field<field_type<Name>>(w, value);
    }

    template <fixed_string Name, Bitfield<T> W>
    [[nodiscard]] static constexpr W with(const W& w, const value_type_of<Name>& value) {
        return detail::with_field<field_type<Name>>(w, value);
    }
};

} // namespace regbits
