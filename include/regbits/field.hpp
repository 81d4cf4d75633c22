#pragma once

#include "regbits/bits.hpp"
#include "regbits/detail/diagnostics.hpp"
#include "regbits/detail/fixed_string.hpp"
#include "regbits/types.hpp"

#include <concepts>
#include <string_view>
#include <type_traits>
#include <utility>

#include <cstddef>

namespace regbits {

// ============================================================================
// Bit range specifiers
// ============================================================================

// Single bit N, accessed as bool
template <std::size_t N>
struct Bit {
    static constexpr std::size_t lsb = N;
    static constexpr std::size_t msb = N + 1;
    static constexpr bool is_flag = true;
};

// Bits [Lsb, Msb), excluding Msb
template <std::size_t Lsb, std::size_t Msb>
struct Bits {
    static_assert(Lsb <= Msb, "inverted bit range: msb is below lsb");
    static_assert(Lsb < Msb, "empty bit range: [lsb, msb) contains no bits");

    static constexpr std::size_t lsb = Lsb;
    static constexpr std::size_t msb = Msb;
    static constexpr bool is_flag = false;
};

// Bits [Lsb, Msb], including Msb
template <std::size_t Lsb, std::size_t Msb>
struct BitsInclusive {
    static_assert(Lsb <= Msb, "inverted bit range: msb is below lsb");

    static constexpr std::size_t lsb = Lsb;
    static constexpr std::size_t msb = Msb + 1;
    static constexpr bool is_flag = false;
};

template <typename R>
concept BitRange = requires {
    { R::lsb } -> std::convertible_to<std::size_t>;
    { R::msb } -> std::convertible_to<std::size_t>;
    { R::is_flag } -> std::convertible_to<bool>;
};

// ============================================================================
// Interface <-> storage conversion
// ============================================================================

/**
 * Conversion between the storage type of a field (an unsigned word holding
 * the raw bits) and the type callers see.
 *
 * The default uses static_cast in both directions. That covers integers,
 * enums, and nested bitfields (explicit constructor from the raw word,
 * explicit conversion back). Specialize for anything else:
 *
 *   template <>
 *   struct regbits::field_conversion<Celsius, uint8_t> {
 *       static constexpr Celsius to_interface(uint8_t raw) { ... }
 *       static constexpr uint8_t to_storage(const Celsius& c) { ... }
 *   };
 *
 * The pair is trusted to round-trip every value the field can hold.
 */
template <typename Interface, typename Storage>
struct field_conversion {
    static constexpr Interface
    to_interface(Storage raw) noexcept(noexcept(static_cast<Interface>(raw)))
        requires requires { static_cast<Interface>(raw); }
    {
        return static_cast<Interface>(raw);
    }

    static constexpr Storage
    to_storage(const Interface& value) noexcept(noexcept(static_cast<Storage>(value)))
        requires requires { static_cast<Storage>(value); }
    {
        return static_cast<Storage>(value);
    }
};

template <typename Interface, typename Storage>
concept ConvertibleField = requires(Storage raw, const Interface& value) {
    { field_conversion<Interface, Storage>::to_interface(raw) } -> std::same_as<Interface>;
    { field_conversion<Interface, Storage>::to_storage(value) } -> std::same_as<Storage>;
};

// ============================================================================
// Field
// ============================================================================

namespace detail {

template <bool IsFlag, typename Storage, typename Interface, std::size_t Width>
consteval bool validate_field() {
    if constexpr (!IsFlag) {
        static_assert(UnsignedWord<Storage>, "field storage type must be an unsigned word type");
        if constexpr (UnsignedWord<Storage>) {
            static_assert(Width <= word_bits<Storage>, "field is wider than its storage type");
        }
        static_assert(ConvertibleField<Interface, Storage>,
                      "field interface type is not convertible to and from its storage type; "
                      "specialize regbits::field_conversion");
    }
    return true;
}

} // namespace detail

/**
 * Field<Name, Range, Storage, Interface>: compile-time specification of one
 * named bit range.
 *
 * - Range is Bit<N>, Bits<Lsb, Msb> or BitsInclusive<Lsb, Msb>.
 * - Storage is the unsigned word the raw bits are truncated to. It defaults to
 *   the smallest word holding the range.
 * - Interface is the type callers get and set. It defaults to Storage.
 *
 * Bit<N> fields are bool and take neither Storage nor Interface.
 *
 * Examples:
 *   Field<"mode", Bits<0, 4>>                       // uint8_t
 *   Field<"count", BitsInclusive<6, 17>, uint16_t>  // uint16_t
 *   Field<"ready", Bit<25>>                         // bool
 *   Field<"ctrl", Bits<26, 32>, uint8_t, Control>   // nested bitfield
 */
template <fixed_string Name, BitRange Range, typename Storage = void, typename Interface = Storage>
struct Field {
    static constexpr auto name = Name;
    using range = Range;

    static constexpr std::size_t lsb = Range::lsb;
    static constexpr std::size_t msb = Range::msb;
    static constexpr std::size_t width = msb - lsb;
    static constexpr bool is_flag = Range::is_flag;

    static_assert(Name.length() > 0, "field name must not be empty");
    static_assert(!is_flag || (std::is_void_v<Storage> && std::is_void_v<Interface>),
                  "Bit<N> fields are always bool; use Bits<N, N + 1> for a typed one-bit field");

    using storage_type =
        std::conditional_t<is_flag, bool,
                           std::conditional_t<std::is_void_v<Storage>, smallest_word_t<width>,
                                              Storage>>;
    using value_type =
        std::conditional_t<is_flag, bool,
                           std::conditional_t<std::is_void_v<Interface>, storage_type, Interface>>;
    using conversion = field_conversion<value_type, storage_type>;

    static_assert(detail::validate_field<is_flag, storage_type, value_type, width>());

    // True when the field can live inside a word of type T
    template <typename T>
    static consteval bool fits_in() {
        if constexpr (!UnsignedWord<T>) {
            return false;
        } else if constexpr (is_flag) {
            return msb <= word_bits<T>;
        } else {
            return msb <= word_bits<T> && word_bits<storage_type> <= word_bits<T>;
        }
    }

    // Getter computation: extract, truncate to storage, convert to interface
    template <UnsignedWord T>
    [[nodiscard]] static constexpr value_type extract(T word) noexcept(
        is_flag || noexcept(conversion::to_interface(std::declval<storage_type>()))) {
        static_assert(msb <= word_bits<T>, "field extends beyond the underlying word");
        if constexpr (is_flag) {
            return get_bit(word, lsb);
        } else {
            static_assert(word_bits<storage_type> <= word_bits<T>,
                          "field storage type is wider than the underlying word");
            const auto raw = truncate_into<storage_type>(get_bits(word, lsb, msb));
            return conversion::to_interface(raw);
        }
    }

    // With-builder computation: convert to storage, widen, replace the range.
    // Storage bits above the field width are dropped.
    template <UnsignedWord T>
    [[nodiscard]] static constexpr T insert(T word, const value_type& value) noexcept(
        is_flag || noexcept(conversion::to_storage(std::declval<const value_type&>()))) {
        static_assert(msb <= word_bits<T>, "field extends beyond the underlying word");
        if constexpr (is_flag) {
            return set_bit(word, lsb, value);
        } else {
            static_assert(word_bits<storage_type> <= word_bits<T>,
                          "field storage type is wider than the underlying word");
            const storage_type raw = conversion::to_storage(value);
            if (!std::is_constant_evaluated() && detail::exceeds_width(raw, width)) {
                detail::warn_truncation(name.view(), raw, width);
            }
            return set_bits(word, lsb, msb, zero_extend<T>(raw));
        }
    }
};

template <typename F>
concept IsField = requires {
    typename F::value_type;
    typename F::storage_type;
    { F::name.view() } -> std::convertible_to<std::string_view>;
    { F::lsb } -> std::convertible_to<std::size_t>;
    { F::msb } -> std::convertible_to<std::size_t>;
    { F::is_flag } -> std::convertible_to<bool>;
};

/**
 * Tag naming a field by type, for tag-based access:
 *
 *   static constexpr regbits::field_tag<ModeField> mode{};
 *   reg.get(Reg::mode);
 */
template <typename F>
struct field_tag {
    using type = F;
    constexpr field_tag() noexcept = default;
};

} // namespace regbits
