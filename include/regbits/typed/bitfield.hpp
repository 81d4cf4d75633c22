#pragma once

#include "regbits/detail/field_list.hpp"
#include "regbits/field.hpp"
#include "regbits/types.hpp"

#include <concepts>
#include <type_traits>

namespace regbits {

/**
 * Capability shared by every bitfield wrapper over an underlying word T:
 * lossless conversion from and to T, equality, copy and a default value.
 *
 * Register<> types satisfy it. AccessorSet<T, ...> accessors work on any
 * type that does, so hand-written wrappers can opt in as well.
 */
template <typename W, typename T>
concept Bitfield = UnsignedWord<T> && std::default_initializable<W> && std::copyable<W> &&
                   std::equality_comparable<W> && std::constructible_from<W, T> &&
                   requires(const W& w) {
                       { w.value() } -> std::same_as<T>;
                   };

// Construct a bitfield from its underlying representation
template <typename W, UnsignedWord T>
    requires Bitfield<W, T>
[[nodiscard]] constexpr W make(T raw) noexcept(std::is_nothrow_constructible_v<W, T>) {
    return W(raw);
}

// Unwrap a bitfield into its underlying representation
template <typename W>
[[nodiscard]] constexpr auto value_of(const W& w) noexcept(noexcept(w.value()))
    -> decltype(w.value()) {
    return w.value();
}

namespace detail {

// Accessor bodies shared by Register and AccessorSet. Setters always go
// through with_field() so the two cannot drift apart.

template <typename F, typename W>
[[nodiscard]] constexpr typename F::value_type get_field(const W& w) {
    return F::extract(w.value());
}

template <typename F, typename W>
[[nodiscard]] constexpr W with_field(const W& w, const typename F::value_type& value) {
    return W(F::insert(w.value(), value));
}

template <typename F, typename W>
constexpr void set_field(W& w, const typename F::value_type& value) {
    w = with_field<F>(w, value);
}

template <typename T, typename... Fs>
consteval bool all_fields_fit(field_list<Fs...>) {
    return (Fs::template fits_in<T>() && ...);
}

template <typename... Fs>
consteval bool all_are_fields(field_list<Fs...>) {
    return (IsField<Fs> && ...);
}

} // namespace detail

} // namespace regbits
