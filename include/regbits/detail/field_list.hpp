#pragma once

#include "regbits/detail/fixed_string.hpp"

#include <type_traits>

#include <cstddef>

namespace regbits::detail {

// Ordered list of field types
template <typename... Fields>
struct field_list {
    static constexpr std::size_t size = sizeof...(Fields);
};

template <typename... Lists>
struct concat_fields;

template <>
struct concat_fields<> {
    using type = field_list<>;
};

template <typename... Fs>
struct concat_fields<field_list<Fs...>> {
    using type = field_list<Fs...>;
};

template <typename... As, typename... Bs, typename... Rest>
struct concat_fields<field_list<As...>, field_list<Bs...>, Rest...> {
    using type = typename concat_fields<field_list<As..., Bs...>, Rest...>::type;
};

// An entry of a register declaration is either a single field or a bundle
// exposing `using fields = field_list<...>` (an AccessorSet).
template <typename Entry>
struct entry_fields {
    using type = field_list<Entry>;
};

template <typename Entry>
    requires requires { typename Entry::fields; }
struct entry_fields<Entry> {
    using type = typename Entry::fields;
};

template <typename... Entries>
using flatten_fields_t = typename concat_fields<typename entry_fields<Entries>::type...>::type;

inline constexpr std::size_t npos = static_cast<std::size_t>(-1);

// Index of the field named Name, or npos
template <fixed_string Name, typename List>
struct find_field;

template <fixed_string Name>
struct find_field<Name, field_list<>> : std::integral_constant<std::size_t, npos> {};

template <fixed_string Name, typename F, typename... Rest>
struct find_field<Name, field_list<F, Rest...>>
    : std::integral_constant<std::size_t,
                             (F::name == Name)
                                 ? 0
                                 : (find_field<Name, field_list<Rest...>>::value == npos
                                        ? npos
                                        : 1 + find_field<Name, field_list<Rest...>>::value)> {};

template <fixed_string Name, typename List>
inline constexpr std::size_t find_field_v = find_field<Name, List>::value;

// Field at index I
template <std::size_t I, typename List>
struct field_at;

template <typename F, typename... Rest>
struct field_at<0, field_list<F, Rest...>> {
    using type = F;
};

template <std::size_t I, typename F, typename... Rest>
struct field_at<I, field_list<F, Rest...>> {
    using type = typename field_at<I - 1, field_list<Rest...>>::type;
};

template <std::size_t I, typename List>
using field_at_t = typename field_at<I, List>::type;

// Field named Name, with a readable error when it does not exist
template <fixed_string Name, typename List>
struct lookup_field {
    static constexpr std::size_t index = find_field_v<Name, List>;
    static_assert(index != npos, "no field with this name in the bitfield");
    using type = field_at_t<(index == npos ? 0 : index), List>;
};

template <typename F, typename List>
struct contains_field;

template <typename F, typename... Fs>
struct contains_field<F, field_list<Fs...>> : std::bool_constant<(std::is_same_v<F, Fs> || ...)> {
};

template <typename F, typename List>
inline constexpr bool contains_field_v = contains_field<F, List>::value;

// Number of fields named Name
template <fixed_string Name, typename List>
struct count_name;

template <fixed_string Name, typename... Fs>
struct count_name<Name, field_list<Fs...>>
    : std::integral_constant<std::size_t, ((Fs::name == Name ? 1 : 0) + ... + 0)> {};

template <typename List>
struct all_unique_names;

template <typename... Fs>
struct all_unique_names<field_list<Fs...>>
    : std::bool_constant<((count_name<Fs::name, field_list<Fs...>>::value == 1) && ...)> {};

template <typename List>
inline constexpr bool all_unique_names_v = all_unique_names<List>::value;

} // namespace regbits::detail
