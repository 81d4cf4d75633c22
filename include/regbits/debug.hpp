#pragma once

#include "regbits/detail/hex.hpp"
#include "regbits/types.hpp"

#include <concepts>
#include <ostream>
#include <string_view>
#include <type_traits>

namespace regbits {

// Marks a word to be printed in hex by DebugStruct (used for raw values)
template <UnsignedWord T>
struct hex_value {
    T value;
};

namespace detail {

template <typename V>
concept Streamable = requires(std::ostream& os, const V& v) {
    { os << v } -> std::convertible_to<std::ostream&>;
};

template <typename V>
void write_debug_value(std::ostream& os, const V& value) {
    if constexpr (std::is_same_v<V, bool>) {
        os << (value ? "true" : "false");
    } else if constexpr (UnsignedWord<V>) {
        os << to_decimal(value);
    } else if constexpr (std::is_enum_v<V>) {
        write_debug_value(os, static_cast<std::underlying_type_t<V>>(value));
    } else if constexpr (std::integral<V>) {
        os << static_cast<long long>(value);
    } else if constexpr (Streamable<V>) {
        os << value;
    } else {
        os << "<opaque>";
    }
}

template <UnsignedWord T>
void write_debug_value(std::ostream& os, const hex_value<T>& value) {
    os << to_hex(value.value);
}

} // namespace detail

/**
 * Builder for the structured dump of a bitfield:
 *
 *   Name { <value>: 0x1f, enable: true, mode: 3 }
 *
 * Used by the generated operator<< and by hand-written format_debug()
 * overrides.
 */
class DebugStruct {
public:
    DebugStruct(std::ostream& os, std::string_view type_name) : os_(os) {
        os_ << type_name << " {";
    }

    DebugStruct(const DebugStruct&) = delete;
    DebugStruct& operator=(const DebugStruct&) = delete;

    template <typename V>
    DebugStruct& field(std::string_view name, const V& value) {
        os_ << (empty_ ? " " : ", ") << name << ": ";
        detail::write_debug_value(os_, value);
        empty_ = false;
        return *this;
    }

    void finish() { os_ << (empty_ ? "}" : " }"); }

private:
    std::ostream& os_;
    bool empty_{true};
};

} // namespace regbits
