#pragma once

#include <string_view>

#include <cstddef>

namespace regbits {

/**
 * Compile-time string usable as a non-type template parameter.
 * Field names are fixed_strings so accessors can be looked up by name:
 *
 *   reg.get<"enable">();
 */
template <std::size_t N>
struct fixed_string {
    char chars[N]{};

    constexpr fixed_string(const char (&s)[N]) noexcept {
        for (std::size_t i = 0; i < N; ++i) {
            chars[i] = s[i];
        }
    }

    // Length without the terminating '\0'
    [[nodiscard]] static constexpr std::size_t length() noexcept { return N ? N - 1 : 0; }

    [[nodiscard]] constexpr const char* c_str() const noexcept { return chars; }

    [[nodiscard]] constexpr std::string_view view() const noexcept {
        return std::string_view{chars, length()};
    }

    constexpr char operator[](std::size_t i) const noexcept { return chars[i]; }
};

template <std::size_t N1, std::size_t N2>
constexpr bool operator==(const fixed_string<N1>& a, const fixed_string<N2>& b) noexcept {
    if constexpr (N1 != N2) {
        return false;
    } else {
        for (std::size_t i = 0; i < N1; ++i) {
            if (a.chars[i] != b.chars[i]) {
                return false;
            }
        }
        return true;
    }
}

} // namespace regbits
