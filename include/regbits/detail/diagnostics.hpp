#pragma once

#include "regbits/bits.hpp"
#include "regbits/config.hpp"
#include "regbits/detail/hex.hpp"
#include "regbits/types.hpp"

#include <string_view>

#include <cstddef>
#include <cstdio>

namespace regbits::detail {

// True when `raw` has bits set at or above `width`
template <UnsignedWord S>
[[nodiscard]] constexpr bool exceeds_width(S raw, std::size_t width) noexcept {
    return width < word_bits<S> && static_cast<S>(raw >> width) != S{0};
}

/**
 * Report a setter argument that is wider than its field. The value is still
 * stored modulo 2^width; this only makes the narrowing visible.
 */
template <UnsignedWord S>
void warn_truncation(std::string_view field, S raw, std::size_t width) noexcept {
#if REGBITS_TRUNCATION_WARNINGS
    // Stack buffers only: this runs inside noexcept setters
    char raw_hex[hex_buffer_size<S>];
    char kept_hex[hex_buffer_size<S>];
    raw_hex[sizeof(raw_hex) - 1] = '\0';
    kept_hex[sizeof(kept_hex) - 1] = '\0';
    const char* raw_text = write_hex(raw, raw_hex + sizeof(raw_hex) - 1);
    const char* kept_text = write_hex(get_bits(raw, 0, width), kept_hex + sizeof(kept_hex) - 1);
    std::fprintf(stderr,
                 "WARNING: value %s exceeds the %zu-bit field '%.*s'. "
                 "Value will be wrapped modulo 2^%zu to %s.\n",
                 raw_text, width, static_cast<int>(field.size()), field.data(), width, kept_text);
#else
    (void)field;
    (void)raw;
    (void)width;
#endif
}

} // namespace regbits::detail
