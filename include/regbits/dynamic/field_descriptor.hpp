#pragma once

#include <string>

#include <cstddef>
#include <cstdint>

namespace regbits::dynamic {

enum class FieldKind : uint8_t {
    flag,        ///< Single bit read as bool
    unsigned_int ///< Bit range read as an unsigned integer
};

[[nodiscard]] constexpr const char* field_kind_string(FieldKind kind) noexcept {
    switch (kind) {
        case FieldKind::flag:
            return "flag";
        case FieldKind::unsigned_int:
            return "unsigned_int";
    }
    return "unknown";
}

/**
 * A validated field: name and half-open bit range [lsb, msb).
 *
 * Produced by Layout::create() for runtime schemas and by
 * Register::descriptors() for typed ones.
 */
struct FieldDescriptor {
    std::string name;
    std::size_t lsb{0};
    std::size_t msb{0}; ///< Exclusive
    FieldKind kind{FieldKind::unsigned_int};

    [[nodiscard]] std::size_t width() const noexcept { return msb - lsb; }

    [[nodiscard]] bool overlaps(const FieldDescriptor& other) const noexcept {
        return lsb < other.msb && other.lsb < msb;
    }

    bool operator==(const FieldDescriptor&) const = default;
};

} // namespace regbits::dynamic
