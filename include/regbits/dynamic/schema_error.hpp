#pragma once

#include "regbits/expected.hpp"

#include <string>
#include <utility>

#include <cstddef>
#include <cstdint>

namespace regbits::dynamic {

/**
 * @brief Reasons a runtime schema or field lookup is rejected
 *
 * Typed registers report the same problems at compile time.
 */
enum class SchemaErrorCode : uint8_t {
    unsupported_width, ///< Word width is not 8, 16, 32 or 64
    empty_name,        ///< Field name is empty
    duplicate_name,    ///< Two fields share a name
    empty_range,       ///< Range [lsb, msb) contains no bits
    inverted_range,    ///< msb is below lsb
    out_of_bounds,     ///< Range extends beyond the word width
    flag_width,        ///< Flag field is not exactly one bit wide
    unknown_field      ///< No field with the requested name
};

[[nodiscard]] constexpr const char* schema_error_string(SchemaErrorCode code) noexcept {
    switch (code) {
        case SchemaErrorCode::unsupported_width:
            return "Unsupported word width";
        case SchemaErrorCode::empty_name:
            return "Field name is empty";
        case SchemaErrorCode::duplicate_name:
            return "Duplicate field name";
        case SchemaErrorCode::empty_range:
            return "Empty bit range";
        case SchemaErrorCode::inverted_range:
            return "Inverted bit range";
        case SchemaErrorCode::out_of_bounds:
            return "Bit range exceeds the word width";
        case SchemaErrorCode::flag_width:
            return "Flag field must be one bit wide";
        case SchemaErrorCode::unknown_field:
            return "Unknown field name";
    }
    return "Unknown schema error";
}

/**
 * @brief Error information from a rejected schema or lookup
 *
 * field_index is npos when the error is not tied to a declared field
 * (an unsupported width, or a lookup by unknown name).
 */
struct SchemaError {
    static constexpr std::size_t npos = static_cast<std::size_t>(-1);

    SchemaErrorCode code;
    std::size_t field_index{npos}; ///< Position in the field list passed to create()
    std::string field_name{};      ///< Offending or requested name

    [[nodiscard]] const char* message() const noexcept { return schema_error_string(code); }

    // Message with the field context, e.g. "Duplicate field name: 'mode' (field 3)"
    [[nodiscard]] std::string describe() const {
        std::string text = message();
        if (!field_name.empty()) {
            text += ": '" + field_name + "'";
        }
        if (field_index != npos) {
            text += " (field " + std::to_string(field_index) + ")";
        }
        return text;
    }

    bool operator==(const SchemaError&) const = default;
};

/**
 * @brief Result type for runtime schema operations
 *
 * Usage:
 * @code
 *   auto layout = Layout::create(8, specs);
 *   if (!layout) {
 *       std::cerr << layout.error().describe() << "\n";
 *   }
 * @endcode
 */
template <typename T>
using SchemaResult = expected<T, SchemaError>;

inline auto make_schema_error(SchemaErrorCode code, std::size_t index = SchemaError::npos,
                              std::string name = {}) {
    return make_unexpected(
        SchemaError{.code = code, .field_index = index, .field_name = std::move(name)});
}

} // namespace regbits::dynamic
