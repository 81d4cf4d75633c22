#pragma once

#include "regbits/dynamic/layout.hpp"
#include "regbits/dynamic/schema_error.hpp"
#include "regbits/expected.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

#include <cstdint>

namespace regbits::dynamic {

/**
 * @brief A raw word bound to a runtime layout
 *
 * The runtime counterpart of a typed register value. The layout is shared,
 * so copies are cheap and every value of one schema points at the same
 * descriptor table.
 *
 * Usage:
 * @code
 *   auto layout = Layout::create(8, {FieldSpec::range("a", 0, 4),
 *                                    FieldSpec::bit("b", 4)});
 *   RegisterValue reg(std::make_shared<const Layout>(*layout), 0b1011'0110);
 *   auto a = reg.get("a");   // 0b0110
 * @endcode
 */
class RegisterValue {
public:
    // raw is masked to the layout word width
    explicit RegisterValue(std::shared_ptr<const Layout> layout, uint64_t raw = 0)
        : layout_(std::move(layout)),
          raw_(raw & layout_->word_mask()) {}

    [[nodiscard]] uint64_t value() const noexcept { return raw_; }

    [[nodiscard]] const Layout& layout() const noexcept { return *layout_; }

    [[nodiscard]] const std::shared_ptr<const Layout>& shared_layout() const noexcept {
        return layout_;
    }

    [[nodiscard]] SchemaResult<uint64_t> get(std::string_view name) const {
        return layout_->get(raw_, name);
    }

    // Leaves the value untouched on error
    SchemaResult<void> set(std::string_view name, uint64_t field_value) {
        auto updated = layout_->with(raw_, name, field_value);
        if (!updated) {
            return make_unexpected(std::move(updated.error()));
        }
        raw_ = *updated;
        return {};
    }

    [[nodiscard]] SchemaResult<RegisterValue> with(std::string_view name,
                                                   uint64_t field_value) const {
        return layout_->with(raw_, name, field_value).map([this](uint64_t raw) {
            return RegisterValue(layout_, raw);
        });
    }

    [[nodiscard]] std::string to_string() const { return layout_->format(raw_); }

    friend std::ostream& operator<<(std::ostream& os, const RegisterValue& reg) {
        reg.layout_->format(os, reg.raw_);
        return os;
    }

    // Equality of the full raw word, reserved bits included
    friend bool operator==(const RegisterValue& a, const RegisterValue& b) noexcept {
        return a.raw_ == b.raw_;
    }

private:
    std::shared_ptr<const Layout> layout_;
    uint64_t raw_;
};

} // namespace regbits::dynamic
