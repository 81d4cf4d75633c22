#include <regbits/dynamic.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include <cstdint>
#include <gtest/gtest.h>

using namespace regbits::dynamic;

namespace {

std::shared_ptr<const Layout> control_layout() {
    auto layout = Layout::create(16,
                                 {FieldSpec::range("mode", 0, 2), FieldSpec::bit("enable", 2),
                                  FieldSpec::range("divider", 4, 12)},
                                 "Control");
    EXPECT_TRUE(layout.has_value());
    return std::make_shared<const Layout>(std::move(*layout));
}

} // namespace

TEST(RegisterValueTest, DefaultsToZero) {
    const RegisterValue reg(control_layout());
    EXPECT_EQ(reg.value(), 0u);
    EXPECT_EQ(reg.get("divider").value(), 0u);
}

TEST(RegisterValueTest, MasksRawToTheWordWidth) {
    const RegisterValue reg(control_layout(), 0x1'2345);
    EXPECT_EQ(reg.value(), 0x2345u);
}

TEST(RegisterValueTest, SetUpdatesInPlace) {
    RegisterValue reg(control_layout());
    ASSERT_TRUE(reg.set("divider", 0x7f).has_value());
    ASSERT_TRUE(reg.set("enable", 1).has_value());
    EXPECT_EQ(reg.value(), 0x07f4u);
    EXPECT_EQ(reg.get("divider").value(), 0x7fu);
    EXPECT_EQ(reg.get("enable").value(), 1u);
}

TEST(RegisterValueTest, FailedSetLeavesValueUntouched) {
    RegisterValue reg(control_layout(), 0x0abc);
    auto result = reg.set("missing", 1);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, SchemaErrorCode::unknown_field);
    EXPECT_EQ(reg.value(), 0x0abcu);
}

TEST(RegisterValueTest, WithReturnsNewValue) {
    const RegisterValue reg(control_layout(), 0x0abc);
    auto updated = reg.with("mode", 0x1);
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->value(), 0x0abdu);
    EXPECT_EQ(reg.value(), 0x0abcu);
    EXPECT_EQ(&updated->layout(), &reg.layout());

    EXPECT_FALSE(reg.with("missing", 0).has_value());
}

TEST(RegisterValueTest, EqualityUsesTheWholeWord) {
    const auto layout = control_layout();
    // Bit 3 and bits 12..16 are reserved
    EXPECT_EQ(RegisterValue(layout, 0x0001), RegisterValue(layout, 0x0001));
    EXPECT_NE(RegisterValue(layout, 0x0001), RegisterValue(layout, 0x8001));
    EXPECT_NE(RegisterValue(layout, 0x0001), RegisterValue(layout, 0x0009));
}

TEST(RegisterValueTest, DebugDump) {
    const RegisterValue reg(control_layout(), 0x8a56);
    const std::string expected = "Control { <value>: 0x8a56, mode: 2, enable: true, divider: 165 }";
    EXPECT_EQ(reg.to_string(), expected);

    std::ostringstream oss;
    oss << reg;
    EXPECT_EQ(oss.str(), expected);
}
