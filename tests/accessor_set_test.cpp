#include "example_registers.hpp"

#include <regbits/typed.hpp>

#include <cstdint>
#include <gtest/gtest.h>

using namespace regbits_test;

namespace {

// Bitfield written by hand, without Register<>: opts into the capability
class RawWord {
public:
    constexpr RawWord() = default;
    constexpr explicit RawWord(uint32_t raw) : raw_(raw) {}

    [[nodiscard]] constexpr uint32_t value() const { return raw_; }

    friend constexpr bool operator==(const RawWord&, const RawWord&) = default;

private:
    uint32_t raw_{0};
};

template <regbits::fixed_string Name, typename W>
constexpr bool has_field = regbits::detail::find_field_v<Name, typename W::fields> !=
                           regbits::detail::npos;

} // namespace

static_assert(regbits::Bitfield<RawWord, uint32_t>);

static_assert(CommonFields::is_attached_to<SomeFields>);
static_assert(CommonFields::is_attached_to<OtherFields>);
static_assert(!CommonFields::is_attached_to<Example>);
static_assert(!CommonFields::is_attached_to<RawWord>);

// Each register only gains its own fields beside the shared ones
static_assert(has_field<"y", SomeFields> && !has_field<"z", SomeFields>);
static_assert(has_field<"z", OtherFields> && !has_field<"y", OtherFields>);
static_assert(has_field<"a", SomeFields> && has_field<"a", OtherFields>);

TEST(AccessorSetTest, SharedFieldsOnEveryAttachedRegister) {
    const SomeFields f(0xabcd'1234);
    EXPECT_EQ(f.get<"a">(), 0x34);
    EXPECT_TRUE(f.get<"y">());
    EXPECT_FALSE(f.get<"x">());

    const OtherFields g(0xabcd'1234);
    EXPECT_EQ(g.get<"a">(), 0x34);
    EXPECT_FALSE(g.get<"z">());
    EXPECT_TRUE(g.get<"q">());
}

TEST(AccessorSetTest, SharedFieldsReadTheSameBits) {
    const SomeFields f(0xabcd'1234);
    const OtherFields g(0xabcd'1234);
    EXPECT_EQ(f.get<"a">(), g.get<"a">());
    EXPECT_EQ(f.get<"b">(), g.get<"b">());
    EXPECT_EQ(f.get<"c">(), g.get<"c">());
    EXPECT_EQ(f.get<"c">(), 0x2af3);
}

TEST(AccessorSetTest, StaticAccessorsMatchMemberAccessors) {
    SomeFields f(0xabcd'1234);
    EXPECT_EQ(CommonFields::get<"a">(f), f.get<"a">());

    CommonFields::set<"a">(f, 0x2a);
    EXPECT_EQ(f.get<"a">(), 0x2a);

    const SomeFields h = CommonFields::with<"b">(f, true);
    EXPECT_TRUE(h.get<"b">());
    EXPECT_EQ(h.value() & ~(uint32_t{1} << 14), f.value() & ~(uint32_t{1} << 14));
}

TEST(AccessorSetTest, StaticAccessorsWorkOnAnyBitfield) {
    RawWord w(0xabcd'1234);
    EXPECT_EQ(CommonFields::get<"a">(w), 0x34);
    EXPECT_EQ(CommonFields::get<"c">(w), 0x2af3);

    CommonFields::set<"c">(w, 0);
    EXPECT_EQ(w.value(), 0x0003'1234u);

    const RawWord v = CommonFields::with<"a">(RawWord{}, 0x3f);
    EXPECT_EQ(v.value(), 0x3fu);
}
