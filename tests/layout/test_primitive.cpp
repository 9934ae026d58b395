/**
 * @file test_primitive.cpp
 * @brief Tests for named primitive layouts
 *
 * @author LukeFrankio
 * @date 2025-10-10
 */

#include <tessera/layout/primitive.hpp>

#include <gtest/gtest.h>

using namespace tessera;
using namespace tessera::layout;

TEST(PrimitiveTest, UnsignedWidths) {
    EXPECT_EQ(*primitive_layout("bool"), Layout::fixed({1}));
    EXPECT_EQ(*primitive_layout("u8"), Layout::fixed({8}));
    EXPECT_EQ(*primitive_layout("u16"), Layout::fixed({16}));
    EXPECT_EQ(*primitive_layout("u32"), Layout::fixed({32}));
    EXPECT_EQ(*primitive_layout("u64"), Layout::fixed({64}));
    EXPECT_EQ(*primitive_layout("u128"), Layout::fixed({128}));
    EXPECT_EQ(*primitive_layout("usize"), Layout::fixed({32}));
}

TEST(PrimitiveTest, U256SpansTwoSlots) {
    EXPECT_EQ(*primitive_layout("u256"), Layout::fixed({128, 128}));
}

TEST(PrimitiveTest, FieldElementTypesUse251Bits) {
    for (const auto* name : {"i8", "i16", "i32", "i64", "i128", "felt252", "ClassHash",
                             "ContractAddress"}) {
        EXPECT_EQ(*primitive_layout(name), Layout::fixed({251})) << name;
    }
    EXPECT_EQ(*primitive_layout("EthAddress"), Layout::fixed({160}));
}

TEST(PrimitiveTest, UnknownNames) {
    EXPECT_EQ(primitive_layout("u512").error().code, ErrorCode::LAYOUT_UNKNOWN_PRIMITIVE);
    EXPECT_EQ(primitive_layout("U8").error().code, ErrorCode::LAYOUT_UNKNOWN_PRIMITIVE);
    EXPECT_FALSE(is_primitive(""));
    EXPECT_TRUE(is_primitive("felt252"));
}

TEST(PrimitiveTest, TableIsConsistent) {
    EXPECT_EQ(primitives().size(), 17u);
    for (const auto& primitive : primitives()) {
        EXPECT_TRUE(is_primitive(primitive.name));
        const auto layout = primitive_layout(primitive.name);
        ASSERT_TRUE(layout.has_value());
        EXPECT_TRUE(layout->validate(4096).has_value()) << primitive.name;
    }
}
