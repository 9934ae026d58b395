/**
 * @file test_serialization.cpp
 * @brief Tests for layout word encoding and YAML conversion
 *
 * @author LukeFrankio
 * @date 2025-10-12
 */

#include <tessera/layout/serialization.hpp>
#include <tessera/layout/primitive.hpp>
#include <tessera/core/hash.hpp>

#include <gtest/gtest.h>

#include <yaml-cpp/yaml.h>

using namespace tessera;
using namespace tessera::layout;

namespace {

auto selector(std::string_view name) -> Word {
    return *hash::selector_from_name(name);
}

/// One of every layout variant, nested.
auto kitchen_sink() -> Layout {
    return Layout::structure({
        FieldLayout{selector("id"), Layout::fixed({251})},
        FieldLayout{selector("pair"), Layout::tuple({Layout::fixed({8}), Layout::fixed({128, 128})})},
        FieldLayout{selector("scores"), Layout::array(Layout::fixed({32}))},
        FieldLayout{selector("grid"), Layout::fixed_array(Layout::fixed({1}), 4)},
        FieldLayout{selector("name"), Layout::byte_array()},
        FieldLayout{selector("state"), Layout::enumeration({
            FieldLayout{Word{0}, Layout::fixed({})},
            FieldLayout{Word{3}, Layout::array(Layout::byte_array())},
        })},
    });
}

} // anonymous namespace

// ========== Word Encoding ==========

TEST(LayoutEncodingTest, FixedEncoding) {
    const auto words = encode_layout(Layout::fixed({8, 16}));
    EXPECT_EQ(words, (std::vector<Word>{1, 2, 8, 16}));
}

TEST(LayoutEncodingTest, ArrayAndByteArrayEncoding) {
    EXPECT_EQ(encode_layout(Layout::array(Layout::byte_array())), (std::vector<Word>{4, 5}));
    EXPECT_EQ(encode_layout(Layout::fixed_array(Layout::fixed({1}), 3)),
              (std::vector<Word>{7, 3, 1, 1, 1}));
}

TEST(LayoutEncodingTest, RoundTrip) {
    const auto layout = kitchen_sink();
    const auto decoded = decode_layout(encode_layout(layout));
    ASSERT_TRUE(decoded.has_value()) << decoded.error().what();
    EXPECT_EQ(*decoded, layout);
}

TEST(LayoutEncodingTest, RejectsTruncatedInput) {
    auto words = encode_layout(kitchen_sink());
    words.pop_back();
    EXPECT_EQ(decode_layout(words).error().code, ErrorCode::LAYOUT_DECODE_FAILED);
    EXPECT_EQ(decode_layout(std::vector<Word>{}).error().code, ErrorCode::LAYOUT_DECODE_FAILED);
}

TEST(LayoutEncodingTest, RejectsTrailingWords) {
    auto words = encode_layout(Layout::fixed({8}));
    words.emplace_back(0);
    EXPECT_EQ(decode_layout(words).error().code, ErrorCode::LAYOUT_DECODE_FAILED);
}

TEST(LayoutEncodingTest, RejectsUnknownVariant) {
    EXPECT_EQ(decode_layout(std::vector<Word>{8}).error().code, ErrorCode::LAYOUT_DECODE_FAILED);
    EXPECT_EQ(decode_layout(std::vector<Word>{0}).error().code, ErrorCode::LAYOUT_DECODE_FAILED);
}

TEST(LayoutEncodingTest, RejectsHugeCounts) {
    // Fixed claiming a million sizes with none present
    EXPECT_EQ(decode_layout(std::vector<Word>{1, 1'000'000}).error().code,
              ErrorCode::LAYOUT_DECODE_FAILED);
}

TEST(LayoutEncodingTest, RejectsInvalidInvariants) {
    // Enum with two variants tagged 1
    const std::vector<Word> words{6, 2, 1, 1, 0, 1, 1, 0};
    EXPECT_EQ(decode_layout(words).error().code, ErrorCode::LAYOUT_DUPLICATE_SELECTOR);

    // Fixed with a zero-bit field
    EXPECT_EQ(decode_layout(std::vector<Word>{1, 1, 0}).error().code,
              ErrorCode::LAYOUT_INVALID_FIELD_SIZE);
}

TEST(LayoutEncodingTest, RejectsExcessiveNesting) {
    std::vector<Word> words;
    for (u32 i = 0; i <= MAX_LAYOUT_DEPTH + 1; ++i) {
        words.emplace_back(4);  // Array(...)
    }
    words.emplace_back(5);
    EXPECT_EQ(decode_layout(words).error().code, ErrorCode::LAYOUT_DECODE_FAILED);
}

// ========== YAML ==========

TEST(LayoutYamlTest, ParsesEveryVariant) {
    const auto layout = parse_layout_yaml(R"(
struct:
  - name: id
    layout: { primitive: felt252 }
  - name: pair
    layout:
      tuple:
        - { fixed: [8] }
        - { primitive: u256 }
  - name: scores
    layout: { array: { fixed: [32] } }
  - name: grid
    layout: { fixed_array: { item: { primitive: bool }, count: 4 } }
  - name: name
    layout: { byte_array: true }
  - name: state
    layout:
      enum:
        - tag: 0
        - tag: 3
          layout: { array: { byte_array: true } }
)");
    ASSERT_TRUE(layout.has_value()) << layout.error().what();
    EXPECT_EQ(*layout, kitchen_sink());
}

TEST(LayoutYamlTest, RoundTrip) {
    const auto layout = kitchen_sink();
    const auto text = layout_to_yaml_string(layout);
    const auto parsed = parse_layout_yaml(text);
    ASSERT_TRUE(parsed.has_value()) << parsed.error().what() << "\n" << text;
    EXPECT_EQ(*parsed, layout);
}

TEST(LayoutYamlTest, SelectorsByHex) {
    const auto layout = parse_layout_yaml(R"(
struct:
  - selector: "0x2a"
    layout: { fixed: [8] }
)");
    ASSERT_TRUE(layout.has_value()) << layout.error().what();
    ASSERT_NE(layout->member(Word{42}), nullptr);
}

TEST(LayoutYamlTest, RejectsMalformedNodes) {
    EXPECT_EQ(parse_layout_yaml("fixed: 8").error().code, ErrorCode::LAYOUT_INVALID_YAML);
    EXPECT_EQ(parse_layout_yaml("[1, 2]").error().code, ErrorCode::LAYOUT_INVALID_YAML);
    EXPECT_EQ(parse_layout_yaml("mystery: true").error().code, ErrorCode::LAYOUT_INVALID_YAML);
    EXPECT_EQ(parse_layout_yaml("struct: [{ layout: { fixed: [8] } }]").error().code,
              ErrorCode::LAYOUT_INVALID_YAML);
    EXPECT_EQ(parse_layout_yaml("enum: [{ layout: { fixed: [8] } }]").error().code,
              ErrorCode::LAYOUT_INVALID_YAML);
    EXPECT_EQ(parse_layout_yaml("fixed_array: { count: 2 }").error().code,
              ErrorCode::LAYOUT_INVALID_YAML);
    EXPECT_EQ(parse_layout_yaml("struct: [unclosed").error().code, ErrorCode::LAYOUT_INVALID_YAML);
}

TEST(LayoutYamlTest, RejectsBadValues) {
    EXPECT_EQ(parse_layout_yaml("fixed: [300]").error().code, ErrorCode::LAYOUT_INVALID_FIELD_SIZE);
    EXPECT_EQ(parse_layout_yaml("fixed: [eight]").error().code, ErrorCode::LAYOUT_INVALID_YAML);
    EXPECT_EQ(parse_layout_yaml("primitive: u7").error().code, ErrorCode::LAYOUT_UNKNOWN_PRIMITIVE);
    EXPECT_EQ(parse_layout_yaml("enum: [{ tag: 256 }]").error().code,
              ErrorCode::LAYOUT_INVALID_VARIANT_TAG);
}

TEST(LayoutYamlTest, EmitsReadableKeys) {
    const auto node = layout_to_yaml(Layout::fixed_array(Layout::byte_array(), 2));
    ASSERT_TRUE(node["fixed_array"]);
    EXPECT_EQ(node["fixed_array"]["count"].as<u32>(), 2u);
    EXPECT_TRUE(node["fixed_array"]["item"]["byte_array"].as<bool>());
}
