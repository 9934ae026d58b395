/**
 * @file test_word.cpp
 * @brief Tests for the 256-bit storage word
 *
 * @author LukeFrankio
 * @date 2025-10-09
 */

#include <tessera/core/word.hpp>

#include <gtest/gtest.h>

#include <unordered_set>

using namespace tessera;

// ========== Construction and Hex ==========

TEST(WordTest, DefaultIsZero) {
    const Word word;
    EXPECT_TRUE(word.is_zero());
    EXPECT_EQ(word.to_hex(), "0x0");
    EXPECT_EQ(word.bit_width(), 0u);
}

TEST(WordTest, HexRoundTrip) {
    const auto word = Word::from_hex("0x1234abcd00000000000000000000000000000001");
    ASSERT_TRUE(word.has_value());
    EXPECT_EQ(word->to_hex(), "0x1234abcd00000000000000000000000000000001");

    const auto upper = Word::from_hex("FF");
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(*upper, Word{255});
}

TEST(WordTest, HexRejectsBadInput) {
    EXPECT_EQ(Word::from_hex("").error().code, ErrorCode::CORE_INVALID_HEX);
    EXPECT_EQ(Word::from_hex("0x").error().code, ErrorCode::CORE_INVALID_HEX);
    EXPECT_EQ(Word::from_hex("0xZZ").error().code, ErrorCode::CORE_INVALID_HEX);
    EXPECT_EQ(Word::from_hex(std::string(65, '1')).error().code, ErrorCode::CORE_INVALID_HEX);
}

TEST(WordTest, BigEndianBytesRoundTrip) {
    const auto word = Word::from_limbs({1, 2, 3, 0x0400000000000000ULL});
    const auto bytes = word.to_bytes_be();
    EXPECT_EQ(bytes[0], 0x04);
    EXPECT_EQ(bytes[31], 0x01);
    EXPECT_EQ(Word::from_bytes_be(bytes), word);
}

// ========== Arithmetic ==========

TEST(WordTest, MaskAndBitWidth) {
    EXPECT_EQ(Word::mask(0), Word{});
    EXPECT_EQ(Word::mask(8), Word{0xFF});
    EXPECT_EQ(Word::mask(251).bit_width(), 251u);
    EXPECT_EQ(Word::mask(300), ~Word{});
    EXPECT_EQ(Word{1}.bit_width(), 1u);
    EXPECT_EQ((Word{1} << 200).bit_width(), 201u);
}

TEST(WordTest, ShiftsCrossLimbs) {
    const Word one = 1;
    EXPECT_EQ(one << 64, Word::from_limbs({0, 1, 0, 0}));
    EXPECT_EQ((one << 130) >> 130, one);
    EXPECT_EQ(Word::from_limbs({0, 0x8000000000000000ULL, 0, 0}) >> 1,
              Word::from_limbs({0, 0x4000000000000000ULL, 0, 0}));
    EXPECT_EQ(one << 256, Word{});
    EXPECT_EQ(one >> 1, Word{});
}

TEST(WordTest, AdditionCarriesAndWraps) {
    EXPECT_EQ(Word{~0ULL} + Word{1}, Word::from_limbs({0, 1, 0, 0}));
    EXPECT_EQ(~Word{} + Word{1}, Word{});
    EXPECT_EQ(Word{40} + Word{2}, Word{42});
}

TEST(WordTest, Ordering) {
    EXPECT_LT(Word{1}, Word{2});
    EXPECT_LT(Word{~0ULL}, Word{1} << 64);
    EXPECT_GT(Word{1} << 255, Word::mask(255));
}

TEST(WordTest, UsableAsHashKey) {
    std::unordered_set<Word> set{Word{1}, Word{1} << 64, Word{1}};
    EXPECT_EQ(set.size(), 2u);
    EXPECT_TRUE(set.contains(Word{1} << 64));
}
