/**
 * @file test_packing.cpp
 * @brief Tests for the greedy bit-packing codec
 *
 * @author LukeFrankio
 * @date 2025-10-10
 */

#include <tessera/layout/packing.hpp>

#include <gtest/gtest.h>

#include <vector>

using namespace tessera;
using namespace tessera::layout;

TEST(PackingTest, SmallFieldsShareOneWord) {
    const std::vector<u8> sizes{8, 8, 16};
    const auto packed = pack(std::vector<Word>{0x12, 0x34, 0x5678}, sizes);
    ASSERT_TRUE(packed.has_value()) << packed.error().what();
    ASSERT_EQ(packed->size(), 1u);
    EXPECT_EQ((*packed)[0], Word{0x56783412});
    EXPECT_EQ(*packed_size(sizes), 1u);
}

TEST(PackingTest, FieldThatDoesNotFitStartsNewWord) {
    // 128 + 128 > 251, so the second half of a u256 gets its own word
    const std::vector<u8> sizes{128, 128};
    const std::vector<Word> values{Word{1} << 127, Word{7}};
    const auto packed = pack(values, sizes);
    ASSERT_TRUE(packed.has_value());
    ASSERT_EQ(packed->size(), 2u);
    EXPECT_EQ((*packed)[0], Word{1} << 127);
    EXPECT_EQ((*packed)[1], Word{7});
    EXPECT_EQ(*packed_size(sizes), 2u);
}

TEST(PackingTest, ExactFitStaysInOneWord) {
    const std::vector<u8> sizes{250, 1};
    EXPECT_EQ(*packed_size(sizes), 1u);

    const auto packed = pack(std::vector<Word>{Word::mask(250), 1}, sizes);
    ASSERT_TRUE(packed.has_value());
    ASSERT_EQ(packed->size(), 1u);
    EXPECT_EQ((*packed)[0], Word::mask(251));
}

TEST(PackingTest, RoundTripMixedWidths) {
    const std::vector<u8> sizes{1, 251, 64, 32, 160, 8, 128};
    const std::vector<Word> values{
        1, Word::mask(251), 0xDEADBEEFCAFEBABEULL, 0x12345678, Word::mask(160), 0xFF, Word{1} << 100,
    };
    const auto packed = pack(values, sizes);
    ASSERT_TRUE(packed.has_value()) << packed.error().what();
    EXPECT_EQ(packed->size(), *packed_size(sizes));

    const auto unpacked = unpack(*packed, sizes);
    ASSERT_TRUE(unpacked.has_value()) << unpacked.error().what();
    EXPECT_EQ(*unpacked, values);
}

TEST(PackingTest, PackedWordsStayBelow251Bits) {
    const std::vector<u8> sizes{200, 51, 100, 100, 51};
    const std::vector<Word> values{
        Word::mask(200), Word::mask(51), Word::mask(100), Word::mask(100), Word::mask(51),
    };
    const auto packed = pack(values, sizes);
    ASSERT_TRUE(packed.has_value());
    for (const auto& word : *packed) {
        EXPECT_LE(word.bit_width(), PACKING_MAX_BITS);
    }
}

TEST(PackingTest, EmptySizesPackToNothing) {
    EXPECT_EQ(*packed_size({}), 0u);
    const auto packed = pack({}, {});
    ASSERT_TRUE(packed.has_value());
    EXPECT_TRUE(packed->empty());
    const auto unpacked = unpack({}, {});
    ASSERT_TRUE(unpacked.has_value());
    EXPECT_TRUE(unpacked->empty());
}

// ========== Errors ==========

TEST(PackingTest, RejectsInvalidSizes) {
    EXPECT_EQ(packed_size(std::vector<u8>{252}).error().code, ErrorCode::PACKING_INVALID_SIZE);
    EXPECT_EQ(packed_size(std::vector<u8>{8, 0}).error().code, ErrorCode::PACKING_INVALID_SIZE);
    EXPECT_EQ(pack(std::vector<Word>{1}, std::vector<u8>{255}).error().code,
              ErrorCode::PACKING_INVALID_SIZE);
}

TEST(PackingTest, RejectsValueOutOfRange) {
    EXPECT_EQ(pack(std::vector<Word>{256}, std::vector<u8>{8}).error().code,
              ErrorCode::PACKING_VALUE_OUT_OF_RANGE);
    EXPECT_EQ(pack(std::vector<Word>{2}, std::vector<u8>{1}).error().code,
              ErrorCode::PACKING_VALUE_OUT_OF_RANGE);
}

TEST(PackingTest, RejectsLengthMismatch) {
    EXPECT_EQ(pack(std::vector<Word>{1, 2}, std::vector<u8>{8}).error().code,
              ErrorCode::PACKING_LENGTH_MISMATCH);
}

TEST(PackingTest, RejectsWrongWordCount) {
    const std::vector<u8> sizes{128, 128};
    EXPECT_EQ(unpack(std::vector<Word>{1}, sizes).error().code,
              ErrorCode::PACKING_WORD_COUNT_MISMATCH);
    EXPECT_EQ(unpack(std::vector<Word>{1, 2, 3}, sizes).error().code,
              ErrorCode::PACKING_WORD_COUNT_MISMATCH);
}
