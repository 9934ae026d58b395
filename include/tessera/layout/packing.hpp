/**
 * @file packing.hpp
 * @brief Bit-packing codec for statically fixed-size layouts
 *
 * Packed models trade member addressability for slot density: all their
 * sub-word fields are bin-packed into as few words as possible.
 *
 * Algorithm (greedy, fields never split):
 * @code
 * acc = 0, offset = 0
 * for (value, size):
 *     if offset + size > 251: flush acc, acc = 0, offset = 0
 *     acc |= value << offset
 *     offset += size
 * flush acc if any field was written
 * @endcode
 *
 * ✨ PURE FUNCTIONS ✨
 *
 * @author LukeFrankio
 * @date 2025-10-10
 */

#pragma once

#include <tessera/core/types.hpp>
#include <tessera/core/word.hpp>

#include <span>
#include <vector>

namespace tessera::layout {

/// Usable bits per packed word.
inline constexpr u32 PACKING_MAX_BITS = 251;

/**
 * @brief Number of words pack() produces for the given sizes
 *
 * @param sizes Field bit widths, each in 1..=251
 * @return Word count (0 for no fields) or PACKING_INVALID_SIZE
 *
 * @complexity O(n)
 */
[[nodiscard]] auto packed_size(std::span<const u8> sizes) -> Result<usize>;

/**
 * @brief Packs values into words
 *
 * @param values One value per size
 * @param sizes Field bit widths, each in 1..=251
 * @return Packed words, or PACKING_LENGTH_MISMATCH / PACKING_INVALID_SIZE /
 *         PACKING_VALUE_OUT_OF_RANGE
 *
 * example:
 * @code
 * auto words = pack(std::vector<Word>{1, 2, 3}, std::vector<u8>{8, 8, 251});
 * // words == [0x0201, 3]
 * @endcode
 */
[[nodiscard]] auto pack(std::span<const Word> values, std::span<const u8> sizes)
    -> Result<std::vector<Word>>;

/**
 * @brief Unpacks words produced by pack()
 *
 * @param words Packed words (exactly packed_size(sizes) of them)
 * @param sizes Field bit widths used when packing
 * @return One value per size, or PACKING_WORD_COUNT_MISMATCH /
 *         PACKING_INVALID_SIZE
 */
[[nodiscard]] auto unpack(std::span<const Word> words, std::span<const u8> sizes)
    -> Result<std::vector<Word>>;

} // namespace tessera::layout
