/**
 * @file byte_array.hpp
 * @brief Byte-array string codec
 *
 * Strings travel through the engine as ByteArray value buffers:
 *
 * @code
 * [n_full_words, word_0, ..., word_{n-1}, pending_word, pending_len]
 * @endcode
 *
 * Each full word holds 31 bytes big-endian. The pending word holds the
 * remaining `pending_len < 31` bytes, also big-endian.
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
#include <string>
#include <string_view>
#include <vector>

namespace tessera::layout {

/// Bytes stored in one full byte-array word.
inline constexpr usize BYTES_PER_WORD = 31;

/**
 * @brief Serializes a string into its byte-array word form
 *
 * @param text Arbitrary bytes
 * @return Word buffer, always at least 3 words
 */
[[nodiscard]] auto encode_byte_array(std::string_view text) -> std::vector<Word>;

/**
 * @brief Rebuilds a string from its byte-array word form
 *
 * @param words Exactly `n_full_words + 3` words
 * @return String or LAYOUT_INVALID_BYTE_ARRAY when counts or word contents
 *         are inconsistent
 */
[[nodiscard]] auto decode_byte_array(std::span<const Word> words) -> Result<std::string>;

} // namespace tessera::layout
