/**
 * @file hash.hpp
 * @brief Collision-resistant hashing of words and byte strings
 *
 * All selectors and storage addresses are produced here. The digest is
 * SHA-256 (OpenSSL EVP) over the 32-byte big-endian encoding of each input
 * word, truncated to 251 bits so results always fit the packing budget and
 * stay clear of the top of the address space.
 *
 * ✨ PURE FUNCTIONS ✨ (no state, same input always gives same output)
 *
 * @author LukeFrankio
 * @date 2025-10-09
 */

#pragma once

#include <tessera/core/types.hpp>
#include <tessera/core/word.hpp>

#include <initializer_list>
#include <span>
#include <string_view>

namespace tessera::hash {

/// Number of significant bits kept from each digest.
inline constexpr u32 DIGEST_BITS = 251;

/**
 * @brief Hashes a sequence of words
 *
 * @param words Input words (order matters, empty input is allowed)
 * @return 251-bit digest or CORE_HASH_FAILURE
 */
[[nodiscard]] auto hash_words(std::span<const Word> words) -> Result<Word>;

/**
 * @brief Hashes a short list of words
 *
 * Convenience overload for fixed arities such as (parent, selector).
 */
[[nodiscard]] auto hash_words(std::initializer_list<Word> words) -> Result<Word>;

/**
 * @brief Hashes raw bytes (used for field names)
 *
 * @param bytes Input bytes
 * @return 251-bit digest or CORE_HASH_FAILURE
 */
[[nodiscard]] auto hash_bytes(std::string_view bytes) -> Result<Word>;

/**
 * @brief Stable selector of a struct field name
 *
 * @param name Field name as declared
 * @return hash_bytes(name)
 */
[[nodiscard]] auto selector_from_name(std::string_view name) -> Result<Word>;

} // namespace tessera::hash
