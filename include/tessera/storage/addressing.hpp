/**
 * @file addressing.hpp
 * @brief Key and field addressing
 *
 * Every leaf of every record gets a unique, recomputable storage address by
 * hash chaining. Nothing is materialized: reads, writes and deletes each
 * recompute the same addresses from (model, keys, path of selectors).
 *
 * @code
 * entity_id(keys)               = hash(keys...)
 * field_key(parent, selector)   = hash(parent, selector)
 * slot_base(model, key)         = hash(model, key)
 * slot_address(model, key, i)   = slot_base(model, key) + i
 * @endcode
 *
 * ✨ PURE FUNCTIONS ✨ (no storage is consulted)
 *
 * @author LukeFrankio
 * @date 2025-10-10
 */

#pragma once

#include <tessera/core/types.hpp>
#include <tessera/core/word.hpp>

#include <span>

namespace tessera::storage {

/**
 * @brief Root identifier of a record from its ordered key tuple
 *
 * @param keys Serialized key fields
 * @return Entity id or CORE_HASH_FAILURE
 */
[[nodiscard]] auto entity_id(std::span<const Word> keys) -> Result<Word>;

/**
 * @brief Child key of a struct field, tuple item, array element or enum payload
 *
 * @param parent Key of the enclosing value
 * @param selector Field selector, positional index or variant tag
 */
[[nodiscard]] auto field_key(const Word& parent, const Word& selector) -> Result<Word>;

/**
 * @brief First slot of the contiguous run stored under (model, key)
 */
[[nodiscard]] auto slot_base(const Word& model, const Word& key) -> Result<Word>;

/**
 * @brief Address of the i-th slot under (model, key)
 *
 * @note Wraps modulo 2^256 (never happens in practice: bases are 251-bit)
 */
[[nodiscard]] auto slot_address(const Word& model, const Word& key, u64 index) -> Result<Word>;

} // namespace tessera::storage
