/**
 * @file naming.hpp
 * @brief Resource names, tags and selectors
 *
 * - Names (namespaces and models) match `^[a-zA-Z0-9_]+$`
 * - A tag is `"<namespace>-<name>"`
 * - namespace selector = bytearray_hash(namespace)
 * - model selector = hash(bytearray_hash(namespace), bytearray_hash(name))
 *
 * Selectors depend only on names, so they survive upgrades.
 *
 * @author LukeFrankio
 * @date 2025-10-13
 */

#pragma once

#include <tessera/core/types.hpp>
#include <tessera/core/word.hpp>

#include <string>
#include <string_view>
#include <utility>

namespace tessera::world {

/// Separator between namespace and name in a tag.
inline constexpr char TAG_SEPARATOR = '-';

/**
 * @brief Checks a namespace or model name
 *
 * ✨ PURE FUNCTION ✨
 *
 * @return true if non-empty and only [a-zA-Z0-9_]
 */
[[nodiscard]] auto is_name_valid(std::string_view name) noexcept -> bool;

/**
 * @brief Builds the tag "<namespace>-<name>"
 */
[[nodiscard]] auto get_tag(std::string_view namespace_name, std::string_view name) -> std::string;

/**
 * @brief Splits a tag into (namespace, name)
 *
 * @return Parts or WORLD_INVALID_NAME if the tag is malformed
 */
[[nodiscard]] auto split_tag(std::string_view tag)
    -> Result<std::pair<std::string_view, std::string_view>>;

/**
 * @brief Hash of a string's byte-array serialization
 */
[[nodiscard]] auto bytearray_hash(std::string_view text) -> Result<Word>;

/**
 * @brief Model selector from its namespace and name
 */
[[nodiscard]] auto selector_from_names(std::string_view namespace_name, std::string_view name)
    -> Result<Word>;

/**
 * @brief Model selector from its tag
 *
 * @return Selector or WORLD_INVALID_NAME
 */
[[nodiscard]] auto selector_from_tag(std::string_view tag) -> Result<Word>;

} // namespace tessera::world
