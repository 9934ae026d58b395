/**
 * @file serialization.hpp
 * @brief Layout serialization: compact word encoding and YAML
 *
 * **Word encoding** (what fingerprints hash, and what a layout looks like
 * when it travels as a word buffer):
 *
 * @code
 * Fixed       -> [1, n, size_0, ..., size_{n-1}]
 * Struct      -> [2, n, selector_0, <layout_0>, ...]
 * Tuple       -> [3, n, <item_0>, ...]
 * Array       -> [4, <item>]
 * ByteArray   -> [5]
 * Enum        -> [6, n, tag_0, <layout_0>, ...]
 * FixedArray  -> [7, count, <item>]
 * @endcode
 *
 * **YAML** (manifests and tooling):
 *
 * @code
 * struct:
 *   - name: position
 *     layout: { fixed: [32, 32] }
 *   - name: owner
 *     layout: { primitive: ContractAddress }
 *   - name: state
 *     layout:
 *       enum:
 *         - { tag: 0, name: Idle }
 *         - { tag: 1, name: Moving, layout: { primitive: u8 } }
 *   - name: inventory
 *     layout: { array: { primitive: u32 } }
 *   - name: label
 *     layout: { byte_array: true }
 * @endcode
 *
 * Struct fields give either `name` (selector derived with
 * selector_from_name) or an explicit hex `selector`.
 *
 * @author LukeFrankio
 * @date 2025-10-12
 *
 * @note Uses yaml-cpp library for YAML parsing
 */

#pragma once

#include <tessera/core/types.hpp>
#include <tessera/core/word.hpp>
#include <tessera/layout/layout.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace YAML {
class Node;
}

namespace tessera::layout {

/// Deepest nesting decode_layout and layout_from_yaml accept.
inline constexpr u32 MAX_LAYOUT_DEPTH = 64;

/**
 * @brief Encodes a layout as a word buffer
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param layout Layout to encode
 * @return Encoded words
 *
 * @complexity O(layout nodes)
 */
[[nodiscard]] auto encode_layout(const Layout& layout) -> std::vector<Word>;

/**
 * @brief Decodes a word buffer produced by encode_layout
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param words Encoded layout (must be consumed exactly)
 * @return Layout, or LAYOUT_DECODE_FAILED on truncated input, trailing
 *         words, unknown variant indices or excessive depth; invariant
 *         violations surface with their own LAYOUT_* code
 */
[[nodiscard]] auto decode_layout(std::span<const Word> words) -> Result<Layout>;

/**
 * @brief Converts a layout into a YAML node
 *
 * Struct fields are emitted with their hex `selector` (names are not kept
 * by the layout itself).
 */
[[nodiscard]] auto layout_to_yaml(const Layout& layout) -> YAML::Node;

/**
 * @brief Builds a layout from a YAML node
 *
 * @param node Layout node (see file comment for the format)
 * @return Validated layout or LAYOUT_INVALID_YAML / LAYOUT_* invariant errors
 *
 * @note yaml-cpp conversion exceptions are caught and reported as
 *       LAYOUT_INVALID_YAML
 */
[[nodiscard]] auto layout_from_yaml(const YAML::Node& node) -> Result<Layout>;

/**
 * @brief Emits a layout as YAML text
 */
[[nodiscard]] auto layout_to_yaml_string(const Layout& layout) -> std::string;

/**
 * @brief Parses YAML text into a layout
 *
 * @param yaml_text YAML document whose root is a layout node
 * @return Layout or LAYOUT_INVALID_YAML
 */
[[nodiscard]] auto parse_layout_yaml(std::string_view yaml_text) -> Result<Layout>;

} // namespace tessera::layout
