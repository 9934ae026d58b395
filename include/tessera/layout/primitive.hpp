/**
 * @file primitive.hpp
 * @brief Built-in primitive types and their fixed layouts
 *
 * Primitives are the leaves every layout bottoms out in. Each one maps to a
 * Fixed layout with one entry per storage word it occupies:
 *
 * | Primitive | Layout |
 * |---|---|
 * | bool | Fixed[1] |
 * | u8 / u16 / u32 / u64 / u128 | Fixed[8] .. Fixed[128] |
 * | u256 | Fixed[128, 128] (low, high) |
 * | i8 .. i128, felt252, ClassHash, ContractAddress | Fixed[251] |
 * | EthAddress | Fixed[160] |
 *
 * @author LukeFrankio
 * @date 2025-10-10
 */

#pragma once

#include <tessera/core/types.hpp>
#include <tessera/layout/layout.hpp>

#include <span>
#include <string_view>

namespace tessera::layout {

/**
 * @brief Name and bit widths of one primitive
 */
struct Primitive {
    std::string_view name;        ///< Type name as written in manifests
    std::span<const u8> sizes;    ///< One bit width per storage word
};

/**
 * @brief Every known primitive, in a stable order
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto primitives() noexcept -> std::span<const Primitive>;

/**
 * @brief Looks up a primitive by name
 *
 * @param name Type name ("u32", "felt252", ...)
 * @return Fixed layout or LAYOUT_UNKNOWN_PRIMITIVE
 *
 * example:
 * @code
 * auto layout = primitive_layout("u256");  // Fixed[128, 128]
 * @endcode
 */
[[nodiscard]] auto primitive_layout(std::string_view name) -> Result<Layout>;

/**
 * @brief Checks whether a name refers to a known primitive
 */
[[nodiscard]] auto is_primitive(std::string_view name) noexcept -> bool;

} // namespace tessera::layout
