/**
 * @file primitive.cpp
 * @brief Primitive table
 *
 * @author LukeFrankio
 * @date 2025-10-10
 */

#include <tessera/layout/primitive.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>

namespace tessera::layout {

namespace {

constexpr std::array<u8, 1> BOOL_SIZES{1};
constexpr std::array<u8, 1> U8_SIZES{8};
constexpr std::array<u8, 1> U16_SIZES{16};
constexpr std::array<u8, 1> U32_SIZES{32};
constexpr std::array<u8, 1> U64_SIZES{64};
constexpr std::array<u8, 1> U128_SIZES{128};
constexpr std::array<u8, 2> U256_SIZES{128, 128};
constexpr std::array<u8, 1> FELT_SIZES{251};
constexpr std::array<u8, 1> ETH_ADDRESS_SIZES{160};

// signed integers are stored as field elements, hence the full 251 bits
constexpr std::array<Primitive, 17> PRIMITIVES{{
    {"bool", BOOL_SIZES},
    {"u8", U8_SIZES},
    {"u16", U16_SIZES},
    {"u32", U32_SIZES},
    {"u64", U64_SIZES},
    {"u128", U128_SIZES},
    {"u256", U256_SIZES},
    {"usize", U32_SIZES},
    {"i8", FELT_SIZES},
    {"i16", FELT_SIZES},
    {"i32", FELT_SIZES},
    {"i64", FELT_SIZES},
    {"i128", FELT_SIZES},
    {"felt252", FELT_SIZES},
    {"ClassHash", FELT_SIZES},
    {"ContractAddress", FELT_SIZES},
    {"EthAddress", ETH_ADDRESS_SIZES},
}};

auto find_primitive(std::string_view name) noexcept -> const Primitive* {
    const auto it = std::ranges::find(PRIMITIVES, name, &Primitive::name);
    return it != PRIMITIVES.end() ? &*it : nullptr;
}

} // anonymous namespace

auto primitives() noexcept -> std::span<const Primitive> {
    return PRIMITIVES;
}

auto primitive_layout(std::string_view name) -> Result<Layout> {
    const auto* primitive = find_primitive(name);
    if (primitive == nullptr) {
        return make_error(ErrorCode::LAYOUT_UNKNOWN_PRIMITIVE,
                          fmt::format("Unknown primitive type '{}'", name));
    }
    return Layout::fixed(std::vector<u8>(primitive->sizes.begin(), primitive->sizes.end()));
}

auto is_primitive(std::string_view name) noexcept -> bool {
    return find_primitive(name) != nullptr;
}

} // namespace tessera::layout
