/**
 * @file upgrade_policy.cpp
 * @brief AppendOnlyUpgradePolicy implementation
 *
 * @author LukeFrankio
 * @date 2025-10-13
 */

#include <tessera/world/upgrade_policy.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace tessera::world {

using layout::Array;
using layout::Enum;
using layout::FieldLayout;
using layout::Fixed;
using layout::FixedArray;
using layout::Layout;
using layout::Struct;
using layout::Tuple;

namespace {

auto rejected(std::string_view reason) -> std::unexpected<Error> {
    return make_error(ErrorCode::WORLD_UPGRADE_REJECTED, reason);
}

auto check_layout(const Layout& old_layout, const Layout& new_layout) -> Result<void>;

auto check_fixed(const Fixed& old_fixed, const Fixed& new_fixed) -> Result<void> {
    if (new_fixed.sizes.size() < old_fixed.sizes.size()) {
        return rejected(fmt::format("Fixed layout shrinks from {} to {} entries",
                                    old_fixed.sizes.size(), new_fixed.sizes.size()));
    }
    for (usize i = 0; i < old_fixed.sizes.size(); ++i) {
        if (new_fixed.sizes[i] < old_fixed.sizes[i]) {
            return rejected(fmt::format("Entry {} narrows from {} to {} bits", i,
                                        old_fixed.sizes[i], new_fixed.sizes[i]));
        }
    }
    return {};
}

auto check_struct(const Struct& old_struct, const Struct& new_struct) -> Result<void> {
    // old fields must appear in the new struct in the same relative order
    usize position = 0;
    for (const auto& old_field : old_struct.fields) {
        const auto begin = new_struct.fields.begin() + static_cast<std::ptrdiff_t>(position);
        const auto it = std::find_if(begin, new_struct.fields.end(), [&](const FieldLayout& field) {
            return field.selector == old_field.selector;
        });
        if (it == new_struct.fields.end()) {
            const bool exists = std::ranges::any_of(new_struct.fields, [&](const FieldLayout& field) {
                return field.selector == old_field.selector;
            });
            return rejected(fmt::format("Field {} {}", old_field.selector.to_hex(),
                                        exists ? "was reordered" : "was removed"));
        }
        if (auto inner = check_layout(old_field.layout, it->layout); !inner) {
            return inner;
        }
        position = static_cast<usize>(it - new_struct.fields.begin()) + 1;
    }
    return {};
}

auto check_enum(const Enum& old_enum, const Enum& new_enum) -> Result<void> {
    for (const auto& old_variant : old_enum.variants) {
        const auto it = std::ranges::find(new_enum.variants, old_variant.selector,
                                          &FieldLayout::selector);
        if (it == new_enum.variants.end()) {
            return rejected(fmt::format("Variant {} was removed", old_variant.selector.low_u64()));
        }
        if (auto inner = check_layout(old_variant.layout, it->layout); !inner) {
            return inner;
        }
    }
    return {};
}

auto check_layout(const Layout& old_layout, const Layout& new_layout) -> Result<void> {
    if (old_layout.kind() != new_layout.kind()) {
        return rejected(fmt::format("Layout kind changes from {} to {}",
                                    layout::to_string(old_layout.kind()),
                                    layout::to_string(new_layout.kind())));
    }

    if (const auto* fixed = old_layout.get_if<Fixed>()) {
        return check_fixed(*fixed, *new_layout.get_if<Fixed>());
    }
    if (const auto* structure = old_layout.get_if<Struct>()) {
        return check_struct(*structure, *new_layout.get_if<Struct>());
    }
    if (const auto* tuple = old_layout.get_if<Tuple>()) {
        const auto& new_items = new_layout.get_if<Tuple>()->items;
        if (new_items.size() != tuple->items.size()) {
            return rejected(fmt::format("Tuple arity changes from {} to {}",
                                        tuple->items.size(), new_items.size()));
        }
        for (usize i = 0; i < new_items.size(); ++i) {
            if (auto inner = check_layout(tuple->items[i], new_items[i]); !inner) {
                return inner;
            }
        }
        return {};
    }
    if (const auto* fixed_array = old_layout.get_if<FixedArray>()) {
        const auto* new_array = new_layout.get_if<FixedArray>();
        if (new_array->count != fixed_array->count) {
            return rejected(fmt::format("Fixed array count changes from {} to {}",
                                        fixed_array->count, new_array->count));
        }
        return check_layout(*fixed_array->item, *new_array->item);
    }
    if (const auto* array = old_layout.get_if<Array>()) {
        return check_layout(*array->item, *new_layout.get_if<Array>()->item);
    }
    if (const auto* enumeration = old_layout.get_if<Enum>()) {
        return check_enum(*enumeration, *new_layout.get_if<Enum>());
    }
    return {};  // ByteArray
}

} // anonymous namespace

auto AppendOnlyUpgradePolicy::check(const Layout& old_layout, const Layout& new_layout) const
    -> Result<void> {
    return check_layout(old_layout, new_layout);
}

} // namespace tessera::world
