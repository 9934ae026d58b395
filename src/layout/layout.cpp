/**
 * @file layout.cpp
 * @brief Layout construction, validation and derived properties
 *
 * @author LukeFrankio
 * @date 2025-10-09
 */

#include <tessera/layout/layout.hpp>
#include <tessera/layout/serialization.hpp>
#include <tessera/core/hash.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <unordered_set>

namespace tessera::layout {

namespace {

/**
 * @brief Structural equality of two node variants
 *
 * ✨ PURE FUNCTION ✨
 */
struct NodeEqual {
    auto operator()(const Fixed& a, const Fixed& b) const -> bool {
        return a.sizes == b.sizes;
    }
    auto operator()(const Struct& a, const Struct& b) const -> bool {
        return a.fields == b.fields;
    }
    auto operator()(const Tuple& a, const Tuple& b) const -> bool {
        return a.items == b.items;
    }
    auto operator()(const Array& a, const Array& b) const -> bool {
        return *a.item == *b.item;
    }
    auto operator()(const FixedArray& a, const FixedArray& b) const -> bool {
        return a.count == b.count && *a.item == *b.item;
    }
    auto operator()(const ByteArray&, const ByteArray&) const -> bool {
        return true;
    }
    auto operator()(const Enum& a, const Enum& b) const -> bool {
        return a.variants == b.variants;
    }
    template<typename A, typename B>
    auto operator()(const A&, const B&) const -> bool {
        return false;
    }
};

auto validate_fields(const std::vector<FieldLayout>& fields, u64 max_array_length,
                     bool tags) -> Result<void> {
    std::unordered_set<Word> seen;
    for (const auto& field : fields) {
        if (tags && (!field.selector.fits_u64() || field.selector.low_u64() > MAX_VARIANT_TAG)) {
            return make_error(ErrorCode::LAYOUT_INVALID_VARIANT_TAG,
                              fmt::format("Variant tag {} exceeds {}",
                                          field.selector.to_hex(), MAX_VARIANT_TAG));
        }
        if (!seen.insert(field.selector).second) {
            return make_error(ErrorCode::LAYOUT_DUPLICATE_SELECTOR,
                              fmt::format("Duplicate {} {}", tags ? "variant tag" : "field selector",
                                          field.selector.to_hex()));
        }
        if (auto result = field.layout.validate(max_array_length); !result) {
            return result;
        }
    }
    return {};
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

Layout::Layout() : node_(Fixed{}) {}

Layout::Layout(Node node) : node_(std::move(node)) {}

auto Layout::fixed(std::vector<u8> sizes) -> Layout {
    return Layout(Fixed{std::move(sizes)});
}

auto Layout::structure(std::vector<FieldLayout> fields) -> Layout {
    return Layout(Struct{std::move(fields)});
}

auto Layout::tuple(std::vector<Layout> items) -> Layout {
    return Layout(Tuple{std::move(items)});
}

auto Layout::array(Layout item) -> Layout {
    return Layout(Array{std::make_shared<const Layout>(std::move(item))});
}

auto Layout::fixed_array(Layout item, u32 count) -> Layout {
    return Layout(FixedArray{std::make_shared<const Layout>(std::move(item)), count});
}

auto Layout::byte_array() -> Layout {
    return Layout(ByteArray{});
}

auto Layout::enumeration(std::vector<FieldLayout> variants) -> Layout {
    return Layout(Enum{std::move(variants)});
}

auto Layout::kind() const noexcept -> Kind {
    // variant alternatives are declared in encoding order
    return static_cast<Kind>(node_.index() + 1);
}

// ============================================================================
// Validation
// ============================================================================

auto Layout::validate(u64 max_array_length) const -> Result<void> {
    if (const auto* fixed = get_if<Fixed>()) {
        for (const auto size : fixed->sizes) {
            if (size == 0 || size > MAX_FIELD_BITS) {
                return make_error(ErrorCode::LAYOUT_INVALID_FIELD_SIZE,
                                  fmt::format("Field size {} outside 1..={}", size, MAX_FIELD_BITS));
            }
        }
        return {};
    }
    if (const auto* structure = get_if<Struct>()) {
        return validate_fields(structure->fields, max_array_length, false);
    }
    if (const auto* tuple = get_if<Tuple>()) {
        for (const auto& item : tuple->items) {
            if (auto result = item.validate(max_array_length); !result) {
                return result;
            }
        }
        return {};
    }
    if (const auto* array = get_if<Array>()) {
        return array->item->validate(max_array_length);
    }
    if (const auto* fixed_array = get_if<FixedArray>()) {
        if (fixed_array->count > max_array_length) {
            return make_error(ErrorCode::LAYOUT_INVALID_ARRAY_SIZE,
                              fmt::format("Fixed array count {} exceeds {}",
                                          fixed_array->count, max_array_length));
        }
        return fixed_array->item->validate(max_array_length);
    }
    if (const auto* enumeration = get_if<Enum>()) {
        return validate_fields(enumeration->variants, max_array_length, true);
    }
    return {};  // ByteArray
}

// ============================================================================
// Derived Properties
// ============================================================================

auto Layout::fixed_word_count() const -> std::optional<usize> {
    if (const auto* fixed = get_if<Fixed>()) {
        return fixed->sizes.size();
    }
    if (const auto* structure = get_if<Struct>()) {
        usize total = 0;
        for (const auto& field : structure->fields) {
            const auto count = field.layout.fixed_word_count();
            if (!count) {
                return std::nullopt;
            }
            total += *count;
        }
        return total;
    }
    if (const auto* tuple = get_if<Tuple>()) {
        usize total = 0;
        for (const auto& item : tuple->items) {
            const auto count = item.fixed_word_count();
            if (!count) {
                return std::nullopt;
            }
            total += *count;
        }
        return total;
    }
    if (const auto* fixed_array = get_if<FixedArray>()) {
        const auto count = fixed_array->item->fixed_word_count();
        if (!count) {
            return std::nullopt;
        }
        return *count * fixed_array->count;
    }
    if (const auto* enumeration = get_if<Enum>()) {
        if (enumeration->variants.empty()) {
            return std::nullopt;
        }
        std::optional<usize> shared;
        for (const auto& variant : enumeration->variants) {
            const auto count = variant.layout.fixed_word_count();
            if (!count || (shared && *shared != *count)) {
                return std::nullopt;
            }
            shared = count;
        }
        return 1 + *shared;
    }
    return std::nullopt;  // Array, ByteArray
}

auto Layout::min_word_count() const -> usize {
    if (const auto* fixed = get_if<Fixed>()) {
        return fixed->sizes.size();
    }
    if (const auto* structure = get_if<Struct>()) {
        usize total = 0;
        for (const auto& field : structure->fields) {
            total += field.layout.min_word_count();
        }
        return total;
    }
    if (const auto* tuple = get_if<Tuple>()) {
        usize total = 0;
        for (const auto& item : tuple->items) {
            total += item.min_word_count();
        }
        return total;
    }
    if (const auto* fixed_array = get_if<FixedArray>()) {
        return fixed_array->item->min_word_count() * fixed_array->count;
    }
    if (get_if<Array>() != nullptr) {
        return 1;  // length only
    }
    if (get_if<ByteArray>() != nullptr) {
        return 3;  // [0, pending_word, pending_len]
    }
    const auto& variants = std::get<Enum>(node_).variants;
    if (variants.empty()) {
        return 1;
    }
    usize smallest = variants.front().layout.min_word_count();
    for (const auto& variant : variants) {
        smallest = std::min(smallest, variant.layout.min_word_count());
    }
    return 1 + smallest;
}

auto Layout::packed_sizes() const -> std::optional<std::vector<u8>> {
    if (const auto* fixed = get_if<Fixed>()) {
        return fixed->sizes;
    }

    std::vector<u8> sizes;
    const auto append = [&sizes](const Layout& child) -> bool {
        auto child_sizes = child.packed_sizes();
        if (!child_sizes) {
            return false;
        }
        sizes.insert(sizes.end(), child_sizes->begin(), child_sizes->end());
        return true;
    };

    if (const auto* structure = get_if<Struct>()) {
        for (const auto& field : structure->fields) {
            if (!append(field.layout)) {
                return std::nullopt;
            }
        }
        return sizes;
    }
    if (const auto* tuple = get_if<Tuple>()) {
        for (const auto& item : tuple->items) {
            if (!append(item)) {
                return std::nullopt;
            }
        }
        return sizes;
    }
    if (const auto* fixed_array = get_if<FixedArray>()) {
        for (u32 i = 0; i < fixed_array->count; ++i) {
            if (!append(*fixed_array->item)) {
                return std::nullopt;
            }
        }
        return sizes;
    }
    return std::nullopt;
}

auto Layout::member(const Word& selector) const -> const Layout* {
    const auto* structure = get_if<Struct>();
    if (structure == nullptr) {
        return nullptr;
    }
    const auto it = std::ranges::find(structure->fields, selector, &FieldLayout::selector);
    return it != structure->fields.end() ? &it->layout : nullptr;
}

auto Layout::fingerprint() const -> Result<Word> {
    const auto encoded = encode_layout(*this);
    return hash::hash_words(encoded);
}

auto Layout::describe() const -> std::string {
    if (const auto* fixed = get_if<Fixed>()) {
        return fmt::format("Fixed[{}]", fmt::join(fixed->sizes, ","));
    }
    if (const auto* structure = get_if<Struct>()) {
        return fmt::format("Struct({})", structure->fields.size());
    }
    if (const auto* tuple = get_if<Tuple>()) {
        return fmt::format("Tuple({})", tuple->items.size());
    }
    if (const auto* array = get_if<Array>()) {
        return fmt::format("Array<{}>", array->item->describe());
    }
    if (const auto* fixed_array = get_if<FixedArray>()) {
        return fmt::format("FixedArray<{}; {}>", fixed_array->item->describe(), fixed_array->count);
    }
    if (const auto* enumeration = get_if<Enum>()) {
        return fmt::format("Enum({})", enumeration->variants.size());
    }
    return "ByteArray";
}

auto operator==(const Layout& a, const Layout& b) -> bool {
    return std::visit(NodeEqual{}, a.node_, b.node_);
}

} // namespace tessera::layout
