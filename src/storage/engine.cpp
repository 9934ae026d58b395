/**
 * @file engine.cpp
 * @brief ModelStore implementation
 *
 * Every operation is a synchronous recursion over the layout tree. Writes
 * run in two passes: measure() walks the value buffer without storage and
 * rejects anything malformed, then write_node() issues the slot writes.
 *
 * @author LukeFrankio
 * @date 2025-10-11
 */

#include <tessera/storage/engine.hpp>
#include <tessera/storage/addressing.hpp>
#include <tessera/layout/packing.hpp>
#include <tessera/core/logging.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace tessera::storage {

using layout::Array;
using layout::ByteArray;
using layout::Enum;
using layout::FieldLayout;
using layout::Fixed;
using layout::FixedArray;
using layout::Layout;
using layout::Struct;
using layout::Tuple;

namespace {

/// Slots a byte array occupies besides its data words.
constexpr u64 BYTE_ARRAY_HEADER_SLOTS = 3;

auto values_too_short(usize needed, usize available) -> std::unexpected<Error> {
    return make_error(ErrorCode::ENGINE_INVALID_VALUES_LENGTH,
                      fmt::format("Layout needs at least {} values, buffer has {}",
                                  needed, available));
}

/**
 * @brief Checks a stored or supplied length against the configured bound
 */
auto checked_length(const Word& length, u64 max_length) -> Result<u64> {
    if (!length.fits_u64() || length.low_u64() > max_length) {
        return make_error(ErrorCode::ENGINE_INVALID_ARRAY_LENGTH,
                          fmt::format("Array length {} exceeds maximum {}",
                                      length.to_hex(), max_length));
    }
    return length.low_u64();
}

/**
 * @brief Items that occupy no slots at all (e.g. unit structs)
 *
 * Arrays of them store only their length, so element loops are skipped.
 */
auto is_zero_width(const Layout& item) -> bool {
    const auto count = item.fixed_word_count();
    return count && *count == 0;
}

auto find_variant(const Enum& enumeration, const Word& tag) -> const FieldLayout* {
    const auto it = std::ranges::find(enumeration.variants, tag, &FieldLayout::selector);
    return it != enumeration.variants.end() ? &*it : nullptr;
}

} // anonymous namespace

ModelStore::ModelStore(StorageBackend& backend, u64 max_array_length)
    : backend_(backend), max_array_length_(max_array_length) {}

// ============================================================================
// Whole-model operations
// ============================================================================

auto ModelStore::check_model_root(const Layout& layout) const -> Result<void> {
    if (layout.get_if<Fixed>() == nullptr && layout.get_if<Struct>() == nullptr) {
        LOG_WARN("Rejected model root layout {}", layout.describe());
        return make_error(ErrorCode::ENGINE_UNEXPECTED_LAYOUT_TYPE,
                          fmt::format("Unexpected layout type for a model: {}",
                                      layout::to_string(layout.kind())));
    }
    return {};
}

auto ModelStore::write_model(const Word& model, const Word& key, std::span<const Word> values,
                             const Layout& layout) -> Result<void> {
    if (auto root = check_model_root(layout); !root) {
        return root;
    }
    return write_layout(model, key, values, layout);
}

auto ModelStore::read_model(const Word& model, const Word& key, const Layout& layout) const
    -> Result<std::vector<Word>> {
    if (auto root = check_model_root(layout); !root) {
        return std::unexpected(root.error());
    }
    return read_layout(model, key, layout);
}

auto ModelStore::delete_model(const Word& model, const Word& key, const Layout& layout)
    -> Result<void> {
    if (auto root = check_model_root(layout); !root) {
        return root;
    }
    return delete_layout(model, key, layout);
}

// ============================================================================
// Sub-layout operations
// ============================================================================

auto ModelStore::validate_values(std::span<const Word> values, const Layout& layout) const
    -> Result<void> {
    auto consumed = measure(layout, values, 0);
    if (!consumed) {
        return std::unexpected(consumed.error());
    }
    if (*consumed != values.size()) {
        return make_error(ErrorCode::ENGINE_INVALID_VALUES_LENGTH,
                          fmt::format("Layout consumes {} values, buffer has {}",
                                      *consumed, values.size()));
    }
    return {};
}

auto ModelStore::write_layout(const Word& model, const Word& key, std::span<const Word> values,
                              const Layout& layout) -> Result<void> {
    LOG_TRACE("write {} at {} ({} values)", layout.describe(), key.to_hex(), values.size());

    if (auto valid = validate_values(values, layout); !valid) {
        LOG_WARN("Rejected write of {} for model {}: {}", layout.describe(), model.to_hex(),
                 valid.error().what());
        return valid;
    }

    usize offset = 0;
    return write_node(model, key, layout, values, offset);
}

auto ModelStore::read_layout(const Word& model, const Word& key, const Layout& layout) const
    -> Result<std::vector<Word>> {
    LOG_TRACE("read {} at {}", layout.describe(), key.to_hex());

    std::vector<Word> out;
    if (auto read = read_node(model, key, layout, out); !read) {
        return std::unexpected(read.error());
    }
    return out;
}

auto ModelStore::delete_layout(const Word& model, const Word& key, const Layout& layout)
    -> Result<void> {
    LOG_TRACE("delete {} at {}", layout.describe(), key.to_hex());
    return delete_node(model, key, layout);
}

// ============================================================================
// Packed operations
// ============================================================================

auto ModelStore::write_packed(const Word& model, const Word& key, std::span<const Word> values,
                              std::span<const u8> sizes) -> Result<void> {
    auto packed = layout::pack(values, sizes);
    if (!packed) {
        LOG_WARN("Rejected packed write for model {}: {}", model.to_hex(), packed.error().what());
        return std::unexpected(packed.error());
    }
    LOG_TRACE("write {} packed words at {}", packed->size(), key.to_hex());
    return write_slots(model, key, *packed);
}

auto ModelStore::read_packed(const Word& model, const Word& key, std::span<const u8> sizes) const
    -> Result<std::vector<Word>> {
    auto word_count = layout::packed_size(sizes);
    if (!word_count) {
        return std::unexpected(word_count.error());
    }

    std::vector<Word> packed;
    if (auto read = read_slots(model, key, 0, *word_count, packed); !read) {
        return std::unexpected(read.error());
    }
    return layout::unpack(packed, sizes);
}

auto ModelStore::delete_packed(const Word& model, const Word& key, std::span<const u8> sizes)
    -> Result<void> {
    auto word_count = layout::packed_size(sizes);
    if (!word_count) {
        return std::unexpected(word_count.error());
    }
    return zero_slots(model, key, *word_count);
}

// ============================================================================
// Measuring pass (no storage access)
// ============================================================================

auto ModelStore::measure(const Layout& layout, std::span<const Word> values, usize offset) const
    -> Result<usize> {
    if (const auto* fixed = layout.get_if<Fixed>()) {
        const usize end = offset + fixed->sizes.size();
        if (end > values.size()) {
            return values_too_short(end, values.size());
        }
        return end;
    }

    if (const auto* structure = layout.get_if<Struct>()) {
        for (const auto& field : structure->fields) {
            auto next = measure(field.layout, values, offset);
            if (!next) {
                return next;
            }
            offset = *next;
        }
        return offset;
    }

    if (const auto* tuple = layout.get_if<Tuple>()) {
        for (const auto& item : tuple->items) {
            auto next = measure(item, values, offset);
            if (!next) {
                return next;
            }
            offset = *next;
        }
        return offset;
    }

    if (const auto* fixed_array = layout.get_if<FixedArray>()) {
        if (is_zero_width(*fixed_array->item)) {
            return offset;
        }
        const usize min_item = fixed_array->item->min_word_count();
        if (min_item > 0 && fixed_array->count > (values.size() - offset) / min_item) {
            return values_too_short(offset + min_item * fixed_array->count, values.size());
        }
        for (u32 i = 0; i < fixed_array->count; ++i) {
            auto next = measure(*fixed_array->item, values, offset);
            if (!next) {
                return next;
            }
            offset = *next;
        }
        return offset;
    }

    if (const auto* array = layout.get_if<Array>()) {
        if (offset >= values.size()) {
            return values_too_short(offset + 1, values.size());
        }
        auto length = checked_length(values[offset], max_array_length_);
        if (!length) {
            return std::unexpected(length.error());
        }
        ++offset;
        if (is_zero_width(*array->item)) {
            return offset;
        }
        const usize min_item = array->item->min_word_count();
        if (min_item > 0 && *length > (values.size() - offset) / min_item) {
            return values_too_short(offset + min_item * *length, values.size());
        }
        for (u64 i = 0; i < *length; ++i) {
            auto next = measure(*array->item, values, offset);
            if (!next) {
                return next;
            }
            offset = *next;
        }
        return offset;
    }

    if (layout.get_if<ByteArray>() != nullptr) {
        if (offset >= values.size()) {
            return values_too_short(offset + BYTE_ARRAY_HEADER_SLOTS, values.size());
        }
        auto data_len = checked_length(values[offset], max_array_length_);
        if (!data_len) {
            return std::unexpected(data_len.error());
        }
        if (*data_len + BYTE_ARRAY_HEADER_SLOTS > values.size() - offset) {
            return values_too_short(offset + *data_len + BYTE_ARRAY_HEADER_SLOTS, values.size());
        }
        return offset + *data_len + BYTE_ARRAY_HEADER_SLOTS;
    }

    const auto& enumeration = std::get<Enum>(layout.node());
    if (offset >= values.size()) {
        return values_too_short(offset + 1, values.size());
    }
    const auto& tag = values[offset];
    if (!tag.fits_u64() || tag.low_u64() > layout::MAX_VARIANT_TAG) {
        return make_error(ErrorCode::ENGINE_INVALID_VARIANT_VALUE,
                          fmt::format("Invalid variant value {}", tag.to_hex()));
    }
    const auto* variant = find_variant(enumeration, tag);
    if (variant == nullptr) {
        return make_error(ErrorCode::ENGINE_VARIANT_NOT_FOUND,
                          fmt::format("Unable to find variant layout for tag {}", tag.low_u64()));
    }
    return measure(variant->layout, values, offset + 1);
}

// ============================================================================
// Write
// ============================================================================

auto ModelStore::write_node(const Word& model, const Word& key, const Layout& layout,
                            std::span<const Word> values, usize& offset) -> Result<void> {
    if (const auto* fixed = layout.get_if<Fixed>()) {
        const auto count = fixed->sizes.size();
        auto written = write_slots(model, key, values.subspan(offset, count));
        offset += count;
        return written;
    }

    if (const auto* structure = layout.get_if<Struct>()) {
        for (const auto& field : structure->fields) {
            auto child = field_key(key, field.selector);
            if (!child) {
                return std::unexpected(child.error());
            }
            if (auto written = write_node(model, *child, field.layout, values, offset); !written) {
                return written;
            }
        }
        return {};
    }

    if (const auto* tuple = layout.get_if<Tuple>()) {
        for (usize i = 0; i < tuple->items.size(); ++i) {
            auto child = field_key(key, Word{i});
            if (!child) {
                return std::unexpected(child.error());
            }
            if (auto written = write_node(model, *child, tuple->items[i], values, offset); !written) {
                return written;
            }
        }
        return {};
    }

    if (const auto* fixed_array = layout.get_if<FixedArray>()) {
        if (is_zero_width(*fixed_array->item)) {
            return {};
        }
        for (u32 i = 0; i < fixed_array->count; ++i) {
            auto child = field_key(key, Word{i});
            if (!child) {
                return std::unexpected(child.error());
            }
            if (auto written = write_node(model, *child, *fixed_array->item, values, offset);
                !written) {
                return written;
            }
        }
        return {};
    }

    if (const auto* array = layout.get_if<Array>()) {
        // measure() already bounded the length
        const u64 length = values[offset].low_u64();
        if (auto written = write_slots(model, key, values.subspan(offset, 1)); !written) {
            return written;
        }
        ++offset;
        if (is_zero_width(*array->item)) {
            return {};
        }
        for (u64 i = 0; i < length; ++i) {
            auto child = field_key(key, Word{i});
            if (!child) {
                return std::unexpected(child.error());
            }
            if (auto written = write_node(model, *child, *array->item, values, offset); !written) {
                return written;
            }
        }
        return {};
    }

    if (layout.get_if<ByteArray>() != nullptr) {
        const usize count = values[offset].low_u64() + BYTE_ARRAY_HEADER_SLOTS;
        auto written = write_slots(model, key, values.subspan(offset, count));
        offset += count;
        return written;
    }

    const auto& enumeration = std::get<Enum>(layout.node());
    const auto& tag = values[offset];
    const auto* variant = find_variant(enumeration, tag);
    if (auto written = write_slots(model, key, values.subspan(offset, 1)); !written) {
        return written;
    }
    ++offset;

    auto payload_key = field_key(key, tag);
    if (!payload_key) {
        return std::unexpected(payload_key.error());
    }
    return write_node(model, *payload_key, variant->layout, values, offset);
}

// ============================================================================
// Read
// ============================================================================

auto ModelStore::read_node(const Word& model, const Word& key, const Layout& layout,
                           std::vector<Word>& out) const -> Result<void> {
    if (const auto* fixed = layout.get_if<Fixed>()) {
        return read_slots(model, key, 0, fixed->sizes.size(), out);
    }

    if (const auto* structure = layout.get_if<Struct>()) {
        for (const auto& field : structure->fields) {
            auto child = field_key(key, field.selector);
            if (!child) {
                return std::unexpected(child.error());
            }
            if (auto read = read_node(model, *child, field.layout, out); !read) {
                return read;
            }
        }
        return {};
    }

    if (const auto* tuple = layout.get_if<Tuple>()) {
        for (usize i = 0; i < tuple->items.size(); ++i) {
            auto child = field_key(key, Word{i});
            if (!child) {
                return std::unexpected(child.error());
            }
            if (auto read = read_node(model, *child, tuple->items[i], out); !read) {
                return read;
            }
        }
        return {};
    }

    if (const auto* fixed_array = layout.get_if<FixedArray>()) {
        if (is_zero_width(*fixed_array->item)) {
            return {};
        }
        for (u32 i = 0; i < fixed_array->count; ++i) {
            auto child = field_key(key, Word{i});
            if (!child) {
                return std::unexpected(child.error());
            }
            if (auto read = read_node(model, *child, *fixed_array->item, out); !read) {
                return read;
            }
        }
        return {};
    }

    if (const auto* array = layout.get_if<Array>()) {
        if (auto read = read_slots(model, key, 0, 1, out); !read) {
            return read;
        }
        auto length = checked_length(out.back(), max_array_length_);
        if (!length) {
            return std::unexpected(length.error());
        }
        if (is_zero_width(*array->item)) {
            return {};
        }
        for (u64 i = 0; i < *length; ++i) {
            auto child = field_key(key, Word{i});
            if (!child) {
                return std::unexpected(child.error());
            }
            if (auto read = read_node(model, *child, *array->item, out); !read) {
                return read;
            }
        }
        return {};
    }

    if (layout.get_if<ByteArray>() != nullptr) {
        if (auto read = read_slots(model, key, 0, 1, out); !read) {
            return read;
        }
        auto data_len = checked_length(out.back(), max_array_length_);
        if (!data_len) {
            return std::unexpected(data_len.error());
        }
        return read_slots(model, key, 1, *data_len + BYTE_ARRAY_HEADER_SLOTS - 1, out);
    }

    const auto& enumeration = std::get<Enum>(layout.node());
    if (auto read = read_slots(model, key, 0, 1, out); !read) {
        return read;
    }
    const Word tag = out.back();
    const auto* variant = find_variant(enumeration, tag);
    if (variant == nullptr) {
        // never written (or deleted) and no variant 0: the tag alone is the value
        if (tag.is_zero()) {
            return {};
        }
        return make_error(ErrorCode::ENGINE_INVALID_VARIANT_VALUE,
                          fmt::format("Stored variant tag {} matches no variant", tag.to_hex()));
    }

    auto payload_key = field_key(key, tag);
    if (!payload_key) {
        return std::unexpected(payload_key.error());
    }
    return read_node(model, *payload_key, variant->layout, out);
}

// ============================================================================
// Delete
// ============================================================================

auto ModelStore::delete_node(const Word& model, const Word& key, const Layout& layout)
    -> Result<void> {
    if (const auto* fixed = layout.get_if<Fixed>()) {
        return zero_slots(model, key, fixed->sizes.size());
    }

    if (const auto* structure = layout.get_if<Struct>()) {
        for (const auto& field : structure->fields) {
            auto child = field_key(key, field.selector);
            if (!child) {
                return std::unexpected(child.error());
            }
            if (auto deleted = delete_node(model, *child, field.layout); !deleted) {
                return deleted;
            }
        }
        return {};
    }

    if (const auto* tuple = layout.get_if<Tuple>()) {
        for (usize i = 0; i < tuple->items.size(); ++i) {
            auto child = field_key(key, Word{i});
            if (!child) {
                return std::unexpected(child.error());
            }
            if (auto deleted = delete_node(model, *child, tuple->items[i]); !deleted) {
                return deleted;
            }
        }
        return {};
    }

    if (const auto* fixed_array = layout.get_if<FixedArray>()) {
        if (is_zero_width(*fixed_array->item)) {
            return {};
        }
        for (u32 i = 0; i < fixed_array->count; ++i) {
            auto child = field_key(key, Word{i});
            if (!child) {
                return std::unexpected(child.error());
            }
            if (auto deleted = delete_node(model, *child, *fixed_array->item); !deleted) {
                return deleted;
            }
        }
        return {};
    }

    if (layout.get_if<Array>() != nullptr) {
        // elements are orphaned: unreachable once the length is zero
        return zero_slots(model, key, 1);
    }

    if (layout.get_if<ByteArray>() != nullptr) {
        // data_len and the two slots after it; reads back as [0, 0, 0]
        return zero_slots(model, key, BYTE_ARRAY_HEADER_SLOTS);
    }

    const auto& enumeration = std::get<Enum>(layout.node());
    std::vector<Word> stored;
    if (auto read = read_slots(model, key, 0, 1, stored); !read) {
        return read;
    }
    const Word tag = stored.front();
    const auto* variant = find_variant(enumeration, tag);
    if (variant == nullptr) {
        if (tag.is_zero()) {
            return {};
        }
        return make_error(ErrorCode::ENGINE_INVALID_VARIANT_VALUE,
                          fmt::format("Stored variant tag {} matches no variant", tag.to_hex()));
    }

    if (auto zeroed = zero_slots(model, key, 1); !zeroed) {
        return zeroed;
    }
    auto payload_key = field_key(key, tag);
    if (!payload_key) {
        return std::unexpected(payload_key.error());
    }
    return delete_node(model, *payload_key, variant->layout);
}

// ============================================================================
// Slot helpers
// ============================================================================

auto ModelStore::write_slots(const Word& model, const Word& key, std::span<const Word> values)
    -> Result<void> {
    if (values.empty()) {
        return {};
    }
    auto base = slot_base(model, key);
    if (!base) {
        return std::unexpected(base.error());
    }
    for (usize i = 0; i < values.size(); ++i) {
        if (auto stored = backend_.set(*base + Word{i}, values[i]); !stored) {
            return stored;
        }
    }
    return {};
}

auto ModelStore::read_slots(const Word& model, const Word& key, u64 first, u64 count,
                            std::vector<Word>& out) const -> Result<void> {
    if (count == 0) {
        return {};
    }
    auto base = slot_base(model, key);
    if (!base) {
        return std::unexpected(base.error());
    }
    for (u64 i = 0; i < count; ++i) {
        auto value = backend_.get(*base + Word{first + i});
        if (!value) {
            return std::unexpected(value.error());
        }
        out.push_back(*value);
    }
    return {};
}

auto ModelStore::zero_slots(const Word& model, const Word& key, u64 count) -> Result<void> {
    if (count == 0) {
        return {};
    }
    auto base = slot_base(model, key);
    if (!base) {
        return std::unexpected(base.error());
    }
    for (u64 i = 0; i < count; ++i) {
        if (auto stored = backend_.set(*base + Word{i}, Word{}); !stored) {
            return stored;
        }
    }
    return {};
}

} // namespace tessera::storage
