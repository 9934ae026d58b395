/**
 * @file layout.hpp
 * @brief Layout algebra - how any value is represented as storage slots
 *
 * A Layout is a closed, recursive shape descriptor. Model definitions carry
 * one for their non-key fields, and member/schema queries carry the
 * sub-layout of the part they touch. The storage engine walks it to decide
 * which slots a flat value buffer maps onto.
 *
 * **Variants**:
 * - **Fixed**: list of bit widths, one slot per entry
 * - **Struct**: named fields (selector + layout) in declaration order
 * - **Tuple**: positional fields
 * - **FixedArray**: one item layout repeated a static number of times
 * - **Array**: one item layout, dynamic length stored in a prefix slot
 * - **ByteArray**: length-prefixed blob (data words + pending word + pending length)
 * - **Enum**: tag slot selecting exactly one variant layout
 *
 * ✨ FUNCTIONAL DESIGN ✨
 * - Layouts are immutable values (children shared, never mutated)
 * - Structural equality (two layouts built the same way compare equal)
 * - No storage access anywhere in this module
 *
 * @author LukeFrankio
 * @date 2025-10-09
 */

#pragma once

#include <tessera/core/types.hpp>
#include <tessera/core/word.hpp>

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tessera::layout {

/// Largest bit width of one Fixed entry (usable bits of a packed word).
inline constexpr u32 MAX_FIELD_BITS = 251;

/// Enum tags must fit one byte.
inline constexpr u64 MAX_VARIANT_TAG = 255;

class Layout;
struct FieldLayout;

/// Flat list of sub-word fields, `sizes[i]` bits each.
struct Fixed {
    std::vector<u8> sizes;
};

/// Named fields; selector is a stable hash of the field name.
struct Struct {
    std::vector<FieldLayout> fields;
};

/// Positional fields; item i is addressed with selector i.
struct Tuple {
    std::vector<Layout> items;
};

/// Dynamic array; length lives in the prefix slot.
struct Array {
    std::shared_ptr<const Layout> item;
};

/// Static-length array; no length slot.
struct FixedArray {
    std::shared_ptr<const Layout> item;
    u32 count = 0;
};

/// Length-prefixed blob: [data_len, data..., pending_word, pending_len].
struct ByteArray {};

/// Tagged union; each FieldLayout selector is a variant tag (< 256).
struct Enum {
    std::vector<FieldLayout> variants;
};

/**
 * @brief Recursive layout value
 *
 * ✨ IMMUTABLE VALUE TYPE ✨
 *
 * Usage:
 * @code
 * // struct { a: u8, b: Option<u32> }
 * auto layout = Layout::structure({
 *     FieldLayout{sel_a, Layout::fixed({8})},
 *     FieldLayout{sel_b, Layout::enumeration({
 *         FieldLayout{0, Layout::fixed({32})},
 *         FieldLayout{1, Layout::fixed({})},
 *     })},
 * });
 * @endcode
 */
class Layout {
public:
    /**
     * @brief Layout variant kinds
     *
     * The numeric values are the variant indices of the word encoding
     * (see serialization.hpp) and must never change.
     */
    enum class Kind : u8 {
        FIXED = 1,
        STRUCT = 2,
        TUPLE = 3,
        ARRAY = 4,
        BYTE_ARRAY = 5,
        ENUM = 6,
        FIXED_ARRAY = 7,
    };

    using Node = std::variant<Fixed, Struct, Tuple, Array, ByteArray, Enum, FixedArray>;

    /**
     * @brief Empty Fixed layout (zero slots)
     */
    Layout();

    [[nodiscard]] static auto fixed(std::vector<u8> sizes) -> Layout;
    [[nodiscard]] static auto structure(std::vector<FieldLayout> fields) -> Layout;
    [[nodiscard]] static auto tuple(std::vector<Layout> items) -> Layout;
    [[nodiscard]] static auto array(Layout item) -> Layout;
    [[nodiscard]] static auto fixed_array(Layout item, u32 count) -> Layout;
    [[nodiscard]] static auto byte_array() -> Layout;
    [[nodiscard]] static auto enumeration(std::vector<FieldLayout> variants) -> Layout;

    /**
     * @brief Variant kind of this layout
     *
     * ✨ PURE FUNCTION ✨
     */
    [[nodiscard]] auto kind() const noexcept -> Kind;

    /**
     * @brief Underlying variant (for std::visit)
     */
    [[nodiscard]] auto node() const noexcept -> const Node& { return node_; }

    /**
     * @brief Typed access to one variant
     *
     * @tparam T One of Fixed, Struct, Tuple, Array, ByteArray, Enum, FixedArray
     * @return Pointer to the variant payload, nullptr if this layout is another kind
     */
    template<typename T>
    [[nodiscard]] auto get_if() const noexcept -> const T* {
        return std::get_if<T>(&node_);
    }

    /**
     * @brief Checks structural invariants recursively
     *
     * - Fixed sizes in 1..=251
     * - Struct selectors unique
     * - Enum tags unique and <= 255
     * - FixedArray count <= max_array_length
     *
     * @param max_array_length Bound on FixedArray counts
     * @return Success or the first violated invariant
     */
    [[nodiscard]] auto validate(u64 max_array_length) const -> Result<void>;

    /**
     * @brief Total slot count when statically known
     *
     * @return Word count, or nullopt when it depends on stored data
     *         (Array, ByteArray, Enum with differently sized variants)
     *
     * @complexity O(layout nodes)
     */
    [[nodiscard]] auto fixed_word_count() const -> std::optional<usize>;

    /**
     * @brief Smallest number of value words any instance consumes
     */
    [[nodiscard]] auto min_word_count() const -> usize;

    /**
     * @brief Flattened bit widths when the layout is statically Fixed-only
     *
     * @return Sizes in value order, or nullopt if an Array, ByteArray or
     *         Enum appears anywhere in the tree
     */
    [[nodiscard]] auto packed_sizes() const -> std::optional<std::vector<u8>>;

    /**
     * @brief Sub-layout of a Struct field
     *
     * @param selector Field selector
     * @return Field layout, nullptr if absent or this is not a Struct
     */
    [[nodiscard]] auto member(const Word& selector) const -> const Layout*;

    /**
     * @brief Hash of the word encoding (equal for structurally equal layouts)
     */
    [[nodiscard]] auto fingerprint() const -> Result<Word>;

    /**
     * @brief Short human-readable summary for logs, e.g. "Struct(3)"
     */
    [[nodiscard]] auto describe() const -> std::string;

    friend auto operator==(const Layout& a, const Layout& b) -> bool;

private:
    explicit Layout(Node node);

    Node node_;
};

/**
 * @brief (selector, layout) pair used by Struct fields and Enum variants
 */
struct FieldLayout {
    Word selector;  ///< Field selector or variant tag
    Layout layout;  ///< Layout of the field / variant payload

    friend auto operator==(const FieldLayout& a, const FieldLayout& b) -> bool {
        return a.selector == b.selector && a.layout == b.layout;
    }
};

/**
 * @brief Name of a layout kind ("Fixed", "Struct", ...)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto to_string(Layout::Kind kind) noexcept -> std::string_view {
    switch (kind) {
        case Layout::Kind::FIXED: return "Fixed";
        case Layout::Kind::STRUCT: return "Struct";
        case Layout::Kind::TUPLE: return "Tuple";
        case Layout::Kind::ARRAY: return "Array";
        case Layout::Kind::BYTE_ARRAY: return "ByteArray";
        case Layout::Kind::ENUM: return "Enum";
        case Layout::Kind::FIXED_ARRAY: return "FixedArray";
    }
    return "Unknown";
}

} // namespace tessera::layout
