/**
 * @file engine.hpp
 * @brief Layout-driven read/write/delete engine
 *
 * ModelStore walks a Layout and maps each leaf of a flat value buffer onto
 * a storage slot through the addressing scheme:
 *
 * | Layout | Storage under (model, key) |
 * |---|---|
 * | Fixed(sizes) | slots 0..n of (model, key) |
 * | Struct(fields) | each field under field_key(key, selector) |
 * | Tuple(items) | item i under field_key(key, i) |
 * | FixedArray(item, n) | item i under field_key(key, i) |
 * | Array(item) | length in slot 0, item i under field_key(key, i) |
 * | ByteArray | [data_len, data..., pending_word, pending_len] in slots 0.. |
 * | Enum(variants) | tag in slot 0, payload under field_key(key, tag) |
 *
 * Contracts:
 * - **write**: the buffer must match the layout exactly. It is fully
 *   validated (lengths, array bounds, variant tags) before the first slot
 *   is written, so a rejected write never touches storage.
 * - **read**: returns exactly the stored shape; never-written leaves read
 *   as zero, never-written arrays as length 0.
 * - **delete**: zeroes every reachable leaf; idempotent. Array elements
 *   and byte-array data past the header are orphaned, not zeroed.
 *
 * Example:
 * @code
 * MemoryBackend backend;
 * ModelStore store(backend);
 *
 * const auto layout = Layout::fixed({251, 251});
 * store.write_model(model, key, std::vector<Word>{1, 2}, layout);
 * auto values = store.read_model(model, key, layout);   // [1, 2]
 * store.delete_model(model, key, layout);
 * values = store.read_model(model, key, layout);        // [0, 0]
 * @endcode
 *
 * @author LukeFrankio
 * @date 2025-10-11
 */

#pragma once

#include <tessera/core/config.hpp>
#include <tessera/core/types.hpp>
#include <tessera/core/word.hpp>
#include <tessera/layout/layout.hpp>
#include <tessera/storage/backend.hpp>

#include <span>
#include <vector>

namespace tessera::storage {

/**
 * @brief Reads, writes and deletes layout-shaped values
 *
 * ⚠️ IMPURE (mutates the backend it references)
 *
 * The store does not own the backend; the backend must outlive it.
 * Not thread-safe: one operation runs to completion at a time.
 */
class ModelStore : NonCopyable {
public:
    /**
     * @brief Creates a store over a backend
     *
     * @param backend Storage substrate
     * @param max_array_length Bound on array and byte-array lengths
     */
    explicit ModelStore(StorageBackend& backend, u64 max_array_length = MAX_ARRAY_LENGTH);

    // ========== Whole-model operations (root must be Fixed or Struct) ==========

    /**
     * @brief Writes a full record
     *
     * @param model Model selector
     * @param key Entity id
     * @param values Flat value buffer in layout order
     * @param layout Model layout
     * @return Success, ENGINE_UNEXPECTED_LAYOUT_TYPE, ENGINE_INVALID_VALUES_LENGTH,
     *         ENGINE_INVALID_ARRAY_LENGTH, ENGINE_INVALID_VARIANT_VALUE,
     *         ENGINE_VARIANT_NOT_FOUND or a backend error
     */
    [[nodiscard]] auto write_model(const Word& model, const Word& key,
                                   std::span<const Word> values,
                                   const layout::Layout& layout) -> Result<void>;

    /**
     * @brief Reads a full record
     *
     * @return Flat value buffer (zeros for never-written data)
     */
    [[nodiscard]] auto read_model(const Word& model, const Word& key,
                                  const layout::Layout& layout) const -> Result<std::vector<Word>>;

    /**
     * @brief Zeroes a full record
     */
    [[nodiscard]] auto delete_model(const Word& model, const Word& key,
                                    const layout::Layout& layout) -> Result<void>;

    // ========== Sub-layout operations (any variant) ==========

    /**
     * @brief Writes a value of any layout under (model, key)
     *
     * Used for member access, where `key` is field_key(entity_id, member)
     * and `layout` is the member's sub-layout.
     */
    [[nodiscard]] auto write_layout(const Word& model, const Word& key,
                                    std::span<const Word> values,
                                    const layout::Layout& layout) -> Result<void>;

    [[nodiscard]] auto read_layout(const Word& model, const Word& key,
                                   const layout::Layout& layout) const -> Result<std::vector<Word>>;

    [[nodiscard]] auto delete_layout(const Word& model, const Word& key,
                                     const layout::Layout& layout) -> Result<void>;

    // ========== Packed operations ==========

    /**
     * @brief Bit-packs a record and writes packed_size(sizes) slots
     *
     * @param sizes Flattened field widths (Layout::packed_sizes())
     * @return Success, a PACKING_* error or a backend error
     */
    [[nodiscard]] auto write_packed(const Word& model, const Word& key,
                                    std::span<const Word> values,
                                    std::span<const u8> sizes) -> Result<void>;

    [[nodiscard]] auto read_packed(const Word& model, const Word& key,
                                   std::span<const u8> sizes) const -> Result<std::vector<Word>>;

    [[nodiscard]] auto delete_packed(const Word& model, const Word& key,
                                     std::span<const u8> sizes) -> Result<void>;

    // ========== Validation ==========

    /**
     * @brief Checks a value buffer against a layout without touching storage
     *
     * ✨ PURE FUNCTION ✨
     *
     * @return Success or the error write_layout() would report before
     *         writing anything
     */
    [[nodiscard]] auto validate_values(std::span<const Word> values,
                                       const layout::Layout& layout) const -> Result<void>;

    /**
     * @brief Checks that a layout may be a whole-model root (Fixed or Struct)
     *
     * @return Success or ENGINE_UNEXPECTED_LAYOUT_TYPE
     */
    [[nodiscard]] auto check_model_root(const layout::Layout& layout) const -> Result<void>;

    [[nodiscard]] auto max_array_length() const noexcept -> u64 { return max_array_length_; }

private:
    auto measure(const layout::Layout& layout, std::span<const Word> values, usize offset) const
        -> Result<usize>;

    auto write_node(const Word& model, const Word& key, const layout::Layout& layout,
                    std::span<const Word> values, usize& offset) -> Result<void>;
    auto read_node(const Word& model, const Word& key, const layout::Layout& layout,
                   std::vector<Word>& out) const -> Result<void>;
    auto delete_node(const Word& model, const Word& key, const layout::Layout& layout)
        -> Result<void>;

    auto write_slots(const Word& model, const Word& key, std::span<const Word> values)
        -> Result<void>;
    auto read_slots(const Word& model, const Word& key, u64 first, u64 count,
                    std::vector<Word>& out) const -> Result<void>;
    auto zero_slots(const Word& model, const Word& key, u64 count) -> Result<void>;

    StorageBackend& backend_;
    u64 max_array_length_;
};

} // namespace tessera::storage
