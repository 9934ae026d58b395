/**
 * @file memory_backend.hpp
 * @brief In-process sparse storage backend
 *
 * Keeps only non-zero slots in a hash map, so "deleted" and "never
 * written" are the same thing physically as well as observably. An
 * optional slot quota models host resource limits.
 *
 * @author LukeFrankio
 * @date 2025-10-10
 */

#pragma once

#include <tessera/storage/backend.hpp>

#include <functional>
#include <optional>
#include <unordered_map>

namespace tessera::storage {

/**
 * @brief Hash map backed StorageBackend
 *
 * Usage:
 * @code
 * MemoryBackend backend;
 * ModelStore store(backend);
 * // ... writes ...
 * LOG_INFO("{} slots in use", backend.slot_count());
 * @endcode
 *
 * @note Not thread-safe (the engine is single-threaded)
 */
class MemoryBackend final : public StorageBackend {
public:
    /**
     * @brief Creates an empty backend
     *
     * @param max_slots Maximum number of non-zero slots (nullopt = unbounded)
     */
    explicit MemoryBackend(std::optional<usize> max_slots = std::nullopt);

    [[nodiscard]] auto get(const Word& address) const -> Result<Word> override;

    /**
     * @brief Writes one slot
     *
     * @return STORAGE_RESOURCE_EXHAUSTED when a new non-zero slot would
     *         exceed the quota
     */
    [[nodiscard]] auto set(const Word& address, const Word& value) -> Result<void> override;

    /**
     * @brief Number of non-zero slots
     */
    [[nodiscard]] auto slot_count() const noexcept -> usize { return slots_.size(); }

    [[nodiscard]] auto max_slots() const noexcept -> std::optional<usize> { return max_slots_; }

    /**
     * @brief Drops every slot
     */
    auto clear() noexcept -> void { slots_.clear(); }

    /**
     * @brief Visits every non-zero slot (unspecified order)
     *
     * @param visitor Called with (address, value)
     */
    auto for_each_slot(const std::function<void(const Word&, const Word&)>& visitor) const -> void;

private:
    std::unordered_map<Word, Word> slots_;
    std::optional<usize> max_slots_;
};

} // namespace tessera::storage
