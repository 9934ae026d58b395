/**
 * @file backend.hpp
 * @brief Storage substrate interface
 *
 * The engine only ever needs two operations from persistent storage:
 * read one word at an address, write one word at an address. Hosts plug
 * their own storage in by implementing this interface.
 *
 * Contract:
 * - get() of a never-written address returns the zero word
 * - set() is per-call correct; no cross-call atomicity is assumed
 * - failures (quota, host errors) are returned, never thrown
 *
 * @author LukeFrankio
 * @date 2025-10-10
 */

#pragma once

#include <tessera/core/types.hpp>
#include <tessera/core/word.hpp>

namespace tessera::storage {

/**
 * @brief Address-indexed word storage
 *
 * ⚠️ IMPURE (implementations own mutable state)
 */
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    /**
     * @brief Reads one slot
     *
     * @param address Slot address
     * @return Stored word (zero if never written) or a STORAGE_* error
     */
    [[nodiscard]] virtual auto get(const Word& address) const -> Result<Word> = 0;

    /**
     * @brief Writes one slot
     *
     * @param address Slot address
     * @param value Word to store (zero clears the slot)
     * @return Success or a STORAGE_* error
     */
    [[nodiscard]] virtual auto set(const Word& address, const Word& value) -> Result<void> = 0;

protected:
    StorageBackend() = default;
    StorageBackend(const StorageBackend&) = default;
    auto operator=(const StorageBackend&) -> StorageBackend& = default;
    StorageBackend(StorageBackend&&) = default;
    auto operator=(StorageBackend&&) -> StorageBackend& = default;
};

} // namespace tessera::storage
