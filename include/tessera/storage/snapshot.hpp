/**
 * @file snapshot.hpp
 * @brief MemoryBackend snapshots to/from YAML
 *
 * Snapshot format:
 * @code
 * version: 1
 * slots:
 *   - address: "0x4a1f..."
 *     value: "0x2a"
 * @endcode
 *
 * Slots are written in ascending address order so snapshots of equal
 * storage are byte-identical and diff cleanly.
 *
 * @author LukeFrankio
 * @date 2025-10-12
 *
 * @note Uses yaml-cpp library for YAML parsing
 */

#pragma once

#include <tessera/core/types.hpp>
#include <tessera/storage/memory_backend.hpp>

#include <expected>
#include <filesystem>

namespace tessera::storage {

/**
 * @enum SnapshotError
 * @brief Error codes for snapshot operations
 */
enum class SnapshotError {
    FILE_NOT_FOUND,          ///< Snapshot file doesn't exist
    FILE_OPEN_FAILED,        ///< Cannot open file for reading/writing
    YAML_PARSE_ERROR,        ///< Invalid YAML syntax
    INVALID_SLOT_DATA,       ///< Address or value is not a valid hex word
    MISSING_REQUIRED_FIELD,  ///< Required YAML field missing
    UNSUPPORTED_VERSION,     ///< Snapshot file version mismatch
    STORAGE_REJECTED,        ///< Backend refused a slot (quota)
};

/**
 * @brief Saves every non-zero slot of a backend to a YAML file
 *
 * ✨ FUNCTIONAL (but has I/O side effects) ✨
 *
 * @param backend Backend to serialize
 * @param path Output file path (parent directories are created)
 * @return Success or error code
 */
auto save_snapshot(const MemoryBackend& backend, const std::filesystem::path& path)
    -> std::expected<void, SnapshotError>;

/**
 * @brief Replaces a backend's contents with a YAML snapshot
 *
 * ⚠️ IMPURE FUNCTION (file I/O, clears backend)
 *
 * @param backend Backend to populate (cleared first)
 * @param path Snapshot file
 * @return Number of slots loaded or error code
 *
 * @post On error the backend may hold a partial snapshot
 */
auto load_snapshot(MemoryBackend& backend, const std::filesystem::path& path)
    -> std::expected<usize, SnapshotError>;

/**
 * @brief Converts error code to human-readable string
 *
 * ✨ PURE FUNCTION ✨
 */
constexpr auto error_to_string(SnapshotError error) noexcept -> const char* {
    switch (error) {
        case SnapshotError::FILE_NOT_FOUND:
            return "File not found";
        case SnapshotError::FILE_OPEN_FAILED:
            return "Failed to open file";
        case SnapshotError::YAML_PARSE_ERROR:
            return "Invalid YAML syntax";
        case SnapshotError::INVALID_SLOT_DATA:
            return "Slot data is malformed";
        case SnapshotError::MISSING_REQUIRED_FIELD:
            return "Required field missing in YAML";
        case SnapshotError::UNSUPPORTED_VERSION:
            return "Unsupported snapshot version";
        case SnapshotError::STORAGE_REJECTED:
            return "Storage rejected a slot";
        default:
            return "Unknown error";
    }
}

} // namespace tessera::storage
