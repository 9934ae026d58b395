/**
 * @file types.hpp
 * @brief Fundamental type definitions for the Tessera storage engine
 *
 * This file provides type aliases, error handling types, and core utilities
 * used throughout Tessera. We use std::expected for error handling
 * (no exceptions!) and prefer explicit types over language primitives uwu
 *
 * Design decisions:
 * - Use std::expected instead of exceptions (functional error handling)
 * - Explicit sized integer types (no implicit conversions)
 * - Error codes grouped by module (CORE, LAYOUT, PACKING, STORAGE, ENGINE, WORLD)
 * - Zero-cost abstractions (everything inlines or constexpr)
 *
 * @author LukeFrankio
 * @date 2025-10-07
 * @version 1.0
 *
 * @note Uses C++23 features (std::expected)
 */

#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace tessera {

// ============================================================================
// Fundamental Types (explicit sized integers for clarity)
// ============================================================================

using u8 = std::uint8_t;    ///< 8-bit unsigned integer
using u16 = std::uint16_t;  ///< 16-bit unsigned integer
using u32 = std::uint32_t;  ///< 32-bit unsigned integer
using u64 = std::uint64_t;  ///< 64-bit unsigned integer

using i8 = std::int8_t;     ///< 8-bit signed integer
using i16 = std::int16_t;   ///< 16-bit signed integer
using i32 = std::int32_t;   ///< 32-bit signed integer
using i64 = std::int64_t;   ///< 64-bit signed integer

using usize = std::size_t;  ///< Unsigned size type (buffer offsets)

// ============================================================================
// Error Handling (functional error handling, no exceptions!)
// ============================================================================

/**
 * @enum ErrorCode
 * @brief Error codes for Tessera operations
 *
 * All error codes are prefixed by module:
 * - CORE_* for core module errors
 * - LAYOUT_* for layout algebra errors
 * - PACKING_* for bit-packing codec errors
 * - STORAGE_* for storage substrate errors
 * - ENGINE_* for read/write/delete engine errors
 * - WORLD_* for registry and permission errors
 *
 * @note Using enum class for strong typing (no implicit conversions)
 */
enum class ErrorCode : u32 {
    // Success (not an error)
    OK = 0,

    // Core module errors (1000-1999)
    CORE_UNKNOWN = 1000,
    CORE_OUT_OF_MEMORY = 1001,
    CORE_INVALID_ARGUMENT = 1002,
    CORE_FILE_NOT_FOUND = 1003,
    CORE_FILE_IO_ERROR = 1004,
    CORE_CONFIG_PARSE_ERROR = 1005,
    CORE_HASH_FAILURE = 1006,
    CORE_INVALID_HEX = 1007,

    // Layout module errors (2000-2999)
    LAYOUT_UNKNOWN = 2000,
    LAYOUT_INVALID_FIELD_SIZE = 2001,
    LAYOUT_DUPLICATE_SELECTOR = 2002,
    LAYOUT_INVALID_VARIANT_TAG = 2003,
    LAYOUT_DECODE_FAILED = 2004,
    LAYOUT_INVALID_YAML = 2005,
    LAYOUT_NOT_PACKABLE = 2006,
    LAYOUT_UNKNOWN_PRIMITIVE = 2007,
    LAYOUT_INVALID_BYTE_ARRAY = 2008,
    LAYOUT_INVALID_ARRAY_SIZE = 2009,

    // Packing module errors (3000-3999)
    PACKING_INVALID_SIZE = 3001,
    PACKING_VALUE_OUT_OF_RANGE = 3002,
    PACKING_LENGTH_MISMATCH = 3003,
    PACKING_WORD_COUNT_MISMATCH = 3004,

    // Storage module errors (4000-4999)
    STORAGE_UNKNOWN = 4000,
    STORAGE_BACKEND_FAILURE = 4001,
    STORAGE_RESOURCE_EXHAUSTED = 4002,

    // Engine module errors (5000-5999)
    ENGINE_INVALID_VALUES_LENGTH = 5001,
    ENGINE_INVALID_ARRAY_LENGTH = 5002,
    ENGINE_UNEXPECTED_LAYOUT_TYPE = 5003,
    ENGINE_INVALID_VARIANT_VALUE = 5004,
    ENGINE_VARIANT_NOT_FOUND = 5005,
    ENGINE_BAD_MEMBER_ID = 5006,
    ENGINE_PACKED_MEMBER_ACCESS = 5007,

    // World module errors (6000-6999)
    WORLD_UNAUTHORIZED = 6001,
    WORLD_INVALID_NAME = 6002,
    WORLD_RESOURCE_NOT_FOUND = 6003,
    WORLD_RESOURCE_CONFLICT = 6004,
    WORLD_UPGRADE_REJECTED = 6005,
    WORLD_INVALID_INDEX = 6006,
};

/**
 * @brief Converts error code to its short machine-checkable name
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param code Error code
 * @return Stable identifier such as "ENGINE_INVALID_ARRAY_LENGTH"
 */
[[nodiscard]] constexpr auto to_string(ErrorCode code) noexcept -> std::string_view {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::CORE_UNKNOWN: return "CORE_UNKNOWN";
        case ErrorCode::CORE_OUT_OF_MEMORY: return "CORE_OUT_OF_MEMORY";
        case ErrorCode::CORE_INVALID_ARGUMENT: return "CORE_INVALID_ARGUMENT";
        case ErrorCode::CORE_FILE_NOT_FOUND: return "CORE_FILE_NOT_FOUND";
        case ErrorCode::CORE_FILE_IO_ERROR: return "CORE_FILE_IO_ERROR";
        case ErrorCode::CORE_CONFIG_PARSE_ERROR: return "CORE_CONFIG_PARSE_ERROR";
        case ErrorCode::CORE_HASH_FAILURE: return "CORE_HASH_FAILURE";
        case ErrorCode::CORE_INVALID_HEX: return "CORE_INVALID_HEX";
        case ErrorCode::LAYOUT_UNKNOWN: return "LAYOUT_UNKNOWN";
        case ErrorCode::LAYOUT_INVALID_FIELD_SIZE: return "LAYOUT_INVALID_FIELD_SIZE";
        case ErrorCode::LAYOUT_DUPLICATE_SELECTOR: return "LAYOUT_DUPLICATE_SELECTOR";
        case ErrorCode::LAYOUT_INVALID_VARIANT_TAG: return "LAYOUT_INVALID_VARIANT_TAG";
        case ErrorCode::LAYOUT_DECODE_FAILED: return "LAYOUT_DECODE_FAILED";
        case ErrorCode::LAYOUT_INVALID_YAML: return "LAYOUT_INVALID_YAML";
        case ErrorCode::LAYOUT_NOT_PACKABLE: return "LAYOUT_NOT_PACKABLE";
        case ErrorCode::LAYOUT_UNKNOWN_PRIMITIVE: return "LAYOUT_UNKNOWN_PRIMITIVE";
        case ErrorCode::LAYOUT_INVALID_BYTE_ARRAY: return "LAYOUT_INVALID_BYTE_ARRAY";
        case ErrorCode::LAYOUT_INVALID_ARRAY_SIZE: return "LAYOUT_INVALID_ARRAY_SIZE";
        case ErrorCode::PACKING_INVALID_SIZE: return "PACKING_INVALID_SIZE";
        case ErrorCode::PACKING_VALUE_OUT_OF_RANGE: return "PACKING_VALUE_OUT_OF_RANGE";
        case ErrorCode::PACKING_LENGTH_MISMATCH: return "PACKING_LENGTH_MISMATCH";
        case ErrorCode::PACKING_WORD_COUNT_MISMATCH: return "PACKING_WORD_COUNT_MISMATCH";
        case ErrorCode::STORAGE_UNKNOWN: return "STORAGE_UNKNOWN";
        case ErrorCode::STORAGE_BACKEND_FAILURE: return "STORAGE_BACKEND_FAILURE";
        case ErrorCode::STORAGE_RESOURCE_EXHAUSTED: return "STORAGE_RESOURCE_EXHAUSTED";
        case ErrorCode::ENGINE_INVALID_VALUES_LENGTH: return "ENGINE_INVALID_VALUES_LENGTH";
        case ErrorCode::ENGINE_INVALID_ARRAY_LENGTH: return "ENGINE_INVALID_ARRAY_LENGTH";
        case ErrorCode::ENGINE_UNEXPECTED_LAYOUT_TYPE: return "ENGINE_UNEXPECTED_LAYOUT_TYPE";
        case ErrorCode::ENGINE_INVALID_VARIANT_VALUE: return "ENGINE_INVALID_VARIANT_VALUE";
        case ErrorCode::ENGINE_VARIANT_NOT_FOUND: return "ENGINE_VARIANT_NOT_FOUND";
        case ErrorCode::ENGINE_BAD_MEMBER_ID: return "ENGINE_BAD_MEMBER_ID";
        case ErrorCode::ENGINE_PACKED_MEMBER_ACCESS: return "ENGINE_PACKED_MEMBER_ACCESS";
        case ErrorCode::WORLD_UNAUTHORIZED: return "WORLD_UNAUTHORIZED";
        case ErrorCode::WORLD_INVALID_NAME: return "WORLD_INVALID_NAME";
        case ErrorCode::WORLD_RESOURCE_NOT_FOUND: return "WORLD_RESOURCE_NOT_FOUND";
        case ErrorCode::WORLD_RESOURCE_CONFLICT: return "WORLD_RESOURCE_CONFLICT";
        case ErrorCode::WORLD_UPGRADE_REJECTED: return "WORLD_UPGRADE_REJECTED";
        case ErrorCode::WORLD_INVALID_INDEX: return "WORLD_INVALID_INDEX";
    }
    return "UNKNOWN";
}

/**
 * @struct Error
 * @brief Error information with code and message
 *
 * This struct combines an error code with a human-readable message.
 * Used with std::expected for functional error handling uwu
 *
 * @note Immutable after construction (functional paradigm)
 */
struct Error {
    ErrorCode code;      ///< Error code
    std::string message; ///< Human-readable error message

    /**
     * @brief Constructs an error with code and message
     *
     * ✨ PURE FUNCTION ✨
     *
     * @param error_code Error code
     * @param error_message Error message
     */
    Error(ErrorCode error_code, std::string_view error_message)
        : code(error_code), message(error_message) {}

    /**
     * @brief Gets error message
     *
     * ✨ PURE FUNCTION ✨
     *
     * @return Error message as string view
     */
    [[nodiscard]] auto what() const noexcept -> std::string_view {
        return message;
    }

    /**
     * @brief Checks if error is OK (not actually an error)
     *
     * ✨ PURE FUNCTION ✨
     *
     * @return true if error code is OK
     */
    [[nodiscard]] auto is_ok() const noexcept -> bool {
        return code == ErrorCode::OK;
    }
};

/**
 * @typedef Result<T>
 * @brief Result type for operations that can fail
 *
 * This is an alias for std::expected<T, Error>, providing functional
 * error handling without exceptions. Operations return Result<T> to
 * indicate success (T) or failure (Error).
 *
 * Usage:
 * @code
 * auto values = store.read_model(model, key, layout);
 * if (values) {
 *     // success: use *values
 *     consume(*values);
 * } else {
 *     // failure: check values.error()
 *     LOG_ERROR("Read failed: {}", values.error().what());
 * }
 * @endcode
 *
 * @tparam T The type of the success value
 *
 * @note Prefer monadic operations (and_then, or_else, transform) over
 *       explicit if-else when composing multiple operations
 */
template<typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Builds an unexpected Error in one call
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param code Error code
 * @param message Error message
 * @return std::unexpected wrapping the error (converts to any Result<T>)
 */
[[nodiscard]] inline auto make_error(ErrorCode code, std::string_view message)
    -> std::unexpected<Error> {
    return std::unexpected(Error{code, message});
}

// ============================================================================
// Utility Types
// ============================================================================

/**
 * @typedef NonCopyable
 * @brief Base class for non-copyable types
 *
 * Inherit from this to make a class non-copyable but movable.
 *
 * @note Prefer composition over inheritance, but this is acceptable
 *       for enforcing non-copyability at compile time
 */
struct NonCopyable {
    NonCopyable() = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable&) = delete;
    auto operator=(const NonCopyable&) -> NonCopyable& = delete;

    NonCopyable(NonCopyable&&) noexcept = default;
    auto operator=(NonCopyable&&) noexcept -> NonCopyable& = default;
};

/**
 * @typedef NonMovable
 * @brief Base class for non-movable types
 *
 * Inherit from this to make a class non-copyable and non-movable.
 *
 * @note Use sparingly, most types should be movable
 */
struct NonMovable {
    NonMovable() = default;
    ~NonMovable() = default;

    NonMovable(const NonMovable&) = delete;
    auto operator=(const NonMovable&) -> NonMovable& = delete;

    NonMovable(NonMovable&&) = delete;
    auto operator=(NonMovable&&) -> NonMovable& = delete;
};

} // namespace tessera
