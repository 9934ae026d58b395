/**
 * @file config.hpp
 * @brief Engine configuration loaded from YAML
 *
 * Example config file:
 * @code
 * engine:
 *   max_array_length: 1024
 * logging:
 *   level: debug
 *   file: logs/tessera.log
 *   colors: never
 * @endcode
 *
 * Missing keys fall back to the defaults below.
 *
 * @author LukeFrankio
 * @date 2025-10-12
 *
 * @note Uses yaml-cpp library for YAML parsing
 */

#pragma once

#include <tessera/core/logging.hpp>
#include <tessera/core/types.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace tessera {

/// Largest array (or byte-array data) length a single write may declare.
inline constexpr u64 MAX_ARRAY_LENGTH = 4'294'967'295ULL;

/**
 * @brief Tunables for the storage engine and its logging
 */
struct EngineConfig {
    u64 max_array_length = MAX_ARRAY_LENGTH;  ///< Bound on array/byte-array lengths
    LogLevel log_level = LogLevel::INFO;      ///< Minimum logger level
    std::string log_file;                     ///< Log file path (empty = console only)
    ColorMode log_colors = ColorMode::AUTO;   ///< Console coloring
};

/**
 * @brief Parses a config document
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param yaml_text YAML text
 * @return Config or CORE_CONFIG_PARSE_ERROR
 */
[[nodiscard]] auto parse_config(std::string_view yaml_text) -> Result<EngineConfig>;

/**
 * @brief Loads a config file
 *
 * ⚠️ IMPURE FUNCTION (file I/O)
 *
 * @param path Config file path
 * @return Config, CORE_FILE_NOT_FOUND, or CORE_CONFIG_PARSE_ERROR
 */
[[nodiscard]] auto load_config(const std::filesystem::path& path) -> Result<EngineConfig>;

/**
 * @brief Applies the logging section to the global Logger
 *
 * ⚠️ IMPURE FUNCTION (modifies global logger, may open log file)
 *
 * @param config Loaded config
 * @return Success or the logger's file error
 */
auto apply_logging(const EngineConfig& config) -> Result<void>;

} // namespace tessera
