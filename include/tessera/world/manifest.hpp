/**
 * @file manifest.hpp
 * @brief YAML manifests describing namespaces and models to register
 *
 * Manifest format:
 * @code
 * namespaces:
 *   - game
 * models:
 *   - namespace: game
 *     name: Position
 *     packed: false
 *     keys:
 *       - name: player
 *         layout: { primitive: ContractAddress }
 *     layout:
 *       struct:
 *         - name: x
 *           layout: { primitive: u32 }
 *         - name: y
 *           layout: { primitive: u32 }
 * @endcode
 *
 * Layout nodes use the format of layout/serialization.hpp.
 *
 * @author LukeFrankio
 * @date 2025-10-14
 *
 * @note Uses yaml-cpp library for YAML parsing
 */

#pragma once

#include <tessera/core/types.hpp>
#include <tessera/core/word.hpp>
#include <tessera/world/registry.hpp>
#include <tessera/world/world.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::world {

/**
 * @brief Parsed manifest
 */
struct Manifest {
    std::vector<std::string> namespaces;   ///< Namespaces to register first
    std::vector<ModelDefinition> models;   ///< Models in registration order
};

/**
 * @brief Parses manifest text
 *
 * ✨ PURE FUNCTION ✨
 *
 * @return Manifest, CORE_CONFIG_PARSE_ERROR for structural problems, or
 *         the LAYOUT_* error of an invalid layout node
 */
[[nodiscard]] auto parse_manifest(std::string_view yaml_text) -> Result<Manifest>;

/**
 * @brief Loads a manifest file
 *
 * ⚠️ IMPURE FUNCTION (file I/O)
 *
 * @return Manifest, CORE_FILE_NOT_FOUND or a parse error
 */
[[nodiscard]] auto load_manifest(const std::filesystem::path& path) -> Result<Manifest>;

/**
 * @brief Registers everything a manifest declares
 *
 * ⚠️ IMPURE FUNCTION (modifies the world's registry and permissions)
 *
 * Namespaces that already exist are skipped; models already registered
 * are upgraded. Stops at the first failure (earlier registrations stay).
 *
 * @return Model selectors in manifest order
 */
[[nodiscard]] auto apply_manifest(World& world, const Word& caller, const Manifest& manifest)
    -> Result<std::vector<Word>>;

} // namespace tessera::world
