/**
 * @file registry.hpp
 * @brief Model registry (selector -> definition) with registration rules
 *
 * Registration creates a model the first time its selector is seen and
 * upgrades it afterwards:
 *
 * - **create**: names valid, root layout Fixed or Struct, layout invariants
 *   hold, packed models statically packable. The namespace is created (and
 *   owned by the caller) if absent, otherwise the caller must own it. The
 *   caller becomes owner of the model, which is bound to its namespace.
 * - **upgrade**: the caller must own the model, key fields and the packed
 *   flag must not change, and the UpgradePolicy must accept the new layout.
 *   The version is bumped.
 *
 * @author LukeFrankio
 * @date 2025-10-13
 */

#pragma once

#include <tessera/core/config.hpp>
#include <tessera/core/types.hpp>
#include <tessera/core/word.hpp>
#include <tessera/layout/layout.hpp>
#include <tessera/world/permissions.hpp>
#include <tessera/world/upgrade_policy.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tessera::world {

/**
 * @brief One key field (keys address records, they are not stored as values)
 */
struct KeyField {
    std::string name;       ///< Field name
    layout::Layout layout;  ///< Serialized shape of the key

    friend auto operator==(const KeyField&, const KeyField&) -> bool = default;
};

/**
 * @brief What a caller registers
 */
struct ModelDefinition {
    std::string namespace_name;    ///< Owning namespace
    std::string name;              ///< Model name (unique within the namespace)
    std::vector<KeyField> keys;    ///< Ordered key fields
    layout::Layout layout;         ///< Value layout (root Fixed or Struct)
    bool packed = false;           ///< Bit-pack the whole record
};

/**
 * @brief A registered model
 */
struct ModelRecord {
    Word selector;                   ///< hash(namespace_hash, name_hash)
    Word namespace_hash;             ///< bytearray_hash(namespace)
    Word name_hash;                  ///< bytearray_hash(name)
    ModelDefinition definition;      ///< Current definition
    u32 version = 1;                 ///< 1 on creation, +1 per upgrade
    std::vector<u8> packed_sizes;    ///< Field widths (packed models only)

    /**
     * @brief "<namespace>-<name>"
     */
    [[nodiscard]] auto tag() const -> std::string;
};

/**
 * @brief Selector -> model lookup plus registration rules
 *
 * The registry writes grants into the Permissions it references; both the
 * permissions and the registry are owned by the enclosing World.
 */
class ModelRegistry : NonCopyable {
public:
    /**
     * @brief Creates an empty registry
     *
     * @param permissions Grant store updated on registration
     * @param policy Upgrade legality policy (default: append-only)
     * @param max_array_length Bound applied to FixedArray counts
     */
    explicit ModelRegistry(Permissions& permissions,
                           std::unique_ptr<const UpgradePolicy> policy =
                               std::make_unique<AppendOnlyUpgradePolicy>(),
                           u64 max_array_length = MAX_ARRAY_LENGTH);

    /**
     * @brief Registers a namespace; the caller becomes its owner
     *
     * @return Namespace selector, WORLD_INVALID_NAME or WORLD_RESOURCE_CONFLICT
     */
    [[nodiscard]] auto register_namespace(const Word& caller, std::string_view name) -> Result<Word>;

    /**
     * @brief Creates or upgrades a model
     *
     * @param caller Registering account
     * @param definition Model definition
     * @return Model selector or WORLD_INVALID_NAME, WORLD_UNAUTHORIZED,
     *         WORLD_UPGRADE_REJECTED, ENGINE_UNEXPECTED_LAYOUT_TYPE,
     *         LAYOUT_NOT_PACKABLE, CORE_INVALID_ARGUMENT or a LAYOUT_* error
     */
    [[nodiscard]] auto register_model(const Word& caller, ModelDefinition definition)
        -> Result<Word>;

    /**
     * @brief Looks up a model
     *
     * @return Record or nullptr if the selector is not registered
     */
    [[nodiscard]] auto find(const Word& selector) const -> const ModelRecord*;

    [[nodiscard]] auto contains(const Word& selector) const -> bool;
    [[nodiscard]] auto has_namespace(const Word& namespace_selector) const -> bool;
    [[nodiscard]] auto model_count() const noexcept -> usize { return models_.size(); }
    [[nodiscard]] auto namespace_count() const noexcept -> usize { return namespaces_.size(); }

private:
    auto validate_definition(const ModelDefinition& definition) const -> Result<void>;
    auto upgrade_model(const Word& caller, ModelRecord& record, ModelDefinition definition)
        -> Result<Word>;

    Permissions& permissions_;
    std::unique_ptr<const UpgradePolicy> policy_;
    u64 max_array_length_;

    std::unordered_map<Word, std::string> namespaces_;  ///< selector -> name
    std::unordered_map<Word, ModelRecord> models_;      ///< selector -> record
};

} // namespace tessera::world
