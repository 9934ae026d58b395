/**
 * @file world.hpp
 * @brief World facade - the external call surface of the engine
 *
 * The World ties the pieces together: a ModelRegistry for definitions, a
 * ModelStore for layout-driven storage access, and a Permissions oracle
 * gating every mutation.
 *
 * **Architecture**:
 * - **Registry**: selector -> ModelRecord (layout, keys, version, packing)
 * - **Store**: recursive layout walk over the storage backend
 * - **Permission gate**: checked once per write/delete, before any slot
 *   is touched, so unauthorized calls never mutate storage
 *
 * Records are addressed by a ModelIndex:
 * - Keys(keys): whole record, entity id = hash(keys)
 * - Id(entity_id): whole record by precomputed id
 * - Member(entity_id, selector): one struct member
 *
 * @author LukeFrankio
 * @date 2025-10-14
 */

#pragma once

#include <tessera/core/config.hpp>
#include <tessera/core/types.hpp>
#include <tessera/core/word.hpp>
#include <tessera/layout/layout.hpp>
#include <tessera/storage/backend.hpp>
#include <tessera/storage/engine.hpp>
#include <tessera/world/permissions.hpp>
#include <tessera/world/registry.hpp>

#include <memory>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

namespace tessera::world {

/// Whole record addressed by its serialized key tuple.
struct IndexKeys {
    std::vector<Word> keys;
};

/// Whole record addressed by its entity id.
struct IndexId {
    Word entity_id;
};

/// One struct member of a record.
struct IndexMember {
    Word entity_id;
    Word member;
};

using ModelIndex = std::variant<IndexKeys, IndexId, IndexMember>;

/**
 * @brief ECS World over pluggable storage and permissions
 *
 * **Usage Example**:
 * @code
 * MemoryBackend backend;
 * AccessControlList acl;
 * World world(backend, acl);
 *
 * auto position = world.register_model(admin, definition);
 * world.set_entity(admin, *position, IndexKeys{{player}}, values, definition.layout);
 * auto stored = world.entity(*position, IndexKeys{{player}});
 * @endcode
 *
 * ⚠️ IMPURE CLASS (mutates the backend and the permissions it references)
 *
 * @note Not thread-safe; one call runs to completion at a time
 */
class World : NonCopyable {
public:
    /**
     * @brief Creates a world
     *
     * @param backend Storage substrate (must outlive the world)
     * @param permissions Permission oracle (must outlive the world)
     * @param config Engine limits
     * @param policy Upgrade legality policy
     */
    World(storage::StorageBackend& backend, Permissions& permissions,
          const EngineConfig& config = {},
          std::unique_ptr<const UpgradePolicy> policy = std::make_unique<AppendOnlyUpgradePolicy>());

    // ========== Registration ==========

    [[nodiscard]] auto register_namespace(const Word& caller, std::string_view name) -> Result<Word>;

    [[nodiscard]] auto register_model(const Word& caller, ModelDefinition definition)
        -> Result<Word>;

    // ========== Single-entity access ==========

    /**
     * @brief Writes a record (or one member of it)
     *
     * ⚠️ IMPURE
     *
     * @param caller Calling account (needs write permission on the model)
     * @param model Registered model selector
     * @param index Keys, Id or Member
     * @param values Flat value buffer
     * @param layout Model layout, or the member's layout for Member indexes
     * @return Success, WORLD_RESOURCE_NOT_FOUND, WORLD_UNAUTHORIZED,
     *         WORLD_INVALID_INDEX, ENGINE_* or a backend error
     */
    [[nodiscard]] auto set_entity(const Word& caller, const Word& model, const ModelIndex& index,
                                  std::span<const Word> values, const layout::Layout& layout)
        -> Result<void>;

    /**
     * @brief Reads a record with an inline layout
     *
     * Works for unregistered selectors as well (everything reads as zero).
     */
    [[nodiscard]] auto entity(const Word& model, const ModelIndex& index,
                              const layout::Layout& layout) const -> Result<std::vector<Word>>;

    /**
     * @brief Reads a record with the registered layout
     *
     * @return Values, WORLD_RESOURCE_NOT_FOUND or ENGINE_BAD_MEMBER_ID
     */
    [[nodiscard]] auto entity(const Word& model, const ModelIndex& index) const
        -> Result<std::vector<Word>>;

    /**
     * @brief Zeroes a record (or one member of it)
     *
     * ⚠️ IMPURE
     */
    [[nodiscard]] auto delete_entity(const Word& caller, const Word& model, const ModelIndex& index,
                                     const layout::Layout& layout) -> Result<void>;

    // ========== Bulk access ==========

    /**
     * @brief Writes several records of one model
     *
     * Permission is checked once and every buffer is validated before the
     * first write, so a rejected call leaves storage untouched.
     *
     * @return Success or WORLD_INVALID_INDEX when counts differ, plus the
     *         set_entity errors
     */
    [[nodiscard]] auto set_entities(const Word& caller, const Word& model,
                                    std::span<const ModelIndex> indexes,
                                    std::span<const std::vector<Word>> values,
                                    const layout::Layout& layout) -> Result<void>;

    [[nodiscard]] auto entities(const Word& model, std::span<const ModelIndex> indexes,
                                const layout::Layout& layout) const
        -> Result<std::vector<std::vector<Word>>>;

    [[nodiscard]] auto delete_entities(const Word& caller, const Word& model,
                                       std::span<const ModelIndex> indexes,
                                       const layout::Layout& layout) -> Result<void>;

    // ========== Members and schemas ==========

    /**
     * @brief Reads one member using the registered layout
     *
     * @return Values, WORLD_RESOURCE_NOT_FOUND, ENGINE_BAD_MEMBER_ID or
     *         ENGINE_PACKED_MEMBER_ACCESS
     */
    [[nodiscard]] auto get_member(const Word& model, const Word& entity_id,
                                  const Word& member) const -> Result<std::vector<Word>>;

    /**
     * @brief Writes one member using the registered layout
     *
     * ⚠️ IMPURE
     */
    [[nodiscard]] auto set_member(const Word& caller, const Word& model, const Word& entity_id,
                                  const Word& member, std::span<const Word> values)
        -> Result<void>;

    /**
     * @brief Reads a subset of a record's members
     *
     * @param schema Struct whose fields must exist, with equal layouts, in
     *        the registered model layout
     * @return Values in schema field order
     */
    [[nodiscard]] auto read_schema(const Word& model, const Word& entity_id,
                                   const layout::Layout& schema) const -> Result<std::vector<Word>>;

    // ========== Accessors ==========

    [[nodiscard]] auto registry() const noexcept -> const ModelRegistry& { return registry_; }
    [[nodiscard]] auto store() const noexcept -> const storage::ModelStore& { return store_; }

private:
    /// Storage key an index resolves to.
    struct Target {
        Word key;
        bool member = false;
    };

    auto resolve(const ModelRecord* record, const ModelIndex& index) const -> Result<Target>;
    auto writable_record(const Word& caller, const Word& model) const -> Result<const ModelRecord*>;
    auto registered_record(const Word& model) const -> Result<const ModelRecord*>;

    auto validate_write(const ModelRecord& record, const Target& target,
                        std::span<const Word> values, const layout::Layout& layout) const
        -> Result<void>;
    auto write_target(const ModelRecord& record, const Target& target,
                      std::span<const Word> values, const layout::Layout& layout) -> Result<void>;
    auto read_target(const Word& model, const ModelRecord* record, const Target& target,
                     const layout::Layout& layout) const -> Result<std::vector<Word>>;
    auto delete_target(const ModelRecord& record, const Target& target,
                       const layout::Layout& layout) -> Result<void>;

    Permissions& permissions_;
    ModelRegistry registry_;
    storage::ModelStore store_;
};

} // namespace tessera::world
