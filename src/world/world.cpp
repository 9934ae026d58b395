/**
 * @file world.cpp
 * @brief World facade implementation
 *
 * @author LukeFrankio
 * @date 2025-10-14
 */

#include <tessera/world/world.hpp>
#include <tessera/storage/addressing.hpp>
#include <tessera/layout/packing.hpp>
#include <tessera/core/logging.hpp>

#include <fmt/format.h>

namespace tessera::world {

World::World(storage::StorageBackend& backend, Permissions& permissions, const EngineConfig& config,
             std::unique_ptr<const UpgradePolicy> policy)
    : permissions_(permissions),
      registry_(permissions, std::move(policy), config.max_array_length),
      store_(backend, config.max_array_length) {}

// ============================================================================
// Registration
// ============================================================================

auto World::register_namespace(const Word& caller, std::string_view name) -> Result<Word> {
    return registry_.register_namespace(caller, name);
}

auto World::register_model(const Word& caller, ModelDefinition definition) -> Result<Word> {
    return registry_.register_model(caller, std::move(definition));
}

// ============================================================================
// Helpers
// ============================================================================

auto World::registered_record(const Word& model) const -> Result<const ModelRecord*> {
    const auto* record = registry_.find(model);
    if (record == nullptr) {
        return make_error(ErrorCode::WORLD_RESOURCE_NOT_FOUND,
                          fmt::format("Model {} is not registered", model.to_hex()));
    }
    return record;
}

auto World::writable_record(const Word& caller, const Word& model) const
    -> Result<const ModelRecord*> {
    auto record = registered_record(model);
    if (!record) {
        LOG_WARN("Write to unregistered model {}", model.to_hex());
        return record;
    }
    if (!permissions_.can_write(caller, model)) {
        LOG_WARN("Caller {} has no write permission on '{}'", caller.to_hex(), (*record)->tag());
        return make_error(ErrorCode::WORLD_UNAUTHORIZED,
                          fmt::format("Caller {} has no write permission on '{}'",
                                      caller.to_hex(), (*record)->tag()));
    }
    return record;
}

auto World::resolve(const ModelRecord* record, const ModelIndex& index) const -> Result<Target> {
    if (const auto* keys = std::get_if<IndexKeys>(&index)) {
        if (keys->keys.empty()) {
            return make_error(ErrorCode::WORLD_INVALID_INDEX, "Key tuple must not be empty");
        }
        auto id = storage::entity_id(keys->keys);
        if (!id) {
            return std::unexpected(id.error());
        }
        return Target{*id, false};
    }
    if (const auto* id = std::get_if<IndexId>(&index)) {
        return Target{id->entity_id, false};
    }

    const auto& member = std::get<IndexMember>(index);
    if (record != nullptr && record->definition.packed) {
        return make_error(ErrorCode::ENGINE_PACKED_MEMBER_ACCESS,
                          fmt::format("Members of packed model '{}' are not addressable",
                                      record->tag()));
    }
    auto key = storage::field_key(member.entity_id, member.member);
    if (!key) {
        return std::unexpected(key.error());
    }
    return Target{*key, true};
}

// ============================================================================
// Dispatch (member / packed / plain)
// ============================================================================

auto World::validate_write(const ModelRecord& record, const Target& target,
                           std::span<const Word> values, const layout::Layout& layout) const
    -> Result<void> {
    if (target.member) {
        return store_.validate_values(values, layout);
    }
    if (record.definition.packed) {
        if (auto packed = layout::pack(values, record.packed_sizes); !packed) {
            return std::unexpected(packed.error());
        }
        return {};
    }
    if (auto root = store_.check_model_root(layout); !root) {
        return root;
    }
    return store_.validate_values(values, layout);
}

auto World::write_target(const ModelRecord& record, const Target& target,
                         std::span<const Word> values, const layout::Layout& layout)
    -> Result<void> {
    if (target.member) {
        return store_.write_layout(record.selector, target.key, values, layout);
    }
    if (record.definition.packed) {
        return store_.write_packed(record.selector, target.key, values, record.packed_sizes);
    }
    return store_.write_model(record.selector, target.key, values, layout);
}

auto World::read_target(const Word& model, const ModelRecord* record, const Target& target,
                        const layout::Layout& layout) const -> Result<std::vector<Word>> {
    if (target.member) {
        return store_.read_layout(model, target.key, layout);
    }
    if (record != nullptr && record->definition.packed) {
        return store_.read_packed(model, target.key, record->packed_sizes);
    }
    return store_.read_model(model, target.key, layout);
}

auto World::delete_target(const ModelRecord& record, const Target& target,
                          const layout::Layout& layout) -> Result<void> {
    if (target.member) {
        return store_.delete_layout(record.selector, target.key, layout);
    }
    if (record.definition.packed) {
        return store_.delete_packed(record.selector, target.key, record.packed_sizes);
    }
    return store_.delete_model(record.selector, target.key, layout);
}

// ============================================================================
// Single-entity access
// ============================================================================

auto World::set_entity(const Word& caller, const Word& model, const ModelIndex& index,
                       std::span<const Word> values, const layout::Layout& layout)
    -> Result<void> {
    auto record = writable_record(caller, model);
    if (!record) {
        return std::unexpected(record.error());
    }
    auto target = resolve(*record, index);
    if (!target) {
        return std::unexpected(target.error());
    }
    return write_target(**record, *target, values, layout);
}

auto World::entity(const Word& model, const ModelIndex& index, const layout::Layout& layout) const
    -> Result<std::vector<Word>> {
    const auto* record = registry_.find(model);
    auto target = resolve(record, index);
    if (!target) {
        return std::unexpected(target.error());
    }
    return read_target(model, record, *target, layout);
}

auto World::entity(const Word& model, const ModelIndex& index) const -> Result<std::vector<Word>> {
    auto record = registered_record(model);
    if (!record) {
        return std::unexpected(record.error());
    }

    const auto& model_layout = (*record)->definition.layout;
    if (const auto* member = std::get_if<IndexMember>(&index)) {
        if ((*record)->definition.packed) {
            return make_error(ErrorCode::ENGINE_PACKED_MEMBER_ACCESS,
                              fmt::format("Members of packed model '{}' are not addressable",
                                          (*record)->tag()));
        }
        const auto* member_layout = model_layout.member(member->member);
        if (member_layout == nullptr) {
            return make_error(ErrorCode::ENGINE_BAD_MEMBER_ID,
                              fmt::format("Model '{}' has no member {}", (*record)->tag(),
                                          member->member.to_hex()));
        }
        return entity(model, index, *member_layout);
    }
    return entity(model, index, model_layout);
}

auto World::delete_entity(const Word& caller, const Word& model, const ModelIndex& index,
                          const layout::Layout& layout) -> Result<void> {
    auto record = writable_record(caller, model);
    if (!record) {
        return std::unexpected(record.error());
    }
    auto target = resolve(*record, index);
    if (!target) {
        return std::unexpected(target.error());
    }
    return delete_target(**record, *target, layout);
}

// ============================================================================
// Bulk access
// ============================================================================

auto World::set_entities(const Word& caller, const Word& model,
                         std::span<const ModelIndex> indexes,
                         std::span<const std::vector<Word>> values,
                         const layout::Layout& layout) -> Result<void> {
    if (indexes.size() != values.size()) {
        return make_error(ErrorCode::WORLD_INVALID_INDEX,
                          fmt::format("Got {} indexes for {} value buffers",
                                      indexes.size(), values.size()));
    }

    auto record = writable_record(caller, model);
    if (!record) {
        return std::unexpected(record.error());
    }

    std::vector<Target> targets;
    targets.reserve(indexes.size());
    for (usize i = 0; i < indexes.size(); ++i) {
        auto target = resolve(*record, indexes[i]);
        if (!target) {
            return std::unexpected(target.error());
        }
        if (auto valid = validate_write(**record, *target, values[i], layout); !valid) {
            LOG_WARN("Rejected bulk write to '{}' at entry {}: {}", (*record)->tag(), i,
                     valid.error().what());
            return valid;
        }
        targets.push_back(*target);
    }

    for (usize i = 0; i < targets.size(); ++i) {
        if (auto written = write_target(**record, targets[i], values[i], layout); !written) {
            return written;
        }
    }
    LOG_DEBUG("Wrote {} entities of '{}'", targets.size(), (*record)->tag());
    return {};
}

auto World::entities(const Word& model, std::span<const ModelIndex> indexes,
                     const layout::Layout& layout) const -> Result<std::vector<std::vector<Word>>> {
    std::vector<std::vector<Word>> all;
    all.reserve(indexes.size());
    for (const auto& index : indexes) {
        auto values = entity(model, index, layout);
        if (!values) {
            return std::unexpected(values.error());
        }
        all.push_back(std::move(*values));
    }
    return all;
}

auto World::delete_entities(const Word& caller, const Word& model,
                            std::span<const ModelIndex> indexes, const layout::Layout& layout)
    -> Result<void> {
    auto record = writable_record(caller, model);
    if (!record) {
        return std::unexpected(record.error());
    }

    std::vector<Target> targets;
    targets.reserve(indexes.size());
    for (const auto& index : indexes) {
        auto target = resolve(*record, index);
        if (!target) {
            return std::unexpected(target.error());
        }
        if (!target->member && !(*record)->definition.packed) {
            if (auto root = store_.check_model_root(layout); !root) {
                return root;
            }
        }
        targets.push_back(*target);
    }

    for (const auto& target : targets) {
        if (auto deleted = delete_target(**record, target, layout); !deleted) {
            return deleted;
        }
    }
    LOG_DEBUG("Deleted {} entities of '{}'", targets.size(), (*record)->tag());
    return {};
}

// ============================================================================
// Members and schemas
// ============================================================================

auto World::get_member(const Word& model, const Word& entity_id, const Word& member) const
    -> Result<std::vector<Word>> {
    return entity(model, IndexMember{entity_id, member});
}

auto World::set_member(const Word& caller, const Word& model, const Word& entity_id,
                       const Word& member, std::span<const Word> values) -> Result<void> {
    auto record = writable_record(caller, model);
    if (!record) {
        return std::unexpected(record.error());
    }

    auto target = resolve(*record, IndexMember{entity_id, member});
    if (!target) {
        return std::unexpected(target.error());
    }

    const auto* member_layout = (*record)->definition.layout.member(member);
    if (member_layout == nullptr) {
        return make_error(ErrorCode::ENGINE_BAD_MEMBER_ID,
                          fmt::format("Model '{}' has no member {}", (*record)->tag(),
                                      member.to_hex()));
    }
    return write_target(**record, *target, values, *member_layout);
}

auto World::read_schema(const Word& model, const Word& entity_id,
                        const layout::Layout& schema) const -> Result<std::vector<Word>> {
    auto record = registered_record(model);
    if (!record) {
        return std::unexpected(record.error());
    }
    const auto& definition = (*record)->definition;
    if (definition.packed) {
        return make_error(ErrorCode::ENGINE_PACKED_MEMBER_ACCESS,
                          fmt::format("Schemas of packed model '{}' are not addressable",
                                      (*record)->tag()));
    }

    const auto* fields = schema.get_if<layout::Struct>();
    if (fields == nullptr) {
        return make_error(ErrorCode::ENGINE_UNEXPECTED_LAYOUT_TYPE,
                          fmt::format("Schema must be a Struct, got {}",
                                      layout::to_string(schema.kind())));
    }
    for (const auto& field : fields->fields) {
        const auto* registered = definition.layout.member(field.selector);
        if (registered == nullptr || !(*registered == field.layout)) {
            return make_error(ErrorCode::ENGINE_BAD_MEMBER_ID,
                              fmt::format("Schema field {} does not match model '{}'",
                                          field.selector.to_hex(), (*record)->tag()));
        }
    }

    // struct fields live at field_key(entity_id, selector), same as members
    return store_.read_layout(model, entity_id, schema);
}

} // namespace tessera::world
