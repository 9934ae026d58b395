/**
 * @file registry.cpp
 * @brief ModelRegistry implementation
 *
 * @author LukeFrankio
 * @date 2025-10-13
 */

#include <tessera/world/registry.hpp>
#include <tessera/world/naming.hpp>
#include <tessera/core/hash.hpp>
#include <tessera/core/logging.hpp>
#include <tessera/layout/packing.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace tessera::world {

auto ModelRecord::tag() const -> std::string {
    return get_tag(definition.namespace_name, definition.name);
}

ModelRegistry::ModelRegistry(Permissions& permissions,
                             std::unique_ptr<const UpgradePolicy> policy,
                             u64 max_array_length)
    : permissions_(permissions), policy_(std::move(policy)), max_array_length_(max_array_length) {}

// ============================================================================
// Namespaces
// ============================================================================

auto ModelRegistry::register_namespace(const Word& caller, std::string_view name) -> Result<Word> {
    if (!is_name_valid(name)) {
        LOG_WARN("Rejected namespace name '{}'", name);
        return make_error(ErrorCode::WORLD_INVALID_NAME,
                          fmt::format("Namespace '{}' is not a valid name", name));
    }

    auto selector = bytearray_hash(name);
    if (!selector) {
        return selector;
    }
    if (namespaces_.contains(*selector)) {
        LOG_WARN("Namespace '{}' already registered", name);
        return make_error(ErrorCode::WORLD_RESOURCE_CONFLICT,
                          fmt::format("Namespace '{}' is already registered", name));
    }

    namespaces_.emplace(*selector, std::string(name));
    permissions_.grant_owner(caller, *selector);
    LOG_INFO("Registered namespace '{}' ({})", name, selector->to_hex());
    return selector;
}

auto ModelRegistry::has_namespace(const Word& namespace_selector) const -> bool {
    return namespaces_.contains(namespace_selector);
}

// ============================================================================
// Models
// ============================================================================

auto ModelRegistry::validate_definition(const ModelDefinition& definition) const -> Result<void> {
    if (!is_name_valid(definition.namespace_name) || !is_name_valid(definition.name)) {
        return make_error(ErrorCode::WORLD_INVALID_NAME,
                          fmt::format("Invalid model tag '{}'",
                                      get_tag(definition.namespace_name, definition.name)));
    }

    if (definition.keys.empty()) {
        return make_error(ErrorCode::CORE_INVALID_ARGUMENT,
                          fmt::format("Model '{}' must have at least one key field",
                                      definition.name));
    }
    for (const auto& key : definition.keys) {
        if (!is_name_valid(key.name)) {
            return make_error(ErrorCode::WORLD_INVALID_NAME,
                              fmt::format("Invalid key field name '{}'", key.name));
        }
        if (auto valid = key.layout.validate(max_array_length_); !valid) {
            return valid;
        }
    }

    const auto& layout = definition.layout;
    if (layout.get_if<layout::Fixed>() == nullptr && layout.get_if<layout::Struct>() == nullptr) {
        return make_error(ErrorCode::ENGINE_UNEXPECTED_LAYOUT_TYPE,
                          fmt::format("Unexpected layout type for a model: {}",
                                      layout::to_string(layout.kind())));
    }
    if (auto valid = layout.validate(max_array_length_); !valid) {
        return valid;
    }

    if (definition.packed && !layout.packed_sizes()) {
        return make_error(ErrorCode::LAYOUT_NOT_PACKABLE,
                          fmt::format("Model '{}' is packed but its layout is not fixed-size",
                                      definition.name));
    }
    return {};
}

auto ModelRegistry::register_model(const Word& caller, ModelDefinition definition)
    -> Result<Word> {
    const auto tag = get_tag(definition.namespace_name, definition.name);

    if (auto valid = validate_definition(definition); !valid) {
        LOG_WARN("Rejected model '{}': {}", tag, valid.error().what());
        return std::unexpected(valid.error());
    }

    auto namespace_hash = bytearray_hash(definition.namespace_name);
    if (!namespace_hash) {
        return namespace_hash;
    }
    auto name_hash = bytearray_hash(definition.name);
    if (!name_hash) {
        return name_hash;
    }
    auto selector = hash::hash_words({*namespace_hash, *name_hash});
    if (!selector) {
        return selector;
    }

    if (auto existing = models_.find(*selector); existing != models_.end()) {
        return upgrade_model(caller, existing->second, std::move(definition));
    }

    if (!namespaces_.contains(*namespace_hash)) {
        if (auto created = register_namespace(caller, definition.namespace_name); !created) {
            return created;
        }
    } else if (!permissions_.is_owner(caller, *namespace_hash)) {
        LOG_WARN("Caller {} does not own namespace '{}'", caller.to_hex(), definition.namespace_name);
        return make_error(ErrorCode::WORLD_UNAUTHORIZED,
                          fmt::format("Caller {} is not owner of namespace '{}'",
                                      caller.to_hex(), definition.namespace_name));
    }

    ModelRecord record{
        .selector = *selector,
        .namespace_hash = *namespace_hash,
        .name_hash = *name_hash,
        .definition = std::move(definition),
        .version = 1,
        .packed_sizes = {},
    };
    if (record.definition.packed) {
        record.packed_sizes = *record.definition.layout.packed_sizes();
    }

    permissions_.grant_owner(caller, *selector);
    permissions_.bind_namespace(*selector, *namespace_hash);
    models_.emplace(*selector, std::move(record));

    LOG_INFO("Registered model '{}' ({})", tag, selector->to_hex());
    return selector;
}

auto ModelRegistry::upgrade_model(const Word& caller, ModelRecord& record,
                                  ModelDefinition definition) -> Result<Word> {
    const auto tag = record.tag();

    if (!permissions_.is_owner(caller, record.selector)) {
        LOG_WARN("Caller {} does not own model '{}'", caller.to_hex(), tag);
        return make_error(ErrorCode::WORLD_UNAUTHORIZED,
                          fmt::format("Caller {} is not owner of model '{}'", caller.to_hex(), tag));
    }

    if (definition.keys != record.definition.keys) {
        LOG_WARN("Rejected upgrade of '{}': key fields changed", tag);
        return make_error(ErrorCode::WORLD_UPGRADE_REJECTED,
                          fmt::format("Key fields of '{}' cannot change", tag));
    }
    if (definition.packed != record.definition.packed) {
        LOG_WARN("Rejected upgrade of '{}': packed flag changed", tag);
        return make_error(ErrorCode::WORLD_UPGRADE_REJECTED,
                          fmt::format("Packing of '{}' cannot change", tag));
    }

    if (auto allowed = policy_->check(record.definition.layout, definition.layout); !allowed) {
        LOG_WARN("Rejected upgrade of '{}': {}", tag, allowed.error().what());
        return std::unexpected(allowed.error());
    }

    std::vector<u8> packed_sizes;
    if (definition.packed) {
        // greedy packing is prefix-stable, so only appended fields keep old bits in place
        packed_sizes = *definition.layout.packed_sizes();
        if (packed_sizes.size() < record.packed_sizes.size() ||
            !std::equal(record.packed_sizes.begin(), record.packed_sizes.end(),
                        packed_sizes.begin())) {
            LOG_WARN("Rejected upgrade of '{}': packed fields moved", tag);
            return make_error(ErrorCode::WORLD_UPGRADE_REJECTED,
                              fmt::format("Packed model '{}' may only append fields", tag));
        }
    }

    record.definition = std::move(definition);
    record.packed_sizes = std::move(packed_sizes);
    ++record.version;

    LOG_INFO("Upgraded model '{}' to version {}", tag, record.version);
    return record.selector;
}

auto ModelRegistry::find(const Word& selector) const -> const ModelRecord* {
    const auto it = models_.find(selector);
    return it != models_.end() ? &it->second : nullptr;
}

auto ModelRegistry::contains(const Word& selector) const -> bool {
    return models_.contains(selector);
}

} // namespace tessera::world
