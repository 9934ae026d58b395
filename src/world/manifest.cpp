/**
 * @file manifest.cpp
 * @brief Manifest parsing and application
 *
 * @author LukeFrankio
 * @date 2025-10-14
 */

#include <tessera/world/manifest.hpp>
#include <tessera/world/naming.hpp>
#include <tessera/layout/serialization.hpp>
#include <tessera/core/logging.hpp>

#include <yaml-cpp/yaml.h>

#include <fmt/format.h>

namespace tessera::world {

namespace {

auto manifest_error(std::string_view message) -> std::unexpected<Error> {
    return make_error(ErrorCode::CORE_CONFIG_PARSE_ERROR, message);
}

auto key_from_yaml(const YAML::Node& node) -> Result<KeyField> {
    if (!node.IsMap() || !node["name"] || !node["layout"]) {
        return manifest_error("Key field needs 'name' and 'layout'");
    }
    auto layout = layout::layout_from_yaml(node["layout"]);
    if (!layout) {
        return std::unexpected(layout.error());
    }
    return KeyField{node["name"].as<std::string>(), std::move(*layout)};
}

auto model_from_yaml(const YAML::Node& node) -> Result<ModelDefinition> {
    if (!node.IsMap() || !node["namespace"] || !node["name"] || !node["layout"]) {
        return manifest_error("Model needs 'namespace', 'name' and 'layout'");
    }

    ModelDefinition definition;
    definition.namespace_name = node["namespace"].as<std::string>();
    definition.name = node["name"].as<std::string>();
    definition.packed = node["packed"] ? node["packed"].as<bool>() : false;

    if (const auto keys = node["keys"]) {
        if (!keys.IsSequence()) {
            return manifest_error(fmt::format("'keys' of '{}' must be a sequence", definition.name));
        }
        for (const auto& key_node : keys) {
            auto key = key_from_yaml(key_node);
            if (!key) {
                return std::unexpected(key.error());
            }
            definition.keys.push_back(std::move(*key));
        }
    }

    auto layout = layout::layout_from_yaml(node["layout"]);
    if (!layout) {
        return std::unexpected(layout.error());
    }
    definition.layout = std::move(*layout);
    return definition;
}

auto manifest_from_yaml(const YAML::Node& root) -> Result<Manifest> {
    if (!root.IsMap()) {
        return manifest_error("Manifest root must be a map");
    }

    Manifest manifest;
    if (const auto namespaces = root["namespaces"]) {
        if (!namespaces.IsSequence()) {
            return manifest_error("'namespaces' must be a sequence");
        }
        for (const auto& ns : namespaces) {
            manifest.namespaces.push_back(ns.as<std::string>());
        }
    }

    if (const auto models = root["models"]) {
        if (!models.IsSequence()) {
            return manifest_error("'models' must be a sequence");
        }
        for (const auto& model_node : models) {
            auto model = model_from_yaml(model_node);
            if (!model) {
                return std::unexpected(model.error());
            }
            manifest.models.push_back(std::move(*model));
        }
    }
    return manifest;
}

} // anonymous namespace

auto parse_manifest(std::string_view yaml_text) -> Result<Manifest> {
    try {
        return manifest_from_yaml(YAML::Load(std::string(yaml_text)));
    } catch (const YAML::Exception& e) {
        return manifest_error(fmt::format("YAML parse error: {}", e.what()));
    }
}

auto load_manifest(const std::filesystem::path& path) -> Result<Manifest> {
    LOG_INFO("Loading manifest from: {}", path.string());

    if (!std::filesystem::exists(path)) {
        LOG_ERROR("Manifest file not found: {}", path.string());
        return make_error(ErrorCode::CORE_FILE_NOT_FOUND,
                          fmt::format("Manifest file not found: {}", path.string()));
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error: {}", e.what());
        return manifest_error(fmt::format("YAML parse error: {}", e.what()));
    }

    try {
        auto manifest = manifest_from_yaml(root);
        if (manifest) {
            LOG_INFO("Manifest loaded ({} namespaces, {} models)",
                     manifest->namespaces.size(), manifest->models.size());
        }
        return manifest;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Invalid manifest value: {}", e.what());
        return manifest_error(fmt::format("Invalid manifest value: {}", e.what()));
    }
}

auto apply_manifest(World& world, const Word& caller, const Manifest& manifest)
    -> Result<std::vector<Word>> {
    for (const auto& ns : manifest.namespaces) {
        auto selector = bytearray_hash(ns);
        if (!selector) {
            return std::unexpected(selector.error());
        }
        if (world.registry().has_namespace(*selector)) {
            LOG_DEBUG("Namespace '{}' already registered, skipping", ns);
            continue;
        }
        if (auto registered = world.register_namespace(caller, ns); !registered) {
            return std::unexpected(registered.error());
        }
    }

    std::vector<Word> selectors;
    selectors.reserve(manifest.models.size());
    for (const auto& model : manifest.models) {
        auto selector = world.register_model(caller, model);
        if (!selector) {
            return std::unexpected(selector.error());
        }
        selectors.push_back(*selector);
    }
    return selectors;
}

} // namespace tessera::world
