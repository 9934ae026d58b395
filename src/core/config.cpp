/**
 * @file config.cpp
 * @brief YAML config loading
 *
 * @author LukeFrankio
 * @date 2025-10-12
 */

#include <tessera/core/config.hpp>

#include <yaml-cpp/yaml.h>

#include <fmt/format.h>

#include <string>

namespace tessera {

namespace {

/**
 * @brief Reads the config fields out of a parsed document
 *
 * @pre root is a map or null
 */
auto config_from_yaml(const YAML::Node& root) -> Result<EngineConfig> {
    EngineConfig config;

    if (const auto engine = root["engine"]) {
        if (const auto max_len = engine["max_array_length"]) {
            const auto value = max_len.as<u64>();
            if (value == 0 || value > MAX_ARRAY_LENGTH) {
                return make_error(
                    ErrorCode::CORE_CONFIG_PARSE_ERROR,
                    fmt::format("engine.max_array_length must be in 1..={}, got {}",
                                MAX_ARRAY_LENGTH, value));
            }
            config.max_array_length = value;
        }
    }

    if (const auto logging = root["logging"]) {
        if (const auto level = logging["level"]) {
            const auto name = level.as<std::string>();
            const auto parsed = parse_log_level(name);
            if (!parsed) {
                return make_error(ErrorCode::CORE_CONFIG_PARSE_ERROR,
                                  fmt::format("Unknown log level '{}'", name));
            }
            config.log_level = *parsed;
        }
        if (const auto file = logging["file"]) {
            config.log_file = file.as<std::string>();
        }
        if (const auto colors = logging["colors"]) {
            const auto name = colors.as<std::string>();
            const auto parsed = parse_color_mode(name);
            if (!parsed) {
                return make_error(ErrorCode::CORE_CONFIG_PARSE_ERROR,
                                  fmt::format("Unknown color mode '{}'", name));
            }
            config.log_colors = *parsed;
        }
    }

    return config;
}

} // anonymous namespace

auto parse_config(std::string_view yaml_text) -> Result<EngineConfig> {
    try {
        const auto root = YAML::Load(std::string(yaml_text));
        if (!root.IsNull() && !root.IsMap()) {
            return make_error(ErrorCode::CORE_CONFIG_PARSE_ERROR,
                              "Config root must be a map");
        }
        return config_from_yaml(root);
    } catch (const YAML::Exception& e) {
        return make_error(ErrorCode::CORE_CONFIG_PARSE_ERROR,
                          fmt::format("YAML parse error: {}", e.what()));
    }
}

auto load_config(const std::filesystem::path& path) -> Result<EngineConfig> {
    LOG_INFO("Loading config from: {}", path.string());

    if (!std::filesystem::exists(path)) {
        LOG_ERROR("Config file not found: {}", path.string());
        return make_error(ErrorCode::CORE_FILE_NOT_FOUND,
                          fmt::format("Config file not found: {}", path.string()));
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error: {}", e.what());
        return make_error(ErrorCode::CORE_CONFIG_PARSE_ERROR,
                          fmt::format("YAML parse error: {}", e.what()));
    }

    if (!root.IsNull() && !root.IsMap()) {
        return make_error(ErrorCode::CORE_CONFIG_PARSE_ERROR, "Config root must be a map");
    }

    try {
        return config_from_yaml(root);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Invalid config value: {}", e.what());
        return make_error(ErrorCode::CORE_CONFIG_PARSE_ERROR,
                          fmt::format("Invalid config value: {}", e.what()));
    }
}

auto apply_logging(const EngineConfig& config) -> Result<void> {
    Logger::instance().set_level(config.log_level);
    Logger::instance().set_color_mode(config.log_colors);
    if (config.log_file.empty()) {
        return {};
    }
    return Logger::instance().initialize(config.log_file);
}

} // namespace tessera
