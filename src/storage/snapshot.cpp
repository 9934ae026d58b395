/**
 * @file snapshot.cpp
 * @brief Snapshot save/load with yaml-cpp
 *
 * @author LukeFrankio
 * @date 2025-10-12
 */

#include <tessera/storage/snapshot.hpp>
#include <tessera/core/logging.hpp>

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <utility>
#include <vector>

namespace tessera::storage {

auto save_snapshot(const MemoryBackend& backend, const std::filesystem::path& path)
    -> std::expected<void, SnapshotError> {
    LOG_INFO("Saving snapshot to: {}", path.string());

    if (const auto parent = path.parent_path(); !parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            LOG_ERROR("Failed to create directory: {}", ec.message());
            return std::unexpected(SnapshotError::FILE_OPEN_FAILED);
        }
    }

    std::vector<std::pair<Word, Word>> slots;
    slots.reserve(backend.slot_count());
    backend.for_each_slot([&slots](const Word& address, const Word& value) {
        slots.emplace_back(address, value);
    });
    std::ranges::sort(slots, {}, &std::pair<Word, Word>::first);

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "version" << YAML::Value << 1;
    out << YAML::Key << "slots" << YAML::Value << YAML::BeginSeq;
    for (const auto& [address, value] : slots) {
        out << YAML::BeginMap;
        out << YAML::Key << "address" << YAML::Value << address.to_hex();
        out << YAML::Key << "value" << YAML::Value << value.to_hex();
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("Failed to open file for writing: {}", path.string());
        return std::unexpected(SnapshotError::FILE_OPEN_FAILED);
    }

    file << out.c_str();
    LOG_INFO("Snapshot saved successfully ({} slots)", slots.size());

    return {};
}

auto load_snapshot(MemoryBackend& backend, const std::filesystem::path& path)
    -> std::expected<usize, SnapshotError> {
    LOG_INFO("Loading snapshot from: {}", path.string());

    if (!std::filesystem::exists(path)) {
        LOG_ERROR("Snapshot file not found: {}", path.string());
        return std::unexpected(SnapshotError::FILE_NOT_FOUND);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YAML parse error: {}", e.what());
        return std::unexpected(SnapshotError::YAML_PARSE_ERROR);
    }

    if (!root.IsMap() || !root["version"]) {
        LOG_ERROR("Missing version field in snapshot file");
        return std::unexpected(SnapshotError::MISSING_REQUIRED_FIELD);
    }

    try {
        const int version = root["version"].as<int>();
        if (version != 1) {
            LOG_ERROR("Unsupported snapshot version: {}", version);
            return std::unexpected(SnapshotError::UNSUPPORTED_VERSION);
        }

        const auto slots = root["slots"];
        if (!slots || !slots.IsSequence()) {
            LOG_ERROR("Missing or invalid slots array");
            return std::unexpected(SnapshotError::MISSING_REQUIRED_FIELD);
        }

        backend.clear();

        usize loaded_count = 0;
        for (const auto& slot : slots) {
            if (!slot["address"] || !slot["value"]) {
                LOG_ERROR("Slot entry missing address or value");
                return std::unexpected(SnapshotError::MISSING_REQUIRED_FIELD);
            }

            const auto address = Word::from_hex(slot["address"].as<std::string>());
            const auto value = Word::from_hex(slot["value"].as<std::string>());
            if (!address || !value) {
                LOG_ERROR("Invalid slot data in snapshot");
                return std::unexpected(SnapshotError::INVALID_SLOT_DATA);
            }

            if (auto stored = backend.set(*address, *value); !stored) {
                LOG_ERROR("Backend rejected slot {}: {}", address->to_hex(), stored.error().what());
                return std::unexpected(SnapshotError::STORAGE_REJECTED);
            }
            ++loaded_count;
        }

        LOG_INFO("Snapshot loaded successfully ({} slots)", loaded_count);
        return loaded_count;
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Invalid snapshot data: {}", e.what());
        return std::unexpected(SnapshotError::INVALID_SLOT_DATA);
    }
}

} // namespace tessera::storage
