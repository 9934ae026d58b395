/**
 * @file world_inspector.cpp
 * @brief Command-line walkthrough of a Tessera world
 *
 * This example demonstrates:
 * 1. Loading an engine config (optional) and applying its logging section
 * 2. Registering namespaces and models from a YAML manifest
 * 3. Writing, reading and deleting records by keys, id and member
 * 4. Packed models and enum/array/byte-array members
 * 5. Saving the backend to a YAML snapshot and loading it back
 *
 * Usage:
 * @code
 * world_inspector [manifest.yaml] [config.yaml] [snapshot.yaml]
 * @endcode
 *
 * Without a manifest the built-in demo manifest below is used.
 *
 * @author LukeFrankio
 * @date 2025-10-15
 */

#include <tessera/core/config.hpp>
#include <tessera/core/hash.hpp>
#include <tessera/core/logging.hpp>
#include <tessera/layout/byte_array.hpp>
#include <tessera/storage/addressing.hpp>
#include <tessera/storage/memory_backend.hpp>
#include <tessera/storage/snapshot.hpp>
#include <tessera/world/manifest.hpp>
#include <tessera/world/permissions.hpp>
#include <tessera/world/world.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

using namespace tessera;
using namespace tessera::world;

namespace {

constexpr std::string_view DEMO_MANIFEST = R"(
namespaces:
  - arena
models:
  - namespace: arena
    name: Position
    keys:
      - name: player
        layout: { primitive: ContractAddress }
    layout:
      struct:
        - name: x
          layout: { primitive: u32 }
        - name: y
          layout: { primitive: u32 }
  - namespace: arena
    name: Profile
    keys:
      - name: player
        layout: { primitive: ContractAddress }
    layout:
      struct:
        - name: nickname
          layout: { byte_array: true }
        - name: badges
          layout: { array: { primitive: u8 } }
        - name: weapon
          layout:
            enum:
              - tag: 0
              - tag: 1
                layout: { primitive: u16 }
  - namespace: arena
    name: Stats
    packed: true
    keys:
      - name: player
        layout: { primitive: ContractAddress }
    layout:
      struct:
        - name: level
          layout: { primitive: u8 }
        - name: xp
          layout: { primitive: u64 }
        - name: alive
          layout: { primitive: bool }
)";

constexpr u64 ADMIN = 0xAD;
constexpr u64 PLAYER = 0x1234;

auto words_to_string(const std::vector<Word>& words) -> std::string {
    std::vector<std::string> hex;
    hex.reserve(words.size());
    for (const auto& word : words) {
        hex.push_back(word.to_hex());
    }
    return fmt::format("[{}]", fmt::join(hex, ", "));
}

/**
 * @brief Logs an error and returns the process exit code
 */
auto fail(std::string_view what, const Error& error) -> int {
    LOG_ERROR("{} failed: [{}] {}", what, to_string(error.code), error.what());
    return EXIT_FAILURE;
}

} // anonymous namespace

auto main(int argc, char** argv) -> int {
    EngineConfig config;
    if (argc > 2) {
        auto loaded = load_config(argv[2]);
        if (!loaded) {
            return fail("Loading config", loaded.error());
        }
        config = *loaded;
    }
    if (auto logging = apply_logging(config); !logging) {
        return fail("Configuring logging", logging.error());
    }

    LOG_INFO("=== Tessera World Inspector ===");

    auto manifest = argc > 1 ? load_manifest(argv[1]) : parse_manifest(DEMO_MANIFEST);
    if (!manifest) {
        return fail("Loading manifest", manifest.error());
    }

    storage::MemoryBackend backend;
    AccessControlList acl;
    World world(backend, acl, config);

    auto selectors = apply_manifest(world, ADMIN, *manifest);
    if (!selectors) {
        return fail("Applying manifest", selectors.error());
    }
    for (usize i = 0; i < selectors->size(); ++i) {
        const auto* record = world.registry().find((*selectors)[i]);
        LOG_INFO("Model '{}' v{} -> {} ({})", record->tag(), record->version,
                 (*selectors)[i].to_hex(), record->definition.layout.describe());
    }

    // the demo walkthrough only makes sense for the built-in models
    if (argc > 1) {
        LOG_INFO("Custom manifest applied, {} models registered", selectors->size());
        return EXIT_SUCCESS;
    }

    const auto& position = (*selectors)[0];
    const auto& profile = (*selectors)[1];
    const auto& stats = (*selectors)[2];
    const ModelIndex player_keys = IndexKeys{{Word{PLAYER}}};

    // ========== Plain struct model ==========

    if (auto written = world.set_entity(ADMIN, position, player_keys,
                                        std::vector<Word>{10, 20},
                                        world.registry().find(position)->definition.layout);
        !written) {
        return fail("Writing Position", written.error());
    }
    auto stored_position = world.entity(position, player_keys);
    if (!stored_position) {
        return fail("Reading Position", stored_position.error());
    }
    LOG_INFO("Position of {}: {}", Word{PLAYER}.to_hex(), words_to_string(*stored_position));

    auto player_id = storage::entity_id(std::vector<Word>{Word{PLAYER}});
    auto x_selector = hash::selector_from_name("x");
    if (!player_id || !x_selector) {
        return fail("Deriving ids", !player_id ? player_id.error() : x_selector.error());
    }
    if (auto moved = world.set_member(ADMIN, position, *player_id, *x_selector,
                                      std::vector<Word>{11});
        !moved) {
        return fail("Updating Position.x", moved.error());
    }
    auto x = world.get_member(position, *player_id, *x_selector);
    if (!x) {
        return fail("Reading Position.x", x.error());
    }
    LOG_INFO("Position.x after member write: {}", words_to_string(*x));

    // ========== Dynamic members ==========

    auto profile_values = layout::encode_byte_array("tessera_fan");
    profile_values.insert(profile_values.end(), {3, 1, 5, 9});  // badges
    profile_values.insert(profile_values.end(), {1, 42});       // weapon = variant 1 (42)

    const auto& profile_layout = world.registry().find(profile)->definition.layout;
    if (auto written = world.set_entity(ADMIN, profile, player_keys, profile_values, profile_layout);
        !written) {
        return fail("Writing Profile", written.error());
    }
    auto stored_profile = world.entity(profile, player_keys);
    if (!stored_profile) {
        return fail("Reading Profile", stored_profile.error());
    }
    LOG_INFO("Profile of {}: {}", Word{PLAYER}.to_hex(), words_to_string(*stored_profile));

    // ========== Packed model ==========

    const auto& stats_layout = world.registry().find(stats)->definition.layout;
    if (auto written = world.set_entity(ADMIN, stats, player_keys,
                                        std::vector<Word>{7, 123'456, 1}, stats_layout);
        !written) {
        return fail("Writing Stats", written.error());
    }
    auto stored_stats = world.entity(stats, player_keys);
    if (!stored_stats) {
        return fail("Reading Stats", stored_stats.error());
    }
    LOG_INFO("Stats of {} (packed into {} slots): {}", Word{PLAYER}.to_hex(),
             backend.slot_count(), words_to_string(*stored_stats));

    // ========== Permissions ==========

    if (auto denied = world.set_entity(Word{PLAYER}, position, player_keys,
                                       std::vector<Word>{0, 0},
                                       world.registry().find(position)->definition.layout);
        denied) {
        LOG_ERROR("Unauthorized write unexpectedly succeeded");
        return EXIT_FAILURE;
    } else {
        LOG_INFO("Write by {} rejected as expected: {}", Word{PLAYER}.to_hex(),
                 to_string(denied.error().code));
    }

    // ========== Snapshot ==========

    const std::filesystem::path snapshot_path =
        argc > 3 ? std::filesystem::path(argv[3])
                 : std::filesystem::temp_directory_path() / "tessera_inspector_snapshot.yaml";
    if (auto saved = storage::save_snapshot(backend, snapshot_path); !saved) {
        LOG_ERROR("Snapshot save failed: {}", storage::error_to_string(saved.error()));
        return EXIT_FAILURE;
    }

    if (auto deleted = world.delete_entity(ADMIN, position, player_keys,
                                           world.registry().find(position)->definition.layout);
        !deleted) {
        return fail("Deleting Position", deleted.error());
    }
    auto cleared = world.entity(position, player_keys);
    if (!cleared) {
        return fail("Reading deleted Position", cleared.error());
    }
    LOG_INFO("Position after delete: {}", words_to_string(*cleared));

    auto restored = storage::load_snapshot(backend, snapshot_path);
    if (!restored) {
        LOG_ERROR("Snapshot load failed: {}", storage::error_to_string(restored.error()));
        return EXIT_FAILURE;
    }
    auto reloaded = world.entity(position, player_keys);
    if (!reloaded) {
        return fail("Reading restored Position", reloaded.error());
    }
    LOG_INFO("Restored {} slots, Position is back to {}", *restored, words_to_string(*reloaded));

    LOG_INFO("=== Done ===");
    return EXIT_SUCCESS;
}
