/**
 * @file test_registry.cpp
 * @brief Tests for model registration and upgrades
 *
 * @author LukeFrankio
 * @date 2025-10-13
 */

#include <tessera/world/registry.hpp>
#include <tessera/world/naming.hpp>
#include <tessera/core/hash.hpp>

#include <gtest/gtest.h>

using namespace tessera;
using namespace tessera::world;
using layout::FieldLayout;
using layout::Layout;

namespace {

const Word ADMIN = 0xAD;
const Word OTHER = 0x0B;

auto field(std::string_view name, Layout layout) -> FieldLayout {
    return FieldLayout{*hash::selector_from_name(name), std::move(layout)};
}

auto position_definition() -> ModelDefinition {
    return ModelDefinition{
        .namespace_name = "arena",
        .name = "Position",
        .keys = {KeyField{"player", Layout::fixed({251})}},
        .layout = Layout::structure({
            field("x", Layout::fixed({32})),
            field("y", Layout::fixed({32})),
        }),
        .packed = false,
    };
}

/**
 * @brief Policy that refuses every upgrade
 */
class FrozenUpgradePolicy final : public UpgradePolicy {
public:
    [[nodiscard]] auto check(const Layout&, const Layout&) const -> Result<void> override {
        return make_error(ErrorCode::WORLD_UPGRADE_REJECTED, "Models are frozen");
    }
};

} // anonymous namespace

class RegistryTest : public ::testing::Test {
protected:
    AccessControlList acl;
    ModelRegistry registry{acl};
};

// ========== Namespaces ==========

TEST_F(RegistryTest, RegisterNamespaceGrantsOwnership) {
    const auto selector = registry.register_namespace(ADMIN, "arena");
    ASSERT_TRUE(selector.has_value());
    EXPECT_EQ(*selector, *bytearray_hash("arena"));
    EXPECT_TRUE(registry.has_namespace(*selector));
    EXPECT_TRUE(acl.is_owner(ADMIN, *selector));
    EXPECT_EQ(registry.namespace_count(), 1u);
}

TEST_F(RegistryTest, DuplicateNamespaceConflicts) {
    ASSERT_TRUE(registry.register_namespace(ADMIN, "arena").has_value());
    const auto again = registry.register_namespace(OTHER, "arena");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::WORLD_RESOURCE_CONFLICT);
    EXPECT_FALSE(acl.is_owner(OTHER, *bytearray_hash("arena")));
}

TEST_F(RegistryTest, InvalidNamespaceName) {
    EXPECT_EQ(registry.register_namespace(ADMIN, "bad-name").error().code,
              ErrorCode::WORLD_INVALID_NAME);
    EXPECT_EQ(registry.register_namespace(ADMIN, "").error().code, ErrorCode::WORLD_INVALID_NAME);
    EXPECT_EQ(registry.namespace_count(), 0u);
}

// ========== Model creation ==========

TEST_F(RegistryTest, RegisterModelCreatesRecord) {
    const auto selector = registry.register_model(ADMIN, position_definition());
    ASSERT_TRUE(selector.has_value()) << selector.error().what();
    EXPECT_EQ(*selector, *selector_from_tag("arena-Position"));

    const auto* record = registry.find(*selector);
    ASSERT_NE(record, nullptr);
    EXPECT_EQ(record->version, 1u);
    EXPECT_EQ(record->tag(), "arena-Position");
    EXPECT_EQ(record->namespace_hash, *bytearray_hash("arena"));
    EXPECT_EQ(record->name_hash, *bytearray_hash("Position"));
    EXPECT_TRUE(record->packed_sizes.empty());

    // namespace created on demand, caller owns both
    EXPECT_TRUE(registry.has_namespace(record->namespace_hash));
    EXPECT_TRUE(acl.is_owner(ADMIN, record->namespace_hash));
    EXPECT_TRUE(acl.is_owner(ADMIN, *selector));
}

TEST_F(RegistryTest, ModelInForeignNamespaceIsUnauthorized) {
    ASSERT_TRUE(registry.register_namespace(ADMIN, "arena").has_value());
    const auto result = registry.register_model(OTHER, position_definition());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::WORLD_UNAUTHORIZED);
    EXPECT_EQ(registry.model_count(), 0u);
}

TEST_F(RegistryTest, NamespaceWritersInheritModelAccess) {
    ASSERT_TRUE(registry.register_namespace(ADMIN, "arena").has_value());
    acl.grant_writer(OTHER, *bytearray_hash("arena"));

    const auto selector = registry.register_model(ADMIN, position_definition());
    ASSERT_TRUE(selector.has_value());
    EXPECT_TRUE(acl.can_write(OTHER, *selector));
}

TEST_F(RegistryTest, RejectsInvalidDefinitions) {
    auto bad_name = position_definition();
    bad_name.name = "Posi tion";
    EXPECT_EQ(registry.register_model(ADMIN, bad_name).error().code, ErrorCode::WORLD_INVALID_NAME);

    auto no_keys = position_definition();
    no_keys.keys.clear();
    EXPECT_EQ(registry.register_model(ADMIN, no_keys).error().code,
              ErrorCode::CORE_INVALID_ARGUMENT);

    auto bad_key = position_definition();
    bad_key.keys[0].name = "player-id";
    EXPECT_EQ(registry.register_model(ADMIN, bad_key).error().code, ErrorCode::WORLD_INVALID_NAME);

    auto array_root = position_definition();
    array_root.layout = Layout::array(Layout::fixed({8}));
    EXPECT_EQ(registry.register_model(ADMIN, array_root).error().code,
              ErrorCode::ENGINE_UNEXPECTED_LAYOUT_TYPE);

    auto too_wide = position_definition();
    too_wide.layout = Layout::fixed({252});
    EXPECT_EQ(registry.register_model(ADMIN, too_wide).error().code,
              ErrorCode::LAYOUT_INVALID_FIELD_SIZE);

    auto duplicate = position_definition();
    duplicate.layout = Layout::structure({
        field("x", Layout::fixed({32})),
        field("x", Layout::fixed({32})),
    });
    EXPECT_EQ(registry.register_model(ADMIN, duplicate).error().code,
              ErrorCode::LAYOUT_DUPLICATE_SELECTOR);

    EXPECT_EQ(registry.model_count(), 0u);
}

TEST_F(RegistryTest, PackedModelsMustBeFixedSize) {
    auto packed = position_definition();
    packed.packed = true;
    const auto selector = registry.register_model(ADMIN, packed);
    ASSERT_TRUE(selector.has_value());
    EXPECT_EQ(registry.find(*selector)->packed_sizes, (std::vector<u8>{32, 32}));

    auto dynamic = position_definition();
    dynamic.name = "Inventory";
    dynamic.packed = true;
    dynamic.layout = Layout::structure({field("items", Layout::array(Layout::fixed({8})))});
    EXPECT_EQ(registry.register_model(ADMIN, dynamic).error().code, ErrorCode::LAYOUT_NOT_PACKABLE);
}

// ========== Upgrades ==========

TEST_F(RegistryTest, UpgradeBumpsVersionAndKeepsSelector) {
    const auto selector = registry.register_model(ADMIN, position_definition());
    ASSERT_TRUE(selector.has_value());

    auto upgraded = position_definition();
    upgraded.layout = Layout::structure({
        field("x", Layout::fixed({32})),
        field("y", Layout::fixed({32})),
        field("z", Layout::fixed({32})),
    });
    const auto again = registry.register_model(ADMIN, upgraded);
    ASSERT_TRUE(again.has_value()) << again.error().what();
    EXPECT_EQ(*again, *selector);

    const auto* record = registry.find(*selector);
    EXPECT_EQ(record->version, 2u);
    EXPECT_EQ(record->definition.layout, upgraded.layout);
    EXPECT_EQ(registry.model_count(), 1u);
}

TEST_F(RegistryTest, UpgradeByNonOwnerIsUnauthorized) {
    ASSERT_TRUE(registry.register_model(ADMIN, position_definition()).has_value());
    EXPECT_EQ(registry.register_model(OTHER, position_definition()).error().code,
              ErrorCode::WORLD_UNAUTHORIZED);
}

TEST_F(RegistryTest, UpgradeCannotChangeKeysOrPacking) {
    const auto selector = registry.register_model(ADMIN, position_definition());
    ASSERT_TRUE(selector.has_value());

    auto new_keys = position_definition();
    new_keys.keys.push_back(KeyField{"slot", Layout::fixed({8})});
    EXPECT_EQ(registry.register_model(ADMIN, new_keys).error().code,
              ErrorCode::WORLD_UPGRADE_REJECTED);

    auto now_packed = position_definition();
    now_packed.packed = true;
    EXPECT_EQ(registry.register_model(ADMIN, now_packed).error().code,
              ErrorCode::WORLD_UPGRADE_REJECTED);

    EXPECT_EQ(registry.find(*selector)->version, 1u);
}

TEST_F(RegistryTest, UpgradeMustSatisfyPolicy) {
    ASSERT_TRUE(registry.register_model(ADMIN, position_definition()).has_value());

    auto shrunk = position_definition();
    shrunk.layout = Layout::structure({field("x", Layout::fixed({32}))});
    EXPECT_EQ(registry.register_model(ADMIN, shrunk).error().code,
              ErrorCode::WORLD_UPGRADE_REJECTED);
}

TEST_F(RegistryTest, PackedUpgradeMayOnlyAppend) {
    auto packed = position_definition();
    packed.packed = true;
    const auto selector = registry.register_model(ADMIN, packed);
    ASSERT_TRUE(selector.has_value());

    // struct policy allows inserting a field in front, packing does not
    auto inserted = packed;
    inserted.layout = Layout::structure({
        field("w", Layout::fixed({8})),
        field("x", Layout::fixed({32})),
        field("y", Layout::fixed({32})),
    });
    EXPECT_EQ(registry.register_model(ADMIN, inserted).error().code,
              ErrorCode::WORLD_UPGRADE_REJECTED);

    auto widened = packed;
    widened.layout = Layout::structure({
        field("x", Layout::fixed({64})),
        field("y", Layout::fixed({32})),
    });
    EXPECT_EQ(registry.register_model(ADMIN, widened).error().code,
              ErrorCode::WORLD_UPGRADE_REJECTED);

    auto appended = packed;
    appended.layout = Layout::structure({
        field("x", Layout::fixed({32})),
        field("y", Layout::fixed({32})),
        field("z", Layout::fixed({1})),
    });
    ASSERT_TRUE(registry.register_model(ADMIN, appended).has_value());
    EXPECT_EQ(registry.find(*selector)->packed_sizes, (std::vector<u8>{32, 32, 1}));
    EXPECT_EQ(registry.find(*selector)->version, 2u);
}

TEST(RegistryPolicyTest, CustomPolicyIsConsulted) {
    AccessControlList acl;
    ModelRegistry registry(acl, std::make_unique<FrozenUpgradePolicy>());

    ASSERT_TRUE(registry.register_model(ADMIN, position_definition()).has_value());
    const auto again = registry.register_model(ADMIN, position_definition());
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::WORLD_UPGRADE_REJECTED);
    EXPECT_EQ(again.error().what(), "Models are frozen");
}

TEST_F(RegistryTest, UnknownSelectorIsNotFound) {
    EXPECT_EQ(registry.find(Word{42}), nullptr);
    EXPECT_FALSE(registry.contains(Word{42}));
}
