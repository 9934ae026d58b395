/**
 * @file test_permissions.cpp
 * @brief Tests for the owner/writer access control list
 *
 * @author LukeFrankio
 * @date 2025-10-13
 */

#include <tessera/world/permissions.hpp>

#include <gtest/gtest.h>

using namespace tessera;
using namespace tessera::world;

namespace {

const Word ADMIN = 0xAD;
const Word SYSTEM = 0x5E;
const Word STRANGER = 0x99;
const Word NAMESPACE = 0x1000;
const Word MODEL = 0x2000;

} // anonymous namespace

class AccessControlListTest : public ::testing::Test {
protected:
    AccessControlList acl;
};

TEST_F(AccessControlListTest, NobodyCanWriteByDefault) {
    EXPECT_FALSE(acl.can_write(ADMIN, MODEL));
    EXPECT_FALSE(acl.is_owner(ADMIN, MODEL));
    EXPECT_FALSE(acl.is_writer(ADMIN, MODEL));
}

TEST_F(AccessControlListTest, OwnersAndWritersCanWrite) {
    acl.grant_owner(ADMIN, MODEL);
    acl.grant_writer(SYSTEM, MODEL);

    EXPECT_TRUE(acl.can_write(ADMIN, MODEL));
    EXPECT_TRUE(acl.can_write(SYSTEM, MODEL));
    EXPECT_FALSE(acl.can_write(STRANGER, MODEL));

    EXPECT_TRUE(acl.is_owner(ADMIN, MODEL));
    EXPECT_FALSE(acl.is_owner(SYSTEM, MODEL));
}

TEST_F(AccessControlListTest, GrantsArePerResource) {
    acl.grant_writer(SYSTEM, MODEL);
    EXPECT_FALSE(acl.can_write(SYSTEM, Word{0x3000}));
}

TEST_F(AccessControlListTest, NamespaceGrantsAreInherited) {
    acl.grant_owner(ADMIN, NAMESPACE);
    acl.grant_writer(SYSTEM, NAMESPACE);

    EXPECT_FALSE(acl.can_write(SYSTEM, MODEL));
    acl.bind_namespace(MODEL, NAMESPACE);

    EXPECT_TRUE(acl.can_write(ADMIN, MODEL));
    EXPECT_TRUE(acl.can_write(SYSTEM, MODEL));
    EXPECT_FALSE(acl.can_write(STRANGER, MODEL));

    // inheritance grants write access, not model ownership
    EXPECT_FALSE(acl.is_owner(ADMIN, MODEL));
}

TEST_F(AccessControlListTest, RevokeRemovesAccess) {
    acl.grant_owner(ADMIN, MODEL);
    acl.grant_writer(SYSTEM, MODEL);

    acl.revoke_writer(SYSTEM, MODEL);
    EXPECT_FALSE(acl.can_write(SYSTEM, MODEL));

    acl.revoke_owner(ADMIN, MODEL);
    EXPECT_FALSE(acl.can_write(ADMIN, MODEL));

    // revoking what was never granted is harmless
    acl.revoke_writer(STRANGER, Word{0x4000});
    EXPECT_FALSE(acl.can_write(STRANGER, Word{0x4000}));
}

TEST_F(AccessControlListTest, UsableThroughInterface) {
    Permissions& permissions = acl;
    permissions.grant_owner(ADMIN, MODEL);
    EXPECT_TRUE(permissions.can_write(ADMIN, MODEL));
    EXPECT_TRUE(permissions.is_owner(ADMIN, MODEL));
}
