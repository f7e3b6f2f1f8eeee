#include <gtest/gtest.h>

#include "domain/AssetClass.hpp"
#include "domain/Role.hpp"
#include "domain/TenantTier.hpp"

using namespace orion::security::domain;

// ============================================
// ROLE NAMES
// ============================================

TEST(RoleTest, ToString_CanonicalNames) {
    EXPECT_EQ(toString(Role::TRADER), "ROLE_TRADER");
    EXPECT_EQ(toString(Role::SALES), "ROLE_SALES");
    EXPECT_EQ(toString(Role::RISK), "ROLE_RISK");
    EXPECT_EQ(toString(Role::ANALYST), "ROLE_ANALYST");
    EXPECT_EQ(toString(Role::ADMIN), "ROLE_ADMIN");
    EXPECT_EQ(toString(Role::PLATFORM), "ROLE_PLATFORM");
}

TEST(RoleTest, FromString_KnownNames) {
    for (Role role : allRoles()) {
        auto parsed = roleFromString(toString(role));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, role);
    }
}

TEST(RoleTest, FromString_UnknownName_ReturnsNullopt) {
    EXPECT_FALSE(roleFromString("ROLE_SUPERUSER").has_value());
    EXPECT_FALSE(roleFromString("TRADER").has_value());
    EXPECT_FALSE(roleFromString("role_trader").has_value());
    EXPECT_FALSE(roleFromString("").has_value());
}

TEST(RoleTest, IsKnownRole) {
    EXPECT_TRUE(isKnownRole("ROLE_ADMIN"));
    EXPECT_FALSE(isKnownRole("ROLE_AUDITOR"));
}

// ============================================
// HIERARCHY
// ============================================

TEST(RoleTest, ImpliedRoles_Admin) {
    std::set<Role> expected = {Role::TRADER, Role::SALES, Role::RISK, Role::ANALYST};
    EXPECT_EQ(impliedRoles(Role::ADMIN), expected);
}

TEST(RoleTest, ImpliedRoles_Sales) {
    std::set<Role> expected = {Role::TRADER};
    EXPECT_EQ(impliedRoles(Role::SALES), expected);
}

TEST(RoleTest, ImpliedRoles_LeafRolesImplyNothing) {
    EXPECT_TRUE(impliedRoles(Role::TRADER).empty());
    EXPECT_TRUE(impliedRoles(Role::RISK).empty());
    EXPECT_TRUE(impliedRoles(Role::ANALYST).empty());
    EXPECT_TRUE(impliedRoles(Role::PLATFORM).empty());
}

TEST(RoleTest, Implies_Reflexive) {
    for (Role role : allRoles()) {
        EXPECT_TRUE(implies(role, role)) << toString(role);
    }
}

TEST(RoleTest, Implies_AdminDoesNotImplyPlatform) {
    EXPECT_FALSE(implies(Role::ADMIN, Role::PLATFORM));
}

TEST(RoleTest, Implies_PlatformDisjoint) {
    for (Role role : allRoles()) {
        if (role == Role::PLATFORM) {
            continue;
        }
        EXPECT_FALSE(implies(Role::PLATFORM, role)) << toString(role);
        EXPECT_FALSE(implies(role, Role::PLATFORM)) << toString(role);
    }
}

TEST(RoleTest, Implies_Asymmetric) {
    EXPECT_TRUE(implies(Role::SALES, Role::TRADER));
    EXPECT_FALSE(implies(Role::TRADER, Role::SALES));
    EXPECT_FALSE(implies(Role::TRADER, Role::ADMIN));
}

// ============================================
// ASSET CLASS / TENANT TIER
// ============================================

TEST(AssetClassTest, RoundTripNames) {
    for (AssetClass assetClass : allAssetClasses()) {
        EXPECT_EQ(assetClassFromString(toString(assetClass)), assetClass);
    }
    EXPECT_FALSE(assetClassFromString("CRYPTO").has_value());
}

TEST(TenantTierTest, Names) {
    EXPECT_EQ(toString(TenantTier::STANDARD), "standard");
    EXPECT_EQ(toString(TenantTier::ENTERPRISE), "enterprise");
    EXPECT_EQ(tenantTierFromString("premium"), TenantTier::PREMIUM);
    EXPECT_FALSE(tenantTierFromString("PREMIUM").has_value());
}
