// =============================================================================
// permission_table_test.cpp
// =============================================================================
// Unit tests for bnpl::PermissionTable and bnpl::ReentrancyGuard.
// =============================================================================

#include "bnpl/access/permission_table.hpp"
#include "bnpl/concurrent/reentrancy_guard.hpp"
#include "bnpl/errors/protocol_error.hpp"

#include <gtest/gtest.h>

class PermissionTableTest : public ::testing::Test {
 protected:
  bnpl::PermissionTable table{"TestComponent", "admin"};
};

TEST_F(PermissionTableTest, AdminIsInstalledAtConstruction) {
  EXPECT_TRUE(table.holds(bnpl::Role::Admin, "admin"));
  EXPECT_EQ(table.holder(bnpl::Role::Admin), "admin");
  EXPECT_NO_THROW(table.require(bnpl::Role::Admin, "admin", "test"));
}

TEST_F(PermissionTableTest, EmptyAdminIsRejected) {
  EXPECT_THROW(bnpl::PermissionTable("X", ""), bnpl::ValidationError);
}

// An unassigned role matches nobody, including the empty caller.
TEST_F(PermissionTableTest, UnassignedRoleMatchesNobody) {
  EXPECT_TRUE(table.holder(bnpl::Role::Orchestrator).empty());
  EXPECT_FALSE(table.holds(bnpl::Role::Orchestrator, ""));
  EXPECT_THROW(table.require(bnpl::Role::Orchestrator, "anyone", "test"),
               bnpl::AuthorizationError);
}

TEST_F(PermissionTableTest, AssignReplacesHolder) {
  table.assign("admin", bnpl::Role::Orchestrator, "orch-1");
  EXPECT_TRUE(table.holds(bnpl::Role::Orchestrator, "orch-1"));

  table.assign("admin", bnpl::Role::Orchestrator, "orch-2");
  EXPECT_FALSE(table.holds(bnpl::Role::Orchestrator, "orch-1"));
  EXPECT_TRUE(table.holds(bnpl::Role::Orchestrator, "orch-2"));
}

TEST_F(PermissionTableTest, OnlyAdminMayAssign) {
  EXPECT_THROW(table.assign("mallory", bnpl::Role::Orchestrator, "mallory"),
               bnpl::AuthorizationError);
  EXPECT_THROW(table.assign("admin", bnpl::Role::Orchestrator, ""),
               bnpl::ValidationError);
}

// No hierarchy: the admin does not implicitly hold other roles.
TEST_F(PermissionTableTest, AdminDoesNotImplyOtherRoles) {
  table.assign("admin", bnpl::Role::Orchestrator, "orch");
  EXPECT_THROW(table.require(bnpl::Role::Orchestrator, "admin", "test"),
               bnpl::AuthorizationError);
  EXPECT_NO_THROW(table.requireAny(
      {bnpl::Role::Admin, bnpl::Role::Orchestrator}, "admin", "test"));
  EXPECT_NO_THROW(table.requireAny(
      {bnpl::Role::Admin, bnpl::Role::Orchestrator}, "orch", "test"));
  EXPECT_THROW(table.requireAny({bnpl::Role::Admin, bnpl::Role::Orchestrator},
                                "detector", "test"),
               bnpl::AuthorizationError);
}

// -----------------------------------------------------------------------------
// ReentrancyGuard
// -----------------------------------------------------------------------------
TEST(ReentrancyGuardTest, NestedGuardThrowsAndFlagIsReleased) {
  bool entered = false;
  {
    bnpl::ReentrancyGuard outer(entered, "Test");
    EXPECT_TRUE(entered);
    try {
      bnpl::ReentrancyGuard inner(entered, "Test");
      FAIL() << "nested guard must throw";
    } catch (const bnpl::ReentrancyError& e) {
      EXPECT_EQ(e.kind(), bnpl::ErrorKind::Reentrancy);
    }
    // The failed inner guard must not have cleared the outer one's flag.
    EXPECT_TRUE(entered);
  }
  EXPECT_FALSE(entered);
}

TEST(ReentrancyGuardTest, ReleasedOnException) {
  bool entered = false;
  try {
    bnpl::ReentrancyGuard guard(entered, "Test");
    throw bnpl::StateConflictError("fails mid-call");
  } catch (const bnpl::StateConflictError&) {
  }
  EXPECT_FALSE(entered);
}
