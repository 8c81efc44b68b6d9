// =============================================================================
// credit_ledger_test.cpp
// =============================================================================
// Unit tests for bnpl::CreditLedger.
//
// Validates:
//   - Admin-only limit writes, with CreditLimitSet events after commit
//   - Batch limit writes are all-or-nothing
//   - useCredit / restoreCredit keep used <= limit and the active-draw flag
//   - unblock() is the only path out of default and is a no-op otherwise
//   - Utilization in basis points
// =============================================================================

#include "protocol_fixture.hpp"

#include "bnpl/errors/protocol_error.hpp"

#include <gtest/gtest.h>

class CreditLedgerTest : public ProtocolFixture {};

// -----------------------------------------------------------------------------
// 1. setLimit stores the limit and emits CreditLimitSet.
// -----------------------------------------------------------------------------
TEST_F(CreditLedgerTest, SetLimitStoresAndEmits) {
  credit.setLimit(kAdmin, "alice", 1000);

  EXPECT_EQ(credit.limitOf("alice"), 1000u);
  EXPECT_EQ(credit.availableCredit("alice"), 1000u);
  EXPECT_TRUE(credit.isEligible("alice", 1000));
  EXPECT_FALSE(credit.isEligible("alice", 1001));

  const auto emitted = eventsOf<bnpl::CreditLimitSetEvent>();
  ASSERT_EQ(emitted.size(), 1u);
  EXPECT_EQ(emitted[0].user, "alice");
  EXPECT_EQ(emitted[0].limit, 1000u);
  EXPECT_EQ(emitted[0].sequence_id, 1u);
  EXPECT_EQ(bnpl::timestamp_to_ms(emitted[0].timestamp), kStartMs);
}

// -----------------------------------------------------------------------------
// 2. Rejections: non-admin, empty user, zero limit.
// -----------------------------------------------------------------------------
TEST_F(CreditLedgerTest, SetLimitRejections) {
  EXPECT_THROW(credit.setLimit("mallory", "alice", 1000),
               bnpl::AuthorizationError);
  EXPECT_THROW(credit.setLimit(kAdmin, "", 1000), bnpl::ValidationError);
  EXPECT_THROW(credit.setLimit(kAdmin, "alice", 0), bnpl::ValidationError);

  EXPECT_EQ(credit.limitOf("alice"), 0u);
  EXPECT_TRUE(events.empty());
}

// -----------------------------------------------------------------------------
// 3. A limit can never drop below what is already drawn.
// -----------------------------------------------------------------------------
TEST_F(CreditLedgerTest, LimitBelowUsedIsRejected) {
  credit.setLimit(kAdmin, "alice", 1000);
  credit.useCredit(kOrchestrator, "alice", 600);

  EXPECT_THROW(credit.setLimit(kAdmin, "alice", 599),
               bnpl::StateConflictError);
  EXPECT_NO_THROW(credit.setLimit(kAdmin, "alice", 600));
  EXPECT_EQ(credit.availableCredit("alice"), 0u);
}

// -----------------------------------------------------------------------------
// 4. Batch: one bad entry leaves every account untouched.
//    Why: the whole batch runs inside a single journal scope.
// -----------------------------------------------------------------------------
TEST_F(CreditLedgerTest, BatchIsAllOrNothing) {
  credit.setLimit(kAdmin, "alice", 100);
  events.clear();

  EXPECT_THROW(credit.batchSetLimits(kAdmin, {"alice", "bob", "carol"},
                                     {500, 700, 0}),
               bnpl::ValidationError);

  EXPECT_EQ(credit.limitOf("alice"), 100u);
  EXPECT_EQ(credit.limitOf("bob"), 0u);
  EXPECT_TRUE(events.empty());

  credit.batchSetLimits(kAdmin, {"alice", "bob"}, {500, 700});
  EXPECT_EQ(credit.limitOf("alice"), 500u);
  EXPECT_EQ(credit.limitOf("bob"), 700u);
  EXPECT_EQ(eventsOf<bnpl::CreditLimitSetEvent>().size(), 2u);
}

TEST_F(CreditLedgerTest, BatchLengthMismatchAndEmptyBatch) {
  EXPECT_THROW(credit.batchSetLimits(kAdmin, {"alice", "bob"}, {500}),
               bnpl::ValidationError);
  EXPECT_NO_THROW(credit.batchSetLimits(kAdmin, {}, {}));
  EXPECT_TRUE(events.empty());
}

// -----------------------------------------------------------------------------
// 5. useCredit opens exactly one draw; restoreCredit closes it.
// -----------------------------------------------------------------------------
TEST_F(CreditLedgerTest, UseAndRestoreCredit) {
  credit.setLimit(kAdmin, "alice", 1000);

  credit.useCredit(kOrchestrator, "alice", 400);
  EXPECT_EQ(credit.usedOf("alice"), 400u);
  EXPECT_TRUE(credit.hasActiveCredit("alice"));
  EXPECT_EQ(credit.utilizationBps("alice"), 4000u);

  // Second draw while one is open.
  EXPECT_THROW(credit.useCredit(kOrchestrator, "alice", 100),
               bnpl::StateConflictError);

  credit.restoreCredit(kOrchestrator, "alice", 400);
  EXPECT_EQ(credit.usedOf("alice"), 0u);
  EXPECT_FALSE(credit.hasActiveCredit("alice"));
  EXPECT_EQ(credit.utilizationBps("alice"), 0u);
}

TEST_F(CreditLedgerTest, UseCreditRejections) {
  credit.setLimit(kAdmin, "alice", 1000);

  EXPECT_THROW(credit.useCredit(kAdmin, "alice", 100),
               bnpl::AuthorizationError);
  EXPECT_THROW(credit.useCredit(kOrchestrator, "alice", 0),
               bnpl::ValidationError);
  EXPECT_THROW(credit.useCredit(kOrchestrator, "alice", 1001),
               bnpl::StateConflictError);
  EXPECT_THROW(credit.restoreCredit(kOrchestrator, "alice", 1),
               bnpl::StateConflictError);
  EXPECT_EQ(credit.usedOf("alice"), 0u);
}

// -----------------------------------------------------------------------------
// 6. Defaulted users cannot draw until the admin unblocks them.
// -----------------------------------------------------------------------------
TEST_F(CreditLedgerTest, DefaultBlocksUntilUnblock) {
  credit.setLimit(kAdmin, "alice", 1000);

  EXPECT_THROW(credit.markDefaulted(kOrchestrator, "alice"),
               bnpl::AuthorizationError);
  credit.markDefaulted(kDetector, "alice");
  EXPECT_TRUE(credit.isDefaulted("alice"));
  EXPECT_FALSE(credit.isEligible("alice", 100));
  EXPECT_THROW(credit.useCredit(kOrchestrator, "alice", 100),
               bnpl::StateConflictError);

  EXPECT_THROW(credit.unblock("mallory", "alice"), bnpl::AuthorizationError);
  credit.unblock(kAdmin, "alice");
  EXPECT_FALSE(credit.isDefaulted("alice"));
  EXPECT_TRUE(credit.isEligible("alice", 100));

  const auto unblocked = eventsOf<bnpl::UserUnblockedEvent>();
  ASSERT_EQ(unblocked.size(), 1u);
  EXPECT_EQ(unblocked[0].user, "alice");
}

TEST_F(CreditLedgerTest, UnblockOfGoodStandingUserIsNoOp) {
  credit.setLimit(kAdmin, "alice", 1000);
  events.clear();

  EXPECT_NO_THROW(credit.unblock(kAdmin, "alice"));
  EXPECT_TRUE(events.empty());
  EXPECT_EQ(credit.limitOf("alice"), 1000u);
}

// -----------------------------------------------------------------------------
// 7. Unknown users read as zeroed accounts.
// -----------------------------------------------------------------------------
TEST_F(CreditLedgerTest, UnknownUserReadsAsEmpty) {
  const bnpl::domain::CreditAccount acct = credit.account("nobody");
  EXPECT_EQ(acct.limit, 0u);
  EXPECT_EQ(acct.used, 0u);
  EXPECT_FALSE(acct.defaulted);
  EXPECT_FALSE(credit.isEligible("nobody", 1));
  EXPECT_FALSE(credit.isEligible("", 1));
  EXPECT_EQ(credit.utilizationBps("nobody"), 0u);
}
