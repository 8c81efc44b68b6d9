// =============================================================================
// journal_test.cpp
// =============================================================================
// Unit tests for bnpl::Journal.
//
// Validates:
//   - Outermost commit keeps mutations and runs commit actions in order
//   - A scope destroyed without commit replays undo closures newest-first
//   - Nested scopes: inner commit defers to the outer scope
//   - Inner rollback under a surviving outer scope drops only its own records
//   - Outside any scope recordUndo is a no-op and onCommit runs immediately
//   - A throwing commit action does not stop the others
// =============================================================================

#include "bnpl/ledger/journal.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

class JournalTest : public ::testing::Test {
 protected:
  bnpl::Journal journal;
  int value = 0;

  // Journaled write of `value`.
  void set(int next) {
    const int previous = value;
    journal.recordUndo([this, previous] { value = previous; });
    value = next;
  }
};

// -----------------------------------------------------------------------------
// 1. A committed scope keeps its writes and runs commit actions in order.
// -----------------------------------------------------------------------------
TEST_F(JournalTest, CommitKeepsWritesAndRunsActions) {
  std::vector<std::string> ran;
  {
    bnpl::Journal::Scope scope(journal);
    set(1);
    journal.onCommit([&ran] { ran.push_back("a"); });
    journal.onCommit([&ran] { ran.push_back("b"); });
    EXPECT_TRUE(ran.empty());
    scope.commit();
  }
  EXPECT_EQ(value, 1);
  EXPECT_EQ(ran, (std::vector<std::string>{"a", "b"}));
  EXPECT_FALSE(journal.inTransaction());
  EXPECT_EQ(journal.pendingUndoCount(), 0u);
}

// -----------------------------------------------------------------------------
// 2. An exception leaving the scope restores every write, newest first.
// -----------------------------------------------------------------------------
TEST_F(JournalTest, ExceptionRollsBackAllWrites) {
  bool action_ran = false;
  try {
    bnpl::Journal::Scope scope(journal);
    set(1);
    set(2);
    set(3);
    journal.onCommit([&action_ran] { action_ran = true; });
    throw std::runtime_error("boom");
  } catch (const std::runtime_error&) {
  }
  EXPECT_EQ(value, 0);
  EXPECT_FALSE(action_ran);
  EXPECT_EQ(journal.depth(), 0u);
}

// -----------------------------------------------------------------------------
// 3. Inner commit hands its records to the outer scope; an outer failure
//    still undoes them.
// -----------------------------------------------------------------------------
TEST_F(JournalTest, OuterRollbackUndoesCommittedInnerScope) {
  bool action_ran = false;
  try {
    bnpl::Journal::Scope outer(journal);
    {
      bnpl::Journal::Scope inner(journal);
      set(5);
      journal.onCommit([&action_ran] { action_ran = true; });
      inner.commit();
    }
    EXPECT_EQ(value, 5);
    EXPECT_FALSE(action_ran);
    throw std::runtime_error("outer fails");
  } catch (const std::runtime_error&) {
  }
  EXPECT_EQ(value, 0);
  EXPECT_FALSE(action_ran);
}

// -----------------------------------------------------------------------------
// 4. An inner scope rolled back under a surviving outer scope drops only its
//    own writes and actions.
// -----------------------------------------------------------------------------
TEST_F(JournalTest, InnerRollbackKeepsOuterRecords) {
  std::vector<int> ran;
  {
    bnpl::Journal::Scope outer(journal);
    set(1);
    journal.onCommit([&ran] { ran.push_back(1); });
    try {
      bnpl::Journal::Scope inner(journal);
      set(2);
      journal.onCommit([&ran] { ran.push_back(2); });
      throw std::runtime_error("inner fails");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(value, 1);
    set(3);
    journal.onCommit([&ran] { ran.push_back(3); });
    outer.commit();
  }
  EXPECT_EQ(value, 3);
  EXPECT_EQ(ran, (std::vector<int>{1, 3}));
}

// -----------------------------------------------------------------------------
// 5. With no scope open, undo is not recorded and actions run at once.
// -----------------------------------------------------------------------------
TEST_F(JournalTest, OutsideScopeActionsRunImmediately) {
  bool ran = false;
  set(9);
  journal.onCommit([&ran] { ran = true; });
  EXPECT_TRUE(ran);
  EXPECT_EQ(journal.pendingUndoCount(), 0u);
  EXPECT_EQ(value, 9);
}

// -----------------------------------------------------------------------------
// 6. A commit action that throws after the commit is final is logged; the
//    actions registered after it still run and commit() does not throw.
// Why: a failed side effect (a custody freeze) must not drop the events
//      queued behind it nor report a committed operation as failed.
// -----------------------------------------------------------------------------
TEST_F(JournalTest, ThrowingCommitActionDoesNotDropLaterActions) {
  std::vector<int> ran;
  {
    bnpl::Journal::Scope scope(journal);
    set(4);
    journal.onCommit([&ran] { ran.push_back(1); });
    journal.onCommit([] { throw std::runtime_error("custody unreachable"); });
    journal.onCommit([&ran] { ran.push_back(3); });
    EXPECT_NO_THROW(scope.commit());
  }
  EXPECT_EQ(value, 4);
  EXPECT_EQ(ran, (std::vector<int>{1, 3}));
  EXPECT_FALSE(journal.inTransaction());
  EXPECT_EQ(journal.pendingUndoCount(), 0u);
}
