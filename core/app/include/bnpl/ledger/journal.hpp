#pragma once

#include <cstddef>
#include <functional>
#include <vector>

namespace bnpl {

// -----------------------------------------------------------------------------
// Journal: shared undo log giving cross-ledger atomicity
// -----------------------------------------------------------------------------
//
// @brief  Records how to undo every mutation made by the operation in flight,
//         and defers side effects (mirrored events) until that operation
//         commits.
//
// @details
// The four components (LoanOrchestrator, CreditLedger, LiquidityLedger,
// DefaultDetector) are separate objects, but a single external call such as
// createLoan() mutates three of them. Either all of those mutations survive
// or none do. All components are constructed with a reference to the same
// Journal, and follow one discipline:
//
//   1. Every public entry point opens a Journal::Scope on entry.
//   2. Before mutating a field, the component calls recordUndo() with a
//      closure that restores the previous value.
//   3. Side effects that must not escape a failed operation (EventMirror
//      publishes) are registered with onCommit().
//   4. On success the entry point calls scope.commit() as its last step.
//
// If an exception leaves the scope before commit(), the destructor replays
// the undo closures recorded since the scope opened, newest first, and drops
// the commit actions registered since then. Scopes nest: an entry point
// called from inside another (Orchestrator → CreditLedger::useCredit) opens an
// inner scope whose commit simply hands its records to the enclosing scope.
// Only the outermost commit clears the undo log and runs the commit actions.
//
// An inner scope that fails while the outer one catches the exception (the
// batch default path does this per pair) rolls back only its own records.
//
// Outside any scope recordUndo() is a no-op and onCommit() runs the action
// immediately.
//
// Commit actions:
//   By the time they run the operation is final, so each action runs in
//   isolation: a std::exception from one is logged to stderr and the
//   remaining actions still run. commit() does not report it to the caller.
//   Anything else an action throws is rethrown after the rest have run.
//
// Thread model:
//   Not thread-safe. The protocol is strictly serial; ProtocolNode serializes
//   every external command before it reaches a component.
//
// Ownership:
//   Owned by ProtocolNode (or a test fixture); components hold a reference.
// -----------------------------------------------------------------------------
class Journal {
 public:
  using Action = std::function<void()>;

  // ---------------------------------------------------------------------------
  // Scope: RAII transaction boundary
  // ---------------------------------------------------------------------------
  class Scope {
   public:
    explicit Scope(Journal& journal);

    // Rolls back everything recorded since construction unless commit() ran.
    ~Scope();

    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;
    Scope(Scope&&) = delete;
    Scope& operator=(Scope&&) = delete;

    // Marks the scope successful. For the outermost scope this also discards
    // the undo log and runs the pending commit actions in registration order.
    void commit();

   private:
    Journal& journal_;
    std::size_t undo_mark_;
    std::size_t commit_mark_;
    bool committed_{false};
  };

  Journal() = default;

  Journal(const Journal&) = delete;
  Journal& operator=(const Journal&) = delete;

  // Registers the closure that reverts the mutation about to be made.
  void recordUndo(Action undo);

  // Registers an action to run once the outermost scope commits.
  void onCommit(Action action);

  bool inTransaction() const { return depth_ > 0; }
  std::size_t depth() const { return depth_; }
  std::size_t pendingUndoCount() const { return undo_log_.size(); }

 private:
  void rollbackTo(std::size_t undo_mark, std::size_t commit_mark);
  void finalize();

  std::vector<Action> undo_log_;
  std::vector<Action> commit_actions_;
  std::size_t depth_{0};
};

}  // namespace bnpl
