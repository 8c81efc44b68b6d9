#include "bnpl/ledger/journal.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace bnpl {

// -----------------------------------------------------------------------------
// Scope: open a (possibly nested) transaction
// -----------------------------------------------------------------------------
Journal::Scope::Scope(Journal& journal)
    : journal_(journal),
      undo_mark_(journal.undo_log_.size()),
      commit_mark_(journal.commit_actions_.size()) {
  ++journal_.depth_;
}

// -----------------------------------------------------------------------------
// ~Scope: roll back if the operation did not reach commit()
// -----------------------------------------------------------------------------
Journal::Scope::~Scope() {
  if (committed_) {
    return;
  }
  --journal_.depth_;
  journal_.rollbackTo(undo_mark_, commit_mark_);
}

// -----------------------------------------------------------------------------
// commit: inner scopes hand their records to the enclosing scope; the
// outermost scope finalizes
// -----------------------------------------------------------------------------
void Journal::Scope::commit() {
  if (committed_) {
    return;
  }
  committed_ = true;
  --journal_.depth_;
  if (journal_.depth_ == 0) {
    journal_.finalize();
  }
}

void Journal::recordUndo(Action undo) {
  if (depth_ == 0) {
    return;
  }
  undo_log_.push_back(std::move(undo));
}

void Journal::onCommit(Action action) {
  if (depth_ == 0) {
    action();
    return;
  }
  commit_actions_.push_back(std::move(action));
}

// -----------------------------------------------------------------------------
// rollbackTo: replay undo closures newest-first down to the scope's mark
// -----------------------------------------------------------------------------
void Journal::rollbackTo(std::size_t undo_mark, std::size_t commit_mark) {
  while (undo_log_.size() > undo_mark) {
    Action undo = std::move(undo_log_.back());
    undo_log_.pop_back();
    undo();
  }
  if (commit_actions_.size() > commit_mark) {
    commit_actions_.resize(commit_mark);
  }
}

// -----------------------------------------------------------------------------
// finalize: drop the undo log, then run deferred side effects
// -----------------------------------------------------------------------------
void Journal::finalize() {
  undo_log_.clear();

  // Move the actions out first: an action may itself open a scope (a
  // subscriber calling a query) and must see an empty journal.
  std::vector<Action> actions;
  actions.swap(commit_actions_);

  std::exception_ptr foreign;
  for (auto& action : actions) {
    try {
      action();
    } catch (const std::exception& e) {
      std::cerr << "[Journal] WARNING: commit action failed after commit: "
                << e.what() << "\n";
    } catch (...) {
      if (!foreign) {
        foreign = std::current_exception();
      }
    }
  }
  if (foreign) {
    std::rethrow_exception(foreign);
  }
}

}  // namespace bnpl
