#pragma once

#include "bnpl/domain/types.hpp"

#include <cstdint>

namespace bnpl {
namespace domain {

// -----------------------------------------------------------------------------
// LoanState
// -----------------------------------------------------------------------------
// Derived lifecycle state. Active is the only non-terminal state.
// -----------------------------------------------------------------------------
enum class LoanState {
  Active,
  Repaid,
  Defaulted,
};

inline const char* loanStateToString(LoanState s) {
  switch (s) {
    case LoanState::Active:    return "Active";
    case LoanState::Repaid:    return "Repaid";
    case LoanState::Defaulted: return "Defaulted";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// Loan
// -----------------------------------------------------------------------------
//
// @brief  One deferred-payment credit draw for a fixed principal.
//
// @details
// Created by LoanOrchestrator::createLoan() and never deleted. Every field is
// immutable after creation except the two terminal flags:
//
//   is_repaid   : set once by repayLoan().
//   is_defaulted: set once by markBNPLAsDefaulted() (Default Detector).
//
// A loan flagged defaulted can still be repaid; the derived state then reports
// Repaid and is_defaulted stays set as history.
//
// The borrower owes the full principal. The fee was withheld from the
// merchant payout at creation and is recorded here for auditing only.
//
// Value type: copies handed out by LoanOrchestrator::loan() are snapshots.
// -----------------------------------------------------------------------------
struct Loan {
  LoanId id{kNoLoan};
  Address borrower;
  Address merchant;
  Amount principal{0};
  Amount fee{0};
  std::int64_t created_at_ms{0};
  std::int64_t due_at_ms{0};
  bool is_repaid{false};
  bool is_defaulted{false};

  LoanState state() const {
    if (is_repaid) {
      return LoanState::Repaid;
    }
    if (is_defaulted) {
      return LoanState::Defaulted;
    }
    return LoanState::Active;
  }
};

}  // namespace domain
}  // namespace bnpl
