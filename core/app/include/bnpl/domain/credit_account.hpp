#pragma once

#include "bnpl/domain/types.hpp"

namespace bnpl {
namespace domain {

// -----------------------------------------------------------------------------
// CreditAccount: per-user credit state owned by CreditLedger
// -----------------------------------------------------------------------------
//
// Invariants (enforced by CreditLedger, never by this struct):
//   used <= limit
//   has_active_credit == (used > 0)    at most one open draw per user
//   defaulted is monotone; only an admin unblock clears it
//
// Plain data with value semantics; the ledger hands out copies.
// -----------------------------------------------------------------------------
struct CreditAccount {
  Amount limit{0};
  Amount used{0};
  bool defaulted{false};
  bool has_active_credit{false};

  Amount available() const { return used >= limit ? 0 : limit - used; }
};

}  // namespace domain
}  // namespace bnpl
