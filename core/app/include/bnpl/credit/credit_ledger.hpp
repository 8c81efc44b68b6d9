#pragma once

#include "bnpl/access/permission_table.hpp"
#include "bnpl/domain/credit_account.hpp"
#include "bnpl/domain/types.hpp"
#include "bnpl/eventbus/event_mirror.hpp"
#include "bnpl/ledger/journal.hpp"

#include <unordered_map>
#include <vector>

namespace bnpl {

// -----------------------------------------------------------------------------
// CreditLedger: authoritative per-user credit capacity and utilization
// -----------------------------------------------------------------------------
//
// @brief  Owns every CreditAccount. Admin sets limits and lifts defaults; the
//         Orchestrator draws and restores credit; the Default Detector flags
//         defaults.
//
// @details
// Writers by role:
//
//   Admin            setLimit, batchSetLimits, unblock
//   Orchestrator     useCredit, restoreCredit
//   DefaultDetector  markDefaulted
//
// A user has at most one open draw: useCredit() refuses while
// has_active_credit is set, and restoreCredit() clears it once used returns
// to zero. The Orchestrator keeps its active-loan pointer in lockstep with
// that flag.
//
// A limit may be lowered, but never below the amount currently drawn. A limit
// of zero is rejected; there is no "revoke" through setLimit.
//
// Atomicity:
//   Every entry point opens a Journal::Scope. Each account write records an
//   undo closure restoring the previous account (or erasing one that did not
//   exist), so a failure anywhere in an enclosing operation (e.g. the merchant
//   payout inside createLoan) reverts the draw as well.
//
// Mirror events:
//   CreditLimitSetEvent per limit written, UserUnblockedEvent when unblock()
//   actually clears a flag.
//
// Thread model:
//   Single-threaded. ProtocolNode serializes all calls.
//
// Ownership:
//   Owned by ProtocolNode. Holds references to the shared Journal and
//   EventMirror.
// -----------------------------------------------------------------------------
class CreditLedger {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  self     This component's own address (what it presents as
  //                  `caller` to other components).
  // @param  admin    Holder of the Admin role. Must be non-empty.
  // @param  journal  Shared undo log.
  // @param  mirror   Event sink.
  //
  // The Orchestrator and DefaultDetector roles start unassigned; wire them
  // with permissions().assign() before use.
  // -------------------------------------------------------------------------
  CreditLedger(domain::Address self, domain::Address admin, Journal& journal,
               EventMirror& mirror);

  CreditLedger(const CreditLedger&) = delete;
  CreditLedger& operator=(const CreditLedger&) = delete;

  // -------------------------------------------------------------------------
  // setLimit(caller, user, limit)
  // -------------------------------------------------------------------------
  // @brief  Assigns the user's credit limit.
  //
  // Errors:
  //   AuthorizationError   caller is not admin.
  //   ValidationError      user empty, or limit == 0.
  //   StateConflictError   limit < current used.
  // -------------------------------------------------------------------------
  void setLimit(const domain::Address& caller, const domain::Address& user,
                domain::Amount limit);

  // -------------------------------------------------------------------------
  // batchSetLimits(caller, users, limits)
  // -------------------------------------------------------------------------
  // @brief  setLimit() for each (users[i], limits[i]) pair, all or nothing.
  //
  // @details
  // The first invalid element aborts the batch and every limit already
  // written by it is rolled back. An empty batch is accepted and does nothing.
  //
  // Errors: as setLimit(), plus ValidationError on a length mismatch.
  // -------------------------------------------------------------------------
  void batchSetLimits(const domain::Address& caller,
                      const std::vector<domain::Address>& users,
                      const std::vector<domain::Amount>& limits);

  // -------------------------------------------------------------------------
  // useCredit(caller, user, amount)
  // -------------------------------------------------------------------------
  // @brief  Opens a draw: used += amount, has_active_credit = true.
  //
  // Errors:
  //   AuthorizationError   caller is not the Orchestrator.
  //   ValidationError      user empty, or amount == 0.
  //   StateConflictError   user defaulted, a draw is already open, or
  //                        amount exceeds available credit.
  // -------------------------------------------------------------------------
  void useCredit(const domain::Address& caller, const domain::Address& user,
                 domain::Amount amount);

  // -------------------------------------------------------------------------
  // restoreCredit(caller, user, amount)
  // -------------------------------------------------------------------------
  // @brief  Returns capacity: used -= amount. Reaching zero closes the draw.
  //
  // Errors:
  //   AuthorizationError   caller is not the Orchestrator.
  //   ValidationError      user empty.
  //   StateConflictError   amount > used.
  // -------------------------------------------------------------------------
  void restoreCredit(const domain::Address& caller,
                     const domain::Address& user, domain::Amount amount);

  // Sets the default flag unconditionally. DefaultDetector only.
  void markDefaulted(const domain::Address& caller,
                     const domain::Address& user);

  // Clears the default flag. Admin only; no-op for a user not in default.
  void unblock(const domain::Address& caller, const domain::Address& user);

  // --- Queries ---------------------------------------------------------------
  domain::Amount limitOf(const domain::Address& user) const;
  domain::Amount usedOf(const domain::Address& user) const;
  domain::Amount availableCredit(const domain::Address& user) const;
  bool hasActiveCredit(const domain::Address& user) const;
  bool isDefaulted(const domain::Address& user) const;

  // True when useCredit(user, amount) would succeed on the current state.
  bool isEligible(const domain::Address& user, domain::Amount amount) const;

  // used * 10000 / limit, or 0 when no limit is set.
  domain::BasisPoints utilizationBps(const domain::Address& user) const;

  // Snapshot of the account; a default-constructed one for unknown users.
  domain::CreditAccount account(const domain::Address& user) const;

  const domain::Address& address() const { return self_; }

  PermissionTable& permissions() { return permissions_; }
  const PermissionTable& permissions() const { return permissions_; }

 private:
  void applyLimit(const domain::Address& user, domain::Amount limit);

  // Replaces the stored account, recording an undo that restores the old one.
  void writeAccount(const domain::Address& user,
                    const domain::CreditAccount& next);

  domain::Address self_;
  PermissionTable permissions_;
  Journal& journal_;
  EventMirror& mirror_;
  std::unordered_map<domain::Address, domain::CreditAccount> accounts_;
};

}  // namespace bnpl
