#pragma once

#include "bnpl/access/permission_table.hpp"
#include "bnpl/credit/credit_ledger.hpp"
#include "bnpl/custody/i_custody_asset.hpp"
#include "bnpl/domain/types.hpp"
#include "bnpl/eventbus/event_mirror.hpp"
#include "bnpl/ledger/journal.hpp"
#include "bnpl/loan/loan_orchestrator.hpp"
#include "bnpl/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace bnpl {

// -----------------------------------------------------------------------------
// DefaultDetector: turns overdue loans into defaulted users
// -----------------------------------------------------------------------------
//
// @brief  On request from the admin or the Orchestrator, checks whether a
//         loan is past due plus grace and, if so, flags the borrower
//         defaulted in the CreditLedger and asks custody to freeze them.
//
// @details
// Nothing here runs on a timer. A keeper calls checkAndProcessDefault() or
// batchCheckDefaults() and the detector evaluates the loan against the
// trusted clock at that moment:
//
//   loan unknown / not the user's    ValidationError
//   loan repaid                      false, nothing changes
//   now < due_at + grace             StateConflictError ("not overdue")
//   user already defaulted           false, nothing changes
//   otherwise                        CreditLedger::markDefaulted, freeze,
//                                    DefaultEvent, true
//
// days_overdue = floor((now - due_at) / 1 day), so a default processed on
// the due instant with zero grace reports 0.
//
// Soft failures:
//   The custody freeze runs when the operation commits and is best-effort:
//   any std::exception from custody (a CustodyError refusal or a transport
//   failure) is logged to stderr and swallowed. The batch path also
//   notifies LoanOrchestrator::markBNPLAsDefaulted() per defaulted pair, with
//   the same treatment. The single-item path does not notify; the loan record
//   then stays Active while the user is defaulted.
//
// Batch isolation:
//   Each pair runs in its own nested Journal::Scope. A pair that throws is
//   rolled back on its own, logged, and skipped; the other pairs are kept.
//
// Thread model:
//   Single-threaded. ProtocolNode serializes all calls.
//
// Ownership:
//   Owned by ProtocolNode. Reads loans through the LoanOrchestrator, writes
//   through the CreditLedger (which must grant it the DefaultDetector role).
// -----------------------------------------------------------------------------
class DefaultDetector {
 public:
  // Throws ValidationError for a grace period outside 0..kMaxPeriodDays.
  DefaultDetector(domain::Address self, domain::Address admin,
                  LoanOrchestrator& orchestrator, CreditLedger& credit,
                  ICustodyAsset& custody, const ITimeProvider& clock,
                  Journal& journal, EventMirror& mirror,
                  std::int64_t grace_period_days);

  DefaultDetector(const DefaultDetector&) = delete;
  DefaultDetector& operator=(const DefaultDetector&) = delete;

  // -------------------------------------------------------------------------
  // checkAndProcessDefault(caller, user, loan_id)
  // -------------------------------------------------------------------------
  // @brief  Evaluates one loan and defaults its borrower if overdue.
  //
  // @return true if the user was newly marked defaulted.
  //
  // Errors:
  //   AuthorizationError  caller is neither admin nor Orchestrator.
  //   ValidationError     empty user, unknown loan, borrower mismatch.
  //   StateConflictError  not yet past due + grace.
  // -------------------------------------------------------------------------
  bool checkAndProcessDefault(const domain::Address& caller,
                              const domain::Address& user,
                              domain::LoanId loan_id);

  // -------------------------------------------------------------------------
  // batchCheckDefaults(caller, users, loan_ids)
  // -------------------------------------------------------------------------
  // @brief  checkAndProcessDefault() over each pair, skipping the ones that
  //         fail or are ineligible.
  //
  // @return Number of users newly marked defaulted.
  //
  // Errors (whole call):
  //   AuthorizationError  caller is neither admin nor Orchestrator.
  //   ValidationError     users.size() != loan_ids.size().
  // -------------------------------------------------------------------------
  std::size_t batchCheckDefaults(const domain::Address& caller,
                                 const std::vector<domain::Address>& users,
                                 const std::vector<domain::LoanId>& loan_ids);

  // Admin only. Best-effort custody unfreeze; false if custody refused or
  // failed.
  bool liftFreeze(const domain::Address& caller, const domain::Address& user);

  void setGracePeriodDays(const domain::Address& caller, std::int64_t days);
  std::int64_t gracePeriodDays() const { return grace_period_days_; }

  const domain::Address& address() const { return self_; }

  PermissionTable& permissions() { return permissions_; }
  const PermissionTable& permissions() const { return permissions_; }

 private:
  bool process(const domain::Address& user, domain::LoanId loan_id);
  void freezeOnCommit(const domain::Address& user);

  domain::Address self_;
  PermissionTable permissions_;
  LoanOrchestrator& orchestrator_;
  CreditLedger& credit_;
  ICustodyAsset& custody_;
  const ITimeProvider& clock_;
  Journal& journal_;
  EventMirror& mirror_;
  std::int64_t grace_period_days_;
};

}  // namespace bnpl
