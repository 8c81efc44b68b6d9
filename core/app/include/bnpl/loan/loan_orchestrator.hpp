#pragma once

#include "bnpl/access/permission_table.hpp"
#include "bnpl/credit/credit_ledger.hpp"
#include "bnpl/custody/i_custody_asset.hpp"
#include "bnpl/domain/loan.hpp"
#include "bnpl/domain/types.hpp"
#include "bnpl/eventbus/event_mirror.hpp"
#include "bnpl/ledger/journal.hpp"
#include "bnpl/liquidity/liquidity_ledger.hpp"
#include "bnpl/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bnpl {

// -----------------------------------------------------------------------------
// LoanOrchestrator: top-level loan state machine
// -----------------------------------------------------------------------------
//
// @brief  Creates and repays loans, driving CreditLedger and LiquidityLedger
//         as their sole privileged writer, and keeps the loan book.
//
// @details
// Per-loan lifecycle:
//
//     createLoan()           repayLoan()
//   ──────────────▶ Active ──────────────▶ Repaid
//                     │
//                     │ markBNPLAsDefaulted()  (DefaultDetector)
//                     ▼
//                 Defaulted ──repayLoan()──▶ Repaid (is_defaulted kept)
//
// Each borrower has at most one Active loan, tracked by the active-loan
// pointer. The pointer is set together with CreditLedger::useCredit() and
// cleared together with restoreCredit(), so
//
//     activeLoanOf(b) != kNoLoan  <=>  credit.hasActiveCredit(b)
//
// holds after every committed operation. Marking a loan defaulted does not
// clear the pointer: the draw is still open until the principal comes back.
//
// createLoan() sequence (one Journal::Scope, all or nothing):
//
//   1. validate input, caller == borrower, KYC probe, credit and pool checks
//   2. record the loan and set the active-loan pointer
//   3. CreditLedger::useCredit(amount)
//   4. LiquidityLedger::collectFees(fee)
//   5. LiquidityLedger::settleMerchant(amount, amount - fee)   custody move
//   6. emit LoanCreatedEvent
//
// caller == borrower is a protocol choice: only the borrower opens their own
// draw, so a merchant or operator cannot check out on a borrower's behalf.
// Lifting it means adding a delegated-checkout role to the PermissionTable.
//
// The merchant payout is the last fallible step, so no custody transfer ever
// happens for a loan that is later rolled back.
//
// repayLoan() mirrors it: flag repaid, restoreCredit, clear the pointer, and
// pull the principal (LiquidityLedger::receiveRepayment) last.
//
// Reentrancy:
//   createLoan() and repayLoan() hold a ReentrancyGuard. A custody asset that
//   calls back into either one mid-transfer gets ReentrancyError.
//
// Thread model:
//   Single-threaded. ProtocolNode serializes all calls.
//
// Ownership:
//   Owned by ProtocolNode. Holds references to both ledgers, the custody
//   asset, the clock, the Journal and the EventMirror.
// -----------------------------------------------------------------------------
class LoanOrchestrator {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  self                   Address presented to the ledgers. They
  //                                must grant it the Orchestrator role.
  // @param  admin                  Admin of this component.
  // @param  repayment_window_days  > 0.
  // @param  fee_rate_bps           0..10000.
  //
  // Throws ValidationError on an out-of-range window or fee rate.
  // -------------------------------------------------------------------------
  LoanOrchestrator(domain::Address self, domain::Address admin,
                   CreditLedger& credit, LiquidityLedger& liquidity,
                   ICustodyAsset& custody, const ITimeProvider& clock,
                   Journal& journal, EventMirror& mirror,
                   std::int64_t repayment_window_days,
                   domain::BasisPoints fee_rate_bps);

  LoanOrchestrator(const LoanOrchestrator&) = delete;
  LoanOrchestrator& operator=(const LoanOrchestrator&) = delete;

  // -------------------------------------------------------------------------
  // createLoan(caller, borrower, merchant, amount)
  // -------------------------------------------------------------------------
  // @brief  Opens a loan for the full amount and pays the merchant
  //         amount - fee immediately.
  //
  // @return The new loan id.
  //
  // Errors:
  //   ValidationError     amount == 0, borrower or merchant empty.
  //   AuthorizationError  caller is not the borrower, or KYC probe says no.
  //   StateConflictError  borrower defaulted, loan already active,
  //                       insufficient credit, insufficient liquidity.
  //   CustodyError        merchant payout refused.
  //   ReentrancyError     re-entered during a custody transfer.
  // -------------------------------------------------------------------------
  domain::LoanId createLoan(const domain::Address& caller,
                            const domain::Address& borrower,
                            const domain::Address& merchant,
                            domain::Amount amount);

  // -------------------------------------------------------------------------
  // repayLoan(caller, loan_id)
  // -------------------------------------------------------------------------
  // @brief  Borrower pays back the full principal.
  //
  // Errors:
  //   ValidationError     unknown loan.
  //   StateConflictError  already repaid.
  //   AuthorizationError  caller is not the borrower.
  //   CustodyError        pull from the borrower refused.
  //   ReentrancyError     re-entered during a custody transfer.
  // -------------------------------------------------------------------------
  void repayLoan(const domain::Address& caller, domain::LoanId loan_id);

  // -------------------------------------------------------------------------
  // markBNPLAsDefaulted(caller, borrower, loan_id)
  // -------------------------------------------------------------------------
  // @brief  DefaultDetector flags the loan defaulted. Touches neither ledger.
  //
  // Errors:
  //   AuthorizationError  caller is not the DefaultDetector.
  //   ValidationError     unknown loan or borrower mismatch.
  //   StateConflictError  already repaid or already defaulted.
  // -------------------------------------------------------------------------
  void markBNPLAsDefaulted(const domain::Address& caller,
                           const domain::Address& borrower,
                           domain::LoanId loan_id);

  // Borrower or merchant of the loan records a dispute. Logged only.
  void raiseDispute(const domain::Address& caller, domain::LoanId loan_id,
                    const std::string& reason);

  // --- Admin configuration ---------------------------------------------------
  void setRepaymentWindowDays(const domain::Address& caller,
                              std::int64_t days);
  void setFeeRateBps(const domain::Address& caller,
                     domain::BasisPoints fee_rate_bps);

  // --- Queries ---------------------------------------------------------------
  std::optional<domain::Loan> loan(domain::LoanId loan_id) const;
  domain::LoanId activeLoanOf(const domain::Address& borrower) const;
  std::vector<domain::LoanId> loansOf(const domain::Address& borrower) const;
  std::uint64_t loanCount() const { return loans_.size(); }

  // createLoan() preconditions except caller identity and KYC, no mutation.
  bool isEligible(const domain::Address& borrower,
                  const domain::Address& merchant,
                  domain::Amount amount) const;

  domain::Amount feeFor(domain::Amount amount) const;

  std::int64_t repaymentWindowDays() const { return repayment_window_days_; }
  domain::BasisPoints feeRateBps() const { return fee_rate_bps_; }

  const domain::Address& address() const { return self_; }

  PermissionTable& permissions() { return permissions_; }
  const PermissionTable& permissions() const { return permissions_; }

 private:
  // Throws StateConflictError naming the first failed condition.
  void checkEligibility(const domain::Address& borrower,
                        domain::Amount amount) const;

  domain::Loan& loanRef(domain::LoanId loan_id);

  // Journaled mutations of the loan book.
  void appendLoan(const domain::Loan& loan);
  void setActiveLoan(const domain::Address& borrower, domain::LoanId loan_id);
  void setRepaidFlag(domain::LoanId loan_id);
  void setDefaultedFlag(domain::LoanId loan_id);

  domain::Address self_;
  PermissionTable permissions_;
  CreditLedger& credit_;
  LiquidityLedger& liquidity_;
  ICustodyAsset& custody_;
  const ITimeProvider& clock_;
  Journal& journal_;
  EventMirror& mirror_;

  std::int64_t repayment_window_days_;
  domain::BasisPoints fee_rate_bps_;

  std::vector<domain::Loan> loans_;  // index = id - 1
  std::unordered_map<domain::Address, domain::LoanId> active_loans_;
  std::unordered_map<domain::Address, std::vector<domain::LoanId>>
      loans_by_borrower_;
  bool entered_{false};
};

}  // namespace bnpl
