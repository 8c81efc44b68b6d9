#include "bnpl/loan/loan_orchestrator.hpp"
#include "bnpl/concurrent/reentrancy_guard.hpp"
#include "bnpl/domain/protocol_limits.hpp"
#include "bnpl/errors/protocol_error.hpp"

#include <iostream>
#include <utility>

namespace bnpl {

namespace {

constexpr const char* kComponent = "LoanOrchestrator";

void validateWindow(std::int64_t days) {
  if (days <= 0 || days > domain::kMaxPeriodDays) {
    throw ValidationError(std::string(kComponent) +
                          ": repayment window must be in 1.." +
                          std::to_string(domain::kMaxPeriodDays) +
                          " days, got " + std::to_string(days));
  }
}

void validateFeeRate(domain::BasisPoints bps) {
  if (bps > domain::kBpsDenominator) {
    throw ValidationError(std::string(kComponent) +
                          ": fee rate must be in 0..10000 bps, got " +
                          std::to_string(bps));
  }
}

}  // namespace

LoanOrchestrator::LoanOrchestrator(domain::Address self, domain::Address admin,
                                   CreditLedger& credit,
                                   LiquidityLedger& liquidity,
                                   ICustodyAsset& custody,
                                   const ITimeProvider& clock,
                                   Journal& journal, EventMirror& mirror,
                                   std::int64_t repayment_window_days,
                                   domain::BasisPoints fee_rate_bps)
    : self_(std::move(self)),
      permissions_(kComponent, std::move(admin)),
      credit_(credit),
      liquidity_(liquidity),
      custody_(custody),
      clock_(clock),
      journal_(journal),
      mirror_(mirror),
      repayment_window_days_(repayment_window_days),
      fee_rate_bps_(fee_rate_bps) {
  validateWindow(repayment_window_days_);
  validateFeeRate(fee_rate_bps_);
}

// -----------------------------------------------------------------------------
// createLoan()
// -----------------------------------------------------------------------------
domain::LoanId LoanOrchestrator::createLoan(const domain::Address& caller,
                                            const domain::Address& borrower,
                                            const domain::Address& merchant,
                                            domain::Amount amount) {
  ReentrancyGuard guard(entered_, kComponent);
  Journal::Scope scope(journal_);

  // --- 1) Preconditions -----------------------------------------------------
  if (amount == 0) {
    throw ValidationError(std::string(kComponent) +
                          ": loan amount must be non-zero");
  }
  if (!domain::isValidAddress(borrower) || !domain::isValidAddress(merchant)) {
    throw ValidationError(std::string(kComponent) +
                          ": borrower and merchant must be non-empty");
  }
  if (caller != borrower) {
    throw AuthorizationError(std::string(kComponent) + ": caller '" + caller +
                             "' cannot open a loan for '" + borrower + "'");
  }

  // An asset without a KYC probe reports nullopt; that counts as passed.
  const std::optional<bool> kyc = custody_.isKycPassed(borrower);
  if (kyc.has_value() && !*kyc) {
    throw AuthorizationError(std::string(kComponent) + ": borrower '" +
                             borrower + "' has not passed KYC");
  }

  checkEligibility(borrower, amount);

  // --- 2) Record the loan ---------------------------------------------------
  const std::int64_t now = clock_.now_ms();

  domain::Loan loan;
  loan.id = static_cast<domain::LoanId>(loans_.size()) + 1;
  loan.borrower = borrower;
  loan.merchant = merchant;
  loan.principal = amount;
  loan.fee = feeFor(amount);
  loan.created_at_ms = now;
  loan.due_at_ms = now + repayment_window_days_ * domain::kMsPerDay;

  appendLoan(loan);
  setActiveLoan(borrower, loan.id);

  // --- 3) Ledgers -----------------------------------------------------------
  credit_.useCredit(self_, borrower, amount);
  liquidity_.collectFees(self_, loan.fee);
  liquidity_.settleMerchant(self_, merchant, amount, amount - loan.fee,
                            loan.id);

  // --- 4) Mirror ------------------------------------------------------------
  LoanCreatedEvent event;
  event.user = borrower;
  event.merchant = merchant;
  event.loan_id = loan.id;
  event.amount = amount;
  event.due_at_ms = loan.due_at_ms;
  mirror_.emit(std::move(event));

  scope.commit();

  std::cout << "[" << kComponent << "] loan " << loan.id << " opened: "
            << borrower << " -> " << merchant << " principal=" << amount
            << " fee=" << loan.fee << " due_at_ms=" << loan.due_at_ms << "\n";
  return loan.id;
}

// -----------------------------------------------------------------------------
// repayLoan()
// -----------------------------------------------------------------------------
void LoanOrchestrator::repayLoan(const domain::Address& caller,
                                 domain::LoanId loan_id) {
  ReentrancyGuard guard(entered_, kComponent);
  Journal::Scope scope(journal_);

  const domain::Loan snapshot = loanRef(loan_id);
  if (snapshot.is_repaid) {
    throw StateConflictError(std::string(kComponent) + ": loan " +
                             std::to_string(loan_id) + " is already repaid");
  }
  if (caller != snapshot.borrower) {
    throw AuthorizationError(std::string(kComponent) + ": caller '" + caller +
                             "' is not the borrower of loan " +
                             std::to_string(loan_id));
  }

  setRepaidFlag(loan_id);
  credit_.restoreCredit(self_, snapshot.borrower, snapshot.principal);
  if (activeLoanOf(snapshot.borrower) == loan_id) {
    setActiveLoan(snapshot.borrower, domain::kNoLoan);
  }
  liquidity_.receiveRepayment(self_, snapshot.borrower, snapshot.principal,
                              loan_id);

  RepaymentEvent event;
  event.user = snapshot.borrower;
  event.merchant = snapshot.merchant;
  event.loan_id = loan_id;
  event.amount = snapshot.principal;
  event.success = true;
  mirror_.emit(std::move(event));

  scope.commit();

  std::cout << "[" << kComponent << "] loan " << loan_id << " repaid by "
            << snapshot.borrower
            << (snapshot.is_defaulted ? " (after default)" : "") << "\n";
}

// -----------------------------------------------------------------------------
// markBNPLAsDefaulted(): notification from the DefaultDetector
// -----------------------------------------------------------------------------
void LoanOrchestrator::markBNPLAsDefaulted(const domain::Address& caller,
                                           const domain::Address& borrower,
                                           domain::LoanId loan_id) {
  Journal::Scope scope(journal_);
  permissions_.require(Role::DefaultDetector, caller, "markBNPLAsDefaulted");

  const domain::Loan& loan = loanRef(loan_id);
  if (loan.borrower != borrower) {
    throw ValidationError(std::string(kComponent) + ": loan " +
                          std::to_string(loan_id) + " does not belong to '" +
                          borrower + "'");
  }
  if (loan.is_repaid) {
    throw StateConflictError(std::string(kComponent) + ": loan " +
                             std::to_string(loan_id) + " is already repaid");
  }
  if (loan.is_defaulted) {
    throw StateConflictError(std::string(kComponent) + ": loan " +
                             std::to_string(loan_id) +
                             " is already defaulted");
  }

  setDefaultedFlag(loan_id);
  scope.commit();
}

void LoanOrchestrator::raiseDispute(const domain::Address& caller,
                                    domain::LoanId loan_id,
                                    const std::string& reason) {
  Journal::Scope scope(journal_);
  const domain::Loan& loan = loanRef(loan_id);
  if (caller != loan.borrower && caller != loan.merchant) {
    throw AuthorizationError(std::string(kComponent) + ": caller '" + caller +
                             "' is not a party to loan " +
                             std::to_string(loan_id));
  }
  if (reason.empty()) {
    throw ValidationError(std::string(kComponent) +
                          ": dispute reason must be non-empty");
  }

  DisputeEvent event;
  event.user = loan.borrower;
  event.merchant = loan.merchant;
  event.loan_id = loan_id;
  event.reason = reason;
  mirror_.emit(std::move(event));
  scope.commit();

  std::cout << "[" << kComponent << "] dispute on loan " << loan_id
            << " by " << caller << ": " << reason << "\n";
}

// -----------------------------------------------------------------------------
// Admin configuration
// -----------------------------------------------------------------------------
void LoanOrchestrator::setRepaymentWindowDays(const domain::Address& caller,
                                              std::int64_t days) {
  permissions_.require(Role::Admin, caller, "setRepaymentWindowDays");
  validateWindow(days);
  repayment_window_days_ = days;
  std::cout << "[" << kComponent << "] repayment window -> " << days
            << " day(s)\n";
}

void LoanOrchestrator::setFeeRateBps(const domain::Address& caller,
                                     domain::BasisPoints fee_rate_bps) {
  permissions_.require(Role::Admin, caller, "setFeeRateBps");
  validateFeeRate(fee_rate_bps);
  fee_rate_bps_ = fee_rate_bps;
  std::cout << "[" << kComponent << "] fee rate -> " << fee_rate_bps
            << " bps\n";
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<domain::Loan> LoanOrchestrator::loan(
    domain::LoanId loan_id) const {
  if (loan_id == domain::kNoLoan || loan_id > loans_.size()) {
    return std::nullopt;
  }
  return loans_[loan_id - 1];
}

domain::LoanId LoanOrchestrator::activeLoanOf(
    const domain::Address& borrower) const {
  auto it = active_loans_.find(borrower);
  return it != active_loans_.end() ? it->second : domain::kNoLoan;
}

std::vector<domain::LoanId> LoanOrchestrator::loansOf(
    const domain::Address& borrower) const {
  auto it = loans_by_borrower_.find(borrower);
  if (it == loans_by_borrower_.end()) {
    return {};
  }
  return it->second;
}

bool LoanOrchestrator::isEligible(const domain::Address& borrower,
                                  const domain::Address& merchant,
                                  domain::Amount amount) const {
  if (amount == 0 || !domain::isValidAddress(borrower) ||
      !domain::isValidAddress(merchant)) {
    return false;
  }
  return activeLoanOf(borrower) == domain::kNoLoan &&
         credit_.isEligible(borrower, amount) &&
         amount <= liquidity_.availableLiquidity();
}

domain::Amount LoanOrchestrator::feeFor(domain::Amount amount) const {
  return domain::mulDiv(amount, fee_rate_bps_, domain::kBpsDenominator);
}

// -----------------------------------------------------------------------------
// checkEligibility(): the createLoan state checks, with reasons
// -----------------------------------------------------------------------------
void LoanOrchestrator::checkEligibility(const domain::Address& borrower,
                                        domain::Amount amount) const {
  if (credit_.isDefaulted(borrower)) {
    throw StateConflictError(std::string(kComponent) + ": borrower '" +
                             borrower + "' is in default");
  }
  const domain::LoanId active = activeLoanOf(borrower);
  if (active != domain::kNoLoan || credit_.hasActiveCredit(borrower)) {
    throw StateConflictError(std::string(kComponent) + ": borrower '" +
                             borrower + "' already has active loan " +
                             std::to_string(active));
  }
  const domain::Amount credit = credit_.availableCredit(borrower);
  if (amount > credit) {
    throw StateConflictError(std::string(kComponent) + ": amount " +
                             std::to_string(amount) +
                             " exceeds available credit " +
                             std::to_string(credit));
  }
  const domain::Amount pool = liquidity_.availableLiquidity();
  if (amount > pool) {
    throw StateConflictError(std::string(kComponent) + ": amount " +
                             std::to_string(amount) +
                             " exceeds available liquidity " +
                             std::to_string(pool));
  }
}

domain::Loan& LoanOrchestrator::loanRef(domain::LoanId loan_id) {
  if (loan_id == domain::kNoLoan || loan_id > loans_.size()) {
    throw ValidationError(std::string(kComponent) + ": unknown loan " +
                          std::to_string(loan_id));
  }
  return loans_[loan_id - 1];
}

// -----------------------------------------------------------------------------
// Journaled mutations
// -----------------------------------------------------------------------------
void LoanOrchestrator::appendLoan(const domain::Loan& loan) {
  journal_.recordUndo([this, borrower = loan.borrower]() {
    loans_.pop_back();
    auto it = loans_by_borrower_.find(borrower);
    if (it != loans_by_borrower_.end()) {
      it->second.pop_back();
      if (it->second.empty()) {
        loans_by_borrower_.erase(it);
      }
    }
  });
  loans_.push_back(loan);
  loans_by_borrower_[loan.borrower].push_back(loan.id);
}

void LoanOrchestrator::setActiveLoan(const domain::Address& borrower,
                                     domain::LoanId loan_id) {
  const domain::LoanId previous = activeLoanOf(borrower);
  journal_.recordUndo([this, borrower, previous]() {
    if (previous == domain::kNoLoan) {
      active_loans_.erase(borrower);
    } else {
      active_loans_[borrower] = previous;
    }
  });
  if (loan_id == domain::kNoLoan) {
    active_loans_.erase(borrower);
  } else {
    active_loans_[borrower] = loan_id;
  }
}

void LoanOrchestrator::setRepaidFlag(domain::LoanId loan_id) {
  journal_.recordUndo(
      [this, loan_id]() { loans_[loan_id - 1].is_repaid = false; });
  loans_[loan_id - 1].is_repaid = true;
}

void LoanOrchestrator::setDefaultedFlag(domain::LoanId loan_id) {
  journal_.recordUndo(
      [this, loan_id]() { loans_[loan_id - 1].is_defaulted = false; });
  loans_[loan_id - 1].is_defaulted = true;
}

}  // namespace bnpl
