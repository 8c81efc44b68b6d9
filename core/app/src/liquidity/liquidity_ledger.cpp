#include "bnpl/liquidity/liquidity_ledger.hpp"
#include "bnpl/concurrent/reentrancy_guard.hpp"
#include "bnpl/errors/protocol_error.hpp"

#include <iostream>
#include <limits>
#include <string>
#include <utility>

namespace bnpl {

namespace {

constexpr const char* kComponent = "LiquidityLedger";

void requireNonZero(domain::Amount amount, const char* what) {
  if (amount == 0) {
    throw ValidationError(std::string(kComponent) + ": " + what +
                          " amount must be non-zero");
  }
}

void requireAccount(const domain::Address& account, const char* what) {
  if (!domain::isValidAddress(account)) {
    throw ValidationError(std::string(kComponent) + ": " + what +
                          " address must be non-empty");
  }
}

}  // namespace

LiquidityLedger::LiquidityLedger(domain::Address self, domain::Address admin,
                                 ICustodyAsset& custody, Journal& journal,
                                 EventMirror& mirror)
    : self_(std::move(self)),
      permissions_(kComponent, std::move(admin)),
      custody_(custody),
      journal_(journal),
      mirror_(mirror) {}

// -----------------------------------------------------------------------------
// depositLiquidity(): open to any provider
// -----------------------------------------------------------------------------
void LiquidityLedger::depositLiquidity(const domain::Address& caller,
                                       domain::Amount amount) {
  ReentrancyGuard guard(entered_, kComponent);
  Journal::Scope scope(journal_);
  requireAccount(caller, "depositor");
  requireNonZero(amount, "deposit");
  if (amount > std::numeric_limits<domain::Amount>::max() -
                   pool_.total_liquidity) {
    throw StateConflictError(std::string(kComponent) + ": deposit of " +
                             std::to_string(amount) +
                             " would overflow total liquidity " +
                             std::to_string(pool_.total_liquidity));
  }

  domain::LiquidityPoolState next = pool_;
  next.total_liquidity += amount;
  writePool(next);

  if (!custody_.transferFrom(self_, caller, self_, amount)) {
    throw CustodyError(std::string(kComponent) + ": deposit pull of " +
                       std::to_string(amount) + " from '" + caller +
                       "' refused");
  }

  PoolActivityEvent event;
  event.activity = PoolActivity::Deposit;
  event.account = caller;
  event.amount = amount;
  mirror_.emit(std::move(event));
  scope.commit();
}

// -----------------------------------------------------------------------------
// withdrawLiquidity(): admin pays out uncommitted capital
// -----------------------------------------------------------------------------
void LiquidityLedger::withdrawLiquidity(const domain::Address& caller,
                                        domain::Amount amount,
                                        const domain::Address& recipient) {
  ReentrancyGuard guard(entered_, kComponent);
  Journal::Scope scope(journal_);
  permissions_.require(Role::Admin, caller, "withdrawLiquidity");
  requireNonZero(amount, "withdrawal");
  requireAccount(recipient, "recipient");

  if (amount > pool_.available()) {
    throw StateConflictError(std::string(kComponent) + ": withdrawal of " +
                             std::to_string(amount) +
                             " exceeds available liquidity " +
                             std::to_string(pool_.available()));
  }

  domain::LiquidityPoolState next = pool_;
  next.total_liquidity -= amount;
  writePool(next);
  push(recipient, amount, "withdrawal");

  PoolActivityEvent event;
  event.activity = PoolActivity::Withdrawal;
  event.account = recipient;
  event.amount = amount;
  mirror_.emit(std::move(event));
  scope.commit();

  std::cout << "[" << kComponent << "] withdrew " << amount << " to "
            << recipient << "\n";
}

// -----------------------------------------------------------------------------
// settleMerchant(): book exposure, pay the merchant net of fee
// -----------------------------------------------------------------------------
void LiquidityLedger::settleMerchant(const domain::Address& caller,
                                     const domain::Address& merchant,
                                     domain::Amount principal,
                                     domain::Amount payout,
                                     domain::LoanId loan_id) {
  ReentrancyGuard guard(entered_, kComponent);
  Journal::Scope scope(journal_);
  permissions_.require(Role::Orchestrator, caller, "settleMerchant");
  requireAccount(merchant, "merchant");
  requireNonZero(principal, "settlement");
  if (payout > principal) {
    throw ValidationError(std::string(kComponent) + ": payout " +
                          std::to_string(payout) + " exceeds principal " +
                          std::to_string(principal));
  }
  if (principal > pool_.available()) {
    throw StateConflictError(std::string(kComponent) + ": loan " +
                             std::to_string(loan_id) + " principal " +
                             std::to_string(principal) +
                             " exceeds available liquidity " +
                             std::to_string(pool_.available()));
  }

  domain::LiquidityPoolState next = pool_;
  next.outstanding_credit += principal;
  writePool(next);

  if (payout > 0) {
    push(merchant, payout, "merchant payout");
  }
  scope.commit();
}

// -----------------------------------------------------------------------------
// receiveRepayment(): pull principal back from the borrower
// -----------------------------------------------------------------------------
void LiquidityLedger::receiveRepayment(const domain::Address& caller,
                                       const domain::Address& user,
                                       domain::Amount amount,
                                       domain::LoanId loan_id) {
  ReentrancyGuard guard(entered_, kComponent);
  Journal::Scope scope(journal_);
  permissions_.require(Role::Orchestrator, caller, "receiveRepayment");
  requireAccount(user, "payer");
  requireNonZero(amount, "repayment");
  if (amount > pool_.outstanding_credit) {
    throw StateConflictError(std::string(kComponent) + ": repayment of " +
                             std::to_string(amount) + " for loan " +
                             std::to_string(loan_id) +
                             " exceeds outstanding credit " +
                             std::to_string(pool_.outstanding_credit));
  }

  domain::LiquidityPoolState next = pool_;
  next.outstanding_credit -= amount;
  writePool(next);

  if (!custody_.transferFrom(self_, user, self_, amount)) {
    throw CustodyError(std::string(kComponent) + ": repayment pull of " +
                       std::to_string(amount) + " from '" + user +
                       "' refused");
  }
  scope.commit();
}

void LiquidityLedger::collectFees(const domain::Address& caller,
                                  domain::Amount amount) {
  Journal::Scope scope(journal_);
  permissions_.require(Role::Orchestrator, caller, "collectFees");

  domain::LiquidityPoolState next = pool_;
  next.protocol_fees += amount;
  writePool(next);
  scope.commit();
}

// -----------------------------------------------------------------------------
// withdrawFees(): admin sweeps accumulated fees
// -----------------------------------------------------------------------------
void LiquidityLedger::withdrawFees(const domain::Address& caller,
                                   domain::Amount amount,
                                   const domain::Address& recipient) {
  ReentrancyGuard guard(entered_, kComponent);
  Journal::Scope scope(journal_);
  permissions_.require(Role::Admin, caller, "withdrawFees");
  requireNonZero(amount, "fee withdrawal");
  requireAccount(recipient, "recipient");
  if (amount > pool_.protocol_fees) {
    throw StateConflictError(std::string(kComponent) + ": fee withdrawal of " +
                             std::to_string(amount) + " exceeds fees " +
                             std::to_string(pool_.protocol_fees));
  }

  domain::LiquidityPoolState next = pool_;
  next.protocol_fees -= amount;
  writePool(next);
  push(recipient, amount, "fee withdrawal");

  PoolActivityEvent event;
  event.activity = PoolActivity::FeeWithdrawal;
  event.account = recipient;
  event.amount = amount;
  mirror_.emit(std::move(event));
  scope.commit();
}

domain::Amount LiquidityLedger::custodyBalance() const {
  return custody_.balanceOf(self_);
}

domain::BasisPoints LiquidityLedger::utilizationBps() const {
  if (pool_.total_liquidity == 0) {
    return 0;
  }
  return static_cast<domain::BasisPoints>(
      domain::mulDiv(pool_.outstanding_credit, domain::kBpsDenominator,
                     pool_.total_liquidity));
}

void LiquidityLedger::writePool(const domain::LiquidityPoolState& next) {
  const domain::LiquidityPoolState previous = pool_;
  journal_.recordUndo([this, previous]() { pool_ = previous; });
  pool_ = next;
}

void LiquidityLedger::push(const domain::Address& to, domain::Amount amount,
                           const char* action) {
  if (!custody_.transfer(self_, to, amount)) {
    std::cerr << "[" << kComponent << "] " << action << " of " << amount
              << " to " << to << " refused by custody\n";
    throw CustodyError(std::string(kComponent) + ": " + action + " of " +
                       std::to_string(amount) + " to '" + to + "' refused");
  }
}

}  // namespace bnpl
