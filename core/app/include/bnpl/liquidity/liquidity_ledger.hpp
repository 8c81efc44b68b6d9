#pragma once

#include "bnpl/access/permission_table.hpp"
#include "bnpl/custody/i_custody_asset.hpp"
#include "bnpl/domain/pool_state.hpp"
#include "bnpl/domain/types.hpp"
#include "bnpl/eventbus/event_mirror.hpp"
#include "bnpl/ledger/journal.hpp"

namespace bnpl {

// -----------------------------------------------------------------------------
// LiquidityLedger: shared pool accounting and the only mover of custody funds
// -----------------------------------------------------------------------------
//
// @brief  Tracks provider capital, outstanding principal and protocol fees,
//         and executes every custody transfer the protocol makes.
//
// @details
// Writers by role:
//
//   anyone           depositLiquidity
//   Admin            withdrawLiquidity, withdrawFees
//   Orchestrator     settleMerchant, receiveRepayment, collectFees
//
// Pool accounting (see domain::LiquidityPoolState):
//
//   deposit(a)            total += a                 custody +a
//   withdrawLiquidity(a)  total -= a                 custody -a
//   settleMerchant(p, n)  outstanding += p           custody -n
//   collectFees(f)        fees += f                  (bookkeeping; f = p - n)
//   receiveRepayment(p)   outstanding -= p           custody +p
//   withdrawFees(f)       fees -= f                  custody -f
//
// so custody = total - outstanding + fees holds after every committed
// operation (delinquent principal is the only thing that breaks it, and it
// stays in outstanding).
//
// Fund-moving discipline:
//   1. ReentrancyGuard on the component for the whole call.
//   2. Journal::Scope.
//   3. Validate, then write the new pool state (journaled).
//   4. Custody transfer as the last step. A false return throws CustodyError,
//      which unwinds the scope and restores the pool.
//
// Thread model:
//   Single-threaded. ProtocolNode serializes all calls.
//
// Ownership:
//   Owned by ProtocolNode. Holds references to the custody asset, Journal and
//   EventMirror.
// -----------------------------------------------------------------------------
class LiquidityLedger {
 public:
  LiquidityLedger(domain::Address self, domain::Address admin,
                  ICustodyAsset& custody, Journal& journal,
                  EventMirror& mirror);

  LiquidityLedger(const LiquidityLedger&) = delete;
  LiquidityLedger& operator=(const LiquidityLedger&) = delete;

  // -------------------------------------------------------------------------
  // depositLiquidity(caller, amount)
  // -------------------------------------------------------------------------
  // @brief  Pulls amount from the caller into the pool.
  //
  // Errors:
  //   ValidationError   amount == 0 or caller empty.
  //   CustodyError      transferFrom returned false.
  //   ReentrancyError   called from inside another fund move.
  // -------------------------------------------------------------------------
  void depositLiquidity(const domain::Address& caller, domain::Amount amount);

  // -------------------------------------------------------------------------
  // withdrawLiquidity(caller, amount, recipient)
  // -------------------------------------------------------------------------
  // @brief  Admin pays uncommitted capital out to recipient.
  //
  // Errors:
  //   AuthorizationError  caller is not admin.
  //   ValidationError     amount == 0 or recipient empty.
  //   StateConflictError  amount > availableLiquidity().
  //   CustodyError / ReentrancyError as above.
  // -------------------------------------------------------------------------
  void withdrawLiquidity(const domain::Address& caller, domain::Amount amount,
                         const domain::Address& recipient);

  // -------------------------------------------------------------------------
  // settleMerchant(caller, merchant, principal, payout, loan_id)
  // -------------------------------------------------------------------------
  // @brief  Books `principal` as outstanding and pays `payout` to merchant.
  //
  // @details
  // payout is principal minus the protocol fee. The withheld difference stays
  // in custody; the Orchestrator books it separately with collectFees().
  //
  // Errors:
  //   AuthorizationError  caller is not the Orchestrator.
  //   ValidationError     merchant empty, principal == 0, payout > principal.
  //   StateConflictError  principal > availableLiquidity().
  //   CustodyError / ReentrancyError as above.
  // -------------------------------------------------------------------------
  void settleMerchant(const domain::Address& caller,
                      const domain::Address& merchant,
                      domain::Amount principal, domain::Amount payout,
                      domain::LoanId loan_id);

  // -------------------------------------------------------------------------
  // receiveRepayment(caller, user, amount, loan_id)
  // -------------------------------------------------------------------------
  // @brief  Pulls amount from user and retires that much outstanding credit.
  //
  // Errors:
  //   AuthorizationError  caller is not the Orchestrator.
  //   ValidationError     user empty or amount == 0.
  //   StateConflictError  amount > outstanding credit.
  //   CustodyError / ReentrancyError as above.
  // -------------------------------------------------------------------------
  void receiveRepayment(const domain::Address& caller,
                        const domain::Address& user, domain::Amount amount,
                        domain::LoanId loan_id);

  // Orchestrator only. protocol_fees += amount; moves no funds.
  void collectFees(const domain::Address& caller, domain::Amount amount);

  // Admin only. amount <= protocol_fees; pays recipient.
  void withdrawFees(const domain::Address& caller, domain::Amount amount,
                    const domain::Address& recipient);

  // --- Queries ---------------------------------------------------------------
  domain::LiquidityPoolState poolState() const { return pool_; }
  domain::Amount availableLiquidity() const { return pool_.available(); }

  // Raw custody balance of the pool account.
  domain::Amount custodyBalance() const;

  // outstanding * 10000 / total, or 0 for an empty pool.
  domain::BasisPoints utilizationBps() const;

  const domain::Address& address() const { return self_; }

  PermissionTable& permissions() { return permissions_; }
  const PermissionTable& permissions() const { return permissions_; }

 private:
  void writePool(const domain::LiquidityPoolState& next);

  // Throws CustodyError when the custody asset refuses.
  void push(const domain::Address& to, domain::Amount amount,
            const char* action);

  domain::Address self_;
  PermissionTable permissions_;
  ICustodyAsset& custody_;
  Journal& journal_;
  EventMirror& mirror_;
  domain::LiquidityPoolState pool_;
  bool entered_{false};
};

}  // namespace bnpl
