#pragma once

#include "bnpl/domain/types.hpp"

namespace bnpl {
namespace domain {

// -----------------------------------------------------------------------------
// LiquidityPoolState: aggregate pool accounting owned by LiquidityLedger
// -----------------------------------------------------------------------------
//
// total_liquidity     Provider capital: cash in custody plus principal lent
//                     out. Moves only on deposit and admin withdrawal.
// outstanding_credit  Principal currently lent out. Grows at loan creation by
//                     the full principal, shrinks on repayment. Delinquent
//                     principal stays here indefinitely.
// protocol_fees       Fees withheld from merchant payouts, still in custody.
//
// Invariant: outstanding_credit <= total_liquidity. The ledger only books new
// exposure against available(), which keeps it true.
// -----------------------------------------------------------------------------
struct LiquidityPoolState {
  Amount total_liquidity{0};
  Amount outstanding_credit{0};
  Amount protocol_fees{0};

  Amount available() const {
    return outstanding_credit >= total_liquidity
               ? 0
               : total_liquidity - outstanding_credit;
  }
};

}  // namespace domain
}  // namespace bnpl
