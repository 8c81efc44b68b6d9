#pragma once

#include "bnpl/domain/types.hpp"

#include <optional>

namespace bnpl {

// -----------------------------------------------------------------------------
// ICustodyAsset: external balance system holding real value
// -----------------------------------------------------------------------------
//
// @brief  The consumed asset interface: moves value between accounts, reports
//         balances, freezes accounts, and answers KYC probes.
//
// @details
// Only LiquidityLedger moves funds through this interface. DefaultDetector
// uses freeze()/unfreeze(); LoanOrchestrator uses isKycPassed(). The
// implementation is external and assumed correct, but not assumed friendly:
// a transfer may call back into the protocol, which is why fund-moving entry
// points hold a ReentrancyGuard.
//
// Failure contract:
//   transfer / transferFrom   Return false on refusal. The caller MUST check
//                             and abort its operation (CustodyError).
//   freeze / unfreeze         Throw CustodyError on refusal. Callers treat the
//                             failure as soft: log and continue.
//   isKycPassed               std::nullopt when the asset has no KYC probe.
//                             Callers treat an absent probe as "passed".
//
// Ownership:
//   Owned outside the protocol (the node binary or a test fixture).
//   Components hold a reference.
// -----------------------------------------------------------------------------
class ICustodyAsset {
 public:
  virtual ~ICustodyAsset() = default;

  // Moves amount from `from` (the calling component's own account) to `to`.
  virtual bool transfer(const domain::Address& from, const domain::Address& to,
                        domain::Amount amount) = 0;

  // Moves amount from `from` to `to` on behalf of `spender`.
  virtual bool transferFrom(const domain::Address& spender,
                            const domain::Address& from,
                            const domain::Address& to,
                            domain::Amount amount) = 0;

  virtual domain::Amount balanceOf(const domain::Address& account) const = 0;

  virtual void freeze(const domain::Address& caller,
                      const domain::Address& account) = 0;

  virtual void unfreeze(const domain::Address& caller,
                        const domain::Address& account) = 0;

  virtual std::optional<bool> isKycPassed(
      const domain::Address& account) const = 0;
};

}  // namespace bnpl
