#pragma once

#include "bnpl/custody/i_custody_asset.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace bnpl {

// -----------------------------------------------------------------------------
// MockCustodyAsset: in-memory custody asset for simulation and tests
// -----------------------------------------------------------------------------
//
// @brief  ICustodyAsset backed by a balance map and a frozen-account set,
//         with switches that make it refuse transfers, refuse freezes, or
//         call back into the protocol mid-transfer.
//
// @details
// This is the simulation counterpart to a real asset. The protocol never
// knows which one it holds: the node binary seeds this one from the
// configured genesis balances, and tests drive it directly.
//
// Transfer model:
//   - A transfer debits `from` and credits `to` atomically.
//   - It returns false (and moves nothing) when `from` has insufficient
//     balance, when either party is frozen, or when failTransfersTo() names
//     the recipient or setFailTransfers(true) is active.
//   - transferFrom() ignores allowances: the spender is recorded for logging
//     only. Approval bookkeeping belongs to the asset, not to the protocol.
//
// Hook:
//   setTransferHook() installs a callback run inside every transfer after
//   the balance check and before the balances move. Tests use it to call
//   back into a protocol component and assert the ReentrancyGuard rejects
//   the nested call.
//
// KYC probe:
//   Disabled by default (isKycPassed returns nullopt). When enabled,
//   accounts are unverified unless setKycStatus(account, true) was called.
//
// Thread model:
//   The node's IPC thread and the main thread may both query balances, so
//   all state is guarded by one mutex. The hook runs with the mutex released.
//
// Ownership:
//   Owned by main() or the test fixture; passed to ProtocolNode by reference.
// -----------------------------------------------------------------------------
class MockCustodyAsset final : public ICustodyAsset {
 public:
  using TransferHook = std::function<void(const domain::Address& from,
                                          const domain::Address& to,
                                          domain::Amount amount)>;

  MockCustodyAsset() = default;

  MockCustodyAsset(const MockCustodyAsset&) = delete;
  MockCustodyAsset& operator=(const MockCustodyAsset&) = delete;

  // --- ICustodyAsset ---------------------------------------------------------
  bool transfer(const domain::Address& from, const domain::Address& to,
                domain::Amount amount) override;

  bool transferFrom(const domain::Address& spender,
                    const domain::Address& from, const domain::Address& to,
                    domain::Amount amount) override;

  domain::Amount balanceOf(const domain::Address& account) const override;

  // Throws CustodyError when setFailFreeze(true) is active, and
  // std::runtime_error when setFreezeUnreachable(true) is active.
  void freeze(const domain::Address& caller,
              const domain::Address& account) override;
  void unfreeze(const domain::Address& caller,
                const domain::Address& account) override;

  std::optional<bool> isKycPassed(
      const domain::Address& account) const override;

  // --- Simulation controls ---------------------------------------------------

  // Creates units out of thin air. Used to seed genesis balances.
  void mint(const domain::Address& account, domain::Amount amount);

  bool isFrozen(const domain::Address& account) const;

  void setKycProbeSupported(bool supported);
  void setKycStatus(const domain::Address& account, bool passed);

  void setFailTransfers(bool fail);
  void failTransfersTo(const domain::Address& recipient);
  void setFailFreeze(bool fail);
  // Models a custody backend that fails below the protocol's error types
  // (a lost connection): freeze/unfreeze throw std::runtime_error.
  void setFreezeUnreachable(bool unreachable);

  void setTransferHook(TransferHook hook);

  std::uint64_t transferCount() const;

 private:
  bool move(const domain::Address& from, const domain::Address& to,
            domain::Amount amount);

  mutable std::mutex mutex_;
  std::unordered_map<domain::Address, domain::Amount> balances_;
  std::unordered_set<domain::Address> frozen_;
  std::unordered_map<domain::Address, bool> kyc_;
  std::unordered_set<domain::Address> failing_recipients_;
  bool kyc_supported_{false};
  bool fail_transfers_{false};
  bool fail_freeze_{false};
  bool freeze_unreachable_{false};
  std::uint64_t transfer_count_{0};
  TransferHook hook_;
};

}  // namespace bnpl
