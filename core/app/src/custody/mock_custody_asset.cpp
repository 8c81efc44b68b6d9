#include "bnpl/custody/mock_custody_asset.hpp"
#include "bnpl/errors/protocol_error.hpp"

#include <stdexcept>
#include <utility>

namespace bnpl {

bool MockCustodyAsset::transfer(const domain::Address& from,
                                const domain::Address& to,
                                domain::Amount amount) {
  return move(from, to, amount);
}

bool MockCustodyAsset::transferFrom(const domain::Address& /*spender*/,
                                    const domain::Address& from,
                                    const domain::Address& to,
                                    domain::Amount amount) {
  return move(from, to, amount);
}

// -----------------------------------------------------------------------------
// move(): check, run the hook, then settle balances
// -----------------------------------------------------------------------------
bool MockCustodyAsset::move(const domain::Address& from,
                            const domain::Address& to,
                            domain::Amount amount) {
  TransferHook hook;
  {
    std::lock_guard lock(mutex_);
    if (fail_transfers_ || failing_recipients_.count(to) > 0) {
      return false;
    }
    if (frozen_.count(from) > 0 || frozen_.count(to) > 0) {
      return false;
    }
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
      return false;
    }
    hook = hook_;
  }

  // The hook may re-enter the protocol, which may call back into this
  // asset; the lock must not be held here.
  if (hook) {
    hook(from, to, amount);
  }

  std::lock_guard lock(mutex_);
  auto it = balances_.find(from);
  if (it == balances_.end() || it->second < amount) {
    return false;
  }
  it->second -= amount;
  balances_[to] += amount;
  ++transfer_count_;
  return true;
}

domain::Amount MockCustodyAsset::balanceOf(
    const domain::Address& account) const {
  std::lock_guard lock(mutex_);
  auto it = balances_.find(account);
  return it != balances_.end() ? it->second : 0;
}

void MockCustodyAsset::freeze(const domain::Address& caller,
                              const domain::Address& account) {
  std::lock_guard lock(mutex_);
  if (freeze_unreachable_) {
    throw std::runtime_error("MockCustodyAsset: custody node unreachable");
  }
  if (fail_freeze_) {
    throw CustodyError("MockCustodyAsset: freeze of '" + account +
                       "' refused for caller '" + caller + "'");
  }
  frozen_.insert(account);
}

void MockCustodyAsset::unfreeze(const domain::Address& caller,
                                const domain::Address& account) {
  std::lock_guard lock(mutex_);
  if (freeze_unreachable_) {
    throw std::runtime_error("MockCustodyAsset: custody node unreachable");
  }
  if (fail_freeze_) {
    throw CustodyError("MockCustodyAsset: unfreeze of '" + account +
                       "' refused for caller '" + caller + "'");
  }
  frozen_.erase(account);
}

std::optional<bool> MockCustodyAsset::isKycPassed(
    const domain::Address& account) const {
  std::lock_guard lock(mutex_);
  if (!kyc_supported_) {
    return std::nullopt;
  }
  auto it = kyc_.find(account);
  return it != kyc_.end() && it->second;
}

void MockCustodyAsset::mint(const domain::Address& account,
                            domain::Amount amount) {
  std::lock_guard lock(mutex_);
  balances_[account] += amount;
}

bool MockCustodyAsset::isFrozen(const domain::Address& account) const {
  std::lock_guard lock(mutex_);
  return frozen_.count(account) > 0;
}

void MockCustodyAsset::setKycProbeSupported(bool supported) {
  std::lock_guard lock(mutex_);
  kyc_supported_ = supported;
}

void MockCustodyAsset::setKycStatus(const domain::Address& account,
                                    bool passed) {
  std::lock_guard lock(mutex_);
  kyc_[account] = passed;
}

void MockCustodyAsset::setFailTransfers(bool fail) {
  std::lock_guard lock(mutex_);
  fail_transfers_ = fail;
}

void MockCustodyAsset::failTransfersTo(const domain::Address& recipient) {
  std::lock_guard lock(mutex_);
  failing_recipients_.insert(recipient);
}

void MockCustodyAsset::setFailFreeze(bool fail) {
  std::lock_guard lock(mutex_);
  fail_freeze_ = fail;
}

void MockCustodyAsset::setFreezeUnreachable(bool unreachable) {
  std::lock_guard lock(mutex_);
  freeze_unreachable_ = unreachable;
}

void MockCustodyAsset::setTransferHook(TransferHook hook) {
  std::lock_guard lock(mutex_);
  hook_ = std::move(hook);
}

std::uint64_t MockCustodyAsset::transferCount() const {
  std::lock_guard lock(mutex_);
  return transfer_count_;
}

}  // namespace bnpl
