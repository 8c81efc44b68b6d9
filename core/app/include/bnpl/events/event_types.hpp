#pragma once

#include "bnpl/domain/types.hpp"
#include "bnpl/time/time_utils.hpp"

#include <cstdint>
#include <string>

namespace bnpl {

// -----------------------------------------------------------------------------
// Mirrored protocol events
// -----------------------------------------------------------------------------
// Plain data records published through EventMirror after the operation that
// produced them has committed. Nothing in the core reads them back; they exist
// for external indexers, the node's telemetry socket, and tests.
//
// Every record carries:
//   timestamp   : trusted-clock time of the operation.
//   sequence_id : mirror-assigned, strictly increasing, gap-free across all
//                  event kinds. Assigned at publish time, so events from a
//                  rolled-back operation never consume a number.
// -----------------------------------------------------------------------------

// -----------------------------------------------------------------------------
// LoanCreatedEvent: a credit draw was opened and the merchant paid.
// -----------------------------------------------------------------------------
struct LoanCreatedEvent {
  domain::Address user;
  domain::Address merchant;
  domain::LoanId loan_id{domain::kNoLoan};
  domain::Amount amount{0};
  std::int64_t due_at_ms{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// RepaymentEvent: a borrower settled a loan in full.
// -----------------------------------------------------------------------------
struct RepaymentEvent {
  domain::Address user;
  domain::Address merchant;
  domain::LoanId loan_id{domain::kNoLoan};
  domain::Amount amount{0};
  bool success{true};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// DefaultEvent: the Default Detector marked a user defaulted.
// -----------------------------------------------------------------------------
struct DefaultEvent {
  domain::Address user;
  domain::LoanId loan_id{domain::kNoLoan};
  domain::Amount overdue_amount{0};
  std::uint64_t days_overdue{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// DisputeEvent: borrower or merchant contested a loan. Logged only.
// -----------------------------------------------------------------------------
struct DisputeEvent {
  domain::Address user;
  domain::Address merchant;
  domain::LoanId loan_id{domain::kNoLoan};
  std::string reason;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// CreditLimitSetEvent: admin assigned a credit limit.
// -----------------------------------------------------------------------------
struct CreditLimitSetEvent {
  domain::Address user;
  domain::Amount limit{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// UserUnblockedEvent: admin cleared a user's default flag.
// -----------------------------------------------------------------------------
struct UserUnblockedEvent {
  domain::Address user;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// PoolActivityEvent: liquidity entered or left the pool.
// -----------------------------------------------------------------------------
enum class PoolActivity {
  Deposit,
  Withdrawal,
  FeeWithdrawal,
};

inline const char* poolActivityToString(PoolActivity a) {
  switch (a) {
    case PoolActivity::Deposit:       return "deposit";
    case PoolActivity::Withdrawal:    return "withdrawal";
    case PoolActivity::FeeWithdrawal: return "fee_withdrawal";
  }
  return "unknown";
}

struct PoolActivityEvent {
  PoolActivity activity{PoolActivity::Deposit};
  domain::Address account;
  domain::Amount amount{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace bnpl
