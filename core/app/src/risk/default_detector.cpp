#include "bnpl/risk/default_detector.hpp"
#include "bnpl/domain/protocol_limits.hpp"
#include "bnpl/errors/protocol_error.hpp"

#include <exception>
#include <iostream>
#include <string>
#include <utility>

namespace bnpl {

namespace {

constexpr const char* kComponent = "DefaultDetector";

void validateGrace(std::int64_t days) {
  if (days < 0 || days > domain::kMaxPeriodDays) {
    throw ValidationError(std::string(kComponent) +
                          ": grace period must be in 0.." +
                          std::to_string(domain::kMaxPeriodDays) +
                          " days, got " + std::to_string(days));
  }
}

}  // namespace

DefaultDetector::DefaultDetector(domain::Address self, domain::Address admin,
                                 LoanOrchestrator& orchestrator,
                                 CreditLedger& credit, ICustodyAsset& custody,
                                 const ITimeProvider& clock, Journal& journal,
                                 EventMirror& mirror,
                                 std::int64_t grace_period_days)
    : self_(std::move(self)),
      permissions_(kComponent, std::move(admin)),
      orchestrator_(orchestrator),
      credit_(credit),
      custody_(custody),
      clock_(clock),
      journal_(journal),
      mirror_(mirror),
      grace_period_days_(grace_period_days) {
  validateGrace(grace_period_days_);
}

// -----------------------------------------------------------------------------
// checkAndProcessDefault(): single pair, errors propagate
// -----------------------------------------------------------------------------
bool DefaultDetector::checkAndProcessDefault(const domain::Address& caller,
                                             const domain::Address& user,
                                             domain::LoanId loan_id) {
  Journal::Scope scope(journal_);
  permissions_.requireAny({Role::Admin, Role::Orchestrator}, caller,
                          "checkAndProcessDefault");
  const bool defaulted = process(user, loan_id);
  scope.commit();
  return defaulted;
}

// -----------------------------------------------------------------------------
// batchCheckDefaults(): per-pair isolation, soft Orchestrator notification
// -----------------------------------------------------------------------------
std::size_t DefaultDetector::batchCheckDefaults(
    const domain::Address& caller, const std::vector<domain::Address>& users,
    const std::vector<domain::LoanId>& loan_ids) {
  Journal::Scope scope(journal_);
  permissions_.requireAny({Role::Admin, Role::Orchestrator}, caller,
                          "batchCheckDefaults");
  if (users.size() != loan_ids.size()) {
    throw ValidationError(std::string(kComponent) +
                          ": batchCheckDefaults length mismatch (" +
                          std::to_string(users.size()) + " users, " +
                          std::to_string(loan_ids.size()) + " loans)");
  }

  std::size_t count = 0;
  for (std::size_t i = 0; i < users.size(); ++i) {
    bool defaulted = false;
    {
      Journal::Scope pair(journal_);
      try {
        defaulted = process(users[i], loan_ids[i]);
        pair.commit();
      } catch (const ProtocolError& e) {
        std::cerr << "[" << kComponent << "] skipping " << users[i]
                  << "/loan " << loan_ids[i] << ": " << e.what() << "\n";
      }
    }
    if (!defaulted) {
      continue;
    }
    ++count;

    try {
      orchestrator_.markBNPLAsDefaulted(self_, users[i], loan_ids[i]);
    } catch (const ProtocolError& e) {
      std::cerr << "[" << kComponent << "] WARNING: orchestrator not "
                << "notified for loan " << loan_ids[i] << ": " << e.what()
                << "\n";
    }
  }

  scope.commit();
  std::cout << "[" << kComponent << "] batch processed " << users.size()
            << " pair(s), " << count << " defaulted\n";
  return count;
}

// -----------------------------------------------------------------------------
// liftFreeze(): admin counterpart to CreditLedger::unblock()
// -----------------------------------------------------------------------------
bool DefaultDetector::liftFreeze(const domain::Address& caller,
                                 const domain::Address& user) {
  permissions_.require(Role::Admin, caller, "liftFreeze");
  if (!domain::isValidAddress(user)) {
    throw ValidationError(std::string(kComponent) +
                          ": user address must be non-empty");
  }
  // Custody is external: a refusal (CustodyError) and a transport failure
  // below the protocol's error types are both soft.
  try {
    custody_.unfreeze(self_, user);
  } catch (const std::exception& e) {
    std::cerr << "[" << kComponent << "] WARNING: unfreeze of " << user
              << " failed: " << e.what() << "\n";
    return false;
  }
  return true;
}

void DefaultDetector::setGracePeriodDays(const domain::Address& caller,
                                         std::int64_t days) {
  permissions_.require(Role::Admin, caller, "setGracePeriodDays");
  validateGrace(days);
  grace_period_days_ = days;
  std::cout << "[" << kComponent << "] grace period -> " << days
            << " day(s)\n";
}

// -----------------------------------------------------------------------------
// process(): eligibility and default effects for one pair
// -----------------------------------------------------------------------------
bool DefaultDetector::process(const domain::Address& user,
                              domain::LoanId loan_id) {
  if (!domain::isValidAddress(user)) {
    throw ValidationError(std::string(kComponent) +
                          ": user address must be non-empty");
  }

  const std::optional<domain::Loan> loan = orchestrator_.loan(loan_id);
  if (!loan.has_value()) {
    throw ValidationError(std::string(kComponent) + ": unknown loan " +
                          std::to_string(loan_id));
  }
  if (loan->borrower != user) {
    throw ValidationError(std::string(kComponent) + ": loan " +
                          std::to_string(loan_id) + " does not belong to '" +
                          user + "'");
  }
  if (loan->is_repaid) {
    return false;
  }

  const std::int64_t now = clock_.now_ms();
  const std::int64_t eligible_at =
      loan->due_at_ms + grace_period_days_ * domain::kMsPerDay;
  if (now < eligible_at) {
    throw StateConflictError(std::string(kComponent) + ": loan " +
                             std::to_string(loan_id) +
                             " is not overdue until " +
                             std::to_string(eligible_at));
  }
  if (credit_.isDefaulted(user)) {
    return false;
  }

  const auto days_overdue =
      static_cast<std::uint64_t>((now - loan->due_at_ms) / domain::kMsPerDay);

  credit_.markDefaulted(self_, user);
  freezeOnCommit(user);

  DefaultEvent event;
  event.user = user;
  event.loan_id = loan_id;
  event.overdue_amount = loan->principal;
  event.days_overdue = days_overdue;
  mirror_.emit(std::move(event));

  std::cout << "[" << kComponent << "] " << user << " defaulted on loan "
            << loan_id << " (" << days_overdue << " day(s) overdue)\n";
  return true;
}

// Custody is external and cannot be rolled back, so the freeze waits for the
// default to commit. By then the default is final: any failure is logged
// and never reaches the caller.
void DefaultDetector::freezeOnCommit(const domain::Address& user) {
  journal_.onCommit([this, user]() {
    try {
      custody_.freeze(self_, user);
    } catch (const std::exception& e) {
      std::cerr << "[" << kComponent << "] WARNING: freeze of " << user
                << " failed: " << e.what() << "\n";
    }
  });
}

}  // namespace bnpl
