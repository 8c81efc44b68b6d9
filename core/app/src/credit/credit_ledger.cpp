#include "bnpl/credit/credit_ledger.hpp"
#include "bnpl/errors/protocol_error.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace bnpl {

namespace {

void requireUser(const domain::Address& user) {
  if (!domain::isValidAddress(user)) {
    throw ValidationError("CreditLedger: user address must be non-empty");
  }
}

}  // namespace

CreditLedger::CreditLedger(domain::Address self, domain::Address admin,
                           Journal& journal, EventMirror& mirror)
    : self_(std::move(self)),
      permissions_("CreditLedger", std::move(admin)),
      journal_(journal),
      mirror_(mirror) {}

// -----------------------------------------------------------------------------
// setLimit()
// -----------------------------------------------------------------------------
void CreditLedger::setLimit(const domain::Address& caller,
                            const domain::Address& user,
                            domain::Amount limit) {
  Journal::Scope scope(journal_);
  permissions_.require(Role::Admin, caller, "setLimit");
  applyLimit(user, limit);
  scope.commit();
}

// -----------------------------------------------------------------------------
// batchSetLimits(): one scope around the whole batch
// -----------------------------------------------------------------------------
void CreditLedger::batchSetLimits(const domain::Address& caller,
                                  const std::vector<domain::Address>& users,
                                  const std::vector<domain::Amount>& limits) {
  Journal::Scope scope(journal_);
  permissions_.require(Role::Admin, caller, "batchSetLimits");
  if (users.size() != limits.size()) {
    throw ValidationError("CreditLedger: batchSetLimits length mismatch (" +
                          std::to_string(users.size()) + " users, " +
                          std::to_string(limits.size()) + " limits)");
  }
  for (std::size_t i = 0; i < users.size(); ++i) {
    applyLimit(users[i], limits[i]);
  }
  scope.commit();
  std::cout << "[CreditLedger] batch set " << users.size() << " limit(s)\n";
}

void CreditLedger::applyLimit(const domain::Address& user,
                              domain::Amount limit) {
  requireUser(user);
  if (limit == 0) {
    throw ValidationError("CreditLedger: limit for '" + user +
                          "' must be greater than zero");
  }

  domain::CreditAccount next = account(user);
  if (limit < next.used) {
    throw StateConflictError("CreditLedger: limit " + std::to_string(limit) +
                             " for '" + user + "' is below used credit " +
                             std::to_string(next.used));
  }
  next.limit = limit;
  writeAccount(user, next);

  CreditLimitSetEvent event;
  event.user = user;
  event.limit = limit;
  mirror_.emit(std::move(event));
}

// -----------------------------------------------------------------------------
// useCredit(): open a draw
// -----------------------------------------------------------------------------
void CreditLedger::useCredit(const domain::Address& caller,
                             const domain::Address& user,
                             domain::Amount amount) {
  Journal::Scope scope(journal_);
  permissions_.require(Role::Orchestrator, caller, "useCredit");
  requireUser(user);
  if (amount == 0) {
    throw ValidationError("CreditLedger: credit draw must be non-zero");
  }

  domain::CreditAccount next = account(user);
  if (next.defaulted) {
    throw StateConflictError("CreditLedger: user '" + user +
                             "' is in default");
  }
  if (next.has_active_credit) {
    throw StateConflictError("CreditLedger: user '" + user +
                             "' already has an active credit draw");
  }
  if (amount > next.available()) {
    throw StateConflictError("CreditLedger: draw of " +
                             std::to_string(amount) + " exceeds available " +
                             std::to_string(next.available()) + " for '" +
                             user + "'");
  }

  next.used += amount;
  next.has_active_credit = true;
  writeAccount(user, next);
  scope.commit();
}

// -----------------------------------------------------------------------------
// restoreCredit(): close (or shrink) a draw
// -----------------------------------------------------------------------------
void CreditLedger::restoreCredit(const domain::Address& caller,
                                 const domain::Address& user,
                                 domain::Amount amount) {
  Journal::Scope scope(journal_);
  permissions_.require(Role::Orchestrator, caller, "restoreCredit");
  requireUser(user);

  domain::CreditAccount next = account(user);
  if (amount > next.used) {
    throw StateConflictError("CreditLedger: restore of " +
                             std::to_string(amount) + " exceeds used " +
                             std::to_string(next.used) + " for '" + user +
                             "'");
  }

  next.used -= amount;
  if (next.used == 0) {
    next.has_active_credit = false;
  }
  writeAccount(user, next);
  scope.commit();
}

void CreditLedger::markDefaulted(const domain::Address& caller,
                                 const domain::Address& user) {
  Journal::Scope scope(journal_);
  permissions_.require(Role::DefaultDetector, caller, "markDefaulted");
  requireUser(user);

  domain::CreditAccount next = account(user);
  next.defaulted = true;
  writeAccount(user, next);
  scope.commit();
}

// -----------------------------------------------------------------------------
// unblock(): the only path out of default
// -----------------------------------------------------------------------------
void CreditLedger::unblock(const domain::Address& caller,
                           const domain::Address& user) {
  Journal::Scope scope(journal_);
  permissions_.require(Role::Admin, caller, "unblock");
  requireUser(user);

  domain::CreditAccount next = account(user);
  if (!next.defaulted) {
    scope.commit();
    return;
  }
  next.defaulted = false;
  writeAccount(user, next);

  UserUnblockedEvent event;
  event.user = user;
  mirror_.emit(std::move(event));
  scope.commit();

  std::cout << "[CreditLedger] unblocked " << user << "\n";
}

// -----------------------------------------------------------------------------
// writeAccount(): journaled write
// -----------------------------------------------------------------------------
void CreditLedger::writeAccount(const domain::Address& user,
                                const domain::CreditAccount& next) {
  std::optional<domain::CreditAccount> previous;
  auto it = accounts_.find(user);
  if (it != accounts_.end()) {
    previous = it->second;
  }

  journal_.recordUndo([this, user, previous]() {
    if (previous) {
      accounts_[user] = *previous;
    } else {
      accounts_.erase(user);
    }
  });

  accounts_[user] = next;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
domain::CreditAccount CreditLedger::account(
    const domain::Address& user) const {
  auto it = accounts_.find(user);
  return it != accounts_.end() ? it->second : domain::CreditAccount{};
}

domain::Amount CreditLedger::limitOf(const domain::Address& user) const {
  return account(user).limit;
}

domain::Amount CreditLedger::usedOf(const domain::Address& user) const {
  return account(user).used;
}

domain::Amount CreditLedger::availableCredit(
    const domain::Address& user) const {
  return account(user).available();
}

bool CreditLedger::hasActiveCredit(const domain::Address& user) const {
  return account(user).has_active_credit;
}

bool CreditLedger::isDefaulted(const domain::Address& user) const {
  return account(user).defaulted;
}

bool CreditLedger::isEligible(const domain::Address& user,
                              domain::Amount amount) const {
  if (!domain::isValidAddress(user) || amount == 0) {
    return false;
  }
  const domain::CreditAccount acct = account(user);
  return !acct.defaulted && !acct.has_active_credit &&
         amount <= acct.available();
}

domain::BasisPoints CreditLedger::utilizationBps(
    const domain::Address& user) const {
  const domain::CreditAccount acct = account(user);
  if (acct.limit == 0) {
    return 0;
  }
  return static_cast<domain::BasisPoints>(
      domain::mulDiv(acct.used, domain::kBpsDenominator, acct.limit));
}

}  // namespace bnpl
