#pragma once

#include "bnpl/domain/types.hpp"

#include <initializer_list>
#include <string>
#include <unordered_map>

namespace bnpl {

// -----------------------------------------------------------------------------
// Role
// -----------------------------------------------------------------------------
// Privileged relationships a component can grant. Each role has at most one
// holder per table: exactly one privileged writer per mutator.
// -----------------------------------------------------------------------------
enum class Role {
  Admin,
  Orchestrator,
  DefaultDetector,
};

inline const char* roleToString(Role r) {
  switch (r) {
    case Role::Admin:           return "admin";
    case Role::Orchestrator:    return "orchestrator";
    case Role::DefaultDetector: return "default_detector";
  }
  return "unknown";
}

// -----------------------------------------------------------------------------
// PermissionTable: per-component access roster
// -----------------------------------------------------------------------------
//
// @brief  Maps each Role to the single Address allowed to act in it, and
//         checks the immediate caller of a privileged entry point against it.
//
// @details
// Each component owns one table, constructed with its admin address. The
// remaining roles are wired at startup by the admin:
//
//   CreditLedger      Orchestrator (useCredit/restoreCredit),
//                     DefaultDetector (markDefaulted)
//   LiquidityLedger   Orchestrator (settle/receive/collectFees)
//   LoanOrchestrator  DefaultDetector (markBNPLAsDefaulted)
//   DefaultDetector   Orchestrator (may trigger checks alongside admin)
//
// There is no role hierarchy: holding Admin does not imply Orchestrator.
// An unassigned role matches nobody.
//
// Errors:
//   require()/requireAny() throw AuthorizationError.
//   assign() throws AuthorizationError for a non-admin caller and
//   ValidationError for the zero address.
// -----------------------------------------------------------------------------
class PermissionTable {
 public:
  PermissionTable(std::string component, domain::Address admin);

  // Admin-only. Replaces the current holder of role.
  void assign(const domain::Address& caller, Role role,
              const domain::Address& holder);

  // Holder of role, or the empty address if unassigned.
  const domain::Address& holder(Role role) const;

  bool holds(Role role, const domain::Address& caller) const;

  void require(Role role, const domain::Address& caller,
               const char* action) const;

  void requireAny(std::initializer_list<Role> roles,
                  const domain::Address& caller, const char* action) const;

 private:
  std::string component_;
  std::unordered_map<Role, domain::Address> holders_;
};

}  // namespace bnpl
