#include "bnpl/access/permission_table.hpp"
#include "bnpl/errors/protocol_error.hpp"

#include <iostream>
#include <utility>

namespace bnpl {

namespace {
const domain::Address kUnassigned;
}  // namespace

PermissionTable::PermissionTable(std::string component, domain::Address admin)
    : component_(std::move(component)) {
  if (!domain::isValidAddress(admin)) {
    throw ValidationError(component_ + ": admin address must be non-empty");
  }
  holders_[Role::Admin] = std::move(admin);
}

// -----------------------------------------------------------------------------
// assign: admin rewires a privileged relationship
// -----------------------------------------------------------------------------
void PermissionTable::assign(const domain::Address& caller, Role role,
                             const domain::Address& holder) {
  require(Role::Admin, caller, "assign role");
  if (!domain::isValidAddress(holder)) {
    throw ValidationError(component_ + ": cannot assign " +
                          roleToString(role) + " to the zero address");
  }
  holders_[role] = holder;
  std::cout << "[" << component_ << "] role " << roleToString(role)
            << " -> " << holder << "\n";
}

const domain::Address& PermissionTable::holder(Role role) const {
  auto it = holders_.find(role);
  return it != holders_.end() ? it->second : kUnassigned;
}

bool PermissionTable::holds(Role role, const domain::Address& caller) const {
  if (!domain::isValidAddress(caller)) {
    return false;
  }
  auto it = holders_.find(role);
  return it != holders_.end() && it->second == caller;
}

void PermissionTable::require(Role role, const domain::Address& caller,
                              const char* action) const {
  if (!holds(role, caller)) {
    throw AuthorizationError(component_ + ": " + action + " requires " +
                             roleToString(role) + ", caller '" + caller +
                             "' is not authorized");
  }
}

void PermissionTable::requireAny(std::initializer_list<Role> roles,
                                 const domain::Address& caller,
                                 const char* action) const {
  for (Role role : roles) {
    if (holds(role, caller)) {
      return;
    }
  }
  throw AuthorizationError(component_ + ": caller '" + caller +
                           "' is not authorized to " + action);
}

}  // namespace bnpl
