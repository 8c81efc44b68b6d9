#pragma once

#include "bnpl/errors/protocol_error.hpp"

#include <string>

namespace bnpl {

// -----------------------------------------------------------------------------
// ReentrancyGuard: non-reentrant section around a fund-moving call
// -----------------------------------------------------------------------------
//
// @brief  RAII lock over a per-component "entered" flag. Constructing a guard
//         while the flag is already set throws ReentrancyError.
//
// @details
// The custody asset is external code. During transfer()/transferFrom() a
// hostile implementation can call straight back into the component that is
// mid-operation, before that operation has finished updating its state. Each
// fund-moving entry point therefore holds a guard for its whole body:
//
//   void LiquidityLedger::depositLiquidity(...) {
//     ReentrancyGuard guard(entered_, "LiquidityLedger");
//     ...
//   }
//
// The flag is released in the destructor, so every exit path (return or
// exception) clears it.
//
// This is not a mutex. The protocol is single-threaded; the guard detects
// re-entry on the same call stack, which a mutex would turn into a deadlock.
//
// Ownership:
//   The component owns the bool flag; the guard holds a reference to it for
//   the duration of one call.
// -----------------------------------------------------------------------------
class ReentrancyGuard {
 public:
  ReentrancyGuard(bool& entered, const char* component) : entered_(entered) {
    if (entered_) {
      throw ReentrancyError(std::string(component) + ": reentrant call");
    }
    entered_ = true;
  }

  ~ReentrancyGuard() { entered_ = false; }

  ReentrancyGuard(const ReentrancyGuard&) = delete;
  ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;
  ReentrancyGuard(ReentrancyGuard&&) = delete;
  ReentrancyGuard& operator=(ReentrancyGuard&&) = delete;

 private:
  bool& entered_;
};

}  // namespace bnpl
