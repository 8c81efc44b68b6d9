#pragma once

#include <cstdint>
#include <string>

namespace bnpl {
namespace domain {

// -----------------------------------------------------------------------------
// Address
// -----------------------------------------------------------------------------
// Identity of an actor (borrower, merchant, liquidity provider, admin) or of a
// protocol component. The empty string is the zero identity and is never a
// valid party to an operation.
// -----------------------------------------------------------------------------
using Address = std::string;

// -----------------------------------------------------------------------------
// Amount
// -----------------------------------------------------------------------------
// Unsigned integer units of the custody asset. Unsigned so that every
// balance-like quantity in the protocol is >= 0 by construction; subtraction
// sites check for underflow before mutating.
// -----------------------------------------------------------------------------
using Amount = std::uint64_t;

// Loan identifiers are 1-based; 0 is the "no loan" sentinel used by the
// active-loan pointer.
using LoanId = std::uint64_t;
inline constexpr LoanId kNoLoan = 0;

// Fee rates and utilization are expressed in basis points (1/10000).
using BasisPoints = std::uint32_t;
inline constexpr BasisPoints kBpsDenominator = 10000;

inline constexpr std::int64_t kMsPerDay = 24LL * 60 * 60 * 1000;

inline bool isValidAddress(const Address& address) {
  return !address.empty();
}

// -------------------------------------------------------------------------
// mulDiv(a, b, d)
// -------------------------------------------------------------------------
// @brief  floor(a * b / d) without intermediate overflow.
//
// @details
// The 128-bit intermediate covers every product of two 64-bit operands.
// The caller guarantees d > 0. Used for fee computation and utilization
// ratios, both of which are bounded by a (b <= d in every call site), so the
// result always fits back into 64 bits.
// -------------------------------------------------------------------------
inline std::uint64_t mulDiv(std::uint64_t a, std::uint64_t b,
                            std::uint64_t d) {
  unsigned __int128 product = static_cast<unsigned __int128>(a) * b;
  return static_cast<std::uint64_t>(product / d);
}

}  // namespace domain
}  // namespace bnpl
