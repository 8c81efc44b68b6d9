#pragma once

#include "bnpl/domain/types.hpp"

#include <cstdint>

namespace bnpl {
namespace domain {

// Protocol parameter defaults and bounds shared by the components, the config
// loader and the node's admin commands.
inline constexpr std::int64_t kDefaultRepaymentWindowDays = 14;
inline constexpr BasisPoints kDefaultFeeRateBps = 50;
inline constexpr std::int64_t kDefaultGracePeriodDays = 3;

// Upper bound for window and grace lengths. Keeps dueAt + grace well inside
// int64 milliseconds.
inline constexpr std::int64_t kMaxPeriodDays = 36500;

}  // namespace domain
}  // namespace bnpl
