#pragma once

#include "bnpl/time/i_time_provider.hpp"

namespace bnpl {

// -----------------------------------------------------------------------------
// LiveTimeProvider: wall-clock time implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Returns real wall-clock time via std::chrono::system_clock.
//
// @details
// Used by the bnpl_node binary. Tests inject SimulationTimeProvider instead so
// that due dates and grace periods can be crossed without sleeping.
//
// Thread model:
//   std::chrono::system_clock::now() is safe to call from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace bnpl
